#ifndef EXAM_EXTRACTION_PIPELINE_HPP
#define EXAM_EXTRACTION_PIPELINE_HPP

#include "DocumentSource.hpp"
#include "DocumentStore.hpp"
#include "ErrorHandler.hpp"
#include "OCREnsemble.hpp"
#include "ProcessingContext.hpp"
#include "ProcessingOrchestrator.hpp"
#include "ProgressChannel.hpp"
#include "QuestionParser.hpp"
#include "RegionDetector.hpp"
#include "RegionStore.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Settings of a document processing run
 */
struct PipelineConfig {
  double detectionDpi = 150.0;       ///< Raster resolution for region detection
  double ocrDpi = 300.0;             ///< Raster resolution for OCR
  ValidationLimits limits;
  DetectorConfig detector;
  OrchestratorConfig orchestrator;
  std::string outputDirectory;       ///< JSON exports; empty to skip
  bool writeOverlays = false;        ///< Region overlay PNG per page
  double textQuestionConfidence = 0.6; ///< Detection confidence of questions
                                       ///< split from page text
};

/**
 * @brief Document processing: validation, OCR, layout, questions, scoring
 *
 * Binds the nine standard steps to the shared components and runs them
 * through a ProcessingOrchestrator. One pipeline can process several
 * documents at once; each run gets its own ProcessingContext.
 */
class ExtractionPipeline {
public:
  ExtractionPipeline(const PipelineConfig &config,
                     std::shared_ptr<OCREnsemble> ensemble,
                     std::shared_ptr<RegionStore> regionStore,
                     std::shared_ptr<DocumentStore> documentStore,
                     std::shared_ptr<ProgressChannel> channel = nullptr,
                     std::shared_ptr<ErrorHandler> errorHandler = nullptr,
                     std::ostream *logStream = nullptr);

  /**
   * @brief Process a document for a pending job
   * @param job Job of the run; completed or failed on return
   * @param paths One PDF, or one PNG per page
   * @return Context with the questions, statistics and log of the run
   */
  std::shared_ptr<ProcessingContext>
  process(ProcessingJob &job, const std::vector<std::string> &paths) const;

  /**
   * @brief The standard steps bound to @p context
   */
  std::vector<ProcessingStep>
  buildSteps(const std::shared_ptr<ProcessingContext> &context) const;

  const PipelineConfig &config() const { return m_config; }
  const std::shared_ptr<RegionStore> &regionStore() const { return m_regionStore; }

  /// Components shared by the step bodies of every run
  struct Components;

private:
  std::shared_ptr<Components> m_components;
  PipelineConfig m_config;
  std::shared_ptr<RegionStore> m_regionStore;
  std::shared_ptr<DocumentStore> m_documentStore;
  std::shared_ptr<ProgressChannel> m_channel;
  std::shared_ptr<ErrorHandler> m_errorHandler;
  std::ostream *m_logStream;
};

} // namespace exam

#endif // EXAM_EXTRACTION_PIPELINE_HPP
