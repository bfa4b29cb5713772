#ifndef EXAM_PROCESSING_CONTEXT_HPP
#define EXAM_PROCESSING_CONTEXT_HPP

#include "ConfidenceAggregator.hpp"
#include "DocumentSource.hpp"
#include "ExtractedQuestion.hpp"
#include "ProcessingLogger.hpp"
#include "QuestionParser.hpp"
#include "Region.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Per-page state built up by the pipeline steps
 */
struct PageData {
  int pageNumber = 1;
  cv::Size detectionSize;         ///< Raster size at the detection DPI
  std::string text;               ///< Text layer or page OCR text
  std::optional<double> ocrConfidence; ///< Page OCR confidence (0-100)
  std::vector<Region> regions;    ///< Stored regions, ids assigned
  std::vector<QuestionGroup> groups; ///< Validated structural groups
  std::string detectionMethod;    ///< structural, hybrid or geometric
  int columnCount = 0;
};

/**
 * @brief A question on its way from region text to ExtractedQuestion
 */
struct QuestionDraft {
  int pageNumber = 1;
  Region region;                       ///< Source region (detection DPI)
  std::string text;                    ///< Region text
  std::optional<double> ocrConfidence; ///< Region OCR confidence (0-100)
  std::string extractionMethod;        ///< structural, geometric, manual, text
  std::optional<QuestionGroup> group;  ///< Structural group of the region
  ParsedQuestion parsed;
};

/**
 * @brief Everything one processing run reads and produces
 *
 * Each step works on its own copy and the copy replaces the run's context
 * only when the step succeeds within its time limit, so a step abandoned
 * after a timeout never touches the context handed back to the caller.
 * The document source and the logger are shared by all copies and guard
 * their own state.
 */
struct ProcessingContext {
  std::string documentId;
  std::vector<std::string> inputPaths;

  ValidationResult validation;
  std::shared_ptr<DocumentSource> source;
  bool searchable = false;

  std::vector<PageData> pages;
  std::vector<QuestionDraft> drafts;
  std::vector<ExtractedQuestion> questions;
  DocumentStatistics statistics;

  std::shared_ptr<ProcessingLogger> logger;
};

} // namespace exam

#endif // EXAM_PROCESSING_CONTEXT_HPP
