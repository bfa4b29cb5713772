#ifndef EXAM_OCR_ENSEMBLE_HPP
#define EXAM_OCR_ENSEMBLE_HPP

#include "ImagePreprocessor.hpp"
#include "OCREngine.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Aggregate OCR request statistics
 *
 * Owned by the caller and injected into the ensemble; updates are short
 * mutex-guarded counter writes.
 */
class OCRPerformanceStats {
public:
  struct Snapshot {
    std::size_t totalRequests = 0;
    std::map<std::string, std::size_t> engineRequests;
    std::size_t resultCount = 0;
    double avgProcessingTime = 0.0; ///< Seconds per engine result
    double avgConfidence = 0.0;
    double minConfidence = 0.0;
    double maxConfidence = 0.0;
  };

  /**
   * @brief Record the results of one ensemble request
   */
  void record(const std::vector<OCRResult> &results);

  Snapshot snapshot() const;
  void reset();

private:
  mutable std::mutex m_mutex;
  Snapshot m_data;
};

/**
 * @brief Runs several OCR engines over the same image and picks the best
 *
 * Only engines available at construction are registered. Engines run
 * concurrently; a failing engine is logged and skipped.
 */
class OCREnsemble {
public:
  OCREnsemble(std::vector<std::shared_ptr<OCREngine>> engines,
              std::shared_ptr<OCRPerformanceStats> stats = nullptr,
              ImagePreprocessor preprocessor = ImagePreprocessor());

  /**
   * @brief Identifiers of the registered engines, in registration order
   */
  std::vector<std::string> availableEngines() const;

  bool hasEngines() const { return !m_engines.empty(); }

  /**
   * @brief Run the selected engines and return the best result
   * @param image Input image
   * @param engineIds Engines to use; empty selects all registered engines
   * @param preprocess Enhance the image before recognition
   * @throws OCRProcessingError if no engine is selected or all engines fail
   */
  OCRResult extractBest(const cv::Mat &image,
                        const std::vector<std::string> &engineIds = {},
                        bool preprocess = true);

  /**
   * @brief Run the selected engines and return every successful result
   * @throws OCRProcessingError if no engine is selected or all engines fail
   */
  std::vector<OCRResult> extractAll(const cv::Mat &image,
                                    const std::vector<std::string> &engineIds = {},
                                    bool preprocess = true);

  /**
   * @brief Highest (confidence, trimmed text length) result
   * @pre results is not empty
   */
  static const OCRResult &selectBest(const std::vector<OCRResult> &results);

  /**
   * @brief Create and initialize the stock Tesseract variants
   *
   * Engines that fail to initialize are still returned; the ensemble drops
   * them when it is constructed.
   */
  static std::vector<std::shared_ptr<OCREngine>>
  createTesseractEngines(const std::string &language,
                         const std::string &tessDataPath = std::string());

private:
  std::vector<std::shared_ptr<OCREngine>>
  selectEngines(const std::vector<std::string> &engineIds) const;

  std::vector<std::shared_ptr<OCREngine>> m_engines;
  std::shared_ptr<OCRPerformanceStats> m_stats;
  ImagePreprocessor m_preprocessor;
};

} // namespace exam

#endif // EXAM_OCR_ENSEMBLE_HPP
