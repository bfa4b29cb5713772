#ifndef EXAM_OCR_ENGINE_HPP
#define EXAM_OCR_ENGINE_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace exam {

/**
 * @brief A single recognized word with its page position
 */
struct OCRWord {
  std::string text;       ///< Word text (UTF-8)
  cv::Rect boundingBox;   ///< Word bounds in the recognized image
  double confidence = 0;  ///< Recognition confidence (0-100)
};

/**
 * @brief Output of one engine over one image
 *
 * An engine reports confidences on its own ConfidenceScale; the ensemble
 * normalizes them to 0-100. Results are treated as immutable afterwards.
 */
struct OCRResult {
  std::string text;                              ///< Full text, one line per row
  double confidence = 0.0;                       ///< Mean word confidence
  std::string engineId;                          ///< Engine that produced it
  double processingTimeSeconds = 0.0;            ///< Wall-clock recognition time
  std::vector<double> wordConfidences;           ///< Per-word confidence
  std::vector<std::string> preprocessingApplied; ///< Enhancement steps used
  std::vector<OCRWord> words;                    ///< Word-level boxes
};

/**
 * @brief Scale an engine reports its confidences on
 */
enum class ConfidenceScale {
  Percent,  ///< 0-100, e.g. Tesseract
  Fraction, ///< 0-1
};

/**
 * @brief Normalize an engine-reported confidence to 0-100
 *
 * The result is clamped.
 */
double normalizeConfidence(double value, ConfidenceScale scale);

/**
 * @brief Normalize the result, word and per-word confidences in place
 */
void normalizeConfidences(OCRResult &result, ConfidenceScale scale);

/**
 * @brief Abstract OCR backend
 *
 * Implementations must be safe to call from several threads; the
 * ensemble may run recognize() on different engines concurrently.
 */
class OCREngine {
public:
  virtual ~OCREngine() = default;

  /**
   * @brief Stable engine identifier, e.g. "tesseract_lstm"
   */
  virtual std::string id() const = 0;

  /**
   * @brief Whether the engine can currently recognize text
   */
  virtual bool isAvailable() const = 0;

  /**
   * @brief Scale of the confidences in the results of recognize()
   */
  virtual ConfidenceScale confidenceScale() const {
    return ConfidenceScale::Percent;
  }

  /**
   * @brief Recognize text in an image
   * @throws OCRProcessingError on engine failure
   */
  virtual OCRResult recognize(const cv::Mat &image) = 0;
};

} // namespace exam

#endif // EXAM_OCR_ENGINE_HPP
