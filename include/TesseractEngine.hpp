#ifndef EXAM_TESSERACT_ENGINE_HPP
#define EXAM_TESSERACT_ENGINE_HPP

#include "OCREngine.hpp"

#include <tesseract/baseapi.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Configuration for one Tesseract engine instance
 */
struct TesseractEngineConfig {
  std::string engineId = "tesseract_lstm"; ///< Identifier in the ensemble
  std::string language = "eng";            ///< Tesseract language code
  std::string tessDataPath;                ///< Empty: TESSDATA_PREFIX or default
  tesseract::OcrEngineMode engineMode = tesseract::OEM_LSTM_ONLY;
  tesseract::PageSegMode pageSegMode = tesseract::PSM_SINGLE_BLOCK;
  double minWordConfidence = 10.0;         ///< Words below are dropped
  bool preserveInterwordSpaces = true;
};

/**
 * @brief OCR engine backed by tesseract::TessBaseAPI
 *
 * Each instance owns one API object; calls are serialized by a mutex so the
 * engine can be shared between threads.
 */
class TesseractEngine : public OCREngine {
public:
  explicit TesseractEngine(
      const TesseractEngineConfig &config = TesseractEngineConfig());
  ~TesseractEngine() override;

  TesseractEngine(const TesseractEngine &) = delete;
  TesseractEngine &operator=(const TesseractEngine &) = delete;

  /**
   * @brief Initialize the Tesseract API
   *
   * tessdata is looked up in the configured path, then TESSDATA_PREFIX,
   * then the library's compiled-in default.
   * @return true if initialization succeeded
   */
  bool initialize();

  std::string id() const override { return m_config.engineId; }
  bool isAvailable() const override;
  /// Tesseract word confidences are percentages
  ConfidenceScale confidenceScale() const override {
    return ConfidenceScale::Percent;
  }
  OCRResult recognize(const cv::Mat &image) override;

  /**
   * @brief Languages installed in the tessdata directory in use
   */
  std::vector<std::string> availableLanguages() const;

  static std::string version();

  /**
   * @brief The two stock variants: LSTM single-block and legacy sparse text
   */
  static std::vector<TesseractEngineConfig>
  defaultVariants(const std::string &language,
                  const std::string &tessDataPath = std::string());

private:
  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract;
  TesseractEngineConfig m_config;
  bool m_initialized;
  mutable std::mutex m_mutex;
};

} // namespace exam

#endif // EXAM_TESSERACT_ENGINE_HPP
