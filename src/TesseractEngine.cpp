#include "TesseractEngine.hpp"
#include "ProcessingErrors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>

namespace exam {

TesseractEngine::TesseractEngine(const TesseractEngineConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()),
      m_config(config), m_initialized(false) {}

TesseractEngine::~TesseractEngine() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

bool TesseractEngine::initialize() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_initialized) {
    return true;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    }
    // Priority 3: nullptr lets Tesseract use its compiled-in default
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str(),
                                 m_config.engineMode);
  if (result != 0) {
    std::cerr << "TesseractEngine[" << m_config.engineId
              << "]: failed to initialize with language: " << m_config.language
              << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  if (m_config.preserveInterwordSpaces) {
    m_tesseract->SetVariable("preserve_interword_spaces", "1");
  }

  m_initialized = true;
  return true;
}

bool TesseractEngine::isAvailable() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_initialized;
}

void TesseractEngine::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

OCRResult TesseractEngine::recognize(const cv::Mat &image) {
  std::lock_guard<std::mutex> lock(m_mutex);

  if (!m_initialized) {
    throw OCRProcessingError("Tesseract engine not initialized",
                             {{"engine", m_config.engineId}});
  }
  if (image.empty()) {
    throw OCRProcessingError("Empty image passed to OCR engine",
                             {{"engine", m_config.engineId}});
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  OCRResult result;
  result.engineId = m_config.engineId;

  setImage(image);
  if (m_tesseract->Recognize(nullptr) != 0) {
    m_tesseract->Clear();
    throw OCRProcessingError("Tesseract recognition failed",
                             {{"engine", m_config.engineId}});
  }

  std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
  const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

  std::string text;
  bool lineHasWords = false;
  bool newLinePending = false;
  double confidenceSum = 0.0;

  if (ri) {
    do {
      if (ri->IsAtBeginningOf(tesseract::RIL_TEXTLINE) && lineHasWords) {
        newLinePending = true;
      }

      std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
      float conf = ri->Confidence(level);
      if (!word || *word.get() == '\0' || conf < m_config.minWordConfidence) {
        continue;
      }

      OCRWord ocrWord;
      ocrWord.text = word.get();
      ocrWord.confidence = std::clamp<double>(conf, 0.0, 100.0);

      int x1, y1, x2, y2;
      ri->BoundingBox(level, &x1, &y1, &x2, &y2);
      ocrWord.boundingBox = cv::Rect(x1, y1, x2 - x1, y2 - y1);

      if (newLinePending) {
        text += '\n';
        newLinePending = false;
      } else if (lineHasWords) {
        text += ' ';
      }
      text += ocrWord.text;
      lineHasWords = true;

      confidenceSum += ocrWord.confidence;
      result.wordConfidences.push_back(ocrWord.confidence);
      result.words.push_back(std::move(ocrWord));
    } while (ri->Next(level));
  }

  m_tesseract->Clear();

  result.text = text;
  if (!result.wordConfidences.empty()) {
    result.confidence = confidenceSum / result.wordConfidences.size();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeSeconds =
      std::chrono::duration<double>(endTime - startTime).count();

  return result;
}

std::vector<std::string> TesseractEngine::availableLanguages() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> languages;
  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }
  return languages;
}

std::string TesseractEngine::version() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<TesseractEngineConfig>
TesseractEngine::defaultVariants(const std::string &language,
                                 const std::string &tessDataPath) {
  TesseractEngineConfig lstm;
  lstm.engineId = "tesseract_lstm";
  lstm.language = language;
  lstm.tessDataPath = tessDataPath;
  lstm.engineMode = tesseract::OEM_LSTM_ONLY;
  lstm.pageSegMode = tesseract::PSM_SINGLE_BLOCK;

  TesseractEngineConfig sparse;
  sparse.engineId = "tesseract_legacy_sparse";
  sparse.language = language;
  sparse.tessDataPath = tessDataPath;
  sparse.engineMode = tesseract::OEM_DEFAULT;
  sparse.pageSegMode = tesseract::PSM_SPARSE_TEXT;

  return {lstm, sparse};
}

} // namespace exam
