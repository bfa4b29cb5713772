#include "OCREnsemble.hpp"
#include "ProcessingErrors.hpp"
#include "TesseractEngine.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <tuple>

namespace exam {

namespace {

std::size_t trimmedLength(const std::string &text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? static_cast<std::size_t>(end - begin) : 0;
}

} // anonymous namespace

double normalizeConfidence(double value, ConfidenceScale scale) {
  if (scale == ConfidenceScale::Fraction) {
    value *= 100.0;
  }
  return std::clamp(value, 0.0, 100.0);
}

void normalizeConfidences(OCRResult &result, ConfidenceScale scale) {
  result.confidence = normalizeConfidence(result.confidence, scale);
  for (auto &confidence : result.wordConfidences) {
    confidence = normalizeConfidence(confidence, scale);
  }
  for (auto &word : result.words) {
    word.confidence = normalizeConfidence(word.confidence, scale);
  }
}

void OCRPerformanceStats::record(const std::vector<OCRResult> &results) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_data.totalRequests++;

  for (const auto &result : results) {
    m_data.engineRequests[result.engineId]++;

    std::size_t n = ++m_data.resultCount;
    m_data.avgProcessingTime +=
        (result.processingTimeSeconds - m_data.avgProcessingTime) / n;
    m_data.avgConfidence += (result.confidence - m_data.avgConfidence) / n;

    if (n == 1) {
      m_data.minConfidence = result.confidence;
      m_data.maxConfidence = result.confidence;
    } else {
      m_data.minConfidence = std::min(m_data.minConfidence, result.confidence);
      m_data.maxConfidence = std::max(m_data.maxConfidence, result.confidence);
    }
  }
}

OCRPerformanceStats::Snapshot OCRPerformanceStats::snapshot() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_data;
}

void OCRPerformanceStats::reset() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_data = Snapshot();
}

OCREnsemble::OCREnsemble(std::vector<std::shared_ptr<OCREngine>> engines,
                         std::shared_ptr<OCRPerformanceStats> stats,
                         ImagePreprocessor preprocessor)
    : m_stats(std::move(stats)), m_preprocessor(std::move(preprocessor)) {
  for (auto &engine : engines) {
    if (!engine) {
      continue;
    }
    if (!engine->isAvailable()) {
      std::cerr << "OCREnsemble: engine " << engine->id()
                << " is not available, skipping" << std::endl;
      continue;
    }
    m_engines.push_back(std::move(engine));
  }
}

std::vector<std::string> OCREnsemble::availableEngines() const {
  std::vector<std::string> ids;
  for (const auto &engine : m_engines) {
    ids.push_back(engine->id());
  }
  return ids;
}

std::vector<std::shared_ptr<OCREngine>>
OCREnsemble::selectEngines(const std::vector<std::string> &engineIds) const {
  if (engineIds.empty()) {
    return m_engines;
  }

  std::vector<std::shared_ptr<OCREngine>> selected;
  for (const auto &id : engineIds) {
    auto it = std::find_if(
        m_engines.begin(), m_engines.end(),
        [&id](const std::shared_ptr<OCREngine> &e) { return e->id() == id; });
    if (it == m_engines.end()) {
      std::cerr << "OCREnsemble: requested engine " << id
                << " is not available" << std::endl;
      continue;
    }
    selected.push_back(*it);
  }
  return selected;
}

std::vector<OCRResult>
OCREnsemble::extractAll(const cv::Mat &image,
                        const std::vector<std::string> &engineIds,
                        bool preprocess) {
  std::vector<std::shared_ptr<OCREngine>> engines = selectEngines(engineIds);
  if (engines.empty()) {
    ErrorDetails details;
    details["available_engines"] = std::to_string(m_engines.size());
    throw OCRProcessingError("No OCR engines available", details);
  }

  cv::Mat input = image;
  std::vector<std::string> applied;
  if (preprocess) {
    PreprocessResult enhanced = m_preprocessor.enhance(image);
    input = enhanced.image;
    applied = enhanced.appliedSteps;
  }

  std::vector<OCRResult> results;
  ErrorDetails failures;

  auto accept = [&](const std::shared_ptr<OCREngine> &engine,
                    OCRResult result) {
    normalizeConfidences(result, engine->confidenceScale());
    result.engineId = engine->id();
    result.preprocessingApplied = applied;
    results.push_back(std::move(result));
  };
  auto reject = [&](const std::shared_ptr<OCREngine> &engine,
                    const std::exception &e) {
    std::cerr << "OCREnsemble: engine " << engine->id()
              << " failed: " << e.what() << std::endl;
    failures[engine->id()] = e.what();
  };

  if (engines.size() == 1) {
    try {
      accept(engines.front(), engines.front()->recognize(input));
    } catch (const std::exception &e) {
      reject(engines.front(), e);
    }
  } else {
    // One task per engine; each future is joined on its own
    std::vector<std::future<OCRResult>> futures;
    futures.reserve(engines.size());
    for (const auto &engine : engines) {
      futures.push_back(std::async(std::launch::async, [engine, input]() {
        return engine->recognize(input);
      }));
    }
    for (std::size_t i = 0; i < engines.size(); ++i) {
      try {
        accept(engines[i], futures[i].get());
      } catch (const std::exception &e) {
        reject(engines[i], e);
      }
    }
  }

  if (m_stats) {
    m_stats->record(results);
  }

  if (results.empty()) {
    throw OCRProcessingError("All OCR engines failed", failures);
  }
  return results;
}

OCRResult OCREnsemble::extractBest(const cv::Mat &image,
                                   const std::vector<std::string> &engineIds,
                                   bool preprocess) {
  std::vector<OCRResult> results = extractAll(image, engineIds, preprocess);
  return selectBest(results);
}

const OCRResult &OCREnsemble::selectBest(const std::vector<OCRResult> &results) {
  return *std::max_element(
      results.begin(), results.end(),
      [](const OCRResult &a, const OCRResult &b) {
        return std::make_tuple(a.confidence, trimmedLength(a.text)) <
               std::make_tuple(b.confidence, trimmedLength(b.text));
      });
}

std::vector<std::shared_ptr<OCREngine>>
OCREnsemble::createTesseractEngines(const std::string &language,
                                    const std::string &tessDataPath) {
  std::vector<std::shared_ptr<OCREngine>> engines;
  for (const auto &config :
       TesseractEngine::defaultVariants(language, tessDataPath)) {
    auto engine = std::make_shared<TesseractEngine>(config);
    if (!engine->initialize()) {
      std::cerr << "OCREnsemble: could not initialize " << config.engineId
                << std::endl;
    }
    engines.push_back(engine);
  }
  return engines;
}

} // namespace exam
