#include "FakeEngine.hpp"
#include "OCREnsemble.hpp"
#include "ProcessingErrors.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace {

using namespace exam;
using test_support::FakeEngine;

OCRResult resultWith(const std::string &text, double confidence) {
  OCRResult result;
  result.text = text;
  result.confidence = confidence;
  return result;
}

cv::Mat blankPage() { return cv::Mat(120, 200, CV_8UC1, cv::Scalar(255)); }

TEST(OCREnsembleTest, UnavailableEnginesAreSkipped) {
  auto ready = std::make_shared<FakeEngine>("ready", resultWith("ok", 80));
  auto missing = std::make_shared<FakeEngine>("missing", OCRResult(), false);

  OCREnsemble ensemble({ready, missing, nullptr});
  EXPECT_TRUE(ensemble.hasEngines());
  EXPECT_EQ(ensemble.availableEngines(), (std::vector<std::string>{"ready"}));
}

TEST(OCREnsembleTest, BestResultHasHighestConfidence) {
  auto low = std::make_shared<FakeEngine>("low", resultWith("blurry text", 55));
  auto high = std::make_shared<FakeEngine>("high", resultWith("clear text", 91));

  OCREnsemble ensemble({low, high});
  OCRResult best = ensemble.extractBest(blankPage(), {}, false);
  EXPECT_EQ(best.engineId, "high");
  EXPECT_EQ(best.text, "clear text");
}

TEST(OCREnsembleTest, TieBrokenByTextLength) {
  std::vector<OCRResult> results = {resultWith("  short  ", 70),
                                    resultWith("much longer text", 70)};
  EXPECT_EQ(OCREnsemble::selectBest(results).text, "much longer text");
}

TEST(OCREnsembleTest, FailingEngineDoesNotFailTheRequest) {
  auto broken = std::make_shared<FakeEngine>("broken");
  broken->failWith("segfault avoided");
  auto working = std::make_shared<FakeEngine>("working", resultWith("text", 75));

  OCREnsemble ensemble({broken, working});
  std::vector<OCRResult> results = ensemble.extractAll(blankPage(), {}, false);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].engineId, "working");
  EXPECT_EQ(broken->calls(), 1);
}

TEST(OCREnsembleTest, AllEnginesFailing) {
  auto a = std::make_shared<FakeEngine>("a");
  auto b = std::make_shared<FakeEngine>("b");
  a->failWith("first");
  b->failWith("second");

  OCREnsemble ensemble({a, b});
  try {
    ensemble.extractBest(blankPage(), {}, false);
    FAIL() << "expected OCRProcessingError";
  } catch (const OCRProcessingError &e) {
    EXPECT_EQ(e.code(), "OCR_PROCESSING_ERROR");
    EXPECT_EQ(e.details().at("a"), "first");
    EXPECT_EQ(e.details().at("b"), "second");
  }
}

TEST(OCREnsembleTest, NoEnginesSelected) {
  OCREnsemble empty(std::vector<std::shared_ptr<OCREngine>>{});
  EXPECT_FALSE(empty.hasEngines());
  EXPECT_THROW(empty.extractAll(blankPage()), OCRProcessingError);

  auto engine = std::make_shared<FakeEngine>("only", resultWith("x", 50));
  OCREnsemble ensemble({engine});
  EXPECT_THROW(ensemble.extractAll(blankPage(), {"unknown"}), OCRProcessingError);
  EXPECT_EQ(engine->calls(), 0);
}

TEST(OCREnsembleTest, SelectedSubsetOnly) {
  auto a = std::make_shared<FakeEngine>("a", resultWith("from a", 60));
  auto b = std::make_shared<FakeEngine>("b", resultWith("from b", 90));

  OCREnsemble ensemble({a, b});
  OCRResult result = ensemble.extractBest(blankPage(), {"a"}, false);
  EXPECT_EQ(result.engineId, "a");
  EXPECT_EQ(b->calls(), 0);
}

TEST(OCREnsembleTest, PreprocessingStepsAreReported) {
  auto engine = std::make_shared<FakeEngine>("only", resultWith("x", 50));
  ImagePreprocessor preprocessor(
      PreprocessConfig{{PreprocessStep::Contrast, PreprocessStep::Binarize}});
  OCREnsemble ensemble({engine}, nullptr, preprocessor);

  OCRResult result = ensemble.extractBest(blankPage());
  EXPECT_EQ(result.preprocessingApplied,
            (std::vector<std::string>{"contrast", "binarize"}));

  OCRResult raw = ensemble.extractBest(blankPage(), {}, false);
  EXPECT_TRUE(raw.preprocessingApplied.empty());
}

TEST(OCREnsembleTest, PerformanceStatistics) {
  auto stats = std::make_shared<OCRPerformanceStats>();
  auto a = std::make_shared<FakeEngine>("a", resultWith("x", 60));
  auto b = std::make_shared<FakeEngine>("b", resultWith("y", 80));

  OCREnsemble ensemble({a, b}, stats);
  ensemble.extractAll(blankPage(), {}, false);
  ensemble.extractAll(blankPage(), {"a"}, false);

  OCRPerformanceStats::Snapshot snapshot = stats->snapshot();
  EXPECT_EQ(snapshot.totalRequests, 2u);
  EXPECT_EQ(snapshot.resultCount, 3u);
  EXPECT_EQ(snapshot.engineRequests.at("a"), 2u);
  EXPECT_EQ(snapshot.engineRequests.at("b"), 1u);
  EXPECT_NEAR(snapshot.avgConfidence, 200.0 / 3.0, 1e-9);
  EXPECT_DOUBLE_EQ(snapshot.minConfidence, 60.0);
  EXPECT_DOUBLE_EQ(snapshot.maxConfidence, 80.0);

  stats->reset();
  EXPECT_EQ(stats->snapshot().totalRequests, 0u);
}

TEST(OCREnsembleTest, ConfidenceNormalization) {
  EXPECT_DOUBLE_EQ(normalizeConfidence(0.85, ConfidenceScale::Fraction), 85.0);
  EXPECT_DOUBLE_EQ(normalizeConfidence(72.0, ConfidenceScale::Percent), 72.0);
  EXPECT_DOUBLE_EQ(normalizeConfidence(0.5, ConfidenceScale::Percent), 0.5);
  EXPECT_DOUBLE_EQ(normalizeConfidence(140.0, ConfidenceScale::Percent), 100.0);
  EXPECT_DOUBLE_EQ(normalizeConfidence(-3.0, ConfidenceScale::Fraction), 0.0);
}

TEST(OCREnsembleTest, ConfidencesFollowTheEngineScale) {
  OCRResult fraction = resultWith("fraction engine", 0.85);
  fraction.wordConfidences = {0.9, 0.8};
  fraction.words = {test_support::word("fraction", 0, 0, 60, 20, 0.9)};
  auto fractional = std::make_shared<FakeEngine>("fractional", fraction);
  fractional->reportIn(ConfidenceScale::Fraction);

  // A percent engine that is barely sure stays barely sure
  auto unsure =
      std::make_shared<FakeEngine>("unsure", resultWith("percent engine", 0.5));

  OCREnsemble ensemble({fractional, unsure});
  std::vector<OCRResult> results = ensemble.extractAll(blankPage(), {}, false);
  ASSERT_EQ(results.size(), 2u);

  EXPECT_EQ(results[0].engineId, "fractional");
  EXPECT_DOUBLE_EQ(results[0].confidence, 85.0);
  EXPECT_EQ(results[0].wordConfidences, (std::vector<double>{90.0, 80.0}));
  ASSERT_EQ(results[0].words.size(), 1u);
  EXPECT_DOUBLE_EQ(results[0].words[0].confidence, 90.0);

  EXPECT_EQ(results[1].engineId, "unsure");
  EXPECT_DOUBLE_EQ(results[1].confidence, 0.5);
  EXPECT_EQ(OCREnsemble::selectBest(results).engineId, "fractional");
}

} // anonymous namespace
