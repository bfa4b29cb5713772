#ifndef EXAM_TESTS_FAKE_ENGINE_HPP
#define EXAM_TESTS_FAKE_ENGINE_HPP

#include "OCREngine.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace exam {
namespace test_support {

/**
 * @brief OCR engine returning a canned result, or throwing when told to
 */
class FakeEngine : public OCREngine {
public:
  explicit FakeEngine(std::string id, OCRResult result = OCRResult(),
                      bool available = true)
      : m_id(std::move(id)), m_result(std::move(result)),
        m_available(available) {}

  std::string id() const override { return m_id; }
  bool isAvailable() const override { return m_available; }
  ConfidenceScale confidenceScale() const override { return m_scale; }

  OCRResult recognize(const cv::Mat &) override {
    ++m_calls;
    if (m_delay.count() > 0) {
      std::this_thread::sleep_for(m_delay);
    }
    if (!m_failure.empty()) {
      throw std::runtime_error(m_failure);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queued.empty()) {
      return m_result;
    }
    OCRResult next = m_queued.front();
    m_queued.pop_front();
    return next;
  }

  void failWith(const std::string &message) { m_failure = message; }
  void reportIn(ConfidenceScale scale) { m_scale = scale; }
  void delayBy(std::chrono::milliseconds delay) { m_delay = delay; }

  /// Results returned by the next calls, in order, before the default one
  void enqueue(OCRResult result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queued.push_back(std::move(result));
  }

  int calls() const { return m_calls; }

private:
  std::string m_id;
  OCRResult m_result;
  bool m_available;
  std::string m_failure;
  ConfidenceScale m_scale = ConfidenceScale::Percent;
  std::chrono::milliseconds m_delay{0};
  std::mutex m_mutex;
  std::deque<OCRResult> m_queued;
  std::atomic<int> m_calls{0};
};

inline OCRWord word(const std::string &text, int x, int y, int width,
                    int height = 20, double confidence = 90.0) {
  OCRWord w;
  w.text = text;
  w.boundingBox = cv::Rect(x, y, width, height);
  w.confidence = confidence;
  return w;
}

/**
 * @brief Words of one multiple-choice question laid out on a 400x500 page
 *
 *   1. What is the capital of France?
 *     (a) Paris (b) London
 *     (c) Berlin (d) Madrid
 *   Answer: (a)
 */
inline std::vector<OCRWord> franceQuestionWords() {
  return {
      word("1.", 20, 40, 20),       word("What", 45, 40, 50),
      word("is", 100, 40, 20),      word("the", 125, 40, 30),
      word("capital", 160, 40, 60), word("of", 225, 40, 20),
      word("France?", 250, 40, 70),

      word("(a)", 30, 80, 25),      word("Paris", 60, 80, 50),
      word("(b)", 120, 80, 25),     word("London", 150, 80, 60),

      word("(c)", 30, 120, 25),     word("Berlin", 60, 120, 55),
      word("(d)", 125, 120, 25),    word("Madrid", 155, 120, 60),

      word("Answer:", 20, 160, 70), word("(a)", 95, 160, 25),
  };
}

inline const char *franceQuestionText() {
  return "1. What is the capital of France?\n"
         "(a) Paris (b) London\n"
         "(c) Berlin (d) Madrid\n"
         "Answer: (a)";
}

inline OCRResult franceQuestionResult(double confidence = 90.0) {
  OCRResult result;
  result.text = franceQuestionText();
  result.confidence = confidence;
  result.words = franceQuestionWords();
  for (const auto &w : result.words) {
    result.wordConfidences.push_back(w.confidence);
  }
  return result;
}

} // namespace test_support
} // namespace exam

#endif // EXAM_TESTS_FAKE_ENGINE_HPP
