#ifndef EXAM_REGION_HPP
#define EXAM_REGION_HPP

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Classified content type of a page region
 */
enum class RegionType {
  Question,      ///< A question stem without options
  AnswerOptions, ///< A block of lettered answer options
  QuestionGroup, ///< A question together with its options
  Passage,       ///< Context passage shared by several questions
  Diagram,       ///< Figure or graphic, treated as opaque
  Table,         ///< Ruled table, treated as opaque
  Unknown        ///< Unclassified text or content
};

/**
 * @brief Stable lower-case name of a region type (e.g. "question_group")
 */
std::string regionTypeToString(RegionType type);

/**
 * @brief Parse a region type name; unknown names map to RegionType::Unknown
 */
RegionType regionTypeFromString(const std::string &name);

/**
 * @brief Rectangular area of one page with a content type and OCR text
 *
 * Coordinates are pixels in the raster the region was detected on, origin
 * top-left. A valid region has positive size, non-negative origin and a
 * confidence in [0, 1].
 */
struct Region {
  int x = 0;                             ///< Left edge in pixels
  int y = 0;                             ///< Top edge in pixels
  int width = 0;                         ///< Width in pixels
  int height = 0;                        ///< Height in pixels
  int pageNumber = 1;                    ///< 1-indexed owning page
  RegionType type = RegionType::Unknown; ///< Classified content type
  double confidence = 0.0;               ///< Detection confidence (0-1)
  std::string text;                      ///< Recognized text, may be empty
  std::map<std::string, std::string> metadata; ///< Free-form annotations

  int x2() const { return x + width; }
  int y2() const { return y + height; }
  int area() const { return width * height; }
  cv::Point center() const { return {x + width / 2, y + height / 2}; }
  cv::Rect rect() const { return {x, y, width, height}; }

  /**
   * @brief Region id stored in metadata, empty if none was assigned
   */
  std::string id() const;

  /**
   * @brief Check the geometry and confidence bounds
   */
  bool isValid() const;

  /**
   * @brief Intersection-over-union test
   * @param other Region to compare with
   * @param threshold IoU above which the regions count as overlapping
   */
  bool overlaps(const Region &other, double threshold = 0.3) const;

  /**
   * @brief Intersection area divided by the smaller of the two areas
   */
  double overlapOverSmaller(const Region &other) const;

  /**
   * @brief Euclidean distance between region centers
   */
  double distanceTo(const Region &other) const;

  static Region fromRect(const cv::Rect &rect, int pageNumber,
                         RegionType type, double confidence);
};

/**
 * @brief One lettered answer option, e.g. "(b) Paris"
 */
struct QuestionOption {
  char letter = 'a'; ///< Lower-case option letter
  std::string text;  ///< Option text without the "(b)" marker
};

inline bool operator==(const QuestionOption &a, const QuestionOption &b) {
  return a.letter == b.letter && a.text == b.text;
}

/**
 * @brief A question_group region plus its parsed structure
 */
struct QuestionGroup {
  Region region;                      ///< Bounding region (question_group)
  std::optional<int> questionNumber;  ///< Printed question number if any
  std::string questionText;           ///< Stem text without number prefix
  std::vector<QuestionOption> options; ///< Options sorted a, b, c, d
  bool isComplete = false;            ///< True when two or more options
};

} // namespace exam

#endif // EXAM_REGION_HPP
