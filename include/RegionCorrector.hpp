#ifndef EXAM_REGION_CORRECTOR_HPP
#define EXAM_REGION_CORRECTOR_HPP

#include "Region.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace exam {

enum class CorrectionType { Resize, Move, Split, Merge, Delete, Create, Retype };

std::string correctionTypeToString(CorrectionType type);

/**
 * @brief Direction of a split cut
 */
enum class SplitAxis {
  Horizontal, ///< Cut along a horizontal line at point.y
  Vertical    ///< Cut along a vertical line at point.x
};

/**
 * @brief One manual correction, recorded once and never changed
 */
struct RegionCorrection {
  CorrectionType type = CorrectionType::Resize;
  std::vector<Region> original;  ///< Regions before the correction
  std::vector<Region> corrected; ///< Regions after the correction
  std::string actor;
  std::chrono::system_clock::time_point timestamp;
  double confidenceBefore = 0.0;
  double confidenceAfter = 0.0;
  int pageNumber = 1;
};

struct CorrectionStats {
  std::size_t total = 0;
  std::map<std::string, std::size_t> byType;
  std::set<std::string> actors;
};

/**
 * @brief Applies manual corrections to regions
 *
 * Every operation returns new regions and appends a RegionCorrection to the
 * history. Invalid geometry throws std::invalid_argument and records
 * nothing.
 */
class RegionCorrector {
public:
  explicit RegionCorrector(double splitConfidenceFactor = 0.9);

  Region resize(const Region &region, const cv::Rect &newBox,
                const std::string &actor);

  Region move(const Region &region, int dx, int dy, const std::string &actor);

  /**
   * @brief Split a region in two at @p point
   *
   * The first half (top or left) keeps the text; both halves get the
   * original confidence scaled by the split factor.
   */
  std::pair<Region, Region> split(const Region &region, const cv::Point &point,
                                   SplitAxis axis, const std::string &actor);

  /**
   * @brief Merge regions of one page into their bounding region
   *
   * Confidence is averaged, texts are joined with newlines and the type of
   * the first region is kept.
   */
  Region merge(const std::vector<Region> &regions, const std::string &actor);

  void remove(const Region &region, const std::string &actor);

  /**
   * @brief Create a user-drawn region with confidence 1.0
   */
  Region create(const cv::Rect &box, int pageNumber, RegionType type,
                const std::string &actor);

  Region retype(const Region &region, RegionType type,
                const std::string &actor);

  /**
   * @brief Copy of the append-only correction history
   */
  std::vector<RegionCorrection> history() const;

  CorrectionStats correctionStats() const;

private:
  void record(CorrectionType type, std::vector<Region> original,
              std::vector<Region> corrected, const std::string &actor);

  double m_splitConfidenceFactor;
  mutable std::mutex m_mutex;
  std::vector<RegionCorrection> m_history;
};

} // namespace exam

#endif // EXAM_REGION_CORRECTOR_HPP
