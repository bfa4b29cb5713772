#ifndef EXAM_JSON_EXPORT_HPP
#define EXAM_JSON_EXPORT_HPP

#include "ConfidenceAggregator.hpp"
#include "ExtractedQuestion.hpp"
#include "ProcessingJob.hpp"
#include "Region.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace exam {

/// Longest region text included in a region export
constexpr std::size_t kTextPreviewLength = 100;

/// Regions below this confidence are flagged for review in exports
constexpr double kRegionReviewThreshold = 0.6;

/**
 * @brief A user-drawn box read from a manual region file
 */
struct ManualRegionSpec {
  int pageNumber = 1;
  cv::Rect box;
  RegionType type = RegionType::Question;
};

/**
 * @brief Region list as a JSON array
 *
 * Each element: id, type, coordinates{x,y,width,height}, confidence,
 * text_preview (at most 100 characters) and needs_review.
 */
std::string regionsToJson(const std::vector<Region> &regions, bool pretty = true);

std::string questionsToJson(const std::vector<ExtractedQuestion> &questions,
                            bool pretty = true);

/**
 * @brief Job snapshot as sent to progress consumers
 *
 * error_details is present only when the job failed.
 */
std::string snapshotToJson(const JobSnapshot &snapshot, bool pretty = false);

std::string statisticsToJson(const DocumentStatistics &statistics,
                             bool pretty = true);

/**
 * @brief Parse `[{page, x, y, width, height, type?}]`
 * @throws std::invalid_argument on malformed input or a bad box
 */
std::vector<ManualRegionSpec> parseManualRegions(const std::string &json);

std::string readTextFile(const std::string &path);

/**
 * @throws std::runtime_error if the file cannot be written
 */
void writeTextFile(const std::string &path, const std::string &content);

} // namespace exam

#endif // EXAM_JSON_EXPORT_HPP
