#ifndef EXAM_REGION_VISUALIZER_HPP
#define EXAM_REGION_VISUALIZER_HPP

#include "Region.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace exam {

/**
 * @brief Box color of a region type (BGR)
 */
cv::Scalar regionColor(RegionType type);

/**
 * @brief Draw regions over a page for review
 *
 * Each region gets a box in its type color and a label with its id (or
 * type) and confidence. Regions below 0.6 confidence are drawn with a
 * thicker box.
 * @param page Page raster the regions were detected on
 * @return BGR copy of the page with the overlay
 */
cv::Mat drawRegions(const cv::Mat &page, const std::vector<Region> &regions);

/**
 * @brief Draw regions and save the overlay as an image file
 * @return True if the file was written
 */
bool saveRegionOverlay(const std::string &path, const cv::Mat &page,
                       const std::vector<Region> &regions);

} // namespace exam

#endif // EXAM_REGION_VISUALIZER_HPP
