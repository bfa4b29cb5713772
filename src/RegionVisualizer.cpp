#include "RegionVisualizer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace exam {

cv::Scalar regionColor(RegionType type) {
  switch (type) {
  case RegionType::QuestionGroup:
    return cv::Scalar(0, 160, 0); // Green
  case RegionType::Question:
    return cv::Scalar(255, 0, 0); // Blue
  case RegionType::AnswerOptions:
    return cv::Scalar(255, 128, 0);
  case RegionType::Passage:
    return cv::Scalar(128, 0, 128); // Purple
  case RegionType::Diagram:
    return cv::Scalar(0, 165, 255); // Orange
  case RegionType::Table:
    return cv::Scalar(0, 200, 200);
  case RegionType::Unknown:
    break;
  }
  return cv::Scalar(0, 0, 255); // Red
}

cv::Mat drawRegions(const cv::Mat &page, const std::vector<Region> &regions) {
  cv::Mat canvas;
  if (page.empty()) {
    return canvas;
  }
  if (page.channels() == 1) {
    cv::cvtColor(page, canvas, cv::COLOR_GRAY2BGR);
  } else if (page.channels() == 4) {
    cv::cvtColor(page, canvas, cv::COLOR_BGRA2BGR);
  } else {
    canvas = page.clone();
  }

  const cv::Rect bounds(0, 0, canvas.cols, canvas.rows);
  for (const auto &region : regions) {
    cv::Rect box = region.rect() & bounds;
    if (box.area() <= 0) {
      continue;
    }

    cv::Scalar color = regionColor(region.type);
    int thickness = region.confidence < 0.6 ? 4 : 2;
    cv::rectangle(canvas, box, color, thickness);

    std::string name = region.id().empty() ? regionTypeToString(region.type)
                                           : region.id();
    char label[96];
    std::snprintf(label, sizeof(label), "%s %.2f", name.c_str(),
                  region.confidence);

    int baseline = 0;
    cv::Size textSize =
        cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
    cv::Point origin(box.x, std::max(box.y - 4, textSize.height));
    cv::rectangle(canvas,
                  cv::Rect(origin.x, origin.y - textSize.height,
                           textSize.width, textSize.height + baseline) &
                      bounds,
                  cv::Scalar(255, 255, 255), cv::FILLED);
    cv::putText(canvas, label, origin, cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 1);
  }

  return canvas;
}

bool saveRegionOverlay(const std::string &path, const cv::Mat &page,
                       const std::vector<Region> &regions) {
  cv::Mat canvas = drawRegions(page, regions);
  if (canvas.empty()) {
    std::cerr << "RegionVisualizer: nothing to draw for " << path << std::endl;
    return false;
  }
  if (!cv::imwrite(path, canvas)) {
    std::cerr << "ERROR: Failed to save region overlay: " << path << std::endl;
    return false;
  }
  return true;
}

} // namespace exam
