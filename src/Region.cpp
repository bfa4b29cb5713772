#include "Region.hpp"

#include <algorithm>
#include <cmath>

namespace exam {

namespace {

struct RegionTypeName {
  RegionType type;
  const char *name;
};

const RegionTypeName kRegionTypeNames[] = {
    {RegionType::Question, "question"},
    {RegionType::AnswerOptions, "answer_options"},
    {RegionType::QuestionGroup, "question_group"},
    {RegionType::Passage, "passage"},
    {RegionType::Diagram, "diagram"},
    {RegionType::Table, "table"},
    {RegionType::Unknown, "unknown"},
};

} // anonymous namespace

std::string regionTypeToString(RegionType type) {
  for (const auto &entry : kRegionTypeNames) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

RegionType regionTypeFromString(const std::string &name) {
  for (const auto &entry : kRegionTypeNames) {
    if (name == entry.name) {
      return entry.type;
    }
  }
  return RegionType::Unknown;
}

std::string Region::id() const {
  auto it = metadata.find("region_id");
  return it != metadata.end() ? it->second : std::string();
}

bool Region::isValid() const {
  return width > 0 && height > 0 && x >= 0 && y >= 0 && pageNumber >= 1 &&
         confidence >= 0.0 && confidence <= 1.0;
}

bool Region::overlaps(const Region &other, double threshold) const {
  cv::Rect intersection = rect() & other.rect();
  if (intersection.empty()) {
    return false;
  }

  double intersectionArea = intersection.area();
  double unionArea = area() + other.area() - intersectionArea;
  if (unionArea <= 0) {
    return false;
  }
  return (intersectionArea / unionArea) > threshold;
}

double Region::overlapOverSmaller(const Region &other) const {
  cv::Rect intersection = rect() & other.rect();
  if (intersection.empty()) {
    return 0.0;
  }

  int smallerArea = std::min(area(), other.area());
  if (smallerArea <= 0) {
    return 0.0;
  }
  return static_cast<double>(intersection.area()) / smallerArea;
}

double Region::distanceTo(const Region &other) const {
  cv::Point a = center();
  cv::Point b = other.center();
  double dx = b.x - a.x;
  double dy = b.y - a.y;
  return std::sqrt(dx * dx + dy * dy);
}

Region Region::fromRect(const cv::Rect &rect, int pageNumber, RegionType type,
                        double confidence) {
  Region region;
  region.x = rect.x;
  region.y = rect.y;
  region.width = rect.width;
  region.height = rect.height;
  region.pageNumber = pageNumber;
  region.type = type;
  region.confidence = std::clamp(confidence, 0.0, 1.0);
  return region;
}

} // namespace exam
