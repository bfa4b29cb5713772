#include "RegionCorrector.hpp"

#include <algorithm>
#include <climits>
#include <stdexcept>

namespace exam {

namespace {

void requireValidBox(const cv::Rect &box, const char *operation) {
  if (box.width <= 0 || box.height <= 0) {
    throw std::invalid_argument(std::string(operation) +
                                ": region must have positive width and height");
  }
  if (box.x < 0 || box.y < 0) {
    throw std::invalid_argument(std::string(operation) +
                                ": region must not start at negative coordinates");
  }
}

double averageConfidence(const std::vector<Region> &regions) {
  if (regions.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto &region : regions) {
    sum += region.confidence;
  }
  return sum / regions.size();
}

Region withBox(const Region &region, const cv::Rect &box) {
  Region result = region;
  result.x = box.x;
  result.y = box.y;
  result.width = box.width;
  result.height = box.height;
  return result;
}

} // anonymous namespace

std::string correctionTypeToString(CorrectionType type) {
  switch (type) {
  case CorrectionType::Resize:
    return "resize";
  case CorrectionType::Move:
    return "move";
  case CorrectionType::Split:
    return "split";
  case CorrectionType::Merge:
    return "merge";
  case CorrectionType::Delete:
    return "delete";
  case CorrectionType::Create:
    return "create";
  case CorrectionType::Retype:
    break;
  }
  return "retype";
}

RegionCorrector::RegionCorrector(double splitConfidenceFactor)
    : m_splitConfidenceFactor(std::clamp(splitConfidenceFactor, 0.0, 1.0)) {}

Region RegionCorrector::resize(const Region &region, const cv::Rect &newBox,
                               const std::string &actor) {
  requireValidBox(newBox, "resize");

  Region corrected = withBox(region, newBox);
  corrected.metadata["manually_corrected"] = "true";
  record(CorrectionType::Resize, {region}, {corrected}, actor);
  return corrected;
}

Region RegionCorrector::move(const Region &region, int dx, int dy,
                             const std::string &actor) {
  cv::Rect moved(region.x + dx, region.y + dy, region.width, region.height);
  requireValidBox(moved, "move");

  Region corrected = withBox(region, moved);
  corrected.metadata["manually_corrected"] = "true";
  record(CorrectionType::Move, {region}, {corrected}, actor);
  return corrected;
}

std::pair<Region, Region> RegionCorrector::split(const Region &region,
                                                 const cv::Point &point,
                                                 SplitAxis axis,
                                                 const std::string &actor) {
  cv::Rect first;
  cv::Rect second;
  if (axis == SplitAxis::Horizontal) {
    if (point.y <= region.y || point.y >= region.y2()) {
      throw std::invalid_argument("split: point must lie strictly inside the region");
    }
    first = cv::Rect(region.x, region.y, region.width, point.y - region.y);
    second = cv::Rect(region.x, point.y, region.width, region.y2() - point.y);
  } else {
    if (point.x <= region.x || point.x >= region.x2()) {
      throw std::invalid_argument("split: point must lie strictly inside the region");
    }
    first = cv::Rect(region.x, region.y, point.x - region.x, region.height);
    second = cv::Rect(point.x, region.y, region.x2() - point.x, region.height);
  }

  double confidence = region.confidence * m_splitConfidenceFactor;

  Region top = withBox(region, first);
  top.confidence = confidence;
  top.metadata.erase("region_id");
  top.metadata["manually_corrected"] = "true";
  top.metadata["split_from"] = region.id();

  Region bottom = top;
  bottom.x = second.x;
  bottom.y = second.y;
  bottom.width = second.width;
  bottom.height = second.height;
  bottom.text.clear();

  record(CorrectionType::Split, {region}, {top, bottom}, actor);
  return {top, bottom};
}

Region RegionCorrector::merge(const std::vector<Region> &regions,
                              const std::string &actor) {
  if (regions.size() < 2) {
    throw std::invalid_argument("merge: at least two regions are required");
  }

  int page = regions.front().pageNumber;
  int left = INT_MAX, top = INT_MAX, right = INT_MIN, bottom = INT_MIN;
  std::vector<std::string> texts;
  for (const auto &region : regions) {
    if (region.pageNumber != page) {
      throw std::invalid_argument("merge: regions must be on the same page");
    }
    left = std::min(left, region.x);
    top = std::min(top, region.y);
    right = std::max(right, region.x2());
    bottom = std::max(bottom, region.y2());
    if (!region.text.empty()) {
      texts.push_back(region.text);
    }
  }

  cv::Rect box(left, top, right - left, bottom - top);
  requireValidBox(box, "merge");

  Region merged = withBox(regions.front(), box);
  merged.confidence = averageConfidence(regions);
  merged.text.clear();
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      merged.text += "\n";
    }
    merged.text += texts[i];
  }
  merged.metadata.erase("region_id");
  merged.metadata["manually_corrected"] = "true";
  merged.metadata["merged_count"] = std::to_string(regions.size());

  record(CorrectionType::Merge, regions, {merged}, actor);
  return merged;
}

void RegionCorrector::remove(const Region &region, const std::string &actor) {
  record(CorrectionType::Delete, {region}, {}, actor);
}

Region RegionCorrector::create(const cv::Rect &box, int pageNumber,
                               RegionType type, const std::string &actor) {
  requireValidBox(box, "create");
  if (pageNumber < 1) {
    throw std::invalid_argument("create: page numbers start at 1");
  }

  Region created = Region::fromRect(box, pageNumber, type, 1.0);
  created.metadata["manually_corrected"] = "true";
  created.metadata["detection_method"] = "manual";
  record(CorrectionType::Create, {}, {created}, actor);
  return created;
}

Region RegionCorrector::retype(const Region &region, RegionType type,
                               const std::string &actor) {
  Region corrected = region;
  corrected.type = type;
  corrected.metadata["manually_corrected"] = "true";
  corrected.metadata["previous_type"] = regionTypeToString(region.type);
  record(CorrectionType::Retype, {region}, {corrected}, actor);
  return corrected;
}

std::vector<RegionCorrection> RegionCorrector::history() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_history;
}

CorrectionStats RegionCorrector::correctionStats() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  CorrectionStats stats;
  stats.total = m_history.size();
  for (const auto &correction : m_history) {
    ++stats.byType[correctionTypeToString(correction.type)];
    stats.actors.insert(correction.actor);
  }
  return stats;
}

void RegionCorrector::record(CorrectionType type, std::vector<Region> original,
                             std::vector<Region> corrected,
                             const std::string &actor) {
  RegionCorrection correction;
  correction.type = type;
  correction.actor = actor;
  correction.timestamp = std::chrono::system_clock::now();
  correction.confidenceBefore = averageConfidence(original);
  correction.confidenceAfter = averageConfidence(corrected);
  if (!original.empty()) {
    correction.pageNumber = original.front().pageNumber;
  } else if (!corrected.empty()) {
    correction.pageNumber = corrected.front().pageNumber;
  }
  correction.original = std::move(original);
  correction.corrected = std::move(corrected);

  std::lock_guard<std::mutex> lock(m_mutex);
  m_history.push_back(std::move(correction));
}

} // namespace exam
