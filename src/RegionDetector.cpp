#include "RegionDetector.hpp"
#include "ProcessingErrors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iostream>

namespace exam {

namespace {

cv::Mat toGray(const cv::Mat &image) {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image;
  }
  return gray;
}

Region candidate(const cv::Rect &rect, int pageNumber, double confidence,
                 const char *method) {
  Region region =
      Region::fromRect(rect, pageNumber, RegionType::Unknown, confidence);
  region.metadata["detection_method"] = method;
  return region;
}

bool sameBoxes(const std::vector<Region> &a, const std::vector<Region> &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].rect() != b[i].rect()) {
      return false;
    }
  }
  return true;
}

void sortByPosition(std::vector<Region> &regions) {
  std::stable_sort(regions.begin(), regions.end(),
                   [](const Region &a, const Region &b) {
                     if (a.y != b.y) {
                       return a.y < b.y;
                     }
                     return a.x < b.x;
                   });
}

} // anonymous namespace

RegionDetector::RegionDetector(const DetectorConfig &config,
                               std::shared_ptr<OCREnsemble> ensemble)
    : m_config(config), m_ensemble(std::move(ensemble)),
      m_questionDetector(config.questions) {}

DetectionResult RegionDetector::detect(const cv::Mat &image,
                                       int pageNumber) const {
  DetectionResult result;
  result.method = "geometric";
  if (image.empty()) {
    return result;
  }

  cv::Mat gray = toGray(image);
  StructuralResult structural;

  // Tier B: OCR words -> lines -> columns -> question groups
  if (m_config.enableStructural && m_ensemble && m_ensemble->hasEngines()) {
    try {
      std::vector<OCRResult> ocrResults = m_ensemble->extractAll(gray, {}, false);
      auto withWords = std::find_if(
          ocrResults.begin(), ocrResults.end(),
          [](const OCRResult &r) { return !r.words.empty(); });
      if (withWords != ocrResults.end()) {
        result.lines = buildTextLines(withWords->words, m_config.lines);
        result.pageText = withWords->text;
        result.ocrConfidence = withWords->confidence;
        structural = m_questionDetector.detect(result.lines, pageNumber,
                                               gray.size(), m_config.columns);
        result.columnCount = structural.columnCount;
      }
    } catch (const OCRProcessingError &e) {
      std::cerr << "RegionDetector: structural detection unavailable on page "
                << pageNumber << ": " << e.what() << std::endl;
    }
  }

  if (structural.groups.empty()) {
    // Tier A over the whole page
    result.regions = detectGeometric(gray, pageNumber);
    for (auto &region : result.regions) {
      region.type = classifyRegion(image, region);
    }
    return result;
  }

  result.method = "structural";
  for (const auto &group : structural.groups) {
    result.regions.push_back(group.region);
  }
  result.groups = std::move(structural.groups);

  // Tier A inside questions whose options did not validate
  for (const auto &area : structural.rejectedAreas) {
    std::vector<Region> fallback = detectGeometric(gray, pageNumber, area);
    for (auto &region : fallback) {
      region.type = classifyRegion(image, region);
      region.metadata["fallback"] = "rejected_question";
      result.regions.push_back(std::move(region));
    }
    result.method = "hybrid";
  }

  return result;
}

std::vector<Region> RegionDetector::detectGeometric(const cv::Mat &gray,
                                                    int pageNumber,
                                                    const cv::Rect &area) const {
  cv::Rect bounds(0, 0, gray.cols, gray.rows);
  cv::Rect searchArea = area.area() > 0 ? (area & bounds) : bounds;
  if (searchArea.area() <= 0) {
    return {};
  }

  cv::Mat roi = toGray(gray(searchArea));

  cv::Mat binary;
  cv::threshold(roi, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

  std::vector<Region> candidates = textLineCandidates(binary);
  std::vector<Region> blocks = textBlockCandidates(binary);
  std::vector<Region> contours = contourCandidates(roi);
  candidates.insert(candidates.end(), blocks.begin(), blocks.end());
  candidates.insert(candidates.end(), contours.begin(), contours.end());

  for (auto &region : candidates) {
    region.x += searchArea.x;
    region.y += searchArea.y;
    region.pageNumber = pageNumber;
  }

  return filterAndMerge(std::move(candidates));
}

std::vector<Region>
RegionDetector::textLineCandidates(const cv::Mat &binary) const {
  // 1. Join characters of a line with a wide, short closing kernel
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(15, 3));
  cv::Mat closed;
  cv::morphologyEx(binary, closed, cv::MORPH_CLOSE, kernel);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(closed, contours, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);

  std::vector<Region> regions;
  for (const auto &contour : contours) {
    cv::Rect box = cv::boundingRect(contour);
    if (box.area() < m_config.minRegionArea ||
        box.area() > m_config.maxRegionArea ||
        box.height < m_config.minTextLineHeight ||
        box.height > m_config.maxTextLineHeight) {
      continue;
    }
    regions.push_back(candidate(box, 1, 0.7, "text_line"));
  }
  return regions;
}

std::vector<Region>
RegionDetector::textBlockCandidates(const cv::Mat &binary) const {
  // 2. Larger kernel plus blur joins neighbouring lines into blocks
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(25, 5));
  cv::Mat closed;
  cv::morphologyEx(binary, closed, cv::MORPH_CLOSE, kernel);
  cv::GaussianBlur(closed, closed, cv::Size(5, 5), 0);
  cv::threshold(closed, closed, 127, 255, cv::THRESH_BINARY);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(closed, contours, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);

  std::vector<Region> regions;
  for (const auto &contour : contours) {
    cv::Rect box = cv::boundingRect(contour);
    if (box.area() < m_config.minBlockArea ||
        box.area() > m_config.maxRegionArea ||
        box.height < m_config.minBlockHeight) {
      continue;
    }
    regions.push_back(candidate(box, 1, 0.8, "text_block"));
  }
  return regions;
}

std::vector<Region>
RegionDetector::contourCandidates(const cv::Mat &gray) const {
  // 3. Edge contours catch boxed content the morphology misses
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150);
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
  cv::dilate(edges, edges, kernel, cv::Point(-1, -1), 2);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  std::vector<Region> regions;
  for (const auto &contour : contours) {
    std::vector<cv::Point> approx;
    cv::approxPolyDP(contour, approx, 0.02 * cv::arcLength(contour, true),
                     true);
    cv::Rect box = cv::boundingRect(approx);
    if (box.area() < m_config.minRegionArea ||
        box.area() > m_config.maxRegionArea || box.width <= 50 ||
        box.height <= 20) {
      continue;
    }
    regions.push_back(candidate(box, 1, 0.6, "contour_region"));
  }
  return regions;
}

std::vector<Region>
RegionDetector::filterAndMerge(std::vector<Region> candidates) const {
  std::vector<Region> current = std::move(candidates);
  sortByPosition(current);

  // Merging can bring boxes close enough to merge again or to overlap;
  // iterate to a fixed point. Each round only shrinks the set.
  for (int round = 0; round < 32; ++round) {
    std::vector<Region> next = mergeVertical(removeOverlaps(current));
    if (sameBoxes(next, current)) {
      break;
    }
    current = std::move(next);
  }
  return current;
}

std::vector<Region>
RegionDetector::removeOverlaps(std::vector<Region> regions) const {
  std::stable_sort(regions.begin(), regions.end(),
                   [](const Region &a, const Region &b) {
                     return a.area() > b.area();
                   });

  std::vector<Region> kept;
  for (auto &region : regions) {
    bool overlapping = std::any_of(
        kept.begin(), kept.end(), [&](const Region &k) {
          return k.overlapOverSmaller(region) > m_config.overlapThreshold;
        });
    if (!overlapping) {
      kept.push_back(std::move(region));
    }
  }
  return kept;
}

std::vector<Region>
RegionDetector::mergeVertical(std::vector<Region> regions) const {
  sortByPosition(regions);

  std::vector<bool> used(regions.size(), false);
  std::vector<Region> merged;

  for (std::size_t i = 0; i < regions.size(); ++i) {
    if (used[i]) {
      continue;
    }
    used[i] = true;

    cv::Rect box = regions[i].rect();
    double confidenceSum = regions[i].confidence;
    int members = 1;

    bool grew;
    do {
      grew = false;
      for (std::size_t j = i + 1; j < regions.size(); ++j) {
        if (used[j]) {
          continue;
        }
        const Region &other = regions[j];
        int gap = other.y - (box.y + box.height);
        bool sharesColumn =
            other.x < box.x + box.width && box.x < other.x2();
        if (gap >= 0 && gap <= m_config.maxVerticalGap && sharesColumn) {
          box |= other.rect();
          confidenceSum += other.confidence;
          ++members;
          used[j] = true;
          grew = true;
        }
      }
    } while (grew);

    Region region = regions[i];
    if (members > 1) {
      region.x = box.x;
      region.y = box.y;
      region.width = box.width;
      region.height = box.height;
      region.confidence = confidenceSum / members;
      region.metadata["detection_method"] = "merged";
      region.metadata["merged_count"] = std::to_string(members);
    }
    merged.push_back(std::move(region));
  }

  sortByPosition(merged);
  return merged;
}

RegionType RegionDetector::classifyRegion(const cv::Mat &image,
                                          const Region &region) const {
  cv::Rect validRect = region.rect() & cv::Rect(0, 0, image.cols, image.rows);
  if (validRect.width < 10 || validRect.height < 10) {
    return RegionType::Unknown;
  }

  cv::Mat roi = image(validRect);
  cv::Mat grayRoi = toGray(roi);

  cv::Mat binary;
  cv::threshold(grayRoi, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);

  // Many small, similar components read as text, whatever the outline
  cv::Mat labels, stats, centroids;
  int count = cv::connectedComponentsWithStats(binary, labels, stats, centroids);
  int glyphLike = 0;
  for (int i = 1; i < count; ++i) {
    int w = stats.at<int>(i, cv::CC_STAT_WIDTH);
    int h = stats.at<int>(i, cv::CC_STAT_HEIGHT);
    if (h >= 5 && h <= 60 && w <= 80) {
      ++glyphLike;
    }
  }
  if (count > 1 && glyphLike >= 10 && glyphLike * 5 >= (count - 1) * 4) {
    return RegionType::Unknown;
  }

  if (isLikelyTable(grayRoi)) {
    return RegionType::Table;
  }

  cv::Mat edges;
  cv::Canny(grayRoi, edges, 50, 150);
  cv::dilate(edges, edges,
             cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5)),
             cv::Point(-1, -1), 2);
  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
  if (contours.empty()) {
    return RegionType::Unknown;
  }

  auto largest = std::max_element(
      contours.begin(), contours.end(),
      [](const std::vector<cv::Point> &a, const std::vector<cv::Point> &b) {
        return cv::contourArea(a) < cv::contourArea(b);
      });

  if (isLikelyGraphic(grayRoi, *largest)) {
    return RegionType::Diagram;
  }
  return RegionType::Unknown;
}

bool RegionDetector::isLikelyTable(const cv::Mat &gray) const {
  cv::Mat binary;
  cv::adaptiveThreshold(~gray, binary, 255, cv::ADAPTIVE_THRESH_MEAN_C,
                        cv::THRESH_BINARY, 15, -2);

  auto countRulings = [&binary](const cv::Size &kernelSize) {
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, kernelSize);
    cv::Mat lines;
    cv::morphologyEx(binary, lines, cv::MORPH_OPEN, kernel);
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(lines, contours, cv::RETR_EXTERNAL,
                     cv::CHAIN_APPROX_SIMPLE);
    return contours.size();
  };

  std::size_t horizontal =
      countRulings(cv::Size(std::max(gray.cols / 4, 20), 1));
  std::size_t vertical = countRulings(cv::Size(1, std::max(gray.rows / 4, 10)));
  return horizontal >= 3 && vertical >= 3;
}

bool RegionDetector::isLikelyGraphic(
    const cv::Mat &gray, const std::vector<cv::Point> &outline) const {
  if (gray.cols < 10 || gray.rows < 10 || outline.size() < 3) {
    return false;
  }

  int score = 0;

  // 1. Figures are roughly square; runs of text are wide and flat
  cv::Rect box = cv::boundingRect(outline);
  double aspectRatio = static_cast<double>(box.width) / std::max(box.height, 1);
  if (aspectRatio >= 0.5 && aspectRatio <= 2.0) {
    score += 2;
  }

  // 2. Line art or a filled shape, neither blank nor a solid block
  cv::Mat ink;
  cv::threshold(gray, ink, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
  double coverage =
      static_cast<double>(cv::countNonZero(ink)) / static_cast<double>(gray.total());
  if (coverage > 0.05 && coverage < 0.85) {
    score += 1;
  }

  // 3. Strokes of a drawing connect across the region, glyphs do not
  cv::Mat labels, stats, centroids;
  int count = cv::connectedComponentsWithStats(ink, labels, stats, centroids);
  int widest = 0;
  int tallest = 0;
  for (int i = 1; i < count; ++i) {
    widest = std::max(widest, stats.at<int>(i, cv::CC_STAT_WIDTH));
    tallest = std::max(tallest, stats.at<int>(i, cv::CC_STAT_HEIGHT));
  }
  if (widest * 2 >= gray.cols || tallest * 2 >= gray.rows) {
    score += 2;
  }

  // 4. Concave outlines: axes, arrows, labelled sketches
  std::vector<cv::Point> hull;
  cv::convexHull(outline, hull);
  double hullArea = cv::contourArea(hull);
  if (hullArea > 0 && cv::contourArea(outline) / hullArea < 0.7) {
    score += 1;
  }

  return score >= 4;
}

} // namespace exam
