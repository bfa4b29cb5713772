#ifndef EXAM_REGION_DETECTOR_HPP
#define EXAM_REGION_DETECTOR_HPP

#include "LayoutAnalysis.hpp"
#include "OCREnsemble.hpp"
#include "QuestionDetector.hpp"
#include "Region.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Region detection parameters
 */
struct DetectorConfig {
  int minRegionArea = 500;         ///< Smallest candidate area
  int maxRegionArea = 200000;      ///< Largest candidate area
  int minTextLineHeight = 10;      ///< Text line candidate height bounds
  int maxTextLineHeight = 500;
  int minBlockArea = 1500;         ///< Text block candidate bounds
  int minBlockHeight = 30;
  double overlapThreshold = 0.5;   ///< Intersection over smaller area
  int maxVerticalGap = 50;         ///< Vertical gap merged into one region
  bool enableStructural = true;    ///< Use OCR based question grouping
  LineBuilderConfig lines;
  ColumnConfig columns;
  QuestionDetectorConfig questions;
};

/**
 * @brief Regions and question groups found on one page
 */
struct DetectionResult {
  std::vector<Region> regions;       ///< All regions, groups first
  std::vector<QuestionGroup> groups; ///< Validated question groups
  std::vector<TextLine> lines;       ///< OCR lines used for grouping
  std::string method;                ///< structural, hybrid or geometric
  int columnCount = 0;
  std::string pageText;              ///< Page OCR text, if OCR ran
  double ocrConfidence = 0.0;        ///< Page OCR confidence (0-100)
};

/**
 * @brief Two-tier page region detector
 *
 * The structural tier OCRs the page and groups numbered questions with
 * their options. Questions whose options fail validation, and pages where
 * no question is found, fall back to the geometric tier, which finds text
 * regions from morphology and contours alone.
 */
class RegionDetector {
public:
  explicit RegionDetector(const DetectorConfig &config = DetectorConfig(),
                          std::shared_ptr<OCREnsemble> ensemble = nullptr);

  /**
   * @brief Detect the regions of one page
   * @param image Page raster (gray, BGR or BGRA)
   * @param pageNumber 1-indexed page number stored on every region
   */
  DetectionResult detect(const cv::Mat &image, int pageNumber = 1) const;

  /**
   * @brief Geometric detection over a page or part of it
   * @param gray 8-bit grayscale page
   * @param pageNumber Page number of the produced regions
   * @param area Part of the page to search; empty for the whole page
   */
  std::vector<Region> detectGeometric(const cv::Mat &gray, int pageNumber,
                                      const cv::Rect &area = cv::Rect()) const;

  /**
   * @brief Drop overlapping candidates and merge vertically adjacent ones
   *
   * Repeats until stable, so applying it to its own output changes nothing.
   */
  std::vector<Region> filterAndMerge(std::vector<Region> candidates) const;

  /**
   * @brief Classify a geometric region as diagram, table or unknown
   */
  RegionType classifyRegion(const cv::Mat &image, const Region &region) const;

  const DetectorConfig &config() const { return m_config; }

private:
  std::vector<Region> textLineCandidates(const cv::Mat &binary) const;
  std::vector<Region> textBlockCandidates(const cv::Mat &binary) const;
  std::vector<Region> contourCandidates(const cv::Mat &gray) const;
  std::vector<Region> removeOverlaps(std::vector<Region> regions) const;
  std::vector<Region> mergeVertical(std::vector<Region> regions) const;
  /// Monochrome figure test on a grayscale region and its largest outline
  bool isLikelyGraphic(const cv::Mat &gray,
                       const std::vector<cv::Point> &outline) const;
  bool isLikelyTable(const cv::Mat &gray) const;

  DetectorConfig m_config;
  std::shared_ptr<OCREnsemble> m_ensemble;
  QuestionDetector m_questionDetector;
};

} // namespace exam

#endif // EXAM_REGION_DETECTOR_HPP
