#ifndef EXAM_IMAGE_PREPROCESSOR_HPP
#define EXAM_IMAGE_PREPROCESSOR_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace exam {

/**
 * @brief Individually toggleable enhancement steps
 */
enum class PreprocessStep {
  Denoise,
  Deskew,
  Contrast,
  Sharpen,
  Morphology,
  Binarize,
  Resize
};

std::string preprocessStepName(PreprocessStep step);

/**
 * @brief Optional capabilities, fixed when the preprocessor is built
 *
 * A missing capability degrades its step to the simpler equivalent.
 */
struct PreprocessCapabilities {
  bool advancedDenoise = true; ///< Non-local-means denoising available
  bool deskew = true;          ///< Hough-based skew correction available
};

/**
 * @brief Tunable parameters of the enhancement steps
 */
struct PreprocessConfig {
  std::vector<PreprocessStep> steps = {
      PreprocessStep::Denoise, PreprocessStep::Deskew, PreprocessStep::Contrast,
      PreprocessStep::Sharpen, PreprocessStep::Binarize};
  double minSkewAngle = 0.5;   ///< Degrees below which no rotation is done
  double claheClipLimit = 2.0; ///< CLAHE clip limit
  int claheTileSize = 8;       ///< CLAHE tile grid size
  int binarizeBlockSize = 11;  ///< Adaptive threshold block size (odd)
  double binarizeC = 2.0;      ///< Adaptive threshold constant
  int minDimension = 300;      ///< Upscale below this width/height
  float nlmStrength = 10.0f;   ///< fastNlMeansDenoising filter strength
};

/**
 * @brief Output of an enhancement run
 */
struct PreprocessResult {
  cv::Mat image;                         ///< Processed (or original) image
  std::vector<std::string> appliedSteps; ///< Steps in the order applied
};

/**
 * @brief Grayscale enhancement chain for OCR input
 *
 * Enabled steps always run in the order denoise, deskew, contrast, sharpen,
 * morphology, binarize, resize. Any failure returns the input unchanged with
 * applied steps ["error"]; enhancement never throws.
 */
class ImagePreprocessor {
public:
  ImagePreprocessor();
  explicit ImagePreprocessor(
      const PreprocessConfig &config,
      const PreprocessCapabilities &capabilities = PreprocessCapabilities());

  /**
   * @brief Run the configured steps
   */
  PreprocessResult enhance(const cv::Mat &image) const;

  /**
   * @brief Run an explicit set of steps
   * @param image Input image (1, 3 or 4 channels)
   * @param steps Steps to enable; order of the list is irrelevant
   */
  PreprocessResult enhance(const cv::Mat &image,
                           const std::vector<PreprocessStep> &steps) const;

  /**
   * @brief Estimate page skew from Hough lines over Canny edges
   * @param gray 8-bit single channel image
   * @return Median line angle in degrees within [-45, 45], 0 if no lines
   */
  static double estimateSkewAngle(const cv::Mat &gray);

  const PreprocessConfig &config() const { return m_config; }
  const PreprocessCapabilities &capabilities() const { return m_capabilities; }

private:
  cv::Mat toGray(const cv::Mat &image) const;
  cv::Mat denoise(const cv::Mat &gray, std::vector<std::string> &applied) const;
  cv::Mat deskew(const cv::Mat &gray, std::vector<std::string> &applied) const;
  cv::Mat enhanceContrast(const cv::Mat &gray) const;
  cv::Mat sharpen(const cv::Mat &gray) const;
  cv::Mat applyMorphology(const cv::Mat &gray) const;
  cv::Mat binarize(const cv::Mat &gray) const;
  cv::Mat resizeIfSmall(const cv::Mat &gray,
                        std::vector<std::string> &applied) const;

  PreprocessConfig m_config;
  PreprocessCapabilities m_capabilities;
};

} // namespace exam

#endif // EXAM_IMAGE_PREPROCESSOR_HPP
