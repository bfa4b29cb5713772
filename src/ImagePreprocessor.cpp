#include "ImagePreprocessor.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace exam {

namespace {

const PreprocessStep kStepOrder[] = {
    PreprocessStep::Denoise,    PreprocessStep::Deskew,
    PreprocessStep::Contrast,   PreprocessStep::Sharpen,
    PreprocessStep::Morphology, PreprocessStep::Binarize,
    PreprocessStep::Resize};

std::string formatFixed(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

} // anonymous namespace

std::string preprocessStepName(PreprocessStep step) {
  switch (step) {
  case PreprocessStep::Denoise:
    return "denoise";
  case PreprocessStep::Deskew:
    return "deskew";
  case PreprocessStep::Contrast:
    return "contrast";
  case PreprocessStep::Sharpen:
    return "sharpen";
  case PreprocessStep::Morphology:
    return "morphology";
  case PreprocessStep::Binarize:
    return "binarize";
  case PreprocessStep::Resize:
    return "resize";
  }
  return "unknown";
}

ImagePreprocessor::ImagePreprocessor() : ImagePreprocessor(PreprocessConfig()) {}

ImagePreprocessor::ImagePreprocessor(const PreprocessConfig &config,
                                     const PreprocessCapabilities &capabilities)
    : m_config(config), m_capabilities(capabilities) {}

PreprocessResult ImagePreprocessor::enhance(const cv::Mat &image) const {
  return enhance(image, m_config.steps);
}

PreprocessResult
ImagePreprocessor::enhance(const cv::Mat &image,
                           const std::vector<PreprocessStep> &steps) const {
  PreprocessResult result;
  if (image.empty()) {
    result.image = image;
    return result;
  }

  std::set<PreprocessStep> enabled(steps.begin(), steps.end());

  try {
    cv::Mat processed = toGray(image);
    std::vector<std::string> applied;

    for (PreprocessStep step : kStepOrder) {
      if (enabled.count(step) == 0) {
        continue;
      }

      switch (step) {
      case PreprocessStep::Denoise:
        processed = denoise(processed, applied);
        break;
      case PreprocessStep::Deskew:
        processed = deskew(processed, applied);
        break;
      case PreprocessStep::Contrast:
        processed = enhanceContrast(processed);
        applied.push_back("contrast");
        break;
      case PreprocessStep::Sharpen:
        processed = sharpen(processed);
        applied.push_back("sharpen");
        break;
      case PreprocessStep::Morphology:
        processed = applyMorphology(processed);
        applied.push_back("morphology");
        break;
      case PreprocessStep::Binarize:
        processed = binarize(processed);
        applied.push_back("binarize");
        break;
      case PreprocessStep::Resize:
        processed = resizeIfSmall(processed, applied);
        break;
      }
    }

    result.image = processed;
    result.appliedSteps = std::move(applied);
  } catch (const std::exception &e) {
    std::cerr << "ImagePreprocessor: enhancement failed, using original image: "
              << e.what() << std::endl;
    result.image = image;
    result.appliedSteps = {"error"};
  }

  return result;
}

cv::Mat ImagePreprocessor::toGray(const cv::Mat &image) const {
  cv::Mat gray;

  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else if (image.channels() == 1) {
    gray = image.clone();
  } else {
    throw std::invalid_argument("Unsupported channel count: " +
                                std::to_string(image.channels()));
  }

  if (gray.depth() != CV_8U) {
    cv::Mat converted;
    double minVal = 0.0, maxVal = 0.0;
    cv::minMaxLoc(gray, &minVal, &maxVal);
    double scale = maxVal > 255.0 ? 255.0 / maxVal : 1.0;
    gray.convertTo(converted, CV_8U, scale);
    gray = converted;
  }

  return gray;
}

cv::Mat ImagePreprocessor::denoise(const cv::Mat &gray,
                                   std::vector<std::string> &applied) const {
  cv::Mat denoised;

  if (m_capabilities.advancedDenoise) {
    try {
      cv::fastNlMeansDenoising(gray, denoised, m_config.nlmStrength, 7, 21);
      applied.push_back("denoise_advanced");
      return denoised;
    } catch (const cv::Exception &e) {
      std::cerr << "ImagePreprocessor: non-local means denoising failed, "
                   "falling back to bilateral filter: "
                << e.what() << std::endl;
    }
  }

  cv::bilateralFilter(gray, denoised, 9, 75, 75);
  applied.push_back("denoise_basic");
  return denoised;
}

double ImagePreprocessor::estimateSkewAngle(const cv::Mat &gray) {
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150, 3);

  std::vector<cv::Vec2f> lines;
  cv::HoughLines(edges, lines, 1, CV_PI / 180, 200);
  if (lines.empty()) {
    return 0.0;
  }

  std::vector<double> angles;
  angles.reserve(lines.size());
  for (const auto &line : lines) {
    double angle = line[1] * 180.0 / CV_PI - 90.0;
    if (angle >= -45.0 && angle <= 45.0) {
      angles.push_back(angle);
    }
  }
  if (angles.empty()) {
    return 0.0;
  }

  std::nth_element(angles.begin(), angles.begin() + angles.size() / 2,
                   angles.end());
  return angles[angles.size() / 2];
}

cv::Mat ImagePreprocessor::deskew(const cv::Mat &gray,
                                  std::vector<std::string> &applied) const {
  if (!m_capabilities.deskew) {
    applied.push_back("deskew_skipped");
    return gray;
  }

  double angle = estimateSkewAngle(gray);
  if (std::abs(angle) <= m_config.minSkewAngle) {
    return gray;
  }

  cv::Point2f center(gray.cols / 2.0f, gray.rows / 2.0f);
  cv::Mat rotation = cv::getRotationMatrix2D(center, angle, 1.0);
  cv::Mat rotated;
  cv::warpAffine(gray, rotated, rotation, gray.size(), cv::INTER_CUBIC,
                 cv::BORDER_REPLICATE);

  applied.push_back("deskew_" + formatFixed(angle) + "deg");
  return rotated;
}

cv::Mat ImagePreprocessor::enhanceContrast(const cv::Mat &gray) const {
  cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(
      m_config.claheClipLimit,
      cv::Size(m_config.claheTileSize, m_config.claheTileSize));
  cv::Mat enhanced;
  clahe->apply(gray, enhanced);
  return enhanced;
}

cv::Mat ImagePreprocessor::sharpen(const cv::Mat &gray) const {
  cv::Mat kernel = (cv::Mat_<float>(3, 3) << -1, -1, -1, -1, 9, -1, -1, -1, -1);
  cv::Mat sharpened;
  cv::filter2D(gray, sharpened, -1, kernel);
  return sharpened;
}

cv::Mat ImagePreprocessor::applyMorphology(const cv::Mat &gray) const {
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2, 2));
  cv::Mat closed;
  cv::morphologyEx(gray, closed, cv::MORPH_CLOSE, kernel);
  return closed;
}

cv::Mat ImagePreprocessor::binarize(const cv::Mat &gray) const {
  cv::Mat binary;
  cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                        cv::THRESH_BINARY, m_config.binarizeBlockSize,
                        m_config.binarizeC);
  return binary;
}

cv::Mat ImagePreprocessor::resizeIfSmall(
    const cv::Mat &gray, std::vector<std::string> &applied) const {
  if (gray.rows >= m_config.minDimension && gray.cols >= m_config.minDimension) {
    return gray;
  }

  double factor =
      std::max(static_cast<double>(m_config.minDimension) / gray.rows,
               static_cast<double>(m_config.minDimension) / gray.cols);
  cv::Mat resized;
  cv::resize(gray, resized, cv::Size(), factor, factor, cv::INTER_CUBIC);

  applied.push_back("resize_" + formatFixed(factor) + "x");
  return resized;
}

} // namespace exam
