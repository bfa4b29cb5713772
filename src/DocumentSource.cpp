#include "DocumentSource.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace exam {

namespace {

enum class FileSignature { Unknown, PDF, PNG };

FileSignature readSignature(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  std::array<unsigned char, 8> header{};
  if (!file.read(reinterpret_cast<char *>(header.data()), header.size())) {
    return FileSignature::Unknown;
  }

  static const std::array<unsigned char, 8> png = {0x89, 'P', 'N', 'G',
                                                   '\r', '\n', 0x1A, '\n'};
  if (header == png) {
    return FileSignature::PNG;
  }
  if (header[0] == '%' && header[1] == 'P' && header[2] == 'D' &&
      header[3] == 'F') {
    return FileSignature::PDF;
  }
  return FileSignature::Unknown;
}

std::string toStdString(const poppler::ustring &text) {
  poppler::byte_array bytes = text.to_utf8();
  return std::string(bytes.begin(), bytes.end());
}

/**
 * Copy a Poppler raster into an OpenCV matrix.
 */
cv::Mat toMat(const poppler::image &image) {
  int width = image.width();
  int height = image.height();
  char *data = const_cast<char *>(image.const_data());
  cv::Mat mat;

  switch (image.format()) {
  case poppler::image::format_argb32:
    // ARGB32 is stored as BGRA in memory
    cv::cvtColor(cv::Mat(height, width, CV_8UC4, data, image.bytes_per_row()),
                 mat, cv::COLOR_BGRA2BGR);
    break;
  case poppler::image::format_rgb24:
    cv::cvtColor(cv::Mat(height, width, CV_8UC3, data, image.bytes_per_row()),
                 mat, cv::COLOR_RGB2BGR);
    break;
  case poppler::image::format_bgr24:
    mat = cv::Mat(height, width, CV_8UC3, data, image.bytes_per_row()).clone();
    break;
  case poppler::image::format_gray8:
    mat = cv::Mat(height, width, CV_8UC1, data, image.bytes_per_row()).clone();
    break;
  default:
    break;
  }
  return mat;
}

std::size_t countNonSpace(const std::string &text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](unsigned char c) {
        return !std::isspace(c);
      }));
}

} // anonymous namespace

// PDFDocumentSource

PDFDocumentSource::PDFDocumentSource(const std::string &pdfPath)
    : m_path(pdfPath),
      m_document(poppler::document::load_from_file(pdfPath)) {
  if (!m_document) {
    throw std::runtime_error("Failed to load PDF file: " + pdfPath);
  }
}

PDFDocumentSource::~PDFDocumentSource() = default;

int PDFDocumentSource::pageCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_document->pages();
}

bool PDFDocumentSource::isLocked() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_document->is_locked();
}

bool PDFDocumentSource::hasTextLayer(int minChars, int samplePages) const {
  int pages = std::min(pageCount(), std::max(samplePages, 1));
  std::size_t total = 0;
  for (int pageNumber = 1; pageNumber <= pages; ++pageNumber) {
    total += countNonSpace(pageText(pageNumber));
    if (total >= static_cast<std::size_t>(std::max(minChars, 0))) {
      return true;
    }
  }
  return false;
}

std::string PDFDocumentSource::pageText(int pageNumber) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_document->is_locked() || pageNumber < 1 ||
      pageNumber > m_document->pages()) {
    return std::string();
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
  if (!page) {
    std::cerr << "PDFDocumentSource: failed to open page " << pageNumber
              << " of " << m_path << std::endl;
    return std::string();
  }
  return toStdString(page->text());
}

std::string PDFDocumentSource::regionText(int pageNumber, const cv::Rect &box,
                                          double dpi) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_document->is_locked() || pageNumber < 1 ||
      pageNumber > m_document->pages() || dpi <= 0.0) {
    return std::string();
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
  if (!page) {
    return std::string();
  }

  // Raster pixels to PDF points (72 per inch), origin top-left
  double scale = 72.0 / dpi;
  poppler::rectf area(box.x * scale, box.y * scale, box.width * scale,
                      box.height * scale);
  return toStdString(page->text(area));
}

PageRenderResult PDFDocumentSource::renderPage(int pageNumber,
                                               double dpi) const {
  PageRenderResult result;
  result.pageNumber = pageNumber;
  result.dpi = dpi;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_document->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + m_path;
      return result;
    }
    if (pageNumber < 1 || pageNumber > m_document->pages()) {
      result.errorMessage = "Page " + std::to_string(pageNumber) +
                            " out of range (document has " +
                            std::to_string(m_document->pages()) + " pages)";
      return result;
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    std::unique_ptr<poppler::page> page(m_document->create_page(pageNumber - 1));
    if (!page) {
      result.errorMessage = "Failed to create page " + std::to_string(pageNumber);
      return result;
    }

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
    if (!popplerImage.is_valid()) {
      result.errorMessage = "Failed to render page " + std::to_string(pageNumber);
      return result;
    }

    result.image = toMat(popplerImage);
    if (result.image.empty()) {
      result.errorMessage = "Unsupported image format";
      return result;
    }
    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page rendering failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

// ImageDocumentSource

ImageDocumentSource::ImageDocumentSource(
    const std::vector<std::string> &imagePaths, double nativeDpi)
    : m_nativeDpi(nativeDpi > 0.0 ? nativeDpi : 300.0) {
  for (const auto &path : imagePaths) {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
      throw std::runtime_error("Failed to load image: " + path);
    }
    m_pages.push_back(image);
  }
}

PageRenderResult ImageDocumentSource::renderPage(int pageNumber,
                                                 double dpi) const {
  PageRenderResult result;
  result.pageNumber = pageNumber;
  result.dpi = dpi;

  auto startTime = std::chrono::high_resolution_clock::now();

  if (pageNumber < 1 || pageNumber > pageCount()) {
    result.errorMessage = "Page " + std::to_string(pageNumber) + " out of range";
    return result;
  }

  const cv::Mat &page = m_pages[pageNumber - 1];
  if (dpi <= 0.0 || std::abs(dpi - m_nativeDpi) < 1e-6) {
    result.image = page.clone();
    result.dpi = m_nativeDpi;
  } else {
    double scale = dpi / m_nativeDpi;
    cv::resize(page, result.image, cv::Size(), scale, scale,
               scale < 1.0 ? cv::INTER_AREA : cv::INTER_CUBIC);
  }
  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return result;
}

// Validation

ValidationResult validateDocumentFiles(const std::vector<std::string> &paths,
                                       const ValidationLimits &limits) {
  namespace fs = std::filesystem;
  ValidationResult result;

  if (paths.empty()) {
    result.errorMessage = "No input files";
    return result;
  }

  FileSignature signature = FileSignature::Unknown;
  for (const auto &path : paths) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
      result.errorMessage = "File not found: " + path;
      return result;
    }
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
      result.errorMessage = "Cannot read file size: " + path;
      return result;
    }
    result.fileSize += size;

    FileSignature current = readSignature(path);
    if (current == FileSignature::Unknown) {
      result.errorMessage = "Unsupported file type (expected PDF or PNG): " + path;
      return result;
    }
    if (signature != FileSignature::Unknown && current != signature) {
      result.errorMessage = "Mixed PDF and PNG input";
      return result;
    }
    signature = current;
  }

  if (result.fileSize > limits.maxFileSize) {
    result.errorMessage = "File too large: " + std::to_string(result.fileSize) +
                          " bytes (limit " +
                          std::to_string(limits.maxFileSize) + ")";
    return result;
  }

  if (signature == FileSignature::PDF) {
    result.format = "pdf";
    if (paths.size() != 1) {
      result.errorMessage = "A PDF upload must be a single file";
      return result;
    }
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(paths.front()));
    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + paths.front();
      return result;
    }
    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + paths.front();
      return result;
    }
    result.pageCount = doc->pages();
  } else {
    result.format = "png";
    result.pageCount = static_cast<int>(paths.size());
  }

  if (result.pageCount < 1) {
    result.errorMessage = "Document has no pages";
    return result;
  }
  if (result.pageCount > limits.maxPages) {
    result.errorMessage = "Too many pages: " + std::to_string(result.pageCount) +
                          " (limit " + std::to_string(limits.maxPages) + ")";
    return result;
  }

  result.success = true;
  return result;
}

std::unique_ptr<DocumentSource>
openDocumentSource(const std::vector<std::string> &paths) {
  if (paths.empty()) {
    throw std::runtime_error("No input files");
  }
  switch (readSignature(paths.front())) {
  case FileSignature::PDF:
    return std::make_unique<PDFDocumentSource>(paths.front());
  case FileSignature::PNG:
    return std::make_unique<ImageDocumentSource>(paths);
  case FileSignature::Unknown:
    break;
  }
  throw std::runtime_error("Unsupported file type: " + paths.front());
}

} // namespace exam
