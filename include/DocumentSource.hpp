#ifndef EXAM_DOCUMENT_SOURCE_HPP
#define EXAM_DOCUMENT_SOURCE_HPP

#include <opencv2/core.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace poppler {
class document;
}

namespace exam {

/**
 * @brief Result of rasterizing one page
 */
struct PageRenderResult {
  bool success = false;
  std::string errorMessage;
  cv::Mat image;           ///< BGR or grayscale raster
  int pageNumber = 1;      ///< 1-indexed page
  double dpi = 0.0;        ///< Resolution of the raster
  double processingTimeMs = 0.0;
};

/**
 * @brief Upload limits checked before a document is processed
 */
struct ValidationLimits {
  std::uintmax_t maxFileSize = 50ull * 1024 * 1024; ///< 50 MiB
  int maxPages = 500;
  int minTextLayerChars = 50; ///< Non-space characters for a text layer
  int textSamplePages = 3;    ///< Pages sampled for the text layer check
};

struct ValidationResult {
  bool success = false;
  std::string errorMessage;
  std::string format;        ///< "pdf" or "png"
  int pageCount = 0;
  std::uintmax_t fileSize = 0; ///< Sum over all files
};

/**
 * @brief Read access to the pages of an uploaded document
 *
 * Page numbers are 1-indexed. Implementations are safe to call from
 * several threads.
 */
class DocumentSource {
public:
  virtual ~DocumentSource() = default;

  virtual std::string format() const = 0;
  virtual int pageCount() const = 0;
  virtual bool isLocked() const = 0;

  /**
   * @brief True when the sampled pages carry an embedded text layer
   */
  virtual bool hasTextLayer(int minChars, int samplePages) const = 0;

  /**
   * @brief Embedded text of a page, empty when there is none
   */
  virtual std::string pageText(int pageNumber) const = 0;

  /**
   * @brief Embedded text inside a box given in pixels of a @p dpi raster
   */
  virtual std::string regionText(int pageNumber, const cv::Rect &box,
                                 double dpi) const = 0;

  virtual PageRenderResult renderPage(int pageNumber, double dpi) const = 0;
};

/**
 * @brief PDF document read through Poppler
 */
class PDFDocumentSource : public DocumentSource {
public:
  /**
   * @throws std::runtime_error if the file cannot be loaded
   */
  explicit PDFDocumentSource(const std::string &pdfPath);
  ~PDFDocumentSource() override;

  std::string format() const override { return "pdf"; }
  int pageCount() const override;
  bool isLocked() const override;
  bool hasTextLayer(int minChars, int samplePages) const override;
  std::string pageText(int pageNumber) const override;
  std::string regionText(int pageNumber, const cv::Rect &box,
                         double dpi) const override;
  PageRenderResult renderPage(int pageNumber, double dpi) const override;

private:
  std::string m_path;
  std::unique_ptr<poppler::document> m_document;
  mutable std::mutex m_mutex; // poppler objects are not thread safe
};

/**
 * @brief Scanned pages supplied as PNG rasters, one file per page
 */
class ImageDocumentSource : public DocumentSource {
public:
  /**
   * @param imagePaths One image per page, in page order
   * @param nativeDpi Resolution the images were scanned at
   * @throws std::runtime_error if an image cannot be read
   */
  explicit ImageDocumentSource(const std::vector<std::string> &imagePaths,
                               double nativeDpi = 300.0);

  std::string format() const override { return "png"; }
  int pageCount() const override { return static_cast<int>(m_pages.size()); }
  bool isLocked() const override { return false; }
  bool hasTextLayer(int, int) const override { return false; }
  std::string pageText(int) const override { return std::string(); }
  std::string regionText(int, const cv::Rect &, double) const override {
    return std::string();
  }
  PageRenderResult renderPage(int pageNumber, double dpi) const override;

private:
  std::vector<cv::Mat> m_pages;
  double m_nativeDpi;
};

/**
 * @brief Check existence, size, signature, lock state and page count
 *
 * A PDF upload is exactly one file; a PNG upload is one file per page.
 */
ValidationResult validateDocumentFiles(const std::vector<std::string> &paths,
                                       const ValidationLimits &limits = ValidationLimits());

/**
 * @brief Open the files as a document, choosing the reader by signature
 * @throws std::runtime_error if the files cannot be opened
 */
std::unique_ptr<DocumentSource>
openDocumentSource(const std::vector<std::string> &paths);

} // namespace exam

#endif // EXAM_DOCUMENT_SOURCE_HPP
