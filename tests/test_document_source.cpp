#include "DocumentSource.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace exam;
namespace fs = std::filesystem;

class DocumentSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    m_dir = fs::temp_directory_path() /
            ("examextract_source_" +
             std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::create_directories(m_dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(m_dir, ec);
  }

  std::string writePng(const std::string &name, int rows = 200, int cols = 100) {
    std::string path = (m_dir / name).string();
    cv::Mat page(rows, cols, CV_8UC3, cv::Scalar(255, 255, 255));
    EXPECT_TRUE(cv::imwrite(path, page));
    return path;
  }

  std::string writeText(const std::string &name, const std::string &content) {
    std::string path = (m_dir / name).string();
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
  }

  fs::path m_dir;
};

TEST_F(DocumentSourceTest, EmptyInputIsRejected) {
  ValidationResult result = validateDocumentFiles({});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorMessage, "No input files");
}

TEST_F(DocumentSourceTest, MissingFileIsRejected) {
  std::string missing = (m_dir / "missing.png").string();
  ValidationResult result = validateDocumentFiles({missing});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorMessage, "File not found: " + missing);
}

TEST_F(DocumentSourceTest, UnknownSignatureIsRejected) {
  std::string notes = writeText("notes.png", "just some plain text");
  ValidationResult result = validateDocumentFiles({notes});
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.errorMessage.find("Unsupported file type"), std::string::npos);
}

TEST_F(DocumentSourceTest, PngPagesAreAccepted) {
  std::vector<std::string> pages = {writePng("p1.png"), writePng("p2.png")};
  ValidationResult result = validateDocumentFiles(pages);
  EXPECT_TRUE(result.success) << result.errorMessage;
  EXPECT_EQ(result.format, "png");
  EXPECT_EQ(result.pageCount, 2);
  EXPECT_GT(result.fileSize, 0u);
}

TEST_F(DocumentSourceTest, MixedInputIsRejected) {
  std::string pdf = writeText("exam.pdf", "%PDF-1.4\n% not really a pdf\n");
  std::string png = writePng("p1.png");
  ValidationResult result = validateDocumentFiles({png, pdf});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorMessage, "Mixed PDF and PNG input");
}

TEST_F(DocumentSourceTest, SizeAndPageLimits) {
  std::vector<std::string> pages = {writePng("p1.png"), writePng("p2.png"),
                                    writePng("p3.png")};

  ValidationLimits tiny;
  tiny.maxFileSize = 10;
  ValidationResult tooLarge = validateDocumentFiles(pages, tiny);
  EXPECT_FALSE(tooLarge.success);
  EXPECT_EQ(tooLarge.errorMessage.rfind("File too large", 0), 0u);

  ValidationLimits fewPages;
  fewPages.maxPages = 2;
  ValidationResult tooMany = validateDocumentFiles(pages, fewPages);
  EXPECT_FALSE(tooMany.success);
  EXPECT_EQ(tooMany.errorMessage, "Too many pages: 3 (limit 2)");
}

TEST_F(DocumentSourceTest, ImagePagesRenderAtRequestedDpi) {
  std::unique_ptr<DocumentSource> source =
      openDocumentSource({writePng("p1.png", 200, 100)});
  ASSERT_TRUE(source);
  EXPECT_EQ(source->format(), "png");
  EXPECT_EQ(source->pageCount(), 1);
  EXPECT_FALSE(source->isLocked());
  EXPECT_FALSE(source->hasTextLayer(50, 3));
  EXPECT_TRUE(source->pageText(1).empty());

  PageRenderResult native = source->renderPage(1, 300.0);
  ASSERT_TRUE(native.success);
  EXPECT_EQ(native.image.rows, 200);
  EXPECT_EQ(native.image.cols, 100);
  EXPECT_DOUBLE_EQ(native.dpi, 300.0);

  PageRenderResult half = source->renderPage(1, 150.0);
  ASSERT_TRUE(half.success);
  EXPECT_EQ(half.image.rows, 100);
  EXPECT_EQ(half.image.cols, 50);
  EXPECT_DOUBLE_EQ(half.dpi, 150.0);

  PageRenderResult outOfRange = source->renderPage(2, 300.0);
  EXPECT_FALSE(outOfRange.success);
  EXPECT_EQ(outOfRange.errorMessage, "Page 2 out of range");
}

TEST_F(DocumentSourceTest, OpenRejectsUnknownFiles) {
  EXPECT_THROW(openDocumentSource({}), std::runtime_error);
  EXPECT_THROW(openDocumentSource({writeText("a.txt", "hello world, not a scan")}),
               std::runtime_error);
}

} // anonymous namespace
