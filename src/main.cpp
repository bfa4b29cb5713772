#include "ErrorHandler.hpp"
#include "ExtractionPipeline.hpp"
#include "JsonExport.hpp"
#include "OCREnsemble.hpp"
#include "ProcessingScheduler.hpp"
#include "ProgressChannel.hpp"
#include "TesseractEngine.hpp"

#include <opencv2/core.hpp>

#include <chrono>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <file> [file...] [options]\n"
      << "\nInput is one PDF, or one PNG per page of the same document.\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>     OCR language (default: eng)\n"
      << "  -t, --tessdata <path>     tessdata directory (default: TESSDATA_PREFIX)\n"
      << "  -o, --output <dir>        Write questions/regions/statistics JSON\n"
      << "  -m, --manual <json>       Add user-drawn regions from a JSON file\n"
      << "  -d, --document-id <id>    Document id (default: first file name)\n"
      << "  -b, --batch               Treat every file as its own document\n"
      << "  -j, --jobs <n>            Concurrent documents in batch mode (default: 5)\n"
      << "      --timeout <seconds>   Time limit per processing step (default: 300)\n"
      << "      --overlays            Save region overlay PNGs to the output dir\n"
      << "  -p, --progress            Print progress snapshots as JSON lines\n"
      << "  -r, --regions             Print detected regions\n"
      << "  -h, --help                Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " exam.pdf -o out\n"
      << "  " << programName << " page1.png page2.png -r\n"
      << "  " << programName << " a.pdf b.pdf --batch -j 2 -o out\n";
}

void printQuestions(const exam::ScheduledRun &run) {
  const auto &questions = run.context->questions;
  std::cout << "\n[" << run.job.documentId() << "] "
            << exam::jobStatusToString(run.job.status()) << ", "
            << questions.size() << " questions\n";
  std::cout << std::string(80, '-') << "\n";

  for (const auto &question : questions) {
    std::cout << "Page " << question.pageNumber << "  ";
    if (question.questionNumber) {
      std::cout << "Q" << *question.questionNumber << "  ";
    }
    std::cout << "[" << exam::questionTypeToString(question.questionType)
              << ", " << std::fixed << std::setprecision(1)
              << question.confidenceScore << "% "
              << exam::confidenceLevelToString(question.confidenceLevel)
              << (question.requiresReview ? ", review" : "") << "]\n";
    std::cout << "  " << question.questionText << "\n";
    for (const auto &option : question.options) {
      std::cout << "    (" << option.letter << ") " << option.text << "\n";
    }
    if (!question.correctAnswers.empty()) {
      std::cout << "  Answer:";
      for (const auto &answer : question.correctAnswers) {
        std::cout << " " << answer;
      }
      std::cout << "\n";
    }
  }

  const auto &stats = run.context->statistics;
  std::cout << std::string(80, '-') << "\n"
            << "High: " << stats.high << "  Medium: " << stats.medium
            << "  Low: " << stats.low << "  Average: " << std::fixed
            << std::setprecision(2) << stats.averageConfidence << "\n";
}

void printRegions(const std::vector<exam::Region> &regions) {
  std::cout << "\n[Detected Regions]\n";
  std::cout << std::setw(6) << "Id" << std::setw(6) << "Page" << std::setw(16)
            << "Type" << std::setw(8) << "Conf" << std::setw(26)
            << "Bounding Box" << "\n";
  std::cout << std::string(80, '-') << "\n";

  for (const auto &region : regions) {
    std::ostringstream bbox;
    bbox << "(" << region.x << "," << region.y << "," << region.width << ","
         << region.height << ")";
    std::cout << std::setw(6) << region.id() << std::setw(6) << region.pageNumber
              << std::setw(16) << exam::regionTypeToString(region.type)
              << std::setw(8) << std::fixed << std::setprecision(2)
              << region.confidence << std::setw(26) << bbox.str() << "\n";
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::string> inputs;
  std::string language = "eng";
  std::string tessDataPath;
  std::string manualPath;
  std::string documentId;
  exam::PipelineConfig config;
  bool batch = false;
  std::size_t jobs = 5;
  bool showProgress = false;
  bool showRegions = false;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      auto value = [&](const char *name) -> std::string {
        if (i + 1 >= argc) {
          throw std::invalid_argument(std::string(name) + " requires an argument");
        }
        return argv[++i];
      };

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-l" || arg == "--language") {
        language = value("--language");
      } else if (arg == "-t" || arg == "--tessdata") {
        tessDataPath = value("--tessdata");
      } else if (arg == "-o" || arg == "--output") {
        config.outputDirectory = value("--output");
      } else if (arg == "-m" || arg == "--manual") {
        manualPath = value("--manual");
      } else if (arg == "-d" || arg == "--document-id") {
        documentId = value("--document-id");
      } else if (arg == "-b" || arg == "--batch") {
        batch = true;
      } else if (arg == "-j" || arg == "--jobs") {
        jobs = static_cast<std::size_t>(std::stoul(value("--jobs")));
      } else if (arg == "--timeout") {
        config.orchestrator.stepTimeout = std::chrono::milliseconds(
            static_cast<long long>(std::stod(value("--timeout")) * 1000));
      } else if (arg == "--overlays") {
        config.writeOverlays = true;
      } else if (arg == "-p" || arg == "--progress") {
        showProgress = true;
      } else if (arg == "-r" || arg == "--regions") {
        showRegions = true;
      } else if (arg[0] != '-') {
        inputs.push_back(arg);
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (inputs.empty()) {
    std::cerr << "Error: No input file provided\n";
    printUsage(argv[0]);
    return 1;
  }
  if (batch && !manualPath.empty()) {
    std::cerr << "Error: --manual applies to a single document, not --batch\n";
    return 1;
  }

  std::cout << "=== Exam Extraction ===\n"
            << "Tesseract version: " << exam::TesseractEngine::version() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << language << "\n"
            << "=======================\n\n";

  auto stats = std::make_shared<exam::OCRPerformanceStats>();
  auto ensemble = std::make_shared<exam::OCREnsemble>(
      exam::OCREnsemble::createTesseractEngines(language, tessDataPath), stats);
  if (!ensemble->hasEngines()) {
    std::cerr << "Warning: no OCR engine could be initialized; only searchable "
                 "PDFs can be processed.\n"
              << "Make sure Tesseract is installed and tessdata is available.\n";
  }

  auto regionStore = std::make_shared<exam::RegionStore>();
  auto documentStore = std::make_shared<exam::InMemoryDocumentStore>();
  auto channel = std::make_shared<exam::ProgressChannel>();
  auto errorHandler = std::make_shared<exam::ErrorHandler>(
      std::make_shared<exam::StderrNotifier>());

  if (showProgress) {
    channel->subscribe([](const exam::JobSnapshot &snapshot) {
      std::cout << exam::snapshotToJson(snapshot) << std::endl;
    });
  }

  // One document per file in batch mode, otherwise one document in total
  std::vector<std::pair<std::string, std::vector<std::string>>> documents;
  if (batch) {
    for (const auto &input : inputs) {
      documents.push_back(
          {std::filesystem::path(input).stem().string(), {input}});
    }
  } else {
    documents.push_back(
        {documentId.empty() ? std::filesystem::path(inputs.front()).stem().string()
                            : documentId,
         inputs});
  }

  if (!manualPath.empty()) {
    try {
      for (const auto &spec :
           exam::parseManualRegions(exam::readTextFile(manualPath))) {
        regionStore->create(documents.front().first, spec.box, spec.pageNumber,
                            spec.type, "cli");
      }
    } catch (const std::exception &e) {
      std::cerr << "Error: " << manualPath << ": " << e.what() << "\n";
      return 1;
    }
  }

  auto pipeline = std::make_shared<exam::ExtractionPipeline>(
      config, ensemble, regionStore, documentStore, channel, errorHandler,
      &std::cerr);

  int exitCode = 0;
  {
    exam::ProcessingScheduler scheduler(pipeline, batch ? jobs : 1);
    std::vector<std::future<exam::ScheduledRun>> runs;
    for (const auto &document : documents) {
      runs.push_back(
          scheduler.submit(exam::ProcessingJob(document.first), document.second));
    }

    for (auto &future : runs) {
      try {
        exam::ScheduledRun run = future.get();
        if (run.job.status() != exam::JobStatus::Completed) {
          const auto &error = run.job.error();
          std::cerr << "Processing failed for " << run.job.documentId();
          if (error) {
            std::cerr << " at " << error->step << ": [" << error->code << "] "
                      << error->message;
          }
          std::cerr << "\n";
          exitCode = 1;
          continue;
        }
        printQuestions(run);
        if (showRegions) {
          printRegions(regionStore->regions(run.job.documentId()));
        }
      } catch (const std::exception &e) {
        std::cerr << "Processing failed: " << e.what() << "\n";
        exitCode = 1;
      }
    }
  }

  auto ocrStats = stats->snapshot();
  std::cout << "\nOCR requests: " << ocrStats.totalRequests
            << "  Average confidence: " << std::fixed << std::setprecision(1)
            << ocrStats.avgConfidence << "\n";

  return exitCode;
}
