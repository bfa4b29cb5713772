#include "ExtractionPipeline.hpp"
#include "ConfidenceAggregator.hpp"
#include "JsonExport.hpp"
#include "RegionVisualizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>

namespace exam {

struct ExtractionPipeline::Components {
  Components(const PipelineConfig &config,
             std::shared_ptr<OCREnsemble> ensemble,
             std::shared_ptr<RegionStore> regionStore,
             std::shared_ptr<DocumentStore> documentStore)
      : config(config), ensemble(std::move(ensemble)),
        detector(config.detector, this->ensemble),
        regionStore(std::move(regionStore)),
        documentStore(std::move(documentStore)) {}

  PipelineConfig config;
  std::shared_ptr<OCREnsemble> ensemble;
  RegionDetector detector;
  QuestionParser parser;
  QuestionTypeClassifier classifier;
  std::shared_ptr<RegionStore> regionStore;
  std::shared_ptr<DocumentStore> documentStore;
};

namespace {

using Components = ExtractionPipeline::Components;

std::string formatDouble(double value, int precision = 2) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(precision);
  out << value;
  return out.str();
}

bool isQuestionRegion(const Region &region) {
  return region.type == RegionType::QuestionGroup ||
         region.type == RegionType::Question;
}

std::string extractionMethodOf(const Region &region) {
  auto it = region.metadata.find("detection_method");
  return it != region.metadata.end() ? it->second : std::string("geometric");
}

std::optional<QuestionGroup> groupOf(const PageData &page, const Region &region) {
  if (region.type != RegionType::QuestionGroup) {
    return std::nullopt;
  }
  auto it = std::find_if(page.groups.begin(), page.groups.end(),
                         [&region](const QuestionGroup &group) {
                           return group.region.rect() == region.rect();
                         });
  if (it == page.groups.end()) {
    return std::nullopt;
  }
  return *it;
}

cv::Rect scaleRect(const cv::Rect &box, double scale, const cv::Size &bounds) {
  cv::Rect scaled(static_cast<int>(box.x * scale), static_cast<int>(box.y * scale),
                  static_cast<int>(box.width * scale + 0.5),
                  static_cast<int>(box.height * scale + 0.5));
  return scaled & cv::Rect(0, 0, bounds.width, bounds.height);
}

// 1. File existence, size, type, lock state and page count
StepOutcome validateUpload(Components &c, ProcessingContext &ctx) {
  ctx.validation = validateDocumentFiles(ctx.inputPaths, c.config.limits);
  if (!ctx.validation.success) {
    ErrorDetails details;
    if (!ctx.inputPaths.empty()) {
      details["file"] = ctx.inputPaths.front();
    }
    details["file_size"] = std::to_string(ctx.validation.fileSize);
    throw FileSecurityError(ctx.validation.errorMessage, details);
  }

  try {
    ctx.source = openDocumentSource(ctx.inputPaths);
  } catch (const std::runtime_error &e) {
    throw FileSecurityError(e.what(), {{"file", ctx.inputPaths.front()}});
  }

  ctx.pages.clear();
  for (int pageNumber = 1; pageNumber <= ctx.source->pageCount(); ++pageNumber) {
    PageData page;
    page.pageNumber = pageNumber;
    ctx.pages.push_back(page);
  }

  return StepOutcome::ok({{"format", ctx.validation.format},
                          {"page_count", std::to_string(ctx.validation.pageCount)},
                          {"file_size", std::to_string(ctx.validation.fileSize)}});
}

// 2. Searchable PDFs skip OCR
StepOutcome detectTextLayer(Components &c, ProcessingContext &ctx) {
  ctx.searchable = ctx.source->hasTextLayer(c.config.limits.minTextLayerChars,
                                            c.config.limits.textSamplePages);
  return StepOutcome::ok({{"searchable", ctx.searchable ? "true" : "false"}});
}

// 3. Page text, from the text layer or the OCR ensemble
StepOutcome runOcr(Components &c, ProcessingContext &ctx) {
  if (ctx.searchable) {
    for (auto &page : ctx.pages) {
      page.text = ctx.source->pageText(page.pageNumber);
    }
    return StepOutcome::ok({{"skipped", "true"}, {"reason", "text_layer"}});
  }

  if (!c.ensemble || !c.ensemble->hasEngines()) {
    throw OCRProcessingError("No OCR engines available",
                             {{"document_id", ctx.documentId}});
  }

  double confidenceSum = 0.0;
  for (auto &page : ctx.pages) {
    PageRenderResult render = ctx.source->renderPage(page.pageNumber, c.config.ocrDpi);
    if (!render.success) {
      throw OCRProcessingError(render.errorMessage,
                               {{"page", std::to_string(page.pageNumber)}});
    }

    OCRResult ocr = c.ensemble->extractBest(render.image);
    page.text = ocr.text;
    page.ocrConfidence = ocr.confidence;
    confidenceSum += ocr.confidence;
  }

  double average = ctx.pages.empty() ? 0.0 : confidenceSum / ctx.pages.size();
  return StepOutcome::ok({{"skipped", "false"},
                          {"pages_processed", std::to_string(ctx.pages.size())},
                          {"average_confidence", formatDouble(average)}});
}

// 4. Region detection on the detection raster
StepOutcome analyzeLayout(Components &c, ProcessingContext &ctx) {
  namespace fs = std::filesystem;
  std::size_t regionCount = 0;
  std::size_t groupCount = 0;
  std::map<std::string, int> methods;

  bool overlays = c.config.writeOverlays && !c.config.outputDirectory.empty();
  if (overlays) {
    fs::create_directories(c.config.outputDirectory);
  }

  for (auto &page : ctx.pages) {
    PageRenderResult render =
        ctx.source->renderPage(page.pageNumber, c.config.detectionDpi);
    if (!render.success) {
      throw LayoutAnalysisError(render.errorMessage,
                                {{"page", std::to_string(page.pageNumber)}});
    }

    DetectionResult detection = c.detector.detect(render.image, page.pageNumber);
    page.detectionSize = render.image.size();
    page.detectionMethod = detection.method;
    page.columnCount = detection.columnCount;
    page.regions = c.regionStore->replaceDetected(ctx.documentId, page.pageNumber,
                                                  detection.regions);
    page.groups = detection.groups;
    if (page.text.empty() && !detection.pageText.empty()) {
      page.text = detection.pageText;
      page.ocrConfidence = detection.ocrConfidence;
    }

    regionCount += page.regions.size();
    groupCount += detection.groups.size();
    ++methods[detection.method];

    if (overlays) {
      fs::path path = fs::path(c.config.outputDirectory) /
                      ("page_" + std::to_string(page.pageNumber) + "_regions.png");
      saveRegionOverlay(path.string(), render.image, page.regions);
    }
  }

  StepDetails details = {{"regions_found", std::to_string(regionCount)},
                         {"question_groups", std::to_string(groupCount)}};
  for (const auto &entry : methods) {
    details["pages_" + entry.first] = std::to_string(entry.second);
  }
  return StepOutcome::ok(details);
}

// 5. Text of every question region
StepOutcome extractText(Components &c, ProcessingContext &ctx) {
  ctx.drafts.clear();
  std::size_t ocrFailures = 0;

  for (const auto &page : ctx.pages) {
    std::vector<Region> questionRegions;
    std::copy_if(page.regions.begin(), page.regions.end(),
                 std::back_inserter(questionRegions), isQuestionRegion);
    if (questionRegions.empty()) {
      continue;
    }

    cv::Mat ocrPage;
    if (!ctx.searchable && c.ensemble && c.ensemble->hasEngines()) {
      PageRenderResult render =
          ctx.source->renderPage(page.pageNumber, c.config.ocrDpi);
      if (!render.success) {
        throw TextExtractionError(render.errorMessage,
                                  {{"page", std::to_string(page.pageNumber)}});
      }
      ocrPage = render.image;
    }
    double scale = c.config.ocrDpi / c.config.detectionDpi;

    for (const auto &region : questionRegions) {
      QuestionDraft draft;
      draft.pageNumber = page.pageNumber;
      draft.region = region;
      draft.extractionMethod = extractionMethodOf(region);
      draft.group = groupOf(page, region);

      if (ctx.searchable) {
        draft.text = ctx.source->regionText(page.pageNumber, region.rect(),
                                            c.config.detectionDpi);
      } else if (!ocrPage.empty()) {
        cv::Rect crop = scaleRect(region.rect(), scale, ocrPage.size());
        if (crop.area() > 0) {
          try {
            OCRResult ocr = c.ensemble->extractBest(ocrPage(crop));
            draft.text = ocr.text;
            draft.ocrConfidence = ocr.confidence;
          } catch (const ProcessingError &e) {
            ++ocrFailures;
            ctx.logger->logWarning("Region OCR failed, using detection text",
                                   {{"region_id", region.id()},
                                    {"page", std::to_string(page.pageNumber)},
                                    {"error", e.what()}});
          }
        }
      }

      if (trim(draft.text).empty()) {
        draft.text = region.text;
      }
      ctx.drafts.push_back(std::move(draft));
    }
  }

  return StepOutcome::ok({{"regions_processed", std::to_string(ctx.drafts.size())},
                          {"ocr_failures", std::to_string(ocrFailures)}});
}

// Structural groups keep their validated number, stem and options; the
// region text contributes the answer key and fills a missing stem
void preferGroup(QuestionDraft &draft) {
  if (!draft.group) {
    return;
  }
  const QuestionGroup &group = *draft.group;
  if (group.questionNumber) {
    draft.parsed.questionNumber = group.questionNumber;
  }
  if (!trim(group.questionText).empty()) {
    draft.parsed.questionText = group.questionText;
  }
  if (!group.options.empty()) {
    draft.parsed.options = group.options;
  }
}

// 6. Question structure from region text, or from page text when a page
// has no question regions
StepOutcome detectQuestions(Components &c, ProcessingContext &ctx) {
  std::vector<QuestionDraft> drafts;
  std::map<int, bool> pagesWithRegions;
  bool anyText = false;
  std::size_t rejected = 0;

  auto accept = [&](QuestionDraft draft) {
    if (draft.parsed.questionText.empty() && draft.parsed.options.empty()) {
      return;
    }
    if (!QuestionDetector::isValidOptionSequence(draft.parsed.options)) {
      ++rejected;
      std::string letters;
      for (const auto &option : draft.parsed.options) {
        letters += option.letter;
      }
      ctx.logger->logWarning("Question dropped, option letters are not a, b, c, d",
                             {{"page", std::to_string(draft.pageNumber)},
                              {"region_id", draft.region.id()},
                              {"letters", letters}});
      return;
    }
    drafts.push_back(std::move(draft));
  };

  try {
    for (auto &draft : ctx.drafts) {
      pagesWithRegions[draft.pageNumber] = true;
      if (trim(draft.text).empty() && !draft.group) {
        continue;
      }
      anyText = true;
      draft.parsed = c.parser.parse(draft.text);
      preferGroup(draft);
      accept(draft);
    }

    for (const auto &page : ctx.pages) {
      if (pagesWithRegions.count(page.pageNumber) || trim(page.text).empty()) {
        continue;
      }
      anyText = true;

      Region pageRegion = Region::fromRect(
          cv::Rect(0, 0, std::max(page.detectionSize.width, 1),
                   std::max(page.detectionSize.height, 1)),
          page.pageNumber, RegionType::Question, c.config.textQuestionConfidence);
      pageRegion.metadata["detection_method"] = "text";

      for (const auto &block : c.parser.splitQuestionBlocks(page.text)) {
        QuestionDraft draft;
        draft.pageNumber = page.pageNumber;
        draft.region = pageRegion;
        draft.text = block;
        draft.ocrConfidence = page.ocrConfidence;
        draft.extractionMethod = "text";
        draft.parsed = c.parser.parse(block);
        accept(std::move(draft));
      }
    }
  } catch (const ProcessingError &) {
    throw;
  } catch (const std::exception &e) {
    throw QuestionDetectionError(std::string("Question parsing failed: ") + e.what(),
                                 {{"document_id", ctx.documentId}});
  }

  if (drafts.empty()) {
    ctx.logger->logWarning(anyText ? "No questions found in document text"
                                   : "Document yielded no text");
  }
  ctx.drafts = std::move(drafts);
  return StepOutcome::ok({{"questions_found", std::to_string(ctx.drafts.size())},
                          {"rejected_option_sequence", std::to_string(rejected)}});
}

// 7. Options, answer key and question type
StepOutcome extractAnswers(Components &c, ProcessingContext &ctx) {
  ctx.questions.clear();
  std::size_t withAnswers = 0;

  for (const auto &draft : ctx.drafts) {
    ExtractedQuestion question;
    question.questionText = draft.parsed.questionText;
    question.questionNumber = draft.parsed.questionNumber;
    question.options = draft.parsed.options;
    question.pageNumber = draft.pageNumber;
    question.position = draft.region;
    question.extractionMethod = draft.extractionMethod;

    for (const auto &answer : draft.parsed.correctAnswers) {
      bool known = question.options.empty() ||
                   std::any_of(question.options.begin(), question.options.end(),
                               [&answer](const QuestionOption &option) {
                                 return std::string(1, option.letter) == answer;
                               });
      if (known) {
        question.correctAnswers.push_back(answer);
      }
    }
    if (!question.correctAnswers.empty()) {
      ++withAnswers;
    }

    question.questionType =
        c.classifier.classify(question.questionText, question.options).first;
    if (question.questionType == QuestionType::MCQ &&
        question.correctAnswers.size() > 1) {
      question.questionType = QuestionType::MultiSelect;
    }
    ctx.questions.push_back(std::move(question));
  }

  return StepOutcome::ok({{"questions", std::to_string(ctx.questions.size())},
                          {"with_answer_key", std::to_string(withAnswers)}});
}

// 8. Question confidence and document statistics
StepOutcome scoreConfidence(Components &, ProcessingContext &ctx) {
  std::map<int, std::pair<int, double>> perPage;

  for (std::size_t i = 0; i < ctx.questions.size(); ++i) {
    ExtractedQuestion &question = ctx.questions[i];
    const QuestionDraft &draft = ctx.drafts[i];
    applyConfidence(question, ConfidenceAggregator::scoreQuestion(
                                  draft.region.confidence, draft.ocrConfidence));

    auto &page = perPage[question.pageNumber];
    ++page.first;
    page.second += question.confidenceScore;
  }

  for (const auto &entry : perPage) {
    ctx.logger->logExtractionResult(entry.first, entry.second.first,
                                    entry.second.second / entry.second.first);
  }

  ctx.statistics = ConfidenceAggregator::compute(ctx.questions);
  return StepOutcome::ok(
      {{"average_confidence", formatDouble(ctx.statistics.averageConfidence)},
       {"needs_review", std::to_string(ctx.statistics.needsReviewCount)}});
}

// 9. Persist results and write exports
StepOutcome finalize(Components &c, ProcessingContext &ctx) {
  std::vector<Region> regions = c.regionStore->regions(ctx.documentId);

  c.documentStore->saveQuestions(ctx.documentId, ctx.questions);
  c.documentStore->saveRegions(ctx.documentId, regions);
  c.documentStore->saveStatistics(ctx.documentId, ctx.statistics);

  StepDetails details = {{"questions_saved", std::to_string(ctx.questions.size())},
                         {"regions_saved", std::to_string(regions.size())}};

  if (!c.config.outputDirectory.empty()) {
    namespace fs = std::filesystem;
    fs::path dir(c.config.outputDirectory);
    fs::create_directories(dir);
    writeTextFile((dir / "questions.json").string(), questionsToJson(ctx.questions));
    writeTextFile((dir / "regions.json").string(), regionsToJson(regions));
    writeTextFile((dir / "statistics.json").string(),
                  statisticsToJson(ctx.statistics));
    details["output_directory"] = dir.string();
  }

  return StepOutcome::ok(details);
}

using StepBody = StepOutcome (*)(Components &, ProcessingContext &);

} // anonymous namespace

ExtractionPipeline::ExtractionPipeline(
    const PipelineConfig &config, std::shared_ptr<OCREnsemble> ensemble,
    std::shared_ptr<RegionStore> regionStore,
    std::shared_ptr<DocumentStore> documentStore,
    std::shared_ptr<ProgressChannel> channel,
    std::shared_ptr<ErrorHandler> errorHandler, std::ostream *logStream)
    : m_config(config),
      m_regionStore(regionStore ? std::move(regionStore)
                                : std::make_shared<RegionStore>()),
      m_documentStore(documentStore ? std::move(documentStore)
                                    : std::make_shared<InMemoryDocumentStore>()),
      m_channel(std::move(channel)), m_errorHandler(std::move(errorHandler)),
      m_logStream(logStream) {
  m_components = std::make_shared<Components>(m_config, std::move(ensemble),
                                              m_regionStore, m_documentStore);
}

std::vector<ProcessingStep> ExtractionPipeline::buildSteps(
    const std::shared_ptr<ProcessingContext> &context) const {
  static const std::map<std::string, StepBody> bodies = {
      {"upload_validation", validateUpload},
      {"text_detection", detectTextLayer},
      {"ocr_processing", runOcr},
      {"layout_analysis", analyzeLayout},
      {"text_extraction", extractText},
      {"qa_detection", detectQuestions},
      {"answer_extraction", extractAnswers},
      {"confidence_scoring", scoreConfidence},
      {"finalization", finalize},
  };

  std::vector<ProcessingStep> steps = standardStepPlan();
  for (auto &step : steps) {
    StepBody body = bodies.at(step.name);
    std::shared_ptr<Components> components = m_components;
    auto working = std::make_shared<std::shared_ptr<ProcessingContext>>();

    step.stage = [context, working]() {
      *working = std::make_shared<ProcessingContext>(*context);
    };
    step.run = [body, components, working]() {
      std::shared_ptr<ProcessingContext> ctx = *working;
      return body(*components, *ctx);
    };
    step.commit = [context, working]() {
      *context = std::move(**working);
      working->reset();
    };
  }
  return steps;
}

std::shared_ptr<ProcessingContext>
ExtractionPipeline::process(ProcessingJob &job,
                            const std::vector<std::string> &paths) const {
  auto context = std::make_shared<ProcessingContext>();
  context->documentId = job.documentId();
  context->inputPaths = paths;
  context->logger = std::make_shared<ProcessingLogger>(job.id(), job.documentId(),
                                                       m_logStream);

  m_documentStore->markDocumentStatus(job.documentId(), "processing");

  ProcessingOrchestrator orchestrator(buildSteps(context), m_config.orchestrator,
                                      m_channel, m_errorHandler);
  bool completed = orchestrator.run(job, *context->logger);
  context->logger->detachStream();

  m_documentStore->markDocumentStatus(job.documentId(),
                                      completed ? "completed" : "failed");
  if (!completed) {
    std::cerr << "ExtractionPipeline: document " << job.documentId()
              << " failed at step " << job.currentStep() << std::endl;
  }
  return context;
}

} // namespace exam
