#include "ProcessingOrchestrator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace exam;

class RecordingNotifier : public Notifier {
public:
  void notifyCritical(const ErrorRecord &error, const JobSnapshot &) override {
    errors.push_back(error);
  }

  std::vector<ErrorRecord> errors;
};

/// The standard plan with every body succeeding and reporting its name
std::vector<ProcessingStep> passingPlan() {
  std::vector<ProcessingStep> steps = standardStepPlan();
  for (auto &step : steps) {
    std::string name = step.name;
    step.run = [name]() { return StepOutcome::ok({{"step", name}}); };
  }
  return steps;
}

ProcessingStep *findStep(std::vector<ProcessingStep> &steps,
                         const std::string &name) {
  auto it = std::find_if(steps.begin(), steps.end(),
                         [&name](const ProcessingStep &s) { return s.name == name; });
  return it == steps.end() ? nullptr : &*it;
}

TEST(ProcessingOrchestratorTest, StandardPlan) {
  std::vector<ProcessingStep> steps = standardStepPlan();
  ASSERT_EQ(steps.size(), 9u);
  EXPECT_EQ(steps.front().name, "upload_validation");
  EXPECT_EQ(steps.back().name, "finalization");
  int total = std::accumulate(
      steps.begin(), steps.end(), 0,
      [](int sum, const ProcessingStep &step) { return sum + step.weight; });
  EXPECT_EQ(total, 100);
}

TEST(ProcessingOrchestratorTest, InvalidPlansAreRejected) {
  std::vector<ProcessingStep> missingBody = standardStepPlan();
  EXPECT_THROW(ProcessingOrchestrator{missingBody}, std::invalid_argument);

  std::vector<ProcessingStep> badSum = passingPlan();
  badSum.front().weight += 1;
  EXPECT_THROW(ProcessingOrchestrator{badSum}, std::invalid_argument);

  std::vector<ProcessingStep> negative = passingPlan();
  negative[0].weight = -5;
  negative[1].weight += 10;
  EXPECT_THROW(ProcessingOrchestrator{negative}, std::invalid_argument);
}

TEST(ProcessingOrchestratorTest, ProgressIsMonotonicAndEndsComplete) {
  auto channel = std::make_shared<ProgressChannel>();
  ProcessingOrchestrator orchestrator(passingPlan(), OrchestratorConfig(), channel);

  ProcessingJob job("doc-1");
  std::vector<JobSnapshot> seen;
  channel->subscribe([&seen](const JobSnapshot &s) { seen.push_back(s); }, job.id());

  ProcessingLogger logger(job.id(), job.documentId());
  EXPECT_TRUE(orchestrator.run(job, logger));

  EXPECT_EQ(job.status(), JobStatus::Completed);
  EXPECT_EQ(job.progressPercentage(), 100);
  ASSERT_FALSE(seen.empty());
  for (std::size_t i = 1; i < seen.size(); ++i) {
    EXPECT_GE(seen[i].progressPercentage, seen[i - 1].progressPercentage);
  }
  EXPECT_EQ(seen.back().status, JobStatus::Completed);
  EXPECT_EQ(seen.back().progressPercentage, 100);

  EXPECT_EQ(job.stepDetails().size(), 9u);
  EXPECT_EQ(job.stepDetails().at("ocr_processing").at("step"), "ocr_processing");

  std::vector<LogEvent> events = logger.events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().event, "performance_metrics");
  EXPECT_EQ(events.back().details.at("steps"), "9");
  EXPECT_EQ(std::count_if(events.begin(), events.end(),
                          [](const LogEvent &e) { return e.event == "step_complete"; }),
            9);
}

TEST(ProcessingOrchestratorTest, CumulativeWeightsAfterEachStep) {
  auto channel = std::make_shared<ProgressChannel>();
  ProcessingOrchestrator orchestrator(passingPlan(), OrchestratorConfig(), channel);

  ProcessingJob job("doc-1");
  std::vector<int> afterSteps;
  channel->subscribe(
      [&afterSteps](const JobSnapshot &s) {
        if (afterSteps.empty() || afterSteps.back() != s.progressPercentage) {
          afterSteps.push_back(s.progressPercentage);
        }
      },
      job.id());
  orchestrator.run(job);

  EXPECT_EQ(afterSteps,
            (std::vector<int>{0, 5, 15, 45, 60, 80, 95, 98, 100}));
}

TEST(ProcessingOrchestratorTest, FailingStepStopsTheRun) {
  std::vector<ProcessingStep> steps = passingPlan();
  bool laterStepRan = false;
  findStep(steps, "layout_analysis")->run = []() -> StepOutcome {
    throw std::runtime_error("layout exploded");
  };
  findStep(steps, "finalization")->run = [&laterStepRan]() {
    laterStepRan = true;
    return StepOutcome::ok();
  };

  auto handler = std::make_shared<ErrorHandler>();
  ProcessingOrchestrator orchestrator(steps, OrchestratorConfig(), nullptr, handler);
  ProcessingJob job("doc-1");
  EXPECT_FALSE(orchestrator.run(job));

  EXPECT_FALSE(laterStepRan);
  EXPECT_EQ(job.status(), JobStatus::Failed);
  EXPECT_EQ(job.progressPercentage(), 45);
  ASSERT_TRUE(job.error().has_value());
  EXPECT_EQ(job.error()->code, "LAYOUT_ANALYSIS_ERROR");
  EXPECT_EQ(job.error()->step, "layout_analysis");
  EXPECT_EQ(job.error()->message, "layout exploded");
  EXPECT_EQ(handler->errorCount(), 1u);
}

TEST(ProcessingOrchestratorTest, ErrorOutcomeKeepsItsOwnKind) {
  std::vector<ProcessingStep> steps = passingPlan();
  findStep(steps, "ocr_processing")->run = []() {
    return StepOutcome::err(makeErrorRecord(FileSecurityError("bad file")));
  };

  ProcessingOrchestrator orchestrator(steps);
  ProcessingJob job("doc-1");
  EXPECT_FALSE(orchestrator.run(job));
  ASSERT_TRUE(job.error().has_value());
  EXPECT_EQ(job.error()->code, "FILE_SECURITY_ERROR");
  EXPECT_EQ(job.error()->step, "ocr_processing");
}

TEST(ProcessingOrchestratorTest, SlowStepTimesOut) {
  std::vector<ProcessingStep> steps = passingPlan();
  findStep(steps, "text_detection")->run = []() {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    return StepOutcome::ok();
  };

  auto notifier = std::make_shared<RecordingNotifier>();
  auto handler = std::make_shared<ErrorHandler>(notifier);
  OrchestratorConfig config;
  config.stepTimeout = std::chrono::milliseconds(50);
  ProcessingOrchestrator orchestrator(steps, config, nullptr, handler);

  ProcessingJob job("doc-1");
  EXPECT_FALSE(orchestrator.run(job));
  EXPECT_EQ(job.status(), JobStatus::Failed);
  ASSERT_TRUE(job.error().has_value());
  EXPECT_EQ(job.error()->code, "PROCESSING_TIMEOUT");
  EXPECT_EQ(job.error()->step, "text_detection");
  ASSERT_EQ(notifier->errors.size(), 1u);
  EXPECT_EQ(notifier->errors.front().code, "PROCESSING_TIMEOUT");
}

TEST(ProcessingOrchestratorTest, TimedOutStepIsNeverCommitted) {
  std::vector<ProcessingStep> steps = passingPlan();
  std::vector<std::string> hooks;
  for (const char *name : {"upload_validation", "text_detection"}) {
    ProcessingStep *step = findStep(steps, name);
    std::string label = name;
    step->stage = [&hooks, label]() { hooks.push_back("stage " + label); };
    step->commit = [&hooks, label]() { hooks.push_back("commit " + label); };
  }
  findStep(steps, "text_detection")->run = []() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return StepOutcome::ok();
  };

  OrchestratorConfig config;
  config.stepTimeout = std::chrono::milliseconds(50);
  ProcessingOrchestrator orchestrator(steps, config);
  ProcessingJob job("doc-1");
  EXPECT_FALSE(orchestrator.run(job));

  EXPECT_EQ(hooks, (std::vector<std::string>{"stage upload_validation",
                                             "commit upload_validation",
                                             "stage text_detection"}));
  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  EXPECT_EQ(hooks.size(), 3u);
}

TEST(ProcessingOrchestratorTest, FailedStageFailsTheStep) {
  std::vector<ProcessingStep> steps = passingPlan();
  bool ran = false;
  ProcessingStep *ocr = findStep(steps, "ocr_processing");
  ocr->stage = []() { throw std::runtime_error("no memory for a copy"); };
  ocr->run = [&ran]() {
    ran = true;
    return StepOutcome::ok();
  };

  ProcessingOrchestrator orchestrator(steps);
  ProcessingJob job("doc-1");
  EXPECT_FALSE(orchestrator.run(job));
  EXPECT_FALSE(ran);
  ASSERT_TRUE(job.error().has_value());
  EXPECT_EQ(job.error()->code, "OCR_PROCESSING_ERROR");
  EXPECT_EQ(job.error()->step, "ocr_processing");
}

} // anonymous namespace
