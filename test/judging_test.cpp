#include <atomic>
#include <future>
#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <arbiter/paths.h>
#include <arbiter/utils.h>
#include <arbiter/errors.h>
#include <arbiter/judging.h>

#include "utils.h"

namespace {

using nlohmann::json;

const char kImage[] = "node:20-alpine";

json TwoRequirementRubric() {
  return json::parse(R"({
    "installCommand": "npm ci",
    "buildCommand": "npm run build",
    "requirements": [
      {"id": "api", "name": "API", "weight": 60, "checks": [
        {"id": "unit", "command": "npm test", "points": 10},
        {"id": "e2e", "command": "./e2e.sh", "points": 10, "timeout": 5}
      ]},
      {"id": "style", "name": "Style", "weight": 40, "checks": [
        {"id": "lint", "command": "npm run lint", "points": 5}
      ]},
      {"id": "ux", "name": "UX", "weight": 0, "type": "ai_judge"}
    ]
  })");
}

int CountScratchDirs() {
  if (!fs::is_directory(kTempRoot)) return 0;
  int ret = 0;
  for (auto& entry : fs::directory_iterator(kTempRoot)) {
    if (entry.path().filename().string().rfind("judge-artifact-", 0) == 0) ret++;
  }
  return ret;
}

} // namespace

class JudgingTest : public DatabaseTest {
 protected:
  FakeEngine engine_;
  SandboxRuntime sandbox_{engine_};
  MemoryArtifactStore artifacts_;
  FakeRubricSource rubrics_;
  QueueManager queue_;
  std::optional<Judge> judge_;

  void SetUp() override {
    DatabaseTest::SetUp();
    judge_.emplace(sandbox_, artifacts_, rubrics_, *db_);
    rubrics_.submissions["s1"] = {"s1", "m1", "u1", "artifacts/s1.zip", 1700000000000};
    rubrics_.challenges["m1"] = {"c1", 3, TwoRequirementRubric(), kImage};
    artifacts_.objects["artifacts/s1.zip"] = "not really a zip";
  }

  JobContext Context(const std::string& submission_id = "s1", int attempt = 1) {
    return JobContext(&queue_, JudgingJobId(submission_id), {"m1", submission_id, "v3"}, attempt);
  }
};

TEST_F(JudgingTest, ProcessJob) {
  engine_.On("./e2e.sh", 1, "", "assertion failed");
  auto ctx = Context();
  auto res = judge_->ProcessJob(ctx);

  // (10/20 * 60 + 5/5 * 40) / 100
  EXPECT_EQ(res.score, 70);
  EXPECT_EQ(res.submission_id, "s1");
  EXPECT_DOUBLE_EQ(res.breakdown.at("api"), 10);
  EXPECT_DOUBLE_EQ(res.breakdown.at("style"), 5);
  EXPECT_FALSE(res.breakdown.count("ux"));
  EXPECT_NE(std::find(res.logs.begin(), res.logs.end(), "[INFO] Final score: 70/100"), res.logs.end());

  auto run = db_->GetRun(res.judgement_run_id);
  ASSERT_TRUE(run);
  EXPECT_EQ(run->status, "success");
  EXPECT_EQ(run->job_id, "judging-s1");
  EXPECT_EQ(run->judge_version, "v3");
  EXPECT_EQ(run->environment_ref, kImage);
  EXPECT_TRUE(run->completed_at);
  std::string logs_key = JudgingLogsKey("m1", res.judgement_run_id);
  EXPECT_EQ(run->logs_key, logs_key);
  ASSERT_TRUE(artifacts_.objects.count(logs_key));
  EXPECT_EQ(artifacts_.content_types[logs_key], "text/plain");
  EXPECT_NE(artifacts_.objects[logs_key].find("Final score: 70/100"), std::string::npos);

  auto scores = db_->RunScores(res.judgement_run_id);
  ASSERT_EQ(scores.size(), 1);
  EXPECT_EQ(scores[0].user_id, "u1");
  EXPECT_EQ(scores[0].total_score, 70);
  auto breakdown = json::parse(scores[0].breakdown_json);
  EXPECT_TRUE(breakdown["buildSuccess"].get<bool>());
  auto& e2e = breakdown["requirements"][0]["checks"][1];
  EXPECT_EQ(e2e["passed"], false);
  EXPECT_EQ(e2e["stderr"], "assertion failed");
  auto automated = json::parse(scores[0].automated_results_json);
  EXPECT_EQ(automated["requirements"].size(), 2);

  // the artifact is copied before anything else runs, in a 1 CPU / 1g sandbox
  ASSERT_GE(engine_.commands.size(), 3);
  EXPECT_EQ(engine_.commands[0], "cp -r /artifact/. /workspace");
  EXPECT_EQ(engine_.commands[1], "npm ci");
  EXPECT_EQ(engine_.commands[2], "npm run build");
  ASSERT_EQ(engine_.configs.size(), 1);
  EXPECT_EQ(engine_.configs[0].image, kImage);
  EXPECT_DOUBLE_EQ(engine_.configs[0].cpu_limit, 1.0);
  EXPECT_EQ(engine_.configs[0].memory_limit, "1g");
  EXPECT_FALSE(engine_.configs[0].network_enabled);

  EXPECT_EQ(sandbox_.LiveSessions(), 0);
  EXPECT_TRUE(engine_.live.empty());
  EXPECT_EQ(CountScratchDirs(), 0);
}

TEST_F(JudgingTest, CheckTimeout) {
  engine_.OnTimeout("./e2e.sh");
  auto ctx = Context();
  auto res = judge_->ProcessJob(ctx);
  EXPECT_EQ(res.score, 70);
  auto breakdown = json::parse(db_->RunScores(res.judgement_run_id)[0].breakdown_json);
  auto& e2e = breakdown["requirements"][0]["checks"][1];
  EXPECT_EQ(e2e["exitCode"], kTimeoutExitCode);
  EXPECT_EQ(e2e["timedOut"], true);
  EXPECT_EQ(e2e["points"], 0);
  EXPECT_EQ(engine_.timeouts[4], 5); // cp, install, build, unit, e2e
}

TEST_F(JudgingTest, BuildFailureKeepsPartialCredit) {
  engine_.On("npm run build", 2, "", "tsc: error TS2322");
  Rubric rubric = ParseRubric(TwoRequirementRubric());
  TempDirectory scratch(kTempRoot, "judge-artifact-");
  auto res = judge_->JudgeSubmission(scratch.Path(), rubric, kImage, scratch.Path());
  EXPECT_FALSE(res.build_success);
  EXPECT_EQ(res.normalized_score, 100);
  EXPECT_EQ(res.total_score, 100);
  EXPECT_DOUBLE_EQ(res.max_score, 100);
  EXPECT_NE(std::find(res.logs.begin(), res.logs.end(), "[ERROR] Build failed (exit 2)"), res.logs.end());
  EXPECT_NE(std::find(res.logs.begin(), res.logs.end(), "tsc: error TS2322"), res.logs.end());
  EXPECT_FALSE(res.report_scoring);
}

TEST_F(JudgingTest, InstallFailureIsNotFatal) {
  engine_.On("npm ci", 1, "", "ENOTFOUND registry");
  engine_.On("npm test", 1);
  Rubric rubric = ParseRubric(TwoRequirementRubric());
  TempDirectory scratch(kTempRoot, "judge-artifact-");
  auto res = judge_->JudgeSubmission(scratch.Path(), rubric, kImage, scratch.Path());
  EXPECT_TRUE(res.build_success);
  EXPECT_NE(std::find(res.logs.begin(), res.logs.end(), "[WARN] Install failed (exit 1)"), res.logs.end());
  // (10/20 * 60 + 40) / 100
  EXPECT_EQ(res.normalized_score, 70);
  ASSERT_EQ(res.requirements.size(), 2);
  EXPECT_FALSE(res.requirements[0].checks[0].passed);
  EXPECT_TRUE(res.requirements[0].checks[1].passed);
}

TEST_F(JudgingTest, ExpectedExitCode) {
  engine_.On("./fails.sh", 3);
  Rubric rubric = ParseRubricText(R"({"requirements": [{"id": "r", "weight": 100, "checks": [
    {"id": "a", "command": "./fails.sh", "expectedExitCode": 3, "points": 1},
    {"id": "b", "command": "true", "expectedExitCode": 3, "points": 1}
  ]}]})");
  TempDirectory scratch(kTempRoot, "judge-artifact-");
  auto res = judge_->JudgeSubmission(scratch.Path(), rubric, "", scratch.Path());
  EXPECT_EQ(res.normalized_score, 50);
  EXPECT_EQ(engine_.configs[0].image, kDefaultJudgeImage);
}

TEST_F(JudgingTest, OutputTruncated) {
  engine_.On("npm test", 0, std::string(kMaxPersistedOutput * 2, 'x'));
  Rubric rubric = ParseRubric(TwoRequirementRubric());
  TempDirectory scratch(kTempRoot, "judge-artifact-");
  auto res = judge_->JudgeSubmission(scratch.Path(), rubric, kImage, scratch.Path());
  EXPECT_EQ(res.requirements[0].checks[0].output.size(), kMaxPersistedOutput);
}

TEST_F(JudgingTest, CopyFailure) {
  engine_.On("cp -r", 1, "", "No space left on device");
  auto ctx = Context();
  EXPECT_THROW(judge_->ProcessJob(ctx), SandboxError);
  auto runs = db_->MatchRuns("m1");
  ASSERT_EQ(runs.size(), 1);
  EXPECT_EQ(runs[0].status, "failed");
  EXPECT_TRUE(runs[0].completed_at);
  EXPECT_TRUE(db_->RunScores(runs[0].id).empty());
  EXPECT_EQ(sandbox_.LiveSessions(), 0);
  EXPECT_TRUE(engine_.live.empty());
  EXPECT_EQ(CountScratchDirs(), 0);
}

TEST_F(JudgingTest, SandboxUnavailable) {
  engine_.fail_create = true;
  auto ctx = Context();
  try {
    judge_->ProcessJob(ctx);
    FAIL() << "expected SandboxError";
  } catch (const SandboxError& err) {
    EXPECT_TRUE(err.Retryable());
  }
  EXPECT_EQ(db_->MatchRuns("m1")[0].status, "failed");
  EXPECT_EQ(CountScratchDirs(), 0);
}

TEST_F(JudgingTest, MissingSubmission) {
  auto ctx = Context("s404");
  try {
    judge_->ProcessJob(ctx);
    FAIL() << "expected NotFoundError";
  } catch (const NotFoundError& err) {
    EXPECT_FALSE(err.Retryable());
  }
  auto runs = db_->MatchRuns("m1");
  ASSERT_EQ(runs.size(), 1);
  EXPECT_EQ(runs[0].status, "failed");
  EXPECT_TRUE(engine_.configs.empty());
}

TEST_F(JudgingTest, MissingArtifact) {
  artifacts_.objects.clear();
  auto ctx = Context();
  EXPECT_THROW(judge_->ProcessJob(ctx), NotFoundError);
  EXPECT_EQ(db_->MatchRuns("m1")[0].environment_ref, kImage);
  EXPECT_EQ(CountScratchDirs(), 0);
}

TEST_F(JudgingTest, StorageFailure) {
  artifacts_.fail_download = true;
  auto ctx = Context();
  EXPECT_THROW(judge_->ProcessJob(ctx), StorageError);
}

TEST_F(JudgingTest, InvalidRubric) {
  rubrics_.challenges["m1"].rubric = json{{"requirements", "nope"}};
  auto ctx = Context();
  EXPECT_THROW(judge_->ProcessJob(ctx), InvalidInputError);
  EXPECT_EQ(db_->MatchRuns("m1")[0].status, "failed");
}

TEST_F(JudgingTest, EachAttemptCreatesRun) {
  engine_.fail_create = true;
  auto first = Context("s1", 1);
  EXPECT_THROW(judge_->ProcessJob(first), SandboxError);
  engine_.fail_create = false;
  auto second = Context("s1", 2);
  auto res = judge_->ProcessJob(second);
  auto runs = db_->MatchRuns("m1");
  ASSERT_EQ(runs.size(), 2);
  EXPECT_EQ(runs[0].status, "failed");
  EXPECT_EQ(runs[1].status, "success");
  EXPECT_EQ(runs[1].id, res.judgement_run_id);

  auto status = judge_->GetJudgingStatus("m1");
  EXPECT_EQ(status.status, JudgingStatus::COMPLETED);
  EXPECT_EQ(status.runs.size(), 2);
  EXPECT_EQ(StatusJSON(status)["status"], "completed");
}

TEST_F(JudgingTest, JudgingStatus) {
  EXPECT_EQ(judge_->GetJudgingStatus("m1").status, JudgingStatus::PENDING);
  JudgementRun run;
  run.match_id = "m1";
  run.submission_id = "s1";
  run.status = "running";
  run.started_at = UnixMillis();
  db_->InsertRun(run);
  EXPECT_EQ(judge_->GetJudgingStatus("m1").status, JudgingStatus::RUNNING);
  EXPECT_EQ(judge_->GetJudgingStatus("other").status, JudgingStatus::PENDING);
}

TEST_F(JudgingTest, ReportScoring) {
  auto rubric_json = TwoRequirementRubric();
  rubric_json["requirements"][0]["tests"] = {"api"};
  rubric_json["requirements"][0]["evidence"] = {"build_log"};
  rubric_json["reports"] = {{"tests", "reports/junit.xml"}, {"lint", "lint.json"}};
  rubrics_.challenges["m1"].rubric = rubric_json;
  engine_.files["/workspace/reports/junit.xml"] = R"(<testsuite name="api" tests="2" failures="1">
    <testcase name="get"/><testcase name="post"><failure/></testcase></testsuite>)";

  auto ctx = Context();
  auto res = judge_->ProcessJob(ctx);
  EXPECT_EQ(res.score, 70); // reports do not change the check score
  EXPECT_NE(std::find(res.logs.begin(), res.logs.end(), "[INFO] Test report: 1/2 passed"), res.logs.end());
  EXPECT_NE(std::find(res.logs.begin(), res.logs.end(), "[WARN] Report lint.json not found"), res.logs.end());
  auto breakdown = json::parse(db_->RunScores(res.judgement_run_id)[0].breakdown_json);
  ASSERT_TRUE(breakdown.contains("reportScoring"));
  auto& report = breakdown["reportScoring"];
  EXPECT_EQ(report["requirements"][0]["details"]["testsMatched"], 2);
  // 1/2 tests passed
  EXPECT_EQ(report["requirements"][0]["score"], 50);
  EXPECT_EQ(report["tieBreakers"]["submitTime"], 1700000000000);
}

TEST_F(JudgingTest, Enqueue) {
  std::string id = judge_->EnqueueJudging(queue_, "m1", "s1");
  EXPECT_EQ(id, "judging-s1");
  auto job = queue_.GetJob(id);
  ASSERT_TRUE(job);
  EXPECT_EQ(job->data.judge_version, "v3");
  EXPECT_EQ(job->state, JobState::WAITING);
  // duplicates are ignored while the job is retained
  EXPECT_EQ(judge_->EnqueueJudging(queue_, "m1", "s1"), id);
  EXPECT_EQ(queue_.Stats().waiting, 1);

  EXPECT_THROW(judge_->EnqueueJudging(queue_, "m1", "s404"), NotFoundError);
  EXPECT_THROW(judge_->EnqueueJudging(queue_, "m404", "s1"), NotFoundError);
  EXPECT_EQ(queue_.Stats().waiting, 1);
}

TEST_F(JudgingTest, ConcurrentJobsLeaveNoSessions) {
  // m1 judges normally; m2's containers fail every command after creation;
  // m3's submissions have no artifact
  rubrics_.challenges["m2"] = {"c2", 1, TwoRequirementRubric(), "broken:1"};
  rubrics_.challenges["m3"] = rubrics_.challenges["m1"];
  engine_.broken_images.insert("broken:1");
  const int kPerMatch = 4;
  for (int i = 0; i < kPerMatch; i++) {
    for (std::string match : {"m1", "m2", "m3"}) {
      std::string sub = match + "-s" + std::to_string(i);
      std::string key = "artifacts/" + sub + ".zip";
      rubrics_.submissions[sub] = {sub, match, "u" + std::to_string(i), key, 1700000000000};
      if (match != "m3") artifacts_.objects[key] = "zip bytes";
    }
  }

  std::atomic_int completed = 0, failed = 0;
  QueueOptions options;
  options.concurrency = 2;
  options.rate_max = 1000;
  options.default_job.attempts = 2;
  options.default_job.backoff_ms = 1;
  QueueManager queue(options, {
    .OnCompleted = [&](const JobInfo&) { completed++; },
    .OnFailed = [&](const JobInfo&, const std::string&) { failed++; },
  });
  queue.Start([this](JobContext& ctx) { return JobResultJSON(judge_->ProcessJob(ctx)); });
  for (int i = 0; i < kPerMatch; i++) {
    for (std::string match : {"m1", "m2", "m3"}) {
      judge_->EnqueueJudging(queue, match, match + "-s" + std::to_string(i));
    }
  }
  ASSERT_TRUE(queue.WaitUntilIdle(std::chrono::seconds(30)));

  EXPECT_EQ(completed, kPerMatch);
  EXPECT_EQ(failed, 2 * kPerMatch);
  EXPECT_EQ(sandbox_.LiveSessions(), 0);
  EXPECT_TRUE(engine_.live.empty());
  EXPECT_EQ(CountScratchDirs(), 0);
  // sandbox errors are retried, missing artifacts are not
  EXPECT_EQ(db_->MatchRuns("m1").size(), kPerMatch);
  EXPECT_EQ(db_->MatchRuns("m2").size(), 2 * kPerMatch);
  EXPECT_EQ(db_->MatchRuns("m3").size(), kPerMatch);
  for (auto& run : db_->MatchRuns("m2")) EXPECT_EQ(run.status, "failed");
}

TEST_F(JudgingTest, EnqueueWhileRunningYieldsOneRun) {
  std::promise<void> started, release;
  std::shared_future<void> released = release.get_future().share();
  std::atomic_int calls = 0;
  QueueOptions options;
  options.concurrency = 2;
  QueueManager queue(options);
  queue.Start([&](JobContext& ctx) {
    if (calls++ == 0) started.set_value();
    released.wait();
    return JobResultJSON(judge_->ProcessJob(ctx));
  });

  std::string id = judge_->EnqueueJudging(queue, "m1", "s1");
  ASSERT_EQ(started.get_future().wait_for(std::chrono::seconds(10)), std::future_status::ready);
  EXPECT_EQ(queue.GetJob(id)->state, JobState::ACTIVE);
  EXPECT_EQ(judge_->EnqueueJudging(queue, "m1", "s1"), id);
  EXPECT_EQ(queue.Stats().waiting, 0);
  release.set_value();
  ASSERT_TRUE(queue.WaitUntilIdle(std::chrono::seconds(10)));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(queue.GetJob(id)->state, JobState::COMPLETED);
  auto runs = db_->MatchRuns("m1");
  ASSERT_EQ(runs.size(), 1);
  EXPECT_EQ(runs[0].status, "success");
  EXPECT_EQ(db_->RunScores(runs[0].id).size(), 1);
}

TEST(ExtractArtifactTest, OpaqueFallback) {
  TempDirectory dir(kTempRoot, "extract-");
  auto content = ExtractArtifact("plain bytes", dir.Path(), 10);
  EXPECT_EQ(content, dir.Path() / "content");
  EXPECT_TRUE(fs::is_regular_file(content / "artifact"));
  EXPECT_EQ(fs::file_size(content / "artifact"), 11);
}

TEST(TempDirectoryTest, Removed) {
  fs::path path;
  {
    TempDirectory dir(kTempRoot, "tmp-test-");
    path = dir.Path();
    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_EQ(path.parent_path(), kTempRoot);
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST(NormalizedScoreTest, Weighted) {
  std::vector<RequirementResult> reqs(3);
  reqs[0].score = 5, reqs[0].max_score = 10, reqs[0].weight = 50;
  reqs[1].score = 0, reqs[1].max_score = 0, reqs[1].weight = 25; // no checks
  reqs[2].score = 3, reqs[2].max_score = 3, reqs[2].weight = 25;
  // (25 + 0 + 25) / 100
  EXPECT_EQ(NormalizedScore(reqs), 50);
  EXPECT_EQ(NormalizedScore({}), 0);
}
