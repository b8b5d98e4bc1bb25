#include <arbiter/judging.h>

#include <cmath>
#include <chrono>
#include <cstdlib>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <arbiter/paths.h>
#include <arbiter/utils.h>
#include <arbiter/errors.h>
#include "process.h"
#include "utils.h"

namespace {

// host-side file names of copied-out reports
const char kTestReportFile[] = "test-report";
const char kCoverageReportFile[] = "coverage.json";
const char kLintReportFile[] = "lint.json";

constexpr size_t kInstallErrorLog = 1000;
constexpr size_t kBuildErrorLog = 2000;

long ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
}

std::string JoinLines(const std::vector<std::string>& lines) {
  std::string ret;
  for (auto& i : lines) ret += i + '\n';
  return ret;
}

} // namespace

JudgeOptions::JudgeOptions() : temp_root(kTempRoot) {
  sandbox.cpu_limit = 1.0;
  sandbox.memory_limit = "1g";
  sandbox.timeout_seconds = 600;
  sandbox.network_enabled = false;
}

TempDirectory::TempDirectory(const fs::path& root, const std::string& prefix) {
  std::string tmpl = (root / (prefix + "XXXXXX")).string();
  if (!CreateDirs(root) || !mkdtemp(tmpl.data())) {
    throw StorageError(fmt::format("Failed to create scratch directory under {}", root.c_str()));
  }
  path_ = tmpl;
}

TempDirectory::~TempDirectory() {
  if (!RemoveAll(path_)) spdlog::warn("Failed to remove scratch directory {}", path_.c_str());
}

fs::path ExtractArtifact(const std::string& data, const fs::path& dir, int timeout_seconds) {
  fs::path zip = dir / "artifact.zip", content = dir / "content";
  if (!WriteFile(zip, data) || !CreateDirs(content)) {
    throw StorageError(fmt::format("Failed to write artifact to {}", dir.c_str()));
  }
  auto res = RunProcess({"unzip", "-q", "-o", zip.string(), "-d", content.string()}, timeout_seconds * 1000L);
  if (res.exit_code == 0) return content;
  spdlog::warn("Failed to extract artifact (exit {}{}), using it as an opaque file",
               res.exit_code, res.timed_out ? ", timed out" : "");
  if (!RemoveAll(content) || !CreateDirs(content) || !Copy(zip, content / "artifact")) {
    throw StorageError(fmt::format("Failed to prepare artifact in {}", content.c_str()));
  }
  return content;
}

int NormalizedScore(const std::vector<RequirementResult>& reqs) {
  double total = 0, weights = 0;
  for (auto& req : reqs) {
    if (req.max_score > 0) total += req.score / req.max_score * req.weight;
    weights += req.weight;
  }
  if (weights <= 0) return 0;
  return (int)std::lround(total / weights * 100);
}

nlohmann::json BreakdownJSON(const JudgingResult& result) {
  using nlohmann::json;
  json reqs = json::array();
  for (auto& req : result.requirements) {
    json checks = json::array();
    for (auto& c : req.checks) {
      checks.push_back({
        {"checkId", c.check_id},
        {"name", c.name},
        {"passed", c.passed},
        {"exitCode", c.exit_code},
        {"stdout", c.output},
        {"stderr", c.error},
        {"durationMs", c.duration_ms},
        {"timedOut", c.timed_out},
        {"oomKilled", c.oom_killed},
        {"points", c.points},
        {"maxPoints", c.max_points},
      });
    }
    reqs.push_back({
      {"requirementId", req.requirement_id},
      {"name", req.name},
      {"checks", std::move(checks)},
      {"score", req.score},
      {"maxScore", req.max_score},
      {"weight", req.weight},
    });
  }
  json ret = {{"requirements", std::move(reqs)}, {"buildSuccess", result.build_success}};
  if (result.report_scoring) ret["reportScoring"] = *result.report_scoring;
  return ret;
}

nlohmann::json AutomatedResultsJSON(const JudgingResult& result) {
  using nlohmann::json;
  json reqs = json::array();
  for (auto& req : result.requirements) {
    json checks = json::array();
    for (auto& c : req.checks) {
      checks.push_back({
        {"id", c.check_id}, {"name", c.name}, {"passed", c.passed},
        {"points", c.points}, {"maxPoints", c.max_points},
      });
    }
    reqs.push_back({
      {"id", req.requirement_id},
      {"name", req.name},
      {"score", req.score},
      {"maxScore", req.max_score},
      {"checks", std::move(checks)},
    });
  }
  return {{"requirements", std::move(reqs)}};
}

nlohmann::json JobResultJSON(const JudgingJobResult& result) {
  return {
    {"submissionId", result.submission_id},
    {"judgementRunId", result.judgement_run_id},
    {"score", result.score},
    {"breakdown", result.breakdown},
    {"logs", result.logs},
    {"executionTimeMs", result.execution_time_ms},
  };
}

nlohmann::json StatusJSON(const JudgingStatusReport& report) {
  using nlohmann::json;
  json runs = json::array();
  for (auto& run : report.runs) {
    json item = {
      {"id", run.id},
      {"matchId", run.match_id},
      {"submissionId", run.submission_id},
      {"status", run.status},
      {"startedAt", run.started_at},
      {"completedAt", run.completed_at ? json(*run.completed_at) : json()},
      {"judgeVersion", run.judge_version},
      {"environmentRef", run.environment_ref},
      {"logsKey", run.logs_key ? json(*run.logs_key) : json()},
    };
    runs.push_back(std::move(item));
  }
  return {{"status", JudgingStatusName(report.status)}, {"runs", std::move(runs)}};
}

CheckResult Judge::RunCheck_(ScopedSandbox& sandbox, const RubricCheck& check) {
  ExecutionCommand cmd;
  cmd.command = check.command;
  cmd.args = check.args;
  cmd.timeout_seconds = check.timeout_seconds > 0 ? check.timeout_seconds : 60;
  auto res = sandbox.Execute(cmd);

  CheckResult ret;
  ret.check_id = check.id;
  ret.name = check.name;
  ret.passed = res.exit_code == check.expected_exit_code && !res.timed_out;
  ret.exit_code = res.exit_code;
  ret.output = Truncate(res.output, kMaxPersistedOutput);
  ret.error = Truncate(res.error, kMaxPersistedOutput);
  ret.duration_ms = res.duration_ms;
  ret.timed_out = res.timed_out;
  ret.oom_killed = res.oom_killed;
  ret.points = ret.passed ? check.points : 0;
  ret.max_points = check.points;
  return ret;
}

RequirementResult Judge::RunRequirement_(ScopedSandbox& sandbox, const RubricRequirement& req) {
  RequirementResult ret;
  ret.requirement_id = req.id;
  ret.name = req.name;
  ret.weight = req.weight;
  for (auto& check : req.checks) {
    ret.checks.push_back(RunCheck_(sandbox, check));
    ret.score += ret.checks.back().points;
    ret.max_score += ret.checks.back().max_points;
  }
  return ret;
}

std::optional<ScoringResult> Judge::ScoreReports_(
    ScopedSandbox& sandbox, const Rubric& rubric, const fs::path& scratch,
    bool build_success, int64_t submit_time, std::vector<std::string>& logs) {
  auto& reports = rubric.reports;
  if (reports.Empty()) return std::nullopt;

  auto fetch = [&](const std::string& path, const char* name) -> std::optional<std::string> {
    if (path.empty()) return std::nullopt;
    fs::path host = scratch / name;
    std::string content;
    if (!sandbox.CopyOut((fs::path(kWorkspacePath) / path).lexically_normal().string(), host) ||
        !ReadFile(host, content)) {
      logs.push_back(fmt::format("[WARN] Report {} not found", path));
      return std::nullopt;
    }
    return content;
  };

  ScoringInputs inputs;
  if (auto content = fetch(reports.tests, kTestReportFile)) {
    inputs.tests = ParseTestReport(reports.tests_format, *content);
    logs.push_back(fmt::format("[INFO] Test report: {}/{} passed", inputs.tests->total_passed,
                               inputs.tests->total_tests));
  }
  if (auto content = fetch(reports.coverage, kCoverageReportFile)) {
    inputs.coverage = ParseCoverageJSON(*content);
  }
  if (auto content = fetch(reports.lint, kLintReportFile)) {
    inputs.lint = ParseESLintJSON(*content);
  }
  if (rubric.build_command) {
    BuildResult build;
    build.success = build_success;
    build.exit_code = build_success ? 0 : 1;
    inputs.build = build;
  }
  if (submit_time) inputs.submit_time = submit_time;
  auto result = CalculateScore(rubric, inputs);
  logs.push_back(fmt::format("[INFO] Report score: {}/{}", result.total_score, result.max_score));
  return result;
}

JudgingResult Judge::JudgeSubmission(const fs::path& artifact_dir, const Rubric& rubric, const std::string& image,
                                     const fs::path& scratch, int64_t submit_time) {
  auto start = std::chrono::steady_clock::now();
  JudgingResult result;
  auto& logs = result.logs;

  SandboxConfig config = options_.sandbox;
  config.image = image.empty() ? kDefaultJudgeImage : image;
  ScopedSandbox sandbox(sandbox_, artifact_dir, config);

  logs.push_back("[INFO] Copying artifact to workspace...");
  {
    ExecutionCommand cmd;
    cmd.command = "cp";
    cmd.args = {"-r", std::string(kArtifactMountPath) + "/.", kWorkspacePath};
    auto res = sandbox.Execute(cmd);
    if (res.exit_code != 0) {
      logs.push_back("[ERROR] Failed to copy artifact: " + res.error);
      throw SandboxError("Failed to copy artifact to workspace");
    }
  }

  if (rubric.install_command) {
    logs.push_back("[INFO] Running install: " + rubric.install_command->command);
    auto res = sandbox.Execute(*rubric.install_command);
    if (res.exit_code != 0) {
      logs.push_back(fmt::format("[WARN] Install failed (exit {})", res.exit_code));
      logs.push_back(Truncate(res.error, kInstallErrorLog));
    } else {
      logs.push_back("[INFO] Install completed successfully");
    }
  }
  if (rubric.build_command) {
    logs.push_back("[INFO] Running build: " + rubric.build_command->command);
    auto res = sandbox.Execute(*rubric.build_command);
    if (res.exit_code != 0) {
      result.build_success = false;
      logs.push_back(fmt::format("[ERROR] Build failed (exit {})", res.exit_code));
      logs.push_back(Truncate(res.error, kBuildErrorLog));
    } else {
      logs.push_back("[INFO] Build completed successfully");
    }
  }

  // requirements still run after a failed build for partial credit
  for (auto& req : rubric.requirements) {
    if (req.type != RequirementType::AUTOMATED) continue;
    logs.push_back("[INFO] Running requirement: " + req.name);
    result.requirements.push_back(RunRequirement_(sandbox, req));
    auto& res = result.requirements.back();
    logs.push_back(fmt::format("[INFO] Requirement {}: {:g}/{:g} points", req.name, res.score, res.max_score));
  }

  double total = 0;
  for (auto& req : result.requirements) {
    if (req.max_score > 0) total += req.score / req.max_score * req.weight;
    result.max_score += req.weight;
  }
  result.total_score = (int)std::lround(total);
  result.normalized_score = NormalizedScore(result.requirements);
  logs.push_back(fmt::format("[INFO] Final score: {}/100", result.normalized_score));

  result.report_scoring = ScoreReports_(sandbox, rubric, scratch, result.build_success, submit_time, logs);
  result.duration_ms = ElapsedMs(start);
  return result;
}

JudgingJobResult Judge::ProcessJob(JobContext& ctx) {
  auto start = std::chrono::steady_clock::now();
  auto& data = ctx.data;
  spdlog::info("Judging job {} for match {} (attempt {})", ctx.job_id, data.match_id, ctx.attempt);

  JudgementRun run;
  run.match_id = data.match_id;
  run.submission_id = data.submission_id;
  run.job_id = ctx.job_id;
  run.status = RunStatusName(RunStatus::RUNNING);
  run.started_at = UnixMillis();
  run.judge_version = data.judge_version;
  run.id = db_.InsertRun(run);

  try {
    ctx.UpdateProgress(10);
    auto submission = rubrics_.GetSubmission(data.submission_id);
    if (!submission) throw NotFoundError("Submission not found: " + data.submission_id);
    ctx.UpdateProgress(20);

    auto challenge = rubrics_.GetMatchChallenge(data.match_id);
    if (!challenge) throw NotFoundError("Challenge of match not found: " + data.match_id);
    Rubric rubric = ParseRubric(challenge->rubric);
    std::string image = challenge->judge_image.empty() ? kDefaultJudgeImage : challenge->judge_image;
    IGNORE_RETURN(db_.SetRunEnvironment(run.id, image));
    ctx.UpdateProgress(30);

    TempDirectory scratch(options_.temp_root, "judge-artifact-");
    fs::path content;
    {
      auto payload = artifacts_.Download(submission->artifact_key);
      if (!payload) throw NotFoundError("Artifact not found: " + submission->artifact_key);
      content = ExtractArtifact(*payload, scratch.Path(), options_.extract_timeout_seconds);
    }
    ctx.UpdateProgress(50);

    JudgingResult result = JudgeSubmission(content, rubric, image, scratch.Path(), submission->submitted_at);
    ctx.UpdateProgress(80);

    std::string logs_key = JudgingLogsKey(data.match_id, run.id);
    artifacts_.Upload(logs_key, JoinLines(result.logs), "text/plain");

    Score score;
    score.judgement_run_id = run.id;
    score.match_id = data.match_id;
    score.user_id = submission->user_id;
    score.total_score = result.normalized_score;
    score.breakdown_json = BreakdownJSON(result).dump();
    score.automated_results_json = AutomatedResultsJSON(result).dump();
    score.created_at = UnixMillis();
    db_.InsertScore(score);
    if (!db_.UpdateRunStatus(run.id, RunStatus::SUCCESS, logs_key)) {
      throw StorageError(fmt::format("Failed to complete run {}", run.id));
    }
    ctx.UpdateProgress(100);
    spdlog::info("Job {} judged: {}/100", ctx.job_id, result.normalized_score);

    JudgingJobResult ret;
    ret.submission_id = data.submission_id;
    ret.judgement_run_id = run.id;
    ret.score = result.normalized_score;
    for (auto& req : result.requirements) ret.breakdown[req.requirement_id] = req.score;
    ret.logs = std::move(result.logs);
    ret.execution_time_ms = ElapsedMs(start);
    return ret;
  } catch (const std::exception& err) {
    spdlog::error("Judging job {} failed: {}", ctx.job_id, err.what());
    try {
      IGNORE_RETURN(db_.UpdateRunStatus(run.id, RunStatus::FAILED));
    } catch (const StorageError& db_err) {
      spdlog::error("Failed to mark run {} failed: {}", run.id, db_err.what());
    }
    throw;
  }
}

std::string Judge::EnqueueJudging(QueueManager& queue, const std::string& match_id,
                                  const std::string& submission_id, std::optional<JobOptions> options) {
  auto submission = rubrics_.GetSubmission(submission_id);
  if (!submission) throw NotFoundError("Submission not found: " + submission_id);
  auto challenge = rubrics_.GetMatchChallenge(match_id);
  if (!challenge) throw NotFoundError("Challenge of match not found: " + match_id);

  JudgingJobData data{match_id, submission_id, fmt::format("v{}", challenge->version_number)};
  std::string id = JudgingJobId(submission_id);
  if (!queue.Add(id, data, std::move(options))) {
    spdlog::info("Submission {} is already queued for judging", submission_id);
  }
  return id;
}

JudgingStatusReport Judge::GetJudgingStatus(const std::string& match_id) {
  JudgingStatusReport report;
  report.runs = db_.MatchRuns(match_id);
  if (report.runs.empty()) return report;
  switch (GetRunStatus(report.runs.back().status)) {
    case RunStatus::QUEUED: [[fallthrough]];
    case RunStatus::RUNNING: report.status = JudgingStatus::RUNNING; break;
    case RunStatus::FAILED: report.status = JudgingStatus::FAILED; break;
    case RunStatus::SUCCESS: report.status = JudgingStatus::COMPLETED; break;
  }
  return report;
}
