#ifndef INCLUDE_ARBITER_JUDGING_H_
#define INCLUDE_ARBITER_JUDGING_H_

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "queue.h"
#include "rubric.h"
#include "scoring.h"
#include "sandbox.h"
#include "database.h"
#include "platform.h"

#define ENUM_JUDGING_STATUS_ \
  X(PENDING, "pending") \
  X(RUNNING, "running") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed")
enum class JudgingStatus {
#define X(name, str) name,
  ENUM_JUDGING_STATUS_
#undef X
};

struct CheckResult {
  std::string check_id, name;
  bool passed = false;
  int exit_code = 0;
  std::string output, error; // truncated
  long duration_ms = 0;
  bool timed_out = false;
  bool oom_killed = false;
  double points = 0, max_points = 0;
};

struct RequirementResult {
  std::string requirement_id, name;
  std::vector<CheckResult> checks;
  double score = 0, max_score = 0;
  double weight = 0;
};

struct JudgingResult {
  int total_score = 0; // rounded sum of weighted requirement scores
  double max_score = 0; // sum of automated weights
  int normalized_score = 0; // 0-100
  std::vector<RequirementResult> requirements;
  bool build_success = true;
  std::optional<ScoringResult> report_scoring;
  std::vector<std::string> logs;
  long duration_ms = 0;
};

struct JudgingJobResult {
  std::string submission_id;
  int64_t judgement_run_id = 0;
  int score = 0;
  std::map<std::string, double> breakdown; // requirement id -> points
  std::vector<std::string> logs;
  long execution_time_ms = 0;
};

struct JudgingStatusReport {
  JudgingStatus status = JudgingStatus::PENDING;
  std::vector<JudgementRun> runs;
};

struct JudgeOptions {
  SandboxConfig sandbox; // image is replaced by the challenge's judge image
  std::filesystem::path temp_root;
  int extract_timeout_seconds = 30;
  JudgeOptions();
};

// RAII scratch directory created with mkdtemp
class TempDirectory {
  std::filesystem::path path_;
 public:
  TempDirectory(const std::filesystem::path& root, const std::string& prefix);
  ~TempDirectory();
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;
  const std::filesystem::path& Path() const { return path_; }
};

// Writes the artifact to <dir>/artifact.zip and extracts it into <dir>/content.
// Falls back to <dir>/content/artifact if it cannot be extracted. Returns the content directory.
std::filesystem::path ExtractArtifact(const std::string& data, const std::filesystem::path& dir,
                                      int timeout_seconds);

// score/max_score per requirement weighted, normalized to 0-100
int NormalizedScore(const std::vector<RequirementResult>&);

nlohmann::json BreakdownJSON(const JudgingResult&);
nlohmann::json AutomatedResultsJSON(const JudgingResult&);
nlohmann::json JobResultJSON(const JudgingJobResult&);
nlohmann::json StatusJSON(const JudgingStatusReport&);

class Judge {
  SandboxRuntime& sandbox_;
  ArtifactStore& artifacts_;
  RubricSource& rubrics_;
  Database& db_;
  JudgeOptions options_;

  CheckResult RunCheck_(ScopedSandbox&, const RubricCheck&);
  RequirementResult RunRequirement_(ScopedSandbox&, const RubricRequirement&);
  std::optional<ScoringResult> ScoreReports_(ScopedSandbox&, const Rubric&, const std::filesystem::path& scratch,
                                             bool build_success, int64_t submit_time, std::vector<std::string>& logs);

 public:
  Judge(SandboxRuntime& sandbox, ArtifactStore& artifacts, RubricSource& rubrics, Database& db,
        JudgeOptions options = JudgeOptions()) :
      sandbox_(sandbox), artifacts_(artifacts), rubrics_(rubrics), db_(db), options_(std::move(options)) {}

  // Runs the rubric against an extracted artifact; throws only on infrastructure failures.
  // scratch receives copied-out reports.
  JudgingResult JudgeSubmission(const std::filesystem::path& artifact_dir, const Rubric& rubric,
                                const std::string& image, const std::filesystem::path& scratch,
                                int64_t submit_time = 0);

  // One attempt of a judging job: creates a run, judges, persists. Rethrows failures after marking the run failed.
  JudgingJobResult ProcessJob(JobContext& ctx);

  // validates the submission and match, then enqueues
  std::string EnqueueJudging(QueueManager& queue, const std::string& match_id, const std::string& submission_id,
                             std::optional<JobOptions> options = std::nullopt);

  JudgingStatusReport GetJudgingStatus(const std::string& match_id);
};

#endif  // INCLUDE_ARBITER_JUDGING_H_
