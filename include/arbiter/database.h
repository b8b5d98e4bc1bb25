#ifndef INCLUDE_ARBITER_DATABASE_H_
#define INCLUDE_ARBITER_DATABASE_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <sqlite_orm/sqlite_orm.h>

// one-directional: QUEUED -> RUNNING -> SUCCESS / FAILED
#define ENUM_RUN_STATUS_ \
  X(QUEUED, "queued") \
  X(RUNNING, "running") \
  X(SUCCESS, "success") \
  X(FAILED, "failed")
enum class RunStatus {
#define X(name, str) name,
  ENUM_RUN_STATUS_
#undef X
};

inline bool IsTerminal(RunStatus status) {
  return status == RunStatus::SUCCESS || status == RunStatus::FAILED;
}

// one record per judging attempt
struct JudgementRun {
  int64_t id = 0;
  std::string match_id;
  std::string submission_id;
  std::string job_id;
  std::string status; // RunStatusName()
  int64_t started_at = 0; // UNIX timestamp, milliseconds
  std::optional<int64_t> completed_at;
  std::string judge_version;
  std::string environment_ref;
  std::optional<std::string> logs_key;
};

// immutable once written; one per (judgement_run_id, user_id)
struct Score {
  int64_t id = 0;
  int64_t judgement_run_id = 0;
  std::string match_id;
  std::string user_id;
  int total_score = 0;
  std::string breakdown_json;
  std::string automated_results_json;
  std::optional<std::string> ai_judge_results_json;
  int64_t created_at = 0;
};

namespace internal {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_judgement_runs_match", &JudgementRun::match_id, &JudgementRun::started_at),
      make_unique_index("idx_scores_run_user", &Score::judgement_run_id, &Score::user_id),
      make_table("judgement_runs",
                 make_column("id", &JudgementRun::id, primary_key().autoincrement()),
                 make_column("match_id", &JudgementRun::match_id),
                 make_column("submission_id", &JudgementRun::submission_id),
                 make_column("job_id", &JudgementRun::job_id),
                 make_column("status", &JudgementRun::status, default_value("queued")),
                 make_column("started_at", &JudgementRun::started_at),
                 make_column("completed_at", &JudgementRun::completed_at),
                 make_column("judge_version", &JudgementRun::judge_version),
                 make_column("environment_ref", &JudgementRun::environment_ref),
                 make_column("logs_key", &JudgementRun::logs_key)),
      make_table("scores",
                 make_column("id", &Score::id, primary_key().autoincrement()),
                 make_column("judgement_run_id", &Score::judgement_run_id),
                 make_column("match_id", &Score::match_id),
                 make_column("user_id", &Score::user_id),
                 make_column("total_score", &Score::total_score),
                 make_column("breakdown_json", &Score::breakdown_json),
                 make_column("automated_results_json", &Score::automated_results_json),
                 make_column("ai_judge_results_json", &Score::ai_judge_results_json),
                 make_column("created_at", &Score::created_at),
                 foreign_key(&Score::judgement_run_id).references(&JudgementRun::id)));
  storage.sync_schema(true);
  return storage;
}

} // namespace internal

// Thread-safe; all access is serialized
class Database {
 public:
  using Storage = decltype(internal::InitStorage(""));

 private:
  std::filesystem::path path_;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;

  void Init_();

 public:
  explicit Database(std::filesystem::path path) : path_(std::move(path)) {}

  // returns the new id
  int64_t InsertRun(const JudgementRun&);
  // false if the run does not exist or is already terminal
  bool UpdateRunStatus(int64_t id, RunStatus status, std::optional<std::string> logs_key = std::nullopt);
  // the judge image, known once the challenge is resolved
  bool SetRunEnvironment(int64_t id, const std::string& environment_ref);
  std::optional<JudgementRun> GetRun(int64_t id);
  // ordered by start time
  std::vector<JudgementRun> MatchRuns(const std::string& match_id);

  // throws InvalidInputError if the run is missing or a score already exists
  int64_t InsertScore(const Score&);
  std::vector<Score> RunScores(int64_t run_id);
};

#endif  // INCLUDE_ARBITER_DATABASE_H_
