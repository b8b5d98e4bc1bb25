#include <arbiter/database.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <arbiter/errors.h>
#include <arbiter/utils.h>

void Database::Init_() {
  if (db_) return;
  try {
    db_ = std::make_unique<Storage>(internal::InitStorage(path_.string()));
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to open database {}: {}", path_.c_str(), err.what()));
  }
}

int64_t Database::InsertRun(const JudgementRun& run) {
  std::lock_guard lck(mtx_);
  Init_();
  try {
    return db_->insert(run);
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to insert run of match {}: {}", run.match_id, err.what()));
  }
}

bool Database::UpdateRunStatus(int64_t id, RunStatus status, std::optional<std::string> logs_key) {
  std::lock_guard lck(mtx_);
  Init_();
  try {
    auto run = db_->get_pointer<JudgementRun>(id);
    if (!run) {
      spdlog::warn("Judgement run {} not found", id);
      return false;
    }
    RunStatus current = GetRunStatus(run->status);
    if (IsTerminal(current) || (int)status < (int)current) {
      spdlog::warn("Refusing run {} transition {} -> {}", id, run->status, RunStatusName(status));
      return false;
    }
    run->status = RunStatusName(status);
    if (IsTerminal(status)) run->completed_at = UnixMillis();
    if (logs_key) run->logs_key = std::move(logs_key);
    db_->update(*run);
    return true;
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to update run {}: {}", id, err.what()));
  }
}

bool Database::SetRunEnvironment(int64_t id, const std::string& environment_ref) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init_();
  try {
    if (!db_->count<JudgementRun>(where(c(&JudgementRun::id) == id))) return false;
    db_->update_all(set(c(&JudgementRun::environment_ref) = environment_ref),
                    where(c(&JudgementRun::id) == id));
    return true;
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to update run {}: {}", id, err.what()));
  }
}

std::optional<JudgementRun> Database::GetRun(int64_t id) {
  std::lock_guard lck(mtx_);
  Init_();
  try {
    auto run = db_->get_pointer<JudgementRun>(id);
    if (!run) return std::nullopt;
    return std::move(*run);
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to read run {}: {}", id, err.what()));
  }
}

std::vector<JudgementRun> Database::MatchRuns(const std::string& match_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init_();
  try {
    return db_->get_all<JudgementRun>(
        where(c(&JudgementRun::match_id) == match_id),
        multi_order_by(order_by(&JudgementRun::started_at), order_by(&JudgementRun::id)));
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to list runs of match {}: {}", match_id, err.what()));
  }
}

int64_t Database::InsertScore(const Score& score) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init_();
  try {
    if (!db_->count<JudgementRun>(where(c(&JudgementRun::id) == score.judgement_run_id))) {
      throw InvalidInputError(fmt::format("Score references missing run {}", score.judgement_run_id));
    }
    if (db_->count<Score>(where(c(&Score::judgement_run_id) == score.judgement_run_id &&
                                c(&Score::user_id) == score.user_id))) {
      throw InvalidInputError(fmt::format("Score of run {} for user {} already exists",
                                          score.judgement_run_id, score.user_id));
    }
    return db_->insert(score);
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to insert score of run {}: {}", score.judgement_run_id, err.what()));
  }
}

std::vector<Score> Database::RunScores(int64_t run_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init_();
  try {
    return db_->get_all<Score>(where(c(&Score::judgement_run_id) == run_id), order_by(&Score::id));
  } catch (const std::system_error& err) {
    throw StorageError(fmt::format("Failed to list scores of run {}: {}", run_id, err.what()));
  }
}
