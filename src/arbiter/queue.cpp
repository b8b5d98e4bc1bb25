#include <arbiter/queue.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <arbiter/errors.h>
#include <arbiter/utils.h>

namespace {

constexpr long kMaxBackoffMs = 3600 * 1000;

} // namespace

std::string JudgingJobId(const std::string& submission_id) {
  return "judging-" + submission_id;
}

void JobContext::UpdateProgress(int progress) {
  queue_->ReportProgress_(job_id, progress);
}

QueueManager::~QueueManager() {
  Close();
}

void QueueManager::Push_(JobRecord& rec) {
  rec.seq = seq_++;
  if (rec.ready_at > Clock::now()) {
    rec.info.state = JobState::DELAYED;
  } else {
    rec.info.state = JobState::WAITING;
    waiting_.insert({{rec.info.options.priority, rec.seq}, rec.info.id});
  }
}

void QueueManager::PromoteDelayed_(Clock::time_point now) {
  for (auto& [id, rec] : jobs_) {
    if (rec.info.state != JobState::DELAYED || rec.ready_at > now) continue;
    rec.info.state = JobState::WAITING;
    waiting_.insert({{rec.info.options.priority, rec.seq}, id});
  }
}

std::optional<QueueManager::Clock::time_point> QueueManager::RateLimitedUntil_(Clock::time_point now) {
  while (recent_starts_.size() && recent_starts_.front() <= now - options_.rate_window) {
    recent_starts_.pop_front();
  }
  if (options_.rate_max <= 0 || recent_starts_.size() < (size_t)options_.rate_max) return std::nullopt;
  return recent_starts_.front() + options_.rate_window;
}

std::chrono::milliseconds RetryBackoff(const JobOptions& options, int attempts_made) {
  if (options.backoff_ms <= 0) return std::chrono::milliseconds(0);
  int shift = std::clamp(attempts_made - 1, 0, 31);
  if (options.backoff_ms > (kMaxBackoffMs >> shift)) return std::chrono::milliseconds(kMaxBackoffMs);
  return std::chrono::milliseconds(options.backoff_ms << shift);
}

std::vector<std::string> QueueManager::Prune_() {
  auto now = Clock::now();
  std::vector<std::string> removed;
  auto prune = [&](JobState state, size_t keep, std::chrono::seconds age) {
    std::vector<std::pair<Clock::time_point, std::string>> finished;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
      if (it->second.info.state != state) {
        ++it;
      } else if (it->second.finished_at < now - age) {
        removed.push_back(it->first);
        it = jobs_.erase(it);
      } else {
        finished.emplace_back(it->second.finished_at, it->first);
        ++it;
      }
    }
    if (finished.size() <= keep) return;
    std::sort(finished.begin(), finished.end());
    for (size_t i = 0; i < finished.size() - keep; i++) {
      jobs_.erase(finished[i].second);
      removed.push_back(std::move(finished[i].second));
    }
  };
  prune(JobState::COMPLETED, options_.keep_completed, options_.completed_age);
  prune(JobState::FAILED, options_.keep_failed, options_.failed_age);
  return removed;
}

void QueueManager::NotifyRemoved_(const std::vector<std::string>& ids) {
  if (!listener_.OnRemoved) return;
  for (auto& id : ids) listener_.OnRemoved(id);
}

JobInfo QueueManager::Snapshot_(const std::string& id) {
  return jobs_.at(id).info;
}

void QueueManager::ReportProgress_(const std::string& id, int progress) {
  JobInfo info;
  {
    std::lock_guard lck(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    it->second.info.progress = std::clamp(progress, 0, 100);
    info = it->second.info;
  }
  spdlog::debug("Job {} progress {}", id, info.progress);
  if (listener_.OnProgress) listener_.OnProgress(info);
}

void QueueManager::Finish_(const std::string& id, bool success, nlohmann::json&& value,
                           const std::string& error, bool retryable) {
  JobInfo info;
  bool final_failure = false;
  std::vector<std::string> pruned;
  {
    std::lock_guard lck(mtx_);
    auto& rec = jobs_.at(id); // active jobs cannot be removed
    auto& job = rec.info;
    if (success) {
      job.state = JobState::COMPLETED;
      job.return_value = std::move(value);
      job.failed_reason.clear();
    } else {
      job.failed_reason = error;
      if (retryable && job.attempts_made < job.options.attempts) {
        auto backoff = RetryBackoff(job.options, job.attempts_made);
        rec.ready_at = Clock::now() + backoff;
        spdlog::warn("Job {} attempt {}/{} failed, retrying in {}ms: {}", id, job.attempts_made,
                     job.options.attempts, backoff.count(), error);
        Push_(rec);
      } else {
        job.state = JobState::FAILED;
        final_failure = true;
        spdlog::error("Job {} failed after {} attempt(s): {}", id, job.attempts_made, error);
      }
    }
    if (job.state == JobState::COMPLETED || job.state == JobState::FAILED) {
      job.finished_at = UnixMillis();
      rec.finished_at = Clock::now();
    }
    info = job;
    pruned = Prune_();
  }
  if (success) {
    spdlog::info("Job {} completed", id);
    if (listener_.OnCompleted) listener_.OnCompleted(info);
  } else if (final_failure) {
    if (listener_.OnFailed) listener_.OnFailed(info, error);
  }
  NotifyRemoved_(pruned);
  // the queue is not idle until the listeners have run
  {
    std::lock_guard lck(mtx_);
    active_--;
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

void QueueManager::WorkerLoop_() {
  std::unique_lock lck(mtx_);
  while (!closing_) {
    auto now = Clock::now();
    PromoteDelayed_(now);
    std::optional<Clock::time_point> wake;
    if (!paused_ && waiting_.size()) {
      wake = RateLimitedUntil_(now);
      if (!wake) {
        std::string id = waiting_.begin()->second;
        waiting_.erase(waiting_.begin());
        auto& job = jobs_.at(id).info;
        job.state = JobState::ACTIVE;
        job.attempts_made++;
        job.progress = 0;
        active_++;
        recent_starts_.push_back(now);
        JobContext ctx(this, id, job.data, job.attempts_made);
        lck.unlock();

        spdlog::info("Job {} started, attempt {}", id, ctx.attempt);
        nlohmann::json value;
        bool success = false, retryable = true;
        std::string error;
        try {
          value = processor_(ctx);
          success = true;
        } catch (const std::exception& err) {
          error = err.what();
          retryable = IsRetryable(err);
        }
        Finish_(id, success, std::move(value), error, retryable);
        lck.lock();
        continue;
      }
    }
    for (auto& [id, rec] : jobs_) {
      if (rec.info.state == JobState::DELAYED && (!wake || rec.ready_at < *wake)) wake = rec.ready_at;
    }
    if (wake) {
      cv_.wait_until(lck, *wake);
    } else {
      cv_.wait(lck);
    }
  }
}

bool QueueManager::Add(const std::string& job_id, const JudgingJobData& data, std::optional<JobOptions> opts) {
  {
    std::lock_guard lck(mtx_);
    if (closing_) {
      spdlog::warn("Queue closed, rejecting job {}", job_id);
      return false;
    }
    if (jobs_.count(job_id)) {
      spdlog::debug("Job {} already exists", job_id);
      return false;
    }
    JobRecord rec;
    rec.info.id = job_id;
    rec.info.data = data;
    rec.info.options = opts ? *opts : options_.default_job;
    rec.info.created_at = UnixMillis();
    rec.ready_at = Clock::now() + std::chrono::milliseconds(std::max(0L, rec.info.options.delay_ms));
    Push_(rec);
    jobs_.emplace(job_id, std::move(rec));
  }
  spdlog::info("Job {} queued: match {} submission {}", job_id, data.match_id, data.submission_id);
  cv_.notify_one();
  return true;
}

std::string QueueManager::EnqueueJudging(const JudgingJobData& data, std::optional<JobOptions> opts) {
  std::string id = JudgingJobId(data.submission_id);
  Add(id, data, std::move(opts));
  return id;
}

void QueueManager::Start(JobProcessor processor) {
  std::lock_guard lck(mtx_);
  if (workers_.size()) {
    spdlog::warn("Queue workers already started");
    return;
  }
  processor_ = std::move(processor);
  for (int i = 0; i < std::max(1, options_.concurrency); i++) {
    workers_.emplace_back(&QueueManager::WorkerLoop_, this);
  }
  spdlog::info("Queue started with {} worker(s)", workers_.size());
}

void QueueManager::Close() {
  {
    std::lock_guard lck(mtx_);
    if (closing_ && workers_.empty()) return;
    closing_ = true;
  }
  cv_.notify_all();
  for (auto& i : workers_) {
    if (i.joinable()) i.join();
  }
  workers_.clear();
  idle_cv_.notify_all();
}

std::optional<JobInfo> QueueManager::GetJob(const std::string& id) {
  std::lock_guard lck(mtx_);
  if (!jobs_.count(id)) return std::nullopt;
  return Snapshot_(id);
}

bool QueueManager::RetryJob(const std::string& id) {
  {
    std::lock_guard lck(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.info.state != JobState::FAILED) return false;
    auto& rec = it->second;
    rec.info.attempts_made = 0;
    rec.info.progress = 0;
    rec.info.failed_reason.clear();
    rec.info.return_value = nullptr;
    rec.info.finished_at = 0;
    rec.ready_at = Clock::now();
    Push_(rec);
  }
  spdlog::info("Job {} re-queued", id);
  cv_.notify_one();
  return true;
}

bool QueueManager::RemoveJob(const std::string& id) {
  {
    std::lock_guard lck(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second.info.state == JobState::ACTIVE) return false;
    if (it->second.info.state == JobState::WAITING) {
      waiting_.erase({{it->second.info.options.priority, it->second.seq}, id});
    }
    jobs_.erase(it);
  }
  NotifyRemoved_({id});
  idle_cv_.notify_all();
  return true;
}

QueueStats QueueManager::Stats() {
  std::lock_guard lck(mtx_);
  QueueStats stats;
  for (auto& [id, rec] : jobs_) {
    switch (rec.info.state) {
      case JobState::WAITING: stats.waiting++; break;
      case JobState::DELAYED: stats.delayed++; break;
      case JobState::ACTIVE: stats.active++; break;
      case JobState::COMPLETED: stats.completed++; break;
      case JobState::FAILED: stats.failed++; break;
    }
  }
  stats.paused = paused_;
  return stats;
}

void QueueManager::Pause() {
  std::lock_guard lck(mtx_);
  paused_ = true;
  spdlog::info("Queue paused");
}

void QueueManager::Resume() {
  {
    std::lock_guard lck(mtx_);
    paused_ = false;
  }
  spdlog::info("Queue resumed");
  cv_.notify_all();
}

size_t QueueManager::Drain() {
  std::vector<std::string> removed;
  {
    std::lock_guard lck(mtx_);
    for (auto it = jobs_.begin(); it != jobs_.end();) {
      auto state = it->second.info.state;
      if (state == JobState::WAITING || state == JobState::DELAYED) {
        removed.push_back(it->first);
        it = jobs_.erase(it);
      } else {
        ++it;
      }
    }
    waiting_.clear();
  }
  spdlog::info("Queue drained, {} job(s) dropped", removed.size());
  NotifyRemoved_(removed);
  idle_cv_.notify_all();
  return removed.size();
}

size_t QueueManager::Clean(std::chrono::milliseconds grace, size_t limit, JobState state) {
  if (state == JobState::ACTIVE) return 0;
  int64_t cutoff = UnixMillis() - grace.count();
  bool finished = state == JobState::COMPLETED || state == JobState::FAILED;
  std::vector<std::string> removed;
  {
    std::lock_guard lck(mtx_);
    for (auto it = jobs_.begin(); it != jobs_.end() && (!limit || removed.size() < limit);) {
      auto& info = it->second.info;
      int64_t ts = finished ? info.finished_at : info.created_at;
      if (info.state != state || ts > cutoff) {
        ++it;
        continue;
      }
      if (state == JobState::WAITING) waiting_.erase({{info.options.priority, it->second.seq}, it->first});
      removed.push_back(it->first);
      it = jobs_.erase(it);
    }
  }
  if (removed.size()) spdlog::info("Cleaned {} {} job(s)", removed.size(), JobStateName(state));
  NotifyRemoved_(removed);
  idle_cv_.notify_all();
  return removed.size();
}

bool QueueManager::WaitUntilIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx_);
  return idle_cv_.wait_for(lck, timeout, [this]() {
    if (active_) return false;
    for (auto& [id, rec] : jobs_) {
      if (rec.info.state == JobState::WAITING || rec.info.state == JobState::DELAYED) return false;
    }
    return true;
  });
}
