#ifndef INCLUDE_ARBITER_QUEUE_H_
#define INCLUDE_ARBITER_QUEUE_H_

#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>
#include <optional>
#include <functional>
#include <condition_variable>

#include <nlohmann/json.hpp>

#define ENUM_JOB_STATE_ \
  X(WAITING, "waiting") \
  X(DELAYED, "delayed") /* waiting for its start delay or retry backoff */ \
  X(ACTIVE, "active") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed")
enum class JobState {
#define X(name, str) name,
  ENUM_JOB_STATE_
#undef X
};

struct JudgingJobData {
  std::string match_id;
  std::string submission_id;
  std::string judge_version; // v<challenge version>, resolved when enqueued
};

// deterministic; one job per submission
std::string JudgingJobId(const std::string& submission_id);

struct JobOptions {
  int attempts = 3;
  long backoff_ms = 1000; // exponential: backoff_ms * 2^(attempt-1)
  int priority = 5; // lower runs first
  long delay_ms = 0;
};

// delay before the attempt after attempts_made; capped at one hour
std::chrono::milliseconds RetryBackoff(const JobOptions& options, int attempts_made);

struct QueueOptions {
  int concurrency = 2;
  // at most rate_max job starts in every rate_window
  int rate_max = 10;
  std::chrono::milliseconds rate_window{60000};
  // retention of finished jobs
  size_t keep_completed = 1000;
  std::chrono::seconds completed_age{24 * 3600};
  size_t keep_failed = 5000;
  std::chrono::seconds failed_age{7 * 24 * 3600};
  JobOptions default_job;
};

struct JobInfo {
  std::string id;
  JudgingJobData data;
  JobOptions options;
  JobState state = JobState::WAITING;
  int attempts_made = 0;
  int progress = 0;
  std::string failed_reason;
  nlohmann::json return_value;
  int64_t created_at = 0; // UNIX timestamp, milliseconds
  int64_t finished_at = 0;
};

struct QueueStats {
  size_t waiting = 0, active = 0, completed = 0, failed = 0, delayed = 0;
  bool paused = false;
};

class QueueManager;

// Correlation data of one attempt, passed to the processor
class JobContext {
  QueueManager* queue_;

 public:
  const std::string job_id;
  const JudgingJobData data;
  const int attempt; // 1-based

  JobContext(QueueManager* queue, std::string job_id, JudgingJobData data, int attempt) :
      queue_(queue), job_id(std::move(job_id)), data(std::move(data)), attempt(attempt) {}

  void UpdateProgress(int progress);
};

// Throwing marks the attempt as failed; errors with Retryable() == false skip the remaining attempts
using JobProcessor = std::function<nlohmann::json(JobContext&)>;

class QueueManager {
 public:
  // these functions should not block; they are called from worker threads without the queue lock
  struct Listener {
    std::function<void(const JobInfo&)> OnProgress;
    std::function<void(const JobInfo&)> OnCompleted;
    // only after the last attempt
    std::function<void(const JobInfo&, const std::string& error)> OnFailed;
    // a job left the queue (retention, Clean, Drain or RemoveJob); its id may be reused
    std::function<void(const std::string& id)> OnRemoved;
  };

 private:
  using Clock = std::chrono::steady_clock;

  struct JobRecord {
    JobInfo info;
    Clock::time_point ready_at; // for delayed jobs
    Clock::time_point finished_at;
    long seq;
  };

  QueueOptions options_;
  Listener listener_;
  JobProcessor processor_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::map<std::string, JobRecord> jobs_;
  // (priority, seq) -> job id
  std::set<std::pair<std::pair<int, long>, std::string>> waiting_;
  std::deque<Clock::time_point> recent_starts_;
  std::vector<std::thread> workers_;
  long seq_ = 0;
  size_t active_ = 0;
  bool paused_ = false;
  bool closing_ = false;

  void WorkerLoop_();
  void PromoteDelayed_(Clock::time_point now);
  // nullopt if a start is allowed now
  std::optional<Clock::time_point> RateLimitedUntil_(Clock::time_point now);
  void Finish_(const std::string& id, bool success, nlohmann::json&& value, const std::string& error, bool retryable);
  // returns the ids of the dropped jobs
  std::vector<std::string> Prune_();
  void NotifyRemoved_(const std::vector<std::string>& ids);
  void Push_(JobRecord& rec);
  JobInfo Snapshot_(const std::string& id);

  friend class JobContext;
  void ReportProgress_(const std::string& id, int progress);

 public:
  explicit QueueManager(QueueOptions options = {}, Listener listener = {}) :
      options_(std::move(options)), listener_(std::move(listener)) {}
  ~QueueManager();
  QueueManager(const QueueManager&) = delete;
  QueueManager& operator=(const QueueManager&) = delete;

  const QueueOptions& Options() const { return options_; }

  // Returns the job id. A no-op while a job with the same id is retained.
  std::string EnqueueJudging(const JudgingJobData&, std::optional<JobOptions> = std::nullopt);
  // false if the job already existed
  bool Add(const std::string& job_id, const JudgingJobData&, std::optional<JobOptions> = std::nullopt);

  // spawns the worker pool; call once
  void Start(JobProcessor processor);
  // stops accepting work and joins the workers after their active jobs finish
  void Close();

  std::optional<JobInfo> GetJob(const std::string& id);
  // re-queue a failed job with fresh attempts
  bool RetryJob(const std::string& id);
  // not allowed for active jobs
  bool RemoveJob(const std::string& id);

  QueueStats Stats();
  void Pause();
  void Resume();
  // drop waiting and delayed jobs
  size_t Drain();
  // remove finished jobs in `state` older than grace; limit 0 = no limit
  size_t Clean(std::chrono::milliseconds grace, size_t limit, JobState state);

  // for tests and shutdown: wait until nothing is waiting, delayed or active
  bool WaitUntilIdle(std::chrono::milliseconds timeout);
};

#endif  // INCLUDE_ARBITER_QUEUE_H_
