#include "server_io.h"

#include <map>
#include <deque>
#include <mutex>
#include <chrono>
#include <thread>
#include <optional>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <arbiter/utils.h>
#include <arbiter/errors.h>
#include "websocket.h"
#include "platform_client.h"

namespace {

QueueManager* queue_manager = nullptr;
Judge* judge_service = nullptr;

constexpr double kCoalesceInterval = 0.5;
constexpr double kPingTimeout = 8;
constexpr auto kStatsInterval = std::chrono::seconds(10);

struct Outgoing {
  std::string action;
  nlohmann::json body;
  // messages sharing a key are coalesced: only the newest is sent,
  // at most once per kCoalesceInterval
  std::string coalesce_key;
  // terminal message of a key; drops its pending coalesced message
  bool closes_key = false;
};

// Outgoing messages waiting for the channel. Messages written since the
// last frame from the platform are kept and resent after a reconnect.
class Outbox {
  struct Coalesced {
    Outgoing msg;
    double due;
  };

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Outgoing> ready_;
  std::map<std::string, Coalesced> coalesced_;
  std::map<std::string, double> last_sent_;
  std::deque<Outgoing> unconfirmed_;

  void PromoteDue_() {
    double now = MonotonicSeconds();
    for (auto it = coalesced_.begin(); it != coalesced_.end();) {
      if (it->second.due > now) {
        ++it;
        continue;
      }
      last_sent_[it->first] = now;
      ready_.push_back(std::move(it->second.msg));
      it = coalesced_.erase(it);
    }
  }

 public:
  void Push(Outgoing&& msg) {
    {
      std::lock_guard lck(mtx_);
      if (msg.coalesce_key.empty()) {
        ready_.push_back(std::move(msg));
      } else if (msg.closes_key) {
        coalesced_.erase(msg.coalesce_key);
        last_sent_.erase(msg.coalesce_key);
        ready_.push_back(std::move(msg));
      } else if (auto it = coalesced_.find(msg.coalesce_key); it != coalesced_.end()) {
        it->second.msg = std::move(msg);
      } else {
        auto sent = last_sent_.find(msg.coalesce_key);
        double due = sent == last_sent_.end() ? 0.0 : sent->second + kCoalesceInterval;
        std::string key = msg.coalesce_key;
        coalesced_.emplace(std::move(key), Coalesced{std::move(msg), due});
      }
    }
    cv_.notify_one();
  }

  // next message to write, or nullopt after waiting briefly
  std::optional<Outgoing> Pop(bool can_send) {
    std::unique_lock lck(mtx_);
    auto wait = std::chrono::duration<double>(kCoalesceInterval / 2);
    cv_.wait_for(lck, wait, [&]() {
      if (!can_send) return false;
      PromoteDue_();
      return !ready_.empty();
    });
    if (!can_send || ready_.empty()) return std::nullopt;
    Outgoing msg = std::move(ready_.front());
    ready_.pop_front();
    return msg;
  }

  void Written(Outgoing&& msg) {
    std::lock_guard lck(mtx_);
    unconfirmed_.push_back(std::move(msg));
  }

  void Confirmed() {
    std::lock_guard lck(mtx_);
    unconfirmed_.clear();
  }

  void Requeue() {
    std::lock_guard lck(mtx_);
    while (unconfirmed_.size()) {
      ready_.push_front(std::move(unconfirmed_.back()));
      unconfirmed_.pop_back();
    }
  }
};

Outbox outbox;

/// --- incoming commands ---
void EnqueueCommand(nlohmann::json&& cmd) {
  std::string match_id, submission_id;
  std::optional<JobOptions> options;
  try {
    match_id = cmd.at("match_id").get<std::string>();
    submission_id = cmd.at("submission_id").get<std::string>();
    if (cmd.contains("priority") || cmd.contains("delay_ms")) {
      options = queue_manager->Options().default_job;
      options->priority = cmd.value("priority", options->priority);
      options->delay_ms = cmd.value("delay_ms", options->delay_ms);
    }
  } catch (const nlohmann::json::exception& err) {
    spdlog::warn("Malformed judge command: {}", err.what());
    return;
  }
  try {
    judge_service->EnqueueJudging(*queue_manager, match_id, submission_id, options);
  } catch (const JudgeError& err) {
    spdlog::warn("Failed to enqueue submission {}: {}", submission_id, err.what());
    JobInfo info;
    info.id = JudgingJobId(submission_id);
    info.data = {match_id, submission_id, ""};
    info.state = JobState::FAILED;
    SendJobFailed(info, err.what());
  }
}

void StatusCommand(std::string match_id) {
  try {
    SendJudgingStatus(match_id, judge_service->GetJudgingStatus(match_id));
  } catch (const StorageError& err) {
    spdlog::warn("Failed to read judging status of {}: {}", match_id, err.what());
  }
}

class JudgeChannel : public ChannelClient {
 public:
  JudgeChannel() : ChannelClient(kPlatformUrl, kPlatformKey) {}

  void OnFrame() override { outbox.Confirmed(); }
  void OnSubscribed() override {
    spdlog::info("Subscribed to judge channel at {}", Url());
  }
  void OnDisconnected() override {
    spdlog::warn("Judge channel lost, reconnect in {} seconds. "
                 "If this keeps happening, check the platform key", kReconnectSeconds);
    outbox.Requeue();
    ScheduleReconnect();
  }

  // enqueue and status lookups hit the platform and the database,
  // so they leave the io thread
  void OnCommand(nlohmann::json&& cmd) override {
    std::string type = cmd.value("type", "");
    if (type == "judge") {
      std::thread(EnqueueCommand, std::move(cmd)).detach();
    } else if (type == "status") {
      std::thread(StatusCommand, cmd.value("match_id", "")).detach();
    } else if (type == "retry") {
      std::string id = cmd.value("job_id", "");
      if (!queue_manager->RetryJob(id)) spdlog::warn("Job {} cannot be retried", id);
    } else if (type == "remove") {
      std::string id = cmd.value("job_id", "");
      if (!queue_manager->RemoveJob(id)) spdlog::warn("Job {} cannot be removed", id);
    } else {
      spdlog::warn("Unknown command type {}", type);
    }
  }
};

void SendLoop() {
  JudgeChannel channel;
  if (!channel.Connect()) {
    spdlog::error("Invalid judge channel URL {}", channel.Url());
    return;
  }
  while (true) {
    if (channel.CanSend() && channel.Stale(kPingTimeout)) {
      spdlog::warn("No ping from platform in {} seconds, closing", kPingTimeout);
      channel.Close();
      continue;
    }
    auto msg = outbox.Pop(channel.CanSend());
    if (!msg) continue;
    if (!channel.Perform(msg->action, msg->body)) {
      outbox.Push(std::move(*msg));
      continue;
    }
    outbox.Written(std::move(*msg));
  }
}

nlohmann::json JobJSON(const JobInfo& info) {
  return {
    {"job_id", info.id},
    {"match_id", info.data.match_id},
    {"submission_id", info.data.submission_id},
    {"state", JobStateName(info.state)},
    {"attempts_made", info.attempts_made},
    {"progress", info.progress},
  };
}

} // namespace

void SendJobProgress(const JobInfo& info) {
  outbox.Push({.action = "job_progress", .body = JobJSON(info), .coalesce_key = info.id});
}

void SendJobCompleted(const JobInfo& info) {
  nlohmann::json body = JobJSON(info);
  body["result"] = info.return_value;
  outbox.Push({.action = "job_completed", .body = std::move(body),
               .coalesce_key = info.id, .closes_key = true});
}

void SendJobFailed(const JobInfo& info, const std::string& error) {
  nlohmann::json body = JobJSON(info);
  body["error"] = error;
  outbox.Push({.action = "job_failed", .body = std::move(body),
               .coalesce_key = info.id, .closes_key = true});
}

void SendJudgingStatus(const std::string& match_id, const JudgingStatusReport& report) {
  nlohmann::json body = StatusJSON(report);
  body["match_id"] = match_id;
  outbox.Push({.action = "judging_status", .body = std::move(body)});
}

void SendQueueStats(const QueueStats& stats) {
  nlohmann::json body{
    {"waiting", stats.waiting},
    {"active", stats.active},
    {"completed", stats.completed},
    {"failed", stats.failed},
    {"delayed", stats.delayed},
    {"paused", stats.paused},
  };
  outbox.Push({.action = "queue_stats", .body = std::move(body), .coalesce_key = "$queue_stats"});
}

void ServerWorkLoop(QueueManager& queue, Judge& judge) {
  // main thread: queue statistics
  // send thread: SendLoop, owns the channel
  // channel io thread: incoming frames
  queue_manager = &queue;
  judge_service = &judge;
  std::thread(SendLoop).detach();
  while (true) {
    std::this_thread::sleep_for(kStatsInterval);
    SendQueueStats(queue.Stats());
  }
}
