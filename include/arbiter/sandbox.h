#ifndef INCLUDE_ARBITER_SANDBOX_H_
#define INCLUDE_ARBITER_SANDBOX_H_

#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>
#include <unordered_set>

extern const char kArtifactMountPath[]; // "/artifact"
extern const char kWorkspacePath[]; // "/workspace"
extern const char kDefaultJudgeImage[];

constexpr int kTimeoutExitCode = 124;
constexpr int kKilledExitCode = 137; // 128 + SIGKILL
constexpr int kImagePullTimeout = 300; // seconds
// captured output kept in the persisted results
constexpr size_t kMaxPersistedOutput = 10000;

// All resource flags are applied at creation and cannot change afterwards
struct SandboxConfig {
  std::string image;
  double cpu_limit;
  std::string memory_limit; // docker notation; swap is set to the same value
  int timeout_seconds; // default per-command timeout
  bool network_enabled;
  std::string workspace_size;
  std::string tmp_size;
  int pids_limit;

  SandboxConfig() :
      image(kDefaultJudgeImage),
      cpu_limit(2.0),
      memory_limit("4g"),
      timeout_seconds(600),
      network_enabled(false),
      workspace_size("100m"),
      tmp_size("50m"),
      pids_limit(100) {}
};

struct ExecutionCommand {
  std::string command; // passed to sh -c; args are quoted
  std::vector<std::string> args;
  std::string cwd; // relative to the workspace; empty for the workspace itself
  int timeout_seconds = 0; // 0 = session default
};

struct ExecutionResult {
  int exit_code = 0;
  std::string output, error;
  long duration_ms = 0;
  bool timed_out = false;
  bool oom_killed = false;
};

struct ContainerStats {
  double cpu_percent = 0;
  double memory_percent = 0;
  std::string memory_usage;
  int pids = 0;
};

struct SandboxSession {
  std::string id;
  SandboxConfig config;
  std::filesystem::path artifact_path; // on the host
  std::string artifact_mount_path;
  int64_t started_at = 0; // UNIX timestamp, milliseconds
};

// Low-level container operations; the runtime adds the session semantics on top.
// Failing operations throw SandboxError unless noted.
class ContainerEngine {
 public:
  virtual ~ContainerEngine() = default;

  virtual bool Available() = 0;
  virtual bool ImageExists(const std::string& image) = 0;
  virtual void PullImage(const std::string& image, int timeout_seconds) = 0;
  // returns the context id
  virtual std::string Create(const SandboxConfig&, const std::filesystem::path& artifact_path) = 0;
  virtual void Start(const std::string& id) = 0;
  // must kill everything it started when the timeout expires; never throws
  virtual ExecutionResult Exec(const std::string& id, const ExecutionCommand&, int timeout_seconds) = 0;
  // nullopt if the engine cannot tell
  virtual std::optional<bool> OOMKilled(const std::string& id) = 0;
  virtual std::optional<ContainerStats> Stats(const std::string& id) = 0;
  // force removal; returns false on failure instead of throwing
  virtual bool Remove(const std::string& id) = 0;
  virtual bool CopyIn(const std::string& id, const std::filesystem::path& host,
                      const std::string& container_path) = 0;
  virtual bool CopyOut(const std::string& id, const std::string& container_path,
                       const std::filesystem::path& host) = 0;
};

class SandboxRuntime {
  ContainerEngine& engine_;
  mutable std::mutex mtx_;
  std::unordered_set<std::string> live_sessions_;

 public:
  explicit SandboxRuntime(ContainerEngine& engine) : engine_(engine) {}

  // pull the image if it is not present locally
  void EnsureImage(const std::string& image);

  SandboxSession Create(const std::filesystem::path& artifact_path, const SandboxConfig& = SandboxConfig());
  ExecutionResult Execute(const SandboxSession&, const ExecutionCommand&);
  // never throws; if the container cannot be removed the session stays live and Destroy may be retried
  void Destroy(const SandboxSession&);

  bool CopyIn(const SandboxSession&, const std::filesystem::path& host, const std::string& container_path);
  bool CopyOut(const SandboxSession&, const std::string& container_path, const std::filesystem::path& host);
  std::optional<ContainerStats> Stats(const SandboxSession&);

  bool HealthCheck(const std::string& image = kDefaultJudgeImage);
  size_t LiveSessions() const;
};

// Creates a session and destroys it when leaving the scope
class ScopedSandbox {
  SandboxRuntime& runtime_;
  SandboxSession session_;

 public:
  ScopedSandbox(SandboxRuntime& runtime, const std::filesystem::path& artifact_path,
                const SandboxConfig& config = SandboxConfig()) :
      runtime_(runtime), session_(runtime.Create(artifact_path, config)) {}
  ~ScopedSandbox() { runtime_.Destroy(session_); }
  ScopedSandbox(const ScopedSandbox&) = delete;
  ScopedSandbox& operator=(const ScopedSandbox&) = delete;

  const SandboxSession& Session() const { return session_; }
  ExecutionResult Execute(const ExecutionCommand& cmd) { return runtime_.Execute(session_, cmd); }
  bool CopyOut(const std::string& container_path, const std::filesystem::path& host) {
    return runtime_.CopyOut(session_, container_path, host);
  }
};

#endif  // INCLUDE_ARBITER_SANDBOX_H_
