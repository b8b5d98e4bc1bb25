#include <arbiter/sandbox.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <arbiter/errors.h>
#include <arbiter/docker_engine.h>
#include "utils.h"

const char kArtifactMountPath[] = "/artifact";
const char kWorkspacePath[] = "/workspace";
const char kDefaultJudgeImage[] = "node:20-alpine";

void SandboxRuntime::EnsureImage(const std::string& image) {
  if (engine_.ImageExists(image)) return;
  engine_.PullImage(image, kImagePullTimeout);
}

SandboxSession SandboxRuntime::Create(const fs::path& artifact_path, const SandboxConfig& config) {
  EnsureImage(config.image);
  SandboxSession session;
  session.id = engine_.Create(config, artifact_path);
  try {
    engine_.Start(session.id);
  } catch (const SandboxError&) {
    IGNORE_RETURN(engine_.Remove(session.id));
    throw;
  }
  session.config = config;
  session.artifact_path = artifact_path;
  session.artifact_mount_path = kArtifactMountPath;
  session.started_at = UnixMillis();
  {
    std::lock_guard lck(mtx_);
    live_sessions_.insert(session.id);
  }
  spdlog::info("Sandbox {} created: image={} cpus={} memory={} network={}",
               session.id.substr(0, 12), config.image, config.cpu_limit, config.memory_limit,
               config.network_enabled);
  return session;
}

ExecutionResult SandboxRuntime::Execute(const SandboxSession& session, const ExecutionCommand& cmd) {
  int timeout = cmd.timeout_seconds > 0 ? cmd.timeout_seconds : session.config.timeout_seconds;
  std::string short_id = session.id.substr(0, 12);
  spdlog::info("[sandbox {}] $ {}", short_id, ShellCommandLine(cmd));
  ExecutionResult res = engine_.Exec(session.id, cmd, timeout);
  if (res.timed_out) {
    res.exit_code = kTimeoutExitCode;
  } else if (res.exit_code == kKilledExitCode) {
    // a flag that cannot be read counts as not OOM-killed
    res.oom_killed = engine_.OOMKilled(session.id).value_or(false);
  }
  spdlog::info("[sandbox {}] exit={} duration={}ms{}{}", short_id, res.exit_code, res.duration_ms,
               res.timed_out ? " timed out" : "", res.oom_killed ? " OOM killed" : "");
  return res;
}

void SandboxRuntime::Destroy(const SandboxSession& session) {
  {
    std::lock_guard lck(mtx_);
    if (!live_sessions_.count(session.id)) {
      spdlog::warn("Sandbox {} destroyed twice or never created", session.id);
      return;
    }
  }
  // a container that could not be removed stays live until a later Destroy succeeds
  if (!engine_.Remove(session.id)) {
    spdlog::error("Failed to remove sandbox {}; it is still counted as live", session.id);
    return;
  }
  {
    std::lock_guard lck(mtx_);
    live_sessions_.erase(session.id);
  }
  spdlog::info("Sandbox {} destroyed", session.id.substr(0, 12));
}

bool SandboxRuntime::CopyIn(const SandboxSession& session, const fs::path& host, const std::string& container_path) {
  return engine_.CopyIn(session.id, host, container_path);
}

bool SandboxRuntime::CopyOut(const SandboxSession& session, const std::string& container_path, const fs::path& host) {
  return engine_.CopyOut(session.id, container_path, host);
}

std::optional<ContainerStats> SandboxRuntime::Stats(const SandboxSession& session) {
  return engine_.Stats(session.id);
}

bool SandboxRuntime::HealthCheck(const std::string& image) {
  if (!engine_.Available()) return false;
  try {
    EnsureImage(image);
  } catch (const SandboxError& err) {
    spdlog::warn("Sandbox health check failed: {}", err.what());
    return false;
  }
  return true;
}

size_t SandboxRuntime::LiveSessions() const {
  std::lock_guard lck(mtx_);
  return live_sessions_.size();
}
