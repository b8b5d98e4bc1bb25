#include <arbiter/docker_engine.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <arbiter/errors.h>
#include "process.h"
#include "utils.h"

namespace {

// timeouts of engine bookkeeping calls, ms
constexpr long kControlTimeout = 60'000;
constexpr long kKillTimeout = 10'000;
constexpr size_t kMaxCopySize = 64 << 20;

std::string Trim(const std::string& str) {
  size_t begin = str.find_first_not_of(" \n\r\t");
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(" \n\r\t") + 1 - begin);
}

double ParsePercent(const std::string& str) {
  try {
    return std::stod(str);
  } catch (const std::logic_error&) {
    return 0;
  }
}

} // namespace

std::vector<std::string> DockerCreateArgs(
    const std::string& docker, const SandboxConfig& config, const fs::path& artifact_path) {
  std::vector<std::string> args = {
    docker, "create",
    "--label", "arbiter.sandbox=1",
    "--cpus", fmt::format("{:g}", config.cpu_limit),
    "--memory", config.memory_limit,
    "--memory-swap", config.memory_limit, // no swap
    "--pids-limit", std::to_string(config.pids_limit),
    "--security-opt", "no-new-privileges:true",
    "--cap-drop", "ALL",
    "--read-only",
    "--tmpfs", fmt::format("{}:rw,nosuid,size={}", kWorkspacePath, config.workspace_size),
    "--tmpfs", fmt::format("/tmp:rw,noexec,nosuid,size={}", config.tmp_size),
    "-v", fmt::format("{}:{}:ro", artifact_path.string(), kArtifactMountPath),
    "-w", kWorkspacePath,
  };
  if (!config.network_enabled) {
    args.insert(args.end(), {"--network", "none"});
  }
  args.insert(args.end(), {
    "-e", fmt::format("ARTIFACT_PATH={}", kArtifactMountPath),
    "-e", fmt::format("WORKSPACE={}", kWorkspacePath),
    config.image,
    "sleep", "infinity",
  });
  return args;
}

std::string ShellCommandLine(const ExecutionCommand& cmd) {
  std::string line = cmd.command;
  for (auto& arg : cmd.args) line += ' ' + ShellQuote(arg);
  return line;
}

std::vector<std::string> DockerExecArgs(
    const std::string& docker, const std::string& id, const ExecutionCommand& cmd) {
  std::vector<std::string> args = {docker, "exec", "-i"};
  if (!cmd.cwd.empty()) {
    args.insert(args.end(), {"-w", (fs::path(kWorkspacePath) / cmd.cwd).lexically_normal().string()});
  }
  args.insert(args.end(), {id, "sh", "-c", ShellCommandLine(cmd)});
  return args;
}

std::vector<std::string> DockerCopyInArgs(
    const std::string& docker, const std::string& id, const std::string& container_path) {
  return {docker, "exec", "-i", id, "sh", "-c", "cat > " + ShellQuote(container_path)};
}

std::vector<std::string> DockerCopyOutArgs(
    const std::string& docker, const std::string& id, const std::string& container_path) {
  return {docker, "exec", id, "cat", "--", container_path};
}

bool DockerCliEngine::Available() {
  auto res = RunProcess({docker_, "info", "--format", "{{.ServerVersion}}"}, kControlTimeout);
  if (res.exit_code != 0) {
    spdlog::warn("Docker is not available: {}", Trim(res.error));
    return false;
  }
  spdlog::debug("Docker server version {}", Trim(res.output));
  return true;
}

bool DockerCliEngine::ImageExists(const std::string& image) {
  auto res = RunProcess({docker_, "image", "inspect", image, "--format", "{{.Id}}"}, kControlTimeout);
  return res.exit_code == 0;
}

void DockerCliEngine::PullImage(const std::string& image, int timeout_seconds) {
  spdlog::info("Pulling image {}", image);
  auto res = RunProcess({docker_, "pull", image}, timeout_seconds * 1000L);
  if (res.timed_out) {
    throw SandboxError(fmt::format("Timed out pulling image {}", image));
  }
  if (res.exit_code != 0) {
    throw SandboxError(fmt::format("Failed to pull image {}: {}", image, Trim(res.error)));
  }
}

std::string DockerCliEngine::Create(const SandboxConfig& config, const fs::path& artifact_path) {
  auto res = RunProcess(DockerCreateArgs(docker_, config, artifact_path), kControlTimeout);
  std::string id = Trim(res.output);
  if (res.exit_code != 0 || id.empty()) {
    throw SandboxError(fmt::format("Failed to create container: {}", Trim(res.error)));
  }
  return id;
}

void DockerCliEngine::Start(const std::string& id) {
  auto res = RunProcess({docker_, "start", id}, kControlTimeout);
  if (res.exit_code != 0) {
    throw SandboxError(fmt::format("Failed to start container {}: {}", id, Trim(res.error)));
  }
}

ExecutionResult DockerCliEngine::Exec(const std::string& id, const ExecutionCommand& cmd, int timeout_seconds) {
  auto res = RunProcess(DockerExecArgs(docker_, id, cmd), timeout_seconds * 1000L);
  ExecutionResult ret;
  ret.output = std::move(res.output);
  ret.error = std::move(res.error);
  ret.duration_ms = res.duration_ms;
  ret.timed_out = res.timed_out;
  ret.exit_code = res.exit_code;
  if (res.timed_out) {
    // killing the client does not stop the command inside the container;
    // kill everything except init (the container's sleep)
    auto kill_res = RunProcess({docker_, "exec", id, "kill", "-9", "-1"}, kKillTimeout);
    if (kill_res.exit_code != 0) {
      spdlog::warn("Failed to kill timed out processes in {}: {}", id, Trim(kill_res.error));
    }
  } else if (res.exit_code < 0) {
    ret.error = "failed to run docker: " + ret.error;
  }
  return ret;
}

std::optional<bool> DockerCliEngine::OOMKilled(const std::string& id) {
  auto res = RunProcess({docker_, "inspect", "--format", "{{.State.OOMKilled}}", id}, kControlTimeout);
  if (res.exit_code != 0) return std::nullopt;
  std::string flag = Trim(res.output);
  if (flag == "true") return true;
  if (flag == "false") return false;
  return std::nullopt;
}

std::optional<ContainerStats> DockerCliEngine::Stats(const std::string& id) {
  auto res = RunProcess({docker_, "stats", "--no-stream", "--format", "{{json .}}", id}, kControlTimeout);
  if (res.exit_code != 0) return std::nullopt;
  try {
    auto data = nlohmann::json::parse(res.output);
    ContainerStats stats;
    stats.cpu_percent = ParsePercent(data.value("CPUPerc", ""));
    stats.memory_percent = ParsePercent(data.value("MemPerc", ""));
    stats.memory_usage = data.value("MemUsage", "");
    stats.pids = std::stoi(data.value("PIDs", "0"));
    return stats;
  } catch (const nlohmann::json::exception& err) {
    spdlog::warn("Unexpected docker stats output: {}", err.what());
  } catch (const std::logic_error&) {
    spdlog::warn("Unexpected docker stats output: {}", Trim(res.output));
  }
  return std::nullopt;
}

bool DockerCliEngine::Remove(const std::string& id) {
  auto res = RunProcess({docker_, "rm", "-f", id}, kControlTimeout);
  if (res.exit_code != 0 && res.error.find("No such container") != std::string::npos) {
    spdlog::info("Container {} is already gone", id);
    return true;
  }
  if (res.exit_code != 0) {
    spdlog::warn("Failed to remove container {}: {}", id, Trim(res.error));
    return false;
  }
  return true;
}

// docker cp cannot reach tmpfs mounts such as the workspace, so files are
// streamed through cat inside the container
bool DockerCliEngine::CopyIn(const std::string& id, const fs::path& host, const std::string& container_path) {
  std::string content;
  if (!fs::is_regular_file(host) || !ReadFile(host, content)) {
    spdlog::warn("Cannot copy {} into {}: not a readable file", host.c_str(), id);
    return false;
  }
  auto res = RunProcess(DockerCopyInArgs(docker_, id, container_path), kControlTimeout, content);
  if (res.exit_code != 0) {
    spdlog::warn("Failed copying {} into {}: {}", host.c_str(), id, Trim(res.error));
    return false;
  }
  return true;
}

bool DockerCliEngine::CopyOut(const std::string& id, const std::string& container_path, const fs::path& host) {
  auto res = RunProcess(DockerCopyOutArgs(docker_, id, container_path), kControlTimeout, "", kMaxCopySize);
  if (res.exit_code != 0) {
    spdlog::debug("Failed copying {} out of {}: {}", container_path, id, Trim(res.error));
    return false;
  }
  if (res.truncated) {
    spdlog::warn("{} in {} exceeds {} bytes", container_path, id, kMaxCopySize);
    return false;
  }
  return WriteFile(host, res.output);
}
