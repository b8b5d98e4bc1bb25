#ifndef INCLUDE_ARBITER_DOCKER_ENGINE_H_
#define INCLUDE_ARBITER_DOCKER_ENGINE_H_

#include <string>
#include <vector>

#include "sandbox.h"

// Drives the docker CLI; every call is a separate client process
class DockerCliEngine : public ContainerEngine {
  std::string docker_;

 public:
  explicit DockerCliEngine(std::string docker = "docker") : docker_(std::move(docker)) {}

  bool Available() override;
  bool ImageExists(const std::string& image) override;
  void PullImage(const std::string& image, int timeout_seconds) override;
  std::string Create(const SandboxConfig&, const std::filesystem::path& artifact_path) override;
  void Start(const std::string& id) override;
  ExecutionResult Exec(const std::string& id, const ExecutionCommand&, int timeout_seconds) override;
  std::optional<bool> OOMKilled(const std::string& id) override;
  std::optional<ContainerStats> Stats(const std::string& id) override;
  bool Remove(const std::string& id) override;
  bool CopyIn(const std::string& id, const std::filesystem::path& host,
              const std::string& container_path) override;
  bool CopyOut(const std::string& id, const std::string& container_path,
               const std::filesystem::path& host) override;
};

// argument vectors, exposed for testing
std::vector<std::string> DockerCreateArgs(
    const std::string& docker, const SandboxConfig&, const std::filesystem::path& artifact_path);
std::vector<std::string> DockerExecArgs(
    const std::string& docker, const std::string& id, const ExecutionCommand&);
// file transfer through cat inside the container
std::vector<std::string> DockerCopyInArgs(
    const std::string& docker, const std::string& id, const std::string& container_path);
std::vector<std::string> DockerCopyOutArgs(
    const std::string& docker, const std::string& id, const std::string& container_path);
// command line given to sh -c inside the container
std::string ShellCommandLine(const ExecutionCommand&);

#endif  // INCLUDE_ARBITER_DOCKER_ENGINE_H_
