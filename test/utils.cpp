#include "utils.h"

#include <fstream>
#include <arbiter/paths.h>
#include <arbiter/errors.h>
#include <arbiter/docker_engine.h>

void FakeEngine::On(const std::string& match, int exit_code, const std::string& output,
                    const std::string& error) {
  ExecutionResult res;
  res.exit_code = exit_code;
  res.output = output;
  res.error = error;
  rules.push_back({match, res});
}

void FakeEngine::OnTimeout(const std::string& match) {
  ExecutionResult res;
  res.exit_code = kKilledExitCode;
  res.timed_out = true;
  rules.push_back({match, res});
}

void FakeEngine::PullImage(const std::string& image, int) {
  std::lock_guard lck(mtx_);
  if (!available) throw SandboxError("Failed to pull " + image);
  pulls++;
  image_present = true;
}

std::string FakeEngine::Create(const SandboxConfig& config, const fs::path&) {
  std::lock_guard lck(mtx_);
  if (fail_create) throw SandboxError("create failed");
  std::string id = "fake" + std::to_string(next_id_++) + "0123456789abcdef";
  configs.push_back(config);
  images_[id] = config.image;
  live.insert(id);
  return id;
}

void FakeEngine::Start(const std::string&) {
  if (fail_start) throw SandboxError("start failed");
}

ExecutionResult FakeEngine::Exec(const std::string& id, const ExecutionCommand& cmd, int timeout_seconds) {
  std::string line = ShellCommandLine(cmd);
  std::lock_guard lck(mtx_);
  commands.push_back(line);
  timeouts.push_back(timeout_seconds);
  if (broken_images.count(images_[id])) {
    ExecutionResult res;
    res.exit_code = 1;
    res.error = "container is broken";
    return res;
  }
  for (auto& rule : rules) {
    if (line.find(rule.match) != std::string::npos) return rule.result;
  }
  return {};
}

bool FakeEngine::Remove(const std::string& id) {
  std::lock_guard lck(mtx_);
  removals++;
  if (fail_remove) return false;
  return live.erase(id);
}

bool FakeEngine::CopyOut(const std::string&, const std::string& container_path, const fs::path& host) {
  std::lock_guard lck(mtx_);
  auto it = files.find(container_path);
  if (it == files.end()) return false;
  std::ofstream fout(host);
  fout << it->second;
  return true;
}

std::optional<std::string> MemoryArtifactStore::Download(const std::string& key) {
  std::lock_guard lck(mtx_);
  if (fail_download) throw StorageError("connection refused");
  auto it = objects.find(key);
  if (it == objects.end()) return std::nullopt;
  return it->second;
}

void MemoryArtifactStore::Upload(const std::string& key, const std::string& data,
                                 const std::string& content_type) {
  std::lock_guard lck(mtx_);
  objects[key] = data;
  content_types[key] = content_type;
}

std::optional<SubmissionInfo> FakeRubricSource::GetSubmission(const std::string& id) {
  auto it = submissions.find(id);
  if (it == submissions.end()) return std::nullopt;
  return it->second;
}

std::optional<ChallengeInfo> FakeRubricSource::GetMatchChallenge(const std::string& match_id) {
  auto it = challenges.find(match_id);
  if (it == challenges.end()) return std::nullopt;
  return it->second;
}

void RecordingLedger::ConsumeHold(const std::string& job_id) {
  std::lock_guard lck(mtx_);
  calls.emplace_back("consume", job_id);
  if (fail) throw StorageError("ledger unavailable");
}

void RecordingLedger::ReleaseHold(const std::string& job_id) {
  std::lock_guard lck(mtx_);
  calls.emplace_back("release", job_id);
  if (fail) throw StorageError("ledger unavailable");
}

size_t RecordingLedger::Count() {
  std::lock_guard lck(mtx_);
  return calls.size();
}

fs::path TestDatabasePath(const std::string& name) {
  fs::path path = DataDir() / ("test-" + name + ".sqlite");
  fs::remove(path);
  return path;
}

void DatabaseTest::SetUp() {
  auto info = ::testing::UnitTest::GetInstance()->current_test_info();
  path_ = TestDatabasePath(std::string(info->test_suite_name()) + "-" + info->name());
  db_.emplace(path_);
}

void DatabaseTest::TearDown() {
  db_.reset();
  fs::remove(path_);
}
