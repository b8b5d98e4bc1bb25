#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <set>
#include <mutex>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <filesystem>

#include <gtest/gtest.h>
#include <arbiter/sandbox.h>
#include <arbiter/platform.h>
#include <arbiter/database.h>

namespace fs = std::filesystem;

// Container engine answering commands from a script instead of running them
class FakeEngine : public ContainerEngine {
  std::mutex mtx_;
  int next_id_ = 0;
  std::map<std::string, std::string> images_; // container id -> image

 public:
  struct Rule {
    std::string match; // substring of the shell command line
    ExecutionResult result;
  };
  std::vector<Rule> rules; // first match wins; unmatched commands succeed silently
  std::map<std::string, std::string> files; // container path -> content for CopyOut

  bool available = true;
  bool image_present = true;
  bool fail_create = false;
  bool fail_start = false;
  bool fail_remove = false;
  std::optional<bool> oom_flag;
  std::set<std::string> broken_images; // every command in their containers exits 1

  std::vector<std::string> commands; // command lines in execution order
  std::vector<int> timeouts; // per command
  std::vector<SandboxConfig> configs;
  std::set<std::string> live;
  int pulls = 0, removals = 0;

  void On(const std::string& match, int exit_code, const std::string& output = "",
          const std::string& error = "");
  void OnTimeout(const std::string& match);

  bool Available() override { return available; }
  bool ImageExists(const std::string&) override { return image_present; }
  void PullImage(const std::string& image, int timeout_seconds) override;
  std::string Create(const SandboxConfig&, const fs::path& artifact_path) override;
  void Start(const std::string& id) override;
  ExecutionResult Exec(const std::string& id, const ExecutionCommand&, int timeout_seconds) override;
  std::optional<bool> OOMKilled(const std::string&) override { return oom_flag; }
  std::optional<ContainerStats> Stats(const std::string&) override { return std::nullopt; }
  bool Remove(const std::string& id) override;
  bool CopyIn(const std::string&, const fs::path&, const std::string&) override { return true; }
  bool CopyOut(const std::string& id, const std::string& container_path, const fs::path& host) override;
};

class MemoryArtifactStore : public ArtifactStore {
  std::mutex mtx_;
 public:
  std::map<std::string, std::string> objects;
  std::map<std::string, std::string> content_types;
  bool fail_download = false;

  std::optional<std::string> Download(const std::string& key) override;
  void Upload(const std::string& key, const std::string& data, const std::string& content_type) override;
};

class FakeRubricSource : public RubricSource {
 public:
  std::map<std::string, SubmissionInfo> submissions;
  std::map<std::string, ChallengeInfo> challenges; // by match id

  std::optional<SubmissionInfo> GetSubmission(const std::string& id) override;
  std::optional<ChallengeInfo> GetMatchChallenge(const std::string& match_id) override;
};

class RecordingLedger : public CreditLedger {
  std::mutex mtx_;
 public:
  std::vector<std::pair<std::string, std::string>> calls; // (action, job id)
  bool fail = false;

  void ConsumeHold(const std::string& job_id) override;
  void ReleaseHold(const std::string& job_id) override;
  size_t Count();
};

// fresh database file under the test data directory
fs::path TestDatabasePath(const std::string& name);

class DatabaseTest : public ::testing::Test {
 protected:
  fs::path path_;
  std::optional<Database> db_;

  void SetUp() override;
  void TearDown() override;
};

#endif // TEST_UTILS_H_
