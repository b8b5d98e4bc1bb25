#ifndef INCLUDE_ARBITER_PLATFORM_H_
#define INCLUDE_ARBITER_PLATFORM_H_

#include <mutex>
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_set>

#include <nlohmann/json.hpp>

// Collaborators owned by the rest of the platform

struct SubmissionInfo {
  std::string id;
  std::string match_id;
  std::string user_id;
  std::string artifact_key;
  int64_t submitted_at = 0; // UNIX timestamp, milliseconds
};

struct ChallengeInfo {
  std::string challenge_id;
  int version_number = 0;
  nlohmann::json rubric;
  std::string judge_image; // empty for the default image
};

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;
  // nullopt if the key does not exist; throws StorageError on transport failures
  virtual std::optional<std::string> Download(const std::string& key) = 0;
  virtual void Upload(const std::string& key, const std::string& data, const std::string& content_type) = 0;
};

class RubricSource {
 public:
  virtual ~RubricSource() = default;
  // nullopt if not found; throws StorageError on transport failures
  virtual std::optional<SubmissionInfo> GetSubmission(const std::string& submission_id) = 0;
  virtual std::optional<ChallengeInfo> GetMatchChallenge(const std::string& match_id) = 0;
};

class CreditLedger {
 public:
  virtual ~CreditLedger() = default;
  virtual void ConsumeHold(const std::string& job_id) = 0;
  virtual void ReleaseHold(const std::string& job_id) = 0;
};

// Makes sure exactly one of consume/release reaches the ledger per job
class CreditSettler {
  CreditLedger& ledger_;
  std::mutex mtx_;
  std::unordered_set<std::string> settled_;

 public:
  explicit CreditSettler(CreditLedger& ledger) : ledger_(ledger) {}
  // false if the job was already settled or the ledger call failed
  bool Settle(const std::string& job_id, bool success);
  bool Settled(const std::string& job_id);
  // the job left the queue; a later job with the same id settles again
  void Forget(const std::string& job_id);
  size_t Tracked();
};

#endif  // INCLUDE_ARBITER_PLATFORM_H_
