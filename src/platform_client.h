#ifndef PLATFORM_CLIENT_H_
#define PLATFORM_CLIENT_H_

#include <string>
#include <arbiter/platform.h>

// HTTP clients of the platform's internal API

extern std::string kPlatformUrl;
extern std::string kPlatformKey;

class HttpArtifactStore : public ArtifactStore {
 public:
  // zstd-encoded responses are decompressed while streaming
  std::optional<std::string> Download(const std::string& key) override;
  void Upload(const std::string& key, const std::string& data, const std::string& content_type) override;
};

class HttpRubricSource : public RubricSource {
 public:
  std::optional<SubmissionInfo> GetSubmission(const std::string& submission_id) override;
  std::optional<ChallengeInfo> GetMatchChallenge(const std::string& match_id) override;
};

class HttpCreditLedger : public CreditLedger {
 public:
  void ConsumeHold(const std::string& job_id) override;
  void ReleaseHold(const std::string& job_id) override;
};

#endif  // PLATFORM_CLIENT_H_
