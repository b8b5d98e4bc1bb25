#include "platform_client.h"

#include <vector>
#include <cstdint>

#include <zstd.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <arbiter/errors.h>
#include "http_utils.h"

std::string kPlatformUrl = "";
std::string kPlatformKey = "";

namespace {

using http_utils::EncodePath;

ApiClient Platform() {
  return ApiClient(kPlatformUrl, kPlatformKey);
}

// nullopt on 404
std::optional<nlohmann::json> GetJSON(const std::string& endpoint) {
  auto body = Platform().Get(endpoint);
  if (!body) return std::nullopt;
  try {
    return nlohmann::json::parse(*body);
  } catch (const nlohmann::json::exception& err) {
    throw StorageError(fmt::format("GET {} returned malformed JSON: {}", endpoint, err.what()));
  }
}

void PostHold(const std::string& job_id, const char* action) {
  Platform().Send(Verb::POST,
                  fmt::format("/internal/credits/holds/{}/{}", EncodePath(job_id, false), action),
                  "{}", "application/json");
}

} // namespace

std::optional<std::string> HttpArtifactStore::Download(const std::string& key) {
  std::string endpoint = "/internal/artifacts/" + EncodePath(key, true);
  std::string data;
  bool compressed = false, stream_error = false;
  std::vector<uint8_t> buf_out(ZSTD_DStreamOutSize());
  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx(ZSTD_createDCtx(), ZSTD_freeDCtx);

  auto reset = [&]() {
    data.clear();
    compressed = stream_error = false;
    ZSTD_DCtx_reset(dctx.get(), ZSTD_reset_session_only);
  };
  auto on_response = [&](const httplib::Response& res) {
    compressed = res.get_header_value("Content-Encoding") == "zstd";
    return true;
  };
  auto receiver = [&](const char* chunk, size_t chunk_length) {
    if (!compressed) {
      data.append(chunk, chunk_length);
      return true;
    }
    ZSTD_inBuffer input = {chunk, chunk_length, 0};
    while (input.pos < input.size) {
      ZSTD_outBuffer output = {buf_out.data(), buf_out.size(), 0};
      const size_t ret = ZSTD_decompressStream(dctx.get(), &output, &input);
      if (ZSTD_isError(ret)) {
        stream_error = true;
        return false;
      }
      data.append((char*)buf_out.data(), output.pos);
    }
    return true;
  };
  try {
    if (!Platform().Stream(endpoint, reset, on_response, receiver)) return std::nullopt;
  } catch (const StorageError&) {
    if (stream_error) throw StorageError(fmt::format("Corrupted zstd stream from {}", endpoint));
    throw;
  }
  spdlog::info("Downloaded artifact {} ({} bytes)", key, data.size());
  return data;
}

void HttpArtifactStore::Upload(const std::string& key, const std::string& data, const std::string& content_type) {
  Platform().Send(Verb::PUT, "/internal/artifacts/" + EncodePath(key, true), data, content_type);
}

std::optional<SubmissionInfo> HttpRubricSource::GetSubmission(const std::string& submission_id) {
  auto data = GetJSON("/internal/submissions/" + EncodePath(submission_id, false));
  if (!data) return std::nullopt;
  try {
    SubmissionInfo info;
    info.id = data->value("id", submission_id);
    info.match_id = data->at("matchId").get<std::string>();
    info.user_id = data->at("userId").get<std::string>();
    info.artifact_key = data->at("artifactKey").get<std::string>();
    info.submitted_at = data->value("submittedAt", (int64_t)0);
    return info;
  } catch (const nlohmann::json::exception& err) {
    throw InvalidInputError(fmt::format("Malformed submission {}: {}", submission_id, err.what()));
  }
}

std::optional<ChallengeInfo> HttpRubricSource::GetMatchChallenge(const std::string& match_id) {
  auto data = GetJSON(fmt::format("/internal/matches/{}/challenge", EncodePath(match_id, false)));
  if (!data) return std::nullopt;
  try {
    ChallengeInfo info;
    info.challenge_id = data->at("challengeId").get<std::string>();
    info.version_number = data->value("versionNumber", 0);
    info.rubric = data->at("rubric");
    if (info.rubric.is_string()) info.rubric = nlohmann::json::parse(info.rubric.get<std::string>());
    if (auto it = data->find("judgeImageRef"); it != data->end() && it->is_string()) {
      info.judge_image = it->get<std::string>();
    }
    return info;
  } catch (const nlohmann::json::exception& err) {
    throw InvalidInputError(fmt::format("Malformed challenge of match {}: {}", match_id, err.what()));
  }
}

void HttpCreditLedger::ConsumeHold(const std::string& job_id) {
  PostHold(job_id, "consume");
}

void HttpCreditLedger::ReleaseHold(const std::string& job_id) {
  PostHold(job_id, "release");
}
