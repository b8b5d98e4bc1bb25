#include <arbiter/paths.h>

#include <fmt/core.h>

fs::path kTempRoot = "/tmp";

namespace internal {
fs::path kDataDir = fs::path(ARBITER_DATA_DIR);
} // internal

fs::path DataDir() {
  return internal::kDataDir;
}

fs::path DatabasePath() {
  return DataDir() / "arbiter.sqlite";
}

fs::path LockFilePath() {
  return DataDir() / "lock";
}

std::string JudgingLogsKey(const std::string& match_id, long run_id) {
  return fmt::format("logs/{}/{}.txt", match_id, run_id);
}
