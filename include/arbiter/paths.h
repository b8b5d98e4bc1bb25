#ifndef INCLUDE_ARBITER_PATHS_H_
#define INCLUDE_ARBITER_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// scratch directories for downloaded artifacts
extern fs::path kTempRoot;

namespace internal {

// does not meant to be publicly used; only for testing and configuration
extern fs::path kDataDir;

} // internal

fs::path DataDir();
fs::path DatabasePath();
fs::path LockFilePath();

// object store keys
std::string JudgingLogsKey(const std::string& match_id, long run_id);

#endif  // INCLUDE_ARBITER_PATHS_H_
