#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <chrono>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

int64_t UnixMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(RunStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RunStatusName, RunStatus, ENUM_RUN_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(JudgingStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JudgingStatusName, JudgingStatus, ENUM_JUDGING_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(JobState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JobStateName, JobState, ENUM_JOB_STATE_)
#undef X

#define X(...) X_RETURN_ARG2(TestStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TestStatusName, TestStatus, ENUM_TEST_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(LintSeverity, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LintSeverityName, LintSeverity, ENUM_LINT_SEVERITY_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

static const char* kRunStatusTable[] = {
#define X(name, str) str,
  ENUM_RUN_STATUS_
#undef X
};

RunStatus GetRunStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kRunStatusTable) / sizeof(kRunStatusTable[0]); i++) {
    if (str == kRunStatusTable[i]) return (RunStatus)i;
  }
  spdlog::warn("Unknown run status {}", str);
  return RunStatus::FAILED;
}

static const char* kRequirementTypeTable[] = {
#define X(name, str) str,
  ENUM_REQUIREMENT_TYPE_
#undef X
};

static const char* kTieBreakerTable[] = {
#define X(name, str) str,
  ENUM_TIE_BREAKER_
#undef X
};

static const char* kReportFormatTable[] = {
#define X(name, str) str,
  ENUM_REPORT_FORMAT_
#undef X
};

const char* RequirementTypeName(RequirementType type) {
  return kRequirementTypeTable[(int)type];
}

const char* TieBreakerName(TieBreaker tie_breaker) {
  return kTieBreakerTable[(int)tie_breaker];
}

const char* ReportFormatName(ReportFormat format) {
  return kReportFormatTable[(int)format];
}

namespace {

template <class T, size_t N>
bool LookupTable(const char* (&table)[N], const std::string& str, T& ret) {
  for (size_t i = 0; i < N; i++) {
    if (str == table[i]) {
      ret = (T)i;
      return true;
    }
  }
  return false;
}

} // namespace

bool GetRequirementType(const std::string& str, RequirementType& type) {
  return LookupTable(kRequirementTypeTable, str, type);
}

bool GetTieBreaker(const std::string& str, TieBreaker& tie_breaker) {
  return LookupTable(kTieBreakerTable, str, tie_breaker);
}

bool GetReportFormat(const std::string& str, ReportFormat& format) {
  return LookupTable(kReportFormatTable, str, format);
}

const char* WinnerName(Winner winner) {
  switch (winner) {
    case Winner::A: return "A";
    case Winner::B: return "B";
    case Winner::TIE: return "tie";
  }
  __builtin_unreachable();
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& data) {
  std::ofstream fout(path, std::ios::binary);
  if (fout) fout.write(data.data(), data.size());
  if (!fout) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& data) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::debug("Failed opening {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  data.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

std::string Truncate(const std::string& str, size_t max_size) {
  if (str.size() <= max_size) return str;
  return str.substr(0, max_size);
}

std::string ShellQuote(const std::string& str) {
  if (!str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return c && (isalnum(c) || strchr("@%+=:,./-_", c));
      })) {
    return str;
  }
  std::string ret = "'";
  for (char c : str) {
    if (c == '\'') {
      ret += "'\\''";
    } else {
      ret += c;
    }
  }
  return ret + '\'';
}

std::string Lowercase(std::string str) {
  for (auto& c : str) c = tolower((unsigned char)c);
  return str;
}
