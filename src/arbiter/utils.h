#ifndef UTILS_H_
#define UTILS_H_

#include <string>
#include <filesystem>

#include <arbiter/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// close every fd >= minfd; only async-signal-safe calls in the fallback
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool WriteFile(const fs::path&, const std::string&);
bool ReadFile(const fs::path&, std::string&);

std::string Truncate(const std::string&, size_t max_size);
std::string ShellQuote(const std::string&);
std::string Lowercase(std::string);

#endif  // UTILS_H_
