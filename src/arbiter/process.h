#ifndef PROCESS_H_
#define PROCESS_H_

#include <string>
#include <vector>

// per stream
constexpr size_t kMaxCapture = 1 << 20;

struct ProcessResult {
  int exit_code = -1; // 128 + signal if killed by a signal; -1 if it could not be started
  std::string output, error;
  long duration_ms = 0;
  bool timed_out = false;
  bool truncated = false;
};

// Runs argv (argv[0] is searched in PATH) in a new process group.
// The whole group is killed with SIGKILL once timeout_ms expires (0 = no timeout);
// output collected until then is kept.
// The caller must ignore SIGPIPE if input is not empty.
ProcessResult RunProcess(const std::vector<std::string>& argv, long timeout_ms = 0,
                         const std::string& input = "", size_t max_capture = kMaxCapture);

#endif  // PROCESS_H_
