#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <algorithm>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

// after killing a timed-out group, keep reading for at most this long
constexpr long kDrainAfterKill = 1000;

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, long timeout_ms,
                         const std::string& input, size_t max_capture) {
  using Clock = std::chrono::steady_clock;
  ProcessResult ret;
  if (argv.empty()) return ret;
  // prepared before fork; the child only calls async-signal-safe functions
  std::vector<char*> args;
  for (auto& i : argv) args.push_back(const_cast<char*>(i.c_str()));
  args.push_back(nullptr);

  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1};
  auto start = Clock::now();
  auto Elapsed = [&start]() {
    return (long)std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
  };
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0) {
    ret.error = strerror(errno);
    spdlog::warn("RunProcess pipe error: {}", ret.error);
    for (int* p : {inpipe, outpipe, errpipe}) CloseFd(p[0]), CloseFd(p[1]);
    return ret;
  }
  pid_t pid = fork();
  if (pid < 0) {
    ret.error = strerror(errno);
    spdlog::warn("RunProcess fork error: {}", ret.error);
    for (int* p : {inpipe, outpipe, errpipe}) CloseFd(p[0]), CloseFd(p[1]);
    return ret;
  }
  if (pid == 0) {
    setpgid(0, 0);
    dup2(inpipe[0], 0);
    dup2(outpipe[1], 1);
    dup2(errpipe[1], 2);
    CloseFrom(3);
    execvp(args[0], args.data());
    _exit(127);
  }
  setpgid(pid, pid); // the child may not have run yet
  spdlog::debug("RunProcess pid={} command={} timeout={}ms", pid, fmt::format("{}", argv), timeout_ms);
  CloseFd(inpipe[0]);
  CloseFd(outpipe[1]);
  CloseFd(errpipe[1]);

  size_t input_pos = 0;
  if (input.empty()) {
    CloseFd(inpipe[1]);
  } else {
    fcntl(inpipe[1], F_SETFL, O_NONBLOCK);
  }
  long drain_deadline = -1;
  char buf[65536];
  while (outpipe[0] >= 0 || errpipe[0] >= 0) {
    long now = Elapsed();
    int wait = -1;
    if (drain_deadline >= 0) {
      if (now >= drain_deadline) break;
      wait = drain_deadline - now;
    } else if (timeout_ms > 0) {
      if (now >= timeout_ms) {
        spdlog::debug("RunProcess pid={} timed out after {}ms", pid, now);
        ret.timed_out = true;
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        drain_deadline = now + kDrainAfterKill;
        CloseFd(inpipe[1]);
        continue;
      }
      wait = timeout_ms - now;
    }
    struct pollfd fds[3];
    int nfds = 0;
    int* owners[3];
    for (int* fd : {&outpipe[0], &errpipe[0]}) {
      if (*fd < 0) continue;
      fds[nfds] = {*fd, POLLIN, 0};
      owners[nfds++] = fd;
    }
    if (inpipe[1] >= 0) {
      fds[nfds] = {inpipe[1], POLLOUT, 0};
      owners[nfds++] = &inpipe[1];
    }
    int res = poll(fds, nfds, wait);
    if (res < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("RunProcess poll error: {}", strerror(errno));
      break;
    }
    for (int i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      int& fd = *owners[i];
      if (&fd == &inpipe[1]) {
        ssize_t n = write(fd, input.data() + input_pos, input.size() - input_pos);
        if (n < 0 && errno != EAGAIN) {
          CloseFd(fd);
        } else if (n > 0 && (input_pos += n) == input.size()) {
          CloseFd(fd);
        }
        continue;
      }
      ssize_t n = read(fd, buf, sizeof(buf));
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
      if (n <= 0) {
        CloseFd(fd);
        continue;
      }
      std::string& target = &fd == &outpipe[0] ? ret.output : ret.error;
      size_t keep = target.size() < max_capture ? std::min((size_t)n, max_capture - target.size()) : 0;
      if (keep < (size_t)n) ret.truncated = true;
      target.append(buf, keep);
    }
  }
  CloseFd(inpipe[1]);
  CloseFd(outpipe[0]);
  CloseFd(errpipe[0]);

  int status = 0;
  if (drain_deadline >= 0) kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::warn("RunProcess waitpid error: {}", strerror(errno));
      ret.duration_ms = Elapsed();
      return ret;
    }
  }
  ret.duration_ms = Elapsed();
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.exit_code = 128 + WTERMSIG(status);
  }
  spdlog::debug("RunProcess pid={} exit_code={} duration={}ms", pid, ret.exit_code, ret.duration_ms);
  return ret;
}
