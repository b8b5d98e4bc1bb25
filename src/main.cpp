#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <arbiter/paths.h>
#include <arbiter/queue.h>
#include <arbiter/logger.h>
#include <arbiter/judging.h>
#include <arbiter/sandbox.h>
#include <arbiter/database.h>
#include <arbiter/docker_engine.h>
#include "platform_client.h"
#include "server_io.h"

namespace {

bool to_lock = true;
std::string docker_path = "docker";
QueueOptions queue_options;
JudgeOptions judge_options;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string data_dir = ini[""]["data_dir"] | "";
  std::string temp_root = ini[""]["temp_root"] | "";
  if (data_dir.size()) internal::kDataDir = data_dir;
  if (temp_root.size()) kTempRoot = temp_root;
  judge_options.temp_root = kTempRoot;
  kPlatformUrl = ini[""]["platform_url"] | kPlatformUrl;
  kPlatformKey = ini[""]["platform_key"] | kPlatformKey;
  docker_path = ini[""]["docker"] | docker_path;

  queue_options.concurrency = ini[""]["concurrency"] | queue_options.concurrency;
  queue_options.rate_max = ini[""]["rate_limit_max"] | queue_options.rate_max;
  queue_options.rate_window = std::chrono::milliseconds(
      ini[""]["rate_limit_window_ms"] | (long)queue_options.rate_window.count());
  queue_options.default_job.attempts = ini[""]["attempts"] | queue_options.default_job.attempts;
  queue_options.default_job.backoff_ms = ini[""]["backoff_ms"] | queue_options.default_job.backoff_ms;

  auto& sandbox = judge_options.sandbox;
  sandbox.cpu_limit = ini[""]["judge_cpus"] | sandbox.cpu_limit;
  sandbox.memory_limit = ini[""]["judge_memory"] | sandbox.memory_limit;
  sandbox.timeout_seconds = ini[""]["judge_timeout_seconds"] | sandbox.timeout_seconds;
  sandbox.image = ini[""]["judge_image"] | std::string(kDefaultJudgeImage);
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "arbiter-judge");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/arbiter-judge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--concurrency")
    .scan<'d', int>()
    .help("Number of judging jobs running in parallel");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--concurrency")) {
    queue_options.concurrency = val.value();
  }
  to_lock = parser["--no-lock"] == false;
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  std::error_code ec;
  fs::create_directories(lock_file.parent_path(), ec);
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  // writes to closed pipes of child processes must not kill the daemon
  signal(SIGPIPE, SIG_IGN);
  ParseArgs(argc, argv);
  if (kPlatformUrl.empty()) {
    spdlog::error("platform_url is not configured.");
    return 1;
  }
  if (to_lock && !LockFile()) {
    spdlog::error("Another judge instance is running.");
    return 1;
  }

  DockerCliEngine engine(docker_path);
  SandboxRuntime sandbox(engine);
  if (!sandbox.HealthCheck(judge_options.sandbox.image)) {
    spdlog::warn("Sandbox health check failed; jobs will be retried until the engine recovers");
  }
  HttpArtifactStore artifacts;
  HttpRubricSource rubrics;
  HttpCreditLedger ledger;
  CreditSettler settler(ledger);
  Database db(DatabasePath());
  Judge judge(sandbox, artifacts, rubrics, db, judge_options);

  QueueManager queue(queue_options, {
    .OnProgress = [](const JobInfo& info) {
      SendJobProgress(info);
    },
    .OnCompleted = [&settler](const JobInfo& info) {
      settler.Settle(info.id, true);
      SendJobCompleted(info);
    },
    .OnFailed = [&settler](const JobInfo& info, const std::string& error) {
      settler.Settle(info.id, false);
      SendJobFailed(info, error);
    },
    .OnRemoved = [&settler](const std::string& id) {
      settler.Forget(id);
    },
  });
  queue.Start([&judge](JobContext& ctx) {
    return JobResultJSON(judge.ProcessJob(ctx));
  });
  ServerWorkLoop(queue, judge);
}
