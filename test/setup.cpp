#include <csignal>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <arbiter/paths.h>

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    fs::create_directories(kTempRoot);
  }
  void TearDown() override {
    fs::remove_all(kTempRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  signal(SIGPIPE, SIG_IGN);
  if (argc) internal::kDataDir = fs::absolute(fs::path(argv[0]).parent_path());
  kTempRoot = DataDir() / "test-scratch";
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
