#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <arbiter/utils.h>
#include <arbiter/errors.h>
#include <arbiter/rubric.h>
#include <arbiter/scoring.h>

// Offline scoring of report files:
//   arbiter-score --rubric rubric.json --junit report.xml [--coverage cov.json] [--lint eslint.json]
//   arbiter-score --compare a.json b.json [--tie-breakers tests_passed,submit_time]

namespace {

std::string ReadAll(const std::string& path) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::error("Cannot open {}", path);
    exit(1);
  }
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

std::vector<TieBreaker> ParseTieBreakers(const std::string& str) {
  std::vector<TieBreaker> ret;
  std::stringstream ss(str);
  std::string item;
  while (std::getline(ss, item, ',')) {
    TieBreaker tb;
    if (!GetTieBreaker(item, tb)) {
      spdlog::error("Unknown tie breaker {}", item);
      exit(1);
    }
    ret.push_back(tb);
  }
  return ret;
}

int Compare(const std::vector<std::string>& files, const std::vector<TieBreaker>& order) {
  ScoringResult a, b;
  try {
    a = ScoringResultFromJSON(nlohmann::json::parse(ReadAll(files[0])));
    b = ScoringResultFromJSON(nlohmann::json::parse(ReadAll(files[1])));
  } catch (const nlohmann::json::exception& err) {
    spdlog::error("Invalid scoring result: {}", err.what());
    return 1;
  }
  std::cout << nlohmann::json{{"winner", WinnerName(DetermineWinner(a, b, order))}} << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  argparse::ArgumentParser parser("arbiter-score");
  parser.add_argument("--rubric").help("Rubric JSON file");
  parser.add_argument("--junit").help("JUnit XML test report");
  parser.add_argument("--tap").help("TAP test report");
  parser.add_argument("--jest").help("Jest JSON test report");
  parser.add_argument("--coverage").help("Istanbul coverage JSON");
  parser.add_argument("--lint").help("ESLint JSON report");
  parser.add_argument("--build-exit").scan<'d', int>().help("Exit code of the build");
  parser.add_argument("--submit-time").scan<'d', int64_t>().help("Submission time, UNIX milliseconds");
  parser.add_argument("--compare").nargs(2).help("Compare two scoring results");
  parser.add_argument("--tie-breakers").help("Comma-separated tie breaker order");
  parser.add_argument("-v", "--verbose")
    .default_value(false)
    .implicit_value(true)
    .help("Log parser warnings");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  spdlog::set_level(parser["--verbose"] == true ? spdlog::level::info : spdlog::level::err);

  std::vector<TieBreaker> order = kDefaultTieBreakers;
  if (auto str = parser.present("--tie-breakers")) order = ParseTieBreakers(str.value());
  if (auto files = parser.present<std::vector<std::string>>("--compare")) {
    return Compare(files.value(), order);
  }

  auto rubric_file = parser.present("--rubric");
  if (!rubric_file) {
    std::cerr << "--rubric or --compare is required" << std::endl;
    std::cerr << parser;
    return 1;
  }
  Rubric rubric;
  try {
    rubric = ParseRubricText(ReadAll(rubric_file.value()));
  } catch (const InvalidInputError& err) {
    spdlog::error("Invalid rubric: {}", err.what());
    return 1;
  }
  if (parser.is_used("--tie-breakers")) rubric.tie_breakers = order;

  ScoringInputs inputs;
  if (auto file = parser.present("--junit")) {
    inputs.tests = ParseTestReport(ReportFormat::JUNIT, ReadAll(file.value()));
  } else if (auto file = parser.present("--tap")) {
    inputs.tests = ParseTestReport(ReportFormat::TAP, ReadAll(file.value()));
  } else if (auto file = parser.present("--jest")) {
    inputs.tests = ParseTestReport(ReportFormat::JEST, ReadAll(file.value()));
  }
  if (auto file = parser.present("--coverage")) inputs.coverage = ParseCoverageJSON(ReadAll(file.value()));
  if (auto file = parser.present("--lint")) inputs.lint = ParseESLintJSON(ReadAll(file.value()));
  if (auto code = parser.present<int>("--build-exit")) {
    BuildResult build;
    build.exit_code = code.value();
    build.success = build.exit_code == 0;
    inputs.build = std::move(build);
  }
  if (auto ts = parser.present<int64_t>("--submit-time")) inputs.submit_time = ts.value();

  nlohmann::json result = CalculateScore(rubric, inputs);
  std::cout << result.dump(2, ' ', false, nlohmann::json::error_handler_t::ignore) << std::endl;
}
