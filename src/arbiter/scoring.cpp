#include <arbiter/scoring.h>

#include <cmath>
#include <chrono>
#include <algorithm>

#include <fmt/core.h>
#include <arbiter/utils.h>

const char kScoringEngineVersion[] = "1.0.0";

using nlohmann::json;

std::vector<TestCase> MatchTestsToRequirement(const TestResults& results, const std::vector<std::string>& patterns) {
  std::vector<TestCase> ret;
  for (auto& suite : results.suites) {
    for (auto& tc : suite.test_cases) {
      const std::string& file =
          !tc.file.empty() ? tc.file :
          !tc.class_name.empty() ? tc.class_name :
          !suite.file.empty() ? suite.file : suite.name;
      for (auto& pattern : patterns) {
        if (GlobMatch(file, pattern, {.match_base = true}) ||
            GlobMatch(tc.name, "*" + pattern + "*", {.nocase = true})) {
          ret.push_back(tc);
          break;
        }
      }
    }
  }
  return ret;
}

RequirementScore ScoreRequirement(const RubricRequirement& req, const ScoringInputs& inputs) {
  RequirementScore ret;
  ret.requirement_id = req.id;
  ret.title = req.name;
  ret.weight = req.weight;
  auto& details = ret.details;
  double score = 0;
  bool has_tests = !req.tests.empty();

  if (has_tests && inputs.tests) {
    auto matched = MatchTestsToRequirement(*inputs.tests, req.tests);
    details.tests_matched = matched.size();
    for (auto& i : matched) {
      if (i.status == TestStatus::PASSED) details.tests_passed++;
      if (i.status == TestStatus::FAILED) details.tests_failed++;
      if (i.status == TestStatus::SKIPPED) details.tests_skipped++;
    }
    if (details.tests_matched > 0) {
      int active = details.tests_matched - details.tests_skipped;
      if (active > 0) score = 100.0 * details.tests_passed / active;
      ret.evidence.push_back({"test_results", {
        {"matched", details.tests_matched},
        {"passed", details.tests_passed},
        {"failed", details.tests_failed},
        {"skipped", details.tests_skipped},
      }, fmt::format("{}/{} tests passed", details.tests_passed, details.tests_matched)});
    }
  }

  if (req.HasEvidence("build_log") && inputs.build) {
    auto& build = *inputs.build;
    details.build_success = build.success;
    if (build.success) {
      if (!has_tests || details.tests_matched == 0) score = 100;
    } else {
      score = std::min(score, 25.0);
    }
    ret.evidence.push_back({"build_log", {{"success", build.success}, {"exitCode", build.exit_code}},
        build.success ? "Build successful" : fmt::format("Build failed (exit {})", build.exit_code)});
  }

  if (req.HasEvidence("lint_log") && inputs.lint) {
    int errors = inputs.lint->error_count;
    details.lint_errors = errors;
    details.lint_warnings = inputs.lint->warning_count;
    if (errors > 0) score = std::max(0.0, score - std::min(errors * 5, 50));
    ret.evidence.push_back({"lint_log", {{"errors", errors}, {"warnings", inputs.lint->warning_count}},
        errors == 0 ? "No lint errors" : fmt::format("{} lint errors", errors)});
  }

  if (req.HasEvidence("coverage") && inputs.coverage) {
    double pct = inputs.coverage->summary.lines.percentage;
    details.coverage_percentage = pct;
    if (pct >= 80) {
      score = std::min(100.0, score + 10);
    } else if (pct >= 60) {
      score = std::min(100.0, score + 5);
    }
    ret.evidence.push_back({"coverage", inputs.coverage->summary, fmt::format("{:.1f}% line coverage", pct)});
  }

  ret.score = std::clamp(std::floor(score + 0.5), 0.0, 100.0);
  ret.weighted_score = ret.score * req.weight / 100;
  return ret;
}

ScoringResult CalculateScore(const Rubric& rubric, const ScoringInputs& inputs) {
  auto start = std::chrono::steady_clock::now();
  ScoringResult ret;
  double total = 0;
  for (auto& req : rubric.requirements) {
    ret.requirements.push_back(ScoreRequirement(req, inputs));
    total += ret.requirements.back().weighted_score;
  }
  ret.total_score = (int)std::floor(total + 0.5);
  ret.inputs = inputs;
  ret.tie_breakers.tests_passed = inputs.tests ? inputs.tests->total_passed : 0;
  ret.tie_breakers.critical_errors = (inputs.lint ? inputs.lint->error_count : 0) +
      (inputs.build && !inputs.build->success ? 10 : 0);
  ret.tie_breakers.submit_time = inputs.submit_time;
  ret.metadata.scored_at = UnixMillis();
  ret.metadata.engine_version = kScoringEngineVersion;
  ret.metadata.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  return ret;
}

long CompareTieBreakers(const ScoringResult& a, const ScoringResult& b, const std::vector<TieBreaker>& order) {
  auto& x = a.tie_breakers;
  auto& y = b.tie_breakers;
  for (auto criterion : order) {
    long diff = 0;
    switch (criterion) {
      case TieBreaker::TESTS_PASSED: diff = y.tests_passed - x.tests_passed; break;
      case TieBreaker::CRITICAL_ERRORS: diff = x.critical_errors - y.critical_errors; break;
      case TieBreaker::SUBMIT_TIME:
        if (x.submit_time && y.submit_time) diff = *x.submit_time - *y.submit_time;
        break;
    }
    if (diff) return diff;
  }
  return 0;
}

Winner DetermineWinner(const ScoringResult& a, const ScoringResult& b, const std::vector<TieBreaker>& order) {
  if (a.total_score > b.total_score) return Winner::A;
  if (b.total_score > a.total_score) return Winner::B;
  long cmp = CompareTieBreakers(a, b, order);
  if (cmp < 0) return Winner::A;
  if (cmp > 0) return Winner::B;
  return Winner::TIE;
}

namespace {

template <class T>
void SetIf(json& j, const char* key, const std::optional<T>& val) {
  if (val) j[key] = *val;
}

void SetIf(json& j, const char* key, const std::string& val) {
  if (!val.empty()) j[key] = val;
}

} // namespace

void to_json(json& j, const TestCase& tc) {
  j = {{"name", tc.name}, {"status", TestStatusName(tc.status)}};
  SetIf(j, "className", tc.class_name);
  SetIf(j, "file", tc.file);
  SetIf(j, "duration", tc.duration);
  SetIf(j, "errorMessage", tc.error_message);
  SetIf(j, "errorType", tc.error_type);
  SetIf(j, "stackTrace", tc.stack_trace);
}

void to_json(json& j, const TestSuite& suite) {
  j = {
    {"name", suite.name},
    {"tests", suite.tests},
    {"passed", suite.passed},
    {"failed", suite.failed},
    {"skipped", suite.skipped},
    {"errors", suite.errors},
    {"testCases", suite.test_cases},
  };
  SetIf(j, "file", suite.file);
  SetIf(j, "duration", suite.duration);
}

void to_json(json& j, const TestResults& res) {
  j = {
    {"suites", res.suites},
    {"totalTests", res.total_tests},
    {"totalPassed", res.total_passed},
    {"totalFailed", res.total_failed},
    {"totalSkipped", res.total_skipped},
    {"totalErrors", res.total_errors},
  };
  SetIf(j, "duration", res.duration);
}

void to_json(json& j, const CoverageMetric& m) {
  j = {{"covered", m.covered}, {"total", m.total}, {"percentage", m.percentage}};
}

void to_json(json& j, const CoverageSummary& s) {
  j = {{"lines", s.lines}, {"branches", s.branches}, {"functions", s.functions}, {"statements", s.statements}};
}

void to_json(json& j, const CoverageReport& report) {
  json files = json::array();
  for (auto& f : report.files) {
    files.push_back({
      {"file", f.file}, {"lines", f.lines}, {"branches", f.branches},
      {"functions", f.functions}, {"statements", f.statements},
    });
  }
  j = {{"files", std::move(files)}, {"summary", report.summary}};
}

void to_json(json& j, const LintIssue& issue) {
  j = {
    {"file", issue.file},
    {"line", issue.line},
    {"column", issue.column},
    {"severity", LintSeverityName(issue.severity)},
    {"rule", issue.rule.empty() ? json() : json(issue.rule)},
    {"message", issue.message},
  };
}

void to_json(json& j, const LintResults& res) {
  j = {
    {"issues", res.issues},
    {"errorCount", res.error_count},
    {"warningCount", res.warning_count},
    {"fixableErrorCount", res.fixable_error_count},
    {"fixableWarningCount", res.fixable_warning_count},
  };
}

void to_json(json& j, const BuildResult& res) {
  j = {
    {"success", res.success},
    {"exitCode", res.exit_code},
    {"output", res.output},
    {"error", res.error},
    {"duration", res.duration_ms},
    {"errors", res.errors},
    {"warnings", res.warnings},
  };
}

void to_json(json& j, const RequirementScore& score) {
  json evidence = json::array();
  for (auto& i : score.evidence) {
    evidence.push_back({{"type", i.type}, {"data", i.data}, {"summary", i.summary}});
  }
  auto& d = score.details;
  json details = {
    {"testsMatched", d.tests_matched},
    {"testsPassed", d.tests_passed},
    {"testsFailed", d.tests_failed},
    {"testsSkipped", d.tests_skipped},
  };
  SetIf(details, "coveragePercentage", d.coverage_percentage);
  SetIf(details, "lintErrors", d.lint_errors);
  SetIf(details, "lintWarnings", d.lint_warnings);
  SetIf(details, "buildSuccess", d.build_success);
  j = {
    {"requirementId", score.requirement_id},
    {"title", score.title},
    {"score", score.score},
    {"weightedScore", score.weighted_score},
    {"weight", score.weight},
    {"maxScore", score.max_score},
    {"evidence", std::move(evidence)},
    {"details", std::move(details)},
  };
}

void to_json(json& j, const ScoringResult& res) {
  json tie_breakers = {
    {"testsPassed", res.tie_breakers.tests_passed},
    {"criticalErrors", res.tie_breakers.critical_errors},
  };
  SetIf(tie_breakers, "submitTime", res.tie_breakers.submit_time);
  j = {
    {"totalScore", res.total_score},
    {"maxScore", res.max_score},
    {"requirements", res.requirements},
    {"tieBreakers", std::move(tie_breakers)},
    {"metadata", {
      {"scoredAt", res.metadata.scored_at},
      {"engineVersion", res.metadata.engine_version},
      {"duration", res.metadata.duration_ms},
    }},
  };
  SetIf(j, "buildResult", res.inputs.build);
  SetIf(j, "testResults", res.inputs.tests);
  SetIf(j, "coverageReport", res.inputs.coverage);
  SetIf(j, "lintResults", res.inputs.lint);
}

ScoringResult ScoringResultFromJSON(const json& j) {
  ScoringResult res;
  res.total_score = j.value("totalScore", 0);
  res.max_score = j.value("maxScore", 100);
  if (auto it = j.find("tieBreakers"); it != j.end() && it->is_object()) {
    res.tie_breakers.tests_passed = it->value("testsPassed", 0);
    res.tie_breakers.critical_errors = it->value("criticalErrors", 0);
    if (auto t = it->find("submitTime"); t != it->end() && t->is_number()) {
      res.tie_breakers.submit_time = t->get<int64_t>();
    }
  }
  return res;
}
