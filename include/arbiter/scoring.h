#ifndef INCLUDE_ARBITER_SCORING_H_
#define INCLUDE_ARBITER_SCORING_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>
#include "rubric.h"

// Pure functions over parsed reports; nothing here touches the filesystem.

extern const char kScoringEngineVersion[];

#define ENUM_TEST_STATUS_ \
  X(PASSED, "passed") \
  X(FAILED, "failed") \
  X(SKIPPED, "skipped") \
  X(ERROR, "error")
enum class TestStatus {
#define X(name, str) name,
  ENUM_TEST_STATUS_
#undef X
};

#define ENUM_LINT_SEVERITY_ \
  X(ERROR, "error") \
  X(WARNING, "warning") \
  X(INFO, "info")
enum class LintSeverity {
#define X(name, str) name,
  ENUM_LINT_SEVERITY_
#undef X
};

enum class Winner { A, B, TIE };

struct TestCase {
  std::string name;
  std::string class_name, file; // empty if unknown
  std::optional<double> duration; // seconds
  TestStatus status = TestStatus::PASSED;
  std::string error_message, error_type, stack_trace;
};

struct TestSuite {
  std::string name, file;
  int tests = 0, passed = 0, failed = 0, skipped = 0, errors = 0;
  std::optional<double> duration;
  std::vector<TestCase> test_cases;
};

struct TestResults {
  std::vector<TestSuite> suites;
  int total_tests = 0;
  int total_passed = 0;
  int total_failed = 0;
  int total_skipped = 0;
  int total_errors = 0;
  std::optional<double> duration;
};

struct CoverageMetric {
  long covered = 0, total = 0;
  double percentage = 0;
};

struct FileCoverage {
  std::string file;
  CoverageMetric lines, branches, functions, statements;
};

struct CoverageSummary {
  CoverageMetric lines, branches, functions, statements;
};

struct CoverageReport {
  std::vector<FileCoverage> files;
  CoverageSummary summary;
};

struct LintIssue {
  std::string file;
  int line = 0, column = 0;
  LintSeverity severity = LintSeverity::INFO;
  std::string rule; // empty if none
  std::string message;
};

struct LintResults {
  std::vector<LintIssue> issues;
  int error_count = 0;
  int warning_count = 0;
  int fixable_error_count = 0;
  int fixable_warning_count = 0;
};

struct BuildResult {
  bool success = true;
  int exit_code = 0;
  std::string output, error;
  long duration_ms = 0;
  std::vector<std::string> errors, warnings;
};

struct RequirementEvidence {
  std::string type;
  nlohmann::json data;
  std::string summary;
};

struct RequirementScore {
  std::string requirement_id, title;
  double score = 0; // 0-100
  double weighted_score = 0; // score * weight / 100
  double weight = 0;
  double max_score = 100;
  std::vector<RequirementEvidence> evidence;
  struct Details {
    int tests_matched = 0;
    int tests_passed = 0;
    int tests_failed = 0;
    int tests_skipped = 0;
    std::optional<double> coverage_percentage;
    std::optional<int> lint_errors, lint_warnings;
    std::optional<bool> build_success;
  } details;
};

struct TieBreakerValues {
  int tests_passed = 0;
  int critical_errors = 0;
  std::optional<int64_t> submit_time; // UNIX timestamp, milliseconds
};

// the parsed inputs of one submission; any of them may be absent
struct ScoringInputs {
  std::optional<TestResults> tests;
  std::optional<BuildResult> build;
  std::optional<LintResults> lint;
  std::optional<CoverageReport> coverage;
  std::optional<int64_t> submit_time;
};

struct ScoringResult {
  int total_score = 0;
  int max_score = 100;
  std::vector<RequirementScore> requirements;
  ScoringInputs inputs;
  TieBreakerValues tie_breakers;
  struct Metadata {
    int64_t scored_at = 0;
    std::string engine_version;
    long duration_ms = 0;
  } metadata;
};

struct GlobOptions {
  bool match_base = false; // patterns without '/' match the basename
  bool nocase = false;
};

// * and ? never match '/', ** matches across directories, [...] is a character class
bool GlobMatch(const std::string& path, const std::string& pattern, GlobOptions = {});

// Parsers never throw; malformed input gives an empty result
TestResults ParseJUnitXML(const std::string&);
TestResults ParseTAP(const std::string&);
TestResults ParseJestJSON(const std::string&);
TestResults ParseTestReport(ReportFormat, const std::string&);
CoverageReport ParseCoverageJSON(const std::string&);
LintResults ParseESLintJSON(const std::string&);

std::vector<TestCase> MatchTestsToRequirement(const TestResults&, const std::vector<std::string>& patterns);

RequirementScore ScoreRequirement(const RubricRequirement&, const ScoringInputs&);
ScoringResult CalculateScore(const Rubric&, const ScoringInputs&);

// negative if a wins, positive if b wins, 0 if still tied
long CompareTieBreakers(const ScoringResult& a, const ScoringResult& b,
                        const std::vector<TieBreaker>& order = kDefaultTieBreakers);
Winner DetermineWinner(const ScoringResult& a, const ScoringResult& b,
                       const std::vector<TieBreaker>& order = kDefaultTieBreakers);

// serialization for storage and the command-line tool
void to_json(nlohmann::json&, const TestCase&);
void to_json(nlohmann::json&, const TestSuite&);
void to_json(nlohmann::json&, const TestResults&);
void to_json(nlohmann::json&, const CoverageMetric&);
void to_json(nlohmann::json&, const CoverageSummary&);
void to_json(nlohmann::json&, const CoverageReport&);
void to_json(nlohmann::json&, const LintIssue&);
void to_json(nlohmann::json&, const LintResults&);
void to_json(nlohmann::json&, const BuildResult&);
void to_json(nlohmann::json&, const RequirementScore&);
void to_json(nlohmann::json&, const ScoringResult&);
// only the fields needed for comparison are read back
ScoringResult ScoringResultFromJSON(const nlohmann::json&);

#endif  // INCLUDE_ARBITER_SCORING_H_
