#ifndef INCLUDE_ARBITER_RUBRIC_H_
#define INCLUDE_ARBITER_RUBRIC_H_

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include "sandbox.h"

#define ENUM_REQUIREMENT_TYPE_ \
  X(AUTOMATED, "automated") \
  X(AI_JUDGE, "ai_judge")
enum class RequirementType {
#define X(name, str) name,
  ENUM_REQUIREMENT_TYPE_
#undef X
};

#define ENUM_TIE_BREAKER_ \
  X(TESTS_PASSED, "tests_passed") \
  X(CRITICAL_ERRORS, "critical_errors") \
  X(SUBMIT_TIME, "submit_time")
enum class TieBreaker {
#define X(name, str) name,
  ENUM_TIE_BREAKER_
#undef X
};

#define ENUM_REPORT_FORMAT_ \
  X(JUNIT, "junit") \
  X(TAP, "tap") \
  X(JEST, "jest")
enum class ReportFormat {
#define X(name, str) name,
  ENUM_REPORT_FORMAT_
#undef X
};

extern const std::vector<TieBreaker> kDefaultTieBreakers;

struct RubricCheck {
  std::string id, name;
  std::string command;
  std::vector<std::string> args;
  int expected_exit_code = 0;
  int timeout_seconds = 60;
  double points = 0;
};

struct RubricRequirement {
  std::string id, name, description;
  double weight = 0; // 0-100
  RequirementType type = RequirementType::AUTOMATED;
  std::vector<RubricCheck> checks;
  // used by the report scoring
  std::vector<std::string> evidence; // build_log, lint_log, coverage
  std::vector<std::string> tests; // glob patterns

  bool HasEvidence(const std::string& type) const;
};

// report files left in the workspace by the checks; paths are workspace-relative
struct RubricReports {
  ReportFormat tests_format = ReportFormat::JUNIT;
  std::string tests, coverage, lint;

  bool Empty() const { return tests.empty() && coverage.empty() && lint.empty(); }
};

struct Rubric {
  std::string version;
  std::vector<RubricRequirement> requirements;
  std::optional<ExecutionCommand> build_command, install_command;
  std::vector<TieBreaker> tie_breakers = kDefaultTieBreakers;
  RubricReports reports;
};

double TotalWeight(const Rubric&);

// Throws InvalidInputError if the structure is unusable.
// A weight sum other than 100 is only logged; weights are used as declared.
Rubric ParseRubric(const nlohmann::json&);
Rubric ParseRubricText(const std::string&);

#endif  // INCLUDE_ARBITER_RUBRIC_H_
