#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <arbiter/errors.h>
#include <arbiter/rubric.h>

namespace {

const char kRubric[] = R"({
  "version": "2",
  "installCommand": "npm ci",
  "buildCommand": {"command": "npm", "args": ["run", "build"], "timeout": 300},
  "requirements": [
    {"id": "api", "name": "API", "weight": 60, "checks": [
      {"id": "unit", "name": "Unit tests", "command": "npm", "args": ["test"], "points": 10},
      {"id": "e2e", "command": "./e2e.sh", "expectedExitCode": 1, "timeout": 0, "points": 5}
    ], "tests": ["api/**/*.test.js"], "evidence": ["build_log"]},
    {"id": "ux", "title": "Looks good", "weight": 40, "type": "ai_judge"}
  ],
  "tieBreakers": ["submit_time", "nonsense", "tests_passed"],
  "reports": {"tests": {"path": "reports/junit.xml", "format": "tap"}, "coverage": "coverage/coverage-final.json"}
})";

} // namespace

TEST(RubricTest, Parse) {
  Rubric rubric = ParseRubricText(kRubric);
  EXPECT_EQ(rubric.version, "2");
  ASSERT_TRUE(rubric.install_command);
  EXPECT_EQ(rubric.install_command->command, "npm ci");
  ASSERT_TRUE(rubric.build_command);
  EXPECT_EQ(rubric.build_command->args, (std::vector<std::string>{"run", "build"}));
  EXPECT_EQ(rubric.build_command->timeout_seconds, 300);
  EXPECT_DOUBLE_EQ(TotalWeight(rubric), 100);

  ASSERT_EQ(rubric.requirements.size(), 2);
  auto& api = rubric.requirements[0];
  EXPECT_EQ(api.type, RequirementType::AUTOMATED);
  ASSERT_EQ(api.checks.size(), 2);
  EXPECT_EQ(api.checks[0].name, "Unit tests");
  EXPECT_EQ(api.checks[0].timeout_seconds, 60);
  EXPECT_DOUBLE_EQ(api.checks[0].points, 10);
  EXPECT_EQ(api.checks[1].name, "e2e");
  EXPECT_EQ(api.checks[1].expected_exit_code, 1);
  EXPECT_EQ(api.checks[1].timeout_seconds, 60);
  EXPECT_TRUE(api.HasEvidence("build_log"));
  EXPECT_FALSE(api.HasEvidence("coverage"));

  auto& ux = rubric.requirements[1];
  EXPECT_EQ(ux.name, "Looks good");
  EXPECT_EQ(ux.type, RequirementType::AI_JUDGE);
  EXPECT_TRUE(ux.checks.empty());

  EXPECT_EQ(rubric.tie_breakers, (std::vector<TieBreaker>{TieBreaker::SUBMIT_TIME, TieBreaker::TESTS_PASSED}));
  EXPECT_EQ(rubric.reports.tests, "reports/junit.xml");
  EXPECT_EQ(rubric.reports.tests_format, ReportFormat::TAP);
  EXPECT_EQ(rubric.reports.coverage, "coverage/coverage-final.json");
  EXPECT_TRUE(rubric.reports.lint.empty());
}

TEST(RubricTest, Defaults) {
  Rubric rubric = ParseRubric(nlohmann::json{{"requirements", nlohmann::json::array()}});
  EXPECT_TRUE(rubric.requirements.empty());
  EXPECT_FALSE(rubric.build_command);
  EXPECT_EQ(rubric.tie_breakers, kDefaultTieBreakers);
  EXPECT_TRUE(rubric.reports.Empty());
}

TEST(RubricTest, UnbalancedWeightsAccepted) {
  Rubric rubric = ParseRubricText(R"({"requirements": [{"id": "a", "weight": 30}]})");
  EXPECT_DOUBLE_EQ(TotalWeight(rubric), 30);
}

class RubricErrorTest : public testing::TestWithParam<std::string> {};
TEST_P(RubricErrorTest, Invalid) {
  EXPECT_THROW(ParseRubricText(GetParam()), InvalidInputError);
}
INSTANTIATE_TEST_SUITE_P(Rubric, RubricErrorTest,
    testing::Values(
      "not json",
      "[]",
      "{}",
      R"({"requirements": {}})",
      R"({"requirements": [{"name": "no id"}]})",
      R"({"requirements": [{"id": "a", "weight": 101}]})",
      R"({"requirements": [{"id": "a", "type": "manual"}]})",
      R"({"requirements": [{"id": "a", "checks": [{"id": "c"}]}]})",
      R"({"requirements": [{"id": "a", "checks": [{"id": "c", "command": "x", "points": -1}]}]})",
      R"({"requirements": [{"id": "a", "tests": "not a list"}]})",
      R"({"requirements": [], "buildCommand": {"args": []}})",
      R"({"requirements": [], "reports": {"tests": {"path": "x", "format": "xunit"}}})"
    ));
