#include <gtest/gtest.h>
#include <arbiter/scoring.h>

namespace {

const char kJUnitReport[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<testsuites name="jest tests" tests="10" failures="2">
  <testsuite name="math" tests="4" failures="1" errors="0" skipped="0" time="0.5" file="src/math.test.js">
    <testcase classname="math add" name="adds numbers" time="0.01"/>
    <testcase classname="math add" name="adds negatives" time="0.02"/>
    <testcase classname="math sub" name="subtracts" time="0.01">
      <failure message="expected 1 to be 2" type="AssertionError"><![CDATA[Error: expected 1 to be 2
    at Object.<anonymous> (src/math.test.js:10:5)]]></failure>
    </testcase>
    <testcase classname="math sub" name="subtracts negatives" time="0.01"/>
  </testsuite>
  <testsuite name="strings" tests="3" failures="1" time="0.2">
    <!-- <testcase name="commented out"/> -->
    <testcase classname="strings" name="concat &amp; trim" time="0.1"/>
    <testcase classname="strings" name="upper" time="0.05">
      <failure message="bad &lt;case&gt;">stack &amp; trace</failure>
    </testcase>
    <testcase classname="strings" name="lower"/>
  </testsuite>
  <testsuite name="api" tests="3" failures="0" time="1.5">
    <testcase classname="api" name="get"/>
    <testcase classname="api" name="post"/>
    <testcase classname="api" name="delete"/>
  </testsuite>
</testsuites>
)";

} // namespace

TEST(JUnitTest, Totals) {
  auto res = ParseJUnitXML(kJUnitReport);
  ASSERT_EQ(res.suites.size(), 3);
  EXPECT_EQ(res.total_tests, 10);
  EXPECT_EQ(res.total_passed, 8);
  EXPECT_EQ(res.total_failed, 2);
  EXPECT_EQ(res.total_skipped, 0);
  EXPECT_EQ(res.total_errors, 0);
  ASSERT_TRUE(res.duration);
  EXPECT_NEAR(*res.duration, 2.2, 1e-9);
}

TEST(JUnitTest, CaseDetails) {
  auto res = ParseJUnitXML(kJUnitReport);
  auto& math = res.suites[0];
  EXPECT_EQ(math.name, "math");
  EXPECT_EQ(math.file, "src/math.test.js");
  ASSERT_EQ(math.test_cases.size(), 4);
  auto& failed = math.test_cases[2];
  EXPECT_EQ(failed.name, "subtracts");
  EXPECT_EQ(failed.class_name, "math sub");
  EXPECT_EQ(failed.status, TestStatus::FAILED);
  EXPECT_EQ(failed.error_message, "expected 1 to be 2");
  EXPECT_EQ(failed.error_type, "AssertionError");
  EXPECT_EQ(failed.stack_trace.rfind("Error: expected 1 to be 2", 0), 0);

  auto& strings = res.suites[1];
  ASSERT_EQ(strings.test_cases.size(), 3);
  EXPECT_EQ(strings.test_cases[0].name, "concat & trim");
  EXPECT_EQ(strings.test_cases[1].error_message, "bad <case>");
  EXPECT_EQ(strings.test_cases[1].stack_trace, "stack & trace");
}

TEST(JUnitTest, CountsFromCasesWithoutAttributes) {
  auto res = ParseJUnitXML(R"(<testsuite name="s">
    <testcase name="a"/>
    <testcase name="b"><skipped/></testcase>
    <testcase name="c"><error message="boom" type="TypeError"/></testcase>
    <testcase name="d"><skipped/><failure message="x"/></testcase>
  </testsuite>)");
  ASSERT_EQ(res.suites.size(), 1);
  auto& suite = res.suites[0];
  EXPECT_EQ(suite.tests, 4);
  EXPECT_EQ(suite.passed, 1);
  EXPECT_EQ(suite.skipped, 1);
  EXPECT_EQ(suite.errors, 1);
  EXPECT_EQ(suite.failed, 1);
  EXPECT_EQ(suite.test_cases[2].error_type, "TypeError");
  EXPECT_EQ(suite.test_cases[3].status, TestStatus::FAILED);
}

TEST(JUnitTest, BareTestCases) {
  auto res = ParseJUnitXML(R"(<testcase name="lonely"/><testcase name="sad"><failure/></testcase>)");
  ASSERT_EQ(res.suites.size(), 1);
  EXPECT_EQ(res.suites[0].name, "default");
  EXPECT_EQ(res.total_tests, 2);
  EXPECT_EQ(res.total_failed, 1);
}

TEST(JUnitTest, Malformed) {
  auto res = ParseJUnitXML("this is not xml at all");
  EXPECT_TRUE(res.suites.empty());
  EXPECT_EQ(res.total_tests, 0);
  res = ParseJUnitXML("<testsuite name=\"cut\"><testcase name=\"a\"");
  EXPECT_EQ(res.total_tests, 0);
}

TEST(JUnitTest, OversizedAttributes) {
  std::string message(200000, 'x');
  auto res = ParseJUnitXML("<testsuite name=\"big\"><testcase name='huge' classname=\"a.b\">"
                           "<failure message=\"" + message + "\" type=\"AssertionError\"/>"
                           "</testcase></testsuite>");
  ASSERT_EQ(res.suites.size(), 1);
  ASSERT_EQ(res.suites[0].test_cases.size(), 1);
  auto& tc = res.suites[0].test_cases[0];
  EXPECT_EQ(tc.name, "huge");
  EXPECT_EQ(tc.class_name, "a.b");
  EXPECT_EQ(tc.status, TestStatus::FAILED);
  EXPECT_EQ(tc.error_message.size(), message.size());
  EXPECT_EQ(tc.error_type, "AssertionError");
}

TEST(JUnitTest, AttributeQuoting) {
  auto res = ParseJUnitXML(R"(<testsuite name = 'single "quoted"' broken= tests="1">)"
                           R"(<testcase name="it &amp; works" time = "0.5"/></testsuite>)");
  ASSERT_EQ(res.suites.size(), 1);
  EXPECT_EQ(res.suites[0].name, "single \"quoted\"");
  ASSERT_EQ(res.suites[0].test_cases.size(), 1);
  EXPECT_EQ(res.suites[0].test_cases[0].name, "it & works");
}

TEST(TAPTest, Basic) {
  auto res = ParseTAP(R"(TAP version 13
1..6
ok 1 - adds
not ok 2 - subtracts
  ---
  message: expected 1
  ...
ok 3 - divides # SKIP no division yet
not ok 4 multiplies # TODO later
ok 5
# comment
)");
  ASSERT_EQ(res.suites.size(), 1);
  auto& suite = res.suites[0];
  EXPECT_EQ(suite.name, "TAP Results");
  ASSERT_EQ(suite.test_cases.size(), 5);
  EXPECT_EQ(suite.tests, 6);
  EXPECT_EQ(suite.passed, 2);
  EXPECT_EQ(suite.failed, 1);
  EXPECT_EQ(suite.skipped, 2);
  EXPECT_EQ(suite.test_cases[1].error_message, "Test failed: subtracts");
  EXPECT_EQ(suite.test_cases[2].name, "divides");
  EXPECT_EQ(suite.test_cases[2].error_message, "no division yet");
  EXPECT_EQ(suite.test_cases[3].name, "multiplies");
  EXPECT_EQ(suite.test_cases[4].name, "test 5");
  EXPECT_EQ(res.total_tests, 6);
}

TEST(TAPTest, NoPlan) {
  auto res = ParseTAP("ok\nnot ok\nokay this is not a test line\n");
  EXPECT_EQ(res.total_tests, 2);
  EXPECT_EQ(res.total_passed, 1);
  EXPECT_EQ(res.total_failed, 1);
}

TEST(TAPTest, OversizedLines) {
  std::string name(200000, 'x');
  auto res = ParseTAP("1..2\nok 1 - " + name + "\nnot ok 2 " + name + " # skip " + name + "\n");
  ASSERT_EQ(res.suites.size(), 1);
  auto& cases = res.suites[0].test_cases;
  ASSERT_EQ(cases.size(), 2);
  EXPECT_EQ(cases[0].name, name);
  EXPECT_EQ(cases[0].status, TestStatus::PASSED);
  EXPECT_EQ(cases[1].name, name);
  EXPECT_EQ(cases[1].status, TestStatus::SKIPPED);
  EXPECT_EQ(cases[1].error_message, name);
}

TEST(TAPTest, DirectiveWordBoundary) {
  auto res = ParseTAP("ok 1 - counts # skipped words\nok 2 - issue #12 fixed\nnot ok 3 # TODO\n");
  auto& cases = res.suites[0].test_cases;
  ASSERT_EQ(cases.size(), 3);
  EXPECT_EQ(cases[0].status, TestStatus::PASSED);
  EXPECT_EQ(cases[0].name, "counts # skipped words");
  EXPECT_EQ(cases[1].name, "issue #12 fixed");
  EXPECT_EQ(cases[2].status, TestStatus::SKIPPED);
  EXPECT_EQ(cases[2].name, "test 3");
}

TEST(JestTest, Results) {
  auto res = ParseJestJSON(R"({
    "numTotalTests": 4, "numPassedTests": 2, "numFailedTests": 1, "numPendingTests": 1,
    "testResults": [{
      "name": "/app/src/cart.test.js",
      "startTime": 1000, "endTime": 3500,
      "assertionResults": [
        {"title": "adds item", "ancestorTitles": ["Cart", "add"], "status": "passed", "duration": 12},
        {"title": "removes item", "ancestorTitles": ["Cart"], "status": "failed",
         "failureMessages": ["expected 0", "received 1"]},
        {"title": "totals", "status": "passed"},
        {"title": "discounts", "status": "pending"}
      ]
    }]
  })");
  ASSERT_EQ(res.suites.size(), 1);
  auto& suite = res.suites[0];
  EXPECT_EQ(suite.file, "/app/src/cart.test.js");
  ASSERT_TRUE(suite.duration);
  EXPECT_DOUBLE_EQ(*suite.duration, 2.5);
  ASSERT_EQ(suite.test_cases.size(), 4);
  EXPECT_EQ(suite.test_cases[0].class_name, "Cart > add");
  EXPECT_DOUBLE_EQ(suite.test_cases[0].duration.value_or(0), 0.012);
  EXPECT_EQ(suite.test_cases[1].error_message, "expected 0\nreceived 1");
  EXPECT_EQ(suite.test_cases[3].status, TestStatus::SKIPPED);
  EXPECT_EQ(res.total_tests, 4);
  EXPECT_EQ(res.total_passed, 2);
  EXPECT_EQ(res.total_failed, 1);
  EXPECT_EQ(res.total_skipped, 1);
  EXPECT_EQ(res.total_errors, 0);
}

TEST(JestTest, Malformed) {
  auto res = ParseJestJSON("{\"testResults\": [");
  EXPECT_EQ(res.total_tests, 0);
  EXPECT_TRUE(res.suites.empty());
}

TEST(TestReportTest, Dispatch) {
  EXPECT_EQ(ParseTestReport(ReportFormat::TAP, "1..1\nok 1\n").total_passed, 1);
  EXPECT_EQ(ParseTestReport(ReportFormat::JUNIT, "<testcase name=\"x\"/>").total_passed, 1);
  EXPECT_EQ(ParseTestReport(ReportFormat::JEST, "{}").total_tests, 0);
}

TEST(CoverageTest, IstanbulFinal) {
  auto report = ParseCoverageJSON(R"({
    "/app/src/a.js": {
      "path": "/app/src/a.js",
      "statementMap": {
        "0": {"start": {"line": 1, "column": 0}, "end": {"line": 1, "column": 10}},
        "1": {"start": {"line": 2, "column": 0}, "end": {"line": 2, "column": 10}},
        "2": {"start": {"line": 2, "column": 12}, "end": {"line": 2, "column": 20}},
        "3": {"start": {"line": 5, "column": 0}, "end": {"line": 5, "column": 10}}
      },
      "s": {"0": 1, "1": 0, "2": 3, "3": 0},
      "f": {"0": 1, "1": 0},
      "b": {"0": [1, 0], "1": [0, 0]}
    }
  })");
  ASSERT_EQ(report.files.size(), 1);
  auto& file = report.files[0];
  EXPECT_EQ(file.lines.total, 3);
  EXPECT_EQ(file.lines.covered, 2);
  EXPECT_EQ(file.statements.total, 4);
  EXPECT_EQ(file.statements.covered, 2);
  EXPECT_EQ(file.functions.covered, 1);
  EXPECT_EQ(file.branches.total, 4);
  EXPECT_EQ(file.branches.covered, 1);
  EXPECT_DOUBLE_EQ(report.summary.branches.percentage, 25);
  EXPECT_NEAR(report.summary.lines.percentage, 66.6667, 1e-3);
}

TEST(CoverageTest, Summary) {
  auto report = ParseCoverageJSON(R"({
    "total": {"lines": {"total": 100, "covered": 1}},
    "src/a.js": {"lines": {"total": 10, "covered": 8}, "branches": {"total": 4, "covered": 2}},
    "src/b.js": {"lines": {"total": 10, "covered": 10}},
    "bogus": 3
  })");
  ASSERT_EQ(report.files.size(), 2);
  EXPECT_EQ(report.summary.lines.total, 20);
  EXPECT_EQ(report.summary.lines.covered, 18);
  EXPECT_DOUBLE_EQ(report.summary.lines.percentage, 90);
  EXPECT_DOUBLE_EQ(report.summary.functions.percentage, 0);
}

TEST(CoverageTest, Malformed) {
  EXPECT_TRUE(ParseCoverageJSON("[1, 2").files.empty());
  EXPECT_TRUE(ParseCoverageJSON("[]").files.empty());
}

TEST(ESLintTest, Counts) {
  auto res = ParseESLintJSON(R"([
    {"filePath": "/app/src/a.js", "errorCount": 1, "warningCount": 1, "fixableErrorCount": 1,
     "fixableWarningCount": 0, "messages": [
       {"ruleId": "no-unused-vars", "severity": 2, "message": "x is unused", "line": 3, "column": 7},
       {"ruleId": null, "severity": 1, "message": "parsing hint", "line": 9, "column": 1}
     ]},
    {"filePath": "/app/src/b.js", "errorCount": 0, "warningCount": 2, "messages": []}
  ])");
  EXPECT_EQ(res.error_count, 1);
  EXPECT_EQ(res.warning_count, 3);
  EXPECT_EQ(res.fixable_error_count, 1);
  ASSERT_EQ(res.issues.size(), 2);
  EXPECT_EQ(res.issues[0].rule, "no-unused-vars");
  EXPECT_EQ(res.issues[0].severity, LintSeverity::ERROR);
  EXPECT_EQ(res.issues[0].line, 3);
  EXPECT_TRUE(res.issues[1].rule.empty());
  EXPECT_EQ(res.issues[1].severity, LintSeverity::WARNING);
}

TEST(ESLintTest, Malformed) {
  auto res = ParseESLintJSON("{\"not\": \"an array\"}");
  EXPECT_EQ(res.error_count, 0);
  EXPECT_TRUE(res.issues.empty());
}
