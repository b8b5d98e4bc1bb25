#include <arbiter/scoring.h>

#include <map>
#include <algorithm>
#include <sstream>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using nlohmann::json;

std::string Trim(const std::string& str) {
  size_t begin = str.find_first_not_of(" \n\r\t");
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(" \n\r\t") + 1 - begin);
}

std::optional<double> ParseDouble(const std::string& str) {
  if (str.empty()) return std::nullopt;
  char* end;
  double ret = strtod(str.c_str(), &end);
  if (end == str.c_str()) return std::nullopt;
  return ret;
}

int ParseInt(const std::string& str) {
  return (int)strtol(str.c_str(), nullptr, 10);
}

void SumTotals(TestResults& res) {
  res.total_tests = res.total_passed = res.total_failed = res.total_skipped = res.total_errors = 0;
  for (auto& suite : res.suites) {
    res.total_tests += suite.tests;
    res.total_passed += suite.passed;
    res.total_failed += suite.failed;
    res.total_skipped += suite.skipped;
    res.total_errors += suite.errors;
    if (suite.duration) res.duration = res.duration.value_or(0) + *suite.duration;
  }
}

void CountCases(TestSuite& suite) {
  suite.tests = suite.test_cases.size();
  suite.passed = suite.failed = suite.skipped = suite.errors = 0;
  for (auto& i : suite.test_cases) {
    switch (i.status) {
      case TestStatus::PASSED: suite.passed++; break;
      case TestStatus::FAILED: suite.failed++; break;
      case TestStatus::SKIPPED: suite.skipped++; break;
      case TestStatus::ERROR: suite.errors++; break;
    }
  }
}

// JUnit XML; a tolerant tag scanner, not a validating parser

std::string DecodeEntities(const std::string& str) {
  static const std::map<std::string, std::string> kEntities = {
    {"lt", "<"}, {"gt", ">"}, {"amp", "&"}, {"quot", "\""}, {"apos", "'"},
  };
  std::string ret;
  for (size_t i = 0; i < str.size(); i++) {
    size_t semi;
    if (str[i] != '&' || (semi = str.find(';', i)) == std::string::npos || semi - i > 10) {
      ret += str[i];
      continue;
    }
    std::string name = str.substr(i + 1, semi - i - 1);
    if (auto it = kEntities.find(name); it != kEntities.end()) {
      ret += it->second;
    } else if (name.size() > 1 && name[0] == '#') {
      long code = name[1] == 'x' ? strtol(name.c_str() + 2, nullptr, 16) : strtol(name.c_str() + 1, nullptr, 10);
      if (code > 0 && code < 0x80) {
        ret += (char)code;
      } else {
        ret += '?';
      }
    } else {
      ret += str.substr(i, semi - i + 1);
    }
    i = semi;
  }
  return ret;
}

struct XMLTag {
  std::string name;
  std::map<std::string, std::string> attrs;
  bool closing = false, self_closing = false;

  std::string Attr(const std::string& key) const {
    auto it = attrs.find(key);
    return it == attrs.end() ? "" : it->second;
  }
  bool Has(const std::string& key) const { return attrs.count(key); }
};

bool IsNameChar(char c) {
  return isalnum((unsigned char)c) || c == '_' || c == ':' || c == '.' || c == '-';
}

// body is the text between '<' and '>'
XMLTag ParseTag(std::string body) {
  XMLTag tag;
  if (!body.empty() && body[0] == '/') {
    tag.closing = true;
    body.erase(0, 1);
  }
  if (!body.empty() && body.back() == '/') {
    tag.self_closing = true;
    body.pop_back();
  }
  size_t name_end = body.find_first_of(" \n\r\t");
  tag.name = body.substr(0, name_end);
  if (name_end == std::string::npos) return tag;
  // name = "value" | name = 'value'; anything else is skipped
  size_t pos = name_end;
  while (pos < body.size()) {
    if (!IsNameChar(body[pos])) {
      pos++;
      continue;
    }
    size_t key_begin = pos;
    while (pos < body.size() && IsNameChar(body[pos])) pos++;
    std::string key = body.substr(key_begin, pos - key_begin);
    pos = body.find_first_not_of(" \n\r\t", pos);
    if (pos == std::string::npos || body[pos] != '=') continue;
    pos = body.find_first_not_of(" \n\r\t", pos + 1);
    if (pos == std::string::npos) break;
    char quote = body[pos];
    if (quote != '"' && quote != '\'') continue;
    size_t value_end = body.find(quote, pos + 1);
    if (value_end == std::string::npos) break;
    tag.attrs[key] = DecodeEntities(body.substr(pos + 1, value_end - pos - 1));
    pos = value_end + 1;
  }
  return tag;
}

class JUnitScanner {
  struct OpenSuite {
    TestSuite suite;
    std::optional<int> tests, failures, errors, skipped;
    bool has_children = false;
  };
  TestResults res_;
  std::vector<OpenSuite> suites_;
  std::optional<TestSuite> default_suite_;
  std::optional<TestCase> testcase_;
  std::string* text_ = nullptr; // where character data goes

  void OpenSuite_(const XMLTag& tag) {
    if (!suites_.empty()) suites_.back().has_children = true;
    OpenSuite s;
    s.suite.name = tag.Attr("name");
    s.suite.file = tag.Attr("file");
    s.suite.duration = ParseDouble(tag.Attr("time"));
    if (tag.Has("tests")) s.tests = ParseInt(tag.Attr("tests"));
    if (tag.Has("failures")) s.failures = ParseInt(tag.Attr("failures"));
    if (tag.Has("errors")) s.errors = ParseInt(tag.Attr("errors"));
    if (tag.Has("skipped")) {
      s.skipped = ParseInt(tag.Attr("skipped"));
    } else if (tag.Has("disabled")) {
      s.skipped = ParseInt(tag.Attr("disabled"));
    }
    suites_.push_back(std::move(s));
  }

  void CloseSuite_() {
    if (suites_.empty()) return;
    OpenSuite s = std::move(suites_.back());
    suites_.pop_back();
    // a suite holding only other suites is a container
    if (s.has_children && s.suite.test_cases.empty()) return;
    TestSuite& suite = s.suite;
    CountCases(suite);
    if (s.tests) {
      suite.tests = *s.tests;
      suite.failed = s.failures.value_or(0);
      suite.errors = s.errors.value_or(0);
      suite.skipped = s.skipped.value_or(0);
      suite.passed = std::max(0, suite.tests - suite.failed - suite.errors - suite.skipped);
    }
    res_.suites.push_back(std::move(suite));
  }

  void OpenCase_(const XMLTag& tag) {
    TestCase tc;
    tc.name = tag.Attr("name");
    tc.class_name = tag.Attr("classname");
    tc.file = tag.Attr("file");
    tc.duration = ParseDouble(tag.Attr("time"));
    testcase_ = std::move(tc);
  }

  void CloseCase_() {
    if (!testcase_) return;
    testcase_->stack_trace = Trim(testcase_->stack_trace);
    if (!suites_.empty()) {
      suites_.back().suite.test_cases.push_back(std::move(*testcase_));
    } else {
      if (!default_suite_) {
        default_suite_.emplace();
        default_suite_->name = "default";
      }
      default_suite_->test_cases.push_back(std::move(*testcase_));
    }
    testcase_.reset();
    text_ = nullptr;
  }

  void Outcome_(const XMLTag& tag) {
    if (!testcase_) return;
    TestStatus status = tag.name == "failure" ? TestStatus::FAILED :
                        tag.name == "error" ? TestStatus::ERROR : TestStatus::SKIPPED;
    // failure > error > skipped
    if (testcase_->status == TestStatus::FAILED) return;
    if (testcase_->status == TestStatus::ERROR && status == TestStatus::SKIPPED) return;
    testcase_->status = status;
    if (status == TestStatus::SKIPPED) {
      if (tag.Has("message")) testcase_->error_message = tag.Attr("message");
      return;
    }
    testcase_->error_message = tag.Attr("message");
    testcase_->error_type = tag.Attr("type");
    testcase_->stack_trace.clear();
    if (!tag.self_closing) text_ = &testcase_->stack_trace;
  }

  void Text_(const std::string& str, bool raw) {
    if (text_) *text_ += raw ? str : DecodeEntities(str);
  }

 public:
  TestResults Scan(const std::string& xml) {
    size_t pos = 0;
    while (pos < xml.size()) {
      size_t lt = xml.find('<', pos);
      if (lt == std::string::npos) {
        Text_(xml.substr(pos), false);
        break;
      }
      Text_(xml.substr(pos, lt - pos), false);
      if (xml.compare(lt, 4, "<!--") == 0) {
        size_t end = xml.find("-->", lt);
        if (end == std::string::npos) break;
        pos = end + 3;
        continue;
      }
      if (xml.compare(lt, 9, "<![CDATA[") == 0) {
        size_t end = xml.find("]]>", lt);
        if (end == std::string::npos) break;
        Text_(xml.substr(lt + 9, end - lt - 9), true);
        pos = end + 3;
        continue;
      }
      size_t gt = xml.find('>', lt);
      if (gt == std::string::npos) break;
      pos = gt + 1;
      if (xml[lt + 1] == '?' || xml[lt + 1] == '!') continue;
      XMLTag tag = ParseTag(Trim(xml.substr(lt + 1, gt - lt - 1)));
      if (tag.name == "testsuite") {
        if (!tag.closing) OpenSuite_(tag);
        if (tag.closing || tag.self_closing) CloseSuite_();
      } else if (tag.name == "testcase") {
        if (!tag.closing) OpenCase_(tag);
        if (tag.closing || tag.self_closing) CloseCase_();
      } else if (tag.name == "failure" || tag.name == "error" || tag.name == "skipped") {
        if (tag.closing) {
          text_ = nullptr;
        } else {
          Outcome_(tag);
        }
      }
    }
    // unterminated document
    if (testcase_) CloseCase_();
    while (!suites_.empty()) CloseSuite_();
    if (default_suite_) {
      CountCases(*default_suite_);
      res_.suites.push_back(std::move(*default_suite_));
    }
    SumTotals(res_);
    return std::move(res_);
  }
};

struct TapLine {
  bool ok = false;
  std::string number;
  std::string description;
};

// "ok 3 - name", "not ok", "ok name # SKIP reason"
bool SplitTapLine(const std::string& line, TapLine& out) {
  size_t pos;
  if (line.compare(0, 6, "not ok") == 0) {
    out.ok = false;
    pos = 6;
  } else if (line.compare(0, 2, "ok") == 0) {
    out.ok = true;
    pos = 2;
  } else {
    return false;
  }
  if (pos < line.size() && !isspace((unsigned char)line[pos])) return false;
  auto skip_space = [&]() {
    while (pos < line.size() && isspace((unsigned char)line[pos])) pos++;
  };
  skip_space();
  size_t num_begin = pos;
  while (pos < line.size() && isdigit((unsigned char)line[pos])) pos++;
  out.number = line.substr(num_begin, pos - num_begin);
  skip_space();
  if (pos < line.size() && line[pos] == '-') {
    pos++;
    skip_space();
  }
  out.description = line.substr(pos);
  return true;
}

// "# SKIP reason" / "# TODO reason"; cuts the directive off desc
bool FindDirective(std::string& desc, std::string& reason) {
  for (size_t hash = desc.find('#'); hash != std::string::npos; hash = desc.find('#', hash + 1)) {
    size_t pos = desc.find_first_not_of(" \t", hash + 1);
    if (pos == std::string::npos || desc.size() - pos < 4) continue;
    std::string word = Lowercase(desc.substr(pos, 4));
    if (word != "skip" && word != "todo") continue;
    size_t after = pos + 4;
    if (after < desc.size() && (isalnum((unsigned char)desc[after]) || desc[after] == '_')) continue;
    reason = Trim(desc.substr(after));
    desc.erase(hash);
    return true;
  }
  return false;
}

} // namespace

TestResults ParseJUnitXML(const std::string& xml) {
  return JUnitScanner().Scan(xml);
}

TestResults ParseTAP(const std::string& tap) {
  TestResults res;
  TestSuite suite;
  suite.name = "TAP Results";
  int plan = 0;
  std::istringstream stream(tap);
  std::string line;
  while (std::getline(stream, line)) {
    line = Trim(line);
    if (line.compare(0, 3, "1..") == 0 && line.size() > 3 && isdigit((unsigned char)line[3])) {
      plan = ParseInt(line.substr(3));
      continue;
    }
    TapLine m;
    if (!SplitTapLine(line, m)) continue;
    TestCase tc;
    std::string desc = m.description;
    std::string reason;
    bool skipped = FindDirective(desc, reason);
    if (skipped) tc.error_message = reason;
    desc = Trim(desc);
    tc.name = desc.empty() ? "test " + (m.number.size() ? m.number : std::to_string(suite.test_cases.size() + 1)) : desc;
    if (skipped) {
      tc.status = TestStatus::SKIPPED;
    } else if (m.ok) {
      tc.status = TestStatus::PASSED;
    } else {
      tc.status = TestStatus::FAILED;
      tc.error_message = "Test failed: " + desc;
    }
    suite.test_cases.push_back(std::move(tc));
  }
  CountCases(suite);
  suite.tests = std::max(plan, suite.tests);
  res.suites.push_back(std::move(suite));
  SumTotals(res);
  return res;
}

TestResults ParseJestJSON(const std::string& str) {
  TestResults res;
  try {
    json data = json::parse(str);
    if (auto it = data.find("testResults"); it != data.end() && it->is_array()) {
      for (auto& file : *it) {
        TestSuite suite;
        suite.name = suite.file = file.value("name", "");
        if (file.value("startTime", json()).is_number() && file.value("endTime", json()).is_number()) {
          suite.duration = (file["endTime"].get<double>() - file["startTime"].get<double>()) / 1000;
        }
        if (auto ar = file.find("assertionResults"); ar != file.end() && ar->is_array()) {
          for (auto& a : *ar) {
            TestCase tc;
            tc.name = a.contains("title") ? a.value("title", "") : a.value("fullName", "");
            if (auto anc = a.find("ancestorTitles"); anc != a.end() && anc->is_array() && !anc->empty()) {
              std::string cls;
              for (auto& i : *anc) {
                if (!cls.empty()) cls += " > ";
                cls += i.get<std::string>();
              }
              tc.class_name = cls;
            }
            if (auto d = a.find("duration"); d != a.end() && d->is_number()) tc.duration = d->get<double>() / 1000;
            std::string status = a.value("status", "");
            if (status == "passed") {
              tc.status = TestStatus::PASSED;
            } else if (status == "failed") {
              tc.status = TestStatus::FAILED;
            } else if (status == "pending" || status == "skipped" || status == "todo") {
              tc.status = TestStatus::SKIPPED;
            } else {
              tc.status = TestStatus::ERROR;
            }
            if (auto fm = a.find("failureMessages"); fm != a.end() && fm->is_array()) {
              for (auto& i : *fm) {
                if (!tc.error_message.empty()) tc.error_message += '\n';
                tc.error_message += i.get<std::string>();
              }
            }
            suite.test_cases.push_back(std::move(tc));
          }
        }
        CountCases(suite);
        res.suites.push_back(std::move(suite));
      }
    }
    SumTotals(res);
    if (data.value("numTotalTests", 0) > 0) {
      res.total_tests = data.value("numTotalTests", 0);
      res.total_passed = data.value("numPassedTests", 0);
      res.total_failed = data.value("numFailedTests", 0);
      res.total_skipped = data.value("numPendingTests", 0) + data.value("numTodoTests", 0);
      res.total_errors = std::max(0, res.total_tests - res.total_passed - res.total_failed - res.total_skipped);
    }
  } catch (const json::exception& err) {
    spdlog::warn("Failed to parse Jest report: {}", err.what());
    return {};
  }
  return res;
}

TestResults ParseTestReport(ReportFormat format, const std::string& str) {
  switch (format) {
    case ReportFormat::JUNIT: return ParseJUnitXML(str);
    case ReportFormat::TAP: return ParseTAP(str);
    case ReportFormat::JEST: return ParseJestJSON(str);
  }
  __builtin_unreachable();
}

namespace {

void Finish(CoverageMetric& m) {
  m.percentage = m.total ? 100.0 * m.covered / m.total : 0;
}

void Accumulate(CoverageMetric& sum, const CoverageMetric& m) {
  sum.covered += m.covered;
  sum.total += m.total;
}

// counters of a hit map, {"1": 3, "2": 0}
CoverageMetric HitMetric(const json& hits) {
  CoverageMetric m;
  for (auto& [key, val] : hits.items()) {
    if (val.is_array()) {
      for (auto& i : val) {
        m.total++;
        if (i.is_number() && i.get<double>() > 0) m.covered++;
      }
    } else if (val.is_number()) {
      m.total++;
      if (val.get<double>() > 0) m.covered++;
    }
  }
  return m;
}

// istanbul's coverage-final.json has no line map; derive one from the statements
CoverageMetric LinesFromStatements(const json& entry) {
  std::map<long, bool> lines;
  auto& statements = entry.at("statementMap");
  for (auto& [key, val] : entry.at("s").items()) {
    auto it = statements.find(key);
    if (it == statements.end()) continue;
    long line = it->value("start", json::object()).value("line", 0L);
    bool hit = val.is_number() && val.get<double>() > 0;
    lines[line] = lines[line] || hit;
  }
  CoverageMetric m;
  for (auto& [line, hit] : lines) {
    m.total++;
    if (hit) m.covered++;
  }
  return m;
}

// coverage-summary.json: {"lines": {"total": 10, "covered": 8, "pct": 80}, ...}
CoverageMetric SummaryMetric(const json& entry, const char* key) {
  CoverageMetric m;
  if (auto it = entry.find(key); it != entry.end() && it->is_object()) {
    m.total = it->value("total", 0L);
    m.covered = it->value("covered", 0L);
  }
  return m;
}

} // namespace

CoverageReport ParseCoverageJSON(const std::string& str) {
  CoverageReport report;
  try {
    json data = json::parse(str);
    if (!data.is_object()) return report;
    for (auto& [name, entry] : data.items()) {
      if (name == "total" || !entry.is_object()) continue;
      FileCoverage file;
      file.file = entry.value("path", name);
      if (entry.contains("lines") && entry["lines"].is_object()) {
        file.lines = SummaryMetric(entry, "lines");
        file.branches = SummaryMetric(entry, "branches");
        file.functions = SummaryMetric(entry, "functions");
        file.statements = SummaryMetric(entry, "statements");
      } else {
        if (entry.contains("l")) {
          file.lines = HitMetric(entry["l"]);
        } else if (entry.contains("s") && entry.contains("statementMap")) {
          file.lines = LinesFromStatements(entry);
        }
        if (entry.contains("b")) file.branches = HitMetric(entry["b"]);
        if (entry.contains("f")) file.functions = HitMetric(entry["f"]);
        if (entry.contains("s")) file.statements = HitMetric(entry["s"]);
      }
      for (auto* m : {&file.lines, &file.branches, &file.functions, &file.statements}) Finish(*m);
      Accumulate(report.summary.lines, file.lines);
      Accumulate(report.summary.branches, file.branches);
      Accumulate(report.summary.functions, file.functions);
      Accumulate(report.summary.statements, file.statements);
      report.files.push_back(std::move(file));
    }
  } catch (const json::exception& err) {
    spdlog::warn("Failed to parse coverage report: {}", err.what());
    return {};
  }
  auto& s = report.summary;
  for (auto* m : {&s.lines, &s.branches, &s.functions, &s.statements}) Finish(*m);
  return report;
}

LintResults ParseESLintJSON(const std::string& str) {
  LintResults res;
  try {
    json data = json::parse(str);
    if (!data.is_array()) return res;
    for (auto& file : data) {
      std::string path = file.value("filePath", "");
      if (auto it = file.find("messages"); it != file.end() && it->is_array()) {
        for (auto& msg : *it) {
          LintIssue issue;
          issue.file = path;
          issue.line = msg.value("line", 0);
          issue.column = msg.value("column", 0);
          int severity = msg.value("severity", 0);
          issue.severity = severity == 2 ? LintSeverity::ERROR :
                           severity == 1 ? LintSeverity::WARNING : LintSeverity::INFO;
          if (auto rule = msg.find("ruleId"); rule != msg.end() && rule->is_string()) {
            issue.rule = rule->get<std::string>();
          }
          issue.message = msg.value("message", "");
          res.issues.push_back(std::move(issue));
        }
      }
      res.error_count += file.value("errorCount", 0);
      res.warning_count += file.value("warningCount", 0);
      res.fixable_error_count += file.value("fixableErrorCount", 0);
      res.fixable_warning_count += file.value("fixableWarningCount", 0);
    }
  } catch (const json::exception& err) {
    spdlog::warn("Failed to parse ESLint report: {}", err.what());
    return {};
  }
  return res;
}
