#include <arbiter/rubric.h>

#include <cmath>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <arbiter/errors.h>
#include "utils.h"

const std::vector<TieBreaker> kDefaultTieBreakers = {
  TieBreaker::TESTS_PASSED, TieBreaker::CRITICAL_ERRORS, TieBreaker::SUBMIT_TIME,
};

bool RubricRequirement::HasEvidence(const std::string& type) const {
  return std::find(evidence.begin(), evidence.end(), type) != evidence.end();
}

double TotalWeight(const Rubric& rubric) {
  double ret = 0;
  for (auto& i : rubric.requirements) ret += i.weight;
  return ret;
}

namespace {

using nlohmann::json;

std::string RequiredString(const json& obj, const char* key, const std::string& where) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    throw InvalidInputError(fmt::format("{}: missing string field '{}'", where, key));
  }
  return it->get<std::string>();
}

std::vector<std::string> StringList(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return {};
  return it->get<std::vector<std::string>>();
}

// "npm test" or {"command": "npm", "args": ["test"], "cwd": "", "timeout": 300}
ExecutionCommand ParseCommand(const json& obj, const std::string& where) {
  ExecutionCommand cmd;
  if (obj.is_string()) {
    cmd.command = obj.get<std::string>();
    return cmd;
  }
  cmd.command = RequiredString(obj, "command", where);
  cmd.args = StringList(obj, "args");
  cmd.cwd = obj.value("cwd", "");
  cmd.timeout_seconds = obj.value("timeout", obj.value("timeoutSeconds", 0));
  return cmd;
}

RubricCheck ParseCheck(const json& obj, const std::string& req_id) {
  RubricCheck check;
  std::string where = "check of requirement " + req_id;
  check.id = RequiredString(obj, "id", where);
  where = fmt::format("check {}/{}", req_id, check.id);
  check.name = obj.value("name", check.id);
  check.command = RequiredString(obj, "command", where);
  check.args = StringList(obj, "args");
  check.expected_exit_code = obj.value("expectedExitCode", 0);
  check.timeout_seconds = obj.value("timeout", obj.value("timeoutSeconds", 60));
  if (check.timeout_seconds <= 0) check.timeout_seconds = 60;
  check.points = obj.value("points", 0.0);
  if (check.points < 0) throw InvalidInputError(where + ": negative points");
  return check;
}

RubricRequirement ParseRequirement(const json& obj) {
  RubricRequirement req;
  req.id = RequiredString(obj, "id", "requirement");
  std::string where = "requirement " + req.id;
  req.name = obj.contains("name") ? RequiredString(obj, "name", where) : obj.value("title", req.id);
  req.description = obj.value("description", "");
  req.weight = obj.value("weight", 0.0);
  if (req.weight < 0 || req.weight > 100) {
    throw InvalidInputError(fmt::format("{}: weight {} out of range", where, req.weight));
  }
  std::string type = obj.value("type", "automated");
  if (!GetRequirementType(type, req.type)) {
    throw InvalidInputError(fmt::format("{}: unknown type {}", where, type));
  }
  if (auto it = obj.find("checks"); it != obj.end()) {
    for (auto& check : *it) req.checks.push_back(ParseCheck(check, req.id));
  }
  req.evidence = StringList(obj, "evidence");
  req.tests = StringList(obj, "tests");
  return req;
}

RubricReports ParseReports(const json& obj) {
  RubricReports reports;
  if (auto it = obj.find("tests"); it != obj.end()) {
    if (it->is_string()) {
      reports.tests = it->get<std::string>();
    } else {
      reports.tests = RequiredString(*it, "path", "reports.tests");
      std::string format = it->value("format", "junit");
      if (!GetReportFormat(format, reports.tests_format)) {
        throw InvalidInputError("reports.tests: unknown format " + format);
      }
    }
  }
  reports.coverage = obj.value("coverage", "");
  reports.lint = obj.value("lint", "");
  return reports;
}

} // namespace

Rubric ParseRubric(const nlohmann::json& data) {
  Rubric rubric;
  try {
    if (!data.is_object()) throw InvalidInputError("rubric is not an object");
    auto reqs = data.find("requirements");
    if (reqs == data.end() || !reqs->is_array()) throw InvalidInputError("rubric has no requirements");
    if (auto it = data.find("version"); it != data.end()) {
      rubric.version = it->is_string() ? it->get<std::string>() : it->dump();
    }
    for (auto& req : *reqs) rubric.requirements.push_back(ParseRequirement(req));
    if (auto it = data.find("buildCommand"); it != data.end() && !it->is_null()) {
      rubric.build_command = ParseCommand(*it, "buildCommand");
    }
    if (auto it = data.find("installCommand"); it != data.end() && !it->is_null()) {
      rubric.install_command = ParseCommand(*it, "installCommand");
    }
    if (auto it = data.find("tieBreakers"); it != data.end() && it->is_array()) {
      rubric.tie_breakers.clear();
      for (auto& i : *it) {
        TieBreaker tie_breaker;
        std::string name = i.get<std::string>();
        if (GetTieBreaker(name, tie_breaker)) {
          rubric.tie_breakers.push_back(tie_breaker);
        } else {
          spdlog::warn("Ignoring unknown tie-breaker {}", name);
        }
      }
    }
    if (auto it = data.find("reports"); it != data.end() && it->is_object()) {
      rubric.reports = ParseReports(*it);
    }
  } catch (const nlohmann::json::exception& err) {
    throw InvalidInputError(fmt::format("Malformed rubric: {}", err.what()));
  }
  double total_weight = TotalWeight(rubric);
  if (std::abs(total_weight - 100) > 1e-9) {
    spdlog::warn("Rubric weights sum to {}, expected 100", total_weight);
  }
  return rubric;
}

Rubric ParseRubricText(const std::string& str) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(str);
  } catch (const nlohmann::json::exception& err) {
    throw InvalidInputError(fmt::format("Malformed rubric: {}", err.what()));
  }
  return ParseRubric(data);
}
