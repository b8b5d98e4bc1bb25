#ifndef INCLUDE_ARBITER_UTILS_H_
#define INCLUDE_ARBITER_UTILS_H_

#include <string>
#include <cstdint>

#include "queue.h"
#include "rubric.h"
#include "scoring.h"
#include "judging.h"
#include "database.h"

// UNIX timestamp, milliseconds
int64_t UnixMillis();

const char* RunStatusName(RunStatus);
RunStatus GetRunStatus(const std::string&);

const char* JudgingStatusName(JudgingStatus);
const char* JobStateName(JobState);

const char* TestStatusName(TestStatus);
const char* LintSeverityName(LintSeverity);

const char* RequirementTypeName(RequirementType);
// false if unknown
bool GetRequirementType(const std::string&, RequirementType&);

const char* TieBreakerName(TieBreaker);
bool GetTieBreaker(const std::string&, TieBreaker&);

const char* ReportFormatName(ReportFormat);
bool GetReportFormat(const std::string&, ReportFormat&);

const char* WinnerName(Winner);

#endif  // INCLUDE_ARBITER_UTILS_H_
