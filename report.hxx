#pragma once

#include "validation.hxx"

#include <iosfwd>
#include <string_view>

struct AnalysisReport;

// "[error]", "[warn]", "[info]", empty for Severity::Ignore
std::string_view severityPrefix(Severity severity);

/**
 * @brief Prints a human readable summary of @p report, ignored findings are left out
 */
void printReport(std::ostream& out, const AnalysisReport& report);
