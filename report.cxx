#include "report.hxx"

#include "analyzer.hxx"

#include <format>
#include <ostream>

std::string_view severityPrefix(Severity severity)
{
	switch (severity) {
	case Severity::Error:
		return "[error]";
	case Severity::Warning:
		return "[warn]";
	case Severity::Info:
		return "[info]";
	case Severity::Ignore:
		break;
	}
	return {};
}

void printReport(std::ostream& out, const AnalysisReport& report)
{
	if (report.totalCommits == 0) {
		out << "No commits found in repository.\n";
		return;
	}
	if (!report.hasReportableFindings()) {
		out << "Commit messages are adequately executed.\n";
		return;
	}

	std::size_t withIssues{};
	for (const CommitFindings& r: report.results) {
		if (r.reportable()) {
			++withIssues;
		}
	}

	out << std::format(
		"Analyzed {} of {} total commits on path {}\n\n", report.analyzedCommits, report.totalCommits,
		report.path.string());
	out << std::format(
		"Found {} commits with issues ({} errors, {} warnings) (threshold: {} chars):\n\n", withIssues,
		report.errorCommitCount(), report.warningCommitCount(), report.threshold);

	for (const CommitFindings& r: report.results) {
		if (!r.reportable()) {
			continue;
		}
		out << std::format("  {}: \"{}\"\n", r.commit.hash(), r.commit.subject());
		for (const Finding& f: r.findings) {
			if (f.severity == Severity::Ignore) {
				continue;
			}
			out << std::format("    {} {}\n", severityPrefix(f.severity), description(f.validation));
		}
	}
	out.flush();
}
