#include "analyzer.hxx"

#include "config.hxx"
#include "report.hxx"
#include "repository.hxx"
#include "validator.hxx"

#include <algorithm>
#include <cstdint>
#include <format>
#include <iostream>
#include <utility>

namespace {
	namespace keys {
		constexpr const char* threshold{"lint-commits.threshold"};
		constexpr const char* strict{"lint-commits.strict"};
		constexpr const char* disable{"lint-commits.disable"};
		constexpr const char* error{"lint-commits.error"};
		constexpr const char* warn{"lint-commits.warn"};
		constexpr const char* info{"lint-commits.info"};
		constexpr const char* ignore{"lint-commits.ignore"};
		constexpr const char* referencePattern{"lint-commits.referencePattern"};
		constexpr const char* vaguePattern{"lint-commits.vaguePattern"};
		constexpr const char* wipPattern{"lint-commits.wipPattern"};
		constexpr const char* type{"lint-commits.type"};
	} // namespace keys

	bool fails(const Finding& finding, bool strict)
	{
		return finding.severity == Severity::Error || (strict && finding.severity == Severity::Warning);
	}

	std::string failureMessage(const AnalysisReport& report, bool strict)
	{
		auto failing = [strict](const CommitFindings& r) {
			return std::ranges::any_of(r.findings, [strict](const Finding& f) { return fails(f, strict); });
		};

		std::string message{
			std::format("Found {} commits with validation issues", std::ranges::count_if(report.results, failing))};
		for (const CommitFindings& r: report.results) {
			for (const Finding& f: r.findings) {
				if (fails(f, strict)) {
					message += std::format(
						"\n  {}: {} ({})", r.commit.hash(), name(f.validation), toString(f.severity));
				}
			}
		}
		return message;
	}

	// lint-commits.<severity> entries are lists themselves, i.e. "short, wip"
	void applySeverities(ValidationConfig& config, const Config& gitConfig, const char* key, Severity severity)
	{
		for (const std::string& list: gitConfig.readMultiString(key)) {
			try {
				config.parseAndSetSeverity(list, severity);
			} catch (const UnknownValidation& e) {
				std::cerr << "Ignoring " << key << ": " << e.what() << std::endl;
			}
		}
	}

	void replaceIfSet(std::vector<std::string>& destination, const Config& gitConfig, const char* key)
	{
		if (std::vector<std::string> values = gitConfig.readMultiString(key); !values.empty()) {
			destination = std::move(values);
		}
	}
} // namespace

bool CommitFindings::has(Severity severity) const
{
	return std::ranges::any_of(findings, [severity](const Finding& f) { return f.severity == severity; });
}

bool CommitFindings::reportable() const
{
	return std::ranges::any_of(findings, [](const Finding& f) { return f.severity != Severity::Ignore; });
}

bool AnalysisReport::hasErrors() const
{
	return std::ranges::any_of(results, [](const CommitFindings& r) { return r.has(Severity::Error); });
}

bool AnalysisReport::hasWarnings() const
{
	return std::ranges::any_of(results, [](const CommitFindings& r) { return r.has(Severity::Warning); });
}

bool AnalysisReport::hasReportableFindings() const
{
	return std::ranges::any_of(results, &CommitFindings::reportable);
}

std::size_t AnalysisReport::errorCommitCount() const
{
	return static_cast<std::size_t>(
		std::ranges::count_if(results, [](const CommitFindings& r) { return r.has(Severity::Error); }));
}

std::size_t AnalysisReport::warningCommitCount() const
{
	return static_cast<std::size_t>(
		std::ranges::count_if(results, [](const CommitFindings& r) { return r.has(Severity::Warning); }));
}

bool AnalysisReport::failed(bool strict) const
{
	return hasErrors() || (strict && hasWarnings());
}

ValidationFailed::ValidationFailed(AnalysisReport report, bool strict)
	: std::runtime_error(failureMessage(report, strict))
	, report_{std::move(report)}
{
}

ValidationConfig resolveConfig(const AnalyzeOptions& options)
{
	if (options.config) {
		return *options.config;
	}
	return ValidationConfig{{.threshold = options.threshold}};
}

AnalysisReport validateCommits(
	const std::vector<Commit>& commits, const ValidationConfig& config,
	const std::optional<std::vector<Validation>>& allowList)
{
	CommitValidator validator{config};

	AnalysisReport report;
	report.totalCommits = commits.size();
	report.analyzedCommits = commits.size();
	report.threshold = config.threshold;

	for (const Commit& commit: commits) {
		std::vector<Finding> findings;
		for (Validation v: validator.validate(commit)) {
			if (allowList && !std::ranges::contains(*allowList, v)) {
				continue;
			}
			findings.push_back(Finding{.validation = v, .severity = config.severity(v)});
		}
		if (!findings.empty()) {
			report.results.push_back(CommitFindings{.commit = commit, .findings = std::move(findings)});
		}
	}
	return report;
}

void loadOptions(AnalyzeOptions& options, const Config& config)
{
	ValidationConfig resolved{resolveConfig(options)};

	if (std::optional<std::int64_t> threshold = config.readInt(keys::threshold); threshold.has_value()) {
		if (*threshold < 0) {
			std::cerr << "Ignoring negative " << keys::threshold << ' ' << *threshold << std::endl;
		} else {
			resolved.threshold = static_cast<std::size_t>(*threshold);
		}
	}

	if (std::optional<bool> strict = config.readBool(keys::strict); strict.has_value()) {
		options.strict = *strict;
	}

	for (const std::string& list: config.readMultiString(keys::disable)) {
		try {
			resolved.parseAndDisable(list);
		} catch (const UnknownValidation& e) {
			std::cerr << "Ignoring " << keys::disable << ": " << e.what() << std::endl;
		}
	}

	applySeverities(resolved, config, keys::error, Severity::Error);
	applySeverities(resolved, config, keys::warn, Severity::Warning);
	applySeverities(resolved, config, keys::info, Severity::Info);
	applySeverities(resolved, config, keys::ignore, Severity::Ignore);

	replaceIfSet(resolved.patterns.referencePatterns, config, keys::referencePattern);
	replaceIfSet(resolved.patterns.vaguePatterns, config, keys::vaguePattern);
	replaceIfSet(resolved.patterns.wipPatterns, config, keys::wipPattern);
	replaceIfSet(resolved.patterns.conventionalTypes, config, keys::type);

	options.config = std::move(resolved);
}

void analyzeCommits(const Repository& repo, const AnalyzeOptions& options, std::ostream& out)
{
	const ValidationConfig config{resolveConfig(options)};

	std::vector<Commit> commits{repo.commits(options.limit)};
	AnalysisReport report{validateCommits(commits, config, options.errors)};
	report.path = options.path;
	report.totalCommits = repo.commitCount();

	if (!options.quiet || report.hasReportableFindings()) {
		printReport(out, report);
	}

	if (report.failed(options.strict)) {
		throw ValidationFailed{std::move(report), options.strict};
	}
}

void analyzeCommits(const AnalyzeOptions& options, std::ostream& out)
{
	Repository repo{Repository::open(options.path)};
	analyzeCommits(repo, options, out);
}

void analyzeCommits(const AnalyzeOptions& options)
{
	analyzeCommits(options, std::cout);
}
