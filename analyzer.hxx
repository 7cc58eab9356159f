#pragma once

#include "commit.hxx"
#include "validation-config.hxx"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class Config;
class Repository;

struct AnalyzeOptions {
	std::filesystem::path path{"."};
	// all commits when unset
	std::optional<std::size_t> limit;
	// used only when config is not set
	std::size_t threshold{ValidationConfig::defaultThreshold};
	bool quiet{false};
	// warnings fail the run too
	bool strict{false};
	std::optional<ValidationConfig> config;
	// only these validations may trigger when set
	std::optional<std::vector<Validation>> errors;
};

struct Finding {
	Validation validation;
	Severity severity;

	bool operator==(const Finding&) const = default;
};

struct CommitFindings {
	Commit commit;
	std::vector<Finding> findings;

	bool has(Severity severity) const;
	bool reportable() const;
};

struct AnalysisReport {
	std::filesystem::path path;
	std::size_t totalCommits{};
	std::size_t analyzedCommits{};
	std::size_t threshold{};
	// commits with at least one triggered validation, in fetch order
	std::vector<CommitFindings> results;

	bool hasErrors() const;
	bool hasWarnings() const;
	bool hasReportableFindings() const;
	std::size_t errorCommitCount() const;
	std::size_t warningCommitCount() const;

	bool failed(bool strict = false) const;
};

class ValidationFailed: public std::runtime_error {
public:
	ValidationFailed(AnalysisReport report, bool strict);

	const AnalysisReport& report() const { return report_; }

private:
	AnalysisReport report_;
};

ValidationConfig resolveConfig(const AnalyzeOptions& options);

/**
 * @brief Validates @p commits and maps every triggered validation to its severity
 *
 * Validations missing from @p allowList are dropped before severities are looked up.
 */
AnalysisReport validateCommits(
	const std::vector<Commit>& commits, const ValidationConfig& config,
	const std::optional<std::vector<Validation>>& allowList = std::nullopt);

/**
 * @brief Applies lint-commits.* settings from the git configuration
 *
 * Resolves options.config first, so explicit settings given afterwards override the git configuration.
 */
void loadOptions(AnalyzeOptions& options, const Config& config);

/**
 * @brief Fetches, validates and reports commits of the repository at options.path
 *
 * @throws PathNotFound, NotARepository, LibgitError
 * @throws ValidationFailed if the run failed
 */
void analyzeCommits(const AnalyzeOptions& options, std::ostream& out);
void analyzeCommits(const AnalyzeOptions& options = {});
void analyzeCommits(const Repository& repo, const AnalyzeOptions& options, std::ostream& out);
