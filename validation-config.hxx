#pragma once

#include "validation.hxx"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Regular expressions and word lists the message checks are built from
 *
 * Expressions use the ECMAScript grammar. Reference, vague and WIP expressions are
 * matched ignoring case.
 */
struct RulePatterns {
	std::vector<std::string> referencePatterns{defaultReferencePatterns()};
	std::vector<std::string> conventionalTypes{defaultConventionalTypes()};
	std::vector<std::string> vaguePatterns{defaultVaguePatterns()};
	std::vector<std::string> wipPatterns{defaultWipPatterns()};
	std::vector<std::string> nonImperativeSuffixes{defaultNonImperativeSuffixes()};

	static std::vector<std::string> defaultReferencePatterns();
	static std::vector<std::string> defaultConventionalTypes();
	static std::vector<std::string> defaultVaguePatterns();
	static std::vector<std::string> defaultWipPatterns();
	static std::vector<std::string> defaultNonImperativeSuffixes();

	bool operator==(const RulePatterns&) const = default;
};

/**
 * @brief Options recognised by ValidationConfig construction
 *
 * ShortCommit is controlled by threshold alone, 0 disables it.
 */
struct ValidationOptions {
	std::size_t threshold{30};
	bool requireIssueRef{true};
	bool requireConventionalFormat{true};
	bool checkVagueLanguage{true};
	bool checkWip{true};
	bool checkImperative{true};
	RulePatterns patterns;
};

class ValidationConfig: public ValidationOptions {
public:
	static constexpr std::size_t defaultThreshold{30};

	ValidationConfig();
	ValidationConfig(const ValidationOptions& options);

	Severity severity(Validation v) const { return severities_[index(v)]; }
	void setSeverity(Validation v, Severity severity) { severities_[index(v)] = severity; }

	bool isEnabled(Validation v) const;
	void setEnabled(Validation v, bool enabled);

	bool shouldReport(Validation v) const { return severity(v) != Severity::Ignore; }
	bool isError(Validation v) const { return severity(v) == Severity::Error; }

	void parseAndSetSeverity(std::string_view list, Severity severity);

	void parseAndDisable(std::string_view list);

	// ValidationConfig(threshold=30, require_issue_ref=true, ...)
	std::string toString() const;

private:
	std::array<Severity, allValidations.size()> severities_;
};
