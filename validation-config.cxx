#include "validation-config.hxx"

#include <format>

namespace {
	constexpr std::array<Severity, allValidations.size()> defaultSeverities{
		Severity::Warning, // ShortCommit
		Severity::Info,    // MissingReference
		Severity::Info,    // InvalidFormat
		Severity::Warning, // VagueLanguage
		Severity::Error,   // WipCommit
		Severity::Warning, // NonImperative
	};

	constexpr std::string_view boolString(bool value)
	{
		return value ? "true" : "false";
	}
} // namespace

std::vector<std::string> RulePatterns::defaultReferencePatterns()
{
	// #123, GH-456, JIRA-789
	return {R"(#\d+)", R"(gh-\d+)", R"([A-Z]{2,}-\d+)"};
}

std::vector<std::string> RulePatterns::defaultConventionalTypes()
{
	return {"feat", "fix", "docs", "style", "refactor", "perf", "test", "build", "ci", "chore", "revert"};
}

std::vector<std::string> RulePatterns::defaultVaguePatterns()
{
	return {
		R"(\b(fix(ed|es|ing)?|update[ds]?|change[ds]?|modify|modified|modifies|tweak(ed|s)?|adjust(ed|s)?)\s+)"
		R"((it|this|that|things?|stuff|code|bug|issue|error|problem)s?\b)",
		R"(\b(stuff|things|misc|various)\b)",
	};
}

std::vector<std::string> RulePatterns::defaultWipPatterns()
{
	return {
		R"(^wip\b)",
		R"(^\[wip\])",
		R"(\bwork.?in.?progress\b)",
		R"(^(fixup|squash|amend)!)",
		R"(\bdo\s*not\s*merge\b)",
		R"(\bdon'?t\s*merge\b)",
		R"(\bwip\s*$)",
	};
}

std::vector<std::string> RulePatterns::defaultNonImperativeSuffixes()
{
	return {"ing", "ed", "s"};
}

ValidationConfig::ValidationConfig()
	: ValidationConfig(ValidationOptions{})
{
}

ValidationConfig::ValidationConfig(const ValidationOptions& options)
	: ValidationOptions(options)
	, severities_{defaultSeverities}
{
}

bool ValidationConfig::isEnabled(Validation v) const
{
	switch (v) {
	case Validation::ShortCommit:
		return threshold > 0;
	case Validation::MissingReference:
		return requireIssueRef;
	case Validation::InvalidFormat:
		return requireConventionalFormat;
	case Validation::VagueLanguage:
		return checkVagueLanguage;
	case Validation::WipCommit:
		return checkWip;
	case Validation::NonImperative:
		return checkImperative;
	}
	return false;
}

void ValidationConfig::setEnabled(Validation v, bool enabled)
{
	switch (v) {
	case Validation::ShortCommit:
		if (!enabled) {
			threshold = 0;
		} else if (threshold == 0) {
			threshold = defaultThreshold;
		}
		break;
	case Validation::MissingReference:
		requireIssueRef = enabled;
		break;
	case Validation::InvalidFormat:
		requireConventionalFormat = enabled;
		break;
	case Validation::VagueLanguage:
		checkVagueLanguage = enabled;
		break;
	case Validation::WipCommit:
		checkWip = enabled;
		break;
	case Validation::NonImperative:
		checkImperative = enabled;
		break;
	}
}

void ValidationConfig::parseAndSetSeverity(std::string_view list, Severity severity)
{
	for (Validation v: parseValidationList(list)) {
		setSeverity(v, severity);
	}
}

void ValidationConfig::parseAndDisable(std::string_view list)
{
	for (Validation v: parseValidationList(list)) {
		setEnabled(v, false);
	}
}

std::string ValidationConfig::toString() const
{
	return std::format(
		"ValidationConfig(threshold={}, require_issue_ref={}, require_conventional_format={}, "
		"check_vague_language={}, check_wip={}, check_imperative={})",
		threshold, boolString(requireIssueRef), boolString(requireConventionalFormat),
		boolString(checkVagueLanguage), boolString(checkWip), boolString(checkImperative));
}
