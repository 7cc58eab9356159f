#include "validation.hxx"

#include "utility.hxx"

#include <algorithm>
#include <format>
#include <string>

namespace {
	struct ValidationInfo {
		std::string_view name;
		std::string_view shortName;
		std::string_view kebabName;
		std::string_view debugName;
		std::string_view description;
	};

	constexpr std::array<ValidationInfo, allValidations.size()> validationTable{{
		{"ShortCommit", "short", "short-commit", "Validation.ShortCommit", "Short commit message"},
		{"MissingReference", "reference", "missing-reference", "Validation.MissingReference",
		 "Missing issue reference (e.g., #123)"},
		{"InvalidFormat", "format", "invalid-format", "Validation.InvalidFormat",
		 "Invalid format (expected: type: description)"},
		{"VagueLanguage", "vague", "vague-language", "Validation.VagueLanguage",
		 "Vague language (e.g., 'fix bug', 'update code')"},
		{"WipCommit", "wip", "wip-commit", "Validation.WipCommit", "Work-in-progress commit (e.g., 'WIP', 'fixup!')"},
		{"NonImperative", "imperative", "non-imperative", "Validation.NonImperative",
		 "Non-imperative mood (use 'Add' not 'Added')"},
	}};

	struct SeverityInfo {
		Severity severity;
		std::string_view text;
		std::string_view debugName;
	};

	constexpr std::array<SeverityInfo, 4> severityTable{{
		{Severity::Ignore, "ignore", "Severity.Ignore"},
		{Severity::Info, "info", "Severity.Info"},
		{Severity::Warning, "warning", "Severity.Warning"},
		{Severity::Error, "error", "Severity.Error"},
	}};

	const ValidationInfo& info(Validation v)
	{
		return validationTable[index(v)];
	}

	const SeverityInfo& info(Severity s)
	{
		return severityTable[static_cast<std::size_t>(s)];
	}
} // namespace

std::string_view name(Validation v)
{
	return info(v).name;
}

std::string_view shortName(Validation v)
{
	return info(v).shortName;
}

std::string_view debugName(Validation v)
{
	return info(v).debugName;
}

std::string_view description(Validation v)
{
	return info(v).description;
}

Validation parseValidation(std::string_view text)
{
	const std::string lower{toLowerCopy(text)};
	if (lower == "ref") {
		return Validation::MissingReference;
	}
	for (Validation v: allValidations) {
		const ValidationInfo& i = info(v);
		if (lower == toLowerCopy(i.name) || lower == i.shortName || lower == i.kebabName) {
			return v;
		}
	}
	throw UnknownValidation{std::format(
		"invalid validation name: '{}' (valid: short, wip, reference, format, vague, imperative)", text)};
}

std::vector<Validation> parseValidationList(std::string_view list)
{
	std::vector<Validation> result;
	for (const std::string& item: splitList(list)) {
		Validation v = parseValidation(item);
		if (!std::ranges::contains(result, v)) {
			result.push_back(v);
		}
	}
	return result;
}

std::string_view toString(Severity s)
{
	return info(s).text;
}

std::string_view debugName(Severity s)
{
	return info(s).debugName;
}

Severity parseSeverity(std::string_view text)
{
	const std::string lower{toLowerCopy(text)};
	auto it = std::ranges::find(severityTable, std::string_view{lower}, &SeverityInfo::text);
	if (it == severityTable.end()) {
		// "warn" is what the command line and the report use
		if (lower == "warn") {
			return Severity::Warning;
		}
		throw InvalidSeverity{
			std::format("invalid severity: '{}' (valid: error, warning, info, ignore)", text)};
	}
	return it->severity;
}
