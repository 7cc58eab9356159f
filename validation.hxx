#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <vector>

/**
 * @brief Kinds of checks run against a commit message
 *
 * Declaration order is the order checks are evaluated and reported in.
 */
enum class Validation {
	ShortCommit,
	MissingReference,
	InvalidFormat,
	VagueLanguage,
	WipCommit,
	NonImperative,
};

inline constexpr std::array<Validation, 6> allValidations{
	Validation::ShortCommit,   Validation::MissingReference, Validation::InvalidFormat,
	Validation::VagueLanguage, Validation::WipCommit,        Validation::NonImperative,
};

constexpr std::size_t index(Validation v)
{
	return static_cast<std::size_t>(v);
}

/**
 * @brief Consequence of a triggered check
 *
 * Declared from the least to the most severe, so that the comparison operators express
 * Error > Warning > Info > Ignore.
 */
enum class Severity {
	Ignore,
	Info,
	Warning,
	Error,
};

constexpr bool moreSevere(Severity left, Severity right)
{
	return left > right;
}

class UnknownValidation: public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

class InvalidSeverity: public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

// "ShortCommit"
std::string_view name(Validation v);
// "short", also accepted by parseValidation()
std::string_view shortName(Validation v);
// "Validation.ShortCommit"
std::string_view debugName(Validation v);
// Human readable text, i.e. "Short commit message"
std::string_view description(Validation v);

/**
 * @brief Parses full ("MissingReference"), short ("reference", "ref") and kebab ("missing-reference")
 * names, ignoring case.
 *
 * @throws UnknownValidation
 */
Validation parseValidation(std::string_view text);

std::vector<Validation> parseValidationList(std::string_view list);

// "error"
std::string_view toString(Severity s);
// "Severity.Error"
std::string_view debugName(Severity s);

/**
 * @throws InvalidSeverity
 */
Severity parseSeverity(std::string_view text);
