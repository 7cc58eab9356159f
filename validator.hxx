#pragma once

#include "validation-config.hxx"

#include <regex>
#include <stdexcept>
#include <string_view>
#include <vector>

class Commit;

class WrongPatternRegex: public std::runtime_error {
	using std::runtime_error::runtime_error;
};

class MessageRules {
public:
	explicit MessageRules(const RulePatterns& patterns = {});

	bool hasReference(std::string_view text) const;
	bool hasConventionalFormat(std::string_view subject) const;
	bool hasVagueLanguage(std::string_view subject) const;
	bool isWipCommit(std::string_view subject) const;
	bool isNonImperative(std::string_view subject) const;

private:
	std::vector<std::regex> references_;
	std::regex conventionalFormat_;
	std::regex conventionalPrefix_;
	std::vector<std::regex> vague_;
	std::vector<std::regex> wip_;
	std::vector<std::string> nonImperativeSuffixes_;
};

/**
 * @brief Applies the checks enabled in a ValidationConfig to commits
 *
 * Takes a snapshot of the configuration; later changes to it are not seen.
 */
class CommitValidator {
public:
	explicit CommitValidator(const ValidationConfig& config);

	/**
	 * @brief Triggered checks, in the order of Validation declaration, each at most once
	 */
	std::vector<Validation> validate(const Commit& commit) const;

	const ValidationConfig& config() const { return config_; }

private:
	bool triggers(Validation v, const Commit& commit) const;

	ValidationConfig config_;
	MessageRules rules_;
};
