#include "validator.hxx"

#include "commit.hxx"
#include "utility.hxx"

#include <algorithm>
#include <cctype>
#include <format>

namespace {
	std::regex makeRegex(const std::string& expression, std::regex::flag_type flags = {})
	{
		try {
			return std::regex{expression, std::regex::ECMAScript | flags};
		} catch (const std::regex_error& e) {
			throw WrongPatternRegex{std::format("Invalid message pattern '{}': {}", expression, e.what())};
		}
	}

	std::vector<std::regex> makeMatchers(const std::vector<std::string>& expressions)
	{
		std::vector<std::regex> res;
		res.reserve(expressions.size());
		for (const std::string& exp: expressions) {
			res.push_back(makeRegex(exp, std::regex::icase));
		}
		return res;
	}

	std::string typeAlternatives(const std::vector<std::string>& types)
	{
		std::string result;
		for (const std::string& type: types) {
			if (!result.empty()) {
				result += '|';
			}
			result += type;
		}
		return result;
	}

	bool searchAny(const std::vector<std::regex>& matchers, std::string_view text)
	{
		return std::ranges::any_of(matchers, [text](const std::regex& matcher) {
			return std::regex_search(text.begin(), text.end(), matcher);
		});
	}
} // namespace

MessageRules::MessageRules(const RulePatterns& patterns)
	: references_{makeMatchers(patterns.referencePatterns)}
	, vague_{makeMatchers(patterns.vaguePatterns)}
	, wip_{makeMatchers(patterns.wipPatterns)}
	, nonImperativeSuffixes_{patterns.nonImperativeSuffixes}
{
	// type(scope)!: description
	const std::string types{typeAlternatives(patterns.conventionalTypes)};
	conventionalFormat_ = makeRegex(std::format(R"(^({})(\(.+\))?!?:\s.+)", types));
	conventionalPrefix_ = makeRegex(std::format(R"(^({})(\([^)]+\))?!?:\s*)", types));
	for (std::string& suffix: nonImperativeSuffixes_) {
		toLower(suffix);
	}
}

bool MessageRules::hasReference(std::string_view text) const
{
	return searchAny(references_, text);
}

bool MessageRules::hasConventionalFormat(std::string_view subject) const
{
	return std::regex_search(subject.begin(), subject.end(), conventionalFormat_);
}

bool MessageRules::hasVagueLanguage(std::string_view subject) const
{
	return searchAny(vague_, subject);
}

bool MessageRules::isWipCommit(std::string_view subject) const
{
	return searchAny(wip_, subject);
}

bool MessageRules::isNonImperative(std::string_view subject) const
{
	std::match_results<std::string_view::const_iterator> prefix;
	if (std::regex_search(subject.begin(), subject.end(), prefix, conventionalPrefix_)) {
		subject.remove_prefix(static_cast<std::size_t>(prefix.length(0)));
	}

	auto wordEnd = std::ranges::find_if_not(subject, [](unsigned char c) { return std::isalpha(c) != 0; });
	const std::string word{toLowerCopy(std::string_view{subject.begin(), wordEnd})};
	if (word.empty()) {
		return false;
	}

	return std::ranges::any_of(nonImperativeSuffixes_, [&word](const std::string& suffix) {
		return word.size() > suffix.size() && word.ends_with(suffix);
	});
}

CommitValidator::CommitValidator(const ValidationConfig& config)
	: config_{config}
	, rules_{config.patterns}
{
}

std::vector<Validation> CommitValidator::validate(const Commit& commit) const
{
	std::vector<Validation> result;
	for (Validation v: allValidations) {
		if (config_.isEnabled(v) && triggers(v, commit)) {
			result.push_back(v);
		}
	}
	return result;
}

bool CommitValidator::triggers(Validation v, const Commit& commit) const
{
	const std::string& subject = commit.subject();
	switch (v) {
	case Validation::ShortCommit:
		return utf8Length(subject) < config_.threshold;
	case Validation::MissingReference:
		return !rules_.hasReference(subject) && !(commit.body() && rules_.hasReference(*commit.body()));
	case Validation::InvalidFormat:
		return !rules_.hasConventionalFormat(subject);
	case Validation::VagueLanguage:
		return rules_.hasVagueLanguage(subject);
	case Validation::WipCommit:
		return rules_.isWipCommit(subject);
	case Validation::NonImperative:
		return rules_.isNonImperative(subject);
	}
	return false;
}
