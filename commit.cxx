#include "commit.hxx"

#include "utility.hxx"
#include "validator.hxx"

#include <git2/commit.h>
#include <git2/oid.h>

#include <string_view>
#include <utility>

namespace {
	std::string_view firstLine(std::string_view message)
	{
		std::string_view line = message.substr(0, message.find('\n'));
		if (line.ends_with('\r')) {
			line.remove_suffix(1);
		}
		return line;
	}

	std::optional<std::string> messageBody(const git_commit& commit)
	{
		const char* body = git_commit_body(const_cast<git_commit*>(&commit));
		if (!body) {
			return std::nullopt;
		}
		std::string result{body};
		trimWhitespace(result);
		if (result.empty()) {
			return std::nullopt;
		}
		return result;
	}

	std::string nonNull(const char* text)
	{
		return text ? std::string{text} : std::string{};
	}
} // namespace

Commit::Commit(
	std::string hash, std::string authorName, std::string authorEmail, std::string subject,
	std::optional<std::string> body)
	: hash_{std::move(hash)}
	, authorName_{std::move(authorName)}
	, authorEmail_{std::move(authorEmail)}
	, subject_{std::move(subject)}
	, body_{std::move(body)}
{
}

Commit::Commit(const git_commit& commit)
{
	char hash[GIT_OID_MAX_HEXSIZE + 1];
	hash_ = git_oid_tostr(hash, sizeof(hash), git_commit_id(&commit));

	if (const git_signature* author = git_commit_author(&commit)) {
		authorName_ = nonNull(author->name);
		authorEmail_ = nonNull(author->email);
	}

	const char* message = git_commit_message(&commit);
	subject_ = std::string{firstLine(message ? std::string_view{message} : std::string_view{})};
	body_ = messageBody(commit);
}

bool Commit::isShort(std::size_t threshold) const
{
	return utf8Length(subject_) < threshold;
}

std::vector<Validation> Commit::validate(const ValidationConfig& config) const
{
	return CommitValidator{config}.validate(*this);
}

std::vector<Validation> Commit::validate(const ValidationConfig& config, std::size_t threshold) const
{
	ValidationConfig copy{config};
	copy.threshold = threshold;
	return validate(copy);
}
