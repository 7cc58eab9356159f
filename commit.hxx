#pragma once

#include "validation-config.hxx"

#include <git2/types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Decoded commit metadata
 *
 * Immutable value, does not keep libgit2 objects alive.
 */
class Commit {
public:
	Commit(
		std::string hash, std::string authorName, std::string authorEmail, std::string subject,
		std::optional<std::string> body = std::nullopt);

	/**
	 * @brief Decodes @p commit: subject is the first message line, body is what follows the blank line
	 */
	explicit Commit(const git_commit& commit);

	const std::string& hash() const { return hash_; }
	const std::string& authorName() const { return authorName_; }
	const std::string& authorEmail() const { return authorEmail_; }
	const std::string& subject() const { return subject_; }
	const std::optional<std::string>& body() const { return body_; }

	/**
	 * @brief Subject has fewer than @p threshold characters
	 */
	bool isShort(std::size_t threshold) const;

	std::vector<Validation> validate(const ValidationConfig& config = {}) const;

	/**
	 * @brief Validates with a copy of @p config where only the threshold is replaced
	 */
	std::vector<Validation> validate(const ValidationConfig& config, std::size_t threshold) const;

private:
	std::string hash_;
	std::string authorName_;
	std::string authorEmail_;
	std::string subject_;
	std::optional<std::string> body_;
};
