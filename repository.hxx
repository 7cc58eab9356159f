#pragma once

#include "commit.hxx"
#include "config.hxx"

#include <git2/types.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <vector>

class RepositoryAccessError: public std::runtime_error {
public:
	RepositoryAccessError(const std::string& message, std::filesystem::path path);

	const std::filesystem::path& path() const { return path_; }

private:
	std::filesystem::path path_;
};

class PathNotFound: public RepositoryAccessError {
public:
	explicit PathNotFound(std::filesystem::path path);
};

class NotARepository: public RepositoryAccessError {
public:
	explicit NotARepository(std::filesystem::path path);
};

class Repository {
public:
	/**
	 * @brief Opens the repository rooted at @p path, parent directories are not searched
	 *
	 * @throws PathNotFound, NotARepository, LibgitError
	 */
	static Repository open(const std::filesystem::path& path);

	// initialises libgit2 once more for the new owner
	Repository(Repository&& other);
	Repository& operator=(Repository&& other) noexcept;
	~Repository();

	Repository(const Repository&) = delete;
	Repository& operator=(const Repository&) = delete;

	operator git_repository&() const
	{
		return *repo_;
	}

	// most recent first, empty for an unborn HEAD
	std::vector<Commit> commits(std::optional<std::size_t> limit = std::nullopt) const;

	std::size_t commitCount() const;

	Config config() const;

private:
	explicit Repository(git_repository* repo);

	bool hasHead() const;

	LibGit2 libgit2_;
	git_repository* repo_;
};

std::vector<Commit> fetchCommits(
	const std::filesystem::path& path = ".", std::optional<std::size_t> limit = std::nullopt);
