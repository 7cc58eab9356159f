#include "repository.hxx"

#include "utility.hxx"

#include <git2/commit.h>
#include <git2/errors.h>
#include <git2/repository.h>
#include <git2/revwalk.h>

#include <format>
#include <memory>
#include <utility>

namespace {
	struct git_revwalk_deleter {
		void operator()(git_revwalk* walk)
		{
			if (walk) {
				git_revwalk_free(walk);
			}
		}
	};

	struct git_commit_deleter {
		void operator()(git_commit* commit)
		{
			if (commit) {
				git_commit_free(commit);
			}
		}
	};

	using RevWalk = std::unique_ptr<git_revwalk, git_revwalk_deleter>;

	RevWalk walkFromHead(git_repository& repo)
	{
		git_revwalk* walk;
		LibgitError::check(git_revwalk_new(&walk, &repo));
		RevWalk result{walk};
		LibgitError::check(git_revwalk_sorting(walk, GIT_SORT_TIME));
		LibgitError::check(git_revwalk_push_head(walk));
		return result;
	}

	// git_revwalk_next() signals the end of the walk with GIT_ITEROVER
	bool nextCommit(git_oid& oid, git_revwalk* walk)
	{
		int error = git_revwalk_next(&oid, walk);
		if (error == GIT_ITEROVER) {
			return false;
		}
		LibgitError::check(error);
		return true;
	}
} // namespace

RepositoryAccessError::RepositoryAccessError(const std::string& message, std::filesystem::path path)
	: std::runtime_error(message)
	, path_{std::move(path)}
{
}

PathNotFound::PathNotFound(std::filesystem::path path)
	: RepositoryAccessError(std::format("Path '{}' does not exist", path.string()), path)
{
}

NotARepository::NotARepository(std::filesystem::path path)
	: RepositoryAccessError(std::format("Path '{}' is not a git repository", path.string()), path)
{
}

Repository Repository::open(const std::filesystem::path& path)
{
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) {
		if (ec) {
			throw RepositoryAccessError{
				std::format("Path '{}' can not be accessed: {}", path.string(), ec.message()), path};
		}
		throw PathNotFound{path};
	}

	LibGit2 libgit;
	git_repository* repo;
	int error = git_repository_open_ext(&repo, path.c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr);
	if (error == GIT_ENOTFOUND) {
		throw NotARepository{path};
	}
	LibgitError::check(error);
	return Repository{repo};
}

Repository::Repository(git_repository* repo)
	: repo_{repo}
{
}

Repository::Repository(Repository&& other)
	: repo_{std::exchange(other.repo_, nullptr)}
{
}

Repository& Repository::operator=(Repository&& other) noexcept
{
	if (this != &other) {
		if (repo_) {
			git_repository_free(repo_);
		}
		repo_ = std::exchange(other.repo_, nullptr);
	}
	return *this;
}

Repository::~Repository()
{
	if (repo_) {
		git_repository_free(repo_);
	}
}

bool Repository::hasHead() const
{
	int unborn = git_repository_head_unborn(repo_);
	LibgitError::check(unborn);
	return unborn == 0;
}

std::vector<Commit> Repository::commits(std::optional<std::size_t> limit) const
{
	std::vector<Commit> result;
	if ((limit && *limit == 0) || !hasHead()) {
		return result;
	}

	RevWalk walk{walkFromHead(*repo_)};
	git_oid oid;
	while ((!limit || result.size() < *limit) && nextCommit(oid, walk.get())) {
		git_commit* commit;
		LibgitError::check(git_commit_lookup(&commit, repo_, &oid));
		std::unique_ptr<git_commit, git_commit_deleter> holder{commit};
		result.emplace_back(*commit);
	}
	return result;
}

std::size_t Repository::commitCount() const
{
	if (!hasHead()) {
		return 0;
	}

	RevWalk walk{walkFromHead(*repo_)};
	std::size_t count{};
	git_oid oid;
	while (nextCommit(oid, walk.get())) {
		++count;
	}
	return count;
}

Config Repository::config() const
{
	return Config{*repo_};
}

std::vector<Commit> fetchCommits(const std::filesystem::path& path, std::optional<std::size_t> limit)
{
	return Repository::open(path).commits(limit);
}
