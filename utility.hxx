#pragma once

#include <git2/errors.h>
#include <git2/types.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

void toLower(std::string& s);
std::string toLowerCopy(std::string_view s);

/**
 * @brief Number of UTF-8 encoded code points in @p s
 */
std::size_t utf8Length(std::string_view s);

std::string& trimWhitespace(std::string& s);

std::vector<std::string> splitList(std::string_view list);

class LibgitError: public std::runtime_error {
public:
	LibgitError(int errorCode, const git_error* error);
	LibgitError(int error);

	int code() const { return code_; }

	/**
	 * @brief Throws LibgitError if error < 0
	 */
	static void check(int error);

private:
	int code_;
};

/**
 * @brief Keeps libgit2 initialised while alive
 */
struct LibGit2 {
	LibGit2();
	~LibGit2();

	LibGit2(const LibGit2&) = delete;
	LibGit2& operator=(const LibGit2&) = delete;
};
