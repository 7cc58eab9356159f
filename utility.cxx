#include "utility.hxx"

#include <git2/global.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>

namespace {
	const char* ws = " \t\n\r\f\v";

	inline std::string& rtrim(std::string& s, const char* t = ws)
	{
		s.erase(s.find_last_not_of(t) + 1);
		return s;
	}

	inline std::string& ltrim(std::string& s, const char* t = ws)
	{
		s.erase(0, s.find_first_not_of(t));
		return s;
	}

	inline std::string& trim(std::string& s, const char* t = ws)
	{
		return ltrim(rtrim(s, t), t);
	}

	std::string describe(int errorCode, const git_error* error)
	{
		if (!error) {
			return std::format("libgit2 error {}", errorCode);
		}
		return std::format("libgit2 error {}/{}: {}", errorCode, error->klass, error->message);
	}
} // namespace

void toLower(std::string& s)
{
	std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

std::string toLowerCopy(std::string_view s)
{
	std::string result{s};
	toLower(result);
	return result;
}

std::size_t utf8Length(std::string_view s)
{
	// continuation bytes look like 10xxxxxx
	return static_cast<std::size_t>(
		std::ranges::count_if(s, [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

std::string& trimWhitespace(std::string& s)
{
	return trim(s);
}

std::vector<std::string> splitList(std::string_view list)
{
	std::vector<std::string> result;
	for (auto&& part: list | std::views::split(',')) {
		std::string item{part.begin(), part.end()};
		trim(item);
		if (!item.empty()) {
			result.push_back(std::move(item));
		}
	}
	return result;
}

LibgitError::LibgitError(int errorCode, const git_error* error)
	: std::runtime_error(describe(errorCode, error))
	, code_{errorCode}
{
}

LibgitError::LibgitError(int error)
	: LibgitError(error, git_error_last())
{
}

void LibgitError::check(int error)
{
	if (error < 0) {
		throw LibgitError(error);
	}
}

LibGit2::LibGit2()
{
	LibgitError::check(git_libgit2_init());
}

LibGit2::~LibGit2()
{
	git_libgit2_shutdown();
}
