#pragma once

#include <git2/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class Config {
public:
	Config(git_repository& repo);
	Config(Config&& other) noexcept;
	Config& operator=(Config&&) noexcept;
	~Config();

	Config(const Config&) = delete;
	Config& operator=(const Config&) = delete;

	std::vector<std::string> readMultiString(const char* key) const;

	/**
	 * @throws LibgitError if the value is not a valid boolean
	 */
	std::optional<bool> readBool(const char* key) const;

	/**
	 * @throws LibgitError if the value is not a valid integer
	 */
	std::optional<std::int64_t> readInt(const char* key) const;

private:
	git_config* config_;
};
