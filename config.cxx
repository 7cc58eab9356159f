#include "config.hxx"

#include "utility.hxx"

#include <git2/config.h>
#include <git2/errors.h>
#include <git2/repository.h>

#include <utility>

Config::Config(git_repository& repo)
{
	LibgitError::check(git_repository_config(&config_, &repo));
}

Config::Config(Config&& other) noexcept
	: config_{std::exchange(other.config_, nullptr)}
{
}

Config& Config::operator=(Config&& other) noexcept
{
	if (config_) {
		git_config_free(config_);
	}
	config_ = other.config_;
	other.config_ = nullptr;
	return *this;
}

Config::~Config()
{
	if (config_) {
		git_config_free(config_);
	}
}

namespace {
	int readMultiStringCallback(const git_config_entry* entry, void* payload)
	{
		static_cast<std::vector<std::string>*>(payload)->emplace_back(entry->value);
		return 0;
	}
}

std::vector<std::string> Config::readMultiString(const char* key) const
{
	std::vector<std::string> res;
	int error = git_config_get_multivar_foreach(config_, key, nullptr, &readMultiStringCallback, &res);
	if (error != GIT_ENOTFOUND) {
		LibgitError::check(error);
	}
	return res;
}

std::optional<bool> Config::readBool(const char* key) const
{
	int value;
	int error = git_config_get_bool(&value, config_, key);
	if (error == GIT_ENOTFOUND) {
		return std::nullopt;
	}
	LibgitError::check(error);
	return value != 0;
}

std::optional<std::int64_t> Config::readInt(const char* key) const
{
	std::int64_t value;
	int error = git_config_get_int64(&value, config_, key);
	if (error == GIT_ENOTFOUND) {
		return std::nullopt;
	}
	LibgitError::check(error);
	return value;
}
