#pragma once

#include "analyzer.hxx"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace CLI {
	class App;
}

class Config;

struct CommandLine {
	std::filesystem::path path{"."};
	std::optional<std::size_t> limit;
	// unset keeps lint-commits.threshold or the default
	std::optional<std::size_t> threshold;
	bool quiet{false};
	bool strict{false};
	// comma separated validation names
	std::string error;
	std::string warn;
	std::string info;
	std::string ignore;
	std::string disable;
	std::string only;
};

void addCommandLineOptions(CLI::App& app, CommandLine& cmd);

/**
 * @brief Overrides @p options with everything given on the command line
 *
 * @throws UnknownValidation
 */
void applyCommandLine(AnalyzeOptions& options, const CommandLine& cmd);

// built-in defaults, then lint-commits.* from @p config, then the command line
AnalyzeOptions resolveOptions(const Config& config, const CommandLine& cmd);

/**
 * @brief Analyzes the repository at cmd.path and returns the process exit code
 *
 * The report goes to @p out, failures other than the validation outcome to @p err.
 */
int runCommandLine(const CommandLine& cmd, std::ostream& out, std::ostream& err);
