#include "cli.hxx"

#include "config.hxx"
#include "repository.hxx"

#include <CLI/App.hpp>
#include <CLI/Validators.hpp>

#include <functional>
#include <ostream>
#include <utility>

namespace {
	struct ValidationListValidator: CLI::Validator {
		ValidationListValidator()
			: CLI::Validator("VALIDATIONS")
		{
			func_ = [](std::string& value) {
				try {
					parseValidationList(value);
				} catch (const UnknownValidation& e) {
					return std::string{e.what()};
				}
				return std::string{};
			};
		}
	};
} // namespace

void addCommandLineOptions(CLI::App& app, CommandLine& cmd)
{
	CLI::Option_group* severity_options = app.add_option_group("severity", "Severity overrides");

	app.add_option("--path", cmd.path, "Path to git repo")->capture_default_str();
	app.add_option_function(
		"--limit,-l", std::function{[&cmd](const std::size_t& value) { cmd.limit = value; }},
		"Maximum number of commits to analyze");
	app.add_option_function(
		"--threshold,-t", std::function{[&cmd](const std::size_t& value) { cmd.threshold = value; }},
		"Minimum subject length in characters (default: 30)");
	app.add_flag("--quiet,-q", cmd.quiet, "Suppress output unless issues found");
	app.add_flag("--strict", cmd.strict, "Treat warnings as errors");
	app.add_option(
		   "--disable", cmd.disable,
		   "Validations to skip entirely (comma-separated). "
		   "Available: short, reference, format, vague, wip, imperative")
		->check(ValidationListValidator());
	app.add_option("--only", cmd.only, "Report only these validations (comma-separated)")
		->check(ValidationListValidator());
	severity_options->add_option("--error", cmd.error, "Validations to treat as errors (comma-separated)")
		->check(ValidationListValidator());
	severity_options->add_option("--warn", cmd.warn, "Validations to treat as warnings (comma-separated)")
		->check(ValidationListValidator());
	severity_options->add_option("--info", cmd.info, "Validations to treat as information (comma-separated)")
		->check(ValidationListValidator());
	severity_options->add_option("--ignore", cmd.ignore, "Validations to ignore (comma-separated)")
		->check(ValidationListValidator());
}

void applyCommandLine(AnalyzeOptions& options, const CommandLine& cmd)
{
	ValidationConfig config{resolveConfig(options)};

	if (cmd.limit) {
		options.limit = cmd.limit;
	}
	if (cmd.quiet) {
		options.quiet = true;
	}
	// --strict can only turn the strict mode on, lint-commits.strict=true stays in effect otherwise
	if (cmd.strict) {
		options.strict = true;
	}
	if (cmd.threshold) {
		config.threshold = *cmd.threshold;
	}

	config.parseAndDisable(cmd.disable);
	config.parseAndSetSeverity(cmd.error, Severity::Error);
	config.parseAndSetSeverity(cmd.warn, Severity::Warning);
	config.parseAndSetSeverity(cmd.info, Severity::Info);
	config.parseAndSetSeverity(cmd.ignore, Severity::Ignore);

	if (!cmd.only.empty()) {
		options.errors = parseValidationList(cmd.only);
	}
	options.config = std::move(config);
}

AnalyzeOptions resolveOptions(const Config& config, const CommandLine& cmd)
{
	AnalyzeOptions options;
	options.path = cmd.path;
	loadOptions(options, config);
	applyCommandLine(options, cmd);
	return options;
}

int runCommandLine(const CommandLine& cmd, std::ostream& out, std::ostream& err)
{
	try {
		Repository repo{Repository::open(cmd.path)};
		analyzeCommits(repo, resolveOptions(repo.config(), cmd), out);
	} catch (const ValidationFailed&) {
		// the report has been printed already
		return 1;
	} catch (const std::exception& e) {
		err << "Error: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
