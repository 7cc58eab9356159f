#include "cli.hxx"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <iostream>

int main(int argc, char** argv)
{
	CommandLine cmd;
	CLI::App app{"Analyze git commit messages and report those breaking the configured rules"};
	app.name("git-lint-commits");
	addCommandLineOptions(app, cmd);

	CLI11_PARSE(app, argc, argv);

	return runCommandLine(cmd, std::cout, std::cerr);
}
