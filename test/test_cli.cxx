#include "cli.hxx"
#include "config.hxx"
#include "repository.hxx"
#include "test_utils.hxx"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <gtest/gtest.h>

#include <sstream>

namespace {
	CommandLine parse(const std::string& args)
	{
		CommandLine cmd;
		CLI::App app;
		addCommandLineOptions(app, cmd);
		app.parse(args);
		return cmd;
	}
} // namespace

TEST(CommandLine, Defaults)
{
	CommandLine cmd{parse("")};
	EXPECT_EQ(cmd.path.string(), ".");
	EXPECT_FALSE(cmd.limit.has_value());
	EXPECT_FALSE(cmd.threshold.has_value());
	EXPECT_FALSE(cmd.quiet);
	EXPECT_FALSE(cmd.strict);
	EXPECT_TRUE(cmd.only.empty());
	EXPECT_TRUE(cmd.error.empty());
}

TEST(CommandLine, ParsesOptions)
{
	CommandLine cmd{parse("--path repo -l 5 -t 12 -q --strict --only short,wip --error vague --ignore ref "
	                      "--disable format")};
	EXPECT_EQ(cmd.path.string(), "repo");
	EXPECT_EQ(cmd.limit, 5u);
	EXPECT_EQ(cmd.threshold, 12u);
	EXPECT_TRUE(cmd.quiet);
	EXPECT_TRUE(cmd.strict);
	EXPECT_EQ(cmd.only, "short,wip");
	EXPECT_EQ(cmd.error, "vague");
	EXPECT_EQ(cmd.ignore, "ref");
	EXPECT_EQ(cmd.disable, "format");
}

TEST(CommandLine, RejectsUnknownValidationNames)
{
	EXPECT_THROW(parse("--only spelling"), CLI::ParseError);
	EXPECT_THROW(parse("--error short,nonsense"), CLI::ParseError);
	EXPECT_THROW(parse("--disable typo"), CLI::ParseError);
}

TEST(CommandLine, ApplyWithoutGitConfig)
{
	CommandLine cmd;
	cmd.threshold = 12;
	cmd.limit = 3;
	cmd.only = "short, wip";
	cmd.ignore = "imperative";

	AnalyzeOptions options;
	applyCommandLine(options, cmd);

	ASSERT_TRUE(options.config.has_value());
	EXPECT_EQ(options.config->threshold, 12u);
	EXPECT_EQ(options.limit, 3u);
	EXPECT_EQ(options.config->severity(Validation::NonImperative), Severity::Ignore);
	EXPECT_EQ(options.errors, (std::vector{Validation::ShortCommit, Validation::WipCommit}));
	EXPECT_FALSE(options.quiet);
	EXPECT_FALSE(options.strict);
}

TEST(CommandLine, ApplyRejectsUnknownNames)
{
	CommandLine cmd;
	cmd.error = "spelling";
	AnalyzeOptions options;
	EXPECT_THROW(applyCommandLine(options, cmd), UnknownValidation);
}

class CommandLineTest: public ::testing::Test {
protected:
	CommandLine commandLine() const
	{
		CommandLine cmd;
		cmd.path = repo.path();
		return cmd;
	}

	AnalyzeOptions resolve(const CommandLine& cmd) const
	{
		Repository opened{Repository::open(repo.path())};
		return resolveOptions(opened.config(), cmd);
	}

	int run(const CommandLine& cmd)
	{
		out.str({});
		err.str({});
		return runCommandLine(cmd, out, err);
	}

	test::TempRepository repo;
	std::ostringstream out;
	std::ostringstream err;
};

TEST_F(CommandLineTest, GitConfigAppliesWithoutFlags)
{
	repo.setConfig("lint-commits.threshold", "50");
	repo.setConfig("lint-commits.strict", "true");
	repo.addConfig("lint-commits.error", "vague");

	AnalyzeOptions options{resolve(commandLine())};
	ASSERT_TRUE(options.config.has_value());
	EXPECT_EQ(options.path.string(), repo.path().string());
	EXPECT_EQ(options.config->threshold, 50u);
	EXPECT_TRUE(options.strict);
	EXPECT_EQ(options.config->severity(Validation::VagueLanguage), Severity::Error);
	EXPECT_FALSE(options.errors.has_value());
}

TEST_F(CommandLineTest, ThresholdFlagWinsOverGitConfig)
{
	repo.setConfig("lint-commits.threshold", "50");
	CommandLine cmd{commandLine()};
	cmd.threshold = 20;
	EXPECT_EQ(resolve(cmd).config->threshold, 20u);
}

TEST_F(CommandLineTest, ThresholdFlagReenablesShortCheck)
{
	repo.addConfig("lint-commits.disable", "short");

	AnalyzeOptions disabled{resolve(commandLine())};
	EXPECT_FALSE(disabled.config->isEnabled(Validation::ShortCommit));
	EXPECT_EQ(disabled.config->threshold, 0u);

	CommandLine cmd{commandLine()};
	cmd.threshold = 25;
	AnalyzeOptions enabled{resolve(cmd)};
	EXPECT_TRUE(enabled.config->isEnabled(Validation::ShortCommit));
	EXPECT_EQ(enabled.config->threshold, 25u);
}

TEST_F(CommandLineTest, SeverityFlagsWinOverGitConfig)
{
	repo.addConfig("lint-commits.error", "vague");
	repo.addConfig("lint-commits.ignore", "wip");
	repo.addConfig("lint-commits.info", "imperative");

	CommandLine cmd{commandLine()};
	cmd.warn = "vague";
	cmd.error = "wip";
	const ValidationConfig config{*resolve(cmd).config};

	EXPECT_EQ(config.severity(Validation::VagueLanguage), Severity::Warning);
	EXPECT_EQ(config.severity(Validation::WipCommit), Severity::Error);
	EXPECT_EQ(config.severity(Validation::NonImperative), Severity::Info);
}

TEST_F(CommandLineTest, DisableFlagAddsToGitConfig)
{
	repo.addConfig("lint-commits.disable", "wip");
	CommandLine cmd{commandLine()};
	cmd.disable = "format";
	const ValidationConfig config{*resolve(cmd).config};

	EXPECT_FALSE(config.checkWip);
	EXPECT_FALSE(config.requireConventionalFormat);
	EXPECT_TRUE(config.checkVagueLanguage);
}

TEST_F(CommandLineTest, StrictFromEitherSource)
{
	CommandLine cmd{commandLine()};
	EXPECT_FALSE(resolve(cmd).strict);
	cmd.strict = true;
	EXPECT_TRUE(resolve(cmd).strict);

	repo.setConfig("lint-commits.strict", "true");
	EXPECT_TRUE(resolve(commandLine()).strict);
}

TEST_F(CommandLineTest, CleanRepositoryExitsZero)
{
	repo.commit("feat: add the first module for parsing #1");
	EXPECT_EQ(run(commandLine()), 0);
	EXPECT_NE(out.str().find("adequately executed"), std::string::npos) << out.str();
	EXPECT_TRUE(err.str().empty()) << err.str();
}

TEST_F(CommandLineTest, QuietCleanRunPrintsNothing)
{
	repo.commit("feat: add the first module for parsing #1");
	CommandLine cmd{commandLine()};
	cmd.quiet = true;
	EXPECT_EQ(run(cmd), 0);
	EXPECT_TRUE(out.str().empty()) << out.str();
}

TEST_F(CommandLineTest, ErrorFindingExitsOne)
{
	repo.commit("WIP: feat: add user authentication #123");
	EXPECT_EQ(run(commandLine()), 1);
	EXPECT_NE(out.str().find("[error]"), std::string::npos) << out.str();
	EXPECT_TRUE(err.str().empty()) << err.str();
}

TEST_F(CommandLineTest, OnlyFlagRestrictsFailures)
{
	repo.commit("WIP: feat: add user authentication #123");
	CommandLine cmd{commandLine()};
	cmd.only = "short";
	EXPECT_EQ(run(cmd), 0);
}

TEST_F(CommandLineTest, ThresholdFlagFailsRunConfiguredInGit)
{
	repo.commit("feat: add the first module for parsing #1");
	repo.addConfig("lint-commits.error", "short");

	EXPECT_EQ(run(commandLine()), 0);

	CommandLine cmd{commandLine()};
	cmd.threshold = 1000;
	EXPECT_EQ(run(cmd), 1);
	EXPECT_NE(out.str().find("threshold: 1000 chars"), std::string::npos) << out.str();
}

TEST_F(CommandLineTest, StrictFlagFailsOnWarnings)
{
	repo.commit("feat: Added user authentication module #123");
	CommandLine cmd{commandLine()};
	EXPECT_EQ(run(cmd), 0);
	cmd.strict = true;
	EXPECT_EQ(run(cmd), 1);
}

TEST_F(CommandLineTest, MissingPathExitsOneWithMessage)
{
	CommandLine cmd;
	cmd.path = "/this/path/does/not/exist";
	EXPECT_EQ(run(cmd), 1);
	EXPECT_EQ(err.str(), "Error: Path '/this/path/does/not/exist' does not exist\n");
	EXPECT_TRUE(out.str().empty());
}

TEST_F(CommandLineTest, MalformedGitConfigExitsOne)
{
	repo.commit("feat: add the first module for parsing #1");
	repo.setConfig("lint-commits.threshold", "lots");
	EXPECT_EQ(run(commandLine()), 1);
	EXPECT_TRUE(err.str().starts_with("Error: ")) << err.str();
}

TEST_F(CommandLineTest, UnknownNameExitsOne)
{
	repo.commit("feat: add the first module for parsing #1");
	CommandLine cmd{commandLine()};
	cmd.ignore = "spelling";
	EXPECT_EQ(run(cmd), 1);
	EXPECT_TRUE(err.str().starts_with("Error: ")) << err.str();
}
