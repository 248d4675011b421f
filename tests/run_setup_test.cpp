#include "../cbzxl_cli/src/cli/cli_parser.hpp"
#include "../cbzxl_cli/src/cli/run_setup.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <CLI/CLI.hpp>
#include <gtest/gtest.h>

#include <iterator>

namespace fs = std::filesystem;
using namespace cbzxl;
using namespace cbzxl::test;

class RunSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.success_db = dir / "converted_archives.db";
        settings.failure_db = dir / "failed_archives.db";
        write_file(settings.success_db, "records");
        write_file(settings.failure_db, "failures");
    }

    TempDir dir;
    Settings settings;
};

TEST_F(RunSetupTest, MissingToolKeepsDatabasesOnReset) {
    settings.reset_db = true;

    const bool ok = prepare_run(settings, [] { throw ToolMissingError("cjxl not found on PATH"); });

    EXPECT_FALSE(ok);
    EXPECT_TRUE(fs::exists(settings.success_db));
    EXPECT_TRUE(fs::exists(settings.failure_db));
}

TEST_F(RunSetupTest, ResetDeletesDatabasesOnceToolsArePresent) {
    settings.reset_db = true;
    int checks = 0;

    EXPECT_TRUE(prepare_run(settings, [&checks] { ++checks; }));

    EXPECT_EQ(checks, 1);
    EXPECT_FALSE(fs::exists(settings.success_db));
    EXPECT_FALSE(fs::exists(settings.failure_db));
}

TEST_F(RunSetupTest, DryRunResetDeletesNothingAndRechecksAll) {
    settings.reset_db = true;
    settings.dry_run = true;

    EXPECT_TRUE(prepare_run(settings, [] {}));

    EXPECT_TRUE(fs::exists(settings.success_db));
    EXPECT_TRUE(fs::exists(settings.failure_db));
    EXPECT_TRUE(settings.to_run_config().recheck_all);
}

TEST(CliParserTest, MapsOptionsToRunConfig) {
    const TempDir dir;
    const std::string input = dir.path().string();
    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);
    const char* argv[] = {"cbzxl", "--effort", "3", "--threads", "2", "--no-flatten", "--archive-timeout", "30",
                          input.c_str()};

    app.parse(static_cast<int>(std::size(argv)), argv);

    const RunConfig config = settings.to_run_config();
    EXPECT_EQ(config.input_dir, dir.path());
    EXPECT_EQ(config.effort, 3);
    EXPECT_EQ(config.threads, 2u);
    EXPECT_FALSE(config.flatten);
    EXPECT_TRUE(config.convert);
    EXPECT_EQ(config.archive_timeout, std::chrono::seconds(30));
    EXPECT_FALSE(config.recheck_all);
}

TEST(CliParserTest, RejectsConflictingModes) {
    const TempDir dir;
    const std::string input = dir.path().string();
    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);
    const char* argv[] = {"cbzxl", "--stats", "--reset-db", input.c_str()};

    EXPECT_THROW(app.parse(static_cast<int>(std::size(argv)), argv), CLI::ValidationError);
}
