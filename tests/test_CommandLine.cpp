#include "SandboxTest.h"
#include "core/CommandLine.h"

class CommandLineTest : public SandboxTest {};

TEST(CommandLine, PositionalDirectoriesAndDefaults) {
    CommandLineOptions opts = parseCommandLine({"/srv/a", "/srv/b"});
    EXPECT_EQ(opts.action, CommandLineOptions::Action::Run);
    ASSERT_EQ(opts.config.allowedDirectories.size(), 2u);
    EXPECT_EQ(opts.config.allowedDirectories[0], fs::path("/srv/a"));
    EXPECT_EQ(opts.config.tier(), PermissionTier::ReadOnly);
    EXPECT_EQ(opts.config.maxReadSize, Config::kDefaultMaxReadSize);
    EXPECT_EQ(opts.config.maxDepth, Config::kDefaultMaxDepth);
}

TEST(CommandLine, PermissionFlags) {
    EXPECT_EQ(parseCommandLine({"--allow-write", "/d"}).config.tier(), PermissionTier::Write);

    CommandLineOptions destructive = parseCommandLine({"/d", "--allow-destructive"});
    EXPECT_EQ(destructive.config.tier(), PermissionTier::Destructive);
    EXPECT_TRUE(destructive.config.allowWrite);
}

TEST(CommandLine, NumericOptions) {
    CommandLineOptions opts = parseCommandLine({"--max-read-size", "4096", "--max-depth=2", "/d"});
    EXPECT_EQ(opts.config.maxReadSize, 4096u);
    EXPECT_EQ(opts.config.maxDepth, 2);

    EXPECT_THROW(parseCommandLine({"--max-read-size", "0", "/d"}), UsageError);
    EXPECT_THROW(parseCommandLine({"--max-read-size", "-5", "/d"}), UsageError);
    EXPECT_THROW(parseCommandLine({"--max-depth", "ten", "/d"}), UsageError);
    EXPECT_THROW(parseCommandLine({"/d", "--max-depth"}), UsageError);
}

TEST(CommandLine, LoggingOptions) {
    CommandLineOptions opts = parseCommandLine({"--log-file", "/tmp/x.log", "--log-level", "debug", "/d"});
    EXPECT_EQ(opts.config.logFile, "/tmp/x.log");
    EXPECT_EQ(opts.config.logLevel, "debug");
    EXPECT_THROW(parseCommandLine({"--log-level", "chatty", "/d"}), UsageError);
}

TEST(CommandLine, HelpAndVersionShortCircuit) {
    EXPECT_EQ(parseCommandLine({"--help"}).action, CommandLineOptions::Action::Help);
    EXPECT_EQ(parseCommandLine({"-h", "--bogus"}).action, CommandLineOptions::Action::Help);
    EXPECT_EQ(parseCommandLine({"--version"}).action, CommandLineOptions::Action::Version);
}

TEST(CommandLine, UsageErrors) {
    EXPECT_THROW(parseCommandLine({}), UsageError);
    EXPECT_THROW(parseCommandLine({"--allow-write"}), UsageError);
    EXPECT_THROW(parseCommandLine({"--frobnicate", "/d"}), UsageError);
    EXPECT_THROW(parseCommandLine({"--allow-write=yes", "/d"}), UsageError);
}

TEST(CommandLine, DoubleDashEndsOptions) {
    CommandLineOptions opts = parseCommandLine({"--", "--weird-dir-name"});
    ASSERT_EQ(opts.config.allowedDirectories.size(), 1u);
    EXPECT_EQ(opts.config.allowedDirectories[0], fs::path("--weird-dir-name"));
}

TEST_F(CommandLineTest, ConfigFileIsExtendedByFlags) {
    fs::path extra = root / "extra";
    fs::create_directories(extra);
    fs::path file = writeFile(base / "palisade.json",
                              "{\"allowed_directories\": [\"" + root.u8string() + "\"], \"max_depth\": 4}");

    CommandLineOptions opts = parseCommandLine({"--config", file.u8string(), "--allow-write", extra.u8string()});
    ASSERT_EQ(opts.config.allowedDirectories.size(), 2u);
    EXPECT_EQ(opts.config.allowedDirectories[0], root);
    EXPECT_EQ(opts.config.allowedDirectories[1], extra);
    EXPECT_EQ(opts.config.maxDepth, 4);
    EXPECT_EQ(opts.config.tier(), PermissionTier::Write);
}

TEST_F(CommandLineTest, ConfigFileAloneSuppliesDirectories) {
    fs::path file = writeFile(base / "palisade.json",
                              "{\"allowed_directories\": [\"" + root.u8string() + "\"]}");
    CommandLineOptions opts = parseCommandLine({"--config=" + file.u8string()});
    ASSERT_EQ(opts.config.allowedDirectories.size(), 1u);
}

TEST_F(CommandLineTest, UnreadableConfigIsRuntimeError) {
    EXPECT_THROW(parseCommandLine({"--config", (base / "missing.json").u8string(), "/d"}), std::runtime_error);
}

TEST(CommandLine, UsageTextMentionsProgramAndFlags) {
    std::string usage = usageText("palisade");
    EXPECT_NE(usage.find("Usage: palisade"), std::string::npos);
    EXPECT_NE(usage.find("--allow-destructive"), std::string::npos);
}
