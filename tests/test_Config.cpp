#include "SandboxTest.h"
#include <nlohmann/json.hpp>

class ConfigTest : public SandboxTest {};

TEST(PermissionTier, FromFlags) {
    EXPECT_EQ(permissionTierFromFlags(false, false), PermissionTier::ReadOnly);
    EXPECT_EQ(permissionTierFromFlags(true, false), PermissionTier::Write);
    EXPECT_EQ(permissionTierFromFlags(false, true), PermissionTier::Destructive);
    EXPECT_EQ(permissionTierFromFlags(true, true), PermissionTier::Destructive);
}

TEST(PermissionTier, Lattice) {
    EXPECT_TRUE(tierAllows(PermissionTier::Destructive, PermissionTier::Write));
    EXPECT_TRUE(tierAllows(PermissionTier::Write, PermissionTier::ReadOnly));
    EXPECT_FALSE(tierAllows(PermissionTier::ReadOnly, PermissionTier::Write));
    EXPECT_FALSE(tierAllows(PermissionTier::Write, PermissionTier::Destructive));
    EXPECT_STREQ(toString(PermissionTier::Write), "write");
}

TEST(ConfigJson, DefaultsWhenKeysMissing) {
    Config cfg = Config::fromJson(nlohmann::json::object());
    EXPECT_TRUE(cfg.allowedDirectories.empty());
    EXPECT_FALSE(cfg.allowWrite);
    EXPECT_EQ(cfg.maxReadSize, 10485760u);
    EXPECT_EQ(cfg.maxDepth, 10);
    EXPECT_EQ(cfg.logLevel, "info");
}

TEST(ConfigJson, ReadsAllKeys) {
    nlohmann::json j = {
        {"allowed_directories", nlohmann::json::array({"/a", "/b"})},
        {"allow_write", true},
        {"allow_destructive", false},
        {"max_read_size", 4096},
        {"max_depth", 3},
        {"log_file", "/tmp/p.log"},
        {"log_level", "debug"}
    };
    Config cfg = Config::fromJson(j);
    ASSERT_EQ(cfg.allowedDirectories.size(), 2u);
    EXPECT_EQ(cfg.allowedDirectories[1], fs::path("/b"));
    EXPECT_EQ(cfg.tier(), PermissionTier::Write);
    EXPECT_EQ(cfg.maxReadSize, 4096u);
    EXPECT_EQ(cfg.maxDepth, 3);
    EXPECT_EQ(cfg.logFile, "/tmp/p.log");
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(ConfigJson, WrongTypeIsRejected) {
    EXPECT_THROW(Config::fromJson({{"max_depth", "deep"}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json::array()), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile) {
    fs::path file = writeFile(base / "config.json",
                              "{\"allowed_directories\": [\"" + root.u8string() + "\"], \"allow_destructive\": true}");
    Config cfg = Config::load(file.u8string());
    ASSERT_EQ(cfg.allowedDirectories.size(), 1u);
    EXPECT_EQ(cfg.tier(), PermissionTier::Destructive);
}

TEST_F(ConfigTest, LoadReportsMissingAndMalformedFiles) {
    EXPECT_THROW(Config::load((base / "nope.json").u8string()), std::runtime_error);

    fs::path bad = writeFile(base / "bad.json", "{ not json");
    try {
        Config::load(bad.u8string());
        FAIL() << "expected parse failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("bad.json"), std::string::npos);
    }
}

TEST_F(ConfigTest, ValidateCanonicalizesRoots) {
    Config cfg;
    cfg.allowedDirectories = {root / "." / ".." / "sandbox"};
    cfg.allowDestructive = true;
    Config valid = cfg.validate();
    ASSERT_EQ(valid.allowedDirectories.size(), 1u);
    EXPECT_EQ(valid.allowedDirectories[0], root);
    EXPECT_TRUE(valid.allowWrite);
    EXPECT_EQ(valid.tier(), PermissionTier::Destructive);
}

TEST_F(ConfigTest, ValidateRejectsBadRoots) {
    Config missing;
    missing.allowedDirectories = {root / "does-not-exist"};
    try {
        missing.validate();
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to resolve directory"), std::string::npos);
    }

    Config file;
    file.allowedDirectories = {writeFile("plain.txt", "x")};
    try {
        file.validate();
        FAIL() << "expected failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("is not a directory"), std::string::npos);
    }

    Config none;
    EXPECT_THROW(none.validate(), std::runtime_error);
}

TEST_F(ConfigTest, ValidateRejectsZeroReadSize) {
    Config cfg;
    cfg.allowedDirectories = {root};
    cfg.maxReadSize = 0;
    EXPECT_THROW(cfg.validate(), std::runtime_error);
}
