// VALORIA - Configuration File Parser Tests
// Copyright (c) 2024 VALORIA Developers
// MIT License

#include <gtest/gtest.h>

#include "valoria/util/config.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace valoria {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/valoria_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValues) {
    auto result = config_.ParseString(
        "# oracle settings\n"
        "admin = gov\n"
        "; another comment\n"
        "\n"
        "consensusthreshold=4\n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("admin"), "gov");
    EXPECT_EQ(config_.GetInt("consensusthreshold"), 4);
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, QuotedValues) {
    auto result = config_.ParseString(
        "a=\"hello world\"\n"
        "b='single \\n raw'\n"
        "c=\"tab\\there\"\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("a"), "hello world");
    EXPECT_EQ(config_.GetString("b"), "single \\n raw");
    EXPECT_EQ(config_.GetString("c"), "tab\there");
}

TEST_F(ConfigTest, BareFlags) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\nnodebug\n").success);

    EXPECT_TRUE(config_.GetBool("printtoconsole"));
    ASSERT_TRUE(config_.HasKey("debug"));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString(
        "admin=gov\n"
        "[test]\n"
        "admin=tester\n").success);

    EXPECT_EQ(config_.GetString("admin"), "gov");
    EXPECT_EQ(config_.GetString("admin", "", "test"), "tester");
    EXPECT_EQ(config_.GetKeys("test"), std::vector<std::string>{"admin"});
}

TEST_F(ConfigTest, MissingSectionBracket) {
    auto result = config_.ParseString("admin=gov\n[broken\n", "valoria.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, "valoria.conf");
    EXPECT_EQ(result.ToString().rfind("valoria.conf:2:", 0), 0u);
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);

    EXPECT_FALSE(config_.ParseString("=value\n").success);
}

TEST_F(ConfigTest, DuplicateKeyWarns) {
    auto result = config_.ParseString("maxoracles=5\nmaxoracles=7\n");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("maxoracles"), std::string::npos);
    EXPECT_EQ(config_.GetInt("maxoracles"), 7);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "key=" + std::string(MAX_LINE_LENGTH, 'x') + "\n";
    EXPECT_FALSE(config_.ParseString(line).success);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, IntegerParsing) {
    ASSERT_TRUE(config_.ParseString(
        "n=42\n"
        "neg=-7\n"
        "junk=12abc\n"
        "huge=99999999999999999999999\n").success);

    EXPECT_EQ(config_.TryGetInt("n"), int64_t{42});
    EXPECT_EQ(config_.TryGetInt("neg"), int64_t{-7});
    EXPECT_FALSE(config_.TryGetInt("junk").has_value());
    EXPECT_FALSE(config_.TryGetInt("huge").has_value());
    EXPECT_FALSE(config_.TryGetInt("absent").has_value());
    EXPECT_EQ(config_.GetInt("junk", 5), 5);
}

TEST_F(ConfigTest, BoolParsing) {
    EXPECT_EQ(ConfigManager::ParseBool("yes"), true);
    EXPECT_EQ(ConfigManager::ParseBool("ON"), true);
    EXPECT_EQ(ConfigManager::ParseBool("0"), false);
    EXPECT_EQ(ConfigManager::ParseBool("False"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

// ============================================================================
// Priority
// ============================================================================

TEST_F(ConfigTest, SetOverridesFile) {
    ASSERT_TRUE(config_.ParseString("admin=gov\n").success);
    config_.Set("admin", "override");
    EXPECT_EQ(config_.GetString("admin"), "override");
}

TEST_F(ConfigTest, FileDoesNotReplaceCommandLine) {
    config_.Set("admin", "cli");
    ASSERT_TRUE(config_.ParseString("admin=file\n").success);
    EXPECT_EQ(config_.GetString("admin"), "cli");
}

TEST_F(ConfigTest, DefaultsHaveLowestPriority) {
    config_.SetDefault("maxoracles", "10");
    EXPECT_EQ(config_.GetInt("maxoracles"), 10);

    ASSERT_TRUE(config_.ParseString("maxoracles=20\n").success);
    EXPECT_EQ(config_.GetInt("maxoracles"), 20);

    config_.SetDefault("maxoracles", "30");
    EXPECT_EQ(config_.GetInt("maxoracles"), 20);
}

TEST_F(ConfigTest, ParseCommandLine) {
    const char* argv[] = {
        "valoria-cli", "--admin=gov", "-maxoracles=4", "--printtoconsole",
        "--nodebug", "submit", "123",
    };
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("admin"), "gov");
    EXPECT_EQ(config_.GetInt("maxoracles"), 4);
    EXPECT_TRUE(config_.GetBool("printtoconsole"));
    EXPECT_FALSE(config_.GetBool("debug", true));
    EXPECT_FALSE(config_.HasKey("submit"));
}

TEST_F(ConfigTest, ParseCommandLineInvalidOption) {
    const char* argv[] = {"valoria-cli", "--bad key=1"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

// ============================================================================
// Files and Expansion
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("admin=gov\nstalenesswindow=600\n");

    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetInt("stalenesswindow"), 600);

    auto entry = config_.GetEntry("stalenesswindow");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source, path);
    EXPECT_EQ(entry->lineNumber, 2);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/valoria.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("VALORIA_TEST_ADMIN", "from-env", 1);
    ASSERT_TRUE(config_.ParseString(
        "admin=${VALORIA_TEST_ADMIN}\n"
        "logfile=$VALORIA_TEST_ADMIN/debug.log\n"
        "unset=${VALORIA_TEST_UNSET_VARIABLE}x\n").success);
    unsetenv("VALORIA_TEST_ADMIN");

    EXPECT_EQ(config_.GetString("admin"), "from-env");
    EXPECT_EQ(config_.GetString("logfile"), "from-env/debug.log");
    EXPECT_EQ(config_.GetString("unset"), "x");
}

TEST_F(ConfigTest, TildeExpansion) {
    const char* savedHome = std::getenv("HOME");
    const std::string previous = savedHome ? savedHome : "";
    setenv("HOME", "/home/tester", 1);

    EXPECT_EQ(ConfigManager::ExpandTilde("~/data"), "/home/tester/data");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs/path"), "/abs/path");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/data"), "~other/data");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.valoria");

    config_.Set("logfile", "~/debug.log");
    EXPECT_EQ(config_.GetPath("logfile"), "/home/tester/debug.log");

    if (savedHome) {
        setenv("HOME", previous.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateWarnsOnUnknownKeys) {
    config_.AllowKey(ConfigKeys::ADMIN);
    config_.AllowKey(ConfigKeys::MAXORACLES);
    config_.SetDefault("unlisted-default", "1");
    ASSERT_TRUE(config_.ParseString("admin=gov\nmaxoracels=4\n", "valoria.conf").success);

    auto warnings = config_.Validate();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("maxoracels"), std::string::npos);
    EXPECT_NE(warnings[0].find("valoria.conf:2"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace valoria
