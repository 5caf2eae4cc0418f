// STAKELEDGER - Configuration File Parser Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeledger/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace stakeledger {
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
        char filename[] = "/tmp/stakeledger_config_test_XXXXXX";
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

    ConfigParseResult ParseArgs(std::vector<const char*> args,
                                std::vector<std::string>* positional = nullptr) {
        args.insert(args.begin(), "stakeledger-cli");
        return config_.ParseCommandLine(static_cast<int>(args.size()), args.data(),
                                        positional);
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// File Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, CommentsAndBlankLinesIgnored) {
    auto result = config_.ParseString("# comment\n; other\n\n   \n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, KeyValueWithWhitespace) {
    ASSERT_TRUE(config_.ParseString("  depositfloor =  100  ").success);
    EXPECT_EQ(config_.GetString("depositfloor", ""), "100");
    EXPECT_EQ(config_.GetUInt("depositfloor", 0), 100u);
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString("a=\"two words\"\nb='raw \\n'\nc=\"tab\\there\"").success);
    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "raw \\n");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, Sections) {
    ASSERT_TRUE(config_.ParseString("x=1\n[test]\nx=2\n").success);
    EXPECT_EQ(config_.GetString("x", ""), "1");
    EXPECT_EQ(config_.GetString("x", "", "test"), "2");
}

TEST_F(ConfigTest, UnclosedSectionIsError) {
    auto result = config_.ParseString("a=1\n[broken\n", "my.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.ToString(), "my.conf:2: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKeyIsError) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\nnodebug\n").success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, RepeatedKeysFormList) {
    ASSERT_TRUE(config_.ParseString("admin=aa\nadmin=bb, cc\n").success);
    EXPECT_EQ(config_.GetString("admin", ""), "aa");
    std::vector<std::string> expected{"aa", "bb", "cc"};
    EXPECT_EQ(config_.GetList("admin"), expected);
    EXPECT_TRUE(config_.GetList("missing").empty());
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("STAKELEDGER_TEST_DIR", "/srv/ledger", 1);
    ASSERT_TRUE(config_.ParseString("datadir=${STAKELEDGER_TEST_DIR}/main").success);
    EXPECT_EQ(config_.GetString("datadir", ""), "/srv/ledger/main");
    unsetenv("STAKELEDGER_TEST_DIR");
}

TEST_F(ConfigTest, TildeExpansion) {
    const char* oldHome = std::getenv("HOME");
    std::string saved = oldHome ? oldHome : "";
    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/x"), "/home/tester/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/x"), "~other/x");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs"), "/abs");
    EXPECT_EQ(ConfigManager::GetDefaultDataDir(), "/home/tester/.stakeledger");
    if (oldHome) {
        setenv("HOME", saved.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("cooldown=86400\ndepositfloor=100\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetUInt("cooldown", 0), 86400u);
    EXPECT_EQ(config_.GetUInt("depositfloor", 0), 100u);
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto result = config_.ParseFile("/nonexistent/stakeledger.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, UIntRejectsNonNumeric) {
    config_.Set("a", "-5");
    config_.Set("b", "12x");
    config_.Set("c", "99999999999999999999999");
    EXPECT_FALSE(config_.TryGetUInt("a").has_value());
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_FALSE(config_.TryGetUInt("c").has_value());
    EXPECT_EQ(config_.GetUInt("a", 7), 7u);
}

TEST_F(ConfigTest, BoolLiterals) {
    EXPECT_EQ(ConfigManager::ParseBool("YES"), true);
    EXPECT_EQ(ConfigManager::ParseBool("off"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());
}

TEST_F(ConfigTest, DefaultsYieldToParsedValues) {
    config_.SetDefault("cooldown", "10");
    EXPECT_EQ(config_.GetUInt("cooldown", 0), 10u);
    ASSERT_TRUE(config_.ParseString("cooldown=20").success);
    EXPECT_EQ(config_.GetUInt("cooldown", 0), 20u);

    config_.SetDefault("cooldown", "30");
    EXPECT_EQ(config_.GetUInt("cooldown", 0), 20u);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineOptionsAndPositionals) {
    std::vector<std::string> positional;
    auto result = ParseArgs({"-caller=ab", "--value=5", "slash", "-nodebug", "cd", "7"},
                            &positional);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("caller", ""), "ab");
    EXPECT_EQ(config_.GetUInt("value", 0), 5u);
    EXPECT_FALSE(config_.GetBool("debug", true));
    std::vector<std::string> expected{"slash", "cd", "7"};
    EXPECT_EQ(positional, expected);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(ParseArgs({"-cooldown=5", "-admin=aa"}).success);
    ASSERT_TRUE(config_.ParseString("cooldown=100\nadmin=bb\n").success);
    EXPECT_EQ(config_.GetUInt("cooldown", 0), 5u);
    std::vector<std::string> expected{"aa"};
    EXPECT_EQ(config_.GetList("admin"), expected);
}

TEST_F(ConfigTest, RepeatedCommandLineOptionsAccumulate) {
    ASSERT_TRUE(ParseArgs({"-admin=aa", "-admin=bb"}).success);
    std::vector<std::string> expected{"aa", "bb"};
    EXPECT_EQ(config_.GetList("admin"), expected);
    EXPECT_EQ(config_.GetString("admin", ""), "bb");
}

TEST_F(ConfigTest, InvalidCommandLineOption) {
    auto result = ParseArgs({"-bad key=1"});
    EXPECT_FALSE(result.success);
}

} // namespace test
} // namespace util
} // namespace stakeledger
