// DIRGATE - Configuration File Parser Tests
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include <gtest/gtest.h>

#include "dirgate/util/config.h"
#include "dirgate/util/fs.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

namespace dirgate {
namespace util {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    /// Runs ParseCommandLine over a copy of args with a program name prepended
    ConfigParseResult ParseArgs(std::vector<std::string> args) {
        args.insert(args.begin(), "dirgated");
        argStorage_ = std::move(args);
        std::vector<char*> argv;
        for (auto& arg : argStorage_) {
            argv.push_back(&arg[0]);
        }
        argv.push_back(nullptr);
        return config_.ParseCommandLine(static_cast<int>(argStorage_.size()), argv.data());
    }

    ConfigManager config_;
    std::vector<std::string> argStorage_;
};

// ============================================================================
// File Syntax
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, KeyValuePairsAndComments) {
    auto result = config_.ParseString(
        "# comment\n"
        "; another comment\n"
        "\n"
        "root = /srv/files\n"
        "bind=0.0.0.0\n");
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(config_.GetString("root", ""), "/srv/files");
    EXPECT_EQ(config_.GetString("bind", ""), "0.0.0.0");
    EXPECT_EQ(config_.GetString("port", "8750"), "8750");
    EXPECT_FALSE(config_.HasKey("comment"));
    EXPECT_EQ(config_.Size(), 2u);
}

TEST_F(ConfigTest, Sections) {
    auto result = config_.ParseString(
        "port=1\n"
        "[rpc]\n"
        "port=9000\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetInt("port", 0), 1);
    EXPECT_EQ(config_.GetInt("port", 0, "rpc"), 9000);
    EXPECT_EQ(config_.GetSections(), std::vector<std::string>{"rpc"});
}

TEST_F(ConfigTest, QuotedValues) {
    auto result = config_.ParseString(
        "a=\"two words\"\n"
        "b=\"say \\\"hi\\\"\"\n"
        "c='raw \\n text'\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "say \"hi\"");
    EXPECT_EQ(config_.GetString("c", ""), "raw \\n text");
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    auto result = config_.ParseString("trustproxy\nnoprinttoconsole\n");
    ASSERT_TRUE(result.success);

    EXPECT_TRUE(config_.GetBool("trustproxy", false));
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
}

TEST_F(ConfigTest, MissingSectionBracketIsError) {
    auto result = config_.ParseString("root=/a\n[rpc\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyIsError) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character in key"), std::string::npos);

    result = config_.ParseString("=value\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Empty key");
}

TEST_F(ConfigTest, LineTooLong) {
    auto result = config_.ParseString("root=" + std::string(MAX_LINE_LENGTH, 'x') + "\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, ContinuationLines) {
    auto result = config_.ParseString("allowedext=.txt,\\\n.pdf\nport=1\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("allowedext", ""), ".txt,.pdf");
    EXPECT_EQ(config_.GetInt("port", 0), 1);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    ASSERT_EQ(setenv("DIRGATE_CONFIG_TEST_DIR", "/srv", 1), 0);

    auto result = config_.ParseString(
        "root=${DIRGATE_CONFIG_TEST_DIR}/files\n"
        "logfile=$DIRGATE_CONFIG_TEST_DIR/log.txt\n"
        "other=${DIRGATE_CONFIG_TEST_UNSET}x\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("root", ""), "/srv/files");
    EXPECT_EQ(config_.GetString("logfile", ""), "/srv/log.txt");
    EXPECT_EQ(config_.GetString("other", ""), "x");

    unsetenv("DIRGATE_CONFIG_TEST_DIR");
}

TEST_F(ConfigTest, ExpandTilde) {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        EXPECT_EQ(ConfigManager::ExpandTilde("~/files"), std::string(home) + "/files");
    }
    EXPECT_EQ(ConfigManager::ExpandTilde("~other/files"), "~other/files");
    EXPECT_EQ(ConfigManager::ExpandTilde("/abs/path"), "/abs/path");
}

// ============================================================================
// Typed Values
// ============================================================================

TEST_F(ConfigTest, IntegersWithSizeSuffixes) {
    auto result = config_.ParseString(
        "plain=42\n"
        "kilo=10k\n"
        "mega=10m\n"
        "giga=2GB\n"
        "spaced=5 kb\n"
        "junk=12xyz\n"
        "word=abc\n"
        "negative=-3\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetInt("plain", 0), 42);
    EXPECT_EQ(config_.GetInt("kilo", 0), 10 * 1024);
    EXPECT_EQ(config_.GetInt("mega", 0), 10 * 1024 * 1024);
    EXPECT_EQ(config_.GetInt("giga", 0), 2LL * 1024 * 1024 * 1024);
    EXPECT_EQ(config_.GetInt("spaced", 0), 5 * 1024);
    EXPECT_FALSE(config_.TryGetInt("junk").has_value());
    EXPECT_EQ(config_.GetInt("word", 7), 7);

    EXPECT_EQ(config_.GetInt("negative", 0), -3);
    EXPECT_FALSE(config_.TryGetUInt("negative").has_value());
    EXPECT_EQ(config_.GetUInt("negative", 9), 9u);
}

TEST_F(ConfigTest, Booleans) {
    auto result = config_.ParseString("a=yes\nb=off\nc=TRUE\nd=maybe\n");
    ASSERT_TRUE(result.success);

    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, ListsFromCommasAndRepeats) {
    auto result = config_.ParseString(
        "allowedext=.txt, .pdf\n"
        "allowedext=.png\n");
    ASSERT_TRUE(result.success);

    std::vector<std::string> expected{".txt", ".pdf", ".png"};
    EXPECT_EQ(config_.GetList("allowedext"), expected);
    EXPECT_TRUE(config_.GetList("missing").empty());
}

TEST_F(ConfigTest, DefaultsYieldToParsedValues) {
    config_.SetDefault("port", "8750");
    config_.SetDefault("bind", "127.0.0.1");
    ASSERT_TRUE(config_.ParseString("port=9000\n").success);
    config_.SetDefault("port", "1");

    EXPECT_EQ(config_.GetInt("port", 0), 9000);
    EXPECT_EQ(config_.GetString("bind", ""), "127.0.0.1");

    config_.Set("port", "1234");
    EXPECT_EQ(config_.GetInt("port", 0), 1234);
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    auto result = ParseArgs({"stray", "-root", "/srv", "-noprinttoconsole",
                             "--port=9", "-help"});
    ASSERT_TRUE(result.success);

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("stray"), std::string::npos);

    EXPECT_EQ(config_.GetString("root", ""), "/srv");
    EXPECT_FALSE(config_.GetBool("printtoconsole", true));
    EXPECT_EQ(config_.GetInt("port", 0), 9);
    EXPECT_TRUE(config_.GetBool("help", false));
}

TEST_F(ConfigTest, CommandLineRejectsInvalidOption) {
    auto result = ParseArgs({"-bad key"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("bad key"), std::string::npos);
}

TEST_F(ConfigTest, CommandLineRepeatsAccumulate) {
    ASSERT_TRUE(ParseArgs({"-debug=rpc", "-debug=store,search"}).success);

    std::vector<std::string> expected{"rpc", "store", "search"};
    EXPECT_EQ(config_.GetList("debug"), expected);
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(ParseArgs({"-port=9000"}).success);
    ASSERT_TRUE(config_.ParseString("port=1000\nbind=::1\n").success);

    EXPECT_EQ(config_.GetInt("port", 0), 9000);
    EXPECT_EQ(config_.GetString("bind", ""), "::1");

    ASSERT_TRUE(config_.ParseString("port=1000\n", "forced.conf", true).success);
    EXPECT_EQ(config_.GetInt("port", 0), 1000);
}

// ============================================================================
// Files and Validation
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    fs::TempDirectory dir("dirgate_config_test");
    fs::Path path = dir.GetPath() / "dirgate.conf";
    ASSERT_TRUE(fs::WriteFile(path, "root=/srv\nmaxfilesize=1m\n"));

    auto result = config_.ParseFile(path.String());
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("root", ""), "/srv");
    EXPECT_EQ(config_.GetUInt("maxfilesize", 0), 1024u * 1024u);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/dirgate-test/dirgate.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage.rfind("Cannot open file", 0), 0u);
}

TEST_F(ConfigTest, ValidateReportsUnknownAndMissingKeys) {
    ASSERT_TRUE(config_.ParseString("root=/srv\nprot=80\n", "dirgate.conf").success);
    config_.AllowKey("root");
    config_.RequireKey("bind");

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(std::find(errors.begin(), errors.end(), "Required key missing: bind"),
              errors.end());
    EXPECT_NE(std::find(errors.begin(), errors.end(),
                        "Unknown key: prot (defined in dirgate.conf)"),
              errors.end());
}

TEST_F(ConfigTest, EveryDaemonKeyValidates) {
    std::string content;
    for (const auto& key : ConfigKeys::All()) {
        content += key + "=1\n";
        config_.AllowKey(key);
    }
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_TRUE(config_.Validate().empty());
    EXPECT_EQ(config_.Size(), ConfigKeys::All().size());
}

TEST_F(ConfigTest, SampleConfigIsAllComments) {
    std::string sample = ConfigManager::GenerateSampleConfig();
    EXPECT_NE(sample.find("#root="), std::string::npos);
    EXPECT_NE(sample.find("#port=8750"), std::string::npos);

    auto result = config_.ParseString(sample);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, DumpNamesSources) {
    ASSERT_TRUE(config_.ParseString("root=/srv\n", "a.conf").success);
    config_.SetDefault("port", "8750");

    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("root=/srv  # a.conf:1"), std::string::npos);
    EXPECT_NE(dump.find("port=8750  # (default)"), std::string::npos);
}

} // namespace
} // namespace util
} // namespace dirgate
