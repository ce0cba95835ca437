#include "clipexpire/ConfigParser.hpp"
#include "clipexpire/Errors.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace clipexpire;
using namespace std::chrono_literals;

namespace {

FileConfig parse(const std::string& text) {
    std::istringstream in(text);
    return parseConfig(in, "test.toml");
}

} // namespace

TEST(ConfigParserTest, ParsesAllKeys) {
    FileConfig config = parse(R"(
# clipexpire settings
[general]
item_expiry_seconds = 120
update_interval_seconds = 5   # poll often
ipc_timeout_ms = 2_000
always_remove_patterns = ["^ssh-ed25519", '^AKIA[0-9A-Z]{16}$']
never_remove_patterns = ["keep this"]
)");

    EXPECT_EQ(config.itemExpirySeconds, 120);
    EXPECT_EQ(config.updateIntervalSeconds, 5);
    EXPECT_EQ(config.ipcTimeoutMs, 2000);
    ASSERT_TRUE(config.alwaysRemovePatterns.has_value());
    EXPECT_EQ(*config.alwaysRemovePatterns,
              (std::vector<std::string>{"^ssh-ed25519", "^AKIA[0-9A-Z]{16}$"}));
    EXPECT_EQ(*config.neverRemovePatterns, std::vector<std::string>{"keep this"});
}

TEST(ConfigParserTest, EmptyInputLeavesEverythingUnset) {
    FileConfig config = parse("");
    EXPECT_FALSE(config.itemExpirySeconds.has_value());
    EXPECT_FALSE(config.updateIntervalSeconds.has_value());
    EXPECT_FALSE(config.alwaysRemovePatterns.has_value());
    EXPECT_FALSE(config.neverRemovePatterns.has_value());
}

TEST(ConfigParserTest, MultiLineArrayWithCommentsAndTrailingComma) {
    FileConfig config = parse(R"(
always_remove_patterns = [
    "^password:",   # colon form
    '#hashtag',
    "-----BEGIN [A-Z ]*PRIVATE KEY-----",
]
item_expiry_seconds = 60
)");

    ASSERT_TRUE(config.alwaysRemovePatterns.has_value());
    EXPECT_EQ(*config.alwaysRemovePatterns,
              (std::vector<std::string>{"^password:", "#hashtag", "-----BEGIN [A-Z ]*PRIVATE KEY-----"}));
    EXPECT_EQ(config.itemExpirySeconds, 60);
}

TEST(ConfigParserTest, BasicStringEscapesAndLiteralStrings) {
    FileConfig config = parse(R"(never_remove_patterns = ["\\d+ \"quoted\"", '\d+ raw'])");
    EXPECT_EQ(*config.neverRemovePatterns,
              (std::vector<std::string>{"\\d+ \"quoted\"", "\\d+ raw"}));
}

TEST(ConfigParserTest, EmptyArrayIsSetButEmpty) {
    FileConfig config = parse("always_remove_patterns = []\n");
    ASSERT_TRUE(config.alwaysRemovePatterns.has_value());
    EXPECT_TRUE(config.alwaysRemovePatterns->empty());
}

TEST(ConfigParserTest, UnknownKeysIgnored) {
    FileConfig config = parse("max_items = 50\nitem_expiry_seconds = 10\n");
    EXPECT_EQ(config.itemExpirySeconds, 10);
}

TEST(ConfigParserTest, MalformedValuesAreErrors) {
    EXPECT_THROW(parse("item_expiry_seconds = ten\n"), ConfigError);
    EXPECT_THROW(parse("item_expiry_seconds = 10s\n"), ConfigError);
    EXPECT_THROW(parse("always_remove_patterns = \"not a list\"\n"), ConfigError);
    EXPECT_THROW(parse("always_remove_patterns = [\"unterminated]\n"), ConfigError);
    EXPECT_THROW(parse("always_remove_patterns = [\"a\" \"b\"]\n"), ConfigError);
    EXPECT_THROW(parse("just some words\n"), ConfigError);
}

TEST(ConfigParserTest, ErrorNamesLineAndKey) {
    try {
        parse("\n\nupdate_interval_seconds = soon\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("test.toml:3"), std::string::npos) << message;
        EXPECT_NE(message.find("update_interval_seconds"), std::string::npos) << message;
    }
}

TEST(ConfigParserTest, MissingFileIsEmptyConfig) {
    FileConfig config = loadConfigFile("/nonexistent/clipexpire-test/clipexpire.toml");
    EXPECT_FALSE(config.itemExpirySeconds.has_value());
}

TEST(ConfigParserTest, MissingExplicitFileIsError) {
    const std::string path = "/nonexistent/clipexpire-test/typo.toml";
    try {
        loadConfigFile(path, true);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos) << e.what();
    }
}

TEST(ConfigParserTest, LoadsFileFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "clipexpire-config-test.toml";
    {
        std::ofstream out(path);
        out << "item_expiry_seconds = 42\n";
    }
    FileConfig config = loadConfigFile(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(config.itemExpirySeconds, 42);
}

TEST(ConfigParserTest, ConfigPathFollowsXdgConfigHome) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    EXPECT_EQ(getConfigPath(), "/tmp/xdg-test/clipexpire.toml");

    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(getConfigPath(), "/home/tester/.config/clipexpire.toml");
}

// ============================================================================
// resolveConfig
// ============================================================================

TEST(ResolveConfigTest, DefaultsWhenNothingSet) {
    ResolvedConfig config = resolveConfig({}, {});
    EXPECT_EQ(config.itemExpiry, 600s);
    EXPECT_EQ(config.updateInterval, 30s);
    EXPECT_EQ(config.ipcTimeout, 5000ms);
    EXPECT_TRUE(config.alwaysRemovePatterns.empty());
    EXPECT_TRUE(config.neverRemovePatterns.empty());
}

TEST(ResolveConfigTest, FileValuesUsed) {
    FileConfig file;
    file.itemExpirySeconds = 300;
    file.updateIntervalSeconds = 15;
    file.alwaysRemovePatterns = std::vector<std::string>{"a"};

    ResolvedConfig config = resolveConfig(file, {});
    EXPECT_EQ(config.itemExpiry, 300s);
    EXPECT_EQ(config.updateInterval, 15s);
    EXPECT_EQ(config.alwaysRemovePatterns, std::vector<std::string>{"a"});
}

TEST(ResolveConfigTest, OverrideWinsKeyByKey) {
    FileConfig file;
    file.itemExpirySeconds = 300;
    file.updateIntervalSeconds = 15;
    file.alwaysRemovePatterns = std::vector<std::string>{"file-deny"};
    file.neverRemovePatterns = std::vector<std::string>{"file-keep"};

    ConfigOverrides overrides;
    overrides.itemExpirySeconds = 45;
    overrides.alwaysRemovePatterns = std::vector<std::string>{"cli-deny"};

    ResolvedConfig config = resolveConfig(file, overrides);
    EXPECT_EQ(config.itemExpiry, 45s);
    EXPECT_EQ(config.updateInterval, 15s);
    EXPECT_EQ(config.alwaysRemovePatterns, std::vector<std::string>{"cli-deny"});
    EXPECT_EQ(config.neverRemovePatterns, std::vector<std::string>{"file-keep"});
}

TEST(ResolveConfigTest, NonPositiveValuesRejectedWithKeyAndValue) {
    FileConfig file;
    file.itemExpirySeconds = 0;
    try {
        resolveConfig(file, {});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("item_expiry_seconds"), std::string::npos);
        EXPECT_NE(message.find("0"), std::string::npos);
    }

    ConfigOverrides overrides;
    overrides.updateIntervalSeconds = -5;
    try {
        resolveConfig({}, overrides);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("update_interval_seconds"), std::string::npos);
        EXPECT_NE(message.find("-5"), std::string::npos);
    }

    overrides = {};
    overrides.ipcTimeoutMs = 0;
    EXPECT_THROW(resolveConfig({}, overrides), ConfigError);
}

TEST(ResolveConfigTest, ExpiryBeyondClockRangeRejected) {
    FileConfig file;
    file.itemExpirySeconds = 10000000000;
    try {
        resolveConfig(file, {});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("item_expiry_seconds"), std::string::npos) << message;
        EXPECT_NE(message.find("10000000000"), std::string::npos) << message;
    }

    file.itemExpirySeconds = ResolvedConfig::MAX_EXPIRY_SECONDS;
    EXPECT_EQ(resolveConfig(file, {}).itemExpiry.count(), ResolvedConfig::MAX_EXPIRY_SECONDS);
}

TEST(ResolveConfigTest, IntervalAndTimeoutBoundedByGLibTypes) {
    FileConfig file;
    file.updateIntervalSeconds = 4294967296;
    try {
        resolveConfig(file, {});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("update_interval_seconds"), std::string::npos) << message;
        EXPECT_NE(message.find("4294967296"), std::string::npos) << message;
    }
    file.updateIntervalSeconds = 4294967295;
    EXPECT_EQ(resolveConfig(file, {}).updateInterval.count(), 4294967295);

    ConfigOverrides overrides;
    overrides.ipcTimeoutMs = 2147483648;
    try {
        resolveConfig({}, overrides);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("ipc_timeout_ms"), std::string::npos) << message;
        EXPECT_NE(message.find("2147483648"), std::string::npos) << message;
    }
    overrides.ipcTimeoutMs = 2147483647;
    EXPECT_EQ(resolveConfig({}, overrides).ipcTimeout.count(), 2147483647);
}

TEST(ResolveConfigTest, ValidOverrideRescuesInvalidFileValue) {
    FileConfig file;
    file.itemExpirySeconds = 0;
    ConfigOverrides overrides;
    overrides.itemExpirySeconds = 10;

    EXPECT_EQ(resolveConfig(file, overrides).itemExpiry, 10s);
}
