/**
 * Tests for the TOML config reader and the [downloader] overlay.
 *
 * Config path resolution order (highest to lowest priority):
 *   1. --config override
 *   2. PARAFETCH_CONFIG
 *   3. $XDG_CONFIG_HOME/parafetch/config.toml
 *   4. ~/.config/parafetch/config.toml
 */

#include <gtest/gtest.h>
#include <parafetch/config/config_helpers.h>

#include "support/temp_dir_scope.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace parafetch::config;
using parafetch::test_support::TempDirScope;
using parafetch::test_support::write_file;

namespace {

/**
 * RAII helper to set (or unset, with nullptr) and restore an environment variable.
 */
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            hadValue_ = true;
            oldValue_ = old;
        }
        set(value);
    }

    ~ScopedEnv() { set(hadValue_ ? oldValue_.c_str() : nullptr); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    void set(const char* value) {
#ifdef _WIN32
        _putenv_s(name_.c_str(), value ? value : "");
#else
        if (value)
            setenv(name_.c_str(), value, 1);
        else
            unsetenv(name_.c_str());
#endif
    }

    std::string name_;
    std::string oldValue_;
    bool hadValue_{false};
};

constexpr const char* kSample = R"(# parafetch settings
user_agent_note = "top level, no section"

[downloader]
workers = 12
chunk_size_mb = 4          # fixed segment size
max_retries = 5
timeout_s = 90
keep_parts = true
resume = "false"
user_agent = "mirror-sync/2.0 # not a comment"

[other]
workers = 99
)";

} // namespace

TEST(ConfigStrings, TrimAndUnquote) {
    std::string s = "  \t value \n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
    EXPECT_EQ(unquote("  bare  "), "bare");
}

TEST(ConfigStrings, TildeExpandsToHome) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/cfg.toml"), fs::path("/home/tester/cfg.toml"));
    EXPECT_EQ(expand_tilde("~"), fs::path("/home/tester"));
    EXPECT_EQ(expand_tilde("/etc/~x"), fs::path("/etc/~x"));
}

TEST(ConfigValues, TypedParsers) {
    EXPECT_EQ(parse_int("42"), 42);
    EXPECT_FALSE(parse_int("4x").has_value());
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_EQ(parse_bool("yes"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(ConfigFile, ReadsValuesBySection) {
    auto dir = TempDirScope::unique_under("parafetch-config");
    const auto cfg = dir / "config.toml";
    write_file(cfg, std::string(kSample));

    EXPECT_EQ(parse_config_value(cfg, "downloader", "workers"), "12");
    EXPECT_EQ(parse_config_value(cfg, "other", "workers"), "99");
    EXPECT_EQ(parse_config_value(cfg, "downloader", "chunk_size_mb"), "4");
    EXPECT_EQ(parse_config_value(cfg, "downloader", "user_agent"),
              "mirror-sync/2.0 # not a comment");
    EXPECT_EQ(parse_config_value(cfg, "downloader", "missing"), "");
    EXPECT_EQ(parse_config_value(dir / "absent.toml", "downloader", "workers"), "");

    auto section = parse_config_section(cfg, "downloader");
    EXPECT_EQ(section.size(), 7u);
    EXPECT_EQ(section["resume"], "false");
}

TEST(ConfigFile, DottedKeysAtTopLevel) {
    auto dir = TempDirScope::unique_under("parafetch-config");
    const auto cfg = dir / "config.toml";
    write_file(cfg, std::string("downloader.workers = 3\ndownloader.keep_parts = on\n"));

    auto section = parse_config_section(cfg, "downloader");
    EXPECT_EQ(section["workers"], "3");
    EXPECT_EQ(section["keep_parts"], "on");
}

TEST(ConfigPath, OverrideBeatsEnvironment) {
    ScopedEnv env("PARAFETCH_CONFIG", "/env/parafetch.toml");
    EXPECT_EQ(get_config_path("/explicit/config.toml"), fs::path("/explicit/config.toml"));
    EXPECT_EQ(get_config_path(), fs::path("/env/parafetch.toml"));
}

TEST(ConfigPath, XdgThenHome) {
    ScopedEnv env("PARAFETCH_CONFIG", nullptr);
    ScopedEnv home("HOME", "/home/tester");
    {
        ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
        EXPECT_EQ(get_config_path(), fs::path("/xdg/parafetch/config.toml"));
    }
    ScopedEnv xdg("XDG_CONFIG_HOME", nullptr);
    EXPECT_EQ(get_config_path(), fs::path("/home/tester/.config/parafetch/config.toml"));
}

TEST(DownloaderConfigFile, OverlaysDefaults) {
    auto dir = TempDirScope::unique_under("parafetch-config");
    const auto path = dir / "config.toml";
    write_file(path, std::string(kSample));

    auto r = loadDownloaderConfig(path);
    ASSERT_TRUE(r.ok()) << r.error().message;
    const auto& cfg = r.value();
    EXPECT_EQ(cfg.defaultWorkers, 12);
    EXPECT_EQ(cfg.defaultChunkSizeMb, 4);
    EXPECT_EQ(cfg.retry.maxAttempts, 5);
    EXPECT_EQ(cfg.defaultTimeout, std::chrono::seconds(90));
    EXPECT_TRUE(cfg.keepParts);
    EXPECT_FALSE(cfg.resume);
    EXPECT_EQ(cfg.userAgent, "mirror-sync/2.0 # not a comment");
    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.maxRedirects, parafetch::downloader::DownloaderConfig{}.maxRedirects);
}

TEST(DownloaderConfigFile, MissingFileReturnsBase) {
    auto dir = TempDirScope::unique_under("parafetch-config");
    parafetch::downloader::DownloaderConfig base;
    base.defaultWorkers = 2;

    auto r = loadDownloaderConfig(dir / "nope.toml", base);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().defaultWorkers, 2);
}

TEST(DownloaderConfigFile, RejectsOutOfRangeValues) {
    auto dir = TempDirScope::unique_under("parafetch-config");
    const auto path = dir / "config.toml";

    write_file(path, std::string("[downloader]\nworkers = 0\n"));
    auto zero = loadDownloaderConfig(path);
    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.error().code, parafetch::downloader::ErrorCode::InvalidArgument);
    EXPECT_NE(zero.error().message.find("downloader.workers"), std::string::npos);

    write_file(path, std::string("[downloader]\nkeep_parts = sometimes\n"));
    auto badBool = loadDownloaderConfig(path);
    ASSERT_FALSE(badBool.ok());
    EXPECT_NE(badBool.error().message.find("sometimes"), std::string::npos);

    write_file(path, std::string("[downloader]\nmax_retries = three\n"));
    EXPECT_FALSE(loadDownloaderConfig(path).ok());
}
