#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "encore/config.hpp"

using namespace encore;

namespace {

const char* const k_vars[] = {
    "DISCORD_TOKEN", "token", "ENCORE_PREFIX", "ENCORE_YTDLP", "ENCORE_FFMPEG",
    "ENCORE_SEARCH_RESULTS", "ENCORE_WORKERS", "ENCORE_CONTROL_WORKERS", "ENCORE_MEMBERSHIP_GRACE",
    "ENCORE_STOP_GRACE", "ENCORE_QUEUE_DRAINED_GRACE", "ENCORE_CHOICE_TIMEOUT",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear()
    {
        for (const char* name : k_vars) {
            unsetenv(name);
        }
    }
};

} // namespace

TEST_F(ConfigTest, TokenIsRequired)
{
    EXPECT_THROW(bot_config::from_env(), std::runtime_error);
}

TEST_F(ConfigTest, DefaultsWithToken)
{
    setenv("DISCORD_TOKEN", "abc", 1);

    const auto cfg = bot_config::from_env();

    EXPECT_EQ(cfg.token, "abc");
    EXPECT_EQ(cfg.prefix, "!");
    EXPECT_EQ(cfg.ffmpeg, "ffmpeg");
    EXPECT_EQ(cfg.ytdlp.executable, "yt-dlp");
    EXPECT_EQ(cfg.search_results, 5u);
    EXPECT_EQ(cfg.workers, 4u);
    EXPECT_EQ(cfg.control_workers, 2u);
    EXPECT_EQ(cfg.grace.membership, std::chrono::seconds(1));
    EXPECT_EQ(cfg.grace.stop, std::chrono::seconds(5));
    EXPECT_EQ(cfg.grace.queue_drained, std::chrono::seconds(15));
    EXPECT_EQ(cfg.choice_timeout, std::chrono::seconds(60));
    EXPECT_TRUE(cfg.warnings.empty());
}

TEST_F(ConfigTest, LegacyTokenVariable)
{
    setenv("token", "legacy", 1);
    EXPECT_EQ(bot_config::from_env().token, "legacy");

    setenv("DISCORD_TOKEN", "preferred", 1);
    EXPECT_EQ(bot_config::from_env().token, "preferred");
}

TEST_F(ConfigTest, Overrides)
{
    setenv("DISCORD_TOKEN", "abc", 1);
    setenv("ENCORE_PREFIX", "?", 1);
    setenv("ENCORE_YTDLP", "/usr/local/bin/yt-dlp", 1);
    setenv("ENCORE_STOP_GRACE", "30", 1);
    setenv("ENCORE_SEARCH_RESULTS", "3", 1);

    const auto cfg = bot_config::from_env();

    EXPECT_EQ(cfg.prefix, "?");
    EXPECT_EQ(cfg.ytdlp.executable, "/usr/local/bin/yt-dlp");
    EXPECT_EQ(cfg.grace.stop, std::chrono::seconds(30));
    EXPECT_EQ(cfg.search_results, 3u);
}

TEST_F(ConfigTest, BadNumbersKeepDefaultsWithWarning)
{
    setenv("DISCORD_TOKEN", "abc", 1);
    setenv("ENCORE_WORKERS", "lots", 1);
    setenv("ENCORE_SEARCH_RESULTS", "12", 1);

    const auto cfg = bot_config::from_env();

    EXPECT_EQ(cfg.workers, 4u);
    EXPECT_EQ(cfg.search_results, 5u);
    ASSERT_EQ(cfg.warnings.size(), 2u);
    EXPECT_NE(cfg.warnings[0].find("ENCORE_SEARCH_RESULTS"), std::string::npos);
    EXPECT_NE(cfg.warnings[1].find("ENCORE_WORKERS"), std::string::npos);
}
