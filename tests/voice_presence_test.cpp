#include <gtest/gtest.h>

#include "encore/music/voice_presence.hpp"

#include "fakes.hpp"

using namespace encore;
using encore::test::raw;

namespace {

const dpp::snowflake k_guild{5};
const dpp::snowflake k_user{50};

} // namespace

TEST(VoicePresence, FirstSightingHasNoPreviousChannel)
{
    music::voice_presence presence;

    EXPECT_FALSE(presence.update(k_guild, k_user, dpp::snowflake(500)));
}

TEST(VoicePresence, ReportsWhereMemberWasBefore)
{
    music::voice_presence presence;
    presence.update(k_guild, k_user, dpp::snowflake(500));

    const auto moved = presence.update(k_guild, k_user, dpp::snowflake(600));
    ASSERT_TRUE(moved);
    EXPECT_EQ(raw(*moved), 500u);

    const auto left = presence.update(k_guild, k_user, dpp::snowflake());
    ASSERT_TRUE(left);
    EXPECT_EQ(raw(*left), 600u);

    // Leaving is remembered, so the next join is known to come from nowhere
    const auto back = presence.update(k_guild, k_user, dpp::snowflake(500));
    ASSERT_TRUE(back);
    EXPECT_TRUE(back->empty());
}

TEST(VoicePresence, GuildsAreTrackedSeparately)
{
    music::voice_presence presence;
    presence.update(k_guild, k_user, dpp::snowflake(500));

    EXPECT_FALSE(presence.update(dpp::snowflake(6), k_user, dpp::snowflake(700)));
}
