#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "encore/music/state_registry.hpp"

using namespace encore;

TEST(StateRegistry, CreatesOnFirstUse)
{
    music::state_registry registry;
    EXPECT_EQ(registry.find(dpp::snowflake(5)), nullptr);

    auto& g = registry.get_or_create(dpp::snowflake(5));

    EXPECT_EQ(static_cast<std::uint64_t>(g.guild_id), 5u);
    EXPECT_EQ(g.state, music::playback_state::idle);
    EXPECT_TRUE(g.queue.empty());
    EXPECT_FALSE(g.current);
    EXPECT_EQ(g.search_id, 0u);
    EXPECT_EQ(registry.find(dpp::snowflake(5)), &g);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(StateRegistry, SameGuildSameState)
{
    music::state_registry registry;
    auto& a = registry.get_or_create(dpp::snowflake(1));
    auto& b = registry.get_or_create(dpp::snowflake(2));

    EXPECT_NE(&a, &b);
    EXPECT_EQ(&registry.get_or_create(dpp::snowflake(1)), &a);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(StateRegistry, ConcurrentLookupsAgree)
{
    music::state_registry registry;
    std::vector<music::guild_state*> seen(8, nullptr);

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&registry, &seen, i] {
            seen[i] = &registry.get_or_create(dpp::snowflake(99));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (auto* p : seen) {
        EXPECT_EQ(p, seen[0]);
    }
    EXPECT_EQ(registry.size(), 1u);
}
