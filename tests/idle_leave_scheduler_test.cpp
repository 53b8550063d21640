#include <gtest/gtest.h>

#include "encore/music/idle_leave_scheduler.hpp"
#include "encore/music/state_registry.hpp"

#include "fakes.hpp"

using namespace encore;
using encore::test::raw;

namespace {

const dpp::snowflake k_guild{42};

class IdleLeaveSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        voice.humans = false;
    }

    music::state_registry       registry;
    test::fake_voice_gateway    voice;
    test::fake_notifier         notifier;
    test::manual_timer_service  timers;
    test::manual_executor       exec;
    music::idle_leave_scheduler idle{registry, voice, notifier, timers, exec, {}};

    music::guild_state& guild() { return registry.get_or_create(k_guild); }
};

} // namespace

TEST_F(IdleLeaveSchedulerTest, FiresAndLeavesOnce)
{
    guild().last_text_channel = dpp::snowflake(77);
    idle.schedule(guild(), std::chrono::seconds(15));
    const auto id = timers.last_id();

    ASSERT_TRUE(timers.fire(id));
    EXPECT_EQ(voice.disconnects, 0) << "leave must run on the executor";
    exec.run_all();

    EXPECT_EQ(voice.disconnects, 1);
    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_EQ(notifier.sent[0].guild_id, raw(k_guild));
    EXPECT_EQ(notifier.sent[0].channel_id, 77u);
    EXPECT_FALSE(idle.pending(guild()));

    // A second tick of the same timer changes nothing
    timers.fire_late(id);
    exec.run_all();
    EXPECT_EQ(voice.disconnects, 1);
    EXPECT_EQ(notifier.sent.size(), 1u);
}

TEST_F(IdleLeaveSchedulerTest, LeavingClearsPlayback)
{
    auto& g = guild();
    g.queue.push_back(music::track("s://b", "b"));
    g.current = music::track("s://a", "a");
    g.state   = music::playback_state::playing;
    const auto session = g.session;

    idle.schedule(g, std::chrono::seconds(1));
    timers.fire(timers.last_id());
    exec.run_all();

    EXPECT_TRUE(g.queue.empty());
    EXPECT_FALSE(g.current);
    EXPECT_EQ(g.state, music::playback_state::idle);
    EXPECT_GT(g.session, session);
}

TEST_F(IdleLeaveSchedulerTest, CancelBeforeFireKeepsConnection)
{
    idle.schedule(guild(), std::chrono::seconds(5));
    const auto id = timers.last_id();

    idle.cancel(guild());
    EXPECT_EQ(timers.armed(), 0u);
    EXPECT_FALSE(idle.pending(guild()));

    // The tick was already on its way when cancel ran
    timers.fire_late(id);
    exec.run_all();

    EXPECT_EQ(voice.disconnects, 0);
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(IdleLeaveSchedulerTest, CancelWithoutTimerIsNoop)
{
    const auto generation = guild().leave_generation;
    idle.cancel(guild());

    EXPECT_EQ(guild().leave_generation, generation);
    EXPECT_EQ(timers.disarms, 0);
}

TEST_F(IdleLeaveSchedulerTest, RescheduleReplacesEarlierTimer)
{
    idle.schedule(guild(), std::chrono::seconds(5));
    const auto first = timers.last_id();
    idle.schedule(guild(), std::chrono::seconds(15));
    const auto second = timers.last_id();

    EXPECT_EQ(timers.armed(), 1u);
    EXPECT_EQ(timers.last_delay, std::chrono::seconds(15));

    timers.fire_late(first);
    exec.run_all();
    EXPECT_EQ(voice.disconnects, 0);

    timers.fire(second);
    exec.run_all();
    EXPECT_EQ(voice.disconnects, 1);
}

TEST_F(IdleLeaveSchedulerTest, SomeoneJoinedDuringDelay)
{
    idle.schedule(guild(), std::chrono::seconds(1));
    voice.humans = true;

    timers.fire(timers.last_id());
    exec.run_all();

    EXPECT_EQ(voice.disconnects, 0);
    EXPECT_TRUE(notifier.sent.empty());
    EXPECT_FALSE(idle.pending(guild()));
}

TEST_F(IdleLeaveSchedulerTest, AlreadyDisconnected)
{
    idle.schedule(guild(), std::chrono::seconds(1));
    voice.connected = false;

    timers.fire(timers.last_id());
    exec.run_all();

    EXPECT_EQ(voice.disconnects, 0);
    EXPECT_TRUE(notifier.sent.empty());
}
