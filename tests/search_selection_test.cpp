#include <gtest/gtest.h>

#include <thread>

#include "encore/music/idle_leave_scheduler.hpp"
#include "encore/music/playback_controller.hpp"
#include "encore/music/search_selection.hpp"
#include "encore/music/state_registry.hpp"

#include "fakes.hpp"

using namespace encore;

namespace {

const dpp::snowflake k_guild{7};
const dpp::snowflake k_text{70};
const dpp::snowflake k_voice{700};

class SearchSelectionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        resolver.searches["lofi"] = {
            test::make_candidate("Lofi One", "https://yt/1", 180, std::string("Chill")),
            test::make_candidate("Lofi Two", "https://yt/2", 240),
            test::make_candidate("Lofi Three", "https://yt/3"),
        };
        resolver.searches["jazz"] = {
            test::make_candidate("Jazz One", "https://yt/j1"),
        };
        resolver.tracks["https://yt/1"]  = music::track("s://1", "Lofi One", "https://yt/1");
        resolver.tracks["https://yt/2"]  = music::track("s://2", "Lofi Two", "https://yt/2");
        resolver.tracks["https://yt/j1"] = music::track("s://j1", "Jazz One", "https://yt/j1");
    }

    music::selection_request request(long index, std::optional<std::uint64_t> search_id = std::nullopt)
    {
        music::selection_request req;
        req.guild_id      = k_guild;
        req.index         = index;
        req.search_id     = search_id;
        req.text_channel  = k_text;
        req.voice_channel = k_voice;
        return req;
    }

    music::guild_state& guild() { return registry.get_or_create(k_guild); }

    music::state_registry       registry;
    test::fake_voice_gateway    voice;
    test::fake_notifier         notifier;
    test::manual_timer_service  timers;
    test::manual_executor       exec;
    test::fake_resolver         resolver;
    music::idle_leave_scheduler idle{registry, voice, notifier, timers, exec, {}};
    music::playback_controller  controller{registry, voice, notifier, idle, exec, music::grace_periods{}, {}};
    music::search_selection     selection{registry, resolver, controller, 5, {}};
};

} // namespace

TEST_F(SearchSelectionTest, SearchStoresCandidatesForGuild)
{
    const auto found = selection.search(k_guild, "lofi");

    EXPECT_EQ(found.search_id, 1u);
    ASSERT_EQ(found.candidates.size(), 3u);
    EXPECT_EQ(resolver.last_search_count, 5u);
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
    EXPECT_EQ(guild().search_id, found.search_id);
    EXPECT_TRUE(resolver.resolved.empty());
}

TEST_F(SearchSelectionTest, SearchTruncatesToResultCount)
{
    music::search_selection three{registry, resolver, controller, 3, {}};
    resolver.searches["many"] = {
        test::make_candidate("a", "https://yt/a"),
        test::make_candidate("b", "https://yt/b"),
        test::make_candidate("c", "https://yt/c"),
        test::make_candidate("d", "https://yt/d"),
    };

    const auto found = three.search(k_guild, "many");

    EXPECT_EQ(found.candidates.size(), 3u);
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
}

TEST_F(SearchSelectionTest, FailedSearchKeepsPreviousList)
{
    const auto first = selection.search(k_guild, "lofi");

    EXPECT_THROW(selection.search(k_guild, "nothing here"), media::resolution_error);

    EXPECT_EQ(guild().search_id, first.search_id);
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
}

TEST_F(SearchSelectionTest, ChooseSecondCandidate)
{
    selection.search(k_guild, "lofi");

    const auto res = selection.select(request(2));

    ASSERT_EQ(res.status, music::select_status::queued);
    ASSERT_TRUE(res.chosen);
    EXPECT_EQ(res.chosen->title, "Lofi Two");
    EXPECT_TRUE(res.started);
    ASSERT_EQ(resolver.resolved.size(), 1u);
    EXPECT_EQ(resolver.resolved[0], "https://yt/2");
    ASSERT_EQ(voice.played.size(), 1u);
    EXPECT_EQ(voice.played[0], "s://2");

    EXPECT_TRUE(guild().pending_candidates.empty());
    EXPECT_EQ(guild().search_id, 0u);
    EXPECT_FALSE(guild().choose_in_flight.load());
}

TEST_F(SearchSelectionTest, ChooseWhilePlayingQueuesBehind)
{
    controller.enqueue_and_maybe_start(k_guild, music::track("s://x", "Playing"));
    selection.search(k_guild, "lofi");

    const auto res = selection.select(request(1));

    ASSERT_EQ(res.status, music::select_status::queued);
    EXPECT_FALSE(res.started);
    ASSERT_EQ(controller.queue_snapshot(k_guild).size(), 1u);
    EXPECT_EQ(controller.queue_snapshot(k_guild)[0].title, "Lofi One");
}

TEST_F(SearchSelectionTest, NothingToChooseFrom)
{
    const auto res = selection.select(request(1));

    EXPECT_EQ(res.status, music::select_status::no_candidates);
    EXPECT_TRUE(resolver.resolved.empty());
}

TEST_F(SearchSelectionTest, OutOfRangeKeepsCandidates)
{
    selection.search(k_guild, "lofi");

    const auto low  = selection.select(request(0));
    const auto high = selection.select(request(4));

    EXPECT_EQ(low.status, music::select_status::out_of_range);
    EXPECT_EQ(high.status, music::select_status::out_of_range);
    EXPECT_EQ(high.candidate_count, 3u);
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
    EXPECT_TRUE(resolver.resolved.empty());
}

TEST_F(SearchSelectionTest, ButtonFromOlderSearchIsStale)
{
    const auto old_search = selection.search(k_guild, "lofi");
    const auto new_search = selection.search(k_guild, "jazz");
    ASSERT_NE(old_search.search_id, new_search.search_id);

    const auto stale = selection.select(request(1, old_search.search_id));
    EXPECT_EQ(stale.status, music::select_status::stale_selection);
    EXPECT_TRUE(resolver.resolved.empty());

    const auto fresh = selection.select(request(1, new_search.search_id));
    ASSERT_EQ(fresh.status, music::select_status::queued);
    EXPECT_EQ(fresh.chosen->title, "Jazz One");
}

TEST_F(SearchSelectionTest, ResolveFailureKeepsCandidates)
{
    resolver.failures["https://yt/3"] = "Video unavailable";
    selection.search(k_guild, "lofi");

    const auto failed = selection.select(request(3));
    EXPECT_EQ(failed.status, music::select_status::resolution_failed);
    EXPECT_EQ(failed.error_message, "Video unavailable");
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
    EXPECT_FALSE(guild().choose_in_flight.load());

    const auto retry = selection.select(request(1));
    EXPECT_EQ(retry.status, music::select_status::queued);
}

TEST_F(SearchSelectionTest, NotInVoice)
{
    voice.connected = false;
    selection.search(k_guild, "lofi");

    auto req = request(1);
    req.voice_channel = dpp::snowflake();
    const auto res = selection.select(req);

    EXPECT_EQ(res.status, music::select_status::not_in_voice);
    EXPECT_TRUE(resolver.resolved.empty());
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
}

TEST_F(SearchSelectionTest, JoinsCallersVoiceChannel)
{
    voice.connected = false;
    selection.search(k_guild, "lofi");

    const auto res = selection.select(request(1));

    EXPECT_EQ(res.status, music::select_status::queued);
    ASSERT_FALSE(voice.connects.empty());
    EXPECT_EQ(voice.connects[0], test::raw(k_voice));
    EXPECT_EQ(test::raw(guild().last_text_channel), test::raw(k_text));
}

TEST_F(SearchSelectionTest, FailedJoinKeepsCandidates)
{
    voice.connected  = false;
    voice.connect_ok = false;
    selection.search(k_guild, "lofi");

    const auto res = selection.select(request(1));

    EXPECT_EQ(res.status, music::select_status::join_failed);
    EXPECT_TRUE(resolver.resolved.empty());
    EXPECT_EQ(guild().pending_candidates.size(), 3u);
    EXPECT_FALSE(guild().choose_in_flight.load());
}

TEST_F(SearchSelectionTest, ConcurrentChooseIsBusy)
{
    selection.search(k_guild, "lofi");

    test::gate entered;
    test::gate release;
    resolver.on_resolve = [&](const std::string&) {
        entered.open();
        release.wait();
    };

    music::select_result first;
    std::thread worker([&] { first = selection.select(request(1)); });

    entered.wait();
    const auto second = selection.select(request(2));
    release.open();
    worker.join();

    EXPECT_EQ(second.status, music::select_status::busy);
    EXPECT_EQ(first.status, music::select_status::queued);
    EXPECT_EQ(resolver.resolved.size(), 1u);
    EXPECT_EQ(controller.now(k_guild)->title, "Lofi One");
}

TEST_F(SearchSelectionTest, SearchDuringResolveKeepsNewList)
{
    selection.search(k_guild, "lofi");

    std::uint64_t newer = 0;
    resolver.on_resolve = [&](const std::string&) {
        newer = selection.search(k_guild, "jazz").search_id;
    };

    const auto res = selection.select(request(1));

    EXPECT_EQ(res.status, music::select_status::queued);
    EXPECT_EQ(guild().search_id, newer);
    ASSERT_EQ(guild().pending_candidates.size(), 1u);
    EXPECT_EQ(guild().pending_candidates[0].title, "Jazz One");
}
