#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include <dpp/snowflake.h>

#include "encore/music/track.hpp"
#include "encore/util/timer_service.hpp"

namespace encore::music {

enum class playback_state {
    idle,
    playing,
    paused
};

/// Everything the bot knows about one guild. Lives in the state_registry for
/// the rest of the process.
///
/// Lock order when more than one is needed: mutation_mutex, then leave_mutex.
/// candidates_mutex is never held together with the other two.
struct guild_state {
    explicit guild_state(dpp::snowflake id) : guild_id(id) {}

    guild_state(const guild_state&) = delete;
    guild_state& operator=(const guild_state&) = delete;

    const dpp::snowflake guild_id;

    // ---- guarded by mutation_mutex ----
    std::mutex            mutation_mutex;
    std::deque<track>     queue;
    std::optional<track>  current;
    playback_state        state   = playback_state::idle;
    std::uint64_t         session = 0; // bumped on every play start and on stop/leave
    dpp::snowflake        last_text_channel;
    dpp::snowflake        last_voice_channel;

    // ---- guarded by leave_mutex ----
    std::mutex                     leave_mutex;
    std::uint64_t                  leave_generation = 0;
    std::optional<util::timer_id>  leave_timer;

    // ---- guarded by candidates_mutex ----
    std::mutex                     candidates_mutex;
    std::vector<candidate_track>   pending_candidates;
    std::uint64_t                  search_id = 0; // 0 while nothing is stored

    std::atomic<bool> choose_in_flight{false};
};

} // namespace encore::music
