#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "encore/log.hpp"
#include "encore/media/resolver.hpp"
#include "encore/music/playback_controller.hpp"
#include "encore/music/state_registry.hpp"
#include "encore/music/track.hpp"

namespace encore::music {

struct search_result {
    std::uint64_t                search_id = 0;
    std::vector<candidate_track> candidates;
};

enum class select_status {
    queued,
    busy,              // another selection for this guild is still resolving
    no_candidates,
    stale_selection,   // the list it refers to was replaced by a newer search
    out_of_range,
    not_in_voice,
    join_failed,       // the caller's voice channel could not be joined
    resolution_failed
};

struct selection_request {
    dpp::snowflake               guild_id;
    long                         index = 0;  // 1-based
    std::optional<std::uint64_t> search_id;  // set by buttons, empty for !choose
    dpp::snowflake               text_channel;
    dpp::snowflake               voice_channel;
};

struct select_result {
    select_status        status = select_status::no_candidates;
    std::optional<track> chosen;
    std::size_t          candidate_count = 0;
    bool                 started = false;
    std::string          error_message;
};

/// Search first, pick later. search() stores a guild-wide candidate list;
/// select() turns one entry of it into a queued track. Only one selection per
/// guild is in flight at a time, whichever entry point it came from.
class search_selection {
public:
    search_selection(state_registry& registry,
                     media::media_resolver& resolver,
                     playback_controller& controller,
                     std::size_t result_count,
                     log_fn log);

    /// Throws media::resolution_error.
    search_result search(dpp::snowflake guild_id, const std::string& query);

    select_result select(const selection_request& req);

    std::size_t result_count() const { return m_result_count; }

private:
    state_registry&        m_registry;
    media::media_resolver& m_resolver;
    playback_controller&   m_controller;
    std::size_t            m_result_count;
    log_fn                 m_log;

    std::uint64_t m_next_search_id = 0; // guarded by m_id_mutex
    std::mutex    m_id_mutex;

    void log(dpp::loglevel level, const std::string& msg) const;
};

} // namespace encore::music
