#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "encore/log.hpp"
#include "encore/music/guild_state.hpp"
#include "encore/music/idle_leave_scheduler.hpp"
#include "encore/music/state_registry.hpp"
#include "encore/music/track.hpp"
#include "encore/util/executor.hpp"
#include "encore/voice/voice_gateway.hpp"

namespace encore::music {

/// How long an empty channel is tolerated, per trigger.
struct grace_periods {
    std::chrono::seconds membership{1};     // last human left the channel
    std::chrono::seconds stop{5};           // after !stop
    std::chrono::seconds queue_drained{15}; // queue ran out naturally
};

enum class control_status {
    ok,
    no_active_session
};

struct enqueue_result {
    std::size_t queue_length = 0; // after the append, before any start
    bool        started      = false;
};

/// Turns a guild's queue into one playback session after another.
///
/// Queue, current track, state and the "should we start now" decision are only
/// touched under guild_state::mutation_mutex, so at most one play_next runs per
/// guild. Stream completions arrive on foreign threads and are re-posted to the
/// executor; each carries the session it belongs to and is dropped if stale.
class playback_controller {
public:
    playback_controller(state_registry& registry,
                        voice::voice_gateway& voice,
                        voice::notifier& notify,
                        idle_leave_scheduler& idle,
                        util::executor& exec,
                        grace_periods grace,
                        log_fn log);

    /// Records where the latest command came from. A zero voice channel keeps
    /// the previous one.
    void remember_channels(dpp::snowflake guild_id,
                           dpp::snowflake text_channel,
                           dpp::snowflake voice_channel);

    /// Connects to voice_channel unless already connected.
    bool join(dpp::snowflake guild_id, dpp::snowflake voice_channel);

    bool voice_connected(dpp::snowflake guild_id) const;

    enqueue_result enqueue_and_maybe_start(dpp::snowflake guild_id, track t);

    void play_next(dpp::snowflake guild_id);

    control_status pause(dpp::snowflake guild_id);
    control_status resume(dpp::snowflake guild_id);
    control_status skip(dpp::snowflake guild_id);
    void           stop(dpp::snowflake guild_id);

    std::optional<track> now(dpp::snowflake guild_id) const;
    std::vector<track>   queue_snapshot(dpp::snowflake guild_id) const;
    playback_state       state_of(dpp::snowflake guild_id) const;

    /// Voice channel membership changed; arm or cancel the idle leave.
    void on_voice_membership_changed(dpp::snowflake guild_id);

    /// A member's voice state changed from `before` (nullopt if unknown) to
    /// `after`. Only changes touching the bot's channel reach
    /// on_voice_membership_changed.
    void on_voice_state_changed(dpp::snowflake guild_id,
                                std::optional<dpp::snowflake> before,
                                dpp::snowflake after);

    const grace_periods& grace() const { return m_grace; }

private:
    state_registry&       m_registry;
    voice::voice_gateway& m_voice;
    voice::notifier&      m_notify;
    idle_leave_scheduler& m_idle;
    util::executor&       m_exec;
    grace_periods         m_grace;
    log_fn                m_log;

    // Caller holds g.mutation_mutex
    void play_next_locked(guild_state& g);

    void on_track_complete(dpp::snowflake guild_id,
                           std::uint64_t session,
                           const std::string& error);

    void log(dpp::loglevel level, const std::string& msg) const;
};

} // namespace encore::music
