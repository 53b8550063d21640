#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <dpp/snowflake.h>

#include "encore/log.hpp"
#include "encore/music/guild_state.hpp"
#include "encore/music/state_registry.hpp"
#include "encore/util/executor.hpp"
#include "encore/util/timer_service.hpp"
#include "encore/voice/voice_gateway.hpp"

namespace encore::music {

/// Leaves a voice channel once nobody but bots is left in it.
///
/// Each guild has at most one armed timer. Every schedule() or cancel() bumps
/// the guild's leave_generation, and a firing timer only acts if its generation
/// is still current. A cancelled timer therefore never disconnects, even when
/// the underlying timer callback was already on its way.
class idle_leave_scheduler {
public:
    idle_leave_scheduler(state_registry& registry,
                         voice::voice_gateway& voice,
                         voice::notifier& notify,
                         util::timer_service& timers,
                         util::executor& exec,
                         log_fn log);

    /// Replaces any pending timer. Safe with or without mutation_mutex held.
    void schedule(guild_state& g, std::chrono::seconds delay);

    /// No-op if nothing is pending.
    void cancel(guild_state& g);

    bool pending(guild_state& g);

    static const char* departure_message();

private:
    state_registry&       m_registry;
    voice::voice_gateway& m_voice;
    voice::notifier&      m_notify;
    util::timer_service&  m_timers;
    util::executor&       m_exec;
    log_fn                m_log;

    void fire(dpp::snowflake guild_id, std::uint64_t generation);
    void log(dpp::loglevel level, const std::string& msg) const;
};

} // namespace encore::music
