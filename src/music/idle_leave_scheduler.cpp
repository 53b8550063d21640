#include "encore/music/idle_leave_scheduler.hpp"

#include <sstream>

namespace encore::music {

idle_leave_scheduler::idle_leave_scheduler(state_registry& registry,
                                           voice::voice_gateway& voice,
                                           voice::notifier& notify,
                                           util::timer_service& timers,
                                           util::executor& exec,
                                           log_fn log)
    : m_registry(registry)
    , m_voice(voice)
    , m_notify(notify)
    , m_timers(timers)
    , m_exec(exec)
    , m_log(std::move(log))
{}

const char* idle_leave_scheduler::departure_message()
{
    return "Nobody is left here, so I'll take my leave too.";
}

void idle_leave_scheduler::log(dpp::loglevel level, const std::string& msg) const
{
    if (m_log) {
        m_log(level, msg);
    }
}

void idle_leave_scheduler::schedule(guild_state& g, std::chrono::seconds delay)
{
    std::lock_guard<std::mutex> lock(g.leave_mutex);

    if (g.leave_timer) {
        m_timers.disarm(*g.leave_timer);
        g.leave_timer.reset();
    }

    const std::uint64_t generation = ++g.leave_generation;
    const dpp::snowflake guild_id  = g.guild_id;

    g.leave_timer = m_timers.arm(delay, [this, guild_id, generation]() {
        // Timer threads are not ours; do the work on the executor
        m_exec.post([this, guild_id, generation]() { fire(guild_id, generation); });
    });

    std::ostringstream oss;
    oss << "Idle leave armed for guild " << guild_id
        << " in " << delay.count() << "s (generation " << generation << ")";
    log(dpp::ll_debug, oss.str());
}

void idle_leave_scheduler::cancel(guild_state& g)
{
    std::lock_guard<std::mutex> lock(g.leave_mutex);
    if (!g.leave_timer) {
        return;
    }

    m_timers.disarm(*g.leave_timer);
    g.leave_timer.reset();
    ++g.leave_generation;

    std::ostringstream oss;
    oss << "Idle leave cancelled for guild " << g.guild_id;
    log(dpp::ll_debug, oss.str());
}

bool idle_leave_scheduler::pending(guild_state& g)
{
    std::lock_guard<std::mutex> lock(g.leave_mutex);
    return g.leave_timer.has_value();
}

void idle_leave_scheduler::fire(dpp::snowflake guild_id, std::uint64_t generation)
{
    guild_state* g = m_registry.find(guild_id);
    if (!g) {
        return;
    }

    dpp::snowflake notify_channel;
    {
        std::lock_guard<std::mutex> lock(g->mutation_mutex);
        {
            std::lock_guard<std::mutex> leave_lock(g->leave_mutex);
            if (!g->leave_timer || g->leave_generation != generation) {
                std::ostringstream oss;
                oss << "Ignoring stale idle leave for guild " << guild_id
                    << " (generation " << generation << ")";
                log(dpp::ll_debug, oss.str());
                return;
            }
            // Committed: a cancel() from here on finds nothing to cancel
            g->leave_timer.reset();
        }

        // Someone may have joined during the delay
        if (!m_voice.is_connected(guild_id) || m_voice.has_humans(guild_id)) {
            std::ostringstream oss;
            oss << "Idle leave for guild " << guild_id << " no longer applies";
            log(dpp::ll_debug, oss.str());
            return;
        }

        g->queue.clear();
        g->current.reset();
        g->state = playback_state::idle;
        ++g->session;
        notify_channel = g->last_text_channel;

        m_voice.disconnect(guild_id);
    }

    std::ostringstream oss;
    oss << "Left voice in guild " << guild_id << " (no listeners)";
    log(dpp::ll_info, oss.str());

    m_notify.send(guild_id, notify_channel, departure_message());
}

} // namespace encore::music
