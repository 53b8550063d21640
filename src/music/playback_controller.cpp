#include "encore/music/playback_controller.hpp"

#include <sstream>

namespace encore::music {

playback_controller::playback_controller(state_registry& registry,
                                         voice::voice_gateway& voice,
                                         voice::notifier& notify,
                                         idle_leave_scheduler& idle,
                                         util::executor& exec,
                                         grace_periods grace,
                                         log_fn log)
    : m_registry(registry)
    , m_voice(voice)
    , m_notify(notify)
    , m_idle(idle)
    , m_exec(exec)
    , m_grace(grace)
    , m_log(std::move(log))
{}

void playback_controller::log(dpp::loglevel level, const std::string& msg) const
{
    if (m_log) {
        m_log(level, msg);
    }
}

void playback_controller::remember_channels(dpp::snowflake guild_id,
                                            dpp::snowflake text_channel,
                                            dpp::snowflake voice_channel)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);
    if (!text_channel.empty()) {
        g.last_text_channel = text_channel;
    }
    if (!voice_channel.empty()) {
        g.last_voice_channel = voice_channel;
    }
}

bool playback_controller::join(dpp::snowflake guild_id, dpp::snowflake voice_channel)
{
    if (m_voice.is_connected(guild_id)) {
        return true;
    }
    if (voice_channel.empty()) {
        return false;
    }

    std::ostringstream oss;
    oss << "Joining voice channel " << voice_channel << " in guild " << guild_id;
    log(dpp::ll_info, oss.str());

    return m_voice.connect(guild_id, voice_channel);
}

bool playback_controller::voice_connected(dpp::snowflake guild_id) const
{
    return m_voice.is_connected(guild_id);
}

enqueue_result playback_controller::enqueue_and_maybe_start(dpp::snowflake guild_id, track t)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);

    {
        std::ostringstream oss;
        oss << "Queued '" << t.title << "' in guild " << guild_id;
        log(dpp::ll_debug, oss.str());
    }

    g.queue.push_back(std::move(t));
    m_idle.cancel(g);

    enqueue_result res;
    res.queue_length = g.queue.size();

    if (!g.current && !m_voice.is_playing(guild_id)) {
        play_next_locked(g);
        res.started = g.current.has_value();
    }
    return res;
}

void playback_controller::play_next(dpp::snowflake guild_id)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);
    play_next_locked(g);
}

void playback_controller::play_next_locked(guild_state& g)
{
    const dpp::snowflake guild_id = g.guild_id;

    if (g.queue.empty()) {
        g.current.reset();
        g.state = playback_state::idle;

        std::ostringstream oss;
        oss << "Queue finished in guild " << guild_id;
        log(dpp::ll_debug, oss.str());

        if (m_voice.is_connected(guild_id) && !m_voice.has_humans(guild_id)) {
            m_idle.schedule(g, m_grace.queue_drained);
        }
        return;
    }

    g.current = std::move(g.queue.front());
    g.queue.pop_front();
    m_idle.cancel(g);

    if (!m_voice.is_connected(guild_id)) {
        // Connection was lost; try the channel the last command came from
        if (g.last_voice_channel.empty() || !m_voice.connect(guild_id, g.last_voice_channel)) {
            std::ostringstream oss;
            oss << "No voice connection for guild " << guild_id
                << ", holding '" << g.current->title << "'";
            log(dpp::ll_warning, oss.str());

            g.queue.push_front(std::move(*g.current));
            g.current.reset();
            g.state = playback_state::idle;
            m_notify.send(guild_id, g.last_text_channel, "Join a voice channel first!");
            return;
        }
    }

    const std::uint64_t session = ++g.session;
    g.state = playback_state::playing;

    {
        std::ostringstream oss;
        oss << "Now playing in guild " << guild_id << ": " << g.current->title;
        log(dpp::ll_info, oss.str());
    }

    const bool accepted = m_voice.play(
        guild_id, g.current->stream_url,
        [this, guild_id, session](const std::string& error) {
            on_track_complete(guild_id, session, error);
        });

    if (!accepted) {
        // Same path as a transport failure so the queue keeps moving
        on_track_complete(guild_id, session, "voice connection refused the stream");
    }
}

void playback_controller::on_track_complete(dpp::snowflake guild_id,
                                            std::uint64_t session,
                                            const std::string& error)
{
    if (!error.empty()) {
        std::ostringstream oss;
        oss << "Playback error in guild " << guild_id << ": " << error;
        log(dpp::ll_warning, oss.str());
    }

    m_exec.post([this, guild_id, session]() {
        guild_state& g = m_registry.get_or_create(guild_id);
        std::lock_guard<std::mutex> lock(g.mutation_mutex);

        if (g.session != session || !g.current) {
            std::ostringstream oss;
            oss << "Dropping stale completion for guild " << guild_id
                << " (session " << session << ", now " << g.session << ")";
            log(dpp::ll_debug, oss.str());
            return;
        }
        play_next_locked(g);
    });
}

control_status playback_controller::pause(dpp::snowflake guild_id)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);

    if (g.state != playback_state::playing || !m_voice.pause(guild_id, true)) {
        return control_status::no_active_session;
    }
    g.state = playback_state::paused;
    return control_status::ok;
}

control_status playback_controller::resume(dpp::snowflake guild_id)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);

    if (g.state != playback_state::paused || !m_voice.pause(guild_id, false)) {
        return control_status::no_active_session;
    }
    g.state = playback_state::playing;
    return control_status::ok;
}

control_status playback_controller::skip(dpp::snowflake guild_id)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);

    if (g.state == playback_state::idle || !g.current) {
        return control_status::no_active_session;
    }

    std::ostringstream oss;
    oss << "Skipping '" << g.current->title << "' in guild " << guild_id;
    log(dpp::ll_info, oss.str());

    // The stopped stream reports completion, which advances the queue
    if (!m_voice.stop(guild_id)) {
        on_track_complete(guild_id, g.session, {});
    }
    return control_status::ok;
}

void playback_controller::stop(dpp::snowflake guild_id)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);

    g.queue.clear();
    g.current.reset();
    g.state = playback_state::idle;
    ++g.session; // the stopped stream's completion is now stale

    if (m_voice.is_playing(guild_id) || m_voice.is_paused(guild_id)) {
        m_voice.stop(guild_id);
    }

    std::ostringstream oss;
    oss << "Stopped playback and cleared queue in guild " << guild_id;
    log(dpp::ll_info, oss.str());

    if (m_voice.is_connected(guild_id) && !m_voice.has_humans(guild_id)) {
        m_idle.schedule(g, m_grace.stop);
    }
}

std::optional<track> playback_controller::now(dpp::snowflake guild_id) const
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);
    return g.current;
}

std::vector<track> playback_controller::queue_snapshot(dpp::snowflake guild_id) const
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);
    return std::vector<track>(g.queue.begin(), g.queue.end());
}

playback_state playback_controller::state_of(dpp::snowflake guild_id) const
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);
    return g.state;
}

void playback_controller::on_voice_membership_changed(dpp::snowflake guild_id)
{
    guild_state& g = m_registry.get_or_create(guild_id);
    std::lock_guard<std::mutex> lock(g.mutation_mutex);

    if (!m_voice.is_connected(guild_id)) {
        return;
    }
    if (m_voice.has_humans(guild_id)) {
        m_idle.cancel(g);
    } else {
        m_idle.schedule(g, m_grace.membership);
    }
}

void playback_controller::on_voice_state_changed(dpp::snowflake guild_id,
                                                 std::optional<dpp::snowflake> before,
                                                 dpp::snowflake after)
{
    const dpp::snowflake ours = m_voice.channel_of(guild_id);
    if (ours.empty()) {
        return;
    }
    if (before) {
        // Mute, deafen and stream toggles keep the channel
        if (*before == after) {
            return;
        }
        if (*before != ours && after != ours) {
            return;
        }
    }
    on_voice_membership_changed(guild_id);
}

} // namespace encore::music
