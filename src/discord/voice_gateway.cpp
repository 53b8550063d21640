#include "encore/discord/voice_gateway.hpp"

#include <cstdio>
#include <sstream>
#include <thread>
#include <vector>

#include <sys/wait.h>

#include "encore/media/ytdlp_resolver.hpp"

namespace encore::discord {

dpp_voice_gateway::dpp_voice_gateway(dpp::cluster& cluster, std::string ffmpeg, log_fn log)
    : m_cluster(cluster)
    , m_ffmpeg(std::move(ffmpeg))
    , m_log(std::move(log))
{}

void dpp_voice_gateway::log(dpp::loglevel level, const std::string& msg) const
{
    if (m_log) {
        m_log(level, msg);
    }
}

dpp::discord_client* dpp_voice_gateway::shard_for(dpp::snowflake guild_id) const
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return nullptr;
    }
    return m_cluster.get_shard(g->shard_id);
}

dpp::voiceconn* dpp_voice_gateway::voice_for(dpp::snowflake guild_id) const
{
    dpp::discord_client* shard = shard_for(guild_id);
    if (!shard) {
        return nullptr;
    }
    return shard->get_voice(guild_id);
}

std::shared_ptr<dpp_voice_gateway::stream_session>
dpp_voice_gateway::session_for(dpp::snowflake guild_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(guild_id);
    if (it == m_sessions.end()) {
        return nullptr;
    }
    return it->second;
}

bool dpp_voice_gateway::connect(dpp::snowflake guild_id, dpp::snowflake channel_id)
{
    dpp::discord_client* shard = shard_for(guild_id);
    if (!shard) {
        log(dpp::ll_warning, "No shard for guild " + guild_id.str() + ", cannot join voice");
        return false;
    }
    shard->connect_voice(guild_id, channel_id, false, true);
    return true;
}

void dpp_voice_gateway::disconnect(dpp::snowflake guild_id)
{
    // The marker of a drained stream never arrives once the client is gone
    if (auto s = session_for(guild_id)) {
        s->cancelled = true;
        finish(guild_id, s, {});
    }

    dpp::discord_client* shard = shard_for(guild_id);
    if (shard) {
        shard->disconnect_voice(guild_id);
    }
}

bool dpp_voice_gateway::play(dpp::snowflake guild_id,
                             const std::string& stream_url,
                             voice::completion_fn on_complete)
{
    auto s = std::make_shared<stream_session>();
    s->url         = stream_url;
    s->on_complete = std::move(on_complete);

    std::shared_ptr<stream_session> previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        s->id     = ++m_next_id;
        s->marker = "encore:" + std::to_string(s->id);

        auto& slot = m_sessions[guild_id];
        previous = slot;
        slot = s;
    }

    if (previous) {
        previous->cancelled = true;
        finish(guild_id, previous, {});
    }

    dpp::voiceconn* v = voice_for(guild_id);
    if (v && v->is_ready()) {
        start_stream(guild_id, s);
    } else {
        log(dpp::ll_debug, "Voice not ready in guild " + guild_id.str() + ", holding stream");
    }
    return true;
}

void dpp_voice_gateway::handle_voice_ready(const dpp::voice_ready_t& ev)
{
    const dpp::snowflake guild_id = ev.voice_client->server_id;

    std::ostringstream oss;
    oss << "Voice ready for guild " << guild_id << " channel " << ev.voice_channel_id;
    log(dpp::ll_debug, oss.str());

    if (auto s = session_for(guild_id)) {
        start_stream(guild_id, s);
    }
}

void dpp_voice_gateway::handle_voice_track_marker(const dpp::voice_track_marker_t& ev)
{
    const dpp::snowflake guild_id = ev.voice_client->server_id;

    auto s = session_for(guild_id);
    if (!s || s->marker != ev.track_meta) {
        return;
    }

    std::string error;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        error = s->error;
    }
    finish(guild_id, s, error);
}

void dpp_voice_gateway::start_stream(dpp::snowflake guild_id, const std::shared_ptr<stream_session>& s)
{
    if (s->started.exchange(true)) {
        return;
    }

    // A pause left over from the previous track would mute this one
    dpp::voiceconn* v = voice_for(guild_id);
    if (v && v->voiceclient && v->voiceclient->is_paused()) {
        v->voiceclient->pause_audio(false);
    }

    // Decoding runs for the length of the track; keep it off the event thread
    std::thread(&dpp_voice_gateway::stream_worker, this, guild_id, s).detach();
}

void dpp_voice_gateway::stream_worker(dpp::snowflake guild_id, std::shared_ptr<stream_session> s)
{
    const std::string cmd = media::shell_quote(m_ffmpeg) +
        " -loglevel error -reconnect 1 -reconnect_streamed 1 -reconnect_delay_max 5"
        " -i " + media::shell_quote(s->url) +
        " -vn -f s16le -ar 48000 -ac 2 pipe:1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        finish(guild_id, s, "could not start ffmpeg");
        return;
    }

    // send_audio_raw wants exactly this size to avoid distortion
    constexpr std::size_t bufsize = dpp::send_audio_raw_max_length;
    std::vector<char> buf(bufsize);
    std::size_t filled = 0;
    std::size_t sent   = 0;
    std::string error;

    auto send = [&](std::size_t length) {
        // stop() may have flushed the client while this chunk was being read
        if (s->cancelled) {
            return false;
        }
        dpp::voiceconn* v = voice_for(guild_id);
        if (!v || !v->voiceclient) {
            error = "voice connection lost";
            return false;
        }
        v->voiceclient->send_audio_raw(reinterpret_cast<uint16_t*>(buf.data()), length);
        sent += length;
        return true;
    };

    while (!s->cancelled) {
        const std::size_t n = std::fread(buf.data() + filled, 1, bufsize - filled, pipe);
        if (n == 0) {
            break;
        }
        filled += n;
        if (filled == bufsize) {
            if (!send(filled)) {
                break;
            }
            filled = 0;
        }
    }

    if (!s->cancelled && error.empty() && filled > 0) {
        send(filled);
    }

    const int status = pclose(pipe);

    if (s->cancelled) {
        finish(guild_id, s, {});
        return;
    }

    if (error.empty() && (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)) {
        std::ostringstream oss;
        oss << "ffmpeg exited with status " << (WIFEXITED(status) ? WEXITSTATUS(status) : status);
        error = oss.str();
    }

    if (sent == 0) {
        finish(guild_id, s, error.empty() ? "no audio decoded" : error);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        s->error = error;
    }

    // Completion comes with the marker once the queued audio has played out
    dpp::voiceconn* v = voice_for(guild_id);
    if (!v || !v->voiceclient) {
        finish(guild_id, s, "voice connection lost");
        return;
    }
    v->voiceclient->insert_marker(s->marker);
}

void dpp_voice_gateway::finish(dpp::snowflake guild_id,
                               const std::shared_ptr<stream_session>& s,
                               const std::string& error)
{
    if (s->done.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(guild_id);
        if (it != m_sessions.end() && it->second == s) {
            m_sessions.erase(it);
        }
    }

    std::ostringstream oss;
    oss << "Stream " << s->id << " in guild " << guild_id << " ended"
        << (error.empty() ? "" : " with error: ") << error;
    log(dpp::ll_debug, oss.str());

    if (s->on_complete) {
        s->on_complete(error);
    }
}

bool dpp_voice_gateway::pause(dpp::snowflake guild_id, bool pause_flag)
{
    dpp::voiceconn* v = voice_for(guild_id);
    if (!v || !v->voiceclient) {
        return false;
    }
    v->voiceclient->pause_audio(pause_flag);

    std::ostringstream oss;
    oss << "Voice pause=" << std::boolalpha << pause_flag << " in guild " << guild_id;
    log(dpp::ll_debug, oss.str());
    return true;
}

bool dpp_voice_gateway::stop(dpp::snowflake guild_id)
{
    auto s = session_for(guild_id);
    if (!s) {
        return false;
    }

    s->cancelled = true;
    dpp::voiceconn* v = voice_for(guild_id);
    if (v && v->voiceclient) {
        // Drops buffered audio and pending markers
        v->voiceclient->stop_audio();
    }
    finish(guild_id, s, {});
    return true;
}

bool dpp_voice_gateway::is_playing(dpp::snowflake guild_id) const
{
    return session_for(guild_id) != nullptr;
}

bool dpp_voice_gateway::is_paused(dpp::snowflake guild_id) const
{
    dpp::voiceconn* v = voice_for(guild_id);
    return v && v->voiceclient && v->voiceclient->is_paused();
}

bool dpp_voice_gateway::is_connected(dpp::snowflake guild_id) const
{
    return voice_for(guild_id) != nullptr;
}

dpp::snowflake dpp_voice_gateway::channel_of(dpp::snowflake guild_id) const
{
    dpp::voiceconn* v = voice_for(guild_id);
    if (!v) {
        return {};
    }
    return v->channel_id;
}

bool dpp_voice_gateway::has_humans(dpp::snowflake guild_id) const
{
    dpp::voiceconn* v = voice_for(guild_id);
    if (!v) {
        return false;
    }
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return false;
    }

    for (const auto& entry : g->voice_members) {
        const dpp::voicestate& vs = entry.second;
        if (vs.channel_id != v->channel_id || entry.first == m_cluster.me.id) {
            continue;
        }
        // Users missing from the cache count as human
        const dpp::user* u = dpp::find_user(entry.first);
        if (!u || !u->is_bot()) {
            return true;
        }
    }
    return false;
}

} // namespace encore::discord
