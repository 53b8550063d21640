#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <dpp/dpp.h>

#include "encore/log.hpp"
#include "encore/voice/voice_gateway.hpp"

namespace encore::discord {

/// voice_gateway on top of D++ voice connections. Audio comes from an ffmpeg
/// child decoding the stream URL to 48 kHz stereo PCM; the end of a track is a
/// voice marker, so completion fires once the audio has actually played out.
class dpp_voice_gateway : public voice::voice_gateway {
public:
    dpp_voice_gateway(dpp::cluster& cluster, std::string ffmpeg, log_fn log);

    // Hook these from your bot:
    void handle_voice_ready(const dpp::voice_ready_t& ev);
    void handle_voice_track_marker(const dpp::voice_track_marker_t& ev);

    bool connect(dpp::snowflake guild_id, dpp::snowflake channel_id) override;
    void disconnect(dpp::snowflake guild_id) override;

    bool play(dpp::snowflake guild_id,
              const std::string& stream_url,
              voice::completion_fn on_complete) override;

    bool pause(dpp::snowflake guild_id, bool pause_flag) override;
    bool stop(dpp::snowflake guild_id) override;

    bool is_playing(dpp::snowflake guild_id) const override;
    bool is_paused(dpp::snowflake guild_id) const override;
    bool is_connected(dpp::snowflake guild_id) const override;
    dpp::snowflake channel_of(dpp::snowflake guild_id) const override;
    bool has_humans(dpp::snowflake guild_id) const override;

private:
    struct stream_session {
        std::uint64_t        id = 0;
        std::string          url;
        std::string          marker;
        voice::completion_fn on_complete;
        std::atomic<bool>    started{false};
        std::atomic<bool>    cancelled{false};
        std::atomic<bool>    done{false};
        std::string          error; // guarded by m_mutex
    };

    dpp::cluster& m_cluster;
    std::string   m_ffmpeg;
    log_fn        m_log;

    mutable std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::shared_ptr<stream_session>> m_sessions;
    std::uint64_t m_next_id = 0;

    dpp::discord_client* shard_for(dpp::snowflake guild_id) const;
    dpp::voiceconn*      voice_for(dpp::snowflake guild_id) const;

    std::shared_ptr<stream_session> session_for(dpp::snowflake guild_id) const;

    void start_stream(dpp::snowflake guild_id, const std::shared_ptr<stream_session>& s);
    void stream_worker(dpp::snowflake guild_id, std::shared_ptr<stream_session> s);
    void finish(dpp::snowflake guild_id,
                const std::shared_ptr<stream_session>& s,
                const std::string& error);

    void log(dpp::loglevel level, const std::string& msg) const;
};

} // namespace encore::discord
