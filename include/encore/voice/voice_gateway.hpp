#pragma once

#include <functional>
#include <string>

#include <dpp/snowflake.h>

namespace encore::voice {

/// Called once per play() when the stream ends. error is empty on a clean end
/// and describes the transport failure otherwise. May run on any thread.
using completion_fn = std::function<void(const std::string& error)>;

/// Per-guild voice connection as the playback core sees it.
class voice_gateway {
public:
    virtual ~voice_gateway() = default;

    virtual bool connect(dpp::snowflake guild_id, dpp::snowflake channel_id) = 0;

    /// Leaves voice. A current stream ends and its completion_fn fires.
    virtual void disconnect(dpp::snowflake guild_id) = 0;

    virtual bool play(dpp::snowflake guild_id,
                      const std::string& stream_url,
                      completion_fn on_complete) = 0;

    virtual bool pause(dpp::snowflake guild_id, bool pause_flag) = 0;

    /// Ends the current stream. Its completion_fn still fires.
    virtual bool stop(dpp::snowflake guild_id) = 0;

    virtual bool is_playing(dpp::snowflake guild_id) const = 0;
    virtual bool is_paused(dpp::snowflake guild_id) const = 0;
    virtual bool is_connected(dpp::snowflake guild_id) const = 0;

    /// Channel the bot is connected to, 0 if none.
    virtual dpp::snowflake channel_of(dpp::snowflake guild_id) const = 0;

    /// True if a non-bot member sits in the channel the bot is connected to.
    virtual bool has_humans(dpp::snowflake guild_id) const = 0;
};

/// Best-effort text notifications. channel_id may be 0; implementations pick
/// a fallback channel. Failures are never reported back.
class notifier {
public:
    virtual ~notifier() = default;

    virtual void send(dpp::snowflake guild_id,
                      dpp::snowflake channel_id,
                      const std::string& text) = 0;
};

} // namespace encore::voice
