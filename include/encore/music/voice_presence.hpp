#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>

#include <dpp/snowflake.h>

namespace encore::music {

/// Last known voice channel of every member seen in a voice state update.
/// Discord only reports where a member is now, so this is what tells a
/// move out of a channel apart from a move between two others.
class voice_presence {
public:
    /// Stores the member's new channel (0 = not in voice) and returns the old
    /// one, or nullopt if the member was never seen.
    std::optional<dpp::snowflake> update(dpp::snowflake guild_id,
                                         dpp::snowflake user_id,
                                         dpp::snowflake channel_id);

private:
    using members = std::unordered_map<dpp::snowflake, dpp::snowflake>;

    std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, members> m_guilds;
};

} // namespace encore::music
