#include "encore/music/voice_presence.hpp"

namespace encore::music {

std::optional<dpp::snowflake> voice_presence::update(dpp::snowflake guild_id,
                                                     dpp::snowflake user_id,
                                                     dpp::snowflake channel_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    members& m = m_guilds[guild_id];

    std::optional<dpp::snowflake> before;
    auto it = m.find(user_id);
    if (it != m.end()) {
        before = it->second;
    }

    m[user_id] = channel_id;
    return before;
}

} // namespace encore::music
