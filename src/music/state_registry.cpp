#include "encore/music/state_registry.hpp"

namespace encore::music {

guild_state& state_registry::get_or_create(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& slot = m_states[guild_id];
    if (!slot) {
        slot = std::make_unique<guild_state>(guild_id);
    }
    return *slot;
}

guild_state* state_registry::find(dpp::snowflake guild_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(guild_id);
    if (it == m_states.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::size_t state_registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_states.size();
}

} // namespace encore::music
