#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <dpp/snowflake.h>

#include "encore/music/guild_state.hpp"

namespace encore::music {

/// Process-wide guild -> state map. States are created on first use and never
/// removed, so the returned references stay valid.
class state_registry {
public:
    guild_state& get_or_create(dpp::snowflake guild_id);

    /// nullptr if the guild was never seen.
    guild_state* find(dpp::snowflake guild_id);

    std::size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::unique_ptr<guild_state>> m_states;
};

} // namespace encore::music
