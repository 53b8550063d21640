#pragma once

#include <dpp/dpp.h>

#include "encore/log.hpp"
#include "encore/voice/voice_gateway.hpp"

namespace encore::discord {

/// Sends to the given channel, or when it is unknown to the guild's system
/// channel, or else the first text channel the bot may write in.
class dpp_notifier : public voice::notifier {
public:
    dpp_notifier(dpp::cluster& cluster, log_fn log);

    void send(dpp::snowflake guild_id,
              dpp::snowflake channel_id,
              const std::string& text) override;

private:
    dpp::cluster& m_cluster;
    log_fn        m_log;

    dpp::snowflake fallback_channel(dpp::snowflake guild_id) const;
};

} // namespace encore::discord
