#include "encore/discord/notifier.hpp"

#include <sstream>

namespace encore::discord {

dpp_notifier::dpp_notifier(dpp::cluster& cluster, log_fn log)
    : m_cluster(cluster)
    , m_log(std::move(log))
{}

dpp::snowflake dpp_notifier::fallback_channel(dpp::snowflake guild_id) const
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return {};
    }
    if (!g->system_channel_id.empty()) {
        return g->system_channel_id;
    }

    auto me = g->members.find(m_cluster.me.id);
    for (const auto& cid : g->channels) {
        const dpp::channel* c = dpp::find_channel(cid);
        if (!c || !c->is_text_channel()) {
            continue;
        }
        if (me == g->members.end() ||
            g->permission_overwrites(me->second, *c).can(dpp::p_send_messages)) {
            return cid;
        }
    }
    return {};
}

void dpp_notifier::send(dpp::snowflake guild_id,
                        dpp::snowflake channel_id,
                        const std::string& text)
{
    dpp::snowflake target = channel_id;
    if (target.empty() || !dpp::find_channel(target)) {
        target = fallback_channel(guild_id);
    }
    if (target.empty()) {
        if (m_log) {
            m_log(dpp::ll_debug, "No channel to notify in guild " + guild_id.str());
        }
        return;
    }

    m_cluster.message_create(dpp::message(target, text),
        [this, target](const dpp::confirmation_callback_t& cc) {
            if (cc.is_error() && m_log) {
                std::ostringstream oss;
                oss << "Notification to channel " << target
                    << " failed: " << cc.get_error().message;
                m_log(dpp::ll_debug, oss.str());
            }
        });
}

} // namespace encore::discord
