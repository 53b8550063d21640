#include "encore/discord/contexts.hpp"

#include <iostream>

#include "encore/bot/command_router.hpp"

namespace encore::discord {

namespace {

dpp::snowflake voice_channel_of(dpp::snowflake guild_id, dpp::snowflake user_id)
{
    dpp::guild* g = dpp::find_guild(guild_id);
    if (!g) {
        return {};
    }
    auto it = g->voice_members.find(user_id);
    if (it == g->voice_members.end()) {
        return {};
    }
    return it->second.channel_id;
}

void add_pick_buttons(dpp::message& msg, std::uint64_t search_id, std::size_t count)
{
    dpp::component row;
    for (std::size_t i = 1; i <= count; ++i) {
        row.add_component(
            dpp::component()
                .set_type(dpp::cot_button)
                .set_label(std::to_string(i))
                .set_style(dpp::cos_primary)
                .set_id(bot::make_pick_id(search_id, i))
        );
    }
    msg.add_component(row);
}

// Strips the buttons once the pick window is over. Re-reads the message
// so an edit made by a successful pick is kept.
void expire_pick_buttons(dpp::cluster& cluster,
                         dpp::snowflake message_id,
                         dpp::snowflake channel_id,
                         std::chrono::seconds after)
{
    cluster.start_timer([&cluster, message_id, channel_id](dpp::timer t) {
        cluster.stop_timer(t);
        cluster.message_get(message_id, channel_id,
            [&cluster](const dpp::confirmation_callback_t& cc) {
                if (cc.is_error()) {
                    return;
                }
                auto msg = std::get<dpp::message>(cc.value);
                if (msg.components.empty()) {
                    return;
                }
                msg.components.clear();
                cluster.message_edit(msg);
            });
    }, static_cast<uint64_t>(after.count()));
}

} // namespace

// ---------- message_context ----------

message_context::message_context(dpp::cluster& cluster,
                                 const dpp::message_create_t& ev,
                                 std::chrono::seconds choice_timeout)
    : m_cluster(cluster)
    , m_guild_id(ev.msg.guild_id)
    , m_channel_id(ev.msg.channel_id)
    , m_message_id(ev.msg.id)
    , m_author_id(ev.msg.author.id)
    , m_voice_channel(voice_channel_of(ev.msg.guild_id, ev.msg.author.id))
    , m_choice_timeout(choice_timeout)
{
    if (!ev.msg.attachments.empty()) {
        const auto& a = ev.msg.attachments.front();
        m_attachment = bot::attachment_ref{a.url, a.filename};
    }
}

void message_context::reply(const std::string& text)
{
    m_cluster.message_create(
        dpp::message(m_channel_id, text).set_reference(m_message_id),
        [](const dpp::confirmation_callback_t& cc) {
            if (cc.is_error()) {
                std::cerr << "Failed to send reply! Err: " << cc.get_error().message << std::endl;
            }
        });
}

void message_context::reply_with_choices(const std::string& text,
                                         std::uint64_t search_id,
                                         std::size_t count)
{
    dpp::message msg(m_channel_id, text);
    msg.set_reference(m_message_id);
    add_pick_buttons(msg, search_id, count);

    dpp::cluster& cluster = m_cluster;
    const std::chrono::seconds timeout = m_choice_timeout;

    m_cluster.message_create(msg,
        [&cluster, timeout](const dpp::confirmation_callback_t& cc) {
            if (cc.is_error()) {
                std::cerr << "Failed to send search results! Err: " << cc.get_error().message << std::endl;
                return;
            }
            const auto sent = std::get<dpp::message>(cc.value);
            expire_pick_buttons(cluster, sent.id, sent.channel_id, timeout);
        });
}

// ---------- button_context ----------

button_context::button_context(dpp::cluster& cluster, const dpp::button_click_t& ev)
    : m_cluster(cluster)
    , m_token(ev.command.token)
    , m_guild_id(ev.command.guild_id)
    , m_channel_id(ev.command.channel_id)
    , m_author_id(ev.command.get_issuing_user().id)
    , m_voice_channel(voice_channel_of(ev.command.guild_id, ev.command.get_issuing_user().id))
{
    // Discord wants an answer within 3 seconds; resolving takes longer
    ev.reply(dpp::ir_deferred_update_message, dpp::message());
}

void button_context::reply(const std::string& text)
{
    m_cluster.interaction_followup_create(m_token, dpp::message(text), dpp::utility::log_error());
}

void button_context::reply_private(const std::string& text)
{
    m_cluster.interaction_followup_create(m_token,
                                          dpp::message(text).set_flags(dpp::m_ephemeral),
                                          dpp::utility::log_error());
}

void button_context::reply_with_choices(const std::string& text,
                                        std::uint64_t search_id,
                                        std::size_t count)
{
    dpp::message msg(text);
    add_pick_buttons(msg, search_id, count);
    m_cluster.interaction_followup_create(m_token, msg, dpp::utility::log_error());
}

void button_context::confirm_choice(const std::string& text)
{
    // Replaces the listing and drops its buttons
    m_cluster.interaction_response_edit(m_token, dpp::message(text), dpp::utility::log_error());
}

} // namespace encore::discord
