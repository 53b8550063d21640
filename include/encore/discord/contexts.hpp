#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <dpp/dpp.h>

#include "encore/bot/command_context.hpp"

namespace encore::discord {

/// A prefix command typed in a guild text channel. Voice channel and
/// attachment are captured when the message arrives.
class message_context : public bot::command_context {
public:
    message_context(dpp::cluster& cluster,
                    const dpp::message_create_t& ev,
                    std::chrono::seconds choice_timeout);

    dpp::snowflake guild_id() const override { return m_guild_id; }
    dpp::snowflake channel_id() const override { return m_channel_id; }
    dpp::snowflake author_id() const override { return m_author_id; }
    dpp::snowflake author_voice_channel() const override { return m_voice_channel; }

    std::optional<bot::attachment_ref> first_attachment() const override { return m_attachment; }

    void reply(const std::string& text) override;
    void reply_with_choices(const std::string& text,
                            std::uint64_t search_id,
                            std::size_t count) override;

private:
    dpp::cluster&        m_cluster;
    dpp::snowflake       m_guild_id;
    dpp::snowflake       m_channel_id;
    dpp::snowflake       m_message_id;
    dpp::snowflake       m_author_id;
    dpp::snowflake       m_voice_channel;
    std::chrono::seconds m_choice_timeout;

    std::optional<bot::attachment_ref> m_attachment;
};

/// A click on one of the numbered pick buttons. The interaction is
/// acknowledged on construction; answers go out as follow-ups or as an edit
/// of the listing message.
class button_context : public bot::command_context {
public:
    button_context(dpp::cluster& cluster, const dpp::button_click_t& ev);

    dpp::snowflake guild_id() const override { return m_guild_id; }
    dpp::snowflake channel_id() const override { return m_channel_id; }
    dpp::snowflake author_id() const override { return m_author_id; }
    dpp::snowflake author_voice_channel() const override { return m_voice_channel; }

    std::optional<bot::attachment_ref> first_attachment() const override { return std::nullopt; }

    void reply(const std::string& text) override;
    void reply_private(const std::string& text) override;
    void reply_with_choices(const std::string& text,
                            std::uint64_t search_id,
                            std::size_t count) override;
    void confirm_choice(const std::string& text) override;

private:
    dpp::cluster&  m_cluster;
    std::string    m_token;
    dpp::snowflake m_guild_id;
    dpp::snowflake m_channel_id;
    dpp::snowflake m_author_id;
    dpp::snowflake m_voice_channel;
};

} // namespace encore::discord
