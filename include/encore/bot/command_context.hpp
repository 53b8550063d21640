#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <dpp/snowflake.h>

namespace encore::bot {

struct attachment_ref {
    std::string url;
    std::string filename;
};

/// Where a command came from and how to answer it. Implemented for message
/// commands and button clicks; replies may be sent from any thread.
class command_context {
public:
    virtual ~command_context() = default;

    virtual dpp::snowflake guild_id() const = 0;
    virtual dpp::snowflake channel_id() const = 0;
    virtual dpp::snowflake author_id() const = 0;

    /// 0 if the author is not in a voice channel.
    virtual dpp::snowflake author_voice_channel() const = 0;

    virtual std::optional<attachment_ref> first_attachment() const = 0;

    virtual void reply(const std::string& text) = 0;

    /// Reply only the author needs to see (button clicks answer ephemerally).
    virtual void reply_private(const std::string& text) { reply(text); }

    /// Candidate listing plus numbered pick buttons bound to search_id.
    virtual void reply_with_choices(const std::string& text,
                                    std::uint64_t search_id,
                                    std::size_t count) = 0;

    /// A pick succeeded. Button clicks replace the listing with text.
    virtual void confirm_choice(const std::string& text) { reply(text); }
};

} // namespace encore::bot
