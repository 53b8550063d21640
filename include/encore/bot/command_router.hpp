#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "encore/bot/command_context.hpp"
#include "encore/log.hpp"
#include "encore/media/resolver.hpp"
#include "encore/music/playback_controller.hpp"
#include "encore/music/search_selection.hpp"
#include "encore/util/executor.hpp"

namespace encore::bot {

enum class command_kind {
    play,
    choose,
    pause,
    resume,
    skip,
    stop,
    now,
    queue,
    unknown
};

struct parsed_command {
    command_kind kind = command_kind::unknown;
    std::string  name; // lower-cased as typed
    std::string  args; // trimmed remainder
};

/// nullopt if content does not start with prefix followed by a name.
std::optional<parsed_command> parse_command(const std::string& content,
                                            const std::string& prefix);

/// Maps a lower-case name or alias to its command.
command_kind command_from_name(const std::string& name);

/// Button ids look like "pick:<search_id>:<index>".
std::string make_pick_id(std::uint64_t search_id, std::size_t index);

struct pick_id {
    std::uint64_t search_id = 0;
    long          index     = 0;
};

std::optional<pick_id> parse_pick_id(const std::string& custom_id);

/// Turns text commands and pick buttons into playback operations. Anything
/// that may wait on yt-dlp is posted to the worker executor; the rest answers
/// inline.
class command_router {
public:
    command_router(music::playback_controller& controller,
                   music::search_selection& selection,
                   media::media_resolver& resolver,
                   util::executor& workers,
                   std::string prefix,
                   log_fn log);

    /// False if content is not one of our commands.
    bool handle_message(const std::shared_ptr<command_context>& ctx, const std::string& content);

    void handle_pick(const std::shared_ptr<command_context>& ctx, const pick_id& pick);

    const std::string& prefix() const { return m_prefix; }

private:
    music::playback_controller& m_controller;
    music::search_selection&    m_selection;
    media::media_resolver&      m_resolver;
    util::executor&             m_workers;
    std::string                 m_prefix;
    log_fn                      m_log;

    void cmd_play(const std::shared_ptr<command_context>& ctx, const std::string& query);
    void cmd_choose(const std::shared_ptr<command_context>& ctx, const std::string& args);
    void cmd_pause(command_context& ctx);
    void cmd_resume(command_context& ctx);
    void cmd_skip(command_context& ctx);
    void cmd_stop(command_context& ctx);
    void cmd_now(command_context& ctx);
    void cmd_queue(command_context& ctx);

    void run_selection(const std::shared_ptr<command_context>& ctx,
                       long index,
                       std::optional<std::uint64_t> search_id);

    void enqueue_and_reply(command_context& ctx, music::track t);

    void log(dpp::loglevel level, const std::string& msg) const;
};

} // namespace encore::bot
