#include "encore/bot/command_router.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "encore/music/format.hpp"

namespace encore::bot {

namespace {

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Whole-string base-10 integer, nothing else
std::optional<long> parse_long(const std::string& s)
{
    if (s.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

const char* const k_join_failed_text = "I couldn't join your voice channel.";

std::string queued_text(const std::string& title)
{
    return "Queued: **" + title + "**";
}

} // namespace

command_kind command_from_name(const std::string& name)
{
    if (name == "play" || name == "p" || name == "재생" || name == "틀어") {
        return command_kind::play;
    }
    if (name == "choose" || name == "pick" || name == "선택") {
        return command_kind::choose;
    }
    if (name == "pause" || name == "일시정지") {
        return command_kind::pause;
    }
    if (name == "resume" || name == "다시재생") {
        return command_kind::resume;
    }
    if (name == "skip" || name == "넘겨" || name == "스킵") {
        return command_kind::skip;
    }
    if (name == "stop" || name == "정지") {
        return command_kind::stop;
    }
    if (name == "now" || name == "np" || name == "지금") {
        return command_kind::now;
    }
    if (name == "queue" || name == "q" || name == "대기열") {
        return command_kind::queue;
    }
    return command_kind::unknown;
}

std::optional<parsed_command> parse_command(const std::string& content,
                                            const std::string& prefix)
{
    if (prefix.empty() || content.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    const std::string rest = content.substr(prefix.size());
    const auto name_end = rest.find_first_of(" \t\r\n");

    parsed_command cmd;
    cmd.name = to_lower(rest.substr(0, name_end));
    if (cmd.name.empty()) {
        return std::nullopt;
    }
    if (name_end != std::string::npos) {
        cmd.args = trim(rest.substr(name_end));
    }
    cmd.kind = command_from_name(cmd.name);
    return cmd;
}

std::string make_pick_id(std::uint64_t search_id, std::size_t index)
{
    return "pick:" + std::to_string(search_id) + ":" + std::to_string(index);
}

std::optional<pick_id> parse_pick_id(const std::string& custom_id)
{
    static const std::string head = "pick:";
    if (custom_id.compare(0, head.size(), head) != 0) {
        return std::nullopt;
    }

    const auto sep = custom_id.find(':', head.size());
    if (sep == std::string::npos) {
        return std::nullopt;
    }

    const auto id  = parse_long(custom_id.substr(head.size(), sep - head.size()));
    const auto idx = parse_long(custom_id.substr(sep + 1));
    if (!id || !idx || *id <= 0) {
        return std::nullopt;
    }

    pick_id out;
    out.search_id = static_cast<std::uint64_t>(*id);
    out.index     = *idx;
    return out;
}

command_router::command_router(music::playback_controller& controller,
                               music::search_selection& selection,
                               media::media_resolver& resolver,
                               util::executor& workers,
                               std::string prefix,
                               log_fn log)
    : m_controller(controller)
    , m_selection(selection)
    , m_resolver(resolver)
    , m_workers(workers)
    , m_prefix(std::move(prefix))
    , m_log(std::move(log))
{}

void command_router::log(dpp::loglevel level, const std::string& msg) const
{
    if (m_log) {
        m_log(level, msg);
    }
}

bool command_router::handle_message(const std::shared_ptr<command_context>& ctx,
                                    const std::string& content)
{
    const auto cmd = parse_command(content, m_prefix);
    if (!cmd || cmd->kind == command_kind::unknown) {
        return false;
    }

    {
        std::ostringstream oss;
        oss << "Command '" << cmd->name << "' from user " << ctx->author_id()
            << " in guild " << ctx->guild_id();
        log(dpp::ll_debug, oss.str());
    }

    m_controller.remember_channels(ctx->guild_id(), ctx->channel_id(), ctx->author_voice_channel());

    switch (cmd->kind) {
    case command_kind::play:   cmd_play(ctx, cmd->args);   break;
    case command_kind::choose: cmd_choose(ctx, cmd->args); break;
    case command_kind::pause:  cmd_pause(*ctx);            break;
    case command_kind::resume: cmd_resume(*ctx);           break;
    case command_kind::skip:   cmd_skip(*ctx);             break;
    case command_kind::stop:   cmd_stop(*ctx);             break;
    case command_kind::now:    cmd_now(*ctx);              break;
    case command_kind::queue:  cmd_queue(*ctx);            break;
    case command_kind::unknown:
        return false;
    }
    return true;
}

void command_router::handle_pick(const std::shared_ptr<command_context>& ctx, const pick_id& pick)
{
    std::ostringstream oss;
    oss << "Pick " << pick.index << " of search " << pick.search_id
        << " from user " << ctx->author_id() << " in guild " << ctx->guild_id();
    log(dpp::ll_debug, oss.str());

    run_selection(ctx, pick.index, pick.search_id);
}

void command_router::enqueue_and_reply(command_context& ctx, music::track t)
{
    const std::string title = t.title;
    m_controller.enqueue_and_maybe_start(ctx.guild_id(), std::move(t));
    ctx.reply(queued_text(title));
}

void command_router::cmd_play(const std::shared_ptr<command_context>& ctx, const std::string& query)
{
    const dpp::snowflake voice_channel = ctx->author_voice_channel();
    if (voice_channel.empty()) {
        ctx->reply("Join a voice channel first.");
        return;
    }
    if (!m_controller.join(ctx->guild_id(), voice_channel)) {
        ctx->reply(k_join_failed_text);
        return;
    }

    if (query.empty()) {
        const auto file = ctx->first_attachment();
        if (!file) {
            ctx->reply("Tell me what to play: a link, some search words, or attach a file.");
            return;
        }
        enqueue_and_reply(*ctx, music::track(file->url, file->filename, file->url));
        return;
    }

    if (media::is_url(query)) {
        m_workers.post([this, ctx, query]() {
            music::track t;
            try {
                t = m_resolver.resolve_one(query);
            } catch (const media::resolution_error& e) {
                log(dpp::ll_warning, "Could not load '" + query + "': " + e.what());
                ctx->reply(std::string("Could not load that: ") + e.what());
                return;
            }
            enqueue_and_reply(*ctx, std::move(t));
        });
        return;
    }

    m_workers.post([this, ctx, query]() {
        music::search_result found;
        try {
            found = m_selection.search(ctx->guild_id(), query);
        } catch (const media::resolution_error& e) {
            log(dpp::ll_warning, "Search '" + query + "' failed: " + e.what());
            ctx->reply(std::string("Search failed: ") + e.what());
            return;
        }
        ctx->reply_with_choices(music::format_candidates(found.candidates),
                                found.search_id,
                                found.candidates.size());
    });
}

void command_router::cmd_choose(const std::shared_ptr<command_context>& ctx, const std::string& args)
{
    const auto index = parse_long(args);
    if (!index) {
        ctx->reply("Usage: `" + m_prefix + "choose <number>` (e.g. `" + m_prefix + "choose 2`)");
        return;
    }
    run_selection(ctx, *index, std::nullopt);
}

void command_router::run_selection(const std::shared_ptr<command_context>& ctx,
                                   long index,
                                   std::optional<std::uint64_t> search_id)
{
    m_workers.post([this, ctx, index, search_id]() {
        music::selection_request req;
        req.guild_id      = ctx->guild_id();
        req.index         = index;
        req.search_id     = search_id;
        req.text_channel  = ctx->channel_id();
        req.voice_channel = ctx->author_voice_channel();

        const music::select_result res = m_selection.select(req);

        switch (res.status) {
        case music::select_status::queued:
            ctx->confirm_choice(queued_text(res.chosen->title));
            break;
        case music::select_status::busy:
            ctx->reply_private("Hold on, I'm still working on the previous pick.");
            break;
        case music::select_status::no_candidates:
            ctx->reply_private("Nothing to choose from. Search first with `" + m_prefix + "play <search words>`.");
            break;
        case music::select_status::stale_selection:
            ctx->reply_private("Those results are out of date. Pick from the latest search.");
            break;
        case music::select_status::out_of_range: {
            std::ostringstream oss;
            oss << "Pick a number between 1 and " << res.candidate_count << '.';
            ctx->reply_private(oss.str());
            break;
        }
        case music::select_status::not_in_voice:
            ctx->reply_private("Join a voice channel first.");
            break;
        case music::select_status::join_failed:
            ctx->reply_private(k_join_failed_text);
            break;
        case music::select_status::resolution_failed:
            ctx->reply_private("Could not load that: " + res.error_message);
            break;
        }
    });
}

void command_router::cmd_pause(command_context& ctx)
{
    if (m_controller.pause(ctx.guild_id()) == music::control_status::ok) {
        ctx.reply("Paused.");
    } else {
        ctx.reply("Nothing is playing right now.");
    }
}

void command_router::cmd_resume(command_context& ctx)
{
    if (m_controller.resume(ctx.guild_id()) == music::control_status::ok) {
        ctx.reply("Resumed.");
    } else {
        ctx.reply("Playback is not paused.");
    }
}

void command_router::cmd_skip(command_context& ctx)
{
    if (m_controller.skip(ctx.guild_id()) == music::control_status::ok) {
        ctx.reply("Skipped.");
    } else {
        ctx.reply("There is nothing to skip.");
    }
}

void command_router::cmd_stop(command_context& ctx)
{
    m_controller.stop(ctx.guild_id());
    ctx.reply("Stopped and cleared the queue.");
}

void command_router::cmd_now(command_context& ctx)
{
    const auto current = m_controller.now(ctx.guild_id());
    if (!current) {
        ctx.reply("Nothing is playing right now.");
        return;
    }
    ctx.reply("Now playing: **" + current->title + "**\n" + current->page_url);
}

void command_router::cmd_queue(command_context& ctx)
{
    ctx.reply(music::format_queue(m_controller.queue_snapshot(ctx.guild_id())));
}

} // namespace encore::bot
