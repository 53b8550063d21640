#include <dpp/dpp.h>                // D++

#include <cstdlib>                  // EXIT_FAILURE
#include <iostream>                 // std::cout, std::cerr
#include <memory>                   // std::make_shared
#include <sstream>                  // std::ostringstream
#include <stdexcept>                // std::runtime_error

#include "encore/bot/command_router.hpp"            // Prefix commands and pick buttons
#include "encore/config.hpp"                        // Environment settings
#include "encore/discord/contexts.hpp"              // Message / button replies
#include "encore/discord/notifier.hpp"              // Channel notices
#include "encore/discord/timer_service.hpp"         // One-shot cluster timers
#include "encore/discord/voice_gateway.hpp"         // ffmpeg -> voice
#include "encore/media/ytdlp_resolver.hpp"          // yt-dlp lookups
#include "encore/music/idle_leave_scheduler.hpp"    // Leave empty channels
#include "encore/music/playback_controller.hpp"     // Queue + playback
#include "encore/music/search_selection.hpp"        // Search -> choose
#include "encore/music/state_registry.hpp"          // Per-guild state
#include "encore/music/voice_presence.hpp"          // Who sits in which voice channel
#include "encore/util/worker_pool.hpp"              // Blocking work off the event thread

using namespace dpp;

int main() {
    encore::bot_config cfg;
    try {
        cfg = encore::bot_config::from_env();
    } catch (const std::runtime_error& e) {
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    cluster bot(cfg.token, i_default_intents | i_message_content); // Prefix commands need message content
    bot.on_log(utility::cout_logger()); // D++ logger

    for (const auto& w : cfg.warnings) {
        bot.log(ll_warning, w);
    }

    const encore::log_fn log = [&bot](loglevel level, const std::string& msg) {
        bot.log(level, msg);
    };

    // ---------- Music core ----------
    encore::util::worker_pool             workers(cfg.workers, log);     // yt-dlp and whole commands
    encore::util::worker_pool             control(cfg.control_workers, log); // completions and idle leaves
    encore::discord::cluster_timer_service timers(bot);
    encore::discord::dpp_voice_gateway     voice(bot, cfg.ffmpeg, log);
    encore::discord::dpp_notifier          notifier(bot, log);

    encore::music::state_registry       registry;
    encore::music::idle_leave_scheduler idle(registry, voice, notifier, timers, control, log);
    encore::music::playback_controller  controller(registry, voice, notifier, idle, control, cfg.grace, log);
    encore::music::voice_presence       presence;

    encore::media::ytdlp_resolver   resolver(cfg.ytdlp, log);
    encore::music::search_selection selection(registry, resolver, controller, cfg.search_results, log);

    encore::bot::command_router router(controller, selection, resolver, workers, cfg.prefix, log);

    // ---------- Prefix commands ----------
    bot.on_message_create([&bot, &router, &cfg](const message_create_t& ev) {
        if (ev.msg.author.is_bot() || ev.msg.guild_id.empty()) {
            return;
        }
        if (ev.msg.content.compare(0, router.prefix().size(), router.prefix()) != 0) {
            return;
        }
        auto ctx = std::make_shared<encore::discord::message_context>(bot, ev, cfg.choice_timeout);
        router.handle_message(ctx, ev.msg.content);
    });

    // ---------- Pick buttons ----------
    bot.on_button_click([&bot, &router](const button_click_t& ev) {
        const auto pick = encore::bot::parse_pick_id(ev.custom_id);
        if (!pick) {
            return;
        }
        auto ctx = std::make_shared<encore::discord::button_context>(bot, ev);
        router.handle_pick(ctx, *pick);
    });

    // ---------- Voice glue ----------
    bot.on_voice_state_update([&controller, &presence](const voice_state_update_t& ev) {
        if (ev.state.guild_id.empty()) {
            return;
        }
        const auto before = presence.update(ev.state.guild_id, ev.state.user_id, ev.state.channel_id);
        controller.on_voice_state_changed(ev.state.guild_id, before, ev.state.channel_id);
    });

    bot.on_voice_ready([&voice](const voice_ready_t& ev) {
        voice.handle_voice_ready(ev);
    });

    bot.on_voice_track_marker([&voice](const voice_track_marker_t& ev) {
        voice.handle_voice_track_marker(ev);
    });

    // ---------- on_ready ----------
    bot.on_ready([&bot](const ready_t& event) {
        (void)event;

        std::cout << "Logged in as " << bot.me.username << "!" << std::endl;

        // Commands are prefix-only; drop any leftover global slash commands
        if (run_once<struct clear_bot_commands>()) {
            std::cout << "Clearing global slash commands..." << std::endl;
            bot.global_bulk_command_create({}, [](const confirmation_callback_t& cc) {
                if (cc.is_error()) {
                    std::cerr << "Failed to clear slash commands! Err: " << cc.get_error().message << std::endl;
                    return;
                }
                std::cout << "Slash commands cleared!" << std::endl;
            });
        }
    });

    std::ostringstream oss;
    oss << "Starting with prefix '" << cfg.prefix << "', " << cfg.workers << " workers";
    bot.log(ll_info, oss.str());

    bot.start(dpp::st_wait);
    return 0;
}
