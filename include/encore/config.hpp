#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "encore/media/ytdlp_resolver.hpp"
#include "encore/music/playback_controller.hpp"

namespace encore {

struct bot_config {
    std::string           token;
    std::string           prefix         = "!";
    std::string           ffmpeg         = "ffmpeg";
    std::size_t           search_results = 5;
    std::size_t           workers        = 4;
    std::size_t           control_workers = 2;
    std::chrono::seconds  choice_timeout{60};

    media::ytdlp_config   ytdlp;
    music::grace_periods  grace;

    // Problems found while reading the environment; logged once the cluster exists
    std::vector<std::string> warnings;

    /// Reads DISCORD_TOKEN (or token) and the ENCORE_* variables.
    /// Throws std::runtime_error if no token is set.
    static bot_config from_env();
};

} // namespace encore
