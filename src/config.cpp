#include "encore/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace encore {

namespace {

std::string env_or(const char* name, const std::string& fallback)
{
    const char* v = std::getenv(name);
    if (!v || !*v) {
        return fallback;
    }
    return v;
}

long env_long(const char* name, long fallback, long min_value, long max_value,
              std::vector<std::string>& warnings)
{
    const char* v = std::getenv(name);
    if (!v || !*v) {
        return fallback;
    }

    errno = 0;
    char* end = nullptr;
    const long parsed = std::strtol(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0') {
        warnings.push_back(std::string(name) + "='" + v + "' is not a number, using " +
                           std::to_string(fallback));
        return fallback;
    }
    if (parsed < min_value || parsed > max_value) {
        const long clamped = parsed < min_value ? min_value : max_value;
        warnings.push_back(std::string(name) + "=" + std::to_string(parsed) +
                           " is out of range, using " + std::to_string(clamped));
        return clamped;
    }
    return parsed;
}

} // namespace

bot_config bot_config::from_env()
{
    bot_config cfg;

    cfg.token = env_or("DISCORD_TOKEN", env_or("token", ""));
    if (cfg.token.empty()) {
        throw std::runtime_error("DISCORD_TOKEN is not set");
    }

    cfg.prefix            = env_or("ENCORE_PREFIX", cfg.prefix);
    cfg.ffmpeg            = env_or("ENCORE_FFMPEG", cfg.ffmpeg);
    cfg.ytdlp.executable  = env_or("ENCORE_YTDLP", cfg.ytdlp.executable);

    // Five buttons fit in one action row
    cfg.search_results = static_cast<std::size_t>(
        env_long("ENCORE_SEARCH_RESULTS", 5, 1, 5, cfg.warnings));
    cfg.workers = static_cast<std::size_t>(
        env_long("ENCORE_WORKERS", 4, 1, 64, cfg.warnings));
    cfg.control_workers = static_cast<std::size_t>(
        env_long("ENCORE_CONTROL_WORKERS", 2, 1, 16, cfg.warnings));

    cfg.grace.membership = std::chrono::seconds(
        env_long("ENCORE_MEMBERSHIP_GRACE", 1, 1, 3600, cfg.warnings));
    cfg.grace.stop = std::chrono::seconds(
        env_long("ENCORE_STOP_GRACE", 5, 1, 3600, cfg.warnings));
    cfg.grace.queue_drained = std::chrono::seconds(
        env_long("ENCORE_QUEUE_DRAINED_GRACE", 15, 1, 3600, cfg.warnings));
    cfg.choice_timeout = std::chrono::seconds(
        env_long("ENCORE_CHOICE_TIMEOUT", 60, 1, 900, cfg.warnings));

    return cfg;
}

} // namespace encore
