#pragma once

#include <functional>
#include <string>
#include <vector>

#include <dpp/json.h>

#include "encore/log.hpp"
#include "encore/media/resolver.hpp"

namespace encore::media {

using json = dpp::json;

struct ytdlp_config {
    std::string executable            = "yt-dlp";
    int         socket_timeout        = 10; // full extraction
    int         search_socket_timeout = 15; // flat search
};

struct process_output {
    int         exit_code = 0;
    std::string output; // stdout and stderr combined
};

using process_runner = std::function<process_output(const std::string& command)>;

/// Runs a shell command through popen() and collects its output.
process_output run_process(const std::string& command);

/// Single-quotes an argument for /bin/sh.
std::string shell_quote(const std::string& arg);

/// Picks the stream URL out of a yt-dlp info dict:
/// best audio-only format, then best combined format, then the top-level url.
/// Throws resolution_error if none exists.
std::string select_stream_url(const json& info);

/// Builds a track from a full (non-flat) info dict. Search wrappers resolve to
/// their first entry.
music::track parse_full_info(const json& info, const std::string& query_or_page);

/// Builds candidates from a flat search result. Throws on zero usable entries.
std::vector<music::candidate_track> parse_flat_entries(const json& info);

class ytdlp_resolver : public media_resolver {
public:
    ytdlp_resolver(ytdlp_config cfg, log_fn log, process_runner runner = run_process);

    music::track resolve_one(const std::string& query_or_page) override;

    std::vector<music::candidate_track> search_flat(const std::string& query,
                                                    std::size_t count) override;

private:
    ytdlp_config   m_cfg;
    log_fn         m_log;
    process_runner m_runner;

    music::track extract_with_client(const std::string& query_or_page,
                                     const std::string& player_client) const;

    json run_json(const std::string& command) const;
};

} // namespace encore::media
