#include "encore/media/ytdlp_resolver.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <sstream>

#include <sys/wait.h>

namespace encore::media {

namespace {

const char* const k_untitled = "Untitled";
const char* const k_watch_prefix = "https://www.youtube.com/watch?v=";

std::string string_field(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

double number_field(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

bool has_codec(const json& fmt, const char* key)
{
    const std::string codec = string_field(fmt, key);
    return !codec.empty() && codec != "none";
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// yt-dlp prints "ERROR: ..." lines on failure; keep the last one.
std::string error_text(const process_output& out)
{
    std::istringstream in(out.output);
    std::string line;
    std::string last_error;
    std::string last_line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        last_line = line;
        if (line.rfind("ERROR:", 0) == 0) {
            last_error = line.substr(6);
            while (!last_error.empty() && last_error.front() == ' ') {
                last_error.erase(0, 1);
            }
        }
    }
    if (!last_error.empty()) {
        return last_error;
    }
    if (!last_line.empty()) {
        return last_line;
    }
    return "yt-dlp exited with status " + std::to_string(out.exit_code);
}

} // namespace

bool is_url(const std::string& text)
{
    return text.rfind("http://", 0) == 0 || text.rfind("https://", 0) == 0;
}

process_output run_process(const std::string& command)
{
    process_output out;

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        out.exit_code = -1;
        out.output    = "failed to start: " + command;
        return out;
    }

    std::array<char, 4096> buffer;
    std::size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        out.output.append(buffer.data(), n);
    }

    const int status = pclose(pipe);
    if (status == -1) {
        out.exit_code = -1;
    } else if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else {
        out.exit_code = -1;
    }
    return out;
}

std::string shell_quote(const std::string& arg)
{
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string select_stream_url(const json& info)
{
    const json* best_audio     = nullptr;
    double      best_audio_br  = -1.0;
    const json* best_muxed     = nullptr;
    double      best_muxed_br  = -1.0;

    auto formats = info.find("formats");
    if (formats != info.end() && formats->is_array()) {
        for (const auto& fmt : *formats) {
            if (!fmt.is_object() || string_field(fmt, "url").empty() || !has_codec(fmt, "acodec")) {
                continue;
            }

            if (!has_codec(fmt, "vcodec")) {
                double br = number_field(fmt, "abr");
                if (br <= 0.0) {
                    br = number_field(fmt, "tbr");
                }
                if (br > best_audio_br) {
                    best_audio_br = br;
                    best_audio    = &fmt;
                }
            } else {
                const double br = number_field(fmt, "tbr");
                if (br > best_muxed_br) {
                    best_muxed_br = br;
                    best_muxed    = &fmt;
                }
            }
        }
    }

    if (best_audio) {
        return string_field(*best_audio, "url");
    }
    if (best_muxed) {
        return string_field(*best_muxed, "url");
    }

    std::string url = string_field(info, "url");
    if (url.empty()) {
        throw resolution_error("no audio stream found");
    }
    return url;
}

music::track parse_full_info(const json& info, const std::string& query_or_page)
{
    if (!info.is_object()) {
        throw resolution_error("no results");
    }

    const json* item = &info;
    auto entries = info.find("entries");
    if (entries != info.end()) {
        if (!entries->is_array() || entries->empty() || !(*entries)[0].is_object()) {
            throw resolution_error("no results");
        }
        item = &(*entries)[0];
    }

    std::string stream = select_stream_url(*item);

    std::string title = string_field(*item, "title");
    if (title.empty()) {
        title = k_untitled;
    }

    std::string page = string_field(*item, "webpage_url");
    if (page.empty()) {
        page = string_field(*item, "original_url");
    }
    if (page.empty()) {
        page = query_or_page;
    }

    return music::track(std::move(stream), std::move(title), std::move(page));
}

std::vector<music::candidate_track> parse_flat_entries(const json& info)
{
    std::vector<music::candidate_track> out;

    auto entries = info.is_object() ? info.find("entries") : info.end();
    if (info.is_object() && entries != info.end() && entries->is_array()) {
        for (const auto& it : *entries) {
            if (!it.is_object()) {
                continue;
            }

            std::string page = string_field(it, "url");
            if (page.empty()) {
                page = string_field(it, "webpage_url");
            }
            if (page.empty()) {
                page = string_field(it, "original_url");
            }
            if (page.empty()) {
                continue;
            }
            // Flat results often carry only the video id
            if (page.rfind("http", 0) != 0) {
                page = k_watch_prefix + page;
            }

            music::candidate_track c;
            c.title = string_field(it, "title");
            if (c.title.empty()) {
                c.title = k_untitled;
            }
            c.page_url = std::move(page);

            auto dur = it.find("duration");
            if (dur != it.end() && dur->is_number() && dur->get<double>() >= 0.0) {
                c.duration = static_cast<int>(dur->get<double>());
            }

            std::string channel = string_field(it, "channel");
            if (!channel.empty()) {
                c.channel = std::move(channel);
            }

            out.push_back(std::move(c));
        }
    }

    if (out.empty()) {
        throw resolution_error("no results");
    }
    return out;
}

ytdlp_resolver::ytdlp_resolver(ytdlp_config cfg, log_fn log, process_runner runner)
    : m_cfg(std::move(cfg))
    , m_log(std::move(log))
    , m_runner(std::move(runner))
{}

json ytdlp_resolver::run_json(const std::string& command) const
{
    if (m_log) {
        m_log(dpp::ll_debug, "Running: " + command);
    }

    const process_output out = m_runner(command);
    if (out.exit_code != 0) {
        throw resolution_error(error_text(out));
    }

    const auto start = out.output.find('{');
    if (start == std::string::npos) {
        throw resolution_error("no results");
    }

    try {
        return json::parse(out.output.substr(start));
    } catch (const json::exception& e) {
        if (m_log) {
            m_log(dpp::ll_warning, std::string("Failed to parse yt-dlp output: ") + e.what());
        }
        throw resolution_error("could not read yt-dlp output");
    }
}

music::track ytdlp_resolver::extract_with_client(const std::string& query_or_page,
                                                 const std::string& player_client) const
{
    std::ostringstream cmd;
    cmd << shell_quote(m_cfg.executable)
        << " --dump-single-json --no-playlist --quiet --no-warnings --skip-download"
        << " --default-search ytsearch --geo-bypass --ignore-no-formats-error"
        << " --retries 1 --extractor-retries 0"
        << " --socket-timeout " << m_cfg.socket_timeout
        << " --extractor-args " << shell_quote("youtube:player_client=" + player_client)
        << " -- " << shell_quote(query_or_page)
        << " 2>&1";

    return parse_full_info(run_json(cmd.str()), query_or_page);
}

music::track ytdlp_resolver::resolve_one(const std::string& query_or_page)
{
    try {
        return extract_with_client(query_or_page, "web");
    } catch (const resolution_error& e) {
        if (to_lower(e.what()).find("not available on this app") == std::string::npos) {
            throw;
        }
        if (m_log) {
            m_log(dpp::ll_info, "Web client refused '" + query_or_page + "', retrying with android client");
        }
    }
    return extract_with_client(query_or_page, "android");
}

std::vector<music::candidate_track> ytdlp_resolver::search_flat(const std::string& query,
                                                                std::size_t count)
{
    std::ostringstream cmd;
    cmd << shell_quote(m_cfg.executable)
        << " --dump-single-json --flat-playlist --quiet --no-warnings --skip-download"
        << " --socket-timeout " << m_cfg.search_socket_timeout
        << " -- " << shell_quote("ytsearch" + std::to_string(count) + ":" + query)
        << " 2>&1";

    auto results = parse_flat_entries(run_json(cmd.str()));

    if (m_log) {
        std::ostringstream oss;
        oss << "Search '" << query << "' returned " << results.size() << " candidate(s)";
        m_log(dpp::ll_debug, oss.str());
    }
    return results;
}

} // namespace encore::media
