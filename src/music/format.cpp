#include "encore/music/format.hpp"

#include <iomanip>
#include <sstream>

namespace encore::music {

namespace {

bool is_continuation_byte(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

std::size_t code_points(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s) {
        if (!is_continuation_byte(c)) {
            ++n;
        }
    }
    return n;
}

} // namespace

std::string format_duration(std::optional<int> seconds)
{
    if (!seconds || *seconds < 0) {
        return {};
    }

    int s = *seconds;
    const int h = s / 3600;
    const int m = (s % 3600) / 60;
    s %= 60;

    std::ostringstream oss;
    if (h > 0) {
        oss << h << ':' << std::setw(2) << std::setfill('0') << m;
    } else {
        oss << m;
    }
    oss << ':' << std::setw(2) << std::setfill('0') << s;
    return oss.str();
}

std::string shorten_title(const std::string& title, std::size_t max_chars)
{
    if (max_chars < 4 || code_points(title) <= max_chars) {
        return title;
    }

    const std::size_t keep = max_chars - 3;
    std::size_t seen = 0;
    std::size_t pos  = 0;
    for (; pos < title.size(); ++pos) {
        if (!is_continuation_byte(static_cast<unsigned char>(title[pos]))) {
            if (seen == keep) {
                break;
            }
            ++seen;
        }
    }
    return title.substr(0, pos) + "...";
}

std::string format_candidates(const std::vector<candidate_track>& candidates)
{
    std::ostringstream oss;
    oss << "Search results (pick one with the buttons or `choose <number>`):";

    std::size_t i = 1;
    for (const auto& c : candidates) {
        oss << '\n' << i++ << ". " << shorten_title(c.title);

        std::vector<std::string> extra;
        if (c.channel && !c.channel->empty()) {
            extra.push_back(*c.channel);
        }
        const std::string d = format_duration(c.duration);
        if (!d.empty()) {
            extra.push_back(d);
        }
        for (std::size_t k = 0; k < extra.size(); ++k) {
            oss << (k == 0 ? " — " : " • ") << extra[k];
        }
    }
    return oss.str();
}

std::string format_queue(const std::vector<track>& queue)
{
    if (queue.empty()) {
        return "The queue is empty.";
    }

    std::ostringstream oss;
    oss << "Queue:";
    std::size_t i = 1;
    for (const auto& t : queue) {
        oss << '\n' << i++ << ". " << shorten_title(t.title);
    }
    return oss.str();
}

} // namespace encore::music
