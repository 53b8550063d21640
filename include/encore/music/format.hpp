#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "encore/music/track.hpp"

namespace encore::music {

/// "m:ss" or "h:mm:ss"; empty when unknown.
std::string format_duration(std::optional<int> seconds);

/// Cuts titles longer than max_chars code points to max_chars - 3 plus "...".
std::string shorten_title(const std::string& title, std::size_t max_chars = 70);

/// Numbered search listing, one line per candidate.
std::string format_candidates(const std::vector<candidate_track>& candidates);

/// Numbered queue listing, or a note that it is empty.
std::string format_queue(const std::vector<track>& queue);

} // namespace encore::music
