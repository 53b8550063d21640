#pragma once

#include <optional>
#include <string>
#include <utility>

namespace encore::music {

/// A resolved, playable item.
struct track {
    track() = default;
    track(std::string stream, std::string name, std::string page = {})
        : stream_url(std::move(stream))
        , title(std::move(name))
        , page_url(page.empty() ? stream_url : std::move(page))
    {}

    std::string stream_url; // what the audio pipe opens
    std::string title;
    std::string page_url;   // source page, falls back to stream_url
};

/// Metadata-only search hit produced by a flat search.
struct candidate_track {
    std::string                title;
    std::string                page_url;
    std::optional<int>         duration; // seconds
    std::optional<std::string> channel;
};

} // namespace encore::music
