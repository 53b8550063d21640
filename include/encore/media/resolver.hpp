#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "encore/music/track.hpp"

namespace encore::media {

/// No result, no usable stream, or the source refused the request.
class resolution_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Turns links and search terms into tracks. Both calls hit the network and
/// must not be made while holding any guild lock.
class media_resolver {
public:
    virtual ~media_resolver() = default;

    /// Full resolution of a link or search term into one playable track.
    virtual music::track resolve_one(const std::string& query_or_page) = 0;

    /// Metadata-only search, upstream order preserved. Throws on zero hits.
    virtual std::vector<music::candidate_track> search_flat(const std::string& query,
                                                            std::size_t count) = 0;
};

/// "http://" or "https://" prefix.
bool is_url(const std::string& text);

} // namespace encore::media
