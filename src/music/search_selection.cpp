#include "encore/music/search_selection.hpp"

#include <atomic>
#include <sstream>

namespace encore::music {

namespace {

// Clears choose_in_flight on every way out of select()
struct in_flight_reset {
    std::atomic<bool>& flag;
    ~in_flight_reset() { flag.store(false); }
};

} // namespace

search_selection::search_selection(state_registry& registry,
                                   media::media_resolver& resolver,
                                   playback_controller& controller,
                                   std::size_t result_count,
                                   log_fn log)
    : m_registry(registry)
    , m_resolver(resolver)
    , m_controller(controller)
    , m_result_count(result_count == 0 ? 1 : result_count)
    , m_log(std::move(log))
{}

void search_selection::log(dpp::loglevel level, const std::string& msg) const
{
    if (m_log) {
        m_log(level, msg);
    }
}

search_result search_selection::search(dpp::snowflake guild_id, const std::string& query)
{
    search_result res;
    res.candidates = m_resolver.search_flat(query, m_result_count);
    if (res.candidates.size() > m_result_count) {
        res.candidates.resize(m_result_count);
    }

    {
        std::lock_guard<std::mutex> lock(m_id_mutex);
        res.search_id = ++m_next_search_id;
    }

    guild_state& g = m_registry.get_or_create(guild_id);
    {
        std::lock_guard<std::mutex> lock(g.candidates_mutex);
        g.pending_candidates = res.candidates;
        g.search_id          = res.search_id;
    }

    std::ostringstream oss;
    oss << "Stored " << res.candidates.size() << " candidate(s) for guild "
        << guild_id << " (search " << res.search_id << ")";
    log(dpp::ll_debug, oss.str());

    return res;
}

select_result search_selection::select(const selection_request& req)
{
    select_result res;
    guild_state& g = m_registry.get_or_create(req.guild_id);

    bool expected = false;
    if (!g.choose_in_flight.compare_exchange_strong(expected, true)) {
        res.status = select_status::busy;
        return res;
    }
    in_flight_reset reset{g.choose_in_flight};

    candidate_track chosen;
    std::uint64_t   list_id = 0;
    {
        std::lock_guard<std::mutex> lock(g.candidates_mutex);
        res.candidate_count = g.pending_candidates.size();

        if (g.pending_candidates.empty()) {
            res.status = select_status::no_candidates;
            return res;
        }
        if (req.search_id && *req.search_id != g.search_id) {
            res.status = select_status::stale_selection;
            return res;
        }
        if (req.index < 1 || static_cast<std::size_t>(req.index) > g.pending_candidates.size()) {
            res.status = select_status::out_of_range;
            return res;
        }
        chosen  = g.pending_candidates[static_cast<std::size_t>(req.index - 1)];
        list_id = g.search_id;
    }

    if (!m_controller.voice_connected(req.guild_id)) {
        if (req.voice_channel.empty()) {
            res.status = select_status::not_in_voice;
            return res;
        }
        if (!m_controller.join(req.guild_id, req.voice_channel)) {
            res.status = select_status::join_failed;
            return res;
        }
    }

    track resolved;
    try {
        resolved = m_resolver.resolve_one(chosen.page_url);
    } catch (const media::resolution_error& e) {
        std::ostringstream oss;
        oss << "Could not resolve '" << chosen.page_url << "' for guild "
            << req.guild_id << ": " << e.what();
        log(dpp::ll_warning, oss.str());

        res.status        = select_status::resolution_failed;
        res.error_message = e.what();
        return res;
    }

    m_controller.remember_channels(req.guild_id, req.text_channel, req.voice_channel);
    const enqueue_result queued = m_controller.enqueue_and_maybe_start(req.guild_id, resolved);

    {
        // A search that landed meanwhile keeps its own list
        std::lock_guard<std::mutex> lock(g.candidates_mutex);
        if (g.search_id == list_id) {
            g.pending_candidates.clear();
            g.search_id = 0;
        }
    }

    res.status  = select_status::queued;
    res.chosen  = std::move(resolved);
    res.started = queued.started;
    return res;
}

} // namespace encore::music
