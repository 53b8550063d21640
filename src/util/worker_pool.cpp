#include "encore/util/worker_pool.hpp"

#include <exception>
#include <sstream>

namespace encore::util {

worker_pool::worker_pool(std::size_t threads, log_fn log)
    : m_log(std::move(log))
{
    if (threads == 0) {
        threads = 1;
    }
    m_workers.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        m_workers.emplace_back(&worker_pool::worker_loop, this);
    }

    if (m_log) {
        std::ostringstream oss;
        oss << "Worker pool started with " << threads << " thread(s)";
        m_log(dpp::ll_debug, oss.str());
    }
}

worker_pool::~worker_pool()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    for (auto& w : m_workers) {
        if (w.joinable()) {
            w.join();
        }
    }
}

void worker_pool::post(task t)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        m_tasks.push(std::move(t));
    }
    m_cv.notify_one();
}

std::size_t worker_pool::pending() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void worker_pool::worker_loop()
{
    for (;;) {
        task t;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            // Drain what is queued before exiting
            if (m_tasks.empty()) {
                return;
            }
            t = std::move(m_tasks.front());
            m_tasks.pop();
        }

        try {
            t();
        } catch (const std::exception& e) {
            if (m_log) {
                m_log(dpp::ll_error, std::string("Worker task threw: ") + e.what());
            }
        } catch (...) {
            // An escaping exception would take every guild down with the thread
            if (m_log) {
                m_log(dpp::ll_error, "Worker task threw a non-standard exception");
            }
        }
    }
}

} // namespace encore::util
