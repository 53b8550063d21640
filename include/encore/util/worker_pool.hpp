#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "encore/log.hpp"
#include "encore/util/executor.hpp"

namespace encore::util {

/// Fixed-size thread pool. The bot runs two: one for blocking work (yt-dlp,
/// whole play/choose commands) and one for controller and idle-leave
/// continuations, so a slow lookup never delays another guild's queue.
class worker_pool : public executor {
public:
    explicit worker_pool(std::size_t threads, log_fn log = {});
    ~worker_pool() override;

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    void post(task t) override;

    std::size_t pending() const;

private:
    void worker_loop();

    log_fn m_log;

    std::vector<std::thread> m_workers;
    std::queue<task>         m_tasks;
    mutable std::mutex       m_mutex;
    std::condition_variable  m_cv;
    std::atomic<bool>        m_stopping{false};
};

} // namespace encore::util
