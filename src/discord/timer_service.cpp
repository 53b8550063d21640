#include "encore/discord/timer_service.hpp"

#include <atomic>
#include <memory>

namespace encore::discord {

cluster_timer_service::cluster_timer_service(dpp::cluster& cluster)
    : m_cluster(cluster)
{}

util::timer_id cluster_timer_service::arm(std::chrono::seconds delay, callback on_fire)
{
    auto fired = std::make_shared<std::atomic<bool>>(false);

    const dpp::timer handle = m_cluster.start_timer(
        [this, fired, on_fire](dpp::timer t) {
            m_cluster.stop_timer(t);
            if (!fired->exchange(true)) {
                on_fire();
            }
        },
        static_cast<uint64_t>(delay.count()));

    return static_cast<util::timer_id>(handle);
}

void cluster_timer_service::disarm(util::timer_id id)
{
    m_cluster.stop_timer(static_cast<dpp::timer>(id));
}

} // namespace encore::discord
