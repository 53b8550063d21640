#pragma once

#include <dpp/dpp.h>

#include "encore/util/timer_service.hpp"

namespace encore::discord {

/// One-shot timers on the cluster's timer thread. D++ timers repeat, so each
/// one stops itself on its first tick.
class cluster_timer_service : public util::timer_service {
public:
    explicit cluster_timer_service(dpp::cluster& cluster);

    util::timer_id arm(std::chrono::seconds delay, callback on_fire) override;
    void           disarm(util::timer_id id) override;

private:
    dpp::cluster& m_cluster;
};

} // namespace encore::discord
