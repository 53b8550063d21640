#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace encore::util {

using timer_id = std::uint64_t;

/// One-shot delayed callbacks. disarm() of an id that already fired or was
/// never armed is a no-op.
class timer_service {
public:
    using callback = std::function<void()>;

    virtual ~timer_service() = default;

    virtual timer_id arm(std::chrono::seconds delay, callback on_fire) = 0;
    virtual void     disarm(timer_id id) = 0;
};

} // namespace encore::util
