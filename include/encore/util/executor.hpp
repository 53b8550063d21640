#pragma once

#include <functional>

namespace encore::util {

/// Somewhere to run continuations that must not execute on the caller's thread
/// (voice callbacks, timer ticks).
class executor {
public:
    using task = std::function<void()>;

    virtual ~executor() = default;

    virtual void post(task t) = 0;
};

} // namespace encore::util
