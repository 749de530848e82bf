#pragma once

#include <chrono>

namespace sandpool {

// Time source for timestamps, retention checks and retry backoff.
// Injected so tests can drive time without sleeping.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration d) override;

    // Process-wide instance for production wiring
    static SteadyClock& instance();
};

} // namespace sandpool
