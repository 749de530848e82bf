#include "clock.h"

#include <thread>

namespace sandpool {

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(duration d) {
    std::this_thread::sleep_for(d);
}

SteadyClock& SteadyClock::instance() {
    static SteadyClock clock;
    return clock;
}

} // namespace sandpool
