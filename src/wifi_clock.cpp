#include "wifi_clock.hpp"
#include <thread>

namespace wifiprov {

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(duration d) {
    if (d > duration::zero()) {
        std::this_thread::sleep_for(d);
    }
}

} // namespace wifiprov
