#pragma once

#include <chrono>

namespace wifiprov {

// Time source for every timeout and delay in the connection state machine.
// Tests substitute a virtual clock so retry and polling schedules can be
// checked without sleeping.
class Clock {
public:
    using duration = std::chrono::steady_clock::duration;
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleepFor(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
    void sleepFor(duration d) override;
};

} // namespace wifiprov
