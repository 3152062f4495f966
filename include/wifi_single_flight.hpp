#pragma once

#include <atomic>
#include <string>

namespace wifiprov {

// Guards the wireless interface: at most one interface-mutating operation
// (boot selection, hotspot/client activation, connection attempt) runs at a
// time. Acquisition never blocks; a busy guard is reported to the caller.
//
// A Ticket may be moved to another thread and released there, which a
// std::mutex does not allow.
class SingleFlight {
public:
    class Ticket {
    public:
        Ticket() = default;
        Ticket(Ticket&& other) noexcept;
        Ticket& operator=(Ticket&& other) noexcept;
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;
        ~Ticket();

        explicit operator bool() const noexcept { return owner != nullptr; }
        void release() noexcept;

    private:
        friend class SingleFlight;
        explicit Ticket(SingleFlight* owner) : owner(owner) {}

        SingleFlight* owner = nullptr;
    };

    SingleFlight() = default;
    SingleFlight(const SingleFlight&) = delete;
    SingleFlight& operator=(const SingleFlight&) = delete;

    // Returns an empty ticket if another operation holds the guard
    Ticket tryAcquire(const std::string& operation);

    bool busy() const noexcept { return held.load(); }

private:
    std::atomic<bool> held{false};
};

} // namespace wifiprov
