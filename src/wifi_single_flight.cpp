#include "wifi_single_flight.hpp"
#include "wifi_logger.hpp"

namespace wifiprov {

SingleFlight::Ticket::Ticket(Ticket&& other) noexcept : owner(other.owner) {
    other.owner = nullptr;
}

SingleFlight::Ticket& SingleFlight::Ticket::operator=(Ticket&& other) noexcept {
    if (this != &other) {
        release();
        owner = other.owner;
        other.owner = nullptr;
    }
    return *this;
}

SingleFlight::Ticket::~Ticket() {
    release();
}

void SingleFlight::Ticket::release() noexcept {
    if (owner) {
        owner->held.store(false);
        owner = nullptr;
    }
}

SingleFlight::Ticket SingleFlight::tryAcquire(const std::string& operation) {
    bool expected = false;
    if (!held.compare_exchange_strong(expected, true)) {
        Logger::getInstance().warning("Rejected ", operation, ": interface is busy");
        return Ticket();
    }
    Logger::getInstance().debug("Interface guard acquired for ", operation);
    return Ticket(this);
}

} // namespace wifiprov
