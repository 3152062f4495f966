#pragma once

#include "wifi_clock.hpp"
#include "wifi_configurator.hpp"
#include "wifi_errors.hpp"
#include "wifi_gateway.hpp"
#include "wifi_mode_store.hpp"
#include "wifi_single_flight.hpp"
#include "wifi_types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wifiprov {

struct RetryPolicy {
    // One entry per attempt: the delay before that attempt starts
    std::vector<std::chrono::seconds> delays{std::chrono::seconds(0),
                                             std::chrono::seconds(5),
                                             std::chrono::seconds(10)};
    std::chrono::seconds attemptTimeout{40};
    std::chrono::seconds pollInterval{2};
};

struct ConnectionResult {
    bool success = false;
    ErrorCode code = ErrorCode::None;
    std::string message;
    std::optional<std::string> ip;
    int attempts = 0;
};

// One try at joining the target network. Lives only inside connect().
struct ConnectionAttempt {
    enum class Outcome { Pending, Success, Timeout, Failed };

    std::string targetSsid;
    int attemptNumber = 0;
    Clock::time_point startedAt;
    Clock::time_point deadline;
    Outcome outcome = Outcome::Pending;
    ConnectOutcome gatewayOutcome = ConnectOutcome::ACCEPTED;
    std::optional<std::string> ip;
};

/**
 * Joins a network with bounded retries and restores the previous state when
 * every attempt fails.
 *
 * Success requires the link to be up on the target SSID, not just an
 * accepted request. A failed call leaves the device in the mode it was in
 * before; if it had neither a client link nor a hotspot, the hotspot is
 * started so the device stays reachable.
 */
class ConnectionOrchestrator {
public:
    ConnectionOrchestrator(NetworkGateway& gateway, InterfaceConfigurator& configurator,
                           ModeStore& modeStore, SingleFlight& guard, Clock& clock,
                           RetryPolicy policy = RetryPolicy());

    // Rejects immediately with AttemptInProgress if the interface is busy
    ConnectionResult connect(const ConnectRequest& request);

    // For callers that already hold the interface guard
    ConnectionResult connectHeld(const ConnectRequest& request, const SingleFlight::Ticket& ticket);

    // Empty on success, otherwise a user-facing reason
    static std::string validate(const ConnectRequest& request);

private:
    struct Snapshot {
        bool hotspot = false;
        std::optional<std::string> activeProfileId;
        std::set<std::string> profileIds;
        // Profiles for the target SSID whose secret connect() may overwrite
        std::map<std::string, ProfileCredential> credentials;
    };

    Snapshot takeSnapshot(const ConnectRequest& request);
    void recordCredential(const std::string& profileId, Snapshot& snapshot);
    ConnectionResult runAttempts(const ConnectRequest& request, const Snapshot& snapshot);
    void runAttempt(const ConnectRequest& request, ConnectionAttempt& attempt);
    void pollUntilConnected(ConnectionAttempt& attempt);
    ConnectionResult commit(const Snapshot& snapshot, const ConnectionAttempt& attempt);
    void rollback(const Snapshot& snapshot, const std::string& ssid);
    void restoreCredentials(const Snapshot& snapshot);
    void fallBackToHotspot();

    NetworkGateway& gateway;
    InterfaceConfigurator& configurator;
    ModeStore& modeStore;
    SingleFlight& guard;
    Clock& clock;
    RetryPolicy policy;
};

} // namespace wifiprov
