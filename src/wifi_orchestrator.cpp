#include "wifi_orchestrator.hpp"
#include "wifi_logger.hpp"

namespace wifiprov {

namespace {

constexpr size_t MAX_SSID_LENGTH = 32;
constexpr size_t MAX_PASSWORD_LENGTH = 63;

ConnectionResult rejected(ErrorCode code, const std::string& message) {
    ConnectionResult result;
    result.code = code;
    result.message = message;
    return result;
}

} // namespace

ConnectionOrchestrator::ConnectionOrchestrator(NetworkGateway& gateway,
                                               InterfaceConfigurator& configurator,
                                               ModeStore& modeStore, SingleFlight& guard,
                                               Clock& clock, RetryPolicy policy)
    : gateway(gateway), configurator(configurator), modeStore(modeStore), guard(guard),
      clock(clock), policy(std::move(policy)) {}

std::string ConnectionOrchestrator::validate(const ConnectRequest& request) {
    if (request.ssid.empty() || request.ssid.size() > MAX_SSID_LENGTH) {
        return "SSID must be 1-32 characters";
    }
    if (request.credential.size() > MAX_PASSWORD_LENGTH) {
        return "Password must be at most 63 characters";
    }
    return "";
}

ConnectionResult ConnectionOrchestrator::connect(const ConnectRequest& request) {
    std::string invalid = validate(request);
    if (!invalid.empty()) {
        return rejected(ErrorCode::InvalidRequest, invalid);
    }

    SingleFlight::Ticket ticket = guard.tryAcquire("connect to " + request.ssid);
    if (!ticket) {
        AttemptInProgressError busy;
        return rejected(busy.code(), busy.what());
    }
    return connectHeld(request, ticket);
}

ConnectionResult ConnectionOrchestrator::connectHeld(const ConnectRequest& request,
                                                     const SingleFlight::Ticket& ticket) {
    if (!ticket) {
        AttemptInProgressError busy;
        return rejected(busy.code(), busy.what());
    }
    std::string invalid = validate(request);
    if (!invalid.empty()) {
        return rejected(ErrorCode::InvalidRequest, invalid);
    }

    Logger::getInstance().info("Attempting to connect to ", request.ssid);
    Snapshot snapshot = takeSnapshot(request);

    try {
        return runAttempts(request, snapshot);
    } catch (const AllAttemptsFailedError& e) {
        Logger::getInstance().error(e.what());
        rollback(snapshot, request.ssid);

        ConnectionResult result = rejected(e.code(), e.what());
        result.attempts = static_cast<int>(policy.delays.size());
        return result;
    }
}

ConnectionOrchestrator::Snapshot ConnectionOrchestrator::takeSnapshot(const ConnectRequest& request) {
    Snapshot snapshot;
    snapshot.hotspot = modeStore.isHotspotMarked();

    try {
        for (const auto& profile : gateway.listProfiles()) {
            snapshot.profileIds.insert(profile.id);
            if (profile.isCurrent) {
                snapshot.activeProfileId = profile.id;
            }
            if (profile.ssid == request.ssid && !request.credential.empty()) {
                recordCredential(profile.id, snapshot);
            }
        }
    } catch (const GatewayError& e) {
        Logger::getInstance().warning("Could not record saved networks before connecting: ", e.what());
    }

    Logger::getInstance().debug("Pre-attempt state: hotspot=", snapshot.hotspot,
                                ", active profile=", snapshot.activeProfileId.value_or("none"));
    return snapshot;
}

void ConnectionOrchestrator::recordCredential(const std::string& profileId, Snapshot& snapshot) {
    try {
        snapshot.credentials[profileId] = gateway.readCredential(profileId);
    } catch (const GatewayError& e) {
        // The attempt still runs; a failure then leaves the new secret in place
        Logger::getInstance().warning("Could not record credentials of profile ", profileId,
                                      ": ", e.what());
    }
}

ConnectionResult ConnectionOrchestrator::runAttempts(const ConnectRequest& request,
                                                     const Snapshot& snapshot) {
    const int maxAttempts = static_cast<int>(policy.delays.size());
    bool authRejected = false;
    bool allNotFound = true;

    for (int i = 0; i < maxAttempts; ++i) {
        ConnectionAttempt attempt;
        attempt.targetSsid = request.ssid;
        attempt.attemptNumber = i + 1;

        if (policy.delays[i].count() > 0) {
            Logger::getInstance().info("Waiting ", policy.delays[i].count(), "s before retry...");
            clock.sleepFor(policy.delays[i]);
        }

        Logger::getInstance().info("Connection attempt ", attempt.attemptNumber, "/", maxAttempts,
                                   " to ", request.ssid);
        attempt.startedAt = clock.now();
        attempt.deadline = attempt.startedAt + policy.attemptTimeout;

        try {
            runAttempt(request, attempt);
        } catch (const ConnectionTimeoutError& e) {
            attempt.outcome = ConnectionAttempt::Outcome::Timeout;
            Logger::getInstance().warning("Attempt ", attempt.attemptNumber, " failed: ", e.what());
        }

        if (attempt.outcome == ConnectionAttempt::Outcome::Success) {
            Logger::getInstance().info("Successfully connected on attempt ", attempt.attemptNumber);
            return commit(snapshot, attempt);
        }

        if (attempt.gatewayOutcome == ConnectOutcome::AUTH_REJECTED) {
            authRejected = true;
        }
        if (attempt.gatewayOutcome != ConnectOutcome::NOT_FOUND) {
            allNotFound = false;
        }
    }

    std::string reason;
    if (authRejected) {
        reason = "incorrect password";
    } else if (allNotFound) {
        reason = "network not found";
    } else {
        reason = "connection timeout - network may be out of range or password incorrect";
    }
    throw AllAttemptsFailedError("Failed to connect to '" + request.ssid + "' after " +
                                 std::to_string(maxAttempts) + " attempts: " + reason);
}

void ConnectionOrchestrator::runAttempt(const ConnectRequest& request, ConnectionAttempt& attempt) {
    ConnectResponse response;
    try {
        response = gateway.connect(request.ssid, request.credential);
    } catch (const GatewayError& e) {
        response = {ConnectOutcome::FAILED, e.what()};
    }
    attempt.gatewayOutcome = response.outcome;

    if (response.outcome != ConnectOutcome::ACCEPTED) {
        attempt.outcome = ConnectionAttempt::Outcome::Failed;
        Logger::getInstance().warning("Attempt ", attempt.attemptNumber, " failed: ", response.message);
        return;
    }

    pollUntilConnected(attempt);
}

void ConnectionOrchestrator::pollUntilConnected(ConnectionAttempt& attempt) {
    Logger::getInstance().info("Waiting for connection to ", attempt.targetSsid,
                               " (timeout: ", policy.attemptTimeout.count(), "s)");

    while (true) {
        try {
            GatewayStatus status = gateway.status();
            if (status.isConnectedTo(attempt.targetSsid)) {
                attempt.outcome = ConnectionAttempt::Outcome::Success;
                attempt.ip = status.ip;
                return;
            }
            if (status.state == LinkState::NEED_AUTH) {
                attempt.outcome = ConnectionAttempt::Outcome::Failed;
                attempt.gatewayOutcome = ConnectOutcome::AUTH_REJECTED;
                Logger::getInstance().warning("Attempt ", attempt.attemptNumber,
                                              " failed: credentials rejected by ", attempt.targetSsid);
                return;
            }
        } catch (const GatewayError& e) {
            Logger::getInstance().error("Error checking connection status: ", e.what());
        }

        if (clock.now() >= attempt.deadline) {
            throw ConnectionTimeoutError(attempt.targetSsid);
        }
        clock.sleepFor(policy.pollInterval);
    }
}

ConnectionResult ConnectionOrchestrator::commit(const Snapshot& snapshot,
                                                const ConnectionAttempt& attempt) {
    ConnectionResult result;
    result.success = true;
    result.ip = attempt.ip;
    result.attempts = attempt.attemptNumber;
    result.message = "Connected to '" + attempt.targetSsid + "' successfully";
    if (attempt.ip) {
        result.message += " (" + *attempt.ip + ")";
    }

    if (snapshot.hotspot) {
        try {
            configurator.activateClient();
        } catch (const WifiError& e) {
            Logger::getInstance().error("Connected, but leaving hotspot mode failed: ", e.what());
            result.message += ", but leaving hotspot mode failed: " + std::string(e.what());
        }
    }
    return result;
}

void ConnectionOrchestrator::rollback(const Snapshot& snapshot, const std::string& ssid) {
    Logger::getInstance().info("Restoring state from before the connection attempt");

    try {
        for (const auto& profile : gateway.listProfiles()) {
            if (profile.ssid == ssid && snapshot.profileIds.count(profile.id) == 0) {
                gateway.deleteProfile(profile.id);
            }
        }
    } catch (const GatewayError& e) {
        Logger::getInstance().warning("Could not remove profile left by failed attempt: ", e.what());
    }

    restoreCredentials(snapshot);

    if (snapshot.hotspot) {
        fallBackToHotspot();
        return;
    }

    if (snapshot.activeProfileId) {
        try {
            gateway.activateProfile(*snapshot.activeProfileId);
            Logger::getInstance().info("Restored original WiFi connection");
            return;
        } catch (const GatewayError& e) {
            Logger::getInstance().error("Failed to restore original connection: ", e.what());
        }
    }

    // Neither a client link nor a hotspot: keep the device reachable
    fallBackToHotspot();
}

void ConnectionOrchestrator::restoreCredentials(const Snapshot& snapshot) {
    for (const auto& entry : snapshot.credentials) {
        try {
            gateway.restoreCredential(entry.first, entry.second);
            Logger::getInstance().info("Restored saved credentials of profile ", entry.first);
        } catch (const GatewayError& e) {
            Logger::getInstance().error("Failed to restore credentials of profile ", entry.first,
                                        ": ", e.what());
        }
    }
}

void ConnectionOrchestrator::fallBackToHotspot() {
    try {
        configurator.activateHotspot();
    } catch (const WifiError& e) {
        Logger::getInstance().critical("Hotspot could not be restored: ", e.what());
    }
}

} // namespace wifiprov
