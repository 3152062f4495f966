#pragma once

#include "wifi_types.hpp"
#include <string>
#include <vector>

namespace wifiprov {

enum class ConnectOutcome {
    ACCEPTED,       // request handed to the host stack, link may still be negotiating
    AUTH_REJECTED,  // explicit credential rejection
    NOT_FOUND,      // no network with that SSID in range
    FAILED
};

struct ConnectResponse {
    ConnectOutcome outcome = ConnectOutcome::FAILED;
    std::string message;
};

// Security settings of a saved profile
struct ProfileCredential {
    std::string keyManagement;  // empty for open networks
    std::string secret;
};

// Abstraction over the host's network-management tool for one wireless
// interface. It is the only place where subprocesses are started and their
// output parsed. Every call blocks for at most one command timeout; failures
// are raised as GatewayError with a short message.
class NetworkGateway {
public:
    virtual ~NetworkGateway() = default;

    virtual const std::string& interfaceName() const = 0;

    virtual std::vector<std::string> listInterfaces() = 0;
    virtual std::vector<NetworkInfo> scan() = 0;
    virtual GatewayStatus status() = 0;

    // Submits the credential and asks the host stack to apply it. Success
    // here does not mean the link is up; callers poll status().
    virtual ConnectResponse connect(const std::string& ssid, const std::string& credential) = 0;
    virtual void disconnect() = 0;

    virtual std::vector<NetworkProfile> listProfiles() = 0;
    virtual void deleteProfile(const std::string& id) = 0;
    virtual void activateProfile(const std::string& id) = 0;

    // connect() may overwrite the secret of an existing profile for the SSID;
    // these let a failed attempt put the previous one back
    virtual ProfileCredential readCredential(const std::string& id) = 0;
    virtual void restoreCredential(const std::string& id, const ProfileCredential& credential) = 0;

    // Hotspot operations
    virtual void activateHotspot(const HotspotConfig& config) = 0;
    virtual void deactivateHotspot() = 0;
    virtual bool isHotspotActive() = 0;

    // Lets the host stack manage the interface on its own again
    virtual void releaseToHost() = 0;
};

} // namespace wifiprov
