#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>
#include "wifi_clock.hpp"
#include "wifi_config.hpp"
#include "wifi_gateway.hpp"
#include "wifi_orchestrator.hpp"
#include "wifi_types.hpp"

namespace wifiprov {

class WifiManager {
public:
    // Drives the real interface through nmcli and nl80211
    explicit WifiManager(const AppConfig& config);

    // Uses the given gateway and clock; both must outlive the manager
    WifiManager(const AppConfig& config, NetworkGateway& gateway, Clock& clock);

    ~WifiManager();

    WifiManager(const WifiManager&) = delete;
    WifiManager& operator=(const WifiManager&) = delete;

    /**
     * Selects the boot mode. Call once at process start.
     *
     * @return the mode the device ended up in, Unknown if the hotspot failed
     */
    DeviceMode boot();

    // Never blocks on a running connection attempt
    SystemStatus getStatus();

    std::vector<NetworkInfo> scan();

    // Blocks until the attempt sequence finishes (up to ~165 s)
    ConnectionResult connect(const std::string& ssid, const std::string& password = "");

    /**
     * Starts a connection attempt on a worker thread.
     *
     * The interface guard is taken before returning, so a second call made
     * while the first runs yields a ready future with AttemptInProgress.
     */
    std::future<ConnectionResult> connectAsync(const std::string& ssid,
                                               const std::string& password = "");

    std::vector<NetworkProfile> listSaved();

    /**
     * Forget a saved network.
     *
     * @return false if no saved network has this id
     * @throws CannotForgetActiveNetworkError for the network in use
     * @throws AttemptInProgressError while the interface is being reconfigured
     */
    bool forget(const std::string& id);

    /**
     * Switch to hotspot mode on request, marking it durable.
     *
     * @throws AttemptInProgressError while the interface is being reconfigured
     * @throws HotspotActivationError if the hotspot does not come up
     */
    void enableHotspotMode();

    bool busy() const;
    const AppConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl;
};

} // namespace wifiprov
