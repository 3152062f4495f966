#pragma once

#include "wifi_clock.hpp"
#include "wifi_gateway.hpp"
#include "wifi_mode_store.hpp"
#include "wifi_types.hpp"
#include <chrono>
#include <string>

namespace wifiprov {

/**
 * Puts the wireless interface into one of its two target configurations.
 *
 * Both operations are idempotent: calling them in the state they produce
 * re-verifies instead of restarting the radio. Callers must hold the
 * interface SingleFlight guard.
 */
class InterfaceConfigurator {
public:
    struct Options {
        std::string dhcpConfPath;
        std::chrono::seconds verifyTimeout{5};
        std::chrono::seconds verifyInterval{1};
    };

    InterfaceConfigurator(NetworkGateway& gateway, ModeStore& modeStore, Clock& clock,
                          HotspotConfig hotspot, Options options);

    /**
     * Marks hotspot mode, stops any client session, applies the static
     * address and DHCP range and starts broadcasting.
     *
     * The marker is written first and stays if broadcasting fails; the next
     * boot then retries the hotspot, and status reports hotspot mode.
     *
     * @throws HotspotActivationError if the hotspot is not running afterwards
     * @throws ConfigWriteError if the marker or DHCP range cannot be written
     */
    void activateHotspot();

    /**
     * Clears the hotspot marker and hands the interface back to the host
     * network stack. Does not pick or join a network.
     *
     * @throws GatewayError if the hotspot cannot be stopped
     */
    void activateClient();

private:
    void writeDhcpRange();
    void reportNotBroadcasting();
    bool waitForBroadcast();

    NetworkGateway& gateway;
    ModeStore& modeStore;
    Clock& clock;
    HotspotConfig hotspot;
    Options options;
};

} // namespace wifiprov
