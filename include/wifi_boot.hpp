#pragma once

#include "wifi_clock.hpp"
#include "wifi_configurator.hpp"
#include "wifi_gateway.hpp"
#include "wifi_mode_store.hpp"
#include "wifi_single_flight.hpp"
#include "wifi_status.hpp"
#include "wifi_types.hpp"
#include <chrono>

namespace wifiprov {

struct BootOptions {
    bool fallbackEnabled = true;
    std::chrono::seconds interfaceWait{10};
    std::chrono::seconds connectionWait{5};
    std::chrono::seconds pollInterval{1};
};

/**
 * Chooses hotspot or client mode once at process start.
 *
 * An explicit hotspot marker wins over saved credentials. Otherwise the
 * selector waits briefly for the host stack to join a saved network and
 * starts the hotspot if it does not. Failures are logged, never thrown, so
 * the process keeps serving status.
 */
class BootModeSelector {
public:
    BootModeSelector(NetworkGateway& gateway, ModeStore& modeStore,
                     InterfaceConfigurator& configurator, StatusReporter& reporter,
                     SingleFlight& guard, Clock& clock, BootOptions options);

    DeviceMode run();

private:
    bool waitForInterface();
    bool hasSavedNetworks();
    bool waitForConnection();
    DeviceMode startHotspot();

    NetworkGateway& gateway;
    ModeStore& modeStore;
    InterfaceConfigurator& configurator;
    StatusReporter& reporter;
    SingleFlight& guard;
    Clock& clock;
    BootOptions options;
};

} // namespace wifiprov
