#include "wifi_boot.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include <algorithm>

namespace wifiprov {

BootModeSelector::BootModeSelector(NetworkGateway& gateway, ModeStore& modeStore,
                                   InterfaceConfigurator& configurator, StatusReporter& reporter,
                                   SingleFlight& guard, Clock& clock, BootOptions options)
    : gateway(gateway), modeStore(modeStore), configurator(configurator), reporter(reporter),
      guard(guard), clock(clock), options(options) {}

DeviceMode BootModeSelector::run() {
    auto& logger = Logger::getInstance();

    if (!options.fallbackEnabled) {
        logger.info("Hotspot fallback disabled - skipping WiFi check");
        return reporter.getStatus().mode;
    }

    auto ticket = guard.tryAcquire("boot mode selection");
    if (!ticket) {
        return DeviceMode::Unknown;
    }

    logger.info("Starting boot WiFi check on ", gateway.interfaceName());

    if (!waitForInterface()) {
        InterfaceNotFoundError error(gateway.interfaceName());
        logger.error(error.what());
        return startHotspot();
    }

    if (modeStore.isHotspotMarked()) {
        logger.info("Hotspot mode marker present - starting hotspot");
        return startHotspot();
    }

    if (!hasSavedNetworks()) {
        logger.info("No saved networks - starting hotspot");
        return startHotspot();
    }

    if (waitForConnection()) {
        logger.info("Connected to a saved network - staying in client mode");
        return DeviceMode::ClientConnected;
    }

    logger.warning("No connection after ", options.connectionWait.count(),
                   "s - starting hotspot");
    return startHotspot();
}

bool BootModeSelector::waitForInterface() {
    const auto deadline = clock.now() + options.interfaceWait;
    const std::string& name = gateway.interfaceName();

    while (true) {
        try {
            auto names = gateway.listInterfaces();
            if (std::find(names.begin(), names.end(), name) != names.end()) {
                return true;
            }
        } catch (const GatewayError& e) {
            Logger::getInstance().debug("Interface listing failed: ", e.what());
        }
        if (clock.now() >= deadline) {
            return false;
        }
        clock.sleepFor(options.pollInterval);
    }
}

bool BootModeSelector::hasSavedNetworks() {
    try {
        return !gateway.listProfiles().empty();
    } catch (const GatewayError& e) {
        // Unknown: let the connection wait decide
        Logger::getInstance().warning("Could not list saved networks: ", e.what());
        return true;
    }
}

bool BootModeSelector::waitForConnection() {
    const auto deadline = clock.now() + options.connectionWait;

    while (true) {
        try {
            if (gateway.status().state == LinkState::CONNECTED) {
                return true;
            }
        } catch (const GatewayError& e) {
            Logger::getInstance().debug("Status query failed: ", e.what());
        }
        if (clock.now() >= deadline) {
            return false;
        }
        clock.sleepFor(options.pollInterval);
    }
}

DeviceMode BootModeSelector::startHotspot() {
    try {
        configurator.activateHotspot();
        return DeviceMode::Hotspot;
    } catch (const HotspotActivationError& e) {
        Logger::getInstance().critical("Hotspot could not be started: ", e.what());
    } catch (const WifiError& e) {
        Logger::getInstance().critical("Hotspot setup failed: ", e.what());
    }
    return DeviceMode::Unknown;
}

} // namespace wifiprov
