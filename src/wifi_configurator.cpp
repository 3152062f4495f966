#include "wifi_configurator.hpp"
#include "wifi_errors.hpp"
#include "wifi_fs.hpp"
#include "wifi_logger.hpp"

namespace wifiprov {

InterfaceConfigurator::InterfaceConfigurator(NetworkGateway& gateway, ModeStore& modeStore,
                                             Clock& clock, HotspotConfig hotspot, Options options)
    : gateway(gateway), modeStore(modeStore), clock(clock),
      hotspot(std::move(hotspot)), options(std::move(options)) {}

void InterfaceConfigurator::activateHotspot() {
    Logger::getInstance().info("Activating HOTSPOT mode on ", gateway.interfaceName());

    modeStore.markHotspot();

    if (gateway.isHotspotActive()) {
        Logger::getInstance().info("Hotspot ", hotspot.ssid, " already broadcasting, verified");
        return;
    }

    writeDhcpRange();

    try {
        gateway.disconnect();
    } catch (const GatewayError& e) {
        // Starting the access point takes the radio over regardless
        Logger::getInstance().warning("Could not disconnect client session: ", e.what());
    }

    try {
        gateway.activateHotspot(hotspot);
    } catch (const GatewayError& e) {
        reportNotBroadcasting();
        throw HotspotActivationError(std::string("Hotspot failed to start: ") + e.what());
    }

    if (!waitForBroadcast()) {
        reportNotBroadcasting();
        throw HotspotActivationError("Hotspot " + hotspot.ssid + " is not broadcasting after start");
    }

    Logger::getInstance().info("HOTSPOT mode active: SSID ", hotspot.ssid,
                               ", address ", hotspot.ipAddress);
}

void InterfaceConfigurator::activateClient() {
    Logger::getInstance().info("Activating CLIENT mode on ", gateway.interfaceName());

    modeStore.clearHotspot();

    if (gateway.isHotspotActive()) {
        gateway.deactivateHotspot();
        Logger::getInstance().info("Stopped hotspot ", hotspot.ssid);
    }
    gateway.releaseToHost();
}

void InterfaceConfigurator::writeDhcpRange() {
    if (options.dhcpConfPath.empty()) {
        return;
    }

    std::string contents = "dhcp-range=" + hotspot.dhcpRange + ",255.255.255.0,24h\n";
    if (fs_util::readFile(options.dhcpConfPath) == contents) {
        return;
    }
    fs_util::replaceFileWithBackup(options.dhcpConfPath, contents);
    Logger::getInstance().info("Wrote DHCP range ", hotspot.dhcpRange, " to ", options.dhcpConfPath);
}

void InterfaceConfigurator::reportNotBroadcasting() {
    Logger::getInstance().critical("Hotspot mode is marked but ", hotspot.ssid,
                                   " is not broadcasting; status reports hotspot until the next "
                                   "successful activation or reboot");
}

bool InterfaceConfigurator::waitForBroadcast() {
    auto deadline = clock.now() + options.verifyTimeout;
    while (true) {
        if (gateway.isHotspotActive()) {
            return true;
        }
        if (clock.now() >= deadline) {
            return false;
        }
        clock.sleepFor(options.verifyInterval);
    }
}

} // namespace wifiprov
