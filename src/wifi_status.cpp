#include "wifi_status.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"

namespace wifiprov {

StatusReporter::StatusReporter(NetworkGateway& gateway, const ModeStore& modeStore,
                               HotspotConfig hotspot)
    : gateway(gateway), modeStore(modeStore), hotspot(std::move(hotspot)) {}

DeviceMode StatusReporter::toDeviceMode(LinkState state) {
    switch (state) {
        case LinkState::CONNECTED:
            return DeviceMode::ClientConnected;
        case LinkState::CONNECTING:
        case LinkState::NEED_AUTH:
            return DeviceMode::ClientConnecting;
        default:
            return DeviceMode::Unknown;
    }
}

SystemStatus StatusReporter::getStatus() {
    SystemStatus status;

    // Local configuration, not a live query: asking the gateway would go
    // through the hotspot's own data plane
    if (modeStore.isHotspotMarked()) {
        status.mode = DeviceMode::Hotspot;
        status.ssid = hotspot.ssid;
        status.ip = hotspot.ipAddress;
        return status;
    }

    try {
        GatewayStatus live = gateway.status();
        status.mode = toDeviceMode(live.state);
        Logger::getInstance().debug("Interface ", gateway.interfaceName(), " is ", toString(live.state));
        if (status.mode != DeviceMode::Unknown) {
            status.ssid = live.ssid;
            status.ip = live.ip;
            status.signal = live.signal;
        }
    } catch (const GatewayError& e) {
        Logger::getInstance().error("Error getting WiFi status: ", e.what());
        status.mode = DeviceMode::Unknown;
    }
    return status;
}

} // namespace wifiprov
