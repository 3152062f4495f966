#pragma once

#include "wifi_gateway.hpp"
#include "wifi_mode_store.hpp"
#include "wifi_types.hpp"

namespace wifiprov {

// Read-only snapshot of the device's connectivity, recomputed per query
class StatusReporter {
public:
    StatusReporter(NetworkGateway& gateway, const ModeStore& modeStore, HotspotConfig hotspot);

    // Never throws; an unreachable gateway reports DeviceMode::Unknown
    SystemStatus getStatus();

    static DeviceMode toDeviceMode(LinkState state);

private:
    NetworkGateway& gateway;
    const ModeStore& modeStore;
    HotspotConfig hotspot;
};

} // namespace wifiprov
