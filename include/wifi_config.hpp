#pragma once

#include "wifi_logger.hpp"
#include "wifi_types.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace wifiprov {

// Process configuration, read once at startup and immutable afterwards.
struct AppConfig {
    std::string interfaceName = "wlan0";
    std::string hostModeFile = "/etc/raspiwifi/host_mode";
    std::chrono::seconds bootTimeout{5};
    bool fallbackEnabled = true;

    HotspotConfig hotspot{"Radio-Setup", "Configure123!", "192.168.4.1",
                          "192.168.4.2,192.168.4.20", 6};
    std::string hotspotConnectionName = "Hotspot";
    std::string hotspotDhcpConf = "/etc/NetworkManager/dnsmasq-shared.d/wifiprov.conf";

    std::chrono::seconds commandTimeout{10};
    LogLevel logLevel = LogLevel::INFO;

    using EnvLookup = std::function<const char*(const char*)>;

    // Throws WifiError(InvalidRequest) naming the offending variable
    static AppConfig fromEnvironment(const EnvLookup& lookup);
    static AppConfig fromEnvironment();

    void validate() const;
};

bool isValidIpv4(const std::string& address);

} // namespace wifiprov
