#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wifiprov {

enum class SecurityType {
    NONE,
    WEP,
    WPA,
    WPA2,
    WPA3,
    UNKNOWN
};

// Link state of the wireless device as reported by the host network stack
enum class LinkState {
    CONNECTED,
    CONNECTING,
    NEED_AUTH,
    DISCONNECTED,
    UNAVAILABLE,
    FAILED
};

enum class DeviceMode {
    Hotspot,
    ClientConnecting,
    ClientConnected,
    Unknown
};

struct NetworkInfo {
    std::string ssid;
    std::string bssid;
    int signalStrength = 0;     // 0-100 %
    SecurityType security = SecurityType::UNKNOWN;
    int channel = 0;
    int frequency = 0;          // in MHz

    std::string getSecurityString() const;
    std::string getBandString() const;
};

struct GatewayStatus {
    LinkState state = LinkState::DISCONNECTED;
    std::string connection;     // gateway profile name, empty if none
    std::optional<std::string> ssid;
    std::optional<std::string> ip;
    std::optional<int> signal;

    bool isConnectedTo(const std::string& target) const {
        return state == LinkState::CONNECTED && ssid && *ssid == target;
    }
};

struct NetworkProfile {
    std::string id;             // gateway profile UUID
    std::string name;           // gateway profile name
    std::string ssid;
    bool hasCredential = false;
    bool isCurrent = false;
    bool isDisabled = false;
};

struct SystemStatus {
    DeviceMode mode = DeviceMode::Unknown;
    std::optional<std::string> ssid;
    std::optional<std::string> ip;
    std::optional<int> signal;
};

struct HotspotConfig {
    std::string ssid;
    std::string password;
    std::string ipAddress;      // static address, /24
    std::string dhcpRange;      // "first,last"
    int channel = 6;
};

struct ConnectRequest {
    std::string ssid;
    std::string credential;
};

const char* toString(DeviceMode mode);
const char* toString(LinkState state);

int frequencyToChannel(int frequency);

} // namespace wifiprov
