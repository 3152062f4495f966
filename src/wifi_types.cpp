#include "wifi_types.hpp"

namespace wifiprov {

std::string NetworkInfo::getSecurityString() const {
    switch (security) {
        case SecurityType::NONE:   return "Open";
        case SecurityType::WEP:    return "WEP";
        case SecurityType::WPA:    return "WPA";
        case SecurityType::WPA2:   return "WPA2";
        case SecurityType::WPA3:   return "WPA3";
        default:                   return "Unknown";
    }
}

std::string NetworkInfo::getBandString() const {
    if (frequency >= 2400 && frequency <= 2500) {
        return "2.4GHz";
    } else if (frequency >= 5000 && frequency <= 6000) {
        return "5GHz";
    }
    return "";
}

const char* toString(DeviceMode mode) {
    switch (mode) {
        case DeviceMode::Hotspot:          return "hotspot";
        case DeviceMode::ClientConnecting: return "client_connecting";
        case DeviceMode::ClientConnected:  return "client_connected";
        default:                           return "unknown";
    }
}

const char* toString(LinkState state) {
    switch (state) {
        case LinkState::CONNECTED:    return "connected";
        case LinkState::CONNECTING:   return "connecting";
        case LinkState::NEED_AUTH:    return "need-auth";
        case LinkState::DISCONNECTED: return "disconnected";
        case LinkState::UNAVAILABLE:  return "unavailable";
        default:                      return "failed";
    }
}

int frequencyToChannel(int frequency) {
    if (frequency == 2484) {
        return 14;
    } else if (frequency >= 2412 && frequency < 2484) {
        return (frequency - 2412) / 5 + 1;
    } else if (frequency >= 5170 && frequency <= 5825) {
        return (frequency - 5170) / 5 + 34;
    } else {
        return 0;
    }
}

} // namespace wifiprov
