#include "wifi_config.hpp"
#include "wifi_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <arpa/inet.h>

namespace wifiprov {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

int parseInt(const char* name, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw WifiError(ErrorCode::InvalidRequest,
                        std::string(name) + " must be a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw WifiError(ErrorCode::InvalidRequest,
                        std::string(name) + " must be a number, got '" + value + "'");
    }
    return result;
}

bool parseBool(const char* name, const std::string& value) {
    std::string v = lowercase(value);
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw WifiError(ErrorCode::InvalidRequest,
                    std::string(name) + " must be true or false, got '" + value + "'");
}

} // namespace

bool isValidIpv4(const std::string& address) {
    in_addr parsed{};
    return ::inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

AppConfig AppConfig::fromEnvironment() {
    return fromEnvironment([](const char* name) { return std::getenv(name); });
}

AppConfig AppConfig::fromEnvironment(const EnvLookup& lookup) {
    AppConfig config;

    auto read = [&lookup](const char* name, std::string& target) {
        const char* value = lookup(name);
        if (value && *value) {
            target = value;
            return true;
        }
        return false;
    };

    std::string value;
    read("WIFI_INTERFACE", config.interfaceName);
    read("HOST_MODE_FILE", config.hostModeFile);
    if (read("WIFI_TIMEOUT", value)) {
        config.bootTimeout = std::chrono::seconds(parseInt("WIFI_TIMEOUT", value));
    }
    if (read("HOTSPOT_ENABLE_FALLBACK", value)) {
        config.fallbackEnabled = parseBool("HOTSPOT_ENABLE_FALLBACK", value);
    }

    read("HOTSPOT_SSID", config.hotspot.ssid);
    // An explicitly empty password is meaningful (open hotspot)
    if (const char* password = lookup("HOTSPOT_PASSWORD")) {
        config.hotspot.password = password;
    }
    read("HOTSPOT_IP", config.hotspot.ipAddress);
    read("HOTSPOT_RANGE", config.hotspot.dhcpRange);
    if (read("HOTSPOT_CHANNEL", value)) {
        config.hotspot.channel = parseInt("HOTSPOT_CHANNEL", value);
    }
    read("HOTSPOT_CONNECTION_NAME", config.hotspotConnectionName);
    read("HOTSPOT_DHCP_CONF", config.hotspotDhcpConf);

    if (read("WIFIPROV_COMMAND_TIMEOUT", value)) {
        config.commandTimeout = std::chrono::seconds(parseInt("WIFIPROV_COMMAND_TIMEOUT", value));
    }
    if (read("WIFIPROV_LOG_LEVEL", value)) {
        config.logLevel = Logger::parseLevel(lowercase(value));
    }

    config.validate();
    return config;
}

void AppConfig::validate() const {
    auto fail = [](const std::string& message) {
        throw WifiError(ErrorCode::InvalidRequest, message);
    };

    if (interfaceName.empty() || interfaceName.size() > 15) {
        fail("WIFI_INTERFACE must be 1-15 characters");
    }
    for (char c : interfaceName) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            fail("WIFI_INTERFACE contains invalid character '" + std::string(1, c) + "'");
        }
    }
    if (hostModeFile.empty()) {
        fail("HOST_MODE_FILE must not be empty");
    }
    if (bootTimeout.count() < 0) {
        fail("WIFI_TIMEOUT must not be negative");
    }
    if (hotspot.ssid.empty() || hotspot.ssid.size() > 32) {
        fail("HOTSPOT_SSID must be 1-32 characters");
    }
    if (!hotspot.password.empty() && (hotspot.password.size() < 8 || hotspot.password.size() > 63)) {
        fail("HOTSPOT_PASSWORD must be empty or 8-63 characters");
    }
    if (!isValidIpv4(hotspot.ipAddress)) {
        fail("HOTSPOT_IP is not a valid IPv4 address: " + hotspot.ipAddress);
    }
    auto comma = hotspot.dhcpRange.find(',');
    if (comma == std::string::npos ||
        !isValidIpv4(hotspot.dhcpRange.substr(0, comma)) ||
        !isValidIpv4(hotspot.dhcpRange.substr(comma + 1))) {
        fail("HOTSPOT_RANGE must be 'first,last', got '" + hotspot.dhcpRange + "'");
    }
    if (hotspot.channel < 1 || hotspot.channel > 13) {
        fail("HOTSPOT_CHANNEL must be between 1 and 13");
    }
    if (hotspotConnectionName.empty()) {
        fail("HOTSPOT_CONNECTION_NAME must not be empty");
    }
    if (commandTimeout.count() <= 0) {
        fail("WIFIPROV_COMMAND_TIMEOUT must be positive");
    }
}

} // namespace wifiprov
