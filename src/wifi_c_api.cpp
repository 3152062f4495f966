#include "wifi_c_api.h"
#include "wifi_api.hpp"
#include "wifi_config.hpp"
#include "wifi_logger.hpp"
#include "wifi_manager.hpp"
#include <cstring>
#include <string>

struct WifiprovManager {
    explicit WifiprovManager(const wifiprov::AppConfig& config) : manager(config), api(manager) {}

    wifiprov::WifiManager manager;
    wifiprov::WifiApi api;
};

// Helper function to hand a std::string to C callers
static char* copy_string(const std::string& value) {
    char* result = new char[value.size() + 1];
    std::memcpy(result, value.c_str(), value.size() + 1);
    return result;
}

static WifiprovMode convert_mode(wifiprov::DeviceMode mode) {
    switch (mode) {
        case wifiprov::DeviceMode::Hotspot:
            return WIFIPROV_MODE_HOTSPOT;
        case wifiprov::DeviceMode::ClientConnecting:
            return WIFIPROV_MODE_CLIENT_CONNECTING;
        case wifiprov::DeviceMode::ClientConnected:
            return WIFIPROV_MODE_CLIENT_CONNECTED;
        case wifiprov::DeviceMode::Unknown:
        default:
            return WIFIPROV_MODE_UNKNOWN;
    }
}

extern "C" {

WifiprovManager* wifiprov_manager_new(void) {
    try {
        wifiprov::AppConfig config = wifiprov::AppConfig::fromEnvironment();
        config.validate();
        wifiprov::Logger::getInstance().setLogLevel(config.logLevel);
        return new WifiprovManager(config);
    } catch (const std::exception& e) {
        wifiprov::Logger::getInstance().error("Failed to create WifiManager: ", e.what());
        return nullptr;
    }
}

void wifiprov_manager_delete(WifiprovManager* manager) {
    delete manager;
}

WifiprovMode wifiprov_manager_boot(WifiprovManager* manager) {
    if (!manager) {
        return WIFIPROV_MODE_UNKNOWN;
    }

    try {
        return convert_mode(manager->manager.boot());
    } catch (const std::exception& e) {
        wifiprov::Logger::getInstance().error("Boot mode selection failed: ", e.what());
        return WIFIPROV_MODE_UNKNOWN;
    }
}

char* wifiprov_handle_request(WifiprovManager* manager, const char* method, const char* path,
                              const char* body, int* http_status) {
    if (!manager || !method || !path) {
        return nullptr;
    }

    try {
        wifiprov::ApiResponse response = manager->api.dispatch(method, path, body ? body : "");
        if (http_status) {
            *http_status = response.httpStatus;
        }
        return copy_string(response.toJson());
    } catch (const std::exception& e) {
        wifiprov::Logger::getInstance().error("Failed to handle ", method, " ", path, ": ", e.what());
        if (http_status) {
            *http_status = 500;
        }
        return copy_string("{\"success\":false,\"message\":\"Internal error\",\"data\":null}");
    }
}

void wifiprov_free_string(char* str) {
    delete[] str;
}

}
