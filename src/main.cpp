#include "wifi_api.hpp"
#include "wifi_config.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include "wifi_manager.hpp"
#include <cJSON.h>
#include <iostream>
#include <string>
#include <vector>

using namespace wifiprov;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [command]\n"
              << "\n"
              << "Commands:\n"
              << "  boot                     select hotspot or client mode (default)\n"
              << "  status                   show the current mode and connection\n"
              << "  scan                     list nearby networks\n"
              << "  connect SSID [PASSWORD]  join a network, falling back on failure\n"
              << "  saved                    list saved networks\n"
              << "  forget ID                remove a saved network\n"
              << "  hotspot                  switch to hotspot mode\n";
}

// Builds {"ssid": ..., "password": ...} the way an HTTP client would send it
std::string connectBody(const std::string& ssid, const std::string& password) {
    JsonPtr body(cJSON_CreateObject());
    cJSON_AddStringToObject(body.get(), "ssid", ssid.c_str());
    cJSON_AddStringToObject(body.get(), "password", password.c_str());
    char* printed = cJSON_PrintUnformatted(body.get());
    std::string result = printed ? printed : "{}";
    cJSON_free(printed);
    return result;
}

int report(const ApiResponse& response) {
    std::cout << response.toJson() << std::endl;
    return response.success ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string command = args.empty() ? "boot" : args[0];

    if (command == "-h" || command == "--help" || command == "help") {
        printUsage(argv[0]);
        return 0;
    }

    AppConfig config;
    try {
        config = AppConfig::fromEnvironment();
        config.validate();
    } catch (const WifiError& e) {
        Logger::getInstance().critical("Invalid configuration: ", e.what());
        return 2;
    }
    Logger::getInstance().setLogLevel(config.logLevel);

    try {
        WifiManager manager(config);
        WifiApi api(manager);

        if (command == "boot") {
            DeviceMode mode = manager.boot();
            Logger::getInstance().info("Boot finished in mode ", toString(mode));
            ApiResponse response = api.getStatus();
            std::cout << response.toJson() << std::endl;
            return mode == DeviceMode::Unknown ? 1 : 0;
        }
        if (command == "status" && args.size() == 1) {
            return report(api.getStatus());
        }
        if (command == "scan" && args.size() == 1) {
            return report(api.scan());
        }
        if (command == "connect" && (args.size() == 2 || args.size() == 3)) {
            return report(api.connect(connectBody(args[1], args.size() == 3 ? args[2] : "")));
        }
        if (command == "saved" && args.size() == 1) {
            return report(api.listSaved());
        }
        if (command == "forget" && args.size() == 2) {
            return report(api.forget(args[1]));
        }
        if (command == "hotspot" && args.size() == 1) {
            return report(api.enableHotspotMode());
        }
    } catch (const std::exception& e) {
        Logger::getInstance().critical("wifiprovd failed: ", e.what());
        return 1;
    }

    printUsage(argv[0]);
    return 2;
}
