#include "wifi_saved_networks.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"

namespace wifiprov {

SavedNetworkStore::SavedNetworkStore(NetworkGateway& gateway) : gateway(gateway) {}

std::vector<NetworkProfile> SavedNetworkStore::list() {
    auto profiles = gateway.listProfiles();

    std::string current = "none";
    for (const auto& profile : profiles) {
        if (profile.isCurrent) {
            current = profile.ssid;
        }
    }
    Logger::getInstance().info("Found ", profiles.size(), " saved networks (current: ", current, ")");
    return profiles;
}

bool SavedNetworkStore::forget(const std::string& id) {
    for (const auto& profile : gateway.listProfiles()) {
        if (profile.id != id) {
            continue;
        }
        // Never delete the only path back to the device
        if (profile.isCurrent) {
            throw CannotForgetActiveNetworkError(profile.ssid);
        }
        gateway.deleteProfile(id);
        Logger::getInstance().info("Successfully removed network: ", profile.ssid);
        return true;
    }

    Logger::getInstance().error("Network ID ", id, " not found");
    return false;
}

} // namespace wifiprov
