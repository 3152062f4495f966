#include "wifi_mode_store.hpp"
#include "wifi_errors.hpp"
#include "wifi_fs.hpp"
#include "wifi_logger.hpp"
#include <filesystem>

namespace wifiprov {

ModeStore::ModeStore(std::string markerPath) : markerPath(std::move(markerPath)) {}

bool ModeStore::isHotspotMarked() const {
    return fs_util::fileExists(markerPath);
}

void ModeStore::markHotspot() {
    if (isHotspotMarked()) {
        return;
    }
    fs_util::writeFileAtomically(markerPath, "");
    Logger::getInstance().info("Created host mode marker: ", markerPath);
}

void ModeStore::clearHotspot() {
    std::error_code ec;
    if (!std::filesystem::remove(markerPath, ec)) {
        if (ec) {
            throw ConfigWriteError("Failed to remove " + markerPath + ": " + ec.message());
        }
        return;
    }
    Logger::getInstance().info("Removed host mode marker: ", markerPath);
}

} // namespace wifiprov
