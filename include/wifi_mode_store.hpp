#pragma once

#include <string>

namespace wifiprov {

/**
 * Durable "hotspot mode is intentional" flag.
 *
 * The flag is the mere existence of a marker file, so it survives process
 * restarts and reboots. It is the single source of truth for the intended
 * mode; every other piece of state is queried live from the gateway.
 */
class ModeStore {
public:
    explicit ModeStore(std::string markerPath);

    bool isHotspotMarked() const;

    // Both are idempotent. Throw ConfigWriteError if the file system refuses.
    void markHotspot();
    void clearHotspot();

    const std::string& path() const { return markerPath; }

private:
    std::string markerPath;
};

} // namespace wifiprov
