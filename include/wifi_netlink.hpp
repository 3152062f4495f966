#pragma once

#include <optional>
#include <string>
#include <vector>

struct nl_sock;

namespace wifiprov {

enum class InterfaceType {
    STATION,
    ACCESS_POINT,
    MONITOR,
    OTHER
};

struct WirelessInterface {
    std::string name;
    int index = -1;
    InterfaceType type = InterfaceType::OTHER;
};

// Kernel-side view of the wireless interfaces, independent of whichever
// user-space tool manages them.
class InterfaceProbe {
public:
    virtual ~InterfaceProbe() = default;

    virtual std::vector<WirelessInterface> listWireless() = 0;
    virtual std::optional<std::string> ipv4Address(const std::string& ifname) const = 0;

    std::optional<WirelessInterface> find(const std::string& ifname);
};

// nl80211 implementation over libnl generic netlink
class Nl80211InterfaceProbe : public InterfaceProbe {
public:
    Nl80211InterfaceProbe();
    ~Nl80211InterfaceProbe() override;

    Nl80211InterfaceProbe(const Nl80211InterfaceProbe&) = delete;
    Nl80211InterfaceProbe& operator=(const Nl80211InterfaceProbe&) = delete;

    // Throws GatewayError if nl80211 cannot be reached
    std::vector<WirelessInterface> listWireless() override;
    std::optional<std::string> ipv4Address(const std::string& ifname) const override;

private:
    bool connectSocket();
    void closeSocket();

    struct nl_sock* socket = nullptr;
    int nl80211_id = -1;
};

} // namespace wifiprov
