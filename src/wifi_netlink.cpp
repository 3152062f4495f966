#include "wifi_netlink.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include <cstring>
#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <linux/nl80211.h>

namespace wifiprov {

namespace {

InterfaceType toInterfaceType(uint32_t iftype) {
    switch (iftype) {
        case NL80211_IFTYPE_STATION: return InterfaceType::STATION;
        case NL80211_IFTYPE_AP:      return InterfaceType::ACCESS_POINT;
        case NL80211_IFTYPE_MONITOR: return InterfaceType::MONITOR;
        default:                     return InterfaceType::OTHER;
    }
}

int onInterface(struct nl_msg* msg, void* arg) {
    auto* interfaces = static_cast<std::vector<WirelessInterface>*>(arg);
    struct nlattr* tb[NL80211_ATTR_MAX + 1];
    struct genlmsghdr* gnlh = static_cast<genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0), genlmsg_attrlen(gnlh, 0), nullptr);

    if (!tb[NL80211_ATTR_IFNAME] || !tb[NL80211_ATTR_IFINDEX]) {
        return NL_SKIP;
    }

    WirelessInterface iface;
    iface.name = nla_get_string(tb[NL80211_ATTR_IFNAME]);
    iface.index = static_cast<int>(nla_get_u32(tb[NL80211_ATTR_IFINDEX]));
    if (tb[NL80211_ATTR_IFTYPE]) {
        iface.type = toInterfaceType(nla_get_u32(tb[NL80211_ATTR_IFTYPE]));
    }
    interfaces->push_back(iface);
    return NL_SKIP;
}

int onFinish(struct nl_msg*, void* arg) {
    *static_cast<int*>(arg) = 0;
    return NL_SKIP;
}

int onAck(struct nl_msg*, void* arg) {
    *static_cast<int*>(arg) = 0;
    return NL_STOP;
}

int onError(struct sockaddr_nl*, struct nlmsgerr* err, void* arg) {
    *static_cast<int*>(arg) = err->error;
    return NL_STOP;
}

} // namespace

std::optional<WirelessInterface> InterfaceProbe::find(const std::string& ifname) {
    for (const auto& iface : listWireless()) {
        if (iface.name == ifname) {
            return iface;
        }
    }
    return std::nullopt;
}

Nl80211InterfaceProbe::Nl80211InterfaceProbe() {
    if (!connectSocket()) {
        Logger::getInstance().warning("nl80211 not available yet, will retry on first query");
    }
}

Nl80211InterfaceProbe::~Nl80211InterfaceProbe() {
    closeSocket();
}

bool Nl80211InterfaceProbe::connectSocket() {
    if (socket) {
        return true;
    }

    socket = nl_socket_alloc();
    if (!socket) {
        Logger::getInstance().error("Failed to allocate netlink socket");
        return false;
    }

    // Connect to generic netlink
    if (genl_connect(socket) < 0) {
        Logger::getInstance().error("Failed to connect to generic netlink");
        closeSocket();
        return false;
    }

    // Find nl80211 driver ID
    nl80211_id = genl_ctrl_resolve(socket, "nl80211");
    if (nl80211_id < 0) {
        Logger::getInstance().error("Failed to find nl80211 netlink family");
        closeSocket();
        return false;
    }

    return true;
}

void Nl80211InterfaceProbe::closeSocket() {
    if (socket) {
        nl_socket_free(socket);
        socket = nullptr;
    }
    nl80211_id = -1;
}

std::vector<WirelessInterface> Nl80211InterfaceProbe::listWireless() {
    std::vector<WirelessInterface> interfaces;
    if (!connectSocket()) {
        throw GatewayError("Wireless subsystem (nl80211) not available");
    }

    struct nl_msg* msg = nlmsg_alloc();
    if (!msg) {
        throw GatewayError("Failed to allocate netlink message");
    }

    genlmsg_put(msg, 0, 0, nl80211_id, 0, NLM_F_DUMP, NL80211_CMD_GET_INTERFACE, 0);

    struct nl_cb* cb = nl_cb_alloc(NL_CB_DEFAULT);
    if (!cb) {
        nlmsg_free(msg);
        throw GatewayError("Failed to allocate netlink callback");
    }

    int status = 1;
    nl_cb_set(cb, NL_CB_VALID, NL_CB_CUSTOM, onInterface, &interfaces);
    nl_cb_set(cb, NL_CB_FINISH, NL_CB_CUSTOM, onFinish, &status);
    nl_cb_set(cb, NL_CB_ACK, NL_CB_CUSTOM, onAck, &status);
    nl_cb_err(cb, NL_CB_CUSTOM, onError, &status);

    int ret = nl_send_auto(socket, msg);
    nlmsg_free(msg);
    if (ret < 0) {
        nl_cb_put(cb);
        closeSocket();
        throw GatewayError("Failed to send interface dump request");
    }

    while (status > 0) {
        ret = nl_recvmsgs(socket, cb);
        if (ret < 0) {
            status = ret;
            break;
        }
    }
    nl_cb_put(cb);

    if (status < 0) {
        Logger::getInstance().error("nl80211 interface dump failed: ", nl_geterror(status));
        closeSocket();
        throw GatewayError("Failed to enumerate wireless interfaces");
    }

    Logger::getInstance().debug("nl80211 reports ", interfaces.size(), " wireless interfaces");
    return interfaces;
}

std::optional<std::string> Nl80211InterfaceProbe::ipv4Address(const std::string& ifname) const {
    int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        return std::nullopt;
    }

    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    strncpy(ifr.ifr_name, ifname.c_str(), IFNAMSIZ - 1);
    ifr.ifr_addr.sa_family = AF_INET;

    if (ioctl(sock, SIOCGIFADDR, &ifr) < 0) {
        close(sock);
        return std::nullopt;
    }

    close(sock);
    auto* sin = reinterpret_cast<struct sockaddr_in*>(&ifr.ifr_addr);
    if (sin->sin_addr.s_addr == 0) {
        return std::nullopt;
    }

    char buffer[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer))) {
        return std::nullopt;
    }
    return std::string(buffer);
}

} // namespace wifiprov
