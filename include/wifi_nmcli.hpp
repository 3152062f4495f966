#pragma once

#include "wifi_command.hpp"
#include "wifi_gateway.hpp"
#include "wifi_netlink.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace wifiprov {

struct NmcliOptions {
    std::string interfaceName = "wlan0";
    std::string hotspotConnectionName = "Hotspot";
    std::chrono::seconds commandTimeout{10};
};

// NetworkGateway for NetworkManager, driven through nmcli in terse mode
class NmcliGateway : public NetworkGateway {
public:
    NmcliGateway(CommandRunner& runner, InterfaceProbe& probe, NmcliOptions options);

    const std::string& interfaceName() const override { return options.interfaceName; }

    std::vector<std::string> listInterfaces() override;
    std::vector<NetworkInfo> scan() override;
    GatewayStatus status() override;

    ConnectResponse connect(const std::string& ssid, const std::string& credential) override;
    void disconnect() override;

    std::vector<NetworkProfile> listProfiles() override;
    void deleteProfile(const std::string& id) override;
    void activateProfile(const std::string& id) override;
    ProfileCredential readCredential(const std::string& id) override;
    void restoreCredential(const std::string& id, const ProfileCredential& credential) override;

    void activateHotspot(const HotspotConfig& config) override;
    void deactivateHotspot() override;
    bool isHotspotActive() override;

    void releaseToHost() override;

private:
    CommandResult runNmcli(const std::vector<std::string>& args);
    // Throws GatewayError with `failure` as message if nmcli does not succeed
    std::string runNmcliChecked(const std::vector<std::string>& args, const std::string& failure);
    std::string activationWait() const;

    CommandRunner& runner;
    InterfaceProbe& probe;
    NmcliOptions options;
};

namespace nmcli {

struct ConnectionRow {
    std::string name;
    std::string uuid;
    std::string type;
    bool autoconnect = true;
    std::string device;
};

// Splits a terse-mode line on ':' honouring the "\:" and "\\" escapes
std::vector<std::string> splitFields(const std::string& line);

// SSID,BSSID,SIGNAL,SECURITY,FREQ rows; de-duplicated by SSID keeping the
// strongest signal, hidden SSIDs dropped, strongest first
std::vector<NetworkInfo> parseScan(const std::string& output);

// Undoes the terse-mode escaping of a single value
std::string unescape(const std::string& value);

SecurityType parseSecurity(const std::string& security);

// "100 (connected)" -> CONNECTED
LinkState parseDeviceState(const std::string& state);

// GENERAL.STATE, GENERAL.CONNECTION and IP4.ADDRESS[n] of `device show`
GatewayStatus parseDeviceShow(const std::string& output);

// ACTIVE,SSID,SIGNAL rows; fills ssid and signal of the in-use access point
void parseActiveAccessPoint(const std::string& output, GatewayStatus& status);

// NAME,UUID,TYPE,AUTOCONNECT,DEVICE rows
std::vector<ConnectionRow> parseConnections(const std::string& output);

ConnectOutcome classifyConnectError(int exitCode, const std::string& message);

} // namespace nmcli

} // namespace wifiprov
