#include "wifi_nmcli.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace wifiprov {

namespace {

// nmcli exit codes
constexpr int NMCLI_TIMEOUT_EXPIRED = 3;
constexpr int NMCLI_NOT_FOUND = 10;

const char* WIRELESS_TYPE = "802-11-wireless";

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> lines(const std::string& output) {
    std::vector<std::string> result;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            result.push_back(line);
        }
    }
    return result;
}

std::optional<int> parseNumber(const std::string& text) {
    try {
        return std::stoi(text);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

namespace nmcli {

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size() &&
            (line[i + 1] == ':' || line[i + 1] == '\\')) {
            current += line[i + 1];
            ++i;
        } else if (line[i] == ':') {
            fields.push_back(current);
            current.clear();
        } else {
            current += line[i];
        }
    }

    fields.push_back(current);
    return fields;
}

std::string unescape(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size() &&
            (value[i + 1] == ':' || value[i + 1] == '\\')) {
            ++i;
        }
        result += value[i];
    }
    return result;
}

SecurityType parseSecurity(const std::string& security) {
    std::string value = trim(security);
    if (value.empty() || value == "--") {
        return SecurityType::NONE;
    }
    if (contains(value, "WPA3") || contains(value, "SAE")) {
        return SecurityType::WPA3;
    }
    if (contains(value, "WPA2") || contains(value, "RSN")) {
        return SecurityType::WPA2;
    }
    if (contains(value, "WPA")) {
        return SecurityType::WPA;
    }
    if (contains(value, "WEP")) {
        return SecurityType::WEP;
    }
    return SecurityType::UNKNOWN;
}

std::vector<NetworkInfo> parseScan(const std::string& output) {
    std::map<std::string, NetworkInfo> best;

    for (const auto& line : lines(output)) {
        auto fields = splitFields(line);
        if (fields.size() < 5) {
            Logger::getInstance().debug("Skipping malformed scan line: ", line);
            continue;
        }

        NetworkInfo network;
        network.ssid = fields[0];
        if (network.ssid.empty()) {
            continue;
        }
        network.bssid = fields[1];

        auto signal = parseNumber(trim(fields[2]));
        if (!signal) {
            Logger::getInstance().debug("Invalid signal '", fields[2], "' for ", network.ssid);
            continue;
        }
        network.signalStrength = std::max(0, std::min(100, *signal));
        network.security = parseSecurity(fields[3]);

        // "2437 MHz"
        if (auto freq = parseNumber(trim(fields[4]))) {
            network.frequency = *freq;
            network.channel = frequencyToChannel(network.frequency);
        }

        auto it = best.find(network.ssid);
        if (it == best.end() || network.signalStrength > it->second.signalStrength) {
            best[network.ssid] = network;
        }
    }

    std::vector<NetworkInfo> networks;
    networks.reserve(best.size());
    for (auto& entry : best) {
        networks.push_back(std::move(entry.second));
    }
    std::stable_sort(networks.begin(), networks.end(),
                     [](const NetworkInfo& a, const NetworkInfo& b) {
                         return a.signalStrength > b.signalStrength;
                     });
    return networks;
}

LinkState parseDeviceState(const std::string& state) {
    auto code = parseNumber(trim(state));
    if (!code) {
        std::string text = lowercase(state);
        if (contains(text, "disconnected")) return LinkState::DISCONNECTED;
        if (contains(text, "connected") && !contains(text, "connecting")) return LinkState::CONNECTED;
        if (contains(text, "need-auth") || contains(text, "need auth")) return LinkState::NEED_AUTH;
        if (contains(text, "connecting")) return LinkState::CONNECTING;
        if (contains(text, "unavailable") || contains(text, "unmanaged")) return LinkState::UNAVAILABLE;
        return LinkState::FAILED;
    }

    // NMDeviceState
    switch (*code) {
        case 100: return LinkState::CONNECTED;
        case 60:  return LinkState::NEED_AUTH;
        case 40:
        case 50:
        case 70:
        case 80:
        case 90:  return LinkState::CONNECTING;
        case 30:
        case 110: return LinkState::DISCONNECTED;
        case 10:
        case 20:  return LinkState::UNAVAILABLE;
        default:  return LinkState::FAILED;
    }
}

GatewayStatus parseDeviceShow(const std::string& output) {
    GatewayStatus status;
    for (const auto& line : lines(output)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colon);
        std::string value = trim(line.substr(colon + 1));

        if (key == "GENERAL.STATE") {
            status.state = parseDeviceState(value);
        } else if (key == "GENERAL.CONNECTION") {
            status.connection = value == "--" ? "" : value;
        } else if (key.rfind("IP4.ADDRESS", 0) == 0 && !status.ip && !value.empty()) {
            // 192.168.1.100/24
            status.ip = value.substr(0, value.find('/'));
        }
    }
    return status;
}

void parseActiveAccessPoint(const std::string& output, GatewayStatus& status) {
    for (const auto& line : lines(output)) {
        auto fields = splitFields(line);
        if (fields.size() < 3 || fields[0] != "yes") {
            continue;
        }
        if (!fields[1].empty()) {
            status.ssid = fields[1];
        }
        status.signal = parseNumber(trim(fields[2]));
        return;
    }
}

std::vector<ConnectionRow> parseConnections(const std::string& output) {
    std::vector<ConnectionRow> rows;
    for (const auto& line : lines(output)) {
        auto fields = splitFields(line);
        if (fields.size() < 5) {
            continue;
        }
        ConnectionRow row;
        row.name = fields[0];
        row.uuid = fields[1];
        row.type = fields[2];
        row.autoconnect = fields[3] != "no";
        row.device = fields[4] == "--" ? "" : fields[4];
        rows.push_back(row);
    }
    return rows;
}

ConnectOutcome classifyConnectError(int exitCode, const std::string& message) {
    std::string text = lowercase(message);

    if (exitCode == NMCLI_TIMEOUT_EXPIRED) {
        // Activation is still running in NetworkManager
        return ConnectOutcome::ACCEPTED;
    }
    if (contains(text, "secrets were required") || contains(text, "no secrets") ||
        contains(text, "invalid password") || contains(text, "802-11-wireless-security.psk") ||
        contains(text, "authentication")) {
        return ConnectOutcome::AUTH_REJECTED;
    }
    if (exitCode == NMCLI_NOT_FOUND || contains(text, "no network with ssid") ||
        contains(text, "could not be found")) {
        return ConnectOutcome::NOT_FOUND;
    }
    return ConnectOutcome::FAILED;
}

} // namespace nmcli

NmcliGateway::NmcliGateway(CommandRunner& runner, InterfaceProbe& probe, NmcliOptions options)
    : runner(runner), probe(probe), options(std::move(options)) {
    Logger::getInstance().info("NetworkManager gateway initialized for interface ",
                               this->options.interfaceName);
}

CommandResult NmcliGateway::runNmcli(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("nmcli");
    argv.insert(argv.end(), args.begin(), args.end());

    CommandResult result = runner.run(argv, options.commandTimeout);
    if (!result.ok()) {
        Logger::getInstance().debug("nmcli ", args.empty() ? "" : args.front(),
                                    " exited with ", result.exitCode,
                                    result.timedOut ? " (timed out)" : "",
                                    ": ", trim(result.err));
    }
    return result;
}

std::string NmcliGateway::runNmcliChecked(const std::vector<std::string>& args,
                                          const std::string& failure) {
    CommandResult result = runNmcli(args);
    if (!result.ok()) {
        throw GatewayError(result.timedOut ? failure + " (timed out)" : failure);
    }
    return result.out;
}

// nmcli's own activation wait, kept inside the command timeout. Whatever is
// left over is observed through status() polling.
std::string NmcliGateway::activationWait() const {
    return std::to_string(std::max<long long>(1, options.commandTimeout.count() - 1));
}

std::vector<std::string> NmcliGateway::listInterfaces() {
    std::vector<std::string> names;
    for (const auto& iface : probe.listWireless()) {
        names.push_back(iface.name);
    }
    return names;
}

std::vector<NetworkInfo> NmcliGateway::scan() {
    Logger::getInstance().info("Scanning for networks on ", options.interfaceName);

    const std::vector<std::string> fields = {
        "-t", "-f", "SSID,BSSID,SIGNAL,SECURITY,FREQ", "device", "wifi", "list",
        "ifname", options.interfaceName};

    std::vector<std::string> args = fields;
    args.insert(args.end(), {"--rescan", "yes"});
    CommandResult result = runNmcli(args);
    if (!result.ok()) {
        // Radios busy broadcasting a hotspot often refuse to rescan
        Logger::getInstance().warning("WiFi rescan failed, using cached scan results");
        args = fields;
        args.insert(args.end(), {"--rescan", "no"});
        result.out = runNmcliChecked(args, "WiFi scan failed");
    }

    auto networks = nmcli::parseScan(result.out);
    Logger::getInstance().info("Found ", networks.size(), " networks");
    return networks;
}

GatewayStatus NmcliGateway::status() {
    std::string output = runNmcliChecked(
        {"-t", "-f", "GENERAL.STATE,GENERAL.CONNECTION,IP4.ADDRESS", "device", "show",
         options.interfaceName},
        "Failed to query interface status");

    GatewayStatus status = nmcli::parseDeviceShow(output);
    if (status.state != LinkState::CONNECTED) {
        return status;
    }

    CommandResult aps = runNmcli({"-t", "-f", "ACTIVE,SSID,SIGNAL", "device", "wifi", "list",
                                  "ifname", options.interfaceName, "--rescan", "no"});
    if (aps.ok()) {
        nmcli::parseActiveAccessPoint(aps.out, status);
    }
    if (!status.ssid && !status.connection.empty()) {
        // Hidden networks and a busy radio give no SSID in the access point list
        CommandResult profile = runNmcli({"-g", "802-11-wireless.ssid", "connection", "show",
                                          "id", status.connection});
        if (profile.ok() && !trim(profile.out).empty()) {
            status.ssid = trim(profile.out);
        }
    }
    if (!status.ip) {
        status.ip = probe.ipv4Address(options.interfaceName);
    }
    return status;
}

ConnectResponse NmcliGateway::connect(const std::string& ssid, const std::string& credential) {
    Logger::getInstance().info("Submitting credentials for ", ssid, " (password provided: ",
                               credential.empty() ? "no" : "yes", ")");

    const std::string wait = activationWait();

    std::string existingId;
    for (const auto& profile : listProfiles()) {
        if (profile.ssid == ssid) {
            existingId = profile.id;
            break;
        }
    }

    CommandResult result;
    if (!existingId.empty()) {
        Logger::getInstance().info("Existing connection found for ", ssid, ", updating it");
        if (!credential.empty()) {
            CommandResult modified = runNmcli({"connection", "modify", "uuid", existingId,
                                               "wifi-sec.key-mgmt", "wpa-psk",
                                               "wifi-sec.psk", credential});
            if (!modified.ok()) {
                return {ConnectOutcome::FAILED, "Failed to update saved credentials"};
            }
        }
        result = runNmcli({"--wait", wait, "connection", "up", "uuid", existingId,
                           "ifname", options.interfaceName});
    } else {
        std::vector<std::string> args = {"--wait", wait, "device", "wifi", "connect", ssid};
        if (!credential.empty()) {
            args.insert(args.end(), {"password", credential});
        }
        args.insert(args.end(), {"ifname", options.interfaceName});
        result = runNmcli(args);
    }

    if (result.ok()) {
        return {ConnectOutcome::ACCEPTED, ""};
    }
    if (result.timedOut) {
        return {ConnectOutcome::FAILED, "Network manager did not respond"};
    }

    ConnectOutcome outcome = nmcli::classifyConnectError(result.exitCode, result.err + result.out);
    switch (outcome) {
        case ConnectOutcome::AUTH_REJECTED:
            return {outcome, "Incorrect password"};
        case ConnectOutcome::NOT_FOUND:
            return {outcome, "Network not found"};
        case ConnectOutcome::ACCEPTED:
            return {outcome, ""};
        default:
            return {outcome, "Connection activation failed"};
    }
}

void NmcliGateway::disconnect() {
    GatewayStatus current = status();
    if (current.state == LinkState::DISCONNECTED || current.state == LinkState::UNAVAILABLE) {
        return;
    }
    Logger::getInstance().info("Disconnecting ", options.interfaceName);
    runNmcliChecked({"device", "disconnect", options.interfaceName},
                    "Failed to disconnect " + options.interfaceName);
}

std::vector<NetworkProfile> NmcliGateway::listProfiles() {
    std::string output = runNmcliChecked(
        {"-t", "-f", "NAME,UUID,TYPE,AUTOCONNECT,DEVICE", "connection", "show"},
        "Failed to list saved networks");

    std::vector<NetworkProfile> profiles;
    for (const auto& row : nmcli::parseConnections(output)) {
        if (row.type != WIRELESS_TYPE || row.name == options.hotspotConnectionName) {
            continue;
        }

        // -g prints bare values, one per line, in field order
        CommandResult detail = runNmcli({"-g", "802-11-wireless.ssid,802-11-wireless.mode,"
                                         "802-11-wireless-security.key-mgmt",
                                         "connection", "show", "uuid", row.uuid});
        NetworkProfile profile;
        profile.id = row.uuid;
        profile.name = row.name;
        profile.ssid = row.name;
        profile.isDisabled = !row.autoconnect;
        profile.isCurrent = row.device == options.interfaceName;

        if (detail.ok()) {
            std::istringstream stream(detail.out);
            std::string ssid, mode, keyMgmt;
            std::getline(stream, ssid);
            std::getline(stream, mode);
            std::getline(stream, keyMgmt);
            if (trim(mode) == "ap") {
                continue;
            }
            if (!trim(ssid).empty()) {
                profile.ssid = nmcli::unescape(trim(ssid));
            }
            profile.hasCredential = !trim(keyMgmt).empty() && trim(keyMgmt) != "none";
        }
        profiles.push_back(profile);
    }

    Logger::getInstance().debug("Found ", profiles.size(), " saved networks");
    return profiles;
}

void NmcliGateway::deleteProfile(const std::string& id) {
    runNmcliChecked({"connection", "delete", "uuid", id}, "Failed to remove network");
    Logger::getInstance().info("Deleted connection profile ", id);
}

void NmcliGateway::activateProfile(const std::string& id) {
    CommandResult result = runNmcli({"--wait", activationWait(), "connection", "up", "uuid", id,
                                     "ifname", options.interfaceName});
    if (result.exitCode == NMCLI_TIMEOUT_EXPIRED) {
        Logger::getInstance().info("Connection ", id, " is still activating");
        return;
    }
    if (!result.ok()) {
        throw GatewayError("Failed to activate saved network");
    }
}

ProfileCredential NmcliGateway::readCredential(const std::string& id) {
    // -s includes secrets; -g prints key-mgmt then psk, one per line
    std::string output = runNmcliChecked(
        {"-s", "-g", "802-11-wireless-security.key-mgmt,802-11-wireless-security.psk",
         "connection", "show", "uuid", id},
        "Failed to read saved credentials");

    std::istringstream stream(output);
    std::string keyMgmt, psk;
    std::getline(stream, keyMgmt);
    std::getline(stream, psk);

    ProfileCredential credential;
    // Open profiles have no security setting at all; "none" is static WEP
    credential.keyManagement = trim(keyMgmt);
    if (!psk.empty() && psk.back() == '\r') {
        psk.pop_back();
    }
    credential.secret = nmcli::unescape(psk);
    return credential;
}

void NmcliGateway::restoreCredential(const std::string& id, const ProfileCredential& credential) {
    std::vector<std::string> args = {"connection", "modify", "uuid", id};
    if (credential.keyManagement.empty()) {
        args.insert(args.end(), {"remove", "802-11-wireless-security"});
    } else {
        args.insert(args.end(), {"wifi-sec.key-mgmt", credential.keyManagement});
        if (!credential.secret.empty()) {
            args.insert(args.end(), {"wifi-sec.psk", credential.secret});
        }
    }
    runNmcliChecked(args, "Failed to restore saved credentials");
}

void NmcliGateway::activateHotspot(const HotspotConfig& config) {
    Logger::getInstance().info("Creating hotspot: ", config.ssid);

    std::vector<std::string> args = {"device", "wifi", "hotspot",
                                     "ifname", options.interfaceName,
                                     "con-name", options.hotspotConnectionName,
                                     "ssid", config.ssid,
                                     "band", "bg",
                                     "channel", std::to_string(config.channel)};
    if (!config.password.empty()) {
        args.insert(args.end(), {"password", config.password});
    }
    runNmcliChecked(args, "Failed to start hotspot");

    // Pin the static address and keep the profile from grabbing the radio on its own
    runNmcliChecked({"connection", "modify", options.hotspotConnectionName,
                     "ipv4.method", "shared",
                     "ipv4.addresses", config.ipAddress + "/24",
                     "connection.autoconnect", "no"},
                    "Failed to configure hotspot address");
    runNmcliChecked({"connection", "up", options.hotspotConnectionName,
                     "ifname", options.interfaceName},
                    "Failed to apply hotspot address");
}

void NmcliGateway::deactivateHotspot() {
    CommandResult result = runNmcli({"connection", "down", options.hotspotConnectionName});
    if (!result.ok() && result.exitCode != NMCLI_NOT_FOUND) {
        // exit code 10: profile is not active, nothing to stop
        throw GatewayError("Failed to stop hotspot");
    }
}

bool NmcliGateway::isHotspotActive() {
    CommandResult result = runNmcli({"-t", "-f", "NAME,UUID,TYPE,AUTOCONNECT,DEVICE",
                                     "connection", "show", "--active"});
    if (!result.ok()) {
        return false;
    }

    bool profileActive = false;
    for (const auto& row : nmcli::parseConnections(result.out)) {
        if (row.name == options.hotspotConnectionName && row.device == options.interfaceName) {
            profileActive = true;
            break;
        }
    }
    if (!profileActive) {
        return false;
    }

    // The profile being active is not enough: the radio must actually beacon
    try {
        auto iface = probe.find(options.interfaceName);
        return iface && iface->type == InterfaceType::ACCESS_POINT;
    } catch (const GatewayError& e) {
        Logger::getInstance().warning("Could not verify interface mode: ", e.what());
        return false;
    }
}

void NmcliGateway::releaseToHost() {
    runNmcliChecked({"device", "set", options.interfaceName, "autoconnect", "yes"},
                    "Failed to hand " + options.interfaceName + " back to NetworkManager");
}

} // namespace wifiprov
