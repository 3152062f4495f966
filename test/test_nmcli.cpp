#include "fakes.hpp"
#include "wifi_errors.hpp"
#include "wifi_nmcli.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <utility>

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;

namespace wifiprov {

using fakes::failed;
using fakes::succeeded;

TEST(NmcliParseTest, SplitFieldsHonoursEscapes) {
    auto fields = nmcli::splitFields("My\\:Net:AA\\:BB\\:CC:70:back\\\\slash:");

    ASSERT_EQ(5u, fields.size());
    EXPECT_EQ("My:Net", fields[0]);
    EXPECT_EQ("AA:BB:CC", fields[1]);
    EXPECT_EQ("70", fields[2]);
    EXPECT_EQ("back\\slash", fields[3]);
    EXPECT_EQ("", fields[4]);
}

TEST(NmcliParseTest, ScanDeduplicatesAndSortsBySignal) {
    const std::string output =
        "Home:AA\\:BB\\:CC\\:DD\\:EE\\:01:45:WPA2:2437 MHz\n"
        "Home:AA\\:BB\\:CC\\:DD\\:EE\\:02:80:WPA1 WPA2:5180 MHz\n"
        ":AA\\:BB\\:CC\\:DD\\:EE\\:03:90:WPA2:2412 MHz\n"
        "Cafe:AA\\:BB\\:CC\\:DD\\:EE\\:04:60::2462 MHz\n"
        "Lab:AA\\:BB\\:CC\\:DD\\:EE\\:05:70:WPA3:2412 MHz\n"
        "garbage line\n";

    auto networks = nmcli::parseScan(output);

    ASSERT_EQ(3u, networks.size());
    EXPECT_EQ("Home", networks[0].ssid);
    EXPECT_EQ(80, networks[0].signalStrength);
    EXPECT_EQ("AA:BB:CC:DD:EE:02", networks[0].bssid);
    EXPECT_EQ(36, networks[0].channel);
    EXPECT_EQ("5GHz", networks[0].getBandString());
    EXPECT_EQ("Lab", networks[1].ssid);
    EXPECT_EQ(SecurityType::WPA3, networks[1].security);
    EXPECT_EQ("Cafe", networks[2].ssid);
    EXPECT_EQ("Open", networks[2].getSecurityString());
    EXPECT_EQ(11, networks[2].channel);
    EXPECT_EQ("2.4GHz", networks[2].getBandString());
}

TEST(NmcliParseTest, DeviceStates) {
    EXPECT_EQ(LinkState::CONNECTED, nmcli::parseDeviceState("100 (connected)"));
    EXPECT_EQ(LinkState::NEED_AUTH, nmcli::parseDeviceState("60 (need-auth)"));
    EXPECT_EQ(LinkState::CONNECTING, nmcli::parseDeviceState("70 (connecting (getting IP configuration))"));
    EXPECT_EQ(LinkState::DISCONNECTED, nmcli::parseDeviceState("30 (disconnected)"));
    EXPECT_EQ(LinkState::UNAVAILABLE, nmcli::parseDeviceState("20 (unavailable)"));
    EXPECT_EQ(LinkState::FAILED, nmcli::parseDeviceState("120 (failed)"));
    EXPECT_EQ(LinkState::CONNECTING, nmcli::parseDeviceState("connecting (prepare)"));
    EXPECT_EQ(LinkState::CONNECTED, nmcli::parseDeviceState("connected"));
    EXPECT_STREQ("need-auth", toString(nmcli::parseDeviceState("60 (need-auth)")));
}

TEST(NmcliParseTest, DeviceShow) {
    GatewayStatus status = nmcli::parseDeviceShow(
        "GENERAL.STATE:100 (connected)\n"
        "GENERAL.CONNECTION:Home\n"
        "IP4.ADDRESS[1]:192.168.1.23/24\n"
        "IP4.ADDRESS[2]:10.0.0.9/8\n");

    EXPECT_EQ(LinkState::CONNECTED, status.state);
    EXPECT_EQ("Home", status.connection);
    EXPECT_EQ("192.168.1.23", status.ip.value_or(""));

    GatewayStatus idle = nmcli::parseDeviceShow(
        "GENERAL.STATE:30 (disconnected)\nGENERAL.CONNECTION:--\n");
    EXPECT_EQ(LinkState::DISCONNECTED, idle.state);
    EXPECT_EQ("", idle.connection);
    EXPECT_FALSE(idle.ip.has_value());
}

TEST(NmcliParseTest, ConnectErrorClassification) {
    EXPECT_EQ(ConnectOutcome::AUTH_REJECTED, nmcli::classifyConnectError(4,
        "Error: Connection activation failed: (7) Secrets were required, but not provided."));
    EXPECT_EQ(ConnectOutcome::NOT_FOUND, nmcli::classifyConnectError(10,
        "Error: No network with SSID 'Nowhere' found."));
    EXPECT_EQ(ConnectOutcome::ACCEPTED, nmcli::classifyConnectError(3,
        "Error: Timeout expired (9 seconds)"));
    EXPECT_EQ(ConnectOutcome::FAILED, nmcli::classifyConnectError(4,
        "Error: Connection activation failed: IP configuration could not be reserved"));
}

TEST(NmcliParseTest, Unescape) {
    EXPECT_EQ("Cafe:Corner", nmcli::unescape("Cafe\\:Corner"));
    EXPECT_EQ("a\\b", nmcli::unescape("a\\\\b"));
    EXPECT_EQ("plain", nmcli::unescape("plain"));
}

class NmcliGatewayTest : public ::testing::Test {
protected:
    NmcliGatewayTest() : gateway(runner, probe, NmcliOptions{"wlan0", "Hotspot", 10s}) {
        ON_CALL(runner, run(_, _)).WillByDefault(Invoke(this, &NmcliGatewayTest::respond));
        ON_CALL(probe, listWireless()).WillByDefault(Return(station()));
        ON_CALL(probe, ipv4Address(_)).WillByDefault(Return(std::nullopt));
    }

    static std::vector<WirelessInterface> station() {
        return {WirelessInterface{"wlan0", 3, InterfaceType::STATION}};
    }

    static std::vector<WirelessInterface> accessPoint() {
        return {WirelessInterface{"wlan0", 3, InterfaceType::ACCESS_POINT}};
    }

    // Canned reply for every command starting with `prefix`
    void script(const std::string& prefix, CommandResult result) {
        replies.emplace_back(prefix, std::move(result));
    }

    CommandResult respond(const std::vector<std::string>& argv, std::chrono::milliseconds) {
        std::string line;
        for (const auto& arg : argv) {
            line += line.empty() ? arg : " " + arg;
        }
        commands.push_back(line);

        for (const auto& reply : replies) {
            if (line.rfind(reply.first, 0) == 0) {
                return reply.second;
            }
        }
        return failed(1, "Error: unexpected command");
    }

    NiceMock<fakes::MockCommandRunner> runner;
    NiceMock<fakes::MockInterfaceProbe> probe;
    NmcliGateway gateway;
    std::vector<std::pair<std::string, CommandResult>> replies;
    std::vector<std::string> commands;
};

TEST_F(NmcliGatewayTest, ScanFallsBackToCachedResults) {
    script("nmcli -t -f SSID,BSSID,SIGNAL,SECURITY,FREQ device wifi list ifname wlan0 --rescan yes",
           failed(1, "Error: Scanning not allowed while unavailable."));
    script("nmcli -t -f SSID,BSSID,SIGNAL,SECURITY,FREQ device wifi list ifname wlan0 --rescan no",
           succeeded("Home:AA\\:BB\\:CC\\:DD\\:EE\\:01:67:WPA2:2437 MHz\n"));

    auto networks = gateway.scan();

    ASSERT_EQ(1u, networks.size());
    EXPECT_EQ("Home", networks[0].ssid);
    EXPECT_EQ(2u, commands.size());
}

TEST_F(NmcliGatewayTest, ScanFailureIsGatewayError) {
    EXPECT_THROW(gateway.scan(), GatewayError);
}

TEST_F(NmcliGatewayTest, StatusReadsActiveAccessPoint) {
    script("nmcli -t -f GENERAL.STATE,GENERAL.CONNECTION,IP4.ADDRESS device show wlan0",
           succeeded("GENERAL.STATE:100 (connected)\nGENERAL.CONNECTION:Home\n"
                     "IP4.ADDRESS[1]:192.168.1.23/24\n"));
    script("nmcli -t -f ACTIVE,SSID,SIGNAL device wifi list ifname wlan0 --rescan no",
           succeeded("no:Cafe:40\nyes:Home:77\n"));

    GatewayStatus status = gateway.status();

    EXPECT_TRUE(status.isConnectedTo("Home"));
    EXPECT_EQ(77, status.signal.value_or(0));
    EXPECT_EQ("192.168.1.23", status.ip.value_or(""));
}

TEST_F(NmcliGatewayTest, StatusFallsBackToKernelAddress) {
    script("nmcli -t -f GENERAL.STATE,GENERAL.CONNECTION,IP4.ADDRESS device show wlan0",
           succeeded("GENERAL.STATE:100 (connected)\nGENERAL.CONNECTION:Home\n"));
    script("nmcli -t -f ACTIVE,SSID,SIGNAL device wifi list", succeeded("yes:Home:77\n"));
    EXPECT_CALL(probe, ipv4Address("wlan0"))
        .WillOnce(Return(std::optional<std::string>("10.1.1.5")));

    EXPECT_EQ("10.1.1.5", gateway.status().ip.value_or(""));
}

TEST_F(NmcliGatewayTest, StatusUsesProfileSsidWhenAccessPointListFails) {
    script("nmcli -t -f GENERAL.STATE,GENERAL.CONNECTION,IP4.ADDRESS device show wlan0",
           succeeded("GENERAL.STATE:100 (connected)\nGENERAL.CONNECTION:Home\n"
                     "IP4.ADDRESS[1]:192.168.1.23/24\n"));
    CommandResult busy;
    busy.timedOut = true;
    script("nmcli -t -f ACTIVE,SSID,SIGNAL device wifi list", busy);
    script("nmcli -g 802-11-wireless.ssid connection show id Home", succeeded("HomeWiFi\n"));

    GatewayStatus status = gateway.status();

    EXPECT_TRUE(status.isConnectedTo("HomeWiFi"));
    EXPECT_FALSE(status.signal.has_value());
}

TEST_F(NmcliGatewayTest, StatusOfHiddenNetworkUsesProfileSsid) {
    script("nmcli -t -f GENERAL.STATE,GENERAL.CONNECTION,IP4.ADDRESS device show wlan0",
           succeeded("GENERAL.STATE:100 (connected)\nGENERAL.CONNECTION:Basement\n"));
    script("nmcli -t -f ACTIVE,SSID,SIGNAL device wifi list", succeeded("no:Cafe:40\nyes::62\n"));
    script("nmcli -g 802-11-wireless.ssid connection show id Basement", succeeded("Stealth\n"));

    GatewayStatus status = gateway.status();

    EXPECT_TRUE(status.isConnectedTo("Stealth"));
    EXPECT_EQ(62, status.signal.value_or(0));
}

TEST_F(NmcliGatewayTest, DisconnectedStatusSkipsAccessPointQueries) {
    script("nmcli -t -f GENERAL.STATE,GENERAL.CONNECTION,IP4.ADDRESS device show wlan0",
           succeeded("GENERAL.STATE:30 (disconnected)\nGENERAL.CONNECTION:--\n"));

    GatewayStatus status = gateway.status();

    EXPECT_EQ(LinkState::DISCONNECTED, status.state);
    EXPECT_FALSE(status.ssid.has_value());
    EXPECT_EQ(1u, commands.size());
}

TEST_F(NmcliGatewayTest, ReadCredentialIncludesSecret) {
    script("nmcli -s -g 802-11-wireless-security.key-mgmt,802-11-wireless-security.psk "
           "connection show uuid uuid-home",
           succeeded("wpa-psk\npass\\:word\n"));

    ProfileCredential credential = gateway.readCredential("uuid-home");

    EXPECT_EQ("wpa-psk", credential.keyManagement);
    EXPECT_EQ("pass:word", credential.secret);
}

TEST_F(NmcliGatewayTest, RestoreCredentialPutsSecretBack) {
    script("nmcli connection modify uuid uuid-home", succeeded());

    gateway.restoreCredential("uuid-home", {"wpa-psk", "correct-horse"});
    gateway.restoreCredential("uuid-home", {"", ""});

    EXPECT_THAT(commands, Contains("nmcli connection modify uuid uuid-home wifi-sec.key-mgmt "
                                   "wpa-psk wifi-sec.psk correct-horse"));
    EXPECT_THAT(commands, Contains("nmcli connection modify uuid uuid-home "
                                   "remove 802-11-wireless-security"));
}

TEST_F(NmcliGatewayTest, RestoreCredentialFailureIsGatewayError) {
    EXPECT_THROW(gateway.restoreCredential("uuid-home", {"wpa-psk", "x"}), GatewayError);
}

TEST_F(NmcliGatewayTest, StatusTimeoutIsGatewayError) {
    CommandResult hung;
    hung.timedOut = true;
    script("nmcli -t -f GENERAL.STATE", hung);

    try {
        gateway.status();
        FAIL() << "expected GatewayError";
    } catch (const GatewayError& e) {
        EXPECT_THAT(e.what(), HasSubstr("timed out"));
    }
}

TEST_F(NmcliGatewayTest, ConnectNewNetworkPassesCredentialAsArgument) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show",
           succeeded("Wired connection 1:uuid-eth:802-3-ethernet:yes:eth0\n"));
    script("nmcli --wait 9 device wifi connect", succeeded());

    ConnectResponse response = gateway.connect("Home Net", "secret 123");

    EXPECT_EQ(ConnectOutcome::ACCEPTED, response.outcome);
    EXPECT_THAT(commands,
                Contains("nmcli --wait 9 device wifi connect Home Net password secret 123 ifname wlan0"));
}

TEST_F(NmcliGatewayTest, ConnectExistingProfileUpdatesCredential) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show",
           succeeded("Home:uuid-home:802-11-wireless:yes:--\n"));
    script("nmcli -g 802-11-wireless.ssid,802-11-wireless.mode,802-11-wireless-security.key-mgmt "
           "connection show uuid uuid-home",
           succeeded("Home\ninfrastructure\nwpa-psk\n"));
    script("nmcli connection modify uuid uuid-home", succeeded());
    script("nmcli --wait 9 connection up uuid uuid-home ifname wlan0", succeeded());

    ConnectResponse response = gateway.connect("Home", "new-secret");

    EXPECT_EQ(ConnectOutcome::ACCEPTED, response.outcome);
    EXPECT_THAT(commands, Contains("nmcli connection modify uuid uuid-home wifi-sec.key-mgmt "
                                   "wpa-psk wifi-sec.psk new-secret"));
    EXPECT_THAT(commands, Not(Contains(HasSubstr("device wifi connect"))));
}

TEST_F(NmcliGatewayTest, ConnectRejectedCredentialHidesToolOutput) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show", succeeded(""));
    script("nmcli --wait 9 device wifi connect",
           failed(4, "Error: Connection activation failed: (7) Secrets were required, but not provided."));

    ConnectResponse response = gateway.connect("Office", "wrong");

    EXPECT_EQ(ConnectOutcome::AUTH_REJECTED, response.outcome);
    EXPECT_EQ("Incorrect password", response.message);
}

TEST_F(NmcliGatewayTest, ConnectUnknownNetwork) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show", succeeded(""));
    script("nmcli --wait 9 device wifi connect",
           failed(10, "Error: No network with SSID 'Nowhere' found."));

    ConnectResponse response = gateway.connect("Nowhere", "");

    EXPECT_EQ(ConnectOutcome::NOT_FOUND, response.outcome);
    EXPECT_THAT(commands, Contains("nmcli --wait 9 device wifi connect Nowhere ifname wlan0"));
}

TEST_F(NmcliGatewayTest, ListProfilesSkipsAccessPointsAndOtherTypes) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show",
           succeeded("Hotspot:uuid-ap:802-11-wireless:no:wlan0\n"
                     "Home:uuid-home:802-11-wireless:yes:wlan0\n"
                     "Old AP:uuid-old:802-11-wireless:no:--\n"
                     "Cafe\\:Corner:uuid-cafe:802-11-wireless:no:--\n"
                     "Wired connection 1:uuid-eth:802-3-ethernet:yes:eth0\n"));
    const std::string detail = "nmcli -g 802-11-wireless.ssid,802-11-wireless.mode,"
                               "802-11-wireless-security.key-mgmt connection show uuid ";
    script(detail + "uuid-home", succeeded("Home\ninfrastructure\nwpa-psk\n"));
    script(detail + "uuid-old", succeeded("OldAP\nap\nwpa-psk\n"));
    script(detail + "uuid-cafe", succeeded("Cafe\\:Corner\ninfrastructure\n\n"));

    auto profiles = gateway.listProfiles();

    ASSERT_EQ(2u, profiles.size());
    EXPECT_EQ("uuid-home", profiles[0].id);
    EXPECT_TRUE(profiles[0].isCurrent);
    EXPECT_TRUE(profiles[0].hasCredential);
    EXPECT_FALSE(profiles[0].isDisabled);
    EXPECT_EQ("Cafe:Corner", profiles[1].ssid);
    EXPECT_FALSE(profiles[1].isCurrent);
    EXPECT_FALSE(profiles[1].hasCredential);
    EXPECT_TRUE(profiles[1].isDisabled);
}

TEST_F(NmcliGatewayTest, DeleteProfileFailureIsGatewayError) {
    script("nmcli connection delete uuid uuid-home",
           failed(10, "Error: unknown connection 'uuid-home'."));

    EXPECT_THROW(gateway.deleteProfile("uuid-home"), GatewayError);
}

TEST_F(NmcliGatewayTest, ActivateProfileToleratesSlowActivation) {
    script("nmcli --wait 9 connection up uuid uuid-home", failed(3, "Error: Timeout expired"));

    EXPECT_NO_THROW(gateway.activateProfile("uuid-home"));
}

TEST_F(NmcliGatewayTest, HotspotIsCreatedWithSharedAddressing) {
    script("nmcli device wifi hotspot", succeeded());
    script("nmcli connection modify Hotspot", succeeded());
    script("nmcli connection up Hotspot", succeeded());

    gateway.activateHotspot(fakes::testHotspot());

    std::vector<std::string> expected = {
        "nmcli device wifi hotspot ifname wlan0 con-name Hotspot ssid Radio-Setup band bg "
        "channel 6 password Configure123!",
        "nmcli connection modify Hotspot ipv4.method shared ipv4.addresses 192.168.4.1/24 "
        "connection.autoconnect no",
        "nmcli connection up Hotspot ifname wlan0"};
    EXPECT_EQ(expected, commands);
}

TEST_F(NmcliGatewayTest, HotspotNeedsAccessPointMode) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show --active",
           succeeded("Hotspot:uuid-ap:802-11-wireless:no:wlan0\n"));

    EXPECT_FALSE(gateway.isHotspotActive());

    EXPECT_CALL(probe, listWireless()).WillOnce(Return(accessPoint()));
    EXPECT_TRUE(gateway.isHotspotActive());
}

TEST_F(NmcliGatewayTest, InactiveHotspotProfileIsNotActive) {
    script("nmcli -t -f NAME,UUID,TYPE,AUTOCONNECT,DEVICE connection show --active",
           succeeded("Home:uuid-home:802-11-wireless:yes:wlan0\n"));
    EXPECT_CALL(probe, listWireless()).Times(0);

    EXPECT_FALSE(gateway.isHotspotActive());
}

TEST_F(NmcliGatewayTest, StoppingStoppedHotspotIsFine) {
    script("nmcli connection down Hotspot", failed(10, "Error: 'Hotspot' is not an active connection."));

    EXPECT_NO_THROW(gateway.deactivateHotspot());
}

TEST_F(NmcliGatewayTest, InterfacesComeFromKernel) {
    EXPECT_EQ(std::vector<std::string>{"wlan0"}, gateway.listInterfaces());
    EXPECT_TRUE(commands.empty());
}

} // namespace wifiprov
