#include "fakes.hpp"
#include "wifi_configurator.hpp"
#include "wifi_mode_store.hpp"
#include "wifi_orchestrator.hpp"
#include "wifi_single_flight.hpp"
#include "wifi_status.hpp"
#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono_literals;
using ::testing::HasSubstr;

namespace wifiprov {

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest()
        : modeStore(dir.file("host_mode")),
          configurator(gateway, modeStore, clock, fakes::testHotspot(),
                       {dir.file("dnsmasq.conf"), 5s, 1s}),
          orchestrator(gateway, configurator, modeStore, guard, clock),
          reporter(gateway, modeStore, fakes::testHotspot()) {}

    std::vector<std::string> savedSsids() {
        std::vector<std::string> ssids;
        for (const auto& profile : gateway.listProfiles()) {
            ssids.push_back(profile.ssid);
        }
        return ssids;
    }

    fakes::TempDir dir;
    fakes::FakeGateway gateway;
    fakes::FakeClock clock;
    ModeStore modeStore;
    SingleFlight guard;
    InterfaceConfigurator configurator;
    ConnectionOrchestrator orchestrator;
    StatusReporter reporter;
};

TEST_F(OrchestratorTest, ConnectsOnFirstAttempt) {
    gateway.addNetwork("HomeWiFi", "secret123");

    ConnectionResult result = orchestrator.connect({"HomeWiFi", "secret123"});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(ErrorCode::None, result.code);
    EXPECT_EQ(1, result.attempts);
    ASSERT_TRUE(result.ip.has_value());
    EXPECT_EQ("192.168.1.50", *result.ip);
    EXPECT_EQ(1, gateway.count("connect"));
    EXPECT_TRUE(clock.sleeps().empty());

    SystemStatus status = reporter.getStatus();
    EXPECT_EQ(DeviceMode::ClientConnected, status.mode);
    EXPECT_EQ("HomeWiFi", status.ssid.value_or(""));
}

TEST_F(OrchestratorTest, PollsUntilLinkIsUp) {
    fakes::FakeGateway::Network slow;
    slow.password = "secret123";
    slow.pollsUntilConnected = 3;
    gateway.addNetwork("HomeWiFi", slow);

    ConnectionResult result = orchestrator.connect({"HomeWiFi", "secret123"});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(1, result.attempts);
    std::vector<Clock::duration> expected(3, 2s);
    EXPECT_EQ(expected, clock.sleeps());
}

TEST_F(OrchestratorTest, RetriesWithIncreasingDelays) {
    ConnectionResult result = orchestrator.connect({"Nowhere", "secret123"});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorCode::AllAttemptsFailed, result.code);
    EXPECT_EQ(3, result.attempts);
    EXPECT_EQ(3, gateway.count("connect"));

    std::vector<Clock::duration> expected = {5s, 10s};
    EXPECT_EQ(expected, clock.sleeps());
    EXPECT_THAT(result.message, HasSubstr("network not found"));
}

TEST_F(OrchestratorTest, SucceedsOnThirdAttempt) {
    int calls = 0;
    gateway.onConnect = [this, &calls](const std::string& ssid) {
        if (++calls == 3) {
            gateway.addNetwork(ssid, "secret123");
        }
    };

    ConnectionResult result = orchestrator.connect({"LateWiFi", "secret123"});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(3, result.attempts);
    std::vector<Clock::duration> expected = {5s, 10s};
    EXPECT_EQ(expected, clock.sleeps());
}

TEST_F(OrchestratorTest, EachAttemptTimesOutAfterFortySeconds) {
    fakes::FakeGateway::Network stuck;
    stuck.password = "secret123";
    stuck.pollsUntilConnected = 1000;
    gateway.addNetwork("FarAway", stuck);

    ConnectionResult result = orchestrator.connect({"FarAway", "secret123"});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorCode::AllAttemptsFailed, result.code);
    EXPECT_THAT(result.message, HasSubstr("connection timeout"));
    // 40 s per attempt plus the 5 s and 10 s backoff
    EXPECT_EQ(Clock::duration(135s), clock.elapsed());
}

TEST_F(OrchestratorTest, WrongPasswordForCurrentNetworkKeepsItConnected) {
    gateway.addNetwork("HomeWiFi", "correct");
    std::string home = gateway.addProfile("HomeWiFi", "correct");
    gateway.joinProfile(home);
    ASSERT_EQ(DeviceMode::ClientConnected, reporter.getStatus().mode);

    ConnectionResult result = orchestrator.connect({"HomeWiFi", "wrong"});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorCode::AllAttemptsFailed, result.code);
    EXPECT_EQ(3, result.attempts);
    EXPECT_THAT(result.message, HasSubstr("incorrect password"));
    EXPECT_THAT(result.message, HasSubstr("after 3 attempts"));
    std::vector<Clock::duration> expected = {5s, 10s};
    EXPECT_EQ(expected, clock.sleeps());

    EXPECT_EQ("correct", gateway.savedPassword(home));
    EXPECT_TRUE(gateway.connectedTo("HomeWiFi"));
    EXPECT_FALSE(modeStore.isHotspotMarked());
    EXPECT_EQ(0, gateway.count("activateHotspot"));
    EXPECT_EQ(std::vector<std::string>{"HomeWiFi"}, savedSsids());

    SystemStatus status = reporter.getStatus();
    EXPECT_EQ(DeviceMode::ClientConnected, status.mode);
    EXPECT_EQ("HomeWiFi", status.ssid.value_or(""));
}

TEST_F(OrchestratorTest, WrongPasswordForSavedNetworkKeepsItsCredential) {
    gateway.addNetwork("Home", "home-pass");
    gateway.addNetwork("Office", "office-pass");
    std::string home = gateway.addProfile("Home", "home-pass");
    std::string office = gateway.addProfile("Office", "office-pass");
    gateway.joinProfile(home);

    ConnectionResult result = orchestrator.connect({"Office", "typo"});

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(gateway.connectedTo("Home"));
    EXPECT_EQ("office-pass", gateway.savedPassword(office));
    EXPECT_EQ(1, gateway.count("restoreCredential:" + office));
    EXPECT_EQ(0, gateway.count("readCredential:" + home));

    EXPECT_NO_THROW(gateway.activateProfile(office));
    EXPECT_TRUE(gateway.connectedTo("Office"));
}

TEST_F(OrchestratorTest, SuccessKeepsUpdatedCredential) {
    gateway.addNetwork("Home", "new-pass");
    std::string home = gateway.addProfile("Home", "old-pass");

    ConnectionResult result = orchestrator.connect({"Home", "new-pass"});

    EXPECT_TRUE(result.success);
    EXPECT_EQ("new-pass", gateway.savedPassword(home));
    EXPECT_EQ(0, gateway.count("restoreCredential"));
}

TEST_F(OrchestratorTest, UnreadableCredentialDoesNotBlockAttempt) {
    gateway.addNetwork("Home", "home-pass");
    gateway.addProfile("Home", "home-pass");
    gateway.credentialReadFails = true;

    ConnectionResult result = orchestrator.connect({"Home", "home-pass"});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(std::vector<std::string>{"Home"}, savedSsids());
}

TEST_F(OrchestratorTest, FailureRestoresPreviousClientConnection) {
    gateway.addNetwork("Home", "home-pass");
    gateway.addNetwork("Office", "right-password");
    gateway.joinProfile(gateway.addProfile("Home", "home-pass"));
    ASSERT_EQ(DeviceMode::ClientConnected, reporter.getStatus().mode);

    ConnectionResult result = orchestrator.connect({"Office", "wrong-password"});

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(gateway.connectedTo("Home"));
    EXPECT_EQ(0, gateway.count("activateHotspot"));
    EXPECT_EQ(std::vector<std::string>{"Home"}, savedSsids());

    SystemStatus status = reporter.getStatus();
    EXPECT_EQ(DeviceMode::ClientConnected, status.mode);
    EXPECT_EQ("Home", status.ssid.value_or(""));
}

TEST_F(OrchestratorTest, FailureFromHotspotKeepsHotspot) {
    configurator.activateHotspot();
    ASSERT_EQ(DeviceMode::Hotspot, reporter.getStatus().mode);

    ConnectionResult result = orchestrator.connect({"Nowhere", "secret123"});

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(modeStore.isHotspotMarked());
    EXPECT_TRUE(gateway.hotspotRunning());
    EXPECT_EQ(DeviceMode::Hotspot, reporter.getStatus().mode);
}

TEST_F(OrchestratorTest, FailureWithoutPriorLinkStartsHotspot) {
    ConnectionResult result = orchestrator.connect({"Nowhere", "secret123"});

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(gateway.hotspotRunning());
    EXPECT_TRUE(modeStore.isHotspotMarked());
}

TEST_F(OrchestratorTest, SuccessFromHotspotSwitchesToClientMode) {
    configurator.activateHotspot();
    gateway.addNetwork("HomeWiFi", "secret123");

    ConnectionResult result = orchestrator.connect({"HomeWiFi", "secret123"});

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(modeStore.isHotspotMarked());
    EXPECT_EQ(1, gateway.count("releaseToHost"));

    SystemStatus status = reporter.getStatus();
    EXPECT_EQ(DeviceMode::ClientConnected, status.mode);
    EXPECT_EQ("HomeWiFi", status.ssid.value_or(""));
}

TEST_F(OrchestratorTest, RejectsSecondAttemptWhileOneIsRunning) {
    gateway.addNetwork("First", "secret123");
    gateway.addNetwork("Second", "secret123");

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> blocked{false};
    gateway.onConnect = [&](const std::string&) {
        if (!blocked.exchange(true)) {
            entered.set_value();
            released.wait();
        }
    };

    std::future<ConnectionResult> first = std::async(std::launch::async, [this] {
        return orchestrator.connect({"First", "secret123"});
    });
    entered.get_future().wait();

    ConnectionResult second = orchestrator.connect({"Second", "secret123"});
    EXPECT_FALSE(second.success);
    EXPECT_EQ(ErrorCode::AttemptInProgress, second.code);
    EXPECT_EQ(0, gateway.count("connect:Second"));

    release.set_value();
    EXPECT_TRUE(first.get().success);
    EXPECT_FALSE(guard.busy());
}

TEST_F(OrchestratorTest, RejectsInvalidRequestsWithoutTouchingGateway) {
    EXPECT_EQ(ErrorCode::InvalidRequest, orchestrator.connect({"", ""}).code);
    EXPECT_EQ(ErrorCode::InvalidRequest, orchestrator.connect({std::string(33, 'x'), ""}).code);
    EXPECT_EQ(ErrorCode::InvalidRequest,
              orchestrator.connect({"Home", std::string(64, 'p')}).code);
    EXPECT_TRUE(gateway.calls().empty());
}

TEST(ConnectRequestValidation, AcceptsBoundaryLengths) {
    EXPECT_EQ("", ConnectionOrchestrator::validate({std::string(32, 's'), std::string(63, 'p')}));
    EXPECT_EQ("", ConnectionOrchestrator::validate({"s", ""}));
    EXPECT_NE("", ConnectionOrchestrator::validate({std::string(32, 's'), std::string(64, 'p')}));
}

} // namespace wifiprov
