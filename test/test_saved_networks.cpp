#include "fakes.hpp"
#include "wifi_errors.hpp"
#include "wifi_saved_networks.hpp"
#include <gtest/gtest.h>

namespace wifiprov {

class SavedNetworksTest : public ::testing::Test {
protected:
    SavedNetworksTest() : store(gateway) {
        gateway.addNetwork("Home", "home-pass");
        homeId = gateway.addProfile("Home", "home-pass");
        cafeId = gateway.addProfile("Cafe", "");
    }

    fakes::FakeGateway gateway;
    SavedNetworkStore store;
    std::string homeId;
    std::string cafeId;
};

TEST_F(SavedNetworksTest, ListsProfilesWithCredentialPresence) {
    gateway.joinProfile(homeId);

    auto profiles = store.list();

    ASSERT_EQ(2u, profiles.size());
    EXPECT_EQ("Home", profiles[0].ssid);
    EXPECT_TRUE(profiles[0].hasCredential);
    EXPECT_TRUE(profiles[0].isCurrent);
    EXPECT_EQ("Cafe", profiles[1].ssid);
    EXPECT_FALSE(profiles[1].hasCredential);
    EXPECT_FALSE(profiles[1].isCurrent);
}

TEST_F(SavedNetworksTest, ForgetRemovesProfile) {
    EXPECT_TRUE(store.forget(cafeId));

    auto profiles = store.list();
    ASSERT_EQ(1u, profiles.size());
    EXPECT_EQ(homeId, profiles[0].id);
}

TEST_F(SavedNetworksTest, ForgetUnknownIdReturnsFalse) {
    EXPECT_FALSE(store.forget("no-such-uuid"));
    EXPECT_EQ(0, gateway.count("deleteProfile"));
    EXPECT_EQ(2u, store.list().size());
}

TEST_F(SavedNetworksTest, ForgetActiveNetworkIsRefused) {
    gateway.joinProfile(homeId);

    EXPECT_THROW(store.forget(homeId), CannotForgetActiveNetworkError);
    EXPECT_EQ(0, gateway.count("deleteProfile"));
    EXPECT_TRUE(gateway.connectedTo("Home"));
}

TEST_F(SavedNetworksTest, ForgetInactiveProfileWhileConnectedElsewhere) {
    gateway.joinProfile(homeId);

    EXPECT_TRUE(store.forget(cafeId));
    EXPECT_TRUE(gateway.connectedTo("Home"));
}

} // namespace wifiprov
