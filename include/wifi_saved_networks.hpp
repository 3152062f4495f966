#pragma once

#include "wifi_gateway.hpp"
#include "wifi_types.hpp"
#include <string>
#include <vector>

namespace wifiprov {

// Saved client networks known to the host network stack
class SavedNetworkStore {
public:
    explicit SavedNetworkStore(NetworkGateway& gateway);

    std::vector<NetworkProfile> list();

    /**
     * Removes a saved network.
     *
     * @return false if no saved network has this id
     * @throws CannotForgetActiveNetworkError if it is the network in use
     * @throws GatewayError if the host stack refuses the deletion
     */
    bool forget(const std::string& id);

private:
    NetworkGateway& gateway;
};

} // namespace wifiprov
