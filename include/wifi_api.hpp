#pragma once

#include "wifi_manager.hpp"
#include <memory>
#include <string>

struct cJSON;

namespace wifiprov {

struct JsonDeleter {
    void operator()(cJSON* json) const;
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

// {success, message, data} envelope returned by every request
struct ApiResponse {
    int httpStatus = 200;
    bool success = false;
    std::string message;
    JsonPtr data;

    std::string toJson() const;
};

// Request surface of the provisioning service, transport independent.
// Handlers never throw; failures become an unsuccessful envelope.
class WifiApi {
public:
    explicit WifiApi(WifiManager& manager);

    ApiResponse getStatus();
    ApiResponse scan();
    ApiResponse connect(const std::string& body);
    ApiResponse listSaved();
    ApiResponse forget(const std::string& id);
    ApiResponse enableHotspotMode();

    // Routes "GET /wifi/status" style requests to the handlers above
    ApiResponse dispatch(const std::string& method, const std::string& path,
                         const std::string& body);

private:
    WifiManager& manager;
};

} // namespace wifiprov
