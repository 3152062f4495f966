#include "wifi_api.hpp"
#include "wifi_errors.hpp"
#include "wifi_logger.hpp"
#include <cJSON.h>

namespace wifiprov {

namespace {

constexpr int HTTP_OK = 200;
constexpr int HTTP_BAD_REQUEST = 400;
constexpr int HTTP_NOT_FOUND = 404;
constexpr int HTTP_METHOD_NOT_ALLOWED = 405;
constexpr int HTTP_CONFLICT = 409;
constexpr int HTTP_INTERNAL_ERROR = 500;

ApiResponse ok(const std::string& message, cJSON* data = nullptr) {
    ApiResponse response;
    response.success = true;
    response.message = message;
    response.data.reset(data);
    return response;
}

ApiResponse failure(int httpStatus, const std::string& message, cJSON* data = nullptr) {
    ApiResponse response;
    response.httpStatus = httpStatus;
    response.success = false;
    response.message = message;
    response.data.reset(data);
    return response;
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidRequest:
        case ErrorCode::CannotForgetActiveNetwork:
            return HTTP_BAD_REQUEST;
        case ErrorCode::NotFound:
            return HTTP_NOT_FOUND;
        case ErrorCode::AttemptInProgress:
            return HTTP_CONFLICT;
        default:
            return HTTP_INTERNAL_ERROR;
    }
}

ApiResponse fromError(const WifiError& e) {
    Logger::getInstance().error("Request failed (", toString(e.code()), "): ", e.what());
    return failure(httpStatusFor(e.code()), e.what());
}

void addOptionalString(cJSON* object, const char* key, const std::optional<std::string>& value) {
    if (value) {
        cJSON_AddStringToObject(object, key, value->c_str());
    } else {
        cJSON_AddNullToObject(object, key);
    }
}

void addOptionalNumber(cJSON* object, const char* key, const std::optional<int>& value) {
    if (value) {
        cJSON_AddNumberToObject(object, key, *value);
    } else {
        cJSON_AddNullToObject(object, key);
    }
}

cJSON* statusToJson(const SystemStatus& status) {
    cJSON* json = cJSON_CreateObject();
    cJSON_AddStringToObject(json, "mode", toString(status.mode));
    cJSON_AddBoolToObject(json, "connected", status.mode == DeviceMode::ClientConnected);
    addOptionalString(json, "ssid", status.ssid);
    addOptionalString(json, "ip_address", status.ip);
    addOptionalNumber(json, "signal_strength", status.signal);
    return json;
}

cJSON* networkToJson(const NetworkInfo& network) {
    cJSON* json = cJSON_CreateObject();
    cJSON_AddStringToObject(json, "ssid", network.ssid.c_str());
    cJSON_AddNumberToObject(json, "signal", network.signalStrength);
    cJSON_AddStringToObject(json, "encryption", network.getSecurityString().c_str());
    cJSON_AddStringToObject(json, "frequency", network.getBandString().c_str());
    cJSON_AddNumberToObject(json, "channel", network.channel);
    return json;
}

cJSON* profileToJson(const NetworkProfile& profile) {
    cJSON* json = cJSON_CreateObject();
    cJSON_AddStringToObject(json, "id", profile.id.c_str());
    cJSON_AddStringToObject(json, "name", profile.name.c_str());
    cJSON_AddStringToObject(json, "ssid", profile.ssid.c_str());
    cJSON_AddBoolToObject(json, "current", profile.isCurrent);
    cJSON_AddBoolToObject(json, "disabled", profile.isDisabled);
    cJSON_AddBoolToObject(json, "has_password", profile.hasCredential);
    return json;
}

// "/api/wifi/saved/?x=1" -> "/wifi/saved"
std::string normalizePath(const std::string& raw) {
    std::string path = raw.substr(0, raw.find('?'));
    const std::string prefix = "/api";
    if (path.compare(0, prefix.size(), prefix) == 0 &&
        (path.size() == prefix.size() || path[prefix.size()] == '/')) {
        path.erase(0, prefix.size());
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

void JsonDeleter::operator()(cJSON* json) const {
    cJSON_Delete(json);
}

std::string ApiResponse::toJson() const {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddBoolToObject(root, "success", success);
    cJSON_AddStringToObject(root, "message", message.c_str());
    if (data) {
        cJSON_AddItemToObject(root, "data", cJSON_Duplicate(data.get(), 1));
    } else {
        cJSON_AddNullToObject(root, "data");
    }

    char* printed = cJSON_PrintUnformatted(root);
    std::string result = printed ? printed : "";
    cJSON_free(printed);
    cJSON_Delete(root);
    return result;
}

WifiApi::WifiApi(WifiManager& manager) : manager(manager) {}

ApiResponse WifiApi::getStatus() {
    try {
        return ok("WiFi status retrieved", statusToJson(manager.getStatus()));
    } catch (const WifiError& e) {
        return fromError(e);
    } catch (const std::exception& e) {
        return failure(HTTP_INTERNAL_ERROR, e.what());
    }
}

ApiResponse WifiApi::scan() {
    try {
        auto networks = manager.scan();
        cJSON* list = cJSON_CreateArray();
        for (const auto& network : networks) {
            cJSON_AddItemToArray(list, networkToJson(network));
        }
        return ok("Found " + std::to_string(networks.size()) + " networks", list);
    } catch (const WifiError& e) {
        return fromError(e);
    } catch (const std::exception& e) {
        return failure(HTTP_INTERNAL_ERROR, e.what());
    }
}

ApiResponse WifiApi::connect(const std::string& body) {
    JsonPtr request(cJSON_Parse(body.c_str()));
    if (!request || !cJSON_IsObject(request.get())) {
        return failure(HTTP_BAD_REQUEST, "Request body must be a JSON object");
    }

    const cJSON* ssid = cJSON_GetObjectItemCaseSensitive(request.get(), "ssid");
    if (!cJSON_IsString(ssid) || ssid->valuestring == nullptr) {
        return failure(HTTP_BAD_REQUEST, "Field 'ssid' is required");
    }
    std::string password;
    const cJSON* passwordItem = cJSON_GetObjectItemCaseSensitive(request.get(), "password");
    if (passwordItem && !cJSON_IsNull(passwordItem)) {
        if (!cJSON_IsString(passwordItem) || passwordItem->valuestring == nullptr) {
            return failure(HTTP_BAD_REQUEST, "Field 'password' must be a string");
        }
        password = passwordItem->valuestring;
    }

    ConnectRequest connectRequest{ssid->valuestring, password};
    std::string invalid = ConnectionOrchestrator::validate(connectRequest);
    if (!invalid.empty()) {
        return failure(HTTP_BAD_REQUEST, invalid);
    }

    ConnectionResult result;
    try {
        result = manager.connect(connectRequest.ssid, connectRequest.credential);
    } catch (const WifiError& e) {
        return fromError(e);
    } catch (const std::exception& e) {
        return failure(HTTP_INTERNAL_ERROR, e.what());
    }

    cJSON* data = cJSON_CreateObject();
    cJSON_AddStringToObject(data, "ssid", connectRequest.ssid.c_str());

    if (result.success) {
        addOptionalString(data, "ip_address", result.ip);
        cJSON_AddNumberToObject(data, "attempts", result.attempts);
        return ok(result.message, data);
    }

    if (result.code == ErrorCode::AllAttemptsFailed) {
        cJSON_AddNumberToObject(data, "attempts", result.attempts);
        cJSON_AddNumberToObject(data, "timeout",
                                static_cast<double>(RetryPolicy().attemptTimeout.count()));
        cJSON_AddStringToObject(data, "error", result.message.c_str());
        return failure(HTTP_OK, "Failed to connect to '" + connectRequest.ssid +
                                "'. Check password and try again.", data);
    }

    cJSON_AddStringToObject(data, "error", result.message.c_str());
    return failure(httpStatusFor(result.code), result.message, data);
}

ApiResponse WifiApi::listSaved() {
    try {
        auto profiles = manager.listSaved();
        cJSON* list = cJSON_CreateArray();
        for (const auto& profile : profiles) {
            cJSON_AddItemToArray(list, profileToJson(profile));
        }
        cJSON* data = cJSON_CreateObject();
        cJSON_AddItemToObject(data, "networks", list);
        return ok("Found " + std::to_string(profiles.size()) + " saved networks", data);
    } catch (const WifiError& e) {
        return fromError(e);
    } catch (const std::exception& e) {
        return failure(HTTP_INTERNAL_ERROR, e.what());
    }
}

ApiResponse WifiApi::forget(const std::string& id) {
    try {
        std::string ssid;
        for (const auto& profile : manager.listSaved()) {
            if (profile.id == id) {
                ssid = profile.ssid;
            }
        }
        if (ssid.empty() || !manager.forget(id)) {
            return failure(httpStatusFor(ErrorCode::NotFound), "Network ID " + id + " not found");
        }
        return ok("Successfully forgot network: " + ssid);
    } catch (const WifiError& e) {
        return fromError(e);
    } catch (const std::exception& e) {
        return failure(HTTP_INTERNAL_ERROR, e.what());
    }
}

ApiResponse WifiApi::enableHotspotMode() {
    try {
        manager.enableHotspotMode();
        const HotspotConfig& hotspot = manager.config().hotspot;
        cJSON* data = cJSON_CreateObject();
        cJSON_AddStringToObject(data, "ssid", hotspot.ssid.c_str());
        cJSON_AddStringToObject(data, "ip_address", hotspot.ipAddress.c_str());
        return ok("Hotspot mode enabled. Join '" + hotspot.ssid + "' to configure WiFi", data);
    } catch (const WifiError& e) {
        return fromError(e);
    } catch (const std::exception& e) {
        return failure(HTTP_INTERNAL_ERROR, e.what());
    }
}

ApiResponse WifiApi::dispatch(const std::string& method, const std::string& path,
                              const std::string& body) {
    const std::string route = normalizePath(path);
    const std::string savedPrefix = "/wifi/saved/";

    if (route == "/wifi/status") {
        if (method == "GET") return getStatus();
    } else if (route == "/wifi/scan") {
        if (method == "POST") return scan();
    } else if (route == "/wifi/connect") {
        if (method == "POST") return connect(body);
    } else if (route == "/wifi/saved") {
        if (method == "GET") return listSaved();
    } else if (route.compare(0, savedPrefix.size(), savedPrefix) == 0) {
        if (method == "DELETE") return forget(route.substr(savedPrefix.size()));
    } else if (route == "/wifi/hotspot-mode" || route == "/system/reset") {
        if (method == "POST") return enableHotspotMode();
    } else {
        return failure(HTTP_NOT_FOUND, "No route for " + method + " " + route);
    }
    return failure(HTTP_METHOD_NOT_ALLOWED, "Method " + method + " not allowed on " + route);
}

} // namespace wifiprov
