#include "wifi_errors.hpp"

namespace wifiprov {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                      return "none";
        case ErrorCode::InterfaceNotFound:         return "interface_not_found";
        case ErrorCode::HotspotActivation:         return "hotspot_activation";
        case ErrorCode::ConnectionTimeout:         return "connection_timeout";
        case ErrorCode::AllAttemptsFailed:         return "all_attempts_failed";
        case ErrorCode::CannotForgetActiveNetwork: return "cannot_forget_active_network";
        case ErrorCode::ConfigWrite:               return "config_write";
        case ErrorCode::AttemptInProgress:         return "attempt_in_progress";
        case ErrorCode::GatewayFailure:            return "gateway_failure";
        case ErrorCode::InvalidRequest:            return "invalid_request";
        case ErrorCode::NotFound:                  return "not_found";
        default:                                   return "unknown";
    }
}

} // namespace wifiprov
