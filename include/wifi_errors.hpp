#pragma once

#include <stdexcept>
#include <string>

namespace wifiprov {

enum class ErrorCode {
    None,
    InterfaceNotFound,
    HotspotActivation,
    ConnectionTimeout,
    AllAttemptsFailed,
    CannotForgetActiveNetwork,
    ConfigWrite,
    AttemptInProgress,
    GatewayFailure,
    InvalidRequest,
    NotFound
};

const char* toString(ErrorCode code);

// Base of all errors raised by wifiprov. what() is a short message that is
// safe to show to an end user; raw subprocess output never ends up here.
class WifiError : public std::runtime_error {
public:
    WifiError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}

    ErrorCode code() const noexcept { return errorCode; }

private:
    ErrorCode errorCode;
};

class InterfaceNotFoundError : public WifiError {
public:
    explicit InterfaceNotFoundError(const std::string& ifname)
        : WifiError(ErrorCode::InterfaceNotFound, "Wireless interface " + ifname + " not found") {}
};

class HotspotActivationError : public WifiError {
public:
    explicit HotspotActivationError(const std::string& message)
        : WifiError(ErrorCode::HotspotActivation, message) {}
};

class ConnectionTimeoutError : public WifiError {
public:
    explicit ConnectionTimeoutError(const std::string& ssid)
        : WifiError(ErrorCode::ConnectionTimeout, "Timed out connecting to '" + ssid + "'") {}
};

class AllAttemptsFailedError : public WifiError {
public:
    explicit AllAttemptsFailedError(const std::string& message)
        : WifiError(ErrorCode::AllAttemptsFailed, message) {}
};

class CannotForgetActiveNetworkError : public WifiError {
public:
    explicit CannotForgetActiveNetworkError(const std::string& ssid)
        : WifiError(ErrorCode::CannotForgetActiveNetwork,
                    "Cannot forget currently connected network '" + ssid +
                    "'. Connect to another network first.") {}
};

class ConfigWriteError : public WifiError {
public:
    explicit ConfigWriteError(const std::string& message)
        : WifiError(ErrorCode::ConfigWrite, message) {}
};

class AttemptInProgressError : public WifiError {
public:
    AttemptInProgressError()
        : WifiError(ErrorCode::AttemptInProgress, "A connection attempt is already in progress") {}
};

class GatewayError : public WifiError {
public:
    explicit GatewayError(const std::string& message)
        : WifiError(ErrorCode::GatewayFailure, message) {}
};

} // namespace wifiprov
