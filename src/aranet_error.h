#pragma once

#include <stdexcept>
#include <string>

namespace aranet {

enum class ErrorCode {
    AdapterUnavailable,
    AdapterUnauthorized,
    AdapterUnsupported,
    DeviceNotFound,
    ConnectionFailed,
    ReadFailed,
    InvalidData,
    Timeout,
    PairingRequired
};

// Short, stable name ("ReadFailed") for logs and tests.
const char* error_code_name(ErrorCode code);

// Default user-facing text for a code. PairingRequired carries the pairing steps.
std::string error_description(ErrorCode code);

class Error : public std::runtime_error {
public:
    explicit Error(ErrorCode code);
    Error(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

// Payload could not be turned into a Reading. Always reports ErrorCode::InvalidData.
class DecodeError : public Error {
public:
    enum class Reason {
        TooShort,
        UnknownCharacteristic,
        UnknownDeviceType,
        UnsupportedDeviceType
    };

    DecodeError(Reason reason, const std::string& detail);

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

} // namespace aranet
