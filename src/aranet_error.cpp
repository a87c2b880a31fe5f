#include "aranet_error.h"

namespace aranet {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::AdapterUnavailable:  return "AdapterUnavailable";
        case ErrorCode::AdapterUnauthorized: return "AdapterUnauthorized";
        case ErrorCode::AdapterUnsupported:  return "AdapterUnsupported";
        case ErrorCode::DeviceNotFound:      return "DeviceNotFound";
        case ErrorCode::ConnectionFailed:    return "ConnectionFailed";
        case ErrorCode::ReadFailed:          return "ReadFailed";
        case ErrorCode::InvalidData:         return "InvalidData";
        case ErrorCode::Timeout:             return "Timeout";
        case ErrorCode::PairingRequired:     return "PairingRequired";
    }
    return "Unknown";
}

std::string error_description(ErrorCode code) {
    switch (code) {
        case ErrorCode::AdapterUnavailable:
            return "Bluetooth is unavailable or not powered on";
        case ErrorCode::AdapterUnauthorized:
            return "Bluetooth access is not authorized. Check that this user may access the "
                   "Bluetooth adapter (e.g. membership of the 'bluetooth' group).";
        case ErrorCode::AdapterUnsupported:
            return "No Bluetooth Low Energy adapter found on this machine";
        case ErrorCode::DeviceNotFound:
            return "Device not found";
        case ErrorCode::ConnectionFailed:
            return "Failed to connect to device";
        case ErrorCode::ReadFailed:
            return "Failed to read characteristic";
        case ErrorCode::InvalidData:
            return "Invalid data received";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::PairingRequired:
            return "Device pairing required. The device will display a PIN code.\n"
                   "\n"
                   "Pair the sensor with the system Bluetooth manager first, for example:\n"
                   "  bluetoothctl pair <device address>\n"
                   "and enter the PIN shown on the Aranet display when prompted.\n"
                   "\n"
                   "If pairing does not start:\n"
                   "1. Make sure the device is showing the PIN (it may time out)\n"
                   "2. Try running the command again\n"
                   "3. The PIN is usually a 6-digit number like 122867";
    }
    return "Unknown error";
}

static std::string compose_message(ErrorCode code, const std::string& detail) {
    std::string msg = error_description(code);
    if (!detail.empty()) msg += " (" + detail + ")";
    return msg;
}

Error::Error(ErrorCode code)
    : std::runtime_error(error_description(code)), code_(code) {}

Error::Error(ErrorCode code, const std::string& detail)
    : std::runtime_error(compose_message(code, detail)), code_(code), detail_(detail) {}

DecodeError::DecodeError(Reason reason, const std::string& detail)
    : Error(ErrorCode::InvalidData, detail), reason_(reason) {}

} // namespace aranet
