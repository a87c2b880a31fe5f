#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "aranet_types.h"

namespace aranet {

enum class AdapterState {
    Unknown,
    PoweredOn,
    PoweredOff,
    Unauthorized,
    Unsupported
};

enum class ReadStatus {
    Ok,
    AuthFailure,   // insufficient authentication/encryption
    Error
};

// Asynchronous BLE central primitives. Every result arrives through the
// callback; implementations may invoke callbacks from any thread, including
// synchronously from within the call.
class BleAdapter {
public:
    using StateCallback = std::function<void(AdapterState)>;
    using ScanFoundCallback = std::function<void(const DeviceIdentity&)>;
    // Empty error string means success.
    using ConnectCallback = std::function<void(const std::string& error)>;
    using ServicesCallback =
        std::function<void(const std::vector<std::string>& services, const std::string& error)>;
    using CharacteristicsCallback =
        std::function<void(const std::string& service,
                           const std::vector<std::string>& characteristics,
                           const std::string& error)>;
    using ReadCallback =
        std::function<void(const std::string& characteristic, ReadStatus status,
                           const std::vector<uint8_t>& value, const std::string& error)>;

    virtual ~BleAdapter() = default;

    virtual AdapterState state() = 0;
    virtual void set_state_callback(StateCallback on_state) = 0;

    virtual void scan_start(const std::vector<std::string>& service_filter,
                            ScanFoundCallback on_found) = 0;
    virtual void scan_stop() = 0;

    virtual bool is_connected(const DeviceIdentity& device) = 0;
    virtual void connect(const DeviceIdentity& device, ConnectCallback on_done) = 0;
    virtual void discover_services(const DeviceIdentity& device, ServicesCallback on_done) = 0;
    virtual void discover_characteristics(const DeviceIdentity& device, const std::string& service,
                                          CharacteristicsCallback on_done) = 0;
    virtual void read_value(const DeviceIdentity& device, const std::string& service,
                            const std::string& characteristic, ReadCallback on_done) = 0;
    virtual void disconnect(const DeviceIdentity& device) = 0;
};

} // namespace aranet
