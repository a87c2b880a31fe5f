#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "simpleble/SimpleBLE.h"

#include "ble_adapter.h"
#include "executor.h"

namespace aranet {

// BleAdapter on top of SimpleBLE's first adapter. SimpleBLE calls block, so
// connect/discover/read run on a private I/O thread and report through the
// callbacks. Peripherals are remembered by address from the last scan.
class SimpleBleAdapter : public BleAdapter {
public:
    SimpleBleAdapter();
    ~SimpleBleAdapter() override;

    AdapterState state() override;
    void set_state_callback(StateCallback on_state) override;

    void scan_start(const std::vector<std::string>& service_filter, ScanFoundCallback on_found) override;
    void scan_stop() override;

    bool is_connected(const DeviceIdentity& device) override;
    void connect(const DeviceIdentity& device, ConnectCallback on_done) override;
    void discover_services(const DeviceIdentity& device, ServicesCallback on_done) override;
    void discover_characteristics(const DeviceIdentity& device, const std::string& service,
                                  CharacteristicsCallback on_done) override;
    void read_value(const DeviceIdentity& device, const std::string& service,
                    const std::string& characteristic, ReadCallback on_done) override;
    void disconnect(const DeviceIdentity& device) override;

private:
    std::optional<SimpleBLE::Adapter> adapter();
    std::optional<SimpleBLE::Peripheral> peripheral(const std::string& id);

    std::mutex mutex_;
    std::optional<SimpleBLE::Adapter> adapter_;
    std::unordered_map<std::string, SimpleBLE::Peripheral> peripherals_;   // lower-case address
    StateCallback on_state_;
    AdapterState last_state_ = AdapterState::Unknown;

    Executor io_;
};

} // namespace aranet
