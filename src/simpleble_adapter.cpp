#include <iostream>

#include "catalog.h"
#include "logging.h"
#include "simpleble_adapter.h"

namespace aranet {

static std::optional<SimpleBLE::Adapter> get_first_adapter() {
    try {
        auto adapters = SimpleBLE::Adapter::get_adapters();
        if (adapters.empty()) return std::nullopt;
        return adapters.front();
    } catch (const std::exception& e) {
        std::cerr << "Adapter enumeration failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

// Platform stacks word this differently; BlueZ says "NotPermitted"/"NotAuthorized".
static bool is_auth_failure(const std::string& what) {
    const std::string m = to_lower(what);
    for (const char* key : {"auth", "encrypt", "notpermitted", "not permitted", "insufficient"}) {
        if (m.find(key) != std::string::npos) return true;
    }
    return false;
}

static bool is_permission_error(const std::string& what) {
    const std::string m = to_lower(what);
    return m.find("permission") != std::string::npos || m.find("access denied") != std::string::npos ||
           m.find("not authorized") != std::string::npos;
}

static bool matches_filter(SimpleBLE::Peripheral& p, const std::vector<std::string>& filter) {
    for (auto& [company, data] : p.manufacturer_data()) {
        if (company == MANUFACTURER_ID_SAF_TEHNIKA) return true;
    }
    if (filter.empty()) return true;
    for (auto& service : p.services()) {
        for (const auto& wanted : filter) {
            if (uuid_equals(service.uuid(), wanted)) return true;
        }
    }
    return false;
}

SimpleBleAdapter::SimpleBleAdapter() = default;

SimpleBleAdapter::~SimpleBleAdapter() {
    io_.stop();

    // Disconnects still queued on the I/O thread were dropped by stop().
    std::lock_guard<std::mutex> lk(mutex_);
    if (adapter_) adapter_->set_callback_on_scan_found({});
    if (adapter_) adapter_->set_callback_on_scan_updated({});
    for (auto& [address, p] : peripherals_) {
        try {
            if (p.is_connected()) p.disconnect();
        } catch (const std::exception& e) {
            std::cerr << "Disconnect failed on " << address << ": " << e.what() << std::endl;
        }
    }
}

std::optional<SimpleBLE::Adapter> SimpleBleAdapter::adapter() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!adapter_) adapter_ = get_first_adapter();
    return adapter_;
}

std::optional<SimpleBLE::Peripheral> SimpleBleAdapter::peripheral(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = peripherals_.find(to_lower(id));
    if (it == peripherals_.end()) return std::nullopt;
    return it->second;
}

AdapterState SimpleBleAdapter::state() {
    AdapterState current = AdapterState::Unknown;
    try {
        if (!adapter()) {
            current = AdapterState::Unsupported;
        } else if (!SimpleBLE::Adapter::bluetooth_enabled()) {
            current = AdapterState::PoweredOff;
        } else {
            current = AdapterState::PoweredOn;
        }
    } catch (const std::exception& e) {
        ARANET_DEBUG << "Adapter state query failed: " << e.what() << std::endl;
        current = is_permission_error(e.what()) ? AdapterState::Unauthorized : AdapterState::Unknown;
    }

    // SimpleBLE has no power-state notification; report changes seen while polling.
    StateCallback notify;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (current != last_state_) {
            last_state_ = current;
            notify = on_state_;
        }
    }
    if (notify) notify(current);
    return current;
}

void SimpleBleAdapter::set_state_callback(StateCallback on_state) {
    std::lock_guard<std::mutex> lk(mutex_);
    on_state_ = std::move(on_state);
}

void SimpleBleAdapter::scan_start(const std::vector<std::string>& service_filter, ScanFoundCallback on_found) {
    auto a = adapter();
    if (!a) throw std::runtime_error("No Bluetooth adapter found.");

    auto on_peripheral = [this, service_filter, on_found](SimpleBLE::Peripheral p) {
        try {
            if (!p.is_connectable() || !matches_filter(p, service_filter)) return;
            const std::string address = p.address();
            if (address.empty()) return;
            {
                std::lock_guard<std::mutex> lk(mutex_);
                peripherals_[to_lower(address)] = p;
            }
            DeviceIdentity identity{address, std::nullopt};
            const std::string name = p.identifier();
            if (!name.empty()) identity.name = name;
            on_found(identity);
        } catch (const std::exception& e) {
            std::cerr << "Scan result dropped: " << e.what() << std::endl;
        }
    };
    a->set_callback_on_scan_found(on_peripheral);
    a->set_callback_on_scan_updated(on_peripheral);
    a->scan_start();
}

void SimpleBleAdapter::scan_stop() {
    auto a = adapter();
    if (!a) return;
    a->scan_stop();
    a->set_callback_on_scan_found({});
    a->set_callback_on_scan_updated({});
}

bool SimpleBleAdapter::is_connected(const DeviceIdentity& device) {
    auto p = peripheral(device.id);
    return p && p->is_connected();
}

void SimpleBleAdapter::connect(const DeviceIdentity& device, ConnectCallback on_done) {
    io_.post([this, device, on_done]() {
        auto p = peripheral(device.id);
        if (!p) {
            on_done("peripheral " + device.id + " was not seen in a scan");
            return;
        }
        try {
            p->connect();
            on_done("");
        } catch (const std::exception& e) {
            on_done(e.what());
        }
    });
}

void SimpleBleAdapter::discover_services(const DeviceIdentity& device, ServicesCallback on_done) {
    io_.post([this, device, on_done]() {
        auto p = peripheral(device.id);
        if (!p) {
            on_done({}, "peripheral " + device.id + " is unknown");
            return;
        }
        std::vector<std::string> uuids;
        try {
            for (auto& service : p->services()) uuids.push_back(service.uuid());
        } catch (const std::exception& e) {
            on_done({}, e.what());
            return;
        }
        on_done(uuids, "");
    });
}

void SimpleBleAdapter::discover_characteristics(const DeviceIdentity& device, const std::string& service,
                                                CharacteristicsCallback on_done) {
    io_.post([this, device, service, on_done]() {
        auto p = peripheral(device.id);
        if (!p) {
            on_done(service, {}, "peripheral " + device.id + " is unknown");
            return;
        }
        std::vector<std::string> uuids;
        try {
            for (auto& s : p->services()) {
                if (!uuid_equals(s.uuid(), service)) continue;
                for (auto& chr : s.characteristics()) uuids.push_back(chr.uuid());
            }
        } catch (const std::exception& e) {
            on_done(service, {}, e.what());
            return;
        }
        on_done(service, uuids, "");
    });
}

void SimpleBleAdapter::read_value(const DeviceIdentity& device, const std::string& service,
                                  const std::string& characteristic, ReadCallback on_done) {
    io_.post([this, device, service, characteristic, on_done]() {
        auto p = peripheral(device.id);
        if (!p) {
            on_done(characteristic, ReadStatus::Error, {}, "peripheral " + device.id + " is unknown");
            return;
        }
        try {
            // SimpleBLE wants the uuid spelled the way it reported it.
            SimpleBLE::BluetoothUUID service_uuid = service;
            SimpleBLE::BluetoothUUID char_uuid = characteristic;
            for (auto& s : p->services()) {
                if (!uuid_equals(s.uuid(), service)) continue;
                service_uuid = s.uuid();
                for (auto& chr : s.characteristics()) {
                    if (uuid_equals(chr.uuid(), characteristic)) char_uuid = chr.uuid();
                }
            }

            SimpleBLE::ByteArray bytes = p->read(service_uuid, char_uuid);
            on_done(characteristic, ReadStatus::Ok, std::vector<uint8_t>(bytes.begin(), bytes.end()), "");
        } catch (const std::exception& e) {
            const ReadStatus status = is_auth_failure(e.what()) ? ReadStatus::AuthFailure : ReadStatus::Error;
            on_done(characteristic, status, {}, e.what());
        }
    });
}

void SimpleBleAdapter::disconnect(const DeviceIdentity& device) {
    io_.post([this, device]() {
        auto p = peripheral(device.id);
        if (!p) return;
        try {
            if (p->is_connected()) p->disconnect();
        } catch (const std::exception& e) {
            std::cerr << "Disconnect failed on " << device.id << ": " << e.what() << std::endl;
        }
    });
}

} // namespace aranet
