#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "ble_adapter.h"
#include "catalog.h"

namespace aranet::test {

// Scripted BleAdapter. Results are delivered synchronously from inside each
// call unless reads or characteristic lists are deferred, in which case
// release_reads()/release_characteristics() deliver them from the calling thread.
class FakeAdapter : public BleAdapter {
public:
    struct Response {
        ReadStatus status = ReadStatus::Ok;
        std::vector<uint8_t> value;
        std::string error;
    };

    // --- scripting ---------------------------------------------------------

    void set_state(AdapterState state) {
        std::lock_guard<std::mutex> lk(mutex_);
        state_ = state;
    }

    void add_advertisement(const DeviceIdentity& device) {
        std::lock_guard<std::mutex> lk(mutex_);
        advertisements_.push_back(device);
    }

    void add_service(const std::string& service, const std::vector<std::string>& characteristics) {
        std::lock_guard<std::mutex> lk(mutex_);
        services_[service] = characteristics;
    }

    void set_response(const std::string& characteristic, Response response) {
        std::lock_guard<std::mutex> lk(mutex_);
        responses_[normalize_uuid(characteristic)] = std::move(response);
    }

    void set_connect_error(const std::string& error) {
        std::lock_guard<std::mutex> lk(mutex_);
        connect_error_ = error;
    }

    // connect() never reports back.
    void set_connect_hangs(bool hangs) {
        std::lock_guard<std::mutex> lk(mutex_);
        connect_hangs_ = hangs;
    }

    void set_defer_reads(bool defer) {
        std::lock_guard<std::mutex> lk(mutex_);
        defer_reads_ = defer;
    }

    // Delivers deferred read results; returns how many were delivered.
    size_t release_reads() {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            pending.swap(deferred_);
        }
        for (auto& deliver : pending) deliver();
        return pending.size();
    }

    size_t deferred_reads() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return deferred_.size();
    }

    // is_connected() answers `connected`, so connect() is skipped.
    void set_connected(bool connected) {
        std::lock_guard<std::mutex> lk(mutex_);
        connected_ = connected;
    }

    void set_services_error(const std::string& error) {
        std::lock_guard<std::mutex> lk(mutex_);
        services_error_ = error;
    }

    void set_characteristics_error(const std::string& service, const std::string& error) {
        std::lock_guard<std::mutex> lk(mutex_);
        characteristics_errors_[service] = error;
    }

    void set_defer_characteristics(bool defer) {
        std::lock_guard<std::mutex> lk(mutex_);
        defer_characteristics_ = defer;
    }

    // Delivers the deferred characteristic list of one service.
    bool release_characteristics(const std::string& service) {
        std::function<void()> deliver;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto it = deferred_characteristics_.find(service);
            if (it == deferred_characteristics_.end()) return false;
            deliver = std::move(it->second);
            deferred_characteristics_.erase(it);
        }
        deliver();
        return true;
    }

    size_t release_characteristics() {
        std::map<std::string, std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            pending.swap(deferred_characteristics_);
        }
        for (auto& kv : pending) kv.second();
        return pending.size();
    }

    size_t deferred_characteristics() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return deferred_characteristics_.size();
    }

    // Fires the registered state callback, as a platform power change would.
    void emit_state(AdapterState state) {
        StateCallback cb;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            state_ = state;
            cb = on_state_;
        }
        if (cb) cb(state);
    }

    std::atomic<int> scan_starts{0};
    std::atomic<int> scan_stops{0};
    std::atomic<int> connects{0};
    std::atomic<int> reads{0};
    std::atomic<int> disconnects{0};

    // --- BleAdapter ----------------------------------------------------------

    AdapterState state() override {
        std::lock_guard<std::mutex> lk(mutex_);
        return state_;
    }

    void set_state_callback(StateCallback on_state) override {
        std::lock_guard<std::mutex> lk(mutex_);
        on_state_ = std::move(on_state);
    }

    void scan_start(const std::vector<std::string>&, ScanFoundCallback on_found) override {
        ++scan_starts;
        std::vector<DeviceIdentity> ads;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            ads = advertisements_;
        }
        for (const auto& d : ads) on_found(d);
    }

    void scan_stop() override { ++scan_stops; }

    bool is_connected(const DeviceIdentity&) override {
        std::lock_guard<std::mutex> lk(mutex_);
        return connected_;
    }

    void connect(const DeviceIdentity&, ConnectCallback on_done) override {
        ++connects;
        std::string error;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (connect_hangs_) return;
            error = connect_error_;
        }
        on_done(error);
    }

    void discover_services(const DeviceIdentity&, ServicesCallback on_done) override {
        std::vector<std::string> services;
        std::string error;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            error = services_error_;
            if (error.empty()) {
                for (const auto& kv : services_) services.push_back(kv.first);
            }
        }
        on_done(services, error);
    }

    void discover_characteristics(const DeviceIdentity&, const std::string& service,
                                  CharacteristicsCallback on_done) override {
        std::vector<std::string> chars;
        std::string error;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto err = characteristics_errors_.find(service);
            if (err != characteristics_errors_.end()) error = err->second;
            auto it = services_.find(service);
            if (it != services_.end() && error.empty()) chars = it->second;
            if (defer_characteristics_) {
                deferred_characteristics_[service] = [on_done, service, chars, error]() {
                    on_done(service, chars, error);
                };
                return;
            }
        }
        on_done(service, chars, error);
    }

    void read_value(const DeviceIdentity&, const std::string&, const std::string& characteristic,
                    ReadCallback on_done) override {
        ++reads;
        Response response{ReadStatus::Error, {}, "no response scripted"};
        bool defer = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto it = responses_.find(normalize_uuid(characteristic));
            if (it != responses_.end()) response = it->second;
            defer = defer_reads_;
            if (defer) {
                deferred_.push_back([on_done, characteristic, response]() {
                    on_done(characteristic, response.status, response.value, response.error);
                });
            }
        }
        if (!defer) on_done(characteristic, response.status, response.value, response.error);
    }

    void disconnect(const DeviceIdentity&) override { ++disconnects; }

private:
    mutable std::mutex mutex_;
    AdapterState state_ = AdapterState::PoweredOn;
    StateCallback on_state_;
    std::vector<DeviceIdentity> advertisements_;
    std::map<std::string, std::vector<std::string>> services_;
    std::map<std::string, Response> responses_;
    std::string connect_error_;
    bool connect_hangs_ = false;
    bool connected_ = false;
    std::string services_error_;
    std::map<std::string, std::string> characteristics_errors_;
    bool defer_characteristics_ = false;
    std::map<std::string, std::function<void()>> deferred_characteristics_;
    bool defer_reads_ = false;
    std::vector<std::function<void()>> deferred_;
};

// Thirteen-byte Aranet4 payload: 1481 ppm, 21.8 C, 1003.2 hPa, 44 %, battery 94 %,
// yellow, interval 300 s, age 237 s.
inline std::vector<uint8_t> aranet4_payload() {
    return {0xC9, 0x05, 0xB4, 0x01, 0x30, 0x27, 0x2C, 0x5E, 0x02, 0x2C, 0x01, 0xED, 0x00};
}

// Aranet4 peripheral exposing GAP name, firmware revision and the detailed readings.
inline void script_aranet4(FakeAdapter& fake, const std::vector<uint8_t>& payload = aranet4_payload()) {
    fake.add_service(SERVICE_GAP, {CHAR_DEVICE_NAME});
    fake.add_service(SERVICE_DIS, {CHAR_FIRMWARE_REVISION});
    fake.add_service(SERVICE_SAF_TEHNIKA_OLD, {CHAR_CURRENT_READINGS, CHAR_CURRENT_READINGS_DETAILED});
    fake.set_response(CHAR_DEVICE_NAME, {ReadStatus::Ok, {'A', 'r', 'a', 'n', 'e', 't', '4', ' ', '1', '2', '3'}, ""});
    fake.set_response(CHAR_FIRMWARE_REVISION, {ReadStatus::Ok, {'v', '1', '.', '4', '.', '4'}, ""});
    fake.set_response(CHAR_CURRENT_READINGS_DETAILED, {ReadStatus::Ok, payload, ""});
}

} // namespace aranet::test
