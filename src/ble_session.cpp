#include <algorithm>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "ble_session.h"
#include "catalog.h"
#include "decoder.h"
#include "logging.h"
#include "result_slot.h"

namespace aranet {

struct Session::ScanContext {
    std::vector<DeviceIdentity> devices;
    Executor::TimerId stop_timer = 0;
    ResultSlot<std::vector<DeviceIdentity>> result;
};

// Per-read state; a fresh one is built for every read() and dropped afterwards.
struct Session::ReadContext {
    DeviceIdentity device;
    SessionState state = SessionState::Idle;

    size_t expected_services = 0;
    size_t reported_services = 0;
    std::vector<std::string> available;                  // normalized characteristic uuids
    std::map<std::string, std::string> service_of;       // characteristic -> service

    std::set<std::string> pending_reads;
    int encryption_errors = 0;
    bool grace_elapsed = false;

    std::string device_name;
    std::string device_version;
    std::string reading_characteristic;
    std::optional<std::vector<uint8_t>> reading_data;

    Executor::TimerId grace_timer = 0;
    Executor::TimerId absolute_timer = 0;
    ResultSlot<Reading> result;
};

Session::Session(BleAdapter& adapter, SessionOptions options)
    : adapter_(adapter), options_(options), executor_(std::make_shared<Executor>()) {
    std::weak_ptr<Executor> weak = executor_;
    adapter_.set_state_callback([this, weak](AdapterState state) {
        auto executor = weak.lock();
        if (!executor) return;
        executor->post([this, state]() {
            // Copies: finishing an operation resets current_read_/current_scan_.
            if (auto read = current_read_) handle(read, AdapterStateChange{state});
            auto scan = current_scan_;
            if (scan && (state == AdapterState::PoweredOff ||
                                  state == AdapterState::Unauthorized ||
                                  state == AdapterState::Unsupported)) {
                const ErrorCode code = state == AdapterState::Unauthorized ? ErrorCode::AdapterUnauthorized
                                     : state == AdapterState::Unsupported  ? ErrorCode::AdapterUnsupported
                                                                           : ErrorCode::AdapterUnavailable;
                finish_scan(scan, std::make_exception_ptr(Error(code)));
            }
        });
    });
}

Session::~Session() {
    adapter_.set_state_callback({});
    executor_->stop();
}

void Session::post_event(Session* self, const std::weak_ptr<Executor>& executor,
                         const std::shared_ptr<ReadContext>& ctx, Event event) {
    auto ex = executor.lock();
    if (!ex) return;
    ex->post([self, ctx, event = std::move(event)]() { self->handle(ctx, event); });
}

void Session::call_on_executor(const std::function<void()>& fn) {
    std::promise<void> done;
    auto f = done.get_future();
    executor_->post([&fn, &done]() {
        try {
            fn();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
    });
    f.get();
}

void Session::wait_until_ready() {
    const auto deadline = std::chrono::steady_clock::now() + options_.ready_timeout;
    while (true) {
        AdapterState state = AdapterState::Unknown;
        call_on_executor([this, &state]() { state = adapter_.state(); });

        switch (state) {
            case AdapterState::PoweredOn:
                return;
            case AdapterState::Unauthorized:
                throw Error(ErrorCode::AdapterUnauthorized);
            case AdapterState::Unsupported:
                throw Error(ErrorCode::AdapterUnsupported);
            case AdapterState::PoweredOff:
                throw Error(ErrorCode::AdapterUnavailable, "adapter is powered off");
            case AdapterState::Unknown:
                break;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            ARANET_DEBUG << "Bluetooth ready timeout" << std::endl;
            throw Error(ErrorCode::AdapterUnavailable, "adapter did not become ready");
        }
        ARANET_DEBUG << "Waiting for Bluetooth to power on..." << std::endl;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

// ---------------------------------------------------------------------------
// scan
// ---------------------------------------------------------------------------

std::vector<DeviceIdentity> Session::scan(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> op(operation_mutex_);
    wait_until_ready();

    auto ctx = std::make_shared<ScanContext>();
    executor_->post([this, ctx, timeout]() { start_scan(ctx, timeout); });
    return ctx->result.get();
}

void Session::start_scan(const std::shared_ptr<ScanContext>& ctx, std::chrono::milliseconds timeout) {
    current_scan_ = ctx;
    std::weak_ptr<Executor> weak = executor_;

    ARANET_DEBUG << "Scan started (" << timeout.count() << " ms)" << std::endl;
    try {
        adapter_.scan_start(aranet_service_filter(), [this, weak, ctx](const DeviceIdentity& device) {
            auto executor = weak.lock();
            if (!executor) return;
            executor->post([this, ctx, device]() { on_scan_found(ctx, device); });
        });
    } catch (const std::exception& e) {
        finish_scan(ctx, std::make_exception_ptr(Error(ErrorCode::AdapterUnavailable, e.what())));
        return;
    }

    ctx->stop_timer = executor_->post_after(timeout, [this, ctx]() { finish_scan(ctx, nullptr); });
}

void Session::on_scan_found(const std::shared_ptr<ScanContext>& ctx, const DeviceIdentity& device) {
    if (ctx->result.completed()) return;

    auto it = std::find_if(ctx->devices.begin(), ctx->devices.end(),
                           [&](const DeviceIdentity& d) { return d.id == device.id; });
    if (it != ctx->devices.end()) {
        if (!it->name && device.name) it->name = device.name;
        return;
    }

    ARANET_DEBUG << "Found device: " << device.display_name() << " [" << device.id << "]" << std::endl;
    ctx->devices.push_back(device);
}

void Session::finish_scan(const std::shared_ptr<ScanContext>& ctx, std::exception_ptr error) {
    if (ctx->result.completed()) return;

    executor_->cancel(ctx->stop_timer);
    try {
        adapter_.scan_stop();
    } catch (const std::exception& e) {
        std::cerr << "Scan stop failed: " << e.what() << std::endl;
    }
    if (current_scan_ == ctx) current_scan_.reset();

    ARANET_DEBUG << "Scan stopped, " << ctx->devices.size() << " device(s)" << std::endl;
    if (error) {
        ctx->result.set_error(error);
    } else {
        ctx->result.set_value(ctx->devices);
    }
}

// ---------------------------------------------------------------------------
// read
// ---------------------------------------------------------------------------

Reading Session::read(const DeviceIdentity& device) {
    std::lock_guard<std::mutex> op(operation_mutex_);
    state_.store(SessionState::Idle);
    wait_until_ready();

    auto ctx = std::make_shared<ReadContext>();
    ctx->device = device;
    executor_->post([this, ctx]() { start_read(ctx); });
    return ctx->result.get();
}

void Session::disconnect(const DeviceIdentity& device) {
    call_on_executor([this, &device]() {
        try {
            adapter_.disconnect(device);
        } catch (const std::exception& e) {
            std::cerr << "Disconnect failed on " << device.id << ": " << e.what() << std::endl;
        }
    });
}

void Session::start_read(const std::shared_ptr<ReadContext>& ctx) {
    current_read_ = ctx;
    std::weak_ptr<Executor> weak = executor_;

    ctx->grace_timer = executor_->post_after(options_.grace_timeout, [this, ctx]() {
        handle(ctx, GraceTimeout{});
    });
    ctx->absolute_timer = executor_->post_after(options_.absolute_timeout, [this, ctx]() {
        handle(ctx, AbsoluteTimeout{});
    });

    ARANET_DEBUG << "Starting read from device: " << ctx->device.display_name()
                 << " (" << ctx->device.id << ")" << std::endl;
    transition(ctx, SessionState::Connecting);

    bool connected = false;
    try {
        connected = adapter_.is_connected(ctx->device);
    } catch (const std::exception& e) {
        ARANET_DEBUG << "Connection state unknown: " << e.what() << std::endl;
    }

    if (connected) {
        ARANET_DEBUG << "Already connected, discovering services..." << std::endl;
        transition(ctx, SessionState::DiscoveringServices);
        request_services(ctx);
        return;
    }

    ARANET_DEBUG << "Connecting to peripheral..." << std::endl;
    try {
        adapter_.connect(ctx->device, [this, weak, ctx](const std::string& error) {
            post_event(this, weak, ctx, ConnectResult{error});
        });
    } catch (const std::exception& e) {
        fail(ctx, ErrorCode::ConnectionFailed, e.what());
    }
}

void Session::handle(const std::shared_ptr<ReadContext>& ctx, const Event& event) {
    if (ctx->result.completed()) {
        ARANET_DEBUG << "Ignoring event for finished read (" << session_state_name(ctx->state) << ")"
                     << std::endl;
        return;
    }
    std::visit([this, &ctx](const auto& e) { on_event(ctx, e); }, event);
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const ConnectResult& e) {
    if (ctx->state != SessionState::Connecting) return;

    if (!e.error.empty()) {
        ARANET_DEBUG << "Failed to connect: " << e.error << std::endl;
        fail(ctx, ErrorCode::ConnectionFailed, e.error);
        return;
    }

    ARANET_DEBUG << "Connected to peripheral: " << ctx->device.display_name() << std::endl;
    transition(ctx, SessionState::DiscoveringServices);
    request_services(ctx);
}

void Session::request_services(const std::shared_ptr<ReadContext>& ctx) {
    std::weak_ptr<Executor> weak = executor_;
    ARANET_DEBUG << "Discovering services..." << std::endl;
    try {
        adapter_.discover_services(ctx->device, [this, weak, ctx](const std::vector<std::string>& services,
                                                                  const std::string& error) {
            post_event(this, weak, ctx, ServicesResult{services, error});
        });
    } catch (const std::exception& e) {
        fail(ctx, ErrorCode::ReadFailed, std::string("service discovery failed: ") + e.what());
    }
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const ServicesResult& e) {
    if (ctx->state != SessionState::DiscoveringServices) return;

    if (!e.error.empty()) {
        ARANET_DEBUG << "Error discovering services: " << e.error << std::endl;
        fail(ctx, ErrorCode::ReadFailed, "service discovery failed: " + e.error);
        return;
    }

    ARANET_DEBUG << "Discovered services: " << e.services.size() << std::endl;
    ctx->expected_services = e.services.size();
    transition(ctx, SessionState::DiscoveringCharacteristics);

    if (e.services.empty()) {
        finish_discovery(ctx);
        return;
    }

    std::weak_ptr<Executor> weak = executor_;
    for (const auto& service : e.services) {
        ARANET_DEBUG << "Discovering characteristics for service: " << service << std::endl;
        try {
            adapter_.discover_characteristics(
                ctx->device, service,
                [this, weak, ctx](const std::string& svc, const std::vector<std::string>& chars,
                                  const std::string& error) {
                    post_event(this, weak, ctx, CharacteristicsResult{svc, chars, error});
                });
        } catch (const std::exception& ex) {
            fail(ctx, ErrorCode::ReadFailed, std::string("characteristic discovery failed: ") + ex.what());
            return;
        }
    }
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const CharacteristicsResult& e) {
    if (ctx->state != SessionState::DiscoveringCharacteristics) return;

    ++ctx->reported_services;
    ARANET_DEBUG << "Discovered " << e.characteristics.size() << " characteristics for service: "
                 << e.service << " (" << ctx->reported_services << "/" << ctx->expected_services << ")"
                 << std::endl;

    if (!e.error.empty()) {
        fail(ctx, ErrorCode::ReadFailed,
             "characteristic discovery failed for " + e.service + ": " + e.error);
        return;
    }

    for (const auto& chr : e.characteristics) {
        const std::string uuid = normalize_uuid(chr);
        if (ctx->service_of.count(uuid)) continue;
        ctx->service_of[uuid] = e.service;
        ctx->available.push_back(uuid);
        if (is_reading_characteristic(uuid)) {
            ARANET_DEBUG << "Found reading characteristic " << uuid << std::endl;
        }
    }

    if (ctx->reported_services >= ctx->expected_services) finish_discovery(ctx);
}

void Session::finish_discovery(const std::shared_ptr<ReadContext>& ctx) {
    auto selected = select_reading_characteristic(ctx->available);
    if (!selected) {
        ARANET_DEBUG << "All services discovered but no reading characteristics found!" << std::endl;
        fail(ctx, ErrorCode::ReadFailed, "no reading characteristic found");
        return;
    }

    ctx->reading_characteristic = *selected;
    transition(ctx, SessionState::AwaitingPayload);
    ARANET_DEBUG << "Will read " << *selected << std::endl;

    // Informational reads are best effort.
    for (const auto& uuid : ctx->available) {
        if (!is_informational_characteristic(uuid)) continue;
        issue_read(ctx, uuid);
        if (ctx->result.completed()) return;
    }
    issue_read(ctx, *selected);

    ARANET_DEBUG << "Pending reads: " << ctx->pending_reads.size() << std::endl;
}

void Session::issue_read(const std::shared_ptr<ReadContext>& ctx, const std::string& characteristic) {
    std::weak_ptr<Executor> weak = executor_;
    ctx->pending_reads.insert(characteristic);
    try {
        adapter_.read_value(ctx->device, ctx->service_of[characteristic], characteristic,
                            [this, weak, ctx](const std::string& chr, ReadStatus status,
                                              const std::vector<uint8_t>& value, const std::string& error) {
                                post_event(this, weak, ctx,
                                           ValueResult{normalize_uuid(chr), status, value, error});
                            });
    } catch (const std::exception& e) {
        ctx->pending_reads.erase(characteristic);
        ARANET_DEBUG << "Read request for " << characteristic << " failed: " << e.what() << std::endl;
        if (characteristic == ctx->reading_characteristic) {
            fail(ctx, ErrorCode::ReadFailed, e.what());
        }
    }
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const ValueResult& e) {
    if (ctx->state != SessionState::AwaitingPayload) return;
    if (ctx->pending_reads.erase(e.characteristic) == 0) return;

    const bool is_reading = e.characteristic == ctx->reading_characteristic;

    switch (e.status) {
        case ReadStatus::AuthFailure:
            ++ctx->encryption_errors;
            ARANET_DEBUG << "Authentication error on characteristic " << e.characteristic
                         << " (count: " << ctx->encryption_errors << ")" << std::endl;
            break;

        case ReadStatus::Error:
            ARANET_DEBUG << "Error reading characteristic " << e.characteristic << ": " << e.error
                         << std::endl;
            break;

        case ReadStatus::Ok:
            ARANET_DEBUG << "Read characteristic " << e.characteristic << ": " << e.value.size()
                         << " bytes" << std::endl;
            if (is_reading) {
                if (e.value.empty()) {
                    // Empty reading payloads come back from links lacking encryption.
                    ++ctx->encryption_errors;
                    ARANET_DEBUG << "Reading characteristic returned no data - likely needs pairing (count: "
                                 << ctx->encryption_errors << ")" << std::endl;
                } else {
                    ctx->reading_data = e.value;
                    ARANET_DEBUG << "Got reading data: " << to_hex(e.value) << std::endl;
                }
            } else if (auto entry = find_catalog_entry(e.characteristic)) {
                if (entry->role == CharacteristicRole::DeviceName) {
                    ctx->device_name.assign(e.value.begin(), e.value.end());
                    ARANET_DEBUG << "Device name: " << ctx->device_name << std::endl;
                } else if (entry->role == CharacteristicRole::FirmwareRevision) {
                    ctx->device_version.assign(e.value.begin(), e.value.end());
                    ARANET_DEBUG << "Software version: " << ctx->device_version << std::endl;
                }
            }
            break;
    }

    ARANET_DEBUG << "Pending reads remaining: " << ctx->pending_reads.size() << std::endl;
    check_completion(ctx);
}

void Session::check_completion(const std::shared_ptr<ReadContext>& ctx) {
    if (!ctx->pending_reads.empty()) return;

    if (ctx->reading_data) {
        complete(ctx);
        return;
    }

    if (ctx->encryption_errors > 0) {
        if (!ctx->grace_elapsed) {
            ARANET_DEBUG << "No reading payload after authentication errors, waiting for grace period"
                         << std::endl;
            return;
        }
        fail(ctx, ErrorCode::PairingRequired);
        return;
    }

    fail(ctx, ErrorCode::ReadFailed, "no reading payload received");
}

void Session::complete(const std::shared_ptr<ReadContext>& ctx) {
    std::string name = ctx->device_name;
    // GAP names are often NUL padded
    name.erase(std::find(name.begin(), name.end(), '\0'), name.end());
    if (name.empty()) name = ctx->device.display_name();
    std::string version = ctx->device_version;
    version.erase(std::find(version.begin(), version.end(), '\0'), version.end());

    ARANET_DEBUG << "All reads complete, parsing data..." << std::endl;
    try {
        Reading reading = decode_reading(*ctx->reading_data, ctx->reading_characteristic, name, version);
        if (ctx->result.completed()) return;
        finish(ctx, SessionState::Completed);
        ctx->result.set_value(std::move(reading));
    } catch (const Error&) {
        fail(ctx, std::current_exception());
    }
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const AdapterStateChange& e) {
    switch (e.state) {
        case AdapterState::Unauthorized:
            fail(ctx, ErrorCode::AdapterUnauthorized);
            break;
        case AdapterState::Unsupported:
            fail(ctx, ErrorCode::AdapterUnsupported);
            break;
        case AdapterState::PoweredOff:
            fail(ctx, ErrorCode::AdapterUnavailable, "adapter powered off");
            break;
        case AdapterState::PoweredOn:
        case AdapterState::Unknown:
            break;
    }
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const GraceTimeout&) {
    ctx->grace_elapsed = true;
    if (ctx->encryption_errors > 0 && !ctx->reading_data) {
        ARANET_DEBUG << "Detected encryption errors with no data - pairing required" << std::endl;
        fail(ctx, ErrorCode::PairingRequired);
    }
}

void Session::on_event(const std::shared_ptr<ReadContext>& ctx, const AbsoluteTimeout&) {
    ARANET_DEBUG << "Operation timed out after " << options_.absolute_timeout.count() << " ms in state "
                 << session_state_name(ctx->state) << std::endl;
    fail(ctx, ErrorCode::Timeout);
}

void Session::transition(const std::shared_ptr<ReadContext>& ctx, SessionState next) {
    if (ctx->state == SessionState::Completed || ctx->state == SessionState::Failed) return;
    ctx->state = next;
    if (current_read_ == ctx) state_.store(next);
}

void Session::fail(const std::shared_ptr<ReadContext>& ctx, ErrorCode code, const std::string& detail) {
    fail(ctx, std::make_exception_ptr(Error(code, detail)));
}

void Session::fail(const std::shared_ptr<ReadContext>& ctx, std::exception_ptr error) {
    if (ctx->result.completed()) return;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        ARANET_DEBUG << "Read failed: " << e.what() << std::endl;
    }
    finish(ctx, SessionState::Failed);
    ctx->result.set_error(error);
}

// Terminal bookkeeping shared by every outcome: timers, state, one disconnect.
void Session::finish(const std::shared_ptr<ReadContext>& ctx, SessionState terminal) {
    executor_->cancel(ctx->grace_timer);
    executor_->cancel(ctx->absolute_timer);
    transition(ctx, terminal);

    try {
        adapter_.disconnect(ctx->device);
    } catch (const std::exception& e) {
        std::cerr << "Disconnect failed on " << ctx->device.id << ": " << e.what() << std::endl;
    }
    if (current_read_ == ctx) current_read_.reset();
}

DeviceIdentity find_device(const std::vector<DeviceIdentity>& devices, const std::string& query) {
    const std::string wanted = to_lower(query);
    for (const auto& d : devices) {
        if (to_lower(d.id) == wanted) return d;
        if (d.name && to_lower(*d.name).find(wanted) != std::string::npos) return d;
    }
    throw Error(ErrorCode::DeviceNotFound, query);
}

} // namespace aranet
