#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "aranet_error.h"
#include "aranet_types.h"
#include "ble_adapter.h"
#include "executor.h"

namespace aranet {

struct SessionOptions {
    std::chrono::milliseconds ready_timeout{5000};
    std::chrono::milliseconds grace_timeout{5000};
    std::chrono::milliseconds absolute_timeout{30000};
};

// Drives one scan or one read against a BleAdapter to exactly one result.
// Adapter callbacks are turned into events and handled on a private
// executor; callers block until the operation resolves. Calls on one
// Session are serialized.
class Session {
public:
    explicit Session(BleAdapter& adapter, SessionOptions options = SessionOptions{});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Collects Aranet peripherals advertising during `timeout`, unique by id.
    // An empty result is not an error.
    std::vector<DeviceIdentity> scan(std::chrono::milliseconds timeout);

    // Connect, discover, read and decode the current measurements.
    // Throws aranet::Error; the peripheral is disconnected on every outcome.
    Reading read(const DeviceIdentity& device);

    void disconnect(const DeviceIdentity& device);

    SessionState state() const { return state_.load(); }
    const SessionOptions& options() const { return options_; }

private:
    struct ReadContext;
    struct ScanContext;

    struct ConnectResult { std::string error; };
    struct ServicesResult { std::vector<std::string> services; std::string error; };
    struct CharacteristicsResult {
        std::string service;
        std::vector<std::string> characteristics;
        std::string error;
    };
    struct ValueResult {
        std::string characteristic;
        ReadStatus status;
        std::vector<uint8_t> value;
        std::string error;
    };
    struct AdapterStateChange { AdapterState state; };
    struct GraceTimeout {};
    struct AbsoluteTimeout {};

    using Event = std::variant<ConnectResult, ServicesResult, CharacteristicsResult, ValueResult,
                               AdapterStateChange, GraceTimeout, AbsoluteTimeout>;

    static void post_event(Session* self, const std::weak_ptr<Executor>& executor,
                           const std::shared_ptr<ReadContext>& ctx, Event event);

    void wait_until_ready();
    void call_on_executor(const std::function<void()>& fn);

    // scan
    void start_scan(const std::shared_ptr<ScanContext>& ctx, std::chrono::milliseconds timeout);
    void on_scan_found(const std::shared_ptr<ScanContext>& ctx, const DeviceIdentity& device);
    void finish_scan(const std::shared_ptr<ScanContext>& ctx, std::exception_ptr error);

    // read
    void start_read(const std::shared_ptr<ReadContext>& ctx);
    void handle(const std::shared_ptr<ReadContext>& ctx, const Event& event);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const ConnectResult& e);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const ServicesResult& e);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const CharacteristicsResult& e);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const ValueResult& e);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const AdapterStateChange& e);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const GraceTimeout& e);
    void on_event(const std::shared_ptr<ReadContext>& ctx, const AbsoluteTimeout& e);

    void request_services(const std::shared_ptr<ReadContext>& ctx);
    void finish_discovery(const std::shared_ptr<ReadContext>& ctx);
    void issue_read(const std::shared_ptr<ReadContext>& ctx, const std::string& characteristic);
    void check_completion(const std::shared_ptr<ReadContext>& ctx);
    void complete(const std::shared_ptr<ReadContext>& ctx);

    void transition(const std::shared_ptr<ReadContext>& ctx, SessionState next);
    void fail(const std::shared_ptr<ReadContext>& ctx, ErrorCode code, const std::string& detail = "");
    void fail(const std::shared_ptr<ReadContext>& ctx, std::exception_ptr error);
    void finish(const std::shared_ptr<ReadContext>& ctx, SessionState terminal);

    BleAdapter& adapter_;
    SessionOptions options_;
    std::mutex operation_mutex_;
    std::atomic<SessionState> state_{SessionState::Idle};

    // Touched only on the executor thread.
    std::shared_ptr<ReadContext> current_read_;
    std::shared_ptr<ScanContext> current_scan_;

    std::shared_ptr<Executor> executor_;
};

// Matches a scan result by id (case-insensitive) or by a name substring.
// Throws Error(DeviceNotFound) when nothing matches.
DeviceIdentity find_device(const std::vector<DeviceIdentity>& devices, const std::string& query);

} // namespace aranet
