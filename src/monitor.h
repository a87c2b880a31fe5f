#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

#include "aranet_types.h"

namespace aranet {

class Session;

struct MonitorOptions {
    // Added after the device's next measurement is due.
    std::chrono::milliseconds margin{3000};
};

// Time until the next measurement is available plus `margin`.
// A missing age falls back to a full interval.
std::chrono::milliseconds next_read_delay(uint16_t interval, std::optional<uint16_t> age,
                                          std::chrono::milliseconds margin);

// Reads a device once per measurement interval, timed from the age the
// device reports. One read at a time; the first failed read ends the loop.
class Monitor {
public:
    using ReadingCallback = std::function<void(const Reading&)>;

    explicit Monitor(Session& session, MonitorOptions options = MonitorOptions{});

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    // Blocks until stop() or an error. Throws the failing read's aranet::Error,
    // or Error(InvalidData) when the first reading has no interval/age.
    void run(const DeviceIdentity& device, const ReadingCallback& on_reading);

    // Safe from any thread; wakes a pending wait.
    void stop();
    bool stop_requested() const;

private:
    // False when woken by stop().
    bool wait(std::chrono::milliseconds delay);

    Session& session_;
    MonitorOptions options_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
};

} // namespace aranet
