#include <algorithm>

#include "aranet_error.h"
#include "ble_session.h"
#include "logging.h"
#include "monitor.h"

namespace aranet {

std::chrono::milliseconds next_read_delay(uint16_t interval, std::optional<uint16_t> age,
                                          std::chrono::milliseconds margin) {
    if (!age) return std::chrono::seconds(interval) + margin;
    const int remaining = std::max(static_cast<int>(interval) - static_cast<int>(*age), 0);
    return std::chrono::seconds(remaining) + margin;
}

Monitor::Monitor(Session& session, MonitorOptions options)
    : session_(session), options_(options) {}

void Monitor::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

bool Monitor::stop_requested() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return stop_requested_;
}

bool Monitor::wait(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(mutex_);
    return !cv_.wait_for(lk, delay, [this]() { return stop_requested_; });
}

void Monitor::run(const DeviceIdentity& device, const ReadingCallback& on_reading) {
    if (stop_requested()) return;

    ARANET_DEBUG << "Performing initial reading for monitoring setup..." << std::endl;
    Reading reading = session_.read(device);
    on_reading(reading);

    if (!reading.interval || !reading.age) {
        throw Error(ErrorCode::InvalidData, "reading has no measurement interval");
    }
    uint16_t interval = *reading.interval;
    auto delay = next_read_delay(interval, reading.age, options_.margin);

    while (true) {
        ARANET_DEBUG << "Device interval: " << interval << "s, next read in " << delay.count() << " ms"
                     << std::endl;
        if (!wait(delay) || stop_requested()) break;

        reading = session_.read(device);
        on_reading(reading);

        if (reading.interval) interval = *reading.interval;
        delay = next_read_delay(interval, reading.age, options_.margin);
    }

    ARANET_DEBUG << "Monitoring stopped" << std::endl;
    session_.disconnect(device);
}

} // namespace aranet
