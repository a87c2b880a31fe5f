#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace aranet {

// One worker thread draining posted tasks and due timers in order.
// Everything posted to the same Executor runs serialized.
class Executor {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;

    Executor();
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    void post(Task task);
    TimerId post_after(Clock::duration delay, Task task);

    // Returns false if the timer already ran or was never scheduled.
    bool cancel(TimerId id);

    bool is_current_thread() const;

    // Pending tasks are dropped, a running task finishes first.
    void stop();

private:
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<std::pair<Clock::time_point, TimerId>, Task> timers_;
    TimerId next_timer_id_ = 1;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace aranet
