#include <iostream>

#include "executor.h"

namespace aranet {

Executor::Executor() : thread_([this]() { run(); }) {}

Executor::~Executor() {
    stop();
}

void Executor::post(Task task) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

Executor::TimerId Executor::post_after(Clock::duration delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_) return 0;
        id = next_timer_id_++;
        timers_.emplace(std::make_pair(Clock::now() + delay, id), std::move(task));
    }
    cv_.notify_one();
    return id;
}

bool Executor::cancel(TimerId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->first.second == id) {
            timers_.erase(it);
            return true;
        }
    }
    return false;
}

bool Executor::is_current_thread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void Executor::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = true;
        tasks_.clear();
        timers_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && !is_current_thread()) thread_.join();
}

void Executor::run() {
    std::unique_lock<std::mutex> lk(mutex_);
    while (!stopping_) {
        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lk.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "Executor task failed: " << e.what() << std::endl;
            }
            lk.lock();
            continue;
        }

        if (!timers_.empty()) {
            auto first = timers_.begin();
            if (first->first.first <= Clock::now()) {
                Task task = std::move(first->second);
                timers_.erase(first);
                lk.unlock();
                try {
                    task();
                } catch (const std::exception& e) {
                    std::cerr << "Executor timer failed: " << e.what() << std::endl;
                }
                lk.lock();
                continue;
            }
            const Clock::time_point deadline = first->first.first;
            cv_.wait_until(lk, deadline);
            continue;
        }

        cv_.wait(lk);
    }
}

} // namespace aranet
