#pragma once

#include <atomic>
#include <exception>
#include <future>
#include <utility>

namespace aranet {

// Promise that accepts exactly one resolution. Later set_value/set_error
// calls do nothing and return false.
template <typename T>
class ResultSlot {
public:
    ResultSlot() : future_(promise_.get_future()) {}

    ResultSlot(const ResultSlot&) = delete;
    ResultSlot& operator=(const ResultSlot&) = delete;

    bool set_value(T value) {
        if (completed_.exchange(true)) return false;
        promise_.set_value(std::move(value));
        return true;
    }

    bool set_error(std::exception_ptr error) {
        if (completed_.exchange(true)) return false;
        promise_.set_exception(std::move(error));
        return true;
    }

    template <typename E>
    bool set_error(const E& error) {
        return set_error(std::make_exception_ptr(error));
    }

    bool completed() const { return completed_.load(); }

    // Blocks until resolved; rethrows a stored error.
    T get() { return future_.get(); }

    std::shared_future<T> future() const { return future_; }

private:
    std::promise<T> promise_;
    std::shared_future<T> future_;
    std::atomic<bool> completed_{false};
};

} // namespace aranet
