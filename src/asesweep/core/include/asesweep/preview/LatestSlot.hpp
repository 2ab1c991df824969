#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace asesweep {

/*
  Single-slot mailbox.

  put() replaces whatever is waiting and never blocks on the reader;
  take() hands out the newest value once. Values that were replaced
  before anyone took them are counted in overwritten().
*/
template <class T>
class LatestSlot {
public:
    void put(T v) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (value_) ++overwritten_;
            value_ = std::move(v);
            ++version_;
        }
        cv_.notify_one();
    }

    // Non-blocking.
    bool tryTake(T& out) {
        std::lock_guard<std::mutex> lk(m_);
        if (!value_) return false;
        out = std::move(*value_);
        value_.reset();
        return true;
    }

    // Waits up to 'wait' for a value. false on timeout or after close().
    template <class Rep, class Period>
    bool take(T& out, std::chrono::duration<Rep, Period> wait) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_for(lk, wait, [this]{ return value_.has_value() || closed_; });
        if (!value_) return false;
        out = std::move(*value_);
        value_.reset();
        return true;
    }

    // Wakes every waiter; later put() calls are still accepted.
    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    [[nodiscard]] std::uint64_t version() const {
        std::lock_guard<std::mutex> lk(m_);
        return version_;
    }

    [[nodiscard]] std::uint64_t overwritten() const {
        std::lock_guard<std::mutex> lk(m_);
        return overwritten_;
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::optional<T> value_;
    std::uint64_t version_{0};
    std::uint64_t overwritten_{0};
    bool closed_{false};
};

} // namespace asesweep
