#pragma once

#include "core/clock.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <utility>

namespace wolfcache::testing {

/**
 * @brief Clock that only moves when told to
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start)
        : now_(start) {}

    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        std::chrono::system_clock::time_point value;
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value = now_;
            hook = std::exchange(on_next_read_, nullptr);
        }
        if (hook) hook();
        return value;
    }

    /// Run once after the next read, before that read returns
    void on_next_read(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_next_read_ = std::move(hook);
    }

    void advance(std::chrono::system_clock::duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

    void set(std::chrono::system_clock::time_point tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point now_;
    mutable std::function<void()> on_next_read_;
};

// 2026-10-19 12:00:00 UTC
inline std::chrono::system_clock::time_point fixed_start() {
    using namespace std::chrono;
    return sys_days{year{2026} / October / 19} + hours{12};
}

} // namespace wolfcache::testing
