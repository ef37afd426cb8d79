#pragma once

#include <chrono>

namespace wolfcache {

/**
 * @brief Wall-clock source
 *
 * Injected into anything that compares against "now" so tests can drive time
 * explicitly instead of sleeping.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace wolfcache
