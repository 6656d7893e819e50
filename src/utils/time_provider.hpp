#ifndef TIME_PROVIDER_HPP
#define TIME_PROVIDER_HPP

#include <chrono>

/**
 * TimeProvider - source of "now" for every staleness and window decision.
 *
 * Components borrow a provider by reference; the system owns a
 * SystemTimeProvider and tests substitute a manually advanced clock.
 */
class TimeProvider {
public:
    virtual ~TimeProvider() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemTimeProvider final : public TimeProvider {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

#endif // TIME_PROVIDER_HPP
