#ifndef MANUAL_TIME_PROVIDER_HPP
#define MANUAL_TIME_PROVIDER_HPP

#include "utils/time_provider.hpp"
#include <chrono>
#include <mutex>

/// Clock that only moves when a test moves it
class ManualTimeProvider : public TimeProvider {
public:
    explicit ManualTimeProvider(std::chrono::system_clock::time_point start) : current(start) {}

    std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(clock_mutex);
        return current;
    }

    void set(std::chrono::system_clock::time_point instant) {
        std::lock_guard<std::mutex> lock(clock_mutex);
        current = instant;
    }

    template <typename Duration>
    void advance(Duration step) {
        std::lock_guard<std::mutex> lock(clock_mutex);
        current += std::chrono::duration_cast<std::chrono::system_clock::duration>(step);
    }

private:
    mutable std::mutex clock_mutex;
    std::chrono::system_clock::time_point current;
};

#endif // MANUAL_TIME_PROVIDER_HPP
