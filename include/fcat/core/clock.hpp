#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace fcat::core {

/**
 * @brief Monotonic time source
 *
 * Cache expiry reads time through this interface so tests can step it
 * explicitly instead of sleeping.
 */
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

class ManualClock : public Clock {
public:
    time_point now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    template<typename Rep, typename Period>
    void advance(const std::chrono::duration<Rep, Period>& delta) {
        std::lock_guard lock(mutex_);
        now_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    time_point now_{};
};

/// Wall-clock Unix seconds, the timestamp unit stored in the catalog.
inline std::int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace fcat::core
