#pragma once

#include "common.h"
#include <atomic>
#include <mutex>

namespace luna_voice {

/**
 * @brief Monotonic time source
 *
 * Every timer in the runtime (VAD silence timeout, circuit breaker
 * cool-down, recovery delays) reads the same Clock instance.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

/// Production clock backed by std::chrono::steady_clock
class SteadyClock : public Clock {
public:
    TimePoint now() const override;
};

/**
 * @brief Clock that only moves when told to (tests, replay)
 */
class ManualClock : public Clock {
public:
    ManualClock();

    TimePoint now() const override;

    void advance(Duration delta);
    void set(TimePoint t);

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace luna_voice
