#include "clock.h"

namespace luna_voice {

TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

// Start well away from the epoch so "now - window" never underflows
ManualClock::ManualClock() : now_(TimePoint() + std::chrono::hours(1)) {}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(Duration delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::set(TimePoint t) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = t;
}

} // namespace luna_voice
