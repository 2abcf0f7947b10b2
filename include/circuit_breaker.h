#pragma once

#include "common.h"
#include "clock.h"
#include "errors.h"
#include "logger.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace luna_voice {

enum class CircuitState {
    Closed,     ///< Normal operation
    Open,       ///< Calls rejected until next_attempt_at
    HalfOpen    ///< Probing whether the resource recovered
};

const char* circuit_state_to_string(CircuitState state);

struct CircuitBreakerConfig {
    int failure_threshold = 3;                 ///< Failures that open a closed circuit
    int success_threshold = 2;                 ///< Successes that close a half-open circuit
    Duration timeout = Duration(30000);        ///< Cool-down before a half-open trial call
    Duration monitoring_window = Duration(120000);  ///< Older failures are forgotten
};

/**
 * @brief Snapshot of one named circuit
 */
struct CircuitBreakerStats {
    CircuitState state = CircuitState::Closed;
    int failure_count = 0;
    int success_count = 0;
    TimePoint next_attempt_at{};
    TimePoint last_failure_at{};
    TimePoint last_success_at{};
};

/**
 * @brief Per-named-resource failure gate ("stt:whisper", "tts:primary", ...)
 *
 * Circuits are created lazily on first use and live as long as the
 * breaker. Counters are only touched by execute(); the lock is never
 * held while the protected call runs, so one slow provider does not
 * serialize the others.
 *
 * A call whose result is a cancellation error counts as neither success
 * nor failure.
 */
class CircuitBreaker {
public:
    CircuitBreaker(Clock& clock, const CircuitBreakerConfig& config = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run fn under the named circuit
     *
     * While the circuit is open, fn is not invoked: fallback runs instead,
     * or a ResourceExhausted "circuit '<name>' is OPEN" error is returned.
     * A failure that leaves the circuit open also hands over to fallback.
     */
    template<typename T>
    Result<T> execute(const std::string& name,
                      const std::function<Result<T>()>& fn,
                      const std::function<Result<T>()>& fallback = nullptr) {
        if (!admit(name)) {
            LOG_CIRCUIT("'" + name + "' is OPEN, " + (fallback ? "using fallback" : "rejecting call"));
            if (fallback) {
                return fallback();
            }
            return open_error(name);
        }

        Result<T> result = fn();
        if (result.is_ok()) {
            on_success(name);
            return result;
        }
        if (is_cancelled_error(result.error())) {
            return result;
        }

        bool now_open = on_failure(name);
        if (now_open && fallback) {
            LOG_CIRCUIT("'" + name + "' failed and is OPEN, using fallback");
            return fallback();
        }
        return result;
    }

    /**
     * @brief True when a call would reach fn right now
     *
     * Does not change state; an expired OPEN circuit reports true.
     */
    bool can_execute(const std::string& name) const;

    CircuitBreakerStats stats(const std::string& name) const;
    std::map<std::string, CircuitBreakerStats> all_stats() const;

    /// Force a circuit back to CLOSED with zeroed counters
    void reset(const std::string& name);

    const CircuitBreakerConfig& config() const { return config_; }

    static bool is_open_error(const Error& error);

private:
    /// OPEN -> HALF_OPEN once the cool-down elapsed; false while still open
    bool admit(const std::string& name);
    void on_success(const std::string& name);
    /// @return True when the circuit is OPEN after recording the failure
    bool on_failure(const std::string& name);

    static Error open_error(const std::string& name);

    Clock& clock_;
    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, CircuitBreakerStats> circuits_;
};

} // namespace luna_voice
