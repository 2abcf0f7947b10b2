/**
 * Per-resource circuit breaker.
 * Asserts:
 * - failure_threshold consecutive failures open the circuit.
 * - While OPEN the protected call is never made; fallback runs or an OPEN error is returned.
 * - After the cool-down a trial call is admitted (HALF_OPEN); success_threshold successes close it,
 *   one failure re-opens it.
 * - Cancelled calls count as neither success nor failure; a message that merely
 *   reads like a cancellation is an ordinary failure.
 * - success_count only counts HALF_OPEN successes.
 * - Failures older than the monitoring window are forgotten.
 * - Circuits are independent per name.
 *
 * Run from build dir: ./test_circuit_breaker
 * No whisper/PortAudio required.
 */

#include "circuit_breaker.h"
#include "clock.h"
#include "logger.h"
#include <iostream>
#include <string>

using namespace luna_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct Counter {
    int calls = 0;
    Error next_error;

    Result<int> operator()() {
        calls++;
        if (next_error.is_error()) return next_error;
        return 7;
    }
};

Result<int> run(CircuitBreaker& breaker, const std::string& name, Counter& counter,
                std::function<Result<int>()> fallback = nullptr) {
    std::function<Result<int>()> fn = [&counter]() { return counter(); };
    return breaker.execute<int>(name, fn, fallback);
}

} // namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    CircuitBreakerConfig config;
    config.failure_threshold = 3;
    config.success_threshold = 2;
    config.timeout = Duration(30000);
    config.monitoring_window = Duration(120000);

    // --- threshold opens, OPEN short-circuits ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter primary;
        primary.next_error = make_network_error("connection refused");

        for (int i = 0; i < 2; i++) {
            Result<int> r = run(breaker, "stt:primary", primary);
            ASSERT(r.is_error());
            ASSERT(r.error().type == ErrorType::NetworkError);
        }
        ASSERT(breaker.stats("stt:primary").state == CircuitState::Closed);
        ASSERT(breaker.stats("stt:primary").failure_count == 2);

        Result<int> third = run(breaker, "stt:primary", primary);
        ASSERT(third.is_error());
        ASSERT(breaker.stats("stt:primary").state == CircuitState::Open);
        ASSERT(!breaker.can_execute("stt:primary"));

        Result<int> rejected = run(breaker, "stt:primary", primary);
        ASSERT(primary.calls == 3);
        ASSERT(rejected.is_error());
        ASSERT(rejected.error().type == ErrorType::ResourceExhausted);
        ASSERT(rejected.error().message == "circuit 'stt:primary' is OPEN");
        ASSERT(CircuitBreaker::is_open_error(rejected.error()));
        ASSERT(!CircuitBreaker::is_open_error(third.error()));

        // Other circuits are unaffected
        Counter other;
        ASSERT(run(breaker, "tts:primary", other).is_ok());
        ASSERT(breaker.all_stats().size() == 2);
    }

    // --- fallback while OPEN, and on the failure that opens ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter primary;
        primary.next_error = make_api_error("http 500");
        int fallback_calls = 0;
        auto fallback = [&]() -> Result<int> { fallback_calls++; return 99; };

        ASSERT(run(breaker, "stt:a", primary, fallback).is_error());
        ASSERT(run(breaker, "stt:a", primary, fallback).is_error());
        ASSERT(fallback_calls == 0);

        Result<int> opening = run(breaker, "stt:a", primary, fallback);
        ASSERT(opening.is_ok() && opening.value() == 99);
        ASSERT(fallback_calls == 1);

        Result<int> open = run(breaker, "stt:a", primary, fallback);
        ASSERT(open.is_ok() && open.value() == 99);
        ASSERT(primary.calls == 3);
        ASSERT(fallback_calls == 2);
    }

    // --- half-open circuit closes after success_threshold successes ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        c.next_error = make_timeout_error();
        for (int i = 0; i < 3; i++) run(breaker, "x", c);
        ASSERT(breaker.stats("x").state == CircuitState::Open);

        clock.advance(Duration(29999));
        ASSERT(!breaker.can_execute("x"));
        ASSERT(run(breaker, "x", c).is_error());
        ASSERT(c.calls == 3);

        clock.advance(Duration(1));
        ASSERT(breaker.can_execute("x"));
        c.next_error = Error();
        ASSERT(run(breaker, "x", c).is_ok());
        ASSERT(c.calls == 4);
        ASSERT(breaker.stats("x").state == CircuitState::HalfOpen);

        ASSERT(run(breaker, "x", c).is_ok());
        ASSERT(breaker.stats("x").state == CircuitState::Closed);
        ASSERT(breaker.stats("x").failure_count == 0);
    }

    // --- a failed half-open call re-opens with a fresh cool-down ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        c.next_error = make_network_error("offline");
        for (int i = 0; i < 3; i++) run(breaker, "x", c);
        clock.advance(Duration(30000));

        ASSERT(run(breaker, "x", c).is_error());
        ASSERT(c.calls == 4);
        ASSERT(breaker.stats("x").state == CircuitState::Open);
        ASSERT(breaker.stats("x").next_attempt_at == clock.now() + Duration(30000));
        ASSERT(!breaker.can_execute("x"));
    }

    // --- cancelled calls are neutral ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        c.next_error = make_cancelled_error("barge-in");
        for (int i = 0; i < 5; i++) {
            Result<int> r = run(breaker, "x", c);
            ASSERT(r.is_error());
            ASSERT(is_cancelled_error(r.error()));
        }
        ASSERT(breaker.stats("x").state == CircuitState::Closed);
        ASSERT(breaker.stats("x").failure_count == 0);
        ASSERT(breaker.stats("x").success_count == 0);

        // Only the flag marks a cancellation, not the wording of the message
        c.next_error = Error(ErrorType::Unknown, "cancelled: upstream rejected the request");
        Result<int> upstream = run(breaker, "x", c);
        ASSERT(upstream.is_error());
        ASSERT(!is_cancelled_error(upstream.error()));
        ASSERT(breaker.stats("x").failure_count == 1);
    }

    // --- success in CLOSED decays the failure count ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        c.next_error = make_network_error("reset by peer");
        run(breaker, "x", c);
        run(breaker, "x", c);
        c.next_error = Error();
        run(breaker, "x", c);
        ASSERT(breaker.stats("x").failure_count == 1);
        c.next_error = make_network_error("reset by peer");
        run(breaker, "x", c);
        ASSERT(breaker.stats("x").state == CircuitState::Closed);
    }

    // --- successes in CLOSED are not counted ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        for (int i = 0; i < 5; i++) {
            run(breaker, "x", c);
        }
        ASSERT(breaker.stats("x").success_count == 0);
        ASSERT(breaker.stats("x").last_success_at == clock.now());

        c.next_error = make_network_error("offline");
        for (int i = 0; i < 3; i++) {
            run(breaker, "x", c);
        }
        ASSERT(breaker.stats("x").state == CircuitState::Open);

        clock.advance(Duration(30000));
        c.next_error = Error();
        run(breaker, "x", c);
        ASSERT(breaker.stats("x").state == CircuitState::HalfOpen);
        ASSERT(breaker.stats("x").success_count == 1);
        run(breaker, "x", c);
        ASSERT(breaker.stats("x").state == CircuitState::Closed);
        ASSERT(breaker.stats("x").success_count == 0);
    }

    // --- failures outside the monitoring window are forgotten ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        c.next_error = make_network_error("offline");
        run(breaker, "x", c);
        run(breaker, "x", c);
        clock.advance(Duration(120001));
        run(breaker, "x", c);
        ASSERT(breaker.stats("x").failure_count == 1);
        ASSERT(breaker.stats("x").state == CircuitState::Closed);
    }

    // --- manual reset ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        Counter c;
        c.next_error = make_network_error("offline");
        for (int i = 0; i < 3; i++) run(breaker, "x", c);
        ASSERT(breaker.stats("x").state == CircuitState::Open);
        breaker.reset("x");
        ASSERT(breaker.stats("x").state == CircuitState::Closed);
        ASSERT(breaker.can_execute("x"));
    }

    ASSERT(std::string(circuit_state_to_string(CircuitState::HalfOpen)) == "HALF_OPEN");

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All circuit breaker tests passed.\n";
    return 0;
}
