#include "circuit_breaker.h"

namespace luna_voice {

namespace {

const char* OPEN_SUFFIX = "' is OPEN";

} // namespace

const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(Clock& clock, const CircuitBreakerConfig& config)
    : clock_(clock), config_(config) {
    if (config_.failure_threshold < 1) config_.failure_threshold = 1;
    if (config_.success_threshold < 1) config_.success_threshold = 1;
}

bool CircuitBreaker::admit(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats& circuit = circuits_[name];
    if (circuit.state != CircuitState::Open) {
        return true;
    }
    if (clock_.now() < circuit.next_attempt_at) {
        return false;
    }
    circuit.state = CircuitState::HalfOpen;
    circuit.success_count = 0;
    LOG_CIRCUIT("'" + name + "' moving to HALF_OPEN");
    return true;
}

void CircuitBreaker::on_success(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats& circuit = circuits_[name];
    circuit.last_success_at = clock_.now();

    // success_count only tracks half-open trial calls
    if (circuit.state == CircuitState::HalfOpen) {
        circuit.success_count++;
        if (circuit.success_count >= config_.success_threshold) {
            circuit.state = CircuitState::Closed;
            circuit.failure_count = 0;
            circuit.success_count = 0;
            LOG_CIRCUIT("'" + name + "' closed, service recovered");
        }
    } else if (circuit.state == CircuitState::Closed) {
        if (circuit.failure_count > 0) {
            circuit.failure_count--;
        }
    }
}

bool CircuitBreaker::on_failure(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    CircuitBreakerStats& circuit = circuits_[name];
    TimePoint now = clock_.now();

    // Failures outside the window no longer count toward opening
    bool stale = circuit.failure_count > 0 &&
                 now - circuit.last_failure_at > config_.monitoring_window;
    circuit.failure_count = stale ? 1 : circuit.failure_count + 1;
    circuit.last_failure_at = now;

    if (circuit.state == CircuitState::HalfOpen) {
        circuit.state = CircuitState::Open;
        circuit.next_attempt_at = now + config_.timeout;
        LOG_CIRCUIT("'" + name + "' failed in HALF_OPEN, going back to OPEN");
    } else if (circuit.state == CircuitState::Closed &&
               circuit.failure_count >= config_.failure_threshold) {
        circuit.state = CircuitState::Open;
        circuit.next_attempt_at = now + config_.timeout;
        LOG_CIRCUIT("'" + name + "' opened after " + std::to_string(circuit.failure_count) + " failures");
    }
    return circuit.state == CircuitState::Open;
}

bool CircuitBreaker::can_execute(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(name);
    if (it == circuits_.end() || it->second.state != CircuitState::Open) {
        return true;
    }
    return clock_.now() >= it->second.next_attempt_at;
}

CircuitBreakerStats CircuitBreaker::stats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(name);
    return it == circuits_.end() ? CircuitBreakerStats{} : it->second;
}

std::map<std::string, CircuitBreakerStats> CircuitBreaker::all_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return circuits_;
}

void CircuitBreaker::reset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    circuits_[name] = CircuitBreakerStats{};
    LOG_CIRCUIT("'" + name + "' manually reset");
}

Error CircuitBreaker::open_error(const std::string& name) {
    return Error(ErrorType::ResourceExhausted, "circuit '" + name + OPEN_SUFFIX);
}

bool CircuitBreaker::is_open_error(const Error& error) {
    if (error.type != ErrorType::ResourceExhausted) return false;
    const std::string suffix = OPEN_SUFFIX;
    return error.message.rfind("circuit '", 0) == 0 &&
           error.message.size() >= suffix.size() &&
           error.message.compare(error.message.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace luna_voice
