#pragma once

#include "common.h"
#include "errors.h"
#include "event_bus.h"
#include "event_loop.h"
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace luna_voice {

/// Where a failure came from; decides which provider list SwitchProvider advances
enum class Component {
    Capture,
    Playback,
    Transcription,
    Synthesis,
    Chat,
    Session
};

const char* component_to_string(Component component);

enum class RecoveryStrategy {
    RestartService,
    ReinitializeAudio,
    SwitchProvider,
    RequestPermissions,
    ExponentialBackoff,
    FallbackMode
};

const char* recovery_strategy_to_string(RecoveryStrategy strategy);

/**
 * @brief Static recovery recipe for one ErrorType
 */
struct RecoveryPlan {
    RecoveryStrategy strategy = RecoveryStrategy::RestartService;
    Duration delay = Duration(0);
    int max_attempts = 1;
    std::vector<RecoveryStrategy> fallback_strategies;
};

/**
 * @brief One classified failure, kept in a bounded per-type history
 */
struct ErrorContext {
    ErrorType error_type = ErrorType::Unknown;
    Error original_error;
    TimePoint timestamp{};
    int recovery_attempts = 0;
    Component component = Component::Session;
    std::string context;
};

/**
 * @brief Maps any Error onto the fixed taxonomy
 *
 * An error already tagged with a concrete type keeps it. Untagged
 * (Unknown) errors are matched against lowercase message patterns, rules
 * ordered from most to least specific; first match wins.
 */
class ErrorClassifier {
public:
    ErrorClassifier();

    ErrorType classify(const Error& error) const;

private:
    struct Rule {
        ErrorType type;
        std::vector<std::string> patterns;
    };
    std::vector<Rule> rules_;
};

/**
 * @brief Side effects a recovery strategy may perform
 *
 * Implemented by the conversation state machine, which owns the session.
 * All calls happen on the event loop thread.
 */
class RecoveryActions {
public:
    virtual ~RecoveryActions() = default;

    virtual VoidResult restart_service() = 0;
    virtual VoidResult reinitialize_audio() = 0;
    virtual VoidResult switch_provider(Component component) = 0;
    virtual VoidResult request_permissions() = 0;
    virtual VoidResult enter_fallback_mode() = 0;

    /// Whether `component` would accept a call now (e.g. its circuit is not OPEN)
    virtual bool service_available(Component component) const = 0;
};

struct RecoveryConfig {
    size_t history_size = 10;
    Duration flapping_window = Duration(300000);
    int flapping_threshold = 5;
    Duration backoff_cap = Duration(30000);
    int backoff_retry_limit = 2;    ///< Attempts past this skip straight to the fallbacks
};

enum class RecoveryOutcome {
    Started,        ///< Strategy chain scheduled on the loop
    Skipped,        ///< Another recovery is running
    Surfaced        ///< No automated remedy; error event emitted
};

/**
 * @brief Runs the bounded recovery chain for a classified failure
 *
 * At most one recovery runs at a time. The primary strategy runs after
 * its plan delay; if it fails, the plan's fallback strategies run in
 * order. ExponentialBackoff fails when the component is still unavailable
 * after the wait, or once the attempt count passes backoff_retry_limit.
 * Only when every strategy failed (or recovery was refused) does an
 * `error` event reach the bus.
 */
class RecoveryPlanner {
public:
    using Emitter = std::function<void(EventKind, EventPayload)>;

    RecoveryPlanner(EventLoop& loop, RecoveryActions& actions, Emitter emit,
                    const RecoveryConfig& config = {});
    ~RecoveryPlanner();

    RecoveryPlanner(const RecoveryPlanner&) = delete;
    RecoveryPlanner& operator=(const RecoveryPlanner&) = delete;

    /**
     * @brief Classify and (maybe) recover from a failure
     */
    RecoveryOutcome handle(const Error& error, Component component, const std::string& context = "");

    bool recovery_in_progress() const { return in_progress_; }

    /// Forget attempt counters (called after a turn completes cleanly)
    void reset_attempts();

    int attempts(ErrorType type) const;

    std::vector<ErrorContext> history(ErrorType type) const;

    /// Abandon a running chain; pending delays are cancelled
    void cancel();

    static const RecoveryPlan& plan_for(ErrorType type);

    /// min(base * 2^attempts, cap)
    static Duration backoff_delay(Duration base, int attempts, Duration cap);

private:
    struct Run {
        ErrorType type = ErrorType::Unknown;
        Component component = Component::Session;
        std::string message;
        std::vector<RecoveryStrategy> chain;
        size_t index = 0;
        int attempt = 0;
    };

    void schedule_step();
    void run_step();
    VoidResult perform(RecoveryStrategy strategy, Component component);
    VoidResult after_backoff(Component component);
    void finish(bool success, const std::string& detail);
    void surface(ErrorType type, const std::string& message, bool recoverable);
    int recent_failures(ErrorType type, TimePoint now) const;

    EventLoop& loop_;
    RecoveryActions& actions_;
    Emitter emit_;
    RecoveryConfig config_;
    ErrorClassifier classifier_;

    std::map<ErrorType, std::deque<ErrorContext>> history_;
    std::map<ErrorType, int> attempts_;
    bool in_progress_;
    Run run_;
    TimerId timer_;
    bool timer_armed_;
};

} // namespace luna_voice
