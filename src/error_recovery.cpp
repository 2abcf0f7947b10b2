#include "error_recovery.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

namespace luna_voice {

const char* component_to_string(Component component) {
    switch (component) {
        case Component::Capture: return "capture";
        case Component::Playback: return "playback";
        case Component::Transcription: return "transcription";
        case Component::Synthesis: return "synthesis";
        case Component::Chat: return "chat";
        case Component::Session: return "session";
    }
    return "unknown";
}

const char* recovery_strategy_to_string(RecoveryStrategy strategy) {
    switch (strategy) {
        case RecoveryStrategy::RestartService: return "restart-service";
        case RecoveryStrategy::ReinitializeAudio: return "reinitialize-audio";
        case RecoveryStrategy::SwitchProvider: return "switch-provider";
        case RecoveryStrategy::RequestPermissions: return "request-permissions";
        case RecoveryStrategy::ExponentialBackoff: return "exponential-backoff";
        case RecoveryStrategy::FallbackMode: return "fallback-mode";
    }
    return "unknown";
}

// =============================================================================
// ErrorClassifier
// =============================================================================

ErrorClassifier::ErrorClassifier() {
    // Most specific first
    rules_ = {
        {ErrorType::PermissionDenied, {"permission denied", "notallowederror", "permission dismissed",
                                       "access denied"}},
        {ErrorType::BrowserCompatibility, {"notsupportederror", "not supported on this platform",
                                           "no audio host api"}},
        {ErrorType::MicrophoneAccess, {"microphone", "input device", "device unavailable",
                                       "notfounderror", "notreadableerror", "getusermedia"}},
        {ErrorType::AudioContext, {"audio context", "audiocontext", "output device", "portaudio",
                                   "playback"}},
        {ErrorType::MediaRecorder, {"mediarecorder", "recorder", "capture stream", "input overflow"}},
        {ErrorType::Timeout, {"timed out", "timeout", "deadline exceeded"}},
        {ErrorType::NetworkError, {"network", "connection", "could not resolve", "couldn't connect",
                                   "offline", "econnrefused", "socket", "websocket"}},
        {ErrorType::APIError, {"api key", "unauthorized", "forbidden", "http 4", "http 5",
                               "invalid response", "bad request"}},
        {ErrorType::TranscriptionError, {"transcri", "speech-to-text", "stt", "whisper"}},
        {ErrorType::TTSError, {"synthes", "text-to-speech", "tts"}},
        {ErrorType::ResourceExhausted, {"rate limit", "quota", "too many requests", "exhausted",
                                        "out of memory"}},
    };
}

ErrorType ErrorClassifier::classify(const Error& error) const {
    if (error.type != ErrorType::None && error.type != ErrorType::Unknown) {
        return error.type;
    }
    std::string message = utils::normalize_copy(error.message);
    for (const auto& rule : rules_) {
        if (utils::contains_any(message, rule.patterns)) {
            return rule.type;
        }
    }
    return ErrorType::Unknown;
}

// =============================================================================
// RecoveryPlanner
// =============================================================================

const RecoveryPlan& RecoveryPlanner::plan_for(ErrorType type) {
    using S = RecoveryStrategy;
    static const std::map<ErrorType, RecoveryPlan> plans = {
        {ErrorType::MicrophoneAccess, {S::ReinitializeAudio, Duration(1000), 3, {S::RequestPermissions}}},
        {ErrorType::AudioContext, {S::ReinitializeAudio, Duration(500), 3, {S::RestartService}}},
        {ErrorType::MediaRecorder, {S::ReinitializeAudio, Duration(500), 2, {S::FallbackMode}}},
        {ErrorType::NetworkError, {S::ExponentialBackoff, Duration(1000), 5, {S::SwitchProvider, S::FallbackMode}}},
        {ErrorType::APIError, {S::SwitchProvider, Duration(0), 3, {S::ExponentialBackoff}}},
        {ErrorType::TranscriptionError, {S::SwitchProvider, Duration(0), 3, {S::RestartService}}},
        {ErrorType::TTSError, {S::SwitchProvider, Duration(0), 3, {S::FallbackMode}}},
        {ErrorType::PermissionDenied, {S::RequestPermissions, Duration(0), 1, {}}},
        {ErrorType::BrowserCompatibility, {S::FallbackMode, Duration(0), 1, {}}},
        {ErrorType::ResourceExhausted, {S::ExponentialBackoff, Duration(2000), 3, {S::FallbackMode}}},
        {ErrorType::Timeout, {S::ExponentialBackoff, Duration(500), 3, {S::SwitchProvider}}},
        {ErrorType::Unknown, {S::RestartService, Duration(1000), 1, {S::FallbackMode}}},
    };
    auto it = plans.find(type);
    return it != plans.end() ? it->second : plans.at(ErrorType::Unknown);
}

Duration RecoveryPlanner::backoff_delay(Duration base, int attempts, Duration cap) {
    if (base.count() <= 0) base = Duration(1000);
    int64_t delay = base.count();
    for (int i = 0; i < attempts && delay < cap.count(); i++) {
        delay *= 2;
    }
    return Duration(std::min<int64_t>(delay, cap.count()));
}

RecoveryPlanner::RecoveryPlanner(EventLoop& loop, RecoveryActions& actions, Emitter emit,
                                 const RecoveryConfig& config)
    : loop_(loop)
    , actions_(actions)
    , emit_(std::move(emit))
    , config_(config)
    , in_progress_(false)
    , timer_(0)
    , timer_armed_(false)
{
    if (config_.history_size == 0) config_.history_size = 1;
}

RecoveryPlanner::~RecoveryPlanner() {
    cancel();
}

RecoveryOutcome RecoveryPlanner::handle(const Error& error, Component component, const std::string& context) {
    ErrorType type = classifier_.classify(error);
    TimePoint now = loop_.clock().now();

    ErrorContext entry;
    entry.error_type = type;
    entry.original_error = error;
    entry.timestamp = now;
    entry.recovery_attempts = attempts(type);
    entry.component = component;
    entry.context = context;
    auto& ring = history_[type];
    ring.push_back(entry);
    while (ring.size() > config_.history_size) {
        ring.pop_front();
    }

    LOG_RECOVERY(std::string("classified ") + component_to_string(component) + " failure as " +
                 error_type_to_string(type) + ": " + error.message);

    if (type == ErrorType::PermissionDenied || type == ErrorType::BrowserCompatibility) {
        surface(type, error.message, false);
        return RecoveryOutcome::Surfaced;
    }

    int recent = recent_failures(type, now);
    if (recent >= config_.flapping_threshold) {
        LOG_RECOVERY(std::to_string(recent) + " " + error_type_to_string(type) +
                     " failures within the flapping window, not retrying");
        surface(type, error.message, true);
        return RecoveryOutcome::Surfaced;
    }

    if (in_progress_) {
        LOG_RECOVERY("recovery already in progress, ignoring " + std::string(error_type_to_string(type)));
        return RecoveryOutcome::Skipped;
    }

    const RecoveryPlan& plan = plan_for(type);
    int& count = attempts_[type];
    if (count >= plan.max_attempts) {
        LOG_RECOVERY(std::string("max attempts reached for ") + error_type_to_string(type));
        surface(type, error.message, true);
        return RecoveryOutcome::Surfaced;
    }
    count++;

    run_ = Run{};
    run_.type = type;
    run_.component = component;
    run_.message = error.message;
    run_.attempt = count;
    run_.chain.push_back(plan.strategy);
    run_.chain.insert(run_.chain.end(), plan.fallback_strategies.begin(), plan.fallback_strategies.end());
    in_progress_ = true;

    RecoveryPayload payload;
    payload.error_type = type;
    payload.strategy = recovery_strategy_to_string(plan.strategy);
    payload.attempt = count;
    payload.detail = error.message;
    emit_(EventKind::RecoveryStarted, payload);

    schedule_step();
    return RecoveryOutcome::Started;
}

void RecoveryPlanner::schedule_step() {
    const RecoveryPlan& plan = plan_for(run_.type);
    RecoveryStrategy strategy = run_.chain[run_.index];

    Duration delay(0);
    if (strategy == RecoveryStrategy::ExponentialBackoff) {
        delay = backoff_delay(plan.delay, run_.attempt - 1, config_.backoff_cap);
    } else if (run_.index == 0) {
        delay = plan.delay;
    }

    std::ostringstream oss;
    oss << "step " << (run_.index + 1) << "/" << run_.chain.size() << " "
        << recovery_strategy_to_string(strategy) << " in " << delay.count() << "ms";
    LOG_RECOVERY(oss.str());

    timer_ = loop_.post_delayed(delay, [this]() {
        timer_armed_ = false;
        run_step();
    });
    timer_armed_ = true;
}

void RecoveryPlanner::run_step() {
    if (!in_progress_) return;

    RecoveryStrategy strategy = run_.chain[run_.index];
    VoidResult result = perform(strategy, run_.component);
    if (result.is_ok()) {
        finish(true, recovery_strategy_to_string(strategy));
        return;
    }

    LOG_RECOVERY(std::string(recovery_strategy_to_string(strategy)) + " failed: " + result.error().message);
    run_.index++;
    if (run_.index >= run_.chain.size()) {
        finish(false, result.error().message);
        return;
    }
    schedule_step();
}

VoidResult RecoveryPlanner::perform(RecoveryStrategy strategy, Component component) {
    switch (strategy) {
        case RecoveryStrategy::RestartService: return actions_.restart_service();
        case RecoveryStrategy::ReinitializeAudio: return actions_.reinitialize_audio();
        case RecoveryStrategy::SwitchProvider: return actions_.switch_provider(component);
        case RecoveryStrategy::RequestPermissions: return actions_.request_permissions();
        case RecoveryStrategy::ExponentialBackoff: return after_backoff(component);
        case RecoveryStrategy::FallbackMode: return actions_.enter_fallback_mode();
    }
    return Error(ErrorType::Unknown, "unhandled recovery strategy");
}

VoidResult RecoveryPlanner::after_backoff(Component component) {
    if (run_.attempt > config_.backoff_retry_limit) {
        return Error(run_.type, "still failing after " + std::to_string(run_.attempt - 1) + " backoff retries");
    }
    if (!actions_.service_available(component)) {
        return Error(ErrorType::ResourceExhausted,
                     std::string(component_to_string(component)) + " still unavailable after backoff");
    }
    return VoidResult();
}

void RecoveryPlanner::finish(bool success, const std::string& detail) {
    in_progress_ = false;

    RecoveryPayload payload;
    payload.error_type = run_.type;
    payload.strategy = recovery_strategy_to_string(run_.chain[std::min(run_.index, run_.chain.size() - 1)]);
    payload.attempt = run_.attempt;
    payload.detail = detail;

    if (success) {
        LOG_RECOVERY(std::string("recovered from ") + error_type_to_string(run_.type) + " via " + detail);
        emit_(EventKind::RecoveryCompleted, payload);
        return;
    }

    LOG_RECOVERY(std::string("all strategies failed for ") + error_type_to_string(run_.type));
    emit_(EventKind::RecoveryFailed, payload);
    surface(run_.type, run_.message, false);
}

void RecoveryPlanner::surface(ErrorType type, const std::string& message, bool recoverable) {
    ErrorPayload payload;
    payload.type = type;
    payload.message = message;
    payload.recoverable = recoverable;
    Logger::error(std::string("[Recovery] surfacing ") + error_type_to_string(type) + ": " + message);
    emit_(EventKind::Error, payload);
}

int RecoveryPlanner::recent_failures(ErrorType type, TimePoint now) const {
    auto it = history_.find(type);
    if (it == history_.end()) return 0;
    return static_cast<int>(std::count_if(it->second.begin(), it->second.end(),
        [&](const ErrorContext& ctx) { return now - ctx.timestamp <= config_.flapping_window; }));
}

void RecoveryPlanner::reset_attempts() {
    attempts_.clear();
}

int RecoveryPlanner::attempts(ErrorType type) const {
    auto it = attempts_.find(type);
    return it == attempts_.end() ? 0 : it->second;
}

std::vector<ErrorContext> RecoveryPlanner::history(ErrorType type) const {
    auto it = history_.find(type);
    if (it == history_.end()) return {};
    return std::vector<ErrorContext>(it->second.begin(), it->second.end());
}

void RecoveryPlanner::cancel() {
    if (timer_armed_) {
        loop_.cancel(timer_);
        timer_armed_ = false;
    }
    in_progress_ = false;
}

} // namespace luna_voice
