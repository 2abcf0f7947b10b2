#pragma once

#include "common.h"
#include "errors.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace luna_voice {

/**
 * @brief Closed set of session notifications delivered to the UI sink
 */
enum class EventKind {
    ListeningStarted,
    ListeningStopped,
    SpeechDetected,
    SpeechEnded,
    ProcessingStarted,
    Transcription,
    AiSpeaking,
    AiFinishedSpeaking,
    UserInterrupted,
    ReplyDropped,
    StateChanged,
    ProviderSwitched,
    Error,
    RecoveryStarted,
    RecoveryCompleted,
    RecoveryFailed
};

/// Topic name used by UI code ("listening-started", "ai-speaking", ...)
const char* event_kind_to_string(EventKind kind);

struct TranscriptionPayload {
    std::string text;
    bool is_final = true;
    std::string provider;
};

struct SpeechPayload {
    std::string text;       ///< Assistant text being spoken
    int64_t duration_ms = 0;
};

struct StatePayload {
    std::string from;
    std::string to;
};

struct ProviderPayload {
    std::string kind;       ///< "transcription" or "synthesis"
    std::string from;
    std::string to;
};

struct ErrorPayload {
    ErrorType type = ErrorType::Unknown;
    std::string message;
    bool recoverable = false;
};

/// Reply discarded because the user started a new turn before it was spoken
struct DroppedReplyPayload {
    std::string user_text;  ///< Transcript the reply answered
    std::string reason;
};

struct RecoveryPayload {
    ErrorType error_type = ErrorType::Unknown;
    std::string strategy;
    int attempt = 0;
    std::string detail;
};

using EventPayload = std::variant<std::monostate, TranscriptionPayload, SpeechPayload,
                                  StatePayload, ProviderPayload, ErrorPayload, RecoveryPayload,
                                  DroppedReplyPayload>;

struct SessionEvent {
    EventKind kind = EventKind::StateChanged;
    std::string session_id;
    uint64_t turn_id = 0;
    TimePoint timestamp{};
    EventPayload payload;
};

using EventHandler = std::function<void(const SessionEvent&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Typed publish/subscribe channel between the runtime and its UI
 *
 * Handlers run synchronously on the publishing thread (the event loop).
 * Subscribing or unsubscribing from inside a handler is allowed.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventKind kind, EventHandler handler);

    /// Receive every event kind
    SubscriptionId subscribe_all(EventHandler handler);

    bool unsubscribe(SubscriptionId id);

    void publish(const SessionEvent& event);

    size_t subscriber_count() const;

private:
    struct Subscription {
        bool all = false;
        EventKind kind = EventKind::StateChanged;
        std::shared_ptr<EventHandler> handler;
    };

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId next_id_ = 1;
};

} // namespace luna_voice
