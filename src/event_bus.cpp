#include "event_bus.h"
#include "logger.h"
#include <exception>

namespace luna_voice {

const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::ListeningStarted: return "listening-started";
        case EventKind::ListeningStopped: return "listening-stopped";
        case EventKind::SpeechDetected: return "speech-detected";
        case EventKind::SpeechEnded: return "speech-ended";
        case EventKind::ProcessingStarted: return "processing-started";
        case EventKind::Transcription: return "transcription";
        case EventKind::AiSpeaking: return "ai-speaking";
        case EventKind::AiFinishedSpeaking: return "ai-finished-speaking";
        case EventKind::UserInterrupted: return "user-interrupted";
        case EventKind::ReplyDropped: return "reply-dropped";
        case EventKind::StateChanged: return "state-changed";
        case EventKind::ProviderSwitched: return "provider-switched";
        case EventKind::Error: return "error";
        case EventKind::RecoveryStarted: return "recovery-started";
        case EventKind::RecoveryCompleted: return "recovery-completed";
        case EventKind::RecoveryFailed: return "recovery-failed";
    }
    return "unknown";
}

SubscriptionId EventBus::subscribe(EventKind kind, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    Subscription sub;
    sub.kind = kind;
    sub.handler = std::make_shared<EventHandler>(std::move(handler));
    subscriptions_.emplace(id, std::move(sub));
    return id;
}

SubscriptionId EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    Subscription sub;
    sub.all = true;
    sub.handler = std::make_shared<EventHandler>(std::move(handler));
    subscriptions_.emplace(id, std::move(sub));
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

void EventBus::publish(const SessionEvent& event) {
    // Snapshot handlers so a handler may (un)subscribe without deadlocking
    std::vector<std::shared_ptr<EventHandler>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : subscriptions_) {
            if (entry.second.all || entry.second.kind == event.kind) {
                targets.push_back(entry.second.handler);
            }
        }
    }
    for (const auto& handler : targets) {
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            Logger::error(std::string("[EventBus] handler for '") + event_kind_to_string(event.kind) +
                          "' threw: " + e.what());
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

} // namespace luna_voice
