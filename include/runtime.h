#pragma once

#include "config.h"
#include "event_bus.h"
#include <memory>

namespace luna_voice {

/**
 * @brief Process-wide container for one voice session
 *
 * Builds every component from Config and owns them. Initialization order:
 * - Logger level and file
 * - Clock, event loop, provider executor
 * - Event bus
 * - Circuit breaker
 * - HTTP client, provider registry (via ProviderFactory), chat client
 * - Audio capture, audio output, voice activity detector
 * - Conversation state machine (owns the recovery planner)
 *
 * Teardown runs in reverse, after the executor has drained so no worker
 * still references a component.
 */
class VoiceRuntime {
public:
    explicit VoiceRuntime(const Config& config);
    ~VoiceRuntime();

    // Non-copyable
    VoiceRuntime(const VoiceRuntime&) = delete;
    VoiceRuntime& operator=(const VoiceRuntime&) = delete;

    /**
     * @brief Build all components
     * @return True if initialization successful, false otherwise
     */
    bool initialize();

    /**
     * @brief Start the session and run the event loop until shutdown()
     * @return Exit code (0 for success, non-zero for error)
     */
    int run();

    /**
     * @brief Request shutdown (thread-safe)
     */
    void shutdown();

    /// Toggle a push-to-talk turn; only honoured in fallback mode (thread-safe)
    void toggle_push_to_talk();

    /// Re-enable voice detection after fallback mode (thread-safe)
    void exit_fallback_mode();

    /// Valid after initialize()
    EventBus& events();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace luna_voice
