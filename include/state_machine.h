#pragma once

#include "common.h"
#include "audio_io.h"
#include "config.h"
#include "error_recovery.h"
#include "event_bus.h"
#include "event_loop.h"
#include "executor.h"
#include "provider_registry.h"
#include "vad/vad_interface.h"
#include "voice_session.h"
#include <memory>
#include <functional>

namespace luna_voice {

/**
 * @brief Collaborators of the conversation state machine
 *
 * Everything is borrowed; VoiceRuntime owns the instances.
 */
struct ConversationDeps {
    EventLoop& loop;
    Executor& executor;
    EventBus& bus;
    ProviderRegistry& registry;
    ChatBackend& chat;
    AudioCapture& capture;
    AudioOutput& output;
    vad::IVAD& vad;
};

/**
 * @brief Turn-taking orchestrator for one VoiceSession
 *
 * - Idle -> Listening (start; capture opened)
 * - Listening -> Transcribing (speech-end with at least min_turn_ms of audio)
 * - Transcribing -> AwaitingResponse (non-empty transcript)
 * - AwaitingResponse -> Speaking (reply text; synthesis then playback)
 * - Speaking -> Listening (playback complete)
 * - Speaking -> Interrupted -> Listening (speech-start; barge-in)
 * - any -> Stopped (stop)
 *
 * Provider calls run on the Executor and post their results back to the
 * loop. A result whose turn id or cancellation token no longer matches
 * the session is dropped. Failures go to the RecoveryPlanner and the turn
 * ends in Listening.
 *
 * Thread Safety:
 * - Every public method must be called on the event loop thread
 */
class ConversationStateMachine : public RecoveryActions {
public:
    ConversationStateMachine(const ConversationDeps& deps, const Config& config);
    ~ConversationStateMachine() override;

    // Non-copyable
    ConversationStateMachine(const ConversationStateMachine&) = delete;
    ConversationStateMachine& operator=(const ConversationStateMachine&) = delete;

    /**
     * @brief Start the session: open capture and output, begin listening
     *
     * A device failure is returned and also handed to recovery, which may
     * bring the session to Listening later (ReinitializeAudio).
     */
    VoidResult start();

    /**
     * @brief Terminal stop: cancel in-flight work, release devices
     */
    void stop();

    /// Resume after a completed turn when continuous listening is off
    void resume_listening();

    /**
     * @brief Feed one captured frame (VAD, recording, barge-in)
     */
    void on_audio_frame(const AudioFrame& frame);

    /**
     * @brief Re-evaluate the silence timeout without a new frame
     */
    void on_tick();

    /**
     * @brief Push-to-talk while VAD is disabled
     * @return Error when not in fallback mode or a turn is already being recorded
     */
    VoidResult begin_manual_turn();
    VoidResult end_manual_turn();
    void exit_fallback_mode();

    // Runtime VAD tuning
    void set_vad_threshold_db(float threshold_db);
    void set_silence_timeout(Duration timeout);

    ConversationState state() const;
    const VoiceSession& session() const;
    RecoveryPlanner& recovery();

    /// Audio recorded while a turn was in flight, waiting for its turn
    bool has_pending_utterance() const;

    // RecoveryActions
    VoidResult restart_service() override;
    VoidResult reinitialize_audio() override;
    VoidResult switch_provider(Component component) override;
    VoidResult request_permissions() override;
    VoidResult enter_fallback_mode() override;
    bool service_available(Component component) const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace luna_voice
