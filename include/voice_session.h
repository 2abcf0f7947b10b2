#pragma once

#include "common.h"
#include "providers/provider.h"
#include <string>
#include <vector>

namespace luna_voice {

/**
 * @brief Turn-taking states of one conversation
 */
enum class ConversationState {
    Idle,               ///< Created, or paused between turns
    Listening,          ///< Capture open, waiting for speech
    Transcribing,       ///< Utterance sent to the transcription provider
    AwaitingResponse,   ///< Transcript sent to the chat backend
    Speaking,           ///< Reply being synthesized or played
    Interrupted,        ///< Barge-in in progress (transient)
    Stopped             ///< Terminal
};

const char* conversation_state_to_string(ConversationState state);

/**
 * @brief Root aggregate of one active conversation
 *
 * Written only by ConversationStateMachine, on the event loop thread.
 */
struct VoiceSession {
    std::string session_id;
    ConversationState state = ConversationState::Idle;
    std::string active_transcription_provider;
    std::string active_synthesis_provider;

    TimePoint started_at{};
    TimePoint last_user_speech_at{};
    TimePoint last_assistant_speech_at{};

    uint64_t turn_id = 0;
    AudioBuffer turn_buffer;        ///< Utterance being recorded
    bool recording = false;
    size_t speech_samples = 0;      ///< turn_buffer length at the last speech frame
    bool interrupt_flag = false;    ///< A full utterance is queued behind the turn in flight
    bool fallback_mode = false;     ///< VAD disabled; turns are delimited manually

    std::vector<ChatMessage> history;   ///< Bounded, in memory only

    /// Random 128-bit hex identifier
    static std::string generate_id();
};

} // namespace luna_voice
