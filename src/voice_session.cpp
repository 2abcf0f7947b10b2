#include "voice_session.h"
#include <iomanip>
#include <random>
#include <sstream>

namespace luna_voice {

const char* conversation_state_to_string(ConversationState state) {
    switch (state) {
        case ConversationState::Idle: return "Idle";
        case ConversationState::Listening: return "Listening";
        case ConversationState::Transcribing: return "Transcribing";
        case ConversationState::AwaitingResponse: return "AwaitingResponse";
        case ConversationState::Speaking: return "Speaking";
        case ConversationState::Interrupted: return "Interrupted";
        case ConversationState::Stopped: return "Stopped";
    }
    return "Unknown";
}

std::string VoiceSession::generate_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

} // namespace luna_voice
