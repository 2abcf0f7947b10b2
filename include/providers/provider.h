#pragma once

/**
 * @file provider.h
 * @brief Capability contracts for external speech and chat backends
 *
 * Providers are transport-agnostic: the registry and the state machine only
 * see these interfaces. Calls block and therefore run on the Executor;
 * implementations must honour the cancellation token where the transport
 * allows it.
 */

#include "common.h"
#include "cancellation.h"
#include "errors.h"
#include <optional>
#include <string>
#include <vector>

namespace luna_voice {

/**
 * @brief Transport family a provider is built from
 */
enum class ProviderKind {
    BatchHttp,           ///< One POST per utterance
    StreamingWebSocket,  ///< Duplex channel with JSON control frames
    LocalWhisper         ///< In-process whisper.cpp model
};

enum class ProviderRole {
    Transcription,
    Synthesis
};

const char* provider_kind_to_string(ProviderKind kind);
std::optional<ProviderKind> provider_kind_from_string(const std::string& name);
const char* provider_role_to_string(ProviderRole role);

/**
 * @brief Speech-to-text capability
 */
class TranscriptionProvider {
public:
    virtual ~TranscriptionProvider() = default;

    virtual std::string name() const = 0;
    virtual ProviderKind kind() const = 0;

    /**
     * @brief Transcribe one utterance
     * @return Final transcript or NetworkError / APIError / Timeout /
     *         TranscriptionError
     */
    virtual Result<Transcript> transcribe(const AudioBuffer& audio,
                                          const AudioFormat& format,
                                          const CancellationToken& token) = 0;
};

/**
 * @brief Text-to-speech capability
 */
class SynthesisProvider {
public:
    virtual ~SynthesisProvider() = default;

    virtual std::string name() const = 0;
    virtual ProviderKind kind() const = 0;

    virtual Result<SynthesizedAudio> synthesize(const std::string& text,
                                                const CancellationToken& token) = 0;
};

/**
 * @brief One exchange of the in-memory conversation history
 */
struct ChatMessage {
    std::string role;     ///< "user" or "assistant"
    std::string content;
};

/**
 * @brief Chat/completion backend that answers a user utterance
 */
class ChatBackend {
public:
    virtual ~ChatBackend() = default;

    virtual Result<std::string> respond(const std::string& message,
                                        const std::vector<ChatMessage>& history,
                                        const CancellationToken& token) = 0;
};

} // namespace luna_voice
