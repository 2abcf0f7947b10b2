#pragma once

#include "config.h"
#include "providers/provider.h"
#include <memory>

namespace luna_voice {

/**
 * @brief Streaming transcription over a WebSocket (libcurl ws API)
 *
 * Per utterance: connect, wait for `session-ready`, send `configure`,
 * stream the WAV-encoded audio as binary messages of at most chunk_bytes,
 * then `flush` so the server processes any buffered tail. The first final
 * `transcription` frame completes the call; an `error` frame fails it.
 */
class StreamingTranscriptionProvider : public TranscriptionProvider {
public:
    explicit StreamingTranscriptionProvider(const ProviderConfig& config);
    ~StreamingTranscriptionProvider() override;

    StreamingTranscriptionProvider(const StreamingTranscriptionProvider&) = delete;
    StreamingTranscriptionProvider& operator=(const StreamingTranscriptionProvider&) = delete;

    std::string name() const override;
    ProviderKind kind() const override { return ProviderKind::StreamingWebSocket; }

    Result<Transcript> transcribe(const AudioBuffer& audio,
                                  const AudioFormat& format,
                                  const CancellationToken& token) override;

    /**
     * @brief Ask the server for its buffer status (`get-status`)
     * @return Raw `status-update` frame
     */
    Result<std::string> query_status(const CancellationToken& token);

    /**
     * @brief Send `reset` so the server drops any buffered audio
     */
    VoidResult reset_remote(const CancellationToken& token);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace luna_voice
