#pragma once

#include "config.h"
#include "providers/provider.h"
#include <memory>

namespace luna_voice {

/**
 * @brief In-process transcription with a whisper.cpp ggml model
 *
 * The model is loaded once at construction. If loading fails every
 * transcribe() call returns a TranscriptionError, so the breaker opens and
 * the registry moves on to the next provider.
 */
class WhisperTranscriptionProvider : public TranscriptionProvider {
public:
    explicit WhisperTranscriptionProvider(const ProviderConfig& config);
    ~WhisperTranscriptionProvider() override;

    // Non-copyable
    WhisperTranscriptionProvider(const WhisperTranscriptionProvider&) = delete;
    WhisperTranscriptionProvider& operator=(const WhisperTranscriptionProvider&) = delete;

    std::string name() const override;
    ProviderKind kind() const override { return ProviderKind::LocalWhisper; }

    Result<Transcript> transcribe(const AudioBuffer& audio,
                                  const AudioFormat& format,
                                  const CancellationToken& token) override;

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace luna_voice
