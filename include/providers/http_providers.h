#pragma once

#include "config.h"
#include "providers/http_client.h"
#include "providers/provider.h"
#include <memory>

namespace luna_voice {

/**
 * @brief Batch transcription: one multipart POST per utterance
 *
 * Uploads the utterance as a 16-bit PCM WAV `file` field plus `model` and
 * `language` fields, with Bearer auth when an API key is configured.
 */
class HttpTranscriptionProvider : public TranscriptionProvider {
public:
    HttpTranscriptionProvider(const ProviderConfig& config, std::shared_ptr<HttpClient> http);

    std::string name() const override { return config_.name; }
    ProviderKind kind() const override { return ProviderKind::BatchHttp; }

    Result<Transcript> transcribe(const AudioBuffer& audio,
                                  const AudioFormat& format,
                                  const CancellationToken& token) override;

private:
    ProviderConfig config_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
};

/**
 * @brief Batch synthesis: POST {text, voice, model}, WAV body back
 *
 * audio/mpeg bodies are rejected: there is no MP3 decoder in the runtime.
 */
class HttpSynthesisProvider : public SynthesisProvider {
public:
    HttpSynthesisProvider(const ProviderConfig& config, std::shared_ptr<HttpClient> http);

    std::string name() const override { return config_.name; }
    ProviderKind kind() const override { return ProviderKind::BatchHttp; }

    Result<SynthesizedAudio> synthesize(const std::string& text,
                                        const CancellationToken& token) override;

private:
    ProviderConfig config_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
};

} // namespace luna_voice
