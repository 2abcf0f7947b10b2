#include "providers/http_providers.h"
#include "providers/protocol.h"
#include "audio_codec.h"
#include "logger.h"
#include "utils.h"
#include "wav.h"
#include <chrono>
#include <sstream>

namespace luna_voice {

namespace {

void add_auth(HttpRequest& request, const std::string& api_key) {
    if (!api_key.empty()) {
        request.headers.push_back("Authorization: Bearer " + api_key);
    }
}

} // namespace

// =============================================================================
// HttpTranscriptionProvider
// =============================================================================

HttpTranscriptionProvider::HttpTranscriptionProvider(const ProviderConfig& config,
                                                     std::shared_ptr<HttpClient> http)
    : config_(config)
    , api_key_(utils::env_or_empty(config.api_key_env))
    , http_(std::move(http))
{
    if (!config_.api_key_env.empty() && api_key_.empty()) {
        Logger::warn("[STT] " + config_.name + ": $" + config_.api_key_env + " is not set");
    }
}

Result<Transcript> HttpTranscriptionProvider::transcribe(const AudioBuffer& audio,
                                                         const AudioFormat& format,
                                                         const CancellationToken& token) {
    if (audio.empty()) {
        return Error(ErrorType::TranscriptionError, "empty audio buffer");
    }

    auto start = std::chrono::steady_clock::now();
    wav::Bytes wav_bytes = wav::encode(audio, format.sample_rate);

    HttpRequest request;
    request.url = config_.endpoint;
    request.timeout_ms = config_.timeout_ms;
    add_auth(request, api_key_);

    MultipartPart file;
    file.name = "file";
    file.filename = "utterance.wav";
    file.content_type = "audio/wav";
    file.data.assign(wav_bytes.begin(), wav_bytes.end());
    request.parts.push_back(std::move(file));
    if (!config_.model.empty()) {
        request.parts.push_back({"model", config_.model, "", ""});
    }
    if (!config_.language.empty()) {
        request.parts.push_back({"language", config_.language, "", ""});
    }

    Result<HttpResponse> response = http_->post(request, token);
    if (response.is_error()) {
        return response.error();
    }

    Result<std::string> text = protocol::extract_transcript_text(response.value().body);
    if (text.is_error()) {
        return text.error();
    }

    Transcript transcript;
    transcript.text = utils::trim_copy(text.value());
    transcript.is_final = true;
    transcript.language = config_.language;
    transcript.duration_ms = format.sample_rate > 0
        ? static_cast<int64_t>(audio.size()) * 1000 / format.sample_rate : 0;
    transcript.processing_ms = ms_between(start, std::chrono::steady_clock::now());
    transcript.provider = config_.name;

    std::ostringstream oss;
    oss << config_.name << ": \"" << transcript.text << "\" (" << transcript.processing_ms << "ms)";
    LOG_STT(oss.str());
    return transcript;
}

// =============================================================================
// HttpSynthesisProvider
// =============================================================================

HttpSynthesisProvider::HttpSynthesisProvider(const ProviderConfig& config,
                                             std::shared_ptr<HttpClient> http)
    : config_(config)
    , api_key_(utils::env_or_empty(config.api_key_env))
    , http_(std::move(http))
{
    if (!config_.api_key_env.empty() && api_key_.empty()) {
        Logger::warn("[TTS] " + config_.name + ": $" + config_.api_key_env + " is not set");
    }
}

Result<SynthesizedAudio> HttpSynthesisProvider::synthesize(const std::string& text,
                                                           const CancellationToken& token) {
    if (utils::is_empty_or_whitespace(text)) {
        return Error(ErrorType::TTSError, "nothing to synthesize");
    }

    HttpRequest request;
    request.url = config_.endpoint;
    request.timeout_ms = config_.timeout_ms;
    request.body = protocol::build_synthesis_request(text, config_.voice, config_.model);
    request.headers.push_back("Content-Type: application/json");
    request.headers.push_back("Accept: audio/wav, audio/mpeg");
    add_auth(request, api_key_);

    Result<HttpResponse> response = http_->post(request, token);
    if (response.is_error()) {
        return response.error();
    }

    const HttpResponse& body = response.value();
    wav::Bytes bytes(body.body.begin(), body.body.end());
    Result<wav::DecodedAudio> decoded = codec::decode(bytes, body.content_type);
    if (decoded.is_error()) {
        return decoded.error();
    }

    SynthesizedAudio audio;
    audio.samples = std::move(decoded.value().samples);
    audio.sample_rate = decoded.value().sample_rate;
    audio.provider = config_.name;

    std::ostringstream oss;
    oss << config_.name << ": " << audio.samples.size() << " samples @ " << audio.sample_rate << "Hz";
    LOG_TTS(oss.str());
    return audio;
}

} // namespace luna_voice
