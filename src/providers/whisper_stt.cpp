#include "providers/whisper_stt.h"
#include "logger.h"
#include "utils.h"
#include "wav.h"
#include <whisper.h>
#include <chrono>
#include <mutex>
#include <sstream>

namespace luna_voice {

namespace {

// whisper.cpp models expect 16 kHz mono float PCM
constexpr int WHISPER_RATE = 16000;

bool abort_when_cancelled(void* user_data) {
    const auto* token = static_cast<const CancellationToken*>(user_data);
    return token->is_cancelled();
}

} // namespace

class WhisperTranscriptionProvider::Impl {
public:
    explicit Impl(const ProviderConfig& config) : config_(config), ctx_(nullptr) {
        if (config_.model_path.empty()) {
            LOG_STT(config_.name + ": no model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            Logger::error("[STT] Failed to load whisper model: " + config_.model_path);
            return;
        }

        LOG_STT(config_.name + ": model loaded from " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format,
                                  const CancellationToken& token) {
        if (!ctx_) {
            return Error(ErrorType::TranscriptionError, "whisper model not loaded: " + config_.model_path);
        }
        if (audio.empty()) {
            return Error(ErrorType::TranscriptionError, "empty audio buffer");
        }

        auto start = std::chrono::steady_clock::now();

        AudioBuffer pcm = format.sample_rate == WHISPER_RATE
            ? audio : wav::resample(audio, format.sample_rate, WHISPER_RATE);

        std::vector<float> pcmf32(pcm.size());
        for (size_t i = 0; i < pcm.size(); i++) {
            pcmf32[i] = static_cast<float>(pcm[i]) / 32768.0f;
        }

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = 4;
        params.offset_ms = 0;
        params.no_context = true;
        params.single_segment = true;
        params.abort_callback = abort_when_cancelled;
        params.abort_callback_user_data = const_cast<CancellationToken*>(&token);

        // One whisper_context serves one inference at a time
        std::lock_guard<std::mutex> lock(mutex_);

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (token.is_cancelled()) {
            return make_cancelled_error("whisper inference");
        }
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            return Error(ErrorType::TranscriptionError, oss.str());
        }

        std::string text;
        int n_segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
        }

        Transcript transcript;
        transcript.text = utils::trim_copy(text);
        transcript.is_final = true;
        transcript.language = config_.language;
        transcript.duration_ms = static_cast<int64_t>(pcm.size()) * 1000 / WHISPER_RATE;
        transcript.processing_ms = ms_between(start, std::chrono::steady_clock::now());
        transcript.provider = config_.name;

        std::ostringstream oss;
        oss << config_.name << ": \"" << transcript.text << "\" (" << transcript.processing_ms << "ms)";
        LOG_STT(oss.str());
        return transcript;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

    const ProviderConfig& config() const { return config_; }

private:
    ProviderConfig config_;
    whisper_context* ctx_;
    std::mutex mutex_;
};

WhisperTranscriptionProvider::WhisperTranscriptionProvider(const ProviderConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperTranscriptionProvider::~WhisperTranscriptionProvider() = default;

std::string WhisperTranscriptionProvider::name() const {
    return pimpl_->config().name;
}

Result<Transcript> WhisperTranscriptionProvider::transcribe(const AudioBuffer& audio,
                                                            const AudioFormat& format,
                                                            const CancellationToken& token) {
    return pimpl_->transcribe(audio, format, token);
}

bool WhisperTranscriptionProvider::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace luna_voice
