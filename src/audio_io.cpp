#include "audio_io.h"
#include "logger.h"
#include "wav.h"
#include <portaudio.h>
#include <algorithm>
#include <vector>
#include <mutex>
#include <queue>
#include <atomic>
#include <cstring>
#include <sstream>

namespace luna_voice {

namespace {

std::string pa_error_text(PaError err) {
    std::ostringstream oss;
    oss << Pa_GetErrorText(err) << " (Error code: " << err << ")";
    return oss.str();
}

int frames_per_buffer(const AudioConfig& config) {
    int frames = config.sample_rate * config.frame_ms / 1000;
    return frames > 0 ? frames : SAMPLES_PER_FRAME;
}

// "default", a numeric index, or an exact device name
int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            LOG_AUDIO(oss.str());
            return default_idx;
        }
        return -1;
    }

    try {
        int device_idx = std::stoi(name);
        if (device_idx >= 0 && device_idx < num_devices && Pa_GetDeviceInfo(device_idx)) {
            std::ostringstream oss;
            oss << "Using " << (is_input ? "input" : "output") << " device by index: ["
                << device_idx << "] " << Pa_GetDeviceInfo(device_idx)->name;
            LOG_AUDIO(oss.str());
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->name != name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            std::ostringstream oss;
            oss << "Found " << (is_input ? "input" : "output") << " device: [" << i << "] " << info->name;
            LOG_AUDIO(oss.str());
            return i;
        }
    }

    return -1;
}

} // namespace

// =============================================================================
// PortAudioCapture
// =============================================================================

class PortAudioCapture::Impl {
public:
    explicit Impl(Clock& clock) : clock_(clock), stream_(nullptr), initialized_(false) {}

    ~Impl() {
        close();
    }

    VoidResult open(const AudioConfig& config, FrameCallback on_frame) {
        if (stream_) {
            return VoidResult();
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return Error(ErrorType::AudioContext, "PortAudio init error: " + pa_error_text(err));
        }
        initialized_ = true;

        int device = find_device(config.input_device, true);
        const PaDeviceInfo* info = device >= 0 ? Pa_GetDeviceInfo(device) : nullptr;
        if (!info || info->maxInputChannels == 0) {
            terminate();
            return Error(ErrorType::MicrophoneAccess, "device unavailable: input device '" +
                                                      config.input_device + "' not found or has no input channels");
        }

        if (!config.echo_cancellation || !config.noise_suppression || !config.auto_gain) {
            LOG_AUDIO("Echo cancellation / noise suppression / auto gain are left to the host audio stack");
        }

        sample_rate_ = config.sample_rate;
        channels_ = config.channels > 0 ? std::min(config.channels, info->maxInputChannels) : 1;
        on_frame_ = std::move(on_frame);
        sequence_ = 0;

        PaStreamParameters input_params;
        input_params.device = device;
        input_params.channelCount = channels_;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, &input_params, nullptr, sample_rate_,
                            frames_per_buffer(config), paClipOff, capture_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            terminate();
            return Error(ErrorType::MicrophoneAccess, "device unavailable: failed to open input stream: " +
                                                      pa_error_text(err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            terminate();
            if (err == paUnanticipatedHostError) {
                Logger::error("This may be a permissions issue; check that this terminal has microphone access.");
                return Error(ErrorType::PermissionDenied, "microphone permission denied: " + pa_error_text(err));
            }
            return Error(ErrorType::MicrophoneAccess, "failed to start input stream: " + pa_error_text(err));
        }

        std::ostringstream oss;
        oss << "Capture open: [" << device << "] " << info->name << " @ " << sample_rate_ << "Hz";
        LOG_AUDIO(oss.str());
        return VoidResult();
    }

    void close() {
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            LOG_AUDIO("Capture closed");
        }
        terminate();
    }

    bool is_open() const {
        return stream_ != nullptr;
    }

private:
    void terminate() {
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    static int capture_callback(const void* input, void* output,
                                unsigned long frame_count,
                                const PaStreamCallbackTimeInfo* time_info,
                                PaStreamCallbackFlags status_flags,
                                void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        if (!input || !self->on_frame_) {
            return paContinue;
        }

        const Sample* in = static_cast<const Sample*>(input);
        AudioBuffer samples(frame_count);
        if (self->channels_ == 1) {
            std::memcpy(samples.data(), in, frame_count * sizeof(Sample));
        } else {
            // Downmix interleaved channels
            for (unsigned long i = 0; i < frame_count; i++) {
                int sum = 0;
                for (int c = 0; c < self->channels_; c++) {
                    sum += in[i * self->channels_ + c];
                }
                samples[i] = static_cast<Sample>(sum / self->channels_);
            }
        }

        AudioFrame frame(std::move(samples), self->sample_rate_, self->sequence_++, self->clock_.now());
        self->on_frame_(frame);
        return paContinue;
    }

    Clock& clock_;
    PaStream* stream_;
    bool initialized_;
    int sample_rate_ = DEFAULT_SAMPLE_RATE;
    int channels_ = 1;
    uint64_t sequence_ = 0;
    FrameCallback on_frame_;
};

PortAudioCapture::PortAudioCapture(Clock& clock) : pimpl_(std::make_unique<Impl>(clock)) {}
PortAudioCapture::~PortAudioCapture() = default;

VoidResult PortAudioCapture::open(const AudioConfig& config, FrameCallback on_frame) {
    return pimpl_->open(config, std::move(on_frame));
}

void PortAudioCapture::close() {
    pimpl_->close();
}

bool PortAudioCapture::is_open() const {
    return pimpl_->is_open();
}

void PortAudioCapture::list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
        oss << " " << info->defaultSampleRate << "Hz";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

// =============================================================================
// PortAudioOutput
// =============================================================================

class PortAudioOutput::Impl {
public:
    Impl() : stream_(nullptr), initialized_(false), playing_(false) {}

    ~Impl() {
        close();
    }

    VoidResult open(const AudioConfig& config) {
        if (stream_) {
            return VoidResult();
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return Error(ErrorType::AudioContext, "PortAudio init error: " + pa_error_text(err));
        }
        initialized_ = true;

        int device = find_device(config.output_device, false);
        const PaDeviceInfo* info = device >= 0 ? Pa_GetDeviceInfo(device) : nullptr;
        if (!info || info->maxOutputChannels == 0) {
            terminate();
            return Error(ErrorType::AudioContext, "output device '" + config.output_device + "' not found");
        }

        sample_rate_ = config.sample_rate;
        frame_size_ = static_cast<size_t>(frames_per_buffer(config));

        PaStreamParameters output_params;
        output_params.device = device;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&stream_, nullptr, &output_params, sample_rate_,
                            static_cast<unsigned long>(frame_size_), paClipOff, playback_callback, this);
        if (err != paNoError) {
            stream_ = nullptr;
            terminate();
            return Error(ErrorType::AudioContext, "failed to open output stream: " + pa_error_text(err));
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Pa_CloseStream(stream_);
            stream_ = nullptr;
            terminate();
            return Error(ErrorType::AudioContext, "failed to start output stream: " + pa_error_text(err));
        }

        std::ostringstream oss;
        oss << "Output open: [" << device << "] " << info->name << " @ " << sample_rate_ << "Hz";
        LOG_AUDIO(oss.str());
        return VoidResult();
    }

    void close() {
        stop();
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    VoidResult play(const AudioBuffer& buffer, int sample_rate, PlaybackCallback on_complete) {
        if (!stream_) {
            return Error(ErrorType::AudioContext, "output stream is not open");
        }

        AudioBuffer pcm = sample_rate == sample_rate_
            ? buffer : wav::resample(buffer, sample_rate, sample_rate_);

        std::lock_guard<std::mutex> lock(playback_mutex_);
        while (!playback_queue_.empty()) {
            playback_queue_.pop();
        }

        // Split buffer into device-sized frames, padding the last one
        for (size_t i = 0; i < pcm.size(); i += frame_size_) {
            size_t remaining = pcm.size() - i;
            size_t n = remaining < frame_size_ ? remaining : frame_size_;
            AudioBuffer frame(pcm.begin() + i, pcm.begin() + i + n);
            frame.resize(frame_size_, 0);
            playback_queue_.push(std::move(frame));
        }

        on_complete_ = std::move(on_complete);
        playing_ = true;
        return VoidResult();
    }

    void stop() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        while (!playback_queue_.empty()) {
            playback_queue_.pop();
        }
        on_complete_ = nullptr;
        playing_ = false;
    }

    bool is_playing() const {
        return playing_;
    }

private:
    void terminate() {
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    static int playback_callback(const void* input, void* output,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* time_info,
                                 PaStreamCallbackFlags status_flags,
                                 void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);
        PlaybackCallback finished;

        {
            std::lock_guard<std::mutex> lock(self->playback_mutex_);
            if (self->playback_queue_.empty()) {
                std::memset(out, 0, frame_count * sizeof(Sample));
                if (self->playing_) {
                    self->playing_ = false;
                    finished = std::move(self->on_complete_);
                    self->on_complete_ = nullptr;
                }
            } else {
                const AudioBuffer& frame = self->playback_queue_.front();
                size_t n = std::min<size_t>(frame_count, frame.size());
                std::memcpy(out, frame.data(), n * sizeof(Sample));
                if (n < frame_count) {
                    std::memset(out + n, 0, (frame_count - n) * sizeof(Sample));
                }
                self->playback_queue_.pop();
            }
        }

        if (finished) {
            finished();
        }
        return paContinue;
    }

    PaStream* stream_;
    bool initialized_;
    int sample_rate_ = DEFAULT_SAMPLE_RATE;
    size_t frame_size_ = SAMPLES_PER_FRAME;

    mutable std::mutex playback_mutex_;
    std::queue<AudioBuffer> playback_queue_;
    PlaybackCallback on_complete_;
    std::atomic<bool> playing_;
};

PortAudioOutput::PortAudioOutput() : pimpl_(std::make_unique<Impl>()) {}
PortAudioOutput::~PortAudioOutput() = default;

VoidResult PortAudioOutput::open(const AudioConfig& config) {
    return pimpl_->open(config);
}

void PortAudioOutput::close() {
    pimpl_->close();
}

VoidResult PortAudioOutput::play(const AudioBuffer& buffer, int sample_rate, PlaybackCallback on_complete) {
    return pimpl_->play(buffer, sample_rate, std::move(on_complete));
}

void PortAudioOutput::stop() {
    pimpl_->stop();
}

bool PortAudioOutput::is_playing() const {
    return pimpl_->is_playing();
}

} // namespace luna_voice
