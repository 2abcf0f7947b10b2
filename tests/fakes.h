#pragma once

/**
 * Scripted stand-ins for devices, providers and the executor.
 * Everything runs on the test thread; nothing touches audio hardware or
 * the network.
 */

#include "audio_io.h"
#include "clock.h"
#include "event_bus.h"
#include "executor.h"
#include "providers/provider.h"
#include <deque>
#include <string>
#include <vector>

namespace luna_voice {
namespace testing {

constexpr int TEST_RATE = 16000;
constexpr int FRAME_MS = 20;
constexpr int SPEECH_AMPLITUDE = 3000;   // about -21 dBFS
constexpr int SILENCE_AMPLITUDE = 30;    // about -61 dBFS

/// Square wave of the given amplitude; RMS equals the amplitude
inline AudioFrame make_frame(TimePoint at, int amplitude, uint64_t sequence = 0,
                             int ms = FRAME_MS, int rate = TEST_RATE) {
    AudioBuffer samples(static_cast<size_t>(rate * ms / 1000));
    for (size_t i = 0; i < samples.size(); i++) {
        samples[i] = static_cast<Sample>(i % 2 == 0 ? amplitude : -amplitude);
    }
    return AudioFrame(std::move(samples), rate, sequence, at);
}

class FakeCapture : public AudioCapture {
public:
    VoidResult open(const AudioConfig& config, FrameCallback on_frame) override {
        (void)config;
        open_calls++;
        if (open_error.is_error()) {
            return open_error;
        }
        on_frame_ = std::move(on_frame);
        open_ = true;
        return VoidResult();
    }

    void close() override {
        if (open_) close_calls++;
        open_ = false;
        on_frame_ = nullptr;
    }

    bool is_open() const override { return open_; }

    /// Deliver a frame the way the audio thread would
    void emit(const AudioFrame& frame) {
        if (open_ && on_frame_) on_frame_(frame);
    }

    Error open_error;
    int open_calls = 0;
    int close_calls = 0;

private:
    bool open_ = false;
    FrameCallback on_frame_;
};

class FakeOutput : public AudioOutput {
public:
    VoidResult open(const AudioConfig& config) override {
        (void)config;
        open_ = true;
        return VoidResult();
    }

    void close() override { open_ = false; }

    VoidResult play(const AudioBuffer& buffer, int sample_rate, PlaybackCallback on_complete) override {
        if (play_error.is_error()) {
            return play_error;
        }
        play_calls++;
        last_buffer = buffer;
        last_rate = sample_rate;
        on_complete_ = std::move(on_complete);
        playing_ = true;
        return VoidResult();
    }

    void stop() override {
        if (playing_) stop_calls++;
        playing_ = false;
        on_complete_ = nullptr;
    }

    bool is_playing() const override { return playing_; }

    /// Simulate the device draining the queue
    void finish() {
        if (!playing_) return;
        playing_ = false;
        PlaybackCallback done = std::move(on_complete_);
        on_complete_ = nullptr;
        if (done) done();
    }

    Error play_error;
    int play_calls = 0;
    int stop_calls = 0;
    AudioBuffer last_buffer;
    int last_rate = 0;

private:
    bool open_ = false;
    bool playing_ = false;
    PlaybackCallback on_complete_;
};

class ScriptedTranscriber : public TranscriptionProvider {
public:
    explicit ScriptedTranscriber(std::string name, std::string reply_text = "hello there")
        : text(std::move(reply_text)), name_(std::move(name)) {}

    std::string name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::BatchHttp; }

    Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format,
                                  const CancellationToken& token) override {
        calls++;
        last_audio_size = audio.size();
        last_rate = format.sample_rate;
        last_token = token;
        if (!failures.empty()) {
            Error error = failures.front();
            failures.pop_front();
            return error;
        }
        Transcript transcript;
        transcript.text = text;
        transcript.provider = name_;
        return transcript;
    }

    std::string text;
    std::deque<Error> failures;     ///< Returned first, one per call
    int calls = 0;
    size_t last_audio_size = 0;
    int last_rate = 0;
    CancellationToken last_token;

private:
    std::string name_;
};

class ScriptedSynthesizer : public SynthesisProvider {
public:
    explicit ScriptedSynthesizer(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }
    ProviderKind kind() const override { return ProviderKind::BatchHttp; }

    Result<SynthesizedAudio> synthesize(const std::string& text, const CancellationToken& token) override {
        calls++;
        last_text = text;
        last_token = token;
        if (!failures.empty()) {
            Error error = failures.front();
            failures.pop_front();
            return error;
        }
        SynthesizedAudio audio;
        audio.samples.assign(TEST_RATE, 100);   // one second
        audio.sample_rate = TEST_RATE;
        audio.provider = name_;
        return audio;
    }

    std::deque<Error> failures;
    int calls = 0;
    std::string last_text;
    CancellationToken last_token;

private:
    std::string name_;
};

class FakeChat : public ChatBackend {
public:
    Result<std::string> respond(const std::string& message, const std::vector<ChatMessage>& history,
                                const CancellationToken& token) override {
        calls++;
        last_message = message;
        last_history = history;
        (void)token;
        if (!failures.empty()) {
            Error error = failures.front();
            failures.pop_front();
            return error;
        }
        return reply;
    }

    std::string reply = "Hi, how can I help?";
    std::deque<Error> failures;
    int calls = 0;
    std::string last_message;
    std::vector<ChatMessage> last_history;
};

/**
 * @brief Holds submitted jobs until the test releases them
 */
class DeferredExecutor : public Executor {
public:
    void submit(Job job) override { jobs_.push_back(std::move(job)); }
    void shutdown() override { jobs_.clear(); }

    size_t queued() const { return jobs_.size(); }

    /// Run the oldest job; returns false when none is queued
    bool run_next() {
        if (jobs_.empty()) return false;
        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        job();
        return true;
    }

private:
    std::deque<Job> jobs_;
};

class EventRecorder {
public:
    explicit EventRecorder(EventBus& bus) {
        bus.subscribe_all([this](const SessionEvent& event) { events.push_back(event); });
    }

    int count(EventKind kind) const {
        int n = 0;
        for (const auto& event : events) {
            if (event.kind == kind) n++;
        }
        return n;
    }

    bool has(EventKind kind) const { return count(kind) > 0; }

    /// Position of the first event of `kind`, or -1
    int index_of(EventKind kind) const {
        for (size_t i = 0; i < events.size(); i++) {
            if (events[i].kind == kind) return static_cast<int>(i);
        }
        return -1;
    }

    const SessionEvent* last(EventKind kind) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->kind == kind) return &*it;
        }
        return nullptr;
    }

    void clear() { events.clear(); }

    std::vector<SessionEvent> events;
};

} // namespace testing
} // namespace luna_voice
