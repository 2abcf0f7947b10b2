#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <utility>

namespace luna_voice {

// Audio types
using Sample = int16_t;
using AudioBuffer = std::vector<Sample>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_between(TimePoint start, TimePoint end) {
    return std::chrono::duration_cast<Duration>(end - start).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (DEFAULT_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 320 samples @ 16kHz

// Level reported for digital silence (dBFS)
constexpr float SILENCE_LEVEL_DB = -100.0f;

// Turn constants
constexpr int MIN_TURN_MS = 300;
constexpr int MAX_TURN_MS = 30000;

/**
 * @brief One block of captured PCM audio.
 *
 * Immutable once constructed. The level is the frame's RMS energy in dBFS,
 * computed by the producer so every consumer sees the same value.
 */
class AudioFrame {
public:
    AudioFrame() = default;
    AudioFrame(AudioBuffer samples, int sample_rate, uint64_t sequence, TimePoint captured_at)
        : samples_(std::make_shared<const AudioBuffer>(std::move(samples))),
          sample_rate_(sample_rate),
          sequence_(sequence),
          captured_at_(captured_at),
          level_db_(compute_level_db(*samples_)) {}

    const AudioBuffer& samples() const {
        static const AudioBuffer empty;
        return samples_ ? *samples_ : empty;
    }
    int sample_rate() const { return sample_rate_; }
    uint64_t sequence() const { return sequence_; }
    TimePoint captured_at() const { return captured_at_; }
    float level_db() const { return level_db_; }

    int64_t duration_ms() const {
        if (sample_rate_ <= 0) return 0;
        return static_cast<int64_t>(samples().size()) * 1000 / sample_rate_;
    }

    static float compute_level_db(const AudioBuffer& samples);

private:
    std::shared_ptr<const AudioBuffer> samples_;
    int sample_rate_ = DEFAULT_SAMPLE_RATE;
    uint64_t sequence_ = 0;
    TimePoint captured_at_{};
    float level_db_ = SILENCE_LEVEL_DB;
};

/// Format tag sent alongside audio bytes to a transcription provider
struct AudioFormat {
    std::string mime_type = "audio/wav";
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = 1;
};

// Transcript result
struct Transcript {
    std::string text;
    bool is_final = true;
    std::string language;
    int64_t duration_ms = 0;
    int64_t processing_ms = 0;
    std::string provider;   ///< Name of the provider that produced it
};

/// Synthesized speech ready for playback
struct SynthesizedAudio {
    AudioBuffer samples;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    std::string provider;
};

} // namespace luna_voice
