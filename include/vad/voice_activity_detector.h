#pragma once

/**
 * @file voice_activity_detector.h
 * @brief Level-based VAD with a percentile noise floor and silence hysteresis
 *
 * Features:
 * - Noise floor = low percentile of a rolling window of frame levels,
 *   sampled at a fixed cadence by capture timestamp
 * - Speech when the level exceeds the floor by threshold_db
 * - speech-end only after non-speech holds for the whole silence timeout,
 *   so natural pauses never split an utterance
 */

#include "vad_interface.h"
#include <memory>

namespace luna_voice {
namespace vad {

/**
 * @brief Configuration for the detector
 */
struct VADConfig {
    /// Required margin over the noise floor (dB)
    float threshold_db = 15.0f;

    /// Continuous non-speech needed to end an utterance (ms)
    int silence_timeout_ms = 1800;

    /// Number of level samples kept for the noise-floor estimate
    size_t noise_window_size = 50;

    /// Cadence at which frame levels enter the window (ms)
    int noise_sample_interval_ms = 100;

    /// Percentile of the window used as the floor (0..1)
    float noise_percentile = 0.10f;
};

class VoiceActivityDetector : public IVAD {
public:
    explicit VoiceActivityDetector(const VADConfig& config = {});
    ~VoiceActivityDetector() override;

    VoiceActivityDetector(const VoiceActivityDetector&) = delete;
    VoiceActivityDetector& operator=(const VoiceActivityDetector&) = delete;

    // IVAD interface
    Event process(const AudioFrame& frame) override;
    Event tick(TimePoint now) override;
    void reset() override;
    Decision last_decision() const override;
    Stats get_stats() const override;
    bool is_speech() const override;
    void set_threshold_db(float threshold_db) override;
    void set_silence_timeout(Duration timeout) override;

    /// Floor estimate from the current window (SILENCE_LEVEL_DB when empty)
    float noise_floor() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vad
} // namespace luna_voice
