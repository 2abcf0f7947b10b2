#pragma once

/**
 * @file vad_interface.h
 * @brief Voice Activity Detection interface
 *
 * Defines the abstract interface for VAD implementations so the
 * conversation state machine can be driven by a scripted detector in tests.
 */

#include "common.h"
#include <memory>

namespace luna_voice {
namespace vad {

/**
 * @brief Edge events emitted during processing
 */
enum class Event {
    None,           ///< No transition
    SpeechStart,    ///< First speech frame after a quiet period
    SpeechEnd       ///< Non-speech held for the full silence timeout
};

/**
 * @brief Per-frame classification (transient, never stored)
 */
struct Decision {
    float level = SILENCE_LEVEL_DB;        ///< Frame level in dBFS
    float noise_floor = SILENCE_LEVEL_DB;  ///< Current noise-floor estimate in dBFS
    bool is_speech = false;
};

/**
 * @brief VAD statistics for debugging
 */
struct Stats {
    bool in_speech = false;
    float noise_floor = SILENCE_LEVEL_DB;
    float threshold_db = 0.0f;
    int64_t silence_timeout_ms = 0;
    size_t noise_samples = 0;
    TimePoint speech_started_at{};
    TimePoint last_speech_at{};
};

/**
 * @brief Abstract VAD interface
 */
class IVAD {
public:
    virtual ~IVAD() = default;

    /**
     * @brief Classify one frame and report any edge it produces
     */
    virtual Event process(const AudioFrame& frame) = 0;

    /**
     * @brief Evaluate the silence timeout without a new frame
     *
     * Lets a loop timer close an utterance when capture stalls.
     */
    virtual Event tick(TimePoint now) = 0;

    /**
     * @brief Return to the quiet state; the noise-floor window is kept
     */
    virtual void reset() = 0;

    virtual Decision last_decision() const = 0;
    virtual Stats get_stats() const = 0;
    virtual bool is_speech() const = 0;

    // Runtime tuning, applied from the next frame on
    virtual void set_threshold_db(float threshold_db) = 0;
    virtual void set_silence_timeout(Duration timeout) = 0;
};

/**
 * @brief Convert Event to string for logging
 */
inline const char* event_to_string(Event event) {
    switch (event) {
        case Event::None: return "None";
        case Event::SpeechStart: return "SpeechStart";
        case Event::SpeechEnd: return "SpeechEnd";
    }
    return "Unknown";
}

} // namespace vad
} // namespace luna_voice
