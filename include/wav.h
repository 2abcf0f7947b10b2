#pragma once

#include "common.h"
#include "errors.h"
#include <cstdint>
#include <vector>

namespace luna_voice {
namespace wav {

using Bytes = std::vector<uint8_t>;

struct DecodedAudio {
    AudioBuffer samples;    ///< Mono PCM16
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int source_channels = 1;
};

/**
 * @brief Encode mono PCM16 as a canonical 44-byte-header RIFF/WAVE buffer
 */
Bytes encode(const AudioBuffer& samples, int sample_rate);

/**
 * @brief Decode a RIFF/WAVE buffer holding 16-bit PCM
 *
 * Walks the chunk list (LIST/fact chunks are skipped), downmixes any
 * channel count to mono by averaging. Fails with a TTSError-typed error
 * for anything that is not 16-bit PCM WAV.
 */
Result<DecodedAudio> decode(const Bytes& data);

/// True if the buffer starts with a RIFF....WAVE signature
bool is_wav(const Bytes& data);

/**
 * @brief Linear-interpolation resampler
 */
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

} // namespace wav
} // namespace luna_voice
