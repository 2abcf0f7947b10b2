#include "wav.h"
#include <algorithm>
#include <cstring>

namespace luna_voice {
namespace wav {

namespace {

void put_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_u32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void put_tag(Bytes& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint16_t read_u16(const Bytes& data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t read_u32(const Bytes& data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

bool tag_is(const Bytes& data, size_t offset, const char* tag) {
    return offset + 4 <= data.size() && std::memcmp(&data[offset], tag, 4) == 0;
}

Error wav_error(const std::string& message) {
    return Error(ErrorType::TTSError, "invalid wav: " + message);
}

} // namespace

Bytes encode(const AudioBuffer& samples, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(Sample));

    Bytes out;
    out.reserve(44 + data_size);

    // RIFF header
    put_tag(out, "RIFF");
    put_u32(out, 36 + data_size);
    put_tag(out, "WAVE");

    // fmt chunk
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, channels);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * channels * bits_per_sample / 8);
    put_u16(out, channels * bits_per_sample / 8);
    put_u16(out, bits_per_sample);

    // data chunk
    put_tag(out, "data");
    put_u32(out, data_size);
    for (Sample s : samples) {
        put_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

bool is_wav(const Bytes& data) {
    return data.size() >= 12 && tag_is(data, 0, "RIFF") && tag_is(data, 8, "WAVE");
}

Result<DecodedAudio> decode(const Bytes& data) {
    if (!is_wav(data)) {
        return wav_error("missing RIFF/WAVE signature");
    }

    bool have_fmt = false;
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;

    size_t offset = 12;
    while (offset + 8 <= data.size()) {
        uint32_t chunk_size = read_u32(data, offset + 4);
        size_t body = offset + 8;

        if (tag_is(data, offset, "fmt ")) {
            if (chunk_size < 16 || body + 16 > data.size()) {
                return wav_error("truncated fmt chunk");
            }
            format = read_u16(data, body);
            channels = read_u16(data, body + 2);
            sample_rate = read_u32(data, body + 4);
            bits = read_u16(data, body + 14);
            have_fmt = true;
        } else if (tag_is(data, offset, "data")) {
            if (!have_fmt) {
                return wav_error("data chunk before fmt chunk");
            }
            if (format != 1 || bits != 16) {
                return wav_error("only 16-bit PCM is supported");
            }
            if (channels == 0 || sample_rate == 0) {
                return wav_error("bad channel count or sample rate");
            }

            // Streaming encoders write 0 or 0xFFFFFFFF when the length is unknown
            size_t available = data.size() - body;
            size_t length = (chunk_size == 0 || chunk_size > available) ? available : chunk_size;
            size_t frames = length / (sizeof(Sample) * channels);

            DecodedAudio decoded;
            decoded.sample_rate = static_cast<int>(sample_rate);
            decoded.source_channels = channels;
            decoded.samples.reserve(frames);
            for (size_t f = 0; f < frames; f++) {
                int32_t sum = 0;
                for (uint16_t c = 0; c < channels; c++) {
                    size_t at = body + (f * channels + c) * sizeof(Sample);
                    sum += static_cast<int16_t>(read_u16(data, at));
                }
                decoded.samples.push_back(static_cast<Sample>(sum / channels));
            }
            return decoded;
        }

        // Chunks are word-aligned
        offset = body + chunk_size + (chunk_size & 1);
    }
    return wav_error("no data chunk");
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    float ratio = static_cast<float>(from_rate) / static_cast<float>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        float input_pos = static_cast<float>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        float t = input_pos - static_cast<float>(idx0);
        float sample0 = static_cast<float>(input[idx0]);
        float sample1 = static_cast<float>(input[idx1]);
        output.push_back(static_cast<Sample>(sample0 * (1.0f - t) + sample1 * t));
    }

    return output;
}

} // namespace wav
} // namespace luna_voice
