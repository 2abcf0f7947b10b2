#include "audio_codec.h"
#include "logger.h"
#include "utils.h"
#include <cstring>
#include <memory>
#include <mutex>
#include <mpg123.h>

namespace luna_voice {
namespace codec {

namespace {

constexpr size_t DECODE_CHUNK_BYTES = 16384;

struct HandleDeleter {
    void operator()(mpg123_handle* handle) const {
        mpg123_close(handle);
        mpg123_delete(handle);
    }
};

using Handle = std::unique_ptr<mpg123_handle, HandleDeleter>;

Error mp3_error(const std::string& message) {
    return Error(ErrorType::TTSError, "invalid mp3: " + message);
}

bool library_ready() {
    static std::once_flag once;
    static int status = MPG123_ERR;
    std::call_once(once, []() { status = mpg123_init(); });
    return status == MPG123_OK;
}

} // namespace

bool is_mp3(const wav::Bytes& data) {
    if (data.size() >= 3 && data[0] == 'I' && data[1] == 'D' && data[2] == '3') {
        return true;
    }
    return data.size() >= 2 && data[0] == 0xFF && (data[1] & 0xE0) == 0xE0;
}

Result<wav::DecodedAudio> decode_mp3(const wav::Bytes& data) {
    if (data.empty()) {
        return mp3_error("empty body");
    }
    if (!library_ready()) {
        return Error(ErrorType::TTSError, "libmpg123 failed to initialize");
    }

    int err = MPG123_OK;
    Handle handle(mpg123_new(nullptr, &err));
    if (!handle) {
        return Error(ErrorType::TTSError, std::string("mpg123_new: ") + mpg123_plain_strerror(err));
    }
    if (mpg123_param(handle.get(), MPG123_ADD_FLAGS, MPG123_QUIET, 0.0) != MPG123_OK) {
        Logger::debug("[TTS] mpg123: could not silence decoder messages");
    }

    // Signed 16-bit output at whatever rate the stream has
    if (mpg123_format_none(handle.get()) != MPG123_OK) {
        return mp3_error(mpg123_strerror(handle.get()));
    }
    const long* rates = nullptr;
    size_t rate_count = 0;
    mpg123_rates(&rates, &rate_count);
    for (size_t i = 0; i < rate_count; i++) {
        if (mpg123_format(handle.get(), rates[i], MPG123_MONO | MPG123_STEREO,
                          MPG123_ENC_SIGNED_16) != MPG123_OK) {
            return mp3_error(mpg123_strerror(handle.get()));
        }
    }

    if (mpg123_open_feed(handle.get()) != MPG123_OK ||
        mpg123_feed(handle.get(), data.data(), data.size()) != MPG123_OK) {
        return mp3_error(mpg123_strerror(handle.get()));
    }

    wav::DecodedAudio out;
    out.sample_rate = 0;
    int channels = 1;
    std::vector<unsigned char> chunk(DECODE_CHUNK_BYTES);
    std::vector<Sample> interleaved;

    for (;;) {
        size_t done = 0;
        int rc = mpg123_read(handle.get(), chunk.data(), chunk.size(), &done);
        if (done > 0) {
            size_t count = done / sizeof(Sample);
            size_t offset = interleaved.size();
            interleaved.resize(offset + count);
            std::memcpy(&interleaved[offset], chunk.data(), count * sizeof(Sample));
        }

        if (rc == MPG123_NEW_FORMAT) {
            long rate = 0;
            int encoding = 0;
            if (mpg123_getformat(handle.get(), &rate, &channels, &encoding) != MPG123_OK) {
                return mp3_error(mpg123_strerror(handle.get()));
            }
            out.sample_rate = static_cast<int>(rate);
            continue;
        }
        if (rc == MPG123_OK) {
            continue;
        }
        if (rc == MPG123_NEED_MORE || rc == MPG123_DONE) {
            break;
        }
        return mp3_error(mpg123_strerror(handle.get()));
    }

    if (out.sample_rate <= 0 || interleaved.empty()) {
        return mp3_error("no audio frames");
    }

    channels = channels > 0 ? channels : 1;
    out.source_channels = channels;
    size_t frames = interleaved.size() / static_cast<size_t>(channels);
    out.samples.resize(frames);
    for (size_t f = 0; f < frames; f++) {
        int32_t sum = 0;
        for (int c = 0; c < channels; c++) {
            sum += interleaved[f * static_cast<size_t>(channels) + static_cast<size_t>(c)];
        }
        out.samples[f] = static_cast<Sample>(sum / channels);
    }

    LOG_TTS("decoded mp3: " + std::to_string(frames) + " samples @ " + std::to_string(out.sample_rate) +
            "Hz, " + std::to_string(channels) + " channel(s)");
    return out;
}

Result<wav::DecodedAudio> decode(const wav::Bytes& data, const std::string& content_type) {
    if (wav::is_wav(data)) {
        return wav::decode(data);
    }
    std::string type = utils::normalize_copy(content_type);
    bool mpeg = type.find("audio/mpeg") != std::string::npos ||
                type.find("audio/mp3") != std::string::npos;
    if (mpeg || is_mp3(data)) {
        return decode_mp3(data);
    }
    return wav::decode(data);
}

} // namespace codec
} // namespace luna_voice
