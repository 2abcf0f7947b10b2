#pragma once

#include "errors.h"
#include "wav.h"
#include <string>

namespace luna_voice {
namespace codec {

/// True for an ID3v2 tag or an MPEG audio frame sync at the start of the buffer
bool is_mp3(const wav::Bytes& data);

/**
 * @brief Decode a complete MPEG audio buffer to mono PCM16 (libmpg123)
 *
 * Any channel count is downmixed by averaging; the stream's own sample
 * rate is kept. Fails with a TTSError-typed error when no audio frame
 * could be decoded.
 */
Result<wav::DecodedAudio> decode_mp3(const wav::Bytes& data);

/**
 * @brief Decode a synthesis response body
 *
 * WAV is recognised by its signature whatever the content type says;
 * MP3 by content type (audio/mpeg, audio/mp3) or by sniffing. Anything
 * else goes to the WAV decoder, which reports what is wrong with it.
 */
Result<wav::DecodedAudio> decode(const wav::Bytes& data, const std::string& content_type);

} // namespace codec
} // namespace luna_voice
