#pragma once

/**
 * @file protocol.h
 * @brief Wire formats shared by the HTTP and WebSocket providers
 *
 * Pure functions over strings and bytes so they can be exercised without
 * a network. JSON parse failures never escape as exceptions.
 */

#include "common.h"
#include "errors.h"
#include "providers/provider.h"
#include <cstdint>
#include <string>
#include <vector>

namespace luna_voice {
namespace protocol {

/**
 * @brief Pull the transcript out of a batch transcription response
 *
 * Accepts `{"text": ...}`, `{"transcription": ...}` and
 * `{"result": {"text": ...}}`.
 */
Result<std::string> extract_transcript_text(const std::string& body);

/**
 * @brief Pull the reply out of a chat backend response
 *
 * Accepts `response`, `content`, `message.content` and
 * `choices[0].message.content`.
 */
Result<std::string> extract_chat_reply(const std::string& body);

/**
 * @brief Map a non-2xx HTTP status onto the error taxonomy
 *
 * 401/403 -> APIError ("unauthorized"), 408/504 -> Timeout,
 * 429 -> ResourceExhausted, anything else -> APIError.
 */
Error error_for_http_status(long status, const std::string& body);

std::string build_chat_request(const std::string& message, const std::vector<ChatMessage>& history);

std::string build_synthesis_request(const std::string& text, const std::string& voice,
                                    const std::string& model);

/**
 * @brief Streaming transcription control and event frames
 */
namespace stream {

std::string configure_frame(const std::string& language, const std::string& model, int sample_rate);
std::string flush_frame();
std::string reset_frame();
std::string get_status_frame();

enum class EventType {
    SessionReady,
    Transcription,
    Processing,
    ConfigUpdated,
    StatusUpdate,
    Error,
    Unknown
};

struct ServerEvent {
    EventType type = EventType::Unknown;
    std::string session_id;
    std::string text;
    bool is_final = false;
    int64_t duration_ms = 0;
    std::string language;
    int64_t timestamp = 0;
    std::string message;    ///< error text (`message` or `error` field)
    std::string code;
    std::string raw;        ///< original frame, for status/config payloads
};

Result<ServerEvent> parse_server_event(const std::string& frame);

/**
 * @brief Split a payload into binary messages of at most `chunk_bytes`
 */
std::vector<std::vector<uint8_t>> chunk_payload(const std::vector<uint8_t>& payload, size_t chunk_bytes);

} // namespace stream

} // namespace protocol
} // namespace luna_voice
