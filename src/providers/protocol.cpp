#include "providers/protocol.h"
#include "logger.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace luna_voice {
namespace protocol {

namespace {

const size_t ERROR_BODY_SNIPPET = 200;

std::string snippet(const std::string& body) {
    if (body.size() <= ERROR_BODY_SNIPPET) return body;
    return body.substr(0, ERROR_BODY_SNIPPET) + "...";
}

bool string_at(const json& j, const char* key, std::string& out) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
        return true;
    }
    return false;
}

// JS servers send numbers for duration/timestamp; tolerate strings and floats
int64_t number_at(const json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const json& v = j[key];
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number()) return static_cast<int64_t>(v.get<double>());
    return 0;
}

} // namespace

Result<std::string> extract_transcript_text(const std::string& body) {
    try {
        json j = json::parse(body);
        std::string text;
        if (string_at(j, "text", text)) return text;
        if (string_at(j, "transcription", text)) return text;
        if (j.is_object() && j.contains("result") && string_at(j["result"], "text", text)) return text;
        return Error(ErrorType::TranscriptionError, "transcription response has no text field: " + snippet(body));
    } catch (const json::exception& e) {
        return Error(ErrorType::APIError, std::string("invalid response JSON: ") + e.what());
    }
}

Result<std::string> extract_chat_reply(const std::string& body) {
    try {
        json j = json::parse(body);
        std::string reply;
        if (string_at(j, "response", reply)) return reply;
        if (string_at(j, "content", reply)) return reply;
        if (j.is_object() && j.contains("message") && string_at(j["message"], "content", reply)) return reply;
        if (j.is_object() && j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            const json& first = j["choices"][0];
            if (first.contains("message") && string_at(first["message"], "content", reply)) return reply;
        }
        return Error(ErrorType::APIError, "chat response has no reply field: " + snippet(body));
    } catch (const json::exception& e) {
        return Error(ErrorType::APIError, std::string("invalid response JSON: ") + e.what());
    }
}

Error error_for_http_status(long status, const std::string& body) {
    std::string detail = "HTTP " + std::to_string(status);
    if (!body.empty()) detail += ": " + snippet(body);

    if (status == 401 || status == 403) {
        return Error(ErrorType::APIError, "unauthorized (" + detail + ")");
    }
    if (status == 408 || status == 504) {
        return Error(ErrorType::Timeout, "request timed out (" + detail + ")");
    }
    if (status == 429) {
        return Error(ErrorType::ResourceExhausted, "rate limited (" + detail + ")");
    }
    return Error(ErrorType::APIError, detail);
}

std::string build_chat_request(const std::string& message, const std::vector<ChatMessage>& history) {
    json request;
    request["message"] = message;
    json turns = json::array();
    for (const auto& m : history) {
        turns.push_back({{"role", m.role}, {"content", m.content}});
    }
    request["history"] = turns;
    return request.dump();
}

std::string build_synthesis_request(const std::string& text, const std::string& voice,
                                    const std::string& model) {
    json request;
    request["text"] = text;
    if (!voice.empty()) request["voice"] = voice;
    if (!model.empty()) request["model"] = model;
    return request.dump();
}

namespace stream {

std::string configure_frame(const std::string& language, const std::string& model, int sample_rate) {
    json config;
    config["format"] = "wav";
    config["sampleRate"] = sample_rate;
    if (!language.empty()) config["language"] = language;
    if (!model.empty()) config["model"] = model;
    return json{{"type", "configure"}, {"config", config}}.dump();
}

std::string flush_frame() {
    return json{{"type", "flush"}}.dump();
}

std::string reset_frame() {
    return json{{"type", "reset"}}.dump();
}

std::string get_status_frame() {
    return json{{"type", "get-status"}}.dump();
}

Result<ServerEvent> parse_server_event(const std::string& frame) {
    json j;
    try {
        j = json::parse(frame);
    } catch (const json::exception& e) {
        return Error(ErrorType::APIError, std::string("invalid server frame: ") + e.what());
    }
    if (!j.is_object()) {
        return Error(ErrorType::APIError, "server frame is not an object");
    }

    ServerEvent event;
    event.raw = frame;
    std::string type;
    string_at(j, "type", type);
    string_at(j, "sessionId", event.session_id);

    if (type == "session-ready") {
        event.type = EventType::SessionReady;
    } else if (type == "transcription") {
        event.type = EventType::Transcription;
        string_at(j, "text", event.text);
        event.is_final = j.contains("isFinal") && j["isFinal"].is_boolean() && j["isFinal"].get<bool>();
        event.duration_ms = number_at(j, "duration");
        string_at(j, "language", event.language);
        event.timestamp = number_at(j, "timestamp");
    } else if (type == "processing") {
        event.type = EventType::Processing;
        event.duration_ms = number_at(j, "duration");
    } else if (type == "config-updated") {
        event.type = EventType::ConfigUpdated;
    } else if (type == "status-update") {
        event.type = EventType::StatusUpdate;
    } else if (type == "error") {
        event.type = EventType::Error;
        if (!string_at(j, "message", event.message)) {
            string_at(j, "error", event.message);
        }
        if (j.contains("code")) {
            event.code = j["code"].is_string() ? j["code"].get<std::string>() : j["code"].dump();
        }
    } else {
        event.type = EventType::Unknown;
        LOG_NET("unknown server frame type: " + type);
    }
    return event;
}

std::vector<std::vector<uint8_t>> chunk_payload(const std::vector<uint8_t>& payload, size_t chunk_bytes) {
    std::vector<std::vector<uint8_t>> chunks;
    if (chunk_bytes == 0) chunk_bytes = payload.size();
    for (size_t offset = 0; offset < payload.size(); offset += chunk_bytes) {
        size_t len = std::min(chunk_bytes, payload.size() - offset);
        chunks.emplace_back(payload.begin() + offset, payload.begin() + offset + len);
    }
    return chunks;
}

} // namespace stream

} // namespace protocol
} // namespace luna_voice
