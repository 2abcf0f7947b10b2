#include "providers/streaming_stt.h"
#include "providers/protocol.h"
#include "logger.h"
#include "utils.h"
#include "wav.h"
#include <curl/curl.h>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

namespace luna_voice {

namespace {

constexpr int POLL_INTERVAL_MS = 10;
constexpr size_t RECV_BUFFER_SIZE = 16384;

using SteadyTime = std::chrono::steady_clock::time_point;

// Endpoints are configured as ws:// or wss://; libcurl wants the same schemes.
std::string normalize_ws_url(const std::string& endpoint) {
    if (endpoint.rfind("http://", 0) == 0) return "ws://" + endpoint.substr(7);
    if (endpoint.rfind("https://", 0) == 0) return "wss://" + endpoint.substr(8);
    return endpoint;
}

/**
 * @brief One connected WebSocket; closes and frees the handle on scope exit
 */
class WsConnection {
public:
    WsConnection() : curl_(curl_easy_init()) {}

    ~WsConnection() {
        if (curl_) {
            if (connected_) {
                size_t sent = 0;
                curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            }
            curl_easy_cleanup(curl_);
        }
    }

    WsConnection(const WsConnection&) = delete;
    WsConnection& operator=(const WsConnection&) = delete;

    VoidResult connect(const std::string& url, const std::string& api_key, long connect_timeout_ms) {
        if (!curl_) {
            return Error(ErrorType::NetworkError, "failed to initialize CURL");
        }

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms);

        struct curl_slist* headers = nullptr;
        if (!api_key.empty()) {
            std::string auth = "Authorization: Bearer " + api_key;
            headers = curl_slist_append(headers, auth.c_str());
            curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
        }

        CURLcode res = curl_easy_perform(curl_);
        if (headers) {
            curl_slist_free_all(headers);
        }

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return make_timeout_error("websocket connect timed out: " + url);
        }
        if (res != CURLE_OK) {
            return make_network_error(std::string("websocket connect failed: ") + curl_easy_strerror(res));
        }
        connected_ = true;
        return VoidResult();
    }

    VoidResult send_text(const std::string& text) {
        return send(text.data(), text.size(), CURLWS_TEXT);
    }

    VoidResult send_binary(const std::vector<uint8_t>& bytes) {
        return send(bytes.data(), bytes.size(), CURLWS_BINARY);
    }

    /**
     * @brief Wait for the next complete text message
     * @return Message text; Timeout at the deadline, cancelled error on cancel
     */
    Result<std::string> receive(const SteadyTime& deadline, const CancellationToken& token) {
        std::string message;
        char buffer[RECV_BUFFER_SIZE];

        while (true) {
            if (token.is_cancelled()) {
                return make_cancelled_error("streaming transcription");
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return make_timeout_error("no transcription before deadline");
            }

            size_t received = 0;
            const struct curl_ws_frame* meta = nullptr;
            CURLcode res = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);

            if (res == CURLE_AGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
                continue;
            }
            if (res == CURLE_GOT_NOTHING) {
                connected_ = false;
                return make_network_error("websocket closed by server");
            }
            if (res != CURLE_OK) {
                return make_network_error(std::string("websocket receive failed: ") + curl_easy_strerror(res));
            }
            if (!meta) {
                continue;
            }
            if (meta->flags & CURLWS_CLOSE) {
                connected_ = false;
                return make_network_error("websocket closed by server");
            }
            if (meta->flags & (CURLWS_PING | CURLWS_PONG | CURLWS_BINARY)) {
                continue;
            }

            message.append(buffer, received);
            if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                return message;
            }
        }
    }

private:
    VoidResult send(const void* data, size_t size, unsigned int flags) {
        const char* cursor = static_cast<const char*>(data);
        size_t remaining = size;
        do {
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, cursor, remaining, &sent, 0, flags);
            if (res == CURLE_AGAIN) {
                std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
                continue;
            }
            if (res != CURLE_OK) {
                return make_network_error(std::string("websocket send failed: ") + curl_easy_strerror(res));
            }
            cursor += sent;
            remaining -= sent;
        } while (remaining > 0);
        return VoidResult();
    }

    CURL* curl_ = nullptr;
    bool connected_ = false;
};

Error error_from_event(const protocol::stream::ServerEvent& event) {
    std::string message = event.message.empty() ? "streaming transcription failed" : event.message;
    if (!event.code.empty()) {
        message += " (" + event.code + ")";
    }
    return Error(ErrorType::TranscriptionError, message);
}

} // namespace

// =============================================================================
// StreamingTranscriptionProvider::Impl
// =============================================================================

class StreamingTranscriptionProvider::Impl {
public:
    explicit Impl(const ProviderConfig& config)
        : config_(config)
        , url_(normalize_ws_url(config.endpoint))
        , api_key_(utils::env_or_empty(config.api_key_env))
    {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    /**
     * @brief Connect and wait for `session-ready`
     */
    Result<std::string> open_session(WsConnection& ws, const SteadyTime& deadline,
                                     const CancellationToken& token) {
        VoidResult connected = ws.connect(url_, api_key_, 3000);
        if (connected.is_error()) {
            return connected.error();
        }

        while (true) {
            Result<std::string> frame = ws.receive(deadline, token);
            if (frame.is_error()) {
                return frame.error();
            }
            Result<protocol::stream::ServerEvent> event = protocol::stream::parse_server_event(frame.value());
            if (event.is_error()) {
                LOG_NET("Ignoring malformed frame: " + frame.value());
                continue;
            }
            if (event.value().type == protocol::stream::EventType::SessionReady) {
                return event.value().session_id;
            }
            if (event.value().type == protocol::stream::EventType::Error) {
                return error_from_event(event.value());
            }
        }
    }

    Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format,
                                  const CancellationToken& token) {
        if (audio.empty()) {
            return Error(ErrorType::TranscriptionError, "empty audio buffer");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();
        SteadyTime deadline = start + std::chrono::milliseconds(config_.timeout_ms);

        WsConnection ws;
        Result<std::string> session = open_session(ws, deadline, token);
        if (session.is_error()) {
            return session.error();
        }
        LOG_NET(config_.name + ": session " + session.value());

        VoidResult sent = ws.send_text(
            protocol::stream::configure_frame(config_.language, config_.model, format.sample_rate));
        if (sent.is_error()) {
            return sent.error();
        }

        wav::Bytes payload = wav::encode(audio, format.sample_rate);
        auto chunks = protocol::stream::chunk_payload(payload, config_.chunk_bytes);
        for (const auto& chunk : chunks) {
            if (token.is_cancelled()) {
                return make_cancelled_error("streaming transcription");
            }
            sent = ws.send_binary(chunk);
            if (sent.is_error()) {
                return sent.error();
            }
        }

        sent = ws.send_text(protocol::stream::flush_frame());
        if (sent.is_error()) {
            return sent.error();
        }

        while (true) {
            Result<std::string> frame = ws.receive(deadline, token);
            if (frame.is_error()) {
                return frame.error();
            }
            Result<protocol::stream::ServerEvent> parsed = protocol::stream::parse_server_event(frame.value());
            if (parsed.is_error()) {
                LOG_NET("Ignoring malformed frame: " + frame.value());
                continue;
            }

            const protocol::stream::ServerEvent& event = parsed.value();
            switch (event.type) {
                case protocol::stream::EventType::Error:
                    return error_from_event(event);
                case protocol::stream::EventType::Transcription:
                    if (!event.is_final) {
                        LOG_NET(config_.name + " partial: " + event.text);
                        break;
                    }
                    return make_transcript(event, audio, format, start);
                default:
                    break;
            }
        }
    }

    Result<std::string> query_status(const CancellationToken& token) {
        std::lock_guard<std::mutex> lock(mutex_);
        SteadyTime deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);

        WsConnection ws;
        Result<std::string> session = open_session(ws, deadline, token);
        if (session.is_error()) {
            return session.error();
        }
        VoidResult sent = ws.send_text(protocol::stream::get_status_frame());
        if (sent.is_error()) {
            return sent.error();
        }

        while (true) {
            Result<std::string> frame = ws.receive(deadline, token);
            if (frame.is_error()) {
                return frame.error();
            }
            Result<protocol::stream::ServerEvent> event = protocol::stream::parse_server_event(frame.value());
            if (event.is_ok() && event.value().type == protocol::stream::EventType::StatusUpdate) {
                return event.value().raw;
            }
            if (event.is_ok() && event.value().type == protocol::stream::EventType::Error) {
                return error_from_event(event.value());
            }
        }
    }

    VoidResult reset_remote(const CancellationToken& token) {
        std::lock_guard<std::mutex> lock(mutex_);
        SteadyTime deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.timeout_ms);

        WsConnection ws;
        Result<std::string> session = open_session(ws, deadline, token);
        if (session.is_error()) {
            return session.error();
        }
        return ws.send_text(protocol::stream::reset_frame());
    }

    const ProviderConfig& config() const { return config_; }

private:
    Transcript make_transcript(const protocol::stream::ServerEvent& event, const AudioBuffer& audio,
                               const AudioFormat& format, const SteadyTime& start) const {
        Transcript transcript;
        transcript.text = utils::trim_copy(event.text);
        transcript.is_final = true;
        transcript.language = event.language.empty() ? config_.language : event.language;
        transcript.duration_ms = event.duration_ms > 0
            ? event.duration_ms
            : (format.sample_rate > 0 ? static_cast<int64_t>(audio.size()) * 1000 / format.sample_rate : 0);
        transcript.processing_ms = ms_between(start, std::chrono::steady_clock::now());
        transcript.provider = config_.name;

        std::ostringstream oss;
        oss << config_.name << ": \"" << transcript.text << "\" (" << transcript.processing_ms << "ms)";
        LOG_STT(oss.str());
        return transcript;
    }

    ProviderConfig config_;
    std::string url_;
    std::string api_key_;
    std::mutex mutex_;
};

// =============================================================================
// StreamingTranscriptionProvider
// =============================================================================

StreamingTranscriptionProvider::StreamingTranscriptionProvider(const ProviderConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

StreamingTranscriptionProvider::~StreamingTranscriptionProvider() = default;

std::string StreamingTranscriptionProvider::name() const {
    return pimpl_->config().name;
}

Result<Transcript> StreamingTranscriptionProvider::transcribe(const AudioBuffer& audio,
                                                              const AudioFormat& format,
                                                              const CancellationToken& token) {
    return pimpl_->transcribe(audio, format, token);
}

Result<std::string> StreamingTranscriptionProvider::query_status(const CancellationToken& token) {
    return pimpl_->query_status(token);
}

VoidResult StreamingTranscriptionProvider::reset_remote(const CancellationToken& token) {
    return pimpl_->reset_remote(token);
}

} // namespace luna_voice
