#include "providers/chat_client.h"
#include "providers/protocol.h"
#include "logger.h"
#include "utils.h"
#include <chrono>
#include <sstream>

namespace luna_voice {

ChatClient::ChatClient(const ChatConfig& config, std::shared_ptr<HttpClient> http)
    : config_(config)
    , api_key_(utils::env_or_empty(config.api_key_env))
    , http_(std::move(http)) {}

Result<std::string> ChatClient::respond(const std::string& message,
                                        const std::vector<ChatMessage>& history,
                                        const CancellationToken& token) {
    HttpRequest request;
    request.url = config_.endpoint;
    request.timeout_ms = config_.timeout_ms;
    request.body = protocol::build_chat_request(message, history);
    request.headers.push_back("Content-Type: application/json");
    if (!api_key_.empty()) {
        request.headers.push_back("Authorization: Bearer " + api_key_);
    }

    auto start = std::chrono::steady_clock::now();
    LOG_LLM("Sending message (" + std::to_string(history.size()) + " history entries) to " + config_.endpoint);

    Result<HttpResponse> response = http_->post(request, token);
    if (response.is_error()) {
        LOG_LLM("Error: " + response.error().message);
        return response.error();
    }

    Result<std::string> reply = protocol::extract_chat_reply(response.value().body);
    if (reply.is_error()) {
        LOG_LLM("Response JSON without reply: " + response.value().body);
        return reply;
    }

    std::string cleaned = utils::trim_copy(reply.value());
    if (cleaned.empty()) {
        return Error(ErrorType::APIError, "chat backend returned an empty reply");
    }

    std::ostringstream oss;
    oss << "Reply in " << ms_between(start, std::chrono::steady_clock::now())
        << "ms: \"" << cleaned << "\"";
    LOG_LLM(oss.str());
    return cleaned;
}

} // namespace luna_voice
