#pragma once

#include "config.h"
#include "providers/http_client.h"
#include "providers/provider.h"
#include <memory>

namespace luna_voice {

/**
 * @brief Chat backend over HTTP: POST {message, history} -> reply text
 *
 * The reply may arrive as `response`, `content`, `message.content` or an
 * OpenAI-style `choices[0].message.content`.
 */
class ChatClient : public ChatBackend {
public:
    ChatClient(const ChatConfig& config, std::shared_ptr<HttpClient> http);

    // Non-copyable
    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    Result<std::string> respond(const std::string& message,
                                const std::vector<ChatMessage>& history,
                                const CancellationToken& token) override;

private:
    ChatConfig config_;
    std::string api_key_;
    std::shared_ptr<HttpClient> http_;
};

} // namespace luna_voice
