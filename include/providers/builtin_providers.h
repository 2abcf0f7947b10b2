#pragma once

#include "provider_factory.h"
#include "providers/http_client.h"
#include <memory>

namespace luna_voice {

/**
 * @brief Register the HTTP, WebSocket and whisper.cpp provider kinds
 *
 * HTTP providers share one HttpClient.
 */
void register_builtin_providers(ProviderFactory& factory, std::shared_ptr<HttpClient> http);

} // namespace luna_voice
