#include "providers/provider.h"
#include "utils.h"

namespace luna_voice {

const char* provider_kind_to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::BatchHttp: return "http";
        case ProviderKind::StreamingWebSocket: return "websocket";
        case ProviderKind::LocalWhisper: return "whisper";
    }
    return "unknown";
}

std::optional<ProviderKind> provider_kind_from_string(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "http" || n == "batch" || n == "batch_http") return ProviderKind::BatchHttp;
    if (n == "websocket" || n == "ws" || n == "streaming") return ProviderKind::StreamingWebSocket;
    if (n == "whisper" || n == "local" || n == "local_whisper") return ProviderKind::LocalWhisper;
    return std::nullopt;
}

const char* provider_role_to_string(ProviderRole role) {
    return role == ProviderRole::Transcription ? "transcription" : "synthesis";
}

} // namespace luna_voice
