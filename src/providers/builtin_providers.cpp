#include "providers/builtin_providers.h"
#include "providers/http_providers.h"
#include "providers/streaming_stt.h"
#include "providers/whisper_stt.h"

namespace luna_voice {

void register_builtin_providers(ProviderFactory& factory, std::shared_ptr<HttpClient> http) {
    factory.register_transcription(ProviderKind::BatchHttp, [http](const ProviderConfig& config) {
        return std::make_shared<HttpTranscriptionProvider>(config, http);
    });
    factory.register_transcription(ProviderKind::StreamingWebSocket, [](const ProviderConfig& config) {
        return std::make_shared<StreamingTranscriptionProvider>(config);
    });
    factory.register_transcription(ProviderKind::LocalWhisper, [](const ProviderConfig& config) {
        return std::make_shared<WhisperTranscriptionProvider>(config);
    });
    factory.register_synthesis(ProviderKind::BatchHttp, [http](const ProviderConfig& config) {
        return std::make_shared<HttpSynthesisProvider>(config, http);
    });
}

} // namespace luna_voice
