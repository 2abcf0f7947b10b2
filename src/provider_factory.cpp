#include "provider_factory.h"
#include "logger.h"

namespace luna_voice {

namespace {

Result<ProviderKind> resolve_kind(const ProviderConfig& config) {
    std::optional<ProviderKind> kind = provider_kind_from_string(config.kind);
    if (!kind) {
        return Error(ErrorType::Unknown, "provider '" + config.name + "': unknown kind '" + config.kind + "'");
    }
    return *kind;
}

} // namespace

void ProviderFactory::register_transcription(ProviderKind kind, TranscriptionBuilder builder) {
    transcription_builders_[kind] = std::move(builder);
}

void ProviderFactory::register_synthesis(ProviderKind kind, SynthesisBuilder builder) {
    synthesis_builders_[kind] = std::move(builder);
}

Result<std::shared_ptr<TranscriptionProvider>>
ProviderFactory::create_transcription(const ProviderConfig& config) const {
    Result<ProviderKind> kind = resolve_kind(config);
    if (kind.is_error()) {
        return kind.error();
    }
    auto it = transcription_builders_.find(kind.value());
    if (it == transcription_builders_.end()) {
        return Error(ErrorType::Unknown, "provider '" + config.name + "': no transcription support for kind '" +
                                         provider_kind_to_string(kind.value()) + "'");
    }
    std::shared_ptr<TranscriptionProvider> provider = it->second(config);
    if (!provider) {
        return Error(ErrorType::Unknown, "provider '" + config.name + "' could not be created");
    }
    return provider;
}

Result<std::shared_ptr<SynthesisProvider>>
ProviderFactory::create_synthesis(const ProviderConfig& config) const {
    Result<ProviderKind> kind = resolve_kind(config);
    if (kind.is_error()) {
        return kind.error();
    }
    auto it = synthesis_builders_.find(kind.value());
    if (it == synthesis_builders_.end()) {
        return Error(ErrorType::Unknown, "provider '" + config.name + "': no synthesis support for kind '" +
                                         provider_kind_to_string(kind.value()) + "'");
    }
    std::shared_ptr<SynthesisProvider> provider = it->second(config);
    if (!provider) {
        return Error(ErrorType::Unknown, "provider '" + config.name + "' could not be created");
    }
    return provider;
}

VoidResult ProviderFactory::populate(const ProvidersConfig& config, ProviderRegistry& registry) const {
    for (const auto& entry : config.transcription) {
        auto provider = create_transcription(entry);
        if (provider.is_error()) {
            Logger::error("[STT] " + provider.error().message);
            continue;
        }
        registry.add_transcription(provider.value());
    }

    for (const auto& entry : config.synthesis) {
        auto provider = create_synthesis(entry);
        if (provider.is_error()) {
            Logger::error("[TTS] " + provider.error().message);
            continue;
        }
        registry.add_synthesis(provider.value());
    }

    if (registry.transcription_count() == 0) {
        return Error(ErrorType::ResourceExhausted, "no usable transcription provider configured");
    }
    if (registry.synthesis_count() == 0) {
        return Error(ErrorType::ResourceExhausted, "no usable synthesis provider configured");
    }
    return VoidResult();
}

} // namespace luna_voice
