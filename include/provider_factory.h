#pragma once

#include "config.h"
#include "provider_registry.h"
#include "providers/provider.h"
#include <functional>
#include <map>
#include <memory>

namespace luna_voice {

/**
 * @brief Builds providers from configuration, keyed by ProviderKind
 *
 * Builders are registered per kind and role; the ordered provider lists
 * from the config are resolved once at startup into a ProviderRegistry.
 */
class ProviderFactory {
public:
    using TranscriptionBuilder =
        std::function<std::shared_ptr<TranscriptionProvider>(const ProviderConfig&)>;
    using SynthesisBuilder =
        std::function<std::shared_ptr<SynthesisProvider>(const ProviderConfig&)>;

    void register_transcription(ProviderKind kind, TranscriptionBuilder builder);
    void register_synthesis(ProviderKind kind, SynthesisBuilder builder);

    Result<std::shared_ptr<TranscriptionProvider>> create_transcription(const ProviderConfig& config) const;
    Result<std::shared_ptr<SynthesisProvider>> create_synthesis(const ProviderConfig& config) const;

    /**
     * @brief Create every configured provider and add it to the registry
     *
     * Entries with an unknown or unsupported kind are skipped with an error
     * log. Fails when either role ends up with no provider at all.
     */
    VoidResult populate(const ProvidersConfig& config, ProviderRegistry& registry) const;

private:
    std::map<ProviderKind, TranscriptionBuilder> transcription_builders_;
    std::map<ProviderKind, SynthesisBuilder> synthesis_builders_;
};

} // namespace luna_voice
