#include "provider_registry.h"
#include "logger.h"

namespace luna_voice {

ProviderRegistry::ProviderRegistry(CircuitBreaker& breaker) : breaker_(breaker) {}

void ProviderRegistry::add_transcription(std::shared_ptr<TranscriptionProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_STT("Registered provider '" + provider->name() + "' (" +
            provider_kind_to_string(provider->kind()) + ")");
    transcription_.push_back(std::move(provider));
}

void ProviderRegistry::add_synthesis(std::shared_ptr<SynthesisProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_TTS("Registered provider '" + provider->name() + "' (" +
            provider_kind_to_string(provider->kind()) + ")");
    synthesis_.push_back(std::move(provider));
}

void ProviderRegistry::set_switch_listener(SwitchListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

std::string ProviderRegistry::circuit_name(ProviderRole role, const std::string& provider_name) {
    return (role == ProviderRole::Transcription ? "stt:" : "tts:") + provider_name;
}

template<typename T, typename P, typename Call>
Result<T> ProviderRegistry::call_chain(ProviderRole role,
                                       const std::vector<std::shared_ptr<P>>& providers,
                                       size_t start, size_t offset, const Call& call) {
    size_t index = (start + offset) % providers.size();
    const std::shared_ptr<P>& provider = providers[index];

    std::function<Result<T>()> fn = [&]() -> Result<T> {
        Result<T> result = call(*provider);
        if (result.is_ok()) {
            mark_active(role, index, provider->name());
        }
        return result;
    };

    std::function<Result<T>()> fallback;
    if (offset + 1 < providers.size()) {
        fallback = [&]() -> Result<T> {
            return call_chain<T>(role, providers, start, offset + 1, call);
        };
    }

    return breaker_.execute<T>(circuit_name(role, provider->name()), fn, fallback);
}

void ProviderRegistry::mark_active(ProviderRole role, size_t index, const std::string& name) {
    SwitchListener listener;
    std::string previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t& active = role == ProviderRole::Transcription ? active_transcription_ : active_synthesis_;
        if (active == index) {
            return;
        }
        previous = role == ProviderRole::Transcription
            ? transcription_[active]->name() : synthesis_[active]->name();
        active = index;
        listener = listener_;
    }

    LOG_CIRCUIT(std::string(provider_role_to_string(role)) + " provider switched: " +
                previous + " -> " + name);
    if (listener) {
        listener(role, previous, name);
    }
}

Result<Transcript> ProviderRegistry::transcribe(const AudioBuffer& audio, const AudioFormat& format,
                                                const CancellationToken& token) {
    std::vector<std::shared_ptr<TranscriptionProvider>> providers;
    size_t start = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        providers = transcription_;
        start = active_transcription_;
    }
    if (providers.empty()) {
        return Error(ErrorType::ResourceExhausted, "no transcription provider configured");
    }

    auto call = [&](TranscriptionProvider& provider) {
        return provider.transcribe(audio, format, token);
    };
    return call_chain<Transcript>(ProviderRole::Transcription, providers, start, 0, call);
}

Result<SynthesizedAudio> ProviderRegistry::synthesize(const std::string& text,
                                                      const CancellationToken& token) {
    std::vector<std::shared_ptr<SynthesisProvider>> providers;
    size_t start = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        providers = synthesis_;
        start = active_synthesis_;
    }
    if (providers.empty()) {
        return Error(ErrorType::ResourceExhausted, "no synthesis provider configured");
    }

    auto call = [&](SynthesisProvider& provider) {
        return provider.synthesize(text, token);
    };
    return call_chain<SynthesizedAudio>(ProviderRole::Synthesis, providers, start, 0, call);
}

VoidResult ProviderRegistry::switch_to_next(ProviderRole role) {
    size_t next = 0;
    std::string name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = role == ProviderRole::Transcription ? transcription_.size() : synthesis_.size();
        if (count < 2) {
            return Error(ErrorType::ResourceExhausted,
                         std::string("no alternative ") + provider_role_to_string(role) + " provider");
        }
        size_t active = role == ProviderRole::Transcription ? active_transcription_ : active_synthesis_;
        next = (active + 1) % count;
        name = role == ProviderRole::Transcription ? transcription_[next]->name() : synthesis_[next]->name();
    }
    mark_active(role, next, name);
    return VoidResult();
}

bool ProviderRegistry::can_serve(ProviderRole role) const {
    std::string name = role == ProviderRole::Transcription ? active_transcription_name()
                                                           : active_synthesis_name();
    if (name.empty()) {
        return false;
    }
    return breaker_.can_execute(circuit_name(role, name));
}

std::string ProviderRegistry::active_transcription_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcription_.empty() ? "" : transcription_[active_transcription_]->name();
}

std::string ProviderRegistry::active_synthesis_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return synthesis_.empty() ? "" : synthesis_[active_synthesis_]->name();
}

size_t ProviderRegistry::transcription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcription_.size();
}

size_t ProviderRegistry::synthesis_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return synthesis_.size();
}

} // namespace luna_voice
