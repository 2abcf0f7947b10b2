#pragma once

#include "circuit_breaker.h"
#include "providers/provider.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace luna_voice {

/**
 * @brief Ordered transcription and synthesis providers behind circuit breakers
 *
 * Each provider is gated by the circuit "stt:<name>" or "tts:<name>". A
 * call starts at the active provider; when that circuit is OPEN (or the
 * failure just opened it) the call falls through to the next provider in
 * configuration order whose circuit admits calls. A fallback provider that
 * serves a call becomes the active one.
 *
 * Thread Safety:
 * - transcribe()/synthesize() run on executor threads
 * - The switch listener may therefore be invoked from a worker thread
 */
class ProviderRegistry {
public:
    using SwitchListener = std::function<void(ProviderRole role, const std::string& from,
                                              const std::string& to)>;

    explicit ProviderRegistry(CircuitBreaker& breaker);

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    void add_transcription(std::shared_ptr<TranscriptionProvider> provider);
    void add_synthesis(std::shared_ptr<SynthesisProvider> provider);

    void set_switch_listener(SwitchListener listener);

    Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format,
                                  const CancellationToken& token);

    Result<SynthesizedAudio> synthesize(const std::string& text, const CancellationToken& token);

    /**
     * @brief Advance the active provider for `role`, wrapping around
     *
     * Used by the SwitchProvider recovery strategy. Fails with
     * ResourceExhausted when the role has fewer than two providers.
     */
    VoidResult switch_to_next(ProviderRole role);

    /**
     * @brief Whether the active provider for `role` would be called now
     *
     * False while its circuit is OPEN and cooling down, or when the role
     * has no providers.
     */
    bool can_serve(ProviderRole role) const;

    std::string active_transcription_name() const;
    std::string active_synthesis_name() const;

    size_t transcription_count() const;
    size_t synthesis_count() const;

    /// "stt:<name>" / "tts:<name>"
    static std::string circuit_name(ProviderRole role, const std::string& provider_name);

private:
    template<typename T, typename P, typename Call>
    Result<T> call_chain(ProviderRole role, const std::vector<std::shared_ptr<P>>& providers,
                         size_t start, size_t offset, const Call& call);

    void mark_active(ProviderRole role, size_t index, const std::string& name);

    CircuitBreaker& breaker_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<TranscriptionProvider>> transcription_;
    std::vector<std::shared_ptr<SynthesisProvider>> synthesis_;
    size_t active_transcription_ = 0;
    size_t active_synthesis_ = 0;
    SwitchListener listener_;
};

} // namespace luna_voice
