/**
 * Provider registry, circuit fall-through and the provider factory.
 * Asserts:
 * - Calls go to the active provider while its circuit is closed.
 * - After failure_threshold failures the call falls through to the next provider,
 *   which becomes active; the failing provider is not called again while OPEN.
 * - The switch listener reports from/to names.
 * - With every circuit open the caller gets the OPEN error, and can_serve()
 *   reports the role unavailable until the cool-down ends.
 * - switch_to_next() wraps and refuses a role with a single provider.
 * - The factory builds providers per kind and skips entries it cannot build.
 *
 * Run from build dir: ./test_provider_registry
 * No whisper/PortAudio required.
 */

#include "fakes.h"
#include "clock.h"
#include "logger.h"
#include "provider_factory.h"
#include "provider_registry.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace luna_voice;
using namespace luna_voice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

struct Switch {
    ProviderRole role;
    std::string from;
    std::string to;
};

AudioBuffer one_second() {
    return AudioBuffer(TEST_RATE, 1000);
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- open circuit hands calls to the secondary provider ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock);
        ProviderRegistry registry(breaker);
        auto primary = std::make_shared<ScriptedTranscriber>("primary", "from primary");
        auto secondary = std::make_shared<ScriptedTranscriber>("secondary", "from secondary");
        registry.add_transcription(primary);
        registry.add_transcription(secondary);

        std::vector<Switch> switches;
        registry.set_switch_listener([&](ProviderRole role, const std::string& from, const std::string& to) {
            switches.push_back({role, from, to});
        });

        ASSERT(registry.transcription_count() == 2);
        ASSERT(registry.active_transcription_name() == "primary");
        ASSERT(ProviderRegistry::circuit_name(ProviderRole::Transcription, "primary") == "stt:primary");
        ASSERT(ProviderRegistry::circuit_name(ProviderRole::Synthesis, "primary") == "tts:primary");

        AudioFormat format;
        CancellationToken token;

        auto ok = registry.transcribe(one_second(), format, token);
        ASSERT(ok.is_ok() && ok.value().text == "from primary");
        ASSERT(primary->last_audio_size == static_cast<size_t>(TEST_RATE));

        for (int i = 0; i < 3; i++) {
            primary->failures.push_back(make_network_error("connection refused"));
        }

        auto first = registry.transcribe(one_second(), format, token);
        auto second = registry.transcribe(one_second(), format, token);
        ASSERT(first.is_error() && first.error().type == ErrorType::NetworkError);
        ASSERT(second.is_error());
        ASSERT(secondary->calls == 0);
        ASSERT(registry.active_transcription_name() == "primary");

        // Third failure opens stt:primary and the call falls through
        auto third = registry.transcribe(one_second(), format, token);
        ASSERT(third.is_ok() && third.value().text == "from secondary");
        ASSERT(breaker.stats("stt:primary").state == CircuitState::Open);
        ASSERT(registry.active_transcription_name() == "secondary");
        ASSERT(switches.size() == 1);
        if (!switches.empty()) {
            ASSERT(switches[0].role == ProviderRole::Transcription);
            ASSERT(switches[0].from == "primary");
            ASSERT(switches[0].to == "secondary");
        }

        auto fourth = registry.transcribe(one_second(), format, token);
        ASSERT(fourth.is_ok() && fourth.value().text == "from secondary");
        ASSERT(primary->calls == 4);
        ASSERT(secondary->calls == 2);
        ASSERT(switches.size() == 1);
    }

    // --- every circuit open: OPEN error reaches the caller ---
    {
        CircuitBreakerConfig config;
        config.failure_threshold = 1;
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        ProviderRegistry registry(breaker);
        auto a = std::make_shared<ScriptedSynthesizer>("a");
        auto b = std::make_shared<ScriptedSynthesizer>("b");
        registry.add_synthesis(a);
        registry.add_synthesis(b);

        a->failures.push_back(Error(ErrorType::TTSError, "voice missing"));
        b->failures.push_back(Error(ErrorType::TTSError, "voice missing"));
        auto failed_both = registry.synthesize("hi", CancellationToken());
        ASSERT(failed_both.is_error());
        ASSERT(failed_both.error().type == ErrorType::TTSError);
        ASSERT(a->calls == 1 && b->calls == 1);

        auto rejected = registry.synthesize("hi", CancellationToken());
        ASSERT(rejected.is_error());
        ASSERT(CircuitBreaker::is_open_error(rejected.error()));
        ASSERT(a->calls == 1 && b->calls == 1);
        ASSERT(!registry.can_serve(ProviderRole::Synthesis));

        // Cool-down over: primary tried again
        clock.advance(config.timeout);
        ASSERT(registry.can_serve(ProviderRole::Synthesis));
        auto recovered = registry.synthesize("hi", CancellationToken());
        ASSERT(recovered.is_ok());
        ASSERT(a->calls == 2);
    }

    // --- cancellation does not count against a provider ---
    {
        CircuitBreakerConfig config;
        config.failure_threshold = 1;
        ManualClock clock;
        CircuitBreaker breaker(clock, config);
        ProviderRegistry registry(breaker);
        auto a = std::make_shared<ScriptedTranscriber>("a");
        auto b = std::make_shared<ScriptedTranscriber>("b");
        registry.add_transcription(a);
        registry.add_transcription(b);

        a->failures.push_back(make_cancelled_error("turn abandoned"));
        auto cancelled = registry.transcribe(one_second(), AudioFormat(), CancellationToken());
        ASSERT(cancelled.is_error() && is_cancelled_error(cancelled.error()));
        ASSERT(b->calls == 0);
        ASSERT(breaker.stats("stt:a").state == CircuitState::Closed);
    }

    // --- manual switching ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock);
        ProviderRegistry registry(breaker);
        registry.add_transcription(std::make_shared<ScriptedTranscriber>("one"));
        registry.add_transcription(std::make_shared<ScriptedTranscriber>("two"));
        registry.add_transcription(std::make_shared<ScriptedTranscriber>("three"));
        registry.add_synthesis(std::make_shared<ScriptedSynthesizer>("only"));

        int notified = 0;
        registry.set_switch_listener([&](ProviderRole, const std::string&, const std::string&) { notified++; });

        ASSERT(registry.switch_to_next(ProviderRole::Transcription).is_ok());
        ASSERT(registry.active_transcription_name() == "two");
        ASSERT(registry.switch_to_next(ProviderRole::Transcription).is_ok());
        ASSERT(registry.switch_to_next(ProviderRole::Transcription).is_ok());
        ASSERT(registry.active_transcription_name() == "one");
        ASSERT(notified == 3);

        VoidResult refused = registry.switch_to_next(ProviderRole::Synthesis);
        ASSERT(refused.is_error());
        ASSERT(refused.error().type == ErrorType::ResourceExhausted);
        ASSERT(registry.active_synthesis_name() == "only");
    }

    // --- empty roles ---
    {
        ManualClock clock;
        CircuitBreaker breaker(clock);
        ProviderRegistry registry(breaker);
        auto none = registry.transcribe(one_second(), AudioFormat(), CancellationToken());
        ASSERT(none.is_error() && none.error().type == ErrorType::ResourceExhausted);
        ASSERT(registry.active_transcription_name().empty());
        ASSERT(!registry.can_serve(ProviderRole::Transcription));
    }

    // --- factory ---
    {
        ProviderFactory factory;
        std::vector<std::string> built;
        factory.register_transcription(ProviderKind::BatchHttp, [&](const ProviderConfig& c) {
            built.push_back(c.name);
            return std::make_shared<ScriptedTranscriber>(c.name);
        });
        factory.register_transcription(ProviderKind::LocalWhisper, [](const ProviderConfig&) {
            return std::shared_ptr<TranscriptionProvider>();
        });
        factory.register_synthesis(ProviderKind::BatchHttp, [](const ProviderConfig& c) {
            return std::make_shared<ScriptedSynthesizer>(c.name);
        });

        ProviderConfig http;
        http.name = "cloud";
        http.kind = "http";
        ProviderConfig grpc;
        grpc.name = "odd";
        grpc.kind = "grpc";
        ProviderConfig ws;
        ws.name = "stream";
        ws.kind = "websocket";
        ProviderConfig local;
        local.name = "local";
        local.kind = "whisper";

        auto unknown = factory.create_transcription(grpc);
        ASSERT(unknown.is_error());
        ASSERT(unknown.error().message.find("unknown kind") != std::string::npos);
        ASSERT(factory.create_transcription(ws).is_error());
        ASSERT(factory.create_transcription(local).is_error());
        ASSERT(factory.create_synthesis(ws).is_error());

        ProvidersConfig providers;
        providers.transcription = {grpc, http, ws};
        providers.synthesis = {http};

        ManualClock clock;
        CircuitBreaker breaker(clock);
        ProviderRegistry registry(breaker);
        VoidResult populated = factory.populate(providers, registry);
        ASSERT(populated.is_ok());
        ASSERT(registry.transcription_count() == 1);
        ASSERT(registry.synthesis_count() == 1);
        ASSERT(registry.active_transcription_name() == "cloud");
        ASSERT(built.size() == 1);

        ProvidersConfig unusable;
        unusable.transcription = {grpc};
        unusable.synthesis = {http};
        ProviderRegistry empty(breaker);
        VoidResult refused = factory.populate(unusable, empty);
        ASSERT(refused.is_error());
        ASSERT(refused.error().type == ErrorType::ResourceExhausted);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All provider registry tests passed.\n";
    return 0;
}
