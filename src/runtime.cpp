#include "runtime.h"
#include "audio_io.h"
#include "circuit_breaker.h"
#include "clock.h"
#include "event_loop.h"
#include "executor.h"
#include "logger.h"
#include "provider_factory.h"
#include "provider_registry.h"
#include "state_machine.h"
#include "providers/builtin_providers.h"
#include "providers/chat_client.h"
#include "providers/http_client.h"
#include "vad/voice_activity_detector.h"
#include <atomic>

namespace luna_voice {

namespace {

CircuitBreakerConfig breaker_config_from(const BreakerConfig& config) {
    CircuitBreakerConfig out;
    out.failure_threshold = config.failure_threshold;
    out.success_threshold = config.success_threshold;
    out.timeout = Duration(config.timeout_ms);
    out.monitoring_window = Duration(config.monitoring_window_ms);
    return out;
}

vad::VADConfig vad_config_from(const VoiceDetectionConfig& config) {
    vad::VADConfig out;
    out.threshold_db = config.threshold_db;
    out.silence_timeout_ms = config.silence_timeout_ms;
    out.noise_window_size = config.noise_window_size > 0 ? static_cast<size_t>(config.noise_window_size) : 1;
    out.noise_sample_interval_ms = config.noise_sample_interval_ms;
    out.noise_percentile = config.noise_percentile;
    return out;
}

} // namespace

class VoiceRuntime::Impl {
public:
    explicit Impl(const Config& config)
        : config_(config), initialized_(false), shutdown_requested_(false) {}

    ~Impl() {
        teardown();
    }

    bool initialize() {
        if (initialized_) {
            return true;
        }

        Logger::set_level(Logger::parse_level(config_.logging.level));
        if (!config_.logging.file.empty() && !Logger::set_output_file(config_.logging.file)) {
            LOG_WARN("Logging to console only; cannot open " + config_.logging.file);
        }

        clock_ = std::make_unique<SteadyClock>();
        loop_ = std::make_unique<EventLoop>(*clock_);
        size_t workers = config_.session.provider_workers > 0
            ? static_cast<size_t>(config_.session.provider_workers) : 1;
        executor_ = std::make_unique<ThreadExecutor>(workers);

        bus_ = std::make_unique<EventBus>();
        breaker_ = std::make_unique<CircuitBreaker>(*clock_, breaker_config_from(config_.circuit_breaker));

        http_ = std::make_shared<HttpClient>();
        registry_ = std::make_unique<ProviderRegistry>(*breaker_);
        ProviderFactory factory;
        register_builtin_providers(factory, http_);
        VoidResult populated = factory.populate(config_.providers, *registry_);
        if (populated.is_error()) {
            Logger::error("Provider setup failed: " + populated.error().message);
            return false;
        }
        chat_ = std::make_unique<ChatClient>(config_.chat, http_);

        capture_ = std::make_unique<PortAudioCapture>(*clock_);
        output_ = std::make_unique<PortAudioOutput>();
        vad_ = std::make_unique<vad::VoiceActivityDetector>(vad_config_from(config_.vad));

        ConversationDeps deps{*loop_, *executor_, *bus_, *registry_, *chat_, *capture_, *output_, *vad_};
        state_machine_ = std::make_unique<ConversationStateMachine>(deps, config_);

        Logger::info("Runtime initialized: " + std::to_string(registry_->transcription_count()) +
                     " transcription / " + std::to_string(registry_->synthesis_count()) +
                     " synthesis providers, " + std::to_string(workers) + " workers");
        initialized_ = true;
        return true;
    }

    int run() {
        if (!initialized_ && !initialize()) {
            return 1;
        }

        Logger::info("=== Luna Voice Session Started ===");
        VoidResult started = state_machine_->start();
        if (started.is_error()) {
            ErrorType type = started.error().type;
            if (type == ErrorType::PermissionDenied || type == ErrorType::BrowserCompatibility) {
                Logger::error("Cannot start session: " + started.error().message);
                return 1;
            }
            Logger::warn("Session start failed, waiting for recovery: " + started.error().message);
        }

        if (!shutdown_requested_) {
            loop_->run();
        }

        state_machine_->stop();
        loop_->run_pending();
        Logger::info("=== Luna Voice Session Ended ===");
        return 0;
    }

    void shutdown() {
        shutdown_requested_ = true;
        if (loop_) {
            loop_->stop();
        }
    }

    void toggle_push_to_talk() {
        if (!loop_) return;
        loop_->post([this]() {
            const VoiceSession& session = state_machine_->session();
            VoidResult result = session.recording ? state_machine_->end_manual_turn()
                                                  : state_machine_->begin_manual_turn();
            if (result.is_error()) {
                Logger::warn("[Session] " + result.error().message);
            }
        });
    }

    void exit_fallback_mode() {
        if (!loop_) return;
        loop_->post([this]() { state_machine_->exit_fallback_mode(); });
    }

    EventBus& events() {
        return *bus_;
    }

private:
    void teardown() {
        if (!initialized_) {
            return;
        }
        if (state_machine_) {
            state_machine_->stop();
        }
        executor_->shutdown();
        loop_->run_pending();

        state_machine_.reset();
        vad_.reset();
        output_.reset();
        capture_.reset();
        chat_.reset();
        registry_.reset();
        http_.reset();
        breaker_.reset();
        bus_.reset();
        executor_.reset();
        loop_.reset();
        clock_.reset();
        initialized_ = false;
    }

    Config config_;
    bool initialized_;
    std::atomic<bool> shutdown_requested_;

    std::unique_ptr<SteadyClock> clock_;
    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<ThreadExecutor> executor_;
    std::unique_ptr<EventBus> bus_;
    std::unique_ptr<CircuitBreaker> breaker_;
    std::shared_ptr<HttpClient> http_;
    std::unique_ptr<ProviderRegistry> registry_;
    std::unique_ptr<ChatClient> chat_;
    std::unique_ptr<PortAudioCapture> capture_;
    std::unique_ptr<PortAudioOutput> output_;
    std::unique_ptr<vad::VoiceActivityDetector> vad_;
    std::unique_ptr<ConversationStateMachine> state_machine_;
};

VoiceRuntime::VoiceRuntime(const Config& config) : pimpl_(std::make_unique<Impl>(config)) {}

VoiceRuntime::~VoiceRuntime() = default;

bool VoiceRuntime::initialize() {
    return pimpl_->initialize();
}

int VoiceRuntime::run() {
    return pimpl_->run();
}

void VoiceRuntime::shutdown() {
    pimpl_->shutdown();
}

void VoiceRuntime::toggle_push_to_talk() {
    pimpl_->toggle_push_to_talk();
}

void VoiceRuntime::exit_fallback_mode() {
    pimpl_->exit_fallback_mode();
}

EventBus& VoiceRuntime::events() {
    return pimpl_->events();
}

} // namespace luna_voice
