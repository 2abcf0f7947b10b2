#include "state_machine.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

namespace luna_voice {

namespace {

// Cadence of the silence-timeout check when capture stalls
constexpr int TICK_INTERVAL_MS = 100;

RecoveryConfig recovery_config_from(const RecoveryPolicyConfig& policy) {
    RecoveryConfig config;
    config.history_size = policy.history_size > 0 ? static_cast<size_t>(policy.history_size) : 1;
    config.flapping_window = Duration(policy.flapping_window_ms);
    config.flapping_threshold = policy.flapping_threshold;
    config.backoff_cap = Duration(policy.backoff_cap_ms);
    config.backoff_retry_limit = policy.backoff_retry_limit;
    return config;
}

} // namespace

class ConversationStateMachine::Impl {
public:
    Impl(RecoveryActions& owner, const ConversationDeps& deps, const Config& config)
        : loop_(deps.loop)
        , executor_(deps.executor)
        , bus_(deps.bus)
        , registry_(deps.registry)
        , chat_(deps.chat)
        , capture_(deps.capture)
        , output_(deps.output)
        , vad_(deps.vad)
        , config_(config)
        , alive_(std::make_shared<bool>(true))
        , sample_rate_(config.audio.sample_rate > 0 ? config.audio.sample_rate : DEFAULT_SAMPLE_RATE)
        , tick_timer_(0)
        , tick_armed_(false)
    {
        recovery_ = std::make_unique<RecoveryPlanner>(
            loop_, owner,
            [this](EventKind kind, EventPayload payload) { emit(kind, std::move(payload)); },
            recovery_config_from(config_.recovery));

        std::weak_ptr<bool> alive = alive_;
        EventLoop& loop = loop_;
        registry_.set_switch_listener(
            [this, alive, &loop](ProviderRole role, const std::string& from, const std::string& to) {
                loop.post([this, alive, role, from, to]() {
                    if (alive.expired()) return;
                    on_provider_switched(role, from, to);
                });
            });
    }

    ~Impl() {
        registry_.set_switch_listener(nullptr);
        cancel_tick();
        turn_token_.cancel();
        recovery_->cancel();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    VoidResult start() {
        if (session_.state == ConversationState::Stopped) {
            return Error(ErrorType::Unknown, "session already stopped");
        }
        if (session_.state != ConversationState::Idle || !session_.session_id.empty()) {
            return VoidResult();
        }

        session_.session_id = VoiceSession::generate_id();
        session_.started_at = loop_.clock().now();
        session_.active_transcription_provider = registry_.active_transcription_name();
        session_.active_synthesis_provider = registry_.active_synthesis_name();
        LOG_SESSION("Starting session " + session_.session_id +
                    " (stt=" + session_.active_transcription_provider +
                    ", tts=" + session_.active_synthesis_provider + ")");

        schedule_tick();

        VoidResult opened = open_audio();
        if (opened.is_error()) {
            Logger::error("[Session] Could not open audio: " + opened.error().message);
            recovery_->handle(opened.error(), Component::Capture, "session start");
            return opened;
        }

        enter_listening();
        return VoidResult();
    }

    void stop() {
        if (session_.state == ConversationState::Stopped) {
            return;
        }
        bool was_listening = session_.state != ConversationState::Idle;

        LOG_SESSION("Stopping session " + session_.session_id);
        turn_token_.cancel();
        recovery_->cancel();
        cancel_tick();
        discard_recording();
        pending_.clear();
        session_.interrupt_flag = false;
        close_audio();
        vad_.reset();

        transition(ConversationState::Stopped);
        if (was_listening) {
            emit(EventKind::ListeningStopped);
        }
    }

    void resume_listening() {
        if (session_.state != ConversationState::Idle || !capture_.is_open()) {
            return;
        }
        vad_.reset();
        enter_listening();
    }

    // -------------------------------------------------------------------------
    // Audio and VAD
    // -------------------------------------------------------------------------

    void on_audio_frame(const AudioFrame& frame) {
        if (!accepting_audio()) {
            return;
        }
        sample_rate_ = frame.sample_rate() > 0 ? frame.sample_rate() : sample_rate_;

        if (session_.fallback_mode) {
            if (session_.recording) {
                append(frame, true);
                enforce_max_turn();
            }
            return;
        }

        vad::Event event = vad_.process(frame);
        if (event == vad::Event::SpeechStart) {
            on_speech_start(frame.captured_at());
            append(frame, true);
        } else if (session_.recording) {
            append(frame, vad_.last_decision().is_speech);
        }

        if (event == vad::Event::SpeechEnd) {
            on_speech_end();
            return;
        }
        enforce_max_turn();
    }

    void on_tick() {
        if (!accepting_audio() || session_.fallback_mode) {
            return;
        }
        if (vad_.tick(loop_.clock().now()) == vad::Event::SpeechEnd) {
            on_speech_end();
        }
    }

    // -------------------------------------------------------------------------
    // Push-to-talk
    // -------------------------------------------------------------------------

    VoidResult begin_manual_turn() {
        if (!session_.fallback_mode) {
            return Error(ErrorType::Unknown, "push-to-talk is only available in fallback mode");
        }
        if (!accepting_audio()) {
            return Error(ErrorType::Unknown, "session is not listening");
        }
        if (session_.recording) {
            return Error(ErrorType::Unknown, "a turn is already being recorded");
        }
        on_speech_start(loop_.clock().now());
        return VoidResult();
    }

    VoidResult end_manual_turn() {
        if (!session_.fallback_mode || !session_.recording) {
            return Error(ErrorType::Unknown, "no manual turn is being recorded");
        }
        on_speech_end();
        return VoidResult();
    }

    void exit_fallback_mode() {
        if (!session_.fallback_mode) {
            return;
        }
        session_.fallback_mode = false;
        discard_recording();
        vad_.reset();
        LOG_SESSION("Voice detection re-enabled");
    }

    void set_vad_threshold_db(float threshold_db) {
        vad_.set_threshold_db(threshold_db);
    }

    void set_silence_timeout(Duration timeout) {
        vad_.set_silence_timeout(timeout);
    }

    ConversationState state() const { return session_.state; }
    const VoiceSession& session() const { return session_; }
    RecoveryPlanner& recovery() { return *recovery_; }
    bool has_pending_utterance() const { return !pending_.empty(); }

    // -------------------------------------------------------------------------
    // Recovery actions
    // -------------------------------------------------------------------------

    VoidResult restart_service() {
        if (session_.state == ConversationState::Stopped) {
            return Error(ErrorType::Unknown, "session stopped");
        }
        LOG_SESSION("Restarting voice service");
        turn_token_.cancel();
        discard_recording();
        pending_.clear();
        session_.interrupt_flag = false;
        close_audio();
        vad_.reset();

        VoidResult opened = open_audio();
        if (opened.is_error()) {
            return opened;
        }
        if (session_.state != ConversationState::Listening) {
            enter_listening();
        }
        return VoidResult();
    }

    VoidResult reinitialize_audio() {
        if (session_.state == ConversationState::Stopped) {
            return Error(ErrorType::Unknown, "session stopped");
        }
        LOG_SESSION("Reinitializing audio devices");
        bool was_speaking = session_.state == ConversationState::Speaking;
        discard_recording();
        close_audio();
        vad_.reset();

        VoidResult opened = open_audio();
        if (opened.is_error()) {
            return opened;
        }
        if (was_speaking) {
            // Playback was torn down with the output device
            turn_token_.cancel();
        }
        if (session_.state == ConversationState::Idle || was_speaking) {
            enter_listening();
        }
        return VoidResult();
    }

    VoidResult switch_provider(Component component) {
        switch (component) {
            case Component::Transcription:
                return registry_.switch_to_next(ProviderRole::Transcription);
            case Component::Synthesis:
                return registry_.switch_to_next(ProviderRole::Synthesis);
            default:
                break;
        }
        return Error(ErrorType::ResourceExhausted,
                     std::string("no alternative provider for ") + component_to_string(component));
    }

    VoidResult request_permissions() {
        Logger::warn("[Session] Microphone access needs to be granted by the user; "
                     "check the system privacy settings, then restart the session");
        return Error(ErrorType::PermissionDenied, "microphone permission requires user action");
    }

    VoidResult enter_fallback_mode() {
        if (session_.state == ConversationState::Stopped) {
            return Error(ErrorType::Unknown, "session stopped");
        }
        session_.fallback_mode = true;
        discard_recording();
        vad_.reset();
        LOG_SESSION("Fallback mode: voice detection disabled, turns are push-to-talk");
        return VoidResult();
    }

    bool service_available(Component component) const {
        switch (component) {
            case Component::Transcription:
                return registry_.can_serve(ProviderRole::Transcription);
            case Component::Synthesis:
                return registry_.can_serve(ProviderRole::Synthesis);
            default:
                break;
        }
        return true;
    }

private:
    // -------------------------------------------------------------------------
    // Turn pipeline
    // -------------------------------------------------------------------------

    void on_speech_start(TimePoint at) {
        session_.last_user_speech_at = at;
        emit(EventKind::SpeechDetected);

        switch (session_.state) {
            case ConversationState::Speaking:
                barge_in();
                break;
            case ConversationState::Transcribing:
            case ConversationState::AwaitingResponse:
                LOG_SESSION("Speech while turn " + std::to_string(session_.turn_id) + " is in flight");
                break;
            default:
                break;
        }

        session_.turn_buffer.clear();
        session_.speech_samples = 0;
        session_.recording = true;
    }

    void on_speech_end() {
        emit(EventKind::SpeechEnded);
        if (session_.recording) {
            close_utterance();
        }
    }

    // User speech preempts assistant speech
    void barge_in() {
        LOG_SESSION("Barge-in during turn " + std::to_string(session_.turn_id));
        output_.stop();
        turn_token_.cancel();
        transition(ConversationState::Interrupted);
        emit(EventKind::UserInterrupted);
        session_.interrupt_flag = false;
        transition(ConversationState::Listening);
    }

    void enforce_max_turn() {
        if (!session_.recording || recorded_ms() < config_.session.max_turn_ms) {
            return;
        }
        LOG_SESSION("Utterance reached " + std::to_string(config_.session.max_turn_ms) + "ms, closing turn");
        if (!session_.fallback_mode) {
            vad_.reset();
        }
        on_speech_end();
    }

    void close_utterance() {
        AudioBuffer utterance = std::move(session_.turn_buffer);
        if (!session_.fallback_mode) {
            // Drop the trailing silence that ended the utterance
            utterance.resize(std::min(session_.speech_samples, utterance.size()));
        }
        discard_recording();

        if (session_.state == ConversationState::Listening) {
            begin_turn(std::move(utterance));
            return;
        }

        // Sound shorter than a turn never supersedes the reply in flight
        int64_t audio_ms = samples_to_ms(utterance.size());
        if (audio_ms < config_.session.min_turn_ms) {
            LOG_SESSION("Ignoring " + std::to_string(audio_ms) + "ms of sound during turn " +
                        std::to_string(session_.turn_id));
            return;
        }

        LOG_SESSION("Queueing utterance until turn " + std::to_string(session_.turn_id) + " resolves");
        pending_.insert(pending_.end(), utterance.begin(), utterance.end());
        session_.interrupt_flag = true;
    }

    void begin_turn(AudioBuffer utterance) {
        int64_t audio_ms = samples_to_ms(utterance.size());
        if (utterance.empty() || audio_ms < config_.session.min_turn_ms) {
            LOG_SESSION("Discarding " + std::to_string(audio_ms) + "ms utterance");
            return;
        }

        session_.turn_id++;
        turn_token_ = CancellationToken();
        uint64_t turn = session_.turn_id;
        CancellationToken token = turn_token_;

        LOG_TRACE(turn, "transcribe", "audio_ms=" + std::to_string(audio_ms));
        transition(ConversationState::Transcribing);
        emit(EventKind::ProcessingStarted);

        AudioFormat format;
        format.sample_rate = sample_rate_;

        std::weak_ptr<bool> alive = alive_;
        EventLoop& loop = loop_;
        ProviderRegistry& registry = registry_;
        executor_.submit([this, alive, &loop, &registry, turn, token, format, audio = std::move(utterance)]() {
            Result<Transcript> result = registry.transcribe(audio, format, token);
            loop.post([this, alive, turn, token, result]() {
                if (alive.expired()) return;
                on_transcription(turn, token, result);
            });
        });
    }

    void on_transcription(uint64_t turn, const CancellationToken& token, const Result<Transcript>& result) {
        if (is_stale(turn, token, ConversationState::Transcribing)) {
            LOG_SESSION("Dropping stale transcription for turn " + std::to_string(turn));
            return;
        }
        if (result.is_error()) {
            fail_turn(result.error(), Component::Transcription);
            return;
        }

        const Transcript& transcript = result.value();
        if (utils::is_blank_transcript(transcript.text)) {
            LOG_SESSION("Empty transcript, back to listening");
            finish_turn(false);
            return;
        }

        TranscriptionPayload payload;
        payload.text = transcript.text;
        payload.is_final = transcript.is_final;
        payload.provider = transcript.provider;
        emit(EventKind::Transcription, payload);
        LOG_TRACE(turn, "chat", "text=\"" + transcript.text + "\"");

        transition(ConversationState::AwaitingResponse);

        std::string text = transcript.text;
        std::vector<ChatMessage> history = session_.history;
        std::weak_ptr<bool> alive = alive_;
        EventLoop& loop = loop_;
        ChatBackend& chat = chat_;
        executor_.submit([this, alive, &loop, &chat, turn, token, text, history]() {
            Result<std::string> reply = chat.respond(text, history, token);
            loop.post([this, alive, turn, token, text, reply]() {
                if (alive.expired()) return;
                on_chat_reply(turn, token, text, reply);
            });
        });
    }

    void on_chat_reply(uint64_t turn, const CancellationToken& token, const std::string& user_text,
                       const Result<std::string>& reply) {
        if (is_stale(turn, token, ConversationState::AwaitingResponse)) {
            LOG_SESSION("Dropping stale reply for turn " + std::to_string(turn));
            return;
        }
        if (reply.is_error()) {
            fail_turn(reply.error(), Component::Chat);
            return;
        }
        if (superseded()) {
            LOG_SESSION("User spoke again before the reply, dropping it");
            DroppedReplyPayload payload;
            payload.user_text = user_text;
            payload.reason = session_.interrupt_flag ? "new utterance queued" : "user still speaking";
            emit(EventKind::ReplyDropped, payload);
            finish_turn(false);
            return;
        }

        remember(user_text, reply.value());
        LOG_TRACE(turn, "synthesize", "chars=" + std::to_string(reply.value().size()));
        transition(ConversationState::Speaking);

        std::string text = reply.value();
        std::weak_ptr<bool> alive = alive_;
        EventLoop& loop = loop_;
        ProviderRegistry& registry = registry_;
        executor_.submit([this, alive, &loop, &registry, turn, token, text]() {
            Result<SynthesizedAudio> audio = registry.synthesize(text, token);
            loop.post([this, alive, turn, token, text, audio]() {
                if (alive.expired()) return;
                on_synthesis(turn, token, text, audio);
            });
        });
    }

    void on_synthesis(uint64_t turn, const CancellationToken& token, const std::string& text,
                      const Result<SynthesizedAudio>& audio) {
        if (is_stale(turn, token, ConversationState::Speaking)) {
            LOG_SESSION("Dropping stale synthesis for turn " + std::to_string(turn));
            return;
        }
        if (audio.is_error()) {
            fail_turn(audio.error(), Component::Synthesis);
            return;
        }

        const SynthesizedAudio& speech = audio.value();
        std::weak_ptr<bool> alive = alive_;
        EventLoop& loop = loop_;
        VoidResult played = output_.play(speech.samples, speech.sample_rate,
            [this, alive, &loop, turn, token]() {
                loop.post([this, alive, turn, token]() {
                    if (alive.expired()) return;
                    on_playback_complete(turn, token);
                });
            });
        if (played.is_error()) {
            fail_turn(played.error(), Component::Playback);
            return;
        }

        session_.last_assistant_speech_at = loop_.clock().now();
        SpeechPayload payload;
        payload.text = text;
        payload.duration_ms = speech.sample_rate > 0
            ? static_cast<int64_t>(speech.samples.size()) * 1000 / speech.sample_rate : 0;
        emit(EventKind::AiSpeaking, payload);
        LOG_TRACE(turn, "play", "duration_ms=" + std::to_string(payload.duration_ms));
    }

    void on_playback_complete(uint64_t turn, const CancellationToken& token) {
        if (is_stale(turn, token, ConversationState::Speaking)) {
            return;
        }
        emit(EventKind::AiFinishedSpeaking);
        finish_turn(true);
    }

    void fail_turn(const Error& error, Component component) {
        if (is_cancelled_error(error)) {
            return;
        }
        Logger::warn("[Session] Turn " + std::to_string(session_.turn_id) + " failed in " +
                     component_to_string(component) + ": " + error.message);
        session_.interrupt_flag = false;
        transition(ConversationState::Listening);
        recovery_->handle(error, component, "turn " + std::to_string(session_.turn_id));
        drain_pending();
    }

    void finish_turn(bool completed) {
        session_.interrupt_flag = false;
        if (completed) {
            recovery_->reset_attempts();
        }

        if (completed && !config_.session.continuous_listening) {
            pending_.clear();
            discard_recording();
            transition(ConversationState::Idle);
            emit(EventKind::ListeningStopped);
            return;
        }

        transition(ConversationState::Listening);
        drain_pending();
    }

    void drain_pending() {
        if (pending_.empty() || session_.state != ConversationState::Listening) {
            return;
        }
        AudioBuffer utterance;
        utterance.swap(pending_);
        begin_turn(std::move(utterance));
    }

    // A queued utterance, or one still being recorded that is already long enough to be a turn
    bool superseded() const {
        if (session_.interrupt_flag) return true;
        return session_.recording && samples_to_ms(session_.speech_samples) >= config_.session.min_turn_ms;
    }

    bool is_stale(uint64_t turn, const CancellationToken& token, ConversationState expected) const {
        return turn != session_.turn_id || !token.same_as(turn_token_) || token.is_cancelled() ||
               session_.state != expected;
    }

    void remember(const std::string& user_text, const std::string& reply) {
        session_.history.push_back({"user", user_text});
        session_.history.push_back({"assistant", reply});
        size_t max_entries = static_cast<size_t>(std::max(config_.session.history_turns, 0)) * 2;
        while (session_.history.size() > max_entries) {
            session_.history.erase(session_.history.begin());
        }
    }

    // -------------------------------------------------------------------------
    // Helpers
    // -------------------------------------------------------------------------

    bool accepting_audio() const {
        return session_.state != ConversationState::Idle && session_.state != ConversationState::Stopped;
    }

    void append(const AudioFrame& frame, bool speech) {
        if (!session_.recording) return;
        const AudioBuffer& samples = frame.samples();
        session_.turn_buffer.insert(session_.turn_buffer.end(), samples.begin(), samples.end());
        if (speech) {
            session_.speech_samples = session_.turn_buffer.size();
        }
    }

    int64_t samples_to_ms(size_t samples) const {
        return static_cast<int64_t>(samples) * 1000 / sample_rate_;
    }

    int64_t recorded_ms() const {
        return samples_to_ms(session_.turn_buffer.size());
    }

    void discard_recording() {
        session_.turn_buffer.clear();
        session_.speech_samples = 0;
        session_.recording = false;
    }

    VoidResult open_audio() {
        std::weak_ptr<bool> alive = alive_;
        EventLoop& loop = loop_;
        VoidResult opened = capture_.open(config_.audio, [this, alive, &loop](const AudioFrame& frame) {
            loop.post([this, alive, frame]() {
                if (alive.expired()) return;
                on_audio_frame(frame);
            });
        });
        if (opened.is_error()) {
            return opened;
        }

        CaptureGuard guard(capture_);
        VoidResult output = output_.open(config_.audio);
        if (output.is_error()) {
            return output;
        }
        guard.release();
        return VoidResult();
    }

    void close_audio() {
        output_.stop();
        output_.close();
        capture_.close();
    }

    void enter_listening() {
        transition(ConversationState::Listening);
        emit(EventKind::ListeningStarted);
    }

    void transition(ConversationState to) {
        ConversationState from = session_.state;
        if (from == to) return;
        session_.state = to;

        LOG_SESSION(std::string(conversation_state_to_string(from)) + " -> " + conversation_state_to_string(to));
        StatePayload payload;
        payload.from = conversation_state_to_string(from);
        payload.to = conversation_state_to_string(to);
        emit(EventKind::StateChanged, payload);
    }

    void emit(EventKind kind, EventPayload payload = {}) {
        SessionEvent event;
        event.kind = kind;
        event.session_id = session_.session_id;
        event.turn_id = session_.turn_id;
        event.timestamp = loop_.clock().now();
        event.payload = std::move(payload);
        bus_.publish(event);
    }

    void on_provider_switched(ProviderRole role, const std::string& from, const std::string& to) {
        if (role == ProviderRole::Transcription) {
            session_.active_transcription_provider = to;
        } else {
            session_.active_synthesis_provider = to;
        }
        ProviderPayload payload;
        payload.kind = provider_role_to_string(role);
        payload.from = from;
        payload.to = to;
        emit(EventKind::ProviderSwitched, payload);
    }

    void schedule_tick() {
        std::weak_ptr<bool> alive = alive_;
        tick_timer_ = loop_.post_delayed(Duration(TICK_INTERVAL_MS), [this, alive]() {
            if (alive.expired()) return;
            tick_armed_ = false;
            on_tick();
            if (session_.state != ConversationState::Stopped) {
                schedule_tick();
            }
        });
        tick_armed_ = true;
    }

    void cancel_tick() {
        if (tick_armed_) {
            loop_.cancel(tick_timer_);
            tick_armed_ = false;
        }
    }

    EventLoop& loop_;
    Executor& executor_;
    EventBus& bus_;
    ProviderRegistry& registry_;
    ChatBackend& chat_;
    AudioCapture& capture_;
    AudioOutput& output_;
    vad::IVAD& vad_;
    Config config_;

    std::shared_ptr<bool> alive_;
    std::unique_ptr<RecoveryPlanner> recovery_;
    VoiceSession session_;
    CancellationToken turn_token_;
    AudioBuffer pending_;
    int sample_rate_;
    TimerId tick_timer_;
    bool tick_armed_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

ConversationStateMachine::ConversationStateMachine(const ConversationDeps& deps, const Config& config)
    : pimpl_(std::make_unique<Impl>(*this, deps, config)) {}

ConversationStateMachine::~ConversationStateMachine() = default;

VoidResult ConversationStateMachine::start() {
    return pimpl_->start();
}

void ConversationStateMachine::stop() {
    pimpl_->stop();
}

void ConversationStateMachine::resume_listening() {
    pimpl_->resume_listening();
}

void ConversationStateMachine::on_audio_frame(const AudioFrame& frame) {
    pimpl_->on_audio_frame(frame);
}

void ConversationStateMachine::on_tick() {
    pimpl_->on_tick();
}

VoidResult ConversationStateMachine::begin_manual_turn() {
    return pimpl_->begin_manual_turn();
}

VoidResult ConversationStateMachine::end_manual_turn() {
    return pimpl_->end_manual_turn();
}

void ConversationStateMachine::exit_fallback_mode() {
    pimpl_->exit_fallback_mode();
}

void ConversationStateMachine::set_vad_threshold_db(float threshold_db) {
    pimpl_->set_vad_threshold_db(threshold_db);
}

void ConversationStateMachine::set_silence_timeout(Duration timeout) {
    pimpl_->set_silence_timeout(timeout);
}

ConversationState ConversationStateMachine::state() const {
    return pimpl_->state();
}

const VoiceSession& ConversationStateMachine::session() const {
    return pimpl_->session();
}

RecoveryPlanner& ConversationStateMachine::recovery() {
    return pimpl_->recovery();
}

bool ConversationStateMachine::has_pending_utterance() const {
    return pimpl_->has_pending_utterance();
}

VoidResult ConversationStateMachine::restart_service() {
    return pimpl_->restart_service();
}

VoidResult ConversationStateMachine::reinitialize_audio() {
    return pimpl_->reinitialize_audio();
}

VoidResult ConversationStateMachine::switch_provider(Component component) {
    return pimpl_->switch_provider(component);
}

VoidResult ConversationStateMachine::request_permissions() {
    return pimpl_->request_permissions();
}

VoidResult ConversationStateMachine::enter_fallback_mode() {
    return pimpl_->enter_fallback_mode();
}

bool ConversationStateMachine::service_available(Component component) const {
    return pimpl_->service_available(component);
}

} // namespace luna_voice
