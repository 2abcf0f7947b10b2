/**
 * Conversation state machine, driven end to end with a ManualClock,
 * scripted providers and fake audio devices.
 * Asserts:
 * - Silence never reaches transcription.
 * - One utterance produces exactly one transcribe/chat/synthesize round and
 *   returns to Listening when playback completes.
 * - Speech during playback stops output, cancels the turn and starts a new utterance.
 * - Utterances shorter than min_turn_ms are discarded; long ones are cut at max_turn_ms.
 * - Failures end the turn in Listening and start recovery; late results are dropped.
 * - A reply is dropped (with a reply-dropped event) only when a real utterance
 *   supersedes it; short noise during an in-flight turn is ignored.
 * - Push-to-talk works only in fallback mode.
 *
 * Run from build dir: ./test_state_machine
 * No whisper/PortAudio required.
 */

#include "fakes.h"
#include "logger.h"
#include "state_machine.h"
#include "vad/voice_activity_detector.h"
#include <iostream>
#include <memory>
#include <string>
#include <variant>

using namespace luna_voice;
using namespace luna_voice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

vad::VADConfig vad_config(const Config& config) {
    vad::VADConfig v;
    v.threshold_db = config.vad.threshold_db;
    v.silence_timeout_ms = config.vad.silence_timeout_ms;
    v.noise_window_size = static_cast<size_t>(config.vad.noise_window_size);
    v.noise_sample_interval_ms = config.vad.noise_sample_interval_ms;
    v.noise_percentile = config.vad.noise_percentile;
    return v;
}

struct Harness {
    explicit Harness(const Config& cfg = Config::defaults(), bool defer_provider_calls = false)
        : config(cfg)
        , loop(clock)
        , recorder(bus)
        , breaker(clock)
        , registry(breaker)
        , stt(std::make_shared<ScriptedTranscriber>("primary"))
        , tts(std::make_shared<ScriptedSynthesizer>("voice"))
        , vad(vad_config(cfg))
        , sm(ConversationDeps{loop,
                              defer_provider_calls ? static_cast<Executor&>(deferred)
                                                   : static_cast<Executor&>(immediate),
                              bus, registry, chat, capture, output, vad},
             cfg)
    {
        registry.add_transcription(stt);
        registry.add_synthesis(tts);
    }

    // Deliver `ms` of 20 ms frames from the capture thread, draining the loop after each
    void feed(int amplitude, int ms) {
        for (int elapsed = 0; elapsed < ms; elapsed += FRAME_MS) {
            clock.advance(Duration(FRAME_MS));
            capture.emit(make_frame(clock.now(), amplitude, sequence++));
            loop.run_pending();
        }
    }

    void silence(int ms) { feed(SILENCE_AMPLITUDE, ms); }
    void speech(int ms) { feed(SPEECH_AMPLITUDE, ms); }

    /// Speech followed by enough silence to end the utterance
    void utterance(int ms) {
        speech(ms);
        silence(2000);
    }

    void advance(int ms) {
        clock.advance(Duration(ms));
        loop.run_pending();
    }

    void finish_playback() {
        output.finish();
        loop.run_pending();
    }

    /// Release one deferred provider job and deliver its result
    void complete_next_call() {
        deferred.run_next();
        loop.run_pending();
    }

    Config config;
    ManualClock clock;
    EventLoop loop;
    InlineExecutor immediate;
    DeferredExecutor deferred;
    EventBus bus;
    EventRecorder recorder;
    CircuitBreaker breaker;
    ProviderRegistry registry;
    std::shared_ptr<ScriptedTranscriber> stt;
    std::shared_ptr<ScriptedSynthesizer> tts;
    FakeChat chat;
    FakeCapture capture;
    FakeOutput output;
    vad::VoiceActivityDetector vad;
    ConversationStateMachine sm;
    uint64_t sequence = 0;
};

std::string last_state_change(const EventRecorder& recorder) {
    const SessionEvent* event = recorder.last(EventKind::StateChanged);
    if (!event) return "";
    const auto* payload = std::get_if<StatePayload>(&event->payload);
    return payload ? payload->to : "";
}

bool saw_state(const EventRecorder& recorder, const std::string& state) {
    for (const auto& event : recorder.events) {
        const auto* payload = std::get_if<StatePayload>(&event.payload);
        if (event.kind == EventKind::StateChanged && payload && payload->to == state) return true;
    }
    return false;
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- start opens devices and listens ---
    {
        Harness h;
        ASSERT(h.sm.state() == ConversationState::Idle);
        ASSERT(h.sm.start().is_ok());
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.capture.is_open());
        ASSERT(h.recorder.count(EventKind::ListeningStarted) == 1);
        ASSERT(!h.sm.session().session_id.empty());
        ASSERT(h.sm.session().active_transcription_provider == "primary");
        ASSERT(h.sm.session().active_synthesis_provider == "voice");
        ASSERT(last_state_change(h.recorder) == "Listening");

        // Second start is a no-op
        ASSERT(h.sm.start().is_ok());
        ASSERT(h.capture.open_calls == 1);
    }

    // --- silence only ---
    {
        Harness h;
        h.sm.start();
        h.silence(2000);
        ASSERT(h.stt->calls == 0);
        ASSERT(!h.recorder.has(EventKind::SpeechDetected));
        ASSERT(h.sm.state() == ConversationState::Listening);
    }

    // --- one complete turn ---
    {
        Harness h;
        h.sm.start();
        h.silence(1000);
        h.speech(3000);
        ASSERT(h.recorder.count(EventKind::SpeechDetected) == 1);
        ASSERT(h.stt->calls == 0);
        h.silence(2000);

        ASSERT(h.recorder.count(EventKind::SpeechEnded) == 1);
        ASSERT(h.stt->calls == 1);
        ASSERT(h.stt->last_audio_size == static_cast<size_t>(3 * TEST_RATE));
        ASSERT(h.stt->last_rate == TEST_RATE);
        ASSERT(h.chat.calls == 1);
        ASSERT(h.chat.last_message == "hello there");
        ASSERT(h.chat.last_history.empty());
        ASSERT(h.tts->calls == 1);
        ASSERT(h.tts->last_text == h.chat.reply);
        ASSERT(h.output.play_calls == 1);
        ASSERT(h.output.last_rate == TEST_RATE);
        ASSERT(h.sm.state() == ConversationState::Speaking);
        ASSERT(h.sm.session().turn_id == 1);

        int processing = h.recorder.index_of(EventKind::ProcessingStarted);
        int transcription = h.recorder.index_of(EventKind::Transcription);
        int speaking = h.recorder.index_of(EventKind::AiSpeaking);
        ASSERT(processing >= 0 && processing < transcription && transcription < speaking);
        ASSERT(saw_state(h.recorder, "Transcribing"));
        ASSERT(saw_state(h.recorder, "AwaitingResponse"));

        const SessionEvent* spoken = h.recorder.last(EventKind::AiSpeaking);
        ASSERT(spoken != nullptr);
        if (spoken) {
            const auto* payload = std::get_if<SpeechPayload>(&spoken->payload);
            ASSERT(payload != nullptr && payload->duration_ms == 1000);
            ASSERT(payload != nullptr && payload->text == h.chat.reply);
            ASSERT(spoken->turn_id == 1);
            ASSERT(spoken->session_id == h.sm.session().session_id);
        }

        ASSERT(h.sm.session().history.size() == 2);
        ASSERT(h.sm.session().history[0].role == "user");
        ASSERT(h.sm.session().history[1].content == h.chat.reply);

        h.finish_playback();
        ASSERT(h.recorder.count(EventKind::AiFinishedSpeaking) == 1);
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(!h.sm.recovery().recovery_in_progress());
    }

    // --- barge-in during playback ---
    {
        Harness h;
        h.sm.start();
        h.silence(1000);
        h.utterance(3000);
        ASSERT(h.sm.state() == ConversationState::Speaking);
        ASSERT(h.output.is_playing());

        h.silence(500);
        ASSERT(h.sm.state() == ConversationState::Speaking);

        h.speech(FRAME_MS);
        ASSERT(h.output.stop_calls == 1);
        ASSERT(!h.output.is_playing());
        ASSERT(h.tts->last_token.is_cancelled());
        ASSERT(h.recorder.count(EventKind::UserInterrupted) == 1);
        ASSERT(saw_state(h.recorder, "Interrupted"));
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.sm.session().recording);

        // The interrupting speech becomes the next turn
        h.utterance(1000);
        ASSERT(h.stt->calls == 2);
        ASSERT(h.stt->last_audio_size == static_cast<size_t>(TEST_RATE + SAMPLES_PER_FRAME));
        ASSERT(h.sm.session().turn_id == 2);
        ASSERT(h.sm.state() == ConversationState::Speaking);
        ASSERT(!h.tts->last_token.is_cancelled());
    }

    // --- too-short utterance is discarded ---
    {
        Harness h;
        h.sm.start();
        h.silence(1000);
        h.utterance(200);
        ASSERT(h.recorder.count(EventKind::SpeechEnded) == 1);
        ASSERT(h.stt->calls == 0);
        ASSERT(!h.recorder.has(EventKind::ProcessingStarted));
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.sm.session().turn_id == 0);
    }

    // --- long utterance is cut at max_turn_ms ---
    {
        Config cfg = Config::defaults();
        cfg.session.max_turn_ms = 1000;
        Harness h(cfg);
        h.sm.start();
        h.silence(1000);
        h.speech(1000);
        ASSERT(h.stt->calls == 1);
        ASSERT(h.stt->last_audio_size == static_cast<size_t>(TEST_RATE));
        ASSERT(h.recorder.count(EventKind::SpeechEnded) == 1);
    }

    // --- runtime VAD tuning shortens the silence timeout ---
    {
        Harness h;
        h.sm.start();
        h.sm.set_silence_timeout(Duration(500));
        h.silence(1000);
        h.speech(1000);
        h.silence(600);
        ASSERT(h.stt->calls == 1);
    }

    // --- blank transcript goes back to listening ---
    {
        Harness h;
        h.stt->text = "[BLANK_AUDIO]";
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.stt->calls == 1);
        ASSERT(h.chat.calls == 0);
        ASSERT(!h.recorder.has(EventKind::Transcription));
        ASSERT(h.sm.state() == ConversationState::Listening);
    }

    // --- transcription failure ends the turn and starts recovery ---
    {
        Harness h;
        h.stt->failures.push_back(make_network_error("connection refused"));
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);

        ASSERT(h.stt->calls == 1);
        ASSERT(h.chat.calls == 0);
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.sm.recovery().recovery_in_progress());
        ASSERT(h.recorder.count(EventKind::RecoveryStarted) == 1);
        ASSERT(!h.recorder.has(EventKind::Error));

        h.advance(1000);
        ASSERT(h.recorder.count(EventKind::RecoveryCompleted) == 1);
        ASSERT(!h.sm.recovery().recovery_in_progress());

        // Next turn works again
        h.utterance(1000);
        ASSERT(h.chat.calls == 1);
        ASSERT(h.sm.state() == ConversationState::Speaking);
    }

    // --- transcription error switches to the next provider ---
    {
        Harness h;
        auto backup = std::make_shared<ScriptedTranscriber>("backup", "from backup");
        h.registry.add_transcription(backup);
        h.stt->failures.push_back(Error(ErrorType::TranscriptionError, "garbled audio"));
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);

        ASSERT(h.recorder.count(EventKind::ProviderSwitched) == 1);
        ASSERT(h.recorder.count(EventKind::RecoveryCompleted) == 1);
        ASSERT(h.sm.session().active_transcription_provider == "backup");
        const SessionEvent* switched = h.recorder.last(EventKind::ProviderSwitched);
        if (switched) {
            const auto* payload = std::get_if<ProviderPayload>(&switched->payload);
            ASSERT(payload != nullptr && payload->from == "primary" && payload->to == "backup");
            ASSERT(payload != nullptr && payload->kind == "transcription");
        }

        h.utterance(1000);
        ASSERT(backup->calls == 1);
        ASSERT(h.stt->calls == 1);
        ASSERT(h.chat.last_message == "from backup");
    }

    // --- chat failure ---
    {
        Harness h;
        h.chat.failures.push_back(Error(ErrorType::APIError, "unauthorized (HTTP 401)"));
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.chat.calls == 1);
        ASSERT(h.tts->calls == 0);
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.sm.session().history.empty());
        ASSERT(h.recorder.count(EventKind::RecoveryStarted) == 1);
    }

    // --- playback failure ---
    {
        Harness h;
        h.output.play_error = Error(ErrorType::AudioContext, "output device lost");
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.tts->calls == 1);
        ASSERT(!h.recorder.has(EventKind::AiSpeaking));
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.sm.recovery().recovery_in_progress());
    }

    // --- speech while a turn is in flight: reply dropped, new utterance runs next ---
    {
        Harness h(Config::defaults(), true);
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.sm.state() == ConversationState::Transcribing);
        ASSERT(h.deferred.queued() == 1);

        h.utterance(1000);
        ASSERT(h.recorder.count(EventKind::SpeechDetected) == 2);
        ASSERT(h.sm.session().interrupt_flag);
        ASSERT(h.sm.has_pending_utterance());
        ASSERT(h.sm.state() == ConversationState::Transcribing);

        h.complete_next_call();     // transcription of turn 1
        ASSERT(h.sm.state() == ConversationState::AwaitingResponse);
        h.complete_next_call();     // reply to turn 1, dropped
        ASSERT(h.chat.calls == 1);
        ASSERT(h.tts->calls == 0);
        ASSERT(h.recorder.count(EventKind::ReplyDropped) == 1);
        const SessionEvent* dropped = h.recorder.last(EventKind::ReplyDropped);
        if (dropped) {
            const auto* payload = std::get_if<DroppedReplyPayload>(&dropped->payload);
            ASSERT(payload != nullptr && payload->user_text == "hello there");
            ASSERT(dropped->turn_id == 1);
        }
        ASSERT(h.sm.session().history.empty());
        ASSERT(!h.sm.has_pending_utterance());
        ASSERT(h.sm.state() == ConversationState::Transcribing);
        ASSERT(h.sm.session().turn_id == 2);
        ASSERT(!h.sm.session().interrupt_flag);

        h.complete_next_call();
        h.complete_next_call();
        ASSERT(h.sm.state() == ConversationState::Speaking);
        h.complete_next_call();
        ASSERT(h.output.play_calls == 1);
        ASSERT(h.stt->calls == 2);
        ASSERT(h.sm.session().history.size() == 2);
    }

    // --- a short noise burst while transcribing does not cost the reply ---
    {
        Harness h(Config::defaults(), true);
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.sm.state() == ConversationState::Transcribing);

        h.utterance(100);
        ASSERT(h.recorder.count(EventKind::SpeechDetected) == 2);
        ASSERT(h.recorder.count(EventKind::SpeechEnded) == 2);
        ASSERT(!h.sm.session().interrupt_flag);
        ASSERT(!h.sm.has_pending_utterance());

        h.complete_next_call();     // transcription
        h.complete_next_call();     // reply
        ASSERT(h.sm.state() == ConversationState::Speaking);
        h.complete_next_call();     // synthesis
        ASSERT(h.tts->calls == 1);
        ASSERT(h.output.play_calls == 1);
        ASSERT(!h.recorder.has(EventKind::ReplyDropped));
        ASSERT(h.sm.session().turn_id == 1);
        ASSERT(h.sm.session().history.size() == 2);
        ASSERT(h.deferred.queued() == 0);
    }

    // --- user still talking when the reply arrives: reply dropped, speech becomes turn 2 ---
    {
        Harness h(Config::defaults(), true);
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        h.complete_next_call();     // transcription
        ASSERT(h.sm.state() == ConversationState::AwaitingResponse);

        h.speech(600);
        ASSERT(h.sm.session().recording);
        h.complete_next_call();     // reply arrives mid-utterance
        ASSERT(h.tts->calls == 0);
        ASSERT(h.recorder.count(EventKind::ReplyDropped) == 1);
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.sm.session().recording);

        h.silence(2000);
        ASSERT(h.sm.state() == ConversationState::Transcribing);
        ASSERT(h.sm.session().turn_id == 2);
        ASSERT(h.deferred.queued() == 1);
    }

    // --- barge-in before synthesis returns: late audio is never played ---
    {
        Harness h(Config::defaults(), true);
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        h.complete_next_call();
        h.complete_next_call();
        ASSERT(h.sm.state() == ConversationState::Speaking);
        ASSERT(h.deferred.queued() == 1);

        h.speech(FRAME_MS);
        ASSERT(h.recorder.count(EventKind::UserInterrupted) == 1);
        ASSERT(h.sm.state() == ConversationState::Listening);

        h.complete_next_call();
        ASSERT(h.tts->calls == 1);
        ASSERT(h.tts->last_token.is_cancelled());
        ASSERT(h.output.play_calls == 0);
        ASSERT(!h.recorder.has(EventKind::AiSpeaking));
        ASSERT(h.sm.state() == ConversationState::Listening);
    }

    // --- stop cancels in-flight work ---
    {
        Harness h(Config::defaults(), true);
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.sm.state() == ConversationState::Transcribing);

        h.sm.stop();
        ASSERT(h.sm.state() == ConversationState::Stopped);
        ASSERT(h.recorder.count(EventKind::ListeningStopped) == 1);
        ASSERT(!h.capture.is_open());

        h.complete_next_call();
        ASSERT(h.stt->last_token.is_cancelled());
        ASSERT(h.chat.calls == 0);
        ASSERT(h.sm.state() == ConversationState::Stopped);

        // Frames after stop are ignored; start is refused
        h.speech(500);
        ASSERT(h.recorder.count(EventKind::SpeechDetected) == 1);
        ASSERT(h.sm.start().is_error());
    }

    // --- capture failure at start is recovered by reinitializing audio ---
    {
        Harness h;
        h.capture.open_error = Error(ErrorType::MicrophoneAccess, "device unavailable: default");
        VoidResult started = h.sm.start();
        ASSERT(started.is_error());
        ASSERT(h.sm.state() == ConversationState::Idle);
        ASSERT(h.sm.recovery().recovery_in_progress());
        ASSERT(h.recorder.count(EventKind::RecoveryStarted) == 1);

        h.capture.open_error = Error();
        h.advance(1000);
        ASSERT(h.capture.is_open());
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.recorder.count(EventKind::ListeningStarted) == 1);
        ASSERT(h.recorder.count(EventKind::RecoveryCompleted) == 1);
    }

    // --- permission denied is surfaced, not retried ---
    {
        Harness h;
        h.capture.open_error = Error(ErrorType::PermissionDenied, "microphone permission denied");
        ASSERT(h.sm.start().is_error());
        ASSERT(h.recorder.count(EventKind::Error) == 1);
        ASSERT(!h.sm.recovery().recovery_in_progress());
        h.advance(5000);
        ASSERT(h.capture.open_calls == 1);
        ASSERT(h.sm.state() == ConversationState::Idle);
    }

    // --- push-to-talk in fallback mode ---
    {
        Harness h;
        h.sm.start();
        ASSERT(h.sm.begin_manual_turn().is_error());

        ASSERT(h.sm.enter_fallback_mode().is_ok());
        ASSERT(h.sm.session().fallback_mode);
        h.silence(1000);
        h.speech(1000);
        ASSERT(!h.recorder.has(EventKind::SpeechDetected));
        ASSERT(h.stt->calls == 0);

        ASSERT(h.sm.end_manual_turn().is_error());
        ASSERT(h.sm.begin_manual_turn().is_ok());
        ASSERT(h.sm.begin_manual_turn().is_error());
        ASSERT(h.recorder.count(EventKind::SpeechDetected) == 1);
        h.silence(1000);
        ASSERT(h.sm.end_manual_turn().is_ok());

        // Manual turns keep everything recorded, silence included
        ASSERT(h.stt->calls == 1);
        ASSERT(h.stt->last_audio_size == static_cast<size_t>(TEST_RATE));
        ASSERT(h.sm.state() == ConversationState::Speaking);
        h.finish_playback();
        ASSERT(h.sm.state() == ConversationState::Listening);

        h.sm.exit_fallback_mode();
        ASSERT(!h.sm.session().fallback_mode);
        ASSERT(h.sm.begin_manual_turn().is_error());
        // The detector saw nothing while disabled; give it a noise floor first
        h.silence(1000);
        h.utterance(1000);
        ASSERT(h.stt->calls == 2);
    }

    // --- continuous listening off: pause after each turn ---
    {
        Config cfg = Config::defaults();
        cfg.session.continuous_listening = false;
        Harness h(cfg);
        h.sm.start();
        h.silence(1000);
        h.utterance(1000);
        h.finish_playback();
        ASSERT(h.sm.state() == ConversationState::Idle);
        ASSERT(h.recorder.count(EventKind::ListeningStopped) == 1);

        h.utterance(1000);
        ASSERT(h.recorder.count(EventKind::SpeechDetected) == 1);
        ASSERT(h.stt->calls == 1);

        h.sm.resume_listening();
        ASSERT(h.sm.state() == ConversationState::Listening);
        ASSERT(h.recorder.count(EventKind::ListeningStarted) == 2);
        h.utterance(1000);
        ASSERT(h.stt->calls == 2);
    }

    // --- history is bounded and sent with the next request ---
    {
        Config cfg = Config::defaults();
        cfg.session.history_turns = 1;
        Harness h(cfg);
        h.sm.start();
        h.silence(1000);
        h.chat.reply = "first reply";
        h.utterance(1000);
        h.finish_playback();
        h.chat.reply = "second reply";
        h.utterance(1000);
        h.finish_playback();

        ASSERT(h.chat.calls == 2);
        ASSERT(h.chat.last_history.size() == 2);
        ASSERT(h.chat.last_history[1].content == "first reply");
        ASSERT(h.sm.session().history.size() == 2);
        ASSERT(h.sm.session().history[1].content == "second reply");
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All state machine tests passed.\n";
    return 0;
}
