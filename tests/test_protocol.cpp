/**
 * Provider wire formats: response extraction, HTTP status mapping,
 * streaming control/event frames, WAV framing and transcript filtering.
 *
 * Run from build dir: ./test_protocol
 * No whisper/PortAudio required.
 */

#include "logger.h"
#include "providers/protocol.h"
#include "providers/provider.h"
#include "utils.h"
#include "wav.h"
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

using namespace luna_voice;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- transcript extraction ---
    {
        auto plain = protocol::extract_transcript_text(R"({"text": "hello world"})");
        ASSERT(plain.is_ok() && plain.value() == "hello world");

        auto alias = protocol::extract_transcript_text(R"({"transcription": "turn left"})");
        ASSERT(alias.is_ok() && alias.value() == "turn left");

        auto nested = protocol::extract_transcript_text(R"({"result": {"text": "nested"}})");
        ASSERT(nested.is_ok() && nested.value() == "nested");

        auto missing = protocol::extract_transcript_text(R"({"words": []})");
        ASSERT(missing.is_error());
        ASSERT(missing.error().type == ErrorType::TranscriptionError);

        auto garbage = protocol::extract_transcript_text("<html>502</html>");
        ASSERT(garbage.is_error());
        ASSERT(garbage.error().type == ErrorType::APIError);
    }

    // --- chat reply extraction ---
    {
        ASSERT(protocol::extract_chat_reply(R"({"response": "a"})").value() == "a");
        ASSERT(protocol::extract_chat_reply(R"({"content": "b"})").value() == "b");
        ASSERT(protocol::extract_chat_reply(R"({"message": {"content": "c"}})").value() == "c");
        ASSERT(protocol::extract_chat_reply(
                   R"({"choices": [{"message": {"role": "assistant", "content": "d"}}]})").value() == "d");
        ASSERT(protocol::extract_chat_reply(R"({"choices": []})").is_error());
        ASSERT(protocol::extract_chat_reply("not json").is_error());
    }

    // --- HTTP status mapping ---
    {
        Error unauthorized = protocol::error_for_http_status(401, "bad key");
        ASSERT(unauthorized.type == ErrorType::APIError);
        ASSERT(unauthorized.message.find("unauthorized") != std::string::npos);
        ASSERT(unauthorized.message.find("HTTP 401") != std::string::npos);

        ASSERT(protocol::error_for_http_status(403, "").type == ErrorType::APIError);
        ASSERT(protocol::error_for_http_status(408, "").type == ErrorType::Timeout);
        ASSERT(protocol::error_for_http_status(504, "").type == ErrorType::Timeout);
        ASSERT(protocol::error_for_http_status(429, "slow down").type == ErrorType::ResourceExhausted);
        ASSERT(protocol::error_for_http_status(500, "").type == ErrorType::APIError);

        std::string long_body(1000, 'x');
        Error truncated = protocol::error_for_http_status(500, long_body);
        ASSERT(truncated.message.size() < 300);
    }

    // --- request bodies ---
    {
        std::vector<ChatMessage> history = {{"user", "hi"}, {"assistant", "hello"}};
        json chat = json::parse(protocol::build_chat_request("what time is it", history));
        ASSERT(chat["message"] == "what time is it");
        ASSERT(chat["history"].size() == 2);
        ASSERT(chat["history"][1]["role"] == "assistant");
        ASSERT(chat["history"][1]["content"] == "hello");

        json tts = json::parse(protocol::build_synthesis_request("Hi there", "alloy", ""));
        ASSERT(tts["text"] == "Hi there");
        ASSERT(tts["voice"] == "alloy");
        ASSERT(!tts.contains("model"));
    }

    // --- streaming control frames ---
    {
        json configure = json::parse(protocol::stream::configure_frame("en", "whisper-1", 16000));
        ASSERT(configure["type"] == "configure");
        ASSERT(configure["config"]["format"] == "wav");
        ASSERT(configure["config"]["sampleRate"] == 16000);
        ASSERT(configure["config"]["language"] == "en");

        ASSERT(json::parse(protocol::stream::flush_frame())["type"] == "flush");
        ASSERT(json::parse(protocol::stream::reset_frame())["type"] == "reset");
        ASSERT(json::parse(protocol::stream::get_status_frame())["type"] == "get-status");
    }

    // --- streaming server events ---
    {
        using protocol::stream::EventType;

        auto ready = protocol::stream::parse_server_event(R"({"type":"session-ready","sessionId":"abc"})");
        ASSERT(ready.is_ok());
        ASSERT(ready.value().type == EventType::SessionReady);
        ASSERT(ready.value().session_id == "abc");

        auto partial = protocol::stream::parse_server_event(
            R"({"type":"transcription","text":"hel","isFinal":false})");
        ASSERT(partial.is_ok());
        ASSERT(partial.value().type == EventType::Transcription);
        ASSERT(!partial.value().is_final);

        auto final_text = protocol::stream::parse_server_event(
            R"({"type":"transcription","text":"hello","isFinal":true,"duration":1234.5,"language":"en","timestamp":99})");
        ASSERT(final_text.is_ok());
        ASSERT(final_text.value().is_final);
        ASSERT(final_text.value().text == "hello");
        ASSERT(final_text.value().duration_ms == 1234);
        ASSERT(final_text.value().language == "en");
        ASSERT(final_text.value().timestamp == 99);

        auto error = protocol::stream::parse_server_event(R"({"type":"error","error":"model busy","code":503})");
        ASSERT(error.is_ok());
        ASSERT(error.value().type == EventType::Error);
        ASSERT(error.value().message == "model busy");
        ASSERT(error.value().code == "503");

        auto status = protocol::stream::parse_server_event(R"({"type":"status-update","queue":2})");
        ASSERT(status.is_ok());
        ASSERT(status.value().type == EventType::StatusUpdate);
        ASSERT(status.value().raw.find("queue") != std::string::npos);

        auto unknown = protocol::stream::parse_server_event(R"({"type":"pong"})");
        ASSERT(unknown.is_ok() && unknown.value().type == EventType::Unknown);

        ASSERT(protocol::stream::parse_server_event("{broken").is_error());
        ASSERT(protocol::stream::parse_server_event("[1,2]").is_error());
    }

    // --- payload chunking ---
    {
        std::vector<uint8_t> payload(10000, 7);
        auto chunks = protocol::stream::chunk_payload(payload, 4096);
        ASSERT(chunks.size() == 3);
        ASSERT(chunks[0].size() == 4096);
        ASSERT(chunks[2].size() == 10000 - 2 * 4096);
        ASSERT(protocol::stream::chunk_payload({}, 4096).empty());
        ASSERT(protocol::stream::chunk_payload(payload, 0).size() == 1);
    }

    // --- WAV framing ---
    {
        AudioBuffer samples = {0, 1000, -1000, 32767, -32768};
        wav::Bytes bytes = wav::encode(samples, 16000);
        ASSERT(bytes.size() == 44 + samples.size() * 2);
        ASSERT(wav::is_wav(bytes));

        auto decoded = wav::decode(bytes);
        ASSERT(decoded.is_ok());
        ASSERT(decoded.value().sample_rate == 16000);
        ASSERT(decoded.value().samples == samples);

        // Stereo with an extra LIST chunk, downmixed by averaging
        wav::Bytes stereo = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E',
                             'f', 'm', 't', ' ', 16, 0, 0, 0,
                             1, 0, 2, 0,                     // PCM, 2 channels
                             0x22, 0x56, 0, 0,               // 22050 Hz
                             0x88, 0x58, 0x01, 0,            // byte rate
                             4, 0, 16, 0,
                             'L', 'I', 'S', 'T', 2, 0, 0, 0, 'x', 'y',
                             'd', 'a', 't', 'a', 8, 0, 0, 0,
                             100, 0, 44, 1,                  // 100, 300
                             0xF6, 0xFF, 0xEC, 0xFF};        // -10, -20
        auto mixed = wav::decode(stereo);
        ASSERT(mixed.is_ok());
        if (mixed.is_ok()) {
            ASSERT(mixed.value().sample_rate == 22050);
            ASSERT(mixed.value().source_channels == 2);
            ASSERT(mixed.value().samples.size() == 2);
            ASSERT(mixed.value().samples[0] == 200);
            ASSERT(mixed.value().samples[1] == -15);
        }

        wav::Bytes mp3 = {'I', 'D', '3', 4, 0, 0, 0, 0, 0, 0, 0, 0};
        auto rejected = wav::decode(mp3);
        ASSERT(rejected.is_error());
        ASSERT(rejected.error().type == ErrorType::TTSError);

        AudioBuffer upsampled = wav::resample(AudioBuffer(1600, 500), 16000, 48000);
        ASSERT(upsampled.size() >= 4799 && upsampled.size() <= 4800);
        ASSERT(std::abs(upsampled[100] - 500) <= 1);
        AudioBuffer downsampled = wav::resample(AudioBuffer(4800, -200), 48000, 16000);
        ASSERT(downsampled.size() == 1600);
        ASSERT(wav::resample(samples, 16000, 16000) == samples);
    }

    // --- transcript filtering ---
    {
        ASSERT(utils::is_blank_transcript(""));
        ASSERT(utils::is_blank_transcript("   \n"));
        ASSERT(utils::is_blank_transcript("[BLANK_AUDIO]"));
        ASSERT(utils::is_blank_transcript(" (silence) [music] "));
        ASSERT(utils::is_blank_transcript("..."));
        ASSERT(!utils::is_blank_transcript("hello"));
        ASSERT(!utils::is_blank_transcript("[laughs] okay"));
    }

    // --- provider kinds ---
    {
        ASSERT(provider_kind_from_string("http") == ProviderKind::BatchHttp);
        ASSERT(provider_kind_from_string(" WebSocket ") == ProviderKind::StreamingWebSocket);
        ASSERT(provider_kind_from_string("whisper") == ProviderKind::LocalWhisper);
        ASSERT(!provider_kind_from_string("grpc").has_value());
        ASSERT(std::string(provider_kind_to_string(ProviderKind::StreamingWebSocket)) == "websocket");
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All protocol tests passed.\n";
    return 0;
}
