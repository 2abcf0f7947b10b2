#include "runtime.h"
#include "audio_io.h"
#include "config.h"
#include "console_input.h"
#include "logger.h"
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace luna_voice {

static VoiceRuntime* g_runtime = nullptr;

void signal_handler(int signal) {
    (void)signal;
    if (g_runtime) {
        g_runtime->shutdown();
    }
}

// One console line per bus event
std::string describe(const SessionEvent& event) {
    std::ostringstream oss;
    oss << "[event] " << event_kind_to_string(event.kind);
    if (event.turn_id > 0) {
        oss << " turn=" << event.turn_id;
    }
    std::visit([&oss](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, TranscriptionPayload>) {
            oss << " \"" << payload.text << "\" (" << payload.provider << ")";
        } else if constexpr (std::is_same_v<T, SpeechPayload>) {
            oss << " \"" << payload.text << "\" " << payload.duration_ms << "ms";
        } else if constexpr (std::is_same_v<T, StatePayload>) {
            oss << " " << payload.from << " -> " << payload.to;
        } else if constexpr (std::is_same_v<T, ProviderPayload>) {
            oss << " " << payload.kind << ": " << payload.from << " -> " << payload.to;
        } else if constexpr (std::is_same_v<T, ErrorPayload>) {
            oss << " " << error_type_to_string(payload.type) << ": " << payload.message
                << (payload.recoverable ? " (retry later)" : " (action required)");
        } else if constexpr (std::is_same_v<T, RecoveryPayload>) {
            oss << " " << error_type_to_string(payload.error_type) << " via " << payload.strategy
                << " attempt " << payload.attempt;
            if (!payload.detail.empty()) oss << ": " << payload.detail;
        } else if constexpr (std::is_same_v<T, DroppedReplyPayload>) {
            oss << " reply to \"" << payload.user_text << "\" (" << payload.reason << ")";
        }
    }, event.payload);
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [config.json]\n"
              << "       " << program << " --list-devices\n"
              << "       " << program << " --write-default-config <path>\n"
              << "\n"
              << "While running: press Enter to start/stop a push-to-talk turn (fallback mode),\n"
              << "type 'vad' to re-enable voice detection, 'q' to quit.\n";
}

} // namespace luna_voice

int main(int argc, char* argv[]) {
    luna_voice::Logger::initialize(luna_voice::LogLevel::INFO);

    std::string config_path;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "--help" || arg == "-h") {
            luna_voice::print_usage(argv[0]);
            return 0;
        }
        if (arg == "--list-devices") {
            luna_voice::PortAudioCapture::list_devices();
            luna_voice::Logger::shutdown();
            return 0;
        }
        if (arg == "--write-default-config") {
            if (argc < 3) {
                luna_voice::print_usage(argv[0]);
                return 1;
            }
            bool saved = luna_voice::Config::defaults().save_to_file(argv[2]);
            if (saved) {
                luna_voice::Logger::info(std::string("Wrote default config to ") + argv[2]);
            }
            luna_voice::Logger::shutdown();
            return saved ? 0 : 1;
        }
        config_path = arg;
    }

    luna_voice::Config config = config_path.empty()
        ? luna_voice::Config::defaults()
        : luna_voice::Config::load_from_file(config_path);

    luna_voice::VoiceRuntime runtime(config);
    if (!runtime.initialize()) {
        luna_voice::Logger::shutdown();
        return 1;
    }

    runtime.events().subscribe_all([](const luna_voice::SessionEvent& event) {
        luna_voice::Logger::info(luna_voice::describe(event));
    });

    luna_voice::g_runtime = &runtime;
    std::signal(SIGINT, luna_voice::signal_handler);
    std::signal(SIGTERM, luna_voice::signal_handler);

    // Console control; joined before the runtime goes away
    luna_voice::ConsoleInput console;
    console.start([&runtime](const std::string& line) {
        if (line == "q" || line == "quit") {
            runtime.shutdown();
        } else if (line == "vad") {
            runtime.exit_fallback_mode();
        } else {
            runtime.toggle_push_to_talk();
        }
    });

    int result = runtime.run();
    console.stop();

    luna_voice::g_runtime = nullptr;
    luna_voice::Logger::shutdown();
    return result;
}
