#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace luna_voice {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = 16000;
    int channels = 1;
    int frame_ms = 20;
    bool echo_cancellation = true;
    bool noise_suppression = true;
    bool auto_gain = true;
};

struct VoiceDetectionConfig {
    float threshold_db = 15.0f;         ///< Margin over the noise floor that counts as speech
    int silence_timeout_ms = 1800;      ///< Continuous non-speech before speech-end
    int noise_window_size = 50;
    int noise_sample_interval_ms = 100;
    float noise_percentile = 0.10f;
};

struct BreakerConfig {
    int failure_threshold = 3;
    int success_threshold = 2;
    int timeout_ms = 30000;
    int monitoring_window_ms = 120000;
};

struct RecoveryPolicyConfig {
    int history_size = 10;
    int flapping_window_ms = 300000;
    int flapping_threshold = 5;
    int backoff_cap_ms = 30000;
    int backoff_retry_limit = 2;    ///< Backoff-only attempts before escalating to fallbacks
};

struct SessionConfig {
    int min_turn_ms = 300;          ///< Shorter utterances never reach transcription
    int max_turn_ms = 30000;        ///< Utterances are closed at this length
    bool continuous_listening = true;
    int history_turns = 10;         ///< Chat exchanges kept in memory for context
    int provider_workers = 2;       ///< Executor threads for provider calls
};

/// One entry of providers.transcription[] / providers.synthesis[]
struct ProviderConfig {
    std::string name;
    std::string kind = "http";      ///< "http" | "websocket" | "whisper"
    std::string endpoint;
    std::string model;
    std::string model_path;         ///< whisper: ggml model file
    std::string language = "en";
    std::string voice;
    std::string api_key_env;        ///< Environment variable holding the API key
    int timeout_ms = 15000;
    int chunk_bytes = 4096;         ///< websocket: max binary message size
    bool use_gpu = true;            ///< whisper: Metal/CUDA when built with it
};

struct ProvidersConfig {
    std::vector<ProviderConfig> transcription;
    std::vector<ProviderConfig> synthesis;
};

struct ChatConfig {
    std::string endpoint = "http://localhost:3000/api/chat";
    int timeout_ms = 30000;
    std::string api_key_env;
};

struct LoggingConfig {
    std::string level = "info";     ///< "debug" | "info" | "warn" | "error"
    std::string file;               ///< Empty = console only
};

struct Config {
    AudioConfig audio;
    VoiceDetectionConfig vad;
    BreakerConfig circuit_breaker;
    RecoveryPolicyConfig recovery;
    SessionConfig session;
    ProvidersConfig providers;
    ChatConfig chat;
    LoggingConfig logging;

    /// Defaults plus one HTTP transcription and one HTTP synthesis provider
    static Config defaults();

    /**
     * @brief Load config; missing keys keep their defaults
     *
     * An unreadable or malformed file logs a warning and yields defaults().
     */
    static Config load_from_file(const std::string& path);

    /// Same as load_from_file() for an in-memory JSON document
    static Config load_from_string(const std::string& json_text);

    bool save_to_file(const std::string& path) const;
    std::string to_json_string() const;
};

} // namespace luna_voice
