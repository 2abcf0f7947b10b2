#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template<typename T>
void read_value(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        try {
            out = j[key].get<T>();
        } catch (const json::exception& e) {
            luna_voice::Logger::warn(std::string("Config key '") + key + "' has wrong type: " + e.what());
        }
    }
}

luna_voice::ProviderConfig provider_from_json(const json& p) {
    luna_voice::ProviderConfig provider;
    read_value(p, "name", provider.name);
    read_value(p, "kind", provider.kind);
    read_value(p, "endpoint", provider.endpoint);
    read_value(p, "model", provider.model);
    read_value(p, "model_path", provider.model_path);
    read_value(p, "language", provider.language);
    read_value(p, "voice", provider.voice);
    read_value(p, "api_key_env", provider.api_key_env);
    read_value(p, "timeout_ms", provider.timeout_ms);
    read_value(p, "chunk_bytes", provider.chunk_bytes);
    read_value(p, "use_gpu", provider.use_gpu);
    provider.model_path = luna_voice::expand_path(provider.model_path);
    return provider;
}

json provider_to_json(const luna_voice::ProviderConfig& provider) {
    json p;
    p["name"] = provider.name;
    p["kind"] = provider.kind;
    p["endpoint"] = provider.endpoint;
    p["model"] = provider.model;
    if (!provider.model_path.empty()) p["model_path"] = provider.model_path;
    p["language"] = provider.language;
    if (!provider.voice.empty()) p["voice"] = provider.voice;
    p["api_key_env"] = provider.api_key_env;
    p["timeout_ms"] = provider.timeout_ms;
    p["chunk_bytes"] = provider.chunk_bytes;
    p["use_gpu"] = provider.use_gpu;
    return p;
}

void read_provider_list(const json& j, const char* key, std::vector<luna_voice::ProviderConfig>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    out.clear();
    int index = 0;
    for (const auto& entry : j[key]) {
        if (!entry.is_object()) {
            luna_voice::Logger::warn(std::string("Ignoring non-object entry in providers.") + key);
            continue;
        }
        luna_voice::ProviderConfig provider = provider_from_json(entry);
        if (provider.name.empty()) {
            provider.name = std::string(key) + "-" + std::to_string(index);
        }
        out.push_back(provider);
        index++;
    }
}

void apply_json_to_config(luna_voice::Config& cfg, const json& j) {
    if (j.contains("audio") && j["audio"].is_object()) {
        const auto& a = j["audio"];
        read_value(a, "input_device", cfg.audio.input_device);
        read_value(a, "output_device", cfg.audio.output_device);
        read_value(a, "sample_rate", cfg.audio.sample_rate);
        read_value(a, "channels", cfg.audio.channels);
        read_value(a, "frame_ms", cfg.audio.frame_ms);
        read_value(a, "echo_cancellation", cfg.audio.echo_cancellation);
        read_value(a, "noise_suppression", cfg.audio.noise_suppression);
        read_value(a, "auto_gain", cfg.audio.auto_gain);
    }

    if (j.contains("vad") && j["vad"].is_object()) {
        const auto& v = j["vad"];
        read_value(v, "threshold_db", cfg.vad.threshold_db);
        read_value(v, "silence_timeout_ms", cfg.vad.silence_timeout_ms);
        read_value(v, "noise_window_size", cfg.vad.noise_window_size);
        read_value(v, "noise_sample_interval_ms", cfg.vad.noise_sample_interval_ms);
        read_value(v, "noise_percentile", cfg.vad.noise_percentile);
    }

    if (j.contains("circuit_breaker") && j["circuit_breaker"].is_object()) {
        const auto& c = j["circuit_breaker"];
        read_value(c, "failure_threshold", cfg.circuit_breaker.failure_threshold);
        read_value(c, "success_threshold", cfg.circuit_breaker.success_threshold);
        read_value(c, "timeout_ms", cfg.circuit_breaker.timeout_ms);
        read_value(c, "monitoring_window_ms", cfg.circuit_breaker.monitoring_window_ms);
    }

    if (j.contains("recovery") && j["recovery"].is_object()) {
        const auto& r = j["recovery"];
        read_value(r, "history_size", cfg.recovery.history_size);
        read_value(r, "flapping_window_ms", cfg.recovery.flapping_window_ms);
        read_value(r, "flapping_threshold", cfg.recovery.flapping_threshold);
        read_value(r, "backoff_cap_ms", cfg.recovery.backoff_cap_ms);
        read_value(r, "backoff_retry_limit", cfg.recovery.backoff_retry_limit);
    }

    if (j.contains("session") && j["session"].is_object()) {
        const auto& s = j["session"];
        read_value(s, "min_turn_ms", cfg.session.min_turn_ms);
        read_value(s, "max_turn_ms", cfg.session.max_turn_ms);
        read_value(s, "continuous_listening", cfg.session.continuous_listening);
        read_value(s, "history_turns", cfg.session.history_turns);
        read_value(s, "provider_workers", cfg.session.provider_workers);
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        const auto& p = j["providers"];
        read_provider_list(p, "transcription", cfg.providers.transcription);
        read_provider_list(p, "synthesis", cfg.providers.synthesis);
    }

    if (j.contains("chat") && j["chat"].is_object()) {
        const auto& c = j["chat"];
        read_value(c, "endpoint", cfg.chat.endpoint);
        read_value(c, "timeout_ms", cfg.chat.timeout_ms);
        read_value(c, "api_key_env", cfg.chat.api_key_env);
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        read_value(l, "level", cfg.logging.level);
        read_value(l, "file", cfg.logging.file);
        cfg.logging.file = luna_voice::expand_path(cfg.logging.file);
    }
}

} // namespace

namespace luna_voice {

Config Config::defaults() {
    Config cfg;

    ProviderConfig stt;
    stt.name = "primary";
    stt.kind = "http";
    stt.endpoint = "https://api.openai.com/v1/audio/transcriptions";
    stt.model = "whisper-1";
    stt.api_key_env = "OPENAI_API_KEY";
    cfg.providers.transcription.push_back(stt);

    ProviderConfig tts;
    tts.name = "primary";
    tts.kind = "http";
    tts.endpoint = "http://localhost:3000/api/voice/tts";
    tts.voice = "default";
    cfg.providers.synthesis.push_back(tts);

    return cfg;
}

Config Config::load_from_string(const std::string& json_text) {
    Config cfg = defaults();
    try {
        json j = json::parse(json_text);
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::warn("Error parsing config: " + std::string(e.what()) + ". Using defaults.");
        return defaults();
    }
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file " + path + ". Using defaults.");
        return defaults();
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    Logger::info("Loading config from " + path);
    return load_from_string(buffer.str());
}

std::string Config::to_json_string() const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["sample_rate"] = audio.sample_rate;
    j["audio"]["channels"] = audio.channels;
    j["audio"]["frame_ms"] = audio.frame_ms;
    j["audio"]["echo_cancellation"] = audio.echo_cancellation;
    j["audio"]["noise_suppression"] = audio.noise_suppression;
    j["audio"]["auto_gain"] = audio.auto_gain;

    j["vad"]["threshold_db"] = vad.threshold_db;
    j["vad"]["silence_timeout_ms"] = vad.silence_timeout_ms;
    j["vad"]["noise_window_size"] = vad.noise_window_size;
    j["vad"]["noise_sample_interval_ms"] = vad.noise_sample_interval_ms;
    j["vad"]["noise_percentile"] = vad.noise_percentile;

    j["circuit_breaker"]["failure_threshold"] = circuit_breaker.failure_threshold;
    j["circuit_breaker"]["success_threshold"] = circuit_breaker.success_threshold;
    j["circuit_breaker"]["timeout_ms"] = circuit_breaker.timeout_ms;
    j["circuit_breaker"]["monitoring_window_ms"] = circuit_breaker.monitoring_window_ms;

    j["recovery"]["history_size"] = recovery.history_size;
    j["recovery"]["flapping_window_ms"] = recovery.flapping_window_ms;
    j["recovery"]["flapping_threshold"] = recovery.flapping_threshold;
    j["recovery"]["backoff_cap_ms"] = recovery.backoff_cap_ms;
    j["recovery"]["backoff_retry_limit"] = recovery.backoff_retry_limit;

    j["session"]["min_turn_ms"] = session.min_turn_ms;
    j["session"]["max_turn_ms"] = session.max_turn_ms;
    j["session"]["continuous_listening"] = session.continuous_listening;
    j["session"]["history_turns"] = session.history_turns;
    j["session"]["provider_workers"] = session.provider_workers;

    j["providers"]["transcription"] = json::array();
    for (const auto& p : providers.transcription) {
        j["providers"]["transcription"].push_back(provider_to_json(p));
    }
    j["providers"]["synthesis"] = json::array();
    for (const auto& p : providers.synthesis) {
        j["providers"]["synthesis"].push_back(provider_to_json(p));
    }

    j["chat"]["endpoint"] = chat.endpoint;
    j["chat"]["timeout_ms"] = chat.timeout_ms;
    j["chat"]["api_key_env"] = chat.api_key_env;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    return j.dump(2);
}

bool Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file " + path);
        return false;
    }
    file << to_json_string() << std::endl;
    return file.good();
}

} // namespace luna_voice
