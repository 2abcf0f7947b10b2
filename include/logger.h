#pragma once

#include <string>
#include <ostream>
#include <memory>

namespace luna_voice {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Lightweight, thread-safe logging system
 *
 * Provides leveled logging with optional file output.
 * Safe to call from the event loop and from provider worker threads.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Redirect the file copy of the log; empty path closes it
     * @return false if the file could not be opened (console output continues)
     */
    static bool set_output_file(const std::string& path);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    /**
     * @brief Get current minimum log level
     */
    static LogLevel get_level();

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or INFO for unrecognized input
     */
    static LogLevel parse_level(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

#define LOG_DEBUG(msg) luna_voice::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) luna_voice::Logger::info(msg)
#define LOG_WARN(msg) luna_voice::Logger::warn(msg)
#define LOG_ERROR(msg) luna_voice::Logger::error(msg)

// Component-specific logging macros
#define LOG_AUDIO(msg) luna_voice::Logger::debug(std::string("[Audio] ") + (msg))
#define LOG_VAD(msg) luna_voice::Logger::debug(std::string("[VAD] ") + (msg))
#define LOG_STT(msg) luna_voice::Logger::info(std::string("[STT] ") + (msg))
#define LOG_TTS(msg) luna_voice::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_LLM(msg) luna_voice::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_NET(msg) luna_voice::Logger::debug(std::string("[Net] ") + (msg))
#define LOG_CIRCUIT(msg) luna_voice::Logger::info(std::string("[Circuit] ") + (msg))
#define LOG_RECOVERY(msg) luna_voice::Logger::info(std::string("[Recovery] ") + (msg))
#define LOG_SESSION(msg) luna_voice::Logger::info(std::string("[Session] ") + (msg))
#define LOG_TRACE(turn_id, stage, data) luna_voice::Logger::info(std::string("[trace] turn_id=") + std::to_string(turn_id) + " stage=" + (stage) + " " + (data))

} // namespace luna_voice
