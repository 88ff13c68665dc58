#pragma once

#include <string>
#include <memory>
#include <mutex>

namespace cabin_voice {

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
 * @brief Leveled, thread-safe logging
 *
 * Lines carry the name of the emitting thread (loop, handler, jobs,
 * worker-N, ...) when one was set, so interleaved output from the
 * transition handler and the worker pool stays readable.
 *
 * Safe to call from detached threads while initialize()/shutdown() run.
 */
class Logger {
public:
    /**
     * @brief Initialize or reconfigure the logger
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                          const std::string& output_file = "");

    /**
     * @brief Shutdown logger and close file handles
     *
     * Later messages fall back to the console (DEBUG is dropped).
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    /**
     * @brief Set minimum log level (filters output)
     */
    static void set_level(LogLevel level);

    static LogLevel get_level();

    /**
     * @brief Parse "debug" | "info" | "warn" | "error" (case-insensitive); unknown -> INFO
     */
    static LogLevel parse_level(const std::string& name);

    /// Name shown for lines logged from the calling thread (empty = none)
    static void set_thread_name(const std::string& name);

private:
    class Impl;
    // Shared so a message in flight keeps its sink alive across shutdown()
    static std::shared_ptr<Impl> impl_;
    static std::mutex impl_mutex_;

    static std::shared_ptr<Impl> current();
    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) cabin_voice::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) cabin_voice::Logger::info(msg)
#define LOG_WARN(msg) cabin_voice::Logger::warn(msg)
#define LOG_ERROR(msg) cabin_voice::Logger::error(msg)

// Component-specific logging macros
#define LOG_CONTEXT(msg) cabin_voice::Logger::debug(std::string("[Context] ") + (msg))
#define LOG_HEALTH(msg) cabin_voice::Logger::info(std::string("[Health] ") + (msg))
#define LOG_RECOVERY(msg) cabin_voice::Logger::info(std::string("[Recovery] ") + (msg))
#define LOG_FSM(msg) cabin_voice::Logger::info(std::string("[FSM] ") + (msg))
#define LOG_EVENT(msg) cabin_voice::Logger::info(std::string("[Event] ") + (msg))
#define LOG_CMD(msg) cabin_voice::Logger::info(std::string("[Command] ") + (msg))
#define LOG_ORCH(msg) cabin_voice::Logger::info(std::string("[Orchestrator] ") + (msg))

} // namespace cabin_voice
