#pragma once

/**
 * @file config.h
 * @brief Orchestrator configuration
 *
 * Every key is optional; missing keys keep the defaults below.
 * Retry budgets and timeouts are injected here rather than hard-coded
 * in the health and recovery components.
 */

#include "errors.h"
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace cabin_voice {

struct ContextConfig {
    size_t history_window = 5;          ///< Turns kept in conversation history
    int64_t ttl_ms = 30 * 60 * 1000;    ///< Reset context if unmodified this long (0 = never)
    std::string snapshot_path;          ///< Load at start / save at shutdown (empty = disabled)
};

struct SpeechConfig {
    float min_confidence = 0.7f;        ///< Transcriptions below this get a clarification prompt
    std::string acknowledge_phrase = "I'm listening";
    std::string clarify_phrase = "I didn't catch that. Could you please repeat?";
    std::string apology_phrase = "I'm sorry, I encountered an error. Please try again.";
};

struct HealthConfig {
    int probe_timeout_ms = 2000;        ///< Per-probe bound; timeout counts as failed
    int degraded_after_ms = 0;          ///< Healthy but slower than this = degraded (0 = disabled)
};

struct RecoveryConfig {
    int max_restart_attempts = 1;       ///< Restart cycles per failed component
    int restart_timeout_ms = 5000;      ///< Bound on a single restart call
};

struct ProviderConfig {
    int call_timeout_ms = 5000;         ///< Bound on NLU/dialogue/TTS/vehicle calls
};

struct LoopConfig {
    int tick_ms = 100;                  ///< Steady-state loop period
    int error_backoff_ms = 1000;        ///< Sleep after a non-critical loop error
};

struct SystemConfig {
    size_t max_workers = 8;             ///< Worker threads for probes, restarts and provider calls
};

struct ErrorHandlingConfig {
    /// Error type names (see error_type_name) that escalate to emergency shutdown from the loop
    std::vector<std::string> critical_errors = {"integrity_failure", "recovery_failed"};
};

struct TelemetryConfig {
    std::string session_log_dir = "sessions";
    std::string feed_server_url;        ///< Optional: POST events here (empty = disabled)
    size_t max_events = 1000;           ///< Events kept in memory and in session.json
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

/// Settings for the simulated providers used by the development binary
struct SimulationConfig {
    double fuel_drain_per_tick = 0.0;   ///< Percent of fuel drained each vehicle poll
    double low_fuel_threshold = 15.0;   ///< Raise low_fuel once when fuel drops below this
    double initial_fuel_level = 100.0;
    std::string wake_phrase = "hey cabin";
    std::vector<std::string> integrity_files;  ///< Startup fails if any of these is missing
};

struct Config {
    ContextConfig context;
    SpeechConfig speech;
    HealthConfig health;
    RecoveryConfig recovery;
    ProviderConfig providers;
    LoopConfig loop;
    SystemConfig system;
    ErrorHandlingConfig error_handling;
    TelemetryConfig telemetry;
    LoggingConfig logging;
    SimulationConfig simulation;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded config or error (IOError / ParseError / ValidationError)
     */
    static Result<Config> load(const std::string& path);

    /**
     * @brief Parse configuration from a JSON string
     */
    static Result<Config> parse(const std::string& json_text);

    /**
     * @brief Save configuration to JSON file
     */
    VoidResult save(const std::string& path) const;

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;

    /**
     * @brief True if an error of this type escalates to emergency shutdown
     */
    bool is_critical(ErrorType type) const;
};

} // namespace cabin_voice
