/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>

using json = nlohmann::json;

namespace cabin_voice {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

const json& section(const json& j, const char* name) {
    static const json empty = json::object();
    if (j.contains(name) && j[name].is_object()) {
        return j[name];
    }
    return empty;
}

void parse_context_config(const json& j, ContextConfig& config) {
    const auto& c = section(j, "context");
    config.history_window = get_or_default(c, "history_window", config.history_window);
    config.ttl_ms = get_or_default(c, "ttl_ms", config.ttl_ms);
    config.snapshot_path = get_or_default(c, "snapshot_path", config.snapshot_path);
}

void parse_speech_config(const json& j, SpeechConfig& config) {
    const auto& s = section(j, "speech");
    config.min_confidence = get_or_default(s, "min_confidence", config.min_confidence);
    config.acknowledge_phrase = get_or_default(s, "acknowledge_phrase", config.acknowledge_phrase);
    config.clarify_phrase = get_or_default(s, "clarify_phrase", config.clarify_phrase);
    config.apology_phrase = get_or_default(s, "apology_phrase", config.apology_phrase);
}

void parse_health_config(const json& j, HealthConfig& config) {
    const auto& h = section(j, "health");
    config.probe_timeout_ms = get_or_default(h, "probe_timeout_ms", config.probe_timeout_ms);
    config.degraded_after_ms = get_or_default(h, "degraded_after_ms", config.degraded_after_ms);
}

void parse_recovery_config(const json& j, RecoveryConfig& config) {
    const auto& r = section(j, "recovery");
    config.max_restart_attempts = get_or_default(r, "max_restart_attempts", config.max_restart_attempts);
    config.restart_timeout_ms = get_or_default(r, "restart_timeout_ms", config.restart_timeout_ms);
}

void parse_simulation_config(const json& j, SimulationConfig& config) {
    const auto& s = section(j, "simulation");
    config.fuel_drain_per_tick = get_or_default(s, "fuel_drain_per_tick", config.fuel_drain_per_tick);
    config.low_fuel_threshold = get_or_default(s, "low_fuel_threshold", config.low_fuel_threshold);
    config.initial_fuel_level = get_or_default(s, "initial_fuel_level", config.initial_fuel_level);
    config.wake_phrase = get_or_default(s, "wake_phrase", config.wake_phrase);
    config.integrity_files = get_array_or_default(s, "integrity_files", config.integrity_files);
}

Config from_json(const json& j) {
    Config config;

    parse_context_config(j, config.context);
    parse_speech_config(j, config.speech);
    parse_health_config(j, config.health);
    parse_recovery_config(j, config.recovery);
    parse_simulation_config(j, config.simulation);

    const auto& p = section(j, "providers");
    config.providers.call_timeout_ms = get_or_default(p, "call_timeout_ms", config.providers.call_timeout_ms);

    const auto& l = section(j, "loop");
    config.loop.tick_ms = get_or_default(l, "tick_ms", config.loop.tick_ms);
    config.loop.error_backoff_ms = get_or_default(l, "error_backoff_ms", config.loop.error_backoff_ms);

    const auto& s = section(j, "system");
    config.system.max_workers = get_or_default(s, "max_workers", config.system.max_workers);

    const auto& e = section(j, "error_handling");
    config.error_handling.critical_errors =
        get_array_or_default(e, "critical_errors", config.error_handling.critical_errors);

    const auto& t = section(j, "telemetry");
    config.telemetry.session_log_dir = get_or_default(t, "session_log_dir", config.telemetry.session_log_dir);
    config.telemetry.feed_server_url = get_or_default(t, "feed_server_url", config.telemetry.feed_server_url);
    config.telemetry.max_events = get_or_default(t, "max_events", config.telemetry.max_events);

    const auto& lg = section(j, "logging");
    config.logging.level = get_or_default(lg, "level", config.logging.level);
    config.logging.file = get_or_default(lg, "file", config.logging.file);

    return config;
}

json to_json(const Config& config) {
    json j;
    j["context"] = {
        {"history_window", config.context.history_window},
        {"ttl_ms", config.context.ttl_ms},
        {"snapshot_path", config.context.snapshot_path}
    };
    j["speech"] = {
        {"min_confidence", config.speech.min_confidence},
        {"acknowledge_phrase", config.speech.acknowledge_phrase},
        {"clarify_phrase", config.speech.clarify_phrase},
        {"apology_phrase", config.speech.apology_phrase}
    };
    j["health"] = {
        {"probe_timeout_ms", config.health.probe_timeout_ms},
        {"degraded_after_ms", config.health.degraded_after_ms}
    };
    j["recovery"] = {
        {"max_restart_attempts", config.recovery.max_restart_attempts},
        {"restart_timeout_ms", config.recovery.restart_timeout_ms}
    };
    j["providers"] = {{"call_timeout_ms", config.providers.call_timeout_ms}};
    j["loop"] = {
        {"tick_ms", config.loop.tick_ms},
        {"error_backoff_ms", config.loop.error_backoff_ms}
    };
    j["system"] = {{"max_workers", config.system.max_workers}};
    j["error_handling"] = {{"critical_errors", config.error_handling.critical_errors}};
    j["telemetry"] = {
        {"session_log_dir", config.telemetry.session_log_dir},
        {"feed_server_url", config.telemetry.feed_server_url},
        {"max_events", config.telemetry.max_events}
    };
    j["logging"] = {
        {"level", config.logging.level},
        {"file", config.logging.file}
    };
    j["simulation"] = {
        {"fuel_drain_per_tick", config.simulation.fuel_drain_per_tick},
        {"low_fuel_threshold", config.simulation.low_fuel_threshold},
        {"initial_fuel_level", config.simulation.initial_fuel_level},
        {"wake_phrase", config.simulation.wake_phrase},
        {"integrity_files", config.simulation.integrity_files}
    };
    return j;
}

Result<Config> finish(Config config) {
    std::string validation_error = config.validate();
    if (!validation_error.empty()) {
        return make_validation_error("Config validation failed: " + validation_error);
    }
    return config;
}

} // anonymous namespace

// =============================================================================
// Config Implementation
// =============================================================================

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Failed to open config file: " + path);
    }

    try {
        json j = json::parse(file);
        Result<Config> result = finish(from_json(j));
        if (result) {
            Logger::info("Configuration loaded from: " + path);
        }
        return result;
    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON parse error in ") + path + ": " + e.what());
    }
}

Result<Config> Config::parse(const std::string& json_text) {
    try {
        return finish(from_json(json::parse(json_text)));
    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON parse error: ") + e.what());
    }
}

VoidResult Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_io_error("Failed to open file for writing: " + path);
    }

    file << to_json(*this).dump(2);
    if (!file.good()) {
        return make_io_error("Failed to write config: " + path);
    }
    Logger::info("Configuration saved to: " + path);
    return VoidResult();
}

std::string Config::validate() const {
    std::ostringstream errors;

    if (context.history_window == 0) {
        errors << "context.history_window must be at least 1; ";
    }
    if (context.ttl_ms < 0) {
        errors << "context.ttl_ms must not be negative; ";
    }
    if (speech.min_confidence < 0.0f || speech.min_confidence > 1.0f) {
        errors << "speech.min_confidence must be between 0 and 1; ";
    }
    if (health.probe_timeout_ms <= 0) {
        errors << "health.probe_timeout_ms must be positive; ";
    }
    if (recovery.max_restart_attempts < 0) {
        errors << "recovery.max_restart_attempts must not be negative; ";
    }
    if (recovery.restart_timeout_ms <= 0) {
        errors << "recovery.restart_timeout_ms must be positive; ";
    }
    if (providers.call_timeout_ms <= 0) {
        errors << "providers.call_timeout_ms must be positive; ";
    }
    if (loop.tick_ms <= 0) {
        errors << "loop.tick_ms must be positive; ";
    }
    if (system.max_workers == 0) {
        errors << "system.max_workers must be at least 1; ";
    }
    if (telemetry.max_events == 0) {
        errors << "telemetry.max_events must be at least 1; ";
    }
    for (const auto& name : error_handling.critical_errors) {
        if (!error_type_from_name(name)) {
            errors << "error_handling.critical_errors has unknown type '" << name << "'; ";
        }
    }

    return errors.str();
}

bool Config::is_critical(ErrorType type) const {
    const std::string name = error_type_name(type);
    return std::find(error_handling.critical_errors.begin(),
                     error_handling.critical_errors.end(), name) != error_handling.critical_errors.end();
}

} // namespace cabin_voice
