/**
 * Configuration loading and validation.
 * Asserts:
 * - Every key is optional; missing keys keep defaults, unknown keys are ignored.
 * - Invalid values are rejected with a ValidationError, bad JSON with a ParseError.
 * - Critical error names map onto error types.
 */

#include "config.h"
#include "logger.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace cabin_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Defaults ---
    {
        Result<Config> parsed = Config::parse("{}");
        ASSERT(parsed.is_ok());
        const Config& c = parsed.value();
        ASSERT(c.context.history_window == 5);
        ASSERT(c.context.ttl_ms == 30 * 60 * 1000);
        ASSERT(c.speech.min_confidence > 0.69f && c.speech.min_confidence < 0.71f);
        ASSERT(c.speech.clarify_phrase == "I didn't catch that. Could you please repeat?");
        ASSERT(c.recovery.max_restart_attempts == 1);
        ASSERT(c.loop.tick_ms == 100);
        ASSERT(c.telemetry.feed_server_url.empty());
        ASSERT(c.telemetry.max_events == 1000);
        ASSERT(c.validate().empty());
        ASSERT(c.is_critical(ErrorType::IntegrityFailure));
        ASSERT(c.is_critical(ErrorType::RecoveryFailed));
        ASSERT(!c.is_critical(ErrorType::Timeout));
    }

    // --- Overrides, unknown keys ignored ---
    {
        Result<Config> parsed = Config::parse(R"({
            "context": {"history_window": 3, "ttl_ms": 1000},
            "speech": {"min_confidence": 0.5},
            "recovery": {"max_restart_attempts": 4, "restart_timeout_ms": 250},
            "error_handling": {"critical_errors": ["timeout"]},
            "simulation": {"integrity_files": ["a.bin", "b.bin"], "wake_phrase": "hello car"},
            "something_else": {"x": 1}
        })");
        ASSERT(parsed.is_ok());
        const Config& c = parsed.value();
        ASSERT(c.context.history_window == 3);
        ASSERT(c.context.ttl_ms == 1000);
        ASSERT(c.speech.min_confidence == 0.5f);
        ASSERT(c.recovery.max_restart_attempts == 4);
        ASSERT(c.recovery.restart_timeout_ms == 250);
        ASSERT(c.health.probe_timeout_ms == 2000);
        ASSERT(c.is_critical(ErrorType::Timeout));
        ASSERT(!c.is_critical(ErrorType::RecoveryFailed));
        ASSERT(c.simulation.integrity_files.size() == 2);
        ASSERT(c.simulation.wake_phrase == "hello car");
    }

    // --- Validation ---
    {
        Result<Config> bad_confidence = Config::parse(R"({"speech": {"min_confidence": 1.5}})");
        ASSERT(bad_confidence.is_error());
        ASSERT(bad_confidence.error().type == ErrorType::ValidationError);

        Result<Config> bad_window = Config::parse(R"({"context": {"history_window": 0}})");
        ASSERT(bad_window.is_error());

        Result<Config> bad_critical = Config::parse(R"({"error_handling": {"critical_errors": ["meltdown"]}})");
        ASSERT(bad_critical.is_error());
        ASSERT(bad_critical.error().message.find("meltdown") != std::string::npos);

        Result<Config> bad_timeout = Config::parse(R"({"providers": {"call_timeout_ms": 0}})");
        ASSERT(bad_timeout.is_error());

        Result<Config> bad_events = Config::parse(R"({"telemetry": {"max_events": 0}})");
        ASSERT(bad_events.is_error());
    }

    // --- Parse errors ---
    {
        Result<Config> not_json = Config::parse("{ not json");
        ASSERT(not_json.is_error());
        ASSERT(not_json.error().type == ErrorType::ParseError);

        Result<Config> wrong_type = Config::parse(R"({"loop": {"tick_ms": "fast"}})");
        ASSERT(wrong_type.is_error());
        ASSERT(wrong_type.error().type == ErrorType::ParseError);

        Result<Config> missing = Config::load("/nonexistent/cabin_voice/config.json");
        ASSERT(missing.is_error());
        ASSERT(missing.error().type == ErrorType::IOError);
    }

    // --- Save and load ---
    {
        char path_template[] = "/tmp/cabin_voice_config_XXXXXX";
        int fd = mkstemp(path_template);
        ASSERT(fd >= 0);
        if (fd >= 0) {
            close(fd);
            Config config;
            config.context.history_window = 9;
            config.telemetry.feed_server_url = "http://localhost:9999/events";
            ASSERT(config.save(path_template).is_ok());

            Result<Config> loaded = Config::load(path_template);
            ASSERT(loaded.is_ok());
            if (loaded) {
                ASSERT(loaded.value().context.history_window == 9);
                ASSERT(loaded.value().telemetry.feed_server_url == "http://localhost:9999/events");
            }
            std::remove(path_template);
        }
    }

    // --- Error type names ---
    {
        ASSERT(std::string(error_type_name(ErrorType::SchemaMismatch)) == "schema_mismatch");
        ASSERT(error_type_from_name("recovery_failed") == ErrorType::RecoveryFailed);
        ASSERT(!error_type_from_name("meltdown").has_value());
        ASSERT(classify(ErrorType::Timeout) == ErrorClass::Transient);
        ASSERT(classify(ErrorType::ValidationError) == ErrorClass::Validation);
        ASSERT(classify(ErrorType::IntegrityFailure) == ErrorClass::Fatal);
    }

    // --- Log levels ---
    {
        ASSERT(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
        ASSERT(Logger::parse_level("warning") == LogLevel::WARN);
        ASSERT(Logger::parse_level("error") == LogLevel::ERROR);
        ASSERT(Logger::parse_level("chatty") == LogLevel::INFO);
    }

    // --- Log file output: level filter and thread name ---
    {
        char path_template[] = "/tmp/cabin_voice_log_XXXXXX";
        int fd = mkstemp(path_template);
        ASSERT(fd >= 0);
        if (fd >= 0) {
            close(fd);
            Logger::initialize(LogLevel::INFO, path_template);
            Logger::set_thread_name("tester");
            Logger::debug("hidden detail");
            Logger::info("visible line");
            Logger::set_thread_name("");
            Logger::shutdown();

            std::ifstream file(path_template);
            std::stringstream content;
            content << file.rdbuf();
            ASSERT(content.str().find("(tester): visible line") != std::string::npos);
            ASSERT(content.str().find("hidden detail") == std::string::npos);
            std::remove(path_template);

            Logger::initialize(LogLevel::ERROR);
        }
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
