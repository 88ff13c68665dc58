#include "orchestrator.h"
#include "config.h"
#include "logger.h"
#include "session_recorder.h"
#include "sim/console_speech.h"
#include "sim/file_integrity.h"
#include "sim/keyword_understanding.h"
#include "sim/simulated_vehicle.h"
#include "sim/template_dialogue.h"
#include <signal.h>
#include <csignal>
#include <unistd.h>
#include <fstream>
#include <memory>

namespace cabin_voice {

static Orchestrator* g_orchestrator = nullptr;

void signal_handler(int signal) {
    (void)signal;
    if (g_orchestrator) {
        g_orchestrator->request_stop();
    }
}

} // namespace cabin_voice

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    cabin_voice::Logger::initialize(cabin_voice::LogLevel::INFO);

    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    } else {
        // Try config directory relative to executable (e.g. build/../config)
        char buf[1024];
        ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
        if (len != -1) {
            buf[len] = '\0';
            std::string exe_dir(buf);
            size_t pos = exe_dir.find_last_of('/');
            if (pos != std::string::npos) {
                exe_dir = exe_dir.substr(0, pos);
                std::string candidate = exe_dir + "/../config/config.json";
                std::ifstream test(candidate);
                if (test.good()) {
                    config_path = candidate;
                }
            }
        }
    }

    cabin_voice::Config config;
    cabin_voice::Result<cabin_voice::Config> loaded = cabin_voice::Config::load(config_path);
    if (loaded) {
        config = loaded.value();
    } else if (loaded.error().type == cabin_voice::ErrorType::IOError && argc <= 1) {
        cabin_voice::Logger::warn("No config at " + config_path + ", using defaults");
    } else {
        cabin_voice::Logger::error("Failed to load config: " + loaded.error().message);
        cabin_voice::Logger::shutdown();
        return 1;
    }

    // Reconfigure logger with configured level and file
    cabin_voice::Logger::initialize(cabin_voice::Logger::parse_level(config.logging.level), config.logging.file);

    int exit_code = 0;
    {
        auto speech_input = std::make_shared<cabin_voice::sim::ConsoleSpeechInput>(config.simulation);

        cabin_voice::Providers providers;
        providers.speech_input = speech_input;
        providers.understanding = std::make_shared<cabin_voice::sim::KeywordUnderstanding>();
        providers.dialogue = std::make_shared<cabin_voice::sim::TemplateDialogue>();
        providers.speech_output = std::make_shared<cabin_voice::sim::ConsoleSpeechOutput>();
        providers.vehicle = std::make_shared<cabin_voice::sim::SimulatedVehicle>(config.simulation);
        providers.telemetry = std::make_shared<cabin_voice::SessionRecorder>(config.telemetry);
        providers.security = std::make_shared<cabin_voice::sim::FileIntegrityVerifier>(config.simulation.integrity_files);

        // Create and run orchestrator
        cabin_voice::Orchestrator orchestrator(config, providers);
        cabin_voice::g_orchestrator = &orchestrator;

        speech_input->set_end_of_input_handler([&orchestrator]() {
            cabin_voice::Logger::info("End of input, shutting down...");
            orchestrator.request_stop();
        });

        // Set up signal handlers
        std::signal(SIGINT, cabin_voice::signal_handler);
        std::signal(SIGTERM, cabin_voice::signal_handler);

        cabin_voice::Logger::info("Say \"" + config.simulation.wake_phrase + "\" to start, \"quit\" to exit");

        // Run orchestrator
        cabin_voice::VoidResult result = orchestrator.run();
        orchestrator.shutdown();

        cabin_voice::g_orchestrator = nullptr;

        if (!result) {
            cabin_voice::Logger::error(std::string("Assistant stopped with ") +
                                       cabin_voice::error_type_name(result.error().type) + ": " +
                                       result.error().message);
            exit_code = 1;
        }
    }

    // Shutdown logger
    cabin_voice::Logger::shutdown();

    return exit_code;
}
