#pragma once

#include "config.h"
#include "common.h"
#include "context_store.h"
#include "health_monitor.h"
#include "state_machine.h"
#include "providers/speech.h"
#include "providers/language.h"
#include "providers/vehicle.h"
#include <memory>

namespace cabin_voice {

/**
 * @brief External collaborators wired into the orchestrator
 *
 * telemetry and security are optional; the rest are required.
 */
struct Providers {
    std::shared_ptr<ISpeechInput> speech_input;
    std::shared_ptr<IUnderstanding> understanding;
    std::shared_ptr<IDialogue> dialogue;
    std::shared_ptr<ISpeechOutput> speech_output;
    std::shared_ptr<IVehicleLink> vehicle;
    std::shared_ptr<ITelemetry> telemetry;
    std::shared_ptr<ISecurity> security;
};

/**
 * @brief Voice assistant orchestrator
 *
 * Manages the complete assistant lifecycle including:
 * - Integrity verification and concurrent component startup
 * - Startup health check, recovery, emergency shutdown
 * - Steady-state loop (vehicle state refresh, wake-word polling, recovery)
 * - Serialized conversation transitions on a single handler thread
 * - Proactive notifications, deferred while a turn is in flight
 */
class Orchestrator {
public:
    /**
     * @brief Construct orchestrator with configuration and collaborators
     * @param clock Clock for context TTL and session timing
     */
    Orchestrator(const Config& config, Providers providers, ClockFn clock = Clock::now);

    /**
     * @brief Destructor - ensures proper shutdown
     */
    ~Orchestrator();

    // Non-copyable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Startup sequence
     * @return IntegrityFailure or RecoveryFailed when startup was aborted
     *         (the orchestrator is shut down in that case)
     */
    VoidResult start();

    /**
     * @brief Run the steady-state loop until request_stop() or a critical error
     *
     * Starts the orchestrator first if start() has not been called.
     * @return The critical error that caused an emergency shutdown, if any
     */
    VoidResult run();

    /**
     * @brief One loop iteration without the sleep
     */
    VoidResult tick();

    /**
     * @brief Ask run() to return (thread-safe)
     */
    void request_stop();

    /**
     * @brief Stop components in reverse start order, then security, then workers
     *
     * Idempotent.
     */
    void shutdown(bool emergency = false);

    /**
     * @brief Wait until no trigger or turn work is outstanding
     * @return False on timeout
     */
    bool wait_until_settled(int timeout_ms);

    ConversationState state() const;
    bool is_active() const;
    bool is_conversation_active() const;
    bool is_system_healthy() const;
    ComponentHealth health() const;
    ContextStore& context();

    /// Completed turns of the current conversation session
    int turn_count() const;

    /// Proactive notifications waiting for the active turn to finish
    size_t deferred_notifications() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace cabin_voice
