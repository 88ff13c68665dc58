#include "orchestrator.h"
#include "command_executor.h"
#include "event_dispatcher.h"
#include "recovery_manager.h"
#include "task_executor.h"
#include "core/channel.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

namespace cabin_voice {

namespace {

/// Input to the transition handler
struct Trigger {
    enum class Kind {
        WakeWord,
        Transcription,
        ResponseReady,
        TurnFailed,
        Delivered,
        Proactive
    };

    Kind kind = Kind::WakeWord;
    Transcription transcription;
    DialogueResponse response;
    ProactiveNotification notification;
    Error error;
    bool end_conversation = false;
};

/// Transient per-conversation bookkeeping
struct ConversationSession {
    bool active = false;
    TimePoint started;
    int turn_count = 0;
};

std::string join_names(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << names[i];
    }
    return oss.str();
}

} // namespace

class Orchestrator::Impl {
public:
    Impl(const Config& config, Providers providers, ClockFn clock)
        : config_(config), providers_(std::move(providers)), clock_(std::move(clock)),
          executor_(config.system.max_workers),
          context_(std::make_shared<ContextStore>(config.context, clock_)),
          monitor_(config.health, executor_),
          recovery_(config.recovery, monitor_, executor_),
          fsm_(config.speech.min_confidence),
          commands_(providers_.vehicle, *context_, executor_, config.providers.call_timeout_ms),
          dispatcher_(*context_, providers_.dialogue, executor_, config.providers.call_timeout_ms),
          active_(false), stop_requested_(false), closing_(false),
          started_(false), components_started_(false), shut_down_(false), outstanding_(0) {

        // Start order; shutdown walks it backwards
        add_component(providers_.speech_input);
        add_component(providers_.understanding);
        add_component(providers_.dialogue);
        add_component(providers_.speech_output);
        add_component(providers_.vehicle);
        add_component(context_);
        add_component(providers_.telemetry);

        dispatcher_.set_proactive_sink([this](ProactiveNotification notification) {
            Trigger trigger;
            trigger.kind = Trigger::Kind::Proactive;
            trigger.notification = std::move(notification);
            post_trigger(std::move(trigger));
        });
        dispatcher_.set_failure_sink([this](const std::string& name, const Error& error) {
            report_failure(name, error);
        });
    }

    ~Impl() {
        shutdown(false);
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    VoidResult start() {
        if (started_) {
            return make_error(ErrorType::InvalidState, "orchestrator already started");
        }
        started_ = true;

        LOG_ORCH("Starting cabin voice assistant");

        std::vector<std::string> missing;
        if (!providers_.speech_input) missing.push_back(component::SPEECH_INPUT);
        if (!providers_.understanding) missing.push_back(component::UNDERSTANDING);
        if (!providers_.dialogue) missing.push_back(component::DIALOGUE);
        if (!providers_.speech_output) missing.push_back(component::SPEECH_OUTPUT);
        if (!providers_.vehicle) missing.push_back(component::VEHICLE);
        if (!missing.empty()) {
            Logger::error("[Orchestrator] Missing collaborators: " + join_names(missing));
            shutdown(true);
            return make_error(ErrorType::InvalidState, "missing collaborators: " + join_names(missing));
        }

        handler_thread_ = std::thread(&Impl::handler_loop, this);
        job_thread_ = std::thread(&Impl::job_loop, this);

        // Security services and integrity verification
        if (providers_.security) {
            VoidResult security_started = providers_.security->start();
            if (!security_started) {
                Logger::error("[Orchestrator] Security service failed to start: " +
                              security_started.error().message);
                shutdown(true);
                return make_error(ErrorType::IntegrityFailure,
                                  "security service failed to start: " + security_started.error().message);
            }
            if (!providers_.security->verify_system_integrity()) {
                Logger::error("[Orchestrator] System integrity check failed. Aborting startup.");
                shutdown(true);
                return make_error(ErrorType::IntegrityFailure, "system integrity check failed");
            }
            LOG_ORCH("System integrity verified");
        }

        // Subscribe before starting so nothing is missed
        providers_.speech_input->set_transcription_callback([this](const Transcription& transcription) {
            Trigger trigger;
            trigger.kind = Trigger::Kind::Transcription;
            trigger.transcription = transcription;
            post_trigger(std::move(trigger));
        });
        providers_.vehicle->subscribe_to_events([this](const std::string& event_type, const Json& payload) {
            if (closing_) return;
            dispatcher_.on_vehicle_event(event_type, payload);
        });

        std::map<std::string, std::string> start_failures = start_components();

        ComponentHealth health = monitor_.check_all();
        for (const auto& [name, message] : start_failures) {
            health.mark(name, HealthStatus::Failed, "start failed: " + message);
        }
        commit_health(health);

        std::vector<std::string> failed = health.failed_components();
        if (!failed.empty()) {
            Logger::error("[Orchestrator] Component health check failed for: " + join_names(failed));
            RecoveryResult recovery = recovery_.recover(failed);
            apply_recovery(recovery);
            if (!recovery.fully_recovered) {
                Logger::error("[Orchestrator] Failed to recover all components, system startup aborted");
                shutdown(true);
                return make_error(ErrorType::RecoveryFailed,
                                  "components failed to recover: " + join_names(recovery.terminally_failed()));
            }
            LOG_ORCH("All failed components recovered");
        }
        for (const auto& name : health.unhealthy_components()) {
            if (health.components.at(name).status == HealthStatus::Degraded) {
                Logger::warn("[Orchestrator] Starting with degraded component: " + name);
            }
        }

        active_ = true;
        set_ui(ui_state::IDLE);
        log_event("system_start", Json{{"status", "success"}});
        LOG_ORCH("Startup complete");
        return VoidResult();
    }

    VoidResult run() {
        if (!started_) {
            VoidResult started = start();
            if (!started) {
                return started;
            }
        }
        if (!active_) {
            return make_error(ErrorType::InvalidState, "orchestrator is not active");
        }

        Logger::set_thread_name("loop");
        LOG_ORCH("Entering main processing loop");

        while (active_ && !stop_requested_) {
            VoidResult result;
            try {
                result = tick();
            } catch (const std::exception& e) {
                result = make_error(ErrorType::Unknown, e.what());
            }

            if (!result) {
                Error error = result.error();
                Logger::error(std::string("[Orchestrator] Error in processing loop (") +
                              error_type_name(error.type) + "): " + error.message);
                if (config_.is_critical(error.type)) {
                    log_event("critical_error", Json{{"type", error_type_name(error.type)},
                                                     {"message", error.message}});
                    shutdown(true);
                    return error;
                }
                sleep_unless_stopped(config_.loop.error_backoff_ms);
                continue;
            }

            sleep_unless_stopped(config_.loop.tick_ms);
        }

        shutdown(false);
        return VoidResult();
    }

    VoidResult tick() {
        if (!active_) {
            return make_error(ErrorType::InvalidState, "orchestrator is not active");
        }

        // Update vehicle context
        std::shared_ptr<IVehicleLink> vehicle = providers_.vehicle;
        Result<Json> vehicle_state = call<Json>(component::VEHICLE, "vehicle.get_current_state",
                                                [vehicle]() { return vehicle->get_current_state(); });
        if (vehicle_state) {
            if (vehicle_state.value().is_object()) {
                VoidResult updated = context_->update(Json{{"vehicle_state", vehicle_state.value()}});
                if (!updated) {
                    Logger::warn("[Orchestrator] Vehicle state rejected: " + updated.error().message);
                }
            } else {
                Logger::warn("[Orchestrator] Vehicle state is not an object, ignored");
            }
        }

        // Check for wake word detection
        if (fsm_.get_state() == ConversationState::Idle) {
            std::shared_ptr<ISpeechInput> speech = providers_.speech_input;
            Result<bool> wake = call<bool>(component::SPEECH_INPUT, "speech.is_wake_word_detected",
                                           [speech]() -> Result<bool> { return speech->is_wake_word_detected(); });
            if (wake && wake.value()) {
                Trigger trigger;
                trigger.kind = Trigger::Kind::WakeWord;
                post_trigger(std::move(trigger));
            }
        }

        return recover_reported_failures();
    }

    void request_stop() {
        stop_requested_ = true;
        loop_cv_.notify_all();
    }

    void shutdown(bool emergency) {
        {
            std::lock_guard<std::mutex> lock(shutdown_mutex_);
            if (shut_down_) {
                return;
            }
            shut_down_ = true;
        }

        LOG_ORCH(std::string(emergency ? "Emergency shutdown" : "Shutting down") + " of cabin voice assistant");

        const bool was_active = active_.exchange(false);
        closing_ = true;
        request_stop();

        // Collaborators may outlive us
        if (started_) {
            if (providers_.speech_input) providers_.speech_input->set_transcription_callback(nullptr);
            if (providers_.vehicle) providers_.vehicle->subscribe_to_events(nullptr);
        }

        if (was_active) {
            log_event("system_shutdown", Json{{"emergency", emergency}});
        }

        // Stop accepting triggers and turn work; the threads exit once drained
        triggers_.close();
        jobs_.close();
        commands_.close();
        if (handler_thread_.joinable()) handler_thread_.join();
        if (job_thread_.joinable()) job_thread_.join();
        fsm_.reset();
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_ = ConversationSession();
        }

        // Shutdown all components in reverse order
        if (components_started_) {
            for (auto it = start_order_.rbegin(); it != start_order_.rend(); ++it) {
                ComponentPtr target = *it;
                VoidResult stopped = executor_.run_with_timeout<void>(
                    [target]() { return target->stop(); },
                    config_.recovery.restart_timeout_ms, target->name() + " stop");
                if (!stopped) {
                    Logger::error("[Orchestrator] Error stopping " + target->name() + ": " +
                                  stopped.error().message);
                }
            }
        }

        if (providers_.security) {
            VoidResult stopped = providers_.security->stop();
            if (!stopped) {
                Logger::error("[Orchestrator] Error stopping security service: " + stopped.error().message);
            }
        }

        executor_.shutdown();
        LOG_ORCH("System shutdown complete");
    }

    bool wait_until_settled(int timeout_ms) {
        std::unique_lock<std::mutex> lock(settle_mutex_);
        return settle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                   [this] { return outstanding_ == 0; });
    }

    // =========================================================================
    // Accessors
    // =========================================================================

    ConversationState state() const { return fsm_.get_state(); }
    bool is_active() const { return active_; }
    bool is_conversation_active() const { return fsm_.is_conversation_active(); }

    bool is_system_healthy() const {
        std::lock_guard<std::mutex> lock(health_mutex_);
        return health_.all_healthy();
    }

    ComponentHealth health() const {
        std::lock_guard<std::mutex> lock(health_mutex_);
        return health_;
    }

    ContextStore& context() { return *context_; }

    int turn_count() const {
        std::lock_guard<std::mutex> lock(session_mutex_);
        return session_.turn_count;
    }

    size_t deferred_notifications() const {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        return deferred_.size();
    }

private:
    void add_component(ComponentPtr component) {
        if (!component) return;
        start_order_.push_back(component);
        monitor_.register_component(component);
    }

    /// Start every component concurrently; returns start errors by name
    std::map<std::string, std::string> start_components() {
        LOG_ORCH("Starting " + std::to_string(start_order_.size()) + " components");
        components_started_ = true;

        std::vector<std::pair<ComponentPtr, TaskHandle<void>>> starts;
        for (const auto& component : start_order_) {
            ComponentPtr target = component;
            starts.emplace_back(target, executor_.spawn<void>([target]() { return target->start(); }));
        }

        const TimePoint deadline = Clock::now() + std::chrono::milliseconds(config_.recovery.restart_timeout_ms);
        std::map<std::string, std::string> failures;
        for (auto& [component, handle] : starts) {
            VoidResult started = handle.wait_until(deadline, component->name() + " start");
            if (!started) {
                failures[component->name()] = started.error().message;
                Logger::error("[Orchestrator] Failed to start " + component->name() + ": " +
                              started.error().message);
            }
        }
        return failures;
    }

    // =========================================================================
    // Health and recovery
    // =========================================================================

    void commit_health(const ComponentHealth& health) {
        {
            std::lock_guard<std::mutex> lock(health_mutex_);
            health_ = health;
        }
        log_event("health_check", Json{{"status", health.to_json()}, {"all_healthy", health.all_healthy()}});
    }

    void apply_recovery(const RecoveryResult& recovery) {
        {
            std::lock_guard<std::mutex> lock(health_mutex_);
            for (const auto& [name, outcome] : recovery.components) {
                health_.mark(name, outcome.recovered ? HealthStatus::Healthy : HealthStatus::Failed,
                             outcome.last_error);
            }
        }
        log_event("recovery", recovery.to_json());
    }

    /// A provider call failed; recovery runs on the next tick
    void report_failure(const std::string& name, const Error& error) {
        if (!active_ || classify(error.type) != ErrorClass::Transient) {
            return;
        }
        std::lock_guard<std::mutex> lock(failures_mutex_);
        reported_failures_[name] = error.message;
    }

    VoidResult recover_reported_failures() {
        std::map<std::string, std::string> failures;
        {
            std::lock_guard<std::mutex> lock(failures_mutex_);
            failures.swap(reported_failures_);
        }
        if (failures.empty()) {
            return VoidResult();
        }

        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lock(health_mutex_);
            for (const auto& [name, message] : failures) {
                health_.mark(name, HealthStatus::Failed, message);
                names.push_back(name);
            }
        }
        Logger::warn("[Orchestrator] Provider failures reported for: " + join_names(names));

        RecoveryResult recovery = recovery_.recover(names);
        apply_recovery(recovery);
        if (!recovery.fully_recovered) {
            return make_error(ErrorType::RecoveryFailed,
                              "components failed to recover: " + join_names(recovery.terminally_failed()));
        }
        return VoidResult();
    }

    // =========================================================================
    // Provider calls
    // =========================================================================

    /// Bounded provider call; a transient failure is reported against the component
    template<typename T>
    Result<T> call(const std::string& name, const std::string& label, std::function<Result<T>()> fn) {
        Result<T> result = executor_.run_with_timeout<T>(std::move(fn), config_.providers.call_timeout_ms, label);
        if (!result) {
            Logger::warn("[Orchestrator] " + label + " failed: " + result.error().message);
            report_failure(name, result.error());
        }
        return result;
    }

    void set_ui(const std::string& state) {
        std::shared_ptr<IVehicleLink> vehicle = providers_.vehicle;
        VoidResult result = call<void>(component::VEHICLE, "vehicle.set_ui_state",
                                       [vehicle, state]() { return vehicle->set_ui_state(state); });
        (void)result;
    }

    VoidResult speak(const std::string& text, bool interrupt) {
        std::shared_ptr<ISpeechOutput> tts = providers_.speech_output;
        return call<void>(component::SPEECH_OUTPUT, "tts.speak",
                          [tts, text, interrupt]() { return tts->speak(text, interrupt); });
    }

    void log_event(const std::string& name, const Json& payload) {
        if (providers_.telemetry) {
            providers_.telemetry->log_event(name, payload);
        }
    }

    // =========================================================================
    // Trigger and job queues
    // =========================================================================

    bool post_trigger(Trigger trigger) {
        begin_work();
        if (!triggers_.push(std::move(trigger))) {
            end_work();
            return false;
        }
        return true;
    }

    bool post_job(std::function<void()> job) {
        begin_work();
        if (!jobs_.push(std::move(job))) {
            end_work();
            return false;
        }
        return true;
    }

    void begin_work() {
        std::lock_guard<std::mutex> lock(settle_mutex_);
        ++outstanding_;
    }

    void end_work() {
        std::lock_guard<std::mutex> lock(settle_mutex_);
        if (--outstanding_ == 0) {
            settle_cv_.notify_all();
        }
    }

    void handler_loop() {
        Logger::set_thread_name("handler");
        while (auto trigger = triggers_.pop()) {
            if (!closing_) {
                try {
                    handle(*trigger);
                } catch (const std::exception& e) {
                    Logger::error(std::string("[FSM] Transition failed, resetting to Idle: ") + e.what());
                    fsm_.reset();
                }
            }
            end_work();
        }
    }

    void job_loop() {
        Logger::set_thread_name("jobs");
        while (auto job = jobs_.pop()) {
            if (!closing_) {
                try {
                    (*job)();
                } catch (const std::exception& e) {
                    Logger::error(std::string("[Orchestrator] Turn job failed: ") + e.what());
                    Trigger trigger;
                    trigger.kind = Trigger::Kind::TurnFailed;
                    trigger.error = make_error(ErrorType::Unknown, e.what());
                    post_trigger(std::move(trigger));
                }
            }
            end_work();
        }
    }

    // =========================================================================
    // Transition handler (handler thread only)
    // =========================================================================

    void handle(const Trigger& trigger) {
        switch (trigger.kind) {
            case Trigger::Kind::WakeWord:      on_wake_word(); break;
            case Trigger::Kind::Transcription: on_transcription(trigger.transcription); break;
            case Trigger::Kind::ResponseReady: on_response_ready(trigger.response); break;
            case Trigger::Kind::TurnFailed:    on_turn_failed(trigger.error); break;
            case Trigger::Kind::Delivered:     on_delivered(trigger.end_conversation); break;
            case Trigger::Kind::Proactive:     on_proactive(trigger.notification); break;
        }
    }

    void on_wake_word() {
        Transition t = fsm_.on_wake_word();
        if (!t.accepted) {
            Logger::debug(std::string("[FSM] Wake word ignored in ") + state_name(t.from));
            return;
        }

        LOG_ORCH("Starting new conversation session");
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_.active = true;
            session_.started = clock_();
            session_.turn_count = 0;
        }

        // Acknowledge wake word with visual and audio feedback
        set_ui(ui_state::LISTENING);
        speak_async(config_.speech.acknowledge_phrase, true);
        log_event("conversation_start", Json{{"context", context_->summary()}});
    }

    void on_transcription(const Transcription& transcription) {
        Transition t = fsm_.on_transcription(transcription.confidence);
        if (!t.accepted) {
            Logger::debug(std::string("[FSM] Transcription ignored in ") + state_name(t.from) +
                          ": '" + transcription.text + "'");
            return;
        }

        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed << transcription.confidence;
        if (t.effect == SideEffect::PromptRepeat) {
            Logger::warn("[Orchestrator] Low confidence transcription ignored: " + oss.str());
            speak_async(config_.speech.clarify_phrase, false);
            return;
        }

        LOG_ORCH("Received speech input: '" + transcription.text + "' (conf: " + oss.str() + ")");
        set_ui(ui_state::PROCESSING);
        const std::string text = transcription.text;
        post_job([this, text]() { run_turn(text); });
    }

    void on_response_ready(const DialogueResponse& response) {
        Transition t = fsm_.on_response_generated();
        if (!t.accepted) {
            return;
        }

        execute_commands(response.commands);

        if (!response.ui_update.is_null()) {
            std::shared_ptr<IVehicleLink> vehicle = providers_.vehicle;
            const Json payload = response.ui_update;
            VoidResult updated = call<void>(component::VEHICLE, "vehicle.update_ui",
                                            [vehicle, payload]() { return vehicle->update_ui(payload); });
            (void)updated;
        }

        set_ui(ui_state::SPEAKING);
        speak_then_deliver(response.speech_response, false, response.end_conversation);
    }

    void on_turn_failed(const Error& error) {
        Transition t = fsm_.on_turn_failed();
        if (!t.accepted) {
            return;
        }

        Logger::error(std::string("[Orchestrator] Error processing speech input (") +
                      error_type_name(error.type) + "): " + error.message);
        log_event("turn_failed", Json{{"type", error_type_name(error.type)}, {"message", error.message}});

        set_ui(ui_state::LISTENING);
        speak_async(config_.speech.apology_phrase, false);
        deliver_deferred();
    }

    void on_delivered(bool end_conversation) {
        const bool proactive = fsm_.is_proactive();
        Transition t = fsm_.on_response_delivered(end_conversation);
        if (!t.accepted) {
            return;
        }

        if (!proactive) {
            std::lock_guard<std::mutex> lock(session_mutex_);
            ++session_.turn_count;
        }

        if (t.effect == SideEffect::EndSession) {
            end_session(proactive ? "proactive" : "completed", true);
        } else {
            set_ui(ui_state::LISTENING);
        }
        deliver_deferred();
    }

    void on_proactive(const ProactiveNotification& notification) {
        const ConversationState current = fsm_.get_state();
        if (current == ConversationState::Processing || current == ConversationState::Speaking) {
            defer(notification);
            return;
        }
        start_proactive(notification);
    }

    void start_proactive(const ProactiveNotification& notification) {
        const bool interrupts_conversation = fsm_.get_state() == ConversationState::Listening;
        Transition t = fsm_.on_proactive_trigger();
        if (!t.accepted) {
            defer(notification);
            return;
        }

        if (interrupts_conversation) {
            end_session("interrupted", false);
        }

        LOG_EVENT("Proactive notification for " + notification.event_type);
        execute_commands(notification.commands);
        set_ui(ui_state::SPEAKING);
        log_event("proactive_notification", Json{{"event_type", notification.event_type},
                                                 {"response", notification}});
        speak_then_deliver(notification.speech, true, true);
    }

    void defer(const ProactiveNotification& notification) {
        std::lock_guard<std::mutex> lock(deferred_mutex_);
        deferred_.push_back(notification);
        LOG_EVENT("Deferring " + notification.event_type + " notification until the active turn completes");
    }

    void deliver_deferred() {
        std::optional<ProactiveNotification> next;
        {
            std::lock_guard<std::mutex> lock(deferred_mutex_);
            if (deferred_.empty()) return;
            next = deferred_.front();
            deferred_.pop_front();
        }
        start_proactive(*next);
    }

    void end_session(const std::string& reason, bool reset_ui) {
        ConversationSession ended;
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            ended = session_;
            session_ = ConversationSession();
        }

        if (reset_ui) {
            set_ui(ui_state::IDLE);
        }
        if (!ended.active) {
            return;
        }

        const int64_t duration_ms = ms_between(ended.started, clock_());
        LOG_ORCH("Ending conversation session (" + reason + ", " + std::to_string(ended.turn_count) +
                 " turns, " + std::to_string(duration_ms) + " ms)");
        log_event("conversation_end", Json{{"turn_count", ended.turn_count},
                                           {"duration_ms", duration_ms},
                                           {"reason", reason}});
    }

    void execute_commands(const std::vector<PendingCommand>& commands) {
        if (commands.empty()) return;

        commands_.enqueue_all(commands);
        for (const auto& outcome : commands_.drain()) {
            if (!outcome.result) {
                Logger::error("[Orchestrator] Error executing command " + outcome.command.type + ": " +
                              outcome.result.error().message);
                report_failure(component::VEHICLE, outcome.result.error());
            }
        }
    }

    // =========================================================================
    // Turn work (job thread only)
    // =========================================================================

    void speak_async(const std::string& text, bool interrupt) {
        if (text.empty()) return;
        post_job([this, text, interrupt]() {
            VoidResult spoken = speak(text, interrupt);
            (void)spoken;
        });
    }

    void speak_then_deliver(const std::string& text, bool interrupt, bool end_conversation) {
        post_job([this, text, interrupt, end_conversation]() {
            if (!text.empty()) {
                VoidResult spoken = speak(text, interrupt);
                (void)spoken;
            }
            Trigger trigger;
            trigger.kind = Trigger::Kind::Delivered;
            trigger.end_conversation = end_conversation;
            post_trigger(std::move(trigger));
        });
    }

    void fail_turn(const Error& error) {
        Trigger trigger;
        trigger.kind = Trigger::Kind::TurnFailed;
        trigger.error = error;
        post_trigger(std::move(trigger));
    }

    void run_turn(const std::string& text) {
        // Understanding
        std::shared_ptr<IUnderstanding> nlu = providers_.understanding;
        Result<NluResult> understood = call<NluResult>(component::UNDERSTANDING, "nlu.process",
                                                       [nlu, text]() { return nlu->process(text); });
        if (!understood) {
            fail_turn(understood.error());
            return;
        }
        const NluResult& nlu_result = understood.value();

        // Entities describe this turn only
        VoidResult updated = context_->replace(Json{{"current_intent", nlu_result.intent},
                                                    {"entities", nlu_result.entities}});
        if (!updated) {
            fail_turn(updated.error());
            return;
        }

        ConversationTurn user_turn;
        user_turn.timestamp_ms = wall_ms();
        user_turn.speaker = speaker::USER;
        user_turn.text = text;
        user_turn.intent = nlu_result.intent;
        user_turn.entities = nlu_result.entities;
        context_->append_turn(user_turn);

        // Dialogue
        std::shared_ptr<IDialogue> dialogue = providers_.dialogue;
        const Json context = context_->read().to_json();
        Result<DialogueResponse> answered = call<DialogueResponse>(
            component::DIALOGUE, "dialogue.process_turn",
            [dialogue, nlu_result, context]() { return dialogue->process_turn(nlu_result, context); });
        if (!answered) {
            fail_turn(answered.error());
            return;
        }
        const DialogueResponse& response = answered.value();

        // Reject the whole turn before any command runs
        for (const auto& command : response.commands) {
            VoidResult valid = CommandExecutor::validate(command);
            if (!valid) {
                fail_turn(valid.error());
                return;
            }
        }

        ConversationTurn assistant_turn;
        assistant_turn.timestamp_ms = wall_ms();
        assistant_turn.speaker = speaker::ASSISTANT;
        assistant_turn.text = response.speech_response;
        assistant_turn.intent = nlu_result.intent;
        context_->append_turn(assistant_turn);

        if (providers_.telemetry) {
            providers_.telemetry->log_interaction(text, nlu_result, response);
        }

        Trigger trigger;
        trigger.kind = Trigger::Kind::ResponseReady;
        trigger.response = response;
        post_trigger(std::move(trigger));
    }

    void sleep_unless_stopped(int ms) {
        std::unique_lock<std::mutex> lock(loop_mutex_);
        loop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stop_requested_.load(); });
    }

    Config config_;
    Providers providers_;
    ClockFn clock_;

    TaskExecutor executor_;
    std::shared_ptr<ContextStore> context_;
    HealthMonitor monitor_;
    RecoveryManager recovery_;
    ConversationStateMachine fsm_;
    CommandExecutor commands_;
    EventDispatcher dispatcher_;
    std::vector<ComponentPtr> start_order_;

    Channel<Trigger> triggers_;
    Channel<std::function<void()>> jobs_;
    std::thread handler_thread_;
    std::thread job_thread_;

    std::atomic<bool> active_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> closing_;
    std::atomic<bool> started_;
    std::atomic<bool> components_started_;
    bool shut_down_;
    std::mutex shutdown_mutex_;

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;

    size_t outstanding_;
    std::mutex settle_mutex_;
    std::condition_variable settle_cv_;

    mutable std::mutex health_mutex_;
    ComponentHealth health_;

    std::mutex failures_mutex_;
    std::map<std::string, std::string> reported_failures_;

    mutable std::mutex session_mutex_;
    ConversationSession session_;

    mutable std::mutex deferred_mutex_;
    std::deque<ProactiveNotification> deferred_;
};

Orchestrator::Orchestrator(const Config& config, Providers providers, ClockFn clock)
    : pimpl_(std::make_unique<Impl>(config, std::move(providers), std::move(clock))) {}

Orchestrator::~Orchestrator() = default;

VoidResult Orchestrator::start() {
    return pimpl_->start();
}

VoidResult Orchestrator::run() {
    return pimpl_->run();
}

VoidResult Orchestrator::tick() {
    return pimpl_->tick();
}

void Orchestrator::request_stop() {
    pimpl_->request_stop();
}

void Orchestrator::shutdown(bool emergency) {
    pimpl_->shutdown(emergency);
}

bool Orchestrator::wait_until_settled(int timeout_ms) {
    return pimpl_->wait_until_settled(timeout_ms);
}

ConversationState Orchestrator::state() const {
    return pimpl_->state();
}

bool Orchestrator::is_active() const {
    return pimpl_->is_active();
}

bool Orchestrator::is_conversation_active() const {
    return pimpl_->is_conversation_active();
}

bool Orchestrator::is_system_healthy() const {
    return pimpl_->is_system_healthy();
}

ComponentHealth Orchestrator::health() const {
    return pimpl_->health();
}

ContextStore& Orchestrator::context() {
    return pimpl_->context();
}

int Orchestrator::turn_count() const {
    return pimpl_->turn_count();
}

size_t Orchestrator::deferred_notifications() const {
    return pimpl_->deferred_notifications();
}

} // namespace cabin_voice
