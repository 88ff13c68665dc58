#include "event_dispatcher.h"
#include "logger.h"

namespace cabin_voice {

EventDispatcher::EventDispatcher(ContextStore& context, std::shared_ptr<IDialogue> dialogue,
                                 TaskExecutor& executor, int call_timeout_ms)
    : context_(context), dialogue_(std::move(dialogue)), executor_(executor),
      call_timeout_ms_(call_timeout_ms) {}

bool EventDispatcher::on_vehicle_event(const std::string& event_type, const Json& payload) {
    Logger::debug("[Event] Vehicle event: " + event_type + " " + payload.dump());

    context_.record_vehicle_event(event_type, payload);

    if (!dialogue_) {
        return false;
    }

    const Json context = context_.read().to_json();
    std::shared_ptr<IDialogue> dialogue = dialogue_;
    auto decision = executor_.run_with_timeout<std::optional<ProactiveNotification>>(
        [dialogue, event_type, payload, context]() {
            return dialogue->check_proactive_trigger(event_type, payload, context);
        },
        call_timeout_ms_, "dialogue.check_proactive_trigger");

    if (!decision) {
        Logger::warn("[Event] Proactive check for " + event_type + " failed: " + decision.error().message);
        if (failure_sink_ && classify(decision.error().type) == ErrorClass::Transient) {
            failure_sink_(component::DIALOGUE, decision.error());
        }
        return false;
    }

    if (!decision.value()) {
        return false;
    }

    ProactiveNotification notification = *decision.value();
    if (notification.event_type.empty()) {
        notification.event_type = event_type;
    }
    LOG_EVENT("Proactive trigger for " + event_type + ": \"" + notification.speech + "\"");

    if (proactive_sink_) {
        proactive_sink_(std::move(notification));
    }
    return true;
}

} // namespace cabin_voice
