#pragma once

#include "context_store.h"
#include "core/types.h"
#include "providers/language.h"
#include "task_executor.h"
#include <functional>
#include <memory>
#include <string>

namespace cabin_voice {

/// Receiver for notifications that should be spoken (the transition handler)
using ProactiveSink = std::function<void(ProactiveNotification)>;

/// Receiver for collaborator failures observed while dispatching
using FailureSink = std::function<void(const std::string& component, const Error& error)>;

/**
 * @brief Routes vehicle-originated events
 *
 * Every event is recorded into the context store. The dialogue collaborator
 * then decides whether the event warrants a spoken notification; if so, the
 * notification is handed to the proactive sink. Callable from any thread.
 */
class EventDispatcher {
public:
    EventDispatcher(ContextStore& context, std::shared_ptr<IDialogue> dialogue,
                    TaskExecutor& executor, int call_timeout_ms);

    void set_proactive_sink(ProactiveSink sink) { proactive_sink_ = std::move(sink); }
    void set_failure_sink(FailureSink sink) { failure_sink_ = std::move(sink); }

    /**
     * @brief Handle one vehicle event
     * @return True if a proactive notification was raised
     */
    bool on_vehicle_event(const std::string& event_type, const Json& payload);

private:
    ContextStore& context_;
    std::shared_ptr<IDialogue> dialogue_;
    TaskExecutor& executor_;
    int call_timeout_ms_;
    ProactiveSink proactive_sink_;
    FailureSink failure_sink_;
};

} // namespace cabin_voice
