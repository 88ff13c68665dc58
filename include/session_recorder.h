#pragma once

#include "common.h"
#include "config.h"
#include "providers/vehicle.h"
#include <string>
#include <memory>
#include <vector>

namespace cabin_voice {

struct SessionEvent {
    int64_t timestamp_ms;   // Since session start
    std::string event_type; // "system_start", "conversation_start", "interaction", "proactive_notification", ...
    Json data;
};

/**
 * @brief Telemetry sink for <session_log_dir>/<session_id>/
 *
 * Every event is appended to events.jsonl as it arrives. session.json holds
 * the session summary and the last telemetry.max_events events; it is
 * written when the session starts and when it is finalized.
 *
 * Optionally POSTs every event to telemetry.feed_server_url.
 * Recording never fails the caller; write errors are logged.
 */
class SessionRecorder : public ITelemetry {
public:
    explicit SessionRecorder(const TelemetryConfig& config);
    ~SessionRecorder() override;

    // Telemetry
    void log_event(const std::string& name, const Json& payload) override;
    void log_interaction(const std::string& input, const NluResult& nlu,
                         const DialogueResponse& response) override;

    // Component: start() opens a new session, stop() finalizes it
    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

    // Get current session ID
    std::string get_session_id() const;

    // Directory of the current session
    std::string get_session_path() const;

    // Copy of the retained (most recent) events
    std::vector<SessionEvent> events() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace cabin_voice
