#pragma once

/**
 * @file vehicle.h
 * @brief Vehicle link, telemetry sink and security collaborator interfaces
 */

#include "providers/component.h"
#include "core/types.h"
#include <string>

namespace cabin_voice {

/**
 * @brief Vehicle bus / head-unit link
 */
class IVehicleLink : public Component {
public:
    /**
     * @brief Current vehicle state snapshot (climate, media, navigation, ...)
     */
    virtual Result<Json> get_current_state() = 0;

    virtual VoidResult set_ui_state(const std::string& state) = 0;
    virtual VoidResult update_ui(const Json& payload) = 0;

    /**
     * @brief Register the receiver for vehicle events; may be called from any thread
     */
    virtual void subscribe_to_events(VehicleEventHandler handler) = 0;

    // Command executors
    virtual VoidResult set_climate(const Json& parameters) = 0;
    virtual VoidResult set_navigation(const Json& parameters) = 0;
    virtual VoidResult control_media(const Json& parameters) = 0;
    virtual VoidResult update_settings(const Json& parameters) = 0;
};

/**
 * @brief Telemetry sink; never fails the caller
 */
class ITelemetry : public Component {
public:
    virtual void log_event(const std::string& name, const Json& payload) = 0;
    virtual void log_interaction(const std::string& input, const NluResult& nlu,
                                 const DialogueResponse& response) = 0;
};

/**
 * @brief Security service; started first, stopped after every other component
 */
class ISecurity {
public:
    virtual ~ISecurity() = default;

    virtual VoidResult start() = 0;
    virtual VoidResult stop() = 0;

    /**
     * @brief Startup integrity verification; failure aborts startup
     */
    virtual bool verify_system_integrity() = 0;
};

} // namespace cabin_voice
