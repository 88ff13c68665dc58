#pragma once

/**
 * @file simulated_vehicle.h
 * @brief In-memory vehicle link
 *
 * Features:
 * - Default state: climate_control, media, navigation, phone, vehicle, settings
 * - Parameter validation for each command executor
 * - Fuel drain per state poll, raising low_fuel once below the threshold
 * - Events delivered on a dedicated thread, never on the caller's
 */

#include "config.h"
#include "core/channel.h"
#include "providers/vehicle.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace cabin_voice {
namespace sim {

class SimulatedVehicle : public IVehicleLink {
public:
    explicit SimulatedVehicle(const SimulationConfig& config);
    ~SimulatedVehicle() override;

    std::string name() const override;
    VoidResult start() override;
    VoidResult stop() override;
    VoidResult restart() override;
    bool health_check() override;

    Result<Json> get_current_state() override;
    VoidResult set_ui_state(const std::string& state) override;
    VoidResult update_ui(const Json& payload) override;
    void subscribe_to_events(VehicleEventHandler handler) override;

    VoidResult set_climate(const Json& parameters) override;
    VoidResult set_navigation(const Json& parameters) override;
    VoidResult control_media(const Json& parameters) override;
    VoidResult update_settings(const Json& parameters) override;

    /**
     * @brief Queue a vehicle event for delivery to the subscriber
     */
    void raise_event(const std::string& event_type, const Json& payload);

    /// Last UI state pushed by the orchestrator
    std::string ui_state() const;

    /// Default state of a freshly started vehicle
    static Json default_state(double fuel_level);

private:
    using EventChannel = Channel<std::pair<std::string, Json>>;

    void event_loop(std::shared_ptr<EventChannel> events);
    VoidResult require_running() const;

    SimulationConfig config_;
    std::atomic<bool> running_;

    mutable std::mutex mutex_;
    Json state_;
    std::string ui_state_;
    Json last_ui_update_;
    bool low_fuel_raised_;

    std::mutex handler_mutex_;
    VehicleEventHandler handler_;

    std::mutex events_mutex_;
    std::shared_ptr<EventChannel> events_;
    std::thread event_thread_;
};

} // namespace sim
} // namespace cabin_voice
