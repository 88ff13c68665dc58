#include "sim/simulated_vehicle.h"
#include "logger.h"
#include <algorithm>
#include <set>

namespace cabin_voice {
namespace sim {

namespace {

VoidResult check_keys(const std::string& command, const Json& parameters, const std::set<std::string>& allowed) {
    if (!parameters.is_object()) {
        return make_validation_error(command + " parameters must be an object");
    }
    if (parameters.empty()) {
        return make_validation_error(command + " needs at least one parameter");
    }
    for (const auto& item : parameters.items()) {
        if (allowed.count(item.key()) == 0) {
            return make_validation_error("unsupported " + command + " parameter: " + item.key());
        }
    }
    return VoidResult();
}

VoidResult check_range(const Json& parameters, const std::string& key, double lo, double hi) {
    if (!parameters.contains(key)) return VoidResult();
    const Json& value = parameters[key];
    if (!value.is_number()) {
        return make_validation_error(key + " must be a number");
    }
    double v = value.get<double>();
    if (v < lo || v > hi) {
        return make_validation_error(key + " out of range");
    }
    return VoidResult();
}

VoidResult check_string(const Json& parameters, const std::string& key) {
    if (parameters.contains(key) && !parameters[key].is_string()) {
        return make_validation_error(key + " must be a string");
    }
    return VoidResult();
}

VoidResult check_bool(const Json& parameters, const std::string& key) {
    if (parameters.contains(key) && !parameters[key].is_boolean()) {
        return make_validation_error(key + " must be a boolean");
    }
    return VoidResult();
}

} // namespace

SimulatedVehicle::SimulatedVehicle(const SimulationConfig& config)
    : config_(config), running_(false), state_(default_state(config.initial_fuel_level)),
      ui_state_(ui_state::IDLE), low_fuel_raised_(false) {}

SimulatedVehicle::~SimulatedVehicle() {
    VoidResult stopped = stop();
    (void)stopped;
}

Json SimulatedVehicle::default_state(double fuel_level) {
    return Json{
        {"climate_control", {
            {"temperature", 22.0},
            {"fan_speed", 2},
            {"mode", "auto"},
            {"recirculation", false}
        }},
        {"media", {
            {"source", "radio"},
            {"volume", 50},
            {"muted", false},
            {"playing", false},
            {"current_track", nullptr}
        }},
        {"navigation", {
            {"destination", nullptr},
            {"route", nullptr},
            {"eta", nullptr},
            {"distance", nullptr}
        }},
        {"phone", {
            {"connected", false},
            {"active_call", nullptr}
        }},
        {"vehicle", {
            {"speed", 0},
            {"fuel_level", fuel_level},
            {"battery_level", 100},
            {"doors_locked", true},
            {"lights", "auto"}
        }},
        {"settings", Json::object()}
    };
}

std::string SimulatedVehicle::name() const {
    return component::VEHICLE;
}

VoidResult SimulatedVehicle::start() {
    if (running_) {
        return VoidResult();
    }
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_ = std::make_shared<EventChannel>();
    }
    running_ = true;
    event_thread_ = std::thread(&SimulatedVehicle::event_loop, this, events_);
    Logger::info("[Vehicle] Simulated vehicle started");
    return VoidResult();
}

VoidResult SimulatedVehicle::stop() {
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        if (events_) {
            events_->close();
        }
    }
    if (event_thread_.joinable()) {
        event_thread_.join();
    }
    return VoidResult();
}

VoidResult SimulatedVehicle::restart() {
    VoidResult stopped = stop();
    if (!stopped) {
        return stopped;
    }
    return start();
}

bool SimulatedVehicle::health_check() {
    return running_;
}

VoidResult SimulatedVehicle::require_running() const {
    if (!running_) {
        return make_provider_error("vehicle link is not running");
    }
    return VoidResult();
}

Result<Json> SimulatedVehicle::get_current_state() {
    VoidResult ready = require_running();
    if (!ready) {
        return ready.error();
    }

    bool raise_low_fuel = false;
    double fuel = 0.0;
    Json snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Json& vehicle = state_["vehicle"];
        fuel = vehicle["fuel_level"].get<double>();
        if (config_.fuel_drain_per_tick > 0.0 && fuel > 0.0) {
            fuel = std::max(0.0, fuel - config_.fuel_drain_per_tick);
            vehicle["fuel_level"] = fuel;
        }
        if (fuel < config_.low_fuel_threshold && !low_fuel_raised_) {
            low_fuel_raised_ = true;
            raise_low_fuel = true;
        } else if (fuel >= config_.low_fuel_threshold) {
            low_fuel_raised_ = false;
        }
        snapshot = state_;
    }

    if (raise_low_fuel) {
        raise_event("low_fuel", Json{{"fuel_level", fuel}});
    }
    return snapshot;
}

VoidResult SimulatedVehicle::set_ui_state(const std::string& state) {
    VoidResult ready = require_running();
    if (!ready) return ready;

    static const std::set<std::string> known = {
        ui_state::IDLE, ui_state::LISTENING, ui_state::PROCESSING, ui_state::SPEAKING
    };
    if (known.count(state) == 0) {
        return make_validation_error("unknown UI state: " + state);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ui_state_ = state;
    Logger::debug("[Vehicle] UI state: " + state);
    return VoidResult();
}

VoidResult SimulatedVehicle::update_ui(const Json& payload) {
    VoidResult ready = require_running();
    if (!ready) return ready;

    std::lock_guard<std::mutex> lock(mutex_);
    last_ui_update_ = payload;
    Logger::debug("[Vehicle] UI update: " + payload.dump());
    return VoidResult();
}

void SimulatedVehicle::subscribe_to_events(VehicleEventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

VoidResult SimulatedVehicle::set_climate(const Json& parameters) {
    VoidResult ready = require_running();
    if (!ready) return ready;

    VoidResult valid = check_keys("climate_control", parameters,
                                  {"temperature", "fan_speed", "mode", "recirculation", "zone"});
    if (valid) valid = check_range(parameters, "temperature", 16.0, 30.0);
    if (valid) valid = check_range(parameters, "fan_speed", 0, 7);
    if (valid) valid = check_string(parameters, "mode");
    if (valid) valid = check_bool(parameters, "recirculation");
    if (!valid) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_["climate_control"].update(parameters);
    return VoidResult();
}

VoidResult SimulatedVehicle::set_navigation(const Json& parameters) {
    VoidResult ready = require_running();
    if (!ready) return ready;

    VoidResult keys = check_keys("navigation", parameters, {"destination", "route_preferences"});
    if (!keys) return keys;
    if (!parameters.contains("destination")) {
        return make_validation_error("navigation needs a destination");
    }
    const Json& destination = parameters["destination"];
    if (!destination.is_null() && !(destination.is_string() && !destination.get<std::string>().empty())) {
        return make_validation_error("destination must be a non-empty string or null");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Json& navigation = state_["navigation"];
    navigation["destination"] = destination;
    navigation["route"] = destination.is_null() ? Json(nullptr) : Json("fastest");
    if (parameters.contains("route_preferences")) {
        navigation["route"] = parameters["route_preferences"];
    }
    return VoidResult();
}

VoidResult SimulatedVehicle::control_media(const Json& parameters) {
    VoidResult ready = require_running();
    if (!ready) return ready;

    VoidResult valid = check_keys("media", parameters, {"action", "source", "volume", "content"});
    if (valid) valid = check_range(parameters, "volume", 0, 100);
    if (valid) valid = check_string(parameters, "source");
    if (!valid) {
        return valid;
    }

    static const std::set<std::string> actions = {
        "play", "pause", "stop", "next", "previous", "mute", "unmute", "volume_up", "volume_down"
    };
    std::string action;
    if (parameters.contains("action")) {
        if (!parameters["action"].is_string() || actions.count(parameters["action"].get<std::string>()) == 0) {
            return make_validation_error("unsupported media action");
        }
        action = parameters["action"].get<std::string>();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Json& media = state_["media"];
    if (action == "play") media["playing"] = true;
    else if (action == "pause" || action == "stop") media["playing"] = false;
    else if (action == "mute") media["muted"] = true;
    else if (action == "unmute") media["muted"] = false;
    else if (action == "volume_up") media["volume"] = std::min(100, media["volume"].get<int>() + 10);
    else if (action == "volume_down") media["volume"] = std::max(0, media["volume"].get<int>() - 10);
    if (parameters.contains("source")) media["source"] = parameters["source"];
    if (parameters.contains("volume")) media["volume"] = parameters["volume"].get<int>();
    if (parameters.contains("content")) media["current_track"] = parameters["content"];
    return VoidResult();
}

VoidResult SimulatedVehicle::update_settings(const Json& parameters) {
    VoidResult ready = require_running();
    if (!ready) return ready;

    if (!parameters.is_object() || parameters.empty()) {
        return make_validation_error("vehicle_settings needs at least one setting");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Json& vehicle = state_["vehicle"];
    for (const auto& item : parameters.items()) {
        if (item.key() == "lights" || item.key() == "doors_locked") {
            vehicle[item.key()] = item.value();
        }
        state_["settings"][item.key()] = item.value();
    }
    return VoidResult();
}

void SimulatedVehicle::raise_event(const std::string& event_type, const Json& payload) {
    std::shared_ptr<EventChannel> events;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events = events_;
    }
    if (!events || !events->push({event_type, payload})) {
        Logger::warn("[Vehicle] Event dropped, vehicle not running: " + event_type);
        return;
    }
    LOG_EVENT("Vehicle raised " + event_type);
}

std::string SimulatedVehicle::ui_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ui_state_;
}

void SimulatedVehicle::event_loop(std::shared_ptr<EventChannel> events) {
    Logger::set_thread_name("vehicle-events");
    while (auto event = events->pop()) {
        VehicleEventHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(event->first, event->second);
        }
    }
}

} // namespace sim
} // namespace cabin_voice
