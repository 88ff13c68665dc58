#include "sim/template_dialogue.h"
#include "logger.h"
#include <cmath>
#include <sstream>

namespace cabin_voice {
namespace sim {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    if (std::floor(value) == value) {
        oss << static_cast<long long>(value);
    } else {
        oss.precision(1);
        oss << std::fixed << value;
    }
    return oss.str();
}

/// vehicle_state.vehicle.<key> from a context snapshot, or null
Json vehicle_field(const Json& context, const std::string& key) {
    const Json::json_pointer path("/vehicle_state/vehicle/" + key);
    if (context.contains(path)) {
        return context.at(path);
    }
    return nullptr;
}

PendingCommand command(const char* type, Json parameters) {
    PendingCommand c;
    c.type = type;
    c.parameters = std::move(parameters);
    return c;
}

} // namespace

TemplateDialogue::TemplateDialogue() : running_(false) {}

std::string TemplateDialogue::name() const {
    return component::DIALOGUE;
}

VoidResult TemplateDialogue::start() {
    running_ = true;
    return VoidResult();
}

VoidResult TemplateDialogue::stop() {
    running_ = false;
    return VoidResult();
}

VoidResult TemplateDialogue::restart() {
    running_ = true;
    return VoidResult();
}

bool TemplateDialogue::health_check() {
    return running_;
}

Result<DialogueResponse> TemplateDialogue::process_turn(const NluResult& nlu, const Json& context) {
    if (!running_) {
        return make_provider_error("dialogue is not running");
    }

    DialogueResponse response;
    const Json& e = nlu.entities;
    const std::string& intent = nlu.intent;

    if (intent == "greeting") {
        response.speech_response = "Hello! How can I help you today?";
    } else if (intent == "farewell") {
        response.speech_response = "Goodbye! Drive safely.";
        response.end_conversation = true;
    } else if (intent == "help") {
        response.speech_response = "You can ask me to change the temperature, navigate somewhere, "
                                   "control the music, or check the vehicle status.";
    } else if (intent == "climate_control") {
        if (e.contains("temperature") && e["temperature"].is_number()) {
            double temperature = e["temperature"].get<double>();
            response.speech_response = "Setting the temperature to " + format_number(temperature) + " degrees.";
            response.commands.push_back(command(command_type::CLIMATE, Json{{"temperature", temperature}}));
            response.ui_update = Json{{"screen", "climate"}, {"temperature", temperature}};
        } else if (e.contains("fan_speed") && e["fan_speed"].is_number()) {
            int fan_speed = e["fan_speed"].get<int>();
            response.speech_response = "Setting the fan to level " + std::to_string(fan_speed) + ".";
            response.commands.push_back(command(command_type::CLIMATE, Json{{"fan_speed", fan_speed}}));
        } else if (e.contains("adjust")) {
            double base = 22.0;
            const Json::json_pointer temperature_path("/vehicle_state/climate_control/temperature");
            if (context.contains(temperature_path) && context.at(temperature_path).is_number()) {
                base = context.at(temperature_path).get<double>();
            }
            double target = e["adjust"] == "warmer" ? base + 2.0 : base - 2.0;
            response.speech_response = "Making it " + e["adjust"].get<std::string>() + ". Setting " +
                                       format_number(target) + " degrees.";
            response.commands.push_back(command(command_type::CLIMATE, Json{{"temperature", target}}));
        } else {
            response.speech_response = "What temperature would you like?";
        }
    } else if (intent == "navigation") {
        if (e.contains("destination") && e["destination"].is_string()) {
            std::string destination = e["destination"].get<std::string>();
            response.speech_response = "Starting navigation to " + destination + ".";
            response.commands.push_back(command(command_type::NAVIGATION, Json{{"destination", destination}}));
            response.ui_update = Json{{"screen", "navigation"}, {"destination", destination}};
        } else {
            response.speech_response = "Where would you like to go?";
        }
    } else if (intent == "media_control") {
        Json parameters = Json::object();
        for (const char* key : {"action", "volume", "source"}) {
            if (e.contains(key)) parameters[key] = e[key];
        }
        if (parameters.empty()) {
            parameters["action"] = "play";
        }
        if (parameters.contains("volume")) {
            response.speech_response = "Setting the volume to " + parameters["volume"].dump() + ".";
        } else if (parameters.contains("action")) {
            std::string action = parameters["action"].get<std::string>();
            for (auto& c : action) if (c == '_') c = ' ';
            response.speech_response = "OK, " + action + ".";
        } else {
            response.speech_response = "Switching to the radio.";
        }
        response.commands.push_back(command(command_type::MEDIA, parameters));
    } else if (intent == "phone_call") {
        if (e.contains("contact")) {
            response.speech_response = "I can't place calls to " + e["contact"].get<std::string>() + " right now.";
        } else {
            response.speech_response = "Phone calls aren't available right now.";
        }
    } else if (intent == "vehicle_status") {
        Json fuel = vehicle_field(context, "fuel_level");
        Json battery = vehicle_field(context, "battery_level");
        if (fuel.is_number() && battery.is_number()) {
            response.speech_response = "Fuel is at " + format_number(fuel.get<double>()) +
                                       " percent and the battery is at " +
                                       format_number(battery.get<double>()) + " percent.";
        } else {
            response.speech_response = "I don't have the vehicle status right now.";
        }
    } else if (intent == "settings") {
        if (e.contains("setting") && e.contains("value")) {
            std::string setting = e["setting"].get<std::string>();
            response.speech_response = "Done. I've updated " + (setting == "doors_locked" ? std::string("the door locks") : setting) + ".";
            response.commands.push_back(command(command_type::SETTINGS, Json{{setting, e["value"]}}));
        } else {
            response.speech_response = "Which setting would you like to change?";
        }
    } else if (intent == "weather") {
        response.speech_response = "I don't have live weather information right now.";
    } else if (intent == "traffic") {
        response.speech_response = "I don't have live traffic information right now.";
    } else {
        response.speech_response = "I'm not sure how to help with that. Could you rephrase?";
    }

    return response;
}

Result<std::optional<ProactiveNotification>> TemplateDialogue::check_proactive_trigger(
    const std::string& event_type, const Json& event_data, const Json& context) {
    (void)context;
    if (!running_) {
        return make_provider_error("dialogue is not running");
    }

    ProactiveNotification notification;
    notification.event_type = event_type;

    if (event_type == "low_fuel") {
        Json level = event_data.is_object() ? event_data.value("fuel_level", Json(nullptr)) : Json(nullptr);
        notification.speech = level.is_number()
            ? "Fuel is low at " + format_number(level.get<double>()) + " percent. Consider refueling soon."
            : "Fuel is low. Consider refueling soon.";
    } else if (event_type == "low_battery") {
        notification.speech = "The battery is running low. Consider charging soon.";
    } else if (event_type == "door_open") {
        Json door = event_data.is_object() ? event_data.value("door", Json(nullptr)) : Json(nullptr);
        notification.speech = door.is_string() && !door.get<std::string>().empty()
            ? "The " + door.get<std::string>() + " door is open."
            : "A door is open.";
    } else if (event_type == "maintenance_due") {
        notification.speech = "Scheduled maintenance is due. Would you like me to find a service center?";
    } else if (event_type == "tire_pressure") {
        notification.speech = "Tire pressure is low. Please check your tires.";
    } else {
        return std::optional<ProactiveNotification>();
    }

    return std::optional<ProactiveNotification>(notification);
}

} // namespace sim
} // namespace cabin_voice
