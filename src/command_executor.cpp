#include "command_executor.h"
#include "logger.h"

namespace cabin_voice {

CommandExecutor::CommandExecutor(std::shared_ptr<IVehicleLink> vehicle, ContextStore& context,
                                 TaskExecutor& executor, int call_timeout_ms)
    : vehicle_(std::move(vehicle)), context_(context), executor_(executor),
      call_timeout_ms_(call_timeout_ms) {}

std::string CommandExecutor::state_key(const std::string& type) {
    if (type == command_type::CLIMATE) return "climate_control";
    if (type == command_type::NAVIGATION) return "navigation";
    if (type == command_type::MEDIA) return "media";
    if (type == command_type::SETTINGS) return "settings";
    return "";
}

bool CommandExecutor::enqueue(PendingCommand command) {
    if (!queue_.push(std::move(command))) {
        Logger::warn("[Command] Queue closed, command dropped");
        return false;
    }
    return true;
}

bool CommandExecutor::enqueue_all(const std::vector<PendingCommand>& commands) {
    for (const auto& command : commands) {
        if (!enqueue(command)) {
            return false;
        }
    }
    return true;
}

std::vector<CommandOutcome> CommandExecutor::drain() {
    std::vector<CommandOutcome> outcomes;
    while (auto command = queue_.try_pop()) {
        VoidResult result = execute(*command);
        outcomes.push_back({std::move(*command), result});
    }
    return outcomes;
}

VoidResult CommandExecutor::validate(const PendingCommand& command) {
    if (state_key(command.type).empty()) {
        return make_validation_error("unknown command type: " + command.type);
    }
    if (!command.parameters.is_object()) {
        return make_validation_error(command.type + " parameters must be an object");
    }
    return VoidResult();
}

VoidResult CommandExecutor::execute(const PendingCommand& command) {
    VoidResult valid = validate(command);
    if (!valid) {
        Logger::warn("[Command] Rejected: " + valid.error().message);
        return valid;
    }
    const std::string key = state_key(command.type);
    if (!vehicle_) {
        return make_error(ErrorType::InvalidState, "no vehicle link");
    }

    std::shared_ptr<IVehicleLink> vehicle = vehicle_;
    const Json parameters = command.parameters;
    const std::string type = command.type;
    VoidResult result = executor_.run_with_timeout<void>([vehicle, parameters, type]() -> VoidResult {
        if (type == command_type::CLIMATE) return vehicle->set_climate(parameters);
        if (type == command_type::NAVIGATION) return vehicle->set_navigation(parameters);
        if (type == command_type::MEDIA) return vehicle->control_media(parameters);
        return vehicle->update_settings(parameters);
    }, call_timeout_ms_, "vehicle." + command.type);

    if (!result) {
        Logger::warn("[Command] " + command.type + " failed: " + result.error().message);
        return result;
    }

    LOG_CMD("Executed " + command.type + " " + command.parameters.dump());

    VoidResult mirrored = context_.update(Json{{"vehicle_state", {{key, command.parameters}}}});
    if (!mirrored) {
        // The vehicle accepted the command; only the context copy is stale
        Logger::warn("[Command] Could not mirror " + command.type + " into context: " +
                     mirrored.error().message);
    }
    return VoidResult();
}

} // namespace cabin_voice
