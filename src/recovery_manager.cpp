#include "recovery_manager.h"
#include "logger.h"
#include <sstream>

namespace cabin_voice {

std::vector<std::string> RecoveryResult::terminally_failed() const {
    std::vector<std::string> names;
    for (const auto& [name, outcome] : components) {
        if (!outcome.recovered) {
            names.push_back(name);
        }
    }
    return names;
}

Json RecoveryResult::to_json() const {
    Json per_component = Json::object();
    for (const auto& [name, outcome] : components) {
        per_component[name] = {
            {"attempts", outcome.attempts},
            {"recovered", outcome.recovered},
            {"last_error", outcome.last_error}
        };
    }
    return Json{{"fully_recovered", fully_recovered}, {"components", per_component}};
}

RecoveryManager::RecoveryManager(const RecoveryConfig& config, HealthMonitor& monitor, TaskExecutor& executor)
    : config_(config), monitor_(monitor), executor_(executor) {}

RecoveryResult RecoveryManager::recover(const std::vector<std::string>& failed_components) {
    RecoveryResult result;
    std::vector<ComponentPtr> pending;

    for (const auto& name : failed_components) {
        ComponentRecovery& outcome = result.components[name];
        ComponentPtr component = monitor_.find(name);
        if (!component) {
            outcome.last_error = "unknown component";
            Logger::error("[Recovery] Cannot recover unknown component: " + name);
            continue;
        }
        pending.push_back(component);
    }

    LOG_RECOVERY("Attempting recovery for " + std::to_string(pending.size()) + " component(s), budget " +
                 std::to_string(config_.max_restart_attempts) + " restart(s) each");

    for (int attempt = 1; attempt <= config_.max_restart_attempts && !pending.empty(); ++attempt) {
        // Restart every pending component concurrently
        struct Restart {
            ComponentPtr component;
            TaskHandle<void> handle;
        };
        std::vector<Restart> restarts;
        restarts.reserve(pending.size());
        for (const auto& component : pending) {
            ComponentPtr target = component;
            restarts.push_back({target, executor_.spawn<void>([target]() { return target->restart(); })});
        }

        const TimePoint deadline = Clock::now() + std::chrono::milliseconds(config_.restart_timeout_ms);
        std::vector<ComponentPtr> restarted;
        for (auto& r : restarts) {
            const std::string name = r.component->name();
            ComponentRecovery& outcome = result.components[name];
            outcome.attempts = attempt;

            VoidResult restart_result = r.handle.wait_until(deadline, name + " restart");
            if (restart_result) {
                restarted.push_back(r.component);
            } else {
                outcome.last_error = restart_result.error().message;
                Logger::warn("[Recovery] Restart " + std::to_string(attempt) + " of " + name +
                             " failed: " + outcome.last_error);
            }
        }

        // Re-probe the restarted ones
        ComponentHealth reprobe = monitor_.check(restarted);
        std::vector<ComponentPtr> still_failed;
        for (const auto& component : pending) {
            const std::string name = component->name();
            ComponentRecovery& outcome = result.components[name];
            auto it = reprobe.components.find(name);
            if (it != reprobe.components.end() && it->second.status == HealthStatus::Healthy) {
                outcome.recovered = true;
                outcome.last_error.clear();
                LOG_RECOVERY("Successfully recovered " + name + " after " + std::to_string(attempt) + " restart(s)");
            } else {
                if (it != reprobe.components.end()) {
                    outcome.last_error = it->second.detail.empty()
                        ? std::string("still ") + health_status_name(it->second.status)
                        : it->second.detail;
                }
                still_failed.push_back(component);
            }
        }
        pending.swap(still_failed);
    }

    result.fully_recovered = true;
    for (const auto& [name, outcome] : result.components) {
        if (!outcome.recovered) {
            result.fully_recovered = false;
            Logger::error("[Recovery] " + name + " terminally failed for this cycle: " +
                          (outcome.last_error.empty() ? "restart budget exhausted" : outcome.last_error));
        }
    }
    return result;
}

} // namespace cabin_voice
