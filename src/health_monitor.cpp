#include "health_monitor.h"
#include "logger.h"
#include <atomic>
#include <memory>
#include <sstream>

namespace cabin_voice {

const char* health_status_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:  return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Failed:   return "failed";
    }
    return "failed";
}

// =============================================================================
// ComponentHealth
// =============================================================================

bool ComponentHealth::all_healthy() const {
    if (components.empty()) {
        return false;
    }
    for (const auto& [name, record] : components) {
        if (record.status != HealthStatus::Healthy) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> ComponentHealth::unhealthy_components() const {
    std::vector<std::string> names;
    for (const auto& [name, record] : components) {
        if (record.status != HealthStatus::Healthy) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> ComponentHealth::failed_components() const {
    std::vector<std::string> names;
    for (const auto& [name, record] : components) {
        if (record.status == HealthStatus::Failed) {
            names.push_back(name);
        }
    }
    return names;
}

void ComponentHealth::mark(const std::string& name, HealthStatus status, const std::string& detail) {
    HealthRecord& record = components[name];
    record.status = status;
    record.detail = detail;
    record.last_checked_ms = wall_ms();
}

Json ComponentHealth::to_json() const {
    Json j = Json::object();
    for (const auto& [name, record] : components) {
        j[name] = {
            {"status", health_status_name(record.status)},
            {"last_checked", record.last_checked_ms},
            {"probe_ms", record.probe_ms},
            {"detail", record.detail}
        };
    }
    return j;
}

// =============================================================================
// HealthMonitor
// =============================================================================

HealthMonitor::HealthMonitor(const HealthConfig& config, TaskExecutor& executor)
    : config_(config), executor_(executor) {}

void HealthMonitor::register_component(ComponentPtr component) {
    if (!component) {
        Logger::error("[Health] Attempted to register null component");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : components_) {
        if (existing->name() == component->name()) {
            existing = std::move(component);
            return;
        }
    }
    components_.push_back(std::move(component));
}

std::vector<ComponentPtr> HealthMonitor::components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return components_;
}

ComponentPtr HealthMonitor::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : components_) {
        if (c->name() == name) {
            return c;
        }
    }
    return nullptr;
}

ComponentHealth HealthMonitor::check_all() {
    ComponentHealth result = check(components());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = result;
    }

    std::ostringstream oss;
    oss << "Health check: " << (result.all_healthy() ? "all healthy" : "unhealthy");
    for (const auto& name : result.unhealthy_components()) {
        const auto& record = result.components.at(name);
        oss << " [" << name << "=" << health_status_name(record.status);
        if (!record.detail.empty()) {
            oss << ": " << record.detail;
        }
        oss << "]";
    }
    LOG_HEALTH(oss.str());
    return result;
}

ComponentHealth HealthMonitor::check(const std::vector<ComponentPtr>& targets) {
    struct Probe {
        std::string name;
        TimePoint started;
        std::shared_ptr<std::atomic<int64_t>> latency_ms;  ///< Set by the probe itself; -1 until it returns
        TaskHandle<bool> handle;
    };

    // Fan out: all probes start now and share one deadline
    std::vector<Probe> probes;
    probes.reserve(targets.size());
    const TimePoint started = Clock::now();
    const TimePoint deadline = started + std::chrono::milliseconds(config_.probe_timeout_ms);

    for (const auto& component : targets) {
        ComponentPtr target = component;
        Probe probe;
        probe.name = target->name();
        probe.started = Clock::now();
        probe.latency_ms = std::make_shared<std::atomic<int64_t>>(-1);
        auto latency = probe.latency_ms;
        probe.handle = executor_.spawn<bool>([target, latency]() -> Result<bool> {
            TimePoint begin = Clock::now();
            bool healthy = target->health_check();
            latency->store(ms_since(begin));
            return healthy;
        });
        probes.push_back(std::move(probe));
    }

    // Fan in
    ComponentHealth health;
    for (auto& probe : probes) {
        Result<bool> outcome = probe.handle.wait_until(deadline, probe.name + " health probe");

        HealthRecord record;
        record.last_checked_ms = wall_ms();
        const int64_t latency = probe.latency_ms->load();
        record.probe_ms = latency >= 0 ? latency : ms_since(probe.started);

        if (outcome.is_error()) {
            record.status = HealthStatus::Failed;
            record.detail = outcome.error().message;
        } else if (!outcome.value()) {
            record.status = HealthStatus::Failed;
            record.detail = "probe reported unhealthy";
        } else if (config_.degraded_after_ms > 0 && record.probe_ms > config_.degraded_after_ms) {
            record.status = HealthStatus::Degraded;
            record.detail = "slow probe (" + std::to_string(record.probe_ms) + " ms)";
        } else {
            record.status = HealthStatus::Healthy;
        }
        health.components[probe.name] = record;
    }

    return health;
}

ComponentHealth HealthMonitor::last_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

bool HealthMonitor::is_system_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_.all_healthy();
}

} // namespace cabin_voice
