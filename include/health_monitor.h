#pragma once

#include "config.h"
#include "task_executor.h"
#include "core/types.h"
#include "providers/component.h"
#include <map>
#include <string>
#include <vector>
#include <mutex>

namespace cabin_voice {

/**
 * @brief Component health levels
 */
enum class HealthStatus {
    Healthy,
    Degraded,   ///< Probe answered healthy, but slower than health.degraded_after_ms
    Failed
};

const char* health_status_name(HealthStatus status);

/**
 * @brief Health record for one component
 */
struct HealthRecord {
    HealthStatus status = HealthStatus::Failed;
    int64_t last_checked_ms = 0;    ///< Wall-clock ms of the probe
    int64_t probe_ms = 0;           ///< Probe latency
    std::string detail;             ///< Failure reason (timeout, probe returned false, ...)
};

/**
 * @brief Health of every registered component
 *
 * Produced by HealthMonitor as a proposal; committed by the orchestrator.
 */
struct ComponentHealth {
    std::map<std::string, HealthRecord> components;

    /// True iff every component is Healthy (and at least one is registered)
    bool all_healthy() const;

    /// Names of components that are not Healthy
    std::vector<std::string> unhealthy_components() const;

    /// Names of components that are Failed (Degraded excluded)
    std::vector<std::string> failed_components() const;

    /// Mark one component (e.g. after a provider timeout)
    void mark(const std::string& name, HealthStatus status, const std::string& detail);

    Json to_json() const;
};

/**
 * @brief Fan-out/fan-in health prober
 *
 * Every probe is submitted to the executor at once and collected against a
 * single deadline, so one check cycle costs at most the probe timeout.
 */
class HealthMonitor {
public:
    HealthMonitor(const HealthConfig& config, TaskExecutor& executor);

    /**
     * @brief Add a component to the probe set (replaces one with the same name)
     */
    void register_component(ComponentPtr component);

    /// Registered components in registration order
    std::vector<ComponentPtr> components() const;

    ComponentPtr find(const std::string& name) const;

    /**
     * @brief Probe every registered component concurrently
     */
    ComponentHealth check_all();

    /**
     * @brief Probe a subset of components concurrently
     */
    ComponentHealth check(const std::vector<ComponentPtr>& targets);

    /**
     * @brief Result of the most recent check_all()
     */
    ComponentHealth last_result() const;

    /**
     * @brief True iff every component was healthy in the most recent check_all()
     */
    bool is_system_healthy() const;

private:
    HealthConfig config_;
    TaskExecutor& executor_;

    mutable std::mutex mutex_;
    std::vector<ComponentPtr> components_;
    ComponentHealth last_;
};

} // namespace cabin_voice
