#pragma once

#include "config.h"
#include "health_monitor.h"
#include "task_executor.h"
#include <map>
#include <string>
#include <vector>

namespace cabin_voice {

/**
 * @brief Outcome of recovering a single component
 */
struct ComponentRecovery {
    int attempts = 0;
    bool recovered = false;
    std::string last_error;     ///< Restart error or failed re-probe reason
};

/**
 * @brief Outcome of one recovery cycle
 */
struct RecoveryResult {
    bool fully_recovered = false;
    std::map<std::string, ComponentRecovery> components;

    /// Components still failed after their restart budget
    std::vector<std::string> terminally_failed() const;

    Json to_json() const;
};

/**
 * @brief Bounded restart-and-reprobe for failed components
 *
 * Restarts are attempted in rounds: each round restarts every still-failed
 * component concurrently (each bounded by recovery.restart_timeout_ms), then
 * re-probes the restarted ones through the HealthMonitor. A component that is
 * still failed after recovery.max_restart_attempts rounds is terminally failed
 * for this cycle; deciding what that means is up to the caller.
 */
class RecoveryManager {
public:
    RecoveryManager(const RecoveryConfig& config, HealthMonitor& monitor, TaskExecutor& executor);

    /**
     * @brief Recover the named components
     * @param failed_components Names as reported by ComponentHealth
     */
    RecoveryResult recover(const std::vector<std::string>& failed_components);

private:
    RecoveryConfig config_;
    HealthMonitor& monitor_;
    TaskExecutor& executor_;
};

} // namespace cabin_voice
