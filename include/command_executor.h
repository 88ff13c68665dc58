#pragma once

#include "core/channel.h"
#include "core/types.h"
#include "context_store.h"
#include "providers/vehicle.h"
#include "task_executor.h"
#include <memory>
#include <string>
#include <vector>

namespace cabin_voice {

/// Outcome of executing one queued command
struct CommandOutcome {
    PendingCommand command;
    VoidResult result;
};

/**
 * @brief Pending-command queue and its single consumer
 *
 * Any thread may enqueue; drain() is called from the transition handler only
 * and executes commands in FIFO order, each at most once. A successful command
 * is mirrored into vehicle_state of the context store.
 */
class CommandExecutor {
public:
    CommandExecutor(std::shared_ptr<IVehicleLink> vehicle, ContextStore& context,
                    TaskExecutor& executor, int call_timeout_ms);

    /**
     * @brief Queue a command
     * @return false once the queue has been closed
     */
    bool enqueue(PendingCommand command);

    /// Queue every command of a response in order
    bool enqueue_all(const std::vector<PendingCommand>& commands);

    /**
     * @brief Execute everything currently queued, oldest first
     */
    std::vector<CommandOutcome> drain();

    /**
     * @brief Validate and execute one command against the vehicle link
     * @return ValidationError for an unknown type or non-object parameters
     */
    VoidResult execute(const PendingCommand& command);

    /**
     * @brief Local checks only: known type, object parameters
     */
    static VoidResult validate(const PendingCommand& command);

    size_t pending() const { return queue_.size(); }

    /// Stop accepting commands (shutdown)
    void close() { queue_.close(); }

    /// vehicle_state key a command type is mirrored into (empty if unknown)
    static std::string state_key(const std::string& type);

private:
    std::shared_ptr<IVehicleLink> vehicle_;
    ContextStore& context_;
    TaskExecutor& executor_;
    int call_timeout_ms_;
    Channel<PendingCommand> queue_;
};

} // namespace cabin_voice
