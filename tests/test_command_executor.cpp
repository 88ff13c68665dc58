/**
 * Pending-command queue and execution.
 * Asserts:
 * - Commands execute in FIFO order, each exactly once, even under concurrent enqueue.
 * - Unknown types and non-object parameters are rejected before reaching the vehicle.
 * - Successful commands are mirrored into vehicle_state; failed ones are not.
 */

#include "command_executor.h"
#include "context_store.h"
#include "fakes.h"
#include "logger.h"
#include "task_executor.h"
#include <iostream>
#include <map>
#include <memory>
#include <thread>
#include <vector>

using namespace cabin_voice;
using namespace cabin_voice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static PendingCommand make_command(const char* type, Json parameters) {
    PendingCommand c;
    c.type = type;
    c.parameters = std::move(parameters);
    return c;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    ContextConfig context_config;

    // --- FIFO execution and context mirroring ---
    {
        auto vehicle = std::make_shared<FakeVehicle>();
        ContextStore context(context_config);
        TaskExecutor executor(2);
        CommandExecutor commands(vehicle, context, executor, 500);

        ASSERT(commands.enqueue(make_command(command_type::CLIMATE, Json{{"temperature", 22}})));
        ASSERT(commands.enqueue(make_command(command_type::NAVIGATION, Json{{"destination", "airport"}})));
        ASSERT(commands.enqueue(make_command(command_type::MEDIA, Json{{"action", "play"}})));
        ASSERT(commands.enqueue(make_command(command_type::SETTINGS, Json{{"lights", "on"}})));
        ASSERT(commands.pending() == 4);

        std::vector<CommandOutcome> outcomes = commands.drain();
        ASSERT(outcomes.size() == 4);
        ASSERT(commands.pending() == 0);
        for (const auto& o : outcomes) ASSERT(o.result.is_ok());

        std::vector<PendingCommand> executed = vehicle->executed();
        ASSERT(executed.size() == 4);
        ASSERT(executed[0].type == command_type::CLIMATE);
        ASSERT(executed[1].type == command_type::NAVIGATION);
        ASSERT(executed[2].type == command_type::MEDIA);
        ASSERT(executed[3].type == command_type::SETTINGS);

        Json state = context.read().vehicle_state;
        ASSERT(state["climate_control"]["temperature"] == 22);
        ASSERT(state["navigation"]["destination"] == "airport");
        ASSERT(state["media"]["action"] == "play");
        ASSERT(state["settings"]["lights"] == "on");

        // Drained commands never run twice
        ASSERT(commands.drain().empty());
        ASSERT(vehicle->executed().size() == 4);
    }

    // --- Concurrent enqueue: every command exactly once, per-producer order kept ---
    {
        auto vehicle = std::make_shared<FakeVehicle>();
        ContextStore context(context_config);
        TaskExecutor executor(2);
        CommandExecutor commands(vehicle, context, executor, 500);

        const int producers = 4;
        const int per_producer = 50;
        std::vector<std::thread> threads;
        for (int p = 0; p < producers; ++p) {
            threads.emplace_back([&commands, p]() {
                for (int i = 0; i < per_producer; ++i) {
                    commands.enqueue(make_command(command_type::MEDIA,
                                                  Json{{"producer", p}, {"seq", i}}));
                }
            });
        }
        for (auto& t : threads) t.join();

        std::vector<CommandOutcome> outcomes = commands.drain();
        ASSERT(outcomes.size() == static_cast<size_t>(producers * per_producer));

        std::map<int, int> next_seq;
        bool ordered = true;
        for (const auto& c : vehicle->executed()) {
            int p = c.parameters["producer"].get<int>();
            int seq = c.parameters["seq"].get<int>();
            if (seq != next_seq[p]) ordered = false;
            next_seq[p] = seq + 1;
        }
        ASSERT(ordered);
        ASSERT(vehicle->executed().size() == static_cast<size_t>(producers * per_producer));
    }

    // --- Validation ---
    {
        ASSERT(CommandExecutor::validate(make_command(command_type::CLIMATE, Json::object())).is_ok());
        VoidResult unknown = CommandExecutor::validate(make_command("teleport", Json::object()));
        ASSERT(unknown.is_error());
        ASSERT(unknown.error().type == ErrorType::ValidationError);
        VoidResult not_object = CommandExecutor::validate(make_command(command_type::MEDIA, Json::array()));
        ASSERT(not_object.is_error());
        ASSERT(not_object.error().type == ErrorType::ValidationError);

        ASSERT(CommandExecutor::state_key(command_type::SETTINGS) == "settings");
        ASSERT(CommandExecutor::state_key("teleport").empty());

        auto vehicle = std::make_shared<FakeVehicle>();
        ContextStore context(context_config);
        TaskExecutor executor(1);
        CommandExecutor commands(vehicle, context, executor, 500);
        ASSERT(commands.execute(make_command("teleport", Json::object())).is_error());
        ASSERT(vehicle->executed().empty());
    }

    // --- Vehicle failure is reported and not mirrored ---
    {
        auto vehicle = std::make_shared<FakeVehicle>();
        vehicle->fail_commands = true;
        ContextStore context(context_config);
        TaskExecutor executor(1);
        CommandExecutor commands(vehicle, context, executor, 500);

        commands.enqueue(make_command(command_type::CLIMATE, Json{{"temperature", 19}}));
        std::vector<CommandOutcome> outcomes = commands.drain();
        ASSERT(outcomes.size() == 1);
        ASSERT(outcomes[0].result.is_error());
        ASSERT(outcomes[0].result.error().type == ErrorType::ProviderError);
        ASSERT(!context.read().vehicle_state.contains("climate_control"));
    }

    // --- Closed queue refuses new commands ---
    {
        auto vehicle = std::make_shared<FakeVehicle>();
        ContextStore context(context_config);
        TaskExecutor executor(1);
        CommandExecutor commands(vehicle, context, executor, 500);
        commands.close();
        ASSERT(!commands.enqueue(make_command(command_type::MEDIA, Json{{"action", "pause"}})));
        ASSERT(!commands.enqueue_all({make_command(command_type::MEDIA, Json::object())}));
        ASSERT(commands.drain().empty());
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All command executor tests passed.\n";
    return 0;
}
