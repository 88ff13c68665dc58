/**
 * Health monitor and recovery manager.
 * Asserts:
 * - All healthy => system healthy; any single failure => not.
 * - Hung probes time out as failed and are checked concurrently.
 * - Slow but healthy probes are degraded, not failed.
 * - Recovery restarts within budget and re-probes; exhausted budget is terminal.
 */

#include "fakes.h"
#include "health_monitor.h"
#include "recovery_manager.h"
#include "task_executor.h"
#include "logger.h"
#include <algorithm>
#include <iostream>
#include <memory>

using namespace cabin_voice;
using namespace cabin_voice::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static std::shared_ptr<FakeComponent> running_component(const std::string& name) {
    auto c = std::make_shared<FakeComponent>(name);
    VoidResult started = c->start();
    (void)started;
    return c;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    HealthConfig health_config;
    health_config.probe_timeout_ms = 100;

    // --- TaskExecutor: timeout and exception conversion ---
    {
        TaskExecutor executor(2);
        Result<int> fast = executor.run_with_timeout<int>([]() -> Result<int> { return 7; }, 500, "fast");
        ASSERT(fast.is_ok() && fast.value() == 7);

        Result<int> slow = executor.run_with_timeout<int>([]() -> Result<int> {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return 1;
        }, 20, "slow");
        ASSERT(slow.is_error());
        ASSERT(slow.error().type == ErrorType::Timeout);

        Result<int> thrown = executor.run_with_timeout<int>([]() -> Result<int> {
            throw std::runtime_error("boom");
        }, 500, "thrown");
        ASSERT(thrown.is_error());
        ASSERT(thrown.error().type == ErrorType::ProviderError);

        executor.shutdown();
        Result<int> after = executor.run_with_timeout<int>([]() -> Result<int> { return 1; }, 100, "after");
        ASSERT(after.is_error());
        ASSERT(after.error().type == ErrorType::InvalidState);
    }

    // --- All healthy ---
    {
        TaskExecutor executor(4);
        HealthMonitor monitor(health_config, executor);
        monitor.register_component(running_component("a"));
        monitor.register_component(running_component("b"));
        monitor.register_component(running_component("c"));

        ComponentHealth health = monitor.check_all();
        ASSERT(health.components.size() == 3);
        ASSERT(health.all_healthy());
        ASSERT(monitor.is_system_healthy());
        ASSERT(health.unhealthy_components().empty());
        ASSERT(health.components["a"].last_checked_ms > 0);
    }

    // --- Empty registry is not healthy ---
    {
        TaskExecutor executor(1);
        HealthMonitor monitor(health_config, executor);
        ASSERT(!monitor.check_all().all_healthy());
    }

    // --- Any single failure => not healthy ---
    {
        TaskExecutor executor(4);
        HealthMonitor monitor(health_config, executor);
        auto a = running_component("a");
        auto b = running_component("b");
        monitor.register_component(a);
        monitor.register_component(b);

        b->healthy = false;
        ComponentHealth health = monitor.check_all();
        ASSERT(!health.all_healthy());
        ASSERT(!monitor.is_system_healthy());
        ASSERT(health.failed_components() == std::vector<std::string>{"b"});
        ASSERT(health.components["a"].status == HealthStatus::Healthy);
        ASSERT(health.components["b"].status == HealthStatus::Failed);
    }

    // --- Hung probes fail by timeout, concurrently ---
    {
        TaskExecutor executor(4);
        HealthMonitor monitor(health_config, executor);
        auto a = running_component("a");
        auto b = running_component("b");
        auto c = running_component("c");
        a->probe_delay_ms = 400;
        b->probe_delay_ms = 400;
        monitor.register_component(a);
        monitor.register_component(b);
        monitor.register_component(c);

        TimePoint begin = Clock::now();
        ComponentHealth health = monitor.check_all();
        int64_t elapsed = ms_since(begin);

        ASSERT(health.components["a"].status == HealthStatus::Failed);
        ASSERT(health.components["b"].status == HealthStatus::Failed);
        ASSERT(health.components["c"].status == HealthStatus::Healthy);
        ASSERT(health.components["a"].detail.find("timed out") != std::string::npos);
        // One shared deadline, not one per probe
        ASSERT(elapsed < 300);
    }

    // --- Slow but healthy is degraded ---
    {
        HealthConfig degraded_config;
        degraded_config.probe_timeout_ms = 1000;
        degraded_config.degraded_after_ms = 20;
        TaskExecutor executor(2);
        HealthMonitor monitor(degraded_config, executor);
        auto slow = running_component("slow");
        slow->probe_delay_ms = 80;
        monitor.register_component(slow);
        monitor.register_component(running_component("quick"));

        ComponentHealth health = monitor.check_all();
        ASSERT(health.components["slow"].status == HealthStatus::Degraded);
        ASSERT(health.components["quick"].status == HealthStatus::Healthy);
        ASSERT(!health.all_healthy());
        ASSERT(health.failed_components().empty());
        ASSERT(health.unhealthy_components() == std::vector<std::string>{"slow"});
    }

    // --- Registering the same name replaces ---
    {
        TaskExecutor executor(1);
        HealthMonitor monitor(health_config, executor);
        monitor.register_component(running_component("a"));
        auto replacement = running_component("a");
        monitor.register_component(replacement);
        ASSERT(monitor.components().size() == 1);
        ASSERT(monitor.find("a") == replacement);
        ASSERT(monitor.find("missing") == nullptr);
    }

    RecoveryConfig recovery_config;
    recovery_config.restart_timeout_ms = 200;

    // --- Recovery succeeds after one restart ---
    {
        recovery_config.max_restart_attempts = 1;
        TaskExecutor executor(4);
        HealthMonitor monitor(health_config, executor);
        RecoveryManager recovery(recovery_config, monitor, executor);
        auto a = running_component("a");
        auto b = running_component("b");
        monitor.register_component(a);
        monitor.register_component(b);

        a->healthy = false;
        b->healthy = false;
        ComponentHealth health = monitor.check_all();
        RecoveryResult result = recovery.recover(health.failed_components());

        ASSERT(result.fully_recovered);
        ASSERT(a->restarts == 1);
        ASSERT(b->restarts == 1);
        ASSERT(result.components["a"].recovered);
        ASSERT(result.components["a"].attempts == 1);
        ASSERT(result.terminally_failed().empty());
        ASSERT(monitor.check_all().all_healthy());
    }

    // --- Recovery fails once the budget is exhausted ---
    {
        recovery_config.max_restart_attempts = 3;
        TaskExecutor executor(4);
        HealthMonitor monitor(health_config, executor);
        RecoveryManager recovery(recovery_config, monitor, executor);
        auto good = running_component("good");
        auto bad = running_component("bad");
        monitor.register_component(good);
        monitor.register_component(bad);

        good->healthy = false;
        bad->healthy = false;
        bad->heal_on_restart = false;
        RecoveryResult result = recovery.recover({"good", "bad"});

        ASSERT(!result.fully_recovered);
        ASSERT(good->restarts == 1);
        ASSERT(bad->restarts == 3);
        ASSERT(result.components["bad"].attempts == 3);
        ASSERT(!result.components["bad"].recovered);
        ASSERT(result.components["good"].recovered);
        ASSERT(result.terminally_failed() == std::vector<std::string>{"bad"});
        ASSERT(result.to_json()["fully_recovered"] == false);
    }

    // --- Failing and hung restarts ---
    {
        recovery_config.max_restart_attempts = 2;
        TaskExecutor executor(4);
        HealthMonitor monitor(health_config, executor);
        RecoveryManager recovery(recovery_config, monitor, executor);
        auto refuses = running_component("refuses");
        auto hangs = running_component("hangs");
        refuses->fail_restart = true;
        hangs->restart_delay_ms = 500;
        hangs->healthy = false;
        monitor.register_component(refuses);
        monitor.register_component(hangs);

        RecoveryResult result = recovery.recover({"refuses", "hangs"});
        ASSERT(!result.fully_recovered);
        ASSERT(refuses->restarts == 2);
        ASSERT(result.components["refuses"].last_error.find("restart failed") != std::string::npos);
        ASSERT(result.components["hangs"].last_error.find("timed out") != std::string::npos);
    }

    // --- Unknown component cannot be recovered ---
    {
        recovery_config.max_restart_attempts = 1;
        TaskExecutor executor(1);
        HealthMonitor monitor(health_config, executor);
        RecoveryManager recovery(recovery_config, monitor, executor);
        RecoveryResult result = recovery.recover({"ghost"});
        ASSERT(!result.fully_recovered);
        ASSERT(result.components["ghost"].last_error == "unknown component");
    }

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All health and recovery tests passed.\n";
    return 0;
}
