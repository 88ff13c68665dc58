#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <optional>
#include <condition_variable>
#include <exception>

namespace cabin_voice {

/**
 * @brief Completion slot shared between a submitted task and its waiter
 *
 * Owned jointly by the worker and the handle, so a waiter that gives up
 * (timeout) never leaves the worker writing into a dead stack frame.
 */
template<typename T>
struct TaskState {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<Result<T>> result;

    void complete(Result<T> value) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (result) {
                return;
            }
            result.emplace(std::move(value));
        }
        cv.notify_all();
    }
};

/**
 * @brief Handle to a task submitted to the TaskExecutor
 */
template<typename T>
class TaskHandle {
public:
    TaskHandle() = default;
    explicit TaskHandle(std::shared_ptr<TaskState<T>> state) : state_(std::move(state)) {}

    /**
     * @brief Wait for the task until deadline
     * @param label Used in the timeout error message
     * @return Task result, or a Timeout error if the deadline passed first
     */
    Result<T> wait_until(TimePoint deadline, const std::string& label) const {
        if (!state_) {
            return make_error(ErrorType::InvalidState, label + ": task was never submitted");
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->cv.wait_until(lock, deadline, [this] { return state_->result.has_value(); })) {
            return make_timeout_error(label + " timed out");
        }
        return *state_->result;
    }

    bool ready() const {
        if (!state_) return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->result.has_value();
    }

private:
    std::shared_ptr<TaskState<T>> state_;
};

/**
 * @brief Bounded worker pool for calls into external collaborators
 *
 * Health probes, restarts and provider calls are submitted here so the
 * caller can fan out and wait with a deadline. A call that overruns its
 * deadline keeps its worker until it returns; the caller has already moved on.
 */
class TaskExecutor {
public:
    /**
     * @brief Construct executor
     * @param max_workers Number of worker threads
     */
    explicit TaskExecutor(size_t max_workers = 4);

    /**
     * @brief Destructor - shuts down and joins workers
     */
    ~TaskExecutor();

    // Non-copyable
    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * @brief Submit a callable returning Result<T>
     *
     * Exceptions thrown by fn are converted to ProviderError results.
     * After shutdown() the returned handle completes immediately with InvalidState.
     */
    template<typename T>
    TaskHandle<T> spawn(std::function<Result<T>()> fn) {
        auto state = std::make_shared<TaskState<T>>();
        Task task;
        task.run = [state, fn]() {
            try {
                state->complete(fn());
            } catch (const std::exception& e) {
                state->complete(make_provider_error(std::string("exception: ") + e.what()));
            }
        };
        task.cancel = [state]() {
            state->complete(make_error(ErrorType::InvalidState, "executor shut down"));
        };
        enqueue(std::move(task));
        return TaskHandle<T>(state);
    }

    /**
     * @brief Run fn on a worker and wait at most timeout_ms for it
     * @param label Name used in the timeout error (e.g. "nlu.process")
     */
    template<typename T>
    Result<T> run_with_timeout(std::function<Result<T>()> fn, int timeout_ms, const std::string& label) {
        TaskHandle<T> handle = spawn<T>(std::move(fn));
        return handle.wait_until(Clock::now() + std::chrono::milliseconds(timeout_ms), label);
    }

    /**
     * @brief Number of queued plus running tasks
     */
    size_t pending_count() const;

    /**
     * @brief Check if executor is idle (no pending executions)
     */
    bool is_idle() const;

    /**
     * @brief Stop accepting work, cancel queued tasks and join the workers
     *
     * Safe to call more than once.
     */
    void shutdown();

    bool is_running() const { return running_; }

    size_t worker_count() const { return max_workers_; }

private:
    struct Task {
        std::function<void()> run;
        std::function<void()> cancel;
    };

    void enqueue(Task task);
    void worker_thread(size_t index);

    size_t max_workers_;
    std::atomic<bool> running_;
    size_t active_executions_;

    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::vector<std::thread> worker_threads_;
    std::mutex join_mutex_;
};

} // namespace cabin_voice
