#include "task_executor.h"
#include "logger.h"

namespace cabin_voice {

TaskExecutor::TaskExecutor(size_t max_workers)
    : max_workers_(max_workers == 0 ? 1 : max_workers), running_(true), active_executions_(0) {

    // Start worker threads
    for (size_t i = 0; i < max_workers_; ++i) {
        worker_threads_.emplace_back(&TaskExecutor::worker_thread, this, i);
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (running_) {
            task_queue_.push(std::move(task));
            queue_cv_.notify_one();
            return;
        }
    }
    Logger::warn("TaskExecutor is shut down, rejecting task");
    task.cancel();
}

size_t TaskExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_executions_;
}

bool TaskExecutor::is_idle() const {
    return pending_count() == 0;
}

void TaskExecutor::shutdown() {
    std::queue<Task> cancelled;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
        std::swap(cancelled, task_queue_);
    }
    queue_cv_.notify_all();

    while (!cancelled.empty()) {
        cancelled.front().cancel();
        cancelled.pop();
    }

    // Wait for running tasks to return
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    worker_threads_.clear();
}

void TaskExecutor::worker_thread(size_t index) {
    Logger::set_thread_name("worker-" + std::to_string(index));
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            if (!running_ && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_executions_++;
        }

        task.run();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_executions_--;
        }
    }
}

} // namespace cabin_voice
