#include <peerlink/core/task.hpp>
#include <peerlink/core/logger.hpp>

namespace peerlink::core {

TaskScheduler::TaskScheduler() = default;

TaskScheduler::~TaskScheduler() {
    stop();
}

Result<void> TaskScheduler::submit(Job job, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stop_requested_) {
            return {ErrorCode::InvalidState, "Task scheduler is not running"};
        }
        tasks_.push({std::move(job), priority, next_sequence_++});
    }
    cv_.notify_one();
    return {};
}

void TaskScheduler::start(std::size_t thread_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;

    if (thread_count == 0) {
        thread_count = 1;
    }

    running_ = true;
    stop_requested_ = false;

    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&TaskScheduler::run, this);
    }

    Logger::info("Task scheduler started with {} worker threads", thread_count);
}

void TaskScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        stop_requested_ = true;
    }

    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = tasks_.size();
        tasks_ = {};
        running_ = false;
    }

    if (dropped > 0) {
        Logger::warn("Task scheduler stopped with {} pending jobs dropped", dropped);
    } else {
        Logger::info("Task scheduler stopped");
    }
}

std::size_t TaskScheduler::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this] {
            return !tasks_.empty() || stop_requested_;
        });

        if (stop_requested_) break;

        auto entry = tasks_.top();
        tasks_.pop();

        // Release lock selama execution
        lock.unlock();

        try {
            entry.job();
        }
        catch (const std::exception& e) {
            Logger::error("Error executing task: {}", e.what());
        }

        lock.lock();
    }
}

} // namespace peerlink::core
