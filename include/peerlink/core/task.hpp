#pragma once

#include <memory>
#include <queue>
#include <thread>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <cstdint>
#include <vector>

#include <peerlink/core/error.hpp>

namespace peerlink::core {

// Task priority untuk scheduling
enum class TaskPriority {
    Low,
    Normal,
    High,
    Critical
};

// Worker pool untuk pekerjaan yang tidak boleh memblokir reactor
class TaskScheduler {
public:
    using Job = std::function<void()>;

    TaskScheduler();
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    // Tambah job; gagal dengan InvalidState kalau scheduler belum jalan
    Result<void> submit(Job job, TaskPriority priority = TaskPriority::Normal);

    void start(std::size_t thread_count = std::thread::hardware_concurrency());

    // Job yang belum jalan dibuang
    void stop();

    bool isRunning() const noexcept { return running_; }

    std::size_t queueSize() const;

private:
    struct TaskEntry {
        Job job;
        TaskPriority priority;
        std::uint64_t sequence;

        // Prioritas tinggi dulu, FIFO untuk prioritas yang sama
        bool operator<(const TaskEntry& other) const {
            if (priority != other.priority) {
                return priority < other.priority;
            }
            return sequence > other.sequence;
        }
    };

    void run();

    std::priority_queue<TaskEntry> tasks_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t next_sequence_ = 0;
    bool running_ = false;
    bool stop_requested_ = false;
};

inline std::unique_ptr<TaskScheduler> make_task_scheduler() {
    return std::make_unique<TaskScheduler>();
}

} // namespace peerlink::core
