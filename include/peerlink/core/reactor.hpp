#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <peerlink/core/error.hpp>

struct uv_loop_s;
struct uv_async_s;
struct uv_timer_s;

namespace peerlink::core {

/**
 * Event loop berbasis libuv.
 *
 * post(), schedule() dan cancel() aman dipanggil dari thread mana pun;
 * semua callback dijalankan di thread loop. Loop bisa dijalankan di thread
 * sendiri (start/stop) atau digerakkan oleh pemanggil (runOnce/runUntil),
 * tapi tidak keduanya sekaligus.
 */
class Reactor {
public:
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    static constexpr TimerId kInvalidTimer = 0;

    Reactor();
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    void post(Callback callback);

    TimerId schedule(std::chrono::milliseconds delay, Callback callback);
    void cancel(TimerId id);

    // Jalankan loop di worker thread
    void start();
    void stop();
    bool isRunning() const noexcept { return running_; }

    // Proses pekerjaan yang sudah siap tanpa blocking
    bool runOnce();

    // Gerakkan loop di thread pemanggil sampai predicate true atau timeout
    bool runUntil(const std::function<bool()>& predicate,
                  std::chrono::milliseconds timeout);

    // Gerakkan loop selama durasi tertentu
    void runFor(std::chrono::milliseconds duration);

    bool isLoopThread() const;

    std::size_t pendingTimers() const;

private:
    struct TimerEntry;

    static void onAsync(uv_async_s* handle);
    static void onTimer(uv_timer_s* handle);

    void drainQueue();
    void startTimer(TimerId id, std::chrono::milliseconds delay, Callback callback);
    void stopTimer(TimerId id);
    void closeHandles();

    std::unique_ptr<uv_loop_s> loop_;
    uv_async_s* async_ = nullptr;

    std::deque<Callback> queue_;
    mutable std::mutex queue_mutex_;

    std::unordered_map<TimerId, TimerEntry*> timers_;
    std::unordered_set<TimerId> cancelled_;
    mutable std::mutex timer_mutex_;
    std::atomic<TimerId> next_timer_id_{1};

    std::thread worker_;
    std::atomic<std::thread::id> loop_thread_id_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace peerlink::core
