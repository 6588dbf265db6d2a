#include <peerlink/core/reactor.hpp>
#include <peerlink/core/logger.hpp>

#include <uv.h>

namespace peerlink::core {

struct Reactor::TimerEntry {
    uv_timer_t handle;
    TimerId id = kInvalidTimer;
    Callback callback;
    Reactor* owner = nullptr;
};

Reactor::Reactor()
    : loop_(std::make_unique<uv_loop_t>()) {
    int result = uv_loop_init(loop_.get());
    if (result != 0) {
        throw Error(ErrorCode::Unknown,
            std::string("Failed to initialize event loop: ") + uv_strerror(result));
    }

    async_ = new uv_async_t;
    result = uv_async_init(loop_.get(), async_, &Reactor::onAsync);
    if (result != 0) {
        delete async_;
        async_ = nullptr;
        uv_loop_close(loop_.get());
        throw Error(ErrorCode::Unknown,
            std::string("Failed to initialize async handle: ") + uv_strerror(result));
    }
    async_->data = this;
}

Reactor::~Reactor() {
    stop();
    closeHandles();

    int result = uv_loop_close(loop_.get());
    if (result != 0) {
        Logger::warn("Event loop closed with active handles: {}", uv_strerror(result));
    }
}

void Reactor::post(Callback callback) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!async_) {
        Logger::warn("Reactor is shutting down, dropping posted callback");
        return;
    }
    queue_.push_back(std::move(callback));
    uv_async_send(async_);
}

Reactor::TimerId Reactor::schedule(std::chrono::milliseconds delay, Callback callback) {
    TimerId id = next_timer_id_++;
    post([this, id, delay, callback = std::move(callback)]() mutable {
        startTimer(id, delay, std::move(callback));
    });
    return id;
}

void Reactor::cancel(TimerId id) {
    if (id == kInvalidTimer) return;

    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        cancelled_.insert(id);
    }
    post([this, id]() { stopTimer(id); });
}

void Reactor::start() {
    if (running_.exchange(true)) return;

    stop_requested_ = false;
    worker_ = std::thread([this]() {
        loop_thread_id_ = std::this_thread::get_id();
        uv_run(loop_.get(), UV_RUN_DEFAULT);
    });
    Logger::debug("Reactor started on worker thread");
}

void Reactor::stop() {
    if (!running_) return;

    stop_requested_ = true;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        uv_async_send(async_);
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
    loop_thread_id_ = std::thread::id();
    Logger::debug("Reactor stopped");
}

bool Reactor::runOnce() {
    loop_thread_id_ = std::this_thread::get_id();
    return uv_run(loop_.get(), UV_RUN_NOWAIT) != 0;
}

bool Reactor::runUntil(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (predicate()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return predicate();

        runOnce();
        if (!predicate()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void Reactor::runFor(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        runOnce();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

bool Reactor::isLoopThread() const {
    return loop_thread_id_.load() == std::this_thread::get_id();
}

std::size_t Reactor::pendingTimers() const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return timers_.size();
}

void Reactor::onAsync(uv_async_t* handle) {
    auto* reactor = static_cast<Reactor*>(handle->data);
    reactor->drainQueue();

    if (reactor->stop_requested_) {
        uv_stop(reactor->loop_.get());
    }
}

void Reactor::onTimer(uv_timer_t* handle) {
    auto* entry = static_cast<TimerEntry*>(handle->data);
    Reactor* reactor = entry->owner;

    Callback callback;
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(reactor->timer_mutex_);
        reactor->timers_.erase(entry->id);
        cancelled = reactor->cancelled_.erase(entry->id) > 0;
        callback = std::move(entry->callback);
    }

    uv_timer_stop(handle);
    uv_close(reinterpret_cast<uv_handle_t*>(handle), [](uv_handle_t* h) {
        delete static_cast<TimerEntry*>(h->data);
    });

    if (cancelled || !callback) return;

    try {
        callback();
    }
    catch (const std::exception& e) {
        Logger::error("Timer callback threw: {}", e.what());
    }
}

void Reactor::drainQueue() {
    std::deque<Callback> pending;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pending.swap(queue_);
    }

    for (auto& callback : pending) {
        try {
            callback();
        }
        catch (const std::exception& e) {
            Logger::error("Posted callback threw: {}", e.what());
        }
    }
}

void Reactor::startTimer(TimerId id, std::chrono::milliseconds delay, Callback callback) {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (cancelled_.erase(id) > 0) {
        return;
    }

    auto* entry = new TimerEntry;
    entry->id = id;
    entry->callback = std::move(callback);
    entry->owner = this;

    uv_timer_init(loop_.get(), &entry->handle);
    entry->handle.data = entry;

    auto timeout = delay.count() > 0 ? static_cast<uint64_t>(delay.count()) : 0;
    int result = uv_timer_start(&entry->handle, &Reactor::onTimer, timeout, 0);
    if (result != 0) {
        Logger::error("Failed to start timer {}: {}", id, uv_strerror(result));
        uv_close(reinterpret_cast<uv_handle_t*>(&entry->handle), [](uv_handle_t* h) {
            delete static_cast<TimerEntry*>(h->data);
        });
        return;
    }

    timers_[id] = entry;
}

void Reactor::stopTimer(TimerId id) {
    TimerEntry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            // Timer sudah jalan
            cancelled_.erase(id);
            return;
        }
        entry = it->second;
        timers_.erase(it);
        cancelled_.erase(id);
    }

    uv_timer_stop(&entry->handle);
    uv_close(reinterpret_cast<uv_handle_t*>(&entry->handle), [](uv_handle_t* h) {
        delete static_cast<TimerEntry*>(h->data);
    });
}

void Reactor::closeHandles() {
    std::unordered_map<TimerId, TimerEntry*> timers;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timers.swap(timers_);
        cancelled_.clear();
    }

    for (auto& [id, entry] : timers) {
        uv_timer_stop(&entry->handle);
        uv_close(reinterpret_cast<uv_handle_t*>(&entry->handle), [](uv_handle_t* h) {
            delete static_cast<TimerEntry*>(h->data);
        });
    }

    uv_async_t* async = nullptr;
    std::deque<Callback> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        async = async_;
        async_ = nullptr;
        dropped.swap(queue_);
    }
    if (async) {
        uv_close(reinterpret_cast<uv_handle_t*>(async), [](uv_handle_t* h) {
            delete reinterpret_cast<uv_async_t*>(h);
        });
    }

    // Proses close callback yang tertunda
    uv_run(loop_.get(), UV_RUN_DEFAULT);
}

} // namespace peerlink::core
