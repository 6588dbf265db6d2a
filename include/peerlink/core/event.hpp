#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <cstdint>
#include <algorithm>
#include <exception>

#include <peerlink/core/logger.hpp>

namespace peerlink::core {

using ListenerId = std::uint64_t;

// Event emitter bertipe; listener dipanggil di thread yang memanggil emit()
template<typename... Args>
class EventEmitter {
public:
    using Callback = std::function<void(Args...)>;

    EventEmitter() = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    ListenerId addListener(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        ListenerId id = next_id_++;
        listeners_.push_back({id, std::make_shared<Callback>(std::move(callback))});
        return id;
    }

    void removeListener(ListenerId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(
            std::remove_if(listeners_.begin(), listeners_.end(),
                           [id](const Entry& entry) { return entry.id == id; }),
            listeners_.end());
    }

    void removeAllListeners() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
    }

    std::size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    // Snapshot listener dulu supaya callback boleh add/remove listener
    void emit(Args... args) const {
        std::vector<std::shared_ptr<Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(listeners_.size());
            for (const auto& entry : listeners_) {
                snapshot.push_back(entry.callback);
            }
        }

        for (const auto& callback : snapshot) {
            try {
                (*callback)(args...);
            }
            catch (const std::exception& e) {
                Logger::error("Event listener threw: {}", e.what());
            }
        }
    }

private:
    struct Entry {
        ListenerId id;
        std::shared_ptr<Callback> callback;
    };

    std::vector<Entry> listeners_;
    mutable std::mutex mutex_;
    ListenerId next_id_ = 1;
};

} // namespace peerlink::core
