#include <peerlink/webrtc/media_relay.hpp>
#include <peerlink/core/logger.hpp>

namespace peerlink::webrtc {

// LocalMediaTrack implementation
bool LocalMediaTrack::pushFrame(MediaFrame frame) {
    FrameHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = handler_;
    }
    if (!handler) return false;

    handler(std::move(frame));
    return true;
}

bool LocalMediaTrack::attached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(handler_);
}

void LocalMediaTrack::setHandler(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

// MediaTrackRelay implementation
std::shared_ptr<MediaTrackRelay> MediaTrackRelay::create(core::Reactor& reactor, std::size_t queue_depth) {
    return std::make_shared<MediaTrackRelay>(reactor, queue_depth);
}

MediaTrackRelay::MediaTrackRelay(core::Reactor& reactor, std::size_t queue_depth)
    : reactor_(reactor),
      queue_depth_(queue_depth == 0 ? 1 : queue_depth) {}

MediaTrackRelay::~MediaTrackRelay() {
    detachAll();
}

core::Result<void> MediaTrackRelay::attach(const std::shared_ptr<PeerConnection>& connection,
                                           const std::shared_ptr<LocalMediaTrack>& track) {
    if (!connection || !track) {
        return {core::ErrorCode::InvalidArgument, "attach requires a connection and a track"};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (local_.count(track->id())) {
            return {core::ErrorCode::InvalidState, "Track " + track->id() + " is already attached"};
        }
    }

    std::shared_ptr<MediaTrackSender> sender;
    try {
        sender = connection->addTrack(track->id(), track->kind());
    }
    catch (const core::Error& e) {
        return e;
    }

    std::weak_ptr<MediaTrackRelay> weak_self = weak_from_this();
    std::string track_id = track->id();

    LocalBinding binding;
    binding.track = track;
    binding.sender = sender;
    binding.connection = connection;
    binding.writable_listener = sender->onWritable.addListener([weak_self, track_id]() {
        if (auto self = weak_self.lock()) self->scheduleFlush(track_id);
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        local_[track_id] = std::move(binding);
    }

    track->setHandler([weak_self, track_id](MediaFrame frame) {
        if (auto self = weak_self.lock()) self->enqueue(track_id, std::move(frame));
    });

    core::Logger::info("Attached {} track {}", toString(track->kind()), track_id);
    return {};
}

void MediaTrackRelay::detach(const std::string& track_id) {
    LocalBinding binding;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = local_.find(track_id);
        if (it == local_.end()) return;
        binding = std::move(it->second);
        local_.erase(it);
    }

    release(binding);
    core::Logger::info("Detached track {} ({} queued frames discarded)", track_id, binding.queue.size());
}

void MediaTrackRelay::detachAll() {
    std::map<std::string, LocalBinding> local;
    std::map<std::string, RemoteBinding> remote;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local.swap(local_);
        remote.swap(remote_);
    }

    for (auto& [id, binding] : local) {
        release(binding);
    }
    for (auto& [id, binding] : remote) {
        release(binding);
    }

    if (!local.empty() || !remote.empty()) {
        core::Logger::debug("Released {} local and {} remote media bindings", local.size(), remote.size());
    }
}

void MediaTrackRelay::handleRemoteTrack(std::shared_ptr<MediaTrackReceiver> track) {
    if (!track) return;

    std::weak_ptr<MediaTrackRelay> weak_self = weak_from_this();
    std::string track_id = track->trackId();

    RemoteBinding binding;
    binding.track = track;
    binding.frame_listener = track->onFrame.addListener([weak_self, track_id](const MediaFrame& frame) {
        if (auto self = weak_self.lock()) self->handleRemoteFrame(track_id, frame);
    });
    binding.ended_listener = track->onEnded.addListener([weak_self, track_id]() {
        if (auto self = weak_self.lock()) self->handleRemoteEnded(track_id);
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = remote_.find(track_id);
        if (it != remote_.end()) {
            release(it->second);
            remote_.erase(it);
        }
        remote_[track_id] = std::move(binding);
    }

    core::Logger::info("Remote {} track {} received", toString(track->kind()), track_id);
    onTrack.emit(track);
}

void MediaTrackRelay::setSink(std::shared_ptr<MediaSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

std::size_t MediaTrackRelay::queuedFrames(const std::string& track_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = local_.find(track_id);
    return it == local_.end() ? 0 : it->second.queue.size();
}

std::vector<std::string> MediaTrackRelay::localTracks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, binding] : local_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> MediaTrackRelay::remoteTracks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, binding] : remote_) {
        ids.push_back(id);
    }
    return ids;
}

MediaRelayStats MediaTrackRelay::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void MediaTrackRelay::enqueue(const std::string& track_id, MediaFrame frame) {
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = local_.find(track_id);
        if (it == local_.end()) return;

        auto& binding = it->second;
        ++stats_.frames_pushed;
        if (binding.queue.size() >= queue_depth_) {
            binding.queue.pop_front();
            ++stats_.frames_dropped;
        }
        binding.queue.push_back(std::move(frame));

        if (!binding.flush_scheduled) {
            binding.flush_scheduled = true;
            schedule = true;
        }
    }

    if (schedule) {
        std::weak_ptr<MediaTrackRelay> weak_self = weak_from_this();
        reactor_.post([weak_self, track_id]() {
            if (auto self = weak_self.lock()) self->flush(track_id);
        });
    }
}

void MediaTrackRelay::scheduleFlush(const std::string& track_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = local_.find(track_id);
        if (it == local_.end() || it->second.flush_scheduled) return;
        it->second.flush_scheduled = true;
    }

    std::weak_ptr<MediaTrackRelay> weak_self = weak_from_this();
    reactor_.post([weak_self, track_id]() {
        if (auto self = weak_self.lock()) self->flush(track_id);
    });
}

void MediaTrackRelay::flush(const std::string& track_id) {
    std::shared_ptr<MediaTrackSender> sender;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = local_.find(track_id);
        if (it == local_.end()) return;
        it->second.flush_scheduled = false;
        sender = it->second.sender;
    }

    while (sender->writable()) {
        MediaFrame frame;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = local_.find(track_id);
            if (it == local_.end() || it->second.queue.empty()) return;
            frame = std::move(it->second.queue.front());
            it->second.queue.pop_front();
        }

        if (!sender->write(frame)) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = local_.find(track_id);
            if (it != local_.end()) {
                it->second.queue.push_front(std::move(frame));
            }
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.frames_sent;
    }
}

void MediaTrackRelay::handleRemoteFrame(const std::string& track_id, const MediaFrame& frame) {
    std::shared_ptr<MediaSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.frames_received;
        sink = sink_;
    }
    if (sink) {
        sink->onFrame(track_id, frame);
    }
}

void MediaTrackRelay::handleRemoteEnded(const std::string& track_id) {
    std::shared_ptr<MediaSink> sink;
    RemoteBinding binding;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
        auto it = remote_.find(track_id);
        if (it != remote_.end()) {
            binding = std::move(it->second);
            remote_.erase(it);
            found = true;
        }
    }

    if (found) {
        release(binding);
    }
    core::Logger::info("Remote track {} ended", track_id);
    if (sink) {
        sink->onTrackEnded(track_id);
    }
}

void MediaTrackRelay::release(LocalBinding& binding) {
    if (binding.track) {
        binding.track->setHandler(nullptr);
    }
    if (binding.sender) {
        binding.sender->onWritable.removeListener(binding.writable_listener);
        if (auto connection = binding.connection.lock()) {
            try {
                connection->removeTrack(binding.sender);
            }
            catch (const core::Error& e) {
                core::Logger::warn("Failed to remove track {}: {}", binding.sender->trackId(), e.what());
            }
        } else {
            binding.sender->stop();
        }
    }
}

void MediaTrackRelay::release(RemoteBinding& binding) {
    if (!binding.track) return;
    binding.track->onFrame.removeListener(binding.frame_listener);
    binding.track->onEnded.removeListener(binding.ended_listener);
}

} // namespace peerlink::webrtc
