#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/webrtc/webrtc.hpp>

namespace peerlink::webrtc {

// Collaborator render/consume untuk track remote
class MediaSink {
public:
    virtual ~MediaSink() = default;

    virtual void onFrame(const std::string& track_id, const MediaFrame& frame) = 0;
    virtual void onTrackEnded(const std::string& track_id) = 0;
};

/**
 * Sumber media lokal. Capture collaborator memanggil pushFrame() dari
 * thread mana pun; frame diteruskan ke relay selama track terpasang.
 */
class LocalMediaTrack {
public:
    LocalMediaTrack(std::string id, MediaKind kind)
        : id_(std::move(id)), kind_(kind) {}

    const std::string& id() const { return id_; }
    MediaKind kind() const { return kind_; }

    // Return false kalau track tidak terpasang
    bool pushFrame(MediaFrame frame);

    bool attached() const;

private:
    friend class MediaTrackRelay;

    using FrameHandler = std::function<void(MediaFrame)>;
    void setHandler(FrameHandler handler);

    std::string id_;
    MediaKind kind_;
    mutable std::mutex mutex_;
    FrameHandler handler_;
};

struct MediaRelayStats {
    std::uint64_t frames_pushed = 0;
    std::uint64_t frames_sent = 0;
    std::uint64_t frames_dropped = 0;
    std::uint64_t frames_received = 0;
};

/**
 * Relay track media antara capture/render collaborator dan peer connection.
 *
 * Setiap track lokal punya antrean terbatas; kalau penuh, frame tertua
 * dibuang. Antrean dikuras di reactor selama sender writable.
 */
class MediaTrackRelay : public std::enable_shared_from_this<MediaTrackRelay> {
public:
    static constexpr std::size_t kDefaultQueueDepth = 8;

    static std::shared_ptr<MediaTrackRelay> create(core::Reactor& reactor,
                                                   std::size_t queue_depth = kDefaultQueueDepth);

    MediaTrackRelay(core::Reactor& reactor, std::size_t queue_depth);
    ~MediaTrackRelay();

    MediaTrackRelay(const MediaTrackRelay&) = delete;
    MediaTrackRelay& operator=(const MediaTrackRelay&) = delete;

    core::Result<void> attach(const std::shared_ptr<PeerConnection>& connection,
                              const std::shared_ptr<LocalMediaTrack>& track);

    void detach(const std::string& track_id);
    void detachAll();

    // Dipanggil untuk setiap track remote dari peer connection
    void handleRemoteTrack(std::shared_ptr<MediaTrackReceiver> track);

    void setSink(std::shared_ptr<MediaSink> sink);

    std::size_t queuedFrames(const std::string& track_id) const;
    std::size_t queueDepth() const noexcept { return queue_depth_; }
    std::vector<std::string> localTracks() const;
    std::vector<std::string> remoteTracks() const;
    MediaRelayStats stats() const;

    core::EventEmitter<std::shared_ptr<MediaTrackReceiver>> onTrack;

private:
    struct LocalBinding {
        std::shared_ptr<LocalMediaTrack> track;
        std::shared_ptr<MediaTrackSender> sender;
        std::weak_ptr<PeerConnection> connection;
        std::deque<MediaFrame> queue;
        core::ListenerId writable_listener = 0;
        bool flush_scheduled = false;
    };

    struct RemoteBinding {
        std::shared_ptr<MediaTrackReceiver> track;
        core::ListenerId frame_listener = 0;
        core::ListenerId ended_listener = 0;
    };

    void enqueue(const std::string& track_id, MediaFrame frame);
    void scheduleFlush(const std::string& track_id);
    void flush(const std::string& track_id);
    void handleRemoteFrame(const std::string& track_id, const MediaFrame& frame);
    void handleRemoteEnded(const std::string& track_id);
    static void release(LocalBinding& binding);
    static void release(RemoteBinding& binding);

    core::Reactor& reactor_;
    std::size_t queue_depth_;

    mutable std::mutex mutex_;
    std::map<std::string, LocalBinding> local_;
    std::map<std::string, RemoteBinding> remote_;
    std::shared_ptr<MediaSink> sink_;
    MediaRelayStats stats_;
};

} // namespace peerlink::webrtc
