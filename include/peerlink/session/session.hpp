#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/core/task.hpp>
#include <peerlink/session/processor.hpp>
#include <peerlink/session/session_config.hpp>
#include <peerlink/transfer/transfer_manager.hpp>
#include <peerlink/webrtc/data_channel_transport.hpp>
#include <peerlink/webrtc/media_relay.hpp>
#include <peerlink/webrtc/peer_manager.hpp>
#include <peerlink/webrtc/signaling.hpp>

namespace peerlink::session {

enum class SessionState {
    Idle,
    Negotiating,
    Connected,
    Closing,
    Closed,
    Failed
};

std::string toString(SessionState state);

/**
 * Koordinator satu sesi peer.
 *
 * Menyatukan PeerConnectionManager, DataChannelTransport, TransferManager
 * dan MediaTrackRelay. Semua pengiriman lewat satu mutex per session dan
 * antrean outbound yang menahan pesan reliable sampai channel control open.
 * Event untuk pengguna selalu di-post ke reactor, tidak pernah dipanggil
 * sambil memegang lock session.
 *
 * Reactor dan scheduler yang diberikan harus hidup lebih lama dari session.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    using ConnectCallback = std::function<void(core::Result<void>)>;

    // scheduler boleh nullptr; session lalu memakai worker pool sendiri
    static std::shared_ptr<Session> create(core::Reactor& reactor,
                                           std::shared_ptr<webrtc::SignalingChannel> signaling,
                                           webrtc::PeerConnectionFactory factory,
                                           SessionConfig config,
                                           std::shared_ptr<ContentProcessor> processor = nullptr,
                                           core::TaskScheduler* scheduler = nullptr);

    Session(core::Reactor& reactor,
            std::shared_ptr<webrtc::SignalingChannel> signaling,
            webrtc::PeerConnectionFactory factory,
            SessionConfig config,
            std::shared_ptr<ContentProcessor> processor,
            core::TaskScheduler* scheduler);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Mulai negosiasi; callback di-post ke reactor
    void connect(ConnectCallback callback = nullptr);

    // Idempotent; membatalkan semua transfer tanpa retry
    void close();

    core::Result<void> sendText(const std::string& text);
    core::Result<std::uint32_t> sendFile(const std::filesystem::path& path);
    core::Result<std::uint32_t> sendBytes(const std::string& name, core::ByteBuffer data);
    core::Result<void> cancelTransfer(std::uint32_t id);

    core::Result<void> attachTrack(std::shared_ptr<webrtc::LocalMediaTrack> track);
    void detachTrack(const std::string& track_id);
    void setMediaSink(std::shared_ptr<webrtc::MediaSink> sink);
    core::Result<void> sendMediaControl(const std::string& payload, bool reliable = false);

    std::optional<transfer::TransferInfo> transfer(std::uint32_t id) const;
    std::vector<transfer::TransferInfo> transfers() const;

    SessionState state() const;
    const SessionConfig& config() const noexcept { return config_; }
    std::shared_ptr<webrtc::PeerSession> peerSession() const;
    std::size_t pendingOutbound() const;
    webrtc::MediaRelayStats mediaStats() const;

    // Events
    core::EventEmitter<SessionState> onStateChange;
    core::EventEmitter<const webrtc::TextMessage&> onText;
    core::EventEmitter<const transfer::ReceivedFile&> onFileReceived;
    core::EventEmitter<const transfer::TransferInfo&> onTransferComplete;
    core::EventEmitter<const transfer::TransferInfo&, const core::Error&> onTransferFailed;
    core::EventEmitter<const core::Error&> onError;
    core::EventEmitter<std::shared_ptr<webrtc::MediaTrackReceiver>> onTrack;
    core::EventEmitter<const std::string&> onMediaControl;

private:
    void wire();

    // Semua fungsi *Locked mengasumsikan mutex_ sudah dipegang
    core::Result<void> sendLocked(const webrtc::DataChannelMessage& message, webrtc::SendOptions options);
    void flushLocked();
    void setStateLocked(SessionState next);
    void failLocked(const core::Error& error);
    void shutdownLocked(bool notify_peer);
    std::string sessionIdLocked() const;
    core::Result<std::uint32_t> startTransferLocked(std::unique_ptr<transfer::ChunkSource> source);

    void handleOpen(core::Result<std::shared_ptr<webrtc::PeerSession>> result, ConnectCallback callback);
    void handlePeerState(webrtc::PeerConnectionState state);
    void handlePeerError(const core::Error& error);
    void handleRemoteHangup();
    void handleChannelOpen(const std::string& label);
    void handleChannelClosed(const std::string& label);
    void handleMessage(const webrtc::DataChannelMessage& message);

    void processText(const std::string& text);
    void processFile(const transfer::ReceivedFile& file);
    void sendResponse(const std::string& text);

    void post(std::function<void(Session&)> action);

    // Meneruskan event TransferManager ke session
    class TransferEvents : public transfer::TransferObserver {
    public:
        explicit TransferEvents(Session& session) : session_(session) {}

        void onFileReceived(const transfer::ReceivedFile& file) override;
        void onTransferComplete(const transfer::TransferInfo& info) override;
        void onTransferFailed(const transfer::TransferInfo& info, const core::Error& error) override;

    private:
        Session& session_;
    };

    core::Reactor& reactor_;
    std::shared_ptr<webrtc::SignalingChannel> signaling_;
    SessionConfig config_;
    std::shared_ptr<ContentProcessor> processor_;
    std::unique_ptr<core::TaskScheduler> own_scheduler_;
    core::TaskScheduler* scheduler_;

    std::shared_ptr<webrtc::PeerConnectionManager> manager_;
    std::shared_ptr<webrtc::DataChannelTransport> transport_;
    std::shared_ptr<webrtc::MediaTrackRelay> relay_;
    TransferEvents transfer_events_{*this};
    std::unique_ptr<transfer::TransferManager> transfers_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    bool closed_ = false;
    bool control_open_ = false;
    std::deque<webrtc::DataChannelMessage> outbound_;
};

} // namespace peerlink::session
