#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/webrtc/data_channel_transport.hpp>
#include <peerlink/webrtc/signaling.hpp>
#include <peerlink/webrtc/webrtc.hpp>

namespace peerlink::webrtc {

enum class PeerRole {
    Offerer,
    Answerer
};

std::string toString(PeerRole role);

struct PeerSessionConfig {
    PeerRole role = PeerRole::Offerer;
    PeerConfiguration peer;
    std::chrono::milliseconds negotiation_timeout{10000};
    int reconnect_attempts = 0;
    std::chrono::milliseconds reconnect_interval{1000};

    // Channel yang dibuat offerer sebelum offer dikirim
    std::vector<ChannelSpec> channels = DataChannelTransport::defaultChannels();
};

/**
 * Sesi peer hasil negosiasi.
 *
 * State hanya bergerak maju, kecuali disconnected -> connecting selama
 * reconnect sedang dicoba.
 */
class PeerSession {
public:
    PeerSession(std::string id, PeerRole role);

    const std::string& id() const { return id_; }
    PeerRole role() const { return role_; }
    std::chrono::system_clock::time_point createdAt() const { return created_at_; }

    PeerConnectionState state() const;
    bool retrying() const;
    std::optional<SessionDescription> localDescription() const;
    std::optional<SessionDescription> remoteDescription() const;
    std::shared_ptr<PeerConnection> connection() const;

    static bool isValidTransition(PeerConnectionState from, PeerConnectionState to, bool retrying);

    // Return false kalau transisi ditolak atau tidak mengubah state
    bool transition(PeerConnectionState next);

private:
    friend class PeerConnectionManager;

    void setRetrying(bool retrying);
    void setLocalDescription(const SessionDescription& desc);
    void setRemoteDescription(const SessionDescription& desc);
    void setConnection(std::shared_ptr<PeerConnection> connection);

    std::string id_;
    PeerRole role_;
    std::chrono::system_clock::time_point created_at_;

    mutable std::mutex mutex_;
    PeerConnectionState state_ = PeerConnectionState::New;
    bool retrying_ = false;
    std::optional<SessionDescription> local_;
    std::optional<SessionDescription> remote_;
    std::shared_ptr<PeerConnection> connection_;
};

/**
 * Mengelola satu PeerSession: negosiasi lewat SignalingChannel, trickle
 * candidate, deadline negosiasi, reconnect dan close.
 *
 * Callback open() selalu dipanggil dari reactor, tidak pernah dari dalam
 * open() sendiri.
 */
class PeerConnectionManager : public std::enable_shared_from_this<PeerConnectionManager> {
public:
    using OpenCallback = std::function<void(core::Result<std::shared_ptr<PeerSession>>)>;

    static std::shared_ptr<PeerConnectionManager> create(core::Reactor& reactor,
                                                         std::shared_ptr<SignalingChannel> signaling,
                                                         PeerConnectionFactory factory);

    PeerConnectionManager(core::Reactor& reactor,
                          std::shared_ptr<SignalingChannel> signaling,
                          PeerConnectionFactory factory);
    ~PeerConnectionManager();

    PeerConnectionManager(const PeerConnectionManager&) = delete;
    PeerConnectionManager& operator=(const PeerConnectionManager&) = delete;

    void open(const PeerSessionConfig& config, OpenCallback callback);

    // Idempotent; kirim bye ke peer kalau signaling masih terbuka
    void close();

    std::shared_ptr<PeerSession> session() const;
    std::size_t bufferedCandidates() const;

    // Events
    core::EventEmitter<PeerConnectionState> onStateChange;
    core::EventEmitter<std::shared_ptr<DataChannel>> onDataChannel;
    core::EventEmitter<std::shared_ptr<MediaTrackReceiver>> onTrack;
    core::EventEmitter<> onRemoteHangup;
    // Error terminal setelah open selesai, misalnya reconnect habis
    core::EventEmitter<const core::Error&> onError;

private:
    void attachSignaling();
    void attachConnection(const std::shared_ptr<PeerConnection>& pc);
    void detachConnection();

    void startOffer();
    void handleSignal(const SignalingMessage& message);
    void handleDescription(const SignalingMessage& message);
    void handleCandidate(const SignalingMessage& message);
    void handleBye();
    void handleSignalingClosed();
    void handleConnectionState(PeerConnectionState state);

    void startReconnect();
    void attemptReconnect();

    // Selesaikan open() dengan error; pc ditutup
    void failNegotiation(core::ErrorCode code, const std::string& reason);
    void failEstablished(const std::string& reason);
    void completeOpen();
    void sendSignal(SignalingMessageType type, const std::string& data);

    core::Reactor& reactor_;
    std::shared_ptr<SignalingChannel> signaling_;
    PeerConnectionFactory factory_;

    mutable std::mutex mutex_;
    PeerSessionConfig config_;
    std::shared_ptr<PeerSession> session_;
    std::shared_ptr<PeerConnection> pc_;
    OpenCallback pending_open_;
    std::vector<IceCandidate> pending_candidates_;
    std::vector<SignalingMessage> early_messages_;
    core::Reactor::TimerId deadline_timer_ = core::Reactor::kInvalidTimer;
    core::Reactor::TimerId reconnect_timer_ = core::Reactor::kInvalidTimer;
    int reconnect_attempts_used_ = 0;
    bool remote_hungup_ = false;
    bool closed_ = false;

    std::vector<core::ListenerId> signaling_listeners_;
    core::ListenerId candidate_listener_ = 0;
    core::ListenerId state_listener_ = 0;
    core::ListenerId channel_listener_ = 0;
    core::ListenerId track_listener_ = 0;
};

} // namespace peerlink::webrtc
