#pragma once

#include <memory>
#include <vector>
#include <cstdint>
#include <string>
#include <chrono>
#include <functional>
#include <optional>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>

namespace peerlink::webrtc {

// ICE server configuration
struct IceServer {
    std::string urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;
};

// Peer connection configuration
struct PeerConfiguration {
    std::vector<IceServer> ice_servers;
};

// ICE candidate
class IceCandidate {
public:
    IceCandidate() = default;
    IceCandidate(const std::string& sdp_mid,
                 int sdp_mline_index,
                 const std::string& candidate);

    const std::string& sdpMid() const { return sdp_mid_; }
    int sdpMLineIndex() const { return sdp_mline_index_; }
    const std::string& candidate() const { return candidate_; }
    std::string toJson() const;

    static IceCandidate fromJson(const std::string& json);

private:
    std::string sdp_mid_;
    int sdp_mline_index_ = 0;
    std::string candidate_;
};

enum class SdpType {
    Offer,
    Answer
};

// Session description
class SessionDescription {
public:
    SessionDescription() = default;
    SessionDescription(SdpType type, const std::string& sdp);

    SdpType type() const { return type_; }
    const std::string& sdp() const { return sdp_; }
    std::string typeString() const;
    std::string toJson() const;

    static SessionDescription fromJson(const std::string& json);

private:
    SdpType type_ = SdpType::Offer;
    std::string sdp_;
};

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    Closed
};

enum class PeerConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

std::string toString(PeerConnectionState state);

enum class DataChannelState {
    Connecting,
    Open,
    Closing,
    Closed
};

std::string toString(DataChannelState state);

// Data channel configuration
struct DataChannelInit {
    bool ordered = true;
    std::optional<int> max_packet_life_time;
    std::optional<int> max_retransmits;
    std::string protocol;
    bool negotiated = false;
    std::optional<int> id;
};

/**
 * Data channel.
 *
 * send() throws core::Error(ChannelNotOpen) kalau state bukan Open, dan
 * core::Error(InvalidArgument) kalau pesan melebihi batas ukuran transport.
 */
class DataChannel {
public:
    virtual ~DataChannel() = default;

    // Properties
    virtual std::string label() const = 0;
    virtual bool ordered() const = 0;
    virtual std::optional<int> maxRetransmits() const = 0;
    virtual bool reliable() const = 0;
    virtual std::uint64_t bufferedAmount() const = 0;
    virtual DataChannelState state() const = 0;

    // Methods
    virtual void send(const std::string& data) = 0;
    virtual void send(const core::ByteBuffer& data) = 0;
    virtual void close() = 0;

    // Events
    core::EventEmitter<const std::string&> onMessage;
    core::EventEmitter<const core::ByteBuffer&> onBinaryMessage;
    core::EventEmitter<DataChannelState> onStateChange;
    core::EventEmitter<std::uint64_t> onBufferedAmountChange;
};

enum class MediaKind {
    Audio,
    Video
};

std::string toString(MediaKind kind);

// Satu frame media yang sudah di-encode oleh media engine
struct MediaFrame {
    MediaKind kind = MediaKind::Audio;
    std::chrono::microseconds timestamp{0};
    core::ByteBuffer data;
    bool keyframe = false;
};

// Sisi kirim dari track lokal
class MediaTrackSender {
public:
    virtual ~MediaTrackSender() = default;

    virtual std::string trackId() const = 0;
    virtual MediaKind kind() const = 0;

    // False kalau transport belum siap menerima frame lagi
    virtual bool writable() const = 0;

    // Return false kalau frame tidak diterima
    virtual bool write(const MediaFrame& frame) = 0;

    virtual void stop() = 0;

    core::EventEmitter<> onWritable;
};

// Track remote yang diterima dari peer
class MediaTrackReceiver {
public:
    MediaTrackReceiver(std::string track_id, MediaKind kind)
        : track_id_(std::move(track_id)), kind_(kind) {}

    const std::string& trackId() const { return track_id_; }
    MediaKind kind() const { return kind_; }
    bool ended() const { return ended_; }

    // Dipanggil oleh implementasi transport
    void deliver(const MediaFrame& frame) {
        if (!ended_) onFrame.emit(frame);
    }

    void end() {
        if (ended_) return;
        ended_ = true;
        onEnded.emit();
    }

    core::EventEmitter<const MediaFrame&> onFrame;
    core::EventEmitter<> onEnded;

private:
    std::string track_id_;
    MediaKind kind_;
    bool ended_ = false;
};

/**
 * Peer connection.
 *
 * Operasi negosiasi melempar core::Error kalau gagal. Semua event dikirim
 * lewat reactor milik implementasi, tidak pernah dari dalam pemanggilan
 * method.
 */
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    // Negotiation
    virtual SessionDescription createOffer() = 0;
    virtual SessionDescription createAnswer() = 0;
    virtual void setLocalDescription(const SessionDescription& desc) = 0;
    virtual void setRemoteDescription(const SessionDescription& desc) = 0;
    virtual std::optional<SessionDescription> localDescription() const = 0;
    virtual std::optional<SessionDescription> remoteDescription() const = 0;

    // ICE candidates; throw InvalidState sebelum remote description ada
    virtual void addIceCandidate(const IceCandidate& candidate) = 0;
    virtual void restartIce() = 0;
    virtual SignalingState signalingState() const = 0;
    virtual PeerConnectionState connectionState() const = 0;

    // Data channels
    virtual std::shared_ptr<DataChannel> createDataChannel(
        const std::string& label,
        const DataChannelInit& options = {}) = 0;

    // Media
    virtual std::shared_ptr<MediaTrackSender> addTrack(const std::string& track_id,
                                                       MediaKind kind) = 0;
    virtual void removeTrack(const std::shared_ptr<MediaTrackSender>& sender) = 0;

    virtual void close() = 0;

    // Events
    core::EventEmitter<const IceCandidate&> onLocalCandidate;
    core::EventEmitter<PeerConnectionState> onConnectionStateChange;
    core::EventEmitter<std::shared_ptr<DataChannel>> onDataChannel;
    core::EventEmitter<std::shared_ptr<MediaTrackReceiver>> onTrack;
};

using PeerConnectionFactory =
    std::function<std::shared_ptr<PeerConnection>(const PeerConfiguration&)>;

} // namespace peerlink::webrtc
