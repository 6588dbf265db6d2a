#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/reactor.hpp>

namespace peerlink::webrtc {

// Signaling Message Types
enum class SignalingMessageType {
    Description,
    Candidate,
    Bye
};

std::string signalingMessageTypeToString(SignalingMessageType type);

// Signaling Message; data berisi JSON description atau candidate
struct SignalingMessage {
    SignalingMessageType type = SignalingMessageType::Description;
    std::string session_id;
    std::string data;

    SignalingMessage() = default;
    SignalingMessage(SignalingMessageType t, const std::string& sid, const std::string& d)
        : type(t), session_id(sid), data(d) {}

    std::string toJson() const;

    // Throw core::Error(InvalidData) kalau JSON tidak valid
    static SignalingMessage fromJson(const std::string& json);
};

/**
 * Channel signaling eksternal.
 *
 * Mekanisme transport tidak ditentukan di sini; implementasi cukup
 * mengirim dan menerima SignalingMessage secara berurutan.
 */
class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;

    virtual void send(const SignalingMessage& message) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    core::EventEmitter<const SignalingMessage&> onMessage;
    core::EventEmitter<> onClosed;
};

// Pasangan channel signaling in-process, pesan dikirim lewat reactor penerima
class LoopbackSignaling : public SignalingChannel,
                          public std::enable_shared_from_this<LoopbackSignaling> {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackSignaling>, std::shared_ptr<LoopbackSignaling>>;

    static Pair createPair(core::Reactor& first, core::Reactor& second);

    explicit LoopbackSignaling(core::Reactor& reactor);

    void send(const SignalingMessage& message) override;
    void close() override;
    bool isOpen() const override { return open_; }

    // Semua pesan keluar dibuang, untuk mensimulasikan peer yang diam
    void setMuted(bool muted) { muted_ = muted; }

    std::size_t messagesSent() const { return messages_sent_; }

private:
    void deliver(const std::string& encoded);
    void remoteClosed();

    core::Reactor& reactor_;
    std::weak_ptr<LoopbackSignaling> peer_;
    std::atomic<bool> open_{true};
    std::atomic<bool> muted_{false};
    std::atomic<std::size_t> messages_sent_{0};
};

} // namespace peerlink::webrtc
