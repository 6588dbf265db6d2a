#include <peerlink/webrtc/signaling.hpp>
#include <peerlink/core/logger.hpp>
#include <nlohmann/json.hpp>

namespace peerlink::webrtc {

std::string signalingMessageTypeToString(SignalingMessageType type) {
    switch (type) {
        case SignalingMessageType::Description: return "description";
        case SignalingMessageType::Candidate: return "candidate";
        case SignalingMessageType::Bye: return "bye";
    }
    return "unknown";
}

namespace {

SignalingMessageType stringToSignalingMessageType(const std::string& type) {
    if (type == "description") return SignalingMessageType::Description;
    if (type == "candidate") return SignalingMessageType::Candidate;
    if (type == "bye") return SignalingMessageType::Bye;
    throw core::Error(core::ErrorCode::InvalidData, "Unknown signaling message type: " + type);
}

} // namespace

std::string SignalingMessage::toJson() const {
    nlohmann::json j;
    j["type"] = signalingMessageTypeToString(type);
    j["sessionId"] = session_id;
    if (!data.empty()) {
        j["data"] = data;
    }
    return j.dump();
}

SignalingMessage SignalingMessage::fromJson(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        throw core::Error(core::ErrorCode::InvalidData,
                          "Invalid signaling message: " + std::string(e.what()));
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw core::Error(core::ErrorCode::InvalidData, "Signaling message has no type");
    }

    SignalingMessage message;
    message.type = stringToSignalingMessageType(j["type"].get<std::string>());
    if (j.contains("sessionId") && j["sessionId"].is_string()) {
        message.session_id = j["sessionId"].get<std::string>();
    }
    if (j.contains("data") && j["data"].is_string()) {
        message.data = j["data"].get<std::string>();
    }
    return message;
}

// LoopbackSignaling implementation
LoopbackSignaling::Pair LoopbackSignaling::createPair(core::Reactor& first, core::Reactor& second) {
    auto a = std::make_shared<LoopbackSignaling>(first);
    auto b = std::make_shared<LoopbackSignaling>(second);
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
}

LoopbackSignaling::LoopbackSignaling(core::Reactor& reactor)
    : reactor_(reactor) {}

void LoopbackSignaling::send(const SignalingMessage& message) {
    if (!open_) {
        throw core::Error(core::ErrorCode::ConnectionClosed, "Signaling channel is closed");
    }

    auto peer = peer_.lock();
    if (!peer) {
        throw core::Error(core::ErrorCode::ConnectionClosed, "Signaling peer is gone");
    }

    ++messages_sent_;
    if (muted_) {
        core::Logger::debug("Signaling muted, dropping {} message",
                            signalingMessageTypeToString(message.type));
        return;
    }

    // Encode di sisi pengirim supaya penerima melewati jalur parsing yang sama
    std::string encoded = message.toJson();
    std::weak_ptr<LoopbackSignaling> weak_peer = peer;
    peer->reactor_.post([weak_peer, encoded = std::move(encoded)]() {
        if (auto target = weak_peer.lock()) {
            target->deliver(encoded);
        }
    });
}

void LoopbackSignaling::close() {
    if (!open_.exchange(false)) return;

    core::Logger::debug("Loopback signaling closed");
    if (auto peer = peer_.lock()) {
        std::weak_ptr<LoopbackSignaling> weak_peer = peer;
        peer->reactor_.post([weak_peer]() {
            if (auto target = weak_peer.lock()) {
                target->remoteClosed();
            }
        });
    }

    std::weak_ptr<LoopbackSignaling> weak_self = weak_from_this();
    reactor_.post([weak_self]() {
        if (auto self = weak_self.lock()) {
            self->onClosed.emit();
        }
    });
}

void LoopbackSignaling::deliver(const std::string& encoded) {
    if (!open_) return;

    try {
        onMessage.emit(SignalingMessage::fromJson(encoded));
    }
    catch (const core::Error& e) {
        core::Logger::warn("Dropping malformed signaling message: {}", e.what());
    }
}

void LoopbackSignaling::remoteClosed() {
    if (!open_.exchange(false)) return;
    onClosed.emit();
}

} // namespace peerlink::webrtc
