#include <peerlink/webrtc/webrtc.hpp>
#include <peerlink/core/logger.hpp>
#include <nlohmann/json.hpp>

namespace peerlink::webrtc {

// IceCandidate implementation
IceCandidate::IceCandidate(const std::string& sdp_mid,
                           int sdp_mline_index,
                           const std::string& candidate)
    : sdp_mid_(sdp_mid), sdp_mline_index_(sdp_mline_index), candidate_(candidate) {}

std::string IceCandidate::toJson() const {
    nlohmann::json j;
    j["sdpMid"] = sdp_mid_;
    j["sdpMLineIndex"] = sdp_mline_index_;
    j["candidate"] = candidate_;
    return j.dump();
}

IceCandidate IceCandidate::fromJson(const std::string& json) {
    try {
        auto j = nlohmann::json::parse(json);
        return IceCandidate(
            j.at("sdpMid").get<std::string>(),
            j.at("sdpMLineIndex").get<int>(),
            j.at("candidate").get<std::string>()
        );
    } catch (const nlohmann::json::exception& e) {
        core::Logger::warn("Failed to parse ICE candidate from JSON: {}", e.what());
        throw core::Error(core::ErrorCode::InvalidData,
                          "Failed to parse ICE candidate: " + std::string(e.what()));
    }
}

// SessionDescription implementation
SessionDescription::SessionDescription(SdpType type, const std::string& sdp)
    : type_(type), sdp_(sdp) {}

std::string SessionDescription::typeString() const {
    switch (type_) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
    }
    return "unknown";
}

std::string SessionDescription::toJson() const {
    nlohmann::json j;
    j["type"] = typeString();
    j["sdp"] = sdp_;
    return j.dump();
}

SessionDescription SessionDescription::fromJson(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        core::Logger::warn("Failed to parse SDP from JSON: {}", e.what());
        throw core::Error(core::ErrorCode::InvalidData,
                          "Failed to parse SDP: " + std::string(e.what()));
    }

    if (!j.is_object() || !j.contains("type") || !j.contains("sdp") ||
        !j["type"].is_string() || !j["sdp"].is_string()) {
        throw core::Error(core::ErrorCode::InvalidData, "Session description missing type or sdp");
    }

    std::string type_str = j["type"].get<std::string>();
    SdpType type;
    if (type_str == "offer") type = SdpType::Offer;
    else if (type_str == "answer") type = SdpType::Answer;
    else throw core::Error(core::ErrorCode::InvalidData, "Unknown SDP type: " + type_str);

    return SessionDescription(type, j["sdp"].get<std::string>());
}

std::string toString(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::New: return "new";
        case PeerConnectionState::Connecting: return "connecting";
        case PeerConnectionState::Connected: return "connected";
        case PeerConnectionState::Disconnected: return "disconnected";
        case PeerConnectionState::Failed: return "failed";
        case PeerConnectionState::Closed: return "closed";
    }
    return "unknown";
}

std::string toString(DataChannelState state) {
    switch (state) {
        case DataChannelState::Connecting: return "connecting";
        case DataChannelState::Open: return "open";
        case DataChannelState::Closing: return "closing";
        case DataChannelState::Closed: return "closed";
    }
    return "unknown";
}

std::string toString(MediaKind kind) {
    return kind == MediaKind::Audio ? "audio" : "video";
}

} // namespace peerlink::webrtc
