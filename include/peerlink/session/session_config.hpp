#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <peerlink/core/config.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/core/logger.hpp>
#include <peerlink/transfer/transfer.hpp>
#include <peerlink/webrtc/peer_manager.hpp>

namespace peerlink::session {

struct SessionConfig {
    webrtc::PeerRole role = webrtc::PeerRole::Offerer;
    // Nama endpoint untuk log
    std::string endpoint = "peer";
    webrtc::PeerConfiguration peer;

    std::chrono::milliseconds negotiation_timeout{10000};
    int reconnect_attempts = 0;
    std::chrono::milliseconds reconnect_interval{1000};

    transfer::TransferSettings transfer;
    std::size_t media_queue_depth = 8;
    core::LogLevel log_level = core::LogLevel::INFO;

    // Key yang tidak ada memakai default; tipe salah -> InvalidData
    static core::Result<SessionConfig> fromConfig(const core::ConfigNode& node);

    core::Result<void> validate() const;

    webrtc::PeerSessionConfig peerSessionConfig() const;
};

} // namespace peerlink::session
