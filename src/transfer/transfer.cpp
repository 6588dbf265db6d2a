#include <peerlink/transfer/transfer.hpp>

namespace peerlink::transfer {

core::Result<void> TransferSettings::validate() const {
    if (chunk_size == 0) {
        return {core::ErrorCode::InvalidArgument, "chunk_size must be positive"};
    }
    if (chunk_size + webrtc::kChunkHeaderSize > max_message_size) {
        return {core::ErrorCode::InvalidArgument,
                "chunk_size " + std::to_string(chunk_size) +
                " plus frame header does not fit max_message_size " + std::to_string(max_message_size)};
    }
    if (window_size == 0) {
        return {core::ErrorCode::InvalidArgument, "window_size must be positive"};
    }
    if (ack_every == 0) {
        return {core::ErrorCode::InvalidArgument, "ack_every must be positive"};
    }
    if (ack_every > window_size) {
        return {core::ErrorCode::InvalidArgument,
                "ack_every larger than window_size would stall the sender"};
    }
    if (ack_timeout.count() <= 0 || ack_delay.count() < 0) {
        return {core::ErrorCode::InvalidArgument, "ack timers must be positive"};
    }
    if (max_incoming == 0) {
        return {core::ErrorCode::InvalidArgument, "max_incoming must be positive"};
    }
    if (ack_delay >= ack_timeout) {
        return {core::ErrorCode::InvalidArgument, "ack_delay must be shorter than ack_timeout"};
    }
    return {};
}

std::string toString(TransferDirection direction) {
    return direction == TransferDirection::Outgoing ? "outgoing" : "incoming";
}

std::string toString(TransferState state) {
    switch (state) {
        case TransferState::Announced: return "announced";
        case TransferState::InProgress: return "in-progress";
        case TransferState::Complete: return "complete";
        case TransferState::Aborted: return "aborted";
    }
    return "unknown";
}

std::uint32_t chunkCountFor(std::uint64_t total_size, std::uint32_t chunk_size) {
    if (total_size == 0 || chunk_size == 0) return 0;
    return static_cast<std::uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

} // namespace peerlink::transfer
