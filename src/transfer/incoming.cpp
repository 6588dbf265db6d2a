#include <peerlink/transfer/incoming.hpp>
#include <peerlink/core/checksum.hpp>
#include <peerlink/core/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace peerlink::transfer {

namespace {

bool isSha256Hex(const std::string& value) {
    return value.size() == 64 &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

std::string toString(ReceiverPhase phase) {
    switch (phase) {
        case ReceiverPhase::Receiving: return "receiving";
        case ReceiverPhase::Complete: return "complete";
        case ReceiverPhase::Aborted: return "aborted";
    }
    return "unknown";
}

core::Result<std::unique_ptr<IncomingTransfer>> IncomingTransfer::fromBegin(
    const webrtc::FileControlMessage& begin, const TransferSettings& settings) {
    if (begin.action != webrtc::FileAction::Begin) {
        return {core::ErrorCode::InvalidArgument, "Not a begin message"};
    }
    if (begin.transfer_id == 0) {
        return {core::ErrorCode::InvalidArgument, "Transfer id 0 is reserved"};
    }
    if (begin.total_size > 0 && begin.chunk_size == 0) {
        return {core::ErrorCode::InvalidArgument, "Chunk size is zero"};
    }
    if (begin.chunk_count != chunkCountFor(begin.total_size, begin.chunk_size)) {
        return {core::ErrorCode::InvalidArgument,
                "Chunk count " + std::to_string(begin.chunk_count) +
                " does not match size " + std::to_string(begin.total_size)};
    }
    if (begin.chunk_size + webrtc::kChunkHeaderSize > settings.max_message_size) {
        return {core::ErrorCode::InvalidArgument,
                "Chunk size " + std::to_string(begin.chunk_size) + " exceeds max_message_size"};
    }
    if (begin.total_size > settings.max_file_size) {
        return {core::ErrorCode::InvalidArgument,
                "File of " + std::to_string(begin.total_size) + " bytes exceeds max_file_size"};
    }
    if (!isSha256Hex(begin.checksum)) {
        return {core::ErrorCode::InvalidArgument, "Checksum is not a SHA-256 digest"};
    }

    return std::unique_ptr<IncomingTransfer>(new IncomingTransfer(begin, settings));
}

IncomingTransfer::IncomingTransfer(const webrtc::FileControlMessage& begin, const TransferSettings& settings)
    : id_(begin.transfer_id),
      name_(begin.name),
      total_size_(begin.total_size),
      chunk_size_(begin.chunk_size),
      chunk_count_(begin.chunk_count),
      checksum_(begin.checksum),
      ack_every_(std::max<std::uint32_t>(settings.ack_every, 1)),
      attempt_(begin.attempt),
      chunks_(begin.chunk_count) {}

IncomingTransfer::ChunkOutcome IncomingTransfer::onChunk(const webrtc::FileChunkMessage& chunk) {
    if (phase_ != ReceiverPhase::Receiving || chunk.attempt != attempt_) {
        return ChunkOutcome::Stale;
    }
    if (chunk.index >= chunk_count_) {
        core::Logger::warn("Transfer {}: chunk index {} out of range", id_, chunk.index);
        return ChunkOutcome::Rejected;
    }
    if (chunk.data.size() != expectedLength(chunk.index)) {
        core::Logger::warn("Transfer {}: chunk {} has {} bytes, expected {}",
                           id_, chunk.index, chunk.data.size(), expectedLength(chunk.index));
        return ChunkOutcome::Rejected;
    }
    if (chunks_.contains(chunk.index)) {
        return ChunkOutcome::Duplicate;
    }

    // Buffer tumbuh mengikuti chunk yang datang, bukan dialokasikan penuh saat begin
    std::uint64_t offset = static_cast<std::uint64_t>(chunk.index) * chunk_size_;
    std::size_t end = static_cast<std::size_t>(offset + chunk.data.size());
    if (data_.size() < end) {
        data_.resize(end);
    }
    std::memcpy(data_.data() + offset, chunk.data.data(), chunk.data.size());
    chunks_.insert(chunk.index);
    ++pending_acks_;

    if (chunks_.complete()) {
        return verify();
    }
    if (pending_acks_ >= ack_every_) {
        return ChunkOutcome::AckDue;
    }
    return ChunkOutcome::Accepted;
}

IncomingTransfer::ChunkOutcome IncomingTransfer::verify() {
    if (phase_ != ReceiverPhase::Receiving || !chunks_.complete()) {
        return ChunkOutcome::Stale;
    }

    std::string actual = core::sha256Hex(data_);
    if (actual == checksum_) {
        phase_ = ReceiverPhase::Complete;
        pending_acks_ = 0;
        core::Logger::info("Transfer {} ({}) complete, {} bytes verified", id_, name_, total_size_);
        return ChunkOutcome::Completed;
    }

    core::Logger::warn("Transfer {} attempt {} checksum mismatch: expected {}, got {}",
                       id_, attempt_, checksum_, actual);
    phase_ = ReceiverPhase::Aborted;
    pending_acks_ = 0;
    // Tidak bisa tahu chunk mana yang rusak, kirim ulang semuanya
    resume_from_ = -1;
    return ChunkOutcome::ChecksumMismatch;
}

core::Result<void> IncomingTransfer::restart(const webrtc::FileControlMessage& begin) {
    if (begin.total_size != total_size_ || begin.chunk_size != chunk_size_ ||
        begin.chunk_count != chunk_count_ || begin.checksum != checksum_) {
        return {core::ErrorCode::InvalidArgument, "Retry does not match the announced transfer"};
    }
    if (begin.attempt <= attempt_) {
        return {core::ErrorCode::InvalidState, "Stale begin for attempt " + std::to_string(begin.attempt)};
    }

    attempt_ = begin.attempt;
    chunks_.truncate(resume_from_);
    phase_ = ReceiverPhase::Receiving;
    pending_acks_ = 0;
    core::Logger::info("Transfer {} restarting with attempt {} after chunk {}", id_, attempt_, resume_from_);
    return {};
}

void IncomingTransfer::abort() {
    if (phase_ == ReceiverPhase::Receiving) {
        phase_ = ReceiverPhase::Aborted;
    }
}

webrtc::FileControlMessage IncomingTransfer::ackMessage() {
    pending_acks_ = 0;

    webrtc::FileControlMessage msg;
    msg.action = webrtc::FileAction::Ack;
    msg.transfer_id = id_;
    msg.attempt = attempt_;
    msg.highest_contiguous = chunks_.highestContiguous();
    return msg;
}

webrtc::FileControlMessage IncomingTransfer::errorMessage(const std::string& reason) const {
    webrtc::FileControlMessage msg;
    msg.action = webrtc::FileAction::Error;
    msg.transfer_id = id_;
    msg.attempt = attempt_;
    msg.reason = reason;
    msg.resume_from = resume_from_;
    return msg;
}

core::ByteBuffer IncomingTransfer::takeData() {
    if (phase_ != ReceiverPhase::Complete) {
        throw core::Error(core::ErrorCode::InvalidState, "Transfer is not complete");
    }
    return std::move(data_);
}

TransferInfo IncomingTransfer::info() const {
    TransferInfo info;
    info.id = id_;
    info.direction = TransferDirection::Incoming;
    info.name = name_;
    info.total_size = total_size_;
    info.chunk_size = chunk_size_;
    info.chunk_count = chunk_count_;
    info.checksum = checksum_;
    info.attempt = attempt_;
    info.chunks_done = chunks_.size();

    switch (phase_) {
        case ReceiverPhase::Receiving:
            info.state = chunks_.size() == 0 ? TransferState::Announced : TransferState::InProgress;
            break;
        case ReceiverPhase::Complete: info.state = TransferState::Complete; break;
        case ReceiverPhase::Aborted: info.state = TransferState::Aborted; break;
    }
    return info;
}

std::uint32_t IncomingTransfer::expectedLength(std::uint32_t index) const {
    if (index + 1 < chunk_count_) {
        return chunk_size_;
    }
    return static_cast<std::uint32_t>(total_size_ - static_cast<std::uint64_t>(index) * chunk_size_);
}

} // namespace peerlink::transfer
