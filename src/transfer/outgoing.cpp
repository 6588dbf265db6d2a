#include <peerlink/transfer/outgoing.hpp>
#include <peerlink/core/logger.hpp>

#include <algorithm>

namespace peerlink::transfer {

std::string toString(SenderPhase phase) {
    switch (phase) {
        case SenderPhase::Announced: return "announced";
        case SenderPhase::Sending: return "sending";
        case SenderPhase::AwaitingAck: return "awaiting-ack";
        case SenderPhase::Complete: return "complete";
        case SenderPhase::Aborted: return "aborted";
    }
    return "unknown";
}

OutgoingTransfer::OutgoingTransfer(std::uint32_t id, std::unique_ptr<ChunkSource> source,
                                   const TransferSettings& settings)
    : id_(id),
      source_(std::move(source)),
      window_size_(std::max<std::uint32_t>(settings.window_size, 1)),
      retry_budget_(settings.retry_budget),
      total_size_(source_->size()),
      chunk_size_(settings.chunk_size),
      chunk_count_(chunkCountFor(total_size_, settings.chunk_size)),
      checksum_(source_->checksum()) {}

webrtc::FileControlMessage OutgoingTransfer::begin() {
    ++attempt_;
    acked_ = resume_from_;
    next_index_ = static_cast<std::uint32_t>(resume_from_ + 1);
    consecutive_timeouts_ = 0;
    phase_ = chunk_count_ == 0 ? SenderPhase::AwaitingAck : SenderPhase::Sending;

    core::Logger::debug("Transfer {} attempt {} starting at chunk {}", id_, attempt_, next_index_);

    webrtc::FileControlMessage msg;
    msg.action = webrtc::FileAction::Begin;
    msg.transfer_id = id_;
    msg.attempt = attempt_;
    msg.name = source_->name();
    msg.total_size = total_size_;
    msg.chunk_size = chunk_size_;
    msg.chunk_count = chunk_count_;
    msg.checksum = checksum_;
    return msg;
}

std::vector<webrtc::FileChunkMessage> OutgoingTransfer::nextChunks() {
    std::vector<webrtc::FileChunkMessage> chunks;
    if (phase_ != SenderPhase::Sending) {
        return chunks;
    }

    while (next_index_ < chunk_count_ && inFlight() < window_size_) {
        chunks.push_back(makeChunk(next_index_));
        ++next_index_;
    }

    if (next_index_ == chunk_count_) {
        phase_ = SenderPhase::AwaitingAck;
    }
    return chunks;
}

std::vector<webrtc::FileChunkMessage> OutgoingTransfer::retransmitWindow() {
    std::vector<webrtc::FileChunkMessage> chunks;
    if (!active()) return chunks;

    for (auto index = static_cast<std::uint32_t>(acked_ + 1); index < next_index_; ++index) {
        chunks.push_back(makeChunk(index));
    }
    return chunks;
}

OutgoingTransfer::AckOutcome OutgoingTransfer::onAck(std::uint32_t attempt, std::int64_t highest_contiguous) {
    if (!active() || attempt != attempt_) {
        return AckOutcome::Stale;
    }

    // Ack final hanya dikirim setelah checksum cocok
    if (highest_contiguous == static_cast<std::int64_t>(chunk_count_) - 1) {
        acked_ = highest_contiguous;
        phase_ = SenderPhase::Complete;
        return AckOutcome::Completed;
    }

    auto highest_sent = static_cast<std::int64_t>(next_index_) - 1;
    if (highest_contiguous <= acked_ || highest_contiguous > highest_sent) {
        return AckOutcome::Stale;
    }

    acked_ = highest_contiguous;
    consecutive_timeouts_ = 0;
    return AckOutcome::Progress;
}

OutgoingTransfer::ErrorOutcome OutgoingTransfer::onError(std::uint32_t attempt,
                                                         const std::string& reason,
                                                         std::int64_t resume_from) {
    if (!active()) {
        return ErrorOutcome::Stale;
    }

    if (reason == webrtc::kReasonAborted) {
        phase_ = SenderPhase::Aborted;
        return ErrorOutcome::Aborted;
    }

    if (attempt != attempt_) {
        return ErrorOutcome::Stale;
    }

    if (reason != webrtc::kReasonChecksumMismatch) {
        phase_ = SenderPhase::Aborted;
        return ErrorOutcome::Fail;
    }

    if (retries_ >= retry_budget_) {
        phase_ = SenderPhase::Aborted;
        return ErrorOutcome::Fail;
    }

    ++retries_;
    resume_from_ = std::clamp<std::int64_t>(resume_from, -1, static_cast<std::int64_t>(chunk_count_) - 1);
    phase_ = SenderPhase::Announced;
    core::Logger::info("Transfer {} retry {}/{} from chunk {}", id_, retries_, retry_budget_, resume_from_ + 1);
    return ErrorOutcome::Retry;
}

OutgoingTransfer::TimeoutOutcome OutgoingTransfer::onAckTimeout() {
    if (phase_ != SenderPhase::Sending && phase_ != SenderPhase::AwaitingAck) {
        return TimeoutOutcome::Ignored;
    }

    ++consecutive_timeouts_;
    if (consecutive_timeouts_ > retry_budget_) {
        phase_ = SenderPhase::Aborted;
        return TimeoutOutcome::Fail;
    }
    return TimeoutOutcome::Retransmit;
}

void OutgoingTransfer::abort() {
    if (active()) {
        phase_ = SenderPhase::Aborted;
    }
}

TransferInfo OutgoingTransfer::info() const {
    TransferInfo info;
    info.id = id_;
    info.direction = TransferDirection::Outgoing;
    info.name = source_->name();
    info.total_size = total_size_;
    info.chunk_size = chunk_size_;
    info.chunk_count = chunk_count_;
    info.checksum = checksum_;
    info.attempt = attempt_;
    info.chunks_done = static_cast<std::uint32_t>(acked_ + 1);

    switch (phase_) {
        case SenderPhase::Announced: info.state = TransferState::Announced; break;
        case SenderPhase::Sending:
        case SenderPhase::AwaitingAck: info.state = TransferState::InProgress; break;
        case SenderPhase::Complete: info.state = TransferState::Complete; break;
        case SenderPhase::Aborted: info.state = TransferState::Aborted; break;
    }
    return info;
}

webrtc::FileChunkMessage OutgoingTransfer::makeChunk(std::uint32_t index) {
    std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size_;
    auto length = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, total_size_ - offset));

    webrtc::FileChunkMessage chunk;
    chunk.transfer_id = id_;
    chunk.attempt = attempt_;
    chunk.index = index;
    chunk.data = source_->read(offset, length);
    return chunk;
}

} // namespace peerlink::transfer
