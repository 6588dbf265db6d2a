#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/transfer/chunk_set.hpp>
#include <peerlink/transfer/transfer.hpp>
#include <peerlink/webrtc/message.hpp>

namespace peerlink::transfer {

enum class ReceiverPhase {
    Receiving,
    Complete,
    Aborted
};

std::string toString(ReceiverPhase phase);

/**
 * Sisi penerima satu transfer: reassembly per index, deteksi gap,
 * batching ack dan verifikasi checksum.
 */
class IncomingTransfer {
public:
    enum class ChunkOutcome {
        Accepted,
        AckDue,
        Duplicate,
        Stale,
        Rejected,
        Completed,
        ChecksumMismatch
    };

    // InvalidArgument kalau begin tidak konsisten atau melanggar batas
    static core::Result<std::unique_ptr<IncomingTransfer>> fromBegin(
        const webrtc::FileControlMessage& begin, const TransferSettings& settings);

    std::uint32_t id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }
    std::uint64_t totalSize() const noexcept { return total_size_; }
    std::uint32_t chunkCount() const noexcept { return chunk_count_; }
    const std::string& checksum() const noexcept { return checksum_; }
    std::uint32_t attempt() const noexcept { return attempt_; }
    ReceiverPhase phase() const noexcept { return phase_; }
    std::uint32_t received() const noexcept { return chunks_.size(); }
    std::int64_t highestContiguous() const noexcept { return chunks_.highestContiguous(); }
    std::uint32_t pendingAcks() const noexcept { return pending_acks_; }
    bool complete() const noexcept { return phase_ == ReceiverPhase::Complete; }

    ChunkOutcome onChunk(const webrtc::FileChunkMessage& chunk);

    // Attempt baru dari pengirim; chunk sampai resume point dipertahankan
    core::Result<void> restart(const webrtc::FileControlMessage& begin);

    // Verifikasi manual, dipakai untuk transfer tanpa chunk
    ChunkOutcome verify();

    void abort();

    // Ack dengan index berurutan tertinggi; mereset hitungan ack tertunda
    webrtc::FileControlMessage ackMessage();
    webrtc::FileControlMessage errorMessage(const std::string& reason) const;

    // Isi file; hanya valid setelah Complete
    core::ByteBuffer takeData();

    TransferInfo info() const;

private:
    IncomingTransfer(const webrtc::FileControlMessage& begin, const TransferSettings& settings);

    std::uint32_t expectedLength(std::uint32_t index) const;

    std::uint32_t id_;
    std::string name_;
    std::uint64_t total_size_;
    std::uint32_t chunk_size_;
    std::uint32_t chunk_count_;
    std::string checksum_;
    std::uint32_t ack_every_;

    std::uint32_t attempt_;
    ReceiverPhase phase_ = ReceiverPhase::Receiving;
    ChunkIndexSet chunks_;
    core::ByteBuffer data_;
    std::uint32_t pending_acks_ = 0;
    std::int64_t resume_from_ = -1;
};

} // namespace peerlink::transfer
