#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <peerlink/transfer/chunk_source.hpp>
#include <peerlink/transfer/transfer.hpp>
#include <peerlink/webrtc/message.hpp>

namespace peerlink::transfer {

enum class SenderPhase {
    Announced,
    Sending,
    AwaitingAck,
    Complete,
    Aborted
};

std::string toString(SenderPhase phase);

/**
 * Sisi pengirim satu transfer.
 *
 * Tidak menyentuh jaringan atau timer; TransferManager yang mengirim pesan
 * hasilnya dan memanggil onAckTimeout() saat timer ack habis.
 * Paling banyak window_size chunk yang belum di-ack boleh in-flight.
 */
class OutgoingTransfer {
public:
    enum class AckOutcome {
        Progress,
        Stale,
        Completed
    };

    enum class ErrorOutcome {
        Retry,
        Fail,
        Aborted,
        Stale
    };

    enum class TimeoutOutcome {
        Retransmit,
        Fail,
        Ignored
    };

    // Throw core::Error kalau checksum sumber tidak bisa dihitung
    OutgoingTransfer(std::uint32_t id, std::unique_ptr<ChunkSource> source,
                     const TransferSettings& settings);

    std::uint32_t id() const noexcept { return id_; }
    const std::string& name() const { return source_->name(); }
    std::uint64_t totalSize() const noexcept { return total_size_; }
    std::uint32_t chunkSize() const noexcept { return chunk_size_; }
    std::uint32_t chunkCount() const noexcept { return chunk_count_; }
    const std::string& checksum() const noexcept { return checksum_; }
    std::uint32_t attempt() const noexcept { return attempt_; }
    SenderPhase phase() const noexcept { return phase_; }
    std::uint32_t retries() const noexcept { return retries_; }
    std::uint32_t consecutiveTimeouts() const noexcept { return consecutive_timeouts_; }

    // Index tertinggi yang sudah di-ack berurutan
    std::int64_t acknowledged() const noexcept { return acked_; }

    std::uint32_t inFlight() const noexcept {
        return static_cast<std::uint32_t>(static_cast<std::int64_t>(next_index_) - (acked_ + 1));
    }

    bool active() const noexcept {
        return phase_ != SenderPhase::Complete && phase_ != SenderPhase::Aborted;
    }

    // Mulai attempt baru dari resume point terakhir
    webrtc::FileControlMessage begin();

    // Chunk berikutnya yang muat di window
    std::vector<webrtc::FileChunkMessage> nextChunks();

    // Chunk yang sudah dikirim tapi belum di-ack
    std::vector<webrtc::FileChunkMessage> retransmitWindow();

    AckOutcome onAck(std::uint32_t attempt, std::int64_t highest_contiguous);
    ErrorOutcome onError(std::uint32_t attempt, const std::string& reason, std::int64_t resume_from);
    TimeoutOutcome onAckTimeout();

    void abort();

    TransferInfo info() const;

private:
    webrtc::FileChunkMessage makeChunk(std::uint32_t index);

    std::uint32_t id_;
    std::unique_ptr<ChunkSource> source_;
    std::uint32_t window_size_;
    std::uint32_t retry_budget_;

    std::uint64_t total_size_;
    std::uint32_t chunk_size_;
    std::uint32_t chunk_count_;
    std::string checksum_;

    SenderPhase phase_ = SenderPhase::Announced;
    std::uint32_t attempt_ = 0;
    std::int64_t acked_ = -1;
    std::uint32_t next_index_ = 0;
    std::int64_t resume_from_ = -1;
    std::uint32_t retries_ = 0;
    std::uint32_t consecutive_timeouts_ = 0;
};

} // namespace peerlink::transfer
