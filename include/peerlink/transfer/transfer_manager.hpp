#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/transfer/chunk_source.hpp>
#include <peerlink/transfer/incoming.hpp>
#include <peerlink/transfer/outgoing.hpp>
#include <peerlink/transfer/transfer.hpp>
#include <peerlink/webrtc/message.hpp>

namespace peerlink::transfer {

// Koneksi manager ke dunia luar; diisi oleh session
struct TransferHooks {
    std::function<core::Result<void>(const webrtc::DataChannelMessage&)> send;
    std::function<core::Reactor::TimerId(std::chrono::milliseconds, std::function<void()>)> schedule;
    std::function<void(core::Reactor::TimerId)> cancel;
};

class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void onFileReceived(const ReceivedFile& file) = 0;
    virtual void onTransferComplete(const TransferInfo& info) = 0;
    virtual void onTransferFailed(const TransferInfo& info, const core::Error& error) = 0;
};

/**
 * Semua transfer file dalam satu session, keluar maupun masuk.
 *
 * Tidak punya lock sendiri: pemanggil (session) menjamin akses serial,
 * termasuk untuk callback timer dari hooks. Id transfer dimulai dari
 * first_id dan naik 2, jadi kedua peer memakai ruang id yang terpisah.
 * Kegagalan satu transfer tidak mempengaruhi transfer lain.
 */
class TransferManager {
public:
    TransferManager(TransferSettings settings, std::uint32_t first_id,
                    TransferHooks hooks, TransferObserver* observer);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Kirim begin dan window pertama; mengembalikan id transfer
    core::Result<std::uint32_t> startTransfer(std::unique_ptr<ChunkSource> source);

    void handleControl(const webrtc::FileControlMessage& message);
    void handleChunk(const webrtc::FileChunkMessage& message);

    // UnknownTransfer kalau id tidak dikenal, InvalidState kalau sudah selesai
    core::Result<void> cancelTransfer(std::uint32_t id);

    // Hentikan semua transfer aktif tanpa retry
    void abortAll(bool notify_peer);

    // Transfer selesai hanya diingat untuk kFinishedHistory entri terakhir
    std::optional<TransferInfo> info(std::uint32_t id) const;
    std::vector<TransferInfo> list() const;
    std::size_t activeCount() const noexcept { return outgoing_.size() + incoming_.size(); }

    const TransferSettings& settings() const noexcept { return settings_; }

private:
    struct OutgoingEntry {
        std::unique_ptr<OutgoingTransfer> transfer;
        core::Reactor::TimerId ack_timer = core::Reactor::kInvalidTimer;
        std::uint64_t ack_generation = 0;
    };

    struct IncomingEntry {
        std::unique_ptr<IncomingTransfer> transfer;
        core::Reactor::TimerId delay_timer = core::Reactor::kInvalidTimer;
        std::uint64_t delay_generation = 0;
    };

    // Error dari hook (termasuk exception core::Error) dikembalikan sebagai Result
    core::Result<void> send(const webrtc::DataChannelMessage& message);

    // Outgoing
    void handleSenderControl(OutgoingEntry& entry, const webrtc::FileControlMessage& message);
    bool beginAttempt(OutgoingEntry& entry);
    bool pump(OutgoingEntry& entry);
    void armAckTimer(OutgoingEntry& entry);
    void onAckTimeout(std::uint32_t id, std::uint64_t generation);
    void finishOutgoing(std::uint32_t id);
    void failOutgoing(std::uint32_t id, const core::Error& error, bool notify_peer);

    // Incoming
    void handleBegin(const webrtc::FileControlMessage& message);
    void handleReceiverControl(IncomingEntry& entry, const webrtc::FileControlMessage& message);
    void armAckDelay(IncomingEntry& entry);
    void onAckDelay(std::uint32_t id, std::uint64_t generation);
    void sendAck(IncomingEntry& entry);
    void finishIncoming(std::uint32_t id);
    void failIncoming(std::uint32_t id, const core::Error& error, bool notify_peer);

    std::optional<std::filesystem::path> saveFile(const IncomingTransfer& transfer,
                                                  const core::ByteBuffer& data) const;

    void recordFinished(std::uint32_t id, const TransferInfo& info);
    bool isFinished(std::uint32_t id) const;

    void cancelTimer(core::Reactor::TimerId& timer);

    TransferSettings settings_;
    TransferHooks hooks_;
    TransferObserver* observer_;
    std::uint32_t next_id_;

    std::map<std::uint32_t, OutgoingEntry> outgoing_;
    std::map<std::uint32_t, IncomingEntry> incoming_;
    // Riwayat transfer selesai, dibatasi kFinishedHistory entri
    static constexpr std::size_t kFinishedHistory = 256;
    std::map<std::uint32_t, TransferInfo> finished_;
    std::uint32_t evicted_through_[2] = {0, 0};
};

} // namespace peerlink::transfer
