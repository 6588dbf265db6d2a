#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>
#include <peerlink/webrtc/message.hpp>

namespace peerlink::transfer {

// Parameter protokol transfer, dibaca dari konfigurasi session
struct TransferSettings {
    std::uint32_t chunk_size = 16 * 1024;
    std::uint32_t window_size = 32;
    std::uint32_t ack_every = 16;
    std::chrono::milliseconds ack_delay{50};
    std::chrono::milliseconds ack_timeout{2000};
    std::uint32_t retry_budget = 3;
    std::uint64_t max_file_size = 512ull * 1024 * 1024;
    // Begin baru ditolak kalau sudah sebanyak ini transfer masuk yang aktif
    std::uint32_t max_incoming = 4;
    std::size_t max_message_size = 64 * 1024;
    std::filesystem::path download_directory;

    // InvalidArgument kalau kombinasi setting tidak konsisten
    core::Result<void> validate() const;
};

enum class TransferDirection {
    Outgoing,
    Incoming
};

enum class TransferState {
    Announced,
    InProgress,
    Complete,
    Aborted
};

std::string toString(TransferDirection direction);
std::string toString(TransferState state);

// Snapshot status satu transfer
struct TransferInfo {
    std::uint32_t id = 0;
    TransferDirection direction = TransferDirection::Outgoing;
    std::string name;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;
    std::uint32_t attempt = 0;
    TransferState state = TransferState::Announced;
    // Chunk yang sudah di-ack (outgoing) atau diterima (incoming)
    std::uint32_t chunks_done = 0;
    std::string error;
};

struct ReceivedFile {
    std::uint32_t transfer_id = 0;
    std::string name;
    core::ByteBuffer data;
    std::string checksum;
    std::optional<std::filesystem::path> saved_path;
};

// Jumlah chunk untuk ukuran tertentu; 0 untuk file kosong
std::uint32_t chunkCountFor(std::uint64_t total_size, std::uint32_t chunk_size);

} // namespace peerlink::transfer
