#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>

namespace peerlink::webrtc {

enum class MessageKind {
    Text,
    FileControl,
    FileChunk,
    MediaControl
};

std::string toString(MessageKind kind);

struct TextMessage {
    std::string body;
    // Jawaban dari processor; tidak diproses ulang oleh penerima
    bool response = false;
};

enum class FileAction {
    Begin,
    Ack,
    Error
};

// Alasan pada file-control error
inline constexpr const char* kReasonChecksumMismatch = "checksum-mismatch";
inline constexpr const char* kReasonAborted = "aborted";
inline constexpr const char* kReasonRejected = "rejected";

struct FileControlMessage {
    FileAction action = FileAction::Begin;
    std::uint32_t transfer_id = 0;
    std::uint32_t attempt = 0;

    // begin
    std::string name;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint32_t chunk_count = 0;
    std::string checksum;

    // ack; -1 berarti belum ada chunk berurutan dari index 0
    std::int64_t highest_contiguous = -1;

    // error
    std::string reason;
    std::int64_t resume_from = -1;
};

struct FileChunkMessage {
    std::uint32_t transfer_id = 0;
    std::uint32_t attempt = 0;
    std::uint32_t index = 0;
    core::ByteBuffer data;
};

struct MediaControlMessage {
    std::string payload;
};

using DataChannelMessage =
    std::variant<TextMessage, FileControlMessage, FileChunkMessage, MediaControlMessage>;

MessageKind kindOf(const DataChannelMessage& message);

// Frame chunk: [tag][transfer id][attempt][index][data], integer big-endian
inline constexpr std::uint8_t kChunkFrameTag = 0x02;
inline constexpr std::size_t kChunkHeaderSize = 13;

// Hasil encode: string frame untuk JSON, binary frame untuk chunk
struct EncodedFrame {
    bool binary = false;
    std::string text;
    core::ByteBuffer bytes;

    std::size_t size() const { return binary ? bytes.size() : text.size(); }
};

// Throws core::Error InvalidArgument kalau string di pesan bukan UTF-8 valid
EncodedFrame encodeMessage(const DataChannelMessage& message);

// Throw core::Error(InvalidData) untuk frame yang tidak bisa di-decode
DataChannelMessage decodeTextFrame(const std::string& frame);
DataChannelMessage decodeBinaryFrame(const core::ByteBuffer& frame);

} // namespace peerlink::webrtc
