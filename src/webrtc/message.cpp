#include <peerlink/webrtc/message.hpp>
#include <nlohmann/json.hpp>

#include <limits>

namespace peerlink::webrtc {

namespace {

std::string actionToString(FileAction action) {
    switch (action) {
        case FileAction::Begin: return "begin";
        case FileAction::Ack: return "ack";
        case FileAction::Error: return "error";
    }
    return "unknown";
}

FileAction actionFromString(const std::string& action) {
    if (action == "begin") return FileAction::Begin;
    if (action == "ack") return FileAction::Ack;
    if (action == "error") return FileAction::Error;
    throw core::Error(core::ErrorCode::InvalidData, "Unknown file-control action: " + action);
}

nlohmann::json encodeFileControl(const FileControlMessage& msg) {
    nlohmann::json j;
    j["kind"] = toString(MessageKind::FileControl);
    j["action"] = actionToString(msg.action);
    j["transferId"] = msg.transfer_id;
    j["attempt"] = msg.attempt;

    switch (msg.action) {
        case FileAction::Begin:
            j["name"] = msg.name;
            j["totalSize"] = msg.total_size;
            j["chunkSize"] = msg.chunk_size;
            j["chunkCount"] = msg.chunk_count;
            j["checksum"] = msg.checksum;
            break;
        case FileAction::Ack:
            j["highestContiguous"] = msg.highest_contiguous;
            break;
        case FileAction::Error:
            j["reason"] = msg.reason;
            j["resumeFrom"] = msg.resume_from;
            break;
    }
    return j;
}

// get<uint32_t>() membungkus angka negatif tanpa error
template <typename T>
T unsignedField(const nlohmann::json& j, const char* key) {
    const auto& value = j.at(key);
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<std::int64_t>() >= 0)) {
        throw core::Error(core::ErrorCode::InvalidData,
                          std::string("Field '") + key + "' must be a non-negative integer");
    }
    auto raw = value.get<std::uint64_t>();
    if constexpr (sizeof(T) < sizeof(std::uint64_t)) {
        if (raw > std::numeric_limits<T>::max()) {
            throw core::Error(core::ErrorCode::InvalidData, std::string("Field '") + key + "' out of range");
        }
    }
    return static_cast<T>(raw);
}

FileControlMessage decodeFileControl(const nlohmann::json& j) {
    FileControlMessage msg;
    msg.action = actionFromString(j.at("action").get<std::string>());
    msg.transfer_id = unsignedField<std::uint32_t>(j, "transferId");
    msg.attempt = j.contains("attempt") ? unsignedField<std::uint32_t>(j, "attempt") : 0u;

    switch (msg.action) {
        case FileAction::Begin:
            msg.name = j.value("name", std::string());
            msg.total_size = unsignedField<std::uint64_t>(j, "totalSize");
            msg.chunk_size = unsignedField<std::uint32_t>(j, "chunkSize");
            msg.chunk_count = unsignedField<std::uint32_t>(j, "chunkCount");
            msg.checksum = j.at("checksum").get<std::string>();
            break;
        case FileAction::Ack:
            msg.highest_contiguous = j.at("highestContiguous").get<std::int64_t>();
            break;
        case FileAction::Error:
            msg.reason = j.at("reason").get<std::string>();
            msg.resume_from = j.value("resumeFrom", static_cast<std::int64_t>(-1));
            break;
    }
    return msg;
}

} // namespace

std::string toString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Text: return "text";
        case MessageKind::FileControl: return "file-control";
        case MessageKind::FileChunk: return "file-chunk";
        case MessageKind::MediaControl: return "media-control";
    }
    return "unknown";
}

MessageKind kindOf(const DataChannelMessage& message) {
    return static_cast<MessageKind>(message.index());
}

EncodedFrame encodeMessage(const DataChannelMessage& message) {
    EncodedFrame frame;

    try {
        if (const auto* text = std::get_if<TextMessage>(&message)) {
            nlohmann::json j;
            j["kind"] = toString(MessageKind::Text);
            j["data"] = text->body;
            if (text->response) {
                j["response"] = true;
            }
            frame.text = j.dump();
        }
        else if (const auto* control = std::get_if<FileControlMessage>(&message)) {
            frame.text = encodeFileControl(*control).dump();
        }
        else if (const auto* chunk = std::get_if<FileChunkMessage>(&message)) {
            core::ByteWriter writer(kChunkHeaderSize + chunk->data.size());
            writer.writeU8(kChunkFrameTag);
            writer.writeU32(chunk->transfer_id);
            writer.writeU32(chunk->attempt);
            writer.writeU32(chunk->index);
            writer.writeBytes(chunk->data);
            frame.binary = true;
            frame.bytes = writer.release();
        }
        else if (const auto* media = std::get_if<MediaControlMessage>(&message)) {
            nlohmann::json j;
            j["kind"] = toString(MessageKind::MediaControl);
            j["payload"] = media->payload;
            frame.text = j.dump();
        }
    }
    catch (const nlohmann::json::exception& e) {
        // dump() menolak string yang bukan UTF-8
        throw core::Error(core::ErrorCode::InvalidArgument,
                          "Message cannot be encoded: " + std::string(e.what()));
    }

    return frame;
}

DataChannelMessage decodeTextFrame(const std::string& frame) {
    try {
        auto j = nlohmann::json::parse(frame);
        if (!j.is_object()) {
            throw core::Error(core::ErrorCode::InvalidData, "Frame is not a JSON object");
        }

        std::string kind = j.at("kind").get<std::string>();
        if (kind == "text") {
            TextMessage text;
            text.body = j.at("data").get<std::string>();
            text.response = j.value("response", false);
            return text;
        }
        if (kind == "file-control") {
            return decodeFileControl(j);
        }
        if (kind == "media-control") {
            MediaControlMessage media;
            media.payload = j.at("payload").get<std::string>();
            return media;
        }

        throw core::Error(core::ErrorCode::InvalidData, "Unknown message kind: " + kind);
    }
    catch (const nlohmann::json::exception& e) {
        throw core::Error(core::ErrorCode::InvalidData,
                          "Malformed control frame: " + std::string(e.what()));
    }
}

DataChannelMessage decodeBinaryFrame(const core::ByteBuffer& frame) {
    core::ByteReader reader(frame);

    std::uint8_t tag = reader.readU8();
    if (tag != kChunkFrameTag) {
        throw core::Error(core::ErrorCode::InvalidData,
                          "Unknown binary frame tag " + std::to_string(tag));
    }

    FileChunkMessage chunk;
    chunk.transfer_id = reader.readU32();
    chunk.attempt = reader.readU32();
    chunk.index = reader.readU32();
    chunk.data = reader.readRemaining();
    return chunk;
}

} // namespace peerlink::webrtc
