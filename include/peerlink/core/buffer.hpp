#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <peerlink/core/error.hpp>

namespace peerlink::core {

using ByteBuffer = std::vector<std::uint8_t>;

inline ByteBuffer to_bytes(std::string_view str) {
    return ByteBuffer(str.begin(), str.end());
}

inline std::string to_string(const ByteBuffer& buffer) {
    return std::string(buffer.begin(), buffer.end());
}

// Writer untuk framing biner, network byte order
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::size_t reserve) { data_.reserve(reserve); }

    void writeU8(std::uint8_t value) {
        data_.push_back(value);
    }

    void writeU16(std::uint16_t value) {
        data_.push_back(static_cast<std::uint8_t>(value >> 8));
        data_.push_back(static_cast<std::uint8_t>(value));
    }

    void writeU32(std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            data_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void writeU64(std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            data_.push_back(static_cast<std::uint8_t>(value >> shift));
        }
    }

    void writeBytes(const std::uint8_t* data, std::size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    void writeBytes(const ByteBuffer& data) {
        writeBytes(data.data(), data.size());
    }

    std::size_t size() const noexcept { return data_.size(); }
    const ByteBuffer& data() const noexcept { return data_; }
    ByteBuffer release() { return std::move(data_); }

private:
    ByteBuffer data_;
};

// Reader untuk framing biner; throw InvalidData kalau buffer underflow
class ByteReader {
public:
    ByteReader(const std::uint8_t* data, std::size_t size)
        : data_(data), size_(size) {}

    explicit ByteReader(const ByteBuffer& buffer)
        : data_(buffer.data()), size_(buffer.size()) {}

    std::uint8_t readU8() {
        require(1);
        return data_[pos_++];
    }

    std::uint16_t readU16() {
        require(2);
        std::uint16_t value = static_cast<std::uint16_t>(
            (static_cast<std::uint16_t>(data_[pos_]) << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    std::uint32_t readU32() {
        require(4);
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return value;
    }

    std::uint64_t readU64() {
        require(8);
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return value;
    }

    ByteBuffer readBytes(std::size_t size) {
        require(size);
        ByteBuffer out(data_ + pos_, data_ + pos_ + size);
        pos_ += size;
        return out;
    }

    ByteBuffer readRemaining() {
        return readBytes(remaining());
    }

    std::size_t remaining() const noexcept { return size_ - pos_; }
    std::size_t position() const noexcept { return pos_; }

private:
    void require(std::size_t count) const {
        if (count > size_ - pos_) {
            throw_error(ErrorCode::InvalidData, "Buffer underflow");
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
};

} // namespace peerlink::core
