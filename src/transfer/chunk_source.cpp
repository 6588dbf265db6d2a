#include <peerlink/transfer/chunk_source.hpp>
#include <peerlink/core/checksum.hpp>
#include <peerlink/core/logger.hpp>

#include <system_error>

namespace peerlink::transfer {

// MemoryChunkSource implementation
MemoryChunkSource::MemoryChunkSource(std::string name, core::ByteBuffer data)
    : name_(std::move(name)), data_(std::move(data)) {}

core::ByteBuffer MemoryChunkSource::read(std::uint64_t offset, std::size_t length) {
    if (offset > data_.size() || length > data_.size() - offset) {
        throw core::Error(core::ErrorCode::InvalidArgument, "Read beyond end of " + name_);
    }
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return core::ByteBuffer(begin, begin + static_cast<std::ptrdiff_t>(length));
}

std::string MemoryChunkSource::checksum() {
    if (checksum_.empty()) {
        checksum_ = core::sha256Hex(data_);
    }
    return checksum_;
}

// FileChunkSource implementation
core::Result<std::unique_ptr<ChunkSource>> FileChunkSource::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return {core::ErrorCode::FileNotFound, "File not found: " + path.string()};
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return {core::ErrorCode::InvalidArgument, "Not a regular file: " + path.string()};
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return {core::ErrorCode::FileAccessDenied,
                "Cannot stat " + path.string() + ": " + ec.message()};
    }

    std::unique_ptr<FileChunkSource> source(new FileChunkSource(path, size));
    if (!source->stream_.is_open()) {
        return {core::ErrorCode::FileAccessDenied, "Cannot open " + path.string()};
    }

    core::Logger::debug("Opened {} ({} bytes) for transfer", path.string(), size);
    return std::unique_ptr<ChunkSource>(std::move(source));
}

FileChunkSource::FileChunkSource(std::filesystem::path path, std::uint64_t size)
    : path_(std::move(path)),
      name_(path_.filename().string()),
      size_(size),
      stream_(path_, std::ios::binary) {}

core::ByteBuffer FileChunkSource::read(std::uint64_t offset, std::size_t length) {
    if (offset > size_ || length > size_ - offset) {
        throw core::Error(core::ErrorCode::InvalidArgument, "Read beyond end of " + name_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    core::ByteBuffer buffer(length);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(stream_.gcount()) != length) {
        throw core::Error(core::ErrorCode::FileAccessDenied,
                          "Short read from " + path_.string());
    }
    return buffer;
}

std::string FileChunkSource::checksum() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checksum_.empty()) return checksum_;

    core::Sha256 digest;
    core::ByteBuffer buffer(64 * 1024);
    stream_.clear();
    stream_.seekg(0);

    std::uint64_t remaining = size_;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
        stream_.read(reinterpret_cast<char*>(buffer.data()), want);
        auto got = stream_.gcount();
        if (got <= 0) {
            throw core::Error(core::ErrorCode::FileAccessDenied,
                              "Short read while hashing " + path_.string());
        }
        digest.update(buffer.data(), static_cast<std::size_t>(got));
        remaining -= static_cast<std::uint64_t>(got);
    }

    checksum_ = digest.finalHex();
    return checksum_;
}

} // namespace peerlink::transfer
