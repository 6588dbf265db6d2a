#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>

namespace peerlink::transfer {

// Sumber byte untuk transfer keluar
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual const std::string& name() const = 0;
    virtual std::uint64_t size() const = 0;

    // Throw core::Error kalau range tidak valid atau pembacaan gagal
    virtual core::ByteBuffer read(std::uint64_t offset, std::size_t length) = 0;

    // SHA-256 hex seluruh isi
    virtual std::string checksum() = 0;
};

class MemoryChunkSource : public ChunkSource {
public:
    MemoryChunkSource(std::string name, core::ByteBuffer data);

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return data_.size(); }
    core::ByteBuffer read(std::uint64_t offset, std::size_t length) override;
    std::string checksum() override;

private:
    std::string name_;
    core::ByteBuffer data_;
    std::string checksum_;
};

class FileChunkSource : public ChunkSource {
public:
    static core::Result<std::unique_ptr<ChunkSource>> open(const std::filesystem::path& path);

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return size_; }
    core::ByteBuffer read(std::uint64_t offset, std::size_t length) override;
    std::string checksum() override;

private:
    FileChunkSource(std::filesystem::path path, std::uint64_t size);

    std::filesystem::path path_;
    std::string name_;
    std::uint64_t size_;
    std::ifstream stream_;
    std::string checksum_;
    std::mutex mutex_;
};

} // namespace peerlink::transfer
