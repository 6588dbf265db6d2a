#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <peerlink/core/buffer.hpp>
#include <peerlink/core/error.hpp>

struct evp_md_ctx_st;

namespace peerlink::core {

// SHA-256 inkremental di atas OpenSSL EVP
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const std::uint8_t* data, std::size_t size);
    void update(const ByteBuffer& data) { update(data.data(), data.size()); }

    // Hex lowercase; objek tidak bisa dipakai lagi setelah ini
    std::string finalHex();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finished_ = false;
};

std::string sha256Hex(const std::uint8_t* data, std::size_t size);

inline std::string sha256Hex(const ByteBuffer& data) {
    return sha256Hex(data.data(), data.size());
}

std::string bytesToHex(const std::uint8_t* data, std::size_t size);

} // namespace peerlink::core
