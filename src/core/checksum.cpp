#include <peerlink/core/checksum.hpp>

#include <openssl/evp.h>

namespace peerlink::core {

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw_error(ErrorCode::Unknown, "Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw_error(ErrorCode::Unknown, "Failed to initialize SHA-256 digest");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(const std::uint8_t* data, std::size_t size) {
    if (finished_) {
        throw_error(ErrorCode::InvalidState, "Digest already finalized");
    }
    if (size == 0) return;

    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw_error(ErrorCode::Unknown, "SHA-256 update failed");
    }
}

std::string Sha256::finalHex() {
    if (finished_) {
        throw_error(ErrorCode::InvalidState, "Digest already finalized");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw_error(ErrorCode::Unknown, "SHA-256 finalization failed");
    }
    finished_ = true;

    return bytesToHex(digest, length);
}

std::string sha256Hex(const std::uint8_t* data, std::size_t size) {
    Sha256 digest;
    digest.update(data, size);
    return digest.finalHex();
}

std::string bytesToHex(const std::uint8_t* data, std::size_t size) {
    static const char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kHex[data[i] >> 4]);
        out.push_back(kHex[data[i] & 0x0f]);
    }
    return out;
}

} // namespace peerlink::core
