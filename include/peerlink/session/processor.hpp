#pragma once

#include <optional>
#include <string>

#include <peerlink/transfer/transfer.hpp>

namespace peerlink::session {

/**
 * Collaborator yang memproses konten dari peer (misalnya layanan LLM).
 *
 * Dipanggil dari worker pool, tidak pernah dari reactor. Jawaban yang tidak
 * kosong dikirim balik ke peer sebagai text response.
 */
class ContentProcessor {
public:
    virtual ~ContentProcessor() = default;

    virtual std::optional<std::string> processText(const std::string& session_id,
                                                   const std::string& text) = 0;

    virtual std::optional<std::string> processFile(const std::string& session_id,
                                                   const transfer::ReceivedFile& file) = 0;
};

// Placeholder: menjawab setiap text dan file
class EchoProcessor : public ContentProcessor {
public:
    std::optional<std::string> processText(const std::string& session_id,
                                           const std::string& text) override;

    std::optional<std::string> processFile(const std::string& session_id,
                                           const transfer::ReceivedFile& file) override;
};

} // namespace peerlink::session
