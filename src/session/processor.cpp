#include <peerlink/session/processor.hpp>
#include <peerlink/core/logger.hpp>

namespace peerlink::session {

std::optional<std::string> EchoProcessor::processText(const std::string& session_id,
                                                      const std::string& text) {
    core::Logger::debug("[{}] processing text ({} bytes)", session_id, text.size());
    return "LLM response to: " + text;
}

std::optional<std::string> EchoProcessor::processFile(const std::string& session_id,
                                                      const transfer::ReceivedFile& file) {
    core::Logger::debug("[{}] processing file {} ({} bytes)", session_id, file.name, file.data.size());
    return "LLM processed file: " + file.name;
}

} // namespace peerlink::session
