#include <peerlink/core/error.hpp>
#include <unordered_map>

namespace peerlink::core {

namespace {
    const std::unordered_map<ErrorCode, const char*> ERROR_MESSAGES = {
        // System errors
        {ErrorCode::Success, "Success"},
        {ErrorCode::Unknown, "Unknown error"},
        {ErrorCode::InvalidArgument, "Invalid argument"},
        {ErrorCode::InvalidState, "Invalid state"},
        {ErrorCode::NotSupported, "Not supported"},
        {ErrorCode::Timeout, "Timeout"},

        // Connection errors
        {ErrorCode::NegotiationError, "Negotiation failed"},
        {ErrorCode::TransportError, "Transport error"},
        {ErrorCode::ChannelNotOpen, "Channel not open"},
        {ErrorCode::ConnectionClosed, "Connection closed"},

        // Transfer errors
        {ErrorCode::ChecksumMismatch, "Checksum mismatch"},
        {ErrorCode::TransferFailed, "Transfer failed"},
        {ErrorCode::TransferAborted, "Transfer aborted"},
        {ErrorCode::UnknownTransfer, "Unknown transfer"},

        // Resource errors
        {ErrorCode::FileNotFound, "File not found"},
        {ErrorCode::FileAccessDenied, "File access denied"},
        {ErrorCode::InvalidData, "Invalid data"}
    };

    const std::unordered_map<ErrorCode, std::error_condition> ERROR_CONDITIONS = {
        {ErrorCode::InvalidArgument, std::errc::invalid_argument},
        {ErrorCode::Timeout, std::errc::timed_out},
        {ErrorCode::TransportError, std::errc::network_unreachable},
        {ErrorCode::ChannelNotOpen, std::errc::not_connected},
        {ErrorCode::ConnectionClosed, std::errc::connection_reset},
        {ErrorCode::TransferAborted, std::errc::operation_canceled},
        {ErrorCode::FileNotFound, std::errc::no_such_file_or_directory},
        {ErrorCode::FileAccessDenied, std::errc::permission_denied},
        {ErrorCode::InvalidData, std::errc::illegal_byte_sequence}
    };
}

std::string ErrorCategory::message(int ev) const {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_MESSAGES.find(code);
    return it != ERROR_MESSAGES.end() ? it->second : "Unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int ev) const noexcept {
    auto code = static_cast<ErrorCode>(ev);
    auto it = ERROR_CONDITIONS.find(code);
    return it != ERROR_CONDITIONS.end() ? it->second : std::error_condition(ev, *this);
}

} // namespace peerlink::core
