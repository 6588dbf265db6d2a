#include <peerlink/session/session_config.hpp>

namespace peerlink::session {

namespace {

core::Result<std::int64_t> readInt(const core::ConfigNode& node, const std::string& key, std::int64_t fallback) {
    if (!node.has(key)) {
        return fallback;
    }
    auto value = node.get<std::int64_t>(key);
    if (value.is_error()) {
        return value.error();
    }
    if (value.value() < 0) {
        return {core::ErrorCode::InvalidArgument, key + " must not be negative"};
    }
    return value.value();
}

core::Result<std::string> readString(const core::ConfigNode& node, const std::string& key,
                                     const std::string& fallback) {
    if (!node.has(key)) {
        return fallback;
    }
    return node.get<std::string>(key);
}

core::Result<webrtc::IceServer> readIceServer(const core::ConfigValue& value) {
    if (const auto* url = std::get_if<std::string>(&value.base())) {
        return webrtc::IceServer{*url, std::nullopt, std::nullopt};
    }

    const auto* object = std::get_if<core::ConfigNodePtr>(&value.base());
    if (!object || !*object) {
        return {core::ErrorCode::InvalidData, "ice_servers entries must be strings or objects"};
    }

    auto urls = (*object)->get<std::string>("urls");
    if (urls.is_error()) {
        return urls.error();
    }

    webrtc::IceServer server;
    server.urls = urls.value();
    if ((*object)->has("username")) {
        server.username = (*object)->getOr<std::string>("username", "");
    }
    if ((*object)->has("credential")) {
        server.credential = (*object)->getOr<std::string>("credential", "");
    }
    return server;
}

} // namespace

core::Result<SessionConfig> SessionConfig::fromConfig(const core::ConfigNode& node) {
    SessionConfig config;

    auto role = readString(node, "role", "offerer");
    if (role.is_error()) return role.error();
    if (role.value() == "offerer") {
        config.role = webrtc::PeerRole::Offerer;
    } else if (role.value() == "answerer") {
        config.role = webrtc::PeerRole::Answerer;
    } else {
        return {core::ErrorCode::InvalidArgument, "role must be offerer or answerer, got " + role.value()};
    }

    auto endpoint = readString(node, "endpoint", config.endpoint);
    if (endpoint.is_error()) return endpoint.error();
    config.endpoint = endpoint.value();

    if (node.has("ice_servers")) {
        auto servers = node.get<core::ConfigArray>("ice_servers");
        if (servers.is_error()) return servers.error();
        for (const auto& entry : servers.value()) {
            auto server = readIceServer(entry);
            if (server.is_error()) return server.error();
            config.peer.ice_servers.push_back(server.value());
        }
    }

    // Semua integer dibaca lewat satu jalur supaya pesan error seragam
    struct IntField {
        const char* key;
        std::int64_t fallback;
        std::int64_t* out;
    };

    std::int64_t negotiation_ms = config.negotiation_timeout.count();
    std::int64_t reconnect_attempts = config.reconnect_attempts;
    std::int64_t reconnect_ms = config.reconnect_interval.count();
    std::int64_t max_message_size = static_cast<std::int64_t>(config.transfer.max_message_size);
    std::int64_t chunk_size = config.transfer.chunk_size;
    std::int64_t window_size = config.transfer.window_size;
    std::int64_t ack_every = config.transfer.ack_every;
    std::int64_t ack_delay_ms = config.transfer.ack_delay.count();
    std::int64_t ack_timeout_ms = config.transfer.ack_timeout.count();
    std::int64_t retry_budget = config.transfer.retry_budget;
    std::int64_t max_file_size = static_cast<std::int64_t>(config.transfer.max_file_size);
    std::int64_t max_incoming = config.transfer.max_incoming;
    std::int64_t media_queue_depth = static_cast<std::int64_t>(config.media_queue_depth);

    const IntField fields[] = {
        {"negotiation_timeout_ms", negotiation_ms, &negotiation_ms},
        {"reconnect_attempts", reconnect_attempts, &reconnect_attempts},
        {"reconnect_interval_ms", reconnect_ms, &reconnect_ms},
        {"max_message_size", max_message_size, &max_message_size},
        {"chunk_size", chunk_size, &chunk_size},
        {"window_size", window_size, &window_size},
        {"ack_every", ack_every, &ack_every},
        {"ack_delay_ms", ack_delay_ms, &ack_delay_ms},
        {"ack_timeout_ms", ack_timeout_ms, &ack_timeout_ms},
        {"retry_budget", retry_budget, &retry_budget},
        {"max_file_size", max_file_size, &max_file_size},
        {"max_incoming_transfers", max_incoming, &max_incoming},
        {"media_queue_depth", media_queue_depth, &media_queue_depth},
    };

    for (const auto& field : fields) {
        auto value = readInt(node, field.key, field.fallback);
        if (value.is_error()) return value.error();
        *field.out = value.value();
    }

    config.negotiation_timeout = std::chrono::milliseconds(negotiation_ms);
    config.reconnect_attempts = static_cast<int>(reconnect_attempts);
    config.reconnect_interval = std::chrono::milliseconds(reconnect_ms);
    config.transfer.max_message_size = static_cast<std::size_t>(max_message_size);
    config.transfer.chunk_size = static_cast<std::uint32_t>(chunk_size);
    config.transfer.window_size = static_cast<std::uint32_t>(window_size);
    config.transfer.ack_every = static_cast<std::uint32_t>(ack_every);
    config.transfer.ack_delay = std::chrono::milliseconds(ack_delay_ms);
    config.transfer.ack_timeout = std::chrono::milliseconds(ack_timeout_ms);
    config.transfer.retry_budget = static_cast<std::uint32_t>(retry_budget);
    config.transfer.max_file_size = static_cast<std::uint64_t>(max_file_size);
    config.transfer.max_incoming = static_cast<std::uint32_t>(max_incoming);
    config.media_queue_depth = static_cast<std::size_t>(media_queue_depth);

    auto download = readString(node, "download_directory", "");
    if (download.is_error()) return download.error();
    config.transfer.download_directory = download.value();

    auto level = readString(node, "log_level", "info");
    if (level.is_error()) return level.error();
    config.log_level = core::Logger::parseLevel(level.value(), core::LogLevel::INFO);

    auto valid = config.validate();
    if (valid.is_error()) {
        return valid.error();
    }
    return config;
}

core::Result<void> SessionConfig::validate() const {
    if (negotiation_timeout.count() <= 0) {
        return {core::ErrorCode::InvalidArgument, "negotiation_timeout must be positive"};
    }
    if (reconnect_attempts < 0) {
        return {core::ErrorCode::InvalidArgument, "reconnect_attempts must not be negative"};
    }
    if (reconnect_attempts > 0 && reconnect_interval.count() <= 0) {
        return {core::ErrorCode::InvalidArgument, "reconnect_interval must be positive"};
    }
    if (media_queue_depth == 0) {
        return {core::ErrorCode::InvalidArgument, "media_queue_depth must be positive"};
    }
    return transfer.validate();
}

webrtc::PeerSessionConfig SessionConfig::peerSessionConfig() const {
    webrtc::PeerSessionConfig config;
    config.role = role;
    config.peer = peer;
    config.negotiation_timeout = negotiation_timeout;
    config.reconnect_attempts = reconnect_attempts;
    config.reconnect_interval = reconnect_interval;
    return config;
}

} // namespace peerlink::session
