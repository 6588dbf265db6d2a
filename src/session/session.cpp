#include <peerlink/session/session.hpp>
#include <peerlink/core/logger.hpp>
#include <peerlink/transfer/chunk_source.hpp>

namespace peerlink::session {

std::string toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Connected: return "connected";
        case SessionState::Closing: return "closing";
        case SessionState::Closed: return "closed";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

std::shared_ptr<Session> Session::create(core::Reactor& reactor,
                                         std::shared_ptr<webrtc::SignalingChannel> signaling,
                                         webrtc::PeerConnectionFactory factory,
                                         SessionConfig config,
                                         std::shared_ptr<ContentProcessor> processor,
                                         core::TaskScheduler* scheduler) {
    auto session = std::make_shared<Session>(reactor, std::move(signaling), std::move(factory),
                                             std::move(config), std::move(processor), scheduler);
    session->wire();
    return session;
}

Session::Session(core::Reactor& reactor,
                 std::shared_ptr<webrtc::SignalingChannel> signaling,
                 webrtc::PeerConnectionFactory factory,
                 SessionConfig config,
                 std::shared_ptr<ContentProcessor> processor,
                 core::TaskScheduler* scheduler)
    : reactor_(reactor),
      signaling_(std::move(signaling)),
      config_(std::move(config)),
      processor_(std::move(processor)),
      scheduler_(scheduler) {
    if (processor_ && !scheduler_) {
        own_scheduler_ = core::make_task_scheduler();
        own_scheduler_->start(1);
        scheduler_ = own_scheduler_.get();
    }

    manager_ = webrtc::PeerConnectionManager::create(reactor_, signaling_, std::move(factory));
    transport_ = webrtc::DataChannelTransport::create(reactor_, config_.transfer.max_message_size);
    relay_ = webrtc::MediaTrackRelay::create(reactor_, config_.media_queue_depth);
}

Session::~Session() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            shutdownLocked(true);
        }
    }
    // Worker harus berhenti sebelum processor dilepas
    if (own_scheduler_) {
        own_scheduler_->stop();
    }
}

void Session::wire() {
    std::weak_ptr<Session> weak_self = weak_from_this();

    transfer::TransferHooks hooks;
    hooks.send = [this](const webrtc::DataChannelMessage& message) {
        return sendLocked(message, webrtc::SendOptions{});
    };
    hooks.schedule = [this, weak_self](std::chrono::milliseconds delay, std::function<void()> callback) {
        return reactor_.schedule(delay, [weak_self, callback = std::move(callback)]() {
            auto self = weak_self.lock();
            if (!self) return;
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (self->closed_) return;
            callback();
        });
    };
    hooks.cancel = [this](core::Reactor::TimerId id) {
        reactor_.cancel(id);
    };

    std::uint32_t first_id = config_.role == webrtc::PeerRole::Offerer ? 1 : 2;
    transfers_ = std::make_unique<transfer::TransferManager>(config_.transfer, first_id,
                                                              std::move(hooks), &transfer_events_);

    manager_->onStateChange.addListener([weak_self](webrtc::PeerConnectionState state) {
        if (auto self = weak_self.lock()) self->handlePeerState(state);
    });
    manager_->onDataChannel.addListener([weak_self](std::shared_ptr<webrtc::DataChannel> channel) {
        if (auto self = weak_self.lock()) self->transport_->attachChannel(std::move(channel));
    });
    manager_->onTrack.addListener([weak_self](std::shared_ptr<webrtc::MediaTrackReceiver> track) {
        if (auto self = weak_self.lock()) self->relay_->handleRemoteTrack(std::move(track));
    });
    manager_->onRemoteHangup.addListener([weak_self]() {
        if (auto self = weak_self.lock()) self->handleRemoteHangup();
    });
    manager_->onError.addListener([weak_self](const core::Error& error) {
        if (auto self = weak_self.lock()) self->handlePeerError(error);
    });

    transport_->onMessage.addListener([weak_self](const webrtc::DataChannelMessage& message) {
        if (auto self = weak_self.lock()) self->handleMessage(message);
    });
    transport_->onChannelOpen.addListener([weak_self](const std::string& label) {
        if (auto self = weak_self.lock()) self->handleChannelOpen(label);
    });
    transport_->onChannelClosed.addListener([weak_self](const std::string& label) {
        if (auto self = weak_self.lock()) self->handleChannelClosed(label);
    });

    relay_->onTrack.addListener([weak_self](std::shared_ptr<webrtc::MediaTrackReceiver> track) {
        if (auto self = weak_self.lock()) {
            self->post([track](Session& session) { session.onTrack.emit(track); });
        }
    });
}

void Session::connect(ConnectCallback callback) {
    std::weak_ptr<Session> weak_self = weak_from_this();
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != SessionState::Idle) {
        core::Error error(core::ErrorCode::InvalidState,
                          "Cannot connect a session that is " + toString(state_));
        if (callback) {
            reactor_.post([callback = std::move(callback), error]() { callback(error); });
        }
        return;
    }

    core::Logger::info("[{}] connecting as {}", config_.endpoint, webrtc::toString(config_.role));
    setStateLocked(SessionState::Negotiating);

    manager_->open(config_.peerSessionConfig(),
        [weak_self, callback = std::move(callback)](core::Result<std::shared_ptr<webrtc::PeerSession>> result) {
            if (auto self = weak_self.lock()) {
                self->handleOpen(std::move(result), callback);
            } else if (callback) {
                callback(core::Error(core::ErrorCode::ConnectionClosed, "Session destroyed"));
            }
        });
}

void Session::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    shutdownLocked(true);
}

core::Result<void> Session::sendText(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sendLocked(webrtc::TextMessage{text, false}, webrtc::SendOptions{});
}

core::Result<std::uint32_t> Session::sendFile(const std::filesystem::path& path) {
    auto source = transfer::FileChunkSource::open(path);
    if (source.is_error()) {
        return source.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return startTransferLocked(std::move(source).value());
}

core::Result<std::uint32_t> Session::sendBytes(const std::string& name, core::ByteBuffer data) {
    auto source = std::make_unique<transfer::MemoryChunkSource>(name, std::move(data));

    std::lock_guard<std::mutex> lock(mutex_);
    return startTransferLocked(std::move(source));
}

core::Result<void> Session::cancelTransfer(std::uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return {core::ErrorCode::ConnectionClosed, "Session is " + toString(state_)};
    }
    return transfers_->cancelTransfer(id);
}

core::Result<void> Session::attachTrack(std::shared_ptr<webrtc::LocalMediaTrack> track) {
    std::shared_ptr<webrtc::PeerConnection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Connected) {
            return {core::ErrorCode::InvalidState, "Tracks can only be attached to a connected session"};
        }
        if (auto peer = manager_->session()) {
            connection = peer->connection();
        }
    }
    if (!connection) {
        return {core::ErrorCode::InvalidState, "No peer connection"};
    }
    return relay_->attach(connection, track);
}

void Session::detachTrack(const std::string& track_id) {
    relay_->detach(track_id);
}

void Session::setMediaSink(std::shared_ptr<webrtc::MediaSink> sink) {
    relay_->setSink(std::move(sink));
}

core::Result<void> Session::sendMediaControl(const std::string& payload, bool reliable) {
    webrtc::SendOptions options;
    options.reliable = reliable;
    options.ordered = reliable;

    std::lock_guard<std::mutex> lock(mutex_);
    return sendLocked(webrtc::MediaControlMessage{payload}, options);
}

std::optional<transfer::TransferInfo> Session::transfer(std::uint32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_->info(id);
}

std::vector<transfer::TransferInfo> Session::transfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_->list();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::shared_ptr<webrtc::PeerSession> Session::peerSession() const {
    return manager_->session();
}

std::size_t Session::pendingOutbound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbound_.size();
}

webrtc::MediaRelayStats Session::mediaStats() const {
    return relay_->stats();
}

core::Result<void> Session::sendLocked(const webrtc::DataChannelMessage& message, webrtc::SendOptions options) {
    if (closed_) {
        return {core::ErrorCode::ConnectionClosed, "Session is " + toString(state_)};
    }

    if (!options.reliable) {
        return transport_->send(message, options);
    }

    // Pesan reliable antre di belakang pesan yang belum terkirim
    if (!control_open_ || !outbound_.empty()) {
        webrtc::EncodedFrame frame;
        try {
            frame = webrtc::encodeMessage(message);
        }
        catch (const core::Error& e) {
            return e;
        }
        if (frame.size() > transport_->maxMessageSize()) {
            return {core::ErrorCode::InvalidArgument,
                    "Encoded " + webrtc::toString(webrtc::kindOf(message)) + " message of " +
                    std::to_string(frame.size()) + " bytes exceeds max_message_size"};
        }
        outbound_.push_back(message);
        core::Logger::debug("[{}] queued {} message ({} pending)",
                            config_.endpoint, webrtc::toString(webrtc::kindOf(message)), outbound_.size());
        return {};
    }

    return transport_->send(message, options);
}

void Session::flushLocked() {
    if (!outbound_.empty()) {
        core::Logger::debug("[{}] flushing {} queued message(s)", config_.endpoint, outbound_.size());
    }

    while (control_open_ && !outbound_.empty()) {
        auto result = transport_->send(outbound_.front(), webrtc::SendOptions{});
        if (result.is_error()) {
            if (result.error().code() == core::ErrorCode::ChannelNotOpen) {
                control_open_ = false;
                return;
            }
            core::Logger::warn("[{}] dropping queued {} message: {}", config_.endpoint,
                               webrtc::toString(webrtc::kindOf(outbound_.front())), result.error().what());
            core::Error error = result.error();
            post([error](Session& session) { session.onError.emit(error); });
        }
        outbound_.pop_front();
    }
}

void Session::setStateLocked(SessionState next) {
    if (state_ == next) return;

    core::Logger::debug("[{}] state {} -> {}", config_.endpoint, toString(state_), toString(next));
    state_ = next;
    post([next](Session& session) { session.onStateChange.emit(next); });
}

void Session::failLocked(const core::Error& error) {
    if (closed_) return;

    core::Logger::error("[{}] session failed: {}", config_.endpoint, error.what());
    transfers_->abortAll(false);
    closed_ = true;
    outbound_.clear();
    control_open_ = false;
    relay_->detachAll();
    transport_->close();
    manager_->close();
    setStateLocked(SessionState::Failed);

    post([error](Session& session) { session.onError.emit(error); });
}

void Session::shutdownLocked(bool notify_peer) {
    core::Logger::info("[{}] closing session", config_.endpoint);
    setStateLocked(SessionState::Closing);

    transfers_->abortAll(notify_peer && control_open_);
    closed_ = true;
    outbound_.clear();
    control_open_ = false;

    relay_->detachAll();
    transport_->close();
    manager_->close();
    setStateLocked(SessionState::Closed);
}

std::string Session::sessionIdLocked() const {
    if (auto peer = manager_->session()) {
        return peer->id();
    }
    return config_.endpoint;
}

core::Result<std::uint32_t> Session::startTransferLocked(std::unique_ptr<transfer::ChunkSource> source) {
    if (state_ != SessionState::Connected) {
        return {core::ErrorCode::InvalidState, "Cannot send a file while the session is " + toString(state_)};
    }
    return transfers_->startTransfer(std::move(source));
}

void Session::handleOpen(core::Result<std::shared_ptr<webrtc::PeerSession>> result, ConnectCallback callback) {
    core::Result<void> outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_error()) {
            outcome = result.error();
            if (!closed_) {
                failLocked(result.error());
            }
        } else if (closed_) {
            outcome = core::Result<void>(core::ErrorCode::ConnectionClosed, "Session closed during negotiation");
        } else {
            core::Logger::info("[{}] connected, peer session {}", config_.endpoint, result.value()->id());
            setStateLocked(SessionState::Connected);
        }
    }

    if (callback) {
        // handleOpen sudah berjalan di reactor; urutan tetap setelah event state
        post([callback, outcome](Session&) { callback(outcome); });
    }
}

void Session::handlePeerState(webrtc::PeerConnectionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    switch (state) {
        case webrtc::PeerConnectionState::Disconnected:
            core::Logger::warn("[{}] peer connection disconnected", config_.endpoint);
            break;
        case webrtc::PeerConnectionState::Connecting:
            if (state_ == SessionState::Connected) {
                core::Logger::info("[{}] reconnecting", config_.endpoint);
            }
            break;
        case webrtc::PeerConnectionState::Connected:
            if (state_ == SessionState::Connected) {
                core::Logger::info("[{}] peer connection restored", config_.endpoint);
            }
            break;
        default:
            break;
    }
}

void Session::handlePeerError(const core::Error& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    failLocked(error);
}

void Session::handleRemoteHangup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    core::Logger::info("[{}] peer hung up", config_.endpoint);
    shutdownLocked(false);
}

void Session::handleChannelOpen(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    core::Logger::debug("[{}] channel {} open", config_.endpoint, label);
    if (label == webrtc::kControlChannel) {
        control_open_ = true;
        flushLocked();
    }
}

void Session::handleChannelClosed(const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (label == webrtc::kControlChannel) {
        control_open_ = false;
    }
}

void Session::handleMessage(const webrtc::DataChannelMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    switch (webrtc::kindOf(message)) {
        case webrtc::MessageKind::Text: {
            const auto& text = std::get<webrtc::TextMessage>(message);
            post([text](Session& session) { session.onText.emit(text); });
            if (!text.response) {
                processText(text.body);
            }
            break;
        }

        case webrtc::MessageKind::FileControl:
            transfers_->handleControl(std::get<webrtc::FileControlMessage>(message));
            break;

        case webrtc::MessageKind::FileChunk:
            transfers_->handleChunk(std::get<webrtc::FileChunkMessage>(message));
            break;

        case webrtc::MessageKind::MediaControl: {
            std::string payload = std::get<webrtc::MediaControlMessage>(message).payload;
            post([payload](Session& session) { session.onMediaControl.emit(payload); });
            break;
        }
    }
}

void Session::processText(const std::string& text) {
    if (!processor_) return;

    std::weak_ptr<Session> weak_self = weak_from_this();
    auto processor = processor_;
    auto& reactor = reactor_;
    std::string session_id = sessionIdLocked();

    auto submitted = scheduler_->submit([weak_self, processor, &reactor, session_id, text]() {
        std::optional<std::string> response;
        try {
            response = processor->processText(session_id, text);
        }
        catch (const std::exception& e) {
            core::Logger::error("Content processor failed on text: {}", e.what());
            return;
        }
        if (!response) return;

        reactor.post([weak_self, response = std::move(*response)]() {
            if (auto self = weak_self.lock()) self->sendResponse(response);
        });
    });

    if (submitted.is_error()) {
        core::Logger::warn("[{}] cannot process text: {}", config_.endpoint, submitted.error().what());
    }
}

void Session::processFile(const transfer::ReceivedFile& file) {
    if (!processor_) return;

    std::weak_ptr<Session> weak_self = weak_from_this();
    auto processor = processor_;
    auto& reactor = reactor_;
    std::string session_id = sessionIdLocked();
    auto received = std::make_shared<transfer::ReceivedFile>(file);

    auto submitted = scheduler_->submit([weak_self, processor, &reactor, session_id, received]() {
        std::optional<std::string> response;
        try {
            response = processor->processFile(session_id, *received);
        }
        catch (const std::exception& e) {
            core::Logger::error("Content processor failed on {}: {}", received->name, e.what());
            return;
        }
        if (!response) return;

        reactor.post([weak_self, response = std::move(*response)]() {
            if (auto self = weak_self.lock()) self->sendResponse(response);
        });
    });

    if (submitted.is_error()) {
        core::Logger::warn("[{}] cannot process file {}: {}", config_.endpoint, file.name, submitted.error().what());
    }
}

void Session::sendResponse(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;

    auto result = sendLocked(webrtc::TextMessage{text, true}, webrtc::SendOptions{});
    if (result.is_error()) {
        core::Logger::warn("[{}] failed to send response: {}", config_.endpoint, result.error().what());
    }
}

void Session::post(std::function<void(Session&)> action) {
    std::weak_ptr<Session> weak_self = weak_from_this();
    reactor_.post([weak_self, action = std::move(action)]() {
        if (auto self = weak_self.lock()) action(*self);
    });
}

void Session::TransferEvents::onFileReceived(const transfer::ReceivedFile& file) {
    core::Logger::info("[{}] received file {} ({} bytes)",
                       session_.config_.endpoint, file.name, file.data.size());

    auto received = std::make_shared<transfer::ReceivedFile>(file);
    session_.post([received](Session& session) { session.onFileReceived.emit(*received); });
    session_.processFile(file);
}

void Session::TransferEvents::onTransferComplete(const transfer::TransferInfo& info) {
    session_.post([info](Session& session) { session.onTransferComplete.emit(info); });
}

void Session::TransferEvents::onTransferFailed(const transfer::TransferInfo& info, const core::Error& error) {
    session_.post([info, error](Session& session) { session.onTransferFailed.emit(info, error); });
}

} // namespace peerlink::session
