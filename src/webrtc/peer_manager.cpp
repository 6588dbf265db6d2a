#include <peerlink/webrtc/peer_manager.hpp>
#include <peerlink/core/logger.hpp>

#include <iomanip>
#include <random>
#include <sstream>

namespace peerlink::webrtc {

namespace {

std::string generateSessionId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::mutex gen_mutex;

    std::uniform_int_distribution<std::uint32_t> dis;
    std::uint32_t value = 0;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        value = dis(gen);
    }

    std::ostringstream oss;
    oss << "peer-" << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

int stateRank(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::New: return 0;
        case PeerConnectionState::Connecting: return 1;
        case PeerConnectionState::Connected: return 2;
        case PeerConnectionState::Disconnected: return 3;
        case PeerConnectionState::Failed: return 4;
        case PeerConnectionState::Closed: return 5;
    }
    return 0;
}

bool isTerminal(PeerConnectionState state) {
    return state == PeerConnectionState::Failed || state == PeerConnectionState::Closed;
}

} // namespace

std::string toString(PeerRole role) {
    return role == PeerRole::Offerer ? "offerer" : "answerer";
}

// PeerSession implementation
PeerSession::PeerSession(std::string id, PeerRole role)
    : id_(std::move(id)),
      role_(role),
      created_at_(std::chrono::system_clock::now()) {}

PeerConnectionState PeerSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool PeerSession::retrying() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retrying_;
}

std::optional<SessionDescription> PeerSession::localDescription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_;
}

std::optional<SessionDescription> PeerSession::remoteDescription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remote_;
}

std::shared_ptr<PeerConnection> PeerSession::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

bool PeerSession::isValidTransition(PeerConnectionState from, PeerConnectionState to, bool retrying) {
    if (from == to || from == PeerConnectionState::Closed) {
        return false;
    }
    if (to == PeerConnectionState::Closed || to == PeerConnectionState::Failed) {
        return true;
    }
    if (from == PeerConnectionState::Failed) {
        return false;
    }
    if (from == PeerConnectionState::Disconnected &&
        (to == PeerConnectionState::Connecting || to == PeerConnectionState::Connected)) {
        return retrying;
    }
    return stateRank(to) > stateRank(from);
}

bool PeerSession::transition(PeerConnectionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isValidTransition(state_, next, retrying_)) {
        if (state_ != next) {
            core::Logger::debug("Session {} ignoring transition {} -> {}",
                                id_, toString(state_), toString(next));
        }
        return false;
    }

    core::Logger::debug("Session {}: {} -> {}", id_, toString(state_), toString(next));
    state_ = next;
    return true;
}

void PeerSession::setRetrying(bool retrying) {
    std::lock_guard<std::mutex> lock(mutex_);
    retrying_ = retrying;
}

void PeerSession::setLocalDescription(const SessionDescription& desc) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_ = desc;
}

void PeerSession::setRemoteDescription(const SessionDescription& desc) {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_ = desc;
}

void PeerSession::setConnection(std::shared_ptr<PeerConnection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_ = std::move(connection);
}

// PeerConnectionManager implementation
std::shared_ptr<PeerConnectionManager> PeerConnectionManager::create(
    core::Reactor& reactor,
    std::shared_ptr<SignalingChannel> signaling,
    PeerConnectionFactory factory) {
    auto manager = std::make_shared<PeerConnectionManager>(reactor, std::move(signaling), std::move(factory));
    manager->attachSignaling();
    return manager;
}

PeerConnectionManager::PeerConnectionManager(core::Reactor& reactor,
                                             std::shared_ptr<SignalingChannel> signaling,
                                             PeerConnectionFactory factory)
    : reactor_(reactor),
      signaling_(std::move(signaling)),
      factory_(std::move(factory)) {}

PeerConnectionManager::~PeerConnectionManager() {
    close();
}

void PeerConnectionManager::open(const PeerSessionConfig& config, OpenCallback callback) {
    auto reject = [this, &callback](core::ErrorCode code, const std::string& reason) {
        core::Error error(code, reason);
        reactor_.post([callback = std::move(callback), error]() {
            callback(error);
        });
    };

    std::vector<SignalingMessage> early;
    std::shared_ptr<PeerSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            reject(core::ErrorCode::InvalidState, "Peer connection manager is closed");
            return;
        }
        if (session_ && !isTerminal(session_->state())) {
            reject(core::ErrorCode::InvalidState, "Peer session already open");
            return;
        }

        config_ = config;
        session_ = std::make_shared<PeerSession>(generateSessionId(), config.role);
        session = session_;
        pending_open_ = std::move(callback);
        pending_candidates_.clear();
        remote_hungup_ = false;
        reconnect_attempts_used_ = 0;
        pc_.reset();
    }

    core::Logger::info("Opening peer session {} as {}", session->id(), toString(config.role));

    std::shared_ptr<PeerConnection> pc;
    try {
        pc = factory_(config.peer);
    }
    catch (const core::Error& e) {
        failNegotiation(core::ErrorCode::TransportError,
                        std::string("Failed to create peer connection: ") + e.what());
        return;
    }
    if (!pc) {
        failNegotiation(core::ErrorCode::TransportError, "Peer connection factory returned nothing");
        return;
    }

    session->setConnection(pc);
    attachConnection(pc);

    std::weak_ptr<PeerConnectionManager> weak_self = weak_from_this();
    auto deadline = reactor_.schedule(config.negotiation_timeout, [weak_self]() {
        auto self = weak_self.lock();
        if (!self) return;

        std::shared_ptr<PeerConnection> pc;
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->deadline_timer_ = core::Reactor::kInvalidTimer;
            pc = self->pc_;
        }

        // Description sudah bertukar tapi path tidak terbentuk
        if (pc && pc->remoteDescription() && pc->localDescription()) {
            self->failNegotiation(core::ErrorCode::TransportError,
                                  "Network path not established before negotiation deadline");
        } else {
            self->failNegotiation(core::ErrorCode::NegotiationError,
                                  "No compatible description within negotiation deadline");
        }
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc_ = pc;
        deadline_timer_ = deadline;
        early.swap(early_messages_);
    }

    reactor_.post([weak_self, role = config.role, early = std::move(early)]() {
        auto self = weak_self.lock();
        if (!self) return;

        if (role == PeerRole::Offerer) {
            self->startOffer();
        }
        for (const auto& message : early) {
            self->handleSignal(message);
        }
    });
}

void PeerConnectionManager::close() {
    OpenCallback callback;
    std::shared_ptr<PeerConnection> pc;
    std::shared_ptr<PeerSession> session;
    core::Reactor::TimerId deadline = core::Reactor::kInvalidTimer;
    core::Reactor::TimerId reconnect = core::Reactor::kInvalidTimer;
    std::vector<core::ListenerId> signaling_listeners;
    bool hungup = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;

        callback = std::move(pending_open_);
        pending_open_ = nullptr;
        pc = pc_;
        session = session_;
        deadline = deadline_timer_;
        reconnect = reconnect_timer_;
        deadline_timer_ = core::Reactor::kInvalidTimer;
        reconnect_timer_ = core::Reactor::kInvalidTimer;
        signaling_listeners.swap(signaling_listeners_);
        hungup = remote_hungup_;
        pending_candidates_.clear();
        early_messages_.clear();
    }

    reactor_.cancel(deadline);
    reactor_.cancel(reconnect);

    if (pc && !hungup) {
        sendSignal(SignalingMessageType::Bye, "");
    }

    detachConnection();
    if (pc) {
        pc->close();
    }

    if (signaling_ && signaling_listeners.size() == 2) {
        signaling_->onMessage.removeListener(signaling_listeners[0]);
        signaling_->onClosed.removeListener(signaling_listeners[1]);
    }

    std::weak_ptr<PeerConnectionManager> weak_self = weak_from_this();
    if (session && session->transition(PeerConnectionState::Closed)) {
        core::Logger::info("Peer session {} closed", session->id());
        reactor_.post([weak_self]() {
            if (auto self = weak_self.lock()) {
                self->onStateChange.emit(PeerConnectionState::Closed);
            }
        });
    }

    if (callback) {
        core::Error error(core::ErrorCode::ConnectionClosed, "Closed during negotiation");
        reactor_.post([callback = std::move(callback), error]() {
            callback(error);
        });
    }
}

std::shared_ptr<PeerSession> PeerConnectionManager::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::size_t PeerConnectionManager::bufferedCandidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_candidates_.size();
}

void PeerConnectionManager::attachSignaling() {
    if (!signaling_) return;

    std::weak_ptr<PeerConnectionManager> weak_self = weak_from_this();
    auto message_id = signaling_->onMessage.addListener([weak_self](const SignalingMessage& message) {
        if (auto self = weak_self.lock()) self->handleSignal(message);
    });
    auto closed_id = signaling_->onClosed.addListener([weak_self]() {
        if (auto self = weak_self.lock()) self->handleSignalingClosed();
    });

    std::lock_guard<std::mutex> lock(mutex_);
    signaling_listeners_ = {message_id, closed_id};
}

void PeerConnectionManager::attachConnection(const std::shared_ptr<PeerConnection>& pc) {
    std::weak_ptr<PeerConnectionManager> weak_self = weak_from_this();

    auto candidate_id = pc->onLocalCandidate.addListener([weak_self](const IceCandidate& candidate) {
        if (auto self = weak_self.lock()) {
            self->sendSignal(SignalingMessageType::Candidate, candidate.toJson());
        }
    });
    auto state_id = pc->onConnectionStateChange.addListener([weak_self](PeerConnectionState state) {
        if (auto self = weak_self.lock()) self->handleConnectionState(state);
    });
    auto channel_id = pc->onDataChannel.addListener([weak_self](std::shared_ptr<DataChannel> channel) {
        if (auto self = weak_self.lock()) self->onDataChannel.emit(channel);
    });
    auto track_id = pc->onTrack.addListener([weak_self](std::shared_ptr<MediaTrackReceiver> track) {
        if (auto self = weak_self.lock()) self->onTrack.emit(track);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    candidate_listener_ = candidate_id;
    state_listener_ = state_id;
    channel_listener_ = channel_id;
    track_listener_ = track_id;
}

void PeerConnectionManager::detachConnection() {
    std::shared_ptr<PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = pc_;
    }
    if (!pc) return;

    pc->onLocalCandidate.removeListener(candidate_listener_);
    pc->onConnectionStateChange.removeListener(state_listener_);
    pc->onDataChannel.removeListener(channel_listener_);
    pc->onTrack.removeListener(track_listener_);
}

void PeerConnectionManager::startOffer() {
    std::shared_ptr<PeerConnection> pc;
    std::shared_ptr<PeerSession> session;
    std::vector<ChannelSpec> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_open_) return;
        pc = pc_;
        session = session_;
        channels = config_.channels;
    }

    try {
        for (const auto& spec : channels) {
            onDataChannel.emit(pc->createDataChannel(spec.label, spec.init));
        }

        auto offer = pc->createOffer();
        pc->setLocalDescription(offer);
        session->setLocalDescription(offer);
        sendSignal(SignalingMessageType::Description, offer.toJson());
        core::Logger::debug("Sent offer for session {}", session->id());
    }
    catch (const core::Error& e) {
        failNegotiation(core::ErrorCode::NegotiationError,
                        std::string("Failed to create offer: ") + e.what());
    }
}

void PeerConnectionManager::handleSignal(const SignalingMessage& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (!pc_) {
            // Belum open, simpan sampai open() dipanggil
            early_messages_.push_back(message);
            return;
        }
    }

    switch (message.type) {
        case SignalingMessageType::Description:
            handleDescription(message);
            break;
        case SignalingMessageType::Candidate:
            handleCandidate(message);
            break;
        case SignalingMessageType::Bye:
            handleBye();
            break;
    }
}

void PeerConnectionManager::handleDescription(const SignalingMessage& message) {
    std::shared_ptr<PeerConnection> pc;
    std::shared_ptr<PeerSession> session;
    PeerRole role;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_open_) {
            core::Logger::warn("Ignoring session description outside negotiation");
            return;
        }
        pc = pc_;
        session = session_;
        role = config_.role;
    }

    try {
        auto desc = SessionDescription::fromJson(message.data);

        if (role == PeerRole::Answerer) {
            if (desc.type() != SdpType::Offer) {
                throw core::Error(core::ErrorCode::InvalidArgument, "Answerer expects an offer");
            }
            pc->setRemoteDescription(desc);
            session->setRemoteDescription(desc);

            auto answer = pc->createAnswer();
            pc->setLocalDescription(answer);
            session->setLocalDescription(answer);
            sendSignal(SignalingMessageType::Description, answer.toJson());
            core::Logger::debug("Answered offer for session {}", session->id());
        } else {
            if (desc.type() != SdpType::Answer) {
                throw core::Error(core::ErrorCode::InvalidArgument, "Offerer expects an answer");
            }
            pc->setRemoteDescription(desc);
            session->setRemoteDescription(desc);
            core::Logger::debug("Applied answer for session {}", session->id());
        }
    }
    catch (const core::Error& e) {
        failNegotiation(core::ErrorCode::NegotiationError,
                        std::string("Remote description rejected: ") + e.what());
        return;
    }

    std::vector<IceCandidate> buffered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buffered.swap(pending_candidates_);
    }

    if (!buffered.empty()) {
        core::Logger::debug("Applying {} buffered candidates", buffered.size());
    }
    for (const auto& candidate : buffered) {
        try {
            pc->addIceCandidate(candidate);
        }
        catch (const core::Error& e) {
            core::Logger::warn("Buffered candidate rejected: {}", e.what());
        }
    }
}

void PeerConnectionManager::handleCandidate(const SignalingMessage& message) {
    IceCandidate candidate;
    try {
        candidate = IceCandidate::fromJson(message.data);
    }
    catch (const core::Error& e) {
        core::Logger::warn("Dropping malformed candidate: {}", e.what());
        return;
    }

    std::shared_ptr<PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pc = pc_;
    }

    if (!pc->remoteDescription()) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_candidates_.push_back(candidate);
        core::Logger::debug("Buffered remote candidate until description is set");
        return;
    }

    try {
        pc->addIceCandidate(candidate);
    }
    catch (const core::Error& e) {
        core::Logger::warn("Remote candidate rejected: {}", e.what());
    }
}

void PeerConnectionManager::handleBye() {
    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remote_hungup_) return;
        remote_hungup_ = true;
        pending = static_cast<bool>(pending_open_);
    }

    core::Logger::info("Remote peer hung up");
    if (pending) {
        failNegotiation(core::ErrorCode::NegotiationError, "Remote peer hung up during negotiation");
    }
    onRemoteHangup.emit();
}

void PeerConnectionManager::handleSignalingClosed() {
    bool pending = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending = static_cast<bool>(pending_open_);
    }

    if (pending) {
        failNegotiation(core::ErrorCode::NegotiationError, "Signaling channel closed during negotiation");
    } else {
        core::Logger::debug("Signaling channel closed");
    }
}

void PeerConnectionManager::handleConnectionState(PeerConnectionState state) {
    std::shared_ptr<PeerSession> session;
    bool pending = false;
    bool hungup = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !session_) return;
        session = session_;
        pending = static_cast<bool>(pending_open_);
        hungup = remote_hungup_;
    }

    bool retrying = session->retrying();
    if (retrying && (state == PeerConnectionState::Failed ||
                     state == PeerConnectionState::Disconnected)) {
        core::Logger::debug("Reconnect in progress, connection is {}", toString(state));
        return;
    }

    if (session->transition(state)) {
        onStateChange.emit(state);
    }

    switch (state) {
        case PeerConnectionState::Connected:
            if (pending) {
                completeOpen();
            } else if (retrying) {
                core::Reactor::TimerId timer;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    timer = reconnect_timer_;
                    reconnect_timer_ = core::Reactor::kInvalidTimer;
                    reconnect_attempts_used_ = 0;
                }
                reactor_.cancel(timer);
                session->setRetrying(false);
                core::Logger::info("Peer session {} reconnected", session->id());
            }
            break;

        case PeerConnectionState::Failed:
            if (pending) {
                failNegotiation(core::ErrorCode::TransportError, "Peer connection failed");
            } else {
                failEstablished("Peer connection failed");
            }
            break;

        case PeerConnectionState::Disconnected:
            if (!pending && !hungup) {
                startReconnect();
            }
            break;

        default:
            break;
    }
}

void PeerConnectionManager::startReconnect() {
    std::shared_ptr<PeerSession> session;
    int max_attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
        max_attempts = config_.reconnect_attempts;
    }

    if (max_attempts <= 0) {
        failEstablished("Connection lost and reconnect is disabled");
        return;
    }
    if (session->retrying()) return;

    core::Logger::warn("Peer session {} disconnected, retrying up to {} times",
                       session->id(), max_attempts);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_attempts_used_ = 0;
    }
    session->setRetrying(true);
    attemptReconnect();
}

void PeerConnectionManager::attemptReconnect() {
    std::shared_ptr<PeerConnection> pc;
    std::shared_ptr<PeerSession> session;
    std::chrono::milliseconds interval{0};
    int attempt = 0;
    int max_attempts = 0;
    bool exhausted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reconnect_timer_ = core::Reactor::kInvalidTimer;
        if (closed_ || !session_ || !session_->retrying()) return;

        session = session_;
        pc = pc_;
        interval = config_.reconnect_interval;
        max_attempts = config_.reconnect_attempts;
        if (reconnect_attempts_used_ >= max_attempts) {
            exhausted = true;
        } else {
            attempt = ++reconnect_attempts_used_;
        }
    }

    if (session->state() == PeerConnectionState::Connected) {
        session->setRetrying(false);
        return;
    }
    if (exhausted) {
        failEstablished("Reconnect attempts exhausted");
        return;
    }

    core::Logger::info("Reconnect attempt {}/{} for session {}", attempt, max_attempts, session->id());
    if (session->transition(PeerConnectionState::Connecting)) {
        onStateChange.emit(PeerConnectionState::Connecting);
    }

    try {
        pc->restartIce();
    }
    catch (const core::Error& e) {
        core::Logger::warn("ICE restart failed: {}", e.what());
    }

    std::weak_ptr<PeerConnectionManager> weak_self = weak_from_this();
    auto timer = reactor_.schedule(interval, [weak_self]() {
        if (auto self = weak_self.lock()) self->attemptReconnect();
    });

    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_timer_ = timer;
}

void PeerConnectionManager::failNegotiation(core::ErrorCode code, const std::string& reason) {
    OpenCallback callback;
    std::shared_ptr<PeerConnection> pc;
    std::shared_ptr<PeerSession> session;
    core::Reactor::TimerId deadline = core::Reactor::kInvalidTimer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_open_) return;
        callback = std::move(pending_open_);
        pending_open_ = nullptr;
        pc = pc_;
        session = session_;
        deadline = deadline_timer_;
        deadline_timer_ = core::Reactor::kInvalidTimer;
        pending_candidates_.clear();
    }

    reactor_.cancel(deadline);

    core::Error error(code, reason);
    core::Logger::warn("Negotiation of session {} failed: {}", session->id(), reason);

    sendSignal(SignalingMessageType::Bye, "");
    if (pc) {
        detachConnection();
        pc->close();
    }

    if (session->transition(PeerConnectionState::Failed)) {
        onStateChange.emit(PeerConnectionState::Failed);
    }

    reactor_.post([callback = std::move(callback), error]() {
        callback(error);
    });
}

void PeerConnectionManager::failEstablished(const std::string& reason) {
    std::shared_ptr<PeerSession> session;
    core::Reactor::TimerId timer = core::Reactor::kInvalidTimer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
        timer = reconnect_timer_;
        reconnect_timer_ = core::Reactor::kInvalidTimer;
    }

    reactor_.cancel(timer);
    session->setRetrying(false);

    core::Logger::error("Peer session {} failed: {}", session->id(), reason);
    if (session->transition(PeerConnectionState::Failed)) {
        onStateChange.emit(PeerConnectionState::Failed);
    }
    onError.emit(core::Error(core::ErrorCode::TransportError, reason));
}

void PeerConnectionManager::completeOpen() {
    OpenCallback callback;
    std::shared_ptr<PeerSession> session;
    core::Reactor::TimerId deadline = core::Reactor::kInvalidTimer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_open_) return;
        callback = std::move(pending_open_);
        pending_open_ = nullptr;
        session = session_;
        deadline = deadline_timer_;
        deadline_timer_ = core::Reactor::kInvalidTimer;
    }

    reactor_.cancel(deadline);
    core::Logger::info("Peer session {} connected", session->id());

    reactor_.post([callback = std::move(callback), session]() {
        callback(session);
    });
}

void PeerConnectionManager::sendSignal(SignalingMessageType type, const std::string& data) {
    if (!signaling_ || !signaling_->isOpen()) {
        core::Logger::debug("Signaling closed, not sending {}", signalingMessageTypeToString(type));
        return;
    }

    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_) session_id = session_->id();
    }

    try {
        signaling_->send(SignalingMessage(type, session_id, data));
    }
    catch (const core::Error& e) {
        core::Logger::warn("Failed to send {} signaling message: {}",
                           signalingMessageTypeToString(type), e.what());
    }
}

} // namespace peerlink::webrtc
