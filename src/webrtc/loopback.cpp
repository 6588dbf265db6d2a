#include <peerlink/webrtc/loopback.hpp>
#include <peerlink/core/logger.hpp>

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace peerlink::webrtc {

namespace {

const char kEndpointAttribute[] = "a=loopback-endpoint:";

std::string makeSdp(const std::string& endpoint_id) {
    std::ostringstream oss;
    oss << "v=0\r\n"
        << "o=- " << endpoint_id << " 1 IN IP4 127.0.0.1\r\n"
        << "s=-\r\n"
        << "t=0 0\r\n"
        << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
        << "a=mid:0\r\n"
        << kEndpointAttribute << endpoint_id << "\r\n";
    return oss.str();
}

std::string parseEndpoint(const std::string& sdp) {
    auto pos = sdp.find(kEndpointAttribute);
    if (pos == std::string::npos) {
        return {};
    }
    pos += sizeof(kEndpointAttribute) - 1;
    auto end = sdp.find_first_of("\r\n", pos);
    return sdp.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

std::string makeCandidate(const std::string& endpoint_id) {
    return "candidate:1 1 udp 2130706431 " + endpoint_id + " 9 typ host";
}

// Format: candidate:<foundation> <component> <transport> <priority> <endpoint> <port> typ <type>
std::string parseCandidateEndpoint(const std::string& candidate) {
    std::istringstream iss(candidate);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }

    if (tokens.size() < 8 || tokens[0].rfind("candidate:", 0) != 0 || tokens[6] != "typ") {
        return {};
    }
    return tokens[4];
}

} // namespace

// Loopback data channel
class LoopbackDataChannel : public DataChannel,
                            public std::enable_shared_from_this<LoopbackDataChannel> {
public:
    LoopbackDataChannel(std::shared_ptr<LoopbackNetwork> network,
                        core::Reactor& reactor,
                        const std::string& label,
                        const DataChannelInit& init)
        : network_(std::move(network)),
          reactor_(reactor),
          label_(label),
          init_(init) {}

    std::string label() const override { return label_; }
    bool ordered() const override { return init_.ordered; }
    std::optional<int> maxRetransmits() const override { return init_.max_retransmits; }

    bool reliable() const override {
        return !init_.max_retransmits && !init_.max_packet_life_time;
    }

    std::uint64_t bufferedAmount() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return buffered_amount_;
    }

    DataChannelState state() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return state_;
    }

    void send(const std::string& data) override {
        transmit(core::to_bytes(data), false);
    }

    void send(const core::ByteBuffer& data) override {
        transmit(data, true);
    }

    void close() override {
        std::shared_ptr<LoopbackDataChannel> remote;
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            if (state_ == DataChannelState::Closing || state_ == DataChannelState::Closed) {
                return;
            }
            setStateLocked(DataChannelState::Closing);
            setStateLocked(DataChannelState::Closed);
            remote = remote_.lock();
        }

        core::Logger::debug("Loopback data channel {} closed", label_);
        if (remote) {
            remote->remoteClosed();
        }
    }

    // Dipanggil dengan network mutex terkunci
    bool pairedLocked() const { return !remote_.expired(); }

    void linkLocked(const std::shared_ptr<LoopbackDataChannel>& remote) {
        remote_ = remote;
        if (state_ == DataChannelState::Connecting) {
            setStateLocked(DataChannelState::Open);
        }
    }

    bool closedLocked() const {
        return state_ == DataChannelState::Closing || state_ == DataChannelState::Closed;
    }

    const DataChannelInit& init() const { return init_; }

private:
    void setStateLocked(DataChannelState state) {
        if (state_ == state) return;
        state_ = state;

        std::weak_ptr<LoopbackDataChannel> weak_self = weak_from_this();
        reactor_.post([weak_self, state]() {
            if (auto self = weak_self.lock()) {
                self->onStateChange.emit(state);
            }
        });
    }

    void transmit(core::ByteBuffer payload, bool binary) {
        std::shared_ptr<LoopbackDataChannel> remote;
        FaultInjector injector;
        bool link_up = false;
        std::size_t size = payload.size();
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            if (state_ != DataChannelState::Open) {
                throw core::Error(core::ErrorCode::ChannelNotOpen,
                                  "Data channel " + label_ + " is " + toString(state_));
            }
            if (size > network_->max_message_size_) {
                throw core::Error(core::ErrorCode::InvalidArgument,
                                  "Message of " + std::to_string(size) +
                                  " bytes exceeds transport limit");
            }
            remote = remote_.lock();
            injector = network_->fault_injector_;
            link_up = network_->link_up_;
            buffered_amount_ += size;
        }

        bool deliver = remote && link_up;
        FaultAction action = deliver && injector ? injector(label_, payload) : FaultAction::Deliver;
        if (action == FaultAction::Drop) {
            core::Logger::debug("Fault injector dropped message on {}", label_);
            deliver = false;
        }
        else if (deliver && action == FaultAction::Defer) {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            deferred_.emplace_back(std::move(payload), binary);
            deliver = false;
        }

        if (deliver) {
            std::vector<std::pair<core::ByteBuffer, bool>> late;
            {
                std::lock_guard<std::mutex> lock(network_->mutex_);
                late.swap(deferred_);
            }

            std::weak_ptr<LoopbackDataChannel> weak_remote = remote;
            remote->reactor_.post([weak_remote, payload = std::move(payload), binary]() {
                if (auto target = weak_remote.lock()) {
                    target->receive(payload, binary);
                }
            });
            for (auto& held : late) {
                remote->reactor_.post([weak_remote, frame = std::move(held.first), is_binary = held.second]() {
                    if (auto target = weak_remote.lock()) {
                        target->receive(frame, is_binary);
                    }
                });
            }
        }

        std::weak_ptr<LoopbackDataChannel> weak_self = weak_from_this();
        reactor_.post([weak_self, size]() {
            auto self = weak_self.lock();
            if (!self) return;

            std::uint64_t amount = 0;
            {
                std::lock_guard<std::mutex> lock(self->network_->mutex_);
                self->buffered_amount_ -= std::min<std::uint64_t>(size, self->buffered_amount_);
                amount = self->buffered_amount_;
            }
            self->onBufferedAmountChange.emit(amount);
        });
    }

    void receive(const core::ByteBuffer& payload, bool binary) {
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            if (state_ != DataChannelState::Open) {
                return;
            }
        }

        if (binary) {
            onBinaryMessage.emit(payload);
        } else {
            onMessage.emit(core::to_string(payload));
        }
    }

    void remoteClosed() {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        if (state_ == DataChannelState::Closed) return;
        setStateLocked(DataChannelState::Closed);
    }

    std::shared_ptr<LoopbackNetwork> network_;
    core::Reactor& reactor_;
    std::string label_;
    DataChannelInit init_;
    DataChannelState state_ = DataChannelState::Connecting;
    std::uint64_t buffered_amount_ = 0;
    std::vector<std::pair<core::ByteBuffer, bool>> deferred_;
    std::weak_ptr<LoopbackDataChannel> remote_;
};

// Loopback track sender
class LoopbackTrackSender : public MediaTrackSender,
                            public std::enable_shared_from_this<LoopbackTrackSender> {
public:
    LoopbackTrackSender(std::shared_ptr<LoopbackNetwork> network,
                        core::Reactor& reactor,
                        const std::string& track_id,
                        MediaKind kind)
        : network_(std::move(network)),
          reactor_(reactor),
          track_id_(track_id),
          kind_(kind) {}

    std::string trackId() const override { return track_id_; }
    MediaKind kind() const override { return kind_; }

    bool writable() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return writableLocked();
    }

    bool write(const MediaFrame& frame) override {
        std::shared_ptr<MediaTrackReceiver> receiver;
        core::Reactor* remote_reactor = nullptr;
        bool link_up = false;
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            if (!writableLocked()) {
                return false;
            }
            receiver = receiver_.lock();
            remote_reactor = remote_reactor_;
            link_up = network_->link_up_;
            ++in_flight_;
        }

        if (receiver && remote_reactor && link_up) {
            std::weak_ptr<MediaTrackReceiver> weak_receiver = receiver;
            remote_reactor->post([weak_receiver, frame]() {
                if (auto target = weak_receiver.lock()) {
                    target->deliver(frame);
                }
            });
        }

        std::weak_ptr<LoopbackTrackSender> weak_self = weak_from_this();
        reactor_.post([weak_self]() {
            auto self = weak_self.lock();
            if (!self) return;

            bool became_writable = false;
            {
                std::lock_guard<std::mutex> lock(self->network_->mutex_);
                bool was_writable = self->writableLocked();
                if (self->in_flight_ > 0) --self->in_flight_;
                became_writable = !was_writable && self->writableLocked();
            }
            if (became_writable) {
                self->onWritable.emit();
            }
        });
        return true;
    }

    void stop() override {
        std::shared_ptr<MediaTrackReceiver> receiver;
        core::Reactor* remote_reactor = nullptr;
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            if (stopped_) return;
            stopped_ = true;
            receiver = receiver_.lock();
            remote_reactor = remote_reactor_;
        }

        core::Logger::debug("Loopback track {} stopped", track_id_);
        if (receiver && remote_reactor) {
            remote_reactor->post([receiver]() { receiver->end(); });
        }
    }

    bool pairedLocked() const { return !receiver_.expired(); }
    bool stoppedLocked() const { return stopped_; }

    void linkLocked(const std::shared_ptr<MediaTrackReceiver>& receiver, core::Reactor& remote_reactor) {
        receiver_ = receiver;
        remote_reactor_ = &remote_reactor;

        std::weak_ptr<LoopbackTrackSender> weak_self = weak_from_this();
        reactor_.post([weak_self]() {
            if (auto self = weak_self.lock()) {
                self->onWritable.emit();
            }
        });
    }

private:
    bool writableLocked() const {
        return !stopped_ && !receiver_.expired() && in_flight_ < network_->track_capacity_;
    }

    std::shared_ptr<LoopbackNetwork> network_;
    core::Reactor& reactor_;
    std::string track_id_;
    MediaKind kind_;
    std::size_t in_flight_ = 0;
    bool stopped_ = false;
    std::weak_ptr<MediaTrackReceiver> receiver_;
    core::Reactor* remote_reactor_ = nullptr;
};

// Loopback peer connection
class LoopbackPeerConnection : public PeerConnection,
                               public std::enable_shared_from_this<LoopbackPeerConnection> {
public:
    LoopbackPeerConnection(std::shared_ptr<LoopbackNetwork> network,
                           core::Reactor& reactor,
                           std::string endpoint_id)
        : network_(std::move(network)),
          reactor_(reactor),
          endpoint_id_(std::move(endpoint_id)) {}

    SessionDescription createOffer() override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();
        return SessionDescription(SdpType::Offer, makeSdp(endpoint_id_));
    }

    SessionDescription createAnswer() override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();
        if (signaling_state_ != SignalingState::HaveRemoteOffer) {
            throw core::Error(core::ErrorCode::InvalidState, "No remote offer to answer");
        }
        return SessionDescription(SdpType::Answer, makeSdp(endpoint_id_));
    }

    void setLocalDescription(const SessionDescription& desc) override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();

        if (desc.type() == SdpType::Offer) {
            if (signaling_state_ != SignalingState::Stable) {
                throw core::Error(core::ErrorCode::InvalidState, "Cannot set local offer in current state");
            }
            signaling_state_ = SignalingState::HaveLocalOffer;
        } else {
            if (signaling_state_ != SignalingState::HaveRemoteOffer) {
                throw core::Error(core::ErrorCode::InvalidState, "Cannot set local answer without remote offer");
            }
            signaling_state_ = SignalingState::Stable;
        }
        local_ = desc;

        if (!gathered_) {
            gathered_ = true;
            IceCandidate candidate("0", 0, makeCandidate(endpoint_id_));
            std::weak_ptr<LoopbackPeerConnection> weak_self = weak_from_this();
            reactor_.post([weak_self, candidate]() {
                if (auto self = weak_self.lock()) {
                    self->onLocalCandidate.emit(candidate);
                }
            });
        }

        tryConnectLocked();
    }

    void setRemoteDescription(const SessionDescription& desc) override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();

        std::string endpoint = parseEndpoint(desc.sdp());
        if (endpoint.empty() || endpoint == endpoint_id_) {
            throw core::Error(core::ErrorCode::InvalidArgument, "Malformed session description");
        }

        if (desc.type() == SdpType::Offer) {
            if (signaling_state_ != SignalingState::Stable) {
                throw core::Error(core::ErrorCode::InvalidState, "Unexpected remote offer");
            }
            signaling_state_ = SignalingState::HaveRemoteOffer;
        } else {
            if (signaling_state_ != SignalingState::HaveLocalOffer) {
                throw core::Error(core::ErrorCode::InvalidState, "Unexpected remote answer");
            }
            signaling_state_ = SignalingState::Stable;
        }

        remote_ = desc;
        remote_endpoint_ = endpoint;
        tryConnectLocked();
    }

    std::optional<SessionDescription> localDescription() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return local_;
    }

    std::optional<SessionDescription> remoteDescription() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return remote_;
    }

    void addIceCandidate(const IceCandidate& candidate) override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();

        if (!remote_) {
            throw core::Error(core::ErrorCode::InvalidState, "Remote description not set");
        }

        std::string endpoint = parseCandidateEndpoint(candidate.candidate());
        if (endpoint.empty()) {
            throw core::Error(core::ErrorCode::InvalidArgument,
                              "Malformed ICE candidate: " + candidate.candidate());
        }
        if (endpoint != remote_endpoint_) {
            core::Logger::warn("Ignoring candidate for unknown endpoint {}", endpoint);
            return;
        }

        remote_candidate_ = true;
        tryConnectLocked();
    }

    void restartIce() override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        if (state_ == PeerConnectionState::Closed) return;

        core::Logger::debug("Restarting ICE on {}", endpoint_id_);
        if (state_ == PeerConnectionState::Disconnected || state_ == PeerConnectionState::Failed) {
            setStateLocked(PeerConnectionState::Connecting);
        }
        tryConnectLocked();
    }

    SignalingState signalingState() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return signaling_state_;
    }

    PeerConnectionState connectionState() const override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        return state_;
    }

    std::shared_ptr<DataChannel> createDataChannel(const std::string& label,
                                                   const DataChannelInit& options) override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();

        auto channel = std::make_shared<LoopbackDataChannel>(network_, reactor_, label, options);
        channels_.push_back(channel);
        core::Logger::debug("Created data channel {} on {}", label, endpoint_id_);

        if (auto peer = connectedPeerLocked()) {
            pairLocked(*peer);
        }
        return channel;
    }

    std::shared_ptr<MediaTrackSender> addTrack(const std::string& track_id, MediaKind kind) override {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        requireOpenLocked();

        auto sender = std::make_shared<LoopbackTrackSender>(network_, reactor_, track_id, kind);
        senders_.push_back(sender);

        if (auto peer = connectedPeerLocked()) {
            pairLocked(*peer);
        }
        return sender;
    }

    void removeTrack(const std::shared_ptr<MediaTrackSender>& sender) override {
        std::shared_ptr<LoopbackTrackSender> found;
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            auto it = std::find_if(senders_.begin(), senders_.end(),
                [&](const auto& candidate) { return candidate == sender; });
            if (it == senders_.end()) return;
            found = *it;
            senders_.erase(it);
        }
        found->stop();
    }

    void close() override {
        std::vector<std::shared_ptr<LoopbackDataChannel>> channels;
        std::vector<std::shared_ptr<LoopbackTrackSender>> senders;
        std::vector<std::shared_ptr<MediaTrackReceiver>> receivers;
        std::shared_ptr<LoopbackPeerConnection> peer;
        {
            std::lock_guard<std::mutex> lock(network_->mutex_);
            if (state_ == PeerConnectionState::Closed) return;

            setStateLocked(PeerConnectionState::Closed);
            signaling_state_ = SignalingState::Closed;
            channels.swap(channels_);
            senders.swap(senders_);
            receivers.swap(receivers_);
            peer = peerLocked();
            network_->endpoints_.erase(endpoint_id_);
        }

        core::Logger::info("Loopback peer connection {} closed", endpoint_id_);

        for (auto& channel : channels) {
            channel->close();
        }
        for (auto& sender : senders) {
            sender->stop();
        }

        for (auto& receiver : receivers) {
            reactor_.post([receiver]() { receiver->end(); });
        }

        if (peer) {
            peer->remoteHangup(endpoint_id_);
        }
    }

    const std::string& endpointId() const { return endpoint_id_; }

private:
    void requireOpenLocked() const {
        if (state_ == PeerConnectionState::Closed) {
            throw core::Error(core::ErrorCode::InvalidState, "Peer connection is closed");
        }
    }

    void setStateLocked(PeerConnectionState state) {
        if (state_ == state) return;
        state_ = state;
        core::Logger::debug("Loopback {} -> {}", endpoint_id_, toString(state));

        std::weak_ptr<LoopbackPeerConnection> weak_self = weak_from_this();
        reactor_.post([weak_self, state]() {
            if (auto self = weak_self.lock()) {
                self->onConnectionStateChange.emit(state);
            }
        });
    }

    std::shared_ptr<LoopbackPeerConnection> peerLocked() const {
        if (remote_endpoint_.empty()) return nullptr;
        auto it = network_->endpoints_.find(remote_endpoint_);
        if (it == network_->endpoints_.end()) return nullptr;
        return it->second.lock();
    }

    // Peer yang connected dan menunjuk balik ke kita
    std::shared_ptr<LoopbackPeerConnection> connectedPeerLocked() const {
        if (state_ != PeerConnectionState::Connected) return nullptr;
        auto peer = peerLocked();
        if (!peer || peer->state_ != PeerConnectionState::Connected ||
            peer->remote_endpoint_ != endpoint_id_) {
            return nullptr;
        }
        return peer;
    }

    void tryConnectLocked() {
        if (state_ == PeerConnectionState::Closed || state_ == PeerConnectionState::Failed ||
            state_ == PeerConnectionState::Connected) {
            return;
        }
        if (!local_ || !remote_ || !remote_candidate_) {
            return;
        }

        if (state_ == PeerConnectionState::New || state_ == PeerConnectionState::Disconnected) {
            setStateLocked(PeerConnectionState::Connecting);
        }

        if (network_->ice_failure_) {
            setStateLocked(PeerConnectionState::Failed);
            return;
        }
        if (!network_->link_up_) {
            return;
        }

        auto peer = peerLocked();
        if (!peer || peer->state_ == PeerConnectionState::Closed) {
            return;
        }

        setStateLocked(PeerConnectionState::Connected);

        // Path pulih untuk kedua sisi
        if (peer->remote_endpoint_ == endpoint_id_ &&
            peer->state_ == PeerConnectionState::Connecting && peer->remote_candidate_ &&
            peer->local_ && peer->remote_) {
            peer->setStateLocked(PeerConnectionState::Connected);
        } else if (peer->remote_endpoint_ == endpoint_id_ &&
                   peer->state_ == PeerConnectionState::Disconnected) {
            peer->setStateLocked(PeerConnectionState::Connected);
        }

        if (peer->state_ == PeerConnectionState::Connected && peer->remote_endpoint_ == endpoint_id_) {
            pairLocked(*peer);
        }
    }

    // Pasangkan channel dan track yang belum punya pasangan di kedua arah
    void pairLocked(LoopbackPeerConnection& peer) {
        pairChannelsLocked(*this, peer);
        pairChannelsLocked(peer, *this);
        pairTracksLocked(*this, peer);
        pairTracksLocked(peer, *this);
    }

    static void pairChannelsLocked(LoopbackPeerConnection& from, LoopbackPeerConnection& to) {
        for (auto& channel : from.channels_) {
            if (channel->pairedLocked() || channel->closedLocked()) continue;

            auto counterpart = std::make_shared<LoopbackDataChannel>(
                to.network_, to.reactor_, channel->label(), channel->init());
            to.channels_.push_back(counterpart);

            std::weak_ptr<LoopbackPeerConnection> weak_to = to.weak_from_this();
            to.reactor_.post([weak_to, counterpart]() {
                if (auto target = weak_to.lock()) {
                    target->onDataChannel.emit(counterpart);
                }
            });

            channel->linkLocked(counterpart);
            counterpart->linkLocked(channel);
            core::Logger::debug("Paired data channel {} between {} and {}",
                                channel->label(), from.endpoint_id_, to.endpoint_id_);
        }
    }

    static void pairTracksLocked(LoopbackPeerConnection& from, LoopbackPeerConnection& to) {
        for (auto& sender : from.senders_) {
            if (sender->pairedLocked() || sender->stoppedLocked()) continue;

            auto receiver = std::make_shared<MediaTrackReceiver>(sender->trackId(), sender->kind());
            to.receivers_.push_back(receiver);

            std::weak_ptr<LoopbackPeerConnection> weak_to = to.weak_from_this();
            to.reactor_.post([weak_to, receiver]() {
                if (auto target = weak_to.lock()) {
                    target->onTrack.emit(receiver);
                }
            });

            sender->linkLocked(receiver, to.reactor_);
        }
    }

    void remoteHangup(const std::string& endpoint) {
        std::lock_guard<std::mutex> lock(network_->mutex_);
        if (remote_endpoint_ != endpoint) return;
        if (state_ == PeerConnectionState::Connected || state_ == PeerConnectionState::Connecting) {
            setStateLocked(PeerConnectionState::Disconnected);
        }
    }

    friend class LoopbackNetwork;

    std::shared_ptr<LoopbackNetwork> network_;
    core::Reactor& reactor_;
    std::string endpoint_id_;

    PeerConnectionState state_ = PeerConnectionState::New;
    SignalingState signaling_state_ = SignalingState::Stable;
    std::optional<SessionDescription> local_;
    std::optional<SessionDescription> remote_;
    std::string remote_endpoint_;
    bool remote_candidate_ = false;
    bool gathered_ = false;

    std::vector<std::shared_ptr<LoopbackDataChannel>> channels_;
    std::vector<std::shared_ptr<LoopbackTrackSender>> senders_;
    std::vector<std::shared_ptr<MediaTrackReceiver>> receivers_;
};

// LoopbackNetwork implementation
std::shared_ptr<LoopbackNetwork> LoopbackNetwork::create() {
    return std::shared_ptr<LoopbackNetwork>(new LoopbackNetwork());
}

std::shared_ptr<PeerConnection> LoopbackNetwork::createPeerConnection(core::Reactor& reactor,
                                                                      const PeerConfiguration& config) {
    std::string endpoint_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoint_id = "loopback-" + std::to_string(next_endpoint_++);

        // Endpoint yang sudah hilang dibersihkan di sini
        for (auto it = endpoints_.begin(); it != endpoints_.end();) {
            if (it->second.expired()) {
                it = endpoints_.erase(it);
            } else {
                ++it;
            }
        }
    }

    auto pc = std::make_shared<LoopbackPeerConnection>(shared_from_this(), reactor, endpoint_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoints_[endpoint_id] = pc;
    }

    core::Logger::info("Created loopback peer connection {} ({} ICE servers configured)",
                       endpoint_id, config.ice_servers.size());
    return pc;
}

PeerConnectionFactory LoopbackNetwork::factory(core::Reactor& reactor) {
    auto self = shared_from_this();
    return [self, &reactor](const PeerConfiguration& config) {
        return self->createPeerConnection(reactor, config);
    };
}

void LoopbackNetwork::setLinkUp(bool up) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (link_up_ == up) return;
    link_up_ = up;
    core::Logger::info("Loopback link {}", up ? "up" : "down");

    std::vector<std::shared_ptr<LoopbackPeerConnection>> peers;
    for (auto& [id, weak_pc] : endpoints_) {
        if (auto pc = weak_pc.lock()) {
            peers.push_back(pc);
        }
    }

    for (auto& pc : peers) {
        if (!up && pc->state_ == PeerConnectionState::Connected) {
            pc->setStateLocked(PeerConnectionState::Disconnected);
        } else if (up && pc->state_ == PeerConnectionState::Connecting) {
            pc->tryConnectLocked();
        }
    }
}

bool LoopbackNetwork::linkUp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_up_;
}

void LoopbackNetwork::setIceFailure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    ice_failure_ = fail;
}

void LoopbackNetwork::setMaxMessageSize(std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_message_size_ = size;
}

std::size_t LoopbackNetwork::maxMessageSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_message_size_;
}

void LoopbackNetwork::setTrackCapacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    track_capacity_ = capacity;
}

void LoopbackNetwork::setFaultInjector(FaultInjector injector) {
    std::lock_guard<std::mutex> lock(mutex_);
    fault_injector_ = std::move(injector);
}

std::size_t LoopbackNetwork::activeConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, weak_pc] : endpoints_) {
        auto pc = weak_pc.lock();
        if (pc && pc->state_ == PeerConnectionState::Connected) {
            ++count;
        }
    }
    return count;
}

} // namespace peerlink::webrtc
