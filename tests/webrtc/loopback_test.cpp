#include <gtest/gtest.h>
#include <peerlink/core/reactor.hpp>
#include <peerlink/webrtc/loopback.hpp>

#include "loopback_pair.hpp"

#include <string>
#include <vector>

namespace peerlink::webrtc::test {

using namespace std::chrono_literals;

class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = LoopbackNetwork::create();
    }

    core::Reactor reactor_;
    std::shared_ptr<LoopbackNetwork> network_;
};

TEST_F(LoopbackTest, NegotiationConnectsBothSides) {
    auto pair = connectLoopbackPair(reactor_, *network_);

    EXPECT_EQ(pair.offerer->connectionState(), PeerConnectionState::Connected);
    EXPECT_EQ(pair.answerer->connectionState(), PeerConnectionState::Connected);
    EXPECT_EQ(pair.offerer->signalingState(), SignalingState::Stable);
    EXPECT_EQ(network_->activeConnections(), 2u);
}

TEST_F(LoopbackTest, AnswerWithoutOfferIsRejected) {
    auto pc = network_->createPeerConnection(reactor_);
    EXPECT_THROW(pc->createAnswer(), core::Error);

    IceCandidate candidate("0", 0, "candidate:1 1 udp 1 loopback-99 9 typ host");
    EXPECT_THROW(pc->addIceCandidate(candidate), core::Error);
}

TEST_F(LoopbackTest, MalformedDescriptionIsRejected) {
    auto pc = network_->createPeerConnection(reactor_);
    try {
        pc->setRemoteDescription(SessionDescription(SdpType::Offer, "v=0\r\n"));
        FAIL() << "Expected core::Error";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::InvalidArgument);
    }
}

TEST_F(LoopbackTest, DataChannelIsPairedByLabel) {
    std::shared_ptr<DataChannel> local;
    auto pair = connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        local = pc.createDataChannel("control");
    });

    ASSERT_EQ(pair.remote_channels->size(), 1u);
    auto remote = pair.remote_channels->front();
    EXPECT_EQ(remote->label(), "control");
    EXPECT_EQ(local->state(), DataChannelState::Open);
    EXPECT_EQ(remote->state(), DataChannelState::Open);

    std::vector<std::string> texts;
    std::vector<core::ByteBuffer> blobs;
    remote->onMessage.addListener([&](const std::string& text) { texts.push_back(text); });
    remote->onBinaryMessage.addListener([&](const core::ByteBuffer& data) { blobs.push_back(data); });

    local->send(std::string("hello"));
    local->send(core::ByteBuffer{1, 2, 3});

    ASSERT_TRUE(reactor_.runUntil([&]() { return texts.size() == 1 && blobs.size() == 1; }, 1000ms));
    EXPECT_EQ(texts[0], "hello");
    EXPECT_EQ(blobs[0], (core::ByteBuffer{1, 2, 3}));
}

TEST_F(LoopbackTest, SendOnUnpairedChannelThrows) {
    auto pc = network_->createPeerConnection(reactor_);
    auto channel = pc->createDataChannel("control");
    EXPECT_EQ(channel->state(), DataChannelState::Connecting);

    try {
        channel->send(std::string("early"));
        FAIL() << "Expected core::Error";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ChannelNotOpen);
    }
}

TEST_F(LoopbackTest, OversizedMessageIsRejected) {
    std::shared_ptr<DataChannel> local;
    connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        local = pc.createDataChannel("control");
    });
    network_->setMaxMessageSize(16);

    try {
        local->send(core::ByteBuffer(17, 0));
        FAIL() << "Expected core::Error";
    }
    catch (const core::Error& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::InvalidArgument);
    }
}

TEST_F(LoopbackTest, FaultInjectorCanCorruptAndDrop) {
    std::shared_ptr<DataChannel> local;
    auto pair = connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        local = pc.createDataChannel("control");
    });

    ASSERT_EQ(pair.remote_channels->size(), 1u);
    auto remote = pair.remote_channels->front();

    std::vector<core::ByteBuffer> received;
    remote->onBinaryMessage.addListener([&](const core::ByteBuffer& data) { received.push_back(data); });

    int seen = 0;
    network_->setFaultInjector([&](const std::string& label, core::ByteBuffer& payload) {
        EXPECT_EQ(label, "control");
        ++seen;
        if (seen == 1) {
            payload[0] ^= 0xFF;
            return FaultAction::Deliver;
        }
        return seen == 2 ? FaultAction::Drop : FaultAction::Deliver;
    });

    local->send(core::ByteBuffer{0x01});
    local->send(core::ByteBuffer{0x02});
    local->send(core::ByteBuffer{0x03});

    ASSERT_TRUE(reactor_.runUntil([&]() { return received.size() == 2; }, 1000ms));
    reactor_.runFor(20ms);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], (core::ByteBuffer{0xFE}));
    EXPECT_EQ(received[1], (core::ByteBuffer{0x03}));
    EXPECT_EQ(seen, 3);
}

TEST_F(LoopbackTest, DeferredMessageArrivesAfterNextOne) {
    std::shared_ptr<DataChannel> local;
    auto pair = connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        local = pc.createDataChannel("control");
    });

    ASSERT_EQ(pair.remote_channels->size(), 1u);
    auto remote = pair.remote_channels->front();

    std::vector<core::ByteBuffer> received;
    remote->onBinaryMessage.addListener([&](const core::ByteBuffer& data) { received.push_back(data); });

    network_->setFaultInjector([](const std::string&, core::ByteBuffer& payload) {
        return payload[0] == 0x02 ? FaultAction::Defer : FaultAction::Deliver;
    });

    local->send(core::ByteBuffer{0x01});
    local->send(core::ByteBuffer{0x02});
    local->send(core::ByteBuffer{0x03});
    local->send(core::ByteBuffer{0x04});

    ASSERT_TRUE(reactor_.runUntil([&]() { return received.size() == 4; }, 1000ms));
    EXPECT_EQ(received, (std::vector<core::ByteBuffer>{{0x01}, {0x03}, {0x02}, {0x04}}));
}

TEST_F(LoopbackTest, LinkDownDisconnectsAndRestartRecovers) {
    auto pair = connectLoopbackPair(reactor_, *network_);

    std::vector<PeerConnectionState> states;
    pair.offerer->onConnectionStateChange.addListener([&](PeerConnectionState state) {
        states.push_back(state);
    });

    network_->setLinkUp(false);
    ASSERT_TRUE(reactor_.runUntil([&]() {
        return pair.offerer->connectionState() == PeerConnectionState::Disconnected &&
               pair.answerer->connectionState() == PeerConnectionState::Disconnected;
    }, 1000ms));
    EXPECT_EQ(network_->activeConnections(), 0u);

    pair.offerer->restartIce();
    pair.answerer->restartIce();
    EXPECT_EQ(pair.offerer->connectionState(), PeerConnectionState::Connecting);

    network_->setLinkUp(true);
    ASSERT_TRUE(reactor_.runUntil([&]() {
        return pair.offerer->connectionState() == PeerConnectionState::Connected &&
               pair.answerer->connectionState() == PeerConnectionState::Connected;
    }, 1000ms));

    reactor_.runFor(10ms);
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front(), PeerConnectionState::Disconnected);
    EXPECT_EQ(states.back(), PeerConnectionState::Connected);
}

TEST_F(LoopbackTest, IceFailureEndsInFailed) {
    network_->setIceFailure(true);
    auto pair = connectLoopbackPair(reactor_, *network_);

    ASSERT_TRUE(reactor_.runUntil([&]() {
        return pair.offerer->connectionState() == PeerConnectionState::Failed &&
               pair.answerer->connectionState() == PeerConnectionState::Failed;
    }, 1000ms));
    EXPECT_EQ(network_->activeConnections(), 0u);
}

TEST_F(LoopbackTest, CloseDisconnectsRemoteAndClosesChannels) {
    std::shared_ptr<DataChannel> local;
    auto pair = connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        local = pc.createDataChannel("control");
    });

    ASSERT_EQ(pair.remote_channels->size(), 1u);
    auto remote = pair.remote_channels->front();

    pair.offerer->close();
    pair.offerer->close();

    EXPECT_EQ(pair.offerer->connectionState(), PeerConnectionState::Closed);
    EXPECT_EQ(local->state(), DataChannelState::Closed);
    EXPECT_EQ(remote->state(), DataChannelState::Closed);

    ASSERT_TRUE(reactor_.runUntil([&]() {
        return pair.answerer->connectionState() == PeerConnectionState::Disconnected;
    }, 1000ms));
    EXPECT_THROW(pair.offerer->createOffer(), core::Error);
}

TEST_F(LoopbackTest, TrackFramesReachRemoteReceiver) {
    std::shared_ptr<MediaTrackSender> sender;
    auto pair = connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        sender = pc.addTrack("mic", MediaKind::Audio);
    });

    ASSERT_EQ(pair.remote_tracks->size(), 1u);
    auto receiver = pair.remote_tracks->front();
    EXPECT_EQ(receiver->trackId(), "mic");
    EXPECT_EQ(receiver->kind(), MediaKind::Audio);

    std::vector<core::ByteBuffer> frames;
    receiver->onFrame.addListener([&](const MediaFrame& frame) { frames.push_back(frame.data); });

    ASSERT_TRUE(sender->writable());
    MediaFrame frame;
    frame.data = {9, 9};
    EXPECT_TRUE(sender->write(frame));

    ASSERT_TRUE(reactor_.runUntil([&]() { return frames.size() == 1; }, 1000ms));
    EXPECT_EQ(frames[0], (core::ByteBuffer{9, 9}));

    bool ended = false;
    receiver->onEnded.addListener([&]() { ended = true; });
    pair.offerer->removeTrack(sender);
    ASSERT_TRUE(reactor_.runUntil([&]() { return ended; }, 1000ms));
    EXPECT_FALSE(sender->writable());
}

TEST_F(LoopbackTest, TrackCapacityLimitsInFlightFrames) {
    network_->setTrackCapacity(2);
    std::shared_ptr<MediaTrackSender> sender;
    connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
        sender = pc.addTrack("cam", MediaKind::Video);
    });

    ASSERT_TRUE(sender->writable());
    EXPECT_TRUE(sender->write(MediaFrame{}));
    EXPECT_TRUE(sender->write(MediaFrame{}));
    EXPECT_FALSE(sender->writable());
    EXPECT_FALSE(sender->write(MediaFrame{}));

    bool writable_again = false;
    sender->onWritable.addListener([&]() { writable_again = true; });
    ASSERT_TRUE(reactor_.runUntil([&]() { return writable_again; }, 1000ms));
    EXPECT_TRUE(sender->writable());
}

} // namespace peerlink::webrtc::test
