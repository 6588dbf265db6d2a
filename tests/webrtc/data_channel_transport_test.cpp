#include <gtest/gtest.h>
#include <peerlink/core/reactor.hpp>
#include <peerlink/webrtc/data_channel_transport.hpp>
#include <peerlink/webrtc/loopback.hpp>

#include "loopback_pair.hpp"

#include <string>
#include <vector>

namespace peerlink::webrtc::test {

using namespace std::chrono_literals;

class DataChannelTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = LoopbackNetwork::create();
        local_ = DataChannelTransport::create(reactor_);
        remote_ = DataChannelTransport::create(reactor_);

        local_->onChannelOpen.addListener([this](const std::string& label) { local_open_.push_back(label); });
        remote_->onChannelOpen.addListener([this](const std::string& label) { remote_open_.push_back(label); });
        remote_->onChannelClosed.addListener([this](const std::string& label) { remote_closed_.push_back(label); });
        remote_->onMessage.addListener([this](const DataChannelMessage& message) { received_.push_back(message); });
    }

    // Offerer membuat channel default, answerer menerimanya lewat onDataChannel
    void connect(bool with_media_signal = true) {
        pair_ = connectLoopbackPair(reactor_, *network_, [&](PeerConnection& pc) {
            for (const auto& spec : DataChannelTransport::defaultChannels()) {
                if (!with_media_signal && spec.label == kMediaSignalChannel) continue;
                local_->attachChannel(pc.createDataChannel(spec.label, spec.init));
            }
        });
        for (const auto& channel : *pair_.remote_channels) {
            remote_->attachChannel(channel);
        }
        reactor_.runUntil([&]() { return remote_open_.size() == pair_.remote_channels->size(); }, 1000ms);
    }

    core::Reactor reactor_;
    std::shared_ptr<LoopbackNetwork> network_;
    std::shared_ptr<DataChannelTransport> local_;
    std::shared_ptr<DataChannelTransport> remote_;
    LoopbackPair pair_;

    std::vector<std::string> local_open_;
    std::vector<std::string> remote_open_;
    std::vector<std::string> remote_closed_;
    std::vector<DataChannelMessage> received_;
};

TEST_F(DataChannelTransportTest, DefaultChannels) {
    auto channels = DataChannelTransport::defaultChannels();
    ASSERT_EQ(channels.size(), 2u);
    EXPECT_EQ(channels[0].label, "control");
    EXPECT_TRUE(channels[0].init.ordered);
    EXPECT_FALSE(channels[0].init.max_retransmits.has_value());
    EXPECT_EQ(channels[1].label, "media-signal");
    EXPECT_FALSE(channels[1].init.ordered);
    EXPECT_EQ(channels[1].init.max_retransmits.value_or(-1), 0);
}

TEST_F(DataChannelTransportTest, SendBeforeOpenFails) {
    auto result = local_->send(TextMessage{"early", false});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ChannelNotOpen);
    EXPECT_FALSE(local_->isOpen());
}

TEST_F(DataChannelTransportTest, OpenEventsFireOncePerChannel) {
    connect();
    reactor_.runFor(20ms);

    EXPECT_EQ(local_open_.size(), 2u);
    EXPECT_EQ(remote_open_.size(), 2u);
    EXPECT_TRUE(local_->isOpen(true));
    EXPECT_TRUE(local_->isOpen(false));
    EXPECT_TRUE(remote_->isOpen(true));
}

TEST_F(DataChannelTransportTest, MessagesArriveInOrderOnControl) {
    connect();

    FileChunkMessage chunk;
    chunk.transfer_id = 1;
    chunk.index = 0;
    chunk.data = {1, 2, 3, 4};

    ASSERT_TRUE(local_->send(TextMessage{"one", false}).is_ok());
    ASSERT_TRUE(local_->send(chunk).is_ok());
    ASSERT_TRUE(local_->send(TextMessage{"two", false}).is_ok());

    ASSERT_TRUE(reactor_.runUntil([&]() { return received_.size() == 3; }, 1000ms));
    EXPECT_EQ(std::get<TextMessage>(received_[0]).body, "one");
    EXPECT_EQ(std::get<FileChunkMessage>(received_[1]).data, chunk.data);
    EXPECT_EQ(std::get<TextMessage>(received_[2]).body, "two");
}

TEST_F(DataChannelTransportTest, UnreliableMessagesUseMediaSignal) {
    connect();

    std::vector<std::string> labels;
    network_->setFaultInjector([&](const std::string& label, core::ByteBuffer&) {
        labels.push_back(label);
        return FaultAction::Deliver;
    });

    SendOptions unreliable;
    unreliable.reliable = false;
    unreliable.ordered = false;
    ASSERT_TRUE(local_->send(MediaControlMessage{"keyframe"}, unreliable).is_ok());
    ASSERT_TRUE(local_->send(TextMessage{"x", false}).is_ok());

    ASSERT_TRUE(reactor_.runUntil([&]() { return received_.size() == 2; }, 1000ms));
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], "media-signal");
    EXPECT_EQ(labels[1], "control");
}

TEST_F(DataChannelTransportTest, MissingUnreliableChannelFails) {
    connect(false);

    SendOptions unreliable;
    unreliable.reliable = false;
    auto result = local_->send(MediaControlMessage{"x"}, unreliable);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::ChannelNotOpen);
}

TEST_F(DataChannelTransportTest, OversizedMessageIsRejectedBeforeSending) {
    auto small = DataChannelTransport::create(reactor_, 64);
    auto result = small->send(TextMessage{std::string(200, 'x'), false});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidArgument);
}

TEST_F(DataChannelTransportTest, UndecodableFramesAreDropped) {
    connect();

    auto raw = pair_.offerer->createDataChannel("control");
    // Channel baru menggantikan yang lama di sisi penerima
    ASSERT_TRUE(reactor_.runUntil([&]() { return pair_.remote_channels->size() == 3; }, 1000ms));
    remote_->attachChannel(pair_.remote_channels->back());
    reactor_.runFor(20ms);

    raw->send(std::string("garbage"));
    raw->send(core::ByteBuffer{0x7F});
    raw->send(encodeMessage(TextMessage{"valid", false}).text);

    ASSERT_TRUE(reactor_.runUntil([&]() { return received_.size() == 1; }, 1000ms));
    EXPECT_EQ(std::get<TextMessage>(received_[0]).body, "valid");
}

TEST_F(DataChannelTransportTest, RemoteCloseEmitsChannelClosed) {
    connect();
    local_->close();
    local_->close();

    ASSERT_TRUE(reactor_.runUntil([&]() { return remote_closed_.size() == 2; }, 1000ms));
    EXPECT_FALSE(remote_->isOpen(true));

    auto result = local_->send(TextMessage{"late", false});
    EXPECT_TRUE(result.is_error());
}

} // namespace peerlink::webrtc::test
