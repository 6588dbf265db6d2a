#include <gtest/gtest.h>
#include <peerlink/core/checksum.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/session/session.hpp>
#include <peerlink/webrtc/data_channel_transport.hpp>
#include <peerlink/webrtc/loopback.hpp>
#include <peerlink/webrtc/signaling.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace peerlink::session::test {

using namespace std::chrono_literals;

namespace {

class CountingProcessor : public ContentProcessor {
public:
    std::optional<std::string> processText(const std::string&, const std::string& text) override {
        ++texts;
        return "echo: " + text;
    }

    std::optional<std::string> processFile(const std::string&, const transfer::ReceivedFile& file) override {
        ++files;
        return "stored " + file.name;
    }

    std::atomic<int> texts{0};
    std::atomic<int> files{0};
};

class RecordingSink : public webrtc::MediaSink {
public:
    void onFrame(const std::string& track_id, const webrtc::MediaFrame& frame) override {
        frames.emplace_back(track_id, frame.data);
    }
    void onTrackEnded(const std::string& track_id) override { ended.push_back(track_id); }

    std::vector<std::pair<std::string, core::ByteBuffer>> frames;
    std::vector<std::string> ended;
};

// Index chunk dari frame biner, nullopt untuk frame lain
std::optional<std::uint32_t> chunkIndexOf(const core::ByteBuffer& payload) {
    if (payload.size() < webrtc::kChunkHeaderSize || payload[0] != webrtc::kChunkFrameTag) {
        return std::nullopt;
    }
    return (static_cast<std::uint32_t>(payload[9]) << 24) |
           (static_cast<std::uint32_t>(payload[10]) << 16) |
           (static_cast<std::uint32_t>(payload[11]) << 8) |
           static_cast<std::uint32_t>(payload[12]);
}

std::uint32_t transferIdOf(const core::ByteBuffer& payload) {
    return (static_cast<std::uint32_t>(payload[1]) << 24) |
           (static_cast<std::uint32_t>(payload[2]) << 16) |
           (static_cast<std::uint32_t>(payload[3]) << 8) |
           static_cast<std::uint32_t>(payload[4]);
}

core::ByteBuffer pattern(std::size_t size) {
    core::ByteBuffer data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 13) ^ (i >> 8));
    }
    return data;
}

SessionConfig baseConfig(webrtc::PeerRole role, const std::string& endpoint) {
    SessionConfig config;
    config.role = role;
    config.endpoint = endpoint;
    config.negotiation_timeout = 2000ms;
    config.transfer.chunk_size = 1024;
    config.transfer.window_size = 8;
    config.transfer.ack_every = 4;
    config.transfer.ack_delay = 20ms;
    config.transfer.ack_timeout = 500ms;
    config.transfer.retry_budget = 2;
    return config;
}

struct Events {
    std::vector<std::string> texts;
    std::vector<std::string> responses;
    std::vector<transfer::ReceivedFile> files;
    std::vector<transfer::TransferInfo> completed;
    std::vector<std::pair<transfer::TransferInfo, core::ErrorCode>> failed;
    std::vector<core::ErrorCode> errors;
    std::vector<SessionState> states;
    std::vector<std::string> media_control;
    // Urutan text dan file yang diterima
    std::vector<std::string> order;
};

void record(Session& session, Events& events) {
    session.onText.addListener([&events](const webrtc::TextMessage& message) {
        if (message.response) {
            events.responses.push_back(message.body);
        } else {
            events.texts.push_back(message.body);
            events.order.push_back("text:" + message.body);
        }
    });
    session.onFileReceived.addListener([&events](const transfer::ReceivedFile& file) {
        events.files.push_back(file);
        events.order.push_back("file:" + file.name);
    });
    session.onTransferComplete.addListener([&events](const transfer::TransferInfo& info) {
        events.completed.push_back(info);
    });
    session.onTransferFailed.addListener([&events](const transfer::TransferInfo& info, const core::Error& error) {
        events.failed.emplace_back(info, error.code());
    });
    session.onError.addListener([&events](const core::Error& error) {
        events.errors.push_back(error.code());
    });
    session.onStateChange.addListener([&events](SessionState state) {
        events.states.push_back(state);
    });
    session.onMediaControl.addListener([&events](const std::string& payload) {
        events.media_control.push_back(payload);
    });
}

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = webrtc::LoopbackNetwork::create();
        server_processor_ = std::make_shared<CountingProcessor>();
        client_processor_ = std::make_shared<CountingProcessor>();
    }

    void TearDown() override {
        if (client_) client_->close();
        if (server_) server_->close();
        reactor_.runFor(20ms);
        client_.reset();
        server_.reset();
    }

    void create(SessionConfig server_config = baseConfig(webrtc::PeerRole::Answerer, "server"),
                SessionConfig client_config = baseConfig(webrtc::PeerRole::Offerer, "client")) {
        auto [server_signaling, client_signaling] = webrtc::LoopbackSignaling::createPair(reactor_, reactor_);
        server_ = Session::create(reactor_, server_signaling, network_->factory(reactor_),
                                  std::move(server_config), server_processor_);
        client_ = Session::create(reactor_, client_signaling, network_->factory(reactor_),
                                  std::move(client_config), client_processor_);
        record(*server_, server_events_);
        record(*client_, client_events_);
    }

    // Kembali setelah kedua callback connect dipanggil
    void connectBoth() {
        server_->connect([this](core::Result<void> result) { server_result_ = result; });
        client_->connect([this](core::Result<void> result) { client_result_ = result; });
        ASSERT_TRUE(reactor_.runUntil([&]() { return server_result_ && client_result_; }, 3000ms));
    }

    void connected() {
        create();
        connectBoth();
        ASSERT_TRUE(server_result_->is_ok());
        ASSERT_TRUE(client_result_->is_ok());
        reactor_.runFor(20ms);
    }

    // Chunk dengan index >= limit tidak pernah sampai
    void stallChunksFrom(std::uint32_t limit) {
        network_->setFaultInjector([limit](const std::string&, core::ByteBuffer& payload) {
            auto index = chunkIndexOf(payload);
            return index && *index >= limit ? webrtc::FaultAction::Drop : webrtc::FaultAction::Deliver;
        });
    }

    core::Reactor reactor_;
    std::shared_ptr<webrtc::LoopbackNetwork> network_;
    std::shared_ptr<CountingProcessor> server_processor_;
    std::shared_ptr<CountingProcessor> client_processor_;
    std::shared_ptr<Session> server_;
    std::shared_ptr<Session> client_;
    Events server_events_;
    Events client_events_;
    std::optional<core::Result<void>> server_result_;
    std::optional<core::Result<void>> client_result_;
};

TEST_F(SessionTest, ConnectsBothSides) {
    connected();

    EXPECT_EQ(server_->state(), SessionState::Connected);
    EXPECT_EQ(client_->state(), SessionState::Connected);
    ASSERT_FALSE(client_events_.states.empty());
    EXPECT_EQ(client_events_.states.front(), SessionState::Negotiating);
    EXPECT_EQ(client_events_.states.back(), SessionState::Connected);
    ASSERT_NE(client_->peerSession(), nullptr);
    EXPECT_EQ(client_->pendingOutbound(), 0u);
}

TEST_F(SessionTest, ConnectTwiceIsRejected) {
    connected();

    std::optional<core::Result<void>> again;
    client_->connect([&](core::Result<void> result) { again = result; });
    ASSERT_TRUE(reactor_.runUntil([&]() { return again.has_value(); }, 1000ms));
    ASSERT_TRUE(again->is_error());
    EXPECT_EQ(again->error().code(), core::ErrorCode::InvalidState);
    EXPECT_EQ(client_->state(), SessionState::Connected);
}

TEST_F(SessionTest, TextGetsProcessedResponse) {
    connected();

    ASSERT_TRUE(client_->sendText("hello").is_ok());
    ASSERT_TRUE(reactor_.runUntil([&]() { return client_events_.responses.size() == 1; }, 2000ms));

    EXPECT_EQ(server_events_.texts, (std::vector<std::string>{"hello"}));
    EXPECT_EQ(client_events_.responses[0], "echo: hello");
    EXPECT_EQ(server_processor_->texts.load(), 1);

    // Response tidak diproses ulang oleh penerima
    reactor_.runFor(50ms);
    EXPECT_EQ(client_processor_->texts.load(), 0);
    EXPECT_TRUE(server_events_.responses.empty());
}

TEST_F(SessionTest, TextBeforeConnectIsQueued) {
    create();

    ASSERT_TRUE(client_->sendText("early").is_ok());
    EXPECT_EQ(client_->pendingOutbound(), 1u);

    auto file = client_->sendBytes("early.bin", pattern(10));
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().code(), core::ErrorCode::InvalidState);

    connectBoth();
    ASSERT_TRUE(reactor_.runUntil([&]() { return server_events_.texts.size() == 1; }, 2000ms));
    EXPECT_EQ(server_events_.texts[0], "early");
    EXPECT_EQ(client_->pendingOutbound(), 0u);
}

TEST_F(SessionTest, FileArrivesAndIsProcessedOnce) {
    connected();

    auto data = pattern(8 * 1024);
    auto id = client_->sendBytes("data.bin", data);
    ASSERT_TRUE(id.is_ok());
    EXPECT_EQ(id.value(), 1u);

    ASSERT_TRUE(reactor_.runUntil([&]() {
        return client_events_.completed.size() == 1 && client_events_.responses.size() == 1;
    }, 3000ms));

    ASSERT_EQ(server_events_.files.size(), 1u);
    EXPECT_EQ(server_events_.files[0].name, "data.bin");
    EXPECT_EQ(server_events_.files[0].data, data);
    EXPECT_EQ(server_events_.files[0].checksum, core::sha256Hex(data));
    EXPECT_EQ(client_events_.responses[0], "stored data.bin");

    EXPECT_EQ(client_events_.completed[0].chunk_count, 8u);
    EXPECT_EQ(client_events_.completed[0].attempt, 1u);

    reactor_.runFor(50ms);
    EXPECT_EQ(server_processor_->files.load(), 1);

    auto info = server_->transfer(id.value());
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->direction, transfer::TransferDirection::Incoming);
    EXPECT_EQ(info->state, transfer::TransferState::Complete);
    EXPECT_EQ(client_->transfers().size(), 1u);
}

TEST_F(SessionTest, TextInterleavesWithTransfer) {
    connected();

    auto id = client_->sendBytes("big.bin", pattern(32 * 1024));
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(client_->sendText("while sending").is_ok());

    ASSERT_TRUE(reactor_.runUntil([&]() { return server_events_.files.size() == 1; }, 5000ms));
    ASSERT_EQ(server_events_.order.size(), 2u);
    EXPECT_EQ(server_events_.order[0], "text:while sending");
    EXPECT_EQ(server_events_.order[1], "file:big.bin");
}

TEST_F(SessionTest, CorruptedChunkIsRetried) {
    connected();

    bool corrupted = false;
    network_->setFaultInjector([&](const std::string&, core::ByteBuffer& payload) {
        auto index = chunkIndexOf(payload);
        if (index && *index == 2 && !corrupted) {
            payload.back() ^= 0x5A;
            corrupted = true;
        }
        return webrtc::FaultAction::Deliver;
    });

    auto data = pattern(6 * 1024);
    ASSERT_TRUE(client_->sendBytes("retry.bin", data).is_ok());
    ASSERT_TRUE(reactor_.runUntil([&]() { return client_events_.completed.size() == 1; }, 3000ms));

    EXPECT_TRUE(corrupted);
    EXPECT_EQ(client_events_.completed[0].attempt, 2u);
    ASSERT_EQ(server_events_.files.size(), 1u);
    EXPECT_EQ(server_events_.files[0].data, data);
    EXPECT_TRUE(client_events_.failed.empty());

    reactor_.runFor(50ms);
    EXPECT_EQ(server_processor_->files.load(), 1);
}

TEST_F(SessionTest, CloseAbortsConcurrentTransfersOnBothSides) {
    connected();

    // Transfer 1 berhenti di 40%, transfer 3 di 90%
    const std::map<std::uint32_t, std::uint32_t> limits{{1, 26}, {3, 58}};
    network_->setFaultInjector([limits](const std::string&, core::ByteBuffer& payload) {
        auto index = chunkIndexOf(payload);
        if (!index) return webrtc::FaultAction::Deliver;
        auto limit = limits.find(transferIdOf(payload));
        return limit != limits.end() && *index >= limit->second ? webrtc::FaultAction::Drop
                                                                : webrtc::FaultAction::Deliver;
    });

    auto early = client_->sendBytes("early.bin", pattern(64 * 1024));
    auto late = client_->sendBytes("late.bin", pattern(64 * 1024));
    ASSERT_TRUE(early.is_ok());
    ASSERT_TRUE(late.is_ok());
    EXPECT_EQ(early.value(), 1u);
    EXPECT_EQ(late.value(), 3u);

    ASSERT_TRUE(reactor_.runUntil([&]() {
        auto first = server_->transfer(1);
        auto second = server_->transfer(3);
        return first && first->chunks_done == 26 && second && second->chunks_done == 58;
    }, 3000ms));

    client_->close();
    ASSERT_TRUE(reactor_.runUntil([&]() {
        return client_events_.failed.size() == 2 && server_events_.failed.size() == 2;
    }, 2000ms));

    for (const auto* events : {&client_events_, &server_events_}) {
        std::set<std::uint32_t> ids;
        for (const auto& [info, code] : events->failed) {
            EXPECT_EQ(code, core::ErrorCode::TransferAborted) << "transfer " << info.id;
            EXPECT_EQ(info.state, transfer::TransferState::Aborted);
            ids.insert(info.id);
        }
        EXPECT_EQ(ids, (std::set<std::uint32_t>{1, 3}));
    }
    EXPECT_EQ(client_->state(), SessionState::Closed);
    ASSERT_TRUE(reactor_.runUntil([&]() { return server_->state() == SessionState::Closed; }, 2000ms));

    // Tidak ada penyelesaian setelah abort
    network_->setFaultInjector(nullptr);
    reactor_.runFor(700ms);
    EXPECT_TRUE(client_events_.completed.empty());
    EXPECT_TRUE(server_events_.completed.empty());
    EXPECT_TRUE(server_events_.files.empty());
    EXPECT_EQ(server_processor_->files.load(), 0);
    EXPECT_EQ(client_events_.failed.size(), 2u);
    EXPECT_EQ(server_events_.failed.size(), 2u);
}

TEST_F(SessionTest, OutOfOrderChunksAreProcessedOnce) {
    auto server_config = baseConfig(webrtc::PeerRole::Answerer, "server");
    auto client_config = baseConfig(webrtc::PeerRole::Offerer, "client");
    for (auto* config : {&server_config, &client_config}) {
        config->transfer.chunk_size = 4096;
        config->transfer.ack_delay = 100ms;
        config->transfer.ack_timeout = 1000ms;
    }
    create(server_config, client_config);
    connectBoth();
    ASSERT_TRUE(server_result_->is_ok());
    ASSERT_TRUE(client_result_->is_ok());
    reactor_.runFor(20ms);

    // Chunk 1 tiba sesudah chunk 2: urutan 0,2,1,3..7
    bool deferred = false;
    std::vector<std::int64_t> acks;
    network_->setFaultInjector([&](const std::string& label, core::ByteBuffer& payload) {
        if (auto index = chunkIndexOf(payload)) {
            if (*index == 1 && !deferred) {
                deferred = true;
                return webrtc::FaultAction::Defer;
            }
            return webrtc::FaultAction::Deliver;
        }
        if (label == webrtc::kControlChannel) {
            auto message = webrtc::decodeTextFrame(std::string(payload.begin(), payload.end()));
            auto control = std::get_if<webrtc::FileControlMessage>(&message);
            if (control && control->action == webrtc::FileAction::Ack) {
                acks.push_back(control->highest_contiguous);
            }
        }
        return webrtc::FaultAction::Deliver;
    });

    auto data = pattern(32768);
    auto id = client_->sendBytes("shuffled.bin", data);
    ASSERT_TRUE(id.is_ok());

    ASSERT_TRUE(reactor_.runUntil([&]() {
        return client_events_.completed.size() == 1 && client_events_.responses.size() == 1;
    }, 3000ms));

    EXPECT_TRUE(deferred);
    EXPECT_EQ(acks, (std::vector<std::int64_t>{3, 7}));
    EXPECT_EQ(client_events_.completed[0].chunk_count, 8u);
    EXPECT_EQ(client_events_.completed[0].attempt, 1u);
    ASSERT_EQ(server_events_.files.size(), 1u);
    EXPECT_EQ(server_events_.files[0].data, data);
    EXPECT_EQ(client_events_.responses[0], "stored shuffled.bin");

    reactor_.runFor(50ms);
    EXPECT_EQ(server_processor_->files.load(), 1);
    EXPECT_EQ(server_events_.files.size(), 1u);
}

TEST_F(SessionTest, UnencodableTextIsRejected) {
    connected();

    auto text = client_->sendText("\xff\xfe");
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code(), core::ErrorCode::InvalidArgument);

    auto file = client_->sendBytes("caf\xe9.bin", pattern(100));
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().code(), core::ErrorCode::TransferFailed);

    reactor_.runFor(50ms);
    EXPECT_TRUE(server_events_.texts.empty());
    EXPECT_TRUE(server_events_.files.empty());
    for (const auto& info : client_->transfers()) {
        EXPECT_EQ(info.state, transfer::TransferState::Aborted);
    }

    ASSERT_TRUE(client_->sendText("still works").is_ok());
    ASSERT_TRUE(reactor_.runUntil([&]() { return server_events_.texts.size() == 1; }, 2000ms));
}

TEST_F(SessionTest, CancelTransfer) {
    connected();
    stallChunksFrom(4);

    auto id = client_->sendBytes("cancel.bin", pattern(16 * 1024));
    ASSERT_TRUE(id.is_ok());
    ASSERT_TRUE(client_->cancelTransfer(id.value()).is_ok());

    ASSERT_TRUE(reactor_.runUntil([&]() { return server_events_.failed.size() == 1; }, 2000ms));
    EXPECT_EQ(server_events_.failed[0].second, core::ErrorCode::TransferAborted);

    auto unknown = client_->cancelTransfer(77);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().code(), core::ErrorCode::UnknownTransfer);

    // Session tetap bisa dipakai
    ASSERT_TRUE(client_->sendText("still here").is_ok());
    ASSERT_TRUE(reactor_.runUntil([&]() { return server_events_.texts.size() == 1; }, 2000ms));
}

TEST_F(SessionTest, CloseIsIdempotentAndHangsUpPeer) {
    connected();

    client_->close();
    client_->close();
    EXPECT_EQ(client_->state(), SessionState::Closed);

    ASSERT_TRUE(reactor_.runUntil([&]() { return server_->state() == SessionState::Closed; }, 2000ms));
    reactor_.runFor(20ms);
    EXPECT_TRUE(server_events_.errors.empty());
    EXPECT_TRUE(client_events_.errors.empty());

    auto text = client_->sendText("late");
    ASSERT_TRUE(text.is_error());
    EXPECT_EQ(text.error().code(), core::ErrorCode::ConnectionClosed);

    auto cancel = client_->cancelTransfer(1);
    ASSERT_TRUE(cancel.is_error());
    EXPECT_EQ(cancel.error().code(), core::ErrorCode::ConnectionClosed);
}

TEST_F(SessionTest, IceFailureFailsConnect) {
    network_->setIceFailure(true);
    create();
    connectBoth();

    ASSERT_TRUE(client_result_->is_error());
    EXPECT_EQ(client_->state(), SessionState::Failed);
    reactor_.runFor(20ms);
    EXPECT_FALSE(client_events_.errors.empty());
}

TEST_F(SessionTest, MediaControlUsesUnreliableChannel) {
    connected();

    ASSERT_TRUE(client_->sendMediaControl("keyframe").is_ok());
    ASSERT_TRUE(client_->sendMediaControl("bitrate=500", true).is_ok());
    ASSERT_TRUE(reactor_.runUntil([&]() { return server_events_.media_control.size() == 2; }, 2000ms));
    EXPECT_NE(std::find(server_events_.media_control.begin(), server_events_.media_control.end(), "keyframe"),
              server_events_.media_control.end());
}

TEST_F(SessionTest, MediaTrackReachesRemoteSink) {
    connected();

    auto sink = std::make_shared<RecordingSink>();
    server_->setMediaSink(sink);
    std::vector<std::string> announced;
    server_->onTrack.addListener([&](std::shared_ptr<webrtc::MediaTrackReceiver> track) {
        announced.push_back(track->trackId());
    });

    auto track = std::make_shared<webrtc::LocalMediaTrack>("cam", webrtc::MediaKind::Video);
    ASSERT_TRUE(client_->attachTrack(track).is_ok());
    ASSERT_TRUE(reactor_.runUntil([&]() { return announced.size() == 1; }, 2000ms));
    EXPECT_EQ(announced[0], "cam");

    webrtc::MediaFrame frame;
    frame.kind = webrtc::MediaKind::Video;
    frame.data = {1, 2, 3};
    EXPECT_TRUE(track->pushFrame(frame));

    ASSERT_TRUE(reactor_.runUntil([&]() { return sink->frames.size() == 1; }, 2000ms));
    EXPECT_EQ(sink->frames[0].first, "cam");
    EXPECT_EQ(sink->frames[0].second, (core::ByteBuffer{1, 2, 3}));
    EXPECT_EQ(client_->mediaStats().frames_sent, 1u);

    client_->detachTrack("cam");
    ASSERT_TRUE(reactor_.runUntil([&]() { return sink->ended.size() == 1; }, 2000ms));
}

TEST_F(SessionTest, AttachTrackNeedsConnection) {
    create();
    auto track = std::make_shared<webrtc::LocalMediaTrack>("mic", webrtc::MediaKind::Audio);
    auto result = client_->attachTrack(track);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), core::ErrorCode::InvalidState);
}

} // namespace peerlink::session::test
