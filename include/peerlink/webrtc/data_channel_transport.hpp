#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <peerlink/core/error.hpp>
#include <peerlink/core/event.hpp>
#include <peerlink/core/reactor.hpp>
#include <peerlink/webrtc/message.hpp>
#include <peerlink/webrtc/webrtc.hpp>

namespace peerlink::webrtc {

inline constexpr const char* kControlChannel = "control";
inline constexpr const char* kMediaSignalChannel = "media-signal";

struct SendOptions {
    bool reliable = true;
    bool ordered = true;
};

struct ChannelSpec {
    std::string label;
    DataChannelInit init;
};

/**
 * Pipa pesan dua arah di atas data channel.
 *
 * Pesan reliable lewat "control" (reliable, ordered), pesan unreliable lewat
 * "media-signal" (unordered, tanpa retransmit). Tidak ada antrean otomatis:
 * send() ke channel yang belum open gagal dengan ChannelNotOpen.
 */
class DataChannelTransport : public std::enable_shared_from_this<DataChannelTransport> {
public:
    static constexpr std::size_t kDefaultMaxMessageSize = 64 * 1024;

    static std::shared_ptr<DataChannelTransport> create(core::Reactor& reactor,
                                                        std::size_t max_message_size = kDefaultMaxMessageSize);

    // Channel yang dibuat oleh offerer
    static std::vector<ChannelSpec> defaultChannels();

    explicit DataChannelTransport(core::Reactor& reactor, std::size_t max_message_size);
    ~DataChannelTransport();

    DataChannelTransport(const DataChannelTransport&) = delete;
    DataChannelTransport& operator=(const DataChannelTransport&) = delete;

    // Pasang channel; event open tidak pernah di-emit dari dalam pemanggilan ini
    void attachChannel(std::shared_ptr<DataChannel> channel);

    core::Result<void> send(const DataChannelMessage& message, SendOptions options = {});

    bool isOpen(bool reliable = true) const;
    std::uint64_t bufferedAmount() const;
    std::size_t maxMessageSize() const noexcept { return max_message_size_; }

    // Tutup semua channel dan lepas listener
    void close();

    // Events
    core::EventEmitter<const DataChannelMessage&> onMessage;
    core::EventEmitter<const std::string&> onChannelOpen;
    core::EventEmitter<const std::string&> onChannelClosed;

private:
    struct Binding {
        std::shared_ptr<DataChannel> channel;
        core::ListenerId message_listener = 0;
        core::ListenerId binary_listener = 0;
        core::ListenerId state_listener = 0;
        bool opened = false;
    };

    std::shared_ptr<DataChannel> channelFor(const SendOptions& options) const;
    void handleState(const std::string& label, DataChannelState state);
    void handleText(const std::string& label, const std::string& frame);
    void handleBinary(const std::string& label, const core::ByteBuffer& frame);
    static void detach(Binding& binding);

    core::Reactor& reactor_;
    std::size_t max_message_size_;
    std::vector<Binding> bindings_;
    bool closed_ = false;
    mutable std::mutex mutex_;
};

} // namespace peerlink::webrtc
