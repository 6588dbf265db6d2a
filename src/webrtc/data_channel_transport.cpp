#include <peerlink/webrtc/data_channel_transport.hpp>
#include <peerlink/core/logger.hpp>

#include <algorithm>

namespace peerlink::webrtc {

std::shared_ptr<DataChannelTransport> DataChannelTransport::create(core::Reactor& reactor,
                                                                   std::size_t max_message_size) {
    return std::make_shared<DataChannelTransport>(reactor, max_message_size);
}

std::vector<ChannelSpec> DataChannelTransport::defaultChannels() {
    DataChannelInit control;
    control.ordered = true;

    DataChannelInit media_signal;
    media_signal.ordered = false;
    media_signal.max_retransmits = 0;

    return {
        {kControlChannel, control},
        {kMediaSignalChannel, media_signal},
    };
}

DataChannelTransport::DataChannelTransport(core::Reactor& reactor, std::size_t max_message_size)
    : reactor_(reactor),
      max_message_size_(max_message_size) {}

DataChannelTransport::~DataChannelTransport() {
    std::vector<Binding> bindings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bindings.swap(bindings_);
    }
    for (auto& binding : bindings) {
        detach(binding);
    }
}

void DataChannelTransport::attachChannel(std::shared_ptr<DataChannel> channel) {
    if (!channel) return;

    std::string label = channel->label();
    std::weak_ptr<DataChannelTransport> weak_self = weak_from_this();

    Binding binding;
    binding.channel = channel;
    binding.message_listener = channel->onMessage.addListener(
        [weak_self, label](const std::string& frame) {
            if (auto self = weak_self.lock()) self->handleText(label, frame);
        });
    binding.binary_listener = channel->onBinaryMessage.addListener(
        [weak_self, label](const core::ByteBuffer& frame) {
            if (auto self = weak_self.lock()) self->handleBinary(label, frame);
        });
    binding.state_listener = channel->onStateChange.addListener(
        [weak_self, label](DataChannelState state) {
            if (auto self = weak_self.lock()) self->handleState(label, state);
        });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            detach(binding);
            core::Logger::warn("Transport closed, ignoring channel {}", label);
            return;
        }

        // Channel dengan label sama menggantikan yang lama
        auto it = std::find_if(bindings_.begin(), bindings_.end(),
            [&](const Binding& b) { return b.channel->label() == label; });
        if (it != bindings_.end()) {
            core::Logger::warn("Replacing data channel {}", label);
            detach(*it);
            bindings_.erase(it);
        }
        bindings_.push_back(binding);
    }

    core::Logger::debug("Attached data channel {} ({})", label, toString(channel->state()));

    if (channel->state() == DataChannelState::Open) {
        reactor_.post([weak_self, label]() {
            if (auto self = weak_self.lock()) self->handleState(label, DataChannelState::Open);
        });
    }
}

core::Result<void> DataChannelTransport::send(const DataChannelMessage& message, SendOptions options) {
    EncodedFrame frame;
    try {
        frame = encodeMessage(message);
    }
    catch (const core::Error& e) {
        return e;
    }
    if (frame.size() > max_message_size_) {
        return {core::ErrorCode::InvalidArgument,
                "Encoded " + toString(kindOf(message)) + " message of " +
                std::to_string(frame.size()) + " bytes exceeds max_message_size " +
                std::to_string(max_message_size_)};
    }

    auto channel = channelFor(options);
    if (!channel || channel->state() != DataChannelState::Open) {
        return {core::ErrorCode::ChannelNotOpen,
                std::string(options.reliable ? kControlChannel : kMediaSignalChannel) + " channel is not open"};
    }

    try {
        if (frame.binary) {
            channel->send(frame.bytes);
        } else {
            channel->send(frame.text);
        }
    }
    catch (const core::Error& e) {
        return e;
    }
    return {};
}

bool DataChannelTransport::isOpen(bool reliable) const {
    SendOptions options;
    options.reliable = reliable;
    auto channel = channelFor(options);
    return channel && channel->state() == DataChannelState::Open;
}

std::uint64_t DataChannelTransport::bufferedAmount() const {
    std::vector<std::shared_ptr<DataChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& binding : bindings_) {
            channels.push_back(binding.channel);
        }
    }

    std::uint64_t total = 0;
    for (const auto& channel : channels) {
        total += channel->bufferedAmount();
    }
    return total;
}

void DataChannelTransport::close() {
    std::vector<Binding> bindings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        bindings.swap(bindings_);
    }

    for (auto& binding : bindings) {
        detach(binding);
        try {
            binding.channel->close();
        }
        catch (const core::Error& e) {
            core::Logger::warn("Error closing data channel {}: {}", binding.channel->label(), e.what());
        }
    }
    core::Logger::debug("Data channel transport closed");
}

std::shared_ptr<DataChannel> DataChannelTransport::channelFor(const SendOptions& options) const {
    const std::string label = options.reliable ? kControlChannel : kMediaSignalChannel;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& binding : bindings_) {
        if (binding.channel->label() == label) {
            return binding.channel;
        }
    }
    return nullptr;
}

void DataChannelTransport::handleState(const std::string& label, DataChannelState state) {
    bool emit_open = false;
    bool emit_closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(bindings_.begin(), bindings_.end(),
            [&](const Binding& b) { return b.channel->label() == label; });
        if (it == bindings_.end()) return;

        if (state == DataChannelState::Open && !it->opened) {
            it->opened = true;
            emit_open = true;
        } else if (state == DataChannelState::Closed && it->opened) {
            it->opened = false;
            emit_closed = true;
        }
    }

    if (emit_open) {
        core::Logger::info("Data channel {} open", label);
        onChannelOpen.emit(label);
    }
    if (emit_closed) {
        core::Logger::info("Data channel {} closed", label);
        onChannelClosed.emit(label);
    }
}

void DataChannelTransport::handleText(const std::string& label, const std::string& frame) {
    try {
        onMessage.emit(decodeTextFrame(frame));
    }
    catch (const core::Error& e) {
        core::Logger::warn("Dropping undecodable frame on {}: {}", label, e.what());
    }
}

void DataChannelTransport::handleBinary(const std::string& label, const core::ByteBuffer& frame) {
    try {
        onMessage.emit(decodeBinaryFrame(frame));
    }
    catch (const core::Error& e) {
        core::Logger::warn("Dropping undecodable binary frame on {}: {}", label, e.what());
    }
}

void DataChannelTransport::detach(Binding& binding) {
    binding.channel->onMessage.removeListener(binding.message_listener);
    binding.channel->onBinaryMessage.removeListener(binding.binary_listener);
    binding.channel->onStateChange.removeListener(binding.state_listener);
}

} // namespace peerlink::webrtc
