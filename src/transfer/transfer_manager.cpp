#include <peerlink/transfer/transfer_manager.hpp>
#include <peerlink/core/logger.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace peerlink::transfer {

TransferManager::TransferManager(TransferSettings settings, std::uint32_t first_id,
                                 TransferHooks hooks, TransferObserver* observer)
    : settings_(std::move(settings)),
      hooks_(std::move(hooks)),
      observer_(observer),
      next_id_(first_id == 0 ? 1 : first_id) {}

TransferManager::~TransferManager() {
    for (auto& [id, entry] : outgoing_) {
        cancelTimer(entry.ack_timer);
    }
    for (auto& [id, entry] : incoming_) {
        cancelTimer(entry.delay_timer);
    }
}

core::Result<std::uint32_t> TransferManager::startTransfer(std::unique_ptr<ChunkSource> source) {
    if (!source) {
        return {core::ErrorCode::InvalidArgument, "No chunk source"};
    }
    if (source->size() > settings_.max_file_size) {
        return {core::ErrorCode::InvalidArgument,
                source->name() + " is larger than max_file_size (" +
                std::to_string(settings_.max_file_size) + " bytes)"};
    }

    std::uint32_t id = next_id_;
    std::unique_ptr<OutgoingTransfer> transfer;
    try {
        transfer = std::make_unique<OutgoingTransfer>(id, std::move(source), settings_);
    }
    catch (const core::Error& e) {
        return e;
    }
    next_id_ += 2;

    core::Logger::info("Starting transfer {}: {} ({} bytes, {} chunks)",
                       id, transfer->name(), transfer->totalSize(), transfer->chunkCount());

    auto [it, inserted] = outgoing_.emplace(id, OutgoingEntry{});
    it->second.transfer = std::move(transfer);

    if (!beginAttempt(it->second)) {
        auto failed = info(id);
        return {core::ErrorCode::TransferFailed,
                "Could not send begin for transfer " + std::to_string(id) +
                (failed ? ": " + failed->error : std::string())};
    }
    return id;
}

void TransferManager::handleControl(const webrtc::FileControlMessage& message) {
    if (message.action == webrtc::FileAction::Begin) {
        handleBegin(message);
        return;
    }

    auto out = outgoing_.find(message.transfer_id);
    if (out != outgoing_.end()) {
        handleSenderControl(out->second, message);
        return;
    }

    auto in = incoming_.find(message.transfer_id);
    if (in != incoming_.end()) {
        handleReceiverControl(in->second, message);
        return;
    }

    core::Logger::debug("Ignoring file-control for unknown or finished transfer {}", message.transfer_id);
}

void TransferManager::handleChunk(const webrtc::FileChunkMessage& message) {
    auto it = incoming_.find(message.transfer_id);
    if (it == incoming_.end()) {
        core::Logger::debug("Dropping chunk {} for unknown transfer {}", message.index, message.transfer_id);
        return;
    }

    IncomingEntry& entry = it->second;
    using Outcome = IncomingTransfer::ChunkOutcome;

    switch (entry.transfer->onChunk(message)) {
        case Outcome::Accepted:
            armAckDelay(entry);
            break;

        case Outcome::AckDue:
            sendAck(entry);
            break;

        case Outcome::Duplicate:
            // Ack ulang, mungkin ack sebelumnya hilang
            armAckDelay(entry);
            break;

        case Outcome::Stale:
            core::Logger::debug("Transfer {}: stale chunk {} from attempt {}",
                                message.transfer_id, message.index, message.attempt);
            break;

        case Outcome::Rejected:
            break;

        case Outcome::Completed:
            sendAck(entry);
            finishIncoming(message.transfer_id);
            break;

        case Outcome::ChecksumMismatch:
            cancelTimer(entry.delay_timer);
            send(entry.transfer->errorMessage(webrtc::kReasonChecksumMismatch));
            break;
    }
}

core::Result<void> TransferManager::cancelTransfer(std::uint32_t id) {
    if (outgoing_.count(id)) {
        failOutgoing(id, core::Error(core::ErrorCode::TransferAborted, "Transfer cancelled"), true);
        return {};
    }
    if (incoming_.count(id)) {
        failIncoming(id, core::Error(core::ErrorCode::TransferAborted, "Transfer cancelled"), true);
        return {};
    }
    if (isFinished(id)) {
        return {core::ErrorCode::InvalidState, "Transfer " + std::to_string(id) + " already finished"};
    }
    return {core::ErrorCode::UnknownTransfer, "Unknown transfer " + std::to_string(id)};
}

void TransferManager::abortAll(bool notify_peer) {
    std::vector<std::uint32_t> out_ids;
    std::vector<std::uint32_t> in_ids;
    for (const auto& [id, entry] : outgoing_) out_ids.push_back(id);
    for (const auto& [id, entry] : incoming_) in_ids.push_back(id);

    if (!out_ids.empty() || !in_ids.empty()) {
        core::Logger::info("Aborting {} active transfer(s)", out_ids.size() + in_ids.size());
    }

    core::Error error(core::ErrorCode::TransferAborted, "Session closed");
    for (auto id : out_ids) failOutgoing(id, error, notify_peer);
    for (auto id : in_ids) failIncoming(id, error, notify_peer);
}

std::optional<TransferInfo> TransferManager::info(std::uint32_t id) const {
    if (auto it = outgoing_.find(id); it != outgoing_.end()) {
        return it->second.transfer->info();
    }
    if (auto it = incoming_.find(id); it != incoming_.end()) {
        return it->second.transfer->info();
    }
    if (auto it = finished_.find(id); it != finished_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<TransferInfo> TransferManager::list() const {
    std::map<std::uint32_t, TransferInfo> all(finished_);
    for (const auto& [id, entry] : outgoing_) all[id] = entry.transfer->info();
    for (const auto& [id, entry] : incoming_) all[id] = entry.transfer->info();

    std::vector<TransferInfo> result;
    result.reserve(all.size());
    for (auto& [id, info] : all) {
        result.push_back(std::move(info));
    }
    return result;
}

core::Result<void> TransferManager::send(const webrtc::DataChannelMessage& message) {
    core::Result<void> result;
    try {
        result = hooks_.send(message);
    }
    catch (const core::Error& e) {
        result = e;
    }
    if (result.is_error()) {
        core::Logger::warn("Failed to send {}: {}",
                           webrtc::toString(webrtc::kindOf(message)), result.error().what());
    }
    return result;
}

// Outgoing

void TransferManager::handleSenderControl(OutgoingEntry& entry, const webrtc::FileControlMessage& message) {
    OutgoingTransfer& transfer = *entry.transfer;
    std::uint32_t id = transfer.id();

    if (message.action == webrtc::FileAction::Ack) {
        switch (transfer.onAck(message.attempt, message.highest_contiguous)) {
            case OutgoingTransfer::AckOutcome::Progress:
                core::Logger::debug("Transfer {} acked through chunk {}", id, message.highest_contiguous);
                if (pump(entry)) {
                    armAckTimer(entry);
                }
                break;
            case OutgoingTransfer::AckOutcome::Completed:
                finishOutgoing(id);
                break;
            case OutgoingTransfer::AckOutcome::Stale:
                core::Logger::debug("Transfer {}: stale ack {} for attempt {}",
                                    id, message.highest_contiguous, message.attempt);
                break;
        }
        return;
    }

    switch (transfer.onError(message.attempt, message.reason, message.resume_from)) {
        case OutgoingTransfer::ErrorOutcome::Retry:
            cancelTimer(entry.ack_timer);
            beginAttempt(entry);
            break;

        case OutgoingTransfer::ErrorOutcome::Fail:
            if (message.reason == webrtc::kReasonChecksumMismatch) {
                failOutgoing(id, core::Error(core::ErrorCode::TransferFailed,
                                             "Checksum mismatch after " +
                                             std::to_string(transfer.retries()) + " retries"),
                             true);
            } else {
                failOutgoing(id, core::Error(core::ErrorCode::TransferFailed,
                                             "Peer reported " + message.reason),
                             false);
            }
            break;

        case OutgoingTransfer::ErrorOutcome::Aborted:
            failOutgoing(id, core::Error(core::ErrorCode::TransferAborted, "Transfer cancelled by peer"), false);
            break;

        case OutgoingTransfer::ErrorOutcome::Stale:
            core::Logger::debug("Transfer {}: stale error for attempt {}", id, message.attempt);
            break;
    }
}

bool TransferManager::beginAttempt(OutgoingEntry& entry) {
    auto sent = send(entry.transfer->begin());
    if (sent.is_error()) {
        failOutgoing(entry.transfer->id(),
                     core::Error(core::ErrorCode::TransferFailed,
                                 std::string("Begin not sent: ") + sent.error().what()),
                     false);
        return false;
    }
    if (!pump(entry)) {
        return false;
    }
    armAckTimer(entry);
    return true;
}

bool TransferManager::pump(OutgoingEntry& entry) {
    std::vector<webrtc::FileChunkMessage> chunks;
    try {
        chunks = entry.transfer->nextChunks();
    }
    catch (const core::Error& e) {
        failOutgoing(entry.transfer->id(), core::Error(core::ErrorCode::TransferFailed, e.what()), true);
        return false;
    }

    for (const auto& chunk : chunks) {
        if (send(chunk).is_error()) {
            failOutgoing(entry.transfer->id(),
                         core::Error(core::ErrorCode::TransferFailed, "Control channel unavailable"), false);
            return false;
        }
    }
    return true;
}

void TransferManager::armAckTimer(OutgoingEntry& entry) {
    cancelTimer(entry.ack_timer);
    if (!entry.transfer->active()) return;

    std::uint32_t id = entry.transfer->id();
    std::uint64_t generation = ++entry.ack_generation;
    entry.ack_timer = hooks_.schedule(settings_.ack_timeout, [this, id, generation]() {
        onAckTimeout(id, generation);
    });
}

void TransferManager::onAckTimeout(std::uint32_t id, std::uint64_t generation) {
    auto it = outgoing_.find(id);
    if (it == outgoing_.end() || it->second.ack_generation != generation) {
        return;
    }

    OutgoingEntry& entry = it->second;
    entry.ack_timer = core::Reactor::kInvalidTimer;

    switch (entry.transfer->onAckTimeout()) {
        case OutgoingTransfer::TimeoutOutcome::Retransmit: {
            core::Logger::warn("Transfer {}: ack timeout {}, retransmitting {} chunk(s)",
                               id, entry.transfer->consecutiveTimeouts(), entry.transfer->inFlight());
            std::vector<webrtc::FileChunkMessage> chunks;
            try {
                chunks = entry.transfer->retransmitWindow();
            }
            catch (const core::Error& e) {
                failOutgoing(id, core::Error(core::ErrorCode::TransferFailed, e.what()), true);
                return;
            }
            for (const auto& chunk : chunks) {
                if (send(chunk).is_error()) {
                    failOutgoing(id, core::Error(core::ErrorCode::TransferFailed,
                                                 "Control channel unavailable"), false);
                    return;
                }
            }
            armAckTimer(entry);
            break;
        }

        case OutgoingTransfer::TimeoutOutcome::Fail:
            failOutgoing(id, core::Error(core::ErrorCode::TransferFailed,
                                         "No acknowledgement after " +
                                         std::to_string(entry.transfer->consecutiveTimeouts()) + " timeouts"),
                         true);
            break;

        case OutgoingTransfer::TimeoutOutcome::Ignored:
            break;
    }
}

void TransferManager::finishOutgoing(std::uint32_t id) {
    auto it = outgoing_.find(id);
    if (it == outgoing_.end()) return;

    cancelTimer(it->second.ack_timer);
    TransferInfo info = it->second.transfer->info();
    outgoing_.erase(it);
    recordFinished(id, info);

    core::Logger::info("Transfer {} ({}) delivered after {} attempt(s)", id, info.name, info.attempt);
    if (observer_) observer_->onTransferComplete(info);
}

void TransferManager::failOutgoing(std::uint32_t id, const core::Error& error, bool notify_peer) {
    auto it = outgoing_.find(id);
    if (it == outgoing_.end()) return;

    OutgoingEntry& entry = it->second;
    cancelTimer(entry.ack_timer);
    entry.transfer->abort();

    if (notify_peer) {
        webrtc::FileControlMessage abort;
        abort.action = webrtc::FileAction::Error;
        abort.transfer_id = id;
        abort.attempt = entry.transfer->attempt();
        abort.reason = webrtc::kReasonAborted;
        send(abort);
    }

    TransferInfo info = entry.transfer->info();
    info.error = error.what();
    outgoing_.erase(it);
    recordFinished(id, info);

    core::Logger::warn("Transfer {} ({}) failed: {}", id, info.name, info.error);
    if (observer_) observer_->onTransferFailed(info, error);
}

// Incoming

void TransferManager::handleBegin(const webrtc::FileControlMessage& message) {
    std::uint32_t id = message.transfer_id;

    if (auto it = incoming_.find(id); it != incoming_.end()) {
        auto restarted = it->second.transfer->restart(message);
        if (restarted.is_error()) {
            core::Logger::warn("Transfer {}: ignoring begin: {}", id, restarted.error().what());
            return;
        }
        cancelTimer(it->second.delay_timer);
        return;
    }

    if (isFinished(id) || outgoing_.count(id)) {
        core::Logger::warn("Ignoring begin for transfer id {} already in use", id);
        return;
    }

    auto created = incoming_.size() >= settings_.max_incoming
        ? core::Result<std::unique_ptr<IncomingTransfer>>(
              core::ErrorCode::InvalidState,
              std::to_string(incoming_.size()) + " incoming transfers already active")
        : IncomingTransfer::fromBegin(message, settings_);
    if (created.is_error()) {
        core::Logger::warn("Rejecting transfer {} ({}): {}", id, message.name, created.error().what());
        webrtc::FileControlMessage reject;
        reject.action = webrtc::FileAction::Error;
        reject.transfer_id = id;
        reject.attempt = message.attempt;
        reject.reason = webrtc::kReasonRejected;
        send(reject);
        return;
    }

    core::Logger::info("Receiving transfer {}: {} ({} bytes, {} chunks)",
                       id, message.name, message.total_size, message.chunk_count);

    auto [it, inserted] = incoming_.emplace(id, IncomingEntry{});
    it->second.transfer = std::move(created).value();

    // File kosong langsung diverifikasi
    if (message.chunk_count == 0) {
        auto outcome = it->second.transfer->verify();
        if (outcome == IncomingTransfer::ChunkOutcome::Completed) {
            sendAck(it->second);
            finishIncoming(id);
        } else {
            send(it->second.transfer->errorMessage(webrtc::kReasonChecksumMismatch));
        }
    }
}

void TransferManager::handleReceiverControl(IncomingEntry& entry, const webrtc::FileControlMessage& message) {
    if (message.action != webrtc::FileAction::Error) {
        core::Logger::debug("Transfer {}: unexpected control from sender", message.transfer_id);
        return;
    }

    std::string reason = message.reason.empty() ? "unknown" : message.reason;
    core::ErrorCode code = reason == webrtc::kReasonAborted
        ? core::ErrorCode::TransferAborted
        : core::ErrorCode::TransferFailed;
    failIncoming(entry.transfer->id(), core::Error(code, "Sender stopped the transfer: " + reason), false);
}

void TransferManager::armAckDelay(IncomingEntry& entry) {
    if (entry.delay_timer != core::Reactor::kInvalidTimer) return;

    std::uint32_t id = entry.transfer->id();
    std::uint64_t generation = ++entry.delay_generation;
    entry.delay_timer = hooks_.schedule(settings_.ack_delay, [this, id, generation]() {
        onAckDelay(id, generation);
    });
}

void TransferManager::onAckDelay(std::uint32_t id, std::uint64_t generation) {
    auto it = incoming_.find(id);
    if (it == incoming_.end() || it->second.delay_generation != generation) {
        return;
    }

    it->second.delay_timer = core::Reactor::kInvalidTimer;
    if (it->second.transfer->phase() == ReceiverPhase::Receiving) {
        sendAck(it->second);
    }
}

void TransferManager::sendAck(IncomingEntry& entry) {
    cancelTimer(entry.delay_timer);
    send(entry.transfer->ackMessage());
}

void TransferManager::finishIncoming(std::uint32_t id) {
    auto it = incoming_.find(id);
    if (it == incoming_.end()) return;

    IncomingEntry& entry = it->second;
    cancelTimer(entry.delay_timer);

    ReceivedFile file;
    file.transfer_id = id;
    file.name = entry.transfer->name();
    file.checksum = entry.transfer->checksum();
    file.data = entry.transfer->takeData();
    file.saved_path = saveFile(*entry.transfer, file.data);

    TransferInfo info = entry.transfer->info();
    incoming_.erase(it);
    recordFinished(id, info);

    if (observer_) {
        observer_->onFileReceived(file);
        observer_->onTransferComplete(info);
    }
}

void TransferManager::failIncoming(std::uint32_t id, const core::Error& error, bool notify_peer) {
    auto it = incoming_.find(id);
    if (it == incoming_.end()) return;

    IncomingEntry& entry = it->second;
    cancelTimer(entry.delay_timer);
    entry.transfer->abort();

    if (notify_peer) {
        auto abort = entry.transfer->errorMessage(webrtc::kReasonAborted);
        abort.resume_from = -1;
        send(abort);
    }

    TransferInfo info = entry.transfer->info();
    info.state = TransferState::Aborted;
    info.error = error.what();
    incoming_.erase(it);
    recordFinished(id, info);

    core::Logger::warn("Incoming transfer {} ({}) failed: {}", id, info.name, info.error);
    if (observer_) observer_->onTransferFailed(info, error);
}

std::optional<std::filesystem::path> TransferManager::saveFile(const IncomingTransfer& transfer,
                                                                const core::ByteBuffer& data) const {
    if (settings_.download_directory.empty()) {
        return std::nullopt;
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(settings_.download_directory, ec);
    if (ec) {
        core::Logger::warn("Cannot create {}: {}", settings_.download_directory.string(), ec.message());
        return std::nullopt;
    }

    // Nama dari peer tidak boleh keluar dari direktori download
    fs::path name = fs::path(transfer.name()).filename();
    if (name.empty() || name == "." || name == "..") {
        name = "transfer-" + std::to_string(transfer.id());
    }

    fs::path target = settings_.download_directory / name;
    for (int suffix = 1; fs::exists(target, ec); ++suffix) {
        target = settings_.download_directory /
                 (name.stem().string() + "-" + std::to_string(suffix) + name.extension().string());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        core::Logger::warn("Cannot open {} for writing", target.string());
        return std::nullopt;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        core::Logger::warn("Failed writing {}", target.string());
        return std::nullopt;
    }

    core::Logger::info("Saved transfer {} to {}", transfer.id(), target.string());
    return target;
}

void TransferManager::recordFinished(std::uint32_t id, const TransferInfo& info) {
    finished_[id] = info;

    // Id yang dibuang tetap dianggap selesai lewat watermark per ruang id
    while (finished_.size() > kFinishedHistory) {
        auto oldest = finished_.begin();
        auto& watermark = evicted_through_[oldest->first % 2];
        watermark = std::max(watermark, oldest->first);
        finished_.erase(oldest);
    }
}

bool TransferManager::isFinished(std::uint32_t id) const {
    if (finished_.count(id)) {
        return true;
    }
    return id != 0 && id <= evicted_through_[id % 2] && !outgoing_.count(id) && !incoming_.count(id);
}

void TransferManager::cancelTimer(core::Reactor::TimerId& timer) {
    if (timer != core::Reactor::kInvalidTimer) {
        if (hooks_.cancel) hooks_.cancel(timer);
        timer = core::Reactor::kInvalidTimer;
    }
}

} // namespace peerlink::transfer
