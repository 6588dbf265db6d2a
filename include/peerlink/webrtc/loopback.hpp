#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <peerlink/core/reactor.hpp>
#include <peerlink/webrtc/webrtc.hpp>

namespace peerlink::webrtc {

class LoopbackPeerConnection;
class LoopbackDataChannel;
class LoopbackTrackSender;

enum class FaultAction {
    Deliver,
    Drop,
    // Ditahan sampai pesan berikutnya di channel yang sama terkirim
    Defer
};

// Dipanggil untuk setiap pesan data channel; payload boleh diubah
using FaultInjector = std::function<FaultAction(const std::string& label, core::ByteBuffer& payload)>;

/**
 * Jaringan in-process yang mengimplementasikan PeerConnection.
 *
 * Description berisi baris "a=loopback-endpoint:<id>" dan candidate menunjuk
 * endpoint yang sama. Koneksi terbentuk setelah kedua description dan
 * candidate remote diterapkan. Data channel dan track dipasangkan per label
 * begitu kedua sisi connected. Semua pengiriman lewat reactor penerima.
 */
class LoopbackNetwork : public std::enable_shared_from_this<LoopbackNetwork> {
public:
    static constexpr std::size_t kDefaultMaxMessageSize = 256 * 1024;
    static constexpr std::size_t kDefaultTrackCapacity = 64;

    static std::shared_ptr<LoopbackNetwork> create();

    std::shared_ptr<PeerConnection> createPeerConnection(core::Reactor& reactor,
                                                         const PeerConfiguration& config = {});

    PeerConnectionFactory factory(core::Reactor& reactor);

    // Link turun: koneksi yang aktif jadi disconnected dan pesan hilang.
    // Link naik: negosiasi yang tertunda diselesaikan.
    void setLinkUp(bool up);
    bool linkUp() const;

    // Koneksi baru berakhir failed, bukan connected
    void setIceFailure(bool fail);

    void setMaxMessageSize(std::size_t size);
    std::size_t maxMessageSize() const;

    // Jumlah frame per track yang boleh in-flight sebelum sender tidak writable
    void setTrackCapacity(std::size_t capacity);

    void setFaultInjector(FaultInjector injector);

    std::size_t activeConnections() const;

private:
    friend class LoopbackPeerConnection;
    friend class LoopbackDataChannel;
    friend class LoopbackTrackSender;

    LoopbackNetwork() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<LoopbackPeerConnection>> endpoints_;
    std::uint64_t next_endpoint_ = 1;
    bool link_up_ = true;
    bool ice_failure_ = false;
    std::size_t max_message_size_ = kDefaultMaxMessageSize;
    std::size_t track_capacity_ = kDefaultTrackCapacity;
    FaultInjector fault_injector_;
};

} // namespace peerlink::webrtc
