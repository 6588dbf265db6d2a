#pragma once

#include <cstdint>
#include <vector>

namespace peerlink::transfer {

// Himpunan index chunk dalam [0, capacity)
class ChunkIndexSet {
public:
    explicit ChunkIndexSet(std::uint32_t capacity = 0);

    // False kalau index di luar range atau sudah ada
    bool insert(std::uint32_t index);
    bool contains(std::uint32_t index) const;

    // Index tertinggi sehingga [0, index] lengkap; -1 kalau index 0 belum ada
    std::int64_t highestContiguous() const noexcept {
        return static_cast<std::int64_t>(next_missing_) - 1;
    }

    // Pertahankan [0, keep_through], buang sisanya
    void truncate(std::int64_t keep_through);

    std::uint32_t size() const noexcept { return count_; }
    std::uint32_t capacity() const noexcept { return static_cast<std::uint32_t>(bits_.size()); }
    bool complete() const noexcept { return count_ == bits_.size(); }

private:
    std::vector<bool> bits_;
    std::uint32_t count_ = 0;
    std::uint32_t next_missing_ = 0;
};

} // namespace peerlink::transfer
