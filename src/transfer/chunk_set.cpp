#include <peerlink/transfer/chunk_set.hpp>

namespace peerlink::transfer {

ChunkIndexSet::ChunkIndexSet(std::uint32_t capacity)
    : bits_(capacity, false) {}

bool ChunkIndexSet::insert(std::uint32_t index) {
    if (index >= bits_.size() || bits_[index]) {
        return false;
    }

    bits_[index] = true;
    ++count_;
    while (next_missing_ < bits_.size() && bits_[next_missing_]) {
        ++next_missing_;
    }
    return true;
}

bool ChunkIndexSet::contains(std::uint32_t index) const {
    return index < bits_.size() && bits_[index];
}

void ChunkIndexSet::truncate(std::int64_t keep_through) {
    count_ = 0;
    for (std::size_t i = 0; i < bits_.size(); ++i) {
        if (static_cast<std::int64_t>(i) > keep_through) {
            bits_[i] = false;
        } else if (bits_[i]) {
            ++count_;
        }
    }

    next_missing_ = 0;
    while (next_missing_ < bits_.size() && bits_[next_missing_]) {
        ++next_missing_;
    }
}

} // namespace peerlink::transfer
