// xdp/frame_allocator.hpp
// Free-frame list for one socket's UMEM partition
//
// Fresh frames are handed out in ascending offset order. Frames coming back
// from the COMPLETION ring (or freed by the caller) go to the front so they
// are reused while still warm in cache.
//
// Every frame also records which side holds it, so a frame can sit in at
// most one ring at a time.

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/error.hpp"
#include "umem.hpp"

namespace wraith::xdp {

// Where a frame of the partition currently is
enum class FrameState : uint8_t {
    FREE,   // In the free list
    APP,    // Held by the application (allocated or received)
    FILL,   // Posted to the FILL ring, owned by the kernel until it shows up in RX
    TX      // Posted to the TX ring, owned by the kernel until it completes
};

inline const char* to_string(FrameState s) {
    switch (s) {
        case FrameState::FREE: return "free list";
        case FrameState::APP:  return "application";
        case FrameState::FILL: return "FILL ring";
        case FrameState::TX:   return "TX ring";
    }
    return "unknown";
}

class FrameAllocator {
public:
    FrameAllocator() = default;

    explicit FrameAllocator(const FrameRange& range) {
        reset(range);
    }

    // Take ownership of every frame in the range
    void reset(const FrameRange& range) {
        range_ = range;
        free_.clear();
        state_.assign(range.count, FrameState::FREE);
        for (uint32_t i = 0; i < range.count; i++) {
            free_.push_back(range.offset + static_cast<uint64_t>(i) * range.frame_size);
        }
    }

    void clear() {
        range_ = FrameRange{};
        free_.clear();
        state_.clear();
    }

    // Never blocks; nullopt means the partition is exhausted
    std::optional<uint64_t> alloc() {
        if (free_.empty()) {
            return std::nullopt;
        }
        uint64_t offset = free_.front();
        free_.pop_front();
        state_[index_of(offset)] = FrameState::APP;
        return offset;
    }

    /**
     * Return a frame the application holds
     * @throws FrameBoundsError for a misaligned or foreign offset
     * @throws std::logic_error on double free or for a frame posted to a ring
     */
    void free(uint64_t offset) {
        check(offset);
        FrameState s = state_[index_of(offset)];
        if (s == FrameState::FREE) {
            throw std::logic_error("double free of frame " + std::to_string(offset));
        }
        if (s != FrameState::APP) {
            throw std::logic_error("free of frame " + std::to_string(offset) + " still in the "
                                   + to_string(s));
        }
        push_free(offset);
    }

    // TX completion: back to the free list; false if the frame was not on TX
    bool reclaim(uint64_t offset) {
        if (!owns(offset) || state_[index_of(offset)] != FrameState::TX) {
            return false;
        }
        push_free(offset);
        return true;
    }

    // Record a ring transition
    void mark(uint64_t offset, FrameState s) {
        check(offset);
        if (s == FrameState::FREE) {
            throw std::logic_error("mark(FREE): use free() or reclaim()");
        }
        state_[index_of(offset)] = s;
    }

    // Offset is an aligned frame inside this partition
    bool owns(uint64_t offset) const {
        return range_.frame_size != 0
            && range_.contains(offset)
            && (offset - range_.offset) % range_.frame_size == 0;
    }

    FrameState state(uint64_t offset) const {
        check(offset);
        return state_[index_of(offset)];
    }

    bool is_free(uint64_t offset) const {
        return owns(offset) && state_[index_of(offset)] == FrameState::FREE;
    }

    bool held(uint64_t offset) const {
        return owns(offset) && state_[index_of(offset)] == FrameState::APP;
    }

    uint32_t available() const { return static_cast<uint32_t>(free_.size()); }
    uint32_t capacity() const { return range_.count; }
    const FrameRange& range() const { return range_; }

private:
    void check(uint64_t offset) const {
        if (!owns(offset)) {
            throw core::FrameBoundsError("frame " + std::to_string(offset)
                                         + " is not an aligned frame of this partition ["
                                         + std::to_string(range_.offset) + ", "
                                         + std::to_string(range_.end()) + ")");
        }
    }

    void push_free(uint64_t offset) {
        state_[index_of(offset)] = FrameState::FREE;
        free_.push_front(offset);
    }

    uint32_t index_of(uint64_t offset) const {
        return static_cast<uint32_t>((offset - range_.offset) / range_.frame_size);
    }

    FrameRange range_;
    std::deque<uint64_t> free_;
    std::vector<FrameState> state_;
};

}  // namespace wraith::xdp
