// xdp/frame_ref.hpp
// Zero-copy view of one UMEM frame (or its post-headroom payload area)

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace wraith::xdp {

/**
 * Reference to a frame in UMEM
 *
 * Never owns memory: the Umem outlives every FrameRef it hands out.
 *
 * Memory layout of a frame:
 * ┌─────────────────────────┬─────────────────────────────────────┐
 * │ Headroom                │  Payload (starting at 'data')       │
 * └─────────────────────────┴─────────────────────────────────────┘
 * ^ addr (frame offset)     ^ addr + headroom
 *
 * frame_at() returns a view starting at the frame offset with
 * capacity == frame_size; payload_at() starts after the headroom.
 */
struct FrameRef {
    uint64_t addr = 0;          ///< UMEM offset of the first byte of 'data'
    uint8_t* data = nullptr;    ///< Pointer into UMEM
    uint32_t len = 0;           ///< Current data length
    uint32_t capacity = 0;      ///< Bytes addressable through 'data'
    uint32_t offset = 0;        ///< Current read offset for sequential access

    bool valid() const { return data != nullptr; }

    uint8_t* current() {
        return data + offset;
    }

    uint32_t remaining() const {
        return (len > offset) ? (len - offset) : 0;
    }

    /**
     * @brief Advance read offset
     * @return false if it would move past len
     */
    bool advance(uint32_t n) {
        if (n > remaining()) {
            return false;
        }
        offset += n;
        return true;
    }

    void reset() {
        offset = 0;
    }

    bool consumed() const {
        return offset >= len;
    }

    // Space left for writing
    uint32_t available() const {
        return (capacity > len) ? (capacity - len) : 0;
    }

    /**
     * @brief Append data (TX path)
     * @return Bytes actually appended (truncated at capacity)
     */
    uint32_t append(const void* src, uint32_t n) {
        uint32_t to_copy = (n < available()) ? n : available();
        if (to_copy > 0) {
            memcpy(data + len, src, to_copy);
            len += to_copy;
        }
        return to_copy;
    }

    // Data was written directly through 'data'
    bool set_length(uint32_t new_len) {
        if (new_len > capacity) {
            return false;
        }
        len = new_len;
        return true;
    }

    void clear() {
        len = 0;
        offset = 0;
    }
};

}  // namespace wraith::xdp
