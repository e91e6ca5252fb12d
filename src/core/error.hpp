// core/error.hpp
// Status codes and exception types shared by the network and file engines
//
// Flow control and resource exhaustion are reported through return values
// (RingStatus, TxStatus, IoStatus) because the caller is expected to back off
// and retry. Misconfiguration, bounds violations and allocation failures are
// thrown: they are programming or environment errors, never corrected silently.

#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace wraith::core {

// Result of a single ring operation (flow control, not an error)
enum class RingStatus : uint8_t {
    OK = 0,
    FULL = 1,
    EMPTY = 2
};

// Result of submitting a transmit descriptor
enum class TxStatus : uint8_t {
    SUBMITTED = 0,       // Descriptor is in the TX ring, frame owned by the kernel
    POOL_EXHAUSTED = 1,  // No free frame (apply backpressure, wait for completions)
    RING_FULL = 2,       // TX ring has no free slot, caller still owns the frame
    INVALID = 3,         // Offset/length rejected (misaligned, foreign, oversized)
    CLOSED = 4           // Socket not bound
};

inline const char* to_string(RingStatus s) {
    switch (s) {
        case RingStatus::OK:    return "OK";
        case RingStatus::FULL:  return "FULL";
        case RingStatus::EMPTY: return "EMPTY";
    }
    return "UNKNOWN";
}

inline const char* to_string(TxStatus s) {
    switch (s) {
        case TxStatus::SUBMITTED:      return "SUBMITTED";
        case TxStatus::POOL_EXHAUSTED: return "POOL_EXHAUSTED";
        case TxStatus::RING_FULL:      return "RING_FULL";
        case TxStatus::INVALID:        return "INVALID";
        case TxStatus::CLOSED:         return "CLOSED";
    }
    return "UNKNOWN";
}

/**
 * Invalid configuration (non power-of-two sizes, headroom swallowing the
 * frame, zero depths). Thrown before anything is allocated.
 */
struct ConfigError : std::invalid_argument {
    explicit ConfigError(const std::string& what)
        : std::invalid_argument("invalid configuration: " + what) {}
};

/**
 * Memory could not be mapped, locked or partitioned.
 * errno_value() is the failing syscall's errno (0 for partition exhaustion).
 */
struct AllocError : std::runtime_error {
    AllocError(const std::string& what, int err)
        : std::runtime_error(err ? what + ": " + strerror(err) : what)
        , err_(err) {}

    int errno_value() const { return err_; }

private:
    int err_;
};

/**
 * Frame offset that is misaligned or outside the buffer pool / partition.
 * Always a caller bug: the pool fails closed instead of wrapping.
 */
struct FrameBoundsError : std::out_of_range {
    explicit FrameBoundsError(const std::string& what) : std::out_of_range(what) {}
};

/**
 * File I/O failure surfaced at the integration boundary (carries errno).
 */
struct IoError : std::runtime_error {
    IoError(const std::string& what, int err)
        : std::runtime_error(what + ": " + strerror(err))
        , err_(err) {}

    int errno_value() const { return err_; }

private:
    int err_;
};

// Power-of-two check used by every size validation
constexpr bool is_power_of_two(uint64_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

}  // namespace wraith::core
