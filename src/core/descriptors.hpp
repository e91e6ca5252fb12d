// core/descriptors.hpp
// Descriptor layouts carried by the four AF_XDP rings
//
//   RX / TX ring:          PacketDesc  { addr, len, options }  (16 bytes)
//   FILL / COMPLETION:     FrameAddr   (uint64_t frame offset)
//
// PacketDesc is layout-identical to the kernel's struct xdp_desc so the same
// ring code can walk kernel-mapped rings and in-process rings.

#pragma once

#include <cstdint>
#include <cstddef>

#ifdef WRAITH_USE_XDP
#include <linux/if_xdp.h>
#endif

namespace wraith::core {

/**
 * Packet descriptor (RX and TX rings)
 *
 * addr is a byte offset into the UMEM: the frame offset plus the position of
 * the packet's first byte inside that frame (headroom). The owning frame is
 * addr & ~(frame_size - 1).
 */
struct PacketDesc {
    uint64_t addr;      // UMEM offset of packet data
    uint32_t len;       // Packet length in bytes
    uint32_t options;   // Reserved, always 0
};
static_assert(sizeof(PacketDesc) == 16, "PacketDesc must match struct xdp_desc");

#ifdef WRAITH_USE_XDP
static_assert(sizeof(PacketDesc) == sizeof(struct xdp_desc), "PacketDesc / xdp_desc size mismatch");
static_assert(offsetof(PacketDesc, len) == offsetof(struct xdp_desc, len), "PacketDesc / xdp_desc layout mismatch");
#endif

// Frame offset (FILL and COMPLETION rings), always a multiple of frame_size
using FrameAddr = uint64_t;

using RxDesc = PacketDesc;
using TxDesc = PacketDesc;
using FillDesc = FrameAddr;
using CompletionDesc = FrameAddr;

// Ring flag set by the kernel side when it must be woken (sendto / recvfrom)
// Same bit as XDP_RING_NEED_WAKEUP.
inline constexpr uint32_t RING_FLAG_NEED_WAKEUP = 1u << 0;

}  // namespace wraith::core
