// xdp/xsk_driver.hpp
// Driver policy interface: the "kernel side" of an AF_XDP socket
//
// XskSocket<Driver> owns the application side of the four rings. A driver
// binds the socket to a queue and hands back ring views:
//
//   rx    kernel -> app   (app consumes RxDesc)
//   tx    app -> kernel   (app produces TxDesc)
//   fill  app -> kernel   (app produces FillDesc)
//   comp  kernel -> app   (app consumes CompletionDesc)
//
// Implementations:
//   KernelXskDriver - real AF_XDP socket via libxdp (kernel_driver.hpp)
//   LoopbackDriver  - in-process kernel side for tests (loopback_driver.hpp)

#pragma once

#include <concepts>
#include <cstdint>
#include <string>

#include "../core/descriptors.hpp"
#include "../core/ring.hpp"
#include "bind_mode.hpp"
#include "umem.hpp"

namespace wraith::xdp {

/**
 * Application-side views of the four rings of one socket
 */
struct XskRings {
    core::SpscRing<core::RxDesc> rx;
    core::SpscRing<core::TxDesc> tx;
    core::SpscRing<core::FillDesc> fill;
    core::SpscRing<core::CompletionDesc> comp;

    bool attached() const {
        return rx.attached() && tx.attached() && fill.attached() && comp.attached();
    }
};

/**
 * Everything a driver needs to bind one socket
 */
struct BindRequest {
    std::string interface;
    uint32_t queue_id = 0;
    Umem* umem = nullptr;           // Kept alive by the socket for the whole binding
    bool primary = true;            // Uses the pool's primary FILL/COMPLETION pair
    uint32_t rx_ring_size = 2048;
    uint32_t tx_ring_size = 2048;
};

/**
 * Driver policy
 *
 * bind() returns 0 or a negated errno and must leave nothing behind on
 * failure (negotiation may retry in another mode). kick_tx(), wakeup_rx()
 * and wait() return 0 / number of ready events, or a negated errno.
 */
template<typename T>
concept XskDriverConcept = requires(T driver, const BindRequest& req, BindMode mode,
                                    XskRings& rings, int timeout_ms) {
    { driver.name() } -> std::convertible_to<const char*>;
    { driver.bind(req, mode, rings) } -> std::same_as<int>;
    { driver.unbind() } -> std::same_as<void>;
    { driver.kick_tx() } -> std::same_as<int>;
    { driver.wakeup_rx() } -> std::same_as<int>;
    { driver.wait(timeout_ms) } -> std::same_as<int>;
    { driver.fd() } -> std::convertible_to<int>;
};

}  // namespace wraith::xdp
