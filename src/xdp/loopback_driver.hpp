// xdp/loopback_driver.hpp
// In-process "kernel side" of an AF_XDP socket
//
// Owns real shared ring memory and plays the kernel's role on it:
//   - consumes TX descriptors on kick_tx() and posts their frames to the
//     COMPLETION ring (immediately, or held until complete_pending())
//   - optionally loops each transmitted payload back into RX
//   - inject() simulates an inbound packet: takes a frame from the FILL ring,
//     copies the payload behind the headroom and posts an RX descriptor. With
//     the FILL ring empty the packet is dropped, as a NIC would.
//   - can refuse zero-copy and/or copy binds with a chosen errno
//
// Used by the unit tests and by hosts without AF_XDP.

#pragma once

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <deque>
#include <memory>
#include <thread>
#include <vector>

#include "../core/descriptors.hpp"
#include "../core/log.hpp"
#include "../core/ring.hpp"
#include "xsk_driver.hpp"

namespace wraith::xdp {

struct LoopbackOptions {
    bool loop_tx_to_rx;         // Transmitted payloads reappear on RX
    bool auto_complete;         // Post completions on kick, else hold for complete_pending()
    bool capture_tx;            // Keep a copy of every transmitted payload
    int reject_zero_copy;       // errno returned for zero-copy binds (0 = accept)
    int reject_copy;            // errno returned for copy binds (0 = accept)

    LoopbackOptions()
        : loop_tx_to_rx(false)
        , auto_complete(true)
        , capture_tx(true)
        , reject_zero_copy(0)
        , reject_copy(0)
    {}
};

/**
 * FILL / COMPLETION pair of a pool, shared by the sockets that bind it
 */
struct LoopbackUmemState {
    core::RingMemory fill;
    core::RingMemory comp;

    LoopbackUmemState(uint32_t fill_size, uint32_t comp_size)
        : fill(fill_size, sizeof(core::FillDesc))
        , comp(comp_size, sizeof(core::CompletionDesc)) {}
};

class LoopbackDriver {
public:
    static constexpr const char* REGISTRATION_TAG = "loopback";

    LoopbackDriver() = default;
    explicit LoopbackDriver(const LoopbackOptions& options) : options_(options) {}

    LoopbackDriver(const LoopbackDriver&) = delete;
    LoopbackDriver& operator=(const LoopbackDriver&) = delete;

    const char* name() const { return "loopback"; }

    int bind(const BindRequest& req, BindMode mode, XskRings& rings) {
        if (bound_) return -EALREADY;
        if (mode == BindMode::ZERO_COPY && options_.reject_zero_copy) return -options_.reject_zero_copy;
        if (mode == BindMode::COPY && options_.reject_copy) return -options_.reject_copy;

        try {
            rx_mem_ = core::RingMemory(req.rx_ring_size, sizeof(core::RxDesc));
            tx_mem_ = core::RingMemory(req.tx_ring_size, sizeof(core::TxDesc));

            const UmemConfig& ucfg = req.umem->config();
            if (req.primary) {
                auto existing = req.umem->registration(REGISTRATION_TAG);
                if (existing) {
                    pool_state_ = std::static_pointer_cast<LoopbackUmemState>(existing);
                } else {
                    pool_state_ = std::make_shared<LoopbackUmemState>(ucfg.fill_ring_size, ucfg.comp_ring_size);
                    req.umem->set_registration(REGISTRATION_TAG, pool_state_);
                }
            } else {
                pool_state_ = std::make_shared<LoopbackUmemState>(ucfg.fill_ring_size, ucfg.comp_ring_size);
            }
        } catch (const core::AllocError& e) {
            WRAITH_WARN("LOOPBACK", "%s", e.what());
            release();
            return e.errno_value() ? -e.errno_value() : -ENOMEM;
        }

        // Application side
        rings.rx = core::SpscRing<core::RxDesc>::over(rx_mem_);
        rings.tx = core::SpscRing<core::TxDesc>::over(tx_mem_);
        rings.fill = core::SpscRing<core::FillDesc>::over(pool_state_->fill);
        rings.comp = core::SpscRing<core::CompletionDesc>::over(pool_state_->comp);

        // Kernel side
        k_rx_ = core::SpscRing<core::RxDesc>::over(rx_mem_);
        k_tx_ = core::SpscRing<core::TxDesc>::over(tx_mem_);
        k_fill_ = core::SpscRing<core::FillDesc>::over(pool_state_->fill);
        k_comp_ = core::SpscRing<core::CompletionDesc>::over(pool_state_->comp);

        // TX is only serviced on a kick
        k_tx_.set_needs_wakeup(true);

        umem_ = req.umem;
        mode_ = mode;
        bound_ = true;
        transmitted_.clear();
        WRAITH_LOG("LOOPBACK", "Bound %s queue %u (%s, rx %u / tx %u)", req.interface.c_str(),
                   req.queue_id, to_string(mode), req.rx_ring_size, req.tx_ring_size);
        return 0;
    }

    void unbind() {
        if (!bound_) return;
        release();
        WRAITH_LOG("LOOPBACK", "Unbound (%lu packets transmitted, %lu injected, %lu dropped)",
                   (unsigned long)tx_serviced_, (unsigned long)rx_injected_, (unsigned long)rx_dropped_);
    }

    int kick_tx() {
        if (!bound_) return -ENOTCONN;
        service_tx();
        return 0;
    }

    int wakeup_rx() {
        return bound_ ? 0 : -ENOTCONN;
    }

    // Services pending TX, then sleeps at most 1 ms when nothing is ready
    int wait(int timeout_ms) {
        if (!bound_) return -ENOTCONN;
        service_tx();
        int ready = static_cast<int>(k_rx_.ready() + k_comp_.ready());
        if (ready == 0 && timeout_ms != 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return ready;
    }

    int fd() const { return -1; }

    // ========================================================================
    // Simulated kernel behavior
    // ========================================================================

    /**
     * Deliver one inbound packet
     * @return false if it was dropped (no fill frame, RX full, oversized)
     */
    bool inject(const void* data, uint32_t len) {
        if (!bound_) return false;
        if (len > umem_->payload_capacity()) {
            rx_dropped_++;
            return false;
        }

        uint64_t frame;
        if (!stash_.empty()) {
            frame = stash_.front();
            stash_.pop_front();
        } else {
            auto f = k_fill_.consume();
            if (!f) {
                k_fill_.set_needs_wakeup(true);
                rx_dropped_++;
                WRAITH_DEBUG_PRINT("[LOOPBACK] FILL ring empty, dropped %u byte packet\n", len);
                return false;
            }
            k_fill_.set_needs_wakeup(false);
            frame = umem_->frame_base(*f);
        }

        core::RxDesc desc;
        desc.addr = frame + umem_->headroom();
        desc.len = len;
        desc.options = 0;
        memcpy(umem_->area() + desc.addr, data, len);

        if (k_rx_.produce(desc) != core::RingStatus::OK) {
            // Frame stays with the kernel side for the next packet
            stash_.push_front(frame);
            rx_dropped_++;
            return false;
        }
        rx_injected_++;
        return true;
    }

    // Consume every TX descriptor; returns number serviced
    uint32_t service_tx() {
        if (!bound_) return 0;
        uint32_t serviced = 0;
        while (auto desc = k_tx_.consume()) {
            serviced++;
            uint8_t* data = umem_->data_at(desc->addr, desc->len);
            if (!data) {
                tx_invalid_++;
                if (desc->addr < umem_->size()) {
                    pending_.push_back(umem_->frame_base(desc->addr));
                }
                continue;
            }
            tx_serviced_++;
            if (options_.capture_tx) {
                transmitted_.emplace_back(data, data + desc->len);
            }
            if (options_.loop_tx_to_rx) {
                inject(data, desc->len);
            }
            pending_.push_back(umem_->frame_base(desc->addr));
        }
        if (options_.auto_complete) {
            complete_pending(UINT32_MAX);
        }
        return serviced;
    }

    // Post held completions; returns number posted
    uint32_t complete_pending(uint32_t max = UINT32_MAX) {
        uint32_t posted = 0;
        while (posted < max && !pending_.empty()) {
            if (k_comp_.produce(pending_.front()) != core::RingStatus::OK) break;
            pending_.pop_front();
            posted++;
        }
        return posted;
    }

    uint32_t pending_completions() const { return static_cast<uint32_t>(pending_.size()); }

    // Captured TX payloads, oldest first (clears the capture)
    std::vector<std::vector<uint8_t>> take_transmitted() {
        std::vector<std::vector<uint8_t>> out;
        out.swap(transmitted_);
        return out;
    }

    // Frames currently posted to the FILL ring and not yet used
    uint32_t fill_available() const { return bound_ ? k_fill_.ready() : 0; }

    bool bound() const { return bound_; }
    BindMode mode() const { return mode_; }
    LoopbackOptions& options() { return options_; }

    uint64_t tx_serviced() const { return tx_serviced_; }
    uint64_t tx_invalid() const { return tx_invalid_; }
    uint64_t rx_injected() const { return rx_injected_; }
    uint64_t rx_dropped() const { return rx_dropped_; }

private:
    void release() {
        k_rx_ = {};
        k_tx_ = {};
        k_fill_ = {};
        k_comp_ = {};
        rx_mem_ = core::RingMemory();
        tx_mem_ = core::RingMemory();
        pool_state_.reset();
        pending_.clear();
        stash_.clear();
        umem_ = nullptr;
        bound_ = false;
    }

    LoopbackOptions options_;
    bool bound_ = false;
    BindMode mode_ = BindMode::COPY;
    Umem* umem_ = nullptr;

    core::RingMemory rx_mem_;
    core::RingMemory tx_mem_;
    std::shared_ptr<LoopbackUmemState> pool_state_;

    core::SpscRing<core::RxDesc> k_rx_;             // producer
    core::SpscRing<core::TxDesc> k_tx_;             // consumer
    core::SpscRing<core::FillDesc> k_fill_;         // consumer
    core::SpscRing<core::CompletionDesc> k_comp_;   // producer

    std::deque<uint64_t> pending_;                  // Transmitted, completion not yet posted
    std::deque<uint64_t> stash_;                    // Fill frames taken but not delivered
    std::vector<std::vector<uint8_t>> transmitted_;

    uint64_t tx_serviced_ = 0;
    uint64_t tx_invalid_ = 0;
    uint64_t rx_injected_ = 0;
    uint64_t rx_dropped_ = 0;
};

static_assert(XskDriverConcept<LoopbackDriver>, "LoopbackDriver must satisfy XskDriverConcept");

}  // namespace wraith::xdp
