// xdp/xsk_socket.hpp
// AF_XDP socket over a shared UMEM
//
// XskSocket<Driver> owns the application side of one queue:
//   - a frame partition claimed from the Umem (whole pool when exclusive)
//   - the RX / TX / FILL / COMPLETION ring views handed back by the driver
//   - a FrameAllocator over its partition for TX frames
//   - mode negotiation trail and statistics
//
// Frame ownership moves with descriptors:
//
//   allocator ──alloc──► app ──tx()──► TX ring ──► kernel ──► COMPLETION ──poll──► allocator
//   allocator ──replenish──► FILL ring ──► kernel ──► RX ring ──rx_batch──► app ──refill()──► FILL
//                                                                             └──free_frame()──► allocator
//
// A received frame that is neither refilled nor freed is lost to the socket;
// once the FILL ring runs dry the kernel drops every further packet.
//
// Hot-path calls never block and never throw for flow control: RX returns
// what is there, TX returns a TxStatus. Only wait_completions() blocks.
//
// Usage:
//   auto umem = Umem::create(UmemConfig());
//   XskSocket<KernelXskDriver> sock;
//   sock.bind("eth0", 0, umem, SocketConfig());
//   sock.send(buf, len);
//   for (auto& pkt : sock.rx_batch(64)) { consume(pkt.data, pkt.len); sock.refill(pkt.frame); }

#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../core/descriptors.hpp"
#include "../core/error.hpp"
#include "../core/log.hpp"
#include "../core/ring.hpp"
#include "bind_mode.hpp"
#include "frame_allocator.hpp"
#include "umem.hpp"
#include "xsk_driver.hpp"
#include "xsk_stats.hpp"

namespace wraith::xdp {

using core::TxStatus;

/**
 * Socket Configuration
 */
struct SocketConfig {
    uint32_t rx_ring_size;      // RX ring depth (power of two)
    uint32_t tx_ring_size;      // TX ring depth (power of two)
    ModePreference mode;        // AUTO / ZERO_COPY / COPY
    bool shared;                // Share the Umem with other sockets (partitioned)
    uint32_t frame_count;       // Frames to claim in shared mode
    uint32_t fill_frames;       // Frames pre-posted to FILL (DEFAULT_FILL = half the partition)
    uint32_t batch_size;        // Batch for internal completion reclaim

    static constexpr uint32_t DEFAULT_FILL = UINT32_MAX;

    SocketConfig()
        : rx_ring_size(2048)
        , tx_ring_size(2048)
        , mode(ModePreference::AUTO)
        , shared(false)
        , frame_count(0)
        , fill_frames(DEFAULT_FILL)
        , batch_size(64)
    {}
};

/**
 * One received packet; the frame stays owned by the caller until it is
 * refilled or freed
 */
struct ReceivedPacket {
    uint64_t frame;     // Frame offset (pass to refill() / free_frame())
    uint64_t addr;      // Descriptor address (frame + in-frame offset)
    uint32_t len;
    uint8_t* data;      // Points into UMEM
};

// One transmit request for tx_batch()
struct TxFrame {
    uint64_t offset;    // Frame offset from alloc_frame()
    uint32_t len;       // Payload length (payload starts after the headroom)
};

template<XskDriverConcept Driver>
class XskSocket {
public:
    template<typename... Args>
    explicit XskSocket(Args&&... driver_args)
        : driver_(std::forward<Args>(driver_args)...) {}

    ~XskSocket() { close(); }

    XskSocket(const XskSocket&) = delete;
    XskSocket& operator=(const XskSocket&) = delete;

    /**
     * Bind to an interface queue
     *
     * Claims a frame partition, negotiates zero-copy / copy mode through the
     * driver, then pre-posts fill_frames frames to the FILL ring.
     *
     * @throws ConfigError  invalid ring sizes or fill share
     * @throws AllocError   partition cannot be claimed
     * @throws BindError    negotiation ended in FAILED
     */
    void bind(const std::string& interface, uint32_t queue_id,
              std::shared_ptr<Umem> umem, const SocketConfig& config = SocketConfig()) {
        if (bound_) {
            throw std::logic_error("XskSocket: already bound to " + interface_);
        }
        if (!umem) {
            throw std::invalid_argument("XskSocket: null umem");
        }
        validate(config, *umem);

        uint32_t count = config.shared ? config.frame_count : umem->num_frames();
        uint32_t fill = (config.fill_frames == SocketConfig::DEFAULT_FILL) ? count / 2 : config.fill_frames;
        if (fill > count || fill > umem->config().fill_ring_size) {
            throw ConfigError("fill_frames " + std::to_string(fill) + " exceeds partition ("
                              + std::to_string(count) + ") or fill ring ("
                              + std::to_string(umem->config().fill_ring_size) + ")");
        }

        FrameRange range = umem->claim_frames(count);
        bool primary = umem->acquire_binding();

        BindRequest req;
        req.interface = interface;
        req.queue_id = queue_id;
        req.umem = umem.get();
        req.primary = primary;
        req.rx_ring_size = config.rx_ring_size;
        req.tx_ring_size = config.tx_ring_size;

        ModeNegotiator negotiator;
        XskRings rings;
        try {
            negotiator.run(config.mode, [&](BindMode mode) {
                return driver_.bind(req, mode, rings);
            });
        } catch (...) {
            umem->release_binding(primary);
            umem->release_frames(range);
            throw;
        }
        negotiation_ = negotiator.trail();

        if (negotiator.state() == NegotiationState::FAILED) {
            umem->release_binding(primary);
            umem->release_frames(range);
            WRAITH_WARN("XSK", "Bind failed on %s queue %u via %s (%s)", interface.c_str(), queue_id,
                        driver_.name(), strerror(negotiator.last_errno()));
            throw BindError(interface, queue_id, NegotiationState::FAILED, negotiator.last_errno());
        }

        umem_ = std::move(umem);
        interface_ = interface;
        queue_id_ = queue_id;
        config_ = config;
        range_ = range;
        primary_ = primary;
        rings_ = rings;
        mode_ = negotiator.mode();
        allocator_.reset(range);
        comp_scratch_.resize(config.batch_size ? config.batch_size : 64);
        bound_ = true;
        driver_drops_seen_ = driver_drops();

        if (mode_ == BindMode::COPY && config.mode == ModePreference::AUTO) {
            WRAITH_WARN("XSK", "Zero-copy unavailable on %s queue %u (%s), running in copy mode",
                        interface.c_str(), queue_id, strerror(negotiator.last_errno()));
        }

        uint32_t posted = replenish_fill(fill);
        (void)posted;
        WRAITH_LOG("XSK", "Bound %s queue %u via %s: %s mode, frames [%lu, +%u), FILL %u",
                   interface.c_str(), queue_id, driver_.name(), to_string(mode_),
                   (unsigned long)range.offset, range.count, posted);
    }

    // ========================================================================
    // Receive
    // ========================================================================

    /**
     * Drain up to max RX descriptors (never blocks)
     *
     * Every returned frame must go back through refill() or free_frame().
     */
    std::vector<ReceivedPacket> rx_batch(uint32_t max) {
        std::vector<ReceivedPacket> out;
        if (!bound_ || max == 0) return out;

        rx_scratch_.resize(max);
        uint32_t n = rings_.rx.consume_batch(rx_scratch_.data(), max);
        out.reserve(n);

        uint64_t bytes = 0;
        for (uint32_t i = 0; i < n; i++) {
            const core::RxDesc& desc = rx_scratch_[i];
            uint64_t frame = umem_->frame_base(desc.addr);
            if (!allocator_.owns(frame) || allocator_.state(frame) != FrameState::FILL) {
                stats_.record_invalid_desc();
                continue;
            }
            uint8_t* data = umem_->data_at(desc.addr, desc.len);
            if (!data) {
                stats_.record_invalid_desc();
                // Keep our frame in circulation
                if (rings_.fill.produce(frame) != core::RingStatus::OK) {
                    allocator_.mark(frame, FrameState::APP);
                    allocator_.free(frame);
                }
                continue;
            }
            allocator_.mark(frame, FrameState::APP);
            ReceivedPacket pkt;
            pkt.frame = frame;
            pkt.addr = desc.addr;
            pkt.len = desc.len;
            pkt.data = data;
            out.push_back(pkt);
            bytes += desc.len;
        }
        if (!out.empty()) {
            stats_.record_rx(out.size(), bytes);
        }

        if (rings_.fill.ready() == 0) {
            stats_.record_fill_ring_empty();
        }
        uint64_t drops = driver_drops();
        if (drops > driver_drops_seen_) {
            stats_.record_rx_dropped(drops - driver_drops_seen_);
            driver_drops_seen_ = drops;
        }
        if (rings_.fill.needs_wakeup()) {
            driver_.wakeup_rx();
            stats_.record_wakeup();
        }
        return out;
    }

    /**
     * Hand a received frame back to the FILL ring
     *
     * @return RingStatus::FULL if the FILL ring has no slot (caller keeps the frame)
     * @throws FrameBoundsError for a foreign or misaligned offset
     * @throws std::logic_error if the frame sits in the free list or in a ring
     */
    core::RingStatus refill(uint64_t frame) {
        check_bound();
        check_held(frame);
        core::RingStatus st = rings_.fill.produce(frame);
        if (st == core::RingStatus::OK) {
            allocator_.mark(frame, FrameState::FILL);
        }
        return st;
    }

    // Returns number of frames posted (stops at the first FULL)
    uint32_t refill_batch(const uint64_t* frames, uint32_t n) {
        check_bound();
        // Mark as we validate so a frame listed twice is caught
        uint32_t marked = 0;
        try {
            for (; marked < n; marked++) {
                check_held(frames[marked]);
                allocator_.mark(frames[marked], FrameState::FILL);
            }
        } catch (...) {
            for (uint32_t i = 0; i < marked; i++) allocator_.mark(frames[i], FrameState::APP);
            throw;
        }
        uint32_t posted = rings_.fill.produce_batch(frames, n);
        for (uint32_t i = posted; i < n; i++) allocator_.mark(frames[i], FrameState::APP);
        return posted;
    }

    // Move up to n free frames from the allocator to the FILL ring
    uint32_t replenish_fill(uint32_t n) {
        if (!bound_) return 0;
        uint32_t posted = 0;
        while (posted < n && rings_.fill.free_slots() > 0) {
            auto frame = allocator_.alloc();
            if (!frame) break;
            if (rings_.fill.produce(*frame) != core::RingStatus::OK) {
                allocator_.free(*frame);
                break;
            }
            allocator_.mark(*frame, FrameState::FILL);
            posted++;
        }
        return posted;
    }

    // ========================================================================
    // Transmit
    // ========================================================================

    /**
     * Submit one frame for transmission (asynchronous)
     *
     * The payload must already be written at payload_at(offset). On
     * SUBMITTED the frame belongs to the kernel until its completion is
     * reclaimed; on any other status the caller still owns it.
     */
    TxStatus tx(uint64_t offset, uint32_t len) {
        if (!bound_) return TxStatus::CLOSED;
        if (!valid_tx(offset, len)) return TxStatus::INVALID;

        core::TxDesc desc;
        desc.addr = offset + umem_->headroom();
        desc.len = len;
        desc.options = 0;
        if (rings_.tx.produce(desc) != core::RingStatus::OK) {
            stats_.record_tx_ring_full();
            return TxStatus::RING_FULL;
        }
        allocator_.mark(offset, FrameState::TX);
        stats_.record_tx(1, len);
        WRAITH_DEBUG_PRINT("[XSK] TX frame 0x%lx len %u\n", (unsigned long)offset, len);

        if (rings_.tx.needs_wakeup()) {
            kick();
        }
        return TxStatus::SUBMITTED;
    }

    /**
     * Submit several frames with one kick
     * @return number accepted (in order; stops at the first invalid frame or full ring)
     */
    uint32_t tx_batch(const TxFrame* frames, uint32_t n) {
        if (!bound_ || n == 0) return 0;

        tx_scratch_.clear();
        uint64_t bytes = 0;
        // Marked TX while collecting so a frame listed twice stops the batch
        for (uint32_t i = 0; i < n; i++) {
            if (!valid_tx(frames[i].offset, frames[i].len)) break;
            core::TxDesc desc;
            desc.addr = frames[i].offset + umem_->headroom();
            desc.len = frames[i].len;
            desc.options = 0;
            tx_scratch_.push_back(desc);
            allocator_.mark(frames[i].offset, FrameState::TX);
        }

        uint32_t accepted = rings_.tx.produce_batch(tx_scratch_.data(),
                                                    static_cast<uint32_t>(tx_scratch_.size()));
        if (accepted < tx_scratch_.size()) {
            stats_.record_tx_ring_full();
            for (size_t i = accepted; i < tx_scratch_.size(); i++) {
                allocator_.mark(frames[i].offset, FrameState::APP);
            }
        }
        for (uint32_t i = 0; i < accepted; i++) {
            bytes += tx_scratch_[i].len;
        }
        if (accepted > 0) {
            stats_.record_tx(accepted, bytes);
            if (rings_.tx.needs_wakeup()) {
                kick();
            }
        }
        return accepted;
    }

    /**
     * Reclaim finished TX frames into the allocator
     * @return number of frames reclaimed
     */
    uint32_t poll_completions(uint32_t max = UINT32_MAX) {
        if (!bound_) return 0;
        uint32_t total = 0;
        while (total < max) {
            uint32_t want = max - total;
            if (want > comp_scratch_.size()) want = static_cast<uint32_t>(comp_scratch_.size());
            uint32_t n = rings_.comp.consume_batch(comp_scratch_.data(), want);
            if (n == 0) break;
            for (uint32_t i = 0; i < n; i++) {
                uint64_t frame = umem_->frame_base(comp_scratch_[i]);
                if (!allocator_.reclaim(frame)) {
                    stats_.record_invalid_desc();
                    continue;
                }
                total++;
            }
        }
        if (total > 0) {
            stats_.record_completion(total);
        }
        return total;
    }

    /**
     * Block until n frames have been reclaimed or timeout_ms expires,
     * kicking the kernel when the TX ring asks for it
     * @return number of frames reclaimed (may be < n on timeout)
     */
    uint32_t wait_completions(uint32_t n, int timeout_ms) {
        if (!bound_) return 0;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        uint32_t reclaimed = poll_completions(n);
        while (reclaimed < n) {
            if (rings_.tx.needs_wakeup()) {
                kick();
            }
            reclaimed += poll_completions(n - reclaimed);
            if (reclaimed >= n) break;

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) break;
            driver_.wait(static_cast<int>(left));
        }
        return reclaimed;
    }

    // ========================================================================
    // Frames
    // ========================================================================

    // Never blocks; reclaims completions first when the free list is empty
    std::optional<uint64_t> alloc_frame() {
        if (!bound_) return std::nullopt;
        if (allocator_.available() == 0) {
            poll_completions(config_.batch_size);
        }
        return allocator_.alloc();
    }

    void free_frame(uint64_t offset) {
        check_bound();
        allocator_.free(offset);
    }

    // Writable payload view of an allocated frame
    FrameRef payload(uint64_t offset) const {
        check_bound();
        return umem_->payload_at(offset);
    }

    /**
     * Copy a payload into a fresh frame and transmit it
     *
     * Returns POOL_EXHAUSTED instead of dropping when no frame is free.
     */
    TxStatus send(const void* data, uint32_t len) {
        if (!bound_) return TxStatus::CLOSED;
        if (len == 0 || len > umem_->payload_capacity()) return TxStatus::INVALID;

        auto frame = alloc_frame();
        if (!frame) return TxStatus::POOL_EXHAUSTED;

        memcpy(umem_->area() + *frame + umem_->headroom(), data, len);
        TxStatus status = tx(*frame, len);
        if (status != TxStatus::SUBMITTED) {
            allocator_.free(*frame);
        }
        return status;
    }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Unbind and release everything exactly once
     *
     * Descriptors still waiting in RX / COMPLETION are discarded and counted.
     */
    void close() {
        if (!bound_) return;

        uint64_t discarded = 0;
        core::RxDesc rx_desc;
        while (rings_.rx.consume_batch(&rx_desc, 1) == 1) discarded++;
        core::CompletionDesc comp_desc;
        while (rings_.comp.consume_batch(&comp_desc, 1) == 1) discarded++;
        if (discarded) {
            stats_.record_discarded(discarded);
        }

        driver_.unbind();
        rings_ = XskRings{};
        allocator_.clear();
        bound_ = false;

        umem_->release_binding(primary_);
        umem_->release_frames(range_);
        WRAITH_LOG("XSK", "Closed %s queue %u (%lu descriptors discarded)",
                   interface_.c_str(), queue_id_, (unsigned long)discarded);
        umem_.reset();
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    bool bound() const { return bound_; }
    BindMode mode() const { return mode_; }
    const std::vector<NegotiationState>& negotiation() const { return negotiation_; }
    NegotiationState negotiation_state() const {
        return negotiation_.empty() ? NegotiationState::UNINITIALIZED : negotiation_.back();
    }

    XskStats& stats() { return stats_; }
    const XskStats& stats() const { return stats_; }
    const std::shared_ptr<Umem>& umem() const { return umem_; }
    const FrameRange& frame_range() const { return range_; }
    uint32_t free_frames() const { return allocator_.available(); }
    uint32_t fill_pending() const { return bound_ ? rings_.fill.ready() : 0; }
    uint32_t payload_capacity() const { return umem_ ? umem_->payload_capacity() : 0; }
    const std::string& interface() const { return interface_; }
    uint32_t queue_id() const { return queue_id_; }
    int fd() const { return driver_.fd(); }

    Driver& driver() { return driver_; }

private:
    static void validate(const SocketConfig& config, const Umem& umem) {
        if (!core::is_power_of_two(config.rx_ring_size)) {
            throw ConfigError("rx ring size " + std::to_string(config.rx_ring_size) + " is not a power of two");
        }
        if (!core::is_power_of_two(config.tx_ring_size)) {
            throw ConfigError("tx ring size " + std::to_string(config.tx_ring_size) + " is not a power of two");
        }
        if (config.shared && (config.frame_count == 0 || config.frame_count > umem.num_frames())) {
            throw ConfigError("shared socket frame_count " + std::to_string(config.frame_count)
                              + " must be in [1, " + std::to_string(umem.num_frames()) + "]");
        }
    }

    bool valid_tx(uint64_t offset, uint32_t len) const {
        return len > 0
            && len <= umem_->payload_capacity()
            && allocator_.held(offset);
    }

    void check_bound() const {
        if (!bound_) {
            throw std::logic_error("XskSocket: not bound");
        }
    }

    void check_held(uint64_t frame) const {
        if (!allocator_.owns(frame)) {
            throw core::FrameBoundsError("frame " + std::to_string(frame) + " does not belong to this socket");
        }
        FrameState s = allocator_.state(frame);
        if (s != FrameState::APP) {
            throw std::logic_error("frame " + std::to_string(frame) + " is in the " + to_string(s));
        }
    }

    // Drivers that count fill-starvation drops expose rx_dropped()
    uint64_t driver_drops() const {
        if constexpr (requires(const Driver& d) { { d.rx_dropped() } -> std::convertible_to<uint64_t>; }) {
            return driver_.rx_dropped();
        } else {
            return 0;
        }
    }

    void kick() {
        int ret = driver_.kick_tx();
        stats_.record_wakeup();
        if (ret < 0) {
            WRAITH_DEBUG_PRINT("[XSK] kick_tx failed: %s\n", strerror(-ret));
        }
    }

    Driver driver_;
    std::shared_ptr<Umem> umem_;
    std::string interface_;
    uint32_t queue_id_ = 0;
    SocketConfig config_;
    FrameRange range_;
    bool primary_ = false;
    bool bound_ = false;

    XskRings rings_;
    FrameAllocator allocator_;
    BindMode mode_ = BindMode::COPY;
    std::vector<NegotiationState> negotiation_;
    XskStats stats_;
    uint64_t driver_drops_seen_ = 0;

    std::vector<core::RxDesc> rx_scratch_;
    std::vector<core::TxDesc> tx_scratch_;
    std::vector<core::CompletionDesc> comp_scratch_;
};

}  // namespace wraith::xdp
