// xdp/xsk_stats.hpp
// Per-socket AF_XDP counters
//
// Relaxed atomics: counters are written by the socket's worker and may be
// read from any thread through snapshot().

#pragma once

#include <atomic>
#include <cstdint>

namespace wraith::xdp {

struct XskStatsSnapshot {
    uint64_t rx_packets;
    uint64_t rx_bytes;
    uint64_t tx_packets;
    uint64_t tx_bytes;
    uint64_t rx_dropped;          // Inbound packets lost for lack of a fill frame
    uint64_t tx_ring_full;
    uint64_t fill_ring_empty;
    uint64_t tx_completions;
    uint64_t invalid_descs;
    uint64_t wakeup_calls;
    uint64_t discarded_at_close;  // Descriptors still in RX / COMPLETION at close()

    double rx_pps(double duration_secs) const {
        return duration_secs > 0.0 ? static_cast<double>(rx_packets) / duration_secs : 0.0;
    }

    double tx_pps(double duration_secs) const {
        return duration_secs > 0.0 ? static_cast<double>(tx_packets) / duration_secs : 0.0;
    }

    // Bits per second
    double rx_bps(double duration_secs) const {
        return duration_secs > 0.0 ? static_cast<double>(rx_bytes) * 8.0 / duration_secs : 0.0;
    }

    double tx_bps(double duration_secs) const {
        return duration_secs > 0.0 ? static_cast<double>(tx_bytes) * 8.0 / duration_secs : 0.0;
    }

    // Fraction of inbound packets dropped
    double drop_rate() const {
        uint64_t total = rx_packets + rx_dropped;
        return total > 0 ? static_cast<double>(rx_dropped) / static_cast<double>(total) : 0.0;
    }
};

class XskStats {
public:
    void record_rx(uint64_t count, uint64_t bytes) {
        rx_packets_.fetch_add(count, std::memory_order_relaxed);
        rx_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void record_tx(uint64_t count, uint64_t bytes) {
        tx_packets_.fetch_add(count, std::memory_order_relaxed);
        tx_bytes_.fetch_add(bytes, std::memory_order_relaxed);
    }

    void record_rx_dropped(uint64_t count = 1) { rx_dropped_.fetch_add(count, std::memory_order_relaxed); }
    void record_completion(uint64_t count) { tx_completions_.fetch_add(count, std::memory_order_relaxed); }
    void record_tx_ring_full() { tx_ring_full_.fetch_add(1, std::memory_order_relaxed); }
    void record_fill_ring_empty() { fill_ring_empty_.fetch_add(1, std::memory_order_relaxed); }
    void record_invalid_desc() { invalid_descs_.fetch_add(1, std::memory_order_relaxed); }
    void record_wakeup() { wakeup_calls_.fetch_add(1, std::memory_order_relaxed); }
    void record_discarded(uint64_t count) { discarded_at_close_.fetch_add(count, std::memory_order_relaxed); }

    XskStatsSnapshot snapshot() const {
        XskStatsSnapshot s;
        s.rx_packets = rx_packets_.load(std::memory_order_relaxed);
        s.rx_bytes = rx_bytes_.load(std::memory_order_relaxed);
        s.tx_packets = tx_packets_.load(std::memory_order_relaxed);
        s.tx_bytes = tx_bytes_.load(std::memory_order_relaxed);
        s.rx_dropped = rx_dropped_.load(std::memory_order_relaxed);
        s.tx_ring_full = tx_ring_full_.load(std::memory_order_relaxed);
        s.fill_ring_empty = fill_ring_empty_.load(std::memory_order_relaxed);
        s.tx_completions = tx_completions_.load(std::memory_order_relaxed);
        s.invalid_descs = invalid_descs_.load(std::memory_order_relaxed);
        s.wakeup_calls = wakeup_calls_.load(std::memory_order_relaxed);
        s.discarded_at_close = discarded_at_close_.load(std::memory_order_relaxed);
        return s;
    }

    void reset() {
        rx_packets_.store(0, std::memory_order_relaxed);
        rx_bytes_.store(0, std::memory_order_relaxed);
        tx_packets_.store(0, std::memory_order_relaxed);
        tx_bytes_.store(0, std::memory_order_relaxed);
        rx_dropped_.store(0, std::memory_order_relaxed);
        tx_ring_full_.store(0, std::memory_order_relaxed);
        fill_ring_empty_.store(0, std::memory_order_relaxed);
        tx_completions_.store(0, std::memory_order_relaxed);
        invalid_descs_.store(0, std::memory_order_relaxed);
        wakeup_calls_.store(0, std::memory_order_relaxed);
        discarded_at_close_.store(0, std::memory_order_relaxed);
    }

private:
    std::atomic<uint64_t> rx_packets_{0};
    std::atomic<uint64_t> rx_bytes_{0};
    std::atomic<uint64_t> tx_packets_{0};
    std::atomic<uint64_t> tx_bytes_{0};
    std::atomic<uint64_t> rx_dropped_{0};
    std::atomic<uint64_t> tx_ring_full_{0};
    std::atomic<uint64_t> fill_ring_empty_{0};
    std::atomic<uint64_t> tx_completions_{0};
    std::atomic<uint64_t> invalid_descs_{0};
    std::atomic<uint64_t> wakeup_calls_{0};
    std::atomic<uint64_t> discarded_at_close_{0};
};

}  // namespace wraith::xdp
