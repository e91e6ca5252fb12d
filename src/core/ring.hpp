// core/ring.hpp
// Lock-free single-producer / single-consumer descriptor ring
//
// Layout of one ring in shared memory (same shape the kernel maps for AF_XDP):
//
//   offset   0: uint32_t producer   (own cache line)
//   offset  64: uint32_t consumer   (own cache line)
//   offset 128: uint32_t flags      (own cache line, need-wakeup bit)
//   offset 192: T descs[size]
//
// producer and consumer are free-running uint32_t counters. They are never
// reset and wrap only through the power-of-two mask, so producer - consumer
// is always the number of filled slots (0 = empty, size = full), even across
// the 2^32 wrap.
//
// RingMemory owns the mapping. SpscRing<T> is a view used by exactly one side
// (producer or consumer) and keeps a private cached copy of the peer index so
// the shared cache line is only touched when the ring looks full or empty.
// Kernel-mapped AF_XDP rings are walked through the same view.

#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>
#include <cerrno>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/mman.h>
#include <unistd.h>

#include "descriptors.hpp"
#include "error.hpp"

namespace wraith::core {

/**
 * Backing memory for one ring (producer/consumer/flags words + descriptors)
 *
 * Anonymous MAP_SHARED mapping so both sides of an in-process ring pair see
 * the same words without any copy. Non-copyable, movable.
 */
class RingMemory {
public:
    static constexpr size_t CACHE_LINE = 64;
    static constexpr size_t PRODUCER_OFFSET = 0;
    static constexpr size_t CONSUMER_OFFSET = CACHE_LINE;
    static constexpr size_t FLAGS_OFFSET = 2 * CACHE_LINE;
    static constexpr size_t DESC_OFFSET = 3 * CACHE_LINE;

    RingMemory() = default;

    RingMemory(uint32_t size, size_t desc_size)
        : size_(size), desc_size_(desc_size) {
        if (!is_power_of_two(size)) {
            throw ConfigError("ring size " + std::to_string(size) + " is not a power of two");
        }
        size_t page = static_cast<size_t>(sysconf(_SC_PAGESIZE));
        bytes_ = DESC_OFFSET + static_cast<size_t>(size) * desc_size;
        bytes_ = (bytes_ + page - 1) & ~(page - 1);

        void* p = mmap(nullptr, bytes_, PROT_READ | PROT_WRITE,
                       MAP_SHARED | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED) {
            int err = errno;
            bytes_ = 0;
            throw AllocError("ring mmap failed", err);
        }
        base_ = static_cast<uint8_t*>(p);
    }

    ~RingMemory() { release(); }

    RingMemory(const RingMemory&) = delete;
    RingMemory& operator=(const RingMemory&) = delete;

    RingMemory(RingMemory&& o) noexcept
        : base_(o.base_), bytes_(o.bytes_), size_(o.size_), desc_size_(o.desc_size_) {
        o.base_ = nullptr;
        o.bytes_ = 0;
    }

    RingMemory& operator=(RingMemory&& o) noexcept {
        if (this != &o) {
            release();
            base_ = o.base_;
            bytes_ = o.bytes_;
            size_ = o.size_;
            desc_size_ = o.desc_size_;
            o.base_ = nullptr;
            o.bytes_ = 0;
        }
        return *this;
    }

    uint32_t* producer() { return reinterpret_cast<uint32_t*>(base_ + PRODUCER_OFFSET); }
    uint32_t* consumer() { return reinterpret_cast<uint32_t*>(base_ + CONSUMER_OFFSET); }
    uint32_t* flags() { return reinterpret_cast<uint32_t*>(base_ + FLAGS_OFFSET); }
    void* descs() { return base_ + DESC_OFFSET; }

    uint32_t size() const { return size_; }
    size_t desc_size() const { return desc_size_; }
    bool valid() const { return base_ != nullptr; }

private:
    void release() {
        if (base_) {
            munmap(base_, bytes_);
            base_ = nullptr;
            bytes_ = 0;
        }
    }

    uint8_t* base_ = nullptr;
    size_t bytes_ = 0;
    uint32_t size_ = 0;
    size_t desc_size_ = 0;
};

/**
 * SPSC ring view
 *
 * Producer side: produce() / produce_batch()
 * Consumer side: consume() / consume_batch()
 * A view must only be used for one of the two roles.
 */
template <typename T>
class SpscRing {
public:
    SpscRing() = default;

    SpscRing(uint32_t* producer, uint32_t* consumer, uint32_t* flags, T* descs, uint32_t size)
        : producer_(producer), consumer_(consumer), flags_(flags), descs_(descs)
        , size_(size), mask_(size - 1) {
        if (!is_power_of_two(size)) {
            throw ConfigError("ring size " + std::to_string(size) + " is not a power of two");
        }
        cached_prod_ = load_acquire(producer_);
        cached_cons_ = load_acquire(consumer_);
    }

    // View over in-process ring memory
    static SpscRing over(RingMemory& mem) {
        if (mem.desc_size() != sizeof(T)) {
            throw std::logic_error("ring memory descriptor size does not match view type");
        }
        return SpscRing(mem.producer(), mem.consumer(), mem.flags(),
                        static_cast<T*>(mem.descs()), mem.size());
    }

    // ========================================================================
    // Producer side
    // ========================================================================

    RingStatus produce(const T& desc) {
        if (producer_free(1) < 1) {
            return RingStatus::FULL;
        }
        uint32_t prod = load_relaxed(producer_);
        descs_[prod & mask_] = desc;
        store_release(producer_, prod + 1);
        return RingStatus::OK;
    }

    // Returns number of descriptors actually produced (may be < n)
    uint32_t produce_batch(const T* items, uint32_t n) {
        uint32_t free = producer_free(n);
        uint32_t count = n < free ? n : free;
        if (count == 0) return 0;

        uint32_t prod = load_relaxed(producer_);
        for (uint32_t i = 0; i < count; i++) {
            descs_[(prod + i) & mask_] = items[i];
        }
        store_release(producer_, prod + count);
        return count;
    }

    // ========================================================================
    // Consumer side
    // ========================================================================

    std::optional<T> consume() {
        if (consumer_avail(1) < 1) {
            return std::nullopt;
        }
        uint32_t cons = load_relaxed(consumer_);
        T desc = descs_[cons & mask_];
        store_release(consumer_, cons + 1);
        return desc;
    }

    // Returns number of descriptors actually consumed (may be < max)
    uint32_t consume_batch(T* out, uint32_t max) {
        uint32_t avail = consumer_avail(max);
        uint32_t count = max < avail ? max : avail;
        if (count == 0) return 0;

        uint32_t cons = load_relaxed(consumer_);
        for (uint32_t i = 0; i < count; i++) {
            out[i] = descs_[(cons + i) & mask_];
        }
        store_release(consumer_, cons + count);
        return count;
    }

    // ========================================================================
    // Occupancy and flags
    // ========================================================================

    uint32_t ready() const {
        return load_acquire(producer_) - load_acquire(consumer_);
    }

    uint32_t free_slots() const { return size_ - ready(); }
    uint32_t size() const { return size_; }
    bool attached() const { return descs_ != nullptr; }

    bool needs_wakeup() const {
        return flags_ && (load_acquire(flags_) & RING_FLAG_NEED_WAKEUP) != 0;
    }

    // Set by the kernel side of the ring
    void set_needs_wakeup(bool on) {
        if (!flags_) return;
        std::atomic_ref<uint32_t> f(*flags_);
        if (on) {
            f.fetch_or(RING_FLAG_NEED_WAKEUP, std::memory_order_release);
        } else {
            f.fetch_and(~RING_FLAG_NEED_WAKEUP, std::memory_order_release);
        }
    }

private:
    static uint32_t load_acquire(uint32_t* p) {
        return std::atomic_ref<uint32_t>(*p).load(std::memory_order_acquire);
    }
    static uint32_t load_relaxed(uint32_t* p) {
        return std::atomic_ref<uint32_t>(*p).load(std::memory_order_relaxed);
    }
    static void store_release(uint32_t* p, uint32_t v) {
        std::atomic_ref<uint32_t>(*p).store(v, std::memory_order_release);
    }

    // Free slots seen by the producer; refreshes the consumer copy only when short
    uint32_t producer_free(uint32_t want) {
        uint32_t prod = load_relaxed(producer_);
        uint32_t used = prod - cached_cons_;
        if (used > size_ || size_ - used < want) {
            cached_cons_ = load_acquire(consumer_);
            used = prod - cached_cons_;
        }
        return size_ - used;
    }

    // Filled slots seen by the consumer; refreshes the producer copy only when short
    uint32_t consumer_avail(uint32_t want) {
        uint32_t cons = load_relaxed(consumer_);
        uint32_t avail = cached_prod_ - cons;
        if (avail > size_ || avail < want) {
            cached_prod_ = load_acquire(producer_);
            avail = cached_prod_ - cons;
        }
        return avail;
    }

    uint32_t* producer_ = nullptr;
    uint32_t* consumer_ = nullptr;
    uint32_t* flags_ = nullptr;
    T* descs_ = nullptr;
    uint32_t size_ = 0;
    uint32_t mask_ = 0;
    uint32_t cached_prod_ = 0;   // consumer side: last seen producer
    uint32_t cached_cons_ = 0;   // producer side: last seen consumer
};

}  // namespace wraith::core
