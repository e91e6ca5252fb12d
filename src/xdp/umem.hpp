// xdp/umem.hpp
// Shared packet-buffer pool (UMEM) for AF_XDP sockets
//
// One contiguous, prefaulted, page-locked region divided into fixed-size
// frames. The pool does not track which frame is where: ownership moves with
// the descriptors in the four rings and the per-socket FrameAllocator. The
// pool only hands out disjoint frame partitions so that shared-mode sockets
// never own the same offset.
//
// Lifetime: std::shared_ptr<Umem>. Every bound socket holds one reference;
// the mapping is unlocked and unmapped when the last reference goes away.
//
// Memory layout:
//   [frame 0][frame 1] ... [frame N-1]        N = size / frame_size
//   frame i: [headroom][payload ....]

#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sys/mman.h>

#include "../core/error.hpp"
#include "../core/log.hpp"
#include "frame_ref.hpp"

namespace wraith::xdp {

using core::AllocError;
using core::ConfigError;
using core::FrameBoundsError;

/**
 * UMEM Configuration
 */
struct UmemConfig {
    uint64_t size;              // Total bytes (power of two, multiple of frame_size)
    uint32_t frame_size;        // Bytes per frame (power of two, >= 2048)
    uint32_t headroom;          // Reserved bytes at the start of each frame
    uint32_t fill_ring_size;    // FILL ring depth (power of two)
    uint32_t comp_ring_size;    // COMPLETION ring depth (power of two)
    bool lock_memory;           // mlock() the region (needs RLIMIT_MEMLOCK)
    bool huge_pages;            // Try MAP_HUGETLB first

    static constexpr uint32_t MIN_FRAME_SIZE = 2048;

    UmemConfig()
        : size(4 * 1024 * 1024)   // 4 MB
        , frame_size(2048)
        , headroom(256)
        , fill_ring_size(2048)
        , comp_ring_size(2048)
        , lock_memory(true)
        , huge_pages(false)
    {}

    uint32_t num_frames() const {
        return frame_size ? static_cast<uint32_t>(size / frame_size) : 0;
    }

    /**
     * @throws ConfigError describing the first violated constraint
     */
    void validate() const {
        if (!core::is_power_of_two(frame_size)) {
            throw ConfigError("frame_size " + std::to_string(frame_size) + " is not a power of two");
        }
        if (frame_size < MIN_FRAME_SIZE) {
            throw ConfigError("frame_size " + std::to_string(frame_size) + " is below "
                              + std::to_string(MIN_FRAME_SIZE));
        }
        if (!core::is_power_of_two(size)) {
            throw ConfigError("umem size " + std::to_string(size) + " is not a power of two");
        }
        if (size < frame_size || size % frame_size != 0) {
            throw ConfigError("umem size " + std::to_string(size)
                              + " is not a multiple of frame_size " + std::to_string(frame_size));
        }
        if (headroom >= frame_size) {
            throw ConfigError("headroom " + std::to_string(headroom)
                              + " leaves no payload in a " + std::to_string(frame_size) + " byte frame");
        }
        if (!core::is_power_of_two(fill_ring_size)) {
            throw ConfigError("fill ring size " + std::to_string(fill_ring_size) + " is not a power of two");
        }
        if (!core::is_power_of_two(comp_ring_size)) {
            throw ConfigError("completion ring size " + std::to_string(comp_ring_size) + " is not a power of two");
        }
    }
};

/**
 * Contiguous run of frames claimed from a Umem
 */
struct FrameRange {
    uint64_t offset = 0;        // Byte offset of the first frame
    uint32_t count = 0;         // Number of frames
    uint32_t frame_size = 0;

    uint64_t end() const { return offset + static_cast<uint64_t>(count) * frame_size; }
    bool empty() const { return count == 0; }

    bool contains(uint64_t addr) const {
        return addr >= offset && addr < end();
    }
};

class Umem {
public:
    /**
     * Validate, map, prefault and (optionally) lock a new pool
     *
     * @throws ConfigError before anything is mapped
     * @throws AllocError when mmap or mlock fails
     */
    static std::shared_ptr<Umem> create(const UmemConfig& config) {
        config.validate();
        return std::shared_ptr<Umem>(new Umem(config));
    }

    ~Umem() {
        // Kernel-side registration must go before the memory it points at
        registration_.reset();
        registration_owner_.clear();
        if (area_) {
            if (locked_) munlock(area_, config_.size);
            munmap(area_, config_.size);
            area_ = nullptr;
            live_counter().fetch_sub(1, std::memory_order_relaxed);
            WRAITH_DEBUG_PRINT("[UMEM] Released %lu bytes\n", (unsigned long)config_.size);
        }
    }

    Umem(const Umem&) = delete;
    Umem& operator=(const Umem&) = delete;

    // Number of pools currently mapped in this process
    static int live_regions() {
        return live_counter().load(std::memory_order_relaxed);
    }

    // ========================================================================
    // Geometry
    // ========================================================================

    const UmemConfig& config() const { return config_; }
    uint8_t* area() const { return area_; }
    uint64_t size() const { return config_.size; }
    uint32_t frame_size() const { return config_.frame_size; }
    uint32_t headroom() const { return config_.headroom; }
    uint32_t num_frames() const { return config_.num_frames(); }
    uint32_t payload_capacity() const { return config_.frame_size - config_.headroom; }
    bool huge_pages() const { return huge_; }
    bool locked() const { return locked_; }

    // Frame offset owning a packet descriptor address
    uint64_t frame_base(uint64_t addr) const {
        return addr & ~static_cast<uint64_t>(config_.frame_size - 1);
    }

    bool is_frame_offset(uint64_t offset) const {
        return offset < config_.size && (offset & (config_.frame_size - 1)) == 0;
    }

    /**
     * View over one whole frame
     * @throws FrameBoundsError if offset is misaligned or outside the pool
     */
    FrameRef frame_at(uint64_t offset) const {
        check_frame(offset);
        FrameRef f;
        f.addr = offset;
        f.data = area_ + offset;
        f.capacity = config_.frame_size;
        return f;
    }

    /**
     * View over the payload area of a frame (after headroom)
     * @throws FrameBoundsError if offset is misaligned or outside the pool
     */
    FrameRef payload_at(uint64_t offset) const {
        check_frame(offset);
        FrameRef f;
        f.addr = offset + config_.headroom;
        f.data = area_ + offset + config_.headroom;
        f.capacity = config_.frame_size - config_.headroom;
        return f;
    }

    /**
     * Pointer for a packet descriptor (hot path, no throw)
     * @return nullptr if [addr, addr+len) leaves the frame or the pool
     */
    uint8_t* data_at(uint64_t addr, uint32_t len) const {
        if (addr >= config_.size) return nullptr;
        uint64_t base = frame_base(addr);
        if (addr + len > base + config_.frame_size) return nullptr;
        return area_ + addr;
    }

    // ========================================================================
    // Frame partitions
    // ========================================================================

    /**
     * Claim `count` contiguous frames (first fit)
     * @throws AllocError if no gap is large enough
     */
    FrameRange claim_frames(uint32_t count) {
        if (count == 0) {
            throw ConfigError("cannot claim zero frames");
        }
        std::lock_guard<std::mutex> lock(partition_mutex_);

        uint64_t want = static_cast<uint64_t>(count) * config_.frame_size;
        uint64_t cursor = 0;
        size_t insert_at = 0;
        for (; insert_at <= claimed_.size(); insert_at++) {
            uint64_t gap_end = (insert_at < claimed_.size()) ? claimed_[insert_at].offset : config_.size;
            if (gap_end - cursor >= want) break;
            if (insert_at < claimed_.size()) cursor = claimed_[insert_at].end();
        }
        if (insert_at > claimed_.size()) {
            throw AllocError("cannot claim " + std::to_string(count) + " frames: "
                             + std::to_string(free_frames_locked()) + " unclaimed", 0);
        }

        FrameRange range;
        range.offset = cursor;
        range.count = count;
        range.frame_size = config_.frame_size;
        claimed_.insert(claimed_.begin() + insert_at, range);
        return range;
    }

    // Claim the whole pool (exclusive socket)
    FrameRange claim_all() {
        return claim_frames(num_frames());
    }

    void release_frames(const FrameRange& range) {
        std::lock_guard<std::mutex> lock(partition_mutex_);
        for (auto it = claimed_.begin(); it != claimed_.end(); ++it) {
            if (it->offset == range.offset && it->count == range.count) {
                claimed_.erase(it);
                return;
            }
        }
        throw std::logic_error("release of unclaimed frame range at offset " + std::to_string(range.offset));
    }

    uint32_t unclaimed_frames() const {
        std::lock_guard<std::mutex> lock(partition_mutex_);
        return free_frames_locked();
    }

    // ========================================================================
    // Driver registration
    // ========================================================================
    //
    // A driver stores its kernel-side state for this pool (e.g. the libxdp
    // xsk_umem handle and the primary FILL/COMPLETION pair) here. The first
    // binding on the pool gets the primary pair; later bindings bring their
    // own pair (shared mode). A primary pair is never handed out twice.

    std::shared_ptr<void> registration(const char* owner) const {
        std::lock_guard<std::mutex> lock(partition_mutex_);
        if (!registration_ || registration_owner_ != owner) return nullptr;
        return registration_;
    }

    void set_registration(const char* owner, std::shared_ptr<void> state) {
        std::lock_guard<std::mutex> lock(partition_mutex_);
        if (registration_ && registration_owner_ != owner) {
            throw std::logic_error("umem already registered with driver " + registration_owner_);
        }
        registration_ = std::move(state);
        registration_owner_ = owner;
    }

    // Forget a registration the kernel no longer backs (a failed first bind)
    void drop_registration(const char* owner) {
        std::shared_ptr<void> doomed;
        {
            std::lock_guard<std::mutex> lock(partition_mutex_);
            if (!registration_ || registration_owner_ != owner) return;
            doomed = std::move(registration_);
            registration_owner_.clear();
        }
        doomed.reset();
    }

    // Register a binding; true if it receives the primary FILL/COMPLETION pair
    bool acquire_binding() {
        std::lock_guard<std::mutex> lock(partition_mutex_);
        bindings_++;
        if (!primary_in_use_ && !primary_retired_) {
            primary_in_use_ = true;
            return true;
        }
        return false;
    }

    void release_binding(bool primary) {
        std::shared_ptr<void> doomed;
        {
            std::lock_guard<std::mutex> lock(partition_mutex_);
            if (bindings_ == 0) {
                throw std::logic_error("umem binding released twice");
            }
            bindings_--;
            if (primary) {
                primary_in_use_ = false;
                primary_retired_ = true;
            }
            if (bindings_ == 0) {
                doomed = std::move(registration_);
                registration_owner_.clear();
                primary_retired_ = false;
            }
        }
        // Driver teardown runs outside the lock
        doomed.reset();
    }

    uint32_t bindings() const {
        std::lock_guard<std::mutex> lock(partition_mutex_);
        return bindings_;
    }

private:
    explicit Umem(const UmemConfig& config) : config_(config) {
        void* p = MAP_FAILED;
        if (config_.huge_pages) {
            p = mmap(nullptr, config_.size, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS | MAP_POPULATE | MAP_HUGETLB, -1, 0);
            if (p == MAP_FAILED) {
                WRAITH_LOG("UMEM", "Huge pages unavailable (%s), using regular pages", strerror(errno));
            } else {
                huge_ = true;
            }
        }
        if (p == MAP_FAILED) {
            p = mmap(nullptr, config_.size, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS | MAP_POPULATE, -1, 0);
        }
        if (p == MAP_FAILED) {
            throw AllocError("Failed to allocate UMEM (" + std::to_string(config_.size) + " bytes)", errno);
        }

        if (config_.lock_memory) {
            if (mlock(p, config_.size) != 0) {
                int err = errno;
                munmap(p, config_.size);
                throw AllocError("Failed to lock memory (check ulimit -l)", err);
            }
            locked_ = true;
        }

        area_ = static_cast<uint8_t*>(p);
        live_counter().fetch_add(1, std::memory_order_relaxed);
        WRAITH_LOG("UMEM", "Allocated %lu bytes (%u frames x %u, headroom %u)%s%s",
                   (unsigned long)config_.size, config_.num_frames(), config_.frame_size,
                   config_.headroom, huge_ ? " [hugepages]" : "", locked_ ? " [locked]" : "");
    }

    void check_frame(uint64_t offset) const {
        if (!is_frame_offset(offset)) {
            throw FrameBoundsError("frame offset " + std::to_string(offset)
                                   + " is misaligned or outside the " + std::to_string(config_.size)
                                   + " byte pool");
        }
    }

    uint32_t free_frames_locked() const {
        uint32_t used = 0;
        for (const auto& r : claimed_) used += r.count;
        return num_frames() - used;
    }

    static std::atomic<int>& live_counter() {
        static std::atomic<int> counter{0};
        return counter;
    }

    UmemConfig config_;
    uint8_t* area_ = nullptr;
    bool huge_ = false;
    bool locked_ = false;

    mutable std::mutex partition_mutex_;
    std::vector<FrameRange> claimed_;        // Sorted by offset

    std::shared_ptr<void> registration_;
    std::string registration_owner_;
    uint32_t bindings_ = 0;
    bool primary_in_use_ = false;
    bool primary_retired_ = false;
};

}  // namespace wraith::xdp
