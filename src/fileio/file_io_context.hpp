// fileio/file_io_context.hpp
// Batched asynchronous file I/O with registered buffers
//
// Two backends behind one interface:
//   - IO_URING: io_uring SQ/CQ, fixed-buffer reads/writes when the buffer
//     table could be registered with the kernel (built with WRAITH_ENABLE_IO_URING)
//   - SYNC:     pread / pwrite / fdatasync executed inline at submission,
//     completion queued immediately (io_uring unavailable, or force_sync)
//
// Submissions return an OperationId right away and are pushed to the kernel
// in batches (submit(), or implicitly by poll/wait). Completions may arrive in
// any order; each id completes exactly once, including through close().
//
// Buffer ownership:
//   submit_read()          acquires a buffer; the completion keeps it until release_buffer()
//   submit_write()         copies into a buffer; released when the write completes
//   submit_write_buffer()  caller-filled buffer; released when the write completes
//   submit_read_into() /
//   submit_write_from()    caller memory (e.g. UMEM frames), no table buffer
//
// Thread safety: not thread-safe (one context per worker)

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <sys/mman.h>
#include <sys/uio.h>
#include <unistd.h>

// io_uring header must be included outside namespace
#ifdef WRAITH_ENABLE_IO_URING
#include <liburing.h>
#endif

#include "../core/error.hpp"
#include "../core/log.hpp"

namespace wraith::fileio {

using OperationId = uint64_t;

enum class Backend : uint8_t {
    IO_URING = 0,
    SYNC = 1
};

enum class IoStatus : uint8_t {
    OK = 0,
    QUEUE_FULL = 1,     // queue_depth operations already outstanding
    NO_BUFFER = 2,      // Every table buffer is held
    CLOSED = 3          // Context was closed
};

enum class OpKind : uint8_t {
    READ = 0,
    WRITE = 1,
    FSYNC = 2
};

inline const char* to_string(Backend b) {
    return b == Backend::IO_URING ? "io_uring" : "sync";
}

inline const char* to_string(IoStatus s) {
    switch (s) {
        case IoStatus::OK:         return "OK";
        case IoStatus::QUEUE_FULL: return "QUEUE_FULL";
        case IoStatus::NO_BUFFER:  return "NO_BUFFER";
        case IoStatus::CLOSED:     return "CLOSED";
    }
    return "UNKNOWN";
}

struct FileIoConfig {
    uint32_t queue_depth;       // Max outstanding operations (power of two)
    bool force_sync;            // Skip io_uring even when available

    FileIoConfig()
        : queue_depth(64)
        , force_sync(false)
    {}
};

struct SubmitResult {
    IoStatus status;
    OperationId id;             // 0 unless status == OK

    bool ok() const { return status == IoStatus::OK; }
};

struct Completion {
    OperationId id = 0;
    OpKind kind = OpKind::READ;
    int32_t result = 0;         // Bytes transferred, or negated errno
    uint32_t requested = 0;     // Bytes requested (0 for fsync)
    uint64_t offset = 0;
    int32_t buffer_index = -1;  // Table buffer, -1 for caller memory / fsync
    uint8_t* data = nullptr;    // Where a read landed (table buffer or caller memory)

    bool ok() const { return result >= 0; }
    bool partial() const { return result >= 0 && static_cast<uint32_t>(result) < requested; }
    bool cancelled() const { return result == -ECANCELED; }
};

class FileIoContext {
public:
    /**
     * @throws ConfigError if queue_depth is not a power of two
     */
    explicit FileIoContext(const FileIoConfig& config = FileIoConfig())
        : config_(config) {
        if (!core::is_power_of_two(config.queue_depth)) {
            throw core::ConfigError("file queue depth " + std::to_string(config.queue_depth)
                                    + " is not a power of two");
        }

        backend_ = Backend::SYNC;
#ifdef WRAITH_ENABLE_IO_URING
        if (!config.force_sync) {
            int ret = io_uring_queue_init(config.queue_depth, &ring_, 0);
            if (ret < 0) {
                WRAITH_WARN("FILEIO", "io_uring_queue_init failed (%s), using synchronous I/O", strerror(-ret));
            } else {
                backend_ = Backend::IO_URING;
            }
        }
#endif
        WRAITH_LOG("FILEIO", "File I/O context: %s backend, queue depth %u",
                   to_string(backend_), config.queue_depth);
    }

    ~FileIoContext() {
        try {
            close();
        } catch (const std::exception& e) {
            WRAITH_WARN("FILEIO", "close during destruction failed: %s", e.what());
        }
    }

    FileIoContext(const FileIoContext&) = delete;
    FileIoContext& operator=(const FileIoContext&) = delete;

    Backend backend() const { return backend_; }
    uint32_t queue_depth() const { return config_.queue_depth; }
    bool closed() const { return closed_; }

    // Submitted operations whose completion has not been consumed yet
    uint32_t outstanding() const {
        return static_cast<uint32_t>(pending_.size() + ready_.size());
    }

    // ========================================================================
    // Buffer table
    // ========================================================================

    /**
     * Allocate `count` page-aligned buffers of `size` bytes and register them
     * with io_uring. Registration refusal is not fatal: plain reads/writes
     * are used instead.
     *
     * @throws std::logic_error if called twice
     * @throws AllocError if the buffers cannot be mapped
     */
    void register_buffers(uint32_t count, uint32_t size) {
        if (buf_base_) {
            throw std::logic_error("FileIoContext: buffers already registered");
        }
        if (count == 0 || size == 0) {
            throw std::invalid_argument("FileIoContext: buffer count and size must be non-zero");
        }
        if (closed_) {
            throw std::logic_error("FileIoContext: closed");
        }

        size_t page = static_cast<size_t>(sysconf(_SC_PAGESIZE));
        buf_stride_ = (static_cast<size_t>(size) + page - 1) & ~(page - 1);
        buf_bytes_ = buf_stride_ * count;
        void* p = mmap(nullptr, buf_bytes_, PROT_READ | PROT_WRITE,
                       MAP_PRIVATE | MAP_ANONYMOUS | MAP_POPULATE, -1, 0);
        if (p == MAP_FAILED) {
            int err = errno;
            buf_bytes_ = 0;
            throw core::AllocError("FileIoContext: buffer mmap failed", err);
        }
        buf_base_ = static_cast<uint8_t*>(p);
        buf_count_ = count;
        buf_size_ = size;
        buf_held_.assign(count, false);
        free_buffers_.clear();
        for (uint32_t i = count; i > 0; i--) {
            free_buffers_.push_back(i - 1);
        }

#ifdef WRAITH_ENABLE_IO_URING
        if (backend_ == Backend::IO_URING) {
            std::vector<struct iovec> iovs(count);
            for (uint32_t i = 0; i < count; i++) {
                iovs[i].iov_base = buf_base_ + i * buf_stride_;
                iovs[i].iov_len = size;
            }
            int ret = io_uring_register_buffers(&ring_, iovs.data(), count);
            if (ret < 0) {
                WRAITH_WARN("FILEIO", "io_uring_register_buffers failed (%s), using non-fixed I/O",
                            strerror(-ret));
            } else {
                registered_ = true;
            }
        }
#endif
        WRAITH_LOG("FILEIO", "%u buffers x %u bytes%s", count, size, registered_ ? " [registered]" : "");
    }

    std::optional<uint32_t> acquire_buffer() {
        if (free_buffers_.empty()) return std::nullopt;
        uint32_t idx = free_buffers_.back();
        free_buffers_.pop_back();
        buf_held_[idx] = true;
        return idx;
    }

    /**
     * @throws std::out_of_range for an unknown index
     * @throws std::logic_error if the buffer is not held
     */
    void release_buffer(uint32_t index) {
        check_index(index);
        if (!buf_held_[index]) {
            throw std::logic_error("FileIoContext: buffer " + std::to_string(index) + " is not held");
        }
        buf_held_[index] = false;
        free_buffers_.push_back(index);
    }

    uint8_t* buffer(uint32_t index) {
        check_index(index);
        return buf_base_ + index * buf_stride_;
    }

    uint32_t buffer_count() const { return buf_count_; }
    uint32_t buffer_size() const { return buf_size_; }
    uint32_t free_buffer_count() const { return static_cast<uint32_t>(free_buffers_.size()); }
    bool buffers_registered() const { return registered_; }

    // ========================================================================
    // Submission
    // ========================================================================

    // Read into a table buffer (kept by the completion until release_buffer())
    SubmitResult submit_read(int fd, uint64_t offset, uint32_t length) {
        check_length(length);
        IoStatus st = admit();
        if (st != IoStatus::OK) return {st, 0};
        auto idx = acquire_buffer();
        if (!idx) return {IoStatus::NO_BUFFER, 0};
        return start(OpKind::READ, fd, offset, buffer(*idx), length, static_cast<int32_t>(*idx), true);
    }

    // Copy into a table buffer and write it
    SubmitResult submit_write(int fd, uint64_t offset, const void* data, uint32_t length) {
        check_length(length);
        IoStatus st = admit();
        if (st != IoStatus::OK) return {st, 0};
        auto idx = acquire_buffer();
        if (!idx) return {IoStatus::NO_BUFFER, 0};
        memcpy(buffer(*idx), data, length);
        return start(OpKind::WRITE, fd, offset, buffer(*idx), length, static_cast<int32_t>(*idx), true);
    }

    // Write a buffer the caller acquired and filled (zero-copy)
    SubmitResult submit_write_buffer(int fd, uint64_t offset, uint32_t index, uint32_t length) {
        check_index(index);
        check_length(length);
        if (!buf_held_[index]) {
            throw std::logic_error("FileIoContext: buffer " + std::to_string(index) + " is not held");
        }
        IoStatus st = admit();
        if (st != IoStatus::OK) return {st, 0};
        return start(OpKind::WRITE, fd, offset, buffer(index), length, static_cast<int32_t>(index));
    }

    // Read straight into caller memory; it must stay valid until completion
    SubmitResult submit_read_into(int fd, uint64_t offset, void* dest, uint32_t length) {
        IoStatus st = admit();
        if (st != IoStatus::OK) return {st, 0};
        return start(OpKind::READ, fd, offset, static_cast<uint8_t*>(dest), length, -1);
    }

    // Write straight from caller memory; it must stay valid until completion
    SubmitResult submit_write_from(int fd, uint64_t offset, const void* src, uint32_t length) {
        IoStatus st = admit();
        if (st != IoStatus::OK) return {st, 0};
        return start(OpKind::WRITE, fd, offset,
                     const_cast<uint8_t*>(static_cast<const uint8_t*>(src)), length, -1);
    }

    SubmitResult submit_fsync(int fd) {
        IoStatus st = admit();
        if (st != IoStatus::OK) return {st, 0};
        return start(OpKind::FSYNC, fd, 0, nullptr, 0, -1);
    }

    /**
     * Push prepared SQEs to the kernel
     * @return number submitted
     * @throws IoError if io_uring_submit fails
     */
    uint32_t submit() {
        int ret = try_submit();
        if (ret < 0) {
            throw core::IoError("io_uring_submit", -ret);
        }
        return static_cast<uint32_t>(ret);
    }

    // ========================================================================
    // Completion
    // ========================================================================

    // Never blocks
    std::vector<Completion> poll_completions() {
        std::vector<Completion> out;
        if (closed_) return out;
        submit();
        reap();
        drain_ready(out);
        return out;
    }

    /**
     * Block until at least min(n, outstanding) completions are available
     * @throws IoError if waiting on the completion queue fails
     */
    std::vector<Completion> wait_completions(uint32_t n) {
        std::vector<Completion> out;
        if (closed_) return out;
        uint32_t want = n < outstanding() ? n : outstanding();
        (void)want;
        submit();
        reap();
#ifdef WRAITH_ENABLE_IO_URING
        while (backend_ == Backend::IO_URING && ready_.size() < want) {
            struct io_uring_cqe* cqe = nullptr;
            int ret = io_uring_wait_cqe(&ring_, &cqe);
            if (ret == -EINTR) continue;
            if (ret < 0) {
                throw core::IoError("io_uring_wait_cqe", -ret);
            }
            reap();
        }
#endif
        drain_ready(out);
        return out;
    }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Cancel outstanding operations, wait for every remaining completion and
     * return them (unfinished ones carry -ECANCELED). Releases the buffer
     * table and the ring exactly once.
     */
    std::vector<Completion> close() {
        std::vector<Completion> out;
        if (closed_) return out;

#ifdef WRAITH_ENABLE_IO_URING
        if (backend_ == Backend::IO_URING) {
            cancel_all();
        }
#endif
        drain_ready(out);
        closed_ = true;

#ifdef WRAITH_ENABLE_IO_URING
        if (backend_ == Backend::IO_URING) {
            if (registered_) {
                io_uring_unregister_buffers(&ring_);
                registered_ = false;
            }
            io_uring_queue_exit(&ring_);
        }
#endif
        if (buf_base_) {
            // Table buffers go away with the context
            for (auto& c : out) {
                if (c.buffer_index >= 0) {
                    c.buffer_index = -1;
                    c.data = nullptr;
                }
            }
            munmap(buf_base_, buf_bytes_);
            buf_base_ = nullptr;
            buf_bytes_ = 0;
            buf_count_ = 0;
            buf_held_.clear();
            free_buffers_.clear();
        }
        WRAITH_LOG("FILEIO", "Closed (%zu final completions)", out.size());
        return out;
    }

private:
    struct PendingOp {
        OpKind kind;
        int fd;
        uint64_t offset;
        uint32_t length;
        int32_t buffer_index;
        uint8_t* data;
    };

    static constexpr uint64_t CANCEL_TAG = UINT64_MAX;

    IoStatus admit() const {
        if (closed_) return IoStatus::CLOSED;
        if (outstanding() >= config_.queue_depth) return IoStatus::QUEUE_FULL;
        return IoStatus::OK;
    }

    void check_index(uint32_t index) const {
        if (index >= buf_count_) {
            throw std::out_of_range("FileIoContext: buffer index " + std::to_string(index)
                                    + " out of range (" + std::to_string(buf_count_) + " buffers)");
        }
    }

    void check_length(uint32_t length) const {
        if (!buf_base_) {
            throw std::logic_error("FileIoContext: register_buffers() must be called first");
        }
        if (length > buf_size_) {
            throw std::invalid_argument("FileIoContext: length " + std::to_string(length)
                                        + " exceeds buffer size " + std::to_string(buf_size_));
        }
    }

    SubmitResult start(OpKind kind, int fd, uint64_t offset, uint8_t* data,
                       uint32_t length, int32_t buffer_index, bool acquired_here = false) {
        (void)acquired_here;
        OperationId id = next_id_++;
        PendingOp op{kind, fd, offset, length, buffer_index, data};

        if (backend_ == Backend::SYNC) {
            ready_.push_back(make_completion(id, op, run_sync(op)));
            return {IoStatus::OK, id};
        }

#ifdef WRAITH_ENABLE_IO_URING
        struct io_uring_sqe* sqe = nullptr;
        try {
            sqe = get_sqe();
        } catch (...) {
            if (acquired_here) release_buffer(static_cast<uint32_t>(buffer_index));
            throw;
        }
        if (!sqe) {
            if (acquired_here) release_buffer(static_cast<uint32_t>(buffer_index));
            return {IoStatus::QUEUE_FULL, 0};
        }
        bool fixed = registered_ && buffer_index >= 0;
        switch (kind) {
            case OpKind::READ:
                if (fixed) io_uring_prep_read_fixed(sqe, fd, data, length, offset, buffer_index);
                else io_uring_prep_read(sqe, fd, data, length, offset);
                break;
            case OpKind::WRITE:
                if (fixed) io_uring_prep_write_fixed(sqe, fd, data, length, offset, buffer_index);
                else io_uring_prep_write(sqe, fd, data, length, offset);
                break;
            case OpKind::FSYNC:
                io_uring_prep_fsync(sqe, fd, IORING_FSYNC_DATASYNC);
                break;
        }
        sqe->user_data = id;
        unsubmitted_++;
        pending_.emplace(id, op);
#endif
        return {IoStatus::OK, id};
    }

    static int32_t run_sync(const PendingOp& op) {
        ssize_t ret;
        switch (op.kind) {
            case OpKind::READ:
                do { ret = pread(op.fd, op.data, op.length, static_cast<off_t>(op.offset)); }
                while (ret < 0 && errno == EINTR);
                return ret < 0 ? -errno : static_cast<int32_t>(ret);
            case OpKind::WRITE:
                do { ret = pwrite(op.fd, op.data, op.length, static_cast<off_t>(op.offset)); }
                while (ret < 0 && errno == EINTR);
                return ret < 0 ? -errno : static_cast<int32_t>(ret);
            case OpKind::FSYNC:
                return fdatasync(op.fd) < 0 ? -errno : 0;
        }
        return -EINVAL;
    }

    Completion make_completion(OperationId id, const PendingOp& op, int32_t result) {
        Completion c;
        c.id = id;
        c.kind = op.kind;
        c.result = result;
        c.requested = op.length;
        c.offset = op.offset;
        c.buffer_index = op.buffer_index;
        c.data = op.kind == OpKind::READ ? op.data : nullptr;
        // A finished write gives its table buffer back
        if (op.kind == OpKind::WRITE && op.buffer_index >= 0) {
            release_buffer(static_cast<uint32_t>(op.buffer_index));
            c.buffer_index = -1;
        }
        return c;
    }

    // Push prepared SQEs; count submitted or negated errno
    int try_submit() {
#ifdef WRAITH_ENABLE_IO_URING
        if (backend_ == Backend::IO_URING && unsubmitted_ > 0) {
            int ret = io_uring_submit(&ring_);
            if (ret < 0) return ret;
            unsubmitted_ = 0;
            return ret;
        }
#endif
        return 0;
    }

    void drain_ready(std::vector<Completion>& out) {
        out.reserve(out.size() + ready_.size());
        while (!ready_.empty()) {
            out.push_back(ready_.front());
            ready_.pop_front();
        }
    }

#ifdef WRAITH_ENABLE_IO_URING
    struct io_uring_sqe* get_sqe() {
        struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
        if (!sqe && unsubmitted_ > 0) {
            submit();
            sqe = io_uring_get_sqe(&ring_);
        }
        return sqe;
    }

    // Close path: an SQ slot without ever throwing
    struct io_uring_sqe* get_sqe_quiet() {
        struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
        if (!sqe && unsubmitted_ > 0 && try_submit() >= 0) {
            sqe = io_uring_get_sqe(&ring_);
        }
        return sqe;
    }

    // Report everything still pending as cancelled
    void abandon_pending() {
        for (const auto& entry : pending_) {
            ready_.push_back(make_completion(entry.first, entry.second, -ECANCELED));
        }
        pending_.clear();
    }

    // Move every available CQE to ready_
    void reap() {
        if (backend_ != Backend::IO_URING) return;
        struct io_uring_cqe* cqe = nullptr;
        while (io_uring_peek_cqe(&ring_, &cqe) == 0 && cqe) {
            uint64_t id = cqe->user_data;
            int32_t res = cqe->res;
            io_uring_cqe_seen(&ring_, cqe);
            if (id == CANCEL_TAG) continue;

            auto it = pending_.find(id);
            if (it == pending_.end()) continue;
            ready_.push_back(make_completion(id, it->second, res));
            pending_.erase(it);
        }
    }

    // Async-cancel everything in flight and wait until each op has completed
    void cancel_all() {
        int ret = try_submit();
        if (ret < 0) {
            // Never reached the kernel: nothing to wait for
            WRAITH_WARN("FILEIO", "io_uring_submit during close: %s", strerror(-ret));
            abandon_pending();
            return;
        }
        reap();
        if (pending_.empty()) return;

        for (const auto& entry : pending_) {
            struct io_uring_sqe* sqe = get_sqe_quiet();
            if (!sqe) break;
            io_uring_prep_cancel(sqe, reinterpret_cast<void*>(static_cast<uintptr_t>(entry.first)), 0);
            sqe->user_data = CANCEL_TAG;
            unsubmitted_++;
        }
        ret = try_submit();
        if (ret < 0) {
            WRAITH_WARN("FILEIO", "io_uring_submit during close: %s", strerror(-ret));
            abandon_pending();
            return;
        }
        WRAITH_LOG("FILEIO", "Cancelling %zu outstanding operations", pending_.size());

        while (!pending_.empty()) {
            struct io_uring_cqe* cqe = nullptr;
            int ret = io_uring_wait_cqe(&ring_, &cqe);
            if (ret == -EINTR) continue;
            if (ret < 0) {
                // Ring unusable: report what is left as cancelled
                WRAITH_WARN("FILEIO", "io_uring_wait_cqe during close: %s", strerror(-ret));
                abandon_pending();
                break;
            }
            reap();
        }
    }

    struct io_uring ring_;
#else
    void reap() {}
#endif

    FileIoConfig config_;
    Backend backend_ = Backend::SYNC;
    bool closed_ = false;
    OperationId next_id_ = 1;
    uint32_t unsubmitted_ = 0;

    std::unordered_map<OperationId, PendingOp> pending_;    // Submitted, not completed
    std::deque<Completion> ready_;                          // Completed, not consumed

    uint8_t* buf_base_ = nullptr;
    size_t buf_bytes_ = 0;
    size_t buf_stride_ = 0;
    uint32_t buf_count_ = 0;
    uint32_t buf_size_ = 0;
    bool registered_ = false;
    std::vector<bool> buf_held_;
    std::vector<uint32_t> free_buffers_;
};

}  // namespace wraith::fileio
