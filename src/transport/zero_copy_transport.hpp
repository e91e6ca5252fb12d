// transport/zero_copy_transport.hpp
// Packet socket + file engine for a file-transfer pipeline
//
// ZeroCopyTransport<Driver> pairs one XskSocket<Driver> with one
// FileIoContext and exposes the boundary the protocol layer uses:
//
//   send() / receive_batch()               opaque datagrams (copy in / copy out)
//   read_chunk() / write_chunk()           file byte ranges (partial I/O resubmitted)
//   send_file_chunk() / receive_to_file()  file <-> UMEM frames with no
//                                          intermediate buffer
//
// Framing, sequencing and encryption live above this layer; payloads are
// opaque bytes here. A BindError from open() means kernel bypass is not
// available and the caller should use a conventional socket instead.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../core/error.hpp"
#include "../core/log.hpp"
#include "../fileio/file_io_context.hpp"
#include "../xdp/umem.hpp"
#include "../xdp/xsk_socket.hpp"
#include "transport_config.hpp"

namespace wraith::transport {

enum class TransportStatus : uint8_t {
    OK = 0,
    POOL_EXHAUSTED = 1,     // No free frame, retry after completions
    RING_FULL = 2,          // TX ring full, retry later
    TOO_LARGE = 3,          // Payload exceeds one frame
    CLOSED = 4
};

inline const char* to_string(TransportStatus s) {
    switch (s) {
        case TransportStatus::OK:             return "OK";
        case TransportStatus::POOL_EXHAUSTED: return "POOL_EXHAUSTED";
        case TransportStatus::RING_FULL:      return "RING_FULL";
        case TransportStatus::TOO_LARGE:      return "TOO_LARGE";
        case TransportStatus::CLOSED:         return "CLOSED";
    }
    return "UNKNOWN";
}

template<xdp::XskDriverConcept Driver>
class ZeroCopyTransport {
public:
    // Milliseconds send_file_chunk() waits for TX completions before giving up
    static constexpr int TX_BACKPRESSURE_WAIT_MS = 100;

    template<typename... Args>
    explicit ZeroCopyTransport(const TransportConfig& config, Args&&... driver_args)
        : config_(config)
        , socket_(std::forward<Args>(driver_args)...)
        , files_(config.file) {}

    ~ZeroCopyTransport() { close(); }

    ZeroCopyTransport(const ZeroCopyTransport&) = delete;
    ZeroCopyTransport& operator=(const ZeroCopyTransport&) = delete;

    /**
     * Set up the buffer table, create the pool (or share `umem`) and bind
     *
     * @throws ConfigError / AllocError / BindError from the layers below
     */
    void open(std::shared_ptr<xdp::Umem> umem = nullptr) {
        if (files_.buffer_count() == 0) {
            files_.register_buffers(config_.file_buffers, config_.file_buffer_size);
        }
        if (!umem) {
            umem = xdp::Umem::create(config_.umem);
        }
        socket_.bind(config_.interface, config_.queue_id, umem, config_.socket);
        WRAITH_LOG("XSK", "Transport open on %s queue %u (%s, file I/O %s)",
                   config_.interface.c_str(), config_.queue_id, xdp::to_string(socket_.mode()),
                   fileio::to_string(files_.backend()));
    }

    // ========================================================================
    // Datagrams
    // ========================================================================

    TransportStatus send(const void* data, uint32_t len) {
        if (!socket_.bound()) return TransportStatus::CLOSED;
        if (len == 0) {
            throw std::invalid_argument("ZeroCopyTransport: empty payload");
        }
        if (len > socket_.payload_capacity()) return TransportStatus::TOO_LARGE;

        switch (socket_.send(data, len)) {
            case core::TxStatus::SUBMITTED:      return TransportStatus::OK;
            case core::TxStatus::POOL_EXHAUSTED: return TransportStatus::POOL_EXHAUSTED;
            case core::TxStatus::RING_FULL:      return TransportStatus::RING_FULL;
            case core::TxStatus::INVALID:        return TransportStatus::TOO_LARGE;
            case core::TxStatus::CLOSED:         return TransportStatus::CLOSED;
        }
        return TransportStatus::CLOSED;
    }

    // Copy out up to max payloads and hand their frames back to FILL
    std::vector<std::vector<uint8_t>> receive_batch(uint32_t max) {
        std::vector<std::vector<uint8_t>> out;
        if (!socket_.bound()) return out;

        auto packets = socket_.rx_batch(max);
        out.reserve(packets.size());
        for (const auto& pkt : packets) {
            out.emplace_back(pkt.data, pkt.data + pkt.len);
            recycle(pkt.frame);
        }
        return out;
    }

    // ========================================================================
    // File ranges
    // ========================================================================

    /**
     * Read [offset, offset+len), resubmitting partial reads; stops early at EOF
     * @throws IoError on a failed read
     */
    std::vector<uint8_t> read_chunk(int fd, uint64_t offset, uint32_t len) {
        std::vector<uint8_t> out;
        out.reserve(len);
        uint64_t pos = offset;
        uint32_t left = len;

        while (left > 0) {
            uint32_t n = left < files_.buffer_size() ? left : files_.buffer_size();
            fileio::SubmitResult r = submit_retry("read_chunk", [&] {
                return files_.submit_read(fd, pos, n);
            });
            fileio::Completion c = await(r.id);
            if (c.result < 0) {
                files_.release_buffer(static_cast<uint32_t>(c.buffer_index));
                throw core::IoError("read_chunk at offset " + std::to_string(pos), -c.result);
            }
            out.insert(out.end(), c.data, c.data + c.result);
            files_.release_buffer(static_cast<uint32_t>(c.buffer_index));
            if (c.result == 0) break;   // EOF

            pos += static_cast<uint32_t>(c.result);
            left -= static_cast<uint32_t>(c.result);
        }
        return out;
    }

    /**
     * Write all of data at offset, resubmitting partial writes
     * @throws IoError on a failed write
     */
    void write_chunk(int fd, uint64_t offset, const void* data, uint32_t len) {
        const uint8_t* src = static_cast<const uint8_t*>(data);
        uint32_t done = 0;
        while (done < len) {
            uint32_t left = len - done;
            uint32_t n = left < files_.buffer_size() ? left : files_.buffer_size();
            fileio::SubmitResult r = submit_retry("write_chunk", [&] {
                return files_.submit_write(fd, offset + done, src + done, n);
            });
            fileio::Completion c = await(r.id);
            check_write(c, "write_chunk", offset + done);
            done += static_cast<uint32_t>(c.result);
        }
    }

    // ========================================================================
    // File <-> frames
    // ========================================================================

    /**
     * Read [offset, offset+len) straight into UMEM frames and transmit them
     * as payloads of at most mtu bytes
     *
     * @return bytes transmitted (short at EOF or when the pool stays exhausted)
     * @throws IoError on a failed read
     */
    uint64_t send_file_chunk(int fd, uint64_t offset, uint64_t len, uint32_t mtu) {
        if (!socket_.bound()) return 0;
        if (mtu == 0 || mtu > socket_.payload_capacity()) {
            throw std::invalid_argument("send_file_chunk: mtu " + std::to_string(mtu)
                                        + " outside (0, " + std::to_string(socket_.payload_capacity()) + "]");
        }

        uint64_t sent = 0;
        bool waited = false;
        while (sent < len) {
            auto frame = socket_.alloc_frame();
            if (!frame) {
                if (waited) break;
                socket_.wait_completions(1, TX_BACKPRESSURE_WAIT_MS);
                waited = true;
                continue;
            }

            uint64_t left = len - sent;
            uint32_t n = left < mtu ? static_cast<uint32_t>(left) : mtu;
            xdp::FrameRef payload = socket_.payload(*frame);
            fileio::Completion c;
            try {
                fileio::SubmitResult r = submit_retry("send_file_chunk", [&] {
                    return files_.submit_read_into(fd, offset + sent, payload.data, n);
                });
                c = await(r.id);
            } catch (...) {
                socket_.free_frame(*frame);
                throw;
            }
            if (c.result <= 0) {
                socket_.free_frame(*frame);
                if (c.result == 0) break;   // EOF
                throw core::IoError("send_file_chunk at offset " + std::to_string(offset + sent), -c.result);
            }

            core::TxStatus st = socket_.tx(*frame, static_cast<uint32_t>(c.result));
            if (st != core::TxStatus::SUBMITTED) {
                socket_.free_frame(*frame);
                if (st != core::TxStatus::RING_FULL || waited) break;
                socket_.wait_completions(1, TX_BACKPRESSURE_WAIT_MS);
                waited = true;
                continue;
            }
            waited = false;
            sent += static_cast<uint32_t>(c.result);
        }
        return sent;
    }

    /**
     * Write up to max received payloads to fd starting at `offset`, straight
     * from their frames; advances `offset` past what was written
     *
     * @return number of packets written
     * @throws IoError on a failed write (frames are recycled first, on any error)
     */
    uint32_t receive_to_file(int fd, uint64_t& offset, uint32_t max) {
        if (!socket_.bound()) return 0;
        auto packets = socket_.rx_batch(max);
        if (packets.empty()) return 0;

        struct PendingWrite {
            fileio::OperationId id;
            uint64_t offset;
            size_t packet;
        };
        std::vector<PendingWrite> writes;
        writes.reserve(packets.size());

        uint64_t pos = offset;
        size_t next = 0;
        try {
            for (size_t i = 0; i < packets.size(); i++) {
                const auto& pkt = packets[i];
                fileio::SubmitResult r = submit_retry("receive_to_file", [&] {
                    return files_.submit_write_from(fd, pos, pkt.data, pkt.len);
                });
                writes.push_back({r.id, pos, i});
                pos += pkt.len;
            }
            while (next < writes.size()) {
                const PendingWrite& w = writes[next++];
                const auto& pkt = packets[w.packet];
                fileio::Completion c = await(w.id);
                check_write(c, "receive_to_file", w.offset);
                if (static_cast<uint32_t>(c.result) < pkt.len) {
                    write_from_all(fd, w.offset + c.result, pkt.data + c.result,
                                   pkt.len - static_cast<uint32_t>(c.result));
                }
            }
        } catch (...) {
            // Writes still in flight read from these frames
            for (size_t j = next; j < writes.size(); j++) {
                settle(writes[j].id);
            }
            for (const auto& pkt : packets) recycle(pkt.frame);
            throw;
        }

        for (const auto& pkt : packets) recycle(pkt.frame);
        offset = pos;
        return static_cast<uint32_t>(packets.size());
    }

    // ========================================================================
    // Lifecycle / accessors
    // ========================================================================

    // Completions that arrived while waiting for something else
    std::vector<fileio::Completion> drain_deferred() {
        std::vector<fileio::Completion> out;
        out.swap(deferred_);
        return out;
    }

    /**
     * Close socket and file engine
     * @return final file completions (including deferred ones)
     */
    std::vector<fileio::Completion> close() {
        std::vector<fileio::Completion> out = drain_deferred();
        socket_.close();
        if (!files_.closed()) {
            auto final_completions = files_.close();
            out.insert(out.end(), final_completions.begin(), final_completions.end());
        }
        return out;
    }

    xdp::XskSocket<Driver>& socket() { return socket_; }
    fileio::FileIoContext& files() { return files_; }
    const TransportConfig& config() const { return config_; }

private:
    // Frame back to FILL, or to the allocator when FILL has no slot
    void recycle(uint64_t frame) {
        if (socket_.refill(frame) != core::RingStatus::OK) {
            socket_.free_frame(frame);
        }
    }

    // QUEUE_FULL / NO_BUFFER: collect a completion to make room, then retry
    template<typename SubmitFn>
    fileio::SubmitResult submit_retry(const char* what, SubmitFn&& submit) {
        while (true) {
            fileio::SubmitResult r = submit();
            if (r.ok()) return r;
            if (r.status == fileio::IoStatus::CLOSED) {
                throw core::IoError(std::string(what) + ": file engine closed", ESHUTDOWN);
            }
            if (files_.outstanding() == 0) {
                throw core::IoError(std::string(what) + ": " + fileio::to_string(r.status),
                                    r.status == fileio::IoStatus::NO_BUFFER ? ENOBUFS : EAGAIN);
            }
            absorb(files_.wait_completions(1));
        }
    }

    // Wait for one specific operation; other completions are deferred
    fileio::Completion await(fileio::OperationId id) {
        while (true) {
            for (auto it = deferred_.begin(); it != deferred_.end(); ++it) {
                if (it->id == id) {
                    fileio::Completion c = *it;
                    deferred_.erase(it);
                    return c;
                }
            }
            if (files_.outstanding() == 0) {
                throw std::logic_error("ZeroCopyTransport: no outstanding operation " + std::to_string(id));
            }
            absorb(files_.wait_completions(1));
        }
    }

    // Error path: collect one operation, logging instead of raising a second error
    void settle(fileio::OperationId id) noexcept {
        try {
            await(id);
        } catch (const std::exception& e) {
            WRAITH_WARN("TRANSPORT", "operation %lu not collected: %s", (unsigned long)id, e.what());
        }
    }

    void absorb(std::vector<fileio::Completion>&& completions) {
        for (auto& c : completions) {
            deferred_.push_back(c);
        }
    }

    static void check_write(const fileio::Completion& c, const char* what, uint64_t offset) {
        if (c.result < 0) {
            throw core::IoError(std::string(what) + " at offset " + std::to_string(offset), -c.result);
        }
        if (c.result == 0 && c.requested > 0) {
            throw core::IoError(std::string(what) + ": zero-byte write at offset " + std::to_string(offset), EIO);
        }
    }

    // Finish a partial write from caller memory
    void write_from_all(int fd, uint64_t offset, const uint8_t* src, uint32_t len) {
        while (len > 0) {
            fileio::SubmitResult r = submit_retry("receive_to_file", [&] {
                return files_.submit_write_from(fd, offset, src, len);
            });
            fileio::Completion c = await(r.id);
            check_write(c, "receive_to_file", offset);
            offset += static_cast<uint32_t>(c.result);
            src += c.result;
            len -= static_cast<uint32_t>(c.result);
        }
    }

    TransportConfig config_;
    xdp::XskSocket<Driver> socket_;
    fileio::FileIoContext files_;
    std::vector<fileio::Completion> deferred_;
};

}  // namespace wraith::transport
