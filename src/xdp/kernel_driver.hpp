// xdp/kernel_driver.hpp
// AF_XDP kernel driver policy (libxdp / libbpf)
//
// Binds an XskSocket to a real NIC queue:
//   - xsk_umem__create() registers the pool once; the handle and the primary
//     FILL/COMPLETION pair live in the Umem's registration slot
//   - xsk_socket__create() for the first socket on the pool,
//     xsk_socket__create_shared() (own FILL/COMPLETION) for the others
//   - ring views are built over the kernel-mapped producer/consumer/flags/desc
//     pointers, so the hot path never calls into libxdp
//   - kick_tx() = sendto(MSG_DONTWAIT), wakeup_rx() = recvfrom(MSG_DONTWAIT),
//     wait() = poll()
//
// Requirements:
//   - Linux kernel 5.4+ (need_wakeup), libxdp, libbpf
//   - CAP_NET_RAW + CAP_BPF (or root) and an XDP-capable NIC for zero-copy
//
// Without WRAITH_USE_XDP a stub is compiled whose bind() reports
// -EOPNOTSUPP, so negotiation ends in FAILED and the caller falls back.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

#ifdef WRAITH_USE_XDP
#include <linux/if_xdp.h>
#include <linux/if_link.h>
#include <xdp/xsk.h>
#include <net/if.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include "redirect_program.hpp"
#endif

#include "../core/log.hpp"
#include "xsk_driver.hpp"

namespace wraith::xdp {

struct KernelDriverOptions {
    uint32_t busy_poll_usec;        // SO_BUSY_POLL duration, 0 = disabled
    uint32_t busy_poll_budget;      // SO_BUSY_POLL_BUDGET packets per poll
    std::string redirect_program;   // XDP object with an XSKMAP, empty = libxdp default program
    bool skb_mode;                  // Attach the redirect program in generic mode only

    KernelDriverOptions()
        : busy_poll_usec(0)
        , busy_poll_budget(64)
        , skb_mode(false)
    {}
};

#ifdef WRAITH_USE_XDP

/**
 * libxdp state for one pool: UMEM handle plus the primary FILL/COMPLETION pair
 */
struct KernelUmemState {
    struct xsk_umem* umem = nullptr;
    struct xsk_ring_prod fill;
    struct xsk_ring_cons comp;

    KernelUmemState() {
        memset(&fill, 0, sizeof(fill));
        memset(&comp, 0, sizeof(comp));
    }

    ~KernelUmemState() {
        if (umem) {
            xsk_umem__delete(umem);
            umem = nullptr;
        }
    }
};

class KernelXskDriver {
public:
    static constexpr const char* REGISTRATION_TAG = "kernel";

    KernelXskDriver() = default;
    explicit KernelXskDriver(const KernelDriverOptions& options) : options_(options) {}

    ~KernelXskDriver() { unbind(); }

    KernelXskDriver(const KernelXskDriver&) = delete;
    KernelXskDriver& operator=(const KernelXskDriver&) = delete;

    const char* name() const { return "af_xdp"; }

    int bind(const BindRequest& req, BindMode mode, XskRings& rings) {
        if (xsk_) return -EALREADY;

        ifindex_ = if_nametoindex(req.interface.c_str());
        if (ifindex_ == 0) {
            return -ENODEV;
        }

        int ret = ensure_umem(req);
        if (ret) return ret;

        if (!options_.redirect_program.empty() && !redirect_) {
            redirect_ = std::make_unique<RedirectProgram>();
            try {
                redirect_->load(req.interface, options_.redirect_program);
                redirect_->attach(options_.skb_mode);
            } catch (const std::runtime_error& e) {
                WRAITH_WARN("XSK", "%s", e.what());
                redirect_.reset();
                return -EINVAL;
            }
        }

        struct xsk_socket_config cfg;
        memset(&cfg, 0, sizeof(cfg));
        cfg.rx_size = req.rx_ring_size;
        cfg.tx_size = req.tx_ring_size;
        cfg.bind_flags = (mode == BindMode::ZERO_COPY ? XDP_ZEROCOPY : XDP_COPY) | XDP_USE_NEED_WAKEUP;
        if (redirect_) {
            cfg.libbpf_flags = XSK_LIBBPF_FLAGS__INHIBIT_PROG_LOAD;
            cfg.xdp_flags = 0;
        } else {
            cfg.libbpf_flags = 0;
            cfg.xdp_flags = XDP_FLAGS_UPDATE_IF_NOEXIST;
        }

        memset(&rx_, 0, sizeof(rx_));
        memset(&tx_, 0, sizeof(tx_));
        memset(&own_fill_, 0, sizeof(own_fill_));
        memset(&own_comp_, 0, sizeof(own_comp_));

        struct xsk_ring_prod* fill;
        struct xsk_ring_cons* comp;
        if (req.primary) {
            ret = xsk_socket__create(&xsk_, req.interface.c_str(), req.queue_id,
                                     state_->umem, &rx_, &tx_, &cfg);
            fill = &state_->fill;
            comp = &state_->comp;
        } else {
            ret = xsk_socket__create_shared(&xsk_, req.interface.c_str(), req.queue_id,
                                            state_->umem, &rx_, &tx_, &own_fill_, &own_comp_, &cfg);
            fill = &own_fill_;
            comp = &own_comp_;
        }
        if (ret) {
            xsk_ = nullptr;
            WRAITH_LOG("XSK", "%s mode bind on %s queue %u failed: %s",
                       to_string(mode), req.interface.c_str(), req.queue_id, strerror(-ret));
            discard_pool_if_sole(req);
            return ret;
        }

        if (redirect_) {
            ret = redirect_->register_socket(xsk_);
            if (ret) {
                xsk_socket__delete(xsk_);
                xsk_ = nullptr;
                discard_pool_if_sole(req);
                return ret;
            }
        }

        apply_busy_poll();

        rings.rx = core::SpscRing<core::RxDesc>(rx_.producer, rx_.consumer, rx_.flags,
                                                static_cast<core::RxDesc*>(rx_.ring), rx_.size);
        rings.tx = core::SpscRing<core::TxDesc>(tx_.producer, tx_.consumer, tx_.flags,
                                                static_cast<core::TxDesc*>(tx_.ring), tx_.size);
        rings.fill = core::SpscRing<core::FillDesc>(fill->producer, fill->consumer, fill->flags,
                                                    static_cast<core::FillDesc*>(fill->ring), fill->size);
        rings.comp = core::SpscRing<core::CompletionDesc>(comp->producer, comp->consumer, comp->flags,
                                                          static_cast<core::CompletionDesc*>(comp->ring), comp->size);

        WRAITH_LOG("XSK", "AF_XDP socket fd %d on %s (ifindex %u) queue %u, %s",
                   xsk_socket__fd(xsk_), req.interface.c_str(), ifindex_, req.queue_id,
                   req.primary ? "primary fill/comp" : "shared umem");
        return 0;
    }

    void unbind() {
        if (xsk_) {
            xsk_socket__delete(xsk_);
            xsk_ = nullptr;
        }
        redirect_.reset();
        release_pool();
    }

    int kick_tx() {
        if (!xsk_) return -ENOTCONN;
        if (sendto(xsk_socket__fd(xsk_), nullptr, 0, MSG_DONTWAIT, nullptr, 0) < 0) {
            // Transient: the kernel is already busy with the TX ring
            if (errno == EAGAIN || errno == EBUSY || errno == ENOBUFS || errno == ENETDOWN) {
                return 0;
            }
            return -errno;
        }
        return 0;
    }

    int wakeup_rx() {
        if (!xsk_) return -ENOTCONN;
        if (recvfrom(xsk_socket__fd(xsk_), nullptr, 0, MSG_DONTWAIT, nullptr, nullptr) < 0) {
            if (errno == EAGAIN || errno == EBUSY || errno == ENETDOWN) {
                return 0;
            }
            return -errno;
        }
        return 0;
    }

    int wait(int timeout_ms) {
        if (!xsk_) return -ENOTCONN;
        struct pollfd pfd;
        pfd.fd = xsk_socket__fd(xsk_);
        pfd.events = POLLIN | POLLOUT;
        pfd.revents = 0;
        int ret = poll(&pfd, 1, timeout_ms);
        return ret < 0 ? -errno : ret;
    }

    int fd() const { return xsk_ ? xsk_socket__fd(xsk_) : -1; }

    const KernelDriverOptions& options() const { return options_; }

private:
    // Register the pool with the kernel once; every binding keeps a reference
    int ensure_umem(const BindRequest& req) {
        if (state_) return 0;

        auto existing = req.umem->registration(REGISTRATION_TAG);
        if (existing) {
            state_ = std::static_pointer_cast<KernelUmemState>(existing);
            return 0;
        }

        auto state = std::make_shared<KernelUmemState>();
        struct xsk_umem_config cfg;
        memset(&cfg, 0, sizeof(cfg));
        cfg.fill_size = req.umem->config().fill_ring_size;
        cfg.comp_size = req.umem->config().comp_ring_size;
        cfg.frame_size = req.umem->frame_size();
        cfg.frame_headroom = req.umem->headroom();
        cfg.flags = 0;

        int ret = xsk_umem__create(&state->umem, req.umem->area(), req.umem->size(),
                                   &state->fill, &state->comp, &cfg);
        if (ret) {
            state->umem = nullptr;
            WRAITH_WARN("XSK", "xsk_umem__create failed: %s", strerror(-ret));
            return ret;
        }
        req.umem->set_registration(REGISTRATION_TAG, state);
        state_ = std::move(state);
        return 0;
    }

    void release_pool() {
        state_.reset();
    }

    // A failed create leaves libxdp's UMEM fd closed when no other socket used
    // it. Delete the UMEM so the next attempt registers the pool again.
    void discard_pool_if_sole(const BindRequest& req) {
        if (req.umem->bindings() <= 1) {
            req.umem->drop_registration(REGISTRATION_TAG);
        }
        release_pool();
    }

    void apply_busy_poll() {
        if (options_.busy_poll_usec == 0) return;
        int fd = xsk_socket__fd(xsk_);
        int prefer = 1;
        int usec = static_cast<int>(options_.busy_poll_usec);
        int budget = static_cast<int>(options_.busy_poll_budget);
        if (setsockopt(fd, SOL_SOCKET, SO_PREFER_BUSY_POLL, &prefer, sizeof(prefer)) < 0
            || setsockopt(fd, SOL_SOCKET, SO_BUSY_POLL_BUDGET, &budget, sizeof(budget)) < 0
            || setsockopt(fd, SOL_SOCKET, SO_BUSY_POLL, &usec, sizeof(usec)) < 0) {
            WRAITH_WARN("XSK", "SO_BUSY_POLL not applied: %s", strerror(errno));
            return;
        }
        WRAITH_LOG("XSK", "SO_BUSY_POLL=%d us, budget=%d", usec, budget);
    }

    KernelDriverOptions options_;
    struct xsk_socket* xsk_ = nullptr;
    struct xsk_ring_cons rx_;
    struct xsk_ring_prod tx_;
    struct xsk_ring_prod own_fill_;     // Shared-mode FILL ring
    struct xsk_ring_cons own_comp_;     // Shared-mode COMPLETION ring
    std::shared_ptr<KernelUmemState> state_;
    std::unique_ptr<RedirectProgram> redirect_;
    unsigned int ifindex_ = 0;
};

#else  // !WRAITH_USE_XDP

// Stub: AF_XDP not compiled in, every bind attempt is unsupported
class KernelXskDriver {
public:
    KernelXskDriver() = default;
    explicit KernelXskDriver(const KernelDriverOptions& options) : options_(options) {}

    const char* name() const { return "af_xdp (not compiled)"; }

    int bind(const BindRequest& req, BindMode mode, XskRings&) {
        (void)req;
        (void)mode;
        WRAITH_LOG("XSK", "AF_XDP support not compiled, %s bind on %s refused. Build with WRAITH_WITH_XDP=ON",
                   to_string(mode), req.interface.c_str());
        return -EOPNOTSUPP;
    }

    void unbind() {}
    int kick_tx() { return -EOPNOTSUPP; }
    int wakeup_rx() { return -EOPNOTSUPP; }
    int wait(int) { return -EOPNOTSUPP; }
    int fd() const { return -1; }

    const KernelDriverOptions& options() const { return options_; }

private:
    KernelDriverOptions options_;
};

#endif  // WRAITH_USE_XDP

static_assert(XskDriverConcept<KernelXskDriver>, "KernelXskDriver must satisfy XskDriverConcept");

}  // namespace wraith::xdp
