// xdp/redirect_program.hpp
// XDP redirect program loader (libbpf)
//
// Loads an XDP object file whose program redirects a queue's packets into an
// XSKMAP, attaches it to the interface and registers AF_XDP sockets in the
// map. The program itself is supplied by the deployment; only its map name
// ("xsks_map" by default) is assumed here.
//
// Only available with WRAITH_USE_XDP.

#pragma once

#ifdef WRAITH_USE_XDP

#include <bpf/libbpf.h>
#include <bpf/bpf.h>
#include <linux/if_link.h>
#include <net/if.h>
#include <xdp/xsk.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include "../core/log.hpp"

namespace wraith::xdp {

class RedirectProgram {
public:
    RedirectProgram() = default;

    ~RedirectProgram() {
        detach();
        if (obj_) {
            bpf_object__close(obj_);
            obj_ = nullptr;
        }
    }

    RedirectProgram(const RedirectProgram&) = delete;
    RedirectProgram& operator=(const RedirectProgram&) = delete;

    /**
     * Open and load the object file
     *
     * @param interface  Interface the program will be attached to
     * @param path       BPF object file
     * @param prog_name  Program section name, nullptr for the first program
     * @param map_name   XSKMAP name
     * @throws std::runtime_error on failure
     */
    void load(const std::string& interface, const std::string& path,
              const char* prog_name = nullptr, const char* map_name = "xsks_map") {
        interface_ = interface;
        ifindex_ = static_cast<int>(if_nametoindex(interface.c_str()));
        if (ifindex_ == 0) {
            throw std::runtime_error("RedirectProgram: Interface not found: " + interface);
        }

        WRAITH_LOG("BPF", "Loading redirect program from: %s", path.c_str());

        obj_ = bpf_object__open_file(path.c_str(), nullptr);
        if (libbpf_get_error(obj_)) {
            obj_ = nullptr;
            throw std::runtime_error("RedirectProgram: Failed to open BPF object file " + path);
        }

        prog_ = prog_name ? bpf_object__find_program_by_name(obj_, prog_name)
                          : bpf_object__next_program(obj_, nullptr);
        if (!prog_) {
            bpf_object__close(obj_);
            obj_ = nullptr;
            throw std::runtime_error("RedirectProgram: No XDP program in " + path);
        }

        if (bpf_object__load(obj_)) {
            bpf_object__close(obj_);
            obj_ = nullptr;
            throw std::runtime_error("RedirectProgram: Failed to load BPF program into kernel");
        }

        prog_fd_ = bpf_program__fd(prog_);
        xsks_map_fd_ = bpf_object__find_map_fd_by_name(obj_, map_name);
        if (prog_fd_ < 0 || xsks_map_fd_ < 0) {
            bpf_object__close(obj_);
            obj_ = nullptr;
            throw std::runtime_error(std::string("RedirectProgram: Missing program fd or map '") + map_name + "'");
        }

        WRAITH_LOG("BPF", "Program loaded (prog fd %d, xsks map fd %d)", prog_fd_, xsks_map_fd_);
    }

    /**
     * Attach to the interface, native driver mode first, generic (SKB) mode
     * as fallback unless skb_only is set
     */
    void attach(bool skb_only = false) {
        if (prog_fd_ < 0) {
            throw std::runtime_error("RedirectProgram: Program not loaded");
        }
        if (attached_) return;

        uint32_t flags = skb_only ? XDP_FLAGS_SKB_MODE : XDP_FLAGS_DRV_MODE;
        int ret = bpf_xdp_attach(ifindex_, prog_fd_, flags, nullptr);
        if (ret < 0 && !skb_only) {
            WRAITH_LOG("BPF", "Native mode failed (%s), trying SKB mode...", strerror(-ret));
            flags = XDP_FLAGS_SKB_MODE;
            ret = bpf_xdp_attach(ifindex_, prog_fd_, flags, nullptr);
        }
        if (ret < 0) {
            throw std::runtime_error(std::string("RedirectProgram: Failed to attach XDP program: ") + strerror(-ret));
        }

        xdp_flags_ = flags;
        attached_ = true;
        WRAITH_LOG("BPF", "Program attached to %s (%s mode)", interface_.c_str(),
                   flags == XDP_FLAGS_SKB_MODE ? "skb" : "driver");
    }

    void detach() {
        if (!attached_) return;
        bpf_xdp_detach(ifindex_, xdp_flags_, nullptr);
        attached_ = false;
        xdp_flags_ = 0;
        WRAITH_LOG("BPF", "Program detached from %s", interface_.c_str());
    }

    // Steer the socket's queue to it; returns 0 or a negated errno
    int register_socket(struct xsk_socket* xsk) {
        if (xsks_map_fd_ < 0 || !xsk) return -EINVAL;
        int ret = xsk_socket__update_xskmap(xsk, xsks_map_fd_);
        if (ret) {
            WRAITH_WARN("BPF", "xsk_socket__update_xskmap failed: %s", strerror(-ret));
            return ret;
        }
        return 0;
    }

    bool attached() const { return attached_; }
    int xsks_map_fd() const { return xsks_map_fd_; }

private:
    struct bpf_object* obj_ = nullptr;
    struct bpf_program* prog_ = nullptr;
    int prog_fd_ = -1;
    int xsks_map_fd_ = -1;
    int ifindex_ = 0;
    uint32_t xdp_flags_ = 0;
    bool attached_ = false;
    std::string interface_;
};

}  // namespace wraith::xdp

#endif  // WRAITH_USE_XDP
