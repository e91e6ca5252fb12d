// transport/transport_config.hpp
// Aggregate configuration for ZeroCopyTransport
//
// Defaults come from the constructors of the per-module structs. from_env()
// overlays process environment variables:
//
//   WRAITH_IFACE             interface name             (default "eth0")
//   WRAITH_QUEUE             NIC queue id               (default 0)
//   WRAITH_MODE              auto | zerocopy | copy     (default auto)
//   WRAITH_FRAME_SIZE        UMEM frame size in bytes   (default 2048)
//   WRAITH_UMEM_SIZE         UMEM size in bytes         (default 4 MB)
//   WRAITH_FILE_QUEUE_DEPTH  file I/O queue depth       (default 64)
//
// Values are validated by the modules that consume them, not here.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "../fileio/file_io_context.hpp"
#include "../xdp/bind_mode.hpp"
#include "../xdp/umem.hpp"
#include "../xdp/xsk_socket.hpp"

namespace wraith::transport {

struct TransportConfig {
    std::string interface;
    uint32_t queue_id;
    xdp::UmemConfig umem;
    xdp::SocketConfig socket;
    fileio::FileIoConfig file;
    uint32_t file_buffers;          // Buffer table entries for chunk reads/writes
    uint32_t file_buffer_size;      // Bytes per buffer table entry

    TransportConfig()
        : interface("eth0")
        , queue_id(0)
        , file_buffers(16)
        , file_buffer_size(64 * 1024)
    {}

    static TransportConfig from_env() {
        TransportConfig config;
        config.apply_env();
        return config;
    }

    /**
     * Overlay WRAITH_* variables that are set
     * @throws std::invalid_argument for an unparsable value
     */
    void apply_env() {
        if (const char* v = std::getenv("WRAITH_IFACE")) {
            interface = v;
        }
        if (const char* v = std::getenv("WRAITH_QUEUE")) {
            queue_id = static_cast<uint32_t>(parse_unsigned("WRAITH_QUEUE", v));
        }
        if (const char* v = std::getenv("WRAITH_MODE")) {
            socket.mode = xdp::parse_mode_preference(v);
        }
        if (const char* v = std::getenv("WRAITH_FRAME_SIZE")) {
            umem.frame_size = static_cast<uint32_t>(parse_unsigned("WRAITH_FRAME_SIZE", v));
        }
        if (const char* v = std::getenv("WRAITH_UMEM_SIZE")) {
            umem.size = parse_unsigned("WRAITH_UMEM_SIZE", v);
        }
        if (const char* v = std::getenv("WRAITH_FILE_QUEUE_DEPTH")) {
            file.queue_depth = static_cast<uint32_t>(parse_unsigned("WRAITH_FILE_QUEUE_DEPTH", v));
        }
    }

private:
    static uint64_t parse_unsigned(const char* name, const char* value) {
        errno = 0;
        char* end = nullptr;
        unsigned long long parsed = std::strtoull(value, &end, 0);
        if (errno != 0 || end == value || *end != '\0' || value[0] == '-') {
            throw std::invalid_argument(std::string(name) + ": not an unsigned integer: '" + value + "'");
        }
        return static_cast<uint64_t>(parsed);
    }
};

}  // namespace wraith::transport
