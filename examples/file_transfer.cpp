// examples/file_transfer.cpp
// File -> UMEM frames -> file, through the loopback driver
//
// This example shows:
// - Building a TransportConfig from WRAITH_* environment variables
// - Probing the AF_XDP kernel driver and handling BindError
// - Streaming a file into frames with send_file_chunk()
// - Writing received frames straight to disk with receive_to_file()
// - Reading socket statistics and closing cleanly
//
// Usage:
//   ./build/file_transfer <source> <destination> [mtu]
//
//   WRAITH_IFACE=ens5f0 ./build/file_transfer in.bin out.bin

#include "transport/transport_config.hpp"
#include "transport/zero_copy_transport.hpp"
#include "xdp/kernel_driver.hpp"
#include "xdp/loopback_driver.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using wraith::transport::TransportConfig;
using wraith::transport::ZeroCopyTransport;
using wraith::xdp::BindError;
using wraith::xdp::KernelXskDriver;
using wraith::xdp::LoopbackDriver;
using wraith::xdp::LoopbackOptions;

// Check whether the configured NIC queue accepts an AF_XDP bind
static bool probe_kernel(const TransportConfig& config) {
    ZeroCopyTransport<KernelXskDriver> probe(config);
    try {
        probe.open();
    } catch (const BindError& e) {
        printf("[PROBE] %s\n", e.what());
        return false;
    }
    printf("[PROBE] %s queue %u bound in %s mode\n", config.interface.c_str(), config.queue_id,
           wraith::xdp::to_string(probe.socket().mode()));
    return true;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        fprintf(stderr, "Usage: %s <source> <destination> [mtu]\n", argv[0]);
        return 1;
    }
    uint32_t mtu = argc > 3 ? static_cast<uint32_t>(strtoul(argv[3], nullptr, 10)) : 1400;

    TransportConfig config;
    try {
        config = TransportConfig::from_env();
    } catch (const std::invalid_argument& e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
        return 1;
    }
    config.umem.lock_memory = false;

    printf("========================================\n");
    printf("Zero-Copy File Transfer Demo\n");
    printf("========================================\n");

    if (!probe_kernel(config)) {
        printf("Kernel bypass unavailable, demonstrating over the loopback driver\n");
    }

    int src = open(argv[1], O_RDONLY);
    if (src < 0) {
        perror(argv[1]);
        return 1;
    }
    int dst = open(argv[2], O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (dst < 0) {
        perror(argv[2]);
        close(src);
        return 1;
    }
    struct stat st;
    if (fstat(src, &st) != 0) {
        perror("fstat");
        close(src);
        close(dst);
        return 1;
    }
    uint64_t size = static_cast<uint64_t>(st.st_size);

    LoopbackOptions opts;
    opts.loop_tx_to_rx = true;
    opts.capture_tx = false;
    config.interface = "loopback";
    uint32_t half = config.umem.num_frames() / 2;
    config.socket.fill_frames = half < config.umem.fill_ring_size ? half : config.umem.fill_ring_size;

    int rc = 0;
    try {
        ZeroCopyTransport<LoopbackDriver> transport(config, opts);
        transport.open();

        auto start = std::chrono::steady_clock::now();
        uint64_t read_pos = 0;
        uint64_t write_pos = 0;
        uint64_t window = static_cast<uint64_t>(mtu) * 64;
        while (read_pos < size) {
            uint64_t want = size - read_pos < window ? size - read_pos : window;
            uint64_t sent = transport.send_file_chunk(src, read_pos, want, mtu);
            if (sent == 0) {
                fprintf(stderr, "Transmit stalled at offset %lu\n", (unsigned long)read_pos);
                rc = 1;
                break;
            }
            read_pos += sent;
            while (transport.receive_to_file(dst, write_pos, 64) > 0) {}
        }
        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        auto s = transport.socket().stats().snapshot();
        printf("\nTransferred %lu bytes in %.3f s\n", (unsigned long)write_pos, secs);
        printf("  TX: %lu packets, %.1f Mbit/s\n", (unsigned long)s.tx_packets, s.tx_bps(secs) / 1e6);
        printf("  RX: %lu packets, %.0f pps\n", (unsigned long)s.rx_packets, s.rx_pps(secs));
        printf("  Dropped: %lu (%.2f%%), wakeups: %lu\n", (unsigned long)transport.socket().driver().rx_dropped(),
               s.drop_rate() * 100.0, (unsigned long)s.wakeup_calls);

        auto leftover = transport.close();
        if (!leftover.empty()) {
            printf("  %zu file completions collected at close\n", leftover.size());
        }
        if (write_pos != size) rc = 1;
    } catch (const std::exception& e) {
        fprintf(stderr, "Transfer failed: %s\n", e.what());
        rc = 1;
    }

    close(src);
    close(dst);
    return rc;
}
