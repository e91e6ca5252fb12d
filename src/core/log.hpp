// core/log.hpp
// Tagged printf logging for the transport core
//
//   WRAITH_LOG("XSK", "bound %s queue %u", ifname, queue_id)
//       -> [XSK] bound eth0 queue 0
//   WRAITH_WARN("FILEIO", "io_uring_register_buffers failed: %s", strerror(err))
//       -> [FILEIO] WARNING: io_uring_register_buffers failed: ... (stderr)
//   WRAITH_DEBUG_PRINT("[RX] desc addr=0x%lx len=%u\n", addr, len)
//       -> compiled only with -DWRAITH_DEBUG (per-packet tracing)
//
// Define WRAITH_QUIET to compile WRAITH_LOG out (benchmarks). Warnings stay on.

#pragma once

#include <cstdio>

#ifdef WRAITH_QUIET
#define WRAITH_LOG(tag, fmt, ...) ((void)0)
#else
#define WRAITH_LOG(tag, fmt, ...) \
    do { printf("[" tag "] " fmt "\n" __VA_OPT__(,) __VA_ARGS__); fflush(stdout); } while (0)
#endif

#define WRAITH_WARN(tag, fmt, ...) \
    do { fprintf(stderr, "[" tag "] WARNING: " fmt "\n" __VA_OPT__(,) __VA_ARGS__); } while (0)

#ifdef WRAITH_DEBUG
#define WRAITH_DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while (0)
#else
#define WRAITH_DEBUG_PRINT(...) ((void)0)
#endif
