// test/unittest/test_zero_copy_transport.cpp
// Unit tests for ZeroCopyTransport over the loopback driver
//
// Run:
//   ./build/test_zero_copy_transport

#include "transport/transport_config.hpp"
#include "transport/zero_copy_transport.hpp"
#include "xdp/loopback_driver.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace wraith::transport;
using namespace wraith::xdp;
using wraith::core::IoError;

// Simple test framework
#define TEST(name) \
    void test_##name(); \
    struct TestRegistrar_##name { \
        TestRegistrar_##name() { register_test(#name, test_##name); } \
    } registrar_##name; \
    void test_##name()

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " == " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        current_failed = true; \
        return; \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #cond << " to be true" << std::endl; \
        current_failed = true; \
        return; \
    } \
} while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_THROWS(expr, ExType) do { \
    bool thrown_ = false; \
    try { expr; } catch (const ExType&) { thrown_ = true; } \
    if (!thrown_) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #expr << " to throw " << #ExType << std::endl; \
        current_failed = true; \
        return; \
    } \
} while(0)

// Test registry
struct Test {
    const char* name;
    void (*func)();
};
std::vector<Test> tests;
bool current_failed = false;

void register_test(const char* name, void (*func)()) {
    tests.push_back({name, func});
}

using LoopTransport = ZeroCopyTransport<LoopbackDriver>;

static TransportConfig test_config(uint32_t frames, uint32_t fill_frames) {
    TransportConfig cfg;
    cfg.interface = "lo0";
    cfg.queue_id = 0;
    cfg.umem.size = static_cast<uint64_t>(frames) * 2048;
    cfg.umem.fill_ring_size = 64;
    cfg.umem.comp_ring_size = 64;
    cfg.umem.lock_memory = false;
    cfg.socket.rx_ring_size = 64;
    cfg.socket.tx_ring_size = 64;
    cfg.socket.fill_frames = fill_frames;
    cfg.socket.batch_size = 16;
    cfg.file.queue_depth = 8;
    cfg.file_buffers = 4;
    cfg.file_buffer_size = 4096;
    return cfg;
}

// Temporary file removed on scope exit
struct TempFile {
    int fd = -1;
    char path[64];

    TempFile() {
        snprintf(path, sizeof(path), "/tmp/wraith_transport_XXXXXX");
        fd = mkstemp(path);
    }

    ~TempFile() {
        if (fd >= 0) ::close(fd);
        unlink(path);
    }

    std::vector<uint8_t> contents() const {
        std::vector<uint8_t> out;
        uint8_t buf[4096];
        off_t pos = 0;
        while (true) {
            ssize_t n = pread(fd, buf, sizeof(buf), pos);
            if (n <= 0) break;
            out.insert(out.end(), buf, buf + n);
            pos += n;
        }
        return out;
    }
};

static std::vector<uint8_t> make_pattern(size_t len, uint8_t seed) {
    std::vector<uint8_t> v(len);
    for (size_t i = 0; i < len; i++) v[i] = static_cast<uint8_t>(seed + i * 13 + (i >> 8));
    return v;
}

static std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>>& parts) {
    std::vector<uint8_t> out;
    for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
    return out;
}

// ============================================================================
// Configuration
// ============================================================================

TEST(config_defaults) {
    TransportConfig cfg;
    ASSERT_EQ(cfg.interface, std::string("eth0"));
    ASSERT_EQ(cfg.queue_id, 0u);
    ASSERT_EQ(cfg.umem.frame_size, 2048u);
    ASSERT_TRUE(cfg.socket.mode == ModePreference::AUTO);
    ASSERT_EQ(cfg.file.queue_depth, 64u);
}

TEST(config_from_environment) {
    setenv("WRAITH_IFACE", "ens5f1", 1);
    setenv("WRAITH_QUEUE", "3", 1);
    setenv("WRAITH_MODE", "copy", 1);
    setenv("WRAITH_FRAME_SIZE", "4096", 1);
    setenv("WRAITH_UMEM_SIZE", "0x1000000", 1);
    setenv("WRAITH_FILE_QUEUE_DEPTH", "128", 1);

    TransportConfig cfg = TransportConfig::from_env();

    unsetenv("WRAITH_IFACE");
    unsetenv("WRAITH_QUEUE");
    unsetenv("WRAITH_MODE");
    unsetenv("WRAITH_FRAME_SIZE");
    unsetenv("WRAITH_UMEM_SIZE");
    unsetenv("WRAITH_FILE_QUEUE_DEPTH");

    ASSERT_EQ(cfg.interface, std::string("ens5f1"));
    ASSERT_EQ(cfg.queue_id, 3u);
    ASSERT_TRUE(cfg.socket.mode == ModePreference::COPY);
    ASSERT_EQ(cfg.umem.frame_size, 4096u);
    ASSERT_EQ(cfg.umem.size, 16u * 1024 * 1024);
    ASSERT_EQ(cfg.file.queue_depth, 128u);
}

TEST(config_rejects_bad_environment) {
    setenv("WRAITH_QUEUE", "two", 1);
    ASSERT_THROWS(TransportConfig::from_env(), std::invalid_argument);
    setenv("WRAITH_QUEUE", "-1", 1);
    ASSERT_THROWS(TransportConfig::from_env(), std::invalid_argument);
    unsetenv("WRAITH_QUEUE");

    setenv("WRAITH_MODE", "turbo", 1);
    ASSERT_THROWS(TransportConfig::from_env(), std::invalid_argument);
    unsetenv("WRAITH_MODE");
}

// ============================================================================
// Datagrams
// ============================================================================

TEST(datagram_round_trip) {
    LoopbackOptions opts;
    opts.loop_tx_to_rx = true;
    LoopTransport t(test_config(16, 8), opts);
    ASSERT_TRUE(t.send("early", 5) == TransportStatus::CLOSED);
    t.open();
    ASSERT_TRUE(t.socket().bound());

    ASSERT_TRUE(t.send("hello", 5) == TransportStatus::OK);
    ASSERT_TRUE(t.send("world!", 6) == TransportStatus::OK);
    auto got = t.receive_batch(8);
    ASSERT_EQ(got.size(), 2u);
    ASSERT_EQ(std::string(got[0].begin(), got[0].end()), std::string("hello"));
    ASSERT_EQ(std::string(got[1].begin(), got[1].end()), std::string("world!"));

    // Frames went straight back to FILL
    ASSERT_EQ(t.socket().fill_pending(), 8u);
}

TEST(datagram_limits) {
    LoopTransport t(test_config(8, 0));
    t.open();

    ASSERT_THROWS(t.send("", 0), std::invalid_argument);
    std::vector<uint8_t> big(t.socket().payload_capacity() + 1, 1);
    ASSERT_TRUE(t.send(big.data(), static_cast<uint32_t>(big.size())) == TransportStatus::TOO_LARGE);
    big.pop_back();
    ASSERT_TRUE(t.send(big.data(), static_cast<uint32_t>(big.size())) == TransportStatus::OK);
}

TEST(pool_exhaustion_surfaces) {
    LoopbackOptions opts;
    opts.auto_complete = false;
    LoopTransport t(test_config(4, 0), opts);
    t.open();

    for (int i = 0; i < 4; i++) {
        ASSERT_TRUE(t.send("x", 1) == TransportStatus::OK);
    }
    ASSERT_TRUE(t.send("x", 1) == TransportStatus::POOL_EXHAUSTED);
    t.socket().driver().complete_pending();
    ASSERT_TRUE(t.send("x", 1) == TransportStatus::OK);
}

TEST(failed_bind_propagates) {
    LoopbackOptions opts;
    opts.reject_zero_copy = ENODEV;
    opts.reject_copy = ENODEV;
    LoopTransport t(test_config(8, 0), opts);

    bool threw = false;
    try {
        t.open();
    } catch (const BindError& e) {
        threw = true;
        ASSERT_TRUE(e.failure() == BindFailure::INTERFACE_NOT_FOUND);
    }
    ASSERT_TRUE(threw);
    ASSERT_TRUE(t.send("x", 1) == TransportStatus::CLOSED);
}

// ============================================================================
// File ranges
// ============================================================================

TEST(write_and_read_chunks) {
    TempFile file;
    ASSERT_TRUE(file.fd >= 0);
    LoopTransport t(test_config(8, 0));
    t.open();

    auto data = make_pattern(10000, 5);
    t.write_chunk(file.fd, 100, data.data(), static_cast<uint32_t>(data.size()));

    auto back = t.read_chunk(file.fd, 100, 10000);
    ASSERT_EQ(back.size(), 10000u);
    ASSERT_TRUE(back == data);

    // Stops at EOF
    auto tail = t.read_chunk(file.fd, 9000, 4000);
    ASSERT_EQ(tail.size(), 10100u - 9000u);
    ASSERT_TRUE(memcmp(tail.data(), data.data() + 8900, tail.size()) == 0);

    ASSERT_EQ(t.files().free_buffer_count(), 4u);
    ASSERT_EQ(t.files().outstanding(), 0u);
}

TEST(read_chunk_error_raises) {
    LoopTransport t(test_config(8, 0));
    t.open();
    ASSERT_THROWS(t.read_chunk(-1, 0, 100), IoError);
    ASSERT_EQ(t.files().free_buffer_count(), 4u);
}

// ============================================================================
// File <-> frames
// ============================================================================

TEST(send_file_chunk_streams_the_file) {
    TempFile file;
    auto data = make_pattern(5000, 9);
    ASSERT_EQ(pwrite(file.fd, data.data(), data.size(), 0), static_cast<ssize_t>(data.size()));

    LoopTransport t(test_config(16, 0));
    t.open();

    uint64_t sent = t.send_file_chunk(file.fd, 0, data.size(), 1000);
    ASSERT_EQ(sent, 5000u);
    auto frames = t.socket().driver().take_transmitted();
    ASSERT_EQ(frames.size(), 5u);
    for (const auto& f : frames) {
        ASSERT_EQ(f.size(), 1000u);
    }
    ASSERT_TRUE(concat(frames) == data);

    // Range past EOF is cut short
    sent = t.send_file_chunk(file.fd, 4500, 2000, 1000);
    ASSERT_EQ(sent, 500u);
    frames = t.socket().driver().take_transmitted();
    ASSERT_EQ(frames.size(), 1u);
    ASSERT_TRUE(memcmp(frames[0].data(), data.data() + 4500, 500) == 0);

    ASSERT_THROWS(t.send_file_chunk(file.fd, 0, 10, 0), std::invalid_argument);
    ASSERT_THROWS(t.send_file_chunk(file.fd, 0, 10, t.socket().payload_capacity() + 1),
                  std::invalid_argument);
}

TEST(send_file_chunk_stops_when_pool_stays_empty) {
    TempFile file;
    auto data = make_pattern(10000, 2);
    ASSERT_EQ(pwrite(file.fd, data.data(), data.size(), 0), static_cast<ssize_t>(data.size()));

    LoopbackOptions opts;
    opts.auto_complete = false;
    LoopTransport t(test_config(4, 0), opts);
    t.open();

    uint64_t sent = t.send_file_chunk(file.fd, 0, data.size(), 1000);
    ASSERT_EQ(sent, 4000u);
    ASSERT_EQ(t.socket().driver().pending_completions(), 4u);

    // Resume once the kernel side finishes
    t.socket().driver().complete_pending();
    sent += t.send_file_chunk(file.fd, sent, data.size() - sent, 1000);
    ASSERT_EQ(sent, 8000u);
}

TEST(receive_to_file_appends_payloads) {
    TempFile file;
    LoopTransport t(test_config(16, 8));
    t.open();

    const char* parts[] = {"first-", "second-", "third"};
    for (const char* p : parts) {
        ASSERT_TRUE(t.socket().driver().inject(p, static_cast<uint32_t>(strlen(p))));
    }

    uint64_t offset = 10;
    ASSERT_EQ(t.receive_to_file(file.fd, offset, 8), 3u);
    ASSERT_EQ(offset, 10u + 18u);
    ASSERT_EQ(t.receive_to_file(file.fd, offset, 8), 0u);

    auto contents = file.contents();
    ASSERT_EQ(contents.size(), 28u);
    ASSERT_EQ(std::string(contents.begin() + 10, contents.end()), std::string("first-second-third"));

    // Every frame went back to FILL
    ASSERT_EQ(t.socket().fill_pending(), 8u);
}

TEST(receive_to_file_error_recycles_frames) {
    LoopTransport t(test_config(16, 8));
    t.open();
    ASSERT_TRUE(t.socket().driver().inject("lost", 4));
    ASSERT_TRUE(t.socket().driver().inject("also", 4));

    uint64_t offset = 0;
    ASSERT_THROWS(t.receive_to_file(-1, offset, 8), IoError);
    ASSERT_EQ(offset, 0u);
    ASSERT_EQ(t.socket().fill_pending(), 8u);
    ASSERT_EQ(t.files().outstanding(), 0u);
}

TEST(send_file_chunk_returns_frame_when_file_engine_fails) {
    TempFile file;
    auto data = make_pattern(512, 4);
    ASSERT_EQ(pwrite(file.fd, data.data(), data.size(), 0), static_cast<ssize_t>(data.size()));

    LoopTransport t(test_config(16, 0));
    t.open();
    uint32_t before = t.socket().free_frames();

    t.files().close();
    ASSERT_THROWS(t.send_file_chunk(file.fd, 0, 512, 512), IoError);
    ASSERT_EQ(t.socket().free_frames(), before);
    ASSERT_TRUE(t.socket().driver().take_transmitted().empty());

    // Frame is usable again
    ASSERT_TRUE(t.send("ok", 2) == TransportStatus::OK);
}

TEST(receive_to_file_recycles_frames_when_file_engine_fails) {
    TempFile file;
    LoopTransport t(test_config(16, 8));
    t.open();
    ASSERT_TRUE(t.socket().driver().inject("kept", 4));
    ASSERT_TRUE(t.socket().driver().inject("also", 4));
    ASSERT_EQ(t.socket().fill_pending(), 6u);

    t.files().close();
    uint64_t offset = 0;
    ASSERT_THROWS(t.receive_to_file(file.fd, offset, 8), IoError);
    ASSERT_EQ(offset, 0u);
    ASSERT_EQ(t.socket().fill_pending(), 8u);
}

TEST(file_to_file_through_loopback) {
    TempFile src;
    TempFile dst;
    auto data = make_pattern(12345, 77);
    ASSERT_EQ(pwrite(src.fd, data.data(), data.size(), 0), static_cast<ssize_t>(data.size()));

    LoopbackOptions opts;
    opts.loop_tx_to_rx = true;
    opts.capture_tx = false;
    LoopTransport t(test_config(64, 32), opts);
    t.open();

    uint64_t read_pos = 0;
    uint64_t write_pos = 0;
    while (read_pos < data.size()) {
        uint64_t want = data.size() - read_pos;
        if (want > 8 * 1400) want = 8 * 1400;
        uint64_t sent = t.send_file_chunk(src.fd, read_pos, want, 1400);
        ASSERT_TRUE(sent > 0);
        read_pos += sent;
        while (t.receive_to_file(dst.fd, write_pos, 16) > 0) {}
    }

    ASSERT_EQ(write_pos, data.size());
    ASSERT_TRUE(dst.contents() == data);
    ASSERT_EQ(t.socket().driver().rx_dropped(), 0u);
    ASSERT_EQ(t.drain_deferred().size(), 0u);
}

// ============================================================================
// Close
// ============================================================================

TEST(close_shuts_both_halves) {
    TempFile file;
    LoopTransport t(test_config(8, 4));
    t.open();
    auto umem = t.socket().umem();

    t.close();
    ASSERT_FALSE(t.socket().bound());
    ASSERT_TRUE(t.files().closed());
    ASSERT_EQ(umem->bindings(), 0u);
    ASSERT_EQ(umem->unclaimed_frames(), umem->num_frames());

    ASSERT_TRUE(t.send("x", 1) == TransportStatus::CLOSED);
    ASSERT_EQ(t.receive_batch(8).size(), 0u);
    ASSERT_EQ(t.send_file_chunk(file.fd, 0, 100, 100), 0u);
    ASSERT_THROWS(t.read_chunk(file.fd, 0, 100), std::logic_error);
    ASSERT_EQ(t.close().size(), 0u);
}

TEST(transports_share_one_pool) {
    TransportConfig cfg = test_config(16, 2);
    cfg.socket.shared = true;
    cfg.socket.frame_count = 8;

    LoopTransport a(cfg);
    a.open();
    LoopTransport b(cfg);
    b.open(a.socket().umem());

    ASSERT_TRUE(a.socket().umem() == b.socket().umem());
    ASSERT_EQ(a.socket().umem()->unclaimed_frames(), 0u);
    ASSERT_TRUE(a.send("a", 1) == TransportStatus::OK);
    ASSERT_TRUE(b.send("b", 1) == TransportStatus::OK);
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Running ZeroCopyTransport unit tests..." << std::endl;
    std::cout << "=================================" << std::endl;

    int passed = 0;
    int failed = 0;

    for (const auto& test : tests) {
        std::cout << "Running: " << test.name << "... ";
        std::cout.flush();

        current_failed = false;
        test.func();

        if (current_failed) {
            std::cout << "FAIL" << std::endl;
            failed++;
        } else {
            std::cout << "PASS" << std::endl;
            passed++;
        }
    }

    std::cout << "=================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed > 0 ? 1 : 0;
}
