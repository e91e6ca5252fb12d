// test/unittest/test_ring.cpp
// Unit tests for the SPSC descriptor ring
//
// Run:
//   ./build/test_ring

#include "core/descriptors.hpp"
#include "core/ring.hpp"

#include <atomic>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

using namespace wraith::core;

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

// ============================================================================
// Capacity and ordering
// ============================================================================

TEST(empty_ring_has_nothing_to_consume) {
    RingMemory mem(8, sizeof(FrameAddr));
    auto cons = SpscRing<FrameAddr>::over(mem);

    ASSERT_EQ(cons.size(), 8u);
    ASSERT_EQ(cons.ready(), 0u);
    ASSERT_EQ(cons.free_slots(), 8u);
    ASSERT_FALSE(cons.consume().has_value());
}

TEST(full_at_exact_capacity) {
    RingMemory mem(8, sizeof(FrameAddr));
    auto prod = SpscRing<FrameAddr>::over(mem);

    for (uint64_t i = 0; i < 8; i++) {
        ASSERT_TRUE(prod.produce(i * 2048) == RingStatus::OK);
    }
    ASSERT_EQ(prod.ready(), 8u);
    ASSERT_EQ(prod.free_slots(), 0u);
    ASSERT_TRUE(prod.produce(99) == RingStatus::FULL);
    ASSERT_EQ(prod.ready(), 8u);
}

TEST(fifo_order_with_interleaving) {
    RingMemory mem(4, sizeof(FrameAddr));
    auto prod = SpscRing<FrameAddr>::over(mem);
    auto cons = SpscRing<FrameAddr>::over(mem);

    uint64_t next_in = 0;
    uint64_t next_out = 0;
    for (int round = 0; round < 50; round++) {
        int n = (round % 4) + 1;
        for (int i = 0; i < n && prod.produce(next_in) == RingStatus::OK; i++) {
            next_in++;
        }
        int m = (round % 3) + 1;
        for (int i = 0; i < m; i++) {
            auto v = cons.consume();
            if (!v) break;
            ASSERT_EQ(*v, next_out);
            next_out++;
        }
    }
    while (auto v = cons.consume()) {
        ASSERT_EQ(*v, next_out);
        next_out++;
    }
    ASSERT_EQ(next_in, next_out);
}

TEST(batch_transfers_what_fits) {
    RingMemory mem(8, sizeof(PacketDesc));
    auto prod = SpscRing<PacketDesc>::over(mem);
    auto cons = SpscRing<PacketDesc>::over(mem);

    std::vector<PacketDesc> in(12);
    for (uint32_t i = 0; i < in.size(); i++) {
        in[i].addr = i * 2048 + 256;
        in[i].len = 60 + i;
        in[i].options = 0;
    }

    ASSERT_EQ(prod.produce_batch(in.data(), 5), 5u);
    ASSERT_EQ(prod.produce_batch(in.data() + 5, 7), 3u);   // only 3 slots left
    ASSERT_EQ(prod.produce_batch(in.data(), 1), 0u);

    PacketDesc out[16];
    ASSERT_EQ(cons.consume_batch(out, 16), 8u);
    for (uint32_t i = 0; i < 8; i++) {
        ASSERT_EQ(out[i].addr, in[i].addr);
        ASSERT_EQ(out[i].len, in[i].len);
    }
    ASSERT_EQ(cons.consume_batch(out, 16), 0u);
}

TEST(indices_wrap_past_uint32_max) {
    RingMemory mem(8, sizeof(FrameAddr));
    // Start both counters just below the 32-bit wrap
    *mem.producer() = 0xFFFFFFFCu;
    *mem.consumer() = 0xFFFFFFFCu;

    auto prod = SpscRing<FrameAddr>::over(mem);
    auto cons = SpscRing<FrameAddr>::over(mem);
    ASSERT_EQ(prod.ready(), 0u);

    for (uint64_t i = 0; i < 8; i++) {
        ASSERT_TRUE(prod.produce(1000 + i) == RingStatus::OK);
    }
    ASSERT_TRUE(prod.produce(0) == RingStatus::FULL);
    ASSERT_EQ(*mem.producer(), 4u);   // wrapped
    ASSERT_EQ(prod.ready(), 8u);

    for (uint64_t i = 0; i < 8; i++) {
        auto v = cons.consume();
        ASSERT_TRUE(v.has_value());
        ASSERT_EQ(*v, 1000 + i);
    }
    ASSERT_FALSE(cons.consume().has_value());
    ASSERT_EQ(*mem.consumer(), 4u);
}

TEST(non_power_of_two_rejected) {
    bool threw = false;
    try {
        RingMemory mem(6, sizeof(FrameAddr));
    } catch (const ConfigError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);

    threw = false;
    uint32_t words[3] = {0, 0, 0};
    FrameAddr descs[12];
    try {
        SpscRing<FrameAddr> ring(&words[0], &words[1], &words[2], descs, 12);
    } catch (const ConfigError&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(view_type_must_match_memory) {
    RingMemory mem(8, sizeof(FrameAddr));
    bool threw = false;
    try {
        auto ring = SpscRing<PacketDesc>::over(mem);
        (void)ring;
    } catch (const std::logic_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(need_wakeup_flag) {
    RingMemory mem(8, sizeof(PacketDesc));
    auto app = SpscRing<PacketDesc>::over(mem);
    auto kernel = SpscRing<PacketDesc>::over(mem);

    ASSERT_FALSE(app.needs_wakeup());
    kernel.set_needs_wakeup(true);
    ASSERT_TRUE(app.needs_wakeup());
    ASSERT_EQ(*mem.flags() & RING_FLAG_NEED_WAKEUP, RING_FLAG_NEED_WAKEUP);
    kernel.set_needs_wakeup(false);
    ASSERT_FALSE(app.needs_wakeup());
}

TEST(memory_is_movable) {
    RingMemory a(4, sizeof(FrameAddr));
    auto prod = SpscRing<FrameAddr>::over(a);
    ASSERT_TRUE(prod.produce(4096) == RingStatus::OK);

    RingMemory b(std::move(a));
    ASSERT_FALSE(a.valid());
    ASSERT_TRUE(b.valid());
    auto cons = SpscRing<FrameAddr>::over(b);
    auto v = cons.consume();
    ASSERT_TRUE(v.has_value());
    ASSERT_EQ(*v, 4096u);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(two_thread_stress) {
    RingMemory mem(64, sizeof(PacketDesc));
    auto prod = SpscRing<PacketDesc>::over(mem);
    auto cons = SpscRing<PacketDesc>::over(mem);

    constexpr uint64_t COUNT = 500000;
    std::atomic<bool> ordered{true};

    std::thread consumer([&] {
        uint64_t expected = 0;
        PacketDesc batch[16];
        while (expected < COUNT) {
            uint32_t n = cons.consume_batch(batch, 16);
            for (uint32_t i = 0; i < n; i++) {
                if (batch[i].addr != expected || batch[i].len != static_cast<uint32_t>(expected & 0xFFFF)) {
                    ordered.store(false);
                }
                expected++;
            }
            if (n == 0) std::this_thread::yield();
        }
    });

    for (uint64_t i = 0; i < COUNT; ) {
        PacketDesc d;
        d.addr = i;
        d.len = static_cast<uint32_t>(i & 0xFFFF);
        d.options = 0;
        if (prod.produce(d) == RingStatus::OK) {
            i++;
        } else {
            std::this_thread::yield();
        }
    }
    consumer.join();

    ASSERT_TRUE(ordered.load());
    ASSERT_EQ(prod.ready(), 0u);
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "Running SPSC ring unit tests..." << std::endl;
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
