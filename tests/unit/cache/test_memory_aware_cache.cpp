#include <gtest/gtest.h>
#include "vellum/cache/memory_aware_cache.hpp"
#include <string>
#include <vector>

using namespace vellum;
using namespace vellum::cache;

namespace {

CacheOptions<std::string> budget_options() {
    CacheOptions<std::string> options;
    options.max_memory = 1000;
    options.max_items = 100;
    options.default_ttl_ms = 0.0;
    options.gc_interval_ms = 0.0;
    return options;
}

} // anonymous namespace

class MemoryAwareCacheTest : public ::testing::Test {
protected:
    void fill(MemoryAwareLRUCache<std::string>& cache) {
        for (int i = 0; i < 9; ++i) {
            cache.set("item" + std::to_string(i), "v", 100);
        }
    }

    ManualClock m_clock;
    EventLoop m_loop{m_clock};
    FixedMemoryPressureSource m_pressure;
};

TEST(MemoryPressureTest, Classification) {
    EXPECT_EQ(classify_memory_pressure(0.5), MemoryPressure::Low);
    EXPECT_EQ(classify_memory_pressure(0.7), MemoryPressure::Low);
    EXPECT_EQ(classify_memory_pressure(0.75), MemoryPressure::Medium);
    EXPECT_EQ(classify_memory_pressure(0.9), MemoryPressure::Medium);
    EXPECT_EQ(classify_memory_pressure(0.95), MemoryPressure::High);
}

TEST(MemoryPressureTest, SystemSourceReportsFraction) {
    SystemMemoryPressureSource source;
    auto utilization = source.sample_utilization();
    if (utilization) {
        EXPECT_GE(*utilization, 0.0);
        EXPECT_LE(*utilization, 1.0);
    }
}

TEST_F(MemoryAwareCacheTest, HighPressureTrimsToHalf) {
    MemoryAwareLRUCache<std::string> cache(m_loop, m_pressure, budget_options());
    fill(cache);

    m_pressure.set_utilization(0.95);
    m_loop.run_for(5000.0);

    EXPECT_EQ(cache.memory_pressure(), MemoryPressure::High);
    EXPECT_LE(cache.current_size(), 500u);
}

TEST_F(MemoryAwareCacheTest, MediumPressureTrimsToSeventyPercent) {
    MemoryAwareLRUCache<std::string> cache(m_loop, m_pressure, budget_options());
    fill(cache);

    m_pressure.set_utilization(0.8);
    cache.check_memory_pressure();

    EXPECT_EQ(cache.memory_pressure(), MemoryPressure::Medium);
    EXPECT_LE(cache.current_size(), 700u);
    EXPECT_GT(cache.current_size(), 500u);
}

TEST_F(MemoryAwareCacheTest, UnchangedPressureDoesNotTrimAgain) {
    MemoryAwareLRUCache<std::string> cache(m_loop, m_pressure, budget_options());
    std::vector<MemoryPressure> changes;
    cache.on_pressure_changed.connect([&](MemoryPressure p) { changes.push_back(p); });

    m_pressure.set_utilization(0.8);
    cache.check_memory_pressure();
    fill(cache);
    cache.check_memory_pressure();

    EXPECT_EQ(changes, (std::vector<MemoryPressure>{MemoryPressure::Medium}));
    EXPECT_EQ(cache.current_size(), 900u);
}

TEST_F(MemoryAwareCacheTest, UnavailableSampleCountsAsLow) {
    MemoryAwareLRUCache<std::string> cache(m_loop, m_pressure, budget_options());
    m_pressure.set_utilization(0.99);
    cache.check_memory_pressure();

    m_pressure.set_utilization(std::nullopt);
    EXPECT_EQ(cache.check_memory_pressure(), MemoryPressure::Low);
}

TEST_F(MemoryAwareCacheTest, DestructionCancelsPressureTimer) {
    {
        MemoryAwareLRUCache<std::string> cache(m_loop, m_pressure, budget_options());
        EXPECT_EQ(m_loop.pending_timers(), 1u);
    }
    EXPECT_EQ(m_loop.pending_timers(), 0u);
}
