#include <gtest/gtest.h>
#include "vellum/cache/gpu_resource_cache.hpp"
#include <memory>

using namespace vellum;
using namespace vellum::cache;

namespace {

class FakeGpuBuffer : public Disposable {
public:
    explicit FakeGpuBuffer(usize bytes) : m_bytes(bytes) {}

    void dispose() override { ++dispose_calls; }
    [[nodiscard]] bool is_disposed() const override { return dispose_calls > 0; }
    [[nodiscard]] usize byte_size() const { return m_bytes; }

    int dispose_calls{0};

private:
    usize m_bytes;
};

class PlainResource {
public:
    virtual ~PlainResource() = default;
    [[nodiscard]] usize byte_size() const { return 16; }
};

class DisposablePlainResource : public PlainResource, public Disposable {
public:
    void dispose() override { disposed = true; }
    [[nodiscard]] bool is_disposed() const override { return disposed; }

    bool disposed{false};
};

CacheOptions<std::shared_ptr<FakeGpuBuffer>> tight_options() {
    auto options = gpu_cache_defaults<std::shared_ptr<FakeGpuBuffer>>();
    options.max_items = 2;
    options.gc_interval_ms = 0.0;
    options.default_ttl_ms = 0.0;
    return options;
}

} // anonymous namespace

class GPUResourceCacheTest : public ::testing::Test {
protected:
    ManualClock m_clock;
    EventLoop m_loop{m_clock};
};

TEST_F(GPUResourceCacheTest, DefaultsMatchGpuBudget) {
    auto options = gpu_cache_defaults<std::shared_ptr<FakeGpuBuffer>>();
    EXPECT_EQ(options.max_memory, 64 * MiB);
    EXPECT_EQ(options.max_items, 200u);
    EXPECT_DOUBLE_EQ(options.default_ttl_ms, 600000.0);
}

TEST_F(GPUResourceCacheTest, EvictionDisposesValue) {
    GPUResourceCache<std::shared_ptr<FakeGpuBuffer>> cache(m_loop, tight_options());
    auto first = std::make_shared<FakeGpuBuffer>(10);

    cache.set("first", first);
    cache.set("second", std::make_shared<FakeGpuBuffer>(10));
    cache.set("third", std::make_shared<FakeGpuBuffer>(10));

    EXPECT_EQ(first->dispose_calls, 1);
    EXPECT_EQ(cache.disposed_count(), 1u);
}

TEST_F(GPUResourceCacheTest, ExpiryDisposesValue) {
    GPUResourceCache<std::shared_ptr<FakeGpuBuffer>> cache(m_loop, tight_options());
    auto buffer = std::make_shared<FakeGpuBuffer>(10);

    cache.set("buffer", buffer, std::nullopt, 100.0);
    m_clock.advance(200.0);
    EXPECT_FALSE(cache.get("buffer").has_value());

    EXPECT_TRUE(buffer->is_disposed());
}

TEST_F(GPUResourceCacheTest, ClearDisposesEveryValue) {
    GPUResourceCache<std::shared_ptr<FakeGpuBuffer>> cache(m_loop, tight_options());
    auto a = std::make_shared<FakeGpuBuffer>(10);
    auto b = std::make_shared<FakeGpuBuffer>(10);
    cache.set("a", a);
    cache.set("b", b);

    cache.clear();

    EXPECT_EQ(a->dispose_calls, 1);
    EXPECT_EQ(b->dispose_calls, 1);
}

TEST_F(GPUResourceCacheTest, RemoveDisposesValue) {
    GPUResourceCache<std::shared_ptr<FakeGpuBuffer>> cache(m_loop, tight_options());
    auto a = std::make_shared<FakeGpuBuffer>(10);
    cache.set("a", a);

    EXPECT_TRUE(cache.remove("a"));
    EXPECT_EQ(a->dispose_calls, 1);
}

TEST_F(GPUResourceCacheTest, ReplacingWithNewValueDisposesOld) {
    GPUResourceCache<std::shared_ptr<FakeGpuBuffer>> cache(m_loop, tight_options());
    auto old_value = std::make_shared<FakeGpuBuffer>(10);
    auto new_value = std::make_shared<FakeGpuBuffer>(20);

    cache.set("a", old_value);
    cache.set("a", old_value);
    EXPECT_EQ(old_value->dispose_calls, 0);

    cache.set("a", new_value);
    EXPECT_EQ(old_value->dispose_calls, 1);
    EXPECT_EQ(new_value->dispose_calls, 0);
    EXPECT_EQ(cache.current_size(), 20u);
}

TEST_F(GPUResourceCacheTest, DestructionDisposesRemainingValues) {
    auto value = std::make_shared<FakeGpuBuffer>(10);
    {
        GPUResourceCache<std::shared_ptr<FakeGpuBuffer>> cache(m_loop, tight_options());
        cache.set("a", value);
    }
    EXPECT_EQ(value->dispose_calls, 1);
    EXPECT_EQ(m_loop.pending_timers(), 0u);
}

TEST_F(GPUResourceCacheTest, OnlyValuesExposingDisposeAreDisposed) {
    auto options = gpu_cache_defaults<std::shared_ptr<PlainResource>>();
    options.gc_interval_ms = 0.0;
    GPUResourceCache<std::shared_ptr<PlainResource>> cache(m_loop, options);

    auto disposable = std::make_shared<DisposablePlainResource>();
    cache.set("plain", std::make_shared<PlainResource>());
    cache.set("disposable", disposable);
    cache.clear();

    EXPECT_TRUE(disposable->disposed);
    EXPECT_EQ(cache.disposed_count(), 1u);
}
