#include <gtest/gtest.h>
#include "fake_gpu_context.hpp"
#include "fake_transport.hpp"
#include "vellum/core/clock.hpp"
#include "vellum/resource/gpu_texture_resource.hpp"
#include "vellum/resource/resource_manager.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace vellum;
using namespace vellum::network;
using namespace vellum::resource;
using vellum::test_support::FakeGpuContext;
using vellum::test_support::FakeTransport;

namespace {

ResourceConfig config_for(const std::string& id, ResourceType type = ResourceType::Binary) {
    ResourceConfig config;
    config.id = id;
    config.url = "https://assets.test/" + id;
    config.type = type;
    config.retries = 0;
    return config;
}

// Every texture decodes to the same 2x3 image
class FixedImageDecoder : public ResourceDecoder {
public:
    ResourceResult<ResourcePtr> decode(const DecodeInput&) const override {
        return ResourcePtr(std::make_shared<ImageResource>(2, 3, std::vector<u8>(24, 0x40)));
    }
};

} // anonymous namespace

class ResourceManagerTest : public ::testing::Test {
protected:
    ResourceManagerTest() {
        decoders.register_decoder(ResourceType::Texture, std::make_shared<FixedImageDecoder>());
    }

    gpu::TexturePool& make_pool(gpu::TexturePoolConfig config = {}) {
        config.preallocate = false;
        config.cleanup_interval_ms = 0.0;
        m_pool = std::make_unique<gpu::TexturePool>(loop, gpu_context, config);
        return *m_pool;
    }

    EnhancedResourceManager& make_manager(ResourceManagerOptions options = {}) {
        ResourceContext context{loop, transport, decoders, pressure, m_pool.get()};
        m_manager = std::make_unique<EnhancedResourceManager>(context, options);
        return *m_manager;
    }

    ResourceRefPtr load(EnhancedResourceManager& manager, const ResourceConfig& config) {
        auto future = manager.load_resource(config);
        loop.run_until_idle();
        if (!future.is_ready() || !future.result()) {
            return nullptr;
        }
        return future.result().value();
    }

    void serve(const std::string& id, const std::string& body) {
        transport.respond_body("https://assets.test/" + id, {body});
    }

    ManualClock clock{0.0};
    EventLoop loop{clock};
    FakeTransport transport{loop};
    DecoderRegistry decoders = DecoderRegistry::with_builtin_decoders();
    cache::FixedMemoryPressureSource pressure;
    FakeGpuContext gpu_context;

private:
    // Declared before the manager so handles release into a live pool
    std::unique_ptr<gpu::TexturePool> m_pool;
    std::unique_ptr<EnhancedResourceManager> m_manager;
};

// ============================================================================
// Loading and caching
// ============================================================================

TEST_F(ResourceManagerTest, LoadsAndCachesPayload) {
    auto& manager = make_manager();
    serve("blob", "abcdef");

    int loaded = 0;
    std::string cached_id;
    usize cached_size = 0;
    manager.on_resource_loaded.connect([&](const ResourceRefPtr&) { ++loaded; });
    manager.on_resource_cached.connect([&](const std::string& id, usize size) {
        cached_id = id;
        cached_size = size;
    });

    auto ref = load(manager, config_for("blob"));

    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->id(), "blob");
    EXPECT_EQ(ref->url(), "https://assets.test/blob");
    EXPECT_EQ(ref->type(), ResourceType::Binary);
    EXPECT_EQ(ref->size(), 6u);
    EXPECT_TRUE(ref->cached());
    EXPECT_EQ(ref->ref_count(), 0u);
    ASSERT_NE(ref->as<BinaryResource>(), nullptr);
    EXPECT_EQ(ref->as<SvgResource>(), nullptr);

    EXPECT_TRUE(manager.is_cached("blob"));
    EXPECT_TRUE(manager.is_tracked("blob"));
    EXPECT_EQ(loaded, 1);
    EXPECT_EQ(cached_id, "blob");
    EXPECT_EQ(cached_size, 6u);

    auto stats = manager.get_stats();
    EXPECT_EQ(stats.cache.item_count, 1u);
    EXPECT_EQ(stats.cache.used, 6u);
    EXPECT_EQ(stats.gpu_cache.item_count, 0u);
    EXPECT_EQ(stats.loader.loaded, 1u);
}

TEST_F(ResourceManagerTest, CachedIdResolvesWithoutFetching) {
    auto& manager = make_manager();
    serve("blob", "abc");

    auto first = load(manager, config_for("blob"));
    auto second = load(manager, config_for("blob"));

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(transport.request_count("https://assets.test/blob"), 1u);
    EXPECT_DOUBLE_EQ(manager.get_stats().performance.cache_hit_rate, 0.5);
}

TEST_F(ResourceManagerTest, ConcurrentLoadsShareOneHandle) {
    auto& manager = make_manager();
    serve("blob", "abc");

    auto a = manager.load_resource(config_for("blob"));
    auto b = manager.load_resource(config_for("blob"));
    EXPECT_TRUE(a.shares_state_with(b));

    loop.run_until_idle();

    ASSERT_TRUE(a.result().is_ok());
    EXPECT_EQ(a.result().value(), b.result().value());
    EXPECT_EQ(transport.request_count("https://assets.test/blob"), 1u);
}

TEST_F(ResourceManagerTest, FailedLoadRejectsAndCachesNothing) {
    auto& manager = make_manager();
    transport.respond_status("https://assets.test/missing", 404);

    auto future = manager.load_resource(config_for("missing"));
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    ASSERT_TRUE(future.result().is_err());
    EXPECT_EQ(future.result().error().status, 404);
    EXPECT_FALSE(manager.is_cached("missing"));
    EXPECT_FALSE(manager.is_tracked("missing"));
}

TEST_F(ResourceManagerTest, DisposedManagerRejectsLoads) {
    auto& manager = make_manager();
    manager.dispose();

    auto future = manager.load_resource(config_for("blob"));
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    EXPECT_EQ(future.result().error().kind, ResourceErrorKind::Configuration);
    EXPECT_TRUE(transport.requests.empty());
}

// ============================================================================
// Textures
// ============================================================================

TEST_F(ResourceManagerTest, UploadsImagesIntoPooledTextures) {
    auto& pool = make_pool();
    auto& manager = make_manager();
    serve("sprite", "png");

    auto ref = load(manager, config_for("sprite", ResourceType::Texture));

    ASSERT_NE(ref, nullptr);
    auto texture = ref->as<GpuTextureResource>();
    ASSERT_NE(texture, nullptr);
    EXPECT_EQ(texture->width(), 2u);
    EXPECT_EQ(texture->height(), 3u);
    EXPECT_TRUE(texture->texture()->in_use());
    EXPECT_EQ(ref->size(), 32u);
    EXPECT_EQ(pool.texture_count(), 1u);
    EXPECT_EQ(gpu_context.texture_uploads.size(), 1u);

    auto stats = manager.get_stats();
    EXPECT_EQ(stats.gpu_cache.item_count, 1u);
    EXPECT_EQ(stats.cache.item_count, 0u);
}

TEST_F(ResourceManagerTest, ImagesStayOnCpuWithoutPool) {
    auto& manager = make_manager();
    serve("sprite", "png");

    auto ref = load(manager, config_for("sprite", ResourceType::Texture));

    ASSERT_NE(ref, nullptr);
    EXPECT_NE(ref->as<ImageResource>(), nullptr);
    EXPECT_EQ(ref->size(), 24u);
    EXPECT_EQ(manager.get_stats().cache.item_count, 1u);
}

TEST_F(ResourceManagerTest, ForceReleaseReturnsTextureToPool) {
    auto& pool = make_pool();
    auto& manager = make_manager();
    serve("sprite", "png");

    auto ref = load(manager, config_for("sprite", ResourceType::Texture));
    ASSERT_NE(ref, nullptr);
    auto pooled = ref->as<GpuTextureResource>()->texture();

    EXPECT_TRUE(manager.force_release_resource("sprite"));
    EXPECT_TRUE(ref->is_disposed());
    EXPECT_FALSE(pooled->in_use());
    EXPECT_FALSE(manager.is_cached("sprite"));
    EXPECT_FALSE(manager.is_tracked("sprite"));
    EXPECT_FALSE(manager.force_release_resource("sprite"));

    auto reused = pool.get_texture(gpu::TextureRequest::sized(2, 3));
    EXPECT_EQ(reused->id(), pooled->id());
}

TEST_F(ResourceManagerTest, ExhaustedPoolRejectsWithCapacityError) {
    gpu::TexturePoolConfig config;
    config.max_textures = 1;
    auto& pool = make_pool(config);
    auto held = pool.get_texture(gpu::TextureRequest::sized(8, 8));
    auto& manager = make_manager();
    serve("sprite", "png");

    auto future = manager.load_resource(config_for("sprite", ResourceType::Texture));
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    ASSERT_TRUE(future.result().is_err());
    EXPECT_EQ(future.result().error().kind, ResourceErrorKind::Capacity);
    EXPECT_FALSE(manager.is_cached("sprite"));
    EXPECT_TRUE(held->in_use());
}

TEST_F(ResourceManagerTest, GpuEvictionDisposesTexture) {
    make_pool();
    ResourceManagerOptions options;
    options.gpu_cache_max_items = 1;
    auto& manager = make_manager(options);
    serve("a", "png");
    serve("b", "png");

    std::vector<std::string> evicted;
    manager.on_resource_evicted.connect([&](const std::string& id, const std::string& reason) {
        evicted.push_back(id + ":" + reason);
    });

    auto first = load(manager, config_for("a", ResourceType::Texture));
    auto second = load(manager, config_for("b", ResourceType::Texture));
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "a:gpu_lru");
    EXPECT_FALSE(first->as<GpuTextureResource>()->texture()->in_use());
    EXPECT_TRUE(second->as<GpuTextureResource>()->texture()->in_use());
}

// ============================================================================
// References and GC
// ============================================================================

TEST_F(ResourceManagerTest, GetAndReleaseTrackReferences) {
    auto& manager = make_manager();
    serve("blob", "abc");
    load(manager, config_for("blob"));

    auto ref = manager.get_resource("blob");
    ASSERT_NE(ref, nullptr);
    EXPECT_EQ(ref->ref_count(), 1u);
    EXPECT_EQ(manager.get_resource("blob"), ref);
    EXPECT_EQ(ref->ref_count(), 2u);

    auto stats = manager.get_stats();
    EXPECT_EQ(stats.references.total_refs, 1u);
    EXPECT_EQ(stats.references.active_refs, 1u);

    EXPECT_TRUE(manager.release_resource("blob"));
    EXPECT_TRUE(manager.release_resource("blob"));
    EXPECT_EQ(ref->ref_count(), 0u);
    EXPECT_TRUE(ref->gc_eligible());
    EXPECT_EQ(manager.get_stats().references.orphaned_refs, 1u);

    EXPECT_FALSE(manager.release_resource("unknown"));
    EXPECT_EQ(manager.get_resource("unknown"), nullptr);
}

TEST_F(ResourceManagerTest, ForceGcDropsReleasedHandlesWithTheirPayload) {
    auto& manager = make_manager();
    serve("released", "abcdef");
    serve("untouched", "xyz");
    load(manager, config_for("released"));
    load(manager, config_for("untouched"));

    ASSERT_NE(manager.get_resource("released"), nullptr);
    manager.release_resource("released");

    usize freed = 0;
    usize removed = 0;
    manager.on_gc_complete.connect([&](usize bytes, usize items) {
        freed = bytes;
        removed = items;
    });

    auto report = manager.force_gc();

    EXPECT_EQ(report.items_removed, 1u);
    EXPECT_EQ(report.freed_memory, 6u);
    EXPECT_EQ(removed, 1u);
    EXPECT_EQ(freed, 6u);
    EXPECT_FALSE(manager.is_cached("released"));
    EXPECT_FALSE(manager.is_tracked("released"));

    // Never referenced: bookkeeping goes, the payload stays resident
    EXPECT_FALSE(manager.is_tracked("untouched"));
    EXPECT_TRUE(manager.is_cached("untouched"));

    auto revived = manager.get_resource("untouched");
    ASSERT_NE(revived, nullptr);
    EXPECT_EQ(revived->ref_count(), 1u);
    EXPECT_EQ(revived->size(), 3u);
}

TEST_F(ResourceManagerTest, AutomaticGcExpiresEntries) {
    ResourceManagerOptions options;
    options.cache_default_ttl_ms = 1000.0;
    options.gc_interval_ms = 5000.0;
    auto& manager = make_manager(options);
    serve("blob", "abc");
    load(manager, config_for("blob"));

    int gc_runs = 0;
    manager.on_gc_complete.connect([&](usize, usize) { ++gc_runs; });

    loop.run_for(6000.0);

    EXPECT_EQ(gc_runs, 1);
    EXPECT_FALSE(manager.is_cached("blob"));
    EXPECT_EQ(manager.get_stats().loader.total, 0u);
}

TEST_F(ResourceManagerTest, EvictionIsReported) {
    ResourceManagerOptions options;
    options.cache_max_items = 1;
    auto& manager = make_manager(options);
    serve("a", "1");
    serve("b", "2");

    std::vector<std::string> evicted;
    manager.on_resource_evicted.connect([&](const std::string& id, const std::string& reason) {
        evicted.push_back(id + ":" + reason);
    });

    load(manager, config_for("a"));
    load(manager, config_for("b"));

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], "a:lru");
}

TEST_F(ResourceManagerTest, MemoryWarningCarriesStats) {
    ResourceManagerOptions options;
    options.cache_max_memory = 10;
    options.memory_warning_threshold = 0.5;
    auto& manager = make_manager(options);
    serve("blob", "abcdef");

    std::optional<ResourceManagerStats> warning;
    manager.on_memory_warning.connect([&](const ResourceManagerStats& stats) { warning = stats; });

    load(manager, config_for("blob"));

    ASSERT_TRUE(warning.has_value());
    EXPECT_EQ(warning->cache.used, 6u);
    EXPECT_DOUBLE_EQ(warning->cache.utilization, 0.6);
}

// ============================================================================
// Batches and preloading
// ============================================================================

TEST_F(ResourceManagerTest, BatchResolvesHandlesInOrder) {
    auto& manager = make_manager();
    serve("a", "1");
    serve("b", "22");

    std::string batch_id;
    usize batch_size = 0;
    manager.on_batch_complete.connect([&](const std::string& id, const std::vector<ResourceRefPtr>& refs) {
        batch_id = id;
        batch_size = refs.size();
    });

    auto future = manager.load_batch({config_for("a"), config_for("b")});
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    ASSERT_TRUE(future.result().is_ok());
    const auto& refs = future.result().value();
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0]->id(), "a");
    EXPECT_EQ(refs[1]->id(), "b");
    EXPECT_EQ(batch_id, "batch_1");
    EXPECT_EQ(batch_size, 2u);
}

TEST_F(ResourceManagerTest, BatchFailureDoesNotAbortSiblings) {
    auto& manager = make_manager();
    serve("a", "1");
    transport.respond_status("https://assets.test/bad", 500);

    bool completed = false;
    manager.on_batch_complete.connect([&](const std::string&, const std::vector<ResourceRefPtr>&) {
        completed = true;
    });

    auto future = manager.load_batch({config_for("a"), config_for("bad")}, std::string("level"));
    loop.run_until_idle();

    ASSERT_TRUE(future.result().is_err());
    EXPECT_EQ(future.result().error().status, 500);
    EXPECT_FALSE(completed);
    EXPECT_TRUE(manager.is_cached("a"));
}

TEST_F(ResourceManagerTest, PreloadRunsChunksAndSwallowsFailures) {
    ResourceManagerOptions options;
    options.preload_batch_size = 2;
    auto& manager = make_manager(options);
    serve("a", "1");
    transport.respond_status("https://assets.test/bad", 500);
    serve("c", "3");

    auto future = manager.preload_resources({config_for("a"), config_for("bad"), config_for("c")});
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    ASSERT_TRUE(future.result().is_ok());
    EXPECT_EQ(future.result().value(), 1u);
    EXPECT_TRUE(manager.is_cached("a"));
    EXPECT_TRUE(manager.is_cached("c"));
    EXPECT_EQ(transport.request_count("https://assets.test/c"), 1u);
}

TEST_F(ResourceManagerTest, PreloadDisabledDoesNothing) {
    ResourceManagerOptions options;
    options.enable_preloading = false;
    auto& manager = make_manager(options);

    auto future = manager.preload_resources({config_for("a")});
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    EXPECT_EQ(future.result().value(), 0u);
    EXPECT_TRUE(transport.requests.empty());
}

// ============================================================================
// Cancellation and teardown
// ============================================================================

TEST_F(ResourceManagerTest, CancelsInFlightLoad) {
    auto& manager = make_manager();
    transport.respond_hang("https://assets.test/slow");

    auto future = manager.load_resource(config_for("slow"));
    loop.run_until_idle();
    ASSERT_TRUE(manager.get_loading_progress("slow").has_value());
    EXPECT_FALSE(manager.get_loading_progress("unknown").has_value());

    EXPECT_TRUE(manager.cancel_resource_loading("slow"));
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    EXPECT_TRUE(future.result().error().is_cancelled());
    EXPECT_FALSE(manager.is_tracked("slow"));
}

TEST_F(ResourceManagerTest, ClearDisposesHandlesAndResetsCounters) {
    auto& pool = make_pool();
    auto& manager = make_manager();
    serve("sprite", "png");
    serve("blob", "abc");

    auto sprite = load(manager, config_for("sprite", ResourceType::Texture));
    auto blob = load(manager, config_for("blob"));
    ASSERT_NE(sprite, nullptr);
    ASSERT_NE(blob, nullptr);

    manager.clear();

    EXPECT_TRUE(sprite->is_disposed());
    EXPECT_TRUE(blob->is_disposed());
    EXPECT_FALSE(sprite->as<GpuTextureResource>()->texture()->in_use());
    EXPECT_FALSE(manager.is_cached("blob"));
    EXPECT_EQ(pool.get_stats().textures_in_use, 0u);

    auto stats = manager.get_stats();
    EXPECT_EQ(stats.references.total_refs, 0u);
    EXPECT_DOUBLE_EQ(stats.performance.cache_hit_rate, 0.0);
    EXPECT_DOUBLE_EQ(stats.performance.average_load_time, 0.0);
}

TEST_F(ResourceManagerTest, DisposeRejectsPendingLoads) {
    auto& manager = make_manager();
    transport.respond_hang("https://assets.test/slow");

    auto future = manager.load_resource(config_for("slow"));
    loop.run_until_idle();
    manager.dispose();
    loop.run_until_idle();

    ASSERT_TRUE(future.is_ready());
    EXPECT_TRUE(future.result().error().is_cancelled());
}

// ============================================================================
// ResourceRef
// ============================================================================

TEST(ResourceRefTest, CountsAndEligibility) {
    ResourceRef ref("id", "url", ResourceType::Binary,
                    std::make_shared<BinaryResource>(std::vector<u8>{1, 2}), 2, true);

    ref.remove_ref();
    EXPECT_EQ(ref.ref_count(), 0u);
    EXPECT_FALSE(ref.gc_eligible());

    ref.add_ref();
    EXPECT_FALSE(ref.gc_eligible());
    ref.remove_ref();
    EXPECT_TRUE(ref.gc_eligible());

    ref.add_ref();
    EXPECT_FALSE(ref.gc_eligible());
}

TEST(ResourceRefTest, DisposeRunsHookOnce) {
    int calls = 0;
    std::string disposed_id;
    ResourceRef ref("id", "url", ResourceType::Binary, nullptr, 0, false,
                    [&](const std::string& id) {
                        ++calls;
                        disposed_id = id;
                    });

    ref.add_ref();
    ref.dispose();
    ref.dispose();

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(disposed_id, "id");
    EXPECT_EQ(ref.ref_count(), 0u);

    ref.add_ref();
    EXPECT_EQ(ref.ref_count(), 0u);
}
