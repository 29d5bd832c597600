#pragma once

/**
 * Enhanced Resource Manager
 *
 * Front door of the resource subsystem. Loads go through two caches
 * before reaching the AsyncResourceLoader: payloads that own GPU objects
 * live in a GPUResourceCache, everything else in a MemoryAwareLRUCache.
 * Callers receive counted ResourceRef handles.
 */

#include "resource_context.hpp"
#include "resource_ref.hpp"
#include "vellum/cache/gpu_resource_cache.hpp"
#include "vellum/cache/memory_aware_cache.hpp"
#include "vellum/network/resource_loader.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace vellum::resource {

struct ResourceManagerOptions {
    /// @brief Byte budget of the general cache
    usize cache_max_memory{200 * MiB};

    /// @brief Entry limit of the general cache
    usize cache_max_items{1000};

    /// @brief TTL of entries in both caches
    f64 cache_default_ttl_ms{10.0 * 60.0 * 1000.0};

    /// @brief Byte budget of the GPU cache
    usize gpu_cache_max_memory{128 * MiB};

    /// @brief Entry limit of the GPU cache
    usize gpu_cache_max_items{200};

    network::LoaderOptions loader;

    /// @brief preload_resources() does nothing when false
    bool enable_preloading{true};

    /// @brief Resources per preload batch; batches run one after another
    usize preload_batch_size{5};

    /// @brief Run force_gc() on a timer
    bool auto_gc{true};

    /// @brief Period of the automatic GC
    f64 gc_interval_ms{30000.0};

    /// @brief Utilization of the general cache that raises memory_warning
    f64 memory_warning_threshold{0.8};

    /// @brief Period of memory pressure sampling, 0 disables it
    f64 pressure_check_interval_ms{5000.0};

    /// @brief Upload decoded images into pooled textures when a pool is available
    bool upload_textures{true};
};

struct ReferenceStats {
    usize total_refs{0};
    usize active_refs{0};
    usize orphaned_refs{0};
};

struct PerformanceStats {
    f64 average_load_time{0.0};  // milliseconds
    f64 cache_hit_rate{0.0};
    f64 memory_efficiency{0.0};  // general cache hit rate / utilization
};

struct ResourceManagerStats {
    network::LoaderStats loader;
    cache::CacheMemoryStats cache;
    cache::CacheMemoryStats gpu_cache;
    ReferenceStats references;
    PerformanceStats performance;
};

class EnhancedResourceManager {
public:
    explicit EnhancedResourceManager(const ResourceContext& context,
                                     ResourceManagerOptions options = {});
    ~EnhancedResourceManager();

    EnhancedResourceManager(const EnhancedResourceManager&) = delete;
    EnhancedResourceManager& operator=(const EnhancedResourceManager&) = delete;

    // Cached ids resolve without touching the loader. Concurrent requests
    // for the same id share one future and one handle.
    [[nodiscard]] Future<ResourceRefPtr> load_resource(const network::ResourceConfig& config);

    // Resolves with handles in config order once every member settled,
    // or rejects with the first failure
    [[nodiscard]] Future<std::vector<ResourceRefPtr>> load_batch(
        const std::vector<network::ResourceConfig>& configs,
        std::optional<std::string> batch_id = std::nullopt);

    // Loads in sequential batches of preload_batch_size. Failed batches are
    // logged; resolves with the number of resources in batches that loaded.
    [[nodiscard]] Future<usize> preload_resources(const std::vector<network::ResourceConfig>& configs);

    // Adds a reference; nullptr when the id is neither tracked nor cached
    [[nodiscard]] ResourceRefPtr get_resource(const std::string& id);

    // Drops a reference; returns false for untracked ids
    bool release_resource(const std::string& id);

    // Disposes the handle and purges the id from both caches
    bool force_release_resource(const std::string& id);

    bool cancel_resource_loading(const std::string& id);
    [[nodiscard]] std::optional<network::LoadingProgress> get_loading_progress(const std::string& id) const;

    cache::GcReport force_gc();

    [[nodiscard]] ResourceManagerStats get_stats() const;

    // Cancels loads, disposes every handle, empties both caches and resets counters
    void clear();
    void dispose();

    [[nodiscard]] bool is_cached(const std::string& id) const;
    [[nodiscard]] bool is_tracked(const std::string& id) const;
    [[nodiscard]] network::AsyncResourceLoader& loader() { return m_loader; }
    [[nodiscard]] const ResourceManagerOptions& options() const { return m_options; }

    // Events
    Signal<const ResourceRefPtr&> on_resource_loaded;
    Signal<const std::string&, usize> on_resource_cached;
    Signal<const std::string&, const std::string&> on_resource_evicted;  // id, reason
    Signal<const ResourceManagerStats&> on_memory_warning;
    Signal<const std::string&, const network::LoadingProgress&> on_loading_progress;
    Signal<const std::string&, const std::vector<ResourceRefPtr>&> on_batch_complete;
    Signal<usize, usize> on_gc_complete;  // freed bytes, items removed

private:
    using ResourceCache = cache::MemoryAwareLRUCache<network::ResourcePtr>;
    using GpuCache = cache::GPUResourceCache<network::ResourcePtr>;

    struct PreloadState;

    void connect_events();
    [[nodiscard]] ResourceRefPtr find_cached(const std::string& id);
    void finish_load(const network::ResourceConfig& config, f64 started_at,
                     const ResourceResult<network::ResourcePtr>& result,
                     Promise<ResourceRefPtr> promise);
    [[nodiscard]] ResourceResult<network::ResourcePtr> prepare_payload(
        const network::ResourceConfig& config, network::ResourcePtr data);
    [[nodiscard]] ResourceRefPtr make_ref(const std::string& id, const std::string& url,
                                          network::ResourceType type,
                                          network::ResourcePtr data, usize size);
    void cache_resource(const std::string& id, const network::ResourcePtr& data, usize size);
    void purge_cached(const std::string& id);
    void preload_next(const std::shared_ptr<PreloadState>& state);

    EventLoop& m_loop;
    gpu::TexturePool* m_texture_pool;
    ResourceManagerOptions m_options;

    network::AsyncResourceLoader m_loader;
    ResourceCache m_cache;
    GpuCache m_gpu_cache;

    std::unordered_map<std::string, ResourceRefPtr> m_references;
    std::unordered_map<std::string, Future<ResourceRefPtr>> m_inflight;

    f64 m_total_load_time{0.0};
    u64 m_load_count{0};
    u64 m_cache_hits{0};
    u64 m_cache_misses{0};

    TimerId m_gc_timer{INVALID_TIMER};
    std::shared_ptr<bool> m_alive;
    u64 m_next_batch_id{1};
    bool m_disposed{false};
};

} // namespace vellum::resource
