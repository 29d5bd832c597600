/**
 * Enhanced Resource Manager implementation
 */

#include "vellum/resource/resource_manager.hpp"
#include "vellum/core/logger.hpp"
#include "vellum/resource/gpu_texture_resource.hpp"
#include <algorithm>

namespace vellum::resource {

namespace {

Logger& log() {
    return logging::get("resource_manager");
}

cache::CacheOptions<network::ResourcePtr> general_cache_options(const ResourceManagerOptions& options) {
    cache::CacheOptions<network::ResourcePtr> result;
    result.max_memory = options.cache_max_memory;
    result.max_items = options.cache_max_items;
    result.default_ttl_ms = options.cache_default_ttl_ms;
    result.memory_warning_threshold = options.memory_warning_threshold;
    // The manager sweeps both caches itself when auto GC is on
    result.gc_interval_ms = options.auto_gc ? 0.0 : options.gc_interval_ms;
    result.name = "cache";
    return result;
}

cache::CacheOptions<network::ResourcePtr> gpu_cache_options(const ResourceManagerOptions& options) {
    auto result = cache::gpu_cache_defaults<network::ResourcePtr>();
    result.max_memory = options.gpu_cache_max_memory;
    result.max_items = options.gpu_cache_max_items;
    result.default_ttl_ms = options.cache_default_ttl_ms;
    result.gc_interval_ms = options.auto_gc ? 0.0 : options.gc_interval_ms;
    return result;
}

struct BatchCollector {
    explicit BatchCollector(EventLoop& loop) : promise(loop) {}

    std::string id;
    Promise<std::vector<ResourceRefPtr>> promise;
    std::vector<std::optional<ResourceResult<ResourceRefPtr>>> results;
    usize remaining{0};
};

} // anonymous namespace

struct EnhancedResourceManager::PreloadState {
    explicit PreloadState(EventLoop& loop) : promise(loop) {}

    Promise<usize> promise;
    std::vector<network::ResourceConfig> configs;
    usize next{0};
    usize loaded{0};
};

// ============================================================================
// Construction
// ============================================================================

EnhancedResourceManager::EnhancedResourceManager(const ResourceContext& context,
                                                 ResourceManagerOptions options)
    : m_loop(context.loop)
    , m_texture_pool(context.texture_pool)
    , m_options(std::move(options))
    , m_loader(context.loop, context.transport, context.decoders, m_options.loader)
    , m_cache(context.loop, context.memory_pressure, general_cache_options(m_options),
              m_options.pressure_check_interval_ms)
    , m_gpu_cache(context.loop, gpu_cache_options(m_options))
    , m_alive(std::make_shared<bool>(true)) {
    connect_events();

    if (m_options.auto_gc && m_options.gc_interval_ms > 0.0) {
        m_gc_timer = m_loop.schedule_repeating(m_options.gc_interval_ms, [this] {
            force_gc();
        });
    }
}

EnhancedResourceManager::~EnhancedResourceManager() {
    dispose();
}

void EnhancedResourceManager::connect_events() {
    m_loader.on_task_progress.connect(
        [this](const network::LoadingTask& task, const network::LoadingProgress& progress) {
            on_loading_progress.emit(task.config.id, progress);
        });

    m_cache.on_evict.connect(
        [this](const std::string& key, const network::ResourcePtr&, cache::EvictReason reason) {
            on_resource_evicted.emit(key, std::string(cache::to_string(reason)));
        });

    m_gpu_cache.on_evict.connect(
        [this](const std::string& key, const network::ResourcePtr&, cache::EvictReason reason) {
            on_resource_evicted.emit(key, "gpu_" + std::string(cache::to_string(reason)));
        });

    m_cache.on_memory_warning.connect([this](const cache::CacheMemoryStats&) {
        on_memory_warning.emit(get_stats());
    });
}

// ============================================================================
// Loading
// ============================================================================

Future<ResourceRefPtr> EnhancedResourceManager::load_resource(const network::ResourceConfig& config) {
    if (m_disposed) {
        return make_failed_future<ResourceRefPtr>(
            m_loop, ResourceError::configuration("Resource manager has been disposed"));
    }

    if (auto cached = find_cached(config.id)) {
        ++m_cache_hits;
        on_resource_loaded.emit(cached);
        return make_ready_future(m_loop, cached);
    }

    auto inflight = m_inflight.find(config.id);
    if (inflight != m_inflight.end()) {
        return inflight->second;
    }

    ++m_cache_misses;

    Promise<ResourceRefPtr> promise(m_loop);
    auto future = promise.future();
    m_inflight.emplace(config.id, future);

    f64 started_at = m_loop.now_ms();
    std::weak_ptr<bool> alive = m_alive;
    m_loader.load_resource(config).then(
        [this, alive, config, started_at, promise](const ResourceResult<network::ResourcePtr>& result) mutable {
            if (!alive.lock() || m_disposed) {
                promise.reject(ResourceError::cancelled());
                return;
            }
            finish_load(config, started_at, result, std::move(promise));
        });
    return future;
}

void EnhancedResourceManager::finish_load(const network::ResourceConfig& config, f64 started_at,
                                          const ResourceResult<network::ResourcePtr>& result,
                                          Promise<ResourceRefPtr> promise) {
    auto inflight = m_inflight.find(config.id);
    if (inflight != m_inflight.end() && inflight->second.shares_state_with(promise.future())) {
        m_inflight.erase(inflight);
    }

    if (!result) {
        if (result.error().is_cancelled()) {
            log().debug_fmt("Load of {} was cancelled", config.id);
        } else {
            log().error_fmt("Failed to load resource {}: {}", config.id, result.error().describe());
        }
        promise.reject(result.error());
        return;
    }

    auto payload = prepare_payload(config, result.value());
    if (!payload) {
        log().error_fmt("Failed to prepare resource {}: {}", config.id, payload.error().describe());
        promise.reject(payload.error());
        return;
    }

    network::ResourcePtr data = payload.value();
    usize size = data ? data->byte_size() : 0;
    auto ref = make_ref(config.id, config.url, config.type, data, size);

    cache_resource(config.id, data, size);
    m_references[config.id] = ref;

    m_total_load_time += m_loop.now_ms() - started_at;
    ++m_load_count;

    on_resource_loaded.emit(ref);
    on_resource_cached.emit(config.id, size);
    promise.resolve(ref);
}

ResourceResult<network::ResourcePtr> EnhancedResourceManager::prepare_payload(
    const network::ResourceConfig& config, network::ResourcePtr data) {
    if (!m_options.upload_textures || !m_texture_pool || config.type != network::ResourceType::Texture) {
        return data;
    }
    auto image = std::dynamic_pointer_cast<network::ImageResource>(data);
    if (!image) {
        return data;
    }

    try {
        return network::ResourcePtr(upload_image(*m_texture_pool, *image));
    } catch (const CapacityError& e) {
        return make_error(ResourceError::capacity(e.what()));
    } catch (const ConfigurationError& e) {
        return make_error(ResourceError::configuration(e.what()));
    }
}

Future<std::vector<ResourceRefPtr>> EnhancedResourceManager::load_batch(
    const std::vector<network::ResourceConfig>& configs, std::optional<std::string> batch_id) {
    auto batch = std::make_shared<BatchCollector>(m_loop);
    batch->id = batch_id ? *batch_id : "batch_" + std::to_string(m_next_batch_id++);
    batch->results.resize(configs.size());
    batch->remaining = configs.size();

    auto future = batch->promise.future();
    if (configs.empty()) {
        on_batch_complete.emit(batch->id, {});
        batch->promise.resolve({});
        return future;
    }

    std::weak_ptr<bool> alive = m_alive;
    for (usize i = 0; i < configs.size(); ++i) {
        load_resource(configs[i]).then([this, alive, batch, i](const ResourceResult<ResourceRefPtr>& result) {
            batch->results[i] = result;
            if (--batch->remaining > 0) {
                return;
            }

            std::vector<ResourceRefPtr> refs;
            refs.reserve(batch->results.size());
            for (const auto& member : batch->results) {
                if (!*member) {
                    if (alive.lock()) {
                        log().error_fmt("Batch loading failed for {}: {}",
                                        batch->id, member->error().describe());
                    }
                    batch->promise.reject(member->error());
                    return;
                }
                refs.push_back(member->value());
            }

            if (alive.lock()) {
                on_batch_complete.emit(batch->id, refs);
            }
            batch->promise.resolve(std::move(refs));
        });
    }
    return future;
}

Future<usize> EnhancedResourceManager::preload_resources(const std::vector<network::ResourceConfig>& configs) {
    if (!m_options.enable_preloading || configs.empty()) {
        return make_ready_future<usize>(m_loop, 0);
    }

    auto state = std::make_shared<PreloadState>(m_loop);
    state->configs = configs;
    auto future = state->promise.future();
    preload_next(state);
    return future;
}

void EnhancedResourceManager::preload_next(const std::shared_ptr<PreloadState>& state) {
    if (state->next >= state->configs.size()) {
        state->promise.resolve(state->loaded);
        return;
    }

    usize batch_size = std::max<usize>(m_options.preload_batch_size, 1);
    usize end = std::min(state->next + batch_size, state->configs.size());
    std::vector<network::ResourceConfig> chunk(state->configs.begin() + static_cast<std::ptrdiff_t>(state->next),
                                               state->configs.begin() + static_cast<std::ptrdiff_t>(end));
    state->next = end;

    std::string id = "preload_" + std::to_string(m_next_batch_id++);
    std::weak_ptr<bool> alive = m_alive;
    usize count = chunk.size();
    load_batch(chunk, id).then(
        [this, alive, state, id, count](const ResourceResult<std::vector<ResourceRefPtr>>& result) {
            if (!alive.lock() || m_disposed) {
                state->promise.resolve(state->loaded);
                return;
            }
            if (result) {
                state->loaded += count;
            } else {
                log().warn_fmt("Preload batch {} failed: {}", id, result.error().describe());
            }
            preload_next(state);
        });
}

// ============================================================================
// References
// ============================================================================

ResourceRefPtr EnhancedResourceManager::make_ref(const std::string& id, const std::string& url,
                                                 network::ResourceType type,
                                                 network::ResourcePtr data, usize size) {
    std::weak_ptr<bool> alive = m_alive;
    return std::make_shared<ResourceRef>(id, url, type, std::move(data), size, true,
        [this, alive](const std::string& disposed_id) {
            if (alive.lock()) {
                purge_cached(disposed_id);
            }
        });
}

ResourceRefPtr EnhancedResourceManager::find_cached(const std::string& id) {
    network::ResourcePtr data;
    if (auto value = m_cache.get(id)) {
        data = *value;
    } else if (auto gpu_value = m_gpu_cache.get(id)) {
        data = *gpu_value;
    }
    if (!data) {
        return nullptr;
    }

    auto tracked = m_references.find(id);
    if (tracked != m_references.end() && tracked->second->data() == data &&
        !tracked->second->is_disposed()) {
        return tracked->second;
    }

    std::string url = tracked != m_references.end() ? tracked->second->url() : std::string();
    auto ref = make_ref(id, url, data->type(), data, data->byte_size());
    m_references[id] = ref;
    return ref;
}

ResourceRefPtr EnhancedResourceManager::get_resource(const std::string& id) {
    auto it = m_references.find(id);
    if (it != m_references.end() && !it->second->is_disposed()) {
        it->second->add_ref();
        return it->second;
    }

    auto cached = find_cached(id);
    if (cached) {
        cached->add_ref();
    }
    return cached;
}

bool EnhancedResourceManager::release_resource(const std::string& id) {
    auto it = m_references.find(id);
    if (it == m_references.end()) {
        return false;
    }
    it->second->remove_ref();
    return true;
}

bool EnhancedResourceManager::force_release_resource(const std::string& id) {
    auto it = m_references.find(id);
    if (it == m_references.end()) {
        return false;
    }
    auto ref = it->second;
    m_references.erase(it);
    ref->dispose();
    return true;
}

bool EnhancedResourceManager::cancel_resource_loading(const std::string& id) {
    return m_loader.cancel_resource(id);
}

std::optional<network::LoadingProgress> EnhancedResourceManager::get_loading_progress(const std::string& id) const {
    auto task = m_loader.get_task(id);
    if (!task) {
        return std::nullopt;
    }
    return task->progress;
}

// ============================================================================
// Caching
// ============================================================================

void EnhancedResourceManager::cache_resource(const std::string& id, const network::ResourcePtr& data,
                                             usize size) {
    if (cache::exposes_dispose(data)) {
        m_gpu_cache.set(id, data, size);
    } else {
        m_cache.set(id, data, size);
    }
}

void EnhancedResourceManager::purge_cached(const std::string& id) {
    m_cache.remove(id);
    m_gpu_cache.remove(id);
}

bool EnhancedResourceManager::is_cached(const std::string& id) const {
    return m_cache.peek(id) != nullptr || m_gpu_cache.peek(id) != nullptr;
}

bool EnhancedResourceManager::is_tracked(const std::string& id) const {
    return m_references.count(id) > 0;
}

cache::GcReport EnhancedResourceManager::force_gc() {
    cache::GcReport report;

    std::vector<std::string> released;
    for (const auto& [id, ref] : m_references) {
        if (ref->ref_count() == 0) {
            released.push_back(id);
        }
    }

    // Handles released back to zero also give up their cached payload
    for (const auto& id : released) {
        auto it = m_references.find(id);
        bool eligible = it->second->gc_eligible();
        m_references.erase(it);
        if (!eligible) {
            continue;
        }
        if (const auto* item = m_cache.peek(id)) {
            report.freed_memory += item->size;
            ++report.items_removed;
        }
        if (const auto* item = m_gpu_cache.peek(id)) {
            report.freed_memory += item->size;
            ++report.items_removed;
        }
        purge_cached(id);
    }

    auto general = m_cache.force_gc();
    auto gpu = m_gpu_cache.force_gc();
    report.freed_memory += general.freed_memory + gpu.freed_memory;
    report.items_removed += general.items_removed + gpu.items_removed;

    // Finished loader tasks would otherwise pin evicted payloads
    m_loader.cleanup();

    if (report.items_removed > 0) {
        log().debug_fmt("GC freed {} bytes across {} resources",
                        report.freed_memory, report.items_removed);
        on_gc_complete.emit(report.freed_memory, report.items_removed);
    }
    return report;
}

// ============================================================================
// Statistics and teardown
// ============================================================================

ResourceManagerStats EnhancedResourceManager::get_stats() const {
    ResourceManagerStats stats;
    stats.loader = m_loader.get_stats();
    stats.cache = m_cache.get_memory_stats();
    stats.gpu_cache = m_gpu_cache.get_memory_stats();

    stats.references.total_refs = m_references.size();
    stats.references.active_refs = static_cast<usize>(std::count_if(
        m_references.begin(), m_references.end(),
        [](const auto& entry) { return entry.second->ref_count() > 0; }));
    stats.references.orphaned_refs = stats.references.total_refs - stats.references.active_refs;

    if (m_load_count > 0) {
        stats.performance.average_load_time = m_total_load_time / static_cast<f64>(m_load_count);
    }
    u64 lookups = m_cache_hits + m_cache_misses;
    if (lookups > 0) {
        stats.performance.cache_hit_rate = static_cast<f64>(m_cache_hits) / static_cast<f64>(lookups);
    }
    if (stats.cache.utilization > 0.0) {
        stats.performance.memory_efficiency = stats.cache.hit_rate / stats.cache.utilization;
    }
    return stats;
}

void EnhancedResourceManager::clear() {
    m_loader.cancel_all();

    auto references = std::move(m_references);
    m_references.clear();
    for (auto& [id, ref] : references) {
        ref->dispose();
    }

    m_cache.clear();
    m_gpu_cache.clear();

    m_total_load_time = 0.0;
    m_load_count = 0;
    m_cache_hits = 0;
    m_cache_misses = 0;
}

void EnhancedResourceManager::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;

    if (m_gc_timer != INVALID_TIMER) {
        m_loop.cancel(m_gc_timer);
        m_gc_timer = INVALID_TIMER;
    }

    clear();
    m_loader.dispose();
    m_cache.dispose();
    m_gpu_cache.dispose();
    m_inflight.clear();

    on_resource_loaded.disconnect_all();
    on_resource_cached.disconnect_all();
    on_resource_evicted.disconnect_all();
    on_memory_warning.disconnect_all();
    on_loading_progress.disconnect_all();
    on_batch_complete.disconnect_all();
    on_gc_complete.disconnect_all();
}

} // namespace vellum::resource
