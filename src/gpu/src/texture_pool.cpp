#include "vellum/gpu/texture_pool.hpp"
#include "vellum/core/error.hpp"
#include "vellum/core/logger.hpp"
#include <algorithm>

namespace vellum::gpu {

namespace {

Logger& log() {
    return logging::get("texture_pool");
}

i32 resolve_unit_count(const TexturePoolConfig& config, const GpuContext& context) {
    if (config.max_texture_units > 0) {
        return config.max_texture_units;
    }
    i32 reported = context.max_texture_units();
    return reported > 0 ? reported : config.fallback_texture_units;
}

} // anonymous namespace

TexturePool::TexturePool(EventLoop& loop, GpuContext& context, TexturePoolConfig config)
    : m_loop(loop)
    , m_context(context)
    , m_config(config)
    , m_units(resolve_unit_count(config, context)) {
    if (m_config.cleanup_interval_ms > 0.0) {
        m_cleanup_timer = m_loop.schedule_repeating(m_config.cleanup_interval_ms, [this] {
            cleanup(false);
        });
    }
    if (m_config.preallocate) {
        m_preallocate_timer = m_loop.schedule(0.0, [this] {
            m_preallocate_timer = INVALID_TIMER;
            preallocate_common_sizes();
        });
    }
}

TexturePool::~TexturePool() {
    dispose();
}

// ============================================================================
// Acquisition
// ============================================================================

std::shared_ptr<PooledTexture> TexturePool::get_texture(const TextureRequest& request) {
    if (m_disposed) {
        throw ConfigurationError("Texture pool has been disposed");
    }

    TextureConfig config = normalize(request);
    auto& pool = m_pools[static_cast<usize>(size_category(config))];
    std::string key = pool_key(config);

    auto bucket = pool.find(key);
    if (bucket != pool.end() && !bucket->second.empty()) {
        auto texture = bucket->second.back();
        bucket->second.pop_back();
        texture->reconfigure(config);
        texture->acquire(m_loop.now_ms());
        on_texture_reused.emit(*texture);
        return texture;
    }

    if (m_textures.size() >= m_config.max_textures || m_memory_usage >= m_config.memory_limit) {
        cleanup(false);
    }

    if (m_textures.size() >= m_config.max_textures) {
        log().error_fmt("Texture pool full: {} textures", m_textures.size());
        on_pool_full.emit(m_textures.size());
        throw CapacityError(format_message(
            "Texture pool is full ({} of {} textures)", m_textures.size(), m_config.max_textures));
    }

    auto texture = create_texture(config);

    if (static_cast<f64>(m_memory_usage) > static_cast<f64>(m_config.memory_limit) * 0.8) {
        log().warn_fmt("Texture memory at {} of {} bytes", m_memory_usage, m_config.memory_limit);
        on_memory_warning.emit(m_memory_usage, m_config.memory_limit);
    }

    return texture;
}

std::shared_ptr<PooledTexture> TexturePool::create_texture(const TextureConfig& config) {
    GpuHandle handle = m_context.create_texture();
    if (handle == NULL_HANDLE) {
        throw CapacityError(format_message(
            "GPU refused to create a {}x{} texture", config.width, config.height));
    }
    m_context.define_texture(handle, config);

    std::string id = "texture_" + std::to_string(m_next_texture_id++);
    auto texture = std::make_shared<PooledTexture>(id, m_context, handle, config, m_loop.now_ms());
    texture->acquire(m_loop.now_ms());

    if (m_config.manage_texture_units) {
        if (auto unit = m_units.allocate_unit()) {
            m_units.bind_texture(*unit, texture);
        }
    }

    m_textures.emplace(id, texture);
    m_memory_usage += texture->memory_usage();

    log().debug_fmt("Created {} ({}, {} bytes)", id, pool_key(config), texture->memory_usage());
    on_texture_created.emit(*texture);
    return texture;
}

void TexturePool::release_texture(const std::shared_ptr<PooledTexture>& texture) {
    if (!texture || !texture->in_use() || !owns(*texture)) {
        return;
    }

    texture->release(m_loop.now_ms());
    auto& pool = m_pools[static_cast<usize>(size_category(texture->config()))];
    pool[pool_key(texture->config())].push_back(texture);
}

bool TexturePool::owns(const PooledTexture& texture) const {
    auto it = m_textures.find(texture.id());
    return it != m_textures.end() && it->second.get() == &texture;
}

// ============================================================================
// Cleanup
// ============================================================================

CleanupReport TexturePool::cleanup(bool force) {
    CleanupReport report;
    f64 now = m_loop.now_ms();

    std::vector<std::shared_ptr<PooledTexture>> doomed;
    for (const auto& [id, texture] : m_textures) {
        bool expired = !texture->in_use() &&
                       (now - texture->last_used()) > m_config.expiration_time_ms;
        if (force || expired) {
            doomed.push_back(texture);
        }
    }

    for (const auto& texture : doomed) {
        report.memory_freed += texture->memory_usage();
        ++report.textures_removed;
        destroy_texture(texture);
    }

    if (report.textures_removed > 0) {
        log().info_fmt("Cleanup removed {} textures, freed {} bytes",
                       report.textures_removed, report.memory_freed);
        on_cleanup_performed.emit(report);
    }
    return report;
}

void TexturePool::destroy_texture(const std::shared_ptr<PooledTexture>& texture) {
    remove_from_bucket(*texture);
    // Only give the unit back if the manager recorded it for this texture
    i32 unit = texture->texture_unit();
    if (unit >= 0 && m_units.texture_on(unit) == texture) {
        m_units.release_unit(unit);
    }
    texture->dispose();

    m_memory_usage -= std::min(m_memory_usage, texture->memory_usage());
    std::string id = texture->id();
    m_textures.erase(id);
    on_texture_disposed.emit(id);
}

void TexturePool::remove_from_bucket(const PooledTexture& texture) {
    auto& pool = m_pools[static_cast<usize>(size_category(texture.config()))];
    auto bucket = pool.find(pool_key(texture.config()));
    if (bucket == pool.end()) {
        return;
    }
    auto& entries = bucket->second;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
        [&texture](const auto& entry) { return entry.get() == &texture; }), entries.end());
    if (entries.empty()) {
        pool.erase(bucket);
    }
}

// ============================================================================
// Warmup
// ============================================================================

void TexturePool::warmup_pool(const std::vector<TextureRequest>& requests) {
    for (const auto& request : requests) {
        try {
            auto texture = get_texture(request);
            release_texture(texture);
        } catch (const std::exception& e) {
            log().warn_fmt("Warmup texture skipped: {}", e.what());
        }
    }
}

void TexturePool::preallocate_common_sizes() {
    std::vector<TextureRequest> requests;
    for (u32 side : {64u, 128u, 256u, 512u}) {
        requests.push_back(TextureRequest::sized(side, side));
    }
    warmup_pool(requests);
}

// ============================================================================
// Stats / teardown
// ============================================================================

TexturePoolStats TexturePool::get_stats() const {
    TexturePoolStats stats;
    stats.total_textures = m_textures.size();
    stats.memory_usage = m_memory_usage;
    stats.memory_limit = m_config.memory_limit;
    stats.texture_units = m_units.get_stats();

    for (const auto& [id, texture] : m_textures) {
        if (texture->in_use()) {
            ++stats.textures_in_use;
        }
    }
    for (usize i = 0; i < SIZE_CATEGORY_COUNT; ++i) {
        for (const auto& [key, bucket] : m_pools[i]) {
            stats.pool_sizes[i] += bucket.size();
        }
    }
    return stats;
}

void TexturePool::dispose() {
    if (m_disposed) {
        return;
    }
    if (m_cleanup_timer != INVALID_TIMER) {
        m_loop.cancel(m_cleanup_timer);
        m_cleanup_timer = INVALID_TIMER;
    }
    if (m_preallocate_timer != INVALID_TIMER) {
        m_loop.cancel(m_preallocate_timer);
        m_preallocate_timer = INVALID_TIMER;
    }
    cleanup(true);
    for (auto& pool : m_pools) {
        pool.clear();
    }
    m_disposed = true;
}

} // namespace vellum::gpu
