#pragma once

/**
 * Texture Pool
 *
 * Reuses GPU textures across requests. Released textures are parked in a
 * bucket keyed by size category and exact pool key, and handed back out to
 * the next request with an identical key. GPU objects are only destroyed by
 * cleanup() or dispose().
 */

#include "pooled_texture.hpp"
#include "texture_unit_manager.hpp"
#include "vellum/core/event_loop.hpp"
#include "vellum/core/signal.hpp"
#include <array>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vellum::gpu {

struct TexturePoolConfig {
    /// @brief Maximum number of live textures, in use or pooled
    usize max_textures{1000};

    /// @brief Byte budget; crossing 80% raises memory_warning
    usize memory_limit{100 * MiB};

    /// @brief Idle time after which a released texture is destroyed
    f64 expiration_time_ms{300000.0};

    /// @brief Period of the background cleanup, 0 disables it
    f64 cleanup_interval_ms{60000.0};

    /// @brief Create and pool one texture per common size shortly after startup
    bool preallocate{true};

    /// @brief Allocate a texture unit for each new texture; when off, units
    ///        are only handed out on demand through texture_units()
    bool manage_texture_units{true};

    /// @brief Unit count; 0 queries the GPU context
    i32 max_texture_units{0};

    /// @brief Unit count used when the context reports none
    i32 fallback_texture_units{8};
};

struct TexturePoolStats {
    usize total_textures{0};
    usize textures_in_use{0};
    usize memory_usage{0};
    usize memory_limit{0};
    TextureUnitStats texture_units;
    std::array<usize, SIZE_CATEGORY_COUNT> pool_sizes{};
};

struct CleanupReport {
    usize textures_removed{0};
    usize memory_freed{0};
};

class TexturePool {
public:
    TexturePool(EventLoop& loop, GpuContext& context, TexturePoolConfig config = {});
    ~TexturePool();

    TexturePool(const TexturePool&) = delete;
    TexturePool& operator=(const TexturePool&) = delete;

    // Throws CapacityError when the texture count limit survives cleanup
    [[nodiscard]] std::shared_ptr<PooledTexture> get_texture(const TextureRequest& request = {});

    // No-op for textures that are not in use or not owned by this pool
    void release_texture(const std::shared_ptr<PooledTexture>& texture);

    CleanupReport cleanup(bool force = false);

    // Create and immediately release one texture per request; failures are logged
    void warmup_pool(const std::vector<TextureRequest>& requests);

    [[nodiscard]] TexturePoolStats get_stats() const;
    [[nodiscard]] usize memory_usage() const { return m_memory_usage; }
    [[nodiscard]] usize texture_count() const { return m_textures.size(); }
    [[nodiscard]] const TexturePoolConfig& config() const { return m_config; }
    [[nodiscard]] TextureUnitManager& texture_units() { return m_units; }
    [[nodiscard]] bool owns(const PooledTexture& texture) const;

    void dispose();

    // Events
    Signal<const PooledTexture&> on_texture_created;
    Signal<const PooledTexture&> on_texture_reused;
    Signal<const std::string&> on_texture_disposed;
    Signal<usize> on_pool_full;
    Signal<usize, usize> on_memory_warning;  // usage, limit
    Signal<const CleanupReport&> on_cleanup_performed;

private:
    using Bucket = std::vector<std::shared_ptr<PooledTexture>>;
    using CategoryPool = std::unordered_map<std::string, Bucket>;

    std::shared_ptr<PooledTexture> create_texture(const TextureConfig& config);
    void remove_from_bucket(const PooledTexture& texture);
    void destroy_texture(const std::shared_ptr<PooledTexture>& texture);
    void preallocate_common_sizes();

    EventLoop& m_loop;
    GpuContext& m_context;
    TexturePoolConfig m_config;
    TextureUnitManager m_units;

    std::unordered_map<std::string, std::shared_ptr<PooledTexture>> m_textures;
    std::array<CategoryPool, SIZE_CATEGORY_COUNT> m_pools;
    usize m_memory_usage{0};
    u64 m_next_texture_id{1};

    TimerId m_cleanup_timer{INVALID_TIMER};
    TimerId m_preallocate_timer{INVALID_TIMER};
    bool m_disposed{false};
};

} // namespace vellum::gpu
