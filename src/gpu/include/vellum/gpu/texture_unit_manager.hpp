#pragma once

#include "pooled_texture.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vellum::gpu {

struct TextureUnitStats {
    usize available{0};
    usize used{0};
    usize total{0};
};

/**
 * Free-list allocator for hardware texture units [0, max_units).
 */
class TextureUnitManager {
public:
    explicit TextureUnitManager(i32 max_units);

    // Pops a free unit; when none is free, reclaims the unit whose texture
    // is not in use and was used least recently. nullopt if nothing qualifies.
    [[nodiscard]] std::optional<i32> allocate_unit();

    void release_unit(i32 unit);

    // Bind texture on unit and record the association
    void bind_texture(i32 unit, const std::shared_ptr<PooledTexture>& texture);

    [[nodiscard]] std::shared_ptr<PooledTexture> texture_on(i32 unit) const;
    [[nodiscard]] bool is_used(i32 unit) const { return m_used_units.count(unit) > 0; }
    [[nodiscard]] i32 max_units() const { return m_max_units; }
    [[nodiscard]] TextureUnitStats get_stats() const;

private:
    std::optional<i32> reclaim_unit();

    i32 m_max_units;
    std::vector<i32> m_available_units;
    std::unordered_set<i32> m_used_units;
    std::unordered_map<i32, std::weak_ptr<PooledTexture>> m_unit_textures;
};

} // namespace vellum::gpu
