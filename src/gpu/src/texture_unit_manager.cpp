#include "vellum/gpu/texture_unit_manager.hpp"
#include "vellum/core/logger.hpp"
#include <algorithm>

namespace vellum::gpu {

TextureUnitManager::TextureUnitManager(i32 max_units)
    : m_max_units(std::max(max_units, 0)) {
    // Highest unit at the front so pop_back hands out unit 0 first
    m_available_units.reserve(static_cast<usize>(m_max_units));
    for (i32 unit = m_max_units - 1; unit >= 0; --unit) {
        m_available_units.push_back(unit);
    }
}

std::optional<i32> TextureUnitManager::allocate_unit() {
    if (!m_available_units.empty()) {
        i32 unit = m_available_units.back();
        m_available_units.pop_back();
        m_used_units.insert(unit);
        return unit;
    }
    return reclaim_unit();
}

std::optional<i32> TextureUnitManager::reclaim_unit() {
    std::optional<i32> candidate;
    f64 oldest = 0.0;

    for (i32 unit : m_used_units) {
        auto it = m_unit_textures.find(unit);
        std::shared_ptr<PooledTexture> texture;
        if (it != m_unit_textures.end()) {
            texture = it->second.lock();
        }

        // A used unit with no live texture is free to take
        if (!texture) {
            m_unit_textures.erase(unit);
            return unit;
        }
        if (texture->in_use()) {
            continue;
        }
        if (!candidate || texture->last_used() < oldest ||
            (texture->last_used() == oldest && unit < *candidate)) {
            candidate = unit;
            oldest = texture->last_used();
        }
    }

    if (!candidate) {
        return std::nullopt;
    }

    if (auto texture = m_unit_textures[*candidate].lock()) {
        logging::get("texture_pool").debug_fmt("Reclaiming unit {} from {}", *candidate, texture->id());
        texture->unbind();
    }
    m_unit_textures.erase(*candidate);
    return candidate;
}

void TextureUnitManager::release_unit(i32 unit) {
    if (m_used_units.erase(unit) == 0) {
        return;
    }
    auto it = m_unit_textures.find(unit);
    if (it != m_unit_textures.end()) {
        if (auto texture = it->second.lock()) {
            if (texture->texture_unit() == unit) {
                texture->unbind();
            }
        }
        m_unit_textures.erase(it);
    }
    m_available_units.push_back(unit);
}

void TextureUnitManager::bind_texture(i32 unit, const std::shared_ptr<PooledTexture>& texture) {
    if (!texture || unit < 0 || unit >= m_max_units) {
        return;
    }
    m_unit_textures[unit] = texture;
    texture->bind(unit);
}

std::shared_ptr<PooledTexture> TextureUnitManager::texture_on(i32 unit) const {
    auto it = m_unit_textures.find(unit);
    return it == m_unit_textures.end() ? nullptr : it->second.lock();
}

TextureUnitStats TextureUnitManager::get_stats() const {
    return {m_available_units.size(), m_used_units.size(), static_cast<usize>(m_max_units)};
}

} // namespace vellum::gpu
