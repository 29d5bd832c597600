#include "vellum/resource/resource_ref.hpp"

namespace vellum::resource {

void ResourceRef::add_ref() {
    if (m_disposed) {
        return;
    }
    ++m_ref_count;
    m_gc_eligible = false;
}

void ResourceRef::remove_ref() {
    if (m_disposed || m_ref_count == 0) {
        return;
    }
    if (--m_ref_count == 0) {
        m_gc_eligible = true;
    }
}

void ResourceRef::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    m_ref_count = 0;
    m_gc_eligible = false;
    if (m_on_dispose) {
        auto hook = std::move(m_on_dispose);
        m_on_dispose = nullptr;
        hook(m_id);
    }
}

} // namespace vellum::resource
