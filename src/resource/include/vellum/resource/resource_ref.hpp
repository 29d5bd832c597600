#pragma once

#include "vellum/network/resource.hpp"
#include <functional>
#include <memory>
#include <string>

namespace vellum::resource {

/**
 * Counted handle to a loaded resource.
 *
 * The count is cooperative bookkeeping only: the cached payload stays
 * resident until the cache evicts or expires it. When the count drops back
 * to zero the handle becomes GC-eligible, and the next manager GC pass
 * drops both the handle and its cached payload.
 */
class ResourceRef {
public:
    using DisposeHook = std::function<void(const std::string&)>;

    ResourceRef(std::string id, std::string url, network::ResourceType type,
                network::ResourcePtr data, usize size, bool cached,
                DisposeHook on_dispose = {})
        : m_id(std::move(id))
        , m_url(std::move(url))
        , m_type(type)
        , m_data(std::move(data))
        , m_size(size)
        , m_cached(cached)
        , m_on_dispose(std::move(on_dispose)) {}

    ResourceRef(const ResourceRef&) = delete;
    ResourceRef& operator=(const ResourceRef&) = delete;

    [[nodiscard]] const std::string& id() const { return m_id; }
    [[nodiscard]] const std::string& url() const { return m_url; }
    [[nodiscard]] network::ResourceType type() const { return m_type; }
    [[nodiscard]] const network::ResourcePtr& data() const { return m_data; }
    [[nodiscard]] usize size() const { return m_size; }
    [[nodiscard]] bool cached() const { return m_cached; }
    [[nodiscard]] u32 ref_count() const { return m_ref_count; }
    [[nodiscard]] bool gc_eligible() const { return m_gc_eligible; }
    [[nodiscard]] bool is_disposed() const { return m_disposed; }

    // Typed view of the payload, nullptr on a type mismatch
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> as() const {
        return std::dynamic_pointer_cast<T>(m_data);
    }

    void add_ref();
    void remove_ref();

    // Runs the dispose hook once; later calls do nothing
    void dispose();

private:
    std::string m_id;
    std::string m_url;
    network::ResourceType m_type;
    network::ResourcePtr m_data;
    usize m_size;
    bool m_cached;
    DisposeHook m_on_dispose;

    u32 m_ref_count{0};
    bool m_gc_eligible{false};
    bool m_disposed{false};
};

using ResourceRefPtr = std::shared_ptr<ResourceRef>;

} // namespace vellum::resource
