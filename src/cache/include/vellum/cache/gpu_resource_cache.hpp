#pragma once

#include "disposable.hpp"
#include "lru_cache.hpp"

namespace vellum::cache {

template<typename T>
CacheOptions<T> gpu_cache_defaults() {
    CacheOptions<T> options;
    options.max_memory = 64 * MiB;
    options.max_items = 200;
    options.default_ttl_ms = 10.0 * 60.0 * 1000.0;
    options.name = "gpu_cache";
    return options;
}

/**
 * LRU cache for values owning GPU objects. Every value leaving the cache
 * through eviction, expiry, removal, replacement or clear() is disposed.
 * T is a shared_ptr to the resource type.
 */
template<typename T>
class GPUResourceCache : public LRUCache<T> {
public:
    using Options = typename LRUCache<T>::Options;

    explicit GPUResourceCache(EventLoop& loop, Options options = gpu_cache_defaults<T>())
        : LRUCache<T>(loop, std::move(options)) {}

    ~GPUResourceCache() override {
        this->dispose();
    }

    [[nodiscard]] usize disposed_count() const { return m_disposed; }

protected:
    void on_value_evicted(const T& value, EvictReason reason) override {
        (void)reason;
        dispose_value(value);
    }

    void on_value_removed(const T& value) override {
        dispose_value(value);
    }

    void on_values_cleared(std::vector<T>& values) override {
        for (const auto& value : values) {
            dispose_value(value);
        }
    }

    void on_value_replaced(const T& previous, const T& current) override {
        if (previous != current) {
            dispose_value(previous);
        }
    }

private:
    void dispose_value(const T& value) {
        if (dispose_if_capable(value)) {
            ++m_disposed;
        }
    }

    usize m_disposed{0};
};

} // namespace vellum::cache
