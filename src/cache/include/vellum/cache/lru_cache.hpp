#pragma once

/**
 * LRU Cache Implementation
 *
 * Memory-bounded, TTL-aware key/value cache. Entries live in a hash map and
 * in an intrusive doubly linked list ordered from most to least recently
 * used; the two structures always hold exactly the same entries.
 */

#include "vellum/core/event_loop.hpp"
#include "vellum/core/logger.hpp"
#include "vellum/core/signal.hpp"
#include "vellum/core/types.hpp"
#include <algorithm>
#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vellum::cache {

enum class EvictReason : u8 {
    Lru,     // item count limit
    Memory,  // byte limit or optimize()
    Ttl,     // expired
};

[[nodiscard]] constexpr std::string_view to_string(EvictReason reason) {
    switch (reason) {
        case EvictReason::Lru: return "lru";
        case EvictReason::Memory: return "memory";
        case EvictReason::Ttl: return "ttl";
    }
    return "unknown";
}

template<typename T>
struct CacheItem {
    std::string key;
    T value;
    usize size{0};
    f64 access_time{0.0};
    f64 create_time{0.0};
    u64 access_count{0};
    std::optional<f64> ttl;  // milliseconds, unset means no expiry
};

struct CacheMemoryStats {
    usize used{0};
    usize limit{0};
    f64 utilization{0.0};
    usize item_count{0};
    f64 hit_rate{0.0};
    u64 evicted_count{0};
};

// Raw lookup counters, reset by clear()
struct CacheCounters {
    u64 hits{0};
    u64 misses{0};
    u64 evictions{0};
};

struct GcReport {
    usize freed_memory{0};
    usize items_removed{0};
};

template<typename T>
struct CacheOptions {
    /// @brief Byte budget for the sum of entry sizes
    usize max_memory{100 * MiB};

    /// @brief Maximum number of entries
    usize max_items{1000};

    /// @brief Utilization at which memory_warning fires
    f64 memory_warning_threshold{0.8};

    /// @brief Period of the background TTL sweep, 0 disables it
    f64 gc_interval_ms{30000.0};

    /// @brief TTL applied when set() gets none, 0 means entries never expire
    f64 default_ttl_ms{5.0 * 60.0 * 1000.0};

    /// @brief Size strategy used when set() is not given an explicit size
    std::function<usize(const T&)> size_of;

    /// @brief Size recorded when no strategy applies or the strategy fails
    usize default_item_size{1024};

    /// @brief Logger name
    std::string name{"cache"};
};

namespace detail {

template<typename T>
std::optional<usize> intrinsic_size(const T& value) {
    if constexpr (requires { { value->byte_size() } -> std::convertible_to<usize>; }) {
        if (!value) {
            return std::nullopt;
        }
        return static_cast<usize>(value->byte_size());
    } else if constexpr (requires { { value.byte_size() } -> std::convertible_to<usize>; }) {
        return static_cast<usize>(value.byte_size());
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string_view(value).size();
    } else {
        return std::nullopt;
    }
}

} // namespace detail

template<typename T>
class LRUCache {
public:
    using Item = CacheItem<T>;
    using Options = CacheOptions<T>;

    LRUCache(EventLoop& loop, Options options = {})
        : m_loop(loop), m_options(std::move(options)) {
        if (m_options.gc_interval_ms > 0.0) {
            m_gc_timer = m_loop.schedule_repeating(m_options.gc_interval_ms, [this] {
                force_gc();
            });
        }
    }

    virtual ~LRUCache() {
        stop_gc_timer();
    }

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    // ------------------------------------------------------------------------
    // Access
    // ------------------------------------------------------------------------

    std::optional<T> get(const std::string& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            ++m_misses;
            on_miss.emit(key);
            return std::nullopt;
        }

        Node* node = it->second.get();
        f64 now = m_loop.now_ms();
        if (is_expired(node->item, now)) {
            evict_node(node, EvictReason::Ttl);
            ++m_misses;
            on_miss.emit(key);
            return std::nullopt;
        }

        node->item.access_time = now;
        ++node->item.access_count;
        move_to_head(node);

        // Copied before emitting: a hit handler may remove the entry
        T value = node->item.value;
        ++m_hits;
        on_hit.emit(key);
        return value;
    }

    void set(const std::string& key, T value,
             std::optional<usize> size = std::nullopt,
             std::optional<f64> ttl_ms = std::nullopt) {
        usize item_size = size ? *size : estimate_size(value);
        f64 ttl = ttl_ms ? *ttl_ms : m_options.default_ttl_ms;
        f64 now = m_loop.now_ms();

        auto it = m_map.find(key);
        if (it != m_map.end()) {
            Node* node = it->second.get();
            T previous = std::move(node->item.value);

            m_current_size -= node->item.size;
            m_current_size += item_size;

            node->item.value = std::move(value);
            node->item.size = item_size;
            node->item.access_time = now;
            node->item.create_time = now;
            node->item.ttl = ttl > 0.0 ? std::optional<f64>(ttl) : std::nullopt;
            ++node->item.access_count;
            move_to_head(node);

            on_value_replaced(previous, node->item.value);
        } else {
            auto node = std::make_unique<Node>();
            node->item.key = key;
            node->item.value = std::move(value);
            node->item.size = item_size;
            node->item.access_time = now;
            node->item.create_time = now;
            node->item.access_count = 1;
            node->item.ttl = ttl > 0.0 ? std::optional<f64>(ttl) : std::nullopt;

            Node* raw = node.get();
            m_map.emplace(key, std::move(node));
            push_head(raw);
            m_current_size += item_size;
        }

        on_set.emit(key, item_size);
        enforce_limits();
        check_memory_warning();
    }

    [[nodiscard]] bool has(const std::string& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return false;
        }
        if (is_expired(it->second->item, m_loop.now_ms())) {
            evict_node(it->second.get(), EvictReason::Ttl);
            return false;
        }
        return true;
    }

    bool remove(const std::string& key) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return false;
        }
        T value = std::move(it->second->item.value);
        unlink_and_erase(it->second.get());
        on_value_removed(value);
        check_memory_warning();
        return true;
    }

    // Restart the entry lifetime with a new TTL, 0 removes the expiry
    bool update_ttl(const std::string& key, f64 ttl_ms) {
        auto it = m_map.find(key);
        if (it == m_map.end()) {
            return false;
        }
        auto& item = it->second->item;
        item.ttl = ttl_ms > 0.0 ? std::optional<f64>(ttl_ms) : std::nullopt;
        item.create_time = m_loop.now_ms();
        return true;
    }

    // Snapshots, most recently used first
    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> result;
        result.reserve(m_map.size());
        for (Node* node = m_head; node; node = node->next) {
            result.push_back(node->item.key);
        }
        return result;
    }

    [[nodiscard]] std::vector<T> values() const {
        std::vector<T> result;
        result.reserve(m_map.size());
        for (Node* node = m_head; node; node = node->next) {
            result.push_back(node->item.value);
        }
        return result;
    }

    // Inspect an entry without touching recency or statistics
    [[nodiscard]] const Item* peek(const std::string& key) const {
        auto it = m_map.find(key);
        return it == m_map.end() ? nullptr : &it->second->item;
    }

    void clear() {
        std::vector<T> values;
        values.reserve(m_map.size());
        for (Node* node = m_head; node; node = node->next) {
            values.push_back(std::move(node->item.value));
        }

        m_map.clear();
        m_head = nullptr;
        m_tail = nullptr;
        m_current_size = 0;
        m_hits = 0;
        m_misses = 0;
        m_evicted = 0;
        m_warning_active = false;

        on_values_cleared(values);
        on_clear.emit();
    }

    // Stop the background sweep and drop every entry
    void dispose() {
        stop_gc_timer();
        clear();
    }

    [[nodiscard]] usize size() const { return m_map.size(); }
    [[nodiscard]] usize current_size() const { return m_current_size; }
    [[nodiscard]] const Options& options() const { return m_options; }

    [[nodiscard]] CacheMemoryStats get_memory_stats() const {
        CacheMemoryStats stats;
        stats.used = m_current_size;
        stats.limit = m_options.max_memory;
        stats.utilization = m_options.max_memory > 0
            ? static_cast<f64>(m_current_size) / static_cast<f64>(m_options.max_memory)
            : 0.0;
        stats.item_count = m_map.size();
        u64 lookups = m_hits + m_misses;
        stats.hit_rate = lookups > 0 ? static_cast<f64>(m_hits) / static_cast<f64>(lookups) : 0.0;
        stats.evicted_count = m_evicted;
        return stats;
    }

    [[nodiscard]] CacheCounters peek_stats() const {
        return CacheCounters{m_hits, m_misses, m_evicted};
    }

    // ------------------------------------------------------------------------
    // Maintenance
    // ------------------------------------------------------------------------

    GcReport force_gc() {
        GcReport report;
        f64 now = m_loop.now_ms();

        std::vector<std::string> expired;
        for (Node* node = m_head; node; node = node->next) {
            if (is_expired(node->item, now)) {
                expired.push_back(node->item.key);
            }
        }

        // Handlers of earlier evictions may already have removed later keys
        for (const auto& key : expired) {
            auto it = m_map.find(key);
            if (it == m_map.end() || !is_expired(it->second->item, now)) {
                continue;
            }
            report.freed_memory += it->second->item.size;
            ++report.items_removed;
            evict_node(it->second.get(), EvictReason::Ttl);
        }

        if (report.items_removed > 0) {
            log().debug_fmt("GC removed {} expired entries, freed {} bytes",
                            report.items_removed, report.freed_memory);
            check_memory_warning();
        }
        on_gc.emit(report);
        return report;
    }

    // Evict the highest-scoring entries until utilization <= target
    GcReport optimize(f64 target_utilization = 0.7) {
        GcReport report;
        auto target = static_cast<usize>(
            static_cast<f64>(m_options.max_memory) * target_utilization);
        if (m_current_size <= target) {
            return report;
        }

        usize to_free = m_current_size - target;
        f64 now = m_loop.now_ms();

        std::vector<std::pair<f64, std::string>> scored;
        scored.reserve(m_map.size());
        for (Node* node = m_head; node; node = node->next) {
            f64 age = now - node->item.access_time;
            f64 frequency = 1.0 / static_cast<f64>(node->item.access_count + 1);
            f64 score = age * frequency + static_cast<f64>(node->item.size) * 0.1;
            scored.emplace_back(score, node->item.key);
        }
        std::stable_sort(scored.begin(), scored.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });

        for (const auto& entry : scored) {
            if (report.freed_memory >= to_free) {
                break;
            }
            auto it = m_map.find(entry.second);
            if (it == m_map.end()) {
                continue;
            }
            report.freed_memory += it->second->item.size;
            ++report.items_removed;
            evict_node(it->second.get(), EvictReason::Memory);
        }

        log().debug_fmt("Optimized to {}: freed {} bytes across {} entries",
                        target_utilization, report.freed_memory, report.items_removed);
        check_memory_warning();
        return report;
    }

    // ------------------------------------------------------------------------
    // Events
    // ------------------------------------------------------------------------

    Signal<const std::string&> on_hit;
    Signal<const std::string&> on_miss;
    Signal<const std::string&, usize> on_set;
    Signal<const std::string&, const T&, EvictReason> on_evict;
    Signal<> on_clear;
    Signal<const CacheMemoryStats&> on_memory_warning;
    Signal<const GcReport&> on_gc;

protected:
    // Hooks for specializations; called after the entry left the cache
    virtual void on_value_evicted(const T& value, EvictReason reason) {
        (void)value;
        (void)reason;
    }
    virtual void on_value_removed(const T& value) { (void)value; }
    virtual void on_values_cleared(std::vector<T>& values) { (void)values; }
    virtual void on_value_replaced(const T& previous, const T& current) {
        (void)previous;
        (void)current;
    }

    [[nodiscard]] EventLoop& loop() { return m_loop; }

    [[nodiscard]] Logger& log() const { return logging::get(m_options.name); }

private:
    struct Node {
        Item item;
        Node* prev{nullptr};
        Node* next{nullptr};
    };

    usize estimate_size(const T& value) const {
        try {
            if (m_options.size_of) {
                return m_options.size_of(value);
            }
            if (auto size = detail::intrinsic_size(value)) {
                return *size;
            }
        } catch (const std::exception& e) {
            log().debug_fmt("Size estimate failed ({}), using {} bytes",
                            e.what(), m_options.default_item_size);
        }
        return m_options.default_item_size;
    }

    [[nodiscard]] static bool is_expired(const Item& item, f64 now) {
        return item.ttl && (now - item.create_time) > *item.ttl;
    }

    void enforce_limits() {
        while (m_tail && (m_map.size() > m_options.max_items ||
                          m_current_size > m_options.max_memory)) {
            EvictReason reason = m_map.size() > m_options.max_items
                ? EvictReason::Lru : EvictReason::Memory;
            evict_node(m_tail, reason);
        }
    }

    void check_memory_warning() {
        auto stats = get_memory_stats();
        if (stats.utilization >= m_options.memory_warning_threshold) {
            if (!m_warning_active) {
                m_warning_active = true;
                log().warn_fmt("Memory utilization at {}% ({} of {} bytes)",
                               stats.utilization * 100.0, stats.used, stats.limit);
                on_memory_warning.emit(stats);
            }
        } else {
            m_warning_active = false;
        }
    }

    void evict_node(Node* node, EvictReason reason) {
        std::string key = node->item.key;
        T value = std::move(node->item.value);
        unlink_and_erase(node);
        ++m_evicted;

        log().debug_fmt("Evicted '{}' ({})", key, to_string(reason));
        on_evict.emit(key, value, reason);
        on_value_evicted(value, reason);
    }

    void unlink_and_erase(Node* node) {
        std::string key = node->item.key;
        m_current_size -= node->item.size;
        unlink(node);
        m_map.erase(key);
    }

    void push_head(Node* node) {
        node->prev = nullptr;
        node->next = m_head;
        if (m_head) {
            m_head->prev = node;
        }
        m_head = node;
        if (!m_tail) {
            m_tail = node;
        }
    }

    void unlink(Node* node) {
        if (node->prev) {
            node->prev->next = node->next;
        } else {
            m_head = node->next;
        }
        if (node->next) {
            node->next->prev = node->prev;
        } else {
            m_tail = node->prev;
        }
        node->prev = nullptr;
        node->next = nullptr;
    }

    void move_to_head(Node* node) {
        if (node == m_head) {
            return;
        }
        unlink(node);
        push_head(node);
    }

    void stop_gc_timer() {
        if (m_gc_timer != INVALID_TIMER) {
            m_loop.cancel(m_gc_timer);
            m_gc_timer = INVALID_TIMER;
        }
    }

    EventLoop& m_loop;
    Options m_options;

    std::unordered_map<std::string, std::unique_ptr<Node>> m_map;
    Node* m_head{nullptr};
    Node* m_tail{nullptr};
    usize m_current_size{0};

    u64 m_hits{0};
    u64 m_misses{0};
    u64 m_evicted{0};
    bool m_warning_active{false};
    TimerId m_gc_timer{INVALID_TIMER};
};

} // namespace vellum::cache
