#pragma once

#include "lru_cache.hpp"
#include "memory_pressure.hpp"

namespace vellum::cache {

/**
 * LRU cache that samples ambient memory pressure on a timer and trims
 * itself when the level changes: to 50% of its budget under high pressure,
 * to 70% under medium pressure, untouched when low.
 */
template<typename T>
class MemoryAwareLRUCache : public LRUCache<T> {
public:
    using Options = typename LRUCache<T>::Options;

    MemoryAwareLRUCache(EventLoop& loop, MemoryPressureSource& pressure_source,
                        Options options = {}, f64 check_interval_ms = 5000.0)
        : LRUCache<T>(loop, std::move(options))
        , m_pressure_source(pressure_source) {
        if (check_interval_ms > 0.0) {
            m_pressure_timer = this->loop().schedule_repeating(check_interval_ms, [this] {
                check_memory_pressure();
            });
        }
    }

    ~MemoryAwareLRUCache() override {
        if (m_pressure_timer != INVALID_TIMER) {
            this->loop().cancel(m_pressure_timer);
        }
    }

    [[nodiscard]] MemoryPressure memory_pressure() const { return m_pressure; }

    // Sample now; returns the (possibly unchanged) pressure level
    MemoryPressure check_memory_pressure() {
        auto utilization = m_pressure_source.sample_utilization();
        MemoryPressure level = utilization
            ? classify_memory_pressure(*utilization)
            : MemoryPressure::Low;

        if (level != m_pressure) {
            MemoryPressure previous = m_pressure;
            m_pressure = level;
            this->log().info_fmt("Memory pressure {} -> {}", to_string(previous), to_string(level));
            on_pressure_changed.emit(level);
            respond_to_pressure(level);
        }
        return m_pressure;
    }

    Signal<MemoryPressure> on_pressure_changed;

private:
    void respond_to_pressure(MemoryPressure level) {
        switch (level) {
            case MemoryPressure::High:
                this->optimize(0.5);
                break;
            case MemoryPressure::Medium:
                this->optimize(0.7);
                break;
            case MemoryPressure::Low:
                break;
        }
    }

    MemoryPressureSource& m_pressure_source;
    MemoryPressure m_pressure{MemoryPressure::Low};
    TimerId m_pressure_timer{INVALID_TIMER};
};

} // namespace vellum::cache
