#pragma once

#include "vellum/core/types.hpp"
#include <optional>
#include <string_view>

namespace vellum::cache {

enum class MemoryPressure : u8 {
    Low,
    Medium,
    High,
};

[[nodiscard]] constexpr std::string_view to_string(MemoryPressure pressure) {
    switch (pressure) {
        case MemoryPressure::Low: return "low";
        case MemoryPressure::Medium: return "medium";
        case MemoryPressure::High: return "high";
    }
    return "unknown";
}

// > 0.9 high, > 0.7 medium, otherwise low
[[nodiscard]] MemoryPressure classify_memory_pressure(f64 utilization);

/**
 * Source of ambient memory utilization in [0, 1]. Returns nullopt when the
 * platform cannot report it, in which case pressure is treated as low.
 */
class MemoryPressureSource {
public:
    virtual ~MemoryPressureSource() = default;
    [[nodiscard]] virtual std::optional<f64> sample_utilization() = 0;
};

// Physical memory utilization reported by sysinfo(2)
class SystemMemoryPressureSource : public MemoryPressureSource {
public:
    [[nodiscard]] std::optional<f64> sample_utilization() override;
};

// Reports whatever utilization it was last given
class FixedMemoryPressureSource : public MemoryPressureSource {
public:
    explicit FixedMemoryPressureSource(std::optional<f64> utilization = std::nullopt)
        : m_utilization(utilization) {}

    [[nodiscard]] std::optional<f64> sample_utilization() override { return m_utilization; }
    void set_utilization(std::optional<f64> utilization) { m_utilization = utilization; }

private:
    std::optional<f64> m_utilization;
};

} // namespace vellum::cache
