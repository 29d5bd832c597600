#include "vellum/cache/memory_pressure.hpp"
#include "vellum/core/logger.hpp"
#include <cerrno>
#include <cstring>
#include <sys/sysinfo.h>

namespace vellum::cache {

MemoryPressure classify_memory_pressure(f64 utilization) {
    if (utilization > 0.9) {
        return MemoryPressure::High;
    }
    if (utilization > 0.7) {
        return MemoryPressure::Medium;
    }
    return MemoryPressure::Low;
}

std::optional<f64> SystemMemoryPressureSource::sample_utilization() {
    struct sysinfo info {};
    if (sysinfo(&info) != 0) {
        logging::get("cache").warn_fmt("sysinfo failed: {}", std::strerror(errno));
        return std::nullopt;
    }
    if (info.totalram == 0) {
        return std::nullopt;
    }

    // mem_unit scales every field equally, so the ratio needs no scaling
    f64 total = static_cast<f64>(info.totalram);
    f64 available = static_cast<f64>(info.freeram) + static_cast<f64>(info.bufferram);
    f64 used = total - available;
    return used > 0.0 ? used / total : 0.0;
}

} // namespace vellum::cache
