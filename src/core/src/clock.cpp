#include "vellum/core/clock.hpp"
#include <chrono>
#include <thread>

namespace vellum {

namespace {

i64 steady_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

// ============================================================================
// SteadyClock
// ============================================================================

SteadyClock::SteadyClock() : m_origin_ns(steady_ns()) {}

f64 SteadyClock::now_ms() const {
    return static_cast<f64>(steady_ns() - m_origin_ns) / 1.0e6;
}

void SteadyClock::sleep_until(f64 deadline_ms) {
    f64 remaining = deadline_ms - now_ms();
    if (remaining > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<f64, std::milli>(remaining));
    }
}

// ============================================================================
// ManualClock
// ============================================================================

void ManualClock::sleep_until(f64 deadline_ms) {
    if (deadline_ms > m_now) {
        m_now = deadline_ms;
    }
}

void ManualClock::advance(f64 delta_ms) {
    if (delta_ms > 0.0) {
        m_now += delta_ms;
    }
}

} // namespace vellum
