#pragma once

#include "types.hpp"

namespace vellum {

/**
 * Time source for timers, TTLs and progress measurements.
 * All values are milliseconds on a monotonic timeline.
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual f64 now_ms() const = 0;

    // Block (or jump) until now_ms() >= deadline_ms
    virtual void sleep_until(f64 deadline_ms) = 0;
};

// Steady wall clock, measured from construction
class SteadyClock : public Clock {
public:
    SteadyClock();

    [[nodiscard]] f64 now_ms() const override;
    void sleep_until(f64 deadline_ms) override;

private:
    i64 m_origin_ns;
};

// Deterministic clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(f64 start_ms = 0.0) : m_now(start_ms) {}

    [[nodiscard]] f64 now_ms() const override { return m_now; }
    void sleep_until(f64 deadline_ms) override;

    void advance(f64 delta_ms);
    void set(f64 now_ms) { m_now = now_ms; }

private:
    f64 m_now;
};

} // namespace vellum
