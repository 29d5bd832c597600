#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace vellum {

using Task = std::function<void()>;
using TimerId = u64;

inline constexpr TimerId INVALID_TIMER = 0;

/**
 * Single-threaded cooperative event loop
 *
 * All cache, pool and loader state is mutated from tasks run by this loop.
 * Microtasks run in FIFO order before any timer is considered; timers fire
 * in due-time order with ties broken by scheduling order. post_external()
 * is the only entry point that may be called from another thread.
 */
class EventLoop {
public:
    explicit EventLoop(Clock& clock);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    [[nodiscard]] Clock& clock() { return m_clock; }
    [[nodiscard]] f64 now_ms() const { return m_clock.now_ms(); }

    void post(Task task);
    TimerId schedule(f64 delay_ms, Task task);
    TimerId schedule_repeating(f64 interval_ms, Task task);
    bool cancel(TimerId id);

    // Thread-safe; wakes a loop blocked in run()
    void post_external(Task task);

    // Run ready microtasks and due timers until nothing is ready. Returns
    // the number of tasks executed.
    usize run_until_idle();

    // Advance through [now, now + duration_ms], firing timers at their due
    // times. Sleeps on a steady clock, jumps on a manual clock.
    void run_for(f64 duration_ms);

    // Run until stop() is called
    void run();
    void stop();

    [[nodiscard]] bool is_running() const { return m_running; }
    [[nodiscard]] usize pending_microtasks() const { return m_microtasks.size(); }
    [[nodiscard]] usize pending_timers() const { return m_timers.size(); }
    [[nodiscard]] std::optional<f64> next_timer_due() const;

private:
    struct Timer {
        f64 due;
        f64 interval;  // 0 for one-shot
        Task task;
    };

    using TimerKey = std::pair<f64, TimerId>;

    TimerId add_timer(f64 delay_ms, f64 interval_ms, Task task);
    usize drain_external();
    usize drain_microtasks();
    bool fire_next_due_timer();

    Clock& m_clock;
    std::deque<Task> m_microtasks;
    std::map<TimerKey, TimerId> m_timer_order;
    std::unordered_map<TimerId, Timer> m_timers;
    TimerId m_next_timer_id{1};

    std::mutex m_external_mutex;
    std::condition_variable m_external_cv;
    std::vector<Task> m_external;

    std::atomic<bool> m_stop_requested{false};
    bool m_running{false};
};

} // namespace vellum
