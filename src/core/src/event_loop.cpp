#include "vellum/core/event_loop.hpp"
#include "vellum/core/logger.hpp"
#include <chrono>

namespace vellum {

EventLoop::EventLoop(Clock& clock) : m_clock(clock) {}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(Task task) {
    if (task) {
        m_microtasks.push_back(std::move(task));
    }
}

TimerId EventLoop::schedule(f64 delay_ms, Task task) {
    return add_timer(delay_ms, 0.0, std::move(task));
}

TimerId EventLoop::schedule_repeating(f64 interval_ms, Task task) {
    if (interval_ms <= 0.0) {
        VELLUM_LOG_WARN_FMT("Rejected repeating timer with interval {}ms", interval_ms);
        return INVALID_TIMER;
    }
    return add_timer(interval_ms, interval_ms, std::move(task));
}

TimerId EventLoop::add_timer(f64 delay_ms, f64 interval_ms, Task task) {
    if (!task) {
        return INVALID_TIMER;
    }

    TimerId id = m_next_timer_id++;
    f64 due = m_clock.now_ms() + (delay_ms > 0.0 ? delay_ms : 0.0);
    m_timers.emplace(id, Timer{due, interval_ms, std::move(task)});
    m_timer_order.emplace(TimerKey{due, id}, id);
    return id;
}

bool EventLoop::cancel(TimerId id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return false;
    }
    m_timer_order.erase(TimerKey{it->second.due, id});
    m_timers.erase(it);
    return true;
}

void EventLoop::post_external(Task task) {
    {
        std::lock_guard lock(m_external_mutex);
        m_external.push_back(std::move(task));
    }
    m_external_cv.notify_one();
}

std::optional<f64> EventLoop::next_timer_due() const {
    if (m_timer_order.empty()) {
        return std::nullopt;
    }
    return m_timer_order.begin()->first.first;
}

usize EventLoop::drain_external() {
    std::vector<Task> batch;
    {
        std::lock_guard lock(m_external_mutex);
        batch.swap(m_external);
    }
    for (auto& task : batch) {
        post(std::move(task));
    }
    return batch.size();
}

usize EventLoop::drain_microtasks() {
    usize executed = 0;
    while (!m_microtasks.empty()) {
        Task task = std::move(m_microtasks.front());
        m_microtasks.pop_front();
        task();
        ++executed;
    }
    return executed;
}

bool EventLoop::fire_next_due_timer() {
    if (m_timer_order.empty()) {
        return false;
    }

    auto first = m_timer_order.begin();
    if (first->first.first > m_clock.now_ms()) {
        return false;
    }

    TimerId id = first->second;
    m_timer_order.erase(first);

    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return true;
    }

    Task task;
    if (it->second.interval > 0.0) {
        // Reschedule before running so the task may cancel itself
        it->second.due += it->second.interval;
        m_timer_order.emplace(TimerKey{it->second.due, id}, id);
        task = it->second.task;
    } else {
        task = std::move(it->second.task);
        m_timers.erase(it);
    }

    task();
    return true;
}

usize EventLoop::run_until_idle() {
    usize executed = 0;
    for (;;) {
        drain_external();
        executed += drain_microtasks();

        if (fire_next_due_timer()) {
            ++executed;
            continue;
        }

        std::lock_guard lock(m_external_mutex);
        if (m_external.empty() && m_microtasks.empty()) {
            break;
        }
    }
    return executed;
}

void EventLoop::run_for(f64 duration_ms) {
    f64 deadline = m_clock.now_ms() + duration_ms;

    run_until_idle();
    for (;;) {
        auto due = next_timer_due();
        if (!due || *due > deadline) {
            break;
        }
        m_clock.sleep_until(*due);
        run_until_idle();
    }

    m_clock.sleep_until(deadline);
    run_until_idle();
}

void EventLoop::run() {
    m_stop_requested = false;
    m_running = true;

    while (!m_stop_requested) {
        run_until_idle();
        if (m_stop_requested) {
            break;
        }

        std::unique_lock lock(m_external_mutex);
        auto wake = [this] { return !m_external.empty() || m_stop_requested.load(); };
        auto due = next_timer_due();
        if (due) {
            f64 wait_ms = *due - m_clock.now_ms();
            if (wait_ms > 0.0) {
                m_external_cv.wait_for(lock,
                    std::chrono::duration<f64, std::milli>(wait_ms), wake);
            }
        } else {
            m_external_cv.wait(lock, wake);
        }
    }

    m_running = false;
}

void EventLoop::stop() {
    {
        std::lock_guard lock(m_external_mutex);
        m_stop_requested = true;
    }
    m_external_cv.notify_all();
}

} // namespace vellum
