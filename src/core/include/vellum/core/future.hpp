#pragma once

#include "error.hpp"
#include "event_loop.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace vellum {

namespace detail {

template<typename T>
struct SharedState {
    using ResultType = ResourceResult<T>;
    using Callback = std::function<void(const ResultType&)>;

    explicit SharedState(EventLoop& event_loop) : loop(&event_loop) {}

    EventLoop* loop;
    std::optional<ResultType> result;
    std::vector<Callback> callbacks;
};

} // namespace detail

/**
 * Read side of a single-assignment asynchronous result.
 *
 * Continuations registered with then() always run as microtasks on the
 * owning EventLoop, never inline, so a continuation registered on an
 * already-settled future still observes the same ordering as a pending one.
 */
template<typename T>
class Future {
public:
    using ResultType = ResourceResult<T>;
    using Callback = std::function<void(const ResultType&)>;

    Future() = default;

    [[nodiscard]] bool valid() const { return m_state != nullptr; }
    [[nodiscard]] bool is_ready() const { return m_state && m_state->result.has_value(); }

    [[nodiscard]] const ResultType& result() const {
        if (!is_ready()) {
            throw std::logic_error("Future::result() called before the future settled");
        }
        return *m_state->result;
    }

    void then(Callback callback) const {
        if (!m_state || !callback) {
            return;
        }
        if (m_state->result) {
            auto state = m_state;
            state->loop->post([state, cb = std::move(callback)] { cb(*state->result); });
            return;
        }
        m_state->callbacks.push_back(std::move(callback));
    }

    [[nodiscard]] bool shares_state_with(const Future& other) const {
        return m_state == other.m_state;
    }

private:
    template<typename U> friend class Promise;

    explicit Future(std::shared_ptr<detail::SharedState<T>> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::SharedState<T>> m_state;
};

template<typename T>
class Promise {
public:
    using ResultType = ResourceResult<T>;

    explicit Promise(EventLoop& loop)
        : m_state(std::make_shared<detail::SharedState<T>>(loop)) {}

    [[nodiscard]] Future<T> future() const { return Future<T>(m_state); }

    [[nodiscard]] bool is_settled() const { return m_state->result.has_value(); }

    // First settlement wins; later calls return false
    bool settle(ResultType result) {
        if (m_state->result) {
            return false;
        }
        m_state->result.emplace(std::move(result));

        auto callbacks = std::move(m_state->callbacks);
        m_state->callbacks.clear();
        auto state = m_state;
        for (auto& callback : callbacks) {
            state->loop->post([state, cb = std::move(callback)] { cb(*state->result); });
        }
        return true;
    }

    bool resolve(T value) {
        return settle(ResultType(std::move(value)));
    }

    bool reject(ResourceError error) {
        return settle(ResultType(make_error(std::move(error))));
    }

private:
    std::shared_ptr<detail::SharedState<T>> m_state;
};

template<typename T>
Future<T> make_ready_future(EventLoop& loop, T value) {
    Promise<T> promise(loop);
    promise.resolve(std::move(value));
    return promise.future();
}

template<typename T>
Future<T> make_failed_future(EventLoop& loop, ResourceError error) {
    Promise<T> promise(loop);
    promise.reject(std::move(error));
    return promise.future();
}

} // namespace vellum
