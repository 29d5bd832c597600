#pragma once

#include "signal.hpp"
#include "types.hpp"
#include <functional>
#include <memory>

namespace vellum {

namespace detail {

struct CancellationState {
    bool cancelled{false};
    Signal<> on_cancel;
};

} // namespace detail

/**
 * Read side of a cancellation source. Copies share state; a default
 * constructed token can never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const {
        return m_state && m_state->cancelled;
    }

    [[nodiscard]] bool can_be_cancelled() const { return m_state != nullptr; }

    // Runs the callback when cancelled, immediately if already cancelled
    ConnectionId on_cancel(std::function<void()> callback) const {
        if (!m_state) {
            return 0;
        }
        if (m_state->cancelled) {
            callback();
            return 0;
        }
        return m_state->on_cancel.connect(std::move(callback));
    }

    void remove_callback(ConnectionId id) const {
        if (m_state && id != 0) {
            m_state->on_cancel.disconnect(id);
        }
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> m_state;
};

class CancellationSource {
public:
    CancellationSource() : m_state(std::make_shared<detail::CancellationState>()) {}

    // A source that is also cancelled when parent is
    explicit CancellationSource(const CancellationToken& parent)
        : CancellationSource() {
        link(parent);
    }

    ~CancellationSource() {
        unlink();
    }

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    [[nodiscard]] CancellationToken token() const {
        return CancellationToken(m_state);
    }

    [[nodiscard]] bool is_cancelled() const { return m_state->cancelled; }

    void cancel() {
        if (m_state->cancelled) {
            return;
        }
        m_state->cancelled = true;
        // Keep state alive while callbacks run
        auto state = m_state;
        state->on_cancel.emit();
        state->on_cancel.disconnect_all();
    }

    void link(const CancellationToken& parent) {
        unlink();
        m_parent = parent;
        std::weak_ptr<detail::CancellationState> weak = m_state;
        m_parent_connection = parent.on_cancel([weak] {
            if (auto state = weak.lock()) {
                if (!state->cancelled) {
                    state->cancelled = true;
                    state->on_cancel.emit();
                    state->on_cancel.disconnect_all();
                }
            }
        });
    }

private:
    void unlink() {
        m_parent.remove_callback(m_parent_connection);
        m_parent_connection = 0;
    }

    std::shared_ptr<detail::CancellationState> m_state;
    CancellationToken m_parent;
    ConnectionId m_parent_connection{0};
};

} // namespace vellum
