#pragma once

#include "types.hpp"
#include <algorithm>
#include <functional>
#include <vector>

namespace vellum {

using ConnectionId = u64;

/**
 * Synchronous per-event callback registry
 *
 * emit() calls every handler connected at the moment the emit starts, in
 * connection order, exactly once. Handlers may connect or disconnect
 * (including themselves) from inside a callback.
 */
template<typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    ConnectionId connect(Handler handler) {
        ConnectionId id = m_next_id++;
        m_slots.push_back(Slot{id, std::make_shared<Handler>(std::move(handler))});
        return id;
    }

    bool disconnect(ConnectionId id) {
        auto it = std::find_if(m_slots.begin(), m_slots.end(),
            [id](const Slot& slot) { return slot.id == id; });
        if (it == m_slots.end()) {
            return false;
        }
        m_slots.erase(it);
        return true;
    }

    void disconnect_all() { m_slots.clear(); }

    void emit(Args... args) const {
        if (m_slots.empty()) {
            return;
        }
        // Snapshot so handlers may mutate the registry
        auto snapshot = m_slots;
        for (const auto& slot : snapshot) {
            if (is_connected(slot.id)) {
                (*slot.handler)(args...);
            }
        }
    }

    [[nodiscard]] bool is_connected(ConnectionId id) const {
        return std::any_of(m_slots.begin(), m_slots.end(),
            [id](const Slot& slot) { return slot.id == id; });
    }

    [[nodiscard]] usize connection_count() const { return m_slots.size(); }

private:
    struct Slot {
        ConnectionId id;
        std::shared_ptr<Handler> handler;
    };

    std::vector<Slot> m_slots;
    ConnectionId m_next_id{1};
};

} // namespace vellum
