#pragma once

/**
 * @file signal.h
 * @brief Typed observer list with connection ids
 *
 * Connection ids are unique across every Signal in the process, so an
 * owner of several signals can disconnect an id without knowing which
 * signal it came from.
 *
 * @par Example
 * @code
 * Signal<int> frameChanged;
 * auto id = frameChanged.connect([](int frame) { std::cout << frame << "\n"; });
 * frameChanged.emit(42);
 * frameChanged.disconnect(id);
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace statusind {

using ConnectionId = uint64_t;

/// Never returned by connect()
constexpr ConnectionId INVALID_CONNECTION = 0;

namespace detail {
inline ConnectionId nextConnectionId() {
    static ConnectionId counter = 0;
    return ++counter;
}
} // namespace detail

template<typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    /**
     * @brief Register a slot
     * @return Id to pass to disconnect()
     */
    ConnectionId connect(Slot slot) {
        ConnectionId id = detail::nextConnectionId();
        m_slots.push_back({id, std::move(slot)});
        return id;
    }

    /**
     * @brief Remove a slot
     * @return false if the id is not connected to this signal
     */
    bool disconnect(ConnectionId id) {
        for (auto it = m_slots.begin(); it != m_slots.end(); ++it) {
            if (it->first == id) {
                m_slots.erase(it);
                return true;
            }
        }
        return false;
    }

    bool isConnected(ConnectionId id) const {
        for (const auto& entry : m_slots) {
            if (entry.first == id) return true;
        }
        return false;
    }

    /**
     * @brief Call every slot in connection order
     *
     * Slots may connect or disconnect while the signal is emitting. A slot
     * disconnected by an earlier slot is not called; slots connected during
     * emission are first called on the next emit.
     */
    void emit(Args... args) const {
        const auto snapshot = m_slots;
        for (const auto& entry : snapshot) {
            if (isConnected(entry.first)) {
                entry.second(args...);
            }
        }
    }

    void disconnectAll() { m_slots.clear(); }

    size_t size() const { return m_slots.size(); }
    bool empty() const { return m_slots.empty(); }

private:
    std::vector<std::pair<ConnectionId, Slot>> m_slots;
};

} // namespace statusind
