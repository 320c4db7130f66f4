/**
 * @file signals.hpp
 * @brief Lightweight signal-slot system
 *
 * Explicit change notification for the editing core: the timeline,
 * history, registry, transcription service and export jobs expose
 * Signal members that any observer can connect to.
 *
 * - Type-safe callbacks with variadic arguments
 * - Disconnection through Connection / ScopedConnection (RAII)
 * - Thread-safe emission (slots are invoked outside the lock)
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace spl {

template<typename... Args>
class Signal;

/**
 * @brief Connection handle for managing slot lifetime
 *
 * Safe to outlive the signal: disconnecting after the signal is gone
 * is a no-op.
 */
class Connection {
public:
    Connection() = default;

    [[nodiscard]] bool connected() const {
        return m_connected && !m_disconnector.expired();
    }

    void disconnect() {
        if (auto disc = m_disconnector.lock()) {
            disc->disconnect(m_id);
        }
        m_connected = false;
    }

private:
    template<typename... Args>
    friend class Signal;

    struct Disconnector {
        virtual ~Disconnector() = default;
        virtual void disconnect(uint64_t id) = 0;
    };

    Connection(uint64_t id, std::shared_ptr<Disconnector> disc)
        : m_id(id), m_disconnector(disc), m_connected(true) {}

    uint64_t m_id = 0;
    std::weak_ptr<Disconnector> m_disconnector;
    bool m_connected = false;
};

/**
 * @brief Scoped connection that auto-disconnects on destruction
 */
class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(Connection conn)
        : m_connection(std::move(conn)) {}

    ~ScopedConnection() { disconnect(); }

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_connection(std::move(other.m_connection)) {
        other.m_connection = Connection();
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_connection = std::move(other.m_connection);
            other.m_connection = Connection();
        }
        return *this;
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void disconnect() { m_connection.disconnect(); }

    [[nodiscard]] bool connected() const { return m_connection.connected(); }

private:
    Connection m_connection;
};

/**
 * @brief Type-safe signal for event emission
 *
 * @code
 *   Signal<const TimelineChange&> changed;
 *   auto conn = changed.connectScoped([](const TimelineChange& c) {
 *       LOG_DEBUG("timeline v{}", c.version);
 *   });
 *   changed.fire(change);
 * @endcode
 *
 * Named 'fire' instead of 'emit' to stay clear of Qt's emit keyword.
 */
template<typename... Args>
class Signal {
public:
    using SlotType = std::function<void(Args...)>;

    Signal() : m_disconnector(std::make_shared<DisconnectorImpl>(this)) {}

    ~Signal() {
        m_disconnector->m_signal = nullptr;
    }

    // Slots hold a pointer back to the signal
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) = delete;
    Signal& operator=(Signal&&) = delete;

    [[nodiscard]] Connection connect(SlotType slot) {
        std::lock_guard lock(m_mutex);
        uint64_t id = m_nextId++;
        m_slots.push_back({id, std::move(slot)});
        return Connection(id, m_disconnector);
    }

    [[nodiscard]] ScopedConnection connectScoped(SlotType slot) {
        return ScopedConnection(connect(std::move(slot)));
    }

    /**
     * @brief Invoke all connected slots
     *
     * Slots are copied under the lock so a slot may connect or
     * disconnect while the signal is firing.
     */
    void fire(Args... args) {
        std::vector<Slot> slotsCopy;
        {
            std::lock_guard lock(m_mutex);
            slotsCopy = m_slots;
        }
        for (auto& slot : slotsCopy) {
            if (slot.func) {
                slot.func(args...);
            }
        }
    }

    void disconnectAll() {
        std::lock_guard lock(m_mutex);
        m_slots.clear();
    }

    [[nodiscard]] size_t slotCount() const {
        std::lock_guard lock(m_mutex);
        return m_slots.size();
    }

private:
    struct Slot {
        uint64_t id;
        SlotType func;
    };

    struct DisconnectorImpl : Connection::Disconnector {
        Signal* m_signal;

        explicit DisconnectorImpl(Signal* sig) : m_signal(sig) {}

        void disconnect(uint64_t id) override {
            if (m_signal) {
                m_signal->disconnectById(id);
            }
        }
    };

    void disconnectById(uint64_t id) {
        std::lock_guard lock(m_mutex);
        m_slots.erase(
            std::remove_if(m_slots.begin(), m_slots.end(),
                [id](const Slot& s) { return s.id == id; }),
            m_slots.end());
    }

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
    std::shared_ptr<DisconnectorImpl> m_disconnector;
    std::atomic<uint64_t> m_nextId{1};
};

using VoidSignal = Signal<>;

} // namespace spl
