#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

/**
 * @brief Minimal publish/subscribe channel.
 *
 * Slots are called synchronously in connection order. Dispatch iterates over a
 * snapshot of the slot list, so a slot may connect or disconnect (itself or
 * others) while a dispatch is in progress.
 *
 * @code
 * Signal<ItemId, Agent> objectAdded;
 * auto id = objectAdded.connect([](const ItemId& item, const Agent& agent) { ... });
 * objectAdded.dispatch(12, Agent::USER);
 * objectAdded.disconnect(id);
 * @endcode
 */
template<typename... Args>
class Signal
{
public:
    using Slot         = std::function<void(const Args&...)>;
    using ConnectionId = uint64_t;

    Signal() = default;

    Signal(const Signal&)            = delete;
    Signal& operator=(const Signal&) = delete;

    /** @return Id to pass to disconnect(). */
    ConnectionId connect(Slot slot)
    {
        const ConnectionId id = m_nextId++;
        m_slots.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(ConnectionId id)
    {
        m_slots.erase(std::remove_if(m_slots.begin(), m_slots.end(), [id](const auto& entry) { return entry.first == id; }),
                      m_slots.end());
    }

    void dispatch(const Args&... args) const
    {
        const auto snapshot = m_slots;
        for (const auto& [id, slot] : snapshot)
            slot(args...);
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_slots.size();
    }

private:
    std::vector<std::pair<ConnectionId, Slot>> m_slots;
    ConnectionId                               m_nextId = 1;
};

/**
 * @brief Collects connections and drops them all on destruction.
 *
 * Owners that subscribe to a longer-lived signal keep one of these as their
 * last member so the slots never outlive the owner.
 */
class SignalConnections
{
public:
    SignalConnections() = default;
    ~SignalConnections()
    {
        clear();
    }

    SignalConnections(const SignalConnections&)            = delete;
    SignalConnections& operator=(const SignalConnections&) = delete;

    template<typename... Args>
    void connect(Signal<Args...>& signal, typename Signal<Args...>::Slot slot)
    {
        const auto id = signal.connect(std::move(slot));
        m_cleanup.push_back([&signal, id]() { signal.disconnect(id); });
    }

    void clear()
    {
        for (auto& cleanup : m_cleanup)
            cleanup();
        m_cleanup.clear();
    }

private:
    std::vector<std::function<void()>> m_cleanup;
};
