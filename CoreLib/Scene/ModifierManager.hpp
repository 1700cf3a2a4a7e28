#pragma once

#include <map>
#include <vector>

#include "CoreTypes.hpp"
#include "GeometryTypes.hpp"
#include "Memento.hpp"
#include "Signal.hpp"

class GeometryDatabase;
struct EditorSignals;

struct Modifier
{
    ModifierKind kind   = ModifierKind::SYMMETRY;
    float        amount = 1.0f;
};

using ModifierStack = std::vector<Modifier>;

struct ModifierMemento
{
    std::map<ItemId, ModifierStack> stacks; ///< keyed by item name
};

/**
 * @brief Non-destructive modifier stacks per item.
 *
 * Stacks are keyed by the item's stable name, so they survive geometry
 * replacement without any bookkeeping. Removing an item drops its stack.
 */
class ModifierManager final : public MementoOriginator<ModifierMemento>
{
public:
    ModifierManager(GeometryDatabase& db, EditorSignals& signals);

    ModifierManager(const ModifierManager&)            = delete;
    ModifierManager& operator=(const ModifierManager&) = delete;

    /** @brief Append a modifier to the stack of the item at @p version. */
    void add(ItemId version, const Modifier& modifier);

    /** @return False if the item had no modifiers. */
    bool clear(ItemId version);

    /** @return The item's stack, or nullptr. */
    [[nodiscard]] const ModifierStack* stackFor(ItemId version) const;

    [[nodiscard]] bool hasModifiers(ItemId version) const
    {
        return stackFor(version) != nullptr;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_stacks.size();
    }

    [[nodiscard]] ModifierMemento saveToMemento() const override;
    void                          restoreFromMemento(ModifierMemento memento) override;

private:
    GeometryDatabase& m_db;
    EditorSignals&    m_signals;

    std::map<ItemId, ModifierStack> m_stacks;

    SignalConnections m_connections;
};
