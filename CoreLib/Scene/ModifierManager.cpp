#include "ModifierManager.hpp"

#include "EditorSignals.hpp"
#include "GeometryDatabase.hpp"

ModifierManager::ModifierManager(GeometryDatabase& db, EditorSignals& signals) : m_db(db), m_signals(signals)
{
    // The name is still bound while objectRemoved is dispatched.
    m_connections.connect(m_db.signals().objectRemoved, [this](const ItemId& id, const Agent&) {
        if (auto name = m_db.names().nameOf(id); name && m_stacks.erase(*name) != 0)
            m_signals.modifiersChanged.dispatch();
    });
}

void ModifierManager::add(ItemId version, const Modifier& modifier)
{
    const ItemId name = m_db.lookupName(version);
    m_stacks[name].push_back(modifier);
    m_signals.modifiersChanged.dispatch();
}

bool ModifierManager::clear(ItemId version)
{
    const ItemId name = m_db.lookupName(version);
    if (m_stacks.erase(name) == 0)
        return false;

    m_signals.modifiersChanged.dispatch();
    return true;
}

const ModifierStack* ModifierManager::stackFor(ItemId version) const
{
    const auto name = m_db.names().nameOf(version);
    if (!name)
        return nullptr;

    auto it = m_stacks.find(*name);
    return it == m_stacks.end() ? nullptr : &it->second;
}

ModifierMemento ModifierManager::saveToMemento() const
{
    return ModifierMemento{m_stacks};
}

void ModifierManager::restoreFromMemento(ModifierMemento memento)
{
    m_stacks.swap(memento.stacks);
}
