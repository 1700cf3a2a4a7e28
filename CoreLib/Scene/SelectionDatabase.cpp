#include "SelectionDatabase.hpp"

#include "EditorSignals.hpp"
#include "GeometryDatabase.hpp"

namespace
{
    template<typename Map>
    bool eraseByParent(Map& map, ItemId parent)
    {
        bool erased = false;
        for (auto it = map.begin(); it != map.end();)
        {
            if (it->second == parent)
            {
                it     = map.erase(it);
                erased = true;
            }
            else
            {
                ++it;
            }
        }
        return erased;
    }
} // namespace

SelectionDatabase::SelectionDatabase(GeometryDatabase& db, EditorSignals& signals) : m_db(db), m_signals(signals)
{
    m_connections.connect(m_db.signals().objectRemoved, [this](const ItemId& id, const Agent&) { onRemoved(id); });
    m_connections.connect(m_db.signals().objectReplaced,
                          [this](const ItemId& from, const ItemId& to) { onReplaced(from, to); });
}

bool SelectionDatabase::selectItem(ItemId id)
{
    if (!m_db.hasItem(id))
        throw InvalidPrecondition("SelectionDatabase::selectItem(): object " + std::to_string(id) +
                                  " missing from geometry model");

    if (!m_items.insert(id).second)
        return false;

    m_signals.selectionChanged.dispatch();
    return true;
}

bool SelectionDatabase::deselectItem(ItemId id)
{
    if (m_items.erase(id) == 0)
        return false;

    m_signals.selectionChanged.dispatch();
    return true;
}

bool SelectionDatabase::selectTopology(const std::string& key)
{
    const TopologyData& data = m_db.lookupTopologyItemById(key);
    if (!m_topology.emplace(key, data.parent).second)
        return false;

    m_signals.selectionChanged.dispatch();
    return true;
}

bool SelectionDatabase::selectControlPoint(const std::string& key)
{
    const ControlPointData& data = m_db.lookupControlPointById(key);
    if (!m_controlPoints.emplace(key, data.parent).second)
        return false;

    m_signals.selectionChanged.dispatch();
    return true;
}

void SelectionDatabase::selectAll()
{
    for (ItemId id : m_db.selectableObjects())
        m_items.insert(id);

    m_signals.selectionChanged.dispatch();
}

void SelectionDatabase::clear()
{
    if (empty())
        return;

    m_items.clear();
    m_topology.clear();
    m_controlPoints.clear();
    m_signals.selectionChanged.dispatch();
}

// ------------------------------------------------------------

bool SelectionDatabase::dropParent(ItemId id)
{
    bool changed = m_items.erase(id) != 0;
    changed |= eraseByParent(m_topology, id);
    changed |= eraseByParent(m_controlPoints, id);
    return changed;
}

void SelectionDatabase::onRemoved(ItemId id)
{
    if (dropParent(id))
        m_signals.selectionChanged.dispatch();
}

void SelectionDatabase::onReplaced(ItemId from, ItemId to)
{
    const bool wasSelected = isSelected(from);
    if (!dropParent(from))
        return;

    // Sub-item keys embed the version, so only the item itself carries over.
    if (wasSelected)
        m_items.insert(to);

    m_signals.selectionChanged.dispatch();
}

// ------------------------------------------------------------

SelectionMemento SelectionDatabase::saveToMemento() const
{
    return SelectionMemento{m_items, m_topology, m_controlPoints};
}

void SelectionDatabase::restoreFromMemento(SelectionMemento memento)
{
    m_items.swap(memento.items);
    m_topology.swap(memento.topology);
    m_controlPoints.swap(memento.controlPoints);
}
