#pragma once

#include <map>
#include <set>
#include <string>

#include "GeometryTypes.hpp"
#include "Memento.hpp"
#include "Signal.hpp"

class GeometryDatabase;
struct EditorSignals;

struct SelectionMemento
{
    std::set<ItemId>              items;
    std::map<std::string, ItemId> topology;      ///< face/edge key -> parent item
    std::map<std::string, ItemId> controlPoints; ///< control point key -> parent item
};

/**
 * @brief Current selection of items, faces/edges and control points.
 *
 * Selection refers to document versions. It follows an item through
 * replacement and drops everything belonging to an item that is removed.
 * Every change publishes EditorSignals::selectionChanged; a restore leaves
 * that to the originator.
 */
class SelectionDatabase final : public MementoOriginator<SelectionMemento>
{
public:
    SelectionDatabase(GeometryDatabase& db, EditorSignals& signals);

    SelectionDatabase(const SelectionDatabase&)            = delete;
    SelectionDatabase& operator=(const SelectionDatabase&) = delete;

    /**
     * @brief Add an item to the selection.
     * @return False if it was already selected.
     * @throws InvalidPrecondition if the item does not exist.
     */
    bool selectItem(ItemId id);

    /** @return False if the item was not selected. */
    bool deselectItem(ItemId id);

    /** @throws InvalidPrecondition if the face/edge does not exist. */
    bool selectTopology(const std::string& key);

    /** @throws InvalidPrecondition if the control point does not exist. */
    bool selectControlPoint(const std::string& key);

    /**
     * @brief Select every selectable item.
     *
     * Hidden, invisible, unselectable and type-disabled items are skipped, as
     * are automatic items.
     */
    void selectAll();

    void clear();

    [[nodiscard]] bool isSelected(ItemId id) const noexcept
    {
        return m_items.count(id) != 0;
    }

    [[nodiscard]] const std::set<ItemId>& items() const noexcept
    {
        return m_items;
    }

    [[nodiscard]] const std::map<std::string, ItemId>& topology() const noexcept
    {
        return m_topology;
    }

    [[nodiscard]] const std::map<std::string, ItemId>& controlPoints() const noexcept
    {
        return m_controlPoints;
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_items.empty() && m_topology.empty() && m_controlPoints.empty();
    }

    [[nodiscard]] SelectionMemento saveToMemento() const override;
    void                           restoreFromMemento(SelectionMemento memento) override;

private:
    void onRemoved(ItemId id);
    void onReplaced(ItemId from, ItemId to);
    bool dropParent(ItemId id);

private:
    GeometryDatabase& m_db;
    EditorSignals&    m_signals;

    std::set<ItemId>              m_items;
    std::map<std::string, ItemId> m_topology;
    std::map<std::string, ItemId> m_controlPoints;

    SignalConnections m_connections;
};
