#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>

#include "GeometryTypes.hpp"
#include "NameIndex.hpp"

class GeometryDatabase;

/**
 * @brief Snapshot of the persistent part of a GeometryDatabase.
 *
 * Holds independent copies of every map; geometry payloads are shared because
 * they are immutable. Temporary items are never captured.
 */
class GeometryMemento
{
public:
    using ItemMap         = std::map<ItemId, ItemRecord>;
    using TopologyMap     = std::map<std::string, TopologyData>;
    using ControlPointMap = std::map<std::string, ControlPointData>;
    using NodeMap         = std::map<ItemId, NodeState>; ///< Keyed by stable name.

    GeometryMemento() = default;

    GeometryMemento(ItemMap          items,
                    NameIndex        names,
                    TopologyMap      topology,
                    ControlPointMap  controlPoints,
                    std::set<ItemId> automatics,
                    NodeMap          nodes) :
        m_items(std::move(items)),
        m_names(std::move(names)),
        m_topology(std::move(topology)),
        m_controlPoints(std::move(controlPoints)),
        m_automatics(std::move(automatics)),
        m_nodes(std::move(nodes))
    {
    }

    [[nodiscard]] const ItemMap& items() const noexcept
    {
        return m_items;
    }

    [[nodiscard]] const NameIndex& names() const noexcept
    {
        return m_names;
    }

    [[nodiscard]] const TopologyMap& topology() const noexcept
    {
        return m_topology;
    }

    [[nodiscard]] const ControlPointMap& controlPoints() const noexcept
    {
        return m_controlPoints;
    }

    [[nodiscard]] const std::set<ItemId>& automatics() const noexcept
    {
        return m_automatics;
    }

    [[nodiscard]] const NodeMap& nodes() const noexcept
    {
        return m_nodes;
    }

private:
    friend class GeometryDatabase; // swaps the maps out on restore

    ItemMap          m_items;
    NameIndex        m_names;
    TopologyMap      m_topology;
    ControlPointMap  m_controlPoints;
    std::set<ItemId> m_automatics;
    NodeMap          m_nodes;
};
