#include "CrossPointDatabase.hpp"

#include <algorithm>
#include <glm/geometric.hpp>
#include <iterator>

#include "GeometryDatabase.hpp"

CrossPointDatabase::CrossPointDatabase(GeometryDatabase& db, float tolerance) : m_db(db), m_tolerance(tolerance)
{
    auto& signals = m_db.signals();

    m_connections.connect(signals.objectAdded, [this](const ItemId& id, const Agent&) { add(id); });
    m_connections.connect(signals.objectRemoved, [this](const ItemId& id, const Agent&) { remove(id); });
    m_connections.connect(signals.objectReplaced, [this](const ItemId& from, const ItemId& to) {
        remove(from);
        add(to);
    });
}

std::vector<CrossPoint> CrossPointDatabase::crossesFor(ItemId curve) const
{
    std::vector<CrossPoint> result;
    std::copy_if(m_crosses.begin(), m_crosses.end(), std::back_inserter(result),
                 [curve](const CrossPoint& cross) { return cross.first == curve || cross.second == curve; });
    return result;
}

void CrossPointDatabase::add(ItemId curve)
{
    const ItemRecord& record = m_db.lookupItemById(curve);
    if (record.type != ItemType::CURVE)
        return;

    const std::vector<glm::vec3>& points = record.model->controlPoints;

    for (const auto& [other, otherPoints] : m_curvePoints)
    {
        for (const glm::vec3& p : points)
        {
            for (const glm::vec3& q : otherPoints)
            {
                if (glm::distance(p, q) <= m_tolerance)
                    m_crosses.push_back(CrossPoint{other, curve, p});
            }
        }
    }

    m_curvePoints[curve] = points;
}

void CrossPointDatabase::remove(ItemId curve)
{
    if (m_curvePoints.erase(curve) == 0)
        return;

    m_crosses.erase(std::remove_if(m_crosses.begin(), m_crosses.end(),
                                   [curve](const CrossPoint& cross) {
                                       return cross.first == curve || cross.second == curve;
                                   }),
                    m_crosses.end());
}

CrossPointMemento CrossPointDatabase::saveToMemento() const
{
    return CrossPointMemento{m_curvePoints, m_crosses};
}

void CrossPointDatabase::restoreFromMemento(CrossPointMemento memento)
{
    m_curvePoints.swap(memento.curvePoints);
    m_crosses.swap(memento.crosses);
}
