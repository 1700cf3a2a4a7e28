#include "SnapManager.hpp"

#include <glm/geometric.hpp>
#include <limits>

#include "CrossPointDatabase.hpp"
#include "GeometryDatabase.hpp"

SnapManager::SnapManager(GeometryDatabase& db, const CrossPointDatabase& crosses) : m_db(db), m_crosses(crosses)
{
    auto& signals = m_db.signals();

    m_connections.connect(signals.objectAdded, [this](const ItemId& id, const Agent&) { cache(id); });
    m_connections.connect(signals.objectRemoved, [this](const ItemId& id, const Agent&) { m_points.erase(id); });
    m_connections.connect(signals.objectReplaced, [this](const ItemId& from, const ItemId& to) {
        m_points.erase(from);
        cache(to);
    });
}

void SnapManager::cache(ItemId id)
{
    const ItemRecord& record = m_db.lookupItemById(id);

    std::vector<glm::vec3> points;
    points.reserve(record.controlPoints.size());
    for (const std::string& key : record.controlPoints)
        points.push_back(m_db.lookupControlPointById(key).position);

    if (points.empty())
        m_points.erase(id);
    else
        m_points[id] = std::move(points);
}

glm::vec3 SnapManager::applyGrid(const glm::vec3& p) const noexcept
{
    if (!m_enabled || m_grid <= 0.0f)
        return p;

    glm::vec3 local   = p - m_origin;
    glm::vec3 snapped = glm::round(local / m_grid) * m_grid;
    return snapped + m_origin;
}

glm::vec3 SnapManager::snap(const glm::vec3& p, float tolerance) const
{
    float     best = std::numeric_limits<float>::max();
    glm::vec3 result(0.0f);

    auto consider = [&](const glm::vec3& candidate) {
        const float d = glm::distance(p, candidate);
        if (d <= tolerance && d < best)
        {
            best   = d;
            result = candidate;
        }
    };

    for (const auto& [id, points] : m_points)
    {
        for (const glm::vec3& candidate : points)
            consider(candidate);
    }

    for (const CrossPoint& cross : m_crosses.crosses())
        consider(cross.position);

    if (best != std::numeric_limits<float>::max())
        return result;

    return applyGrid(p);
}

const std::vector<glm::vec3>* SnapManager::pointsFor(ItemId id) const
{
    auto it = m_points.find(id);
    return it == m_points.end() ? nullptr : &it->second;
}

std::size_t SnapManager::pointCount() const noexcept
{
    std::size_t count = 0;
    for (const auto& [id, points] : m_points)
        count += points.size();
    return count;
}

SnapMemento SnapManager::saveToMemento() const
{
    return SnapMemento{m_points};
}

void SnapManager::restoreFromMemento(SnapMemento memento)
{
    m_points.swap(memento.points);
}
