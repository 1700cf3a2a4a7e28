#pragma once

#include <glm/glm.hpp>
#include <map>
#include <vector>

#include "GeometryTypes.hpp"
#include "Memento.hpp"
#include "Signal.hpp"

class GeometryDatabase;

/** @brief Location where control points of two different curves coincide. */
struct CrossPoint
{
    ItemId    first  = 0;
    ItemId    second = 0;
    glm::vec3 position{0.0f};
};

struct CrossPointMemento
{
    std::map<ItemId, std::vector<glm::vec3>> curvePoints;
    std::vector<CrossPoint>                  crosses;
};

/**
 * @brief Cache of coincident control points between curves.
 *
 * Tracks every curve in the document and keeps the list of cross points up to
 * date as curves are added, removed and replaced.
 */
class CrossPointDatabase final : public MementoOriginator<CrossPointMemento>
{
public:
    CrossPointDatabase(GeometryDatabase& db, float tolerance);

    CrossPointDatabase(const CrossPointDatabase&)            = delete;
    CrossPointDatabase& operator=(const CrossPointDatabase&) = delete;

    [[nodiscard]] const std::vector<CrossPoint>& crosses() const noexcept
    {
        return m_crosses;
    }

    /** @return Cross points involving @p curve. */
    [[nodiscard]] std::vector<CrossPoint> crossesFor(ItemId curve) const;

    [[nodiscard]] bool tracks(ItemId curve) const noexcept
    {
        return m_curvePoints.count(curve) != 0;
    }

    [[nodiscard]] CrossPointMemento saveToMemento() const override;
    void                            restoreFromMemento(CrossPointMemento memento) override;

private:
    void add(ItemId curve);
    void remove(ItemId curve);

private:
    GeometryDatabase& m_db;
    float             m_tolerance;

    std::map<ItemId, std::vector<glm::vec3>> m_curvePoints;
    std::vector<CrossPoint>                  m_crosses;

    SignalConnections m_connections;
};
