#pragma once

#include <glm/glm.hpp>
#include <map>
#include <vector>

#include "GeometryTypes.hpp"
#include "Memento.hpp"
#include "Signal.hpp"

class CrossPointDatabase;
class GeometryDatabase;

struct SnapMemento
{
    std::map<ItemId, std::vector<glm::vec3>> points; ///< snap points per item
};

/**
 * @brief Point snapping for interactive placement.
 *
 * Two layers:
 *  - object snaps: control points of every document item plus curve cross
 *    points, cached per item and kept in sync with the database;
 *  - grid snapping in world space with an optional origin offset, used when no
 *    object snap is within tolerance.
 *
 * Grid settings are preferences and are not part of the memento; the snap
 * point cache is.
 */
class SnapManager final : public MementoOriginator<SnapMemento>
{
public:
    SnapManager(GeometryDatabase& db, const CrossPointDatabase& crosses);

    SnapManager(const SnapManager&)            = delete;
    SnapManager& operator=(const SnapManager&) = delete;

    // ------------------------------------------------------------
    // Grid settings
    // ------------------------------------------------------------

    void setEnabled(bool v) noexcept
    {
        m_enabled = v;
    }

    [[nodiscard]] bool enabled() const noexcept
    {
        return m_enabled;
    }

    /**
     * @brief Set the grid size used for snapping.
     * @param s Grid spacing (must be > 0 to take effect)
     */
    void setGridSize(float s) noexcept
    {
        m_grid = s;
    }

    [[nodiscard]] float gridSize() const noexcept
    {
        return m_grid;
    }

    void setOrigin(const glm::vec3& org) noexcept
    {
        m_origin = org;
    }

    [[nodiscard]] const glm::vec3& origin() const noexcept
    {
        return m_origin;
    }

    // ------------------------------------------------------------
    // Snapping
    // ------------------------------------------------------------

    /**
     * @brief Apply grid snapping to a position.
     *
     * If snapping is disabled or grid size is invalid (<= 0),
     * the input position is returned unchanged.
     */
    [[nodiscard]] glm::vec3 applyGrid(const glm::vec3& p) const noexcept;

    /**
     * @brief Snap to the nearest object snap point within @p tolerance,
     * falling back to the grid.
     */
    [[nodiscard]] glm::vec3 snap(const glm::vec3& p, float tolerance) const;

    /** @return Cached snap points of an item, or nullptr if none. */
    [[nodiscard]] const std::vector<glm::vec3>* pointsFor(ItemId id) const;

    [[nodiscard]] std::size_t pointCount() const noexcept;

    [[nodiscard]] SnapMemento saveToMemento() const override;
    void                      restoreFromMemento(SnapMemento memento) override;

private:
    void cache(ItemId id);

private:
    GeometryDatabase&         m_db;
    const CrossPointDatabase& m_crosses;

    bool      m_enabled = false;
    float     m_grid    = 0.1f;
    glm::vec3 m_origin  = glm::vec3(0.0f);

    std::map<ItemId, std::vector<glm::vec3>> m_points;

    SignalConnections m_connections;
};
