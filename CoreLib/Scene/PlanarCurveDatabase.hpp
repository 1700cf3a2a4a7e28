#pragma once

#include <map>
#include <vector>

#include "Future.hpp"
#include "GeometryTypes.hpp"
#include "Memento.hpp"

class GeometryDatabase;

/** @brief What the editor knows about one curve. */
struct CurveInfo
{
    bool                planar = false;
    bool                closed = false;
    std::vector<ItemId> regions; ///< Automatic regions bounded by this curve.
};

struct CurveMemento
{
    std::map<ItemId, CurveInfo> curves;
};

/**
 * @brief Curve, contour and region bookkeeping.
 *
 * Commands register curves here after adding them to the database. A closed
 * planar curve gets an automatic region item filling it; the region lives and
 * dies with its curve. Unlike the passive caches, this database mutates the
 * document, so its operations return Futures that commands chain on.
 */
class PlanarCurveDatabase final : public MementoOriginator<CurveMemento>
{
public:
    explicit PlanarCurveDatabase(GeometryDatabase& db);

    PlanarCurveDatabase(const PlanarCurveDatabase&)            = delete;
    PlanarCurveDatabase& operator=(const PlanarCurveDatabase&) = delete;

    /**
     * @brief Start tracking a curve and build its regions.
     * @throws InvalidPrecondition if @p curve is not a curve item.
     */
    Future<void> add(ItemId curve);

    /** @brief Stop tracking a curve and delete its regions. */
    Future<void> remove(ItemId curve);

    /** @brief Move tracking from one curve version to its replacement. */
    Future<void> replace(ItemId from, ItemId to);

    [[nodiscard]] bool contains(ItemId curve) const noexcept
    {
        return m_curves.count(curve) != 0;
    }

    /** @throws InvalidPrecondition if the curve is not tracked. */
    [[nodiscard]] const CurveInfo& lookup(ItemId curve) const;

    /** @return Every automatic region owned by a tracked curve. */
    [[nodiscard]] std::vector<ItemId> regions() const;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_curves.size();
    }

    [[nodiscard]] CurveMemento saveToMemento() const override;
    void                       restoreFromMemento(CurveMemento memento) override;

private:
    GeometryDatabase&           m_db;
    std::map<ItemId, CurveInfo> m_curves;
};
