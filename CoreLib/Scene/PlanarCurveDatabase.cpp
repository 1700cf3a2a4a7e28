#include "PlanarCurveDatabase.hpp"

#include "GeometryDatabase.hpp"

PlanarCurveDatabase::PlanarCurveDatabase(GeometryDatabase& db) : m_db(db)
{
}

Future<void> PlanarCurveDatabase::add(ItemId curve)
{
    const ItemRecord& record = m_db.lookupItemById(curve);
    if (record.type != ItemType::CURVE)
        throw InvalidPrecondition("PlanarCurveDatabase::add(): object " + std::to_string(curve) + " is not a curve");

    if (contains(curve))
        return makeReadyFuture();

    const GeometryModel& model = *record.model;

    CurveInfo info;
    info.planar     = model.planar;
    info.closed     = isClosed(model);
    m_curves[curve] = info;

    if (!info.planar || !info.closed)
        return makeReadyFuture();

    return m_db.addItem(makeRegion(model.controlPoints), Agent::AUTOMATIC).then([this, curve](ItemId region) {
        if (auto it = m_curves.find(curve); it != m_curves.end())
            it->second.regions.push_back(region);
        return makeReadyFuture();
    });
}

Future<void> PlanarCurveDatabase::remove(ItemId curve)
{
    auto it = m_curves.find(curve);
    if (it == m_curves.end())
        return makeReadyFuture();

    const std::vector<ItemId> regions = it->second.regions;
    m_curves.erase(it);

    std::vector<Future<void>> removals;
    for (ItemId region : regions)
    {
        if (m_db.hasItem(region))
            removals.push_back(m_db.removeItem(region));
    }
    return whenAll(std::move(removals));
}

Future<void> PlanarCurveDatabase::replace(ItemId from, ItemId to)
{
    return remove(from).then([this, to]() { return add(to); });
}

const CurveInfo& PlanarCurveDatabase::lookup(ItemId curve) const
{
    auto it = m_curves.find(curve);
    if (it == m_curves.end())
        throw InvalidPrecondition("PlanarCurveDatabase::lookup(): curve " + std::to_string(curve) + " is not tracked");
    return it->second;
}

std::vector<ItemId> PlanarCurveDatabase::regions() const
{
    std::vector<ItemId> result;
    for (const auto& [curve, info] : m_curves)
        result.insert(result.end(), info.regions.begin(), info.regions.end());
    return result;
}

CurveMemento PlanarCurveDatabase::saveToMemento() const
{
    return CurveMemento{m_curves};
}

void PlanarCurveDatabase::restoreFromMemento(CurveMemento memento)
{
    m_curves.swap(memento.curves);
}
