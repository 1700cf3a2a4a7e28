#include "EditorOriginator.hpp"

#include <stdexcept>

#include "EditorSignals.hpp"
#include "GeometryDatabase.hpp"

EditorOriginator::EditorOriginator(GeometryDatabase&    db,
                                   SelectionDatabase&   selection,
                                   SnapManager&         snaps,
                                   CrossPointDatabase&  crosses,
                                   PlanarCurveDatabase& curves,
                                   ModifierManager&     modifiers,
                                   EditorSignals&       signals) :
    m_db(db),
    m_selection(selection),
    m_snaps(snaps),
    m_crosses(crosses),
    m_curves(curves),
    m_modifiers(modifiers),
    m_signals(signals)
{
}

std::shared_ptr<const EditorMemento> EditorOriginator::saveToMemento() const
{
    return std::make_shared<const EditorMemento>(m_nextOrdinal++,
                                                 m_db.saveToMemento(),
                                                 m_selection.saveToMemento(),
                                                 m_snaps.saveToMemento(),
                                                 m_crosses.saveToMemento(),
                                                 m_curves.saveToMemento(),
                                                 m_modifiers.saveToMemento());
}

Future<void> EditorOriginator::restoreFromMemento(std::shared_ptr<const EditorMemento> memento)
{
    if (!memento)
        throw std::invalid_argument("EditorOriginator::restoreFromMemento(): null memento.");

    return m_db.enqueue([this, memento]() {
        apply(*memento);
        return makeReadyFuture();
    });
}

void EditorOriginator::apply(const EditorMemento& memento)
{
    GeometryMemento   geometry  = memento.geometry();
    CrossPointMemento crosses   = memento.crosses();
    SnapMemento       snaps     = memento.snaps();
    CurveMemento      curves    = memento.curves();
    ModifierMemento   modifiers = memento.modifiers();
    SelectionMemento  selection = memento.selection();

    // Geometry first, then the caches derived from it.
    m_db.restoreFromMemento(std::move(geometry));
    m_crosses.restoreFromMemento(std::move(crosses));
    m_snaps.restoreFromMemento(std::move(snaps));
    m_curves.restoreFromMemento(std::move(curves));
    m_modifiers.restoreFromMemento(std::move(modifiers));
    m_selection.restoreFromMemento(std::move(selection));

    m_db.signals().sceneGraphChanged.dispatch();
    m_signals.selectionChanged.dispatch();
    m_signals.modifiersChanged.dispatch();
}

void EditorOriginator::validate() const
{
    m_db.validate();

    for (ItemId id : m_selection.items())
    {
        if (!m_db.hasItem(id))
            throw InvalidPrecondition("EditorOriginator::validate(): selected object " + std::to_string(id) +
                                      " missing from geometry model");
    }

    for (ItemId region : m_curves.regions())
    {
        if (!m_db.hasItem(region) || !m_db.isAutomatic(region))
            throw InvalidPrecondition("EditorOriginator::validate(): region " + std::to_string(region) +
                                      " is not an automatic item");
    }
}
