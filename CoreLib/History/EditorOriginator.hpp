#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "CrossPointDatabase.hpp"
#include "Future.hpp"
#include "GeometryMemento.hpp"
#include "ModifierManager.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"
#include "SnapManager.hpp"

class GeometryDatabase;
struct EditorSignals;

/**
 * @brief Immutable snapshot of the whole editable document.
 *
 * Only ever handed out as std::shared_ptr<const EditorMemento>; history
 * entries and callers can share one without copying.
 */
class EditorMemento
{
public:
    EditorMemento(uint64_t           ordinal,
                  GeometryMemento    geometry,
                  SelectionMemento   selection,
                  SnapMemento        snaps,
                  CrossPointMemento  crosses,
                  CurveMemento       curves,
                  ModifierMemento    modifiers) :
        m_ordinal(ordinal),
        m_geometry(std::move(geometry)),
        m_selection(std::move(selection)),
        m_snaps(std::move(snaps)),
        m_crosses(std::move(crosses)),
        m_curves(std::move(curves)),
        m_modifiers(std::move(modifiers))
    {
    }

    /** @brief Creation order; strictly increasing per originator. */
    [[nodiscard]] uint64_t ordinal() const noexcept
    {
        return m_ordinal;
    }

    [[nodiscard]] const GeometryMemento& geometry() const noexcept
    {
        return m_geometry;
    }

    [[nodiscard]] const SelectionMemento& selection() const noexcept
    {
        return m_selection;
    }

    [[nodiscard]] const SnapMemento& snaps() const noexcept
    {
        return m_snaps;
    }

    [[nodiscard]] const CrossPointMemento& crosses() const noexcept
    {
        return m_crosses;
    }

    [[nodiscard]] const CurveMemento& curves() const noexcept
    {
        return m_curves;
    }

    [[nodiscard]] const ModifierMemento& modifiers() const noexcept
    {
        return m_modifiers;
    }

private:
    uint64_t          m_ordinal;
    GeometryMemento   m_geometry;
    SelectionMemento  m_selection;
    SnapMemento       m_snaps;
    CrossPointMemento m_crosses;
    CurveMemento      m_curves;
    ModifierMemento   m_modifiers;
};

/**
 * @brief Captures and restores every subsystem that makes up the document.
 *
 * A restore runs as one operation on the database queue, behind any mutation
 * still waiting on the kernel. Every part of the memento is copied before the
 * first subsystem is touched; the swaps that follow do not throw, so a restore
 * either lands completely or not at all. sceneGraphChanged, selectionChanged
 * and modifiersChanged are published after the last swap.
 */
class EditorOriginator
{
public:
    EditorOriginator(GeometryDatabase&    db,
                     SelectionDatabase&   selection,
                     SnapManager&         snaps,
                     CrossPointDatabase&  crosses,
                     PlanarCurveDatabase& curves,
                     ModifierManager&     modifiers,
                     EditorSignals&       signals);

    [[nodiscard]] std::shared_ptr<const EditorMemento> saveToMemento() const;

    /**
     * @brief Queue a restore of the whole document.
     * @return Settles once the memento is in place.
     * @throws std::invalid_argument if @p memento is null.
     */
    Future<void> restoreFromMemento(std::shared_ptr<const EditorMemento> memento);

    /** @throws InvalidPrecondition if the subsystems disagree with each other. */
    void validate() const;

private:
    void apply(const EditorMemento& memento);

private:
    GeometryDatabase&    m_db;
    SelectionDatabase&   m_selection;
    SnapManager&         m_snaps;
    CrossPointDatabase&  m_crosses;
    PlanarCurveDatabase& m_curves;
    ModifierManager&     m_modifiers;
    EditorSignals&       m_signals;

    mutable uint64_t m_nextOrdinal = 1;
};
