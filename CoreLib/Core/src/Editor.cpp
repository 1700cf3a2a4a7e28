#include "Editor.hpp"

#include <stdexcept>

#include "CmdHistory.hpp"
#include "Command.hpp"
#include "CommandExecutor.hpp"
#include "CrossPointDatabase.hpp"
#include "EditorOriginator.hpp"
#include "GeometryDatabase.hpp"
#include "History.hpp"
#include "MeshCreator.hpp"
#include "ModifierManager.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"
#include "SnapManager.hpp"

Editor::Editor(EditorSettings settings, std::unique_ptr<MeshCreator> meshCreator) :
    m_settings(settings),
    m_meshCreator(std::move(meshCreator))
{
    if (!m_meshCreator)
        m_meshCreator = std::make_unique<ImmediateMeshCreator>();

    m_db        = std::make_unique<GeometryDatabase>(*m_meshCreator);
    m_crosses   = std::make_unique<CrossPointDatabase>(*m_db, m_settings.crossTolerance);
    m_snaps     = std::make_unique<SnapManager>(*m_db, *m_crosses);
    m_curves    = std::make_unique<PlanarCurveDatabase>(*m_db);
    m_modifiers = std::make_unique<ModifierManager>(*m_db, m_signals);
    m_selection = std::make_unique<SelectionDatabase>(*m_db, m_signals);

    m_snaps->setEnabled(m_settings.snapEnabled);
    m_snaps->setGridSize(m_settings.snapGridSize);

    m_originator = std::make_unique<EditorOriginator>(
        *m_db, *m_selection, *m_snaps, *m_crosses, *m_curves, *m_modifiers, m_signals);
    m_history  = std::make_unique<History>(*m_originator, m_signals, m_settings.historyDepth);
    m_executor = std::make_unique<CommandExecutor>(*m_history, m_signals, m_settings.rollbackOnFailure);

    config::registerCommands(m_commandFactory);

    m_history->checkpoint("Initial");
}

Editor::~Editor()
{
    // Executor first: its queue may still reference the history.
    m_executor.reset();
    m_history.reset();
    m_originator.reset();
    m_selection.reset();
    m_modifiers.reset();
    m_curves.reset();
    m_snaps.reset();
    m_crosses.reset();
    m_db.reset();
}

// ------------------------------------------------------------

Future<void> Editor::enqueue(std::shared_ptr<Command> command)
{
    return m_executor->enqueue(std::move(command));
}

Future<void> Editor::runCommand(const std::string& name)
{
    std::unique_ptr<Command> command = m_commandFactory.createItem(name, *this);
    if (!command)
        throw std::runtime_error("Editor::runCommand(): Command \"" + name + "\" not found.");

    return enqueue(std::move(command));
}

Future<void> Editor::undo()
{
    return enqueue(std::make_shared<CmdUndo>(*this));
}

Future<void> Editor::redo()
{
    return enqueue(std::make_shared<CmdRedo>(*this));
}

std::vector<std::string> Editor::commandNames() const
{
    return m_commandFactory.names();
}

// ------------------------------------------------------------

GeometryDatabase& Editor::db() noexcept
{
    return *m_db;
}

SelectionDatabase& Editor::selection() noexcept
{
    return *m_selection;
}

SnapManager& Editor::snaps() noexcept
{
    return *m_snaps;
}

CrossPointDatabase& Editor::crosses() noexcept
{
    return *m_crosses;
}

PlanarCurveDatabase& Editor::curves() noexcept
{
    return *m_curves;
}

ModifierManager& Editor::modifiers() noexcept
{
    return *m_modifiers;
}

EditorOriginator& Editor::originator() noexcept
{
    return *m_originator;
}

History& Editor::history() noexcept
{
    return *m_history;
}

CommandExecutor& Editor::executor() noexcept
{
    return *m_executor;
}
