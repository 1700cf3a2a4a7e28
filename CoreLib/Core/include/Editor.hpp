//=============================================================================
// Editor.hpp
//=============================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Config.hpp"
#include "EditorSignals.hpp"
#include "Future.hpp"
#include "MeshCreator.hpp"

class Command;
class CommandExecutor;
class CrossPointDatabase;
class EditorOriginator;
class GeometryDatabase;
class History;
class ModifierManager;
class PlanarCurveDatabase;
class SelectionDatabase;
class SnapManager;

/**
 * @brief Central editing controller.
 *
 * Owns the document (geometry database and the subsystems derived from it),
 * the history, the command executor and the named-command registry. Every
 * change to the document goes through a Command; Editor only routes them.
 *
 * The history starts with an "Initial" checkpoint of the empty document.
 */
class Editor
{
public:
    /**
     * @param settings    Tunables; see EditorSettings.
     * @param meshCreator Geometry kernel; an ImmediateMeshCreator when null.
     */
    explicit Editor(EditorSettings settings = config::defaultSettings(),
                    std::unique_ptr<MeshCreator> meshCreator = nullptr);

    ~Editor();

    Editor(const Editor&)            = delete;
    Editor& operator=(const Editor&) = delete;

    // ------------------------------------------------------------
    // Commands
    // ------------------------------------------------------------

    /**
     * @brief Submit a command, interrupting the running one.
     * @return Resolves when the command's slot is done. Never rejects.
     */
    Future<void> enqueue(std::shared_ptr<Command> command);

    /**
     * @brief Create a registered command by name and enqueue it.
     * @throws std::runtime_error if no command is registered under @p name.
     */
    Future<void> runCommand(const std::string& name);

    /** @brief Enqueue an undo step. */
    Future<void> undo();

    /** @brief Enqueue a redo step. */
    Future<void> redo();

    /** @return Names accepted by runCommand(). */
    [[nodiscard]] std::vector<std::string> commandNames() const;

    // ------------------------------------------------------------
    // Subsystems
    // ------------------------------------------------------------

    [[nodiscard]] GeometryDatabase&    db() noexcept;
    [[nodiscard]] SelectionDatabase&   selection() noexcept;
    [[nodiscard]] SnapManager&         snaps() noexcept;
    [[nodiscard]] CrossPointDatabase&  crosses() noexcept;
    [[nodiscard]] PlanarCurveDatabase& curves() noexcept;
    [[nodiscard]] ModifierManager&     modifiers() noexcept;
    [[nodiscard]] EditorOriginator&    originator() noexcept;
    [[nodiscard]] History&             history() noexcept;
    [[nodiscard]] CommandExecutor&     executor() noexcept;

    [[nodiscard]] EditorSignals& signals() noexcept
    {
        return m_signals;
    }

    [[nodiscard]] const EditorSettings& settings() const noexcept
    {
        return m_settings;
    }

private:
    EditorSettings m_settings;
    EditorSignals  m_signals;
    CommandFactory m_commandFactory;

    // Declaration order is construction order: everything below depends on
    // what precedes it.
    std::unique_ptr<MeshCreator>         m_meshCreator;
    std::unique_ptr<GeometryDatabase>    m_db;
    std::unique_ptr<CrossPointDatabase>  m_crosses;
    std::unique_ptr<SnapManager>         m_snaps;
    std::unique_ptr<PlanarCurveDatabase> m_curves;
    std::unique_ptr<ModifierManager>     m_modifiers;
    std::unique_ptr<SelectionDatabase>   m_selection;
    std::unique_ptr<EditorOriginator>    m_originator;
    std::unique_ptr<History>             m_history;
    std::unique_ptr<CommandExecutor>     m_executor;
};
