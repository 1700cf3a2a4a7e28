#pragma once

#include <cstddef>

#include "ItemFactory.hpp"

class Command;
class Editor;

using CommandFactory = ItemFactory<Command, Editor&>;

/** @brief Tunables read once when an Editor is constructed. */
struct EditorSettings
{
    std::size_t historyDepth      = 0;     ///< Maximum history entries; 0 = unbounded.
    bool        rollbackOnFailure = true;  ///< Restore the last checkpoint after a command fails or is interrupted.
    bool        snapEnabled       = false; ///< Grid snapping on at startup.
    float       snapGridSize      = 0.1f;  ///< Grid spacing in world units.
    float       crossTolerance    = 1e-4f; ///< Distance under which control points of two curves cross.
};

namespace config
{
    [[nodiscard]] EditorSettings defaultSettings();

    /** @brief Register every command that can be run by name. */
    void registerCommands(CommandFactory& factory);
} // namespace config
