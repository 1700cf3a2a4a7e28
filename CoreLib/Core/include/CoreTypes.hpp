//=============================================================================
// CoreTypes.hpp
//=============================================================================
// Public enums and types shared by the editor core and its embedders.

#pragma once

/**
 * @brief Lifecycle of a Command.
 *
 * NONE -> STARTED -> FINISHED
 *                 -> CANCELLED
 *                 -> INTERRUPTED
 * NONE -> CANCELLED | INTERRUPTED
 *
 * FINISHED, CANCELLED and INTERRUPTED are terminal.
 */
enum class CommandState
{
    NONE,
    STARTED,
    FINISHED,
    CANCELLED,
    INTERRUPTED,
};

[[nodiscard]] constexpr bool isTerminal(CommandState state) noexcept
{
    return state == CommandState::FINISHED || state == CommandState::CANCELLED ||
           state == CommandState::INTERRUPTED;
}

[[nodiscard]] constexpr const char* toString(CommandState state) noexcept
{
    switch (state)
    {
        case CommandState::NONE:
            return "None";
        case CommandState::STARTED:
            return "Started";
        case CommandState::FINISHED:
            return "Finished";
        case CommandState::CANCELLED:
            return "Cancelled";
        case CommandState::INTERRUPTED:
            return "Interrupted";
    }
    return "Unknown";
}

/** @brief Kinds of non-destructive modifiers that can be stacked on an item. */
enum class ModifierKind
{
    SYMMETRY,
    MIRROR,
    SUBDIVIDE,
    OFFSET,
};
