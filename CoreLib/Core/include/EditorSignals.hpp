#pragma once

#include "Signal.hpp"

class Command;

/**
 * @brief Editor-level notifications.
 *
 * Document-level notifications (objectAdded, objectRemoved, ...) are published
 * by GeometryDatabase::signals(); this struct carries the ones owned by the
 * command and history layers.
 */
struct EditorSignals
{
    /// A command left NONE and its effect is about to run.
    Signal<Command> commandStarted;

    /// A command reached FINISHED (after its history checkpoint, if any).
    Signal<Command> commandFinishedSuccessfully;

    /// A command that was started reached a terminal state. Always follows commandStarted.
    Signal<Command> commandEnded;

    Signal<> historyChanged;
    Signal<> selectionChanged;
    Signal<> modifiersChanged;
};
