#pragma once

#include <memory>

#include "Future.hpp"
#include "SerialQueue.hpp"

class Command;
class History;
struct EditorSignals;

/**
 * @class CommandExecutor
 * @brief Runs commands one at a time, letting the newest command preempt older ones.
 *
 * enqueue() interrupts the command that is currently running (its effect is
 * told to stop but is not awaited) and queues the new one. Commands run on the
 * executor's own SerialQueue, separate from the database queue their effects
 * use. When a slot comes up:
 *  - a command that was superseded while still queued, or cancelled by its
 *    owner, is skipped and keeps its state;
 *  - otherwise it is STARTED and its effect runs to settlement.
 *
 * Outcome handling: success finishes the command and checkpoints History
 * (if the command wants to be remembered); failure cancels it. Either failure
 * or interruption rolls the document back to the current history entry when
 * rollback is enabled. The rollback is queued on the database behind any work
 * the command left in flight, and the slot (with commandEnded) waits for it.
 * Command errors are logged and never reach the caller.
 *
 * Destroying the executor interrupts the active command; effects that settle
 * afterwards are ignored.
 */
class CommandExecutor
{
public:
    /**
     * @param history            Checkpoint target and rollback source.
     * @param signals            Command lifecycle notifications.
     * @param rollbackOnFailure  Restore the last checkpoint after CANCELLED/INTERRUPTED.
     */
    CommandExecutor(History& history, EditorSignals& signals, bool rollbackOnFailure = true);
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&)            = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /**
     * @brief Interrupt the running command and queue @p command.
     *
     * @return Future that resolves once the command's slot is done, whatever
     *         the outcome. It never rejects; inspect Command::state().
     * @throws std::invalid_argument if @p command is null.
     */
    Future<void> enqueue(std::shared_ptr<Command> command);

    /** @return The command whose effect is running, or nullptr. */
    [[nodiscard]] Command* active() const noexcept
    {
        return m_active.get();
    }

    /** @return The most recently enqueued command that has not started yet, or nullptr. */
    [[nodiscard]] Command* pending() const noexcept
    {
        return m_next.get();
    }

    [[nodiscard]] bool busy() const noexcept
    {
        return m_queue.busy() || m_queue.pending() > 0;
    }

private:
    Future<void> run(const std::shared_ptr<Command>& command);
    Future<void> conclude(const std::shared_ptr<Command>& command, const Future<void>& effect);

private:
    History&       m_history;
    EditorSignals& m_signals;
    bool           m_rollbackOnFailure;

    std::shared_ptr<Command> m_active; ///< Started, not settled.
    std::shared_ptr<Command> m_next;   ///< Last enqueued, not started.

    SerialQueue m_queue;

    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true); ///< Expires with the executor.
};
