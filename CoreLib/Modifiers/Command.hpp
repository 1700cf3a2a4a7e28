#pragma once

#include <stop_token>
#include <string>

#include "CoreTypes.hpp"
#include "Future.hpp"

class Editor;

/**
 * @class Command
 * @brief Base class for all user-initiated document operations.
 *
 * A command is a one-shot unit of work. Its effect routine runs against the
 * editor it was created for and may suspend by returning a pending Future.
 * The CommandExecutor drives the lifecycle (see CommandState); a command never
 * re-enters NONE and a terminal state never changes.
 *
 * Cancellation is cooperative. When a command is interrupted or cancelled its
 * stop token is signalled; the effect checks it with throwIfCancelled() or
 * wraps its waits in withCancellation(). Work that ignores the token simply
 * runs to completion, and its outcome is then discarded.
 */
class Command
{
public:
    explicit Command(Editor& editor) noexcept;
    virtual ~Command() = default;

    Command(const Command&)            = delete;
    Command& operator=(const Command&) = delete;

    [[nodiscard]] CommandState state() const noexcept
    {
        return m_state;
    }

    [[nodiscard]] bool terminal() const noexcept
    {
        return isTerminal(m_state);
    }

    /** @brief Label used for history entries and diagnostics. */
    [[nodiscard]] virtual std::string title() const
    {
        return "Command";
    }

    /** @brief Whether a successful run records a history entry. */
    [[nodiscard]] virtual bool remember() const noexcept
    {
        return true;
    }

    /**
     * @brief Abort the command on behalf of its caller.
     * @return False if the command was already terminal.
     */
    bool cancel();

    /**
     * @brief Mark the command as superseded.
     * @return False if the command was already terminal.
     */
    bool interrupt();

    [[nodiscard]] std::stop_token stopToken() const noexcept
    {
        return m_stop.get_token();
    }

protected:
    /**
     * @brief Effect routine.
     *
     * @param token Signalled when the command is interrupted or cancelled.
     * @return Future settling when the effect is done; rejection means failure.
     */
    virtual Future<void> execute(std::stop_token token) = 0;

    [[nodiscard]] Editor& editor() const noexcept
    {
        return m_editor;
    }

private:
    friend class CommandExecutor;

    /// NONE -> STARTED, then run the effect. Synchronous throws become a rejected future.
    Future<void> start();

    /// STARTED -> FINISHED. No-op if already terminal.
    void finish() noexcept;

    /// STARTED -> CANCELLED. No-op if already terminal.
    void fail() noexcept;

    bool transition(CommandState next) noexcept;

private:
    Editor&           m_editor;
    CommandState      m_state = CommandState::NONE;
    std::stop_source  m_stop;
};
