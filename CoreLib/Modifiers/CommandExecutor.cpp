#include "CommandExecutor.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "Command.hpp"
#include "EditorSignals.hpp"
#include "History.hpp"

namespace
{
    std::string describe(const std::exception_ptr& error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception& e)
        {
            return e.what();
        }
        catch (...)
        {
            return "unknown error";
        }
    }
} // namespace

CommandExecutor::CommandExecutor(History& history, EditorSignals& signals, bool rollbackOnFailure) :
    m_history(history),
    m_signals(signals),
    m_rollbackOnFailure(rollbackOnFailure)
{
}

CommandExecutor::~CommandExecutor()
{
    // Effects that settle from here on, including any this interrupt settles,
    // find m_alive expired and stop there.
    m_alive.reset();
    if (m_active)
        m_active->interrupt();
}

Future<void> CommandExecutor::enqueue(std::shared_ptr<Command> command)
{
    if (!command)
        throw std::invalid_argument("CommandExecutor::enqueue(): command is null.");

    // Not awaited: the interrupted effect settles on its own schedule and
    // keeps the queue slot until it does.
    if (auto active = m_active)
        active->interrupt();

    m_next = command;

    Promise<void> done;
    Future<void>  result = done.future();

    m_queue.enqueue([this, command]() { return run(command); }).onSettled([done]() mutable { done.resolve(); });

    return result;
}

Future<void> CommandExecutor::run(const std::shared_ptr<Command>& command)
{
    // Superseded by a later enqueue while waiting for its slot.
    if (m_next != command)
        return makeReadyFuture();

    m_next.reset();

    // Cancelled or interrupted by its owner before it could start.
    if (command->state() != CommandState::NONE)
        return makeReadyFuture();

    m_active = command;
    m_signals.commandStarted.dispatch(*command);

    Future<void> effect = command->start();

    Promise<void>       slot;
    Future<void>        result = slot.future();
    std::weak_ptr<bool> alive  = m_alive;

    // The slot is held until the rollback, if any, has landed.
    effect.onSettled([this, alive, command, effect, slot]() mutable {
        if (alive.expired())
            return;
        conclude(command, effect).onSettled([slot]() mutable { slot.resolve(); });
    });

    return result;
}

Future<void> CommandExecutor::conclude(const std::shared_ptr<Command>& command, const Future<void>& effect)
{
    if (effect.rejected())
    {
        if (command->state() == CommandState::STARTED)
            std::cerr << "CommandExecutor: \"" << command->title() << "\" failed: " << describe(effect.error()) << "\n";
        command->fail();
    }
    else
    {
        command->finish();
    }

    if (m_active == command)
        m_active.reset();

    const bool finished = command->state() == CommandState::FINISHED;

    Future<void> settled = makeReadyFuture();
    try
    {
        if (finished && command->remember())
            m_history.checkpoint(command->title());
        else if (!finished && m_rollbackOnFailure)
            settled = m_history.restoreCurrent().then([](bool) { return makeReadyFuture(); });
    }
    catch (const std::exception& e)
    {
        std::cerr << "CommandExecutor: history update after \"" << command->title() << "\" failed: " << e.what()
                  << "\n";
    }

    Promise<void>       done;
    Future<void>        result = done.future();
    std::weak_ptr<bool> alive  = m_alive;

    settled.onSettled([this, alive, command, finished, settled, done]() mutable {
        if (alive.expired())
            return;

        if (settled.rejected())
            std::cerr << "CommandExecutor: rollback after \"" << command->title()
                      << "\" failed: " << describe(settled.error()) << "\n";

        if (finished)
            m_signals.commandFinishedSuccessfully.dispatch(*command);

        m_signals.commandEnded.dispatch(*command);
        done.resolve();
    });

    return result;
}
