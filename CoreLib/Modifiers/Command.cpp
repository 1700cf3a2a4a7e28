#include "Command.hpp"

#include <exception>
#include <stdexcept>

Command::Command(Editor& editor) noexcept : m_editor(editor)
{
}

bool Command::cancel()
{
    if (!transition(CommandState::CANCELLED))
        return false;

    m_stop.request_stop();
    return true;
}

bool Command::interrupt()
{
    if (!transition(CommandState::INTERRUPTED))
        return false;

    m_stop.request_stop();
    return true;
}

Future<void> Command::start()
{
    if (!transition(CommandState::STARTED))
    {
        return makeFailedFuture<void>(std::make_exception_ptr(
            std::logic_error("Command::start(): \"" + title() + "\" cannot start from state " + toString(m_state))));
    }

    try
    {
        Future<void> effect = execute(m_stop.get_token());
        if (!effect.valid())
            throw std::logic_error("Command::start(): \"" + title() + "\" returned an invalid future.");
        return effect;
    }
    catch (...)
    {
        return makeFailedFuture<void>(std::current_exception());
    }
}

void Command::finish() noexcept
{
    transition(CommandState::FINISHED);
}

void Command::fail() noexcept
{
    transition(CommandState::CANCELLED);
}

bool Command::transition(CommandState next) noexcept
{
    switch (m_state)
    {
        case CommandState::NONE:
            if (next == CommandState::FINISHED || next == CommandState::NONE)
                return false;
            break;
        case CommandState::STARTED:
            if (next == CommandState::NONE || next == CommandState::STARTED)
                return false;
            break;
        case CommandState::FINISHED:
        case CommandState::CANCELLED:
        case CommandState::INTERRUPTED:
            return false;
    }

    m_state = next;
    return true;
}
