#include "CmdHistory.hpp"

#include <iostream>

#include "Editor.hpp"
#include "History.hpp"

Future<void> CmdUndo::execute(std::stop_token /*token*/)
{
    return editor().history().undo().then([this](bool applied) {
        m_applied = applied;
        if (!applied)
            std::cerr << "CmdUndo: nothing to undo.\n";
        return makeReadyFuture();
    });
}

Future<void> CmdRedo::execute(std::stop_token /*token*/)
{
    return editor().history().redo().then([this](bool applied) {
        m_applied = applied;
        if (!applied)
            std::cerr << "CmdRedo: nothing to redo.\n";
        return makeReadyFuture();
    });
}
