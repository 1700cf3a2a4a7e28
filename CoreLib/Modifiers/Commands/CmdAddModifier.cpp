#include "CmdAddModifier.hpp"

#include "Editor.hpp"
#include "SelectionDatabase.hpp"

CmdAddModifier::CmdAddModifier(Editor& editor, const Modifier& modifier) : Command(editor), m_modifier(modifier)
{
}

Future<void> CmdAddModifier::execute(std::stop_token /*token*/)
{
    Editor& ed = editor();
    for (ItemId id : ed.selection().items())
        ed.modifiers().add(id, m_modifier);

    return makeReadyFuture();
}
