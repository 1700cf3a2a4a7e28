#include "CmdSelect.hpp"

#include "Editor.hpp"
#include "SelectionDatabase.hpp"

Future<void> CmdSelectAll::execute(std::stop_token /*token*/)
{
    editor().selection().selectAll();
    return makeReadyFuture();
}

Future<void> CmdSelectNone::execute(std::stop_token /*token*/)
{
    editor().selection().clear();
    return makeReadyFuture();
}

// ------------------------------------------------------------

CmdSelectItems::CmdSelectItems(Editor& editor, std::vector<ItemId> items) : Command(editor), m_items(std::move(items))
{
}

Future<void> CmdSelectItems::execute(std::stop_token /*token*/)
{
    SelectionDatabase& selection = editor().selection();

    selection.clear();
    for (ItemId id : m_items)
        selection.selectItem(id);

    return makeReadyFuture();
}
