#include "Config.hpp"

#include "CmdDelete.hpp"
#include "CmdDuplicate.hpp"
#include "CmdHistory.hpp"
#include "CmdSelect.hpp"

namespace config
{

    EditorSettings defaultSettings()
    {
        return EditorSettings{};
    }

    void registerCommands(CommandFactory& factory)
    {
        factory.registerItem("SelectAll", &CommandFactory::createItemType<CmdSelectAll>);
        factory.registerItem("SelectNone", &CommandFactory::createItemType<CmdSelectNone>);
        factory.registerItem("Delete", &CommandFactory::createItemType<CmdDelete>);
        factory.registerItem("Duplicate", &CommandFactory::createItemType<CmdDuplicate>);
        factory.registerItem("Undo", &CommandFactory::createItemType<CmdUndo>);
        factory.registerItem("Redo", &CommandFactory::createItemType<CmdRedo>);
    }

} // namespace config
