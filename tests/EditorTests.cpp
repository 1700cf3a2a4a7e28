#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "CmdAddItem.hpp"
#include "CmdSelect.hpp"
#include "Editor.hpp"
#include "EditorOriginator.hpp"
#include "GeometryDatabase.hpp"
#include "History.hpp"
#include "SelectionDatabase.hpp"
#include "TestSupport.hpp"

namespace
{
    ItemId add(Editor& editor, GeometryPtr model, bool select = true)
    {
        auto command = std::make_shared<CmdAddItem>(editor, std::move(model), select);
        editor.enqueue(command);
        EXPECT_EQ(command->state(), CommandState::FINISHED);
        return command->result().value();
    }
} // namespace

TEST(EditorTest, RegistersNamedCommands)
{
    Editor editor;

    const std::vector<std::string> names = editor.commandNames();
    for (const char* expected : {"Delete", "Duplicate", "Redo", "SelectAll", "SelectNone", "Undo"})
        EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;

    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
}

TEST(EditorTest, UnknownCommandNameThrows)
{
    Editor editor;
    EXPECT_THROW(editor.runCommand("Explode"), std::runtime_error);
    EXPECT_EQ(editor.history().size(), 1u);
}

TEST(EditorTest, RunCommandByName)
{
    Editor       editor;
    const ItemId a = add(editor, unitBox(), false);
    const ItemId b = add(editor, unitBox(), false);

    editor.runCommand("SelectAll");
    EXPECT_TRUE(editor.selection().isSelected(a));
    EXPECT_TRUE(editor.selection().isSelected(b));
    EXPECT_EQ(editor.history().current()->label, "Select All");

    editor.runCommand("SelectNone");
    EXPECT_TRUE(editor.selection().empty());

    editor.runCommand("Undo");
    EXPECT_EQ(editor.selection().items().size(), 2u);

    editor.runCommand("Redo");
    EXPECT_TRUE(editor.selection().empty());
}

TEST(EditorTest, AddItemTitleNamesType)
{
    Editor editor;
    add(editor, closedSquare());
    EXPECT_EQ(editor.history().current()->label, "Add Curve");
}

TEST(EditorTest, DuplicateSelectsCopies)
{
    Editor       editor;
    const ItemId a = add(editor, unitBox(), false);
    const ItemId b = add(editor, closedSquare(), false);

    editor.enqueue(std::make_shared<CmdSelectItems>(editor, std::vector<ItemId>{a, b}));
    editor.runCommand("Duplicate");

    EXPECT_EQ(editor.db().findAll().size(), 4u);
    EXPECT_EQ(editor.selection().items().size(), 2u);
    EXPECT_FALSE(editor.selection().isSelected(a));
    EXPECT_FALSE(editor.selection().isSelected(b));

    // The copied curve is closed and planar, so it gets a region of its own.
    EXPECT_EQ(editor.curves().size(), 2u);
    EXPECT_EQ(editor.db().find(ItemType::REGION, true).size(), 2u);
    EXPECT_NO_THROW(editor.originator().validate());

    editor.undo();
    EXPECT_EQ(editor.db().findAll().size(), 2u);
    EXPECT_TRUE(editor.selection().isSelected(a));
}

TEST(EditorTest, DeleteRemovesSelectedItems)
{
    Editor       editor;
    const ItemId keep   = add(editor, unitBox(), false);
    const ItemId remove = add(editor, unitBox());

    editor.runCommand("Delete");

    EXPECT_TRUE(editor.db().hasItem(keep));
    EXPECT_FALSE(editor.db().hasItem(remove));
    EXPECT_EQ(editor.history().current()->label, "Delete");
    EXPECT_NO_THROW(editor.originator().validate());
}

TEST(EditorTest, DeleteWithEmptySelectionStillFinishes)
{
    Editor editor;
    add(editor, unitBox(), false);

    editor.runCommand("Delete");

    EXPECT_EQ(editor.db().size(), 1u);
    EXPECT_EQ(editor.history().size(), 3u);
}

TEST(EditorTest, UsesProvidedMeshCreator)
{
    auto  mesher = std::make_unique<DeferredMeshCreator>();
    auto& kernel = *mesher;

    Editor editor(config::defaultSettings(), std::move(mesher));
    auto   command = std::make_shared<CmdAddItem>(editor, unitBox());

    editor.enqueue(command);
    EXPECT_EQ(command->state(), CommandState::STARTED);
    EXPECT_TRUE(editor.executor().busy());
    EXPECT_EQ(kernel.pending(), 1u);

    kernel.settleAll();

    EXPECT_EQ(command->state(), CommandState::FINISHED);
    EXPECT_TRUE(editor.db().hasItem(command->result().value()));
}

TEST(EditorTest, SupersededCommandWaitingOnKernelLeavesNoTrace)
{
    auto  mesher = std::make_unique<DeferredMeshCreator>();
    auto& kernel = *mesher;

    Editor editor(config::defaultSettings(), std::move(mesher));
    auto   first  = std::make_shared<CmdAddItem>(editor, unitBox());
    auto   second = std::make_shared<CmdAddItem>(editor, closedSquare());

    editor.enqueue(first);
    editor.enqueue(second);
    EXPECT_EQ(first->state(), CommandState::INTERRUPTED);

    // first's insert lands, sees the stop request and bails out; rollback
    // removes the item before second starts.
    kernel.settle(0);
    EXPECT_EQ(editor.db().size(), 0u);
    EXPECT_EQ(second->state(), CommandState::STARTED);
    EXPECT_EQ(kernel.pending(), 1u);

    kernel.settleAll();

    EXPECT_EQ(second->state(), CommandState::FINISHED);
    EXPECT_EQ(editor.db().findAll().size(), 1u);
    EXPECT_EQ(editor.db().lookupItemById(second->result().value()).type, ItemType::CURVE);
    EXPECT_EQ(editor.history().size(), 2u);
    EXPECT_NO_THROW(editor.originator().validate());
}
