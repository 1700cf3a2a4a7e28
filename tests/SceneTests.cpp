#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <vector>

#include "CmdAddItem.hpp"
#include "CmdAddModifier.hpp"
#include "CmdTranslate.hpp"
#include "CrossPointDatabase.hpp"
#include "Editor.hpp"
#include "EditorOriginator.hpp"
#include "GeometryDatabase.hpp"
#include "ModifierManager.hpp"
#include "PlanarCurveDatabase.hpp"
#include "SelectionDatabase.hpp"
#include "SnapManager.hpp"
#include "TestSupport.hpp"

namespace
{
    ItemId add(Editor& editor, GeometryPtr model)
    {
        auto command = std::make_shared<CmdAddItem>(editor, std::move(model));
        editor.enqueue(command);
        EXPECT_EQ(command->state(), CommandState::FINISHED);
        return command->result().value();
    }

    void expectNear(const glm::vec3& a, const glm::vec3& b)
    {
        EXPECT_FLOAT_EQ(a.x, b.x);
        EXPECT_FLOAT_EQ(a.y, b.y);
        EXPECT_FLOAT_EQ(a.z, b.z);
    }
} // namespace

// ------------------------------------------------------------
// Selection
// ------------------------------------------------------------

TEST(SelectionTest, RemovedItemsLeaveSelection)
{
    Editor       editor;
    const ItemId id = add(editor, unitBox());

    editor.selection().selectTopology("face,1,2");
    editor.selection().selectControlPoint("point,1,0");
    EXPECT_TRUE(editor.selection().isSelected(id));

    editor.runCommand("Delete");

    EXPECT_EQ(editor.db().size(), 0u);
    EXPECT_TRUE(editor.selection().empty());

    editor.undo();
    EXPECT_TRUE(editor.db().hasItem(id));
    EXPECT_TRUE(editor.selection().isSelected(id));
}

TEST(SelectionTest, SelectionFollowsReplacedItem)
{
    Editor       editor;
    const ItemId id = add(editor, unitBox());

    editor.enqueue(std::make_shared<CmdTranslate>(editor, glm::vec3(1.0f, 0.0f, 0.0f)));

    const ItemId moved = editor.db().lookupByName(id);
    EXPECT_NE(moved, id);
    EXPECT_FALSE(editor.selection().isSelected(id));
    EXPECT_TRUE(editor.selection().isSelected(moved));
    expectNear(editor.db().lookup(moved)->controlPoints[0], glm::vec3(1.0f, 0.0f, 0.0f));

    editor.undo();
    EXPECT_TRUE(editor.selection().isSelected(id));
    EXPECT_EQ(editor.db().lookupByName(id), id);
}

TEST(SelectionTest, SelectMissingItemThrows)
{
    Editor editor;
    EXPECT_THROW(editor.selection().selectItem(7), InvalidPrecondition);
    EXPECT_THROW(editor.selection().selectTopology("face,7,0"), InvalidPrecondition);
}

TEST(SelectionTest, PublishesSelectionChanged)
{
    Editor editor;
    int    changes = 0;
    editor.signals().selectionChanged.connect([&changes]() { ++changes; });

    const ItemId id = add(editor, unitBox());
    const int    afterAdd = changes;
    EXPECT_GT(afterAdd, 0);

    EXPECT_FALSE(editor.selection().selectItem(id));
    EXPECT_EQ(changes, afterAdd);

    EXPECT_TRUE(editor.selection().deselectItem(id));
    EXPECT_EQ(changes, afterAdd + 1);
}

TEST(SelectionTest, SelectAllSkipsHiddenAndUnselectableItems)
{
    Editor       editor;
    const ItemId hidden     = add(editor, unitBox());
    const ItemId locked     = add(editor, unitBox());
    const ItemId selectable = add(editor, closedSquare());

    editor.db().makeHidden(hidden, true);
    editor.db().makeSelectable(locked, false);

    editor.runCommand("SelectNone");
    editor.runCommand("SelectAll");
    EXPECT_EQ(editor.selection().items(), (std::set<ItemId>{selectable}));

    editor.db().setTypeEnabled(ItemType::CURVE, false);
    editor.runCommand("SelectNone");
    editor.runCommand("SelectAll");
    EXPECT_TRUE(editor.selection().empty());
}

// ------------------------------------------------------------
// Snapping
// ------------------------------------------------------------

TEST(SnapTest, CachesControlPointsOfDocumentItems)
{
    Editor       editor;
    const ItemId id = add(editor, unitBox());

    ASSERT_NE(editor.snaps().pointsFor(id), nullptr);
    EXPECT_EQ(editor.snaps().pointsFor(id)->size(), 8u);
    EXPECT_EQ(editor.snaps().pointCount(), 8u);

    expectNear(editor.snaps().snap(glm::vec3(0.98f, 1.01f, 0.0f), 0.05f), glm::vec3(1.0f, 1.0f, 0.0f));

    editor.undo();
    EXPECT_EQ(editor.snaps().pointsFor(id), nullptr);
    EXPECT_EQ(editor.snaps().pointCount(), 0u);
}

TEST(SnapTest, FallsBackToGrid)
{
    Editor editor;
    editor.snaps().setEnabled(true);
    editor.snaps().setGridSize(0.5f);

    expectNear(editor.snaps().snap(glm::vec3(0.7f, 1.2f, -0.3f), 0.01f), glm::vec3(0.5f, 1.0f, -0.5f));

    editor.snaps().setOrigin(glm::vec3(0.25f, 0.0f, 0.0f));
    expectNear(editor.snaps().applyGrid(glm::vec3(0.7f, 0.0f, 0.0f)), glm::vec3(0.75f, 0.0f, 0.0f));

    editor.snaps().setEnabled(false);
    expectNear(editor.snaps().applyGrid(glm::vec3(0.7f, 0.0f, 0.0f)), glm::vec3(0.7f, 0.0f, 0.0f));
}

TEST(SnapTest, TranslateDeltaIsGridSnapped)
{
    EditorSettings settings = config::defaultSettings();
    settings.snapEnabled    = true;
    settings.snapGridSize   = 1.0f;

    Editor       editor(settings);
    const ItemId id = add(editor, unitBox());

    editor.enqueue(std::make_shared<CmdTranslate>(editor, glm::vec3(0.8f, 0.2f, 0.0f)));

    expectNear(editor.db().lookup(editor.db().lookupByName(id))->controlPoints[0], glm::vec3(1.0f, 0.0f, 0.0f));
}

// ------------------------------------------------------------
// Cross points
// ------------------------------------------------------------

TEST(CrossPointTest, TracksSharedCurvePoints)
{
    Editor       editor;
    const ItemId first  = add(editor, openLine(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f)));
    const ItemId second = add(editor, openLine(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(1.0f, 1.0f, 0.0f)));
    add(editor, unitBox());

    ASSERT_EQ(editor.crosses().crosses().size(), 1u);
    EXPECT_EQ(editor.crosses().crosses()[0].first, first);
    EXPECT_EQ(editor.crosses().crosses()[0].second, second);
    expectNear(editor.crosses().crosses()[0].position, glm::vec3(1.0f, 0.0f, 0.0f));
    EXPECT_EQ(editor.crosses().crossesFor(second).size(), 1u);

    // Cross points are snap targets too.
    expectNear(editor.snaps().snap(glm::vec3(1.01f, 0.0f, 0.0f), 0.05f), glm::vec3(1.0f, 0.0f, 0.0f));

    editor.undo();
    editor.undo();
    EXPECT_TRUE(editor.crosses().crosses().empty());
    EXPECT_TRUE(editor.crosses().tracks(first));
    EXPECT_FALSE(editor.crosses().tracks(second));

    editor.redo();
    EXPECT_EQ(editor.crosses().crosses().size(), 1u);
    EXPECT_EQ(editor.db().size(), 2u);
}

// ------------------------------------------------------------
// Planar curves
// ------------------------------------------------------------

TEST(PlanarCurveTest, ClosedCurveGetsAutomaticRegion)
{
    Editor       editor;
    const ItemId curve = add(editor, closedSquare());
    const ItemId line  = add(editor, openLine(glm::vec3(5.0f), glm::vec3(6.0f)));

    const CurveInfo& info = editor.curves().lookup(curve);
    EXPECT_TRUE(info.planar);
    EXPECT_TRUE(info.closed);
    ASSERT_EQ(info.regions.size(), 1u);

    const ItemId region = info.regions[0];
    EXPECT_TRUE(editor.db().isAutomatic(region));
    EXPECT_EQ(editor.db().lookupItemById(region).type, ItemType::REGION);
    EXPECT_TRUE(editor.curves().lookup(line).regions.empty());

    editor.runCommand("SelectAll");
    EXPECT_EQ(editor.selection().items().size(), 2u);
    EXPECT_FALSE(editor.selection().isSelected(region));
    EXPECT_NO_THROW(editor.originator().validate());
}

TEST(PlanarCurveTest, RegionFollowsCurveThroughEdits)
{
    Editor       editor;
    const ItemId curve = add(editor, closedSquare());

    editor.enqueue(std::make_shared<CmdTranslate>(editor, glm::vec3(0.0f, 0.0f, 2.0f)));

    const ItemId moved = editor.db().lookupByName(curve);
    EXPECT_FALSE(editor.curves().contains(curve));
    ASSERT_TRUE(editor.curves().contains(moved));
    ASSERT_EQ(editor.curves().regions().size(), 1u);
    EXPECT_EQ(editor.db().find(ItemType::REGION, true).size(), 1u);
    EXPECT_FLOAT_EQ(editor.db().lookup(editor.curves().regions()[0])->controlPoints[0].z, 2.0f);
    EXPECT_NO_THROW(editor.originator().validate());

    editor.runCommand("Delete");
    EXPECT_EQ(editor.db().findAll(true).size(), 0u);
    EXPECT_EQ(editor.curves().size(), 0u);

    editor.undo();
    EXPECT_EQ(editor.db().findAll(true).size(), 2u);
    EXPECT_TRUE(editor.curves().contains(moved));
    EXPECT_NO_THROW(editor.originator().validate());
}

TEST(PlanarCurveTest, RestorePublishesOnlyConsistentState)
{
    Editor editor;
    add(editor, closedSquare());
    editor.runCommand("Delete");
    editor.undo();

    int  notifications = 0;
    auto check         = [&editor, &notifications]() {
        ++notifications;
        EXPECT_NO_THROW(editor.originator().validate());
    };
    editor.db().signals().sceneGraphChanged.connect(check);
    editor.signals().selectionChanged.connect(check);

    editor.redo();

    EXPECT_EQ(notifications, 2);
    EXPECT_EQ(editor.db().findAll(true).size(), 0u);
    EXPECT_EQ(editor.curves().size(), 0u);
}

TEST(PlanarCurveTest, NonCurveIsRejected)
{
    Editor       editor;
    const ItemId box = add(editor, unitBox());
    EXPECT_THROW(editor.curves().add(box), InvalidPrecondition);
    EXPECT_THROW((void)editor.curves().lookup(box), InvalidPrecondition);
}

// ------------------------------------------------------------
// Modifiers
// ------------------------------------------------------------

TEST(ModifierTest, StackIsKeyedByNameAndSurvivesReplace)
{
    Editor       editor;
    const ItemId id = add(editor, unitBox());
    int          changes = 0;
    editor.signals().modifiersChanged.connect([&changes]() { ++changes; });

    editor.enqueue(std::make_shared<CmdAddModifier>(editor, Modifier{ModifierKind::SUBDIVIDE, 2.0f}));
    ASSERT_TRUE(editor.modifiers().hasModifiers(id));
    EXPECT_EQ(changes, 1);

    editor.enqueue(std::make_shared<CmdTranslate>(editor, glm::vec3(1.0f)));
    const ItemId moved = editor.db().lookupByName(id);

    const ModifierStack* stack = editor.modifiers().stackFor(moved);
    ASSERT_NE(stack, nullptr);
    ASSERT_EQ(stack->size(), 1u);
    EXPECT_EQ((*stack)[0].kind, ModifierKind::SUBDIVIDE);
    EXPECT_FLOAT_EQ((*stack)[0].amount, 2.0f);

    editor.undo();
    editor.undo();
    EXPECT_FALSE(editor.modifiers().hasModifiers(id));
}

TEST(ModifierTest, RemovingItemDropsStack)
{
    Editor       editor;
    const ItemId id = add(editor, unitBox());

    editor.modifiers().add(id, Modifier{ModifierKind::MIRROR, 1.0f});
    EXPECT_EQ(editor.modifiers().size(), 1u);

    editor.runCommand("Delete");
    EXPECT_EQ(editor.modifiers().size(), 0u);

    EXPECT_THROW(editor.modifiers().add(id, Modifier{}), InvalidPrecondition);
}
