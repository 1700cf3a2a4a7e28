#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "GeometryDatabase.hpp"
#include "TestSupport.hpp"

namespace
{
    ItemId addNow(GeometryDatabase& db, GeometryPtr model, Agent agent = Agent::USER)
    {
        Future<ItemId> added = db.addItem(std::move(model), agent);
        EXPECT_TRUE(added.fulfilled());
        return added.get();
    }
} // namespace

TEST(GeometryDatabaseTest, AddAssignsIncreasingIdsAndNames)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    const ItemId a = addNow(db, unitBox());
    const ItemId b = addNow(db, unitBox());

    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(db.lookupName(b), b);
    EXPECT_EQ(db.lookupByName(a), a);
    EXPECT_EQ(db.version(), 3);

    const ItemRecord& record = db.lookupItemById(a);
    EXPECT_EQ(record.faces.size(), 6u);
    EXPECT_EQ(record.edges.size(), 12u);
    EXPECT_EQ(record.controlPoints.size(), 8u);
    EXPECT_TRUE(db.hasTopologyItem("face,1,5"));
    EXPECT_EQ(db.lookupTopologyItemById("edge,1,3").parent, a);
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, MutationsApplyInCallOrderWhenKernelSettlesOutOfOrder)
{
    DeferredMeshCreator mesher;
    GeometryDatabase    db(mesher);
    std::vector<ItemId> added;

    db.signals().objectAdded.connect([&added](const ItemId& id, const Agent&) { added.push_back(id); });

    Future<ItemId> first  = db.addItem(unitBox());
    Future<ItemId> second = db.addItem(openLine(glm::vec3(0.0f), glm::vec3(1.0f)));

    // The second request has not reached the kernel: the queue holds it back.
    EXPECT_EQ(mesher.pending(), 1u);
    EXPECT_TRUE(db.busy());

    mesher.settle(0);
    EXPECT_EQ(first.get(), 1);
    EXPECT_EQ(mesher.pending(), 1u);

    mesher.settle(0);
    EXPECT_EQ(second.get(), 2);
    EXPECT_EQ(added, (std::vector<ItemId>{1, 2}));
}

TEST(GeometryDatabaseTest, ReplaceKeepsNameAndDropsOldVersion)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);
    ItemId               replacedFrom = 0;
    ItemId               replacedTo   = 0;
    int                  removed      = 0;

    db.signals().objectReplaced.connect([&](const ItemId& from, const ItemId& to) {
        replacedFrom = from;
        replacedTo   = to;
    });
    db.signals().objectRemoved.connect([&](const ItemId&, const Agent&) { ++removed; });

    const ItemId v1 = addNow(db, unitBox());
    const ItemId v2 = db.replaceItem(v1, makeBox(glm::vec3(0.0f), glm::vec3(2.0f))).get();
    const ItemId v3 = db.replaceItem(v2, makeBox(glm::vec3(0.0f), glm::vec3(3.0f))).get();

    EXPECT_NE(v2, v1);
    EXPECT_NE(v3, v2);
    EXPECT_FALSE(db.hasItem(v1));
    EXPECT_FALSE(db.hasItem(v2));
    EXPECT_FALSE(db.hasTopologyItem("face,1,0"));

    EXPECT_EQ(db.lookupName(v3), v1);
    EXPECT_EQ(db.lookupByName(v1), v3);
    EXPECT_EQ(db.names().size(), 1u);
    EXPECT_TRUE(db.names().consistent());

    EXPECT_EQ(replacedFrom, v2);
    EXPECT_EQ(replacedTo, v3);
    EXPECT_EQ(removed, 0);
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, RemoveDropsRecordsAndName)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);
    bool                 nameVisibleWhileRemoving = false;

    const ItemId id = addNow(db, unitBox());
    db.signals().objectRemoved.connect([&](const ItemId& removed, const Agent&) {
        nameVisibleWhileRemoving = db.names().containsVersion(removed);
    });

    EXPECT_TRUE(db.removeItem(id).fulfilled());

    EXPECT_TRUE(nameVisibleWhileRemoving);
    EXPECT_FALSE(db.hasItem(id));
    EXPECT_FALSE(db.hasTopologyItem("face,1,0"));
    EXPECT_TRUE(db.names().empty());
    EXPECT_THROW((void)db.lookupItemById(id), InvalidPrecondition);
    EXPECT_THROW((void)db.lookupName(id), InvalidPrecondition);
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, FailedOperationsRejectAndLeaveQueueUsable)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    Future<void>   missing   = db.removeItem(42);
    Future<ItemId> malformed = db.addItem(makeCurve({}));
    Future<ItemId> fine      = db.addItem(unitBox());

    EXPECT_TRUE(missing.rejected());
    EXPECT_THROW(missing.get(), InvalidPrecondition);
    EXPECT_TRUE(malformed.rejected());
    EXPECT_TRUE(fine.fulfilled());
    EXPECT_EQ(db.size(), 1u);
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, AutomaticItemsAreHiddenFromDefaultQueries)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    const ItemId curve  = addNow(db, closedSquare());
    const ItemId region = addNow(db, makeRegion(closedSquare()->controlPoints), Agent::AUTOMATIC);
    const ItemId box    = addNow(db, unitBox());

    EXPECT_TRUE(db.isAutomatic(region));
    EXPECT_EQ(db.findAll(), (std::vector<ItemId>{curve, box}));
    EXPECT_EQ(db.findAll(true), (std::vector<ItemId>{curve, region, box}));
    EXPECT_TRUE(db.find(ItemType::REGION).empty());
    EXPECT_EQ(db.find(ItemType::REGION, true), (std::vector<ItemId>{region}));
    EXPECT_EQ(db.find(ItemType::CURVE), (std::vector<ItemId>{curve}));
}

TEST(GeometryDatabaseTest, DuplicateSharesGeometry)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    const ItemId source = addNow(db, unitBox());
    const ItemId copy   = db.duplicate(source).get();

    EXPECT_NE(copy, source);
    EXPECT_EQ(db.lookup(copy), db.lookup(source));
    EXPECT_EQ(db.lookupName(copy), copy);
}

TEST(GeometryDatabaseTest, LoadPreservesNamesWhenAsked)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    const std::vector<NamedModel> models{{10, unitBox()}, {4, closedSquare()}};

    Future<std::vector<ItemId>> loaded = db.load(models, true);
    ASSERT_TRUE(loaded.fulfilled());
    EXPECT_EQ(loaded.get(), (std::vector<ItemId>{10, 4}));
    EXPECT_EQ(db.version(), 11);

    // Fresh ids continue past the highest preserved name.
    EXPECT_EQ(addNow(db, unitBox()), 11);

    Future<std::vector<ItemId>> clash = db.load({{4, unitBox()}}, true);
    EXPECT_TRUE(clash.rejected());

    EXPECT_EQ(db.load(models, false).get(), (std::vector<ItemId>{12, 13}));
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, MementoIsIsolatedFromLaterMutations)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    const ItemId    kept     = addNow(db, unitBox());
    GeometryMemento snapshot = db.saveToMemento();

    const ItemId later = addNow(db, unitBox());
    db.replaceItem(kept, makeBox(glm::vec3(0.0f), glm::vec3(4.0f))).get();

    EXPECT_EQ(snapshot.items().size(), 1u);
    EXPECT_EQ(snapshot.items().count(kept), 1u);
    EXPECT_EQ(snapshot.names().versionOf(kept).value(), kept);

    // Only queue operations may swap state in directly.
    EXPECT_THROW(db.restoreFromMemento(snapshot), std::logic_error);
    EXPECT_TRUE(db.hasItem(later));

    // Restore replaces, never merges.
    EXPECT_TRUE(db.restore(snapshot).fulfilled());
    EXPECT_TRUE(db.hasItem(kept));
    EXPECT_FALSE(db.hasItem(later));
    EXPECT_EQ(db.size(), 1u);
    EXPECT_EQ(db.lookupByName(kept), kept);
    EXPECT_NO_THROW(db.validate());

    // Ids keep growing after a restore.
    EXPECT_GT(addNow(db, unitBox()), later);
}

TEST(GeometryDatabaseTest, RestoreQueuesBehindPendingMutations)
{
    DeferredMeshCreator mesher;
    GeometryDatabase    db(mesher);
    int                 sceneChanges = 0;

    const GeometryMemento empty = db.saveToMemento();
    db.signals().sceneGraphChanged.connect([&sceneChanges]() { ++sceneChanges; });

    Future<ItemId> added    = db.addItem(unitBox());
    Future<void>   restored = db.restore(empty);

    EXPECT_FALSE(restored.settled());
    EXPECT_EQ(mesher.pending(), 1u);

    mesher.settleAll();

    EXPECT_TRUE(added.fulfilled());
    EXPECT_TRUE(restored.fulfilled());
    EXPECT_EQ(db.size(), 0u);
    EXPECT_TRUE(db.names().empty());
    EXPECT_EQ(sceneChanges, 2);
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, NodeStateFiltersVisibleAndSelectableObjects)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);
    std::vector<ItemId>  changed;

    db.signals().nodeChanged.connect([&changed](const ItemId& id) { changed.push_back(id); });

    const ItemId box    = addNow(db, unitBox());
    const ItemId curve  = addNow(db, closedSquare());
    const ItemId other  = addNow(db, unitBox());
    const ItemId region = addNow(db, makeRegion(closedSquare()->controlPoints), Agent::AUTOMATIC);

    EXPECT_FALSE(db.isHidden(box));
    EXPECT_TRUE(db.isVisible(box));
    EXPECT_TRUE(db.isSelectable(box));

    // Automatic items are never listed, whatever their state.
    EXPECT_TRUE(db.isVisible(region));
    EXPECT_EQ(db.visibleObjects(), (std::vector<ItemId>{box, curve, other}));

    EXPECT_TRUE(db.makeHidden(box, true).fulfilled());
    EXPECT_TRUE(db.makeSelectable(other, false).fulfilled());

    EXPECT_TRUE(db.isHidden(box));
    EXPECT_EQ(db.visibleObjects(), (std::vector<ItemId>{curve, other}));
    EXPECT_EQ(db.selectableObjects(), (std::vector<ItemId>{curve}));
    EXPECT_EQ(changed, (std::vector<ItemId>{box, other}));

    db.setTypeEnabled(ItemType::CURVE, false);
    EXPECT_FALSE(db.isTypeEnabled(ItemType::CURVE));
    EXPECT_TRUE(db.selectableObjects().empty());
    db.setTypeEnabled(ItemType::CURVE, true);

    EXPECT_TRUE(db.makeVisible(curve, false).fulfilled());
    EXPECT_EQ(db.visibleObjects(), (std::vector<ItemId>{other}));

    Future<std::vector<ItemId>> unhidden = db.unhideAll();
    EXPECT_EQ(unhidden.get(), (std::vector<ItemId>{box}));
    EXPECT_FALSE(db.isHidden(box));

    EXPECT_THROW((void)db.isHidden(42), InvalidPrecondition);
    EXPECT_TRUE(db.makeHidden(42, true).rejected());
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, NodeStateFollowsNameAndMemento)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);

    const ItemId    id     = addNow(db, unitBox());
    GeometryMemento before = db.saveToMemento();

    db.makeHidden(id, true).get();
    const ItemId moved = db.replaceItem(id, makeBox(glm::vec3(1.0f), glm::vec3(2.0f))).get();
    EXPECT_TRUE(db.isHidden(moved));

    GeometryMemento hidden = db.saveToMemento();
    EXPECT_EQ(hidden.nodes().size(), 1u);
    EXPECT_TRUE(hidden.nodes().at(id).hidden);

    db.restore(before).get();
    EXPECT_FALSE(db.isHidden(id));

    db.restore(hidden).get();
    EXPECT_TRUE(db.isHidden(moved));

    db.removeItem(moved).get();
    EXPECT_TRUE(db.saveToMemento().nodes().empty());
    EXPECT_NO_THROW(db.validate());
}

TEST(GeometryDatabaseTest, TemporariesLiveOutsideTheDocument)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);
    const ItemId         item = addNow(db, unitBox());

    const ItemId temp    = db.addTemporaryItem(makeBox(glm::vec3(0.0f), glm::vec3(2.0f)), item).get();
    const ItemId phantom = db.addPhantom(unitBox()).get();

    EXPECT_LT(temp, 0);
    EXPECT_LT(phantom, temp);
    EXPECT_EQ(db.temporaryCount(), 2u);
    EXPECT_FALSE(db.hasItem(temp));
    EXPECT_FALSE(db.names().containsVersion(temp));
    EXPECT_EQ(db.findAll(true), (std::vector<ItemId>{item}));
    EXPECT_TRUE(db.lookupTemporary(phantom).visible);

    EXPECT_FALSE(db.isObscured(item));
    db.showTemporary(temp);
    EXPECT_TRUE(db.isObscured(item));
    db.hideTemporary(temp);
    EXPECT_FALSE(db.isObscured(item));

    EXPECT_EQ(db.saveToMemento().items().size(), 1u);

    db.cancelTemporary(temp);
    EXPECT_THROW(db.showTemporary(temp), InvalidPrecondition);
    db.clearTemporaryObjects();
    EXPECT_EQ(db.temporaryCount(), 0u);
}

TEST(GeometryDatabaseTest, DumpListsItems)
{
    ImmediateMeshCreator mesher;
    GeometryDatabase     db(mesher);
    addNow(db, unitBox());

    std::ostringstream os;
    db.dump(os);

    EXPECT_NE(os.str().find("#1 name=1 Solid user"), std::string::npos);
}
