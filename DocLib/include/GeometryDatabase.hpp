//=============================================================================
// GeometryDatabase.hpp
//=============================================================================
#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "Future.hpp"
#include "GeometryMemento.hpp"
#include "GeometryTypes.hpp"
#include "Memento.hpp"
#include "MeshCreator.hpp"
#include "NameIndex.hpp"
#include "SerialQueue.hpp"
#include "Signal.hpp"

/**
 * @brief Notifications published by the database.
 *
 * objectRemoved is dispatched before the item's records and name are dropped,
 * so subscribers may still resolve it. Replacement publishes objectReplaced
 * only (no added/removed pair).
 */
struct DatabaseSignals
{
    Signal<ItemId, Agent>  objectAdded;
    Signal<ItemId, Agent>  objectRemoved;
    Signal<ItemId, ItemId> objectReplaced; ///< (from, to)
    Signal<>               sceneGraphChanged;
    Signal<ItemId>         temporaryObjectAdded;
    Signal<ItemId>         nodeChanged; ///< Hidden/visible/selectable state of a version changed.
    Signal<ItemType, bool> typeToggled;
};

/** @brief Preview item outside the document (negative id). */
struct TemporaryItem
{
    ItemId                id = 0;
    GeometryPtr           model;
    std::optional<ItemId> ancestor; ///< Item this temporary previews a replacement for.
    bool                  phantom = false;
    bool                  visible = false;
};

/** @brief Input record for GeometryDatabase::load(). */
struct NamedModel
{
    ItemId      name = 0;
    GeometryPtr model;
};

/**
 * @brief Versioned store of every geometric item in the document.
 *
 * All persistent mutations (add, replace, remove, node state, restore) are
 * serialized through the database's own SerialQueue, so they take effect in
 * call order even when the kernel settles out of order. Reads are synchronous
 * and see the state left by the last completed mutation.
 *
 * Identity: every record has a version id. Replacing geometry creates a new
 * version; the item's name (its first version id) stays bound to the newest
 * version through the NameIndex.
 */
class GeometryDatabase final : public MementoOriginator<GeometryMemento>
{
public:
    explicit GeometryDatabase(MeshCreator& meshCreator);

    GeometryDatabase(const GeometryDatabase&)            = delete;
    GeometryDatabase& operator=(const GeometryDatabase&) = delete;

    [[nodiscard]] DatabaseSignals& signals() noexcept
    {
        return m_signals;
    }

    /**
     * @brief Run @p operation on the database queue.
     *
     * It starts once every mutation queued before it has settled, and nothing
     * queued after it starts until its own future settles. Collaborators that
     * must change the document together with their own state (a full editor
     * restore) go through here.
     *
     * @param operation Callable with signature Future<T>().
     */
    template<typename F>
    auto enqueue(F&& operation)
    {
        return m_queue.enqueue(std::forward<F>(operation));
    }

    // ------------------------------------------------------------
    // Mutations
    // ------------------------------------------------------------

    /**
     * @brief Insert a new item.
     *
     * @param model Geometry payload.
     * @param agent AUTOMATIC items are hidden from default enumeration.
     * @param name  Explicit id to use (bulk load); must be unused.
     * @return Id of the new item, which is also its name.
     */
    Future<ItemId> addItem(GeometryPtr model, Agent agent = Agent::USER, std::optional<ItemId> name = std::nullopt);

    /**
     * @brief Replace an item's geometry with a new version.
     * @return Id of the new version; its name is the old version's name.
     */
    Future<ItemId> replaceItem(ItemId from, GeometryPtr model);

    Future<void> removeItem(ItemId id);

    /** @brief Insert a new item sharing @p id's geometry. */
    Future<ItemId> duplicate(ItemId id);

    /**
     * @brief Insert many items.
     * @param preserveNames Use the stored names as ids instead of fresh ones.
     */
    Future<std::vector<ItemId>> load(const std::vector<NamedModel>& models, bool preserveNames = false);

    // ------------------------------------------------------------
    // Temporaries
    // ------------------------------------------------------------

    /**
     * @brief Create a hidden preview item outside the document.
     * @param ancestor Document item hidden while the temporary is shown.
     */
    Future<ItemId> addTemporaryItem(GeometryPtr model, std::optional<ItemId> ancestor = std::nullopt);

    /** @brief Create a visible, non-interactive preview. */
    Future<ItemId> addPhantom(GeometryPtr model);

    void showTemporary(ItemId id);
    void hideTemporary(ItemId id);
    void cancelTemporary(ItemId id);
    void clearTemporaryObjects();

    [[nodiscard]] const TemporaryItem& lookupTemporary(ItemId id) const;
    [[nodiscard]] std::size_t          temporaryCount() const noexcept
    {
        return m_temporaries.size();
    }

    /** @return True if a visible temporary currently stands in for @p id. */
    [[nodiscard]] bool isObscured(ItemId id) const noexcept;

    // ------------------------------------------------------------
    // Node state
    // ------------------------------------------------------------

    /** @brief Hide or unhide an item. The state follows the item across versions. */
    Future<void> makeHidden(ItemId id, bool value);

    /** @brief Unhide every hidden item. @return Versions that were hidden. */
    Future<std::vector<ItemId>> unhideAll();

    Future<void> makeVisible(ItemId id, bool value);
    Future<void> makeSelectable(ItemId id, bool value);

    /** @throws InvalidPrecondition if the item is missing. */
    [[nodiscard]] bool isHidden(ItemId id) const;
    [[nodiscard]] bool isVisible(ItemId id) const;
    [[nodiscard]] bool isSelectable(ItemId id) const;

    /** @return User items that are not hidden, are visible and whose type is enabled. */
    [[nodiscard]] std::vector<ItemId> visibleObjects() const;

    /** @return The visible objects that are also selectable. */
    [[nodiscard]] std::vector<ItemId> selectableObjects() const;

    /**
     * @brief Enable or disable a whole item type for display and selection.
     *
     * A view filter, not document state: applied immediately and never
     * captured by a memento.
     */
    void setTypeEnabled(ItemType type, bool enabled);

    [[nodiscard]] bool isTypeEnabled(ItemType type) const noexcept
    {
        return m_disabledTypes.count(type) == 0;
    }

    // ------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------

    /** @throws InvalidPrecondition if the item is missing. */
    [[nodiscard]] const ItemRecord& lookupItemById(ItemId id) const;

    [[nodiscard]] GeometryPtr lookup(ItemId id) const
    {
        return lookupItemById(id).model;
    }

    [[nodiscard]] bool hasItem(ItemId id) const noexcept
    {
        return m_items.count(id) != 0;
    }

    [[nodiscard]] bool isAutomatic(ItemId id) const noexcept
    {
        return m_automatics.count(id) != 0;
    }

    [[nodiscard]] std::vector<ItemId> find(ItemType type, bool includeAutomatics = false) const;
    [[nodiscard]] std::vector<ItemId> findAll(bool includeAutomatics = false) const;

    [[nodiscard]] bool                hasTopologyItem(const std::string& name) const noexcept;
    [[nodiscard]] const TopologyData& lookupTopologyItemById(const std::string& name) const;

    [[nodiscard]] const ControlPointData& lookupControlPointById(const std::string& name) const;

    /** @return Stable name of a version. */
    [[nodiscard]] ItemId lookupName(ItemId version) const;

    /** @return Current version of a name. */
    [[nodiscard]] ItemId lookupByName(ItemId name) const;

    [[nodiscard]] const NameIndex& names() const noexcept
    {
        return m_names;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_items.size();
    }

    /** @brief Id counter; grows with every inserted item and never decreases. */
    [[nodiscard]] ItemId version() const noexcept
    {
        return m_positiveCounter;
    }

    /** @return True while a mutation is running on the queue. */
    [[nodiscard]] bool busy() const noexcept
    {
        return m_queue.busy();
    }

    // ------------------------------------------------------------
    // Memento
    // ------------------------------------------------------------

    [[nodiscard]] GeometryMemento saveToMemento() const override;

    /**
     * @brief Swap the memento's maps in.
     *
     * @pre Runs inside an operation on this database's queue (see enqueue()
     *      and restore()). Publishes nothing.
     * @throws std::logic_error if the queue is idle.
     */
    void restoreFromMemento(GeometryMemento memento) override;

    /**
     * @brief Queue a restore behind every pending mutation.
     *
     * Publishes sceneGraphChanged once the maps are swapped in.
     */
    Future<void> restore(GeometryMemento memento);

    // ------------------------------------------------------------
    // Diagnostics
    // ------------------------------------------------------------

    /** @throws InvalidPrecondition if the name index or derived records are inconsistent. */
    void validate() const;

    void dump(std::ostream& os) const;

private:
    ItemId         allocateId(std::optional<ItemId> name);
    Future<ItemId> insertItem(GeometryPtr model, Agent agent, std::optional<ItemId> name);
    void           insertRecords(ItemId id, GeometryPtr model, const MeshData& mesh, Agent agent);
    void           removeRecords(ItemId id);

    [[nodiscard]] const NodeState& nodeOf(ItemId id) const;
    void                           setNode(ItemId id, const NodeState& state);

private:
    MeshCreator&    m_meshCreator;
    DatabaseSignals m_signals;
    SerialQueue     m_queue;

    std::map<ItemId, ItemRecord>            m_items;
    NameIndex                               m_names;
    std::map<std::string, TopologyData>     m_topology;
    std::map<std::string, ControlPointData> m_controlPoints;
    std::set<ItemId>                        m_automatics;
    std::map<ItemId, NodeState>             m_nodes; ///< Keyed by stable name; absent means defaults.
    std::set<ItemType>                      m_disabledTypes;

    std::map<ItemId, TemporaryItem> m_temporaries;

    ItemId m_positiveCounter = 1; ///< Next document id.
    ItemId m_negativeCounter = -1; ///< Next temporary id.
};
