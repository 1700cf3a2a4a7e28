#include "GeometryDatabase.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <utility>

GeometryDatabase::GeometryDatabase(MeshCreator& meshCreator) : m_meshCreator(meshCreator)
{
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

Future<ItemId> GeometryDatabase::addItem(GeometryPtr model, Agent agent, std::optional<ItemId> name)
{
    return m_queue.enqueue([this, model = std::move(model), agent, name]() {
        return insertItem(model, agent, name).then([this, agent](ItemId id) {
            m_names.insert(id, id);
            m_signals.objectAdded.dispatch(id, agent);
            m_signals.sceneGraphChanged.dispatch();
            return makeReadyFuture(id);
        });
    });
}

Future<ItemId> GeometryDatabase::replaceItem(ItemId from, GeometryPtr model)
{
    return m_queue.enqueue([this, from, model = std::move(model)]() {
        if (!hasItem(from))
            throw InvalidPrecondition("GeometryDatabase::replaceItem(): object " + std::to_string(from) +
                                      " missing from geometry model");

        if (!model)
            throw std::invalid_argument("GeometryDatabase::replaceItem(): null model.");

        const ItemId to = allocateId(std::nullopt);
        return m_meshCreator.create(*model, to).then([this, from, to, model](const MeshData& mesh) {
            if (!hasItem(from))
                throw InvalidPrecondition("GeometryDatabase::replaceItem(): object " + std::to_string(from) +
                                          " was removed while its replacement was built");

            // The name moves before any record is written.
            m_names.rebind(from, to);
            insertRecords(to, model, mesh, Agent::USER);
            removeRecords(from);

            m_signals.objectReplaced.dispatch(from, to);
            m_signals.sceneGraphChanged.dispatch();
            return makeReadyFuture(to);
        });
    });
}

Future<void> GeometryDatabase::removeItem(ItemId id)
{
    return m_queue.enqueue([this, id]() {
        if (!hasItem(id))
            throw InvalidPrecondition("GeometryDatabase::removeItem(): object " + std::to_string(id) +
                                      " missing from geometry model");

        const Agent agent = isAutomatic(id) ? Agent::AUTOMATIC : Agent::USER;
        m_signals.objectRemoved.dispatch(id, agent);

        if (auto name = m_names.nameOf(id))
            m_nodes.erase(*name);

        removeRecords(id);
        m_names.eraseVersion(id);
        m_signals.sceneGraphChanged.dispatch();
        return makeReadyFuture();
    });
}

Future<ItemId> GeometryDatabase::duplicate(ItemId id)
{
    return m_queue.enqueue([this, id]() {
        // Geometry is immutable, so the copy shares the payload.
        GeometryPtr model = lookup(id);
        return insertItem(model, Agent::USER, std::nullopt).then([this](ItemId copy) {
            m_names.insert(copy, copy);
            m_signals.objectAdded.dispatch(copy, Agent::USER);
            m_signals.sceneGraphChanged.dispatch();
            return makeReadyFuture(copy);
        });
    });
}

Future<std::vector<ItemId>> GeometryDatabase::load(const std::vector<NamedModel>& models, bool preserveNames)
{
    std::vector<Future<ItemId>> added;
    added.reserve(models.size());

    for (const NamedModel& entry : models)
    {
        std::optional<ItemId> name;
        if (preserveNames)
            name = entry.name;
        added.push_back(addItem(entry.model, Agent::USER, name));
    }

    return whenAll(std::move(added));
}

ItemId GeometryDatabase::allocateId(std::optional<ItemId> name)
{
    if (!name)
        return m_positiveCounter++;

    if (*name <= 0)
        throw InvalidPrecondition("GeometryDatabase::insertItem(): name " + std::to_string(*name) +
                                  " is not a document id");
    if (hasItem(*name) || m_names.containsName(*name))
        throw InvalidPrecondition("GeometryDatabase::insertItem(): name " + std::to_string(*name) + " already in use");

    m_positiveCounter = std::max(m_positiveCounter, *name + 1);
    return *name;
}

Future<ItemId> GeometryDatabase::insertItem(GeometryPtr model, Agent agent, std::optional<ItemId> name)
{
    if (!model)
        throw std::invalid_argument("GeometryDatabase::insertItem(): null model.");

    const ItemId id = allocateId(name);

    return m_meshCreator.create(*model, id).then([this, id, model, agent](const MeshData& mesh) {
        insertRecords(id, model, mesh, agent);
        return makeReadyFuture(id);
    });
}

void GeometryDatabase::insertRecords(ItemId id, GeometryPtr model, const MeshData& mesh, Agent agent)
{
    ItemRecord record;
    record.id    = id;
    record.type  = model->type;
    record.model = std::move(model);

    for (const TopologyData& face : mesh.faces)
    {
        std::string key = topologyName(TopologyKind::FACE, id, face.index);
        m_topology[key] = face;
        record.faces.push_back(std::move(key));
    }

    for (const TopologyData& edge : mesh.edges)
    {
        std::string key = topologyName(TopologyKind::EDGE, id, edge.index);
        m_topology[key] = edge;
        record.edges.push_back(std::move(key));
    }

    for (const ControlPointData& point : mesh.controlPoints)
    {
        std::string key      = controlPointName(id, point.index);
        m_controlPoints[key] = point;
        record.controlPoints.push_back(std::move(key));
    }

    m_items[id] = std::move(record);

    if (agent == Agent::AUTOMATIC)
        m_automatics.insert(id);
}

void GeometryDatabase::removeRecords(ItemId id)
{
    auto it = m_items.find(id);
    if (it == m_items.end())
        return;

    for (const std::string& key : it->second.faces)
        m_topology.erase(key);
    for (const std::string& key : it->second.edges)
        m_topology.erase(key);
    for (const std::string& key : it->second.controlPoints)
        m_controlPoints.erase(key);

    m_items.erase(it);
    m_automatics.erase(id);
}

// ------------------------------------------------------------
// Temporaries
// ------------------------------------------------------------

Future<ItemId> GeometryDatabase::addTemporaryItem(GeometryPtr model, std::optional<ItemId> ancestor)
{
    if (!model)
        throw std::invalid_argument("GeometryDatabase::addTemporaryItem(): null model.");
    if (ancestor && !hasItem(*ancestor))
        throw InvalidPrecondition("GeometryDatabase::addTemporaryItem(): ancestor " + std::to_string(*ancestor) +
                                  " missing from geometry model");

    const ItemId id = m_negativeCounter--;

    return m_meshCreator.create(*model, id).then([this, id, model, ancestor](const MeshData&) {
        m_temporaries[id] = TemporaryItem{id, model, ancestor, false, false};
        m_signals.temporaryObjectAdded.dispatch(id);
        return makeReadyFuture(id);
    });
}

Future<ItemId> GeometryDatabase::addPhantom(GeometryPtr model)
{
    return addTemporaryItem(std::move(model)).then([this](ItemId id) {
        TemporaryItem& temp = m_temporaries.at(id);
        temp.phantom        = true;
        temp.visible        = true;
        return makeReadyFuture(id);
    });
}

void GeometryDatabase::showTemporary(ItemId id)
{
    auto it = m_temporaries.find(id);
    if (it == m_temporaries.end())
        throw InvalidPrecondition("GeometryDatabase::showTemporary(): temporary " + std::to_string(id) + " missing");
    it->second.visible = true;
}

void GeometryDatabase::hideTemporary(ItemId id)
{
    auto it = m_temporaries.find(id);
    if (it == m_temporaries.end())
        throw InvalidPrecondition("GeometryDatabase::hideTemporary(): temporary " + std::to_string(id) + " missing");
    it->second.visible = false;
}

void GeometryDatabase::cancelTemporary(ItemId id)
{
    m_temporaries.erase(id);
}

void GeometryDatabase::clearTemporaryObjects()
{
    m_temporaries.clear();
}

const TemporaryItem& GeometryDatabase::lookupTemporary(ItemId id) const
{
    auto it = m_temporaries.find(id);
    if (it == m_temporaries.end())
        throw InvalidPrecondition("GeometryDatabase::lookupTemporary(): temporary " + std::to_string(id) + " missing");
    return it->second;
}

bool GeometryDatabase::isObscured(ItemId id) const noexcept
{
    return std::any_of(m_temporaries.begin(), m_temporaries.end(), [id](const auto& entry) {
        return entry.second.visible && entry.second.ancestor == id;
    });
}

// ------------------------------------------------------------
// Node state
// ------------------------------------------------------------

Future<void> GeometryDatabase::makeHidden(ItemId id, bool value)
{
    return m_queue.enqueue([this, id, value]() {
        NodeState state = nodeOf(id);
        state.hidden    = value;
        setNode(id, state);
        return makeReadyFuture();
    });
}

Future<std::vector<ItemId>> GeometryDatabase::unhideAll()
{
    return m_queue.enqueue([this]() {
        std::vector<ItemId> unhidden;
        for (const auto& [name, state] : m_nodes)
        {
            if (state.hidden)
                unhidden.push_back(lookupByName(name));
        }

        for (ItemId id : unhidden)
        {
            NodeState state = nodeOf(id);
            state.hidden    = false;
            setNode(id, state);
        }

        return makeReadyFuture(std::move(unhidden));
    });
}

Future<void> GeometryDatabase::makeVisible(ItemId id, bool value)
{
    return m_queue.enqueue([this, id, value]() {
        NodeState state = nodeOf(id);
        state.visible   = value;
        setNode(id, state);
        return makeReadyFuture();
    });
}

Future<void> GeometryDatabase::makeSelectable(ItemId id, bool value)
{
    return m_queue.enqueue([this, id, value]() {
        NodeState state  = nodeOf(id);
        state.selectable = value;
        setNode(id, state);
        return makeReadyFuture();
    });
}

bool GeometryDatabase::isHidden(ItemId id) const
{
    return nodeOf(id).hidden;
}

bool GeometryDatabase::isVisible(ItemId id) const
{
    return nodeOf(id).visible;
}

bool GeometryDatabase::isSelectable(ItemId id) const
{
    return nodeOf(id).selectable;
}

std::vector<ItemId> GeometryDatabase::visibleObjects() const
{
    std::vector<ItemId> result;
    for (ItemId id : findAll())
    {
        const NodeState& node = nodeOf(id);
        if (node.hidden || !node.visible)
            continue;
        if (!isTypeEnabled(m_items.at(id).type))
            continue;
        result.push_back(id);
    }
    return result;
}

std::vector<ItemId> GeometryDatabase::selectableObjects() const
{
    std::vector<ItemId> result = visibleObjects();
    result.erase(std::remove_if(result.begin(), result.end(), [this](ItemId id) { return !nodeOf(id).selectable; }),
                 result.end());
    return result;
}

void GeometryDatabase::setTypeEnabled(ItemType type, bool enabled)
{
    const bool changed = enabled ? m_disabledTypes.erase(type) != 0 : m_disabledTypes.insert(type).second;
    if (changed)
        m_signals.typeToggled.dispatch(type, enabled);
}

const NodeState& GeometryDatabase::nodeOf(ItemId id) const
{
    static const NodeState defaults;

    if (!hasItem(id))
        throw InvalidPrecondition("invalid precondition: object " + std::to_string(id) + " missing from geometry model");

    auto it = m_nodes.find(lookupName(id));
    return it == m_nodes.end() ? defaults : it->second;
}

void GeometryDatabase::setNode(ItemId id, const NodeState& state)
{
    const ItemId name = lookupName(id);
    if (state == NodeState{})
        m_nodes.erase(name);
    else
        m_nodes[name] = state;

    m_signals.nodeChanged.dispatch(id);
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

const ItemRecord& GeometryDatabase::lookupItemById(ItemId id) const
{
    auto it = m_items.find(id);
    if (it == m_items.end())
        throw InvalidPrecondition("invalid precondition: object " + std::to_string(id) + " missing from geometry model");
    return it->second;
}

std::vector<ItemId> GeometryDatabase::find(ItemType type, bool includeAutomatics) const
{
    std::vector<ItemId> result;
    for (const auto& [id, record] : m_items)
    {
        if (record.type != type)
            continue;
        if (!includeAutomatics && isAutomatic(id))
            continue;
        result.push_back(id);
    }
    return result;
}

std::vector<ItemId> GeometryDatabase::findAll(bool includeAutomatics) const
{
    std::vector<ItemId> result;
    result.reserve(m_items.size());
    for (const auto& [id, record] : m_items)
    {
        if (includeAutomatics || !isAutomatic(id))
            result.push_back(id);
    }
    return result;
}

bool GeometryDatabase::hasTopologyItem(const std::string& name) const noexcept
{
    return m_topology.count(name) != 0;
}

const TopologyData& GeometryDatabase::lookupTopologyItemById(const std::string& name) const
{
    auto it = m_topology.find(name);
    if (it == m_topology.end())
        throw InvalidPrecondition("invalid precondition: topology item " + name + " missing from topology model");
    return it->second;
}

const ControlPointData& GeometryDatabase::lookupControlPointById(const std::string& name) const
{
    auto it = m_controlPoints.find(name);
    if (it == m_controlPoints.end())
        throw InvalidPrecondition("invalid precondition: control point " + name + " missing from control point model");
    return it->second;
}

ItemId GeometryDatabase::lookupName(ItemId version) const
{
    if (auto name = m_names.nameOf(version))
        return *name;
    throw InvalidPrecondition("invalid precondition: version " + std::to_string(version) + " has no name");
}

ItemId GeometryDatabase::lookupByName(ItemId name) const
{
    if (auto version = m_names.versionOf(name))
        return *version;
    throw InvalidPrecondition("invalid precondition: name " + std::to_string(name) + " has no version");
}

// ------------------------------------------------------------
// Memento
// ------------------------------------------------------------

GeometryMemento GeometryDatabase::saveToMemento() const
{
    return GeometryMemento(m_items, m_names, m_topology, m_controlPoints, m_automatics, m_nodes);
}

void GeometryDatabase::restoreFromMemento(GeometryMemento memento)
{
    if (!m_queue.busy())
        throw std::logic_error("GeometryDatabase::restoreFromMemento(): must run on the database queue.");

    m_items.swap(memento.m_items);
    std::swap(m_names, memento.m_names);
    m_topology.swap(memento.m_topology);
    m_controlPoints.swap(memento.m_controlPoints);
    m_automatics.swap(memento.m_automatics);
    m_nodes.swap(memento.m_nodes);
}

Future<void> GeometryDatabase::restore(GeometryMemento memento)
{
    return m_queue.enqueue([this, memento = std::move(memento)]() mutable {
        restoreFromMemento(std::move(memento));
        m_signals.sceneGraphChanged.dispatch();
        return makeReadyFuture();
    });
}

// ------------------------------------------------------------
// Diagnostics
// ------------------------------------------------------------

void GeometryDatabase::validate() const
{
    if (!m_names.consistent())
        throw InvalidPrecondition("GeometryDatabase::validate(): name index maps are not inverse");

    if (m_names.size() != m_items.size())
        throw InvalidPrecondition("GeometryDatabase::validate(): " + std::to_string(m_items.size()) + " items but " +
                                  std::to_string(m_names.size()) + " names");

    for (const auto& [id, record] : m_items)
    {
        if (!m_names.containsVersion(id))
            throw InvalidPrecondition("GeometryDatabase::validate(): object " + std::to_string(id) + " has no name");
        if (record.id != id || !record.model)
            throw InvalidPrecondition("GeometryDatabase::validate(): object " + std::to_string(id) + " is malformed");
    }

    for (const auto& [key, data] : m_topology)
    {
        if (!hasItem(data.parent))
            throw InvalidPrecondition("GeometryDatabase::validate(): topology item " + key + " is orphaned");
    }

    for (const auto& [key, data] : m_controlPoints)
    {
        if (!hasItem(data.parent))
            throw InvalidPrecondition("GeometryDatabase::validate(): control point " + key + " is orphaned");
    }

    for (ItemId id : m_automatics)
    {
        if (!hasItem(id))
            throw InvalidPrecondition("GeometryDatabase::validate(): automatic object " + std::to_string(id) +
                                      " is missing");
    }

    for (const auto& [name, state] : m_nodes)
    {
        if (!m_names.containsName(name))
            throw InvalidPrecondition("GeometryDatabase::validate(): node state for unknown name " +
                                      std::to_string(name));
    }
}

void GeometryDatabase::dump(std::ostream& os) const
{
    os << "GeometryDatabase: " << m_items.size() << " items, " << m_temporaries.size() << " temporaries, next id "
       << m_positiveCounter << "\n";

    for (const auto& [id, record] : m_items)
    {
        const auto name = m_names.nameOf(id);
        os << "  #" << id << " name=" << (name ? std::to_string(*name) : std::string("?")) << " "
           << toString(record.type) << " " << toString(isAutomatic(id) ? Agent::AUTOMATIC : Agent::USER)
           << " faces=" << record.faces.size() << " edges=" << record.edges.size()
           << " points=" << record.controlPoints.size();

        if (name)
        {
            auto node = m_nodes.find(*name);
            if (node != m_nodes.end())
            {
                os << (node->second.hidden ? " hidden" : "") << (node->second.visible ? "" : " invisible")
                   << (node->second.selectable ? "" : " unselectable");
            }
        }
        os << "\n";
    }

    for (const auto& [id, temp] : m_temporaries)
    {
        os << "  temp " << id << (temp.phantom ? " phantom" : "") << (temp.visible ? " visible" : " hidden") << "\n";
    }
}
