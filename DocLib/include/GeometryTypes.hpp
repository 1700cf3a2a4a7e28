//=============================================================================
// GeometryTypes.hpp
//=============================================================================
#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/// Item version id. Positive for document items, negative for temporaries.
using ItemId = int32_t;

/** @brief Who created an item. Automatic items are derived by subsystems. */
enum class Agent
{
    USER,
    AUTOMATIC,
};

enum class ItemType
{
    SOLID,
    CURVE,
    SURFACE,
    REGION,
};

enum class TopologyKind
{
    FACE,
    EDGE,
};

/**
 * @brief A lookup or structural precondition did not hold.
 *
 * Raised for missing ids and names, broken name/version pairing and malformed
 * kernel input.
 */
class InvalidPrecondition : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Immutable geometry payload as produced by the kernel.
 *
 * Shared between item records, mementos and duplicates; never mutated after
 * construction. Edits produce a new model and a new item version.
 */
struct GeometryModel
{
    ItemType               type = ItemType::SOLID;
    std::vector<glm::vec3> controlPoints;
    uint32_t               faceCount = 0;
    uint32_t               edgeCount = 0;
    bool                   planar    = false;
};

using GeometryPtr = std::shared_ptr<const GeometryModel>;

/** @brief Face or edge of an item. */
struct TopologyData
{
    ItemId       parent = 0;
    TopologyKind kind   = TopologyKind::FACE;
    uint32_t     index  = 0;
};

struct ControlPointData
{
    ItemId    parent = 0;
    uint32_t  index  = 0;
    glm::vec3 position{0.0f};
};

/**
 * @brief One item version stored in the database.
 *
 * Besides the model it remembers the keys of its derived records so that
 * removal drops exactly those.
 */
struct ItemRecord
{
    ItemId                   id   = 0;
    ItemType                 type = ItemType::SOLID;
    GeometryPtr              model;
    std::vector<std::string> faces;
    std::vector<std::string> edges;
    std::vector<std::string> controlPoints;
};

/**
 * @brief Per-item display state, keyed by the item's stable name.
 *
 * An item with no entry has the defaults. hidden is the user's hide/unhide
 * toggle; visible is set by whatever owns the item (layers, tools).
 */
struct NodeState
{
    bool hidden     = false;
    bool visible    = true;
    bool selectable = true;

    bool operator==(const NodeState& other) const = default;
};

// ------------------------------------------------------------
// Naming
// ------------------------------------------------------------

[[nodiscard]] std::string topologyName(TopologyKind kind, ItemId parent, uint32_t index);
[[nodiscard]] std::string controlPointName(ItemId parent, uint32_t index);

[[nodiscard]] const char* toString(ItemType type) noexcept;
[[nodiscard]] const char* toString(Agent agent) noexcept;

// ------------------------------------------------------------
// Model builders
// ------------------------------------------------------------

/** @brief Closed solid with the given face/edge counts and optional corner points. */
[[nodiscard]] GeometryPtr makeSolid(uint32_t faceCount, uint32_t edgeCount, std::vector<glm::vec3> corners = {});

/** @brief Axis aligned box: 6 faces, 12 edges, 8 corners. */
[[nodiscard]] GeometryPtr makeBox(const glm::vec3& min, const glm::vec3& max);

/**
 * @brief Polyline curve through the given points.
 *
 * A curve whose last point equals its first is closed; a curve whose points
 * share one plane is planar.
 */
[[nodiscard]] GeometryPtr makeCurve(std::vector<glm::vec3> points);

/** @brief Single-face region bounded by the given loop. */
[[nodiscard]] GeometryPtr makeRegion(std::vector<glm::vec3> boundary);

/** @brief Copy of @p model with every control point moved by @p delta. */
[[nodiscard]] GeometryPtr translated(const GeometryModel& model, const glm::vec3& delta);

/** @return True if the control point loop is closed (at least 3 segments). */
[[nodiscard]] bool isClosed(const GeometryModel& model) noexcept;
