#pragma once

#include <vector>

#include "Future.hpp"
#include "GeometryTypes.hpp"

/** @brief Derived records of one item, as produced by the kernel. */
struct MeshData
{
    std::vector<TopologyData>     faces;
    std::vector<TopologyData>     edges;
    std::vector<ControlPointData> controlPoints;
};

/**
 * @brief Boundary to the geometry kernel.
 *
 * The database asks the kernel to build the topology of every item it inserts.
 * The call is asynchronous: real kernels tessellate off the editor's critical
 * path and settle later.
 */
class MeshCreator
{
public:
    virtual ~MeshCreator() = default;

    /**
     * @brief Build derived records for @p model, parented to @p id.
     * @return Future rejecting with InvalidPrecondition on malformed input.
     */
    virtual Future<MeshData> create(const GeometryModel& model, ItemId id) = 0;
};

/**
 * @brief Kernel stand-in that enumerates faces, edges and control points of
 * the model and settles immediately.
 */
class ImmediateMeshCreator final : public MeshCreator
{
public:
    Future<MeshData> create(const GeometryModel& model, ItemId id) override;

    /** @brief Synchronous core shared with deferred test doubles. */
    static MeshData build(const GeometryModel& model, ItemId id);
};
