#include "MeshCreator.hpp"

#include <exception>

MeshData ImmediateMeshCreator::build(const GeometryModel& model, ItemId id)
{
    switch (model.type)
    {
        case ItemType::CURVE:
            if (model.controlPoints.size() < 2 || model.edgeCount == 0)
                throw InvalidPrecondition("MeshCreator::build(): curve has no edges.");
            break;
        case ItemType::SURFACE:
        case ItemType::REGION:
            if (model.faceCount != 1)
                throw InvalidPrecondition("MeshCreator::build(): " + std::string(toString(model.type)) +
                                          " must have exactly one face.");
            break;
        case ItemType::SOLID:
            if (model.faceCount == 0)
                throw InvalidPrecondition("MeshCreator::build(): solid has no faces.");
            break;
    }

    MeshData mesh;
    mesh.faces.reserve(model.faceCount);
    mesh.edges.reserve(model.edgeCount);
    mesh.controlPoints.reserve(model.controlPoints.size());

    for (uint32_t i = 0; i < model.faceCount; ++i)
        mesh.faces.push_back(TopologyData{id, TopologyKind::FACE, i});

    for (uint32_t i = 0; i < model.edgeCount; ++i)
        mesh.edges.push_back(TopologyData{id, TopologyKind::EDGE, i});

    for (uint32_t i = 0; i < model.controlPoints.size(); ++i)
        mesh.controlPoints.push_back(ControlPointData{id, i, model.controlPoints[i]});

    return mesh;
}

Future<MeshData> ImmediateMeshCreator::create(const GeometryModel& model, ItemId id)
{
    try
    {
        return makeReadyFuture(build(model, id));
    }
    catch (const InvalidPrecondition&)
    {
        return makeFailedFuture<MeshData>(std::current_exception());
    }
}
