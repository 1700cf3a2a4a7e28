#include "GeometryTypes.hpp"

#include <cmath>
#include <glm/geometric.hpp>

namespace
{
    constexpr float kPlanarEpsilon = 1e-5f;

    bool pointsArePlanar(const std::vector<glm::vec3>& points) noexcept
    {
        if (points.size() < 4)
            return true;

        // Find a non-degenerate plane from the first point and two others.
        const glm::vec3& origin = points[0];
        glm::vec3        normal(0.0f);
        for (size_t i = 1; i + 1 < points.size() && glm::length(normal) < kPlanarEpsilon; ++i)
            normal = glm::cross(points[i] - origin, points[i + 1] - origin);

        if (glm::length(normal) < kPlanarEpsilon)
            return true; // collinear

        normal = glm::normalize(normal);
        for (const glm::vec3& p : points)
        {
            if (std::abs(glm::dot(p - origin, normal)) > kPlanarEpsilon)
                return false;
        }
        return true;
    }
} // namespace

std::string topologyName(TopologyKind kind, ItemId parent, uint32_t index)
{
    const char* prefix = kind == TopologyKind::FACE ? "face," : "edge,";
    return prefix + std::to_string(parent) + "," + std::to_string(index);
}

std::string controlPointName(ItemId parent, uint32_t index)
{
    return "point," + std::to_string(parent) + "," + std::to_string(index);
}

const char* toString(ItemType type) noexcept
{
    switch (type)
    {
        case ItemType::SOLID:
            return "Solid";
        case ItemType::CURVE:
            return "Curve";
        case ItemType::SURFACE:
            return "Surface";
        case ItemType::REGION:
            return "Region";
    }
    return "Unknown";
}

const char* toString(Agent agent) noexcept
{
    return agent == Agent::AUTOMATIC ? "automatic" : "user";
}

// ------------------------------------------------------------

GeometryPtr makeSolid(uint32_t faceCount, uint32_t edgeCount, std::vector<glm::vec3> corners)
{
    auto model           = std::make_shared<GeometryModel>();
    model->type          = ItemType::SOLID;
    model->faceCount     = faceCount;
    model->edgeCount     = edgeCount;
    model->controlPoints = std::move(corners);
    return model;
}

GeometryPtr makeBox(const glm::vec3& min, const glm::vec3& max)
{
    std::vector<glm::vec3> corners;
    corners.reserve(8);
    for (int i = 0; i < 8; ++i)
    {
        corners.emplace_back((i & 1) ? max.x : min.x, (i & 2) ? max.y : min.y, (i & 4) ? max.z : min.z);
    }
    return makeSolid(6, 12, std::move(corners));
}

GeometryPtr makeCurve(std::vector<glm::vec3> points)
{
    auto model       = std::make_shared<GeometryModel>();
    model->type      = ItemType::CURVE;
    model->edgeCount = points.size() > 1 ? static_cast<uint32_t>(points.size() - 1) : 0u;
    model->planar    = pointsArePlanar(points);
    model->controlPoints = std::move(points);
    return model;
}

GeometryPtr makeRegion(std::vector<glm::vec3> boundary)
{
    auto model       = std::make_shared<GeometryModel>();
    model->type      = ItemType::REGION;
    model->faceCount = 1;
    model->edgeCount = boundary.size() > 1 ? static_cast<uint32_t>(boundary.size() - 1) : 0u;
    model->planar    = true;
    model->controlPoints = std::move(boundary);
    return model;
}

GeometryPtr translated(const GeometryModel& model, const glm::vec3& delta)
{
    auto moved = std::make_shared<GeometryModel>(model);
    for (glm::vec3& p : moved->controlPoints)
        p += delta;
    return moved;
}

bool isClosed(const GeometryModel& model) noexcept
{
    const auto& pts = model.controlPoints;
    if (pts.size() < 4)
        return false;

    return glm::length(pts.front() - pts.back()) < kPlanarEpsilon;
}
