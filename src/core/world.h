#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <cmath>

// Authoritative world-space coordinates are stored as double precision.
// The ground plane is XZ; Y is height and is ignored by streaming.
using WorldVec3 = glm::dvec3;

inline glm::dvec2 world_xz(const WorldVec3 &p)
{
    return glm::dvec2(p.x, p.z);
}

inline bool is_finite(const WorldVec3 &p)
{
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

inline double planar_distance(const WorldVec3 &a, const WorldVec3 &b)
{
    const double dx = a.x - b.x;
    const double dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}
