#pragma once

#include <prism/raytracing/bvh.h>
#include <prism/raytracing/ray.h>

#include <glm/glm.hpp>

#include <algorithm>
#include <limits>

namespace prism
{

// "No hit" distance. Every distance comparison treats it as farther than any hit.
constexpr float NO_HIT = std::numeric_limits<float>::infinity();

// Determinant threshold for Moller-Trumbore. Also rejects back faces.
constexpr float TRIANGLE_EPSILON = 1e-8f;

// Hits closer than this are ignored (self-intersection guard for bounce rays).
constexpr float RAY_NEAR_BIAS = 1e-4f;

struct TriangleHit
{
    float t = NO_HIT;
    float u = 0.0f;
    float v = 0.0f;

    bool hit() const { return t < NO_HIT; }
};

// Slab test. Returns the entry distance (negative when the origin is inside
// the box) or NO_HIT. Infinite reciprocal components need no special case.
inline float intersectAABB(const AABB& box, const Ray& ray)
{
    glm::vec3 t1 = (box.min - ray.origin) * ray.invDirection;
    glm::vec3 t2 = (box.max - ray.origin) * ray.invDirection;
    glm::vec3 tmin = glm::min(t1, t2);
    glm::vec3 tmax = glm::max(t1, t2);

    float tNear = std::max(std::max(tmin.x, tmin.y), tmin.z);
    float tFar  = std::min(std::min(tmax.x, tmax.y), tmax.z);

    if (tNear <= tFar && tFar >= 0.0f)
        return tNear;
    return NO_HIT;
}

// Moller-Trumbore with one-sided culling: only triangles wound
// counter-clockwise as seen from the ray origin are hit.
inline TriangleHit intersectTriangle(const Ray& ray, const glm::vec3& v0,
                                     const glm::vec3& v1, const glm::vec3& v2)
{
    glm::vec3 edge1 = v1 - v0;
    glm::vec3 edge2 = v2 - v0;
    glm::vec3 p = glm::cross(ray.direction, edge2);
    float det = glm::dot(edge1, p);

    if (det < TRIANGLE_EPSILON)
        return {};

    float invDet = 1.0f / det;
    glm::vec3 s = ray.origin - v0;
    float u = glm::dot(s, p) * invDet;
    if (u < 0.0f || u > 1.0f)
        return {};

    glm::vec3 q = glm::cross(s, edge1);
    float v = glm::dot(ray.direction, q) * invDet;
    if (v < 0.0f || u + v > 1.0f)
        return {};

    float t = glm::dot(edge2, q) * invDet;
    if (t < RAY_NEAR_BIAS)
        return {};

    return { t, u, v };
}

} // namespace prism
