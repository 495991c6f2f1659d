#pragma once

#include <prism/raytracing/bvh.h>
#include <prism/raytracing/environment.h>
#include <prism/raytracing/hit.h>
#include <prism/raytracing/ray.h>
#include <prism/scene/mesh_data.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace prism
{

struct Instance
{
    glm::mat4 worldToLocal{1.0f};
    glm::mat4 localToWorld{1.0f};
    Material material;
    uint32_t blasRoot = BVH::INVALID_NODE;
};

// Ray in another space: origin through the full matrix, direction through
// its upper-left 3x3 without renormalization, so distances along the ray
// stay comparable between spaces.
inline Ray transformRay(const glm::mat4& m, const Ray& ray)
{
    return Ray(glm::vec3(m * glm::vec4(ray.origin, 1.0f)),
               glm::mat3(m) * ray.direction);
}

// Immutable render scene. Built by SceneBuilder and shared read-only by all
// render workers.
class Scene
{
public:
    // Nearest hit along the ray. A miss returns the environment radiance in
    // color with HIT_FLAG_EMISSIVE set and t == NO_HIT.
    HitRecord trace(const Ray& ray) const;

    const std::vector<BVH::Node>& getBlasNodes() const { return m_blas.nodes(); }
    const std::vector<BVH::Node>& getTlasNodes() const { return m_tlas.nodes(); }
    const std::vector<Instance>& getInstances() const { return m_instances; }
    const std::vector<Vertex>& getVertices() const { return m_vertices; }
    const std::vector<uint32_t>& getIndices() const { return m_indices; }
    const EnvironmentMap& getEnvironment() const { return m_environment; }

    uint32_t getTriangleCount() const { return static_cast<uint32_t>(m_indices.size() / 3); }
    AABB getBounds() const { return m_tlas.rootAABB(); }
    bool empty() const { return m_instances.empty(); }

    const BVH& getBlas() const { return m_blas; }
    const BVH& getTlas() const { return m_tlas; }

private:
    friend class SceneBuilder;

    struct RawHit
    {
        float u = 0.0f;
        float v = 0.0f;
        uint32_t instance = UINT32_MAX;
        uint32_t triangle = UINT32_MAX;
    };

    void intersectBLAS(uint32_t instanceIndex, const Ray& localRay, float& closest,
                       RawHit& best, HitRecord& rec) const;
    void resolveHit(const Ray& ray, float t, const RawHit& raw, HitRecord& rec) const;

    BVH m_blas;
    BVH m_tlas;
    std::vector<Instance> m_instances;
    std::vector<Vertex> m_vertices;
    std::vector<uint32_t> m_indices;
    EnvironmentMap m_environment;
};

} // namespace prism
