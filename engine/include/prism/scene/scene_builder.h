#pragma once

#include <prism/raytracing/environment.h>
#include <prism/raytracing/scene.h>
#include <prism/scene/mesh_data.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace prism
{

// Collects meshes and instances and flattens them into an immutable Scene:
// one BLAS per unique mesh, a TLAS over instances, and shared vertex and
// index buffers.
class SceneBuilder
{
public:
    static constexpr uint32_t INVALID_MESH = UINT32_MAX;

    // Returns the mesh id, or INVALID_MESH when the mesh has no triangles or
    // references vertices it does not have.
    uint32_t addMesh(MeshData mesh);

    // Instance with the mesh's own material
    bool addInstance(uint32_t meshId, const glm::mat4& localToWorld);
    bool addInstance(uint32_t meshId, const glm::mat4& localToWorld, const Material& material);

    EnvironmentMap& getEnvironment() { return m_environment; }
    void setEnvironment(EnvironmentMap environment) { m_environment = std::move(environment); }

    uint32_t getMeshCount() const { return static_cast<uint32_t>(m_meshes.size()); }
    uint32_t getInstanceCount() const { return static_cast<uint32_t>(m_instances.size()); }

    std::shared_ptr<const Scene> build() const;

    void clear();

private:
    struct PendingInstance
    {
        uint32_t meshId;
        glm::mat4 localToWorld;
        glm::mat4 worldToLocal;
        Material material;
    };

    std::vector<MeshData> m_meshes;
    std::vector<PendingInstance> m_instances;
    EnvironmentMap m_environment;
};

} // namespace prism
