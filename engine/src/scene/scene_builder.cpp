#include <prism/scene/scene_builder.h>
#include <prism/core/log.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>

namespace prism
{

uint32_t SceneBuilder::addMesh(MeshData mesh)
{
    if (mesh.indices.size() < 3)
    {
        Log::warn("Mesh '" + mesh.name + "' has no triangles, skipped");
        return INVALID_MESH;
    }

    if (mesh.indices.size() % 3 != 0)
    {
        Log::warn("Mesh '" + mesh.name + "' index count is not a multiple of 3, dropping the trailing indices");
        mesh.indices.resize(mesh.indices.size() - mesh.indices.size() % 3);
    }

    for (uint32_t idx : mesh.indices)
    {
        if (idx >= mesh.vertices.size())
        {
            Log::error("Mesh '" + mesh.name + "' references vertex " + std::to_string(idx)
                       + " of " + std::to_string(mesh.vertices.size()));
            return INVALID_MESH;
        }
    }

    m_meshes.push_back(std::move(mesh));
    return static_cast<uint32_t>(m_meshes.size() - 1);
}

bool SceneBuilder::addInstance(uint32_t meshId, const glm::mat4& localToWorld)
{
    if (meshId >= m_meshes.size())
    {
        Log::error("Instance references unknown mesh " + std::to_string(meshId));
        return false;
    }
    return addInstance(meshId, localToWorld, m_meshes[meshId].material);
}

bool SceneBuilder::addInstance(uint32_t meshId, const glm::mat4& localToWorld, const Material& material)
{
    if (meshId >= m_meshes.size())
    {
        Log::error("Instance references unknown mesh " + std::to_string(meshId));
        return false;
    }

    float det = glm::determinant(localToWorld);
    if (!std::isfinite(det) || std::abs(det) < 1e-12f)
    {
        Log::error("Instance transform of mesh '" + m_meshes[meshId].name + "' is not invertible");
        return false;
    }

    m_instances.push_back({ meshId, localToWorld, glm::inverse(localToWorld), material });
    return true;
}

void SceneBuilder::clear()
{
    m_meshes.clear();
    m_instances.clear();
    m_environment = EnvironmentMap{};
}

std::shared_ptr<const Scene> SceneBuilder::build() const
{
    auto start = std::chrono::steady_clock::now();

    auto scene = std::make_shared<Scene>();
    scene->m_environment = m_environment;

    // --- Flatten geometry ---

    std::vector<uint32_t> meshFirstTri(m_meshes.size());
    std::vector<AABB> triBounds;
    std::vector<uint32_t> flatIndices;

    for (size_t m = 0; m < m_meshes.size(); ++m)
    {
        const MeshData& mesh = m_meshes[m];
        uint32_t vertexOffset = static_cast<uint32_t>(scene->m_vertices.size());
        meshFirstTri[m] = static_cast<uint32_t>(triBounds.size());

        scene->m_vertices.insert(scene->m_vertices.end(), mesh.vertices.begin(), mesh.vertices.end());

        for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
        {
            AABB box;
            for (int k = 0; k < 3; ++k)
            {
                uint32_t vi = mesh.indices[i + k];
                box.grow(mesh.vertices[vi].position);
                flatIndices.push_back(vertexOffset + vi);
            }
            triBounds.push_back(box);
        }
    }

    // --- BLAS per mesh (shared node array) ---

    std::vector<uint32_t> meshRoots(m_meshes.size(), BVH::INVALID_NODE);
    for (size_t m = 0; m < m_meshes.size(); ++m)
    {
        meshRoots[m] = scene->m_blas.append(triBounds, meshFirstTri[m], m_meshes[m].triangleCount());

        uint32_t depth = scene->m_blas.depth(meshRoots[m]);
        if (depth >= BVH::MAX_DEPTH)
            Log::warn("BLAS of mesh '" + m_meshes[m].name + "' hit the depth limit; leaves may hold many triangles");
    }

    // Triangle slots follow the BLAS leaf order
    const auto& triOrder = scene->m_blas.indices();
    scene->m_indices.resize(flatIndices.size());
    for (size_t slot = 0; slot < triOrder.size(); ++slot)
    {
        uint32_t tri = triOrder[slot];
        scene->m_indices[slot * 3 + 0] = flatIndices[tri * 3 + 0];
        scene->m_indices[slot * 3 + 1] = flatIndices[tri * 3 + 1];
        scene->m_indices[slot * 3 + 2] = flatIndices[tri * 3 + 2];
    }

    // --- TLAS over instances ---

    std::vector<Instance> instances;
    std::vector<AABB> instanceBounds;
    instances.reserve(m_instances.size());
    instanceBounds.reserve(m_instances.size());

    for (const PendingInstance& pending : m_instances)
    {
        Instance inst;
        inst.localToWorld = pending.localToWorld;
        inst.worldToLocal = pending.worldToLocal;
        inst.material = pending.material;
        inst.blasRoot = meshRoots[pending.meshId];

        instances.push_back(inst);
        instanceBounds.push_back(scene->m_blas.rootAABB(inst.blasRoot).transformed(inst.localToWorld));
    }

    scene->m_tlas.build(instanceBounds);

    // Instances follow the TLAS leaf order
    const auto& instOrder = scene->m_tlas.indices();
    scene->m_instances.resize(instances.size());
    for (size_t slot = 0; slot < instOrder.size(); ++slot)
        scene->m_instances[slot] = instances[instOrder[slot]];

    if (scene->m_instances.empty())
        Log::warn("Scene has no instances; every ray sees the environment");

    float ms = std::chrono::duration<float, std::milli>(std::chrono::steady_clock::now() - start).count();

    char timing[32];
    std::snprintf(timing, sizeof(timing), "%.1f ms", ms);
    Log::info("Scene built: " + std::to_string(m_meshes.size()) + " mesh(es), "
              + std::to_string(scene->m_instances.size()) + " instance(s), "
              + std::to_string(scene->getTriangleCount()) + " triangles, "
              + std::to_string(scene->m_blas.nodeCount()) + " BLAS / "
              + std::to_string(scene->m_tlas.nodeCount()) + " TLAS nodes in " + timing);

    return scene;
}

} // namespace prism
