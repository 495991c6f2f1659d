#include <prism/scene/mesh_data.h>
#include <prism/core/log.h>

#include <tiny_obj_loader.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>

namespace prism
{

namespace
{

constexpr float MESH_PI = 3.14159265358979323846f;

Material convertMaterial(const tinyobj::material_t& m)
{
    Material mat;
    mat.color = { m.diffuse[0], m.diffuse[1], m.diffuse[2] };

    // Ns -> roughness: sqrt(2 / (Ns + 2)) maps Blinn-Phong exponent to GGX roughness.
    mat.roughness = glm::clamp(std::sqrt(2.0f / (std::max(m.shininess, 0.0f) + 2.0f)), 0.0f, 1.0f);

    // Mirror illumination models become metals tinted by Ks
    if (m.illum == 3 || m.illum == 5)
    {
        mat.metallic = 1.0f;
        mat.color = { m.specular[0], m.specular[1], m.specular[2] };
    }

    // Ke: intensity is the largest channel, color the normalized emission
    glm::vec3 ke(m.emission[0], m.emission[1], m.emission[2]);
    float intensity = std::max(ke.x, std::max(ke.y, ke.z));
    if (intensity > 0.0f)
    {
        mat.color = ke / intensity;
        mat.emissive = intensity;
    }

    return mat;
}

} // namespace

std::vector<MeshData> MeshData::loadOBJ(const std::string& path)
{
    tinyobj::attrib_t attrib;
    std::vector<tinyobj::shape_t> shapes;
    std::vector<tinyobj::material_t> materials;
    std::string warn, err;

    std::string filename = std::filesystem::path(path).filename().string();
    Log::info("Loading OBJ: " + filename + "...");

    std::string mtlDir = std::filesystem::path(path).parent_path().string() + "/";

    bool ok = tinyobj::LoadObj(&attrib, &shapes, &materials, &warn, &err,
                               path.c_str(), mtlDir.c_str(), true);

    if (!warn.empty()) Log::warn(warn);
    if (!err.empty())  Log::error(err);
    if (!ok) return {};

    Log::info("  Parsed " + std::to_string(shapes.size()) + " shape(s), "
              + std::to_string(materials.size()) + " material(s)");

    // Group faces by material ID across all shapes (ordered for stable output)
    std::map<int, MeshData> matGroups;

    for (const auto& shape : shapes)
    {
        size_t indexOffset = 0;

        for (size_t f = 0; f < shape.mesh.num_face_vertices.size(); f++)
        {
            int fv = shape.mesh.num_face_vertices[f];
            int matId = shape.mesh.material_ids[f];
            if (matId < 0 || matId >= static_cast<int>(materials.size()))
                matId = -1; // normalize "no material"

            auto groupIt = matGroups.find(matId);
            if (groupIt == matGroups.end())
            {
                MeshData group;
                if (matId >= 0)
                {
                    group.name = materials[matId].name;
                    group.material = convertMaterial(materials[matId]);
                }
                else
                {
                    group.name = shape.name;
                }
                groupIt = matGroups.emplace(matId, std::move(group)).first;
            }
            MeshData& group = groupIt->second;

            glm::vec3 pos[3];
            glm::vec3 vtxNormals[3];
            glm::vec2 uv[3] = {};
            bool hasVertexNormals = true;
            for (int v = 0; v < fv && v < 3; v++)
            {
                tinyobj::index_t idx = shape.mesh.indices[indexOffset + v];
                pos[v] =
                {
                    attrib.vertices[3 * idx.vertex_index + 0],
                    attrib.vertices[3 * idx.vertex_index + 1],
                    attrib.vertices[3 * idx.vertex_index + 2]
                };
                if (idx.normal_index >= 0)
                {
                    vtxNormals[v] =
                    {
                        attrib.normals[3 * idx.normal_index + 0],
                        attrib.normals[3 * idx.normal_index + 1],
                        attrib.normals[3 * idx.normal_index + 2]
                    };
                }
                else
                {
                    hasVertexNormals = false;
                }
                if (idx.texcoord_index >= 0)
                {
                    uv[v] =
                    {
                        attrib.texcoords[2 * idx.texcoord_index + 0],
                        attrib.texcoords[2 * idx.texcoord_index + 1]
                    };
                }
            }

            indexOffset += fv;

            glm::vec3 cross = glm::cross(pos[1] - pos[0], pos[2] - pos[0]);
            float area2 = glm::length(cross);
            if (!(area2 > 0.0f))
                continue; // degenerate face

            glm::vec3 faceNormal = cross / area2;
            if (!hasVertexNormals)
                vtxNormals[0] = vtxNormals[1] = vtxNormals[2] = faceNormal;

            // Compute tangent from UV gradients
            glm::vec3 edge1 = pos[1] - pos[0];
            glm::vec3 edge2 = pos[2] - pos[0];
            glm::vec2 dUV1  = uv[1] - uv[0];
            glm::vec2 dUV2  = uv[2] - uv[0];
            float det = dUV1.x * dUV2.y - dUV2.x * dUV1.y;
            glm::vec3 T = glm::normalize(edge1);
            float bSign = 1.0f;
            if (std::abs(det) > 1e-8f)
            {
                float ff = 1.0f / det;
                T = glm::normalize(ff * (dUV2.y * edge1 - dUV1.y * edge2));
                glm::vec3 B = ff * (-dUV2.x * edge1 + dUV1.x * edge2);
                bSign = (glm::dot(glm::cross(faceNormal, T), B) < 0.0f) ? -1.0f : 1.0f;
            }
            glm::vec4 tangent(T, bSign);

            uint32_t baseIdx = static_cast<uint32_t>(group.vertices.size());
            for (int v = 0; v < 3; v++)
            {
                group.vertices.push_back({ pos[v], uv[v].x, vtxNormals[v], uv[v].y, tangent });
                group.indices.push_back(baseIdx + v);
            }
        }
    }

    std::vector<MeshData> result;
    result.reserve(matGroups.size());
    for (auto& [id, group] : matGroups)
    {
        if (!group.indices.empty())
            result.push_back(std::move(group));
    }

    size_t totalVerts = 0;
    size_t totalTris = 0;
    int emissiveCount = 0;
    for (const auto& m : result)
    {
        totalVerts += m.vertices.size();
        totalTris += m.triangleCount();
        if (m.material.isEmissive())
            ++emissiveCount;
    }

    Log::info("  " + std::to_string(totalVerts) + " vertices, "
              + std::to_string(totalTris) + " triangles, "
              + std::to_string(result.size()) + " submesh(es), "
              + std::to_string(emissiveCount) + " emissive");

    return result;
}

// --- Procedural meshes ---

MeshData MeshData::createUVSphere(float radius, uint32_t segments, uint32_t rings)
{
    segments = std::max(segments, 3u);
    rings = std::max(rings, 2u);

    MeshData mesh;
    mesh.name = "sphere";
    mesh.vertices.reserve(static_cast<size_t>(segments + 1) * (rings + 1));

    for (uint32_t i = 0; i <= rings; ++i)
    {
        float theta = MESH_PI * static_cast<float>(i) / static_cast<float>(rings);
        float sinTheta = std::sin(theta);
        float cosTheta = std::cos(theta);

        for (uint32_t j = 0; j <= segments; ++j)
        {
            float phi = 2.0f * MESH_PI * static_cast<float>(j) / static_cast<float>(segments);
            float sinPhi = std::sin(phi);
            float cosPhi = std::cos(phi);

            glm::vec3 n(sinTheta * cosPhi, cosTheta, sinTheta * sinPhi);

            Vertex vert;
            vert.position = n * radius;
            vert.normal = n;
            vert.u = static_cast<float>(j) / static_cast<float>(segments);
            vert.v = static_cast<float>(i) / static_cast<float>(rings);
            vert.tangent = glm::vec4(-sinPhi, 0.0f, cosPhi, 1.0f);
            mesh.vertices.push_back(vert);
        }
    }

    uint32_t stride = segments + 1;
    for (uint32_t i = 0; i < rings; ++i)
    {
        for (uint32_t j = 0; j < segments; ++j)
        {
            uint32_t a = i * stride + j;
            uint32_t b = (i + 1) * stride + j;
            uint32_t c = (i + 1) * stride + j + 1;
            uint32_t d = i * stride + j + 1;

            // Skip the zero-area triangles at the poles
            if (i != 0)
                mesh.indices.insert(mesh.indices.end(), { a, d, b });
            if (i != rings - 1)
                mesh.indices.insert(mesh.indices.end(), { d, c, b });
        }
    }

    return mesh;
}

MeshData MeshData::createBox(const glm::vec3& halfExtents)
{
    struct Face
    {
        glm::vec3 normal, u, v; // cross(u, v) == normal
    };

    static const Face faces[6] = {
        { { 1, 0, 0 },  { 0, 1, 0 }, { 0, 0, 1 } },
        { { -1, 0, 0 }, { 0, 0, 1 }, { 0, 1, 0 } },
        { { 0, 1, 0 },  { 0, 0, 1 }, { 1, 0, 0 } },
        { { 0, -1, 0 }, { 1, 0, 0 }, { 0, 0, 1 } },
        { { 0, 0, 1 },  { 1, 0, 0 }, { 0, 1, 0 } },
        { { 0, 0, -1 }, { 0, 1, 0 }, { 1, 0, 0 } },
    };

    static const glm::vec2 corners[4] = { { -1, -1 }, { 1, -1 }, { 1, 1 }, { -1, 1 } };

    MeshData mesh;
    mesh.name = "box";

    for (const Face& face : faces)
    {
        uint32_t base = static_cast<uint32_t>(mesh.vertices.size());
        for (const glm::vec2& c : corners)
        {
            Vertex vert;
            vert.position = (face.normal + c.x * face.u + c.y * face.v) * halfExtents;
            vert.normal = face.normal;
            vert.u = 0.5f * (c.x + 1.0f);
            vert.v = 0.5f * (c.y + 1.0f);
            vert.tangent = glm::vec4(face.u, 1.0f);
            mesh.vertices.push_back(vert);
        }
        mesh.indices.insert(mesh.indices.end(), { base, base + 1, base + 2, base, base + 2, base + 3 });
    }

    return mesh;
}

} // namespace prism
