#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace prism
{

// Packed like the GPU-side vertex buffer (std430, 48 bytes).
struct Vertex
{
    glm::vec3 position{0.0f};
    float u = 0.0f;
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    float v = 0.0f;
    glm::vec4 tangent{1.0f, 0.0f, 0.0f, 1.0f}; // xyz = tangent, w = bitangent sign (+1 or -1)

    glm::vec2 texcoord() const { return { u, v }; }
};

struct Material
{
    glm::vec3 color{0.7f};
    float roughness = 0.5f;
    float metallic = 0.0f;
    float emissive = 0.0f; // > 0: emitter with radiance color * emissive

    bool isEmissive() const { return emissive > 0.0f; }
};

struct MeshData
{
    std::string name;       // material group name (from MTL usemtl)
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    Material material;

    uint32_t triangleCount() const { return static_cast<uint32_t>(indices.size() / 3); }

    // One MeshData per material group. Empty on failure.
    static std::vector<MeshData> loadOBJ(const std::string& path);

    // Counter-clockwise winding as seen from outside for both generators.
    static MeshData createUVSphere(float radius, uint32_t segments = 48, uint32_t rings = 24);
    static MeshData createBox(const glm::vec3& halfExtents);
};

} // namespace prism
