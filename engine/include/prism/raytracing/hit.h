#pragma once

#include <prism/raytracing/intersect.h>

#include <cstdint>
#include <glm/glm.hpp>

namespace prism
{

// Terminal hit: the record's color is radiance (emitter or environment).
constexpr uint32_t HIT_FLAG_EMISSIVE = 1u << 0;

struct HitRecord
{
    float t = NO_HIT;
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f};           // interpolated shading normal, unnormalized
    glm::vec3 geometricNormal{0.0f};  // face normal, unnormalized
    glm::vec3 tangent{0.0f};          // interpolated tangent, unnormalized
    float bitangentSign = 1.0f;
    glm::vec2 texcoord{0.0f};

    // Material parameters copied from the owning instance
    glm::vec3 color{0.0f};
    float roughness = 1.0f;
    float metallic = 0.0f;

    uint32_t flags = 0;
    uint32_t instanceIndex = UINT32_MAX;
    uint32_t triangleIndex = UINT32_MAX;

    // Debug counters
    uint32_t aabbTests = 0;
    uint32_t triangleTests = 0;

    bool hit() const { return t < NO_HIT; }
    bool isEmissive() const { return (flags & HIT_FLAG_EMISSIVE) != 0; }
};

} // namespace prism
