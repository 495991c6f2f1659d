#pragma once

#include <prism/core/camera.h>
#include <prism/raytracing/ray.h>
#include <prism/raytracing/sampler.h>
#include <prism/raytracing/scene.h>

#include <glm/glm.hpp>

#include <cstdint>

namespace prism
{

struct IntegratorSettings
{
    uint32_t maxBounces = 8;
    float contributionFactor = 100.0f; // Russian roulette scale on throughput luminance

    // Biased early-out for paths whose throughput has become negligible
    bool enableThroughputCutoff = false;
    float minThroughput = 1e-3f;
};

// Russian roulette survival probability after a bounce:
// clamp((1 - (bounce / maxBounces)^2) * luminance(throughput) * factor, 0, 1)
float continuationProbability(const glm::vec3& throughput, uint32_t bounce,
                              uint32_t maxBounces, float contributionFactor);

// Primary ray through pixel (x, y) offset by jitter in [0,1)^2. Starts on
// the near plane and points at the matching far-plane point.
Ray generatePrimaryRay(const CameraData& camera, uint32_t x, uint32_t y,
                       const glm::vec2& jitter, uint32_t width, uint32_t height);

// One radiance estimate along a camera path. Returns zero for paths killed
// by roulette, invalid BSDF samples or an exhausted bounce budget.
glm::vec3 tracePath(const Scene& scene, Ray ray, const PixelSampler& sampler,
                    const IntegratorSettings& settings);

} // namespace prism
