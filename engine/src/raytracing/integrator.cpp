#include <prism/raytracing/integrator.h>
#include <prism/raytracing/bsdf.h>

#include <algorithm>

namespace prism
{

float continuationProbability(const glm::vec3& throughput, uint32_t bounce,
                              uint32_t maxBounces, float contributionFactor)
{
    if (maxBounces == 0)
        return 0.0f;

    float progress = static_cast<float>(bounce) / static_cast<float>(maxBounces);
    float decay = 1.0f - progress * progress;
    float p = decay * luminance(throughput) * contributionFactor;

    // NaN falls through both comparisons; treat it as termination
    if (!(p > 0.0f))
        return 0.0f;
    return std::min(p, 1.0f);
}

Ray generatePrimaryRay(const CameraData& camera, uint32_t x, uint32_t y,
                       const glm::vec2& jitter, uint32_t width, uint32_t height)
{
    float ndcX = 2.0f * (static_cast<float>(x) + jitter.x) / static_cast<float>(width) - 1.0f;
    float ndcY = 1.0f - 2.0f * (static_cast<float>(y) + jitter.y) / static_cast<float>(height);

    glm::vec4 nearPoint = camera.clipToWorld * glm::vec4(ndcX, ndcY, -1.0f, 1.0f);
    glm::vec4 farPoint  = camera.clipToWorld * glm::vec4(ndcX, ndcY,  1.0f, 1.0f);
    glm::vec3 origin = glm::vec3(nearPoint) / nearPoint.w;
    glm::vec3 target = glm::vec3(farPoint) / farPoint.w;

    return Ray(origin, glm::normalize(target - origin));
}

glm::vec3 tracePath(const Scene& scene, Ray ray, const PixelSampler& sampler,
                    const IntegratorSettings& settings)
{
    glm::vec3 throughput(1.0f);
    float minThroughput2 = settings.minThroughput * settings.minThroughput;

    for (uint32_t bounce = 0; bounce < settings.maxBounces; ++bounce)
    {
        HitRecord hit = scene.trace(ray);

        // Environment miss or emitter: radiance is in the record's color
        if (hit.isEmissive())
            return throughput * hit.color;

        glm::vec4 lobeSpec = sampler.bounce(bounce, 0); // lobe, specular u1/u2
        glm::vec4 diffRR   = sampler.bounce(bounce, 1); // diffuse u1/u2, roulette

        PrincipledBSDF bsdf{ hit.color, hit.roughness, hit.metallic };
        BSDFSample s = bsdf.sample(hit.normal, hit.geometricNormal, hit.tangent, -ray.direction,
                                   lobeSpec.x, glm::vec2(lobeSpec.y, lobeSpec.z),
                                   glm::vec2(diffRR.x, diffRR.y));
        if (!s.valid)
            return glm::vec3(0.0f);

        throughput *= s.weight;

        if (settings.enableThroughputCutoff && glm::dot(throughput, throughput) < minThroughput2)
            return glm::vec3(0.0f);

        float p = continuationProbability(throughput, bounce, settings.maxBounces,
                                          settings.contributionFactor);
        if (p <= 0.0f || diffRR.z > p)
            return glm::vec3(0.0f);
        throughput /= p;

        ray = Ray(hit.position, s.direction);
    }

    // Bounce budget exhausted without reaching a light
    return glm::vec3(0.0f);
}

} // namespace prism
