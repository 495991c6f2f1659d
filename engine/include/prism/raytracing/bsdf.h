#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>

namespace prism
{

constexpr float PI = 3.14159265358979323846f;

struct BSDFSample
{
    glm::vec3 direction{0.0f};
    glm::vec3 weight{0.0f}; // BRDF * cos_theta / pdf, already divided by the lobe probability
    bool valid = false;
};

inline float luminance(const glm::vec3& c)
{
    return glm::dot(c, glm::vec3(0.2126f, 0.7152f, 0.0722f));
}

inline void buildONB(const glm::vec3& n, glm::vec3& t, glm::vec3& b)
{
    glm::vec3 a = (std::abs(n.x) > 0.9f) ? glm::vec3(0, 1, 0) : glm::vec3(1, 0, 0);
    t = glm::normalize(glm::cross(n, a));
    b = glm::cross(n, t);
}

// Tangent frame from the interpolated tangent (Gram-Schmidt against n).
// Falls back to buildONB when the tangent is missing or parallel to n.
inline void buildTangentFrame(const glm::vec3& n, const glm::vec3& tangent,
                              glm::vec3& t, glm::vec3& b)
{
    glm::vec3 ortho = tangent - n * glm::dot(n, tangent);
    float len2 = glm::dot(ortho, ortho);
    if (!(len2 > 1e-12f))
    {
        buildONB(n, t, b);
        return;
    }
    t = ortho / std::sqrt(len2);
    b = glm::cross(n, t);
}

// Metallic-roughness material: GGX specular lobe and Burley diffuse lobe,
// one lobe chosen stochastically per sample.
struct PrincipledBSDF
{
    glm::vec3 albedo{1.0f};
    float roughness = 1.0f;
    float metallic = 0.0f;

    float getAlpha() const { return roughness * roughness; }

    glm::vec3 getF0() const
    {
        return glm::mix(glm::vec3(0.04f), albedo, metallic);
    }

    // Probability of picking the specular lobe. A material with neither lobe
    // weighted (black dielectric) still samples the specular lobe.
    float specularProbability() const
    {
        float wSpec = luminance(getF0());
        float wDiff = (1.0f - metallic) * luminance(albedo);
        float total = wSpec + wDiff;
        if (!(total > 0.0f))
            return 1.0f;
        return wSpec / total;
    }

    static glm::vec3 F_Schlick(float cosTheta, const glm::vec3& F0)
    {
        float m = std::clamp(1.0f - cosTheta, 0.0f, 1.0f);
        float m2 = m * m;
        return F0 + (1.0f - F0) * (m2 * m2 * m);
    }

    // Smith Lambda for GGX
    static float lambda(float cosTheta, float alpha)
    {
        float c2 = std::max(cosTheta * cosTheta, 1e-8f);
        float tan2 = std::max(1.0f - c2, 0.0f) / c2;
        return 0.5f * (-1.0f + std::sqrt(1.0f + alpha * alpha * tan2));
    }

    // Visible normal sampling with spherical caps (Dupuy & Benyoub 2023),
    // evaluated directly around the world-space normal n.
    static glm::vec3 sampleVNDF(const glm::vec3& n, const glm::vec3& V,
                                float alpha, float u1, float u2)
    {
        if (alpha == 0.0f)
            return n;

        // Warp to the hemisphere configuration
        glm::vec3 viZ = n * glm::dot(V, n);
        glm::vec3 viXY = V - viZ;
        glm::vec3 viStd = glm::normalize(viZ - alpha * viXY);

        // Spherical cap in (-viStd.z, 1]
        float viStdZ = glm::dot(viStd, n);
        float z = 1.0f - u2 * (1.0f + viStdZ);
        float sinTheta = std::sqrt(std::clamp(1.0f - z * z, 0.0f, 1.0f));
        float phi = 2.0f * PI * u1 - PI;
        glm::vec3 cStd(sinTheta * std::cos(phi), sinTheta * std::sin(phi), z);

        // Rotate the cap sample from +Z onto n
        glm::vec3 up(0.0f, 0.0f, 1.000001f);
        glm::vec3 wr = n + up;
        glm::vec3 c = glm::dot(wr, cStd) * wr / wr.z - cStd;

        // Unwarp the halfway vector
        glm::vec3 hStd = c + viStd;
        glm::vec3 hZ = n * glm::dot(n, hStd);
        glm::vec3 hXY = hZ - hStd;
        return glm::normalize(hZ + alpha * hXY);
    }

    // N = shading normal, Ng = geometric normal, V = direction towards the
    // viewer. uLobe picks the lobe; uSpec / uDiff drive the chosen lobe.
    BSDFSample sample(glm::vec3 N, glm::vec3 Ng, const glm::vec3& tangent,
                      const glm::vec3& V, float uLobe,
                      const glm::vec2& uSpec, const glm::vec2& uDiff) const
    {
        N = glm::normalize(N);
        Ng = glm::normalize(Ng);
        if (glm::dot(Ng, V) < 0.0f)
            Ng = -Ng;
        if (glm::dot(N, Ng) < 0.0f)
            N = -N;

        glm::vec3 F0 = getF0();
        float pSpec = specularProbability();
        float NdotV = std::clamp(glm::dot(N, V), 0.0f, 1.0f);

        BSDFSample s;
        if (uLobe < pSpec)
        {
            float alpha = getAlpha();
            glm::vec3 H = sampleVNDF(N, V, alpha, uSpec.x, uSpec.y);
            float VdotH = glm::dot(V, H);
            glm::vec3 L = 2.0f * VdotH * H - V;

            if (glm::dot(L, Ng) <= 0.0f)
                return s;

            // Above the face but under the shading normal: no valid lobe value
            float NdotL = glm::dot(N, L);
            if (NdotL <= 0.0f)
                return s;

            float lambdaV = lambda(NdotV, alpha);
            float lambdaL = lambda(NdotL, alpha);
            glm::vec3 F = F_Schlick(std::max(VdotH, 0.0f), F0);

            s.direction = L;
            s.weight = F * ((1.0f + lambdaV) / (1.0f + lambdaV + lambdaL)) / pSpec;
        }
        else
        {
            glm::vec3 t, b;
            buildTangentFrame(N, tangent, t, b);

            float phi = 2.0f * PI * uDiff.x;
            float cosTheta = std::sqrt(1.0f - uDiff.y);
            float sinTheta = std::sqrt(uDiff.y);
            glm::vec3 L = t * (std::cos(phi) * sinTheta)
                        + b * (std::sin(phi) * sinTheta)
                        + N * cosTheta;

            if (glm::dot(L, Ng) <= 0.0f)
                return s;

            glm::vec3 H = glm::normalize(L + V);
            float LdotH = glm::dot(L, H);
            float NdotL = std::clamp(glm::dot(N, L), 0.0f, 1.0f);
            float FD90 = 0.5f + 2.0f * roughness * LdotH * LdotH;

            float mL = 1.0f - NdotL;
            float mV = 1.0f - NdotV;
            float fL = 1.0f + (FD90 - 1.0f) * (mL * mL * mL * mL * mL);
            float fV = 1.0f + (FD90 - 1.0f) * (mV * mV * mV * mV * mV);

            s.direction = L;
            s.weight = (1.0f - metallic) * albedo * (fL * fV) / (1.0f - pSpec);
        }

        s.valid = true;
        return s;
    }
};

} // namespace prism
