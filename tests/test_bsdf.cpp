#include <prism/raytracing/bsdf.h>

#include <gtest/gtest.h>

#include <random>

using namespace prism;

namespace
{

PrincipledBSDF mirror()
{
    PrincipledBSDF bsdf;
    bsdf.albedo = glm::vec3(1.0f);
    bsdf.roughness = 0.0f;
    bsdf.metallic = 1.0f;
    return bsdf;
}

glm::vec3 randomUnit(std::mt19937& rng)
{
    std::normal_distribution<float> g;
    glm::vec3 v;
    do
    {
        v = glm::vec3(g(rng), g(rng), g(rng));
    } while (glm::dot(v, v) < 1e-6f);
    return glm::normalize(v);
}

} // namespace

TEST(BSDF, LuminanceWeights)
{
    EXPECT_NEAR(luminance(glm::vec3(1.0f)), 1.0f, 1e-6f);
    EXPECT_FLOAT_EQ(luminance(glm::vec3(0.0f, 1.0f, 0.0f)), 0.7152f);
}

TEST(BSDF, TangentFrameIsOrthonormal)
{
    glm::vec3 n = glm::normalize(glm::vec3(0.3f, 0.8f, -0.2f));
    glm::vec3 t, b;

    buildTangentFrame(n, glm::vec3(1.0f, 0.0f, 0.0f), t, b);
    EXPECT_NEAR(glm::dot(t, n), 0.0f, 1e-6f);
    EXPECT_NEAR(glm::dot(b, n), 0.0f, 1e-6f);
    EXPECT_NEAR(glm::length(t), 1.0f, 1e-6f);
    EXPECT_NEAR(glm::length(b), 1.0f, 1e-6f);

    // A tangent parallel to the normal falls back to an arbitrary basis
    buildTangentFrame(n, n * 2.0f, t, b);
    EXPECT_NEAR(glm::dot(t, n), 0.0f, 1e-5f);
    EXPECT_NEAR(glm::length(t), 1.0f, 1e-5f);
}

TEST(BSDF, LambdaVanishesForSmoothOrNormalIncidence)
{
    EXPECT_FLOAT_EQ(PrincipledBSDF::lambda(1.0f, 0.5f), 0.0f);
    EXPECT_FLOAT_EQ(PrincipledBSDF::lambda(0.3f, 0.0f), 0.0f);
    EXPECT_GT(PrincipledBSDF::lambda(0.3f, 0.5f), 0.0f);
    EXPECT_GT(PrincipledBSDF::lambda(0.3f, 0.8f), PrincipledBSDF::lambda(0.3f, 0.5f));
}

TEST(BSDF, SpecularProbability)
{
    EXPECT_FLOAT_EQ(mirror().specularProbability(), 1.0f);

    PrincipledBSDF white;
    white.albedo = glm::vec3(1.0f);
    white.metallic = 0.0f;
    EXPECT_NEAR(white.specularProbability(), 0.04f / 1.04f, 1e-5f);

    PrincipledBSDF blackDielectric;
    blackDielectric.albedo = glm::vec3(0.0f);
    blackDielectric.metallic = 0.0f;
    EXPECT_FLOAT_EQ(blackDielectric.specularProbability(), 1.0f);

    PrincipledBSDF blackMetal;
    blackMetal.albedo = glm::vec3(0.0f);
    blackMetal.metallic = 1.0f;
    EXPECT_FLOAT_EQ(blackMetal.specularProbability(), 1.0f);
}

TEST(BSDF, SmoothMirrorReflectsExactlyWithUnitWeight)
{
    glm::vec3 N(0.0f, 0.0f, 1.0f);
    glm::vec3 V = glm::normalize(glm::vec3(0.3f, -0.4f, 0.8f));

    BSDFSample s = mirror().sample(N, N, glm::vec3(1, 0, 0), V, 0.7f,
                                   glm::vec2(0.2f, 0.9f), glm::vec2(0.5f));
    ASSERT_TRUE(s.valid);

    glm::vec3 expected = glm::reflect(-V, N);
    EXPECT_NEAR(glm::length(s.direction - expected), 0.0f, 1e-6f);
    EXPECT_EQ(s.weight, glm::vec3(1.0f));
}

TEST(BSDF, FlippedNormalsFaceTheViewer)
{
    glm::vec3 N(0.0f, 0.0f, -1.0f);
    glm::vec3 V(0.0f, 0.6f, 0.8f);

    BSDFSample s = mirror().sample(N, N, glm::vec3(1, 0, 0), V, 0.0f,
                                   glm::vec2(0.5f), glm::vec2(0.5f));
    ASSERT_TRUE(s.valid);
    EXPECT_NEAR(s.direction.x, 0.0f, 1e-6f);
    EXPECT_NEAR(s.direction.y, -0.6f, 1e-6f);
    EXPECT_NEAR(s.direction.z, 0.8f, 1e-6f);
}

TEST(BSDF, ReflectionBelowGeometricSurfaceIsInvalid)
{
    // Shading normal tilted far from the face normal pushes the mirror
    // direction through the surface
    glm::vec3 N = glm::normalize(glm::vec3(1.0f, 0.0f, 0.2f));
    glm::vec3 Ng(0.0f, 0.0f, 1.0f);
    glm::vec3 V(0.0f, 0.0f, 1.0f);

    BSDFSample s = mirror().sample(N, Ng, glm::vec3(0, 1, 0), V, 0.0f,
                                   glm::vec2(0.5f), glm::vec2(0.5f));
    EXPECT_FALSE(s.valid);
    EXPECT_EQ(s.weight, glm::vec3(0.0f));
}

TEST(BSDF, VisibleNormalsLieInUpperHemisphere)
{
    std::mt19937 rng(77);
    std::uniform_real_distribution<float> u(0.0f, 1.0f);

    for (int i = 0; i < 2000; ++i)
    {
        glm::vec3 n = randomUnit(rng);
        if (n.z < -0.9f)
            n = -n;

        glm::vec3 V = randomUnit(rng);
        if (glm::dot(V, n) < 0.0f)
            V = -V;
        if (glm::dot(V, n) < 1e-3f)
            continue;

        float alpha = 0.05f + 0.95f * u(rng);
        glm::vec3 H = PrincipledBSDF::sampleVNDF(n, V, alpha, u(rng), u(rng));

        EXPECT_NEAR(glm::length(H), 1.0f, 1e-4f);
        EXPECT_GE(glm::dot(H, n), -1e-4f);
        // Visible normals face the viewer
        EXPECT_GE(glm::dot(H, V), -1e-4f);
    }
}

TEST(BSDF, SmallRoughnessConcentratesAroundMirrorDirection)
{
    glm::vec3 n(0.0f, 0.0f, 1.0f);
    glm::vec3 V = glm::normalize(glm::vec3(0.5f, 0.0f, 1.0f));

    std::mt19937 rng(3);
    std::uniform_real_distribution<float> u(0.0f, 1.0f);
    for (int i = 0; i < 200; ++i)
    {
        glm::vec3 H = PrincipledBSDF::sampleVNDF(n, V, 1e-3f, u(rng), u(rng));
        EXPECT_GT(glm::dot(H, n), 0.999f);
    }
    EXPECT_EQ(PrincipledBSDF::sampleVNDF(n, V, 0.0f, 0.3f, 0.3f), n);
}

TEST(BSDF, DiffuseLobeSamplesCosineHemisphere)
{
    PrincipledBSDF white;
    white.albedo = glm::vec3(0.8f);
    white.roughness = 1.0f;
    white.metallic = 0.0f;

    glm::vec3 N(0.0f, 1.0f, 0.0f);
    glm::vec3 V = glm::normalize(glm::vec3(0.2f, 1.0f, 0.1f));
    float pSpec = white.specularProbability();

    std::mt19937 rng(11);
    std::uniform_real_distribution<float> u(0.0f, 1.0f);

    float meanCos = 0.0f;
    const int n = 4000;
    for (int i = 0; i < n; ++i)
    {
        glm::vec2 uDiff(u(rng), u(rng));
        BSDFSample s = white.sample(N, N, glm::vec3(1, 0, 0), V, 0.99f, glm::vec2(0.5f), uDiff);
        ASSERT_TRUE(s.valid);
        EXPECT_GT(glm::dot(s.direction, N), 0.0f);
        EXPECT_NEAR(glm::length(s.direction), 1.0f, 1e-4f);
        EXPECT_GT(s.weight.x, 0.0f);
        EXPECT_FLOAT_EQ(s.weight.x, s.weight.y);
        meanCos += glm::dot(s.direction, N);
    }
    meanCos /= static_cast<float>(n);

    // E[cos] under a cosine-weighted hemisphere is 2/3
    EXPECT_NEAR(meanCos, 2.0f / 3.0f, 0.02f);
    EXPECT_LT(pSpec, 0.99f);
}

TEST(BSDF, GlossyWeightsStayBounded)
{
    PrincipledBSDF gold;
    gold.albedo = glm::vec3(1.0f, 0.78f, 0.34f);
    gold.roughness = 0.4f;
    gold.metallic = 1.0f;

    glm::vec3 N(0.0f, 0.0f, 1.0f);
    std::mt19937 rng(5);
    std::uniform_real_distribution<float> u(0.0f, 1.0f);

    int valid = 0;
    for (int i = 0; i < 2000; ++i)
    {
        glm::vec3 V = glm::normalize(glm::vec3(u(rng) - 0.5f, u(rng) - 0.5f, 0.2f + u(rng)));
        BSDFSample s = gold.sample(N, N, glm::vec3(1, 0, 0), V, u(rng),
                                   glm::vec2(u(rng), u(rng)), glm::vec2(u(rng), u(rng)));
        if (!s.valid)
            continue;
        ++valid;
        EXPECT_GT(glm::dot(s.direction, N), 0.0f);
        // Smith G2/G1 <= 1 and Schlick F <= 1
        EXPECT_LE(s.weight.x, 1.0f + 1e-5f);
        EXPECT_GE(s.weight.z, 0.0f);
    }
    EXPECT_GT(valid, 1500);
}

TEST(BSDF, RoughReflectionUnderShadingNormalIsInvalid)
{
    PrincipledBSDF metal;
    metal.albedo = glm::vec3(0.9f);
    metal.roughness = 1.0f;
    metal.metallic = 1.0f;

    // Shading normal tilted 37 degrees away from the face normal leaves a
    // wedge of directions above the face but below the shading normal
    glm::vec3 N = glm::normalize(glm::vec3(0.6f, 0.0f, 0.8f));
    glm::vec3 Ng(0.0f, 0.0f, 1.0f);

    std::mt19937 rng(19);
    std::uniform_real_distribution<float> u(0.0f, 1.0f);

    int valid = 0;
    int rejected = 0;
    for (int i = 0; i < 4000; ++i)
    {
        glm::vec3 V = glm::normalize(glm::vec3(-0.2f - u(rng), u(rng) - 0.5f, 0.3f + u(rng)));
        BSDFSample s = metal.sample(N, Ng, glm::vec3(0, 1, 0), V, u(rng),
                                    glm::vec2(u(rng), u(rng)), glm::vec2(u(rng), u(rng)));
        if (!s.valid)
        {
            ++rejected;
            EXPECT_EQ(s.weight, glm::vec3(0.0f));
            continue;
        }
        ++valid;
        EXPECT_GT(glm::dot(s.direction, N), 0.0f);
        EXPECT_GT(glm::dot(s.direction, Ng), 0.0f);
        EXPECT_LE(s.weight.x, 1.0f + 1e-5f);
    }
    EXPECT_GT(valid, 0);
    EXPECT_GT(rejected, 0);
}
