#include <prism/raytracing/bvh.h>
#include <prism/raytracing/intersect.h>
#include <prism/raytracing/traversal.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <random>
#include <vector>

using namespace prism;

namespace
{

using Triangle = std::array<glm::vec3, 3>;

std::vector<Triangle> randomTriangles(std::mt19937& rng, size_t count, float extent)
{
    std::uniform_real_distribution<float> pos(-extent, extent);
    std::uniform_real_distribution<float> edge(-0.5f, 0.5f);

    std::vector<Triangle> tris(count);
    for (auto& tri : tris)
    {
        glm::vec3 c(pos(rng), pos(rng), pos(rng));
        tri[0] = c + glm::vec3(edge(rng), edge(rng), edge(rng));
        tri[1] = c + glm::vec3(edge(rng), edge(rng), edge(rng));
        tri[2] = c + glm::vec3(edge(rng), edge(rng), edge(rng));
    }
    return tris;
}

std::vector<AABB> boundsOf(const std::vector<Triangle>& tris)
{
    std::vector<AABB> bounds(tris.size());
    for (size_t i = 0; i < tris.size(); ++i)
        for (const auto& v : tris[i])
            bounds[i].grow(v);
    return bounds;
}

bool contains(const AABB& outer, const AABB& inner)
{
    return glm::all(glm::lessThanEqual(outer.min, inner.min))
        && glm::all(glm::greaterThanEqual(outer.max, inner.max));
}

} // namespace

TEST(BVH, EmptyInputBuildsNothing)
{
    BVH bvh;
    bvh.build({});
    EXPECT_TRUE(bvh.empty());
    EXPECT_EQ(bvh.depth(), 0u);
    EXPECT_FALSE(bvh.rootAABB().valid());
}

TEST(BVH, SinglePrimitiveIsRootLeaf)
{
    AABB box;
    box.grow(glm::vec3(0.0f));
    box.grow(glm::vec3(1.0f));

    BVH bvh;
    bvh.build({ box });

    ASSERT_EQ(bvh.nodeCount(), 1u);
    const BVH::Node& root = bvh.nodes()[0];
    EXPECT_TRUE(root.isLeaf());
    EXPECT_EQ(root.primitiveBegin(), 0u);
    EXPECT_EQ(root.primitiveEnd(), 1u);
    EXPECT_EQ(bvh.depth(), 1u);
}

TEST(BVH, StructureInvariants)
{
    std::mt19937 rng(42);
    auto tris = randomTriangles(rng, 2000, 20.0f);
    auto bounds = boundsOf(tris);

    BVH bvh;
    bvh.build(bounds);

    const auto& nodes = bvh.nodes();
    const auto& indices = bvh.indices();
    ASSERT_FALSE(nodes.empty());
    ASSERT_EQ(indices.size(), tris.size());

    // Every primitive lands in exactly one leaf, and leaves are contained in their bounds
    std::vector<int> seen(tris.size(), 0);
    for (uint32_t n = 0; n < nodes.size(); ++n)
    {
        const BVH::Node& node = nodes[n];
        if (node.isLeaf())
        {
            for (uint32_t slot = node.primitiveBegin(); slot < node.primitiveEnd(); ++slot)
            {
                ++seen[indices[slot]];
                EXPECT_TRUE(contains(node.bounds, bounds[indices[slot]]));
            }
        }
        else
        {
            ASSERT_LT(node.rightChild(), nodes.size());
            EXPECT_GT(node.leftChild(), n);
            EXPECT_TRUE(contains(node.bounds, nodes[node.leftChild()].bounds));
            EXPECT_TRUE(contains(node.bounds, nodes[node.rightChild()].bounds));
        }
    }
    for (int count : seen)
        EXPECT_EQ(count, 1);

    EXPECT_LE(bvh.depth(), BVH::MAX_DEPTH);
    EXPECT_LT(bvh.depth(), TRAVERSAL_STACK_SIZE);
    EXPECT_GT(bvh.sahCost(), 0.0f);
}

TEST(BVH, CoincidentPrimitivesStayWithinDepthBound)
{
    AABB box;
    box.grow(glm::vec3(-1.0f));
    box.grow(glm::vec3(1.0f));
    std::vector<AABB> bounds(500, box);

    BVH bvh;
    bvh.build(bounds);
    EXPECT_LE(bvh.depth(), BVH::MAX_DEPTH);
}

TEST(BVH, ExponentialSpacingStaysWithinDepthBound)
{
    // Strongly skewed centroids push the SAH builder towards deep, unbalanced trees
    std::vector<AABB> bounds;
    for (int i = 0; i < 100; ++i)
    {
        float x = std::ldexp(1.0f, i - 50);
        AABB box;
        box.grow(glm::vec3(x, 0.0f, 0.0f));
        box.grow(glm::vec3(x * 1.01f, 1.0f, 1.0f));
        bounds.push_back(box);
    }

    BVH bvh;
    bvh.build(bounds);
    EXPECT_LE(bvh.depth(), BVH::MAX_DEPTH);
}

TEST(BVH, DepthLimitLeavesRemainingPrimitivesInOneLeaf)
{
    // Doubling spacing lets each split peel off only a few primitives, so
    // the builder runs into MAX_DEPTH with many primitives left over
    std::vector<AABB> bounds;
    for (int i = -120; i <= 120; ++i)
    {
        float x = std::ldexp(1.0f, i);
        AABB box;
        box.grow(glm::vec3(x, 0.0f, 0.0f));
        box.grow(glm::vec3(x * 1.01f, 1.0f, 1.0f));
        bounds.push_back(box);
    }

    BVH bvh;
    bvh.build(bounds);
    EXPECT_EQ(bvh.depth(), BVH::MAX_DEPTH);

    const auto& nodes = bvh.nodes();
    const auto& indices = bvh.indices();
    std::vector<int> seen(bounds.size(), 0);
    uint32_t largestLeaf = 0;
    for (const BVH::Node& node : nodes)
    {
        if (!node.isLeaf())
            continue;
        largestLeaf = std::max(largestLeaf, node.count);
        for (uint32_t slot = node.primitiveBegin(); slot < node.primitiveEnd(); ++slot)
        {
            ++seen[indices[slot]];
            EXPECT_TRUE(contains(node.bounds, bounds[indices[slot]]));
        }
    }
    for (int count : seen)
        EXPECT_EQ(count, 1);

    // The node at the depth limit is not split any further
    EXPECT_GT(largestLeaf, 2u);
}

TEST(BVH, AppendedTreesShareNodeArray)
{
    std::mt19937 rng(7);
    auto tris = randomTriangles(rng, 300, 5.0f);
    auto bounds = boundsOf(tris);

    BVH bvh;
    uint32_t rootA = bvh.append(bounds, 0, 100);
    uint32_t rootB = bvh.append(bounds, 100, 200);
    EXPECT_EQ(bvh.append(bounds, 300, 0), BVH::INVALID_NODE);

    EXPECT_EQ(rootA, 0u);
    EXPECT_GT(rootB, rootA);

    // Each tree only references its own slot range
    auto checkRange = [&](uint32_t root, uint32_t first, uint32_t count)
    {
        std::vector<uint32_t> stack{ root };
        uint32_t total = 0;
        while (!stack.empty())
        {
            const BVH::Node& node = bvh.nodes()[stack.back()];
            stack.pop_back();
            if (node.isLeaf())
            {
                EXPECT_GE(node.primitiveBegin(), first);
                EXPECT_LE(node.primitiveEnd(), first + count);
                for (uint32_t s = node.primitiveBegin(); s < node.primitiveEnd(); ++s)
                {
                    EXPECT_GE(bvh.indices()[s], first);
                    EXPECT_LT(bvh.indices()[s], first + count);
                }
                total += node.count;
            }
            else
            {
                stack.push_back(node.leftChild());
                stack.push_back(node.rightChild());
            }
        }
        EXPECT_EQ(total, count);
    };

    checkRange(rootA, 0, 100);
    checkRange(rootB, 100, 200);
}

TEST(BVH, TransformedBoundsCoverCorners)
{
    AABB box;
    box.grow(glm::vec3(-1.0f, -2.0f, -3.0f));
    box.grow(glm::vec3(1.0f, 2.0f, 3.0f));

    glm::mat4 m(1.0f);
    m[3] = glm::vec4(10.0f, 0.0f, 0.0f, 1.0f);
    m[0][0] = 2.0f;

    AABB t = box.transformed(m);
    EXPECT_FLOAT_EQ(t.min.x, 8.0f);
    EXPECT_FLOAT_EQ(t.max.x, 12.0f);
    EXPECT_FLOAT_EQ(t.min.y, -2.0f);
    EXPECT_FLOAT_EQ(t.max.z, 3.0f);
}

// --- Traversal ---

TEST(BVHTraversal, MatchesBruteForce)
{
    std::mt19937 rng(2024);
    auto tris = randomTriangles(rng, 1500, 10.0f);
    auto bounds = boundsOf(tris);

    BVH bvh;
    bvh.build(bounds);
    const auto& indices = bvh.indices();

    std::uniform_real_distribution<float> unit(-1.0f, 1.0f);
    int hits = 0;
    for (int r = 0; r < 1000; ++r)
    {
        glm::vec3 origin(unit(rng) * 15.0f, unit(rng) * 15.0f, unit(rng) * 15.0f);
        glm::vec3 dir(unit(rng), unit(rng), unit(rng));
        if (glm::length(dir) < 1e-3f)
            continue;
        Ray ray(origin, glm::normalize(dir));

        float bruteT = NO_HIT;
        uint32_t bruteTri = UINT32_MAX;
        for (uint32_t i = 0; i < tris.size(); ++i)
        {
            TriangleHit h = intersectTriangle(ray, tris[i][0], tris[i][1], tris[i][2]);
            if (h.t < bruteT)
            {
                bruteT = h.t;
                bruteTri = i;
            }
        }

        float closest = NO_HIT;
        uint32_t bestTri = UINT32_MAX;
        uint32_t aabbTests = 0;
        traverseBVH(bvh.nodes().data(), 0, ray, closest, aabbTests,
            [&](const BVH::Node& leaf, float& leafClosest)
            {
                for (uint32_t s = leaf.primitiveBegin(); s < leaf.primitiveEnd(); ++s)
                {
                    const Triangle& tri = tris[indices[s]];
                    TriangleHit h = intersectTriangle(ray, tri[0], tri[1], tri[2]);
                    if (h.t < leafClosest)
                    {
                        leafClosest = h.t;
                        bestTri = indices[s];
                    }
                }
            });

        EXPECT_EQ(closest, bruteT);
        if (bruteT < NO_HIT)
        {
            ++hits;
            EXPECT_EQ(bestTri, bruteTri);
            EXPECT_GT(aabbTests, 0u);
        }
    }
    EXPECT_GT(hits, 50);
}
