#pragma once

#include <prism/raytracing/bvh.h>
#include <prism/raytracing/intersect.h>
#include <prism/raytracing/ray.h>

#include <cstdint>
#include <utility>

namespace prism
{

// Explicit stack capacity. The builder caps tree depth at BVH::MAX_DEPTH and
// near/far ordering keeps at most one pending entry per level, so this never
// overflows for trees produced by BVH. Trees from elsewhere must respect the
// same bound; overflow is not detected.
constexpr uint32_t TRAVERSAL_STACK_SIZE = 64;
static_assert(TRAVERSAL_STACK_SIZE > BVH::MAX_DEPTH + 1,
              "traversal stack must exceed the BVH depth bound");

// Nearest-hit traversal shared by the BLAS and the TLAS.
//
// visitLeaf(const BVH::Node& leaf, float& closest) tests the leaf's
// primitives and lowers closest for every nearer hit it finds. Entries whose
// box distance is no longer below closest are skipped when popped.
template <typename LeafVisitor>
void traverseBVH(const BVH::Node* nodes, uint32_t root, const Ray& ray,
                 float& closest, uint32_t& aabbTests, LeafVisitor&& visitLeaf)
{
    struct StackEntry
    {
        uint32_t node;
        float distance;
    };

    StackEntry stack[TRAVERSAL_STACK_SIZE];
    uint32_t stackPtr = 0;

    ++aabbTests;
    float rootDist = intersectAABB(nodes[root].bounds, ray);
    if (rootDist < closest)
        stack[stackPtr++] = { root, rootDist };

    while (stackPtr > 0)
    {
        StackEntry entry = stack[--stackPtr];

        // Stale: a closer hit was found after this entry was pushed
        if (entry.distance >= closest)
            continue;

        const BVH::Node& node = nodes[entry.node];
        if (node.isLeaf())
        {
            visitLeaf(node, closest);
            continue;
        }

        uint32_t nearChild = node.leftChild();
        uint32_t farChild  = node.rightChild();
        float nearDist = intersectAABB(nodes[nearChild].bounds, ray);
        float farDist  = intersectAABB(nodes[farChild].bounds, ray);
        aabbTests += 2;

        // Ties keep the left child as the near one
        if (farDist < nearDist)
        {
            std::swap(nearChild, farChild);
            std::swap(nearDist, farDist);
        }

        // Far first so the near child is popped next
        if (farDist < closest)
            stack[stackPtr++] = { farChild, farDist };
        if (nearDist < closest)
            stack[stackPtr++] = { nearChild, nearDist };
    }
}

} // namespace prism
