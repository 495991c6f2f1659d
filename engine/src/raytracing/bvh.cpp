#include <prism/raytracing/bvh.h>

#include <algorithm>
#include <cfloat>
#include <numeric>
#include <utility>

namespace prism
{

AABB AABB::transformed(const glm::mat4& m) const
{
    AABB result;
    for (int i = 0; i < 8; ++i)
    {
        glm::vec3 corner((i & 1) ? max.x : min.x,
                         (i & 2) ? max.y : min.y,
                         (i & 4) ? max.z : min.z);
        result.grow(glm::vec3(m * glm::vec4(corner, 1.0f)));
    }
    return result;
}

void BVH::clear()
{
    m_nodes.clear();
    m_indices.clear();
}

void BVH::build(const std::vector<AABB>& primBounds)
{
    clear();
    append(primBounds, 0, static_cast<uint32_t>(primBounds.size()));
    m_nodes.shrink_to_fit();
}

uint32_t BVH::append(const std::vector<AABB>& primBounds, uint32_t first, uint32_t count)
{
    if (count == 0)
        return INVALID_NODE;

    m_primBounds = &primBounds;
    m_centroids.resize(primBounds.size());
    for (uint32_t i = first; i < first + count; ++i)
        m_centroids[i] = primBounds[i].centroid();

    // Identity permutation for the slots this tree owns
    if (m_indices.size() < first + count)
        m_indices.resize(first + count);
    std::iota(m_indices.begin() + first, m_indices.begin() + first + count, first);

    // Worst case 2N - 1 nodes; reserving keeps node references stable while splitting
    m_nodes.reserve(m_nodes.size() + 2 * static_cast<size_t>(count));

    uint32_t rootIdx = static_cast<uint32_t>(m_nodes.size());
    Node root;
    root.index = first;
    root.count = count;
    m_nodes.push_back(root);
    updateNodeBounds(rootIdx);

    subdivide(rootIdx, 1);

    // Free temporary build data
    m_primBounds = nullptr;
    m_centroids.clear();
    m_centroids.shrink_to_fit();

    return rootIdx;
}

void BVH::updateNodeBounds(uint32_t nodeIdx)
{
    Node& node = m_nodes[nodeIdx];
    node.bounds = AABB{};
    for (uint32_t i = 0; i < node.count; ++i)
        node.bounds.grow((*m_primBounds)[m_indices[node.index + i]]);
}

void BVH::subdivide(uint32_t nodeIdx, uint32_t depth)
{
    Node& node = m_nodes[nodeIdx];

    if (node.count <= 2 || depth >= MAX_DEPTH)
        return;

    // Centroid bounds for the primitives in this node
    AABB centroidBounds;
    for (uint32_t i = 0; i < node.count; ++i)
        centroidBounds.grow(m_centroids[m_indices[node.index + i]]);

    float parentArea = node.bounds.surfaceArea();
    float bestCost = FLT_MAX;
    int bestAxis = -1;
    float bestSplitPos = 0.0f;

    // Evaluate SAH for each axis using binning
    for (int axis = 0; axis < 3; ++axis)
    {
        float boundsMin = centroidBounds.min[axis];
        float boundsMax = centroidBounds.max[axis];
        if (boundsMin == boundsMax)
            continue;

        struct Bin
        {
            AABB bounds;
            uint32_t count = 0;
        };
        Bin bins[SAH_BINS] = {};
        float scale = static_cast<float>(SAH_BINS) / (boundsMax - boundsMin);

        for (uint32_t i = 0; i < node.count; ++i)
        {
            uint32_t primIdx = m_indices[node.index + i];
            uint32_t binIdx = std::min(
                SAH_BINS - 1,
                static_cast<uint32_t>((m_centroids[primIdx][axis] - boundsMin) * scale));
            bins[binIdx].count++;
            bins[binIdx].bounds.grow((*m_primBounds)[primIdx]);
        }

        // Sweep left-to-right and right-to-left to build prefix sums
        float leftArea[SAH_BINS - 1], rightArea[SAH_BINS - 1];
        uint32_t leftCount[SAH_BINS - 1], rightCount[SAH_BINS - 1];

        AABB leftBounds, rightBounds;
        uint32_t leftSum = 0, rightSum = 0;

        for (uint32_t i = 0; i < SAH_BINS - 1; ++i)
        {
            leftSum += bins[i].count;
            leftBounds.grow(bins[i].bounds);
            leftCount[i] = leftSum;
            leftArea[i] = leftBounds.surfaceArea();

            uint32_t ri = SAH_BINS - 1 - i;
            rightSum += bins[ri].count;
            rightBounds.grow(bins[ri].bounds);
            rightCount[ri - 1] = rightSum;
            rightArea[ri - 1] = rightBounds.surfaceArea();
        }

        for (uint32_t i = 0; i < SAH_BINS - 1; ++i)
        {
            // Empty sides have an inverted (negative-area) box; skip them
            if (leftCount[i] == 0 || rightCount[i] == 0)
                continue;

            float cost = TRAVERSAL_COST +
                INTERSECT_COST * (leftCount[i] * leftArea[i] +
                                  rightCount[i] * rightArea[i]) / std::max(parentArea, FLT_MIN);
            if (cost < bestCost)
            {
                bestCost = cost;
                bestAxis = axis;
                bestSplitPos = boundsMin + static_cast<float>(i + 1) / scale;
            }
        }
    }

    // If no split improves over leaf cost, keep as leaf
    float leafCost = static_cast<float>(node.count) * INTERSECT_COST;
    if (bestAxis == -1 || bestCost >= leafCost)
        return;

    // Partition primitive slots around the split position
    int left = static_cast<int>(node.index);
    int right = left + static_cast<int>(node.count) - 1;
    while (left <= right)
    {
        if (m_centroids[m_indices[left]][bestAxis] < bestSplitPos)
            left++;
        else
            std::swap(m_indices[left], m_indices[right--]);
    }

    uint32_t leftPrimCount = static_cast<uint32_t>(left) - node.index;
    if (leftPrimCount == 0 || leftPrimCount == node.count)
        return; // degenerate split, keep as leaf

    // Allocate child nodes (consecutive pair)
    uint32_t leftIdx = static_cast<uint32_t>(m_nodes.size());
    uint32_t rightIdx = leftIdx + 1;

    Node leftNode;
    leftNode.index = node.index;
    leftNode.count = leftPrimCount;

    Node rightNode;
    rightNode.index = static_cast<uint32_t>(left);
    rightNode.count = node.count - leftPrimCount;

    // Convert current node to internal
    node.index = leftIdx;
    node.count = 0;

    m_nodes.push_back(leftNode);
    m_nodes.push_back(rightNode);

    updateNodeBounds(leftIdx);
    updateNodeBounds(rightIdx);

    subdivide(leftIdx, depth + 1);
    subdivide(rightIdx, depth + 1);
}

uint32_t BVH::depth(uint32_t root) const
{
    if (root >= m_nodes.size())
        return 0;

    uint32_t maxDepth = 0;
    std::vector<std::pair<uint32_t, uint32_t>> stack;
    stack.emplace_back(root, 1u);
    while (!stack.empty())
    {
        auto [nodeIdx, d] = stack.back();
        stack.pop_back();
        maxDepth = std::max(maxDepth, d);

        const Node& node = m_nodes[nodeIdx];
        if (!node.isLeaf())
        {
            stack.emplace_back(node.leftChild(), d + 1);
            stack.emplace_back(node.rightChild(), d + 1);
        }
    }
    return maxDepth;
}

float BVH::sahCost(uint32_t root) const
{
    if (root >= m_nodes.size())
        return 0.0f;
    float rootArea = m_nodes[root].bounds.surfaceArea();
    if (rootArea <= 0.0f)
        return 0.0f;

    float cost = 0.0f;
    std::vector<uint32_t> stack{ root };
    while (!stack.empty())
    {
        const Node& n = m_nodes[stack.back()];
        stack.pop_back();
        if (n.isLeaf())
        {
            cost += n.bounds.surfaceArea() * static_cast<float>(n.count) * INTERSECT_COST;
        }
        else
        {
            cost += n.bounds.surfaceArea() * TRAVERSAL_COST;
            stack.push_back(n.leftChild());
            stack.push_back(n.rightChild());
        }
    }
    return cost / rootArea;
}

} // namespace prism
