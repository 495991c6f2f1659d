#pragma once

#include <glm/glm.hpp>

#include <algorithm>
#include <cfloat>
#include <cstdint>
#include <vector>

namespace prism
{

struct AABB
{
    glm::vec3 min{FLT_MAX, FLT_MAX, FLT_MAX};
    glm::vec3 max{-FLT_MAX, -FLT_MAX, -FLT_MAX};

    void grow(const glm::vec3& p)
    {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    void grow(const AABB& other)
    {
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    bool valid() const
    {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    float surfaceArea() const
    {
        glm::vec3 d = max - min;
        return 2.0f * (d.x * d.y + d.y * d.z + d.x * d.z);
    }

    glm::vec3 centroid() const
    {
        return (min + max) * 0.5f;
    }

    // Bounds of this box after an affine transform (all 8 corners).
    AABB transformed(const glm::mat4& m) const;
};

// Binary BVH over an indexed primitive set. Several trees may share one node
// array (one BLAS per mesh); each append() returns the new tree's root index.
//
// Node encoding: count > 0 marks a leaf covering primitive slots
// [index, index + count). Internal nodes have count == 0 and their two
// children stored contiguously at index and index + 1.
class BVH
{
public:
    struct Node
    {
        AABB bounds;
        uint32_t index = 0; // internal: left child index; leaf: first primitive slot
        uint32_t count = 0; // 0 = internal node, >0 = leaf

        bool isLeaf() const { return count > 0; }
        uint32_t leftChild() const { return index; }
        uint32_t rightChild() const { return index + 1; }
        uint32_t primitiveBegin() const { return index; }
        uint32_t primitiveEnd() const { return index + count; }
    };

    static constexpr uint32_t INVALID_NODE = UINT32_MAX;

    // Depth bound enforced by the builder. Traversal stacks must hold more
    // than MAX_DEPTH + 1 entries.
    static constexpr uint32_t MAX_DEPTH = 32;

    void clear();

    // Build a single tree over all primitives; root ends up at index 0.
    void build(const std::vector<AABB>& primBounds);

    // Build a tree over primitives [first, first + count) of primBounds and
    // append it to the node array. Primitive slots in that range are
    // permuted; see indices(). Returns INVALID_NODE when count is zero.
    uint32_t append(const std::vector<AABB>& primBounds, uint32_t first, uint32_t count);

    const std::vector<Node>& nodes() const { return m_nodes; }

    // indices()[slot] = original primitive index stored in that slot.
    const std::vector<uint32_t>& indices() const { return m_indices; }
    bool empty() const { return m_nodes.empty(); }

    uint32_t nodeCount() const { return static_cast<uint32_t>(m_nodes.size()); }

    size_t memoryBytes() const
    {
        return m_nodes.capacity() * sizeof(Node) + m_indices.capacity() * sizeof(uint32_t);
    }

    AABB rootAABB(uint32_t root = 0) const
    {
        return root < m_nodes.size() ? m_nodes[root].bounds : AABB{};
    }

    // Number of nodes on the longest root-to-leaf path (a lone leaf has depth 1).
    uint32_t depth(uint32_t root = 0) const;

    float sahCost(uint32_t root = 0) const;

private:
    static constexpr uint32_t SAH_BINS = 12;
    static constexpr float TRAVERSAL_COST = 1.0f;
    static constexpr float INTERSECT_COST = 1.0f;

    void updateNodeBounds(uint32_t nodeIdx);
    void subdivide(uint32_t nodeIdx, uint32_t depth);

    std::vector<Node> m_nodes;
    std::vector<uint32_t> m_indices;

    // Temporary build data (valid during append only)
    const std::vector<AABB>* m_primBounds = nullptr;
    std::vector<glm::vec3> m_centroids;
};

} // namespace prism
