#include <prism/raytracing/scene.h>
#include <prism/raytracing/intersect.h>
#include <prism/raytracing/traversal.h>

namespace prism
{

HitRecord Scene::trace(const Ray& ray) const
{
    HitRecord rec;
    RawHit best;
    float closest = NO_HIT;

    if (!m_tlas.empty())
    {
        traverseBVH(m_tlas.nodes().data(), 0, ray, closest, rec.aabbTests,
            [&](const BVH::Node& leaf, float& leafClosest)
            {
                for (uint32_t i = leaf.primitiveBegin(); i < leaf.primitiveEnd(); ++i)
                {
                    Ray localRay = transformRay(m_instances[i].worldToLocal, ray);
                    intersectBLAS(i, localRay, leafClosest, best, rec);
                }
            });
    }

    if (closest < NO_HIT)
    {
        resolveHit(ray, closest, best, rec);
        return rec;
    }

    // Environment miss
    rec.color = m_environment.sample(ray.direction);
    rec.flags |= HIT_FLAG_EMISSIVE;
    return rec;
}

void Scene::intersectBLAS(uint32_t instanceIndex, const Ray& localRay, float& closest,
                          RawHit& best, HitRecord& rec) const
{
    uint32_t root = m_instances[instanceIndex].blasRoot;
    if (root == BVH::INVALID_NODE)
        return;

    traverseBVH(m_blas.nodes().data(), root, localRay, closest, rec.aabbTests,
        [&](const BVH::Node& leaf, float& leafClosest)
        {
            for (uint32_t tri = leaf.primitiveBegin(); tri < leaf.primitiveEnd(); ++tri)
            {
                const glm::vec3& v0 = m_vertices[m_indices[tri * 3 + 0]].position;
                const glm::vec3& v1 = m_vertices[m_indices[tri * 3 + 1]].position;
                const glm::vec3& v2 = m_vertices[m_indices[tri * 3 + 2]].position;

                ++rec.triangleTests;
                TriangleHit h = intersectTriangle(localRay, v0, v1, v2);
                if (h.t < leafClosest)
                {
                    leafClosest = h.t;
                    best.u = h.u;
                    best.v = h.v;
                    best.instance = instanceIndex;
                    best.triangle = tri;
                }
            }
        });
}

void Scene::resolveHit(const Ray& ray, float t, const RawHit& raw, HitRecord& rec) const
{
    const Instance& inst = m_instances[raw.instance];
    const Vertex& a = m_vertices[m_indices[raw.triangle * 3 + 0]];
    const Vertex& b = m_vertices[m_indices[raw.triangle * 3 + 1]];
    const Vertex& c = m_vertices[m_indices[raw.triangle * 3 + 2]];

    float w = 1.0f - raw.u - raw.v;

    // Normals use the inverse transpose of localToWorld, which is the
    // transpose of worldToLocal
    glm::mat3 normalMatrix = glm::transpose(glm::mat3(inst.worldToLocal));
    glm::mat3 tangentMatrix(inst.localToWorld);

    glm::vec4 tangent = w * a.tangent + raw.u * b.tangent + raw.v * c.tangent;

    rec.t = t;
    rec.position = ray.origin + t * ray.direction;
    rec.normal = normalMatrix * (w * a.normal + raw.u * b.normal + raw.v * c.normal);
    rec.geometricNormal = normalMatrix * glm::cross(b.position - a.position, c.position - a.position);
    rec.tangent = tangentMatrix * glm::vec3(tangent);
    rec.bitangentSign = tangent.w < 0.0f ? -1.0f : 1.0f;
    rec.texcoord = w * a.texcoord() + raw.u * b.texcoord() + raw.v * c.texcoord();

    rec.color = inst.material.color;
    rec.roughness = inst.material.roughness;
    rec.metallic = inst.material.metallic;
    if (inst.material.isEmissive())
    {
        rec.color *= inst.material.emissive;
        rec.flags |= HIT_FLAG_EMISSIVE;
    }

    rec.instanceIndex = raw.instance;
    rec.triangleIndex = raw.triangle;
}

} // namespace prism
