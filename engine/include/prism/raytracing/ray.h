#pragma once

#include <glm/glm.hpp>

namespace prism
{

struct Ray
{
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, 1.0f};
    glm::vec3 invDirection{0.0f, 0.0f, 1.0f}; // components may be +-inf

    Ray() = default;

    Ray(const glm::vec3& o, const glm::vec3& d)
        : origin(o), direction(d), invDirection(1.0f / d)
    {
    }

    glm::vec3 at(float t) const { return origin + t * direction; }
};

} // namespace prism
