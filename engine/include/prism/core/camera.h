#pragma once

#include <glm/glm.hpp>

namespace prism
{

// Matrices consumed by ray generation. Ray origin and direction are derived
// from clipToWorld alone; worldToClip is kept for projecting world points.
struct CameraData
{
    glm::mat4 worldToClip{1.0f};
    glm::mat4 clipToWorld{1.0f};
};

class Camera
{
public:
    void setOrbit(const glm::vec3& target, float distance, float yaw, float pitch);

    glm::mat4 getViewMatrix() const;
    glm::mat4 getProjectionMatrix(float aspectRatio) const;
    glm::vec3 getPosition() const;

    CameraData getCameraData(float aspectRatio) const;

    const glm::vec3& getTarget() const { return m_target; }
    float getDistance() const { return m_distance; }

    float fov = 45.0f;
    float nearPlane = 0.01f;
    float farPlane = 1000.0f;

private:
    glm::vec3 m_target = { 0.0f, 0.0f, 0.0f };
    float m_distance = 4.0f;
    float m_yaw = 0.0f;
    float m_pitch = 0.0f;
};

} // namespace prism
