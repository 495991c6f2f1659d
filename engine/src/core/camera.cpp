#include <prism/core/camera.h>
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace prism
{

void Camera::setOrbit(const glm::vec3& target, float distance, float yaw, float pitch)
{
    m_target = target;
    m_distance = distance;
    m_yaw = yaw;
    m_pitch = std::clamp(pitch, -1.5f, 1.5f);
}

glm::vec3 Camera::getPosition() const
{
    float x = m_distance * std::cos(m_pitch) * std::sin(m_yaw);
    float y = m_distance * std::sin(m_pitch);
    float z = m_distance * std::cos(m_pitch) * std::cos(m_yaw);
    return m_target + glm::vec3(x, y, z);
}

glm::mat4 Camera::getViewMatrix() const
{
    return glm::lookAt(getPosition(), m_target, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::mat4 Camera::getProjectionMatrix(float aspectRatio) const
{
    return glm::perspective(glm::radians(fov), aspectRatio, nearPlane, farPlane);
}

CameraData Camera::getCameraData(float aspectRatio) const
{
    CameraData data;
    data.worldToClip = getProjectionMatrix(aspectRatio) * getViewMatrix();
    data.clipToWorld = glm::inverse(data.worldToClip);
    return data;
}

} // namespace prism
