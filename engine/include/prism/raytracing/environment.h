#pragma once

#include <glm/glm.hpp>

#include <array>
#include <string>
#include <vector>

namespace prism
{

// Radiance seen by rays that leave the scene. Either a solid color or a
// cubemap with six square RGB float faces (OpenGL face orientation).
class EnvironmentMap
{
public:
    enum Face
    {
        PositiveX = 0,
        NegativeX,
        PositiveY,
        NegativeY,
        PositiveZ,
        NegativeZ,
        FaceCount
    };

    void setColor(const glm::vec3& color) { m_color = color; }
    const glm::vec3& getColor() const { return m_color; }

    // faces[i] holds size * size * 3 floats, row 0 at the top.
    bool setCubemap(std::array<std::vector<float>, FaceCount> faces, int size);

    // Loads px/nx/py/ny/pz/nz.{exr,hdr,png,jpg} from a directory.
    bool loadCubemap(const std::string& directory);

    void clearCubemap();
    bool hasCubemap() const { return m_faceSize > 0; }
    int getFaceSize() const { return m_faceSize; }

    glm::vec3 sample(const glm::vec3& direction) const;

    // Major-axis face lookup; uv in [0,1]^2.
    static Face faceForDirection(const glm::vec3& direction, glm::vec2& uv);

private:
    glm::vec3 m_color{0.0f};
    std::array<std::vector<float>, FaceCount> m_faces;
    int m_faceSize = 0;
};

} // namespace prism
