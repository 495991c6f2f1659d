#include <prism/raytracing/environment.h>
#include <prism/core/log.h>

#include <stb_image.h>
#include <tinyexr.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <utility>

namespace prism
{

namespace
{

// RGB float pixels, row 0 at the top
bool loadFace(const std::filesystem::path& path, std::vector<float>& rgb, int& w, int& h)
{
    if (path.extension() == ".exr")
    {
        float* rgba = nullptr;
        const char* err = nullptr;
        if (LoadEXR(&rgba, &w, &h, path.string().c_str(), &err) != TINYEXR_SUCCESS)
        {
            std::string errMsg = err ? err : "unknown error";
            if (err)
                FreeEXRErrorMessage(err);
            Log::error("Failed to load cubemap face " + path.string() + ": " + errMsg);
            return false;
        }

        size_t count = static_cast<size_t>(w) * h;
        rgb.resize(count * 3);
        for (size_t p = 0; p < count; ++p)
        {
            rgb[p * 3 + 0] = rgba[p * 4 + 0];
            rgb[p * 3 + 1] = rgba[p * 4 + 1];
            rgb[p * 3 + 2] = rgba[p * 4 + 2];
        }
        free(rgba);
        return true;
    }

    int channels;
    float* data = stbi_loadf(path.string().c_str(), &w, &h, &channels, 3);
    if (!data)
    {
        Log::error("Failed to load cubemap face " + path.string() + ": " + stbi_failure_reason());
        return false;
    }

    rgb.assign(data, data + static_cast<size_t>(w) * h * 3);
    stbi_image_free(data);
    return true;
}

} // namespace

bool EnvironmentMap::setCubemap(std::array<std::vector<float>, FaceCount> faces, int size)
{
    if (size <= 0)
    {
        Log::error("Cubemap face size must be positive");
        return false;
    }

    size_t expected = static_cast<size_t>(size) * size * 3;
    for (int i = 0; i < FaceCount; ++i)
    {
        if (faces[i].size() != expected)
        {
            Log::error("Cubemap face " + std::to_string(i) + " has "
                       + std::to_string(faces[i].size()) + " floats, expected "
                       + std::to_string(expected));
            return false;
        }
    }

    m_faces = std::move(faces);
    m_faceSize = size;
    return true;
}

bool EnvironmentMap::loadCubemap(const std::string& directory)
{
    static constexpr const char* faceNames[FaceCount] = { "px", "nx", "py", "ny", "pz", "nz" };
    static constexpr const char* extensions[] = { ".exr", ".hdr", ".png", ".jpg" };

    std::array<std::vector<float>, FaceCount> faces;
    int faceSize = 0;

    for (int i = 0; i < FaceCount; ++i)
    {
        std::filesystem::path facePath;
        for (const char* ext : extensions)
        {
            std::filesystem::path candidate = std::filesystem::path(directory) / (std::string(faceNames[i]) + ext);
            if (std::filesystem::exists(candidate))
            {
                facePath = candidate;
                break;
            }
        }

        if (facePath.empty())
        {
            Log::error("Cubemap face '" + std::string(faceNames[i]) + "' not found in " + directory);
            return false;
        }

        int w = 0, h = 0;
        if (!loadFace(facePath, faces[i], w, h))
            return false;

        if (w != h || (faceSize != 0 && w != faceSize))
        {
            Log::error("Cubemap face " + facePath.string() + " is " + std::to_string(w) + "x"
                       + std::to_string(h) + "; faces must be square and equally sized");
            return false;
        }

        faceSize = w;
    }

    if (!setCubemap(std::move(faces), faceSize))
        return false;

    Log::info("Loaded cubemap " + directory + " (" + std::to_string(faceSize) + "px faces)");
    return true;
}

void EnvironmentMap::clearCubemap()
{
    for (auto& face : m_faces)
        face.clear();
    m_faceSize = 0;
}

EnvironmentMap::Face EnvironmentMap::faceForDirection(const glm::vec3& d, glm::vec2& uv)
{
    glm::vec3 a = glm::abs(d);
    Face face;
    float sc, tc, ma;

    if (a.x >= a.y && a.x >= a.z)
    {
        face = d.x >= 0.0f ? PositiveX : NegativeX;
        sc = d.x >= 0.0f ? -d.z : d.z;
        tc = -d.y;
        ma = a.x;
    }
    else if (a.y >= a.z)
    {
        face = d.y >= 0.0f ? PositiveY : NegativeY;
        sc = d.x;
        tc = d.y >= 0.0f ? d.z : -d.z;
        ma = a.y;
    }
    else
    {
        face = d.z >= 0.0f ? PositiveZ : NegativeZ;
        sc = d.z >= 0.0f ? d.x : -d.x;
        tc = -d.y;
        ma = a.z;
    }

    uv = glm::vec2(0.5f * (sc / ma + 1.0f), 0.5f * (tc / ma + 1.0f));
    return face;
}

glm::vec3 EnvironmentMap::sample(const glm::vec3& direction) const
{
    if (!hasCubemap())
        return m_color;

    // Zero or non-finite directions have no face
    if (!std::isfinite(direction.x) || !std::isfinite(direction.y) || !std::isfinite(direction.z))
        return m_color;
    if (std::max({ std::abs(direction.x), std::abs(direction.y), std::abs(direction.z) }) <= 0.0f)
        return m_color;

    glm::vec2 uv;
    Face face = faceForDirection(direction, uv);

    int px = std::clamp(static_cast<int>(uv.x * m_faceSize), 0, m_faceSize - 1);
    int py = std::clamp(static_cast<int>(uv.y * m_faceSize), 0, m_faceSize - 1);
    size_t idx = (static_cast<size_t>(py) * m_faceSize + px) * 3;

    const auto& pixels = m_faces[face];
    return glm::vec3(pixels[idx], pixels[idx + 1], pixels[idx + 2]);
}

} // namespace prism
