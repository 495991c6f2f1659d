#include "app.h"

#include <prism/core/log.h>
#include <prism/scene/mesh_data.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>

bool App::init(const AppConfig& config)
{
    m_config = config;

    if (m_config.width == 0 || m_config.height == 0)
    {
        prism::Log::error("Render size must be non-zero");
        return false;
    }

    m_renderer = prism::Renderer(m_config.render);

    if (!loadScene())
        return false;

    auto scene = m_builder.build();
    m_renderer.resize(m_config.width, m_config.height);
    m_renderer.setScene(scene);

    frameCamera(scene->getBounds());
    float aspect = static_cast<float>(m_config.width) / static_cast<float>(m_config.height);
    m_renderer.setCamera(m_camera.getCameraData(aspect));

    return true;
}

bool App::loadScene()
{
    for (const auto& path : m_config.objPaths)
    {
        std::vector<prism::MeshData> meshes = prism::MeshData::loadOBJ(path);
        if (meshes.empty())
        {
            prism::Log::error("No geometry loaded from " + path);
            return false;
        }

        for (auto& mesh : meshes)
        {
            uint32_t id = m_builder.addMesh(std::move(mesh));
            if (id != prism::SceneBuilder::INVALID_MESH)
                m_builder.addInstance(id, glm::mat4(1.0f));
        }
    }

    if (m_config.addSphere)
    {
        prism::Material mirror;
        mirror.color = glm::vec3(0.95f);
        mirror.roughness = 0.0f;
        mirror.metallic = 1.0f;

        uint32_t id = m_builder.addMesh(prism::MeshData::createUVSphere(1.0f, 64, 32));
        if (!m_builder.addInstance(id, glm::mat4(1.0f), mirror))
            return false;
    }

    prism::EnvironmentMap& env = m_builder.getEnvironment();
    if (m_config.envColor)
        env.setColor(*m_config.envColor);
    else
        env.setColor(glm::vec3(1.0f));

    if (!m_config.envmapDir.empty() && !env.loadCubemap(m_config.envmapDir))
        return false;

    return true;
}

void App::frameCamera(const prism::AABB& bounds)
{
    if (!bounds.valid())
    {
        m_camera.setOrbit(glm::vec3(0.0f), 4.0f, 0.0f, 0.0f);
        return;
    }

    glm::vec3 center = bounds.centroid();
    float radius = 0.5f * glm::length(bounds.max - bounds.min);
    float halfFov = glm::radians(m_camera.fov) * 0.5f;
    float distance = std::max(radius / std::sin(halfFov), 0.1f) * 1.1f;

    m_camera.setOrbit(center, distance, 0.0f, 0.2f);
    m_camera.farPlane = std::max(m_camera.farPlane, distance + 2.0f * radius);
}

void App::run()
{
    auto start = std::chrono::steady_clock::now();
    uint32_t reportEvery = std::max(1u, m_config.samples / 8);

    for (uint32_t s = 0; s < m_config.samples; ++s)
    {
        m_renderer.traceSample();

        uint32_t done = m_renderer.getSampleCount();
        if (done % reportEvery == 0 || done == m_config.samples)
        {
            float secs = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
            char msg[96];
            std::snprintf(msg, sizeof(msg), "Sample %u/%u (%.2f s)", done, m_config.samples, secs);
            prism::Log::info(msg);
        }
    }
}

bool App::shutdown()
{
    bool ok = true;

    if (!m_config.outputPNG.empty())
        ok = m_renderer.savePNG(m_config.outputPNG) && ok;

    if (!m_config.outputEXR.empty())
        ok = m_renderer.saveEXR(m_config.outputEXR) && ok;

    return ok;
}
