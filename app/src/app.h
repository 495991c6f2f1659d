#pragma once

#include <prism/core/camera.h>
#include <prism/raytracing/renderer.h>
#include <prism/scene/scene_builder.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct AppConfig
{
    std::vector<std::string> objPaths;
    bool addSphere = false;
    std::string envmapDir;
    std::optional<glm::vec3> envColor;

    uint32_t width = 640;
    uint32_t height = 360;
    uint32_t samples = 64;

    prism::RenderSettings render;

    std::string outputPNG = "render.png";
    std::string outputEXR;
};

struct App
{
    bool init(const AppConfig& config);
    void run();
    bool shutdown();

private:
    bool loadScene();
    void frameCamera(const prism::AABB& bounds);

    AppConfig           m_config;
    prism::SceneBuilder m_builder;
    prism::Camera       m_camera;
    prism::Renderer     m_renderer;
};
