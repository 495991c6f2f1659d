#pragma once

#include <prism/core/camera.h>
#include <prism/raytracing/accumulator.h>
#include <prism/raytracing/integrator.h>
#include <prism/raytracing/sampler.h>
#include <prism/raytracing/scene.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace prism
{

struct RenderSettings
{
    uint32_t maxBounces = 8;
    float contributionFactor = 100.0f;
    AccumulationMode accumulation = AccumulationMode::RunningMean;
    float emaWeight = 0.1f;
    bool enableAA = true;
    bool enableThroughputCutoff = false;
    float minThroughput = 1e-3f;
    SamplerKind sampler = SamplerKind::QuasiRandom;

    // Display conversion
    float exposure = 0.0f; // EV
    float gamma = 2.2f;
    bool enableACES = true;

    uint32_t threadCount = 0; // 0 = hardware concurrency
};

// Progressive path tracer. Each traceSample() adds one sample per pixel,
// split over worker threads by bands of rows.
class Renderer
{
public:
    Renderer();
    explicit Renderer(const RenderSettings& settings);

    void setScene(std::shared_ptr<const Scene> scene);
    const std::shared_ptr<const Scene>& getScene() const { return m_scene; }

    void setCamera(const CameraData& camera);
    const CameraData& getCamera() const { return m_camera; }

    void resize(uint32_t width, uint32_t height);
    void reset();
    void traceSample();

    const std::vector<glm::vec3>& getRadiance() const { return m_accumulator.getRadiance(); }
    const std::vector<uint8_t>& getPixelBuffer() const { return m_pixelBuffer; }

    uint32_t getSampleCount() const { return m_accumulator.getSampleCount(); }
    uint32_t getWidth()  const { return m_width; }
    uint32_t getHeight() const { return m_height; }

    const RenderSettings& getSettings() const { return m_settings; }
    const SobolTable& getSampleTable() const { return m_sampleTable; }

    // Settings (each resets accumulation when changed)
    void setMaxBounces(uint32_t bounces);
    void setContributionFactor(float factor);
    void setAccumulationMode(AccumulationMode mode);
    void setEmaWeight(float weight);
    void setEnableAA(bool v);
    void setEnableThroughputCutoff(bool v);
    void setMinThroughput(float v);
    void setSamplerKind(SamplerKind kind);
    void setThreadCount(uint32_t count) { m_settings.threadCount = count; }

    // Display settings only re-run the tonemap
    void setExposure(float v);
    void setGamma(float v);
    void setEnableACES(bool v);

    bool savePNG(const std::string& path) const;
    bool saveEXR(const std::string& path) const;

private:
    void ensureSampleTable();
    void updatePixelBuffer();
    IntegratorSettings integratorSettings() const;

    std::shared_ptr<const Scene> m_scene;
    CameraData m_camera;
    RenderSettings m_settings;

    SobolTable m_sampleTable;
    Accumulator m_accumulator;
    std::vector<uint8_t> m_pixelBuffer;
    uint32_t m_width = 0, m_height = 0;
};

} // namespace prism
