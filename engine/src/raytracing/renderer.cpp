#include <prism/raytracing/renderer.h>
#include <prism/core/log.h>
#include <prism/core/row_bands.h>

#include <stb_image_write.h>
#include <tinyexr.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace prism
{

Renderer::Renderer()
    : Renderer(RenderSettings{})
{
}

Renderer::Renderer(const RenderSettings& settings)
    : m_settings(settings)
{
    m_accumulator.setMode(m_settings.accumulation);
    m_accumulator.setEmaWeight(m_settings.emaWeight);
    ensureSampleTable();
}

// --- Setup ---

void Renderer::setScene(std::shared_ptr<const Scene> scene)
{
    m_scene = std::move(scene);
    if (!m_scene)
        Log::warn("Renderer has no scene; traceSample() will do nothing");
    reset();
}

void Renderer::setCamera(const CameraData& camera)
{
    if (m_camera.clipToWorld == camera.clipToWorld && m_camera.worldToClip == camera.worldToClip)
        return;
    m_camera = camera;
    reset();
}

void Renderer::resize(uint32_t width, uint32_t height)
{
    if (m_width == width && m_height == height)
        return;

    m_width = width;
    m_height = height;
    m_accumulator.resize(width, height);
    m_pixelBuffer.assign(static_cast<size_t>(width) * height * 4, 0);
    Log::info("Render target resized to " + std::to_string(width) + "x" + std::to_string(height));
}

void Renderer::reset()
{
    m_accumulator.reset();
    std::fill(m_pixelBuffer.begin(), m_pixelBuffer.end(), uint8_t(0));
}

void Renderer::ensureSampleTable()
{
    if (!m_sampleTable.empty() && m_settings.maxBounces <= m_sampleTable.getMaxBounces())
        return;

    m_sampleTable.build(m_settings.maxBounces);
    Log::info("Sample table built for " + std::to_string(m_settings.maxBounces) + " bounces, "
              + std::to_string(m_sampleTable.getSampleCount()) + " samples");
}

IntegratorSettings Renderer::integratorSettings() const
{
    IntegratorSettings s;
    s.maxBounces = m_settings.maxBounces;
    s.contributionFactor = m_settings.contributionFactor;
    s.enableThroughputCutoff = m_settings.enableThroughputCutoff;
    s.minThroughput = m_settings.minThroughput;
    return s;
}

// --- Settings (auto-reset on change) ---

void Renderer::setMaxBounces(uint32_t bounces)
{
    if (m_settings.maxBounces == bounces) return;
    m_settings.maxBounces = bounces;
    ensureSampleTable();
    reset();
}

void Renderer::setContributionFactor(float factor)
{
    if (m_settings.contributionFactor == factor) return;
    m_settings.contributionFactor = factor;
    reset();
}

void Renderer::setAccumulationMode(AccumulationMode mode)
{
    if (m_settings.accumulation == mode) return;
    m_settings.accumulation = mode;
    m_accumulator.setMode(mode);
    reset();
}

void Renderer::setEmaWeight(float weight)
{
    if (m_settings.emaWeight == weight) return;
    m_settings.emaWeight = weight;
    m_accumulator.setEmaWeight(weight);
    reset();
}

void Renderer::setEnableAA(bool v)
{
    if (m_settings.enableAA == v) return;
    m_settings.enableAA = v;
    reset();
}

void Renderer::setEnableThroughputCutoff(bool v)
{
    if (m_settings.enableThroughputCutoff == v) return;
    m_settings.enableThroughputCutoff = v;
    reset();
}

void Renderer::setMinThroughput(float v)
{
    if (m_settings.minThroughput == v) return;
    m_settings.minThroughput = v;
    reset();
}

void Renderer::setSamplerKind(SamplerKind kind)
{
    if (m_settings.sampler == kind) return;
    m_settings.sampler = kind;
    reset();
}

void Renderer::setExposure(float v)
{
    m_settings.exposure = v;
    updatePixelBuffer();
}

void Renderer::setGamma(float v)
{
    m_settings.gamma = v;
    updatePixelBuffer();
}

void Renderer::setEnableACES(bool v)
{
    m_settings.enableACES = v;
    updatePixelBuffer();
}

// --- Sample dispatch ---

void Renderer::traceSample()
{
    if (m_width == 0 || m_height == 0 || !m_scene)
        return;

    const Scene& scene = *m_scene;
    const IntegratorSettings integrator = integratorSettings();
    const uint32_t sampleIndex = m_accumulator.getSampleCount();
    const float weight = m_accumulator.beginSample();

    auto traceRows = [&](uint32_t startRow, uint32_t endRow)
    {
        for (uint32_t y = startRow; y < endRow; ++y)
        {
            for (uint32_t x = 0; x < m_width; ++x)
            {
                PixelSampler sampler(m_sampleTable, m_settings.sampler, x, y, sampleIndex);

                glm::vec2 jitter(0.5f);
                if (m_settings.enableAA)
                    jitter = glm::vec2(sampler.jitter());

                Ray ray = generatePrimaryRay(m_camera, x, y, jitter, m_width, m_height);
                glm::vec3 color = tracePath(scene, ray, sampler, integrator);

                // Non-finite samples would poison the running estimate
                if (!std::isfinite(color.r) || !std::isfinite(color.g) || !std::isfinite(color.b))
                    color = glm::vec3(0.0f);

                m_accumulator.merge(y * m_width + x, color, weight);
            }
        }
    };

    uint32_t threadCount = m_settings.threadCount > 0
        ? m_settings.threadCount
        : std::max(1u, std::thread::hardware_concurrency());
    dispatchRowBands(m_height, threadCount, traceRows);

    updatePixelBuffer();
}

// --- Display conversion ---

void Renderer::updatePixelBuffer()
{
    const auto& radiance = m_accumulator.getRadiance();
    if (radiance.empty() || m_pixelBuffer.size() != radiance.size() * 4)
        return;

    float exposureMul = std::pow(2.0f, m_settings.exposure);
    float invGamma = 1.0f / m_settings.gamma;
    for (size_t i = 0; i < radiance.size(); ++i)
    {
        glm::vec3 c = radiance[i] * exposureMul;

        if (m_settings.enableACES)
        {
            // ACES filmic tone mapping (Narkowicz fit)
            const float a = 2.51f, b = 0.03f, cc = 2.43f, d = 0.59f, e = 0.14f;
            c = glm::clamp((c * (a * c + b)) / (c * (cc * c + d) + e), 0.0f, 1.0f);
        }
        else
        {
            c = glm::clamp(c, 0.0f, 1.0f);
        }

        c = glm::pow(c, glm::vec3(invGamma));

        m_pixelBuffer[i * 4 + 0] = static_cast<uint8_t>(c.r * 255.0f + 0.5f);
        m_pixelBuffer[i * 4 + 1] = static_cast<uint8_t>(c.g * 255.0f + 0.5f);
        m_pixelBuffer[i * 4 + 2] = static_cast<uint8_t>(c.b * 255.0f + 0.5f);
        m_pixelBuffer[i * 4 + 3] = 255;
    }
}

// --- Output ---

bool Renderer::savePNG(const std::string& path) const
{
    if (m_pixelBuffer.empty())
    {
        Log::error("Nothing to save: render target is empty");
        return false;
    }

    int w = static_cast<int>(m_width);
    int h = static_cast<int>(m_height);
    if (stbi_write_png(path.c_str(), w, h, 4, m_pixelBuffer.data(), w * 4) == 0)
    {
        Log::error("Failed to write PNG: " + path);
        return false;
    }

    Log::info("Saved " + path);
    return true;
}

bool Renderer::saveEXR(const std::string& path) const
{
    const auto& radiance = getRadiance();
    if (radiance.empty())
    {
        Log::error("Nothing to save: render target is empty");
        return false;
    }

    std::vector<float> rgb(radiance.size() * 3);
    for (size_t i = 0; i < radiance.size(); ++i)
    {
        rgb[i * 3 + 0] = radiance[i].r;
        rgb[i * 3 + 1] = radiance[i].g;
        rgb[i * 3 + 2] = radiance[i].b;
    }

    const char* err = nullptr;
    int ret = SaveEXR(rgb.data(), static_cast<int>(m_width), static_cast<int>(m_height), 3,
                      0, path.c_str(), &err);
    if (ret != TINYEXR_SUCCESS)
    {
        std::string errMsg = err ? err : "unknown error";
        if (err)
            FreeEXRErrorMessage(err);
        Log::error("Failed to write EXR " + path + ": " + errMsg);
        return false;
    }

    Log::info("Saved " + path);
    return true;
}

} // namespace prism
