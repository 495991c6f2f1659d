#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace prism
{

enum class AccumulationMode
{
    RunningMean,       // weight = 1 / n
    ExponentialAverage // weight = max(1 / n, emaWeight)
};

// Progressive per-pixel radiance estimate: new = mix(old, sample, weight).
// The sample count is shared by the whole image; each dispatch calls
// beginSample() once and then merge() once per pixel.
class Accumulator
{
public:
    void resize(uint32_t width, uint32_t height);
    void reset();

    void setMode(AccumulationMode mode) { m_mode = mode; }
    AccumulationMode getMode() const { return m_mode; }

    void setEmaWeight(float weight) { m_emaWeight = weight; }
    float getEmaWeight() const { return m_emaWeight; }

    // Advances the sample count and returns the merge weight for this dispatch.
    float beginSample();

    // Safe to call concurrently for distinct pixels.
    void merge(uint32_t pixelIndex, const glm::vec3& sample, float weight)
    {
        m_radiance[pixelIndex] = glm::mix(m_radiance[pixelIndex], sample, weight);
    }

    const std::vector<glm::vec3>& getRadiance() const { return m_radiance; }
    uint32_t getSampleCount() const { return m_sampleCount; }
    uint32_t getWidth() const { return m_width; }
    uint32_t getHeight() const { return m_height; }

private:
    std::vector<glm::vec3> m_radiance;
    uint32_t m_width = 0, m_height = 0;
    uint32_t m_sampleCount = 0;

    AccumulationMode m_mode = AccumulationMode::RunningMean;
    float m_emaWeight = 0.1f;
};

} // namespace prism
