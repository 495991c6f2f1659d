#include <prism/raytracing/accumulator.h>

#include <algorithm>

namespace prism
{

void Accumulator::resize(uint32_t width, uint32_t height)
{
    m_width = width;
    m_height = height;
    m_radiance.assign(static_cast<size_t>(width) * height, glm::vec3(0.0f));
    m_sampleCount = 0;
}

void Accumulator::reset()
{
    std::fill(m_radiance.begin(), m_radiance.end(), glm::vec3(0.0f));
    m_sampleCount = 0;
}

float Accumulator::beginSample()
{
    ++m_sampleCount;
    float weight = 1.0f / static_cast<float>(m_sampleCount);

    if (m_mode == AccumulationMode::ExponentialAverage)
        weight = std::max(weight, m_emaWeight);

    return weight;
}

} // namespace prism
