#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <vector>

namespace prism
{

// Integer hash (pcg4d, Jarzynski & Olano 2020). Two rounds of multiply-add,
// cross-lane mixing and shift diffusion.
glm::uvec4 pcg4d(glm::uvec4 v);

// Maps 32 random bits to [0,1) by placing the top 23 bits in the mantissa
// of a float in [1,2).
inline float toUnitFloat(uint32_t x)
{
    return glm::uintBitsToFloat((x >> 9) | 0x3f800000u) - 1.0f;
}

inline glm::vec4 toUnitFloat(const glm::uvec4& v)
{
    return glm::vec4(toUnitFloat(v.x), toUnitFloat(v.y), toUnitFloat(v.z), toUnitFloat(v.w));
}

// Precomputed quasi-random sequence. Each row belongs to one sample index
// and holds one 4D slot for the primary jitter followed by two slots per
// bounce. Slots are 4D Sobol points with hash-based Owen scrambling and an
// independent index shuffle per slot.
class SobolTable
{
public:
    static constexpr uint32_t DEFAULT_SAMPLE_COUNT = 4096;

    // Slot layout within a row
    static constexpr uint32_t JITTER_SLOT = 0;
    static uint32_t bounceSlot(uint32_t bounce, uint32_t which) { return 1 + 2 * bounce + which; }

    // sampleCount is rounded up to a power of two; sample indices wrap.
    void build(uint32_t maxBounces, uint32_t sampleCount = DEFAULT_SAMPLE_COUNT, uint32_t seed = 0);

    bool empty() const { return m_values.empty(); }
    uint32_t getMaxBounces() const { return m_maxBounces; }
    uint32_t getSampleCount() const { return m_sampleCount; }
    uint32_t getSlotsPerRow() const { return m_slotsPerRow; }

    const glm::vec4& at(uint32_t sampleIndex, uint32_t slot) const
    {
        return m_values[static_cast<size_t>(sampleIndex & (m_sampleCount - 1)) * m_slotsPerRow + slot];
    }

    // Unscrambled 32-bit Sobol coordinate for dimensions 0..3.
    static uint32_t sobol(uint32_t index, uint32_t dimension);

    // Hash-based Owen scramble (Burley 2020).
    static uint32_t nestedUniformScramble(uint32_t x, uint32_t seed);

private:
    std::vector<glm::vec4> m_values;
    uint32_t m_maxBounces = 0;
    uint32_t m_sampleCount = 0;
    uint32_t m_slotsPerRow = 0;
};

enum class SamplerKind
{
    QuasiRandom, // Sobol table + per-pixel Cranley-Patterson rotation
    Random       // pcg4d hash of pixel, sample index and slot
};

// Per-pixel, per-sample view of the sampling engine. Cheap to construct;
// one lives on the stack of each pixel's path.
class PixelSampler
{
public:
    PixelSampler(const SobolTable& table, SamplerKind kind,
                 uint32_t x, uint32_t y, uint32_t sampleIndex)
        : m_table(table), m_kind(kind), m_x(x), m_y(y), m_sampleIndex(sampleIndex)
    {
    }

    glm::vec4 get(uint32_t slot) const;

    glm::vec4 jitter() const { return get(SobolTable::JITTER_SLOT); }
    glm::vec4 bounce(uint32_t bounce, uint32_t which) const
    {
        return get(SobolTable::bounceSlot(bounce, which));
    }

    // Cranley-Patterson shift for a slot; constant within one pass over the table.
    glm::vec4 pixelShift(uint32_t slot) const;

private:
    const SobolTable& m_table;
    SamplerKind m_kind;
    uint32_t m_x, m_y;
    uint32_t m_sampleIndex;
};

} // namespace prism
