#include <prism/raytracing/sampler.h>

#include <algorithm>
#include <array>

namespace prism
{

glm::uvec4 pcg4d(glm::uvec4 v)
{
    v = v * 1664525u + 1013904223u;

    v.x += v.y * v.w;
    v.y += v.z * v.x;
    v.z += v.x * v.y;
    v.w += v.y * v.z;

    v ^= v >> 16u;

    v.x += v.y * v.w;
    v.y += v.z * v.x;
    v.z += v.x * v.y;
    v.w += v.y * v.z;

    return v;
}

// --- Sobol ---

namespace
{

struct SobolPolynomial
{
    uint32_t degree;
    uint32_t coefficients;
    std::array<uint32_t, 3> initial;
};

// Joe & Kuo parameters for dimensions 1..3 (dimension 0 is van der Corput)
constexpr SobolPolynomial s_polynomials[3] = {
    { 1, 0, { 1, 0, 0 } },
    { 2, 1, { 1, 3, 0 } },
    { 3, 1, { 1, 3, 1 } },
};

using DirectionTable = std::array<std::array<uint32_t, 32>, 4>;

DirectionTable makeDirections()
{
    DirectionTable dirs{};

    for (uint32_t k = 0; k < 32; ++k)
        dirs[0][k] = 1u << (31 - k);

    for (uint32_t d = 1; d < 4; ++d)
    {
        const SobolPolynomial& poly = s_polynomials[d - 1];
        uint32_t s = poly.degree;
        auto& v = dirs[d];

        for (uint32_t k = 0; k < s; ++k)
            v[k] = poly.initial[k] << (31 - k);

        for (uint32_t k = s; k < 32; ++k)
        {
            v[k] = v[k - s] ^ (v[k - s] >> s);
            for (uint32_t i = 1; i < s; ++i)
            {
                if ((poly.coefficients >> (s - 1 - i)) & 1u)
                    v[k] ^= v[k - i];
            }
        }
    }

    return dirs;
}

const DirectionTable& directions()
{
    static const DirectionTable table = makeDirections();
    return table;
}

uint32_t reverseBits(uint32_t x)
{
    x = ((x >> 1) & 0x55555555u) | ((x & 0x55555555u) << 1);
    x = ((x >> 2) & 0x33333333u) | ((x & 0x33333333u) << 2);
    x = ((x >> 4) & 0x0f0f0f0fu) | ((x & 0x0f0f0f0fu) << 4);
    x = ((x >> 8) & 0x00ff00ffu) | ((x & 0x00ff00ffu) << 8);
    return (x >> 16) | (x << 16);
}

uint32_t laineKarrasPermutation(uint32_t x, uint32_t seed)
{
    x += seed;
    x ^= x * 0x6c50b47cu;
    x ^= x * 0xb82f1e52u;
    x ^= x * 0xc7afe638u;
    x ^= x * 0x8d22f6e6u;
    return x;
}

uint32_t hashCombine(uint32_t seed, uint32_t v)
{
    return seed ^ (v + (seed << 6) + (seed >> 2));
}

uint32_t roundUpPow2(uint32_t x)
{
    uint32_t p = 1;
    while (p < x && p < (1u << 31))
        p <<= 1;
    return p;
}

} // namespace

uint32_t SobolTable::sobol(uint32_t index, uint32_t dimension)
{
    const auto& v = directions()[dimension];
    uint32_t x = 0;
    for (uint32_t bit = 0; index != 0; ++bit, index >>= 1)
    {
        if (index & 1u)
            x ^= v[bit];
    }
    return x;
}

uint32_t SobolTable::nestedUniformScramble(uint32_t x, uint32_t seed)
{
    x = reverseBits(x);
    x = laineKarrasPermutation(x, seed);
    return reverseBits(x);
}

void SobolTable::build(uint32_t maxBounces, uint32_t sampleCount, uint32_t seed)
{
    m_maxBounces = maxBounces;
    m_sampleCount = roundUpPow2(std::max(sampleCount, 1u));
    m_slotsPerRow = 1 + 2 * maxBounces;
    m_values.resize(static_cast<size_t>(m_sampleCount) * m_slotsPerRow);

    for (uint32_t slot = 0; slot < m_slotsPerRow; ++slot)
    {
        uint32_t slotSeed = pcg4d(glm::uvec4(slot, seed, 0x9e3779b9u, 0u)).x;

        for (uint32_t i = 0; i < m_sampleCount; ++i)
        {
            // Shuffling the index decorrelates slots from each other
            uint32_t index = nestedUniformScramble(i, slotSeed);

            glm::uvec4 bits;
            for (uint32_t d = 0; d < 4; ++d)
                bits[d] = nestedUniformScramble(sobol(index, d), hashCombine(slotSeed, d + 1));

            m_values[static_cast<size_t>(i) * m_slotsPerRow + slot] = toUnitFloat(bits);
        }
    }
}

// --- PixelSampler ---

glm::vec4 PixelSampler::pixelShift(uint32_t slot) const
{
    // A fresh shift per pass over the table keeps wrapped indices from
    // replaying earlier samples
    uint32_t epoch = m_sampleIndex / std::max(m_table.getSampleCount(), 1u);
    return toUnitFloat(pcg4d(glm::uvec4(m_x, m_y, slot, epoch ^ 0x85ebca6bu)));
}

glm::vec4 PixelSampler::get(uint32_t slot) const
{
    if (m_kind == SamplerKind::Random)
        return toUnitFloat(pcg4d(glm::uvec4(m_x, m_y, m_sampleIndex, slot)));

    return glm::fract(m_table.at(m_sampleIndex, slot) + pixelShift(slot));
}

} // namespace prism
