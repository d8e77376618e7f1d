#pragma once

#include <glm/vec3.hpp>

#include "MeshSnapshot.hpp"

/**
 * @brief Reversible axis mapping between a host convention and an exchange convention.
 *
 * RH_Yup -> LH_Zup maps (x, y, z) to (x, -z, y); the inverse maps (x, y, z) to
 * (x, z, -y). Only permutes components and flips signs, so the mapping is exact.
 * Applies to positions and morph vectors only.
 */
class CoordinateTransform
{
public:
    CoordinateTransform(CoordinateConvention host, CoordinateConvention exchange) noexcept;

    [[nodiscard]] glm::vec3 toExchange(const glm::vec3& pos) const noexcept;
    [[nodiscard]] glm::vec3 toHost(const glm::vec3& pos) const noexcept;

    [[nodiscard]] bool identity() const noexcept
    {
        return m_host == m_exchange;
    }

    static glm::vec3 convert(const glm::vec3& pos, CoordinateConvention from, CoordinateConvention to) noexcept;

private:
    CoordinateConvention m_host;
    CoordinateConvention m_exchange;
};

/// Rewrites the positions and morph vectors of a snapshot into another convention.
void convertSnapshot(MeshSnapshot& snapshot, CoordinateConvention target) noexcept;
