#pragma once

#include <array>
#include <cstdint>
#include <glm/vec3.hpp>
#include <span>
#include <vector>

/// Shape class of a polygon loop, judged in its best-fit plane.
enum class PolygonShape : uint8_t
{
    Convex,
    Concave,
    SelfIntersecting,
    Degenerate ///< Zero area; all points collinear or coincident.
};

using Triangle = std::array<int32_t, 3>;

namespace tri
{
    /// @return The shape of the loop. Triangles are Convex unless degenerate.
    PolygonShape classify(std::span<const glm::vec3> points);

    /// @return True for loops that must be split before export.
    inline bool irregular(PolygonShape shape) noexcept
    {
        return shape == PolygonShape::Concave || shape == PolygonShape::SelfIntersecting;
    }

    /**
     * @brief Ear clipping in the loop's best-fit plane.
     *
     * Triangles hold corner indices into @p points and keep the loop's winding.
     * When no ear can be found (self-intersecting input) the remainder is fanned.
     * @return points.size() - 2 triangles.
     */
    std::vector<Triangle> triangulate(std::span<const glm::vec3> points);
} // namespace tri
