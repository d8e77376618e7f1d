#include "PolygonTriangulator.hpp"

#include <algorithm>
#include <cmath>
#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

namespace
{
    struct Projection
    {
        std::vector<glm::vec2> points;
        float                  eps = 0.f;
        bool                   degenerate = false;
    };

    // Newell normal; for loops whose signed areas cancel (bow ties) fall back
    // to the largest corner cross product.
    glm::vec3 bestFitNormal(std::span<const glm::vec3> points)
    {
        glm::vec3    n{0.f};
        const size_t count = points.size();
        for (size_t i = 0; i < count; ++i)
        {
            const glm::vec3& a = points[i];
            const glm::vec3& b = points[(i + 1) % count];
            n.x += (a.y - b.y) * (a.z + b.z);
            n.y += (a.z - b.z) * (a.x + b.x);
            n.z += (a.x - b.x) * (a.y + b.y);
        }

        float extent = 0.f;
        for (const glm::vec3& p : points)
            extent = std::max(extent, glm::length(p - points[0]));

        const float areaEps = 1e-7f * extent * extent;
        if (glm::length(n) > areaEps)
            return n;

        glm::vec3 best{0.f};
        for (size_t i = 1; i + 1 < count; ++i)
        {
            const glm::vec3 c = glm::cross(points[i] - points[0], points[i + 1] - points[0]);
            if (glm::length(c) > glm::length(best))
                best = c;
        }
        return glm::length(best) > areaEps ? best : glm::vec3(0.f);
    }

    Projection project(std::span<const glm::vec3> points)
    {
        Projection proj;

        const glm::vec3 n = bestFitNormal(points);
        if (n == glm::vec3(0.f))
        {
            proj.degenerate = true;
            return proj;
        }

        // Drop the dominant axis; the remaining pair is ordered so a positive
        // normal component yields counter-clockwise 2D winding.
        const glm::vec3 an   = glm::abs(n);
        int             axis = 2;
        if (an.x >= an.y && an.x >= an.z)
            axis = 0;
        else if (an.y >= an.z)
            axis = 1;

        const float flip = n[axis] < 0.f ? -1.f : 1.f;

        float extent = 0.f;
        proj.points.reserve(points.size());
        for (const glm::vec3& p : points)
        {
            glm::vec2 q;
            switch (axis)
            {
                case 0:
                    q = {p.y, p.z};
                    break;
                case 1:
                    q = {p.z, p.x};
                    break;
                default:
                    q = {p.x, p.y};
                    break;
            }
            q.x *= flip;
            proj.points.push_back(q);
            extent = std::max(extent, glm::length(q - proj.points.front()));
        }

        proj.eps = 1e-7f * extent * extent;
        return proj;
    }

    float cross2(const glm::vec2& a, const glm::vec2& b, const glm::vec2& c) noexcept
    {
        return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
    }

    bool onSegment(const glm::vec2& a, const glm::vec2& b, const glm::vec2& p) noexcept
    {
        return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x) && std::min(a.y, b.y) <= p.y &&
               p.y <= std::max(a.y, b.y);
    }

    int sign(float v, float eps) noexcept
    {
        return v > eps ? 1 : (v < -eps ? -1 : 0);
    }

    // Closed segment intersection: touching and collinear overlap count.
    bool segmentsIntersect(const glm::vec2& p1, const glm::vec2& p2, const glm::vec2& q1, const glm::vec2& q2, float eps)
    {
        const int d1 = sign(cross2(q1, q2, p1), eps);
        const int d2 = sign(cross2(q1, q2, p2), eps);
        const int d3 = sign(cross2(p1, p2, q1), eps);
        const int d4 = sign(cross2(p1, p2, q2), eps);

        if (d1 * d2 < 0 && d3 * d4 < 0)
            return true;

        return (d1 == 0 && onSegment(q1, q2, p1)) || (d2 == 0 && onSegment(q1, q2, p2)) ||
               (d3 == 0 && onSegment(p1, p2, q1)) || (d4 == 0 && onSegment(p1, p2, q2));
    }

    bool selfIntersecting(const std::vector<glm::vec2>& pts, float eps)
    {
        const size_t n = pts.size();
        for (size_t i = 0; i < n; ++i)
        {
            for (size_t j = i + 1; j < n; ++j)
            {
                // Skip edges sharing a corner
                if (j == i + 1 || (i == 0 && j == n - 1))
                    continue;

                if (segmentsIntersect(pts[i], pts[(i + 1) % n], pts[j], pts[(j + 1) % n], eps))
                    return true;
            }
        }
        return false;
    }

    float signedArea(const std::vector<glm::vec2>& pts) noexcept
    {
        float area = 0.f;
        for (size_t i = 0; i < pts.size(); ++i)
        {
            const glm::vec2& a = pts[i];
            const glm::vec2& b = pts[(i + 1) % pts.size()];
            area += a.x * b.y - b.x * a.y;
        }
        return area * 0.5f;
    }

    bool insideTriangle(const glm::vec2& a, const glm::vec2& b, const glm::vec2& c, const glm::vec2& p, float eps)
    {
        return cross2(a, b, p) >= -eps && cross2(b, c, p) >= -eps && cross2(c, a, p) >= -eps;
    }
} // namespace

namespace tri
{
    PolygonShape classify(std::span<const glm::vec3> points)
    {
        if (points.size() < 3)
            return PolygonShape::Degenerate;

        const Projection proj = project(points);
        if (proj.degenerate)
            return PolygonShape::Degenerate;

        if (points.size() == 3)
            return PolygonShape::Convex;

        if (selfIntersecting(proj.points, proj.eps))
            return PolygonShape::SelfIntersecting;

        const size_t n = proj.points.size();
        for (size_t i = 0; i < n; ++i)
        {
            const glm::vec2& a = proj.points[(i + n - 1) % n];
            const glm::vec2& b = proj.points[i];
            const glm::vec2& c = proj.points[(i + 1) % n];
            if (cross2(a, b, c) < -proj.eps)
                return PolygonShape::Concave;
        }

        return PolygonShape::Convex;
    }

    std::vector<Triangle> triangulate(std::span<const glm::vec3> points)
    {
        std::vector<Triangle> result;
        if (points.size() < 3)
            return result;

        result.reserve(points.size() - 2);

        Projection proj = project(points);

        std::vector<int32_t> remaining(points.size());
        for (size_t i = 0; i < remaining.size(); ++i)
            remaining[i] = static_cast<int32_t>(i);

        if (proj.degenerate)
        {
            for (size_t i = 1; i + 1 < remaining.size(); ++i)
                result.push_back({remaining[0], remaining[i], remaining[i + 1]});
            return result;
        }

        const std::vector<glm::vec2>& pts = proj.points;
        const float orient = signedArea(pts) < 0.f ? -1.f : 1.f;
        const float eps    = proj.eps;

        while (remaining.size() > 3)
        {
            const size_t n       = remaining.size();
            bool         clipped = false;

            for (size_t i = 0; i < n; ++i)
            {
                const int32_t ia = remaining[(i + n - 1) % n];
                const int32_t ib = remaining[i];
                const int32_t ic = remaining[(i + 1) % n];

                const glm::vec2& a = pts[ia];
                const glm::vec2& b = pts[ib];
                const glm::vec2& c = pts[ic];

                if (cross2(a, b, c) * orient <= eps)
                    continue;

                bool blocked = false;
                for (int32_t other : remaining)
                {
                    if (other == ia || other == ib || other == ic)
                        continue;

                    // Points coincident with a corner (keyhole bridges) do not block
                    const glm::vec2& p = pts[other];
                    if (p == a || p == b || p == c)
                        continue;

                    const bool inside = orient > 0.f ? insideTriangle(a, b, c, p, eps) : insideTriangle(a, c, b, p, eps);
                    if (inside)
                    {
                        blocked = true;
                        break;
                    }
                }

                if (blocked)
                    continue;

                result.push_back({ia, ib, ic});
                remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
                clipped = true;
                break;
            }

            if (!clipped)
            {
                // Fan the rest
                for (size_t i = 1; i + 1 < remaining.size(); ++i)
                    result.push_back({remaining[0], remaining[i], remaining[i + 1]});
                return result;
            }
        }

        result.push_back({remaining[0], remaining[1], remaining[2]});
        return result;
    }
} // namespace tri
