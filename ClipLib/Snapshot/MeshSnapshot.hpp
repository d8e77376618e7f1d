#pragma once

#include <compare>
#include <cstdint>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct ClipboardReport;

/// Coordinate conventions of the two exchanging applications.
enum class CoordinateConvention : uint8_t
{
    RH_Yup, ///< Right-handed, Y up.
    LH_Zup  ///< The other host: handedness and up axis differ.
};

/// How a snapshot polygon came to be.
enum class PolygonOrigin : uint8_t
{
    Regular,
    TriangulatedFromIrregular ///< Triangle of a non-convex/self-intersecting source loop.
};

enum class MorphKind : uint8_t
{
    Relative, ///< Values are positional deltas.
    Absolute  ///< Values are target positions.
};

enum class ColorKind : uint8_t
{
    Rgb,
    Rgba
};

enum class SelectionKind : uint8_t
{
    Vertex,
    Edge,
    Polygon
};

/// Unordered vertex pair, always stored lowest id first.
using EdgeKey = std::pair<int32_t, int32_t>;

inline EdgeKey makeEdgeKey(int32_t a, int32_t b) noexcept
{
    return a < b ? EdgeKey{a, b} : EdgeKey{b, a};
}

/// Addresses one face corner: the corner-th vertex of a polygon.
struct CornerRef
{
    int32_t polygon = 0;
    int32_t corner  = 0;

    auto operator<=>(const CornerRef&) const = default;
};

struct SnapshotVertex
{
    glm::vec3 position{0.f};

    bool operator==(const SnapshotVertex&) const = default;
};

struct SnapshotPolygon
{
    std::vector<int32_t>   vertices;
    std::optional<int32_t> material;
    bool                   isSubdivisionSurface = false;
    PolygonOrigin          origin               = PolygonOrigin::Regular;

    bool operator==(const SnapshotPolygon&) const = default;
};

struct SnapshotMorph
{
    std::string                  name;
    MorphKind                    kind = MorphKind::Relative;
    std::map<int32_t, glm::vec3> values;

    bool operator==(const SnapshotMorph&) const = default;
};

struct SnapshotWeightMap
{
    std::string              name;
    std::map<int32_t, float> weights;

    bool operator==(const SnapshotWeightMap&) const = default;
};

/// Edge crease weights of a subdivision cage.
struct SnapshotCreaseMap
{
    std::map<EdgeKey, float> weights;

    bool operator==(const SnapshotCreaseMap&) const = default;
};

struct SnapshotMaterial
{
    std::string                name;
    glm::vec3                  diffuse{0.8f};
    std::optional<std::string> texturePath;

    bool operator==(const SnapshotMaterial&) const = default;
};

struct SnapshotUvMap
{
    std::string                    name;
    bool                           primary = false;
    std::map<CornerRef, glm::vec2> values;

    bool operator==(const SnapshotUvMap&) const = default;
};

struct SnapshotColorMap
{
    std::string                    name;
    ColorKind                      kind = ColorKind::Rgb;
    std::map<CornerRef, glm::vec4> values; ///< Alpha is 1 for Rgb maps.

    bool operator==(const SnapshotColorMap&) const = default;
};

/// Named selection set. Vertex and polygon sets use elements, edge sets use edges.
struct SnapshotSelectionSet
{
    std::string       name;
    SelectionKind     kind = SelectionKind::Vertex;
    std::set<int32_t> elements;
    std::set<EdgeKey> edges;

    bool operator==(const SnapshotSelectionSet&) const = default;
};

struct SnapshotMetadata
{
    std::string sourceApplication;
    float       unitScale = 1.f;
    std::string objectName;

    bool operator==(const SnapshotMetadata&) const = default;
};

/// Name of the edge set carrying Freestyle-edge semantics.
inline constexpr std::string_view kFreestyleSetName = "_Freestyle";

/// Name of the edge set carrying UV seams.
inline constexpr std::string_view kSeamSetName = "_Seam";

/**
 * @brief Application-neutral mesh interchange value.
 *
 * Vertex and polygon ids are their indices in the vectors. A snapshot holds no
 * references into any host; it is copied, encoded and merged as a plain value.
 */
struct MeshSnapshot
{
    static constexpr int32_t kSchemaVersion = 1;

    int32_t              schemaVersion = kSchemaVersion;
    CoordinateConvention convention    = CoordinateConvention::RH_Yup;
    SnapshotMetadata     metadata;

    std::vector<SnapshotVertex>       vertices;
    std::vector<SnapshotPolygon>      polygons;
    std::vector<SnapshotMaterial>     materials;
    std::vector<SnapshotUvMap>        uvMaps;
    std::vector<SnapshotColorMap>     colorMaps;
    std::vector<SnapshotWeightMap>    weightMaps;
    std::vector<SnapshotMorph>        morphs;
    SnapshotCreaseMap                 subdivisionWeights;
    std::vector<SnapshotSelectionSet> selectionSets;

    [[nodiscard]] int32_t vertexCount() const noexcept
    {
        return static_cast<int32_t>(vertices.size());
    }

    [[nodiscard]] int32_t polygonCount() const noexcept
    {
        return static_cast<int32_t>(polygons.size());
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return vertices.empty() && polygons.empty();
    }

    [[nodiscard]] const SnapshotUvMap*        primaryUvMap() const noexcept;
    [[nodiscard]] const SnapshotSelectionSet* findSelectionSet(std::string_view name, SelectionKind kind) const noexcept;

    /// @return The UV seam set: "_Seam", else an edge set named after the primary UV map.
    [[nodiscard]] const SnapshotSelectionSet* seamSet() const noexcept;

    bool operator==(const MeshSnapshot&) const = default;
};

/**
 * @brief Checks every cross reference of a snapshot.
 *
 * Reports the first violation as MalformedReference. Out-of-range weights and
 * crease values are not violations; see clampSnapshotWeights().
 * @return True when the snapshot is internally consistent.
 */
bool validateSnapshot(const MeshSnapshot& snapshot, ClipboardReport& report);

/// Clamps weight map and crease values into [0, 1], warning once per map.
void clampSnapshotWeights(MeshSnapshot& snapshot, ClipboardReport& report);

std::string_view conventionName(CoordinateConvention convention) noexcept;
std::optional<CoordinateConvention> parseConvention(std::string_view name) noexcept;
