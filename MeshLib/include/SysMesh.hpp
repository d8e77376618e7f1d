//
//  SysMesh.hpp
//  MeshLib
//
//  Polygon mesh with named vertex, face-corner, edge and polygon maps.
//

#ifndef SYS_MESH_HPP_INCLUDED
#define SYS_MESH_HPP_INCLUDED

#include <array>
#include <cstdint>
#include <glm/vec3.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "EdgeSet.hpp"

using SysPolyVerts = std::vector<int32_t>;
using SysVertPolys = std::vector<int32_t>;
using SysPolyEdges = std::vector<IndexPair>;

/// A map value holds up to four floats; only the first map_dim() are meaningful.
using SysMapValue = std::array<float, 4>;

/// Material id of a polygon without a material.
inline constexpr uint32_t kSysNoMaterial = 0xFFFFFFFFu;

/// Primitive type of a polygon.
enum class SysPolyType : uint8_t
{
    Face,   ///< Plain polygon face.
    Subdiv, ///< Subdivision surface cage polygon.
    Curve,  ///< Open or closed spline curve.
    Line    ///< Polyline.
};

/// Kinds of data a mesh map can carry. The type fixes both the value dimension
/// and the element domain the map is keyed on.
enum class SysMapType : uint8_t
{
    Weight,   ///< Vertex, 1 float.
    Morph,    ///< Vertex, 3 floats, offset from the base position.
    Spot,     ///< Vertex, 3 floats, absolute position.
    Texture,  ///< Face corner, 2 floats.
    Rgb,      ///< Face corner, 3 floats.
    Rgba,     ///< Face corner, 4 floats.
    Subdiv,   ///< Edge, 1 float crease weight.
    VertPick, ///< Vertex membership (named vertex selection set).
    EdgePick, ///< Edge membership (named edge selection set).
    PolyPick  ///< Polygon membership (named polygon selection set).
};

enum class SysMapDomain : uint8_t
{
    Vert,
    Corner,
    Edge,
    Poly
};

class SysMesh
{
public:
    explicit SysMesh();
    SysMesh(const SysMesh&)            = delete;
    SysMesh& operator=(const SysMesh&) = delete;

    SysMesh(SysMesh&& other) noexcept;
    SysMesh& operator=(SysMesh&& other) noexcept;

    ~SysMesh();

    /// Empties the mesh, removing all geometry, maps, seams and selections.
    void clear();

    /// Vertices ------------------------------------------

    /// @return A list of all valid vertex indices in the mesh.
    [[nodiscard]] const std::vector<int32_t>& all_verts() const noexcept;

    /// @return The number of valid vertices in the mesh.
    [[nodiscard]] uint32_t num_verts() const noexcept;

    /// @return An index to a newly created vertex with the specified position.
    int32_t create_vert(const glm::vec3& pos);

    /// @return The position of the specified vertex.
    [[nodiscard]] const glm::vec3& vert_position(int32_t vert_index) const noexcept;

    [[nodiscard]] bool vert_valid(int32_t vert_index) const noexcept;

    /// Edges ---------------------------------------------

    /// @return A list of all valid edges in the mesh (unique, sorted).
    [[nodiscard]] std::vector<IndexPair> all_edges() const;

    /// @return True if some polygon has the specified edge, in either direction.
    [[nodiscard]] bool has_edge(const IndexPair& edge) const noexcept;

    /// @return The polygons connected to the specified edge.
    [[nodiscard]] std::vector<int32_t> edge_polys(const IndexPair& edge) const;

    /// Polygons ------------------------------------------

    /// @return A list of all valid polygon indices in the mesh.
    [[nodiscard]] const std::vector<int32_t>& all_polys() const noexcept;

    /// @return The number of valid polygons in the mesh.
    [[nodiscard]] uint32_t num_polys() const noexcept;

    /// @return An index to a newly created polygon with the specified vertices and material.
    int32_t create_poly(const SysPolyVerts& verts, uint32_t material_id = 0, SysPolyType type = SysPolyType::Face);

    /// Removes the specified polygon. Its vertices are kept.
    void remove_poly(int32_t poly_index);

    [[nodiscard]] bool poly_valid(int32_t poly_index) const noexcept;

    /// @return The vertices of the specified polygon.
    [[nodiscard]] const SysPolyVerts& poly_verts(int32_t poly_index) const noexcept;

    /// @return The edges of the specified polygon in winding order.
    [[nodiscard]] SysPolyEdges poly_edges(int32_t poly_index) const;

    /// @return True if the polygon has the specified edge.
    [[nodiscard]] bool poly_has_edge(int32_t poly_index, const IndexPair& edge) const noexcept;

    [[nodiscard]] uint32_t poly_material(int32_t poly_index) const noexcept;

    void set_poly_material(int32_t poly_index, uint32_t material_id) noexcept;

    [[nodiscard]] SysPolyType poly_type(int32_t poly_index) const noexcept;

    void set_poly_type(int32_t poly_index, SysPolyType type) noexcept;

    /// Maps ----------------------------------------------

    /// @return The index of a new map with the specified name and type.
    int32_t map_create(std::string_view name, SysMapType type);

    /// Removes the specified map.
    void map_remove(int32_t map);

    /// @return The index of the map with the specified type and name, or -1.
    [[nodiscard]] int32_t map_find(SysMapType type, std::string_view name) const noexcept;

    /// @return Indices of all maps of the specified type, in creation order.
    [[nodiscard]] std::vector<int32_t> maps_of_type(SysMapType type) const;

    [[nodiscard]] bool map_valid(int32_t map) const noexcept;

    [[nodiscard]] const std::string& map_name(int32_t map) const noexcept;

    [[nodiscard]] SysMapType map_type(int32_t map) const noexcept;

    /// @return The number of meaningful floats per value.
    [[nodiscard]] int32_t map_dim(int32_t map) const noexcept;

    [[nodiscard]] SysMapDomain map_domain(int32_t map) const noexcept;

    /// Removes every value from the map, keeping the map itself.
    void map_clear(int32_t map);

    /// @return The value of a vertex map entry, or nullptr if the vertex is unmapped.
    [[nodiscard]] const float* map_vert_value(int32_t map, int32_t vert_index) const noexcept;

    void map_set_vert_value(int32_t map, int32_t vert_index, const float* value);

    void map_clear_vert_value(int32_t map, int32_t vert_index);

    /// @return The value of a polygon corner, or nullptr if the corner is unmapped.
    [[nodiscard]] const float* map_corner_value(int32_t map, int32_t poly_index, int32_t corner) const noexcept;

    void map_set_corner_value(int32_t map, int32_t poly_index, int32_t corner, const float* value);

    /// @return The value of an edge entry, or nullptr if the edge is unmapped.
    [[nodiscard]] const float* map_edge_value(int32_t map, const IndexPair& edge) const noexcept;

    void map_set_edge_value(int32_t map, const IndexPair& edge, const float* value);

    [[nodiscard]] bool map_poly_tagged(int32_t map, int32_t poly_index) const noexcept;

    void map_set_poly_tag(int32_t map, int32_t poly_index, bool tagged);

    /// @return Mapped vertices of a vertex map, ascending.
    [[nodiscard]] std::vector<int32_t> map_verts(int32_t map) const;

    /// @return Mapped edges of an edge map, sorted.
    [[nodiscard]] std::vector<IndexPair> map_edges(int32_t map) const;

    /// @return Tagged polygons of a polygon map, ascending.
    [[nodiscard]] std::vector<int32_t> map_polys(int32_t map) const;

    /// Seams ---------------------------------------------

    void set_edge_seam(const IndexPair& edge, bool seam);

    [[nodiscard]] bool edge_seam(const IndexPair& edge) const noexcept;

    [[nodiscard]] std::vector<IndexPair> seam_edges() const;

    /// Selection -----------------------------------------

    bool select_poly(int32_t poly_index, bool select) noexcept;

    /// @return A list of all the selected polygon indices.
    [[nodiscard]] std::vector<int32_t> selected_polys() const;

    void clear_selection() noexcept;

    /// Returns a sorted edge (lowest index first) for stable edge comparisons.
    static IndexPair sort_edge(const IndexPair& edge) noexcept;

    /// @return The map value dimension implied by a map type.
    static int32_t type_dim(SysMapType type) noexcept;

    /// @return The element domain implied by a map type.
    static SysMapDomain type_domain(SysMapType type) noexcept;

private:
    std::shared_ptr<struct SysMeshData> data;
};

#endif
