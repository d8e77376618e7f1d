//
//  SysMesh.cpp
//  MeshLib
//

#include "SysMesh.hpp"

#include <algorithm>
#include <cassert>
#include <glm/glm.hpp>

#include "SysMeshData.hpp"

SysMesh::SysMesh() : data{std::make_shared<SysMeshData>()}
{
}

SysMesh::SysMesh(SysMesh&& other) noexcept : data{std::move(other.data)}
{
}

SysMesh& SysMesh::operator=(SysMesh&& other) noexcept
{
    if (this != &other)
        data = std::move(other.data);
    return *this;
}

SysMesh::~SysMesh() = default;

void SysMesh::clear()
{
    data->verts.clear();
    data->polys.clear();
    data->mesh_maps.clear();
    data->seams.clear();
}

/// -------------------------------------------------------
/// Vertices
/// -------------------------------------------------------

const std::vector<int32_t>& SysMesh::all_verts() const noexcept
{
    return data->verts.valid_indices();
}

uint32_t SysMesh::num_verts() const noexcept
{
    return static_cast<uint32_t>(data->verts.size());
}

int32_t SysMesh::create_vert(const glm::vec3& pos)
{
    SysVert new_vert{};
    new_vert.pos = pos;
    return data->verts.insert(std::move(new_vert));
}

const glm::vec3& SysMesh::vert_position(int32_t vert_index) const noexcept
{
    return data->verts[vert_index].pos;
}

bool SysMesh::vert_valid(int32_t vert_index) const noexcept
{
    return data->verts.valid(vert_index);
}

/// -------------------------------------------------------
/// Edges
/// -------------------------------------------------------

std::vector<IndexPair> SysMesh::all_edges() const
{
    std::vector<IndexPair> edges;
    edges.reserve(static_cast<size_t>(num_polys()) * 4);

    for (int32_t poly_index : all_polys())
    {
        for (const IndexPair& e : poly_edges(poly_index))
            edges.push_back(sort_edge(e));
    }

    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

bool SysMesh::has_edge(const IndexPair& edge) const noexcept
{
    if (!vert_valid(edge.first) || !vert_valid(edge.second))
        return false;

    for (int32_t poly_index : data->verts[edge.first].polys)
    {
        if (poly_has_edge(poly_index, edge))
            return true;
    }
    return false;
}

std::vector<int32_t> SysMesh::edge_polys(const IndexPair& edge) const
{
    std::vector<int32_t> results;
    if (!vert_valid(edge.first))
        return results;

    for (int32_t poly_index : data->verts[edge.first].polys)
    {
        if (poly_has_edge(poly_index, edge))
            results.push_back(poly_index);
    }
    return results;
}

/// -------------------------------------------------------
/// Polys
/// -------------------------------------------------------

const std::vector<int32_t>& SysMesh::all_polys() const noexcept
{
    return data->polys.valid_indices();
}

uint32_t SysMesh::num_polys() const noexcept
{
    return static_cast<uint32_t>(data->polys.size());
}

int32_t SysMesh::create_poly(const SysPolyVerts& verts, uint32_t material_id, SysPolyType type)
{
    SysPoly new_poly{};
    new_poly.verts       = verts;
    new_poly.material_id = material_id;
    new_poly.type        = type;

    const int32_t poly_index = data->polys.insert(std::move(new_poly));

    // Add the new polygon to its vertices.
    for (int32_t vert_index : verts)
    {
        assert(vert_valid(vert_index) && "Polygon references an invalid vertex!");
        SysVertPolys& vp = data->verts[vert_index].polys;
        if (std::find(vp.begin(), vp.end(), poly_index) == vp.end())
            vp.push_back(poly_index);
    }

    return poly_index;
}

void SysMesh::remove_poly(int32_t poly_index)
{
    assert(poly_valid(poly_index) && "Polygon has already been removed!");

    // Edges used by this polygon only are about to disappear.
    std::vector<IndexPair> dying_edges;
    for (const IndexPair& edge : poly_edges(poly_index))
    {
        if (edge_polys(edge).size() == 1)
            dying_edges.push_back(sort_edge(edge));
    }

    for (int32_t map : data->mesh_maps.valid_indices())
    {
        SysMeshMap& m = *data->mesh_maps[map];
        m.corner_values.erase(poly_index);
        std::erase(m.tagged_polys, poly_index);
        for (const IndexPair& edge : dying_edges)
            m.edge_values.erase(edge);
    }
    for (const IndexPair& edge : dying_edges)
        data->seams.erase(edge);

    // Remove polygon from its vertices.
    for (int32_t vert_index : data->polys[poly_index].verts)
        std::erase(data->verts[vert_index].polys, poly_index);

    data->polys.remove(poly_index);
}

bool SysMesh::poly_valid(int32_t poly_index) const noexcept
{
    return data->polys.valid(poly_index);
}

const SysPolyVerts& SysMesh::poly_verts(int32_t poly_index) const noexcept
{
    assert(poly_valid(poly_index) && "nth polygon does not exist!");
    return data->polys[poly_index].verts;
}

SysPolyEdges SysMesh::poly_edges(int32_t poly_index) const
{
    SysPolyEdges        results;
    const SysPolyVerts& pv = data->polys[poly_index].verts;
    const int32_t       n  = static_cast<int32_t>(pv.size());
    for (int32_t prev = n - 1, next = 0; next < n; prev = next++)
        results.emplace_back(pv[prev], pv[next]);
    return results;
}

bool SysMesh::poly_has_edge(int32_t poly_index, const IndexPair& edge) const noexcept
{
    const SysPolyVerts& pv = data->polys[poly_index].verts;
    const size_t        n  = pv.size();

    for (size_t i = 0; i < n; ++i)
    {
        const int32_t a = pv[i];
        const int32_t b = pv[(i + 1) % n];

        if ((a == edge.first && b == edge.second) || (a == edge.second && b == edge.first))
            return true;
    }
    return false;
}

uint32_t SysMesh::poly_material(int32_t poly_index) const noexcept
{
    return data->polys[poly_index].material_id;
}

void SysMesh::set_poly_material(int32_t poly_index, uint32_t material_id) noexcept
{
    data->polys[poly_index].material_id = material_id;
}

SysPolyType SysMesh::poly_type(int32_t poly_index) const noexcept
{
    return data->polys[poly_index].type;
}

void SysMesh::set_poly_type(int32_t poly_index, SysPolyType type) noexcept
{
    data->polys[poly_index].type = type;
}

/// -------------------------------------------------------
/// Maps
/// -------------------------------------------------------

int32_t SysMesh::map_create(std::string_view name, SysMapType type)
{
    auto new_map    = std::make_shared<SysMeshMap>();
    new_map->name   = std::string{name};
    new_map->type   = type;
    new_map->dim    = type_dim(type);
    new_map->domain = type_domain(type);

    return data->mesh_maps.insert(std::move(new_map));
}

void SysMesh::map_remove(int32_t map)
{
    assert(map_valid(map) && "Invalid map index!");
    data->mesh_maps.remove(map);
}

int32_t SysMesh::map_find(SysMapType type, std::string_view name) const noexcept
{
    for (int32_t map : data->mesh_maps.valid_indices())
    {
        const SysMeshMap& m = *data->mesh_maps[map];
        if (m.type == type && m.name == name)
            return map;
    }
    return -1;
}

std::vector<int32_t> SysMesh::maps_of_type(SysMapType type) const
{
    std::vector<int32_t> result;
    for (int32_t map : data->mesh_maps.valid_indices())
    {
        if (data->mesh_maps[map]->type == type)
            result.push_back(map);
    }
    return result;
}

bool SysMesh::map_valid(int32_t map) const noexcept
{
    return data->mesh_maps.valid(map);
}

const std::string& SysMesh::map_name(int32_t map) const noexcept
{
    return data->mesh_maps[map]->name;
}

SysMapType SysMesh::map_type(int32_t map) const noexcept
{
    return data->mesh_maps[map]->type;
}

int32_t SysMesh::map_dim(int32_t map) const noexcept
{
    return data->mesh_maps[map]->dim;
}

SysMapDomain SysMesh::map_domain(int32_t map) const noexcept
{
    return data->mesh_maps[map]->domain;
}

void SysMesh::map_clear(int32_t map)
{
    SysMeshMap& m = *data->mesh_maps[map];
    m.vert_values.clear();
    m.corner_values.clear();
    m.edge_values.clear();
    m.tagged_polys.clear();
}

const float* SysMesh::map_vert_value(int32_t map, int32_t vert_index) const noexcept
{
    const SysMeshMap& m  = *data->mesh_maps[map];
    const auto        it = m.vert_values.find(vert_index);
    return it == m.vert_values.end() ? nullptr : it->second.data();
}

void SysMesh::map_set_vert_value(int32_t map, int32_t vert_index, const float* value)
{
    assert(vert_valid(vert_index) && "Invalid vertex index!");

    SysMeshMap& m = *data->mesh_maps[map];
    SysMapValue v{};
    for (int32_t i = 0; i < m.dim && value; ++i)
        v[i] = value[i];
    m.vert_values[vert_index] = v;
}

void SysMesh::map_clear_vert_value(int32_t map, int32_t vert_index)
{
    data->mesh_maps[map]->vert_values.erase(vert_index);
}

const float* SysMesh::map_corner_value(int32_t map, int32_t poly_index, int32_t corner) const noexcept
{
    const SysMeshMap& m  = *data->mesh_maps[map];
    const auto        it = m.corner_values.find(poly_index);
    if (it == m.corner_values.end())
        return nullptr;

    const SysMapPoly& mp = it->second;
    if (corner < 0 || corner >= static_cast<int32_t>(mp.set.size()) || !mp.set[corner])
        return nullptr;

    return mp.values[corner].data();
}

void SysMesh::map_set_corner_value(int32_t map, int32_t poly_index, int32_t corner, const float* value)
{
    assert(poly_valid(poly_index) && "Invalid polygon index!");

    const size_t corners = data->polys[poly_index].verts.size();
    assert(corner >= 0 && static_cast<size_t>(corner) < corners && "Corner out of range!");

    SysMeshMap& m  = *data->mesh_maps[map];
    SysMapPoly& mp = m.corner_values[poly_index];
    if (mp.values.size() != corners)
    {
        mp.values.resize(corners, SysMapValue{});
        mp.set.resize(corners, false);
    }

    SysMapValue v{};
    for (int32_t i = 0; i < m.dim; ++i)
        v[i] = value[i];
    mp.values[corner] = v;
    mp.set[corner]    = true;
}

const float* SysMesh::map_edge_value(int32_t map, const IndexPair& edge) const noexcept
{
    const SysMeshMap& m  = *data->mesh_maps[map];
    const auto        it = m.edge_values.find(sort_edge(edge));
    return it == m.edge_values.end() ? nullptr : it->second.data();
}

void SysMesh::map_set_edge_value(int32_t map, const IndexPair& edge, const float* value)
{
    SysMeshMap& m = *data->mesh_maps[map];
    SysMapValue v{};
    for (int32_t i = 0; i < m.dim && value; ++i)
        v[i] = value[i];
    m.edge_values[sort_edge(edge)] = v;
}

bool SysMesh::map_poly_tagged(int32_t map, int32_t poly_index) const noexcept
{
    const std::vector<int32_t>& tagged = data->mesh_maps[map]->tagged_polys;
    return std::find(tagged.begin(), tagged.end(), poly_index) != tagged.end();
}

void SysMesh::map_set_poly_tag(int32_t map, int32_t poly_index, bool tagged)
{
    std::vector<int32_t>& list = data->mesh_maps[map]->tagged_polys;
    const auto            it   = std::find(list.begin(), list.end(), poly_index);

    if (tagged && it == list.end())
        list.push_back(poly_index);
    else if (!tagged && it != list.end())
        list.erase(it);
}

std::vector<int32_t> SysMesh::map_verts(int32_t map) const
{
    std::vector<int32_t> result;
    for (const auto& [vert_index, value] : data->mesh_maps[map]->vert_values)
        result.push_back(vert_index);
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<IndexPair> SysMesh::map_edges(int32_t map) const
{
    std::vector<IndexPair> result;
    for (const auto& [edge, value] : data->mesh_maps[map]->edge_values)
        result.push_back(edge);
    return result;
}

std::vector<int32_t> SysMesh::map_polys(int32_t map) const
{
    std::vector<int32_t> result = data->mesh_maps[map]->tagged_polys;
    std::sort(result.begin(), result.end());
    return result;
}

/// -------------------------------------------------------
/// Seams
/// -------------------------------------------------------

void SysMesh::set_edge_seam(const IndexPair& edge, bool seam)
{
    if (seam)
        data->seams.insert(edge);
    else
        data->seams.erase(edge);
}

bool SysMesh::edge_seam(const IndexPair& edge) const noexcept
{
    return data->seams.contains(edge);
}

std::vector<IndexPair> SysMesh::seam_edges() const
{
    return data->seams.to_vector();
}

/// -------------------------------------------------------
/// Selection
/// -------------------------------------------------------

bool SysMesh::select_poly(int32_t poly_index, bool select) noexcept
{
    if (!poly_valid(poly_index) || data->polys[poly_index].selected == select)
        return false;

    data->polys[poly_index].selected = select;
    return true;
}

std::vector<int32_t> SysMesh::selected_polys() const
{
    std::vector<int32_t> result;
    for (int32_t poly_index : all_polys())
    {
        if (data->polys[poly_index].selected)
            result.push_back(poly_index);
    }
    return result;
}

void SysMesh::clear_selection() noexcept
{
    for (int32_t poly_index : all_polys())
        data->polys[poly_index].selected = false;
}

IndexPair SysMesh::sort_edge(const IndexPair& edge) noexcept
{
    if (edge.first > edge.second)
        return {edge.second, edge.first};
    return edge;
}

int32_t SysMesh::type_dim(SysMapType type) noexcept
{
    switch (type)
    {
        case SysMapType::Weight:
        case SysMapType::Subdiv:
            return 1;
        case SysMapType::Texture:
            return 2;
        case SysMapType::Morph:
        case SysMapType::Spot:
        case SysMapType::Rgb:
            return 3;
        case SysMapType::Rgba:
            return 4;
        case SysMapType::VertPick:
        case SysMapType::EdgePick:
        case SysMapType::PolyPick:
            return 0;
    }
    return 0;
}

SysMapDomain SysMesh::type_domain(SysMapType type) noexcept
{
    switch (type)
    {
        case SysMapType::Weight:
        case SysMapType::Morph:
        case SysMapType::Spot:
        case SysMapType::VertPick:
            return SysMapDomain::Vert;
        case SysMapType::Texture:
        case SysMapType::Rgb:
        case SysMapType::Rgba:
            return SysMapDomain::Corner;
        case SysMapType::Subdiv:
        case SysMapType::EdgePick:
            return SysMapDomain::Edge;
        case SysMapType::PolyPick:
            return SysMapDomain::Poly;
    }
    return SysMapDomain::Vert;
}
