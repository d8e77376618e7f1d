#ifndef SYS_MESH_DATA_HPP_INCLUDED
#define SYS_MESH_DATA_HPP_INCLUDED

#include <EdgeSet.hpp>
#include <HoleList.hpp>
#include <cstdint>
#include <glm/vec3.hpp>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "SysMesh.hpp"

struct SysVert
{
    SysVertPolys polys;
    glm::vec3    pos{0.f};
};

struct SysPoly
{
    SysPolyVerts verts;
    uint32_t     material_id = 0;
    SysPolyType  type        = SysPolyType::Face;
    bool         selected    = false;
};

/// Per-corner values of one polygon. A corner slot is unset until written.
struct SysMapPoly
{
    std::vector<SysMapValue> values;
    std::vector<bool>        set;
};

struct SysMeshMap
{
    std::string  name;
    SysMapType   type   = SysMapType::Weight;
    SysMapDomain domain = SysMapDomain::Vert;
    int32_t      dim    = 0;

    std::unordered_map<int32_t, SysMapValue> vert_values;
    std::unordered_map<int32_t, SysMapPoly>  corner_values;
    std::map<IndexPair, SysMapValue>         edge_values;
    std::vector<int32_t>                     tagged_polys;
};

struct SysMeshData
{
    /// List of verts, polys and maps
    HoleList<SysVert>                     verts;
    HoleList<SysPoly>                     polys;
    HoleList<std::shared_ptr<SysMeshMap>> mesh_maps;

    /// Edge flags
    EdgeSet seams;
};

#endif
