#include "SysMeshHost.hpp"

#include <algorithm>

#include "MaterialHandler.hpp"
#include "SysMesh.hpp"

namespace
{
    SysMapType toMapType(ChannelKind kind) noexcept
    {
        switch (kind)
        {
            case ChannelKind::Weight:
                return SysMapType::Weight;
            case ChannelKind::RelativeMorph:
                return SysMapType::Morph;
            case ChannelKind::AbsoluteMorph:
                return SysMapType::Spot;
            case ChannelKind::Uv:
                return SysMapType::Texture;
            case ChannelKind::ColorRgb:
                return SysMapType::Rgb;
            case ChannelKind::ColorRgba:
                return SysMapType::Rgba;
            case ChannelKind::Crease:
                return SysMapType::Subdiv;
            case ChannelKind::VertexSet:
                return SysMapType::VertPick;
            case ChannelKind::EdgeSet:
                return SysMapType::EdgePick;
            case ChannelKind::PolygonSet:
                return SysMapType::PolyPick;
        }
        return SysMapType::Weight;
    }

    const float* copyValue(const float* value, int32_t dim, float* out) noexcept
    {
        if (value && out)
            std::copy_n(value, dim, out);
        return value;
    }
} // namespace

SysMeshHost::SysMeshHost(SysMesh& mesh, MaterialHandler& materials, std::string name, CoordinateConvention convention)
    : m_mesh{mesh}, m_materials{materials}, m_name{std::move(name)}, m_convention{convention}
{
}

CoordinateConvention SysMeshHost::convention() const noexcept
{
    return m_convention;
}

std::string SysMeshHost::name() const
{
    return m_name;
}

std::vector<int32_t> SysMeshHost::allPolygons() const
{
    return m_mesh.all_polys();
}

std::vector<int32_t> SysMeshHost::selectedPolygons() const
{
    return m_mesh.selected_polys();
}

HostPolygonType SysMeshHost::polygonType(int32_t poly) const
{
    switch (m_mesh.poly_type(poly))
    {
        case SysPolyType::Face:
            return HostPolygonType::Face;
        case SysPolyType::Subdiv:
            return HostPolygonType::Subdivision;
        default:
            return HostPolygonType::Other;
    }
}

std::vector<int32_t> SysMeshHost::polygonVertices(int32_t poly) const
{
    return m_mesh.poly_verts(poly);
}

glm::vec3 SysMeshHost::vertexPosition(int32_t vert) const
{
    return m_mesh.vert_position(vert);
}

std::optional<int32_t> SysMeshHost::polygonMaterial(int32_t poly) const
{
    const uint32_t id = m_mesh.poly_material(poly);
    if (id == kSysNoMaterial || !m_materials.valid(static_cast<int32_t>(id)))
        return std::nullopt;
    return static_cast<int32_t>(id);
}

std::vector<SnapshotMaterial> SysMeshHost::materials() const
{
    std::vector<SnapshotMaterial> result;
    result.reserve(m_materials.materials().size());

    for (const Material& mat : m_materials.materials())
    {
        SnapshotMaterial sm;
        sm.name    = mat.name();
        sm.diffuse = mat.baseColor();
        if (mat.hasTexture())
            sm.texturePath = mat.texturePath();
        result.push_back(std::move(sm));
    }
    return result;
}

std::vector<ChannelHandle> SysMeshHost::channels(ChannelKind kind) const
{
    return m_mesh.maps_of_type(toMapType(kind));
}

std::string SysMeshHost::channelName(ChannelHandle channel) const
{
    return m_mesh.map_name(channel);
}

std::string SysMeshHost::primaryUvChannel() const
{
    if (!m_primaryUv.empty() && m_mesh.map_find(SysMapType::Texture, m_primaryUv) != -1)
        return m_primaryUv;

    const std::vector<int32_t> uvMaps = m_mesh.maps_of_type(SysMapType::Texture);
    if (uvMaps.empty())
        return {};

    return m_mesh.map_name(uvMaps.front());
}

bool SysMeshHost::vertexValue(ChannelHandle channel, int32_t vert, float* out) const
{
    return copyValue(m_mesh.map_vert_value(channel, vert), m_mesh.map_dim(channel), out) != nullptr;
}

bool SysMeshHost::cornerValue(ChannelHandle channel, int32_t poly, int32_t corner, float* out) const
{
    return copyValue(m_mesh.map_corner_value(channel, poly, corner), m_mesh.map_dim(channel), out) != nullptr;
}

bool SysMeshHost::edgeValue(ChannelHandle channel, const EdgeKey& edge, float* out) const
{
    return copyValue(m_mesh.map_edge_value(channel, edge), m_mesh.map_dim(channel), out) != nullptr;
}

bool SysMeshHost::polygonInChannel(ChannelHandle channel, int32_t poly) const
{
    return m_mesh.map_poly_tagged(channel, poly);
}

std::vector<int32_t> SysMeshHost::channelVertices(ChannelHandle channel) const
{
    return m_mesh.map_verts(channel);
}

std::vector<EdgeKey> SysMeshHost::channelEdges(ChannelHandle channel) const
{
    return m_mesh.map_edges(channel);
}

std::vector<EdgeKey> SysMeshHost::seamEdges() const
{
    return m_mesh.seam_edges();
}

bool SysMeshHost::hasEdge(const EdgeKey& edge) const
{
    return m_mesh.has_edge(edge);
}

int32_t SysMeshHost::createVertex(const glm::vec3& pos)
{
    return m_mesh.create_vert(pos);
}

int32_t SysMeshHost::createPolygon(const std::vector<int32_t>& verts, std::optional<int32_t> material, bool subdivision)
{
    const uint32_t id = material ? static_cast<uint32_t>(*material) : kSysNoMaterial;
    return m_mesh.create_poly(verts, id, subdivision ? SysPolyType::Subdiv : SysPolyType::Face);
}

void SysMeshHost::deletePolygons(const std::vector<int32_t>& polys)
{
    for (int32_t poly : polys)
    {
        if (m_mesh.poly_valid(poly))
            m_mesh.remove_poly(poly);
    }
}

void SysMeshHost::clear()
{
    m_mesh.clear();
    m_primaryUv.clear();
}

std::optional<int32_t> SysMeshHost::findMaterial(std::string_view name) const
{
    return m_materials.findMaterial(name);
}

int32_t SysMeshHost::createMaterial(const SnapshotMaterial& material)
{
    const int32_t index = m_materials.createMaterial(material.name);
    updateMaterial(index, material);
    return index;
}

void SysMeshHost::updateMaterial(int32_t index, const SnapshotMaterial& material)
{
    Material& mat = m_materials.material(index);
    mat.baseColor(material.diffuse);
    mat.texturePath(material.texturePath.value_or(std::string{}));
}

ChannelHandle SysMeshHost::findChannel(ChannelKind kind, std::string_view name) const
{
    return m_mesh.map_find(toMapType(kind), name);
}

ChannelHandle SysMeshHost::createChannel(ChannelKind kind, std::string_view name)
{
    return m_mesh.map_create(name, toMapType(kind));
}

void SysMeshHost::removeChannel(ChannelHandle channel)
{
    if (m_mesh.map_valid(channel))
        m_mesh.map_remove(channel);
}

void SysMeshHost::clearChannel(ChannelHandle channel)
{
    m_mesh.map_clear(channel);
}

void SysMeshHost::setPrimaryUvChannel(std::string_view name)
{
    m_primaryUv = std::string{name};
}

void SysMeshHost::setVertexValue(ChannelHandle channel, int32_t vert, const float* value)
{
    m_mesh.map_set_vert_value(channel, vert, value);
}

void SysMeshHost::clearVertexValue(ChannelHandle channel, int32_t vert)
{
    m_mesh.map_clear_vert_value(channel, vert);
}

void SysMeshHost::setCornerValue(ChannelHandle channel, int32_t poly, int32_t corner, const float* value)
{
    m_mesh.map_set_corner_value(channel, poly, corner, value);
}

void SysMeshHost::setEdgeValue(ChannelHandle channel, const EdgeKey& edge, const float* value)
{
    m_mesh.map_set_edge_value(channel, edge, value);
}

void SysMeshHost::setPolygonInChannel(ChannelHandle channel, int32_t poly, bool member)
{
    m_mesh.map_set_poly_tag(channel, poly, member);
}

void SysMeshHost::markSeam(const EdgeKey& edge)
{
    m_mesh.set_edge_seam(edge, true);
}
