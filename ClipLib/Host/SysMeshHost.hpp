#pragma once

#include <string>
#include <utility>

#include "MeshHost.hpp"

class SysMesh;
class MaterialHandler;

/**
 * @brief MeshHost over a SysMesh whose material ids index a MaterialHandler.
 *
 * Channel handles are SysMesh map indices. Each ChannelKind maps onto one
 * SysMapType (relative morphs are Morph maps, absolute morphs Spot maps).
 * The primary UV channel is remembered by name; when unset, the first UV map
 * counts as primary.
 */
class SysMeshHost final : public MeshHost
{
public:
    SysMeshHost(SysMesh& mesh, MaterialHandler& materials, std::string name,
                CoordinateConvention convention = CoordinateConvention::RH_Yup);

    [[nodiscard]] SysMesh& mesh() noexcept
    {
        return m_mesh;
    }

    [[nodiscard]] const SysMesh& mesh() const noexcept
    {
        return m_mesh;
    }

    void setName(std::string name)
    {
        m_name = std::move(name);
    }

    [[nodiscard]] CoordinateConvention convention() const noexcept override;
    [[nodiscard]] std::string          name() const override;

    [[nodiscard]] std::vector<int32_t>          allPolygons() const override;
    [[nodiscard]] std::vector<int32_t>          selectedPolygons() const override;
    [[nodiscard]] HostPolygonType               polygonType(int32_t poly) const override;
    [[nodiscard]] std::vector<int32_t>          polygonVertices(int32_t poly) const override;
    [[nodiscard]] glm::vec3                     vertexPosition(int32_t vert) const override;
    [[nodiscard]] std::optional<int32_t>        polygonMaterial(int32_t poly) const override;
    [[nodiscard]] std::vector<SnapshotMaterial> materials() const override;

    [[nodiscard]] std::vector<ChannelHandle> channels(ChannelKind kind) const override;
    [[nodiscard]] std::string                channelName(ChannelHandle channel) const override;
    [[nodiscard]] std::string                primaryUvChannel() const override;

    bool vertexValue(ChannelHandle channel, int32_t vert, float* out) const override;
    bool cornerValue(ChannelHandle channel, int32_t poly, int32_t corner, float* out) const override;
    bool edgeValue(ChannelHandle channel, const EdgeKey& edge, float* out) const override;
    bool polygonInChannel(ChannelHandle channel, int32_t poly) const override;

    [[nodiscard]] std::vector<int32_t> channelVertices(ChannelHandle channel) const override;
    [[nodiscard]] std::vector<EdgeKey> channelEdges(ChannelHandle channel) const override;
    [[nodiscard]] std::vector<EdgeKey> seamEdges() const override;
    [[nodiscard]] bool                 hasEdge(const EdgeKey& edge) const override;

    int32_t createVertex(const glm::vec3& pos) override;
    int32_t createPolygon(const std::vector<int32_t>& verts, std::optional<int32_t> material, bool subdivision) override;
    void    deletePolygons(const std::vector<int32_t>& polys) override;
    void    clear() override;

    [[nodiscard]] std::optional<int32_t> findMaterial(std::string_view name) const override;

    int32_t createMaterial(const SnapshotMaterial& material) override;
    void    updateMaterial(int32_t index, const SnapshotMaterial& material) override;

    [[nodiscard]] ChannelHandle findChannel(ChannelKind kind, std::string_view name) const override;

    ChannelHandle createChannel(ChannelKind kind, std::string_view name) override;
    void          removeChannel(ChannelHandle channel) override;
    void          clearChannel(ChannelHandle channel) override;
    void          setPrimaryUvChannel(std::string_view name) override;

    void setVertexValue(ChannelHandle channel, int32_t vert, const float* value) override;
    void clearVertexValue(ChannelHandle channel, int32_t vert) override;
    void setCornerValue(ChannelHandle channel, int32_t poly, int32_t corner, const float* value) override;
    void setEdgeValue(ChannelHandle channel, const EdgeKey& edge, const float* value) override;
    void setPolygonInChannel(ChannelHandle channel, int32_t poly, bool member) override;
    void markSeam(const EdgeKey& edge) override;

private:
    SysMesh&             m_mesh;
    MaterialHandler&     m_materials;
    std::string          m_name;
    CoordinateConvention m_convention;
    std::string          m_primaryUv;
};
