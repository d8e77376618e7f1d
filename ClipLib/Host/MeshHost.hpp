#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "MeshSnapshot.hpp"

/// Primitive type of a host polygon as seen by the extractor.
enum class HostPolygonType : uint8_t
{
    Face,
    Subdivision,
    Other ///< Curves, lines and anything else that is not a surface polygon.
};

/// Kinds of named per-element data channels a host exposes.
enum class ChannelKind : uint8_t
{
    Weight,        ///< Vertex, 1 float.
    RelativeMorph, ///< Vertex, 3 floats, delta.
    AbsoluteMorph, ///< Vertex, 3 floats, position.
    Uv,            ///< Face corner, 2 floats.
    ColorRgb,      ///< Face corner, 3 floats.
    ColorRgba,     ///< Face corner, 4 floats.
    Crease,        ///< Edge, 1 float.
    VertexSet,     ///< Vertex membership.
    EdgeSet,       ///< Edge membership.
    PolygonSet     ///< Polygon membership.
};

using ChannelHandle = int32_t;

inline constexpr ChannelHandle kNoChannel = -1;

/**
 * @brief Read/write contract between the interchange engine and a host mesh.
 *
 * Element ids are host ids; they need not be dense. Value accessors write up to
 * four floats into @p out and return false when the element carries no value.
 * Membership channels (sets) ignore the value pointers.
 */
class MeshHost
{
public:
    virtual ~MeshHost() = default;

    /// Convention the host's positions are expressed in.
    [[nodiscard]] virtual CoordinateConvention convention() const noexcept = 0;

    /// Name of the mesh item.
    [[nodiscard]] virtual std::string name() const = 0;

    // Extraction ---------------------------------------------------------

    [[nodiscard]] virtual std::vector<int32_t> allPolygons() const      = 0;
    [[nodiscard]] virtual std::vector<int32_t> selectedPolygons() const = 0;

    [[nodiscard]] virtual HostPolygonType      polygonType(int32_t poly) const     = 0;
    [[nodiscard]] virtual std::vector<int32_t> polygonVertices(int32_t poly) const = 0;
    [[nodiscard]] virtual glm::vec3            vertexPosition(int32_t vert) const  = 0;

    /// @return Index into materials(), or nullopt when the polygon has no material.
    [[nodiscard]] virtual std::optional<int32_t> polygonMaterial(int32_t poly) const = 0;

    [[nodiscard]] virtual std::vector<SnapshotMaterial> materials() const = 0;

    [[nodiscard]] virtual std::vector<ChannelHandle> channels(ChannelKind kind) const        = 0;
    [[nodiscard]] virtual std::string                channelName(ChannelHandle channel) const = 0;

    /// @return Name of the primary UV channel, or empty when there is none.
    [[nodiscard]] virtual std::string primaryUvChannel() const = 0;

    virtual bool vertexValue(ChannelHandle channel, int32_t vert, float* out) const                = 0;
    virtual bool cornerValue(ChannelHandle channel, int32_t poly, int32_t corner, float* out) const = 0;
    virtual bool edgeValue(ChannelHandle channel, const EdgeKey& edge, float* out) const           = 0;
    virtual bool polygonInChannel(ChannelHandle channel, int32_t poly) const                       = 0;

    /// @return Vertices carrying a value in a vertex-domain channel, ascending.
    [[nodiscard]] virtual std::vector<int32_t> channelVertices(ChannelHandle channel) const = 0;

    /// @return Edges carrying a value in an edge-domain channel.
    [[nodiscard]] virtual std::vector<EdgeKey> channelEdges(ChannelHandle channel) const = 0;

    [[nodiscard]] virtual std::vector<EdgeKey> seamEdges() const = 0;

    [[nodiscard]] virtual bool hasEdge(const EdgeKey& edge) const = 0;

    // Mutation -----------------------------------------------------------

    virtual int32_t createVertex(const glm::vec3& pos) = 0;
    virtual int32_t createPolygon(const std::vector<int32_t>& verts, std::optional<int32_t> material, bool subdivision) = 0;

    /// Deletes the polygons; their vertices stay.
    virtual void deletePolygons(const std::vector<int32_t>& polys) = 0;

    /// Removes all geometry and channels of the mesh item.
    virtual void clear() = 0;

    [[nodiscard]] virtual std::optional<int32_t> findMaterial(std::string_view name) const = 0;

    virtual int32_t createMaterial(const SnapshotMaterial& material)                = 0;
    virtual void    updateMaterial(int32_t index, const SnapshotMaterial& material) = 0;

    [[nodiscard]] virtual ChannelHandle findChannel(ChannelKind kind, std::string_view name) const = 0;

    virtual ChannelHandle createChannel(ChannelKind kind, std::string_view name) = 0;
    virtual void          removeChannel(ChannelHandle channel)                   = 0;
    virtual void          clearChannel(ChannelHandle channel)                    = 0;

    virtual void setPrimaryUvChannel(std::string_view name) = 0;

    virtual void setVertexValue(ChannelHandle channel, int32_t vert, const float* value)                = 0;
    virtual void clearVertexValue(ChannelHandle channel, int32_t vert)                                 = 0;
    virtual void setCornerValue(ChannelHandle channel, int32_t poly, int32_t corner, const float* value) = 0;
    virtual void setEdgeValue(ChannelHandle channel, const EdgeKey& edge, const float* value)           = 0;
    virtual void setPolygonInChannel(ChannelHandle channel, int32_t poly, bool member)                 = 0;

    virtual void markSeam(const EdgeKey& edge) = 0;

    /// @return The channel of that kind and name, created when missing.
    ChannelHandle setOrCreateChannel(ChannelKind kind, std::string_view name)
    {
        const ChannelHandle channel = findChannel(kind, name);
        if (channel != kNoChannel)
            return channel;
        return createChannel(kind, name);
    }
};
