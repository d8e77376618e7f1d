#include "SnapshotMerger.hpp"

#include <string>

#include "ClipboardReport.hpp"
#include "CoordinateTransform.hpp"
#include "MeshHost.hpp"

namespace
{
    /// Name of the crease channel created when the target has none.
    constexpr std::string_view kCreaseChannelName = "Subdivision";

    ChannelKind morphChannelKind(MorphKind kind) noexcept
    {
        return kind == MorphKind::Absolute ? ChannelKind::AbsoluteMorph : ChannelKind::RelativeMorph;
    }

    ChannelKind selectionChannelKind(SelectionKind kind) noexcept
    {
        switch (kind)
        {
            case SelectionKind::Vertex:
                return ChannelKind::VertexSet;
            case SelectionKind::Edge:
                return ChannelKind::EdgeSet;
            case SelectionKind::Polygon:
                return ChannelKind::PolygonSet;
        }
        return ChannelKind::VertexSet;
    }
} // namespace

SnapshotMerger::SnapshotMerger(MeshHost& host) : m_host{host}
{
}

MergeResult SnapshotMerger::merge(const MeshSnapshot& snapshot, MergeTarget target, ClipboardReport& report)
{
    MergeResult result;

    if (target == MergeTarget::NewItem)
        m_host.clear();

    const CoordinateTransform xf(m_host.convention(), snapshot.convention);
    const float               scale = snapshot.metadata.unitScale;

    if (!xf.identity())
    {
        report.info("Converting from " + std::string(conventionName(snapshot.convention)) + " to " +
                    std::string(conventionName(m_host.convention())));
    }

    std::vector<std::optional<int32_t>> materialMap;
    mergeMaterials(snapshot, materialMap, result);

    result.createdVertices.reserve(snapshot.vertices.size());
    for (const SnapshotVertex& vert : snapshot.vertices)
        result.createdVertices.push_back(m_host.createVertex(xf.toHost(vert.position) * scale));

    result.createdPolygons.reserve(snapshot.polygons.size());
    for (const SnapshotPolygon& poly : snapshot.polygons)
    {
        std::vector<int32_t> verts;
        verts.reserve(poly.vertices.size());
        for (int32_t id : poly.vertices)
            verts.push_back(result.createdVertices[id]);

        const std::optional<int32_t> material = poly.material ? materialMap[*poly.material] : std::nullopt;
        result.createdPolygons.push_back(m_host.createPolygon(verts, material, poly.isSubdivisionSurface));
    }

    mergeCornerMaps(snapshot, result, target);
    mergeVertexMaps(snapshot, result, xf, scale, report);
    mergeEdgeData(snapshot, result, report);
    mergeSelectionSets(snapshot, result);

    if (result.edgesSkipped > 0)
        report.info(std::to_string(result.edgesSkipped) + " edge references had no matching edge and were skipped");

    report.info("Merged " + std::to_string(result.createdVertices.size()) + " vertices and " +
                std::to_string(result.createdPolygons.size()) + " polygons into '" + m_host.name() + "'");
    return result;
}

void SnapshotMerger::mergeMaterials(const MeshSnapshot& snapshot, std::vector<std::optional<int32_t>>& materialMap,
                                    MergeResult& result)
{
    materialMap.reserve(snapshot.materials.size());

    for (const SnapshotMaterial& material : snapshot.materials)
    {
        if (const std::optional<int32_t> existing = m_host.findMaterial(material.name))
        {
            m_host.updateMaterial(*existing, material);
            materialMap.push_back(existing);
            ++result.materialsReused;
        }
        else
        {
            materialMap.push_back(m_host.createMaterial(material));
            ++result.materialsCreated;
        }
    }
}

void SnapshotMerger::mergeCornerMaps(const MeshSnapshot& snapshot, const MergeResult& result, MergeTarget target)
{
    const std::string currentPrimary = target == MergeTarget::NewItem ? std::string{} : m_host.primaryUvChannel();

    for (const SnapshotUvMap& map : snapshot.uvMaps)
    {
        const ChannelHandle channel = m_host.setOrCreateChannel(ChannelKind::Uv, map.name);
        for (const auto& [ref, uv] : map.values)
            m_host.setCornerValue(channel, result.createdPolygons[ref.polygon], ref.corner, &uv[0]);

        if (map.primary && currentPrimary.empty())
            m_host.setPrimaryUvChannel(map.name);
    }

    for (const SnapshotColorMap& map : snapshot.colorMaps)
    {
        const ChannelKind kind  = map.kind == ColorKind::Rgba ? ChannelKind::ColorRgba : ChannelKind::ColorRgb;
        const ChannelKind other = map.kind == ColorKind::Rgba ? ChannelKind::ColorRgb : ChannelKind::ColorRgba;

        // A same-name map of the other color kind is extended in its own kind
        ChannelHandle channel = m_host.findChannel(kind, map.name);
        if (channel == kNoChannel)
            channel = m_host.findChannel(other, map.name);
        if (channel == kNoChannel)
            channel = m_host.createChannel(kind, map.name);

        for (const auto& [ref, color] : map.values)
            m_host.setCornerValue(channel, result.createdPolygons[ref.polygon], ref.corner, &color[0]);
    }
}

void SnapshotMerger::mergeVertexMaps(const MeshSnapshot& snapshot, const MergeResult& result,
                                     const CoordinateTransform& xf, float scale, ClipboardReport& report)
{
    for (const SnapshotWeightMap& map : snapshot.weightMaps)
    {
        const ChannelHandle channel = m_host.setOrCreateChannel(ChannelKind::Weight, map.name);
        for (const auto& [vert, weight] : map.weights)
            m_host.setVertexValue(channel, result.createdVertices[vert], &weight);
    }

    for (const SnapshotMorph& morph : snapshot.morphs)
    {
        const ChannelKind kind  = morphChannelKind(morph.kind);
        const ChannelKind other = morph.kind == MorphKind::Absolute ? ChannelKind::RelativeMorph
                                                                    : ChannelKind::AbsoluteMorph;

        if (const ChannelHandle stale = m_host.findChannel(other, morph.name); stale != kNoChannel)
        {
            report.info("Morph '" + morph.name + "' recreated as " +
                        (morph.kind == MorphKind::Absolute ? "absolute" : "relative"));
            m_host.removeChannel(stale);
        }

        const ChannelHandle channel = m_host.setOrCreateChannel(kind, morph.name);

        // Replace, never blend, the data of the incoming vertices
        for (int32_t vert : result.createdVertices)
            m_host.clearVertexValue(channel, vert);

        for (const auto& [vert, value] : morph.values)
        {
            const glm::vec3 hostValue = xf.toHost(value) * scale;
            m_host.setVertexValue(channel, result.createdVertices[vert], &hostValue[0]);
        }
    }
}

void SnapshotMerger::mergeEdgeData(const MeshSnapshot& snapshot, MergeResult& result, ClipboardReport& report)
{
    const auto& creases = snapshot.subdivisionWeights.weights;
    if (creases.empty())
        return;

    const std::vector<ChannelHandle> existing = m_host.channels(ChannelKind::Crease);
    const ChannelHandle channel = existing.empty() ? m_host.createChannel(ChannelKind::Crease, kCreaseChannelName)
                                                   : existing.front();

    int32_t applied = 0;
    for (const auto& [edge, weight] : creases)
    {
        const std::optional<EdgeKey> target = hostEdge(edge, result);
        if (!target)
        {
            ++result.edgesSkipped;
            continue;
        }
        m_host.setEdgeValue(channel, *target, &weight);
        ++applied;
    }

    report.info("Applied " + std::to_string(applied) + " subdivision weights");
}

void SnapshotMerger::mergeSelectionSets(const MeshSnapshot& snapshot, MergeResult& result)
{
    const SnapshotSelectionSet* seams = snapshot.seamSet();

    for (const SnapshotSelectionSet& set : snapshot.selectionSets)
    {
        if (&set == seams)
        {
            for (const EdgeKey& edge : set.edges)
            {
                if (const std::optional<EdgeKey> target = hostEdge(edge, result))
                    m_host.markSeam(*target);
                else
                    ++result.edgesSkipped;
            }
            continue;
        }

        const ChannelHandle channel = m_host.setOrCreateChannel(selectionChannelKind(set.kind), set.name);

        switch (set.kind)
        {
            case SelectionKind::Vertex:
                for (int32_t vert : set.elements)
                    m_host.setVertexValue(channel, result.createdVertices[vert], nullptr);
                break;

            case SelectionKind::Polygon:
                for (int32_t poly : set.elements)
                    m_host.setPolygonInChannel(channel, result.createdPolygons[poly], true);
                break;

            case SelectionKind::Edge:
                if (set.name == kFreestyleSetName)
                    m_host.clearChannel(channel);

                for (const EdgeKey& edge : set.edges)
                {
                    if (const std::optional<EdgeKey> target = hostEdge(edge, result))
                        m_host.setEdgeValue(channel, *target, nullptr);
                    else
                        ++result.edgesSkipped;
                }
                break;
        }
    }
}

std::optional<EdgeKey> SnapshotMerger::hostEdge(const EdgeKey& edge, const MergeResult& result) const
{
    const EdgeKey target = makeEdgeKey(result.createdVertices[edge.first], result.createdVertices[edge.second]);
    if (!m_host.hasEdge(target))
        return std::nullopt;
    return target;
}
