#include "SnapshotExtractor.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_map>
#include <unordered_set>

#include "ClipboardReport.hpp"
#include "MeshHost.hpp"
#include "PolygonTriangulator.hpp"

namespace
{
    /// Where the corners of a snapshot polygon come from on the host.
    struct CornerSource
    {
        int32_t              hostPoly = -1;
        std::vector<int32_t> hostCorners;
    };

    using VertexMap = std::unordered_map<int32_t, int32_t>;

    /// A polygon as it will be emitted, still in host vertex ids.
    struct PendingPolygon
    {
        std::vector<int32_t>   hostVerts;
        CornerSource           source;
        std::optional<int32_t> hostMaterial;
        bool                   subdivision = false;
        PolygonOrigin          origin      = PolygonOrigin::Regular;
    };

    /// @return The snapshot edge, or nullopt when no extracted polygon has it.
    std::optional<EdgeKey> mapEdge(const VertexMap& vertMap, const std::set<EdgeKey>& edges, const EdgeKey& edge)
    {
        const auto a = vertMap.find(edge.first);
        const auto b = vertMap.find(edge.second);
        if (a == vertMap.end() || b == vertMap.end())
            return std::nullopt;

        const EdgeKey mapped = makeEdgeKey(a->second, b->second);
        if (!edges.contains(mapped))
            return std::nullopt;
        return mapped;
    }
} // namespace

SnapshotExtractor::SnapshotExtractor(const MeshHost& host, std::string sourceApplication)
    : m_host{host}, m_sourceApplication{std::move(sourceApplication)}
{
}

ExtractionResult SnapshotExtractor::extract(SelectionMode mode, ClipboardReport& report) const
{
    ExtractionResult result;
    MeshSnapshot&    snap = result.snapshot;

    snap.convention                 = m_host.convention();
    snap.metadata.sourceApplication = m_sourceApplication;
    snap.metadata.objectName        = m_host.name();

    std::vector<int32_t> candidates;
    if (mode == SelectionMode::SelectedPolygons)
    {
        candidates = m_host.selectedPolygons();
        if (candidates.empty())
        {
            report.info("Nothing selected, using the whole mesh");
            candidates = m_host.allPolygons();
        }
    }
    else
    {
        candidates = m_host.allPolygons();
    }
    std::ranges::sort(candidates);

    // -----------------------------------------------------------------
    // Eligible polygons, split into triangles where irregular
    // -----------------------------------------------------------------
    std::vector<PendingPolygon> pending;

    for (int32_t poly : candidates)
    {
        const HostPolygonType type = m_host.polygonType(poly);
        if (type == HostPolygonType::Other)
        {
            report.warning(ClipboardStatus::ExtractionError,
                           "polygon " + std::to_string(poly) + " is not a face or subdivision polygon; skipped");
            continue;
        }

        const std::vector<int32_t> verts = m_host.polygonVertices(poly);

        const std::unordered_set<int32_t> distinct(verts.begin(), verts.end());
        if (distinct.size() < 3)
        {
            report.warning(ClipboardStatus::ExtractionError,
                           "polygon " + std::to_string(poly) + " has fewer than 3 distinct vertices; skipped");
            continue;
        }

        const std::optional<int32_t> material    = m_host.polygonMaterial(poly);
        const bool                   subdivision = type == HostPolygonType::Subdivision;

        std::vector<glm::vec3> points;
        points.reserve(verts.size());
        for (int32_t vert : verts)
            points.push_back(m_host.vertexPosition(vert));

        const bool         repeated = distinct.size() != verts.size();
        const PolygonShape shape    = repeated ? PolygonShape::SelfIntersecting : tri::classify(points);

        if (!tri::irregular(shape))
        {
            PendingPolygon pp;
            pp.hostVerts       = verts;
            pp.source.hostPoly = poly;
            for (int32_t corner = 0; corner < static_cast<int32_t>(verts.size()); ++corner)
                pp.source.hostCorners.push_back(corner);
            pp.hostMaterial = material;
            pp.subdivision  = subdivision;

            pending.push_back(std::move(pp));
            result.sourcePolygons.push_back(poly);
            continue;
        }

        int32_t emitted = 0;
        for (const Triangle& t : tri::triangulate(points))
        {
            const int32_t a = verts[t[0]];
            const int32_t b = verts[t[1]];
            const int32_t c = verts[t[2]];
            if (a == b || b == c || a == c)
                continue;

            PendingPolygon pp;
            pp.hostVerts    = {a, b, c};
            pp.source       = CornerSource{poly, {t[0], t[1], t[2]}};
            pp.hostMaterial = material;
            pp.subdivision  = subdivision;
            pp.origin       = PolygonOrigin::TriangulatedFromIrregular;

            pending.push_back(std::move(pp));
            ++emitted;
        }

        if (emitted == 0)
            report.warning(ClipboardStatus::ExtractionError,
                           "polygon " + std::to_string(poly) + " could not be triangulated; skipped");
        else
            result.sourcePolygons.push_back(poly);
    }

    // -----------------------------------------------------------------
    // Vertices used by the emitted polygons, in ascending host order
    // -----------------------------------------------------------------
    std::set<int32_t> usedVerts;
    for (const PendingPolygon& pp : pending)
        usedVerts.insert(pp.hostVerts.begin(), pp.hostVerts.end());

    VertexMap vertMap;
    for (int32_t vert : usedVerts)
    {
        vertMap[vert] = static_cast<int32_t>(snap.vertices.size());
        snap.vertices.push_back(SnapshotVertex{m_host.vertexPosition(vert)});
        result.sourceVertices.push_back(vert);
    }

    // -----------------------------------------------------------------
    // Polygons and the materials they reference
    // -----------------------------------------------------------------
    const std::vector<SnapshotMaterial> hostMaterials = m_host.materials();
    std::unordered_map<int32_t, int32_t> materialMap;

    auto mapMaterial = [&](std::optional<int32_t> hostIndex) -> std::optional<int32_t> {
        if (!hostIndex || *hostIndex < 0 || *hostIndex >= static_cast<int32_t>(hostMaterials.size()))
            return std::nullopt;

        if (auto it = materialMap.find(*hostIndex); it != materialMap.end())
            return it->second;

        const auto index        = static_cast<int32_t>(snap.materials.size());
        materialMap[*hostIndex] = index;
        snap.materials.push_back(hostMaterials[*hostIndex]);
        return index;
    };

    std::vector<CornerSource> cornerSources;
    std::set<EdgeKey>         snapEdges;

    for (PendingPolygon& pp : pending)
    {
        SnapshotPolygon sp;
        sp.material             = mapMaterial(pp.hostMaterial);
        sp.isSubdivisionSurface = pp.subdivision;
        sp.origin               = pp.origin;
        for (int32_t vert : pp.hostVerts)
            sp.vertices.push_back(vertMap.at(vert));

        const auto n = sp.vertices.size();
        for (size_t i = 0; i < n; ++i)
            snapEdges.insert(makeEdgeKey(sp.vertices[i], sp.vertices[(i + 1) % n]));

        snap.polygons.push_back(std::move(sp));
        cornerSources.push_back(std::move(pp.source));
    }

    // -----------------------------------------------------------------
    // Face-corner maps
    // -----------------------------------------------------------------
    const std::string primaryUv = m_host.primaryUvChannel();

    for (ChannelHandle channel : m_host.channels(ChannelKind::Uv))
    {
        SnapshotUvMap map;
        map.name    = m_host.channelName(channel);
        map.primary = !primaryUv.empty() && map.name == primaryUv;

        for (int32_t p = 0; p < snap.polygonCount(); ++p)
        {
            const CornerSource& source = cornerSources[p];
            for (int32_t k = 0; k < static_cast<int32_t>(source.hostCorners.size()); ++k)
            {
                float value[4] = {};
                if (m_host.cornerValue(channel, source.hostPoly, source.hostCorners[k], value))
                    map.values[CornerRef{p, k}] = glm::vec2(value[0], value[1]);
            }
        }
        snap.uvMaps.push_back(std::move(map));
    }

    for (ChannelKind kind : {ChannelKind::ColorRgb, ChannelKind::ColorRgba})
    {
        for (ChannelHandle channel : m_host.channels(kind))
        {
            SnapshotColorMap map;
            map.name = m_host.channelName(channel);
            map.kind = kind == ChannelKind::ColorRgba ? ColorKind::Rgba : ColorKind::Rgb;

            for (int32_t p = 0; p < snap.polygonCount(); ++p)
            {
                const CornerSource& source = cornerSources[p];
                for (int32_t k = 0; k < static_cast<int32_t>(source.hostCorners.size()); ++k)
                {
                    float value[4] = {0.f, 0.f, 0.f, 1.f};
                    if (m_host.cornerValue(channel, source.hostPoly, source.hostCorners[k], value))
                    {
                        const float alpha = map.kind == ColorKind::Rgba ? value[3] : 1.f;
                        map.values[CornerRef{p, k}] = glm::vec4(value[0], value[1], value[2], alpha);
                    }
                }
            }
            snap.colorMaps.push_back(std::move(map));
        }
    }

    // -----------------------------------------------------------------
    // Vertex maps, filtered to the exported vertices
    // -----------------------------------------------------------------
    for (ChannelHandle channel : m_host.channels(ChannelKind::Weight))
    {
        SnapshotWeightMap map;
        map.name = m_host.channelName(channel);

        for (int32_t vert : m_host.channelVertices(channel))
        {
            const auto it = vertMap.find(vert);
            if (it == vertMap.end())
                continue;

            float value[4] = {};
            if (m_host.vertexValue(channel, vert, value))
                map.weights[it->second] = value[0];
        }
        snap.weightMaps.push_back(std::move(map));
    }

    for (ChannelKind kind : {ChannelKind::RelativeMorph, ChannelKind::AbsoluteMorph})
    {
        for (ChannelHandle channel : m_host.channels(kind))
        {
            SnapshotMorph morph;
            morph.name = m_host.channelName(channel);
            morph.kind = kind == ChannelKind::AbsoluteMorph ? MorphKind::Absolute : MorphKind::Relative;

            for (int32_t vert : m_host.channelVertices(channel))
            {
                const auto it = vertMap.find(vert);
                if (it == vertMap.end())
                    continue;

                float value[4] = {};
                if (m_host.vertexValue(channel, vert, value))
                    morph.values[it->second] = glm::vec3(value[0], value[1], value[2]);
            }
            snap.morphs.push_back(std::move(morph));
        }
    }

    // -----------------------------------------------------------------
    // Edge data
    // -----------------------------------------------------------------
    for (ChannelHandle channel : m_host.channels(ChannelKind::Crease))
    {
        for (const EdgeKey& edge : m_host.channelEdges(channel))
        {
            const std::optional<EdgeKey> mapped = mapEdge(vertMap, snapEdges, edge);
            float                        value[4] = {};
            if (mapped && m_host.edgeValue(channel, edge, value))
                snap.subdivisionWeights.weights[*mapped] = value[0];
        }
    }

    // -----------------------------------------------------------------
    // Selection sets
    // -----------------------------------------------------------------
    for (ChannelHandle channel : m_host.channels(ChannelKind::VertexSet))
    {
        SnapshotSelectionSet set;
        set.name = m_host.channelName(channel);
        set.kind = SelectionKind::Vertex;
        for (int32_t vert : m_host.channelVertices(channel))
        {
            if (const auto it = vertMap.find(vert); it != vertMap.end())
                set.elements.insert(it->second);
        }
        snap.selectionSets.push_back(std::move(set));
    }

    for (ChannelHandle channel : m_host.channels(ChannelKind::EdgeSet))
    {
        SnapshotSelectionSet set;
        set.name = m_host.channelName(channel);
        set.kind = SelectionKind::Edge;
        for (const EdgeKey& edge : m_host.channelEdges(channel))
        {
            if (const std::optional<EdgeKey> mapped = mapEdge(vertMap, snapEdges, edge))
                set.edges.insert(*mapped);
        }
        snap.selectionSets.push_back(std::move(set));
    }

    for (ChannelHandle channel : m_host.channels(ChannelKind::PolygonSet))
    {
        SnapshotSelectionSet set;
        set.name = m_host.channelName(channel);
        set.kind = SelectionKind::Polygon;
        for (int32_t p = 0; p < snap.polygonCount(); ++p)
        {
            if (m_host.polygonInChannel(channel, cornerSources[p].hostPoly))
                set.elements.insert(p);
        }
        snap.selectionSets.push_back(std::move(set));
    }

    // Host seams travel as the "_Seam" edge set
    std::set<EdgeKey> seams;
    for (const EdgeKey& edge : m_host.seamEdges())
    {
        if (const std::optional<EdgeKey> mapped = mapEdge(vertMap, snapEdges, edge))
            seams.insert(*mapped);
    }

    if (!seams.empty())
    {
        auto it = std::ranges::find_if(snap.selectionSets, [](const SnapshotSelectionSet& s) {
            return s.kind == SelectionKind::Edge && s.name == kSeamSetName;
        });
        if (it == snap.selectionSets.end())
        {
            SnapshotSelectionSet set;
            set.name = std::string{kSeamSetName};
            set.kind = SelectionKind::Edge;
            snap.selectionSets.push_back(std::move(set));
            it = std::prev(snap.selectionSets.end());
        }
        it->edges.insert(seams.begin(), seams.end());
    }

    if (snap.polygons.empty())
        report.warning("No polygons were extracted");

    return result;
}
