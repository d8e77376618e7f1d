#include "MeshSnapshot.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

#include "ClipboardReport.hpp"

const SnapshotUvMap* MeshSnapshot::primaryUvMap() const noexcept
{
    for (const SnapshotUvMap& map : uvMaps)
    {
        if (map.primary)
            return &map;
    }
    return nullptr;
}

const SnapshotSelectionSet* MeshSnapshot::findSelectionSet(std::string_view name, SelectionKind kind) const noexcept
{
    for (const SnapshotSelectionSet& set : selectionSets)
    {
        if (set.kind == kind && set.name == name)
            return &set;
    }
    return nullptr;
}

const SnapshotSelectionSet* MeshSnapshot::seamSet() const noexcept
{
    if (const SnapshotSelectionSet* set = findSelectionSet(kSeamSetName, SelectionKind::Edge))
        return set;

    if (const SnapshotUvMap* uv = primaryUvMap())
        return findSelectionSet(uv->name, SelectionKind::Edge);

    return nullptr;
}

namespace
{
    std::string polyLabel(int32_t poly)
    {
        return "polygon " + std::to_string(poly);
    }

    bool validVertex(const MeshSnapshot& snapshot, int32_t vert) noexcept
    {
        return vert >= 0 && vert < snapshot.vertexCount();
    }

    bool validEdge(const MeshSnapshot& snapshot, const EdgeKey& edge) noexcept
    {
        return validVertex(snapshot, edge.first) && validVertex(snapshot, edge.second) && edge.first != edge.second;
    }

    bool validCorner(const MeshSnapshot& snapshot, const CornerRef& ref) noexcept
    {
        if (ref.polygon < 0 || ref.polygon >= snapshot.polygonCount())
            return false;
        const auto cornerCount = static_cast<int32_t>(snapshot.polygons[ref.polygon].vertices.size());
        return ref.corner >= 0 && ref.corner < cornerCount;
    }

    bool validatePolygons(const MeshSnapshot& snapshot, ClipboardReport& report)
    {
        const auto materialCount = static_cast<int32_t>(snapshot.materials.size());

        for (int32_t p = 0; p < snapshot.polygonCount(); ++p)
        {
            const SnapshotPolygon& poly = snapshot.polygons[p];

            if (poly.vertices.size() < 3)
            {
                report.error(ClipboardStatus::MalformedReference, polyLabel(p) + " has fewer than 3 vertices");
                return false;
            }

            std::unordered_set<int32_t> seen;
            for (int32_t vert : poly.vertices)
            {
                if (!validVertex(snapshot, vert))
                {
                    report.error(ClipboardStatus::MalformedReference,
                                 polyLabel(p) + " references missing vertex " + std::to_string(vert));
                    return false;
                }
                if (!seen.insert(vert).second)
                {
                    report.error(ClipboardStatus::MalformedReference,
                                 polyLabel(p) + " repeats vertex " + std::to_string(vert));
                    return false;
                }
            }

            if (poly.material && (*poly.material < 0 || *poly.material >= materialCount))
            {
                report.error(ClipboardStatus::MalformedReference,
                             polyLabel(p) + " references missing material " + std::to_string(*poly.material));
                return false;
            }
        }
        return true;
    }

    template<typename Map>
    bool validateCornerMap(const MeshSnapshot& snapshot, const Map& map, const char* what, ClipboardReport& report)
    {
        for (const auto& [ref, value] : map.values)
        {
            if (!validCorner(snapshot, ref))
            {
                report.error(ClipboardStatus::MalformedReference,
                             std::string(what) + " '" + map.name + "' references missing corner " +
                                 std::to_string(ref.corner) + " of " + polyLabel(ref.polygon));
                return false;
            }
        }
        return true;
    }

    bool validateSelectionSet(const MeshSnapshot& snapshot, const SnapshotSelectionSet& set, ClipboardReport& report)
    {
        const std::string label = "selection set '" + set.name + "'";

        switch (set.kind)
        {
            case SelectionKind::Vertex:
                for (int32_t vert : set.elements)
                {
                    if (!validVertex(snapshot, vert))
                    {
                        report.error(ClipboardStatus::MalformedReference,
                                     label + " references missing vertex " + std::to_string(vert));
                        return false;
                    }
                }
                break;
            case SelectionKind::Polygon:
                for (int32_t poly : set.elements)
                {
                    if (poly < 0 || poly >= snapshot.polygonCount())
                    {
                        report.error(ClipboardStatus::MalformedReference, label + " references missing " + polyLabel(poly));
                        return false;
                    }
                }
                break;
            case SelectionKind::Edge:
                for (const EdgeKey& edge : set.edges)
                {
                    if (!validEdge(snapshot, edge))
                    {
                        report.error(ClipboardStatus::MalformedReference,
                                     label + " references invalid edge " + std::to_string(edge.first) + "-" +
                                         std::to_string(edge.second));
                        return false;
                    }
                }
                break;
        }
        return true;
    }
} // namespace

bool validateSnapshot(const MeshSnapshot& snapshot, ClipboardReport& report)
{
    if (!validatePolygons(snapshot, report))
        return false;

    for (const SnapshotUvMap& map : snapshot.uvMaps)
    {
        if (!validateCornerMap(snapshot, map, "UV map", report))
            return false;
    }

    for (const SnapshotColorMap& map : snapshot.colorMaps)
    {
        if (!validateCornerMap(snapshot, map, "color map", report))
            return false;
    }

    for (const SnapshotWeightMap& map : snapshot.weightMaps)
    {
        for (const auto& [vert, weight] : map.weights)
        {
            if (!validVertex(snapshot, vert))
            {
                report.error(ClipboardStatus::MalformedReference,
                             "weight map '" + map.name + "' references missing vertex " + std::to_string(vert));
                return false;
            }
        }
    }

    for (const SnapshotMorph& morph : snapshot.morphs)
    {
        for (const auto& [vert, value] : morph.values)
        {
            if (!validVertex(snapshot, vert))
            {
                report.error(ClipboardStatus::MalformedReference,
                             "morph '" + morph.name + "' references missing vertex " + std::to_string(vert));
                return false;
            }
        }
    }

    for (const auto& [edge, weight] : snapshot.subdivisionWeights.weights)
    {
        if (!validEdge(snapshot, edge))
        {
            report.error(ClipboardStatus::MalformedReference,
                         "subdivision weight references invalid edge " + std::to_string(edge.first) + "-" +
                             std::to_string(edge.second));
            return false;
        }
    }

    for (const SnapshotSelectionSet& set : snapshot.selectionSets)
    {
        if (!validateSelectionSet(snapshot, set, report))
            return false;
    }

    return true;
}

void clampSnapshotWeights(MeshSnapshot& snapshot, ClipboardReport& report)
{
    for (SnapshotWeightMap& map : snapshot.weightMaps)
    {
        bool clamped = false;
        for (auto& [vert, weight] : map.weights)
        {
            const float c = std::clamp(weight, 0.f, 1.f);
            clamped |= c != weight;
            weight = c;
        }
        if (clamped)
            report.warning("weight map '" + map.name + "' had values outside [0, 1]; clamped");
    }

    bool clamped = false;
    for (auto& [edge, weight] : snapshot.subdivisionWeights.weights)
    {
        const float c = std::clamp(weight, 0.f, 1.f);
        clamped |= c != weight;
        weight = c;
    }
    if (clamped)
        report.warning("subdivision weights had values outside [0, 1]; clamped");
}

std::string_view conventionName(CoordinateConvention convention) noexcept
{
    switch (convention)
    {
        case CoordinateConvention::RH_Yup:
            return "RH_Yup";
        case CoordinateConvention::LH_Zup:
            return "LH_Zup";
    }
    return "RH_Yup";
}

std::optional<CoordinateConvention> parseConvention(std::string_view name) noexcept
{
    if (name == "RH_Yup")
        return CoordinateConvention::RH_Yup;
    if (name == "LH_Zup")
        return CoordinateConvention::LH_Zup;
    return std::nullopt;
}
