#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "MeshSnapshot.hpp"

class CoordinateTransform;
class MeshHost;
struct ClipboardReport;

enum class MergeTarget : uint8_t
{
    ExistingItem, ///< Append to the mesh as it is.
    NewItem       ///< Clear the mesh first.
};

struct MergeResult
{
    std::vector<int32_t> createdVertices; ///< Host vertex per snapshot vertex.
    std::vector<int32_t> createdPolygons; ///< Host polygon per snapshot polygon.
    int32_t              materialsCreated = 0;
    int32_t              materialsReused  = 0;
    int32_t              edgesSkipped     = 0; ///< Crease/set/seam edges absent from the target.
};

/**
 * @brief Applies a validated snapshot to a host mesh.
 *
 * Geometry is always appended, never welded. Named data (materials, UV and
 * color maps, weight maps, morphs, selection sets) is matched by exact,
 * case-sensitive name and extended, or created. Positions and morph vectors
 * are converted into the host convention and scaled by metadata.unitScale.
 */
class SnapshotMerger
{
public:
    explicit SnapshotMerger(MeshHost& host);

    MergeResult merge(const MeshSnapshot& snapshot, MergeTarget target, ClipboardReport& report);

private:
    void mergeMaterials(const MeshSnapshot& snapshot, std::vector<std::optional<int32_t>>& materialMap,
                        MergeResult& result);
    void mergeCornerMaps(const MeshSnapshot& snapshot, const MergeResult& result, MergeTarget target);
    void mergeVertexMaps(const MeshSnapshot& snapshot, const MergeResult& result, const CoordinateTransform& xf,
                         float scale, ClipboardReport& report);
    void mergeEdgeData(const MeshSnapshot& snapshot, MergeResult& result, ClipboardReport& report);
    void mergeSelectionSets(const MeshSnapshot& snapshot, MergeResult& result);

    /// @return The snapshot edge in host numbering, when the host has that edge.
    std::optional<EdgeKey> hostEdge(const EdgeKey& edge, const MergeResult& result) const;

    MeshHost& m_host;
};
