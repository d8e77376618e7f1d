#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "MeshSnapshot.hpp"

class MeshHost;
struct ClipboardReport;

enum class SelectionMode : uint8_t
{
    SelectedPolygons,
    WholeMesh
};

/// Snapshot plus the host elements it was built from. Cut deletes sourcePolygons.
struct ExtractionResult
{
    MeshSnapshot         snapshot;
    std::vector<int32_t> sourcePolygons; ///< Host polygons exported, ascending.
    std::vector<int32_t> sourceVertices; ///< Host vertices exported; index = snapshot vertex id.
};

/**
 * @brief Builds a MeshSnapshot from a host mesh selection.
 *
 * The snapshot is expressed in the host's own coordinate convention; positions
 * are copied verbatim. Unsupported polygons are skipped with an ExtractionError
 * warning; extraction itself never fails.
 */
class SnapshotExtractor
{
public:
    explicit SnapshotExtractor(const MeshHost& host, std::string sourceApplication = "MeshClip");

    ExtractionResult extract(SelectionMode mode, ClipboardReport& report) const;

private:
    const MeshHost& m_host;
    std::string     m_sourceApplication;
};
