#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "MeshSnapshot.hpp"
#include "SnapshotExtractor.hpp"

class ClipboardTransport;
class MeshHost;
class MeshScene;
struct ClipboardReport;

enum class ClipboardOperation : uint8_t
{
    Copy,
    Cut,
    Paste,
    NewMesh
};

/// Steps an operation walks through. Every run ends in Finished or Failed.
enum class ClipboardPhase : uint8_t
{
    Idle,
    Extracting,
    Encoding,
    Writing,
    Deleting,
    Reading,
    Decoding,
    Merging,
    Finished,
    Failed
};

struct ClipboardOptions
{
    SelectionMode selectionMode = SelectionMode::SelectedPolygons;

    /// Convention written into copied payloads; the host's own when unset.
    std::optional<CoordinateConvention> exchangeConvention;

    std::string sourceApplication = "MeshClip";

    /// JSON indentation of written payloads; negative for compact output.
    int indent = -1;
};

std::string_view operationName(ClipboardOperation operation) noexcept;
std::string_view phaseName(ClipboardPhase phase) noexcept;

/**
 * @brief Runs Copy, Cut, Paste and New Mesh against a scene through a transport.
 *
 * Copy/Cut: extract -> encode -> write (-> delete source polygons for Cut).
 * Paste/New Mesh: read -> decode -> merge. Nothing in the scene is changed
 * unless every step before the mutation succeeded.
 */
class ClipboardController
{
public:
    explicit ClipboardController(ClipboardTransport& transport, ClipboardOptions options = {});

    bool copy(MeshScene& scene, ClipboardReport& report);
    bool cut(MeshScene& scene, ClipboardReport& report);
    bool paste(MeshScene& scene, ClipboardReport& report);
    bool newMeshFromClipboard(MeshScene& scene, ClipboardReport& report);

    bool run(ClipboardOperation operation, MeshScene& scene, ClipboardReport& report);

    [[nodiscard]] ClipboardPhase phase() const noexcept
    {
        return m_phase;
    }

    [[nodiscard]] const ClipboardOptions& options() const noexcept
    {
        return m_options;
    }

    void setOptions(const ClipboardOptions& options);

private:
    bool writeSelection(MeshHost& host, bool deleteSource, ClipboardReport& report);
    bool readSnapshot(MeshSnapshot& snapshot, ClipboardReport& report);

    void enter(ClipboardPhase phase) noexcept;
    bool fail(ClipboardReport& report);

    ClipboardTransport& m_transport;
    ClipboardOptions    m_options;
    ClipboardPhase      m_phase = ClipboardPhase::Idle;
};
