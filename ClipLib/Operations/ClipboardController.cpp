#include "ClipboardController.hpp"

#include <utility>

#include "ClipboardReport.hpp"
#include "ClipboardTransport.hpp"
#include "CoordinateTransform.hpp"
#include "MeshHost.hpp"
#include "MeshScene.hpp"
#include "SnapshotCodec.hpp"
#include "SnapshotMerger.hpp"

namespace
{
    constexpr std::string_view kDefaultMeshName = "Mesh";
}

std::string_view operationName(ClipboardOperation operation) noexcept
{
    switch (operation)
    {
        case ClipboardOperation::Copy:
            return "Copy";
        case ClipboardOperation::Cut:
            return "Cut";
        case ClipboardOperation::Paste:
            return "Paste";
        case ClipboardOperation::NewMesh:
            return "NewMesh";
    }
    return "Unknown";
}

std::string_view phaseName(ClipboardPhase phase) noexcept
{
    switch (phase)
    {
        case ClipboardPhase::Idle:
            return "Idle";
        case ClipboardPhase::Extracting:
            return "Extracting";
        case ClipboardPhase::Encoding:
            return "Encoding";
        case ClipboardPhase::Writing:
            return "Writing";
        case ClipboardPhase::Deleting:
            return "Deleting";
        case ClipboardPhase::Reading:
            return "Reading";
        case ClipboardPhase::Decoding:
            return "Decoding";
        case ClipboardPhase::Merging:
            return "Merging";
        case ClipboardPhase::Finished:
            return "Finished";
        case ClipboardPhase::Failed:
            return "Failed";
    }
    return "Unknown";
}

ClipboardController::ClipboardController(ClipboardTransport& transport, ClipboardOptions options)
    : m_transport{transport}, m_options{std::move(options)}
{
}

void ClipboardController::setOptions(const ClipboardOptions& options)
{
    m_options = options;
}

bool ClipboardController::run(ClipboardOperation operation, MeshScene& scene, ClipboardReport& report)
{
    switch (operation)
    {
        case ClipboardOperation::Copy:
            return copy(scene, report);
        case ClipboardOperation::Cut:
            return cut(scene, report);
        case ClipboardOperation::Paste:
            return paste(scene, report);
        case ClipboardOperation::NewMesh:
            return newMeshFromClipboard(scene, report);
    }
    return false;
}

bool ClipboardController::copy(MeshScene& scene, ClipboardReport& report)
{
    enter(ClipboardPhase::Idle);

    MeshHost* host = scene.activeMesh();
    if (!host)
    {
        report.error(ClipboardStatus::NoTarget, "Copy: no active mesh");
        return fail(report);
    }
    return writeSelection(*host, false, report);
}

bool ClipboardController::cut(MeshScene& scene, ClipboardReport& report)
{
    enter(ClipboardPhase::Idle);

    MeshHost* host = scene.activeMesh();
    if (!host)
    {
        report.error(ClipboardStatus::NoTarget, "Cut: no active mesh");
        return fail(report);
    }
    return writeSelection(*host, true, report);
}

bool ClipboardController::paste(MeshScene& scene, ClipboardReport& report)
{
    enter(ClipboardPhase::Idle);

    MeshHost* host = scene.activeMesh();
    if (!host)
    {
        report.error(ClipboardStatus::NoTarget, "Paste: no active mesh");
        return fail(report);
    }

    MeshSnapshot snapshot;
    if (!readSnapshot(snapshot, report))
        return fail(report);

    enter(ClipboardPhase::Merging);
    SnapshotMerger merger(*host);
    merger.merge(snapshot, MergeTarget::ExistingItem, report);

    enter(ClipboardPhase::Finished);
    return true;
}

bool ClipboardController::newMeshFromClipboard(MeshScene& scene, ClipboardReport& report)
{
    enter(ClipboardPhase::Idle);

    MeshSnapshot snapshot;
    if (!readSnapshot(snapshot, report))
        return fail(report);

    const std::string_view name =
        snapshot.metadata.objectName.empty() ? kDefaultMeshName : std::string_view{snapshot.metadata.objectName};

    MeshHost* host = scene.createMesh(name);
    if (!host)
    {
        report.error(ClipboardStatus::NoTarget, "New Mesh: the scene could not create a mesh item");
        return fail(report);
    }

    enter(ClipboardPhase::Merging);
    SnapshotMerger merger(*host);
    merger.merge(snapshot, MergeTarget::NewItem, report);

    enter(ClipboardPhase::Finished);
    return true;
}

bool ClipboardController::writeSelection(MeshHost& host, bool deleteSource, ClipboardReport& report)
{
    enter(ClipboardPhase::Extracting);
    const SnapshotExtractor extractor(host, m_options.sourceApplication);
    ExtractionResult        extracted = extractor.extract(m_options.selectionMode, report);

    if (extracted.snapshot.empty())
        report.warning("Nothing to copy; an empty payload is written");

    if (m_options.exchangeConvention && *m_options.exchangeConvention != extracted.snapshot.convention)
        convertSnapshot(extracted.snapshot, *m_options.exchangeConvention);

    enter(ClipboardPhase::Encoding);
    const SnapshotCodec codec(m_options.indent);
    const std::string   payload = codec.encode(extracted.snapshot);

    enter(ClipboardPhase::Writing);
    if (!m_transport.write(payload, report))
    {
        if (report.ok())
            report.error(ClipboardStatus::TransportError,
                         std::string("write through ") + std::string(m_transport.transportName()) + " failed");
        return fail(report);
    }

    report.info("Copied " + std::to_string(extracted.snapshot.vertexCount()) + " vertices and " +
                std::to_string(extracted.snapshot.polygonCount()) + " polygons from '" + host.name() + "' via " +
                std::string(m_transport.transportName()));

    if (deleteSource)
    {
        enter(ClipboardPhase::Deleting);
        host.deletePolygons(extracted.sourcePolygons);
        report.info("Removed " + std::to_string(extracted.sourcePolygons.size()) + " polygons");
    }

    enter(ClipboardPhase::Finished);
    return true;
}

bool ClipboardController::readSnapshot(MeshSnapshot& snapshot, ClipboardReport& report)
{
    enter(ClipboardPhase::Reading);
    std::string payload;
    if (!m_transport.read(payload, report))
    {
        if (report.ok())
            report.error(ClipboardStatus::TransportError,
                         std::string("read through ") + std::string(m_transport.transportName()) + " failed");
        return false;
    }

    enter(ClipboardPhase::Decoding);
    const SnapshotCodec codec;
    return codec.decode(payload, snapshot, report);
}

void ClipboardController::enter(ClipboardPhase phase) noexcept
{
    m_phase = phase;
}

bool ClipboardController::fail(ClipboardReport& report)
{
    report.info(std::string("Operation stopped while ") + std::string(phaseName(m_phase)));
    m_phase = ClipboardPhase::Failed;
    return false;
}
