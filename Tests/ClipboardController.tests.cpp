#include "ClipboardController.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "SnapshotCodec.hpp"
#include "TestHelpers.hpp"

using namespace cliptest;

namespace
{
    MeshSnapshot decodePayload(const MemoryTransport& transport)
    {
        MeshSnapshot    snapshot;
        ClipboardReport report;
        EXPECT_TRUE(transport.payload.has_value());
        EXPECT_TRUE(SnapshotCodec{}.decode(transport.payload.value_or(""), snapshot, report));
        return snapshot;
    }
} // namespace

TEST(ClipboardController, copy_then_paste_duplicates_the_selected_polygon)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.select_poly(1, true);

    MemoryTransport     transport;
    ClipboardController controller(transport);

    ClipboardReport copyReport;
    ASSERT_TRUE(controller.copy(scene, copyReport));
    EXPECT_TRUE(copyReport.ok());
    EXPECT_EQ(controller.phase(), ClipboardPhase::Finished);
    EXPECT_EQ(transport.writes, 1);

    ClipboardReport pasteReport;
    ASSERT_TRUE(controller.paste(scene, pasteReport));
    EXPECT_TRUE(pasteReport.ok());
    EXPECT_EQ(controller.phase(), ClipboardPhase::Finished);

    ASSERT_EQ(sys.num_polys(), 3u);
    ASSERT_TRUE(sys.poly_valid(2));
    EXPECT_EQ(sys.num_verts(), 10u);

    const SysPolyVerts& source = sys.poly_verts(1);
    const SysPolyVerts& pasted = sys.poly_verts(2);
    ASSERT_EQ(pasted.size(), source.size());
    for (size_t i = 0; i < source.size(); ++i)
    {
        EXPECT_NE(pasted[i], source[i]);
        EXPECT_TRUE(near(sys.vert_position(pasted[i]), sys.vert_position(source[i])));
    }
}

TEST(ClipboardController, cut_removes_exactly_the_selected_polygons)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.select_poly(0, true);

    MemoryTransport     transport;
    ClipboardController controller(transport);

    ClipboardReport report;
    ASSERT_TRUE(controller.cut(scene, report));
    EXPECT_TRUE(report.ok());

    EXPECT_FALSE(sys.poly_valid(0));
    EXPECT_TRUE(sys.poly_valid(1));
    EXPECT_EQ(sys.num_polys(), 1u);
    EXPECT_EQ(sys.num_verts(), 6u);

    const MeshSnapshot copied = decodePayload(transport);
    EXPECT_EQ(copied.vertexCount(), 4);
    EXPECT_EQ(copied.polygonCount(), 1);
}

TEST(ClipboardController, failed_write_on_cut_deletes_nothing)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.select_poly(0, true);

    MemoryTransport transport;
    transport.failWrites = true;
    ClipboardController controller(transport);

    ClipboardReport report;
    EXPECT_FALSE(controller.cut(scene, report));
    EXPECT_EQ(report.status, ClipboardStatus::TransportError);
    EXPECT_EQ(controller.phase(), ClipboardPhase::Failed);
    EXPECT_TRUE(sys.poly_valid(0));
    EXPECT_EQ(sys.num_polys(), 2u);
}

TEST(ClipboardController, operations_without_an_active_mesh_have_no_target)
{
    Scene           scene;
    MemoryTransport transport;
    transport.payload = "{}";
    ClipboardController controller(transport);

    ClipboardReport copyReport;
    EXPECT_FALSE(controller.copy(scene, copyReport));
    EXPECT_EQ(copyReport.status, ClipboardStatus::NoTarget);

    ClipboardReport cutReport;
    EXPECT_FALSE(controller.cut(scene, cutReport));
    EXPECT_EQ(cutReport.status, ClipboardStatus::NoTarget);

    ClipboardReport pasteReport;
    EXPECT_FALSE(controller.paste(scene, pasteReport));
    EXPECT_EQ(pasteReport.status, ClipboardStatus::NoTarget);
    EXPECT_EQ(controller.phase(), ClipboardPhase::Failed);

    EXPECT_EQ(transport.writes, 0);
    EXPECT_TRUE(scene.sceneMeshes().empty());
}

TEST(ClipboardController, new_mesh_is_named_after_the_copied_object)
{
    Scene      scene;
    SceneMesh* crate = scene.createSceneMesh("Crate");
    addQuad(*crate->sysMesh());

    MemoryTransport     transport;
    ClipboardController controller(transport);

    // Nothing selected: the whole mesh is copied
    ClipboardReport copyReport;
    ASSERT_TRUE(controller.copy(scene, copyReport));

    ClipboardReport report;
    ASSERT_TRUE(controller.newMeshFromClipboard(scene, report));
    EXPECT_TRUE(report.ok());

    ASSERT_EQ(scene.sceneMeshes().size(), 2u);
    SceneMesh* created = scene.activeSceneMesh();
    ASSERT_NE(created, crate);
    EXPECT_EQ(created->name(), "Crate");
    EXPECT_EQ(created->sysMesh()->num_polys(), 1u);
    EXPECT_EQ(created->sysMesh()->num_verts(), 4u);
    EXPECT_EQ(crate->sysMesh()->num_polys(), 1u);
}

TEST(ClipboardController, failed_read_or_decode_changes_nothing)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Plane");
    addQuad(*mesh->sysMesh());

    MemoryTransport     transport;
    ClipboardController controller(transport);

    ClipboardReport emptyReport;
    EXPECT_FALSE(controller.newMeshFromClipboard(scene, emptyReport));
    EXPECT_EQ(emptyReport.status, ClipboardStatus::TransportError);
    EXPECT_EQ(controller.phase(), ClipboardPhase::Failed);

    transport.payload = "this is not a mesh";

    ClipboardReport newMeshReport;
    EXPECT_FALSE(controller.newMeshFromClipboard(scene, newMeshReport));
    EXPECT_EQ(newMeshReport.status, ClipboardStatus::ParseError);

    ClipboardReport pasteReport;
    EXPECT_FALSE(controller.paste(scene, pasteReport));
    EXPECT_EQ(pasteReport.status, ClipboardStatus::ParseError);

    transport.payload = R"({"schemaVersion": 7, "vertices": [], "polygons": []})";

    ClipboardReport versionReport;
    EXPECT_FALSE(controller.paste(scene, versionReport));
    EXPECT_EQ(versionReport.status, ClipboardStatus::UnsupportedVersion);

    EXPECT_EQ(scene.sceneMeshes().size(), 1u);
    EXPECT_EQ(scene.activeSceneMesh(), mesh);
    EXPECT_EQ(mesh->sysMesh()->num_polys(), 1u);
    EXPECT_EQ(mesh->sysMesh()->num_verts(), 4u);
}

TEST(ClipboardController, exchange_convention_is_written_into_the_payload)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Plane");
    addQuad(*mesh->sysMesh());

    MemoryTransport  transport;
    ClipboardOptions options;
    options.exchangeConvention = CoordinateConvention::LH_Zup;
    ClipboardController controller(transport, options);

    ClipboardReport report;
    ASSERT_TRUE(controller.copy(scene, report));

    const nlohmann::json j = nlohmann::json::parse(*transport.payload);
    EXPECT_EQ(j.at("coordinateConvention"), "LH_Zup");

    // (0, 1, 0) in RH_Yup is (0, 0, 1) in LH_Zup
    const nlohmann::json& top = j.at("vertices").at(3);
    EXPECT_FLOAT_EQ(top.at(0).get<float>(), 0.f);
    EXPECT_FLOAT_EQ(top.at(1).get<float>(), 0.f);
    EXPECT_FLOAT_EQ(top.at(2).get<float>(), 1.f);

    // Pasting back into the RH_Yup scene restores the original positions
    ClipboardReport pasteReport;
    ASSERT_TRUE(controller.paste(scene, pasteReport));

    const SysMesh&      sys    = *mesh->sysMesh();
    const SysPolyVerts& source = sys.poly_verts(0);
    const SysPolyVerts& pasted = sys.poly_verts(1);
    for (size_t i = 0; i < source.size(); ++i)
        EXPECT_EQ(sys.vert_position(pasted[i]), sys.vert_position(source[i]));
}

TEST(ClipboardController, rh_yup_copy_lands_converted_in_an_lh_zup_scene)
{
    Scene      source;
    SceneMesh* quad = source.createSceneMesh("Quad");
    addQuad(*quad->sysMesh(), glm::vec3(0.f, 0.f, 2.f));

    MemoryTransport     transport;
    ClipboardController controller(transport);

    ClipboardReport copyReport;
    ASSERT_TRUE(controller.copy(source, copyReport));

    Scene      target(CoordinateConvention::LH_Zup);
    SceneMesh* mesh = target.createSceneMesh("Target");

    ClipboardReport pasteReport;
    ASSERT_TRUE(controller.paste(target, pasteReport));

    const SysMesh& sys = *mesh->sysMesh();
    ASSERT_EQ(sys.num_polys(), 1u);

    const SysPolyVerts& pv = sys.poly_verts(sys.all_polys().front());
    ASSERT_EQ(pv.size(), 4u);
    EXPECT_TRUE(near(sys.vert_position(pv[0]), glm::vec3(0.f, -2.f, 0.f)));
    EXPECT_TRUE(near(sys.vert_position(pv[2]), glm::vec3(1.f, -2.f, 1.f)));
}

TEST(ClipboardController, empty_copy_writes_an_empty_payload_with_a_warning)
{
    Scene scene;
    scene.createSceneMesh("Nothing");

    MemoryTransport     transport;
    ClipboardController controller(transport);

    ClipboardReport report;
    ASSERT_TRUE(controller.copy(scene, report));
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.hasWarnings());

    const MeshSnapshot copied = decodePayload(transport);
    EXPECT_TRUE(copied.empty());
}

TEST(ClipboardController, run_dispatches_by_operation)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Plane");
    addQuad(*mesh->sysMesh());

    MemoryTransport     transport;
    ClipboardController controller(transport);

    ClipboardReport report;
    ASSERT_TRUE(controller.run(ClipboardOperation::Copy, scene, report));
    ASSERT_TRUE(controller.run(ClipboardOperation::Paste, scene, report));
    EXPECT_EQ(mesh->sysMesh()->num_polys(), 2u);

    EXPECT_EQ(operationName(ClipboardOperation::NewMesh), "NewMesh");
    EXPECT_EQ(phaseName(ClipboardPhase::Merging), "Merging");
}
