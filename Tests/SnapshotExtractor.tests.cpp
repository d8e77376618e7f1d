#include "SnapshotExtractor.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

#include "ClipboardReport.hpp"
#include "Scene.hpp"
#include "SceneMesh.hpp"
#include "TestHelpers.hpp"

using namespace cliptest;

namespace
{
    ExtractionResult extract(SceneMesh& mesh, SelectionMode mode, ClipboardReport& report)
    {
        return SnapshotExtractor(*mesh.host(), "Tests").extract(mode, report);
    }
} // namespace

TEST(SnapshotExtractor, whole_mesh_keeps_geometry_and_metadata)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    addStrip(*mesh->sysMesh());

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    EXPECT_EQ(r.snapshot.vertexCount(), 6);
    EXPECT_EQ(r.snapshot.polygonCount(), 2);
    EXPECT_EQ(r.snapshot.convention, CoordinateConvention::RH_Yup);
    EXPECT_EQ(r.snapshot.metadata.objectName, "Strip");
    EXPECT_EQ(r.snapshot.metadata.sourceApplication, "Tests");
    EXPECT_EQ(r.sourcePolygons, (std::vector<int32_t>{0, 1}));
    EXPECT_EQ(r.snapshot.polygons[1].vertices, (std::vector<int32_t>{1, 2, 5, 4}));
    EXPECT_TRUE(report.ok());
}

TEST(SnapshotExtractor, selection_renumbers_vertices_densely)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.select_poly(1, true);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::SelectedPolygons, report);

    ASSERT_EQ(r.snapshot.polygonCount(), 1);
    EXPECT_EQ(r.sourceVertices, (std::vector<int32_t>{1, 2, 4, 5}));
    EXPECT_EQ(r.snapshot.polygons[0].vertices, (std::vector<int32_t>{0, 1, 3, 2}));
    EXPECT_EQ(r.snapshot.vertices[1].position, glm::vec3(2.f, 0.f, 0.f));
    EXPECT_EQ(r.sourcePolygons, std::vector<int32_t>{1});
}

TEST(SnapshotExtractor, empty_selection_exports_the_whole_mesh)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    addStrip(*mesh->sysMesh());

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::SelectedPolygons, report);

    EXPECT_EQ(r.snapshot.polygonCount(), 2);
    EXPECT_TRUE(report.ok());
}

TEST(SnapshotExtractor, weight_outside_the_subset_is_dropped)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.select_poly(1, true);

    const int32_t weights = sys.map_create("Bone", SysMapType::Weight);
    const float   outside = 0.9f;
    const float   inside  = 0.4f;
    sys.map_set_vert_value(weights, 0, &outside);
    sys.map_set_vert_value(weights, 2, &inside);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::SelectedPolygons, report);

    ASSERT_EQ(r.snapshot.weightMaps.size(), 1u);
    const SnapshotWeightMap& map = r.snapshot.weightMaps[0];
    EXPECT_EQ(map.name, "Bone");
    ASSERT_EQ(map.weights.size(), 1u);
    EXPECT_FLOAT_EQ(map.weights.at(1), 0.4f);
    EXPECT_EQ(report.count(ClipboardStatus::ExtractionError), 0u);
}

TEST(SnapshotExtractor, materials_are_renumbered_in_first_use_order)
{
    Scene      scene;
    const auto a = static_cast<uint32_t>(scene.materialHandler().createMaterial("A"));
    scene.materialHandler().createMaterial("B");
    const auto c = static_cast<uint32_t>(scene.materialHandler().createMaterial("C"));

    SceneMesh* mesh = scene.createSceneMesh("Quads");
    SysMesh&   sys  = *mesh->sysMesh();
    addQuad(sys, glm::vec3(0.f), c);
    addQuad(sys, glm::vec3(2.f, 0.f, 0.f), a);
    addQuad(sys, glm::vec3(4.f, 0.f, 0.f));

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    ASSERT_EQ(r.snapshot.materials.size(), 2u);
    EXPECT_EQ(r.snapshot.materials[0].name, "C");
    EXPECT_EQ(r.snapshot.materials[1].name, "A");
    EXPECT_EQ(r.snapshot.polygons[0].material, 0);
    EXPECT_EQ(r.snapshot.polygons[1].material, 1);
    EXPECT_FALSE(r.snapshot.polygons[2].material.has_value());
}

TEST(SnapshotExtractor, concave_polygon_is_triangulated_and_uvs_follow_corners)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("L");
    SysMesh&   sys  = *mesh->sysMesh();

    const std::vector<glm::vec3> pts = {
        {0.f, 0.f, 0.f}, {2.f, 0.f, 0.f}, {2.f, 1.f, 0.f}, {1.f, 1.f, 0.f}, {1.f, 2.f, 0.f}, {0.f, 2.f, 0.f},
    };
    std::vector<int32_t> verts;
    for (const glm::vec3& p : pts)
        verts.push_back(sys.create_vert(p));
    const int32_t poly = sys.create_poly(verts, kSysNoMaterial);

    // UV of every corner is the XY of its vertex
    const int32_t uv = sys.map_create("UVMap", SysMapType::Texture);
    for (int32_t k = 0; k < static_cast<int32_t>(pts.size()); ++k)
    {
        const float value[2] = {pts[k].x, pts[k].y};
        sys.map_set_corner_value(uv, poly, k, value);
    }

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    ASSERT_EQ(r.snapshot.polygonCount(), 4);
    EXPECT_EQ(r.sourcePolygons, std::vector<int32_t>{poly});
    ASSERT_EQ(r.snapshot.uvMaps.size(), 1u);

    const SnapshotUvMap& map = r.snapshot.uvMaps[0];
    EXPECT_TRUE(map.primary);
    EXPECT_EQ(map.values.size(), 12u);

    for (int32_t p = 0; p < r.snapshot.polygonCount(); ++p)
    {
        const SnapshotPolygon& sp = r.snapshot.polygons[p];
        EXPECT_EQ(sp.origin, PolygonOrigin::TriangulatedFromIrregular);
        ASSERT_EQ(sp.vertices.size(), 3u);

        for (int32_t k = 0; k < 3; ++k)
        {
            const glm::vec3& pos = r.snapshot.vertices[sp.vertices[k]].position;
            EXPECT_EQ(map.values.at(CornerRef{p, k}), glm::vec2(pos.x, pos.y));
        }
    }
}

TEST(SnapshotExtractor, keyhole_loop_with_repeated_vertices_is_triangulated)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Frame");
    SysMesh&   sys  = *mesh->sysMesh();

    // Outer square CCW, inner square CW, joined by the bridge 0-4
    const std::vector<glm::vec3> pts = {
        {0.f, 0.f, 0.f}, {4.f, 0.f, 0.f}, {4.f, 4.f, 0.f}, {0.f, 4.f, 0.f},
        {1.f, 1.f, 0.f}, {1.f, 3.f, 0.f}, {3.f, 3.f, 0.f}, {3.f, 1.f, 0.f},
    };
    for (const glm::vec3& p : pts)
        sys.create_vert(p);
    const int32_t poly = sys.create_poly({0, 1, 2, 3, 0, 4, 5, 6, 7, 4}, kSysNoMaterial);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    EXPECT_EQ(r.snapshot.vertexCount(), 8);
    ASSERT_GT(r.snapshot.polygonCount(), 0);
    EXPECT_EQ(r.sourcePolygons, std::vector<int32_t>{poly});

    for (const SnapshotPolygon& sp : r.snapshot.polygons)
    {
        EXPECT_EQ(sp.origin, PolygonOrigin::TriangulatedFromIrregular);
        ASSERT_EQ(sp.vertices.size(), 3u);
        EXPECT_NE(sp.vertices[0], sp.vertices[1]);
        EXPECT_NE(sp.vertices[1], sp.vertices[2]);
        EXPECT_NE(sp.vertices[0], sp.vertices[2]);
    }

    ClipboardReport validation;
    EXPECT_TRUE(validateSnapshot(r.snapshot, validation));
}

TEST(SnapshotExtractor, unsupported_polygons_are_skipped_with_a_warning)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Mixed");
    SysMesh&   sys  = *mesh->sysMesh();
    addQuad(sys);

    const int32_t a = sys.create_vert({5.f, 0.f, 0.f});
    const int32_t b = sys.create_vert({6.f, 0.f, 0.f});
    const int32_t c = sys.create_vert({7.f, 1.f, 0.f});
    sys.create_poly({a, b, c}, kSysNoMaterial, SysPolyType::Curve);
    sys.create_poly({a, b, a}, kSysNoMaterial);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    EXPECT_EQ(r.snapshot.polygonCount(), 1);
    EXPECT_EQ(r.snapshot.vertexCount(), 4);
    EXPECT_EQ(report.count(ClipboardStatus::ExtractionError), 2u);
    EXPECT_TRUE(report.ok()) << "skipped polygons do not fail the extraction";
}

TEST(SnapshotExtractor, subdivision_polygons_and_creases_are_exported)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Cage");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.set_poly_type(0, SysPolyType::Subdiv);

    const int32_t crease = sys.map_create("Subdivision", SysMapType::Subdiv);
    const float   sharp  = 1.f;
    sys.map_set_edge_value(crease, {4, 1}, &sharp);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    EXPECT_TRUE(r.snapshot.polygons[0].isSubdivisionSurface);
    EXPECT_FALSE(r.snapshot.polygons[1].isSubdivisionSurface);
    ASSERT_EQ(r.snapshot.subdivisionWeights.weights.size(), 1u);
    EXPECT_FLOAT_EQ(r.snapshot.subdivisionWeights.weights.at(makeEdgeKey(1, 4)), 1.f);
}

TEST(SnapshotExtractor, seams_and_sets_are_filtered_to_the_subset)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();
    addStrip(sys);
    sys.select_poly(1, true);

    sys.set_edge_seam({1, 4}, true);
    sys.set_edge_seam({0, 3}, true);

    const int32_t pins = sys.map_create("Pins", SysMapType::VertPick);
    sys.map_set_vert_value(pins, 0, nullptr);
    sys.map_set_vert_value(pins, 5, nullptr);

    const int32_t top = sys.map_create("Top", SysMapType::PolyPick);
    sys.map_set_poly_tag(top, 0, true);
    sys.map_set_poly_tag(top, 1, true);

    const int32_t freestyle = sys.map_create("_Freestyle", SysMapType::EdgePick);
    sys.map_set_edge_value(freestyle, {2, 5}, nullptr);
    sys.map_set_edge_value(freestyle, {0, 1}, nullptr);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::SelectedPolygons, report);

    // Host verts 1, 2, 4, 5 become 0, 1, 2, 3
    const SnapshotSelectionSet* seam = r.snapshot.seamSet();
    ASSERT_NE(seam, nullptr);
    EXPECT_EQ(seam->name, "_Seam");
    EXPECT_EQ(seam->edges, (std::set<EdgeKey>{makeEdgeKey(0, 2)}));

    const SnapshotSelectionSet* pinSet = r.snapshot.findSelectionSet("Pins", SelectionKind::Vertex);
    ASSERT_NE(pinSet, nullptr);
    EXPECT_EQ(pinSet->elements, (std::set<int32_t>{3}));

    const SnapshotSelectionSet* topSet = r.snapshot.findSelectionSet("Top", SelectionKind::Polygon);
    ASSERT_NE(topSet, nullptr);
    EXPECT_EQ(topSet->elements, (std::set<int32_t>{0}));

    const SnapshotSelectionSet* fs = r.snapshot.findSelectionSet("_Freestyle", SelectionKind::Edge);
    ASSERT_NE(fs, nullptr);
    EXPECT_EQ(fs->edges, (std::set<EdgeKey>{makeEdgeKey(1, 3)}));
}

TEST(SnapshotExtractor, edges_of_unselected_polygons_are_not_exported)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Strip");
    SysMesh&   sys  = *mesh->sysMesh();

    // 3x1 strip: bottom row 0..3, top row 4..7
    for (int i = 0; i < 4; ++i)
        sys.create_vert(glm::vec3(static_cast<float>(i), 0.f, 0.f));
    for (int i = 0; i < 4; ++i)
        sys.create_vert(glm::vec3(static_cast<float>(i), 1.f, 0.f));
    sys.create_poly({0, 1, 5, 4}, kSysNoMaterial);
    sys.create_poly({1, 2, 6, 5}, kSysNoMaterial);
    sys.create_poly({2, 3, 7, 6}, kSysNoMaterial);

    sys.select_poly(0, true);
    sys.select_poly(2, true);

    // Edge 1-2 belongs only to the unselected middle quad
    const int32_t crease = sys.map_create("Subdivision", SysMapType::Subdiv);
    const float   sharp  = 1.f;
    sys.map_set_edge_value(crease, {1, 2}, &sharp);
    sys.map_set_edge_value(crease, {0, 1}, &sharp);

    const int32_t freestyle = sys.map_create("_Freestyle", SysMapType::EdgePick);
    sys.map_set_edge_value(freestyle, {1, 2}, nullptr);
    sys.map_set_edge_value(freestyle, {2, 3}, nullptr);

    sys.set_edge_seam({1, 2}, true);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::SelectedPolygons, report);

    EXPECT_EQ(r.snapshot.vertexCount(), 8);
    EXPECT_EQ(r.sourcePolygons, (std::vector<int32_t>{0, 2}));

    // Vertex ids are unchanged since every host vertex is used
    ASSERT_EQ(r.snapshot.subdivisionWeights.weights.size(), 1u);
    EXPECT_TRUE(r.snapshot.subdivisionWeights.weights.contains(makeEdgeKey(0, 1)));

    const SnapshotSelectionSet* fs = r.snapshot.findSelectionSet("_Freestyle", SelectionKind::Edge);
    ASSERT_NE(fs, nullptr);
    EXPECT_EQ(fs->edges, (std::set<EdgeKey>{makeEdgeKey(2, 3)}));

    const SnapshotSelectionSet* seam = r.snapshot.seamSet();
    EXPECT_TRUE(seam == nullptr || seam->edges.empty());
}

TEST(SnapshotExtractor, polygon_that_yields_no_triangles_leaves_no_vertices_behind)
{
    Scene      scene;
    SceneMesh* mesh = scene.createSceneMesh("Mixed");
    SysMesh&   sys  = *mesh->sysMesh();
    addQuad(sys);

    // Loop a-b-a-c has no area; every fan triangle repeats a vertex
    const int32_t a = sys.create_vert({5.f, 0.f, 0.f});
    const int32_t b = sys.create_vert({6.f, 0.f, 0.f});
    const int32_t c = sys.create_vert({5.f, 1.f, 0.f});
    sys.create_poly({a, b, a, c}, kSysNoMaterial);

    ClipboardReport        report;
    const ExtractionResult r = extract(*mesh, SelectionMode::WholeMesh, report);

    EXPECT_EQ(r.snapshot.polygonCount(), 1);
    EXPECT_EQ(r.snapshot.vertexCount(), 4);
    EXPECT_EQ(r.sourceVertices, (std::vector<int32_t>{0, 1, 2, 3}));
    EXPECT_EQ(r.sourcePolygons, std::vector<int32_t>{0});
    EXPECT_EQ(report.count(ClipboardStatus::ExtractionError), 1u);
}
