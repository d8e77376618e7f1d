#include "SysMesh.hpp"

#include <gtest/gtest.h>

#include "TestHelpers.hpp"

using namespace cliptest;

TEST(SysMesh, create_poly_links_vertices_and_edges)
{
    SysMesh mesh;
    const int32_t poly = addQuad(mesh);

    EXPECT_EQ(mesh.num_verts(), 4u);
    EXPECT_EQ(mesh.num_polys(), 1u);
    EXPECT_EQ(mesh.poly_verts(poly).size(), 4u);
    EXPECT_TRUE(mesh.has_edge({0, 1}));
    EXPECT_TRUE(mesh.has_edge({3, 0}));
    EXPECT_TRUE(mesh.has_edge({0, 3}));
    EXPECT_FALSE(mesh.has_edge({0, 2}));
    EXPECT_EQ(mesh.all_edges().size(), 4u);
}

TEST(SysMesh, remove_poly_keeps_vertices_and_shared_edges)
{
    SysMesh mesh;
    addStrip(mesh);

    const int32_t seams = mesh.map_create("Seams", SysMapType::EdgePick);
    mesh.map_set_edge_value(seams, {1, 4}, nullptr);
    mesh.map_set_edge_value(seams, {0, 3}, nullptr);
    mesh.set_edge_seam({0, 1}, true);

    mesh.remove_poly(0);

    EXPECT_EQ(mesh.num_verts(), 6u);
    EXPECT_EQ(mesh.num_polys(), 1u);
    EXPECT_TRUE(mesh.has_edge({1, 4}));
    EXPECT_FALSE(mesh.has_edge({0, 3}));

    // Edge data survives only on edges that still exist
    EXPECT_NE(mesh.map_edge_value(seams, {4, 1}), nullptr);
    EXPECT_EQ(mesh.map_edge_value(seams, {0, 3}), nullptr);
    EXPECT_TRUE(mesh.seam_edges().empty());
}

TEST(SysMesh, map_find_matches_type_and_exact_name)
{
    SysMesh mesh;
    const int32_t uv = mesh.map_create("UVMap", SysMapType::Texture);
    mesh.map_create("UVMap", SysMapType::Weight);

    EXPECT_EQ(mesh.map_find(SysMapType::Texture, "UVMap"), uv);
    EXPECT_EQ(mesh.map_find(SysMapType::Texture, "uvmap"), -1);
    EXPECT_EQ(mesh.map_find(SysMapType::Rgb, "UVMap"), -1);
    EXPECT_EQ(mesh.map_dim(uv), 2);
    EXPECT_EQ(mesh.map_domain(uv), SysMapDomain::Corner);
    EXPECT_EQ(mesh.maps_of_type(SysMapType::Weight).size(), 1u);
}

TEST(SysMesh, corner_values_are_per_polygon_corner)
{
    SysMesh mesh;
    const int32_t poly = addQuad(mesh);
    const int32_t uv   = mesh.map_create("UVMap", SysMapType::Texture);

    const float value[2] = {0.25f, 0.75f};
    mesh.map_set_corner_value(uv, poly, 2, value);

    const float* stored = mesh.map_corner_value(uv, poly, 2);
    ASSERT_NE(stored, nullptr);
    EXPECT_FLOAT_EQ(stored[0], 0.25f);
    EXPECT_FLOAT_EQ(stored[1], 0.75f);
    EXPECT_EQ(mesh.map_corner_value(uv, poly, 1), nullptr);
    EXPECT_EQ(mesh.map_corner_value(uv, poly, 7), nullptr);
}

TEST(SysMesh, selection_reports_selected_polygons_only)
{
    SysMesh mesh;
    addStrip(mesh);

    EXPECT_TRUE(mesh.select_poly(1, true));
    EXPECT_FALSE(mesh.select_poly(1, true));
    EXPECT_EQ(mesh.selected_polys(), std::vector<int32_t>{1});

    mesh.clear_selection();
    EXPECT_TRUE(mesh.selected_polys().empty());
}

TEST(SysMesh, clear_removes_everything)
{
    SysMesh mesh;
    addStrip(mesh);
    mesh.map_create("Weights", SysMapType::Weight);

    mesh.clear();

    EXPECT_EQ(mesh.num_verts(), 0u);
    EXPECT_EQ(mesh.num_polys(), 0u);
    EXPECT_TRUE(mesh.maps_of_type(SysMapType::Weight).empty());
}
