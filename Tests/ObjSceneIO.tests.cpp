#include "ObjSceneIO.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "TestHelpers.hpp"

using namespace cliptest;

namespace
{
    void writeFile(const std::filesystem::path& path, const std::string& text)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path);
        out << text;
    }

    constexpr const char* kShapesObj = R"(# two quads
mtllib shapes.mtl
v 0 0 0
v 1 0 0
v 1 1 0
v 0 1 0
v 2 0 0
v 2 1 0
vt 0 0
vt 1 0
vt 1 1
vt 0 1
g left
usemtl Skin
f 1/1 2/2 3/3 4/4
g right
usemtl Hair
f 2 5 6 3
f 1 2 99
)";

    constexpr const char* kShapesMtl = R"(newmtl Skin
Kd 0.9 0.7 0.6

newmtl Hair
Kd 0.1 0.1 0.1
d 0.5
map_Kd hair.png
)";

    /// @return The only polygon tagged in the named pick map, or -1.
    int32_t polyInGroup(const SysMesh& mesh, const std::string& group)
    {
        const int32_t map = mesh.map_find(SysMapType::PolyPick, group);
        if (map == -1)
            return -1;

        int32_t found = -1;
        for (int32_t poly : mesh.all_polys())
        {
            if (!mesh.map_poly_tagged(map, poly))
                continue;
            if (found != -1)
                return -1;
            found = poly;
        }
        return found;
    }

    std::string materialName(const Scene& scene, const SysMesh& mesh, int32_t poly)
    {
        const auto id = static_cast<int32_t>(mesh.poly_material(poly));
        if (!scene.materialHandler().valid(id))
            return {};
        return scene.materialHandler().material(id).name();
    }
} // namespace

TEST(ObjSceneIO, load_creates_an_active_mesh_named_after_the_file)
{
    TempPath dir("obj_load");
    writeFile(dir.path() / "shapes.obj", kShapesObj);
    writeFile(dir.path() / "shapes.mtl", kShapesMtl);

    Scene      scene;
    SceneMesh* mesh = loadObjIntoScene(scene, dir.path() / "shapes.obj");
    ASSERT_NE(mesh, nullptr);

    EXPECT_EQ(mesh->name(), "shapes");
    EXPECT_EQ(scene.activeSceneMesh(), mesh);
    EXPECT_EQ(mesh->sysMesh()->num_verts(), 6u);
    EXPECT_EQ(mesh->sysMesh()->num_polys(), 2u);
}

TEST(ObjSceneIO, material_ids_are_remapped_into_the_scene_list)
{
    TempPath dir("obj_materials");
    writeFile(dir.path() / "shapes.obj", kShapesObj);
    writeFile(dir.path() / "shapes.mtl", kShapesMtl);

    Scene scene;
    scene.materialHandler().createMaterial("Hair");

    SceneMesh* mesh = loadObjIntoScene(scene, dir.path() / "shapes.obj");
    ASSERT_NE(mesh, nullptr);

    const SysMesh& sys = *mesh->sysMesh();
    EXPECT_EQ(scene.materialHandler().size(), 2);
    EXPECT_EQ(materialName(scene, sys, polyInGroup(sys, "left")), "Skin");
    EXPECT_EQ(materialName(scene, sys, polyInGroup(sys, "right")), "Hair");

    const Material& hair = scene.materialHandler().material(*scene.materialHandler().findMaterial("Hair"));
    EXPECT_FLOAT_EQ(hair.opacity(), 0.5f);
    EXPECT_EQ(hair.texturePath(), "hair.png");
}

TEST(ObjSceneIO, groups_and_texture_coordinates_become_maps)
{
    TempPath dir("obj_maps");
    writeFile(dir.path() / "shapes.obj", kShapesObj);
    writeFile(dir.path() / "shapes.mtl", kShapesMtl);

    Scene      scene;
    SceneMesh* mesh = loadObjIntoScene(scene, dir.path() / "shapes.obj");
    ASSERT_NE(mesh, nullptr);

    const SysMesh& sys  = *mesh->sysMesh();
    const int32_t  left = polyInGroup(sys, "left");
    ASSERT_NE(left, -1);
    ASSERT_NE(polyInGroup(sys, "right"), -1);

    const int32_t uvMap = sys.map_find(SysMapType::Texture, "Texture");
    ASSERT_NE(uvMap, -1);

    const float* uv = sys.map_corner_value(uvMap, left, 2);
    ASSERT_NE(uv, nullptr);
    EXPECT_FLOAT_EQ(uv[0], 1.f);
    EXPECT_FLOAT_EQ(uv[1], 1.f);

    EXPECT_EQ(sys.map_corner_value(uvMap, polyInGroup(sys, "right"), 0), nullptr);
}

TEST(ObjSceneIO, saved_mesh_loads_back_the_same)
{
    TempPath dir("obj_save");
    writeFile(dir.path() / "shapes.obj", kShapesObj);
    writeFile(dir.path() / "shapes.mtl", kShapesMtl);

    Scene      scene;
    SceneMesh* mesh = loadObjIntoScene(scene, dir.path() / "shapes.obj");
    ASSERT_NE(mesh, nullptr);

    const auto saved = dir.path() / "out" / "copy.obj";
    std::filesystem::create_directories(saved.parent_path());
    ASSERT_TRUE(saveSceneMeshToObj(scene, *mesh, saved));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "out" / "copy.mtl"));

    Scene      reloadedScene;
    SceneMesh* reloaded = loadObjIntoScene(reloadedScene, saved);
    ASSERT_NE(reloaded, nullptr);
    EXPECT_EQ(reloaded->name(), "copy");

    const SysMesh& sys = *reloaded->sysMesh();
    EXPECT_EQ(sys.num_polys(), 2u);
    EXPECT_EQ(sys.num_verts(), 6u);

    const int32_t left = polyInGroup(sys, "left");
    ASSERT_NE(left, -1);
    EXPECT_EQ(materialName(reloadedScene, sys, left), "Skin");
    EXPECT_EQ(materialName(reloadedScene, sys, polyInGroup(sys, "right")), "Hair");

    const SysPolyVerts& pv = sys.poly_verts(left);
    ASSERT_EQ(pv.size(), 4u);
    EXPECT_TRUE(near(sys.vert_position(pv[2]), glm::vec3(1.f, 1.f, 0.f)));

    const int32_t uvMap = sys.map_find(SysMapType::Texture, "Texture");
    ASSERT_NE(uvMap, -1);
    const float* uv = sys.map_corner_value(uvMap, left, 3);
    ASSERT_NE(uv, nullptr);
    EXPECT_FLOAT_EQ(uv[0], 0.f);
    EXPECT_FLOAT_EQ(uv[1], 1.f);
}

TEST(ObjSceneIO, missing_file_leaves_the_scene_empty)
{
    TempPath dir("obj_missing");

    Scene scene;
    EXPECT_EQ(loadObjIntoScene(scene, dir.path() / "absent.obj"), nullptr);
    EXPECT_TRUE(scene.sceneMeshes().empty());
    EXPECT_EQ(scene.activeSceneMesh(), nullptr);
}
