#include "ObjSceneIO.hpp"

#include <SysMesh.hpp>
#include <SysObjLoader.hpp>
#include <vector>

#include "Scene.hpp"

SceneMesh* loadObjIntoScene(Scene& scene, const std::filesystem::path& filePath)
{
    SysMesh      loaded;
    ObjMaterials objMaterials;

    if (!loadObjToMesh(filePath.string(), &loaded, objMaterials))
        return nullptr;

    MaterialHandler& handler = scene.materialHandler();

    // OBJ material index -> scene material index
    std::vector<uint32_t> remap;
    remap.reserve(objMaterials.size());
    for (const ObjMaterial& objMat : objMaterials)
    {
        const int32_t index = handler.createMaterial(objMat.name);
        Material&     mat   = handler.material(index);
        mat.baseColor(objMat.Kd);
        mat.opacity(objMat.d);
        mat.texturePath(objMat.map_Kd);
        remap.push_back(static_cast<uint32_t>(index));
    }

    for (int32_t poly : loaded.all_polys())
    {
        const uint32_t id = loaded.poly_material(poly);
        loaded.set_poly_material(poly, id < remap.size() ? remap[id] : kSysNoMaterial);
    }

    SceneMesh* mesh = scene.createSceneMesh(filePath.stem().string());
    *mesh->sysMesh() = std::move(loaded);
    return mesh;
}

bool saveSceneMeshToObj(const Scene& scene, const SceneMesh& mesh, const std::filesystem::path& filePath)
{
    ObjMaterials objMaterials;
    objMaterials.reserve(scene.materialHandler().materials().size());

    for (const Material& mat : scene.materialHandler().materials())
    {
        ObjMaterial objMat = new_material(mat.name());
        objMat.Kd          = mat.baseColor();
        objMat.d           = mat.opacity();
        objMat.map_Kd      = mat.texturePath();
        objMaterials.push_back(std::move(objMat));
    }

    return saveMeshToObj(filePath.string(), mesh.sysMesh(), objMaterials);
}
