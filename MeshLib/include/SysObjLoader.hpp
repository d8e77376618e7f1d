#ifndef SYS_OBJ_LOADER_HPP_INCLUDED
#define SYS_OBJ_LOADER_HPP_INCLUDED

#include <glm/vec3.hpp>
#include <string>
#include <vector>

/// Material properties read from and written to MTL files.
struct ObjMaterial
{
    std::string name; ///< Material name (newmtl)
    glm::vec3   Ka;   ///< Ambient color
    glm::vec3   Kd;   ///< Diffuse color
    glm::vec3   Ks;   ///< Specular color
    float       Ns;   ///< Specular exponent
    float       d;    ///< Dissolve (opacity)

    std::string map_Kd; ///< Diffuse texture map
};

using ObjMaterials = std::vector<ObjMaterial>;

/// Name of the face-corner UV map that receives "vt" coordinates.
inline constexpr const char* kObjTextureMapName = "Texture";

/// Loads an OBJ file along with its material library (MTL).
/// Face groups ("g") become polygon pick maps; "vt" coordinates land in the
/// "Texture" UV map. Material names are matched case-sensitively.
/// @param filepath - The full path of the OBJ file.
/// @param mesh - A valid SysMesh instance to be populated.
/// @param materials - Receives the materials referenced by the file.
/// @return True if loading succeeded, false otherwise.
bool loadObjToMesh(const std::string& filepath, class SysMesh* mesh, ObjMaterials& materials);

/// Saves a SysMesh to an OBJ file along with its material library (MTL).
/// Polygons whose material id is out of range are written without usemtl.
/// @param filepath - The path to save the OBJ file.
/// @param mesh - The mesh to be saved.
/// @param materials - The materials the polygon material ids refer to.
/// @return True if saving succeeded, false otherwise.
bool saveMeshToObj(const std::string& filepath, const class SysMesh* mesh, const ObjMaterials& materials);

ObjMaterial new_material(const std::string& name);

#endif // SYS_OBJ_LOADER_HPP_INCLUDED
