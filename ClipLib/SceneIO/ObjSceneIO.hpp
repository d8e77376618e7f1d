#pragma once

#include <filesystem>

class Scene;
class SceneMesh;

/**
 * @brief Loads an OBJ file into a new mesh of the scene and makes it active.
 *
 * The mesh is named after the file stem. MTL materials are merged into the
 * scene material list by exact name; polygon material ids are remapped.
 * @return The created mesh, or nullptr when the file could not be read.
 */
SceneMesh* loadObjIntoScene(Scene& scene, const std::filesystem::path& filePath);

/**
 * @brief Saves one scene mesh, with the scene's materials, as OBJ + MTL.
 * @return True if both files were written.
 */
bool saveSceneMeshToObj(const Scene& scene, const SceneMesh& mesh, const std::filesystem::path& filePath);
