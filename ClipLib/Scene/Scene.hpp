#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "MaterialHandler.hpp"
#include "MeshScene.hpp"
#include "SceneMesh.hpp"

/**
 * @brief Container of mesh items sharing one material list.
 *
 * Tracks one active mesh, the target of Paste. New items become active.
 */
class Scene final : public MeshScene
{
public:
    /** @brief Construct an empty scene in the given convention. */
    explicit Scene(CoordinateConvention convention = CoordinateConvention::RH_Yup);

    Scene(const Scene&)            = delete;
    Scene& operator=(const Scene&) = delete;

    [[nodiscard]] CoordinateConvention convention() const noexcept;

    /**
     * @brief Create and add a new SceneMesh, making it active.
     * @param name Optional mesh name ("Mesh" when empty)
     * @return Pointer to the created SceneMesh
     */
    SceneMesh* createSceneMesh(std::string_view name = {});

    /// @return All scene meshes in creation order.
    [[nodiscard]] std::vector<SceneMesh*> sceneMeshes() const;

    /// @return The active scene mesh, or nullptr when the scene is empty.
    [[nodiscard]] SceneMesh* activeSceneMesh() const noexcept;

    /** @brief Remove all meshes and materials. */
    void clear();

    [[nodiscard]] MaterialHandler& materialHandler() noexcept;

    [[nodiscard]] const MaterialHandler& materialHandler() const noexcept;

    // MeshScene
    MeshHost* activeMesh() override;
    MeshHost* createMesh(std::string_view name) override;

private:
    CoordinateConvention                    m_convention;
    MaterialHandler                         m_materialHandler;
    std::vector<std::unique_ptr<SceneMesh>> m_meshes;
    SceneMesh*                              m_active = nullptr;
};
