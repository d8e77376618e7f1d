#pragma once

#include <SysMesh.hpp>
#include <string>
#include <string_view>

#include "SysMeshHost.hpp"

class MaterialHandler;

/**
 * @brief Scene item that owns a SysMesh and exposes it as a MeshHost.
 *
 * Material ids of the mesh index the owning scene's MaterialHandler.
 * Not movable: the host adapter refers to the owned mesh.
 */
class SceneMesh final
{
public:
    /**
     * @brief Construct an empty SceneMesh.
     * @param name Mesh display name
     * @param materials Scene material list the mesh's material ids refer to
     * @param convention Coordinate convention of the scene
     */
    SceneMesh(std::string_view name, MaterialHandler& materials, CoordinateConvention convention);

    SceneMesh(const SceneMesh&)            = delete;
    SceneMesh& operator=(const SceneMesh&) = delete;

    [[nodiscard]] std::string name() const;

    void name(std::string_view name);

    /**
     * @brief Access the owned SysMesh.
     * @return Mutable SysMesh pointer
     */
    [[nodiscard]] SysMesh* sysMesh() noexcept;

    /// @return Const SysMesh pointer
    [[nodiscard]] const SysMesh* sysMesh() const noexcept;

    /// @return The MeshHost view of this mesh.
    [[nodiscard]] SysMeshHost* host() noexcept;

private:
    SysMesh     m_mesh;
    SysMeshHost m_host;
};
