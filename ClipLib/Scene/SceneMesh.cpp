#include "SceneMesh.hpp"

SceneMesh::SceneMesh(std::string_view name, MaterialHandler& materials, CoordinateConvention convention)
    : m_mesh{}, m_host{m_mesh, materials, std::string{name}, convention}
{
}

std::string SceneMesh::name() const
{
    return m_host.name();
}

void SceneMesh::name(std::string_view name)
{
    m_host.setName(std::string{name});
}

SysMesh* SceneMesh::sysMesh() noexcept
{
    return &m_mesh;
}

const SysMesh* SceneMesh::sysMesh() const noexcept
{
    return &m_mesh;
}

SysMeshHost* SceneMesh::host() noexcept
{
    return &m_host;
}
