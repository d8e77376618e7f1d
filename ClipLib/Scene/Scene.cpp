#include "Scene.hpp"

Scene::Scene(CoordinateConvention convention) : m_convention{convention}
{
}

CoordinateConvention Scene::convention() const noexcept
{
    return m_convention;
}

SceneMesh* Scene::createSceneMesh(std::string_view name)
{
    const std::string_view meshName = name.empty() ? std::string_view{"Mesh"} : name;

    m_meshes.push_back(std::make_unique<SceneMesh>(meshName, m_materialHandler, m_convention));
    m_active = m_meshes.back().get();
    return m_active;
}

std::vector<SceneMesh*> Scene::sceneMeshes() const
{
    std::vector<SceneMesh*> result;
    result.reserve(m_meshes.size());
    for (const auto& mesh : m_meshes)
        result.push_back(mesh.get());
    return result;
}

SceneMesh* Scene::activeSceneMesh() const noexcept
{
    return m_active;
}

void Scene::clear()
{
    m_active = nullptr;
    m_meshes.clear();
    m_materialHandler.clear();
}

MaterialHandler& Scene::materialHandler() noexcept
{
    return m_materialHandler;
}

const MaterialHandler& Scene::materialHandler() const noexcept
{
    return m_materialHandler;
}

MeshHost* Scene::activeMesh()
{
    return m_active ? m_active->host() : nullptr;
}

MeshHost* Scene::createMesh(std::string_view name)
{
    return createSceneMesh(name)->host();
}
