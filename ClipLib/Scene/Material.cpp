#include "Material.hpp"

#include <algorithm>
#include <glm/common.hpp>
#include <utility>

Material::Material(std::string name) : m_name{std::move(name)}
{
}

const std::string& Material::name() const noexcept
{
    return m_name;
}

void Material::name(const std::string& name)
{
    m_name = name;
}

const glm::vec3& Material::baseColor() const noexcept
{
    return m_baseColor;
}

void Material::baseColor(const glm::vec3& color) noexcept
{
    m_baseColor = glm::clamp(color, glm::vec3(0.f), glm::vec3(1.f));
}

float Material::opacity() const noexcept
{
    return m_opacity;
}

void Material::opacity(float value) noexcept
{
    m_opacity = std::clamp(value, 0.f, 1.f);
}

const std::string& Material::texturePath() const noexcept
{
    return m_texturePath;
}

void Material::texturePath(const std::string& path)
{
    m_texturePath = path;
}
