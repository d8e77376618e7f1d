#include "MaterialHandler.hpp"

#include <algorithm>
#include <string>

int32_t MaterialHandler::createMaterial(std::string_view name)
{
    static constexpr const char* kDefaultName = "New Material";

    const std::string base = name.empty() ? kDefaultName : std::string{name};

    if (std::optional<int32_t> existing = findMaterial(base))
        return *existing;

    m_materials.emplace_back(base);
    return static_cast<int32_t>(m_materials.size() - 1);
}

std::optional<int32_t> MaterialHandler::findMaterial(std::string_view name) const noexcept
{
    auto it = std::ranges::find_if(m_materials, [&](const Material& m) { return m.name() == name; });
    if (it == m_materials.end())
        return std::nullopt;

    return static_cast<int32_t>(std::distance(m_materials.begin(), it));
}

void MaterialHandler::clear()
{
    m_materials.clear();
}

const std::vector<Material>& MaterialHandler::materials() const noexcept
{
    return m_materials;
}

const Material& MaterialHandler::material(int32_t index) const noexcept
{
    return m_materials[index];
}

Material& MaterialHandler::material(int32_t index) noexcept
{
    return m_materials[index];
}
