#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "Material.hpp"

class MaterialHandler
{
public:
    MaterialHandler() = default;

    /**
     * @brief Create a new material or return the existing index.
     *
     * Names match exactly and case-sensitively: "Skin" and "skin" are two
     * materials. An empty name becomes "New Material".
     *
     * @param name The desired material name
     * @return Index of the existing or newly created material
     */
    int32_t createMaterial(std::string_view name);

    /// @return Index of the material with exactly this name, or nullopt.
    [[nodiscard]] std::optional<int32_t> findMaterial(std::string_view name) const noexcept;

    void clear();

    [[nodiscard]] int32_t size() const noexcept
    {
        return static_cast<int32_t>(m_materials.size());
    }

    [[nodiscard]] bool valid(int32_t index) const noexcept
    {
        return index >= 0 && index < size();
    }

    [[nodiscard]] const std::vector<Material>& materials() const noexcept;

    [[nodiscard]] const Material& material(int32_t index) const noexcept;

    [[nodiscard]] Material& material(int32_t index) noexcept;

private:
    std::vector<Material> m_materials;
};
