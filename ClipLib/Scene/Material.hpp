#pragma once

#include <cstdint>
#include <glm/vec3.hpp>
#include <string>

/// \brief Surface material shared by the meshes of a Scene.
///
/// Referenced by index (material id) from mesh polygons. Only the
/// properties that travel through the clipboard and OBJ/MTL are kept.
class Material
{
public:
    Material() = default;
    explicit Material(std::string name);

    const std::string& name() const noexcept;
    void               name(const std::string& name);

    /// Diffuse color, each channel in [0, 1].
    const glm::vec3& baseColor() const noexcept;
    void             baseColor(const glm::vec3& color) noexcept;

    /// Opacity in [0, 1]. 1 = fully opaque.
    float opacity() const noexcept;
    void  opacity(float value) noexcept;

    /// Path of the diffuse texture image. Empty means "no texture".
    const std::string& texturePath() const noexcept;
    void               texturePath(const std::string& path);

    bool hasTexture() const noexcept
    {
        return !m_texturePath.empty();
    }

private:
    std::string m_name;
    glm::vec3   m_baseColor{0.8f, 0.8f, 0.8f};
    float       m_opacity = 1.0f;
    std::string m_texturePath;
};
