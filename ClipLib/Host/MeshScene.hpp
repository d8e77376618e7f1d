#pragma once

#include <string_view>

class MeshHost;

/// Scene-level contract: where Paste targets go and where New Mesh creates items.
class MeshScene
{
public:
    virtual ~MeshScene() = default;

    /// @return The active mesh item, or nullptr when there is none.
    virtual MeshHost* activeMesh() = 0;

    /// Creates an empty mesh item, makes it active and returns it.
    virtual MeshHost* createMesh(std::string_view name) = 0;
};
