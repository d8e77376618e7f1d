#include "CoordinateTransform.hpp"

CoordinateTransform::CoordinateTransform(CoordinateConvention host, CoordinateConvention exchange) noexcept
    : m_host{host}, m_exchange{exchange}
{
}

glm::vec3 CoordinateTransform::toExchange(const glm::vec3& pos) const noexcept
{
    return convert(pos, m_host, m_exchange);
}

glm::vec3 CoordinateTransform::toHost(const glm::vec3& pos) const noexcept
{
    return convert(pos, m_exchange, m_host);
}

glm::vec3 CoordinateTransform::convert(const glm::vec3& pos, CoordinateConvention from, CoordinateConvention to) noexcept
{
    if (from == to)
        return pos;

    if (from == CoordinateConvention::RH_Yup)
        return glm::vec3(pos.x, -pos.z, pos.y);

    return glm::vec3(pos.x, pos.z, -pos.y);
}

void convertSnapshot(MeshSnapshot& snapshot, CoordinateConvention target) noexcept
{
    const CoordinateConvention source = snapshot.convention;
    if (source == target)
        return;

    for (SnapshotVertex& vert : snapshot.vertices)
        vert.position = CoordinateTransform::convert(vert.position, source, target);

    // Deltas and absolute targets are both plain vectors under a linear map
    for (SnapshotMorph& morph : snapshot.morphs)
    {
        for (auto& [vert, value] : morph.values)
            value = CoordinateTransform::convert(value, source, target);
    }

    snapshot.convention = target;
}
