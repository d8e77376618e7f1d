#include "CoordinateTransform.hpp"

#include <gtest/gtest.h>

#include <array>
#include <limits>

TEST(CoordinateTransform, rh_yup_to_lh_zup_maps_the_unit_quad)
{
    const CoordinateTransform xf(CoordinateConvention::RH_Yup, CoordinateConvention::LH_Zup);

    EXPECT_EQ(xf.toExchange({0.f, 0.f, 0.f}), glm::vec3(0.f, 0.f, 0.f));
    EXPECT_EQ(xf.toExchange({1.f, 0.f, 0.f}), glm::vec3(1.f, 0.f, 0.f));
    EXPECT_EQ(xf.toExchange({1.f, 1.f, 0.f}), glm::vec3(1.f, 0.f, 1.f));
    EXPECT_EQ(xf.toExchange({0.f, 1.f, 0.f}), glm::vec3(0.f, 0.f, 1.f));
}

TEST(CoordinateTransform, permutes_axes_with_sign_flip)
{
    EXPECT_EQ(CoordinateTransform::convert({1.f, 2.f, 3.f}, CoordinateConvention::RH_Yup, CoordinateConvention::LH_Zup),
              glm::vec3(1.f, -3.f, 2.f));
    EXPECT_EQ(CoordinateTransform::convert({1.f, 2.f, 3.f}, CoordinateConvention::LH_Zup, CoordinateConvention::RH_Yup),
              glm::vec3(1.f, 3.f, -2.f));
}

TEST(CoordinateTransform, to_host_inverts_to_exchange_exactly)
{
    const std::array<glm::vec3, 4> samples = {
        glm::vec3(0.1f, -2.5f, 3.75f),
        glm::vec3(1e-30f, 1e30f, -0.f),
        glm::vec3(std::numeric_limits<float>::max(), std::numeric_limits<float>::denorm_min(), 7.f),
        glm::vec3(-123.456f, 0.333333f, 98765.4f),
    };

    for (CoordinateConvention host : {CoordinateConvention::RH_Yup, CoordinateConvention::LH_Zup})
    {
        for (CoordinateConvention exchange : {CoordinateConvention::RH_Yup, CoordinateConvention::LH_Zup})
        {
            const CoordinateTransform xf(host, exchange);
            for (const glm::vec3& p : samples)
            {
                EXPECT_EQ(xf.toHost(xf.toExchange(p)), p);
                EXPECT_EQ(xf.toExchange(xf.toHost(p)), p);
            }
        }
    }
}

TEST(CoordinateTransform, same_convention_is_identity)
{
    const CoordinateTransform xf(CoordinateConvention::LH_Zup, CoordinateConvention::LH_Zup);

    EXPECT_TRUE(xf.identity());
    EXPECT_EQ(xf.toExchange({4.f, 5.f, 6.f}), glm::vec3(4.f, 5.f, 6.f));
}

TEST(CoordinateTransform, convert_snapshot_moves_positions_and_morphs_only)
{
    MeshSnapshot snap;
    snap.convention = CoordinateConvention::RH_Yup;
    snap.vertices   = {SnapshotVertex{{1.f, 2.f, 3.f}}};
    snap.morphs.push_back(SnapshotMorph{"Smile", MorphKind::Relative, {{0, glm::vec3(0.f, 1.f, 0.f)}}});
    snap.weightMaps.push_back(SnapshotWeightMap{"W", {{0, 0.5f}}});

    convertSnapshot(snap, CoordinateConvention::LH_Zup);

    EXPECT_EQ(snap.convention, CoordinateConvention::LH_Zup);
    EXPECT_EQ(snap.vertices[0].position, glm::vec3(1.f, -3.f, 2.f));
    EXPECT_EQ(snap.morphs[0].values.at(0), glm::vec3(0.f, 0.f, 1.f));
    EXPECT_FLOAT_EQ(snap.weightMaps[0].weights.at(0), 0.5f);
}
