#include "ray.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

namespace
{
constexpr double kEps = 1e-12;
constexpr double kDeg = M_PI / 180.0;
} // namespace

TEST(Ray, ConstructorRecordsOrigin)
{
    Ray r(Vector2d(-5, 2), 0.1, 486.1, 1.33);
    ASSERT_EQ(r.path.size(), 1u);
    EXPECT_EQ(r.path[0], Vector2d(-5, 2));
    EXPECT_DOUBLE_EQ(r.wavelength_nm, 486.1);
    EXPECT_DOUBLE_EQ(r.medium_index, 1.33);
    EXPECT_DOUBLE_EQ(r.intensity, 1.0);
    EXPECT_TRUE(r.alive());
}

TEST(Ray, PropagateAppendsPoints)
{
    Ray r(Vector2d(0, 1), 0.0);
    r.propagate(10.0);
    ASSERT_EQ(r.path.size(), 2u);
    EXPECT_NEAR(r.origin.x(), 10.0, kEps);
    EXPECT_NEAR(r.origin.y(), 1.0, kEps);

    r.angle = 90.0 * kDeg;
    r.propagate(2.0);
    EXPECT_NEAR(r.origin.x(), 10.0, kEps);
    EXPECT_NEAR(r.origin.y(), 3.0, kEps);

    // A zero step still records a point
    r.propagate(0.0);
    EXPECT_EQ(r.path.size(), 4u);
}

TEST(Ray, NormalIncidenceKeepsDirection)
{
    Ray r(Vector2d(0, 0), 0.0);
    EXPECT_TRUE(r.refract(1.0, 1.5, M_PI));
    EXPECT_NEAR(r.angle, 0.0, kEps);
    EXPECT_DOUBLE_EQ(r.medium_index, 1.5);
}

TEST(Ray, SnellAtFlatInterface)
{
    Ray r(Vector2d(0, 0), 30.0 * kDeg);
    EXPECT_TRUE(r.refract(1.0, 1.5, M_PI));
    EXPECT_NEAR(r.angle, std::asin(0.5 / 1.5), 1e-12);
}

TEST(Ray, NormalOrientationDoesNotMatter)
{
    Ray a(Vector2d(0, 0), 0.2);
    Ray b(Vector2d(0, 0), 0.2);
    a.refract(1.0, 1.7, 0.4);
    b.refract(1.0, 1.7, 0.4 + M_PI);
    EXPECT_NEAR(a.angle, b.angle, kEps);
}

TEST(Ray, SnellInvariantOnTiltedNormal)
{
    const double normal = 0.3;
    Ray r(Vector2d(0, 0), 0.1);
    ASSERT_TRUE(r.refract(1.0, 1.5, normal));
    EXPECT_NEAR(1.0 * std::sin(0.1 - normal), 1.5 * std::sin(r.angle - normal), 1e-12);
}

TEST(Ray, TotalInternalReflectionMirrorsDirection)
{
    Ray r(Vector2d(0, 0), 60.0 * kDeg);
    EXPECT_FALSE(r.refract(1.5, 1.0, 0.0));
    EXPECT_TRUE(r.total_internal_reflection);
    EXPECT_FALSE(r.blocked);
    EXPECT_FALSE(r.alive());

    // Mirror about the plane x = const: (cos, sin) -> (-cos, sin)
    EXPECT_NEAR(r.angle, 120.0 * kDeg, 1e-12);
    EXPECT_DOUBLE_EQ(r.medium_index, 1.0);
}

TEST(Ray, BelowCriticalAngleTransmits)
{
    // Critical angle for 1.5 -> 1.0 is 41.8 degrees
    Ray r(Vector2d(0, 0), 40.0 * kDeg);
    EXPECT_TRUE(r.refract(1.5, 1.0, 0.0));
    EXPECT_FALSE(r.total_internal_reflection);
}

TEST(Ray, ZeroIndexBlocks)
{
    Ray r(Vector2d(0, 0), 0.0);
    EXPECT_FALSE(r.refract(1.0, 0.0, M_PI));
    EXPECT_TRUE(r.blocked);
}

TEST(Common, WrapAngle)
{
    EXPECT_NEAR(wrap_angle(2.5 * M_PI), 0.5 * M_PI, kEps);
    EXPECT_NEAR(wrap_angle(-M_PI), M_PI, kEps);
    EXPECT_NEAR(wrap_angle(0.5), 0.5, kEps);
    EXPECT_NEAR(wrap_angle(-2.0 * M_PI - 0.5), -0.5, kEps);
}

TEST(Common, WrapAngleLargeAndNonFinite)
{
    for (double a : {1e12, -1e12, 1e300, -7.0e15})
    {
        double w = wrap_angle(a);
        EXPECT_GT(w, -M_PI) << a;
        EXPECT_LE(w, M_PI) << a;
    }
    EXPECT_NEAR(wrap_angle(2000.0 * M_PI + 0.25), 0.25, 1e-9);
    EXPECT_TRUE(std::isnan(wrap_angle(std::numeric_limits<double>::infinity())));
    EXPECT_TRUE(std::isnan(wrap_angle(-std::numeric_limits<double>::infinity())));
    EXPECT_TRUE(std::isnan(wrap_angle(std::numeric_limits<double>::quiet_NaN())));
}
