#include <chroma/math/angle.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace chroma::math;

// ------------------------------------------------------------------
// normalize_angle
// ------------------------------------------------------------------

TEST(AngleTest, NormalizeKnownValues) {
    EXPECT_FLOAT_EQ(normalize_angle(0.0f), 0.0f);
    EXPECT_FLOAT_EQ(normalize_angle(360.0f), 0.0f);
    EXPECT_FLOAT_EQ(normalize_angle(400.0f), 40.0f);
    EXPECT_FLOAT_EQ(normalize_angle(1155.0f), 75.0f);
    EXPECT_FLOAT_EQ(normalize_angle(-360.0f), 0.0f);
    EXPECT_FLOAT_EQ(normalize_angle(-90.0f), 270.0f);
    EXPECT_FLOAT_EQ(normalize_angle(-765.0f), 315.0f);
}

TEST(AngleTest, NormalizeStaysInHalfOpenRange) {
    for (float x = -2000.0f; x <= 2000.0f; x += 7.25f) {
        float n = normalize_angle(x);
        EXPECT_GE(n, 0.0f) << x;
        EXPECT_LT(n, 360.0f) << x;
    }
    float tiny = normalize_angle(-1e-7f);
    EXPECT_GE(tiny, 0.0f);
    EXPECT_LT(tiny, 360.0f);
}

TEST(AngleTest, NormalizeIsPeriodic) {
    for (int k = -3; k <= 3; ++k) {
        EXPECT_NEAR(normalize_angle(30.0f + 360.0f * k), 30.0f, 1e-3f) << k;
        EXPECT_NEAR(normalize_angle(250.0f + 360.0f * k), 250.0f, 1e-3f) << k;
    }
}

TEST(AngleTest, NormalizeNonFiniteIsZero) {
    EXPECT_EQ(normalize_angle(std::numeric_limits<float>::quiet_NaN()), 0.0f);
    EXPECT_EQ(normalize_angle(std::numeric_limits<float>::infinity()), 0.0f);
    EXPECT_EQ(normalize_angle(-std::numeric_limits<float>::infinity()), 0.0f);
    EXPECT_EQ(normalize_angle_rad(std::numeric_limits<float>::quiet_NaN()), 0.0f);
}

TEST(AngleTest, NormalizeRadians) {
    EXPECT_NEAR(normalize_angle_rad(kTau + 1.0f), 1.0f, 1e-5f);
    EXPECT_NEAR(normalize_angle_rad(-kPi / 2.0f), 1.5f * kPi, 1e-5f);
    EXPECT_EQ(normalize_angle_rad(kTau), 0.0f);
}

TEST(AngleTest, ModuloHasSignOfDivisor) {
    EXPECT_FLOAT_EQ(modulo(-1.0f, 6.0f), 5.0f);
    EXPECT_FLOAT_EQ(modulo(7.0f, 6.0f), 1.0f);
    EXPECT_FLOAT_EQ(modulo(3.0f, 6.0f), 3.0f);
}

// ------------------------------------------------------------------
// interp_angle
// ------------------------------------------------------------------

TEST(AngleTest, InterpEndpoints) {
    EXPECT_FLOAT_EQ(interp_angle(0.0f, 90.0f, 0.0f), 0.0f);
    EXPECT_FLOAT_EQ(interp_angle(0.0f, 90.0f, 1.0f), 90.0f);
    EXPECT_FLOAT_EQ(interp_angle(400.0f, 10.0f, 0.0f), 40.0f);
    EXPECT_FLOAT_EQ(interp_angle(400.0f, -90.0f, 1.0f), 270.0f);
}

TEST(AngleTest, InterpTakesShorterArc) {
    EXPECT_FLOAT_EQ(interp_angle(0.0f, 90.0f, 0.5f), 45.0f);
    EXPECT_FLOAT_EQ(interp_angle(360.0f, 90.0f, 0.5f), 45.0f);
    EXPECT_FLOAT_EQ(interp_angle(350.0f, 10.0f, 0.5f), 0.0f);
    EXPECT_FLOAT_EQ(interp_angle(10.0f, 350.0f, 0.25f), 5.0f);
    EXPECT_FLOAT_EQ(interp_angle(300.0f, 60.0f, 0.5f), 0.0f);
}

TEST(AngleTest, InterpRadians) {
    // crosses zero going backwards
    EXPECT_NEAR(interp_angle_rad(kPi / 4.0f, kTau - kPi / 4.0f, 0.25f), kPi / 8.0f, 1e-5f);
    EXPECT_NEAR(interp_angle_rad(0.0f, kPi / 2.0f, 0.5f), kPi / 4.0f, 1e-6f);
}

// ------------------------------------------------------------------
// Helpers
// ------------------------------------------------------------------

TEST(AngleTest, Clamp01) {
    EXPECT_EQ(clamp01(-0.5f), 0.0f);
    EXPECT_EQ(clamp01(0.25f), 0.25f);
    EXPECT_EQ(clamp01(1.5f), 1.0f);
    EXPECT_EQ(clamp01(std::numeric_limits<float>::quiet_NaN()), 0.0f);
}

TEST(AngleTest, DegreeRadianConversion) {
    EXPECT_NEAR(degrees_to_radians(180.0f), kPi, 1e-6f);
    EXPECT_NEAR(radians_to_degrees(kPi / 2.0f), 90.0f, 1e-4f);
    EXPECT_FLOAT_EQ(lerp(2.0f, 4.0f, 0.5f), 3.0f);
}
