#include <chroma/model/cylindrical.h>
#include <gtest/gtest.h>

using namespace chroma::model;

namespace {

void expect_triple_near(const Triple& actual, const Triple& expected, float tol = 1e-4f) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_NEAR(actual[i], expected[i], tol) << "component " << i;
    }
}

constexpr Triple kSamples[] = {
    {1.0f, 0.0f, 0.0f},
    {0.2f, 0.4f, 0.6f},
    {0.9f, 0.7f, 0.1f},
    {0.3f, 0.8f, 0.35f},
    {0.55f, 0.1f, 0.75f},
    {0.05f, 0.05f, 0.9f},
};

} // namespace

// ------------------------------------------------------------------
// HSL
// ------------------------------------------------------------------

TEST(CylindricalTest, HslPrimaries) {
    expect_triple_near(hsl_to_rgb(0.0f, 1.0f, 0.5f), {1.0f, 0.0f, 0.0f});
    expect_triple_near(hsl_to_rgb(120.0f, 1.0f, 0.5f), {0.0f, 1.0f, 0.0f});
    expect_triple_near(hsl_to_rgb(240.0f, 1.0f, 0.5f), {0.0f, 0.0f, 1.0f});
    expect_triple_near(hsl_to_rgb(60.0f, 1.0f, 0.5f), {1.0f, 1.0f, 0.0f});
}

TEST(CylindricalTest, HslDegenerate) {
    expect_triple_near(rgb_to_hsl(0.0f, 0.0f, 0.0f), {0.0f, 0.0f, 0.0f}, 0.0f);
    expect_triple_near(rgb_to_hsl(1.0f, 1.0f, 1.0f), {0.0f, 0.0f, 1.0f}, 0.0f);
    for (float h : {0.0f, 45.0f, 200.0f, 359.0f}) {
        expect_triple_near(hsl_to_rgb(h, 0.0f, 0.3f), {0.3f, 0.3f, 0.3f}, 0.0f);
    }
}

TEST(CylindricalTest, HslRoundTrip) {
    for (const auto& rgb : kSamples) {
        auto [h, s, l] = rgb_to_hsl(rgb[0], rgb[1], rgb[2]);
        expect_triple_near(hsl_to_rgb(h, s, l), rgb);
    }
}

// ------------------------------------------------------------------
// HSV
// ------------------------------------------------------------------

TEST(CylindricalTest, HsvPrimaries) {
    expect_triple_near(hsv_to_rgb(0.0f, 1.0f, 1.0f), {1.0f, 0.0f, 0.0f});
    expect_triple_near(hsv_to_rgb(180.0f, 1.0f, 1.0f), {0.0f, 1.0f, 1.0f});
    expect_triple_near(hsv_to_rgb(0.0f, 0.0f, 0.4f), {0.4f, 0.4f, 0.4f});
}

TEST(CylindricalTest, HsvOfBlackAndWhite) {
    expect_triple_near(rgb_to_hsv(0.0f, 0.0f, 0.0f), {0.0f, 0.0f, 0.0f}, 0.0f);
    expect_triple_near(rgb_to_hsv(1.0f, 1.0f, 1.0f), {0.0f, 0.0f, 1.0f}, 0.0f);
}

TEST(CylindricalTest, HsvHslBridge) {
    auto hsl = hsv_to_hsl(30.0f, 1.0f, 1.0f);
    expect_triple_near(hsl, {30.0f, 1.0f, 0.5f});
    expect_triple_near(hsl_to_hsv(hsl[0], hsl[1], hsl[2]), {30.0f, 1.0f, 1.0f});
}

TEST(CylindricalTest, HsvRoundTrip) {
    for (const auto& rgb : kSamples) {
        auto [h, s, v] = rgb_to_hsv(rgb[0], rgb[1], rgb[2]);
        expect_triple_near(hsv_to_rgb(h, s, v), rgb);
    }
}

// ------------------------------------------------------------------
// HWB
// ------------------------------------------------------------------

TEST(CylindricalTest, HwbSaturatedWhitenessAndBlacknessGiveGray) {
    expect_triple_near(hwb_to_rgb(90.0f, 0.6f, 0.6f), {0.5f, 0.5f, 0.5f}, 1e-6f);
    expect_triple_near(hwb_to_rgb(0.0f, 0.75f, 0.25f), {0.75f, 0.75f, 0.75f}, 1e-6f);
    expect_triple_near(hwb_to_rgb(200.0f, 1.0f, 0.0f), {1.0f, 1.0f, 1.0f}, 1e-6f);
}

TEST(CylindricalTest, HwbPureHue) {
    expect_triple_near(hwb_to_rgb(0.0f, 0.0f, 0.0f), {1.0f, 0.0f, 0.0f});
    expect_triple_near(hwb_to_rgb(240.0f, 0.2f, 0.0f), {0.2f, 0.2f, 1.0f});
}

TEST(CylindricalTest, HwbRoundTrip) {
    for (const auto& rgb : kSamples) {
        auto [h, w, b] = rgb_to_hwb(rgb[0], rgb[1], rgb[2]);
        expect_triple_near(hwb_to_rgb(h, w, b), rgb);
    }
}
