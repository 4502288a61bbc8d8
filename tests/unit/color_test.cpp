#include <chroma/color/color.h>
#include <chroma/core/config.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <limits>
#include <string>
#include <sstream>

using chroma::Color;
using chroma::Space;
using chroma::core::config::kRoundTripTolerance;

namespace {

void expect_color_near(const Color& actual, const Color& expected, float tol = kRoundTripTolerance) {
    EXPECT_NEAR(actual.r, expected.r, tol);
    EXPECT_NEAR(actual.g, expected.g, tol);
    EXPECT_NEAR(actual.b, expected.b, tol);
    EXPECT_NEAR(actual.a, expected.a, tol);
}

const Color kSamples[] = {
    Color::from_rgb(1.0f, 0.0f, 0.0f),
    Color::from_rgba(0.2f, 0.4f, 0.6f, 0.8f),
    Color::from_rgb(0.9f, 0.7f, 0.1f),
    Color::from_rgba(0.3f, 0.8f, 0.35f, 0.25f),
    Color::from_rgb(0.55f, 0.1f, 0.75f),
};

constexpr Space kAllSpaces[] = {
    Space::Rgb, Space::LinearRgb, Space::Hsl, Space::Hsv,
    Space::Hwb, Space::Oklab, Space::Lab, Space::Lch,
};

} // namespace

// ------------------------------------------------------------------
// 1. Construction
// ------------------------------------------------------------------

TEST(ColorTest, DefaultIsOpaqueBlack) {
    Color c;
    EXPECT_EQ(c, Color::black());
    EXPECT_EQ(c.a, 1.0f);
}

TEST(ColorTest, NamedConstructorsClamp) {
    Color c = Color::from_rgba(1.5f, -0.2f, 0.5f, 2.0f);
    EXPECT_EQ(c.r, 1.0f);
    EXPECT_EQ(c.g, 0.0f);
    EXPECT_EQ(c.b, 0.5f);
    EXPECT_EQ(c.a, 1.0f);
}

TEST(ColorTest, NanChannelBecomesZero) {
    Color c = Color::from_rgb(std::numeric_limits<float>::quiet_NaN(), 0.5f, 0.5f);
    EXPECT_EQ(c.r, 0.0f);
}

TEST(ColorTest, AggregateInitKeepsFieldsAsGiven) {
    Color c{2.0f, -1.0f, 0.5f, 1.0f};
    EXPECT_EQ(c.r, 2.0f);
    EXPECT_EQ(c.g, -1.0f);
    // 8-bit output still clamps
    auto rgba8 = c.rgba_u8();
    EXPECT_EQ(rgba8[0], 255);
    EXPECT_EQ(rgba8[1], 0);
    EXPECT_EQ(rgba8[2], 128);
    EXPECT_EQ(rgba8[3], 255);
}

TEST(ColorTest, FromU8) {
    Color c = Color::from_rgba_u8(255, 0, 51, 255);
    EXPECT_EQ(c.r, 1.0f);
    EXPECT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.2f);
    EXPECT_EQ(c.a, 1.0f);
}

TEST(ColorTest, FromHslRed) {
    expect_color_near(Color::from_hsl(0.0f, 1.0f, 0.5f), Color::from_rgb(1.0f, 0.0f, 0.0f));
}

TEST(ColorTest, FromHslWrapsHue) {
    expect_color_near(Color::from_hsl(480.0f, 1.0f, 0.5f), Color::from_hsl(120.0f, 1.0f, 0.5f));
    expect_color_near(Color::from_hsl(-240.0f, 1.0f, 0.5f), Color::from_hsl(120.0f, 1.0f, 0.5f));
}

TEST(ColorTest, FromHslClampsSaturationAndLightness) {
    expect_color_near(Color::from_hsl(0.0f, 3.0f, 0.5f), Color::from_hsl(0.0f, 1.0f, 0.5f));
    expect_color_near(Color::from_hsl(0.0f, 1.0f, -1.0f), Color::black());
}

TEST(ColorTest, FromHwbGray) {
    expect_color_near(Color::from_hwb(45.0f, 0.6f, 0.6f), Color::from_rgb(0.5f, 0.5f, 0.5f));
}

TEST(ColorTest, FromLinearRgb) {
    Color c = Color::from_linear_rgb(0.214041f, 0.0f, 1.0f);
    EXPECT_NEAR(c.r, 0.5f, 1e-4f);
    EXPECT_EQ(c.g, 0.0f);
    EXPECT_NEAR(c.b, 1.0f, 1e-6f);
}

TEST(ColorTest, FromLchClampsNegativeChroma) {
    expect_color_near(Color::from_lch(50.0f, -10.0f, 1.0f), Color::from_lch(50.0f, 0.0f, 1.0f));
}

TEST(ColorTest, FromLabWhite) {
    expect_color_near(Color::from_lab(100.0f, 0.0f, 0.0f), Color::white(), 1e-3f);
}

// ------------------------------------------------------------------
// 2. Accessor round trips
// ------------------------------------------------------------------

TEST(ColorTest, HslRoundTrip) {
    for (const auto& c : kSamples) {
        auto [h, s, l, a] = c.to_hsla();
        expect_color_near(Color::from_hsla(h, s, l, a), c);
    }
}

TEST(ColorTest, HsvRoundTrip) {
    for (const auto& c : kSamples) {
        auto [h, s, v, a] = c.to_hsva();
        expect_color_near(Color::from_hsva(h, s, v, a), c);
    }
}

TEST(ColorTest, HwbRoundTrip) {
    for (const auto& c : kSamples) {
        auto [h, w, b, a] = c.to_hwba();
        expect_color_near(Color::from_hwba(h, w, b, a), c);
    }
}

TEST(ColorTest, OklabRoundTrip) {
    for (const auto& c : kSamples) {
        auto [l, a, b, alpha] = c.to_oklaba();
        expect_color_near(Color::from_oklaba(l, a, b, alpha), c);
    }
}

TEST(ColorTest, LinearRgbRoundTrip) {
    for (const auto& c : kSamples) {
        auto [r, g, b, a] = c.to_linear_rgba();
        expect_color_near(Color::from_linear_rgba(r, g, b, a), c);
    }
}

TEST(ColorTest, LabAndLchRoundTrip) {
    for (const auto& c : kSamples) {
        auto [l, a, b, alpha] = c.to_lab();
        expect_color_near(Color::from_lab(l, a, b, alpha), c, 1e-3f);

        auto [lc, ch, hue, alpha2] = c.to_lch();
        expect_color_near(Color::from_lch(lc, ch, hue, alpha2), c, 1e-3f);
    }
}

TEST(ColorTest, LinearU8OfWhite) {
    auto rgba8 = Color::white().to_linear_rgba_u8();
    EXPECT_EQ(rgba8[0], 255);
    EXPECT_EQ(rgba8[1], 255);
    EXPECT_EQ(rgba8[2], 255);
    EXPECT_EQ(rgba8[3], 255);
}

TEST(ColorTest, ExplicitPerceptualModel) {
    chroma::model::CieLab lab;
    Color c = Color::from_rgb(0.2f, 0.4f, 0.6f);
    auto with_default = c.to_lab();
    auto with_model = c.to_lab(lab);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(with_default[i], with_model[i]);
    }
}

// ------------------------------------------------------------------
// 3. Interpolation
// ------------------------------------------------------------------

TEST(ColorTest, InterpolateRgbIdentity) {
    for (const auto& c : kSamples) {
        for (float t : {0.0f, 0.3f, 0.5f, 1.0f}) {
            EXPECT_EQ(c.interpolate_rgb(c, t), c);
        }
    }
}

TEST(ColorTest, InterpolateEndpointsInEverySpace) {
    Color c1 = kSamples[1];
    Color c2 = kSamples[2];
    for (Space space : kAllSpaces) {
        expect_color_near(c1.interpolate(c2, 0.0f, space), c1, 2e-3f);
        expect_color_near(c1.interpolate(c2, 1.0f, space), c2, 2e-3f);
    }
}

TEST(ColorTest, InterpolateRgbMidpoint) {
    Color mid = Color::black().interpolate_rgb(Color::white(), 0.5f);
    expect_color_near(mid, Color::from_rgb(0.5f, 0.5f, 0.5f));
}

TEST(ColorTest, InterpolateLinearRgbIsBrighterThanRgb) {
    Color rgb_mid = Color::black().interpolate_rgb(Color::white(), 0.5f);
    Color linear_mid = Color::black().interpolate_linear_rgb(Color::white(), 0.5f);
    EXPECT_GT(linear_mid.r, rgb_mid.r);
    EXPECT_NEAR(linear_mid.r, 0.7354f, 1e-3f);
}

TEST(ColorTest, InterpolateHsvTakesShorterHueArc) {
    Color c1 = Color::from_hsv(360.0f, 1.0f, 1.0f);
    Color c2 = Color::from_hsv(90.0f, 1.0f, 1.0f);
    auto hsva = c1.interpolate_hsv(c2, 0.5f).to_hsva();
    EXPECT_NEAR(hsva[0], 45.0f, 1e-2f);
}

TEST(ColorTest, InterpolateHslTakesShorterHueArc) {
    Color c1 = Color::from_hsl(350.0f, 1.0f, 0.5f);
    Color c2 = Color::from_hsl(30.0f, 1.0f, 0.5f);
    auto hsla = c1.interpolate_hsl(c2, 0.5f).to_hsla();
    EXPECT_NEAR(hsla[0], 10.0f, 1e-2f);
}

TEST(ColorTest, InterpolateAlpha) {
    Color c1 = Color::from_rgba(1.0f, 0.0f, 0.0f, 0.0f);
    Color c2 = Color::from_rgba(1.0f, 0.0f, 0.0f, 1.0f);
    for (Space space : kAllSpaces) {
        EXPECT_NEAR(c1.interpolate(c2, 0.25f, space).a, 0.25f, 1e-5f) << chroma::space_name(space);
    }
}

TEST(ColorTest, ExtrapolationIsClamped) {
    Color c = Color::black().interpolate_rgb(Color::white(), 2.0f);
    EXPECT_EQ(c, Color::white());
}

// ------------------------------------------------------------------
// 4. Formatting and comparison
// ------------------------------------------------------------------

TEST(ColorTest, HexString) {
    EXPECT_EQ(Color::from_rgb_u8(255, 0, 0).to_hex_string(), "#ff0000");
    EXPECT_EQ(Color::from_rgba(1.0f, 0.0f, 0.0f, 0.5f).to_hex_string(), "#ff000080");
    EXPECT_EQ(Color::from_rgba(1.0f, 1.0f, 0.5f, 0.5f).to_hex_string(), "#ffff8080");
    EXPECT_EQ(Color::transparent().to_hex_string(), "#00000000");
}

TEST(ColorTest, RgbString) {
    EXPECT_EQ(Color::from_rgb(1.0f, 0.0f, 0.0f).to_rgb_string(), "rgb(255,0,0)");
    EXPECT_EQ(Color::from_rgba(1.0f, 0.0f, 0.0f, 0.5f).to_rgb_string(), "rgba(255,0,0,0.5)");
}

TEST(ColorTest, RgbStringKeepsFullAlphaPrecision) {
    Color c = Color::from_rgba_u8(255, 0, 0, 128);
    std::string text = c.to_rgb_string();
    EXPECT_EQ(text, "rgba(255,0,0,0.5019608)");

    // the printed alpha reads back as exactly the stored value
    std::string alpha = text.substr(text.rfind(',') + 1);
    alpha.pop_back();
    EXPECT_EQ(std::strtof(alpha.c_str(), nullptr), c.a);

    Color odd = Color::from_rgba(1.0f, 0.0f, 0.0f, 0.1234567f);
    std::string odd_text = odd.to_rgb_string();
    std::string odd_alpha = odd_text.substr(odd_text.rfind(',') + 1);
    odd_alpha.pop_back();
    EXPECT_EQ(std::strtof(odd_alpha.c_str(), nullptr), 0.1234567f);
    EXPECT_EQ(odd_text, "rgba(255,0,0,0.1234567)");
}

TEST(ColorTest, StreamOutput) {
    std::ostringstream oss;
    oss << Color{1.0f, 0.0f, 0.5f, 1.0f};
    EXPECT_EQ(oss.str(), "RGBA(1,0,0.5,1)");
}

TEST(ColorTest, Ordering) {
    EXPECT_LT(Color::black(), Color::white());
    EXPECT_FALSE(Color::white() < Color::white());
    EXPECT_NE(Color::black(), Color::transparent());
}

// ------------------------------------------------------------------
// 5. Space names
// ------------------------------------------------------------------

TEST(ColorTest, ParseSpaceNames) {
    for (Space space : kAllSpaces) {
        auto parsed = chroma::parse_space(chroma::space_name(space));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, space);
    }
    EXPECT_EQ(chroma::parse_space("RGB"), Space::Rgb);
    EXPECT_EQ(chroma::parse_space("linear-rgb"), Space::LinearRgb);
    EXPECT_FALSE(chroma::parse_space("cmyk").has_value());
}
