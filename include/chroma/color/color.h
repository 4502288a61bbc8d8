#pragma once
#include <chroma/model/components.h>
#include <chroma/model/lab.h>

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace chroma {

// Color spaces an interpolation can run in.
enum class Space { Rgb, LinearRgb, Hsl, Hsv, Hwb, Oklab, Lab, Lch };

const char* space_name(Space space);

// Accepts the CSS color-mix() names ("srgb", "srgb-linear", "hsl", ...)
// plus the aliases "rgb" and "linear-rgb". Case-insensitive.
std::optional<Space> parse_space(std::string_view name);

// Encoded sRGB with straight alpha, every channel in [0, 1].
//
// The named constructors clamp and wrap their inputs, so anything they return
// is in range. Aggregate initialization (Color{r, g, b, a}) stores the fields
// as given; intermediate out-of-gamut values are allowed that way.
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    static Color from_rgb(float r, float g, float b);
    static Color from_rgba(float r, float g, float b, float a);
    static Color from_rgb_u8(uint8_t r, uint8_t g, uint8_t b);
    static Color from_rgba_u8(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    static Color from_linear_rgb(float r, float g, float b);
    static Color from_linear_rgba(float r, float g, float b, float a);
    static Color from_linear_rgb_u8(uint8_t r, uint8_t g, uint8_t b);
    static Color from_linear_rgba_u8(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    // hue in degrees (any value, wrapped), the rest in [0, 1] (clamped)
    static Color from_hsl(float h, float s, float l);
    static Color from_hsla(float h, float s, float l, float a);
    static Color from_hsv(float h, float s, float v);
    static Color from_hsva(float h, float s, float v, float a);
    static Color from_hwb(float h, float w, float b);
    static Color from_hwba(float h, float w, float b, float a);

    static Color from_oklab(float l, float a, float b);
    static Color from_oklaba(float l, float a, float b, float alpha);

    // CIE Lab/LCh through the given perceptual model, CieLab when omitted.
    static Color from_lab(float l, float a, float b, float alpha = 1.0f);
    static Color from_lab(const model::PerceptualModel& perceptual,
                          float l, float a, float b, float alpha = 1.0f);
    static Color from_lch(float l, float c, float hue_rad, float alpha = 1.0f);
    static Color from_lch(const model::PerceptualModel& perceptual,
                          float l, float c, float hue_rad, float alpha = 1.0f);

    model::Quad rgba() const { return {r, g, b, a}; }
    std::array<uint8_t, 4> rgba_u8() const;

    model::Quad to_linear_rgba() const;
    std::array<uint8_t, 4> to_linear_rgba_u8() const;
    model::Quad to_hsla() const;
    model::Quad to_hsva() const;
    model::Quad to_hwba() const;
    model::Quad to_oklaba() const;
    model::Quad to_lab() const;
    model::Quad to_lab(const model::PerceptualModel& perceptual) const;
    model::Quad to_lch() const;
    model::Quad to_lch(const model::PerceptualModel& perceptual) const;

    // Blend toward `other`. t is not clamped: values outside [0, 1]
    // extrapolate and the result is clamped by the reconstructing constructor.
    Color interpolate_rgb(const Color& other, float t) const;
    Color interpolate_linear_rgb(const Color& other, float t) const;
    Color interpolate_hsl(const Color& other, float t) const;
    Color interpolate_hsv(const Color& other, float t) const;
    Color interpolate_hwb(const Color& other, float t) const;
    Color interpolate_oklab(const Color& other, float t) const;
    Color interpolate_lab(const Color& other, float t) const;
    Color interpolate_lab(const Color& other, float t, const model::PerceptualModel& perceptual) const;
    Color interpolate_lch(const Color& other, float t) const;
    Color interpolate_lch(const Color& other, float t, const model::PerceptualModel& perceptual) const;
    Color interpolate(const Color& other, float t, Space space) const;

    // "#rrggbb", or "#rrggbbaa" when alpha is below 255 in 8 bits.
    std::string to_hex_string() const;
    // "rgb(r,g,b)", or "rgba(r,g,b,a)" when a < 1. The alpha is the stored float
    // in its shortest round-trip form: 0.5, 0.5019608.
    std::string to_rgb_string() const;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    bool operator<(const Color& other) const;

    static Color black() { return {0.0f, 0.0f, 0.0f, 1.0f}; }
    static Color white() { return {1.0f, 1.0f, 1.0f, 1.0f}; }
    static Color transparent() { return {0.0f, 0.0f, 0.0f, 0.0f}; }
};

// Writes "RGBA(r,g,b,a)".
std::ostream& operator<<(std::ostream& os, const Color& color);

} // namespace chroma
