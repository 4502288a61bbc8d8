#include <chroma/color/color.h>
#include <chroma/math/angle.h>
#include <chroma/math/gamma.h>
#include <chroma/model/cylindrical.h>
#include <chroma/model/oklab.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <tuple>

namespace chroma {

using math::clamp01;
using math::lerp;
using math::normalize_angle;
using model::Quad;
using model::Triple;

namespace {

uint8_t to_u8(float channel) {
    return static_cast<uint8_t>(std::lround(clamp01(channel) * 255.0f));
}

float from_u8(uint8_t channel) {
    return static_cast<float>(channel) / 255.0f;
}

Color from_triple(const Triple& rgb, float alpha) {
    return Color::from_rgba(rgb[0], rgb[1], rgb[2], alpha);
}

Quad with_alpha(const Triple& t, float alpha) {
    return {t[0], t[1], t[2], alpha};
}

// Shortest decimal form that reads back as the same float.
std::string format_float(float value) {
    char buf[32];
    for (int precision = 1; precision < std::numeric_limits<float>::max_digits10; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, static_cast<double>(value));
        if (std::strtof(buf, nullptr) == value) {
            return buf;
        }
    }
    std::snprintf(buf, sizeof(buf), "%.*g", std::numeric_limits<float>::max_digits10,
                  static_cast<double>(value));
    return buf;
}

} // anonymous namespace

const char* space_name(Space space) {
    switch (space) {
        case Space::Rgb:       return "srgb";
        case Space::LinearRgb: return "srgb-linear";
        case Space::Hsl:       return "hsl";
        case Space::Hsv:       return "hsv";
        case Space::Hwb:       return "hwb";
        case Space::Oklab:     return "oklab";
        case Space::Lab:       return "lab";
        case Space::Lch:       return "lch";
    }
    return "unknown";
}

std::optional<Space> parse_space(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "srgb" || lower == "rgb") return Space::Rgb;
    if (lower == "srgb-linear" || lower == "linear-rgb") return Space::LinearRgb;
    if (lower == "hsl") return Space::Hsl;
    if (lower == "hsv") return Space::Hsv;
    if (lower == "hwb") return Space::Hwb;
    if (lower == "oklab") return Space::Oklab;
    if (lower == "lab") return Space::Lab;
    if (lower == "lch") return Space::Lch;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------

Color Color::from_rgb(float r, float g, float b) {
    return from_rgba(r, g, b, 1.0f);
}

Color Color::from_rgba(float r, float g, float b, float a) {
    return Color{clamp01(r), clamp01(g), clamp01(b), clamp01(a)};
}

Color Color::from_rgb_u8(uint8_t r, uint8_t g, uint8_t b) {
    return from_rgba_u8(r, g, b, 255);
}

Color Color::from_rgba_u8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return Color{from_u8(r), from_u8(g), from_u8(b), from_u8(a)};
}

Color Color::from_linear_rgb(float r, float g, float b) {
    return from_linear_rgba(r, g, b, 1.0f);
}

Color Color::from_linear_rgba(float r, float g, float b, float a) {
    return from_triple(math::from_linear(Triple{r, g, b}), a);
}

Color Color::from_linear_rgb_u8(uint8_t r, uint8_t g, uint8_t b) {
    return from_linear_rgba_u8(r, g, b, 255);
}

Color Color::from_linear_rgba_u8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    return from_linear_rgba(from_u8(r), from_u8(g), from_u8(b), from_u8(a));
}

Color Color::from_hsl(float h, float s, float l) {
    return from_hsla(h, s, l, 1.0f);
}

Color Color::from_hsla(float h, float s, float l, float a) {
    return from_triple(model::hsl_to_rgb(normalize_angle(h), clamp01(s), clamp01(l)), a);
}

Color Color::from_hsv(float h, float s, float v) {
    return from_hsva(h, s, v, 1.0f);
}

Color Color::from_hsva(float h, float s, float v, float a) {
    return from_triple(model::hsv_to_rgb(normalize_angle(h), clamp01(s), clamp01(v)), a);
}

Color Color::from_hwb(float h, float w, float b) {
    return from_hwba(h, w, b, 1.0f);
}

Color Color::from_hwba(float h, float w, float b, float a) {
    return from_triple(model::hwb_to_rgb(normalize_angle(h), clamp01(w), clamp01(b)), a);
}

Color Color::from_oklab(float l, float a, float b) {
    return from_oklaba(l, a, b, 1.0f);
}

Color Color::from_oklaba(float l, float a, float b, float alpha) {
    return from_triple(model::oklab_to_rgb(Triple{l, a, b}), alpha);
}

Color Color::from_lab(float l, float a, float b, float alpha) {
    return from_lab(model::CieLab{}, l, a, b, alpha);
}

Color Color::from_lab(const model::PerceptualModel& perceptual,
                      float l, float a, float b, float alpha) {
    return from_triple(perceptual.to_rgb(Triple{l, a, b}), alpha);
}

Color Color::from_lch(float l, float c, float hue_rad, float alpha) {
    return from_lch(model::CieLab{}, l, c, hue_rad, alpha);
}

Color Color::from_lch(const model::PerceptualModel& perceptual,
                      float l, float c, float hue_rad, float alpha) {
    auto lab = model::lch_to_lab(Triple{l, std::max(c, 0.0f), math::normalize_angle_rad(hue_rad)});
    return from_triple(perceptual.to_rgb(lab), alpha);
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::array<uint8_t, 4> Color::rgba_u8() const {
    return {to_u8(r), to_u8(g), to_u8(b), to_u8(a)};
}

Quad Color::to_linear_rgba() const {
    return with_alpha(math::to_linear(Triple{r, g, b}), a);
}

std::array<uint8_t, 4> Color::to_linear_rgba_u8() const {
    auto [lr, lg, lb, la] = to_linear_rgba();
    return {to_u8(lr), to_u8(lg), to_u8(lb), to_u8(la)};
}

Quad Color::to_hsla() const {
    return with_alpha(model::rgb_to_hsl(r, g, b), a);
}

Quad Color::to_hsva() const {
    return with_alpha(model::rgb_to_hsv(r, g, b), a);
}

Quad Color::to_hwba() const {
    return with_alpha(model::rgb_to_hwb(r, g, b), a);
}

Quad Color::to_oklaba() const {
    return with_alpha(model::rgb_to_oklab(Triple{r, g, b}), a);
}

Quad Color::to_lab() const {
    return to_lab(model::CieLab{});
}

Quad Color::to_lab(const model::PerceptualModel& perceptual) const {
    return with_alpha(perceptual.from_rgb(Triple{r, g, b}), a);
}

Quad Color::to_lch() const {
    return to_lch(model::CieLab{});
}

Quad Color::to_lch(const model::PerceptualModel& perceptual) const {
    return with_alpha(model::lab_to_lch(perceptual.from_rgb(Triple{r, g, b})), a);
}

// ---------------------------------------------------------------------------
// Interpolation
// ---------------------------------------------------------------------------

Color Color::interpolate_rgb(const Color& other, float t) const {
    return from_rgba(lerp(r, other.r, t), lerp(g, other.g, t),
                     lerp(b, other.b, t), lerp(a, other.a, t));
}

Color Color::interpolate_linear_rgb(const Color& other, float t) const {
    auto [r1, g1, b1, a1] = to_linear_rgba();
    auto [r2, g2, b2, a2] = other.to_linear_rgba();
    return from_linear_rgba(lerp(r1, r2, t), lerp(g1, g2, t),
                            lerp(b1, b2, t), lerp(a1, a2, t));
}

Color Color::interpolate_hsl(const Color& other, float t) const {
    auto [h1, s1, l1, a1] = to_hsla();
    auto [h2, s2, l2, a2] = other.to_hsla();
    return from_hsla(math::interp_angle(h1, h2, t), lerp(s1, s2, t),
                     lerp(l1, l2, t), lerp(a1, a2, t));
}

Color Color::interpolate_hsv(const Color& other, float t) const {
    auto [h1, s1, v1, a1] = to_hsva();
    auto [h2, s2, v2, a2] = other.to_hsva();
    return from_hsva(math::interp_angle(h1, h2, t), lerp(s1, s2, t),
                     lerp(v1, v2, t), lerp(a1, a2, t));
}

Color Color::interpolate_hwb(const Color& other, float t) const {
    auto [h1, w1, bk1, a1] = to_hwba();
    auto [h2, w2, bk2, a2] = other.to_hwba();
    return from_hwba(math::interp_angle(h1, h2, t), lerp(w1, w2, t),
                     lerp(bk1, bk2, t), lerp(a1, a2, t));
}

Color Color::interpolate_oklab(const Color& other, float t) const {
    auto [l1, a1, b1, alpha1] = to_oklaba();
    auto [l2, a2, b2, alpha2] = other.to_oklaba();
    return from_oklaba(lerp(l1, l2, t), lerp(a1, a2, t),
                       lerp(b1, b2, t), lerp(alpha1, alpha2, t));
}

Color Color::interpolate_lab(const Color& other, float t) const {
    return interpolate_lab(other, t, model::CieLab{});
}

Color Color::interpolate_lab(const Color& other, float t, const model::PerceptualModel& perceptual) const {
    auto [l1, a1, b1, alpha1] = to_lab(perceptual);
    auto [l2, a2, b2, alpha2] = other.to_lab(perceptual);
    return from_lab(perceptual, lerp(l1, l2, t), lerp(a1, a2, t),
                    lerp(b1, b2, t), lerp(alpha1, alpha2, t));
}

Color Color::interpolate_lch(const Color& other, float t) const {
    return interpolate_lch(other, t, model::CieLab{});
}

Color Color::interpolate_lch(const Color& other, float t, const model::PerceptualModel& perceptual) const {
    auto [l1, c1, h1, alpha1] = to_lch(perceptual);
    auto [l2, c2, h2, alpha2] = other.to_lch(perceptual);
    return from_lch(perceptual, lerp(l1, l2, t), lerp(c1, c2, t),
                    math::interp_angle_rad(h1, h2, t), lerp(alpha1, alpha2, t));
}

Color Color::interpolate(const Color& other, float t, Space space) const {
    switch (space) {
        case Space::Rgb:       return interpolate_rgb(other, t);
        case Space::LinearRgb: return interpolate_linear_rgb(other, t);
        case Space::Hsl:       return interpolate_hsl(other, t);
        case Space::Hsv:       return interpolate_hsv(other, t);
        case Space::Hwb:       return interpolate_hwb(other, t);
        case Space::Oklab:     return interpolate_oklab(other, t);
        case Space::Lab:       return interpolate_lab(other, t);
        case Space::Lch:       return interpolate_lch(other, t);
    }
    return interpolate_rgb(other, t);
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

std::string Color::to_hex_string() const {
    auto [r8, g8, b8, a8] = rgba_u8();
    char buf[10];
    if (a8 < 255) {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", r8, g8, b8, a8);
    } else {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r8, g8, b8);
    }
    return buf;
}

std::string Color::to_rgb_string() const {
    const auto rgba8 = rgba_u8();
    std::ostringstream oss;
    oss << (a < 1.0f ? "rgba(" : "rgb(")
        << +rgba8[0] << "," << +rgba8[1] << "," << +rgba8[2];
    if (a < 1.0f) {
        oss << "," << format_float(a);
    }
    oss << ")";
    return oss.str();
}

bool Color::operator<(const Color& other) const {
    return std::tie(r, g, b, a) < std::tie(other.r, other.g, other.b, other.a);
}

std::ostream& operator<<(std::ostream& os, const Color& color) {
    return os << "RGBA(" << color.r << "," << color.g << ","
              << color.b << "," << color.a << ")";
}

} // namespace chroma
