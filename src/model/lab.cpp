#include <chroma/model/lab.h>
#include <chroma/core/config.h>
#include <chroma/math/angle.h>
#include <chroma/math/gamma.h>

#include <cmath>

namespace chroma::model {

namespace {

constexpr float kEpsilon = 216.0f / 24389.0f;
constexpr float kKappa = 24389.0f / 27.0f;

float lab_f(float t) {
    if (t > kEpsilon) return std::cbrt(t);
    return (kKappa * t + 16.0f) / 116.0f;
}

float lab_f_inv(float f) {
    float f3 = f * f * f;
    if (f3 > kEpsilon) return f3;
    return (116.0f * f - 16.0f) / kKappa;
}

} // anonymous namespace

Triple CieLab::rgb_to_xyz(const Triple& rgb) {
    const auto [r, g, b] = math::to_linear(rgb);
    return {
        0.4124564f * r + 0.3575761f * g + 0.1804375f * b,
        0.2126729f * r + 0.7151522f * g + 0.0721750f * b,
        0.0193339f * r + 0.1191920f * g + 0.9503041f * b,
    };
}

Triple CieLab::xyz_to_rgb(const Triple& xyz) {
    const auto [x, y, z] = xyz;
    return math::from_linear(Triple{
        +3.2404542f * x - 1.5371385f * y - 0.4985314f * z,
        -0.9692660f * x + 1.8760108f * y + 0.0415560f * z,
        +0.0556434f * x - 0.2040259f * y + 1.0572252f * z,
    });
}

Triple CieLab::xyz_to_lab(const Triple& xyz) {
    const auto& white = core::config::kD65White;
    float fx = lab_f(xyz[0] / white[0]);
    float fy = lab_f(xyz[1] / white[1]);
    float fz = lab_f(xyz[2] / white[2]);
    return {116.0f * fy - 16.0f, 500.0f * (fx - fy), 200.0f * (fy - fz)};
}

Triple CieLab::lab_to_xyz(const Triple& lab) {
    const auto& white = core::config::kD65White;
    float fy = (lab[0] + 16.0f) / 116.0f;
    float fx = lab[1] / 500.0f + fy;
    float fz = fy - lab[2] / 200.0f;

    // Y uses L directly below the linear threshold, as CIE specifies
    float yr = lab[0] > kKappa * kEpsilon ? fy * fy * fy : lab[0] / kKappa;
    return {white[0] * lab_f_inv(fx), white[1] * yr, white[2] * lab_f_inv(fz)};
}

Triple CieLab::from_rgb(const Triple& rgb) const {
    return xyz_to_lab(rgb_to_xyz(rgb));
}

Triple CieLab::to_rgb(const Triple& lab) const {
    return xyz_to_rgb(lab_to_xyz(lab));
}

Triple lab_to_lch(const Triple& lab) {
    const auto [l, a, b] = lab;
    float c = std::hypot(a, b);
    // atan2(0, 0) is 0, so achromatic colors get hue 0
    float hue_rad = math::normalize_angle_rad(std::atan2(b, a));
    return {l, c, hue_rad};
}

Triple lch_to_lab(const Triple& lch) {
    const auto [l, c, hue_rad] = lch;
    return {l, c * std::cos(hue_rad), c * std::sin(hue_rad)};
}

} // namespace chroma::model
