#include <chroma/math/angle.h>

#include <cmath>

namespace chroma::math {

namespace {

// Shared by the degree and radian variants.
float wrap(float x, float period) {
    if (!std::isfinite(x)) return 0.0f;
    float r = std::fmod(x, period);
    if (r < 0.0f) r += period;
    // -1e-7 + 360 rounds to exactly 360 in single precision
    if (r >= period) r = 0.0f;
    return r;
}

float shortest_delta(float a0, float a1, float period) {
    const float half = period / 2.0f;
    return std::fmod(std::fmod(a1 - a0, period) + period + half, period) - half;
}

} // anonymous namespace

float modulo(float x, float n) {
    return std::fmod(std::fmod(x, n) + n, n);
}

float normalize_angle(float degrees) {
    return wrap(degrees, 360.0f);
}

float normalize_angle_rad(float radians) {
    return wrap(radians, kTau);
}

float interp_angle(float a0, float a1, float t) {
    return normalize_angle(a0 + t * shortest_delta(a0, a1, 360.0f));
}

float interp_angle_rad(float a0_rad, float a1_rad, float t) {
    return normalize_angle_rad(a0_rad + t * shortest_delta(a0_rad, a1_rad, kTau));
}

float clamp01(float x) {
    if (!(x > 0.0f)) return 0.0f;
    if (x > 1.0f) return 1.0f;
    return x;
}

float degrees_to_radians(float degrees) {
    return degrees * kPi / 180.0f;
}

float radians_to_degrees(float radians) {
    return radians * 180.0f / kPi;
}

} // namespace chroma::math
