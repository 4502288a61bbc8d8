#pragma once

namespace chroma::math {

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kTau = 2.0f * kPi;

// Floored modulo: the result has the sign of n.
float modulo(float x, float n);

// Wrap degrees into [0, 360). Non-finite input yields 0.
float normalize_angle(float degrees);

// Wrap radians into [0, 2pi). Non-finite input yields 0.
float normalize_angle_rad(float radians);

// Interpolate two hues along the shorter arc of the 360 degree circle.
// t = 0 gives normalize_angle(a0), t = 1 gives normalize_angle(a1).
float interp_angle(float a0, float a1, float t);

// Same as interp_angle with a period of 2pi.
float interp_angle_rad(float a0_rad, float a1_rad, float t);

// Clamp into [0, 1]. NaN maps to 0.
float clamp01(float x);

inline float lerp(float a, float b, float t) {
    return a + t * (b - a);
}

float degrees_to_radians(float degrees);
float radians_to_degrees(float radians);

} // namespace chroma::math
