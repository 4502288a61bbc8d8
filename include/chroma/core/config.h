#pragma once

#include <array>

namespace chroma::core::config {

inline constexpr const char kProgramName[] = "chroma";
inline constexpr const char kVersionString[] = "chroma 0.1.0";

// color-mix() and `chroma mix` fall back to these when nothing is given.
inline constexpr const char kDefaultMixSpace[] = "oklab";
inline constexpr float kDefaultMixRatio = 0.5f;

inline constexpr float kRoundTripTolerance = 1e-4f;

// CIE XYZ of the D65 reference white, Y normalized to 1.
inline constexpr std::array<float, 3> kD65White = {0.95047f, 1.00000f, 1.08883f};

} // namespace chroma::core::config
