#include <chroma/math/gamma.h>

#include <cmath>

namespace chroma::math {

namespace {

constexpr float kDecodeThreshold = 0.04045f;
constexpr float kEncodeThreshold = 0.0031308f;
constexpr float kLinearSlope = 12.92f;
constexpr float kOffset = 0.055f;
constexpr float kGamma = 2.4f;

} // anonymous namespace

float to_linear(float encoded) {
    if (encoded >= kDecodeThreshold) {
        return std::pow((encoded + kOffset) / (1.0f + kOffset), kGamma);
    }
    return encoded / kLinearSlope;
}

float from_linear(float linear) {
    if (linear >= kEncodeThreshold) {
        return (1.0f + kOffset) * std::pow(linear, 1.0f / kGamma) - kOffset;
    }
    return kLinearSlope * linear;
}

model::Triple to_linear(const model::Triple& encoded_rgb) {
    return {to_linear(encoded_rgb[0]), to_linear(encoded_rgb[1]), to_linear(encoded_rgb[2])};
}

model::Triple from_linear(const model::Triple& linear_rgb) {
    return {from_linear(linear_rgb[0]), from_linear(linear_rgb[1]), from_linear(linear_rgb[2])};
}

} // namespace chroma::math
