#pragma once
#include <chroma/color/color.h>

#include <array>
#include <cstdint>
#include <tuple>

namespace chroma {

// Bridges between Color and plain component containers. Float inputs are in
// [0, 1] and clamped, 8-bit inputs are divided by 255.

Color from_array(const std::array<float, 3>& rgb);
Color from_array(const std::array<float, 4>& rgba);
Color from_array(const std::array<uint8_t, 3>& rgb);
Color from_array(const std::array<uint8_t, 4>& rgba);

Color from_tuple(const std::tuple<float, float, float>& rgb);
Color from_tuple(const std::tuple<float, float, float, float>& rgba);
Color from_tuple(const std::tuple<uint8_t, uint8_t, uint8_t>& rgb);
Color from_tuple(const std::tuple<uint8_t, uint8_t, uint8_t, uint8_t>& rgba);

std::array<float, 4> to_array(const Color& color);
std::array<uint8_t, 4> to_array_u8(const Color& color);
std::tuple<float, float, float, float> to_tuple(const Color& color);

} // namespace chroma
