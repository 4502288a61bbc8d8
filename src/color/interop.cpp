#include <chroma/color/interop.h>

namespace chroma {

Color from_array(const std::array<float, 3>& rgb) {
    return Color::from_rgb(rgb[0], rgb[1], rgb[2]);
}

Color from_array(const std::array<float, 4>& rgba) {
    return Color::from_rgba(rgba[0], rgba[1], rgba[2], rgba[3]);
}

Color from_array(const std::array<uint8_t, 3>& rgb) {
    return Color::from_rgb_u8(rgb[0], rgb[1], rgb[2]);
}

Color from_array(const std::array<uint8_t, 4>& rgba) {
    return Color::from_rgba_u8(rgba[0], rgba[1], rgba[2], rgba[3]);
}

Color from_tuple(const std::tuple<float, float, float>& rgb) {
    auto [r, g, b] = rgb;
    return Color::from_rgb(r, g, b);
}

Color from_tuple(const std::tuple<float, float, float, float>& rgba) {
    auto [r, g, b, a] = rgba;
    return Color::from_rgba(r, g, b, a);
}

Color from_tuple(const std::tuple<uint8_t, uint8_t, uint8_t>& rgb) {
    auto [r, g, b] = rgb;
    return Color::from_rgb_u8(r, g, b);
}

Color from_tuple(const std::tuple<uint8_t, uint8_t, uint8_t, uint8_t>& rgba) {
    auto [r, g, b, a] = rgba;
    return Color::from_rgba_u8(r, g, b, a);
}

std::array<float, 4> to_array(const Color& color) {
    return color.rgba();
}

std::array<uint8_t, 4> to_array_u8(const Color& color) {
    return color.rgba_u8();
}

std::tuple<float, float, float, float> to_tuple(const Color& color) {
    return {color.r, color.g, color.b, color.a};
}

} // namespace chroma
