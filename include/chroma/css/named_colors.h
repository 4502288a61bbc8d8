#pragma once
#include <chroma/color/color.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace chroma::css {

struct NamedColor {
    std::string_view name;
    uint32_t rgb; // 0xRRGGBB
};

// The CSS Color Module Level 4 named colors, sorted by name.
const NamedColor* named_colors_begin();
const NamedColor* named_colors_end();
std::size_t named_color_count();

// Exact lowercase match; no fuzzy lookup.
std::optional<Color> lookup_named_color(std::string_view lowercase_name);

} // namespace chroma::css
