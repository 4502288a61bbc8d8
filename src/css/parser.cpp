#include <chroma/css/parser.h>
#include <chroma/css/named_colors.h>
#include <chroma/math/angle.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace chroma::css {

namespace {

constexpr const char kModule[] = "css-parser";

// Nesting limit for color-mix() arguments that are themselves color-mix().
constexpr int kMaxMixDepth = 32;

std::string to_lower(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parse_number(std::string_view text, float& out) {
    if (text.empty()) return false;
    const std::string buf(text);
    char* end = nullptr;
    float v = std::strtof(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

// One numeric function argument with its unit suffix.
struct Component {
    enum class Unit { None, Percent, Deg, Grad, Rad, Turn };
    float value = 0;
    Unit unit = Unit::None;
};

std::optional<Component> parse_component(std::string_view token) {
    // "grad" must be tried before "rad"
    static constexpr std::pair<std::string_view, Component::Unit> kSuffixes[] = {
        {"%", Component::Unit::Percent},
        {"deg", Component::Unit::Deg},
        {"grad", Component::Unit::Grad},
        {"rad", Component::Unit::Rad},
        {"turn", Component::Unit::Turn},
    };

    Component c;
    for (const auto& [suffix, unit] : kSuffixes) {
        if (ends_with(token, suffix)) {
            token.remove_suffix(suffix.size());
            c.unit = unit;
            break;
        }
    }
    if (!parse_number(token, c.value)) return std::nullopt;
    return c;
}

// Plain number, or a percentage of `percent_ref`. Angles are rejected.
std::optional<float> number_or_percent(const Component& c, float percent_ref) {
    switch (c.unit) {
        case Component::Unit::None:    return c.value;
        case Component::Unit::Percent: return c.value / 100.0f * percent_ref;
        default:                       return std::nullopt;
    }
}

// Hue in degrees; unitless numbers are degrees.
std::optional<float> hue_degrees(const Component& c) {
    switch (c.unit) {
        case Component::Unit::None:
        case Component::Unit::Deg:     return c.value;
        case Component::Unit::Grad:    return c.value * 360.0f / 400.0f;
        case Component::Unit::Rad:     return math::radians_to_degrees(c.value);
        case Component::Unit::Turn:    return c.value * 360.0f;
        case Component::Unit::Percent: return std::nullopt;
    }
    return std::nullopt;
}

// Split function arguments on commas, '/' and whitespace.
std::vector<std::string_view> split_args(std::string_view args) {
    std::vector<std::string_view> tokens;
    size_t start = 0;
    for (size_t i = 0; i <= args.size(); ++i) {
        bool sep = i == args.size() || args[i] == ',' || args[i] == '/' ||
                   std::isspace(static_cast<unsigned char>(args[i]));
        if (sep) {
            if (i > start) tokens.push_back(args.substr(start, i - start));
            start = i + 1;
        }
    }
    return tokens;
}

// Split on top-level commas, ignoring commas nested in parentheses.
std::vector<std::string_view> split_top_level(std::string_view args) {
    std::vector<std::string_view> parts;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == '(') depth++;
        else if (args[i] == ')') depth--;
        else if (args[i] == ',' && depth == 0) {
            parts.push_back(trim(args.substr(start, i - start)));
            start = i + 1;
        }
    }
    parts.push_back(trim(args.substr(start)));
    return parts;
}

class ColorParser {
public:
    explicit ColorParser(core::DiagnosticEmitter* diagnostics) : diagnostics_(diagnostics) {}

    ParseColorResult parse(std::string_view text);

private:
    ParseColorResult parse_hex(std::string_view input, std::string_view hex);
    ParseColorResult parse_function(std::string_view input, const std::string& name,
                                    std::string_view args);
    ParseColorResult parse_mix(std::string_view input, std::string_view args);

    ParseColorResult success(std::string_view input, const std::string& stage, const Color& color);
    ParseColorResult failure(ParseErrorKind kind, std::string_view input, std::string detail);

    // Warn when a component had to be clamped into [lo, hi].
    void check_range(std::string_view input, const std::string& stage, const char* component,
                     float value, float lo, float hi);

    core::DiagnosticEmitter* diagnostics_;
    int mix_depth_ = 0;
};

ParseColorResult ColorParser::success(std::string_view input, const std::string& stage, const Color& color) {
    if (diagnostics_) {
        diagnostics_->info(kModule, stage, std::string(input), "parsed as " + color.to_hex_string());
    }
    ParseColorResult result;
    result.color = color;
    return result;
}

ParseColorResult ColorParser::failure(ParseErrorKind kind, std::string_view input, std::string detail) {
    ParseError error;
    error.kind = kind;
    error.input = std::string(input);
    error.detail = std::move(detail);
    if (diagnostics_) {
        std::string message = error.detail.empty() ? std::string(parse_error_kind_name(kind)) : error.detail;
        diagnostics_->error(kModule, parse_error_kind_name(kind), error.input, message);
    }
    ParseColorResult result;
    result.error = std::move(error);
    return result;
}

void ColorParser::check_range(std::string_view input, const std::string& stage, const char* component,
                              float value, float lo, float hi) {
    if (diagnostics_ && (value < lo || value > hi)) {
        diagnostics_->warning(kModule, stage, std::string(input),
            std::string(component) + " " + std::to_string(value) + " out of range, clamped");
    }
}

ParseColorResult ColorParser::parse(std::string_view text) {
    const std::string value = to_lower(trim(text));
    if (value.empty()) {
        return failure(ParseErrorKind::Empty, text, "empty string");
    }

    if (value == "transparent") {
        return success(text, "named", Color::transparent());
    }

    if (value[0] == '#') {
        return parse_hex(text, std::string_view(value).substr(1));
    }

    auto open = value.find('(');
    if (open != std::string::npos) {
        if (value.back() != ')') {
            return failure(ParseErrorKind::InvalidArguments, text, "missing closing parenthesis");
        }
        std::string name(trim(std::string_view(value).substr(0, open)));
        std::string_view args = std::string_view(value).substr(open + 1, value.size() - open - 2);
        return parse_function(text, name, args);
    }

    if (auto named = lookup_named_color(value)) {
        return success(text, "named", *named);
    }

    // Bare hex digits without the leading '#'
    bool all_hex = true;
    for (char c : value) {
        if (hex_digit(c) < 0) {
            all_hex = false;
            break;
        }
    }
    if (all_hex) {
        return parse_hex(text, value);
    }

    return failure(ParseErrorKind::UnknownName, text, "not a named color");
}

ParseColorResult ColorParser::parse_hex(std::string_view input, std::string_view hex) {
    int digits[8] = {};
    if (hex.size() > 8) {
        return failure(ParseErrorKind::InvalidHex, input, "expected 3, 4, 6 or 8 hex digits");
    }
    for (size_t i = 0; i < hex.size(); ++i) {
        digits[i] = hex_digit(hex[i]);
        if (digits[i] < 0) {
            return failure(ParseErrorKind::InvalidHex, input, "invalid hex digit");
        }
    }

    auto byte = [](int hi, int lo) { return static_cast<uint8_t>(hi * 16 + lo); };

    switch (hex.size()) {
        case 3:
            return success(input, "hex", Color::from_rgb_u8(byte(digits[0], digits[0]),
                                                     byte(digits[1], digits[1]),
                                                     byte(digits[2], digits[2])));
        case 4:
            return success(input, "hex", Color::from_rgba_u8(byte(digits[0], digits[0]),
                                                      byte(digits[1], digits[1]),
                                                      byte(digits[2], digits[2]),
                                                      byte(digits[3], digits[3])));
        case 6:
            return success(input, "hex", Color::from_rgb_u8(byte(digits[0], digits[1]),
                                                     byte(digits[2], digits[3]),
                                                     byte(digits[4], digits[5])));
        case 8:
            return success(input, "hex", Color::from_rgba_u8(byte(digits[0], digits[1]),
                                                      byte(digits[2], digits[3]),
                                                      byte(digits[4], digits[5]),
                                                      byte(digits[6], digits[7])));
        default:
            return failure(ParseErrorKind::InvalidHex, input, "expected 3, 4, 6 or 8 hex digits");
    }
}

ParseColorResult ColorParser::parse_function(std::string_view input, const std::string& name,
                                             std::string_view args) {
    if (name == "color-mix") {
        return parse_mix(input, args);
    }

    static constexpr std::string_view kFunctions[] = {
        "rgb", "rgba", "hsl", "hsla", "hwb", "hwba", "hsv", "hsva",
        "oklab", "oklch", "lab", "lch",
    };
    bool known = false;
    for (auto fn : kFunctions) {
        if (name == fn) {
            known = true;
            break;
        }
    }
    if (!known) {
        return failure(ParseErrorKind::UnknownFunction, input, "unknown function '" + name + "'");
    }

    auto tokens = split_args(args);
    if (tokens.size() != 3 && tokens.size() != 4) {
        return failure(ParseErrorKind::InvalidArguments, input,
                       "expected 3 or 4 arguments, got " + std::to_string(tokens.size()));
    }

    Component c[4];
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto parsed = parse_component(tokens[i]);
        if (!parsed) {
            return failure(ParseErrorKind::InvalidArguments, input,
                           "invalid argument '" + std::string(tokens[i]) + "'");
        }
        c[i] = *parsed;
    }

    float alpha = 1.0f;
    if (tokens.size() == 4) {
        auto a = number_or_percent(c[3], 1.0f);
        if (!a) return failure(ParseErrorKind::InvalidArguments, input, "invalid alpha");
        check_range(input, name, "alpha", *a, 0.0f, 1.0f);
        alpha = *a;
    }

    // rgba -> rgb, hsla -> hsl, hwba -> hwb, hsva -> hsv
    std::string family = name;
    if (family.size() == 4 && family.back() == 'a') family.pop_back();

    if (family == "rgb") {
        float rgb[3];
        for (int i = 0; i < 3; ++i) {
            auto v = number_or_percent(c[i], 255.0f);
            if (!v) return failure(ParseErrorKind::InvalidArguments, input, "invalid channel");
            rgb[i] = *v / 255.0f;
            check_range(input, family, "channel", rgb[i], 0.0f, 1.0f);
        }
        return success(input, family, Color::from_rgba(rgb[0], rgb[1], rgb[2], alpha));
    }

    if (family == "hsl" || family == "hwb" || family == "hsv") {
        auto h = hue_degrees(c[0]);
        auto x = number_or_percent(c[1], 1.0f);
        auto y = number_or_percent(c[2], 1.0f);
        if (!h || !x || !y) return failure(ParseErrorKind::InvalidArguments, input, "invalid component");
        check_range(input, family, "component 2", *x, 0.0f, 1.0f);
        check_range(input, family, "component 3", *y, 0.0f, 1.0f);
        if (family == "hsl") return success(input, family, Color::from_hsla(*h, *x, *y, alpha));
        if (family == "hwb") return success(input, family, Color::from_hwba(*h, *x, *y, alpha));
        return success(input, family, Color::from_hsva(*h, *x, *y, alpha));
    }

    if (family == "oklab" || family == "lab") {
        const bool ok = family == "oklab";
        auto l = number_or_percent(c[0], ok ? 1.0f : 100.0f);
        auto a = number_or_percent(c[1], ok ? 0.4f : 125.0f);
        auto b = number_or_percent(c[2], ok ? 0.4f : 125.0f);
        if (!l || !a || !b) return failure(ParseErrorKind::InvalidArguments, input, "invalid component");
        if (ok) return success(input, family, Color::from_oklaba(*l, *a, *b, alpha));
        return success(input, family, Color::from_lab(*l, *a, *b, alpha));
    }

    // oklch / lch
    const bool ok = family == "oklch";
    auto l = number_or_percent(c[0], ok ? 1.0f : 100.0f);
    auto chr = number_or_percent(c[1], ok ? 0.4f : 150.0f);
    auto h = hue_degrees(c[2]);
    if (!l || !chr || !h) return failure(ParseErrorKind::InvalidArguments, input, "invalid component");
    check_range(input, family, "chroma", *chr, 0.0f, std::numeric_limits<float>::infinity());
    if (ok) {
        float h_rad = math::degrees_to_radians(*h);
        float cc = std::max(*chr, 0.0f);
        return success(input, family, Color::from_oklaba(*l, cc * std::cos(h_rad), cc * std::sin(h_rad), alpha));
    }
    return success(input, family, Color::from_lch(*l, *chr, math::degrees_to_radians(*h), alpha));
}

ParseColorResult ColorParser::parse_mix(std::string_view input, std::string_view args) {
    auto parts = split_top_level(args);
    if (parts.size() != 3) {
        return failure(ParseErrorKind::InvalidMix, input, "expected 'in <space>' and two colors");
    }

    // "in <space> [shorter hue]"
    auto method = split_args(parts[0]);
    bool method_ok = (method.size() == 2 ||
                      (method.size() == 4 && method[2] == "shorter" && method[3] == "hue")) &&
                     method[0] == "in";
    std::optional<Space> space = method_ok ? parse_space(method[1]) : std::nullopt;
    if (!space) {
        return failure(ParseErrorKind::InvalidMix, input,
                       "unsupported interpolation method '" + std::string(parts[0]) + "'");
    }

    if (mix_depth_ >= kMaxMixDepth) {
        return failure(ParseErrorKind::InvalidMix, input,
                       "nested deeper than " + std::to_string(kMaxMixDepth) + " levels");
    }
    ++mix_depth_;
    struct DepthGuard {
        int& depth;
        ~DepthGuard() { --depth; }
    } guard{mix_depth_};

    Color colors[2];
    float pct[2] = {-1.0f, -1.0f};
    for (int i = 0; i < 2; ++i) {
        std::string_view part = parts[i + 1];
        auto space_pos = part.find_last_of(" \t");
        if (space_pos != std::string_view::npos && ends_with(part, "%")) {
            auto pc = parse_component(part.substr(space_pos + 1));
            if (!pc || pc->value < 0.0f || pc->value > 100.0f) {
                return failure(ParseErrorKind::InvalidMix, input, "invalid percentage");
            }
            pct[i] = pc->value;
            part = trim(part.substr(0, space_pos));
        }
        auto nested = parse(part);
        if (!nested.ok()) {
            return failure(ParseErrorKind::InvalidMix, input,
                           "invalid color '" + std::string(part) + "'");
        }
        colors[i] = *nested.color;
    }

    if (pct[0] < 0 && pct[1] < 0) {
        pct[0] = pct[1] = 50.0f;
    } else if (pct[0] < 0) {
        pct[0] = 100.0f - pct[1];
    } else if (pct[1] < 0) {
        pct[1] = 100.0f - pct[0];
    }
    float total = pct[0] + pct[1];
    if (total <= 0.0f) {
        return failure(ParseErrorKind::InvalidMix, input, "percentages sum to zero");
    }

    return success(input, "color-mix", colors[0].interpolate(colors[1], pct[1] / total, *space));
}

} // anonymous namespace

const char* parse_error_kind_name(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::Empty:            return "empty";
        case ParseErrorKind::InvalidHex:       return "invalid-hex";
        case ParseErrorKind::UnknownName:      return "unknown-name";
        case ParseErrorKind::UnknownFunction:  return "unknown-function";
        case ParseErrorKind::InvalidArguments: return "invalid-arguments";
        case ParseErrorKind::InvalidMix:       return "invalid-mix";
    }
    return "unknown";
}

std::string ParseError::message() const {
    std::string msg = parse_error_kind_name(kind);
    msg += ": '" + input + "'";
    if (!detail.empty()) {
        msg += " (" + detail + ")";
    }
    return msg;
}

ParseColorError::ParseColorError(ParseError error)
    : std::runtime_error(error.message()), error_(std::move(error)) {}

ParseColorResult parse(std::string_view text) {
    return ColorParser(nullptr).parse(text);
}

ParseColorResult parse_with_diagnostics(std::string_view text, core::DiagnosticEmitter& diagnostics) {
    return ColorParser(&diagnostics).parse(text);
}

std::optional<Color> parse_color(std::string_view text) {
    return parse(text).color;
}

Color from_html(std::string_view text) {
    auto result = parse(text);
    if (!result.ok()) {
        throw ParseColorError(std::move(*result.error));
    }
    return *result.color;
}

} // namespace chroma::css
