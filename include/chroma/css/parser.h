#pragma once
#include <chroma/color/color.h>
#include <chroma/core/diagnostics.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chroma::css {

enum class ParseErrorKind {
    Empty,
    InvalidHex,
    UnknownName,
    UnknownFunction,
    InvalidArguments,
    InvalidMix,
};

const char* parse_error_kind_name(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Empty;
    std::string input;
    std::string detail;

    // "invalid-hex: '#12' (expected 3, 4, 6 or 8 hex digits)"
    std::string message() const;
};

// Thrown by from_html() and by io::Deserializer::read_color().
class ParseColorError : public std::runtime_error {
public:
    explicit ParseColorError(ParseError error);
    const ParseError& error() const { return error_; }

private:
    ParseError error_;
};

struct ParseColorResult {
    std::optional<Color> color;
    std::optional<ParseError> error;

    bool ok() const { return color.has_value(); }
};

// Parse a CSS color: named colors, transparent, #hex (with or without '#'),
// rgb[a](), hsl[a](), hwb[a](), hsv[a](), oklab(), oklch(), lab(), lch() and
// color-mix(in <space>, <color> [p%], <color> [p%]). Case-insensitive.
ParseColorResult parse(std::string_view text);

// Same as parse(), reporting each step to `diagnostics`: the syntax that was
// recognized (info), components that had to be clamped (warning) and the
// failure reason (error).
ParseColorResult parse_with_diagnostics(std::string_view text, core::DiagnosticEmitter& diagnostics);

std::optional<Color> parse_color(std::string_view text);

// Throws ParseColorError when `text` is not a color.
Color from_html(std::string_view text);

} // namespace chroma::css
