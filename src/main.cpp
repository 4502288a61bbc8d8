#include <chroma/color/color.h>
#include <chroma/core/config.h>
#include <chroma/core/diagnostics.h>
#include <chroma/css/parser.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using chroma::core::config::kProgramName;
using chroma::core::config::kVersionString;

constexpr int kExitOk = 0;
constexpr int kExitParseFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& stream) {
    stream << "usage: " << kProgramName
           << " <color> [--space=<space>|hex|rgb-string|all] [--verbose]\n"
           << "       " << kProgramName
           << " mix <color1> <color2> [t] [--space=<space>] [--verbose]\n"
           << "spaces: srgb srgb-linear hsl hsv hwb oklab lab lch\n";
}

bool is_help_flag(std::string_view text) {
    return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
    return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_ratio(const std::string& text, float& value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const float parsed = std::strtof(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

struct Options {
    std::vector<std::string> positional;
    std::string output = "hex";
    bool has_space_flag = false;
    bool verbose = false;
};

// Returns false on an unknown or duplicate flag.
bool parse_options(int argc, char** argv, Options& options) {
    constexpr std::string_view kSpacePrefix = "--space=";
    for (int index = 1; index < argc; ++index) {
        const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
        if (argument == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (starts_with(argument, kSpacePrefix)) {
            if (options.has_space_flag) {
                std::cerr << "Invalid --space: duplicate flag '" << argument << "'\n";
                return false;
            }
            options.output = std::string(argument.substr(kSpacePrefix.size()));
            options.has_space_flag = true;
            continue;
        }
        if (starts_with(argument, "--")) {
            std::cerr << "Unknown flag: '" << argument << "'\n";
            return false;
        }
        options.positional.emplace_back(argument);
    }
    return true;
}

void print_components(std::ostream& stream, const char* label, const chroma::model::Quad& values) {
    stream << label << ": " << values[0] << " " << values[1] << " "
           << values[2] << " " << values[3] << "\n";
}

void print_in_space(std::ostream& stream, const chroma::Color& color, chroma::Space space) {
    const char* label = chroma::space_name(space);
    switch (space) {
        case chroma::Space::Rgb:       print_components(stream, label, color.rgba()); break;
        case chroma::Space::LinearRgb: print_components(stream, label, color.to_linear_rgba()); break;
        case chroma::Space::Hsl:       print_components(stream, label, color.to_hsla()); break;
        case chroma::Space::Hsv:       print_components(stream, label, color.to_hsva()); break;
        case chroma::Space::Hwb:       print_components(stream, label, color.to_hwba()); break;
        case chroma::Space::Oklab:     print_components(stream, label, color.to_oklaba()); break;
        case chroma::Space::Lab:       print_components(stream, label, color.to_lab()); break;
        case chroma::Space::Lch:       print_components(stream, label, color.to_lch()); break;
    }
}

// Returns false when `output` names nothing printable.
bool print_color(std::ostream& stream, const chroma::Color& color, const std::string& output) {
    if (output == "hex") {
        stream << color.to_hex_string() << "\n";
        return true;
    }
    if (output == "rgb-string") {
        stream << color.to_rgb_string() << "\n";
        return true;
    }
    if (output == "all") {
        stream << "hex: " << color.to_hex_string() << "\n";
        stream << "css: " << color.to_rgb_string() << "\n";
        for (chroma::Space space : {chroma::Space::Rgb, chroma::Space::LinearRgb,
                                    chroma::Space::Hsl, chroma::Space::Hsv,
                                    chroma::Space::Hwb, chroma::Space::Oklab,
                                    chroma::Space::Lab, chroma::Space::Lch}) {
            print_in_space(stream, color, space);
        }
        return true;
    }
    const std::optional<chroma::Space> space = chroma::parse_space(output);
    if (!space) {
        return false;
    }
    print_in_space(stream, color, *space);
    return true;
}

std::optional<chroma::Color> parse_argument(const std::string& text,
                                            chroma::core::DiagnosticEmitter& diagnostics) {
    const chroma::css::ParseColorResult result = chroma::css::parse_with_diagnostics(text, diagnostics);
    if (!result.ok()) {
        // The observer has already printed the error event.
        return std::nullopt;
    }
    return result.color;
}

int run_describe(const Options& options, chroma::core::DiagnosticEmitter& diagnostics) {
    if (options.positional.size() != 1) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::optional<chroma::Color> color = parse_argument(options.positional[0], diagnostics);
    if (!color) {
        return kExitParseFailure;
    }

    if (!print_color(std::cout, *color, options.output)) {
        std::cerr << "Invalid --space: '" << options.output << "'\n";
        print_usage(std::cerr);
        return kExitUsage;
    }
    return kExitOk;
}

int run_mix(const Options& options, chroma::core::DiagnosticEmitter& diagnostics) {
    // positional[0] is "mix"
    if (options.positional.size() < 3 || options.positional.size() > 4) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    float t = chroma::core::config::kDefaultMixRatio;
    if (options.positional.size() == 4 && !parse_ratio(options.positional[3], t)) {
        std::cerr << "Invalid mix ratio: " << options.positional[3] << "\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string space_text =
        options.has_space_flag ? options.output : chroma::core::config::kDefaultMixSpace;
    const std::optional<chroma::Space> space = chroma::parse_space(space_text);
    if (!space) {
        std::cerr << "Invalid --space: '" << space_text << "'\n";
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::optional<chroma::Color> first = parse_argument(options.positional[1], diagnostics);
    if (!first) {
        return kExitParseFailure;
    }
    const std::optional<chroma::Color> second = parse_argument(options.positional[2], diagnostics);
    if (!second) {
        return kExitParseFailure;
    }

    diagnostics.info("cli", "mix", options.positional[1] + ", " + options.positional[2],
                     std::string("interpolating in ") + chroma::space_name(*space) +
                         " at t=" + std::to_string(t));
    std::cout << first->interpolate(*second, t, *space).to_hex_string() << "\n";
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char** argv) {
    if (argc == 2 && is_help_flag(argv[1])) {
        print_usage(std::cout);
        return kExitOk;
    }
    if (argc == 2 && is_version_flag(argv[1])) {
        std::cout << kVersionString << "\n";
        return kExitOk;
    }

    Options options;
    if (!parse_options(argc, argv, options)) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (options.positional.empty()) {
        print_usage(std::cerr);
        return kExitUsage;
    }

    chroma::core::DiagnosticEmitter diagnostics;
    diagnostics.set_min_severity(options.verbose ? chroma::core::Severity::Info
                                                 : chroma::core::Severity::Warning);
    diagnostics.add_observer([](const chroma::core::DiagnosticEvent& event) {
        std::cerr << chroma::core::format_diagnostic(event) << "\n";
    });

    if (options.positional[0] == "mix") {
        return run_mix(options, diagnostics);
    }
    return run_describe(options, diagnostics);
}
