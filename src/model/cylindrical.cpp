#include <chroma/model/cylindrical.h>
#include <chroma/math/angle.h>

#include <algorithm>

namespace chroma::model {

namespace {

// Piecewise ramp over a hue period of 6 (one unit per 60 degrees).
float hue_to_rgb(float n1, float n2, float h) {
    h = math::modulo(h, 6.0f);
    if (h < 1.0f) return n1 + (n2 - n1) * h;
    if (h < 3.0f) return n2;
    if (h < 4.0f) return n1 + (n2 - n1) * (4.0f - h);
    return n1;
}

// Hue in degrees from the channel that attains max. Caller guarantees d > 0.
float hue_from_max(float r, float g, float b, float max, float d) {
    float dr = (max - r) / d;
    float dg = (max - g) / d;
    float db = (max - b) / d;

    float h;
    if (r == max) {
        h = db - dg;
    } else if (g == max) {
        h = 2.0f + dr - db;
    } else {
        h = 4.0f + dg - dr;
    }
    return math::normalize_angle(h * 60.0f);
}

} // anonymous namespace

Triple hsl_to_rgb(float hue_deg, float saturation, float lightness) {
    if (saturation == 0.0f) {
        return {lightness, lightness, lightness};
    }

    float n2 = lightness < 0.5f
        ? lightness * (1.0f + saturation)
        : lightness + saturation - lightness * saturation;
    float n1 = 2.0f * lightness - n2;
    float h = hue_deg / 60.0f;

    return {
        hue_to_rgb(n1, n2, h + 2.0f),
        hue_to_rgb(n1, n2, h),
        hue_to_rgb(n1, n2, h - 2.0f),
    };
}

Triple rgb_to_hsl(float r, float g, float b) {
    float min = std::min({r, g, b});
    float max = std::max({r, g, b});
    float l = (max + min) / 2.0f;

    if (min == max) {
        return {0.0f, 0.0f, l};
    }

    float d = max - min;
    float s = l < 0.5f ? d / (max + min) : d / (2.0f - max - min);

    return {hue_from_max(r, g, b, max, d), s, l};
}

Triple hsv_to_hsl(float hue_deg, float saturation, float value) {
    float l = (2.0f - saturation) * value / 2.0f;

    float s = saturation;
    if (l != 0.0f) {
        if (l == 1.0f) {
            s = 0.0f;
        } else if (l < 0.5f) {
            s = saturation * value / (l * 2.0f);
        } else {
            s = saturation * value / (2.0f - l * 2.0f);
        }
    }

    return {hue_deg, s, l};
}

Triple hsl_to_hsv(float hue_deg, float saturation, float lightness) {
    float v = lightness + saturation * std::min(lightness, 1.0f - lightness);
    float s = v == 0.0f ? 0.0f : 2.0f * (1.0f - lightness / v);
    return {hue_deg, s, v};
}

Triple hsv_to_rgb(float hue_deg, float saturation, float value) {
    auto [h, s, l] = hsv_to_hsl(hue_deg, saturation, value);
    return hsl_to_rgb(h, s, l);
}

Triple rgb_to_hsv(float r, float g, float b) {
    float v = std::max({r, g, b});
    float d = v - std::min({r, g, b});

    if (d == 0.0f) {
        return {0.0f, 0.0f, v};
    }

    return {hue_from_max(r, g, b, v, d), d / v, v};
}

Triple hwb_to_rgb(float hue_deg, float whiteness, float blackness) {
    if (whiteness + blackness >= 1.0f) {
        float gray = whiteness / (whiteness + blackness);
        return {gray, gray, gray};
    }

    auto rgb = hsl_to_rgb(hue_deg, 1.0f, 0.5f);
    float scale = 1.0f - whiteness - blackness;
    for (auto& c : rgb) {
        c = c * scale + whiteness;
    }
    return rgb;
}

Triple rgb_to_hwb(float r, float g, float b) {
    float hue = rgb_to_hsl(r, g, b)[0];
    float white = std::min({r, g, b});
    float black = 1.0f - std::max({r, g, b});
    return {hue, white, black};
}

} // namespace chroma::model
