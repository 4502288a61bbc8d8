#include <chroma/model/oklab.h>
#include <chroma/math/gamma.h>

#include <cmath>

namespace chroma::model {

Triple linear_rgb_to_oklab(const Triple& linear_rgb) {
    const auto [r, g, b] = linear_rgb;

    // std::cbrt keeps the sign of out-of-gamut intermediates
    float l_ = std::cbrt(0.4121656120f * r + 0.5362752080f * g + 0.0514575653f * b);
    float m_ = std::cbrt(0.2118591070f * r + 0.6807189584f * g + 0.1074065790f * b);
    float s_ = std::cbrt(0.0883097947f * r + 0.2818474174f * g + 0.6302613616f * b);

    return {
        0.2104542553f * l_ + 0.7936177850f * m_ - 0.0040720468f * s_,
        1.9779984951f * l_ - 2.4285922050f * m_ + 0.4505937099f * s_,
        0.0259040371f * l_ + 0.7827717662f * m_ - 0.8086757660f * s_,
    };
}

Triple oklab_to_linear_rgb(const Triple& lab) {
    const auto [L, a, b] = lab;

    float l_ = L + 0.3963377774f * a + 0.2158037573f * b;
    float m_ = L - 0.1055613458f * a - 0.0638541728f * b;
    float s_ = L - 0.0894841775f * a - 1.2914855480f * b;

    float l3 = l_ * l_ * l_;
    float m3 = m_ * m_ * m_;
    float s3 = s_ * s_ * s_;

    return {
        +4.0767245293f * l3 - 3.3072168827f * m3 + 0.2307590544f * s3,
        -1.2681437731f * l3 + 2.6093323231f * m3 - 0.3411344290f * s3,
        -0.0041119885f * l3 - 0.7034763098f * m3 + 1.7068625689f * s3,
    };
}

Triple rgb_to_oklab(const Triple& rgb) {
    return linear_rgb_to_oklab(math::to_linear(rgb));
}

Triple oklab_to_rgb(const Triple& lab) {
    return math::from_linear(oklab_to_linear_rgb(lab));
}

} // namespace chroma::model
