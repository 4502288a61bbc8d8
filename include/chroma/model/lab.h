#pragma once
#include <chroma/model/components.h>

namespace chroma::model {

// A perceptual color model reachable from encoded sRGB. Implementations must
// be stateless so a const reference can be shared across threads.
class PerceptualModel {
public:
    virtual ~PerceptualModel() = default;

    virtual const char* name() const = 0;

    // Encoded sRGB in [0, 1] -> model coordinates.
    virtual Triple from_rgb(const Triple& rgb) const = 0;

    // Model coordinates -> encoded sRGB. The result is not clamped.
    virtual Triple to_rgb(const Triple& coords) const = 0;
};

// CIE L*a*b* relative to the D65 white point. L in [0, 100], a/b signed.
class CieLab final : public PerceptualModel {
public:
    const char* name() const override { return "cie-lab"; }
    Triple from_rgb(const Triple& rgb) const override;
    Triple to_rgb(const Triple& lab) const override;

    static Triple rgb_to_xyz(const Triple& rgb);
    static Triple xyz_to_rgb(const Triple& xyz);
    static Triple xyz_to_lab(const Triple& xyz);
    static Triple lab_to_xyz(const Triple& lab);
};

// Polar form of Lab. The hue is in radians, [0, 2pi).
// (L, a, b) -> (L, C, hue_rad)
Triple lab_to_lch(const Triple& lab);
// (L, C, hue_rad) -> (L, a, b)
Triple lch_to_lab(const Triple& lch);

} // namespace chroma::model
