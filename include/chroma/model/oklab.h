#pragma once
#include <chroma/model/components.h>

namespace chroma::model {

// Oklab (Bjorn Ottosson, 2020). L is perceived lightness, roughly [0, 1];
// a (green/red) and b (blue/yellow) are signed and unbounded.

Triple linear_rgb_to_oklab(const Triple& linear_rgb);
Triple oklab_to_linear_rgb(const Triple& lab);

// Encoded sRGB variants; gamma is applied on the way in and out.
Triple rgb_to_oklab(const Triple& rgb);
Triple oklab_to_rgb(const Triple& lab);

} // namespace chroma::model
