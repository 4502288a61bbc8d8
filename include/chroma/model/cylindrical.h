#pragma once
#include <chroma/model/components.h>

namespace chroma::model {

// Hue in degrees [0, 360); every other component in [0, 1].
// Inputs are expected to be normalized already; the Color constructors do that.

Triple hsl_to_rgb(float hue_deg, float saturation, float lightness);
Triple rgb_to_hsl(float r, float g, float b);

// HSV is bridged through HSL rather than carrying its own hue ramp.
Triple hsv_to_hsl(float hue_deg, float saturation, float value);
Triple hsl_to_hsv(float hue_deg, float saturation, float lightness);
Triple hsv_to_rgb(float hue_deg, float saturation, float value);
Triple rgb_to_hsv(float r, float g, float b);

Triple hwb_to_rgb(float hue_deg, float whiteness, float blackness);
Triple rgb_to_hwb(float r, float g, float b);

} // namespace chroma::model
