#pragma once
#include <chroma/model/components.h>

namespace chroma::math {

// sRGB transfer function. Applies to color channels only, never to alpha.
float to_linear(float encoded);
float from_linear(float linear);

model::Triple to_linear(const model::Triple& encoded_rgb);
model::Triple from_linear(const model::Triple& linear_rgb);

} // namespace chroma::math
