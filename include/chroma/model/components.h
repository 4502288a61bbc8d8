#pragma once
#include <array>

namespace chroma::model {

// Components of one color in some model, in the model's canonical order:
// (r, g, b), (h, s, l), (h, s, v), (h, w, b), (L, a, b), (L, C, h).
using Triple = std::array<float, 3>;

// A Triple followed by straight alpha.
using Quad = std::array<float, 4>;

} // namespace chroma::model
