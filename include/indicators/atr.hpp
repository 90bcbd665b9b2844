#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// TR[0] = H-L, utána max(H-L, |H-C[i-1]|, |L-C[i-1]|)
Series true_range(const Bars& bars);

// Wilder ATR: TR első `period` elemének SMA-ja a mag, utána
// atr = atr + (tr - atr) / period. Az első period-1 elem kUndef.
Series atr(const Bars& bars, std::size_t period);

} // namespace ind
