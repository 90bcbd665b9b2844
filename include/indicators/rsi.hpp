#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// Wilder RSI (alpha = 1/length). Az első definiált érték előtti szakasz és
// az első `length` változás kUndef. avgLoss == 0 esetén 100.
Series wilder_rsi(const Series& x, std::size_t length);

// Volumennel súlyozott RSI: HLC3 * (Volume / Volume gördülő átlaga),
// erre Wilder RSI. Nulla átlagvolumen -> kUndef, nem hiba.
Series volume_rsi(const Bars& bars, std::size_t length);

} // namespace ind
