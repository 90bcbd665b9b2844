#pragma once
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// Trailing gördülő átlag (az aktuális bar is benne van).
// i < p-1 -> kUndef; ha az ablakban van kUndef, az eredmény is kUndef.
Series rolling_mean(const Series& v, std::size_t p);

// SMA őrrel: ha kevesebb adat van, mint p, csupa kUndef sorozat (nem dob).
Series safe_sma(const Series& closes, std::size_t p);

} // namespace ind
