#pragma once
#include <cstddef>
#include <optional>
#include "indicators/engine.hpp"

namespace strat {

// Kész-e az i. bar kiértékelésre: SMA és ATR definiált.
// Az RSI szándékosan nincs benne, a keresztezés-vizsgálat úgyis false-t ad rá.
inline bool ready(const ind::IndicatorSeries& s, std::size_t i){
    return i < s.size() && defined(s.sma[i]) && defined(s.atr[i]);
}

// Az első index, ahol ready() igaz
inline std::optional<std::size_t> first_ready(const ind::IndicatorSeries& s){
    for (std::size_t i = 0; i < s.size(); ++i) if (ready(s, i)) return i;
    return std::nullopt;
}

} // namespace strat
