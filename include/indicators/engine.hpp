#pragma once
#include "core/types.hpp"
#include "strategy/config.hpp"

namespace ind {

// Három, a bar sorozattal 1:1 igazított sorozat
struct IndicatorSeries {
    Series rsi;
    Series sma;
    Series atr;
    std::size_t size() const { return rsi.size(); }
};

Series closes(const Bars& bars);

// Tiszta függvény: ugyanarra a bemenetre bitre azonos kimenet
IndicatorSeries compute_indicators(const Bars& bars, const strat::StrategyConfig& cfg);

} // namespace ind
