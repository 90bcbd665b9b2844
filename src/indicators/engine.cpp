#include "indicators/engine.hpp"
#include "indicators/atr.hpp"
#include "indicators/rsi.hpp"
#include "indicators/sma.hpp"

namespace ind {

Series closes(const Bars& bars){
    Series c(bars.size());
    for (std::size_t i = 0; i < bars.size(); ++i) c[i] = bars[i].close;
    return c;
}

IndicatorSeries compute_indicators(const Bars& bars, const strat::StrategyConfig& cfg){
    IndicatorSeries s;
    s.rsi = volume_rsi(bars, cfg.rsi_period);
    s.sma = safe_sma(closes(bars), cfg.sma_period);
    s.atr = atr(bars, cfg.atr_period);
    return s;
}

} // namespace ind
