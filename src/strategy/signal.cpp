#include "strategy/signal.hpp"
#include "strategy/warmup.hpp"

namespace strat {

bool crosses_above(const Series& s, std::size_t i, double level){
    if (i == 0 || i >= s.size()) return false;
    return s[i-1] <= level && s[i] > level; // NaN összehasonlítás mindig false
}

bool crosses_below(const Series& s, std::size_t i, double level){
    if (i == 0 || i >= s.size()) return false;
    return s[i-1] >= level && s[i] < level;
}

Intent evaluate(const Bars& bars, const ind::IndicatorSeries& s, const PositionState& pos,
                std::size_t i, const StrategyConfig& cfg){
    if (i >= bars.size() || !ready(s, i)) return Intent::none();

    const double price = bars[i].close;

    // BUY: nincs pozíció + RSI felfelé átlépi a buy küszöböt + ár az SMA felett
    if (!pos.is_long() && crosses_above(s.rsi, i, cfg.buy_threshold) && price > s.sma[i]){
        const double sl = price - cfg.atr_multiplier_sl * s.atr[i];
        const double tp = price + cfg.atr_multiplier_tp * s.atr[i];
        return Intent::open_long(sl, tp);
    }
    // SELL: van pozíció + RSI lefelé átlépi a sell küszöböt
    if (pos.is_long() && crosses_below(s.rsi, i, cfg.sell_threshold))
        return Intent::close_long();

    return Intent::none();
}

} // namespace strat
