#pragma once
#include <algorithm>
#include <cstddef>

namespace strat {

// Stratégia paraméterek (immutable a futás alatt)
struct StrategyConfig {
    std::size_t rsi_period{21};
    std::size_t sma_period{50};
    std::size_t atr_period{14};
    double atr_multiplier_sl{1.5}; // Stop Loss szorzó
    double atr_multiplier_tp{5.0}; // Take Profit szorzó

    // RSI küszöbök
    double buy_threshold{55.0};
    double sell_threshold{45.0};

    std::size_t longest_period() const { return std::max({rsi_period, sma_period, atr_period}); }
};

} // namespace strat
