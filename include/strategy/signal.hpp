#pragma once
#include <cstddef>
#include "core/types.hpp"
#include "indicators/engine.hpp"
#include "strategy/config.hpp"

namespace strat {

enum class Side { Flat, Long };

// A végrehajtó motor tulajdona; itt csak olvassuk
struct PositionState {
    Side side{Side::Flat};
    double entry_price{0.0};
    double stop_loss{0.0};
    double take_profit{0.0};
    bool is_long() const { return side == Side::Long; }
};

enum class IntentType { None, OpenLong, CloseLong };

inline const char* to_string(IntentType t) {
    switch (t) {
        case IntentType::OpenLong:  return "OPEN_LONG";
        case IntentType::CloseLong: return "CLOSE_LONG";
        default:                    return "NONE";
    }
}

// Javaslat, nem állapotváltás
struct Intent {
    IntentType type{IntentType::None};
    double stop_loss{kUndef};
    double take_profit{kUndef};

    static Intent none() { return {}; }
    static Intent open_long(double sl, double tp) { return {IntentType::OpenLong, sl, tp}; }
    static Intent close_long() { return {IntentType::CloseLong, kUndef, kUndef}; }
};

// s[i-1] <= level && s[i] > level; bármelyik kUndef -> false
bool crosses_above(const Series& s, std::size_t i, double level);
// s[i-1] >= level && s[i] < level
bool crosses_below(const Series& s, std::size_t i, double level);

// Bar-onkénti döntés. BUY szabály előbb, SELL utána; baronként max. egy intent.
Intent evaluate(const Bars& bars, const ind::IndicatorSeries& s, const PositionState& pos,
                std::size_t i, const StrategyConfig& cfg);

} // namespace strat
