#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "core/types.hpp"
#include "indicators/engine.hpp"
#include "strategy/config.hpp"
#include "strategy/signal.hpp"

namespace exec {

struct BrokerConfig {
    double cash{1'000'000.0};    // induló tőke
    double commission{0.0002};   // jutalék / kötés (notional arányában)
    double size_fraction{0.9999}; // az equity ekkora részét tesszük be
    double size_step{1.0};       // 1.0 = egész egységek, 0 = tört mennyiség
};

enum class ExitReason { Signal, StopLoss, TakeProfit, EndOfData };

inline const char* to_string(ExitReason r) {
    switch (r) {
        case ExitReason::Signal:     return "signal";
        case ExitReason::StopLoss:   return "stop_loss";
        case ExitReason::TakeProfit: return "take_profit";
        default:                     return "end_of_data";
    }
}

struct Trade {
    std::size_t entry_bar{0};
    std::size_t exit_bar{0};
    std::int64_t entry_time_ms{0};
    std::int64_t exit_time_ms{0};
    double size{0.0};
    double entry_price{0.0};
    double exit_price{0.0};
    double stop_loss{0.0};
    double take_profit{0.0};
    double commission{0.0}; // belépő + kilépő jutalék összesen
    double pnl{0.0};        // jutalék után
    double return_pct{0.0};
    ExitReason reason{ExitReason::Signal};
};

struct EquityPoint {
    std::int64_t time_ms{0};
    double equity{0.0};
};

struct BacktestResult {
    double initial_cash{0.0};
    double final_cash{0.0};
    std::size_t bars_in_position{0};
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity;
    std::vector<strat::Intent> intents; // baronként, index-igazítva
};

// A pozíció és a cash egyetlen írója. Az intent a következő bar nyitóján teljesül.
class Broker {
public:
    explicit Broker(BrokerConfig cfg);

    void submit(const strat::Intent& intent);
    // függő megbízás a nyitón, aztán SL/TP a bar high/low alapján
    void on_bar(const Bar& b, std::size_t i);
    // adatsor vége: nyitott pozíció zárása az utolsó close-on
    void close_all(const Bar& last, std::size_t i);

    const strat::PositionState& position() const { return pos_; }
    double cash() const { return cash_; }
    double size() const { return size_; }
    double equity(double mark) const { return cash_ + size_ * mark; }
    bool has_pending() const { return pending_.has_value(); }
    const std::vector<Trade>& trades() const { return trades_; }

private:
    void open_long(const Bar& b, std::size_t i, double sl, double tp);
    void close_long(double price, std::int64_t t, std::size_t i, ExitReason r);
    void check_brackets(const Bar& b, std::size_t i);

    BrokerConfig cfg_;
    double cash_{0.0};
    strat::PositionState pos_{};
    double size_{0.0};
    double entry_fee_{0.0};
    std::size_t entry_bar_{0};
    std::int64_t entry_time_{0};
    std::optional<strat::Intent> pending_;
    std::vector<Trade> trades_;
};

// Teljes szimuláció: bar-onként on_bar -> evaluate -> submit
BacktestResult run_backtest(const Bars& bars, const ind::IndicatorSeries& s,
                            const strat::StrategyConfig& scfg, const BrokerConfig& bcfg);

} // namespace exec
