#include <gtest/gtest.h>
#include <numeric>
#include "exec/broker.hpp"
#include "indicators/engine.hpp"
#include "strategy/warmup.hpp"
#include "test_bars.hpp"

using namespace testutil;
using exec::Broker;
using exec::BrokerConfig;
using exec::ExitReason;
using strat::Intent;

namespace {

Bar bar(std::int64_t t, double o, double h, double l, double c){
    return Bar{t, o, h, l, c, 1000.0};
}

BrokerConfig no_fees(double cash = 10'000.0){
    BrokerConfig c;
    c.cash = cash;
    c.commission = 0.0;
    c.size_fraction = 1.0;
    c.size_step = 1.0;
    return c;
}

} // namespace

TEST(BrokerTest, OpenFillsAtNextOpen) {
    Broker br(no_fees());
    br.submit(Intent::open_long(90.0, 120.0));
    EXPECT_TRUE(br.has_pending());
    EXPECT_FALSE(br.position().is_long());

    br.on_bar(bar(1, 100, 101, 99, 100.5), 1);
    ASSERT_TRUE(br.position().is_long());
    EXPECT_FALSE(br.has_pending());
    EXPECT_DOUBLE_EQ(br.position().entry_price, 100.0);
    EXPECT_DOUBLE_EQ(br.position().stop_loss, 90.0);
    EXPECT_DOUBLE_EQ(br.position().take_profit, 120.0);
    EXPECT_DOUBLE_EQ(br.size(), 100.0);
    EXPECT_DOUBLE_EQ(br.cash(), 0.0);
    EXPECT_DOUBLE_EQ(br.equity(100.5), 10'050.0);
}

TEST(BrokerTest, StopLossExitsAtStopPrice) {
    Broker br(no_fees());
    br.submit(Intent::open_long(90.0, 120.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    br.on_bar(bar(2, 95, 96, 88, 89), 2);
    ASSERT_FALSE(br.position().is_long());
    ASSERT_EQ(br.trades().size(), 1u);
    const auto& t = br.trades()[0];
    EXPECT_EQ(t.reason, ExitReason::StopLoss);
    EXPECT_DOUBLE_EQ(t.exit_price, 90.0);
    EXPECT_DOUBLE_EQ(t.pnl, -1000.0);
    EXPECT_DOUBLE_EQ(t.return_pct, -10.0);
    EXPECT_EQ(t.entry_bar, 1u);
    EXPECT_EQ(t.exit_bar, 2u);
}

TEST(BrokerTest, GapBelowStopExitsAtOpen) {
    Broker br(no_fees());
    br.submit(Intent::open_long(90.0, 120.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    br.on_bar(bar(2, 85, 87, 84, 86), 2);
    ASSERT_EQ(br.trades().size(), 1u);
    EXPECT_DOUBLE_EQ(br.trades()[0].exit_price, 85.0);
}

TEST(BrokerTest, TakeProfitExitsAtTarget) {
    Broker br(no_fees());
    br.submit(Intent::open_long(90.0, 120.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    br.on_bar(bar(2, 110, 125, 109, 118), 2);
    ASSERT_EQ(br.trades().size(), 1u);
    EXPECT_EQ(br.trades()[0].reason, ExitReason::TakeProfit);
    EXPECT_DOUBLE_EQ(br.trades()[0].exit_price, 120.0);
    EXPECT_DOUBLE_EQ(br.cash(), 12'000.0);
}

TEST(BrokerTest, StopWinsWhenBothTouched) {
    Broker br(no_fees());
    br.submit(Intent::open_long(90.0, 120.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    br.on_bar(bar(2, 100, 130, 80, 100), 2);
    ASSERT_EQ(br.trades().size(), 1u);
    EXPECT_EQ(br.trades()[0].reason, ExitReason::StopLoss);
}

TEST(BrokerTest, BracketCheckedOnEntryBar) {
    Broker br(no_fees());
    br.submit(Intent::open_long(95.0, 120.0));
    br.on_bar(bar(1, 100, 101, 94, 96), 1);
    ASSERT_EQ(br.trades().size(), 1u);
    EXPECT_EQ(br.trades()[0].entry_bar, 1u);
    EXPECT_EQ(br.trades()[0].exit_bar, 1u);
}

TEST(BrokerTest, CommissionChargedOnBothSides) {
    BrokerConfig cfg = no_fees();
    cfg.commission = 0.001;
    Broker br(cfg);
    br.submit(Intent::open_long(50.0, 500.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    // 10000 / 100.1 -> 99 egész egység
    EXPECT_DOUBLE_EQ(br.size(), 99.0);
    EXPECT_NEAR(br.cash(), 10'000.0 - 9'900.0 - 9.9, 1e-9);

    br.submit(Intent::close_long());
    br.on_bar(bar(2, 110, 111, 109, 110), 2);
    ASSERT_EQ(br.trades().size(), 1u);
    const auto& t = br.trades()[0];
    EXPECT_EQ(t.reason, ExitReason::Signal);
    EXPECT_NEAR(t.commission, 9.9 + 10.89, 1e-9);
    EXPECT_NEAR(t.pnl, 990.0 - 20.79, 1e-9);
    EXPECT_NEAR(br.cash(), 10'000.0 + t.pnl, 1e-9);
}

TEST(BrokerTest, FractionalSizing) {
    BrokerConfig cfg = no_fees(1'000.0);
    cfg.size_step = 0.0;
    cfg.size_fraction = 0.5;
    Broker br(cfg);
    br.submit(Intent::open_long(1.0, 1e9));
    br.on_bar(bar(1, 300, 301, 299, 300), 1);
    EXPECT_NEAR(br.size(), 500.0 / 300.0, 1e-12);
}

TEST(BrokerTest, SkipsOrderWhenCashTooSmall) {
    Broker br(no_fees(50.0));
    br.submit(Intent::open_long(90.0, 120.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    EXPECT_FALSE(br.position().is_long());
    EXPECT_DOUBLE_EQ(br.cash(), 50.0);
}

TEST(BrokerTest, CloseWhileFlatIsIgnored) {
    Broker br(no_fees());
    br.submit(Intent::close_long());
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    EXPECT_TRUE(br.trades().empty());
    EXPECT_DOUBLE_EQ(br.cash(), 10'000.0);
}

TEST(BrokerTest, NoneIntentIsNotQueued) {
    Broker br(no_fees());
    br.submit(Intent::none());
    EXPECT_FALSE(br.has_pending());
}

TEST(BrokerTest, CloseAllAtEndOfData) {
    Broker br(no_fees());
    br.submit(Intent::open_long(50.0, 500.0));
    br.on_bar(bar(1, 100, 101, 99, 100), 1);
    br.close_all(bar(2, 100, 106, 99, 105), 2);
    ASSERT_EQ(br.trades().size(), 1u);
    EXPECT_EQ(br.trades()[0].reason, ExitReason::EndOfData);
    EXPECT_DOUBLE_EQ(br.trades()[0].exit_price, 105.0);
    EXPECT_DOUBLE_EQ(br.cash(), 10'500.0);
}

TEST(BacktestTest, RunOverCyclicMarket) {
    // esés / emelkedés ciklusok -> több belépés és kilépés
    std::vector<double> closes;
    double x = 300.0;
    for (int cycle = 0; cycle < 6; ++cycle){
        for (int i = 0; i < 60; ++i){ x -= 1.0; closes.push_back(x); }
        for (int i = 0; i < 60; ++i){ x += 1.5; closes.push_back(x); }
    }
    const Bars b = make_bars(closes);
    const strat::StrategyConfig scfg;
    const auto s = ind::compute_indicators(b, scfg);
    const auto r = exec::run_backtest(b, s, scfg, exec::BrokerConfig{});

    EXPECT_EQ(r.equity.size(), b.size());
    EXPECT_EQ(r.intents.size(), b.size());
    ASSERT_FALSE(r.trades.empty());
    EXPECT_DOUBLE_EQ(r.final_cash, r.equity.back().equity);

    const double pnl = std::accumulate(r.trades.begin(), r.trades.end(), 0.0,
                                       [](double a, const exec::Trade& t){ return a + t.pnl; });
    EXPECT_NEAR(r.final_cash, r.initial_cash + pnl, 1e-6 * r.initial_cash);

    const auto first = strat::first_ready(s);
    ASSERT_TRUE(first.has_value());
    for (std::size_t k = 0; k < r.trades.size(); ++k){
        const auto& t = r.trades[k];
        EXPECT_GT(t.entry_bar, *first);
        EXPECT_LE(t.entry_bar, t.exit_bar);
        // a belépést az előző bar OpenLong intentje váltotta ki
        EXPECT_EQ(r.intents[t.entry_bar - 1].type, strat::IntentType::OpenLong);
        if (k + 1 < r.trades.size()) EXPECT_LE(t.exit_bar, r.trades[k + 1].entry_bar);
    }
}

TEST(BacktestTest, IntentOnLastBarIsDiscarded) {
    const Bars b = make_bars({100, 101, 102, 103});
    ind::IndicatorSeries s;
    s.rsi = {40, 50, 54, 56};
    s.sma.assign(4, 90.0);
    s.atr.assign(4, 2.0);
    const auto r = exec::run_backtest(b, s, {}, exec::BrokerConfig{});
    EXPECT_EQ(r.intents[3].type, strat::IntentType::OpenLong);
    EXPECT_TRUE(r.trades.empty());
    EXPECT_DOUBLE_EQ(r.final_cash, r.initial_cash);
    EXPECT_EQ(r.bars_in_position, 0u);
}
