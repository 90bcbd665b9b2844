#include "report/stats.hpp"
#include "core/timeutil.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <fmt/format.h>

namespace report {

static constexpr double kDayMs = 86'400'000.0;

// Drawdown periódusok: maximum és a periódus-maximumok átlaga (mindkettő negatív %)
static void drawdowns(const std::vector<exec::EquityPoint>& eq, double& max_dd, double& avg_dd){
    double peak = 0.0, cur = 0.0, worst = 0.0, sum = 0.0;
    std::size_t periods = 0;
    for (const auto& p : eq){
        peak = std::max(peak, p.equity);
        const double dd = peak > 0 ? 1.0 - p.equity / peak : 0.0;
        if (dd > 0){
            cur = std::max(cur, dd);
        } else if (cur > 0){
            sum += cur; ++periods; cur = 0.0;
        }
        worst = std::max(worst, dd);
    }
    if (cur > 0){ sum += cur; ++periods; }
    max_dd = -worst * 100.0;
    avg_dd = periods ? -(sum / periods) * 100.0 : 0.0;
}

Stats compute_stats(const Bars& bars, const exec::BacktestResult& r){
    Stats s;
    s.bars = bars.size();
    s.trades = r.trades.size();
    s.equity_final = r.final_cash;
    if (bars.empty()) return s;

    s.start_ms = bars.front().open_time_ms;
    s.end_ms   = bars.back().open_time_ms;
    s.duration_days = (s.end_ms - s.start_ms) / kDayMs;
    s.exposure_pct = 100.0 * r.bars_in_position / bars.size();

    s.equity_peak = r.initial_cash;
    for (const auto& p : r.equity) s.equity_peak = std::max(s.equity_peak, p.equity);

    s.return_pct = (r.final_cash - r.initial_cash) / r.initial_cash * 100.0;
    s.buy_hold_return_pct = (bars.back().close - bars.front().close) / bars.front().close * 100.0;
    if (s.duration_days > 0){
        const double growth = r.final_cash / r.initial_cash;
        if (growth > 0) s.return_ann_pct = (std::pow(growth, 365.0 / s.duration_days) - 1.0) * 100.0;
    }
    drawdowns(r.equity, s.max_drawdown_pct, s.avg_drawdown_pct);

    if (r.trades.empty()) return s;

    std::vector<double> rets, pnls;
    for (const auto& t : r.trades){ rets.push_back(t.return_pct); pnls.push_back(t.pnl); }
    const double n = static_cast<double>(r.trades.size());

    const auto wins = std::count_if(pnls.begin(), pnls.end(), [](double p){ return p > 0; });
    s.win_rate_pct = 100.0 * wins / n;
    s.best_trade_pct  = *std::max_element(rets.begin(), rets.end());
    s.worst_trade_pct = *std::min_element(rets.begin(), rets.end());
    s.expectancy_pct  = std::accumulate(rets.begin(), rets.end(), 0.0) / n;

    if (s.worst_trade_pct > -100.0){
        double log_sum = 0.0;
        for (double x : rets) log_sum += std::log1p(x / 100.0);
        s.avg_trade_pct = std::expm1(log_sum / n) * 100.0;
    }

    double gross_win = 0.0, gross_loss = 0.0;
    for (double p : pnls){ if (p > 0) gross_win += p; else gross_loss -= p; }
    if (gross_loss > 0) s.profit_factor = gross_win / gross_loss;

    if (pnls.size() > 1){
        const double mean = std::accumulate(pnls.begin(), pnls.end(), 0.0) / n;
        double var = 0.0;
        for (double p : pnls) var += (p - mean) * (p - mean);
        const double sd = std::sqrt(var / (n - 1.0));
        if (sd > 0) s.sqn = std::sqrt(n) * mean / sd;
    }
    return s;
}

static std::string num(double v, int prec = 2){
    return defined(v) ? fmt::format("{:.{}f}", v, prec) : std::string("n/a");
}

std::vector<std::pair<std::string, std::string>> stats_rows(const Stats& s){
    return {
        {"Start",                  format_utc(s.start_ms)},
        {"End",                    format_utc(s.end_ms)},
        {"Duration [days]",        num(s.duration_days, 1)},
        {"Bars",                   std::to_string(s.bars)},
        {"Exposure Time [%]",      num(s.exposure_pct)},
        {"Equity Final [$]",       num(s.equity_final)},
        {"Equity Peak [$]",        num(s.equity_peak)},
        {"Return [%]",             num(s.return_pct)},
        {"Buy & Hold Return [%]",  num(s.buy_hold_return_pct)},
        {"Return (Ann.) [%]",      num(s.return_ann_pct)},
        {"Max. Drawdown [%]",      num(s.max_drawdown_pct)},
        {"Avg. Drawdown [%]",      num(s.avg_drawdown_pct)},
        {"# Trades",               std::to_string(s.trades)},
        {"Win Rate [%]",           num(s.win_rate_pct)},
        {"Best Trade [%]",         num(s.best_trade_pct)},
        {"Worst Trade [%]",        num(s.worst_trade_pct)},
        {"Avg. Trade [%]",         num(s.avg_trade_pct)},
        {"Profit Factor",          num(s.profit_factor)},
        {"Expectancy [%]",         num(s.expectancy_pct)},
        {"SQN",                    num(s.sqn)},
        {"Data SHA-256",           s.data_sha256},
    };
}

std::string format_stats(const Stats& s){
    std::string out = fmt::format("{:=^50}\n{:^50}\n{:=^50}\n", "", "BACKTEST RESULTS", "");
    for (const auto& [k, v] : stats_rows(s)) out += fmt::format("{:<26}{:>24}\n", k, v);
    return out;
}

} // namespace report
