#include "app/pipeline.hpp"
#include "core/timeutil.hpp"
#include "data/bars.hpp"
#include "data/csv.hpp"
#include "strategy/warmup.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace app {

Pipeline::Pipeline(AppConfig cfg, std::unique_ptr<data::IBarSource> source)
: cfg_(std::move(cfg)), source_(std::move(source)) {
    validate(cfg_);
    if (!source_) source_ = data::make_source(cfg_.data);
}

const Bars& Pipeline::fetch(){
    if (bars_) return *bars_;
    spdlog::info("Fetching historical data ({})...", source_->id());
    Bars b = data::normalize(source_->fetch());
    data::require_min_bars(b, std::max<std::size_t>(cfg_.data.min_bars, 1));
    if (!cfg_.data.save_csv_path.empty()) data::save_csv(cfg_.data.save_csv_path, b);
    spdlog::info("{} bars: {} .. {}", b.size(), format_utc(b.front().open_time_ms), format_utc(b.back().open_time_ms));
    bars_ = std::move(b);
    return *bars_;
}

const ind::IndicatorSeries& Pipeline::compute(){
    if (series_) return *series_;
    const Bars& b = fetch();
    series_ = ind::compute_indicators(b, cfg_.strategy);
    if (auto first = strat::first_ready(*series_))
        spdlog::info("Indicators ready from bar {} ({})", *first, format_utc(b[*first].open_time_ms));
    else
        spdlog::warn("Indicators never become ready on {} bars", b.size());
    return *series_;
}

const exec::BacktestResult& Pipeline::simulate(){
    if (result_) return *result_;
    const auto& s = compute();
    spdlog::info("Running backtest...");
    result_ = exec::run_backtest(*bars_, s, cfg_.strategy, cfg_.broker);
    spdlog::info("Backtest done: {} trades, final equity {:.2f}", result_->trades.size(), result_->final_cash);
    return *result_;
}

const report::Stats& Pipeline::evaluate_stats(){
    if (stats_) return *stats_;
    const auto& r = simulate();
    report::Stats st = report::compute_stats(*bars_, r);
    st.data_sha256 = data::fingerprint(*bars_);
    stats_ = std::move(st);
    return *stats_;
}

report::ReportFiles Pipeline::write_report(){
    const auto& st = evaluate_stats();
    return report::write_report(cfg_.report, to_json(cfg_), st, *result_, now_ms());
}

const report::Stats& Pipeline::run(){
    const auto& st = evaluate_stats();
    if (!cfg_.report.output_dir.empty()) write_report();
    return st;
}

} // namespace app
