#pragma once
#include <memory>
#include <optional>
#include "app/config.hpp"
#include "data/source.hpp"
#include "exec/broker.hpp"
#include "indicators/engine.hpp"
#include "report/stats.hpp"
#include "report/writer.hpp"

namespace app {

// fetch -> compute -> simulate (evaluate bar-onként) -> report.
// Minden lépés külön hívható; a korábbi lépést szükség esetén lefuttatja.
class Pipeline {
public:
    explicit Pipeline(AppConfig cfg, std::unique_ptr<data::IBarSource> source = nullptr);

    const Bars& fetch();
    const ind::IndicatorSeries& compute();
    const exec::BacktestResult& simulate();
    const report::Stats& evaluate_stats();
    report::ReportFiles write_report();

    // teljes futás; a statisztikát adja vissza
    const report::Stats& run();

    const AppConfig& config() const { return cfg_; }

private:
    AppConfig cfg_;
    std::unique_ptr<data::IBarSource> source_;
    std::optional<Bars> bars_;
    std::optional<ind::IndicatorSeries> series_;
    std::optional<exec::BacktestResult> result_;
    std::optional<report::Stats> stats_;
};

} // namespace app
