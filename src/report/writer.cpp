#include "report/writer.hpp"
#include "report/chart.hpp"
#include "core/timeutil.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace exec {
static void to_json(json& j, const Trade& t){
    j = json{
        {"entry_bar", t.entry_bar}, {"exit_bar", t.exit_bar},
        {"entry_time", format_utc(t.entry_time_ms)}, {"exit_time", format_utc(t.exit_time_ms)},
        {"size", t.size},
        {"entry_price", t.entry_price}, {"exit_price", t.exit_price},
        {"stop_loss", t.stop_loss}, {"take_profit", t.take_profit},
        {"commission", t.commission}, {"pnl", t.pnl}, {"return_pct", t.return_pct},
        {"exit_reason", to_string(t.reason)},
    };
}
} // namespace exec

namespace report {

void to_json(json& j, const Stats& s){
    // NaN -> null a dump()-ban
    j = json{
        {"start", format_utc(s.start_ms)}, {"end", format_utc(s.end_ms)},
        {"duration_days", s.duration_days}, {"bars", s.bars},
        {"exposure_pct", s.exposure_pct},
        {"equity_final", s.equity_final}, {"equity_peak", s.equity_peak},
        {"return_pct", s.return_pct}, {"buy_hold_return_pct", s.buy_hold_return_pct},
        {"return_ann_pct", s.return_ann_pct},
        {"max_drawdown_pct", s.max_drawdown_pct}, {"avg_drawdown_pct", s.avg_drawdown_pct},
        {"trades", s.trades}, {"win_rate_pct", s.win_rate_pct},
        {"best_trade_pct", s.best_trade_pct}, {"worst_trade_pct", s.worst_trade_pct},
        {"avg_trade_pct", s.avg_trade_pct}, {"profit_factor", s.profit_factor},
        {"expectancy_pct", s.expectancy_pct}, {"sqn", s.sqn},
        {"data_sha256", s.data_sha256},
    };
}

std::string base_name(std::uint64_t ms){
    const std::time_t t = static_cast<std::time_t>(ms / 1000);
    std::tm lt{};
#ifdef _WIN32
    localtime_s(&lt, &t);
#else
    localtime_r(&t, &lt);
#endif
    std::ostringstream oss;
    oss << "backtest_result_" << std::put_time(&lt, "%Y-%m-%d_%H-%M-%S");
    return oss.str();
}

static void write_text(const fs::path& p, const std::string& text){
    std::ofstream f(p);
    f << text;
    if (!f.good()) throw std::runtime_error("cannot write " + p.string());
}

ReportFiles write_report(const ReportConfig& cfg, const json& run_config,
                         const Stats& s, const exec::BacktestResult& r, std::uint64_t now){
    const fs::path dir(cfg.output_dir);
    fs::create_directories(dir);
    const std::string base = base_name(now);
    ReportFiles files;

    json j;
    j["config"] = run_config;
    j["stats"]  = s;
    j["trades"] = json::array();
    for (const auto& t : r.trades){ json jt; exec::to_json(jt, t); j["trades"].push_back(jt); }
    files.json = (dir / (base + ".json")).string();
    write_text(files.json, j.dump(2));

    std::ostringstream csv;
    csv << "time,equity\n" << std::setprecision(12);
    for (const auto& p : r.equity) csv << format_utc(p.time_ms) << ',' << p.equity << '\n';
    files.equity_csv = (dir / (base + "_equity.csv")).string();
    write_text(files.equity_csv, csv.str());

    if (cfg.write_chart){
        const auto path = (dir / (base + ".png")).string();
        const auto daily = resample_daily(r.equity);
        if (render_equity_png(daily, r.initial_cash, path, cfg.chart_width, cfg.chart_height))
            files.chart = path;
        else
            spdlog::warn("equity chart not written ({} daily points) to {}", daily.size(), path);
    }
    spdlog::info("Report written: {}", files.json);
    return files;
}

} // namespace report
