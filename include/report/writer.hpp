#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "exec/broker.hpp"
#include "report/stats.hpp"

namespace report {

struct ReportConfig {
    std::string output_dir{"Backtests"};
    bool write_chart{true};
    unsigned chart_width{1200};
    unsigned chart_height{600};
    bool show_viewer{false};
};

// Az elkészült fájlok útvonalai (üres = nem készült)
struct ReportFiles {
    std::string json;
    std::string equity_csv;
    std::string chart;
};

void to_json(nlohmann::json& j, const Stats& s);

// "backtest_result_YYYY-MM-DD_HH-MM-SS" (helyi idő)
std::string base_name(std::uint64_t ms);

// output_dir létrehozása szükség esetén; írási hibára std::runtime_error.
// A chart hibája csak figyelmeztetés.
ReportFiles write_report(const ReportConfig& cfg, const nlohmann::json& run_config,
                         const Stats& s, const exec::BacktestResult& r, std::uint64_t now_ms);

} // namespace report
