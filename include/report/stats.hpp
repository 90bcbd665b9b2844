#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "core/types.hpp"
#include "exec/broker.hpp"

namespace report {

// Összesített futás statisztika. A nem értelmezhető értékek (pl. win rate
// kötés nélkül) NaN-ok, JSON-ban null.
struct Stats {
    std::int64_t start_ms{0};
    std::int64_t end_ms{0};
    double duration_days{0.0};
    std::size_t bars{0};
    double exposure_pct{0.0};
    double equity_final{0.0};
    double equity_peak{0.0};
    double return_pct{0.0};
    double buy_hold_return_pct{0.0};
    double return_ann_pct{kUndef};
    double max_drawdown_pct{0.0};   // negatív vagy 0
    double avg_drawdown_pct{0.0};   // negatív vagy 0
    std::size_t trades{0};
    double win_rate_pct{kUndef};
    double best_trade_pct{kUndef};
    double worst_trade_pct{kUndef};
    double avg_trade_pct{kUndef};   // mértani átlag
    double profit_factor{kUndef};
    double expectancy_pct{kUndef};  // számtani átlag
    double sqn{kUndef};
    std::string data_sha256;
};

Stats compute_stats(const Bars& bars, const exec::BacktestResult& r);

// Címke/érték sorok (stdout tábla, viewer)
std::vector<std::pair<std::string, std::string>> stats_rows(const Stats& s);

// Kiírás táblaként
std::string format_stats(const Stats& s);

} // namespace report
