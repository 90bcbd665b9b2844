#include "app/config.hpp"
#include "core/errors.hpp"
#include "core/timeutil.hpp"
#include <cstdlib>
#include <fstream>
#include <type_traits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace app {

template <typename T>
static void get_if(const json& j, const char* key, T& out){
    if (!j.contains(key) || j[key].is_null()) return;
    if constexpr (std::is_unsigned_v<T>){
        if (j[key].is_number() && j[key].template get<double>() < 0)
            throw ConfigError(std::string("config key '") + key + "' must not be negative");
    }
    try{
        out = j[key].template get<T>();
    } catch (const json::exception& e){
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

void apply_json(AppConfig& cfg, const json& j){
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    if (j.contains("strategy")){
        const auto& s = j["strategy"];
        auto& c = cfg.strategy;
        get_if(s, "rsi_period", c.rsi_period);
        get_if(s, "sma_period", c.sma_period);
        get_if(s, "atr_period", c.atr_period);
        get_if(s, "atr_multiplier_sl", c.atr_multiplier_sl);
        get_if(s, "atr_multiplier_tp", c.atr_multiplier_tp);
        get_if(s, "buy_threshold", c.buy_threshold);
        get_if(s, "sell_threshold", c.sell_threshold);
    }
    if (j.contains("data")){
        const auto& d = j["data"];
        auto& c = cfg.data;
        get_if(d, "symbol", c.symbol);
        std::string iv;
        get_if(d, "interval", iv);
        if (!iv.empty()){
            auto tf = parse_timeframe(iv);
            if (!tf) throw ConfigError("unknown interval: " + iv);
            c.interval = *tf;
        }
        get_if(d, "start", c.start);
        get_if(d, "end", c.end);
        get_if(d, "csv_path", c.csv_path);
        get_if(d, "save_csv_path", c.save_csv_path);
        get_if(d, "min_bars", c.min_bars);
        get_if(d, "api_key", c.api_key);
        get_if(d, "testnet", c.testnet);
        get_if(d, "timeout_ms", c.timeout_ms);
    }
    if (j.contains("broker")){
        const auto& b = j["broker"];
        get_if(b, "cash", cfg.broker.cash);
        get_if(b, "commission", cfg.broker.commission);
        get_if(b, "size_fraction", cfg.broker.size_fraction);
        get_if(b, "size_step", cfg.broker.size_step);
    }
    if (j.contains("report")){
        const auto& r = j["report"];
        get_if(r, "output_dir", cfg.report.output_dir);
        get_if(r, "write_chart", cfg.report.write_chart);
        get_if(r, "chart_width", cfg.report.chart_width);
        get_if(r, "chart_height", cfg.report.chart_height);
        get_if(r, "show_viewer", cfg.report.show_viewer);
    }
    get_if(j, "log_level", cfg.log_level);
}

void apply_file(AppConfig& cfg, const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw ConfigError("cannot open config file: " + path);
    json j;
    try{
        f >> j;
    } catch (const json::parse_error& e){
        throw ConfigError(path + ": " + e.what());
    }
    apply_json(cfg, j);
}

void apply_env(AppConfig& cfg){
    if (!cfg.data.api_key.empty()) return;
    if (const char* k = std::getenv("BINANCE_API_KEY")) cfg.data.api_key = k;
}

void validate(const AppConfig& cfg){
    const auto& s = cfg.strategy;
    if (s.rsi_period == 0 || s.sma_period == 0 || s.atr_period == 0)
        throw ConfigError("indicator periods must be positive");
    if (!(s.atr_multiplier_sl > 0) || !(s.atr_multiplier_tp > 0))
        throw ConfigError("ATR multipliers must be positive");
    if (!(s.buy_threshold > s.sell_threshold))
        throw ConfigError("buy_threshold must be greater than sell_threshold");

    const auto& d = cfg.data;
    if (d.csv_path.empty()){
        if (d.symbol.empty()) throw ConfigError("symbol is empty");
        const auto a = parse_date_ms(d.start), b = parse_date_ms(d.end);
        if (!a) throw ConfigError("invalid start date: " + d.start);
        if (!b) throw ConfigError("invalid end date: " + d.end);
        if (*b < *a) throw ConfigError("end date before start date");
    }

    const auto& b = cfg.broker;
    if (!(b.cash > 0)) throw ConfigError("cash must be positive");
    if (b.commission < 0 || b.commission >= 1) throw ConfigError("commission must be in [0, 1)");
    if (!(b.size_fraction > 0) || b.size_fraction > 1) throw ConfigError("size_fraction must be in (0, 1]");
    if (b.size_step < 0) throw ConfigError("size_step must not be negative");

    // from_str ismeretlen névre off-ot ad, ami elnémítaná a logot
    if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off && cfg.log_level != "off")
        throw ConfigError("unknown log level: " + cfg.log_level);
}

json to_json(const AppConfig& cfg){
    const auto& s = cfg.strategy;
    const auto& d = cfg.data;
    return json{
        {"strategy", {
            {"rsi_period", s.rsi_period}, {"sma_period", s.sma_period}, {"atr_period", s.atr_period},
            {"atr_multiplier_sl", s.atr_multiplier_sl}, {"atr_multiplier_tp", s.atr_multiplier_tp},
            {"buy_threshold", s.buy_threshold}, {"sell_threshold", s.sell_threshold}}},
        {"data", {
            {"source", d.csv_path.empty() ? "binance" : "csv"},
            {"symbol", d.symbol}, {"interval", to_string(d.interval)},
            {"start", d.start}, {"end", d.end}, {"csv_path", d.csv_path},
            {"min_bars", d.min_bars}, {"testnet", d.testnet}}},
        {"broker", {
            {"cash", cfg.broker.cash}, {"commission", cfg.broker.commission},
            {"size_fraction", cfg.broker.size_fraction}, {"size_step", cfg.broker.size_step}}},
    };
}

} // namespace app
