#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "data/source.hpp"
#include "exec/broker.hpp"
#include "report/writer.hpp"
#include "strategy/config.hpp"

namespace app {

struct AppConfig {
    strat::StrategyConfig strategy;
    data::DataConfig data;
    exec::BrokerConfig broker;
    report::ReportConfig report;
    std::string log_level{"info"};
};

// {"strategy":{...},"data":{...},"broker":{...},"report":{...},"log_level":"..."}
// Hiányzó kulcs -> marad az alapérték, ismeretlen kulcs -> figyelmen kívül.
void apply_json(AppConfig& cfg, const nlohmann::json& j);

// Fájlból; olvasási/parse hibára ConfigError
void apply_file(AppConfig& cfg, const std::string& path);

// BINANCE_API_KEY, ha nincs megadva kulcs
void apply_env(AppConfig& cfg);

// ConfigError, ha valami nem stimmel
void validate(const AppConfig& cfg);

// A riportba kerülő nézet (api_key nélkül)
nlohmann::json to_json(const AppConfig& cfg);

} // namespace app
