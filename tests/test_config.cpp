#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "app/cli.hpp"
#include "app/config.hpp"
#include "core/errors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// argv összerakása tesztekhez
struct Argv {
    std::vector<std::string> store;
    std::vector<char*> ptrs;
    explicit Argv(std::vector<std::string> args) : store(std::move(args)) {
        store.insert(store.begin(), "vrsi_backtester");
        for (auto& s : store) ptrs.push_back(s.data());
    }
    int argc() { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }
};

app::CliOptions parse(std::vector<std::string> args){
    Argv a(std::move(args));
    return app::parse_args(a.argc(), a.argv());
}

} // namespace

TEST(ConfigTest, DefaultsMatchStrategy) {
    const app::AppConfig c;
    EXPECT_EQ(c.strategy.rsi_period, 21u);
    EXPECT_EQ(c.strategy.sma_period, 50u);
    EXPECT_EQ(c.strategy.atr_period, 14u);
    EXPECT_DOUBLE_EQ(c.strategy.atr_multiplier_sl, 1.5);
    EXPECT_DOUBLE_EQ(c.strategy.atr_multiplier_tp, 5.0);
    EXPECT_DOUBLE_EQ(c.strategy.buy_threshold, 55.0);
    EXPECT_DOUBLE_EQ(c.strategy.sell_threshold, 45.0);
    EXPECT_EQ(c.data.symbol, "BTCUSDT");
    EXPECT_EQ(c.data.interval, Timeframe::H4);
    EXPECT_EQ(c.data.start, "2015-01-01");
    EXPECT_EQ(c.data.end, "2025-02-16");
    EXPECT_EQ(c.data.min_bars, 200u);
    EXPECT_DOUBLE_EQ(c.broker.cash, 1'000'000.0);
    EXPECT_DOUBLE_EQ(c.broker.commission, 0.0002);
    EXPECT_EQ(c.report.output_dir, "Backtests");
    EXPECT_EQ(c.strategy.longest_period(), 50u);
    EXPECT_NO_THROW(app::validate(c));
}

TEST(ConfigTest, JsonOverridesOnlyGivenKeys) {
    app::AppConfig c;
    app::apply_json(c, json::parse(R"({
        "strategy": {"rsi_period": 14, "buy_threshold": 60},
        "data": {"symbol": "ETHUSDT", "interval": "1d", "unknown": 1},
        "broker": {"cash": 5000},
        "report": {"write_chart": false},
        "log_level": "debug",
        "extra": true
    })"));
    EXPECT_EQ(c.strategy.rsi_period, 14u);
    EXPECT_DOUBLE_EQ(c.strategy.buy_threshold, 60.0);
    EXPECT_DOUBLE_EQ(c.strategy.sell_threshold, 45.0);
    EXPECT_EQ(c.data.symbol, "ETHUSDT");
    EXPECT_EQ(c.data.interval, Timeframe::D1);
    EXPECT_DOUBLE_EQ(c.broker.cash, 5000.0);
    EXPECT_DOUBLE_EQ(c.broker.commission, 0.0002);
    EXPECT_FALSE(c.report.write_chart);
    EXPECT_EQ(c.log_level, "debug");
}

TEST(ConfigTest, BadJsonValuesThrow) {
    app::AppConfig c;
    EXPECT_THROW(app::apply_json(c, json::parse(R"({"strategy": {"rsi_period": "x"}})")), ConfigError);
    EXPECT_THROW(app::apply_json(c, json::parse(R"({"strategy": {"sma_period": -5}})")), ConfigError);
    EXPECT_THROW(app::apply_json(c, json::parse(R"({"data": {"interval": "7h"}})")), ConfigError);
    EXPECT_THROW(app::apply_json(c, json::parse("[1,2]")), ConfigError);
}

TEST(ConfigTest, ValidateRejectsInconsistentSettings) {
    auto bad = [](auto mutate){
        app::AppConfig c;
        mutate(c);
        EXPECT_THROW(app::validate(c), ConfigError);
    };
    bad([](app::AppConfig& c){ c.strategy.sma_period = 0; });
    bad([](app::AppConfig& c){ c.strategy.atr_multiplier_sl = 0; });
    bad([](app::AppConfig& c){ c.strategy.buy_threshold = 45; });
    bad([](app::AppConfig& c){ c.data.start = "2015/01/01"; });
    bad([](app::AppConfig& c){ c.data.start = "2025-03-01"; });
    bad([](app::AppConfig& c){ c.broker.cash = 0; });
    bad([](app::AppConfig& c){ c.broker.commission = -0.1; });
    bad([](app::AppConfig& c){ c.broker.size_fraction = 1.5; });

    // CSV forrásnál a dátumtartomány nem számít
    app::AppConfig c;
    c.data.csv_path = "bars.csv";
    c.data.start = "whenever";
    EXPECT_NO_THROW(app::validate(c));
}

TEST(ConfigTest, SizeStepFromJson) {
    app::AppConfig c;
    EXPECT_DOUBLE_EQ(c.broker.size_step, 1.0);
    app::apply_json(c, json::parse(R"({"broker": {"size_step": 0.001}})"));
    EXPECT_DOUBLE_EQ(c.broker.size_step, 0.001);
    app::apply_json(c, json::parse(R"({"broker": {"size_step": -1}})"));
    EXPECT_THROW(app::validate(c), ConfigError);
}

TEST(ConfigTest, UnknownLogLevelRejected) {
    app::AppConfig c;
    for (const char* lvl : {"trace", "debug", "info", "warn", "error", "critical", "off"}){
        c.log_level = lvl;
        EXPECT_NO_THROW(app::validate(c)) << lvl;
    }
    c.log_level = "verbose";
    EXPECT_THROW(app::validate(c), ConfigError);
    c.log_level = "INFO";
    EXPECT_THROW(app::validate(c), ConfigError);

    const auto o = parse({"--log-level", "dbug"});
    EXPECT_THROW(app::validate(o.cfg), ConfigError);
}

TEST(ConfigTest, FileLoading) {
    const auto p = fs::temp_directory_path() / "vrsi_config_test.json";
    {
        std::ofstream f(p);
        f << R"({"strategy": {"sma_period": 30}, "broker": {"commission": 0.001}})";
    }
    app::AppConfig c;
    app::apply_file(c, p.string());
    EXPECT_EQ(c.strategy.sma_period, 30u);
    EXPECT_DOUBLE_EQ(c.broker.commission, 0.001);

    {
        std::ofstream f(p);
        f << "{ not json";
    }
    EXPECT_THROW(app::apply_file(c, p.string()), ConfigError);
    EXPECT_THROW(app::apply_file(c, "/nonexistent/vrsi.json"), ConfigError);
    fs::remove(p);
}

TEST(ConfigTest, ApiKeyFromEnvironment) {
    ::setenv("BINANCE_API_KEY", "env-key", 1);
    app::AppConfig c;
    app::apply_env(c);
    EXPECT_EQ(c.data.api_key, "env-key");

    app::AppConfig keep;
    keep.data.api_key = "explicit";
    app::apply_env(keep);
    EXPECT_EQ(keep.data.api_key, "explicit");
    ::unsetenv("BINANCE_API_KEY");
}

TEST(ConfigTest, ReportViewDoesNotLeakApiKey) {
    app::AppConfig c;
    c.data.api_key = "secret";
    const std::string dumped = app::to_json(c).dump();
    EXPECT_EQ(dumped.find("secret"), std::string::npos);
    EXPECT_EQ(app::to_json(c).at("strategy").at("rsi_period").get<int>(), 21);
}

TEST(CliTest, FlagsOverrideDefaults) {
    const auto o = parse({"--csv", "data/btc.csv", "--symbol", "ETHUSDT", "--interval", "1h",
                          "--cash", "25000", "--commission", "0.001", "--out", "runs",
                          "--no-chart", "--show", "--testnet", "--log-level", "debug"});
    EXPECT_FALSE(o.help);
    EXPECT_EQ(o.cfg.data.csv_path, "data/btc.csv");
    EXPECT_EQ(o.cfg.data.symbol, "ETHUSDT");
    EXPECT_EQ(o.cfg.data.interval, Timeframe::H1);
    EXPECT_DOUBLE_EQ(o.cfg.broker.cash, 25000.0);
    EXPECT_DOUBLE_EQ(o.cfg.broker.commission, 0.001);
    EXPECT_EQ(o.cfg.report.output_dir, "runs");
    EXPECT_FALSE(o.cfg.report.write_chart);
    EXPECT_TRUE(o.cfg.report.show_viewer);
    EXPECT_TRUE(o.cfg.data.testnet);
    EXPECT_EQ(o.cfg.log_level, "debug");
}

TEST(CliTest, CommandLineWinsOverConfigFile) {
    const auto p = fs::temp_directory_path() / "vrsi_cli_test.json";
    {
        std::ofstream f(p);
        f << R"({"broker": {"cash": 111, "commission": 0.003}})";
    }
    const auto o = parse({"--cash", "222", "--config", p.string()});
    EXPECT_DOUBLE_EQ(o.cfg.broker.cash, 222.0);
    EXPECT_DOUBLE_EQ(o.cfg.broker.commission, 0.003);
    fs::remove(p);
}

TEST(CliTest, Errors) {
    EXPECT_THROW(parse({"--bogus"}), ConfigError);
    EXPECT_THROW(parse({"--cash"}), ConfigError);
    EXPECT_THROW(parse({"--cash", "12abc"}), ConfigError);
    EXPECT_THROW(parse({"--interval", "2m"}), ConfigError);
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_NE(app::usage("vrsi").find("--csv"), std::string::npos);
}
