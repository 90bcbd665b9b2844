#include "app/cli.hpp"
#include "core/errors.hpp"
#include <sstream>
#include <vector>

namespace app {

static double to_num(const std::string& flag, const std::string& v){
    try{
        std::size_t pos = 0;
        const double d = std::stod(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::logic_error&){
        throw ConfigError(flag + ": not a number: " + v);
    }
}

std::string usage(const char* prog){
    std::ostringstream o;
    o << "Usage: " << prog << " [options]\n"
      << "  --config <file.json>    load settings from JSON\n"
      << "  --csv <path>            read bars from CSV instead of Binance\n"
      << "  --symbol <SYM>          trading pair (default BTCUSDT)\n"
      << "  --interval <tf>         kline interval (default 4h)\n"
      << "  --start <YYYY-MM-DD>    start date (UTC)\n"
      << "  --end <YYYY-MM-DD>      end date (UTC)\n"
      << "  --cash <amount>         starting cash\n"
      << "  --commission <rate>     commission per trade, e.g. 0.0002\n"
      << "  --out <dir>             report directory (default Backtests)\n"
      << "  --save-csv <path>       save fetched bars\n"
      << "  --testnet               use the Binance testnet host\n"
      << "  --no-chart              skip the PNG equity chart\n"
      << "  --show                  open the result viewer window\n"
      << "  --log-level <lvl>       trace|debug|info|warn|error|off\n"
      << "  --help\n";
    return o.str();
}

CliOptions parse_args(int argc, char** argv){
    CliOptions o;
    std::vector<std::string> args(argv + 1, argv + argc);

    // --config előre, hogy a többi kapcsoló felülírhassa
    for (std::size_t i = 0; i < args.size(); ++i){
        if (args[i] == "--config"){
            if (i + 1 >= args.size()) throw ConfigError("--config requires a value");
            apply_file(o.cfg, args[i + 1]);
        }
    }
    apply_env(o.cfg);

    for (std::size_t i = 0; i < args.size(); ++i){
        const std::string& a = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError(a + " requires a value");
            return args[++i];
        };

        if      (a == "--help" || a == "-h") o.help = true;
        else if (a == "--config")     value();
        else if (a == "--csv")        o.cfg.data.csv_path = value();
        else if (a == "--symbol")     o.cfg.data.symbol = value();
        else if (a == "--interval"){
            const auto& v = value();
            auto tf = parse_timeframe(v);
            if (!tf) throw ConfigError("unknown interval: " + v);
            o.cfg.data.interval = *tf;
        }
        else if (a == "--start")      o.cfg.data.start = value();
        else if (a == "--end")        o.cfg.data.end = value();
        else if (a == "--cash")       o.cfg.broker.cash = to_num(a, value());
        else if (a == "--commission") o.cfg.broker.commission = to_num(a, value());
        else if (a == "--out")        o.cfg.report.output_dir = value();
        else if (a == "--save-csv")   o.cfg.data.save_csv_path = value();
        else if (a == "--testnet")    o.cfg.data.testnet = true;
        else if (a == "--no-chart")   o.cfg.report.write_chart = false;
        else if (a == "--show")       o.cfg.report.show_viewer = true;
        else if (a == "--log-level")  o.cfg.log_level = value();
        else throw ConfigError("unknown option: " + a);
    }
    return o;
}

} // namespace app
