#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "app/cli.hpp"
#include "app/pipeline.hpp"
#include "core/errors.hpp"
#include "report/chart.hpp"
#include "report/stats.hpp"
#ifdef VRSI_WITH_VIEWER
#include "ui/result_viewer.hpp"
#endif

int main(int argc, char** argv) {
    app::CliOptions opt;
    try {
        opt = app::parse_args(argc, argv);
        if (!opt.help) app::validate(opt.cfg);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n\n" << app::usage(argv[0]);
        return 1;
    }
    if (opt.help) {
        std::cout << app::usage(argv[0]);
        return 0;
    }
    spdlog::set_level(spdlog::level::from_str(opt.cfg.log_level));

    try {
        app::Pipeline p(opt.cfg);
        const auto& stats = p.run();
        std::cout << "\n" << report::format_stats(stats);

        if (opt.cfg.report.show_viewer) {
#ifdef VRSI_WITH_VIEWER
            ui::ViewerData vd;
            vd.title = opt.cfg.data.csv_path.empty()
                ? opt.cfg.data.symbol + " " + to_string(opt.cfg.data.interval)
                : opt.cfg.data.csv_path;
            vd.stats  = stats;
            vd.trades = p.simulate().trades;
            vd.equity = report::resample_daily(p.simulate().equity);
            ui::ResultViewer(std::move(vd)).run();
#else
            spdlog::warn("--show ignored: built without the viewer");
#endif
        }
    } catch (const InsufficientDataError& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const ConfigError& e) {
        spdlog::error("config: {}", e.what());
        return 2;
    } catch (const DataSourceError& e) {
        spdlog::error("data source: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 3;
    }
    return 0;
}
