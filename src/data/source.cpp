#include "data/source.hpp"
#include "data/binance_klines.hpp"
#include "data/csv.hpp"

namespace data {

std::unique_ptr<IBarSource> make_source(const DataConfig& cfg){
    if (!cfg.csv_path.empty()) return std::make_unique<CsvSource>(cfg.csv_path);
    return std::make_unique<BinanceKlines>(cfg);
}

} // namespace data
