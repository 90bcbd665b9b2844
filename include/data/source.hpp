#pragma once
#include <memory>
#include <string>
#include "core/types.hpp"

namespace data {

struct DataConfig {
    std::string symbol{"BTCUSDT"};
    Timeframe interval{Timeframe::H4};
    std::string start{"2015-01-01"};
    std::string end{"2025-02-16"};
    std::string csv_path;       // ha meg van adva, innen töltünk Binance helyett
    std::string save_csv_path;  // letöltött barok mentése (opcionális)
    std::size_t min_bars{200};
    std::string api_key;
    bool testnet{false};
    int timeout_ms{10000};
};

// Bar forrás interfész. fetch() DataSourceError-t dob I/O hibára.
class IBarSource {
public:
    virtual ~IBarSource() = default;
    virtual std::string id() const = 0;
    virtual Bars fetch() = 0;
};

// csv_path alapján CSV vagy Binance
std::unique_ptr<IBarSource> make_source(const DataConfig& cfg);

} // namespace data
