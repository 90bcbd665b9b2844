#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "data/source.hpp"

namespace data {

// Binance SPOT történeti kline-ok (publikus REST, GET /api/v3/klines)
class BinanceKlines final : public IBarSource {
public:
    static constexpr int kPageLimit = 1000;

    explicit BinanceKlines(DataConfig cfg);

    std::string id() const override { return "binance"; }

    // start..end teljes tartomány, lapozva
    Bars fetch() override;

    // egy lap: max kPageLimit kline a [start_ms, end_ms] tartományból
    Bars fetch_page(std::int64_t start_ms, std::int64_t end_ms);

    // [[open_time, "open", "high", "low", "close", "volume", close_time, ...], ...]
    static Bars parse_klines(const nlohmann::json& j);

private:
    std::string rest_base() const;
    nlohmann::json http_get(const std::string& path, const std::string& query);

    DataConfig cfg_;
};

} // namespace data
