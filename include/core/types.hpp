#pragma once
#include <cstdint>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// Időkeret (Binance kline intervallumok)
enum class Timeframe { M1, M3, M5, M15, M30, H1, H2, H4, H6, H8, H12, D1, D3, W1 };

const char* to_string(Timeframe tf);
std::optional<Timeframe> parse_timeframe(const std::string& s);
std::int64_t timeframe_ms(Timeframe tf);

// OHLCV bar
struct Bar {
    std::int64_t open_time_ms{}; // kline open time (ms)
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

using Bars = std::vector<Bar>;
using Series = std::vector<double>;

// "Nincs még érték" = quiet NaN (warm-up szakasz)
inline constexpr double kUndef = std::numeric_limits<double>::quiet_NaN();
inline bool defined(double v) { return !std::isnan(v); }
