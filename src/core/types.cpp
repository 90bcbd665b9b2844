#include "core/types.hpp"

namespace {
struct TfRow { Timeframe tf; const char* name; std::int64_t ms; };

constexpr std::int64_t kMin = 60'000;
constexpr TfRow kTable[] = {
    {Timeframe::M1,  "1m",  kMin},
    {Timeframe::M3,  "3m",  3 * kMin},
    {Timeframe::M5,  "5m",  5 * kMin},
    {Timeframe::M15, "15m", 15 * kMin},
    {Timeframe::M30, "30m", 30 * kMin},
    {Timeframe::H1,  "1h",  60 * kMin},
    {Timeframe::H2,  "2h",  120 * kMin},
    {Timeframe::H4,  "4h",  240 * kMin},
    {Timeframe::H6,  "6h",  360 * kMin},
    {Timeframe::H8,  "8h",  480 * kMin},
    {Timeframe::H12, "12h", 720 * kMin},
    {Timeframe::D1,  "1d",  1440 * kMin},
    {Timeframe::D3,  "3d",  3 * 1440 * kMin},
    {Timeframe::W1,  "1w",  7 * 1440 * kMin},
};
} // namespace

const char* to_string(Timeframe tf) {
    for (const auto& r : kTable) if (r.tf == tf) return r.name;
    return "1m";
}

std::optional<Timeframe> parse_timeframe(const std::string& s) {
    for (const auto& r : kTable) if (s == r.name) return r.tf;
    return std::nullopt;
}

std::int64_t timeframe_ms(Timeframe tf) {
    for (const auto& r : kTable) if (r.tf == tf) return r.ms;
    return kMin;
}
