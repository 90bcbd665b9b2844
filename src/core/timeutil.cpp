#include "core/timeutil.hpp"
#include <chrono>
#include <cstdio>

namespace {
constexpr std::int64_t kDayMs = 86'400'000;

// Howard Hinnant: days_from_civil / civil_from_days
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d){
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

unsigned days_in_month(std::int64_t y, unsigned m){
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
    return m == 2 && leap ? 29 : kDays[m - 1];
}

void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d){
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
}
} // namespace

std::optional<std::int64_t> parse_date_ms(const std::string& ymd){
    int y = 0; unsigned m = 0, d = 0; char tail = 0;
    if (std::sscanf(ymd.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) return std::nullopt;
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) return std::nullopt;
    return days_from_civil(y, m, d) * kDayMs;
}

std::int64_t day_index(std::int64_t ms){
    return ms >= 0 ? ms / kDayMs : (ms - kDayMs + 1) / kDayMs;
}

std::string format_date(std::int64_t ms){
    int y; unsigned m, d;
    civil_from_days(day_index(ms), y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

std::string format_utc(std::int64_t ms){
    const std::int64_t sec = (ms - day_index(ms) * kDayMs) / 1000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s %02d:%02d:%02d", format_date(ms).c_str(),
                  static_cast<int>(sec / 3600), static_cast<int>(sec / 60 % 60), static_cast<int>(sec % 60));
    return buf;
}

std::uint64_t now_ms(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
