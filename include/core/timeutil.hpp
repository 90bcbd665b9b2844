#pragma once
#include <cstdint>
#include <optional>
#include <string>

// "YYYY-MM-DD" -> UTC éjfél, ms
std::optional<std::int64_t> parse_date_ms(const std::string& ymd);

// ms -> "YYYY-MM-DD HH:MM:SS" (UTC)
std::string format_utc(std::int64_t ms);

// ms -> "YYYY-MM-DD" (UTC)
std::string format_date(std::int64_t ms);

// UTC nap sorszáma 1970-01-01 óta
std::int64_t day_index(std::int64_t ms);

std::uint64_t now_ms();
