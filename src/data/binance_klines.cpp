#include "data/binance_klines.hpp"
#include "core/errors.hpp"
#include "core/timeutil.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <sstream>

using json = nlohmann::json;

namespace data {

static double to_d(const json& v){
    if (v.is_string()) return std::strtod(v.get_ref<const std::string&>().c_str(), nullptr);
    if (v.is_number()) return v.get<double>();
    throw DataSourceError("kline field is neither string nor number: " + v.dump());
}

BinanceKlines::BinanceKlines(DataConfig cfg) : cfg_(std::move(cfg)) {}

std::string BinanceKlines::rest_base() const {
    return cfg_.testnet? "https://testnet.binance.vision" : "https://api.binance.com";
}

json BinanceKlines::http_get(const std::string& path, const std::string& query){
    const std::string url = rest_base() + path + (query.empty()? "" : "?" + query);
    cpr::Header hdr{};
    if (!cfg_.api_key.empty()) hdr = cpr::Header{{"X-MBX-APIKEY", cfg_.api_key}};

    cpr::Response r = cpr::Get(cpr::Url{url},
                               hdr,
                               cpr::Timeout{cfg_.timeout_ms},
                               cpr::VerifySsl{true});
    if (r.error){
        throw DataSourceError("GET " + path + " failed: " + r.error.message);
    }
    if (r.status_code >= 400){
        spdlog::warn("GET {} : {} {}", path, r.status_code, r.text);
        throw DataSourceError("GET " + path + " returned HTTP " + std::to_string(r.status_code) + ": " + r.text);
    }
    try{
        return json::parse(r.text.empty()? "[]" : r.text);
    } catch (const json::parse_error& e){
        throw DataSourceError("GET " + path + " returned malformed JSON: " + e.what());
    }
}

Bars BinanceKlines::parse_klines(const json& j){
    if (!j.is_array()) throw DataSourceError("klines response is not an array: " + j.dump());
    Bars out;
    out.reserve(j.size());
    for (const auto& k : j){
        if (!k.is_array() || k.size() < 6) throw DataSourceError("malformed kline row: " + k.dump());
        Bar b;
        b.open_time_ms = k[0].get<std::int64_t>();
        b.open   = to_d(k[1]);
        b.high   = to_d(k[2]);
        b.low    = to_d(k[3]);
        b.close  = to_d(k[4]);
        b.volume = to_d(k[5]);
        out.push_back(b);
    }
    return out;
}

Bars BinanceKlines::fetch_page(std::int64_t start_ms, std::int64_t end_ms){
    std::ostringstream q;
    q << "symbol=" << cfg_.symbol
      << "&interval=" << to_string(cfg_.interval)
      << "&startTime=" << start_ms
      << "&endTime=" << end_ms
      << "&limit=" << kPageLimit;
    return parse_klines(http_get("/api/v3/klines", q.str()));
}

Bars BinanceKlines::fetch(){
    const auto start = parse_date_ms(cfg_.start);
    const auto end   = parse_date_ms(cfg_.end);
    if (!start || !end) throw DataSourceError("invalid date range: " + cfg_.start + " .. " + cfg_.end);

    spdlog::info("Fetching {} {} klines {} .. {}", cfg_.symbol, to_string(cfg_.interval), cfg_.start, cfg_.end);
    Bars all;
    std::int64_t cursor = *start;
    while (cursor <= *end){
        Bars page = fetch_page(cursor, *end);
        if (page.empty()) break;
        spdlog::debug("page: {} klines from {}", page.size(), format_utc(page.front().open_time_ms));
        cursor = page.back().open_time_ms + 1;
        all.insert(all.end(), page.begin(), page.end());
        if (page.size() < static_cast<std::size_t>(kPageLimit)) break;
    }
    spdlog::info("Received {} klines", all.size());
    return all;
}

} // namespace data
