#include "data/bars.hpp"
#include "core/errors.hpp"
#include "core/timeutil.hpp"
#include <cstring>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace data {

Bars normalize(Bars bars){
    Bars out;
    out.reserve(bars.size());
    std::size_t dropped = 0;
    for (const auto& b : bars){
        if (!out.empty()){
            const auto last = out.back().open_time_ms;
            if (b.open_time_ms == last){ ++dropped; continue; }
            if (b.open_time_ms < last)
                throw DataSourceError("bars out of order: " + format_utc(b.open_time_ms) +
                                      " after " + format_utc(last));
        }
        out.push_back(b);
    }
    if (dropped) spdlog::warn("dropped {} duplicate bars", dropped);
    return out;
}

void require_min_bars(const Bars& bars, std::size_t min_bars){
    if (bars.size() < min_bars) throw InsufficientDataError(bars.size(), min_bars);
}

std::string fingerprint(const Bars& bars){
    std::string buf;
    buf.reserve(bars.size() * sizeof(Bar));
    for (const auto& b : bars){
        char raw[sizeof(std::int64_t) + 5 * sizeof(double)];
        char* p = raw;
        std::memcpy(p, &b.open_time_ms, sizeof(b.open_time_ms)); p += sizeof(b.open_time_ms);
        for (double v : {b.open, b.high, b.low, b.close, b.volume}){
            std::memcpy(p, &v, sizeof(v)); p += sizeof(v);
        }
        buf.append(raw, sizeof(raw));
    }

    unsigned int len = 0;
    unsigned char md[EVP_MAX_MD_SIZE];
    if (EVP_Digest(buf.data(), buf.size(), md, &len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_Digest(sha256) failed");
    std::ostringstream oss;
    for (unsigned int i=0;i<len;++i) oss<< std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
    return oss.str();
}

} // namespace data
