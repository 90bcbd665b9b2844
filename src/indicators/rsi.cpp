#include "indicators/rsi.hpp"
#include "indicators/sma.hpp"
#include <algorithm>

namespace ind {

static double rsi_from(double avg_gain, double avg_loss){
    if (avg_loss == 0.0) return 100.0;
    const double rs  = avg_gain / avg_loss;
    const double rsi = 100.0 - (100.0 / (1.0 + rs));
    return std::clamp(rsi, 0.0, 100.0);
}

Series wilder_rsi(const Series& x, std::size_t length){
    Series out(x.size(), kUndef);
    if (length == 0 || x.size() <= length) return out;

    const double alpha = 1.0 / static_cast<double>(length);
    double g = 0.0, l = 0.0;
    std::size_t seeded = 0;
    bool ready = false;

    for (std::size_t i = 1; i < x.size(); ++i){
        if (!defined(x[i]) || !defined(x[i-1])){
            // seed közben lyuk: elölről kezdjük; utána csak kihagyjuk a bart
            if (!ready){ g = l = 0.0; seeded = 0; }
            continue;
        }
        const double d = x[i] - x[i-1];
        const double up = d > 0 ? d : 0.0;
        const double dn = d < 0 ? -d : 0.0;

        if (!ready){
            g += up; l += dn;
            if (++seeded < length) continue;
            g /= static_cast<double>(length);
            l /= static_cast<double>(length);
            ready = true;
        } else {
            g += alpha * (up - g);
            l += alpha * (dn - l);
        }
        out[i] = rsi_from(g, l);
    }
    return out;
}

Series volume_rsi(const Bars& bars, std::size_t length){
    const std::size_t n = bars.size();
    Series vol(n), adj(n, kUndef);
    for (std::size_t i = 0; i < n; ++i) vol[i] = bars[i].volume;

    const Series vol_avg = rolling_mean(vol, length);
    for (std::size_t i = 0; i < n; ++i){
        if (!defined(vol_avg[i]) || vol_avg[i] == 0.0) continue;
        const double hlc3 = (bars[i].high + bars[i].low + bars[i].close) / 3.0;
        adj[i] = hlc3 * (vol[i] / vol_avg[i]);
    }
    return wilder_rsi(adj, length);
}

} // namespace ind
