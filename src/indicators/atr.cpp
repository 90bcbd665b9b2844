#include "indicators/atr.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

Series true_range(const Bars& b){
    Series tr(b.size(), kUndef);
    for (std::size_t i = 0; i < b.size(); ++i){
        const double hl = b[i].high - b[i].low;
        if (i == 0){ tr[i] = hl; continue; }
        const double pc = b[i-1].close;
        tr[i] = std::max({hl, std::abs(b[i].high - pc), std::abs(b[i].low - pc)});
    }
    return tr;
}

Series atr(const Bars& bars, std::size_t period){
    Series out(bars.size(), kUndef);
    if (period == 0 || bars.size() < period) return out;

    const Series tr = true_range(bars);
    const double p = static_cast<double>(period);
    double a = 0.0;
    for (std::size_t i = 0; i < period; ++i) a += tr[i];
    a /= p;
    out[period-1] = a;
    for (std::size_t i = period; i < bars.size(); ++i){
        a += (tr[i] - a) / p;
        out[i] = a;
    }
    return out;
}

} // namespace ind
