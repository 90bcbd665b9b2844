#include "indicators/sma.hpp"

namespace ind {

Series rolling_mean(const Series& v, std::size_t p){
    Series out(v.size(), kUndef);
    if (p == 0) return out;
    double sum = 0.0;
    std::size_t missing = 0; // kUndef elemek száma az ablakban
    std::size_t nonzero = 0; // csupa nulla ablak -> pontosan 0, nem a futó összeg maradéka
    for (std::size_t i = 0; i < v.size(); ++i){
        if (!defined(v[i])) ++missing;
        else { sum += v[i]; if (v[i] != 0.0) ++nonzero; }
        if (i >= p){
            const double old = v[i-p];
            if (!defined(old)) --missing;
            else { sum -= old; if (old != 0.0) --nonzero; }
        }
        if (i + 1 >= p && missing == 0) out[i] = nonzero ? sum / static_cast<double>(p) : 0.0;
    }
    return out;
}

Series safe_sma(const Series& closes, std::size_t p){
    if (p == 0 || closes.size() < p) return Series(closes.size(), kUndef);
    return rolling_mean(closes, p);
}

} // namespace ind
