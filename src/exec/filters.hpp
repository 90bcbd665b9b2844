#pragma once
#include <cmath>

namespace exec {
// Mennyiség lefelé kerekítése a lépésközre (LOT_SIZE jelleggel); step<=0 -> nincs kerekítés
inline double floor_step(double v, double step){
    if (step<=0) return v;
    return std::floor(v/step + 1e-9)*step;
}
} // namespace exec
