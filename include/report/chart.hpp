#pragma once
#include <string>
#include <vector>
#include "exec/broker.hpp"

namespace report {

// Napi újramintavételezés: UTC naponként az utolsó equity érték
std::vector<exec::EquityPoint> resample_daily(const std::vector<exec::EquityPoint>& eq);

// Equity görbe PNG-be (sf::Image, ablak nélkül). false, ha a mentés nem sikerült.
bool render_equity_png(const std::vector<exec::EquityPoint>& eq, double initial_cash,
                       const std::string& path, unsigned width, unsigned height);

} // namespace report
