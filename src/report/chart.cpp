#include "report/chart.hpp"
#include "core/timeutil.hpp"
#include <SFML/Graphics/Image.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace report {

std::vector<exec::EquityPoint> resample_daily(const std::vector<exec::EquityPoint>& eq){
    std::vector<exec::EquityPoint> out;
    for (const auto& p : eq){
        if (!out.empty() && day_index(out.back().time_ms) == day_index(p.time_ms)) out.back() = p;
        else out.push_back(p);
    }
    return out;
}

namespace {

void put(sf::Image& img, int x, int y, const sf::Color& c){
    const auto sz = img.getSize();
    if (x < 0 || y < 0 || x >= (int)sz.x || y >= (int)sz.y) return;
    img.setPixel((unsigned)x, (unsigned)y, c);
}

// Bresenham, 2px vastag
void line(sf::Image& img, int x0, int y0, int x1, int y1, const sf::Color& c){
    const int dx = std::abs(x1-x0), sx = x0<x1 ? 1 : -1;
    const int dy = -std::abs(y1-y0), sy = y0<y1 ? 1 : -1;
    int err = dx + dy;
    while (true){
        put(img, x0, y0, c); put(img, x0, y0+1, c);
        if (x0==x1 && y0==y1) break;
        const int e2 = 2*err;
        if (e2 >= dy){ err += dy; x0 += sx; }
        if (e2 <= dx){ err += dx; y0 += sy; }
    }
}

void hline_dashed(sf::Image& img, int y, int x0, int x1, const sf::Color& c){
    for (int x = x0; x <= x1; ++x) if ((x / 6) % 2 == 0) put(img, x, y, c);
}

} // namespace

bool render_equity_png(const std::vector<exec::EquityPoint>& eq, double initial_cash,
                       const std::string& path, unsigned width, unsigned height){
    if (eq.size() < 2 || width < 64 || height < 64) return false;

    sf::Image img;
    img.create(width, height, sf::Color::White);

    const int margin = 24;
    const int w = (int)width - 2*margin, h = (int)height - 2*margin;

    auto [mn_it, mx_it] = std::minmax_element(eq.begin(), eq.end(),
        [](const exec::EquityPoint& a, const exec::EquityPoint& b){ return a.equity < b.equity; });
    double lo = std::min(mn_it->equity, initial_cash);
    double hi = std::max(mx_it->equity, initial_cash);
    if (hi - lo < 1e-9){ hi += 1.0; lo -= 1.0; }

    auto px = [&](std::size_t i){ return margin + (int)std::lround((double)i * w / (eq.size() - 1)); };
    auto py = [&](double v){ return margin + h - (int)std::lround((v - lo) / (hi - lo) * h); };

    // keret + rács
    const sf::Color grid(225, 225, 225);
    for (int k = 0; k <= 4; ++k){
        const int y = margin + k * h / 4;
        line(img, margin, y, margin + w, y, grid);
    }
    line(img, margin, margin, margin, margin + h, sf::Color(120, 120, 120));
    line(img, margin, margin + h, margin + w, margin + h, sf::Color(120, 120, 120));

    // induló tőke szaggatott vonallal
    hline_dashed(img, py(initial_cash), margin, margin + w, sf::Color(160, 160, 160));

    // equity
    const sf::Color blue(31, 119, 180);
    for (std::size_t i = 1; i < eq.size(); ++i)
        line(img, px(i-1), py(eq[i-1].equity), px(i), py(eq[i].equity), blue);

    // csúcs pont
    const std::size_t peak = (std::size_t)std::distance(eq.begin(), mx_it);
    for (int d = -3; d <= 3; ++d) line(img, px(peak) - 3, py(eq[peak].equity) + d, px(peak) + 3, py(eq[peak].equity) + d, sf::Color(44, 160, 44));

    return img.saveToFile(path);
}

} // namespace report
