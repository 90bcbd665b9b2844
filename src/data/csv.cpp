#include "data/csv.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace data {

static bool parse_row(const std::string& line, Bar& r){
    std::stringstream ss(line);
    std::string x;
    try{
        if (!std::getline(ss,x,',')) return false; r.open_time_ms = std::stoll(x);
        if (!std::getline(ss,x,',')) return false; r.open   = std::stod(x);
        if (!std::getline(ss,x,',')) return false; r.high   = std::stod(x);
        if (!std::getline(ss,x,',')) return false; r.low    = std::stod(x);
        if (!std::getline(ss,x,',')) return false; r.close  = std::stod(x);
        if (!std::getline(ss,x,',')) return false; r.volume = std::stod(x);
    } catch (const std::logic_error&){
        return false;
    }
    return true;
}

Bars load_csv(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) throw DataSourceError("cannot open CSV: " + path);

    Bars out;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(f, line)){
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        // header sor: nem számmal kezdődik
        if (lineno == 1 && !std::isdigit(static_cast<unsigned char>(line[0]))) continue;
        Bar b{};
        if (!parse_row(line, b))
            throw DataSourceError(path + ":" + std::to_string(lineno) + ": malformed row '" + line + "'");
        out.push_back(b);
    }
    spdlog::info("Loaded {} bars from {}", out.size(), path);
    return out;
}

void save_csv(const std::string& path, const Bars& bars){
    std::ofstream f(path);
    if (!f.good()) throw DataSourceError("cannot write CSV: " + path);
    f << "open_time_ms,open,high,low,close,volume\n";
    f << std::setprecision(17);
    for (const auto& b : bars)
        f << b.open_time_ms << ',' << b.open << ',' << b.high << ',' << b.low << ',' << b.close << ',' << b.volume << '\n';
    if (!f.good()) throw DataSourceError("write failed: " + path);
    spdlog::info("Saved {} bars to {}", bars.size(), path);
}

} // namespace data
