#pragma once
#include <string>
#include "data/source.hpp"

namespace data {

// Formátum: open_time_ms,open,high,low,close,volume (opcionális header sor)
Bars load_csv(const std::string& path);
void save_csv(const std::string& path, const Bars& bars);

class CsvSource final : public IBarSource {
public:
    explicit CsvSource(std::string path) : path_(std::move(path)) {}
    std::string id() const override { return "csv"; }
    Bars fetch() override { return load_csv(path_); }
private:
    std::string path_;
};

} // namespace data
